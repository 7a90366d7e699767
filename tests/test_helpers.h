/**
 * @file test_helpers.h
 * @brief 测试用的临时目录和脚本工具
 */

#ifndef OJT_TESTS_TEST_HELPERS_H
#define OJT_TESTS_TEST_HELPERS_H

#include <gtest/gtest.h>
#include <string>
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <sys/stat.h>

namespace ojt_test {

namespace fs = std::filesystem;

/// 测试程序被测试器启动时运行的解题函数，见 test_main.cpp
void embedded_solution();

/**
 * @brief 带临时目录的测试基类
 */
class TempDirTest : public ::testing::Test {
protected:
    fs::path work_dir;

    void SetUp() override {
        std::string tmpl = (fs::temp_directory_path() / "ojt_test_XXXXXX").string();
        ASSERT_NE(mkdtemp(&tmpl[0]), nullptr);
        work_dir = tmpl;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(work_dir, ec);
    }

    fs::path write_file(const fs::path &relative, const std::string &content) {
        fs::path path = work_dir / relative;
        fs::create_directories(path.parent_path());
        std::ofstream f(path, std::ios::binary);
        f << content;
        return path;
    }

    /**
     * @brief 写一个可执行的 /bin/sh 脚本
     */
    fs::path write_script(const fs::path &relative, const std::string &body) {
        fs::path path = write_file(relative, "#!/bin/sh\n" + body + "\n");
        chmod(path.c_str(), 0755);
        return path;
    }
};

} // namespace ojt_test

#endif // OJT_TESTS_TEST_HELPERS_H
