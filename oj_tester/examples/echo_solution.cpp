/**
 * @file echo_solution.cpp
 * @brief 嵌入模式示例
 *
 * 同一个可执行文件既是测试器又是受测程序：直接运行时测试 test_case/ 下的测资，
 * 被测试器启动时（OJ_CHILD_PROCESS=1）只执行 solve()。
 *
 * solve() 读入若干整数，输出它们的和；输入为空时抛出异常。
 */

#include <iostream>
#include <stdexcept>
#include "oj_tester.h"

using namespace ojt;

static void solve() {
    long long sum = 0, x;
    int count = 0;
    while (std::cin >> x) {
        sum += x;
        count++;
    }
    if (count == 0) {
        throw std::invalid_argument("empty input");
    }
    std::cout << sum << "\n";
}

int main(int argc, char **argv) {
    // 最先检查：子进程不应做任何测试准备工作
    guard_entry(solve);

    TesterOptions options;
    options.repeat = 3;
    for (int i = 1; i < argc; i++) {
        options.cases.push_back(parse_token(argv[i]));
    }

    // argv[0] 不一定带路径，用 /proc/self/exe 定位自身
    auto tester = OnlineJudgeTester::create("/proc/self/exe", options);
    if (!tester.ok()) {
        std::cerr << "Error: " << tester.error().message() << std::endl;
        return 1;
    }

    auto results = tester.value().run_tests(solve);
    if (!results.ok()) {
        std::cerr << "Error: " << results.error().message() << std::endl;
        return 1;
    }
    return 0;
}
