/**
 * @file tester.h
 * @brief 测试流程
 *
 * 递归保护 → 发现测资 → 筛选 → 重复运行 → 比对 → 逐个输出并汇总。
 * 只有找不到目标程序、找不到任何测资这两种情况会作为错误返回，
 * 单个测资的问题都记在该测资的结果里。
 */

#ifndef OJT_CORE_TESTER_H
#define OJT_CORE_TESTER_H

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <filesystem>
#include "core/error.h"
#include "core/types.h"
#include "core/config.h"
#include "core/case_store.h"
#include "core/comparator.h"
#include "core/runner.h"
#include "core/guard.h"
#include "core/reporter.h"
#include "core/logger.h"

namespace ojt {

/// 默认测资目录名，位于目标程序所在目录下
inline constexpr const char *DEFAULT_TEST_CASE_DIR = "test_case";

class OnlineJudgeTester {
private:
    std::string target_;
    fs::path test_case_dir_;
    TesterOptions options_;
    std::shared_ptr<Reporter> reporter_;
    CandidateRunner runner_;
    Comparator comparator_;

    OnlineJudgeTester(std::string target, fs::path test_case_dir, TesterOptions options,
                      std::shared_ptr<Reporter> reporter)
        : target_(target), test_case_dir_(std::move(test_case_dir)),
          options_(std::move(options)), reporter_(std::move(reporter)),
          runner_(Candidate{target, {}, fs::path(target).parent_path().string()}),
          comparator_(options_.max_diffs) {}

public:
    /**
     * @brief 创建测试器
     * @param target_path 受测程序路径，会解析为绝对路径
     * @param options 测试选项
     * @param reporter 结果输出，nullptr 时输出到 stdout
     */
    static Result<OnlineJudgeTester> create(const std::string &target_path,
                                            TesterOptions options = TesterOptions(),
                                            std::shared_ptr<Reporter> reporter = nullptr) {
        OJT_TRY(options.validate());

        std::string target = get_realpath(target_path);
        OJT_ENSURE(!target.empty(), ErrorCode::TARGET_NOT_FOUND,
                   "Target program not found: " + target_path);

        fs::path dir;
        if (!options.test_case_dir.empty()) {
            std::error_code ec;
            dir = fs::absolute(options.test_case_dir, ec);
            if (ec) {
                dir = options.test_case_dir;
            }
        } else {
            dir = fs::path(target).parent_path() / DEFAULT_TEST_CASE_DIR;
        }

        if (!reporter) {
            reporter = std::make_shared<ConsoleReporter>(
                std::cout, options.show_missing_output, options.show_raw_output);
        }
        return OnlineJudgeTester(target, dir, std::move(options), std::move(reporter));
    }

    const std::string& target() const { return target_; }
    const fs::path& test_case_dir() const { return test_case_dir_; }
    const TesterOptions& options() const { return options_; }

    /**
     * @brief 运行单个测资
     */
    CaseResult run_case(const Case &c) const {
        CaseResult result;
        result.case_name = c.name;

        auto input = read_text_file(c.input_path.string());
        if (input.is_error()) {
            OJT_LOG_WARN << "Cannot read input of case " << c.name << ": " << input.error().message();
            result.status = Status::RE;
            result.error_message = input.error().message();
            return result;
        }

        RepeatOutcome run = runner_.run_with_repeat(
            input.value(), options_.time_limit_ms, options_.repeat);
        result.status = run.status;
        result.execution_times = std::move(run.times);
        result.output = std::move(run.output);
        result.error_message = std::move(run.diagnostic);

        if (result.status != Status::AC || !options_.compare_output) {
            return result;
        }

        if (!c.has_expected()) {
            result.status = Status::MISSING;
            result.error_message = "Missing expected output file " + c.name + OUTPUT_SUFFIX;
            return result;
        }

        auto expected = read_text_file(c.expected_path->string());
        if (expected.is_error()) {
            OJT_LOG_WARN << "Cannot read expected output of case " << c.name << ": "
                         << expected.error().message();
            result.status = Status::WA;
            result.error_message = expected.error().message();
            return result;
        }

        Verdict verdict = comparator_.compare(result.output, expected.value(), options_.strict_comparison);
        result.status = verdict.status;
        if (!verdict.accepted()) {
            result.error_message = verdict.report;
        }
        return result;
    }

    /**
     * @brief 执行测试的主流程
     *
     * @param solution 嵌入模式下的解题函数；当前进程是子进程时运行它并退出，
     *                 不会返回。作为独立命令行工具使用时可以传空。
     * @return 各测资结果；选择器没有匹配时为空
     */
    Result<std::vector<CaseResult>> run_tests(const std::function<void()> &solution = nullptr) {
        guard_entry(solution);

        CaseSet all = discover(test_case_dir_);
        if (all.empty() && options_.cases.empty()) {
            return Err<std::vector<CaseResult>>(ErrorCode::NO_TEST_CASES,
                "No " + std::string(INPUT_SUFFIX) + " files found in " + test_case_dir_.string());
        }

        CaseSet selected = filter(all, options_.cases);
        if (!options_.cases.empty() && selected.empty()) {
            OJT_LOG_WARN << "No cases matched the given filter";
            reporter_->on_filter_empty(options_.cases);
            return std::vector<CaseResult>();
        }

        reporter_->on_start(target_, selected.size());

        std::vector<CaseResult> results;
        results.reserve(selected.size());
        for (const auto &c : selected) {
            CaseResult r = run_case(c);
            OJT_LOG_DEBUGF("Case %s: %s, %zu attempt(s)", r.case_name.c_str(),
                           status_to_string(r.status), r.execution_times.size());
            reporter_->on_result(r);
            results.push_back(std::move(r));
        }

        reporter_->on_finish(results);
        return results;
    }
};

} // namespace ojt

#endif // OJT_CORE_TESTER_H
