/**
 * @file reporter.h
 * @brief 测试结果输出
 *
 * 每个测资完成后立即输出，不等全部结束。
 */

#ifndef OJT_CORE_REPORTER_H
#define OJT_CORE_REPORTER_H

#include <string>
#include <vector>
#include <map>
#include <ostream>
#include <iostream>
#include "core/types.h"
#include "core/utils.h"
#include "core/case_store.h"

namespace ojt {

/**
 * @brief 结果输出接口
 */
class Reporter {
public:
    virtual ~Reporter() = default;

    /// 开始运行前调用一次
    virtual void on_start(const std::string &target, size_t selected) = 0;
    /// 每个测资完成后调用
    virtual void on_result(const CaseResult &result) = 0;
    /// 选择器没有匹配到任何测资
    virtual void on_filter_empty(const std::vector<FilterToken> &tokens) = 0;
    /// 全部完成后调用
    virtual void on_finish(const std::vector<CaseResult> &results) = 0;
};

/**
 * @brief 不输出任何内容
 */
class NullReporter : public Reporter {
public:
    void on_start(const std::string&, size_t) override {}
    void on_result(const CaseResult&) override {}
    void on_filter_empty(const std::vector<FilterToken>&) override {}
    void on_finish(const std::vector<CaseResult>&) override {}
};

/**
 * @brief 用时显示："N/A"、"12.34ms" 或 "avg ms (min:x, max:y)"
 */
inline std::string format_times(const std::vector<double> &times) {
    if (times.empty()) {
        return "N/A";
    }
    if (times.size() == 1) {
        return format_ms(times[0]) + "ms";
    }
    TimingSummary s = TimingSummary::of(times);
    return format_ms(s.mean) + "ms (min:" + format_ms(s.min) + ", max:" + format_ms(s.max) + ")";
}

/**
 * @brief 控制台输出
 */
class ConsoleReporter : public Reporter {
private:
    std::ostream &out_;
    bool show_missing_output_;
    bool show_raw_output_;

    static const std::string& separator() {
        static const std::string line(40, '-');
        return line;
    }

    void print_raw(const std::string &title, const std::string &output) {
        out_ << "  [" << title << "]\n";
        out_ << output << "\n";
        out_ << "  [End Raw Output]\n";
    }

public:
    ConsoleReporter(std::ostream &out, bool show_missing_output, bool show_raw_output)
        : out_(out), show_missing_output_(show_missing_output), show_raw_output_(show_raw_output) {}

    void on_start(const std::string &target, size_t selected) override {
        std::string name = target;
        size_t pos = name.find_last_of('/');
        if (pos != std::string::npos) {
            name = name.substr(pos + 1);
        }
        out_ << "=== Running Tests on " << name << " ===\n";
        out_ << "Target: " << target << "\n";
        out_ << "Cases: " << selected << " selected\n";
        out_ << separator() << std::endl;
    }

    void on_result(const CaseResult &r) override {
        out_ << "[" << r.case_name << "] Status: " << status_to_string(r.status)
             << " | Time: " << format_times(r.execution_times) << "\n";

        switch (r.status) {
            case Status::WA:
                out_ << "  [Wrong Answer Info]\n";
                for (const auto &line : split_lines(r.error_message)) {
                    out_ << "    " << line << "\n";
                }
                break;
            case Status::RE:
                out_ << "  [Runtime Error Info]\n";
                out_ << r.error_message << "\n";
                break;
            case Status::TLE:
                out_ << "  [" << status_description(r.status) << "]\n";
                break;
            case Status::MISSING:
                out_ << "  [Info] " << r.error_message << "\n";
                if (show_missing_output_) {
                    print_raw("Raw Output (Missing .out)", r.output);
                }
                break;
            case Status::AC:
                break;
        }

        if (show_raw_output_) {
            print_raw("Raw Output", r.output);
        }
        out_ << separator() << std::endl;
    }

    void on_filter_empty(const std::vector<FilterToken> &tokens) override {
        std::vector<std::string> parts;
        for (const auto &t : tokens) {
            parts.push_back(token_to_string(t));
        }
        out_ << "[WARNING] No cases matched filter: [" << join(parts, ", ") << "]" << std::endl;
    }

    void on_finish(const std::vector<CaseResult> &results) override {
        std::map<Status, size_t> counts;
        for (const auto &r : results) {
            counts[r.status]++;
        }
        out_ << "Summary: " << results.size() << " case(s)";
        for (Status s : {Status::AC, Status::WA, Status::TLE, Status::RE, Status::MISSING}) {
            if (counts[s] > 0) {
                out_ << ", " << status_to_string(s) << " " << counts[s];
            }
        }
        out_ << std::endl;
    }
};

} // namespace ojt

#endif // OJT_CORE_REPORTER_H
