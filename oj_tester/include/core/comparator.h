/**
 * @file comparator.h
 * @brief 输出比对
 *
 * 两种模式：
 * - 宽松：去掉空白行，每行去掉首尾空白后逐行比较
 * - 严格：不做任何处理，逐行比较
 *
 * 不一致时生成逐行 diff 报告，显示条数受 max_diffs 限制。
 */

#ifndef OJT_CORE_COMPARATOR_H
#define OJT_CORE_COMPARATOR_H

#include <string>
#include <vector>
#include <optional>
#include <algorithm>
#include "core/types.h"
#include "core/utils.h"

namespace ojt {

inline constexpr const char *EOF_MARKER = "<EOF>";

class Comparator {
private:
    std::optional<size_t> max_diffs_;

    static std::vector<std::string> normalize(const std::string &text, bool strict) {
        std::vector<std::string> lines = split_lines(text);
        if (strict) {
            return lines;
        }
        std::vector<std::string> kept;
        for (const auto &line : lines) {
            std::string t = trim(line);
            if (!t.empty()) {
                kept.push_back(std::move(t));
            }
        }
        return kept;
    }

    static std::string format_entry(size_t index, const std::string &got, const std::string &expect) {
        return "line " + std::to_string(index + 1) + ": got:    " + quote_repr(got) +
               "\n        expect: " + quote_repr(expect);
    }

public:
    /**
     * @param max_diffs 最多显示的不一致行数，std::nullopt 表示不限制
     */
    explicit Comparator(std::optional<size_t> max_diffs = 10) : max_diffs_(max_diffs) {}

    const std::optional<size_t>& max_diffs() const { return max_diffs_; }

    /**
     * @brief 比对实际输出与期望输出
     *
     * 实际输出行数不足时报告一次 "Insufficient output lines" 并停止，
     * 之后的位置不再逐行比较；期望输出先结束时以 <EOF> 作为期望值。
     * 超过显示上限的差异仍然计数，最后追加一行被省略的条数。
     */
    Verdict compare(const std::string &actual, const std::string &expected, bool strict) const {
        if (strict && actual == expected) {
            return Verdict{Status::AC, ""};
        }

        std::vector<std::string> act = normalize(actual, strict);
        std::vector<std::string> exp = normalize(expected, strict);
        if (act == exp) {
            return Verdict{Status::AC, ""};
        }

        std::vector<std::string> report;
        size_t max_len = std::max(act.size(), exp.size());
        size_t diff_count = 0;

        for (size_t i = 0; i < max_len; i++) {
            if (i >= act.size()) {
                report.push_back("Error: Insufficient output lines.");
                break;
            }
            const std::string &got = act[i];
            const std::string expect = i < exp.size() ? exp[i] : EOF_MARKER;
            if (got == expect) {
                continue;
            }
            diff_count++;
            if (!max_diffs_ || diff_count <= *max_diffs_) {
                report.push_back(format_entry(i, got, expect));
            }
        }

        if (max_diffs_ && diff_count > *max_diffs_) {
            report.push_back("... and " + std::to_string(diff_count - *max_diffs_) +
                             " more differences.");
        }

        return Verdict{Status::WA, join(report, "\n")};
    }
};

/**
 * @brief 便捷函数
 */
inline Verdict compare_output(const std::string &actual, const std::string &expected,
                              bool strict, std::optional<size_t> max_diffs = 10) {
    return Comparator(max_diffs).compare(actual, expected, strict);
}

} // namespace ojt

#endif // OJT_CORE_COMPARATOR_H
