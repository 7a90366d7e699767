/**
 * @file case_store.h
 * @brief 测资发现与筛选
 *
 * 在目录中寻找 <name>.in，并配对同名的 <name>.out（可以不存在）。
 * 排序键取文件名中第一段连续数字；没有数字的测资按名字字典序排在数字测资之后。
 */

#ifndef OJT_CORE_CASE_STORE_H
#define OJT_CORE_CASE_STORE_H

#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <algorithm>
#include <filesystem>
#include <system_error>
#include "core/utils.h"
#include "core/logger.h"

namespace ojt {

namespace fs = std::filesystem;

inline constexpr const char *INPUT_SUFFIX = ".in";
inline constexpr const char *OUTPUT_SUFFIX = ".out";

/**
 * @brief 测资
 */
struct Case {
    std::string name;                       ///< 不含扩展名的文件名
    fs::path input_path;
    std::optional<fs::path> expected_path;  ///< 没有 .out 时为空

    bool has_expected() const { return expected_path.has_value(); }
};

using CaseSet = std::vector<Case>;

/**
 * @brief 排序键：(是否非数字, 数值, 名字)
 *
 * 数字段超过 unsigned long long 范围时按饱和值处理。
 */
struct CaseOrderKey {
    bool non_numeric = true;
    unsigned long long number = 0;
    std::string name;

    static CaseOrderKey of(const std::string &stem) {
        CaseOrderKey key;
        key.name = stem;
        auto first = std::find_if(stem.begin(), stem.end(),
            [](char c) { return c >= '0' && c <= '9'; });
        if (first == stem.end()) {
            return key;
        }
        key.non_numeric = false;
        for (auto it = first; it != stem.end() && *it >= '0' && *it <= '9'; ++it) {
            unsigned long long digit = *it - '0';
            if (key.number > (ULLONG_MAX - digit) / 10) {
                key.number = ULLONG_MAX;
                break;
            }
            key.number = key.number * 10 + digit;
        }
        return key;
    }

    bool operator<(const CaseOrderKey &o) const {
        if (non_numeric != o.non_numeric) return !non_numeric;
        if (!non_numeric && number != o.number) return number < o.number;
        if (non_numeric) return name < o.name;
        return false;
    }
};

/**
 * @brief 扫描目录，返回按排序键排好的测资
 *
 * 目录不存在或为空时返回空集合，由调用者决定是否视为错误。
 * 数字键相同的测资保持目录名字典序，使结果与遍历顺序无关。
 */
inline CaseSet discover(const fs::path &directory) {
    CaseSet cases;
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        OJT_LOG_DEBUG << "Test case directory not found: " << directory.string();
        return cases;
    }

    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        const fs::path &path = it->path();
        if (path.extension() != INPUT_SUFFIX || !it->is_regular_file(ec)) {
            continue;
        }
        Case c;
        c.name = path.stem().string();
        c.input_path = path;
        fs::path expected = path;
        expected.replace_extension(OUTPUT_SUFFIX);
        if (fs::exists(expected, ec)) {
            c.expected_path = expected;
        }
        cases.push_back(std::move(c));
    }
    if (ec) {
        OJT_LOG_WARN << "Error while scanning " << directory.string() << ": " << ec.message();
    }

    std::sort(cases.begin(), cases.end(), [](const Case &a, const Case &b) {
        return a.name < b.name;
    });
    std::stable_sort(cases.begin(), cases.end(), [](const Case &a, const Case &b) {
        return CaseOrderKey::of(a.name) < CaseOrderKey::of(b.name);
    });

    for (const auto &c : cases) {
        OJT_LOG_DEBUG << "Discovered case " << c.name
                      << (c.has_expected() ? "" : " (no expected output)");
    }
    return cases;
}

//==============================================================================
// 筛选
//==============================================================================

/**
 * @brief 数字选择器：只匹配纯数字且数值相等的测资名（1 匹配 "01"）
 */
struct IntegerToken {
    unsigned long long value;
};

/**
 * @brief 字符串选择器：子串匹配
 */
struct SubstringToken {
    std::string value;
};

using FilterToken = std::variant<IntegerToken, SubstringToken>;

/**
 * @brief 把命令行参数转成选择器：全数字为 IntegerToken，否则为 SubstringToken
 */
inline FilterToken parse_token(const std::string &text) {
    if (is_all_digits(text)) {
        errno = 0;
        unsigned long long v = strtoull(text.c_str(), nullptr, 10);
        if (errno != ERANGE) {
            return IntegerToken{v};
        }
    }
    return SubstringToken{text};
}

inline std::string token_to_string(const FilterToken &token) {
    if (auto *i = std::get_if<IntegerToken>(&token)) {
        return std::to_string(i->value);
    }
    return "'" + std::get<SubstringToken>(token).value + "'";
}

inline bool token_matches(const FilterToken &token, const std::string &case_name) {
    if (auto *i = std::get_if<IntegerToken>(&token)) {
        if (!is_all_digits(case_name)) {
            return false;
        }
        errno = 0;
        unsigned long long v = strtoull(case_name.c_str(), nullptr, 10);
        return errno != ERANGE && v == i->value;
    }
    return case_name.find(std::get<SubstringToken>(token).value) != std::string::npos;
}

/**
 * @brief 按选择器筛选，任一选择器匹配即保留，保持原有顺序
 */
inline CaseSet filter(const CaseSet &cases, const std::vector<FilterToken> &tokens) {
    if (tokens.empty()) {
        return cases;
    }
    CaseSet selected;
    for (const auto &c : cases) {
        bool matched = std::any_of(tokens.begin(), tokens.end(),
            [&](const FilterToken &t) { return token_matches(t, c.name); });
        if (matched) {
            selected.push_back(c);
        }
    }
    return selected;
}

} // namespace ojt

#endif // OJT_CORE_CASE_STORE_H
