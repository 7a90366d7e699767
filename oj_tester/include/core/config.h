/**
 * @file config.h
 * @brief 配置系统
 *
 * Config 管理 "key value" 格式的配置文件；TesterOptions 是测试器选项的强类型视图。
 */

#ifndef OJT_CORE_CONFIG_H
#define OJT_CORE_CONFIG_H

#include <string>
#include <vector>
#include <map>
#include <fstream>
#include <sstream>
#include <optional>
#include <cstdlib>
#include <cerrno>
#include <cstdint>
#include "core/error.h"
#include "core/case_store.h"

namespace ojt {

/**
 * @brief 配置管理类
 *
 * 每行一个 "key value"，# 开头的行是注释。value 可以包含空格。
 */
class Config {
private:
    std::map<std::string, std::string> data_;

public:
    Config() = default;

    /**
     * @brief 从文件加载配置
     */
    Result<void> load(const std::string &filename) {
        std::ifstream fin(filename.c_str());
        if (!fin) {
            return Err(ErrorCode::FILE_NOT_FOUND, "Cannot open config file " + filename);
        }
        std::string line;
        int lineno = 0;
        while (std::getline(fin, line)) {
            lineno++;
            std::string t = trim(line);
            if (t.empty() || t[0] == '#') {
                continue;
            }
            size_t sep = t.find_first_of(" \t");
            if (sep == std::string::npos) {
                return Err(ErrorCode::CONFIG_PARSE_ERROR,
                    filename + ":" + std::to_string(lineno) + ": missing value for '" + t + "'");
            }
            data_[t.substr(0, sep)] = trim(t.substr(sep + 1));
        }
        return Ok();
    }

    void set(const std::string &key, const std::string &val) {
        data_[key] = val;
    }

    /**
     * @brief 添加配置项（如果不存在）
     */
    void add(const std::string &key, const std::string &val) {
        if (data_.count(key) == 0) {
            data_[key] = val;
        }
    }

    bool has(const std::string &key) const {
        return data_.count(key) != 0;
    }

    bool is(const std::string &key, const std::string &val) const {
        auto it = data_.find(key);
        return it != data_.end() && it->second == val;
    }

    std::string get_str(const std::string &key, const std::string &default_val = "") const {
        auto it = data_.find(key);
        return (it != data_.end()) ? it->second : default_val;
    }

    /**
     * @brief 获取整数配置，格式错误时返回错误
     */
    Result<long long> get_int(const std::string &key, long long default_val) const {
        auto it = data_.find(key);
        if (it == data_.end()) {
            return default_val;
        }
        const std::string &s = it->second;
        char *end = nullptr;
        errno = 0;
        long long v = strtoll(s.c_str(), &end, 10);
        if (s.empty() || *end != '\0' || errno == ERANGE) {
            return Err<long long>(ErrorCode::CONFIG_INVALID_VALUE,
                "'" + key + "' expects an integer, got '" + s + "'");
        }
        return v;
    }

    /**
     * @brief 获取开关配置：on/off、true/false、yes/no、1/0
     */
    Result<bool> get_bool(const std::string &key, bool default_val) const {
        auto it = data_.find(key);
        if (it == data_.end()) {
            return default_val;
        }
        const std::string &s = it->second;
        if (s == "on" || s == "true" || s == "yes" || s == "1") return true;
        if (s == "off" || s == "false" || s == "no" || s == "0") return false;
        return Err<bool>(ErrorCode::CONFIG_INVALID_VALUE,
            "'" + key + "' expects on/off, got '" + s + "'");
    }

    const std::map<std::string, std::string>& data() const { return data_; }
};

/**
 * @brief 测试器选项
 */
struct TesterOptions {
    int time_limit_ms = 3000;                  ///< 每次运行的墙上时间限制
    bool compare_output = true;                ///< AC 后是否再比对 .out
    bool strict_comparison = false;            ///< 严格/宽松比对
    int repeat = 1;                            ///< 每个测资运行次数
    std::vector<FilterToken> cases;            ///< 空表示全部
    std::optional<size_t> max_diffs = 10;      ///< std::nullopt 表示不限制
    bool show_missing_output = false;          ///< 缺少 .out 时显示原始输出
    bool show_raw_output = false;              ///< 总是显示原始输出
    std::string test_case_dir;                 ///< 空表示目标程序旁的 test_case/

    /**
     * @brief 检查取值范围
     */
    Result<void> validate() const {
        OJT_ENSURE(time_limit_ms > 0, ErrorCode::CONFIG_INVALID_VALUE,
                   "time limit must be positive");
        OJT_ENSURE(repeat >= 1, ErrorCode::CONFIG_INVALID_VALUE,
                   "repeat count must be at least 1");
        return Ok();
    }

    /**
     * @brief 从 Config 读取，未出现的键保持默认值
     */
    static Result<TesterOptions> from_config(const Config &config) {
        TesterOptions opt;

        OJT_TRY_UNWRAP(time_limit, config.get_int("time_limit", opt.time_limit_ms));
        OJT_TRY_UNWRAP(repeat, config.get_int("repeat", opt.repeat));
        OJT_TRY_UNWRAP(compare, config.get_bool("compare_output", opt.compare_output));
        OJT_TRY_UNWRAP(strict, config.get_bool("strict", opt.strict_comparison));
        OJT_TRY_UNWRAP(show_missing, config.get_bool("show_missing_output", opt.show_missing_output));
        OJT_TRY_UNWRAP(show_raw, config.get_bool("show_raw_output", opt.show_raw_output));

        OJT_ENSURE(time_limit > 0 && time_limit <= INT32_MAX, ErrorCode::CONFIG_INVALID_VALUE,
                   "'time_limit' out of range");
        OJT_ENSURE(repeat >= 1 && repeat <= INT32_MAX, ErrorCode::CONFIG_INVALID_VALUE,
                   "'repeat' must be at least 1");

        opt.time_limit_ms = static_cast<int>(time_limit);
        opt.repeat = static_cast<int>(repeat);
        opt.compare_output = compare;
        opt.strict_comparison = strict;
        opt.show_missing_output = show_missing;
        opt.show_raw_output = show_raw;
        opt.test_case_dir = config.get_str("test_case_dir", "");

        if (config.has("max_diffs")) {
            OJT_TRY_UNWRAP(max_diffs, parse_max_diffs(config.get_str("max_diffs")));
            opt.max_diffs = max_diffs;
        }

        std::string cases = config.get_str("cases", "");
        std::stringstream ss(cases);
        std::string token;
        while (std::getline(ss, token, ',')) {
            token = trim(token);
            if (!token.empty()) {
                opt.cases.push_back(parse_token(token));
            }
        }

        return opt;
    }

    /**
     * @brief 解析 max_diffs："none" 表示不限制，否则为非负整数
     */
    static Result<std::optional<size_t>> parse_max_diffs(const std::string &s) {
        if (s == "none" || s == "unlimited") {
            return std::optional<size_t>();
        }
        if (!is_all_digits(s)) {
            return Err<std::optional<size_t>>(ErrorCode::CONFIG_INVALID_VALUE,
                "max diffs expects a non-negative integer or 'none', got '" + s + "'");
        }
        errno = 0;
        unsigned long long v = strtoull(s.c_str(), nullptr, 10);
        if (errno == ERANGE) {
            return Err<std::optional<size_t>>(ErrorCode::CONFIG_INVALID_VALUE,
                "max diffs out of range: " + s);
        }
        return std::optional<size_t>(static_cast<size_t>(v));
    }
};

} // namespace ojt

#endif // OJT_CORE_CONFIG_H
