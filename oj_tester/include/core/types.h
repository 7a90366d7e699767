/**
 * @file types.h
 * @brief 核心数据结构定义
 * 
 * 包含测试器使用的基础数据结构：
 * - Status: 五种最终结果
 * - RunOutcome: 单次运行结果
 * - RepeatOutcome: 重复运行结果
 * - Verdict: 输出比对结果
 * - CaseResult: 单个测资的最终结果
 * - TimingSummary: 用时统计
 */

#ifndef OJT_CORE_TYPES_H
#define OJT_CORE_TYPES_H

#include <string>
#include <vector>
#include <ostream>
#include <algorithm>
#include <numeric>

namespace ojt {

/**
 * @brief 测资结果类型
 */
enum class Status {
    AC,       ///< Accepted
    WA,       ///< Wrong Answer
    TLE,      ///< Time Limit Exceeded
    RE,       ///< Runtime Error
    MISSING   ///< 缺少 .out 文件
};

inline const char* status_to_string(Status status) {
    switch (status) {
        case Status::AC:      return "AC";
        case Status::WA:      return "WA";
        case Status::TLE:     return "TLE";
        case Status::RE:      return "RE";
        case Status::MISSING: return "MISSING";
    }
    return "UNKNOWN";
}

/**
 * @brief 获取结果类型的完整描述
 */
inline const char* status_description(Status status) {
    switch (status) {
        case Status::AC:      return "Accepted";
        case Status::WA:      return "Wrong Answer";
        case Status::TLE:     return "Time Limit Exceeded";
        case Status::RE:      return "Runtime Error";
        case Status::MISSING: return "Missing Expected Output";
    }
    return "Unknown Result";
}

inline std::ostream& operator<<(std::ostream &os, Status status) {
    return os << status_to_string(status);
}

/**
 * @brief 单次运行结果
 *
 * TLE 时 output 为被杀之前捕获到的输出，diagnostic 为空。
 */
struct RunOutcome {
    Status status = Status::RE;
    std::string output;       ///< 标准输出
    double elapsed_ms = 0;    ///< 墙上时间（毫秒）
    std::string diagnostic;   ///< RE 时为标准错误或启动失败原因

    RunOutcome() = default;
    RunOutcome(Status _status, std::string _output, double _elapsed_ms, std::string _diagnostic)
        : status(_status), output(std::move(_output)),
          elapsed_ms(_elapsed_ms), diagnostic(std::move(_diagnostic)) {}
};

/**
 * @brief 重复运行结果
 */
struct RepeatOutcome {
    Status status = Status::RE;
    std::vector<double> times;   ///< 每次尝试的用时，按尝试顺序
    std::string output;
    std::string diagnostic;
};

/**
 * @brief 输出比对结果，AC 时 report 为空
 */
struct Verdict {
    Status status = Status::AC;
    std::string report;

    bool accepted() const { return status == Status::AC; }
};

/**
 * @brief 单个测资的最终结果
 */
struct CaseResult {
    std::string case_name;
    Status status = Status::RE;
    std::vector<double> execution_times;
    std::string output;
    std::string error_message;   ///< WA 的 diff / RE 的错误输出 / MISSING 的说明
};

/**
 * @brief 用时统计
 */
struct TimingSummary {
    size_t count = 0;
    double mean = 0;
    double min = 0;
    double max = 0;

    static TimingSummary of(const std::vector<double> &times) {
        TimingSummary s;
        s.count = times.size();
        if (times.empty()) {
            return s;
        }
        s.mean = std::accumulate(times.begin(), times.end(), 0.0) / times.size();
        auto [lo, hi] = std::minmax_element(times.begin(), times.end());
        s.min = *lo;
        s.max = *hi;
        return s;
    }
};

} // namespace ojt

#endif // OJT_CORE_TYPES_H
