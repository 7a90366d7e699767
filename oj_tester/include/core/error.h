/**
 * @file error.h
 * @brief 统一错误处理机制
 * 
 * 提供：
 * - Result<T> 类型：类似 Rust 的结果类型
 * - Error 类和错误码
 * - 错误传播宏
 * 
 * 只有测试器级别的失败（找不到目标程序、没有测资）会作为 Error 返回给调用者；
 * 单个测资的失败（RE/TLE/WA/MISSING）一律折叠进该测资的结果。
 */

#ifndef OJT_CORE_ERROR_H
#define OJT_CORE_ERROR_H

#include <string>
#include <variant>
#include <optional>
#include <stdexcept>
#include <sstream>
#include <ostream>
#include <type_traits>

namespace ojt {

//==============================================================================
// 错误码定义
//==============================================================================

enum class ErrorCode {
    OK = 0,
    
    // 文件操作错误 (1xx)
    FILE_NOT_FOUND = 100,
    FILE_READ_ERROR = 101,
    
    // 配置错误 (2xx)
    CONFIG_PARSE_ERROR = 200,
    CONFIG_INVALID_VALUE = 201,
    
    // 测资发现错误 (3xx)
    TARGET_NOT_FOUND = 300,
    NO_TEST_CASES = 301,
    
    // 进程错误 (4xx)
    SPAWN_FAILED = 400,
    PIPE_FAILED = 401,
    FORK_FAILED = 402,
    WAIT_FAILED = 403,
    
    // 系统错误 (9xx)
    SYSTEM_ERROR = 900,
    UNKNOWN_ERROR = 999
};

inline const char* error_code_str(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::FILE_READ_ERROR: return "FILE_READ_ERROR";
        case ErrorCode::CONFIG_PARSE_ERROR: return "CONFIG_PARSE_ERROR";
        case ErrorCode::CONFIG_INVALID_VALUE: return "CONFIG_INVALID_VALUE";
        case ErrorCode::TARGET_NOT_FOUND: return "TARGET_NOT_FOUND";
        case ErrorCode::NO_TEST_CASES: return "NO_TEST_CASES";
        case ErrorCode::SPAWN_FAILED: return "SPAWN_FAILED";
        case ErrorCode::PIPE_FAILED: return "PIPE_FAILED";
        case ErrorCode::FORK_FAILED: return "FORK_FAILED";
        case ErrorCode::WAIT_FAILED: return "WAIT_FAILED";
        case ErrorCode::SYSTEM_ERROR: return "SYSTEM_ERROR";
        case ErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
    }
    return "UNKNOWN_ERROR";
}

inline std::ostream& operator<<(std::ostream &os, ErrorCode code) {
    return os << error_code_str(code);
}

//==============================================================================
// Error 类
//==============================================================================

/**
 * @brief 错误信息类
 */
class Error {
private:
    ErrorCode code_;
    std::string message_;
    std::string file_;
    int line_;

public:
    Error() : code_(ErrorCode::OK), line_(0) {}
    
    Error(ErrorCode code, const std::string &message = "")
        : code_(code), message_(message), line_(0) {}
    
    Error(ErrorCode code, const std::string &message, 
          const char *file, int line)
        : code_(code), message_(message), file_(file ? file : ""), line_(line) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

    /**
     * @brief 格式化错误信息
     */
    std::string to_string() const {
        std::ostringstream oss;
        oss << "[" << error_code_str(code_) << "]";
        if (!message_.empty()) {
            oss << " " << message_;
        }
        if (!file_.empty() && line_ > 0) {
            oss << " at " << file_ << ":" << line_;
        }
        return oss.str();
    }
};

//==============================================================================
// Result<T> 类型
//==============================================================================

/**
 * @brief 结果类型，类似 Rust 的 Result<T, E>
 * 
 * 用法：
 *   auto r = config.get_int("repeat", 1);
 *   if (r.ok()) {
 *       use(r.value());
 *   } else {
 *       OJT_LOG_ERROR << r.error().to_string();
 *   }
 */
template<typename T>
class Result {
private:
    std::variant<T, Error> data_;

public:
    Result(const T &value) : data_(value) {}
    Result(T &&value) : data_(std::move(value)) {}
    
    Result(const Error &err) : data_(err) {}
    Result(Error &&err) : data_(std::move(err)) {}
    Result(ErrorCode code, const std::string &msg = "") 
        : data_(Error(code, msg)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    bool is_error() const { return std::holds_alternative<Error>(data_); }
    explicit operator bool() const { return ok(); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const & { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }
    
    Error& error() & { return std::get<Error>(data_); }
    const Error& error() const & { return std::get<Error>(data_); }

};

/**
 * @brief 无值的结果类型（仅表示成功/失败）
 */
template<>
class Result<void> {
private:
    std::optional<Error> error_;

public:
    Result() : error_(std::nullopt) {}
    Result(const Error &err) : error_(err) {}
    Result(Error &&err) : error_(std::move(err)) {}
    Result(ErrorCode code, const std::string &msg = "") 
        : error_(Error(code, msg)) {}

    bool ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }
    explicit operator bool() const { return ok(); }

    Error& error() { return *error_; }
    const Error& error() const { return *error_; }
};

//==============================================================================
// 便捷函数
//==============================================================================

template<typename T>
Result<std::decay_t<T>> Ok(T &&value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

inline Result<void> Ok() {
    return Result<void>();
}

template<typename T = void>
Result<T> Err(ErrorCode code, const std::string &message = "") {
    return Result<T>(Error(code, message));
}

//==============================================================================
// 错误处理宏
//==============================================================================

/**
 * @brief 创建带位置信息的错误
 */
#define OJT_ERROR(code, msg) \
    ojt::Error(code, msg, __FILE__, __LINE__)

/**
 * @brief 如果结果是错误，则返回错误（类似 Rust 的 ? 操作符）
 */
#define OJT_TRY(expr) \
    do { \
        auto _result = (expr); \
        if (_result.is_error()) { \
            return _result.error(); \
        } \
    } while (0)

/**
 * @brief 如果结果是错误，则返回错误；否则解包值
 */
#define OJT_TRY_UNWRAP(var, expr) \
    auto _tmp_##var = (expr); \
    if (_tmp_##var.is_error()) { \
        return _tmp_##var.error(); \
    } \
    auto var = std::move(_tmp_##var.value())

/**
 * @brief 断言条件，失败时返回错误
 */
#define OJT_ENSURE(cond, code, msg) \
    do { \
        if (!(cond)) { \
            return OJT_ERROR(code, msg); \
        } \
    } while (0)

} // namespace ojt

#endif // OJT_CORE_ERROR_H
