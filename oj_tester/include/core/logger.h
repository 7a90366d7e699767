/**
 * @file logger.h
 * @brief 轻量级日志系统
 *
 * 特性：
 * - 多日志级别 (TRACE, DEBUG, INFO, WARN, ERROR, FATAL)
 * - 控制台彩色输出（固定写到 stderr，stdout 留给测试报告和子进程的答案）
 * - 可选文件输出
 * - 级别可由环境变量 OJT_LOG_LEVEL 指定
 * - 零依赖（仅标准库）
 */

#ifndef OJT_CORE_LOGGER_H
#define OJT_CORE_LOGGER_H

#include <string>
#include <fstream>
#include <iostream>
#include <sstream>
#include <ctime>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <memory>
#include <vector>
#include <cstdarg>
#include <cstdlib>
#include <cctype>
#include <optional>
#include <unistd.h>

namespace ojt {

/**
 * @brief 日志级别
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    FATAL = 5,
    OFF   = 6
};

inline const char* level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF  ";
    }
    return "?????";
}

/**
 * @brief 解析日志级别名称（不区分大小写）
 * @return 无法识别时返回 std::nullopt
 */
inline std::optional<LogLevel> level_from_string(std::string name) {
    for (auto &c : name) {
        c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    }
    if (name == "trace") return LogLevel::TRACE;
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info")  return LogLevel::INFO;
    if (name == "warn" || name == "warning") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    if (name == "fatal") return LogLevel::FATAL;
    if (name == "off")   return LogLevel::OFF;
    return std::nullopt;
}

inline const char* level_to_color(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "\033[90m";      // 灰色
        case LogLevel::DEBUG: return "\033[36m";      // 青色
        case LogLevel::INFO:  return "\033[32m";      // 绿色
        case LogLevel::WARN:  return "\033[33m";      // 黄色
        case LogLevel::ERROR: return "\033[31m";      // 红色
        case LogLevel::FATAL: return "\033[35;1m";    // 粗体紫色
        case LogLevel::OFF:   break;
    }
    return "";
}

/**
 * @brief 日志输出接口
 */
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(LogLevel level, const std::string &message) = 0;
    virtual void flush() = 0;
};

/**
 * @brief 控制台输出，只写 stderr
 */
class ConsoleSink : public LogSink {
private:
    bool use_color_;
    std::mutex mutex_;

public:
    explicit ConsoleSink(bool use_color = true) : use_color_(use_color) {}

    void write(LogLevel level, const std::string &message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (use_color_) {
            std::cerr << level_to_color(level) << message << "\033[0m" << std::endl;
        } else {
            std::cerr << message << std::endl;
        }
    }

    void flush() override {
        std::cerr.flush();
    }
};

/**
 * @brief 文件输出
 */
class FileSink : public LogSink {
private:
    std::ofstream file_;
    std::mutex mutex_;

public:
    explicit FileSink(const std::string &filename, bool append = true) {
        file_.open(filename, append ? std::ios::app : std::ios::trunc);
    }

    bool is_open() const { return file_.is_open(); }

    void write(LogLevel, const std::string &message) override {
        if (!file_.is_open()) return;

        std::lock_guard<std::mutex> lock(mutex_);
        file_ << message << std::endl;
    }

    void flush() override {
        if (file_.is_open()) {
            file_.flush();
        }
    }
};

/**
 * @brief 日志记录器
 */
class Logger {
private:
    std::string name_;
    LogLevel level_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
    std::mutex mutex_;
    bool show_timestamp_;
    bool show_level_;
    bool show_location_;

    static std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::ostringstream oss;
        oss << std::put_time(std::localtime(&time), "%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    static std::string basename(const std::string &path) {
        size_t pos = path.find_last_of("/\\");
        return (pos == std::string::npos) ? path : path.substr(pos + 1);
    }

public:
    explicit Logger(const std::string &name = "oj_tester")
        : name_(name), level_(LogLevel::WARN),
          show_timestamp_(true), show_level_(true), show_location_(false) {}

    Logger& set_level(LogLevel level) { level_ = level; return *this; }
    Logger& show_location(bool show) { show_location_ = show; return *this; }

    Logger& add_sink(std::shared_ptr<LogSink> sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.push_back(std::move(sink));
        return *this;
    }

    Logger& add_console(bool use_color = true) {
        return add_sink(std::make_shared<ConsoleSink>(use_color));
    }

    /**
     * @brief 添加文件输出
     * @return 文件能否打开
     */
    bool add_file(const std::string &filename, bool append = true) {
        auto sink = std::make_shared<FileSink>(filename, append);
        if (!sink->is_open()) {
            return false;
        }
        add_sink(sink);
        return true;
    }

    void flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &sink : sinks_) {
            sink->flush();
        }
    }

    /**
     * @brief 核心日志方法
     */
    void log(LogLevel level, const char *file, int line, const std::string &message) {
        if (level < level_ || level_ == LogLevel::OFF) return;

        std::ostringstream oss;
        if (show_timestamp_) {
            oss << "[" << get_timestamp() << "] ";
        }
        if (show_level_) {
            oss << "[" << level_to_string(level) << "] ";
        }
        oss << name_ << ": ";
        if (show_location_ && file) {
            oss << "[" << basename(file) << ":" << line << "] ";
        }
        oss << message;

        std::string formatted = oss.str();

        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &sink : sinks_) {
            sink->write(level, formatted);
        }
    }

    /**
     * @brief printf 风格日志
     */
    void logf(LogLevel level, const char *file, int line, const char *fmt, ...) {
        if (level < level_) return;

        char buffer[4096];
        va_list args;
        va_start(args, fmt);
        vsnprintf(buffer, sizeof(buffer), fmt, args);
        va_end(args);

        log(level, file, line, buffer);
    }
};

/**
 * @brief 全局默认日志器
 *
 * 第一次使用时按 OJT_LOG_LEVEL 设置级别，stderr 是终端时启用颜色。
 */
inline Logger& default_logger() {
    static Logger logger("oj_tester");
    static bool initialized = false;
    if (!initialized) {
        initialized = true;
        logger.add_console(isatty(STDERR_FILENO) != 0);
        const char *env = getenv("OJT_LOG_LEVEL");
        if (env != nullptr) {
            if (auto level = level_from_string(env)) {
                logger.set_level(*level);
            }
        }
    }
    return logger;
}

/**
 * @brief 流式日志构建器
 */
class LogStream {
private:
    Logger &logger_;
    LogLevel level_;
    const char *file_;
    int line_;
    std::ostringstream stream_;

public:
    LogStream(Logger &logger, LogLevel level, const char *file, int line)
        : logger_(logger), level_(level), file_(file), line_(line) {}

    ~LogStream() {
        logger_.log(level_, file_, line_, stream_.str());
    }

    template<typename T>
    LogStream& operator<<(const T &value) {
        stream_ << value;
        return *this;
    }
};

} // namespace ojt

//==============================================================================
// 日志宏
//==============================================================================

#define OJT_LOG_SET_LEVEL(level) ojt::default_logger().set_level(level)

#define OJT_LOG_TRACE ojt::LogStream(ojt::default_logger(), ojt::LogLevel::TRACE, __FILE__, __LINE__)
#define OJT_LOG_DEBUG ojt::LogStream(ojt::default_logger(), ojt::LogLevel::DEBUG, __FILE__, __LINE__)
#define OJT_LOG_INFO  ojt::LogStream(ojt::default_logger(), ojt::LogLevel::INFO,  __FILE__, __LINE__)
#define OJT_LOG_WARN  ojt::LogStream(ojt::default_logger(), ojt::LogLevel::WARN,  __FILE__, __LINE__)
#define OJT_LOG_ERROR ojt::LogStream(ojt::default_logger(), ojt::LogLevel::ERROR, __FILE__, __LINE__)
#define OJT_LOG_FATAL ojt::LogStream(ojt::default_logger(), ojt::LogLevel::FATAL, __FILE__, __LINE__)

#define OJT_LOG_DEBUGF(fmt, ...) ojt::default_logger().logf(ojt::LogLevel::DEBUG, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#endif // OJT_CORE_LOGGER_H
