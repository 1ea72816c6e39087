/**
 * @file logger.h
 * @brief 日志器与输出端
 *
 * 一个 Logger 是一个命名通道，可挂多个 LogSink。每行格式：
 *
 *   [2024-05-01 12:00:00.123] [WARN ] [sandbox] [t140...] [executor.h:210] message
 *
 * 时间、通道名、线程、位置各自可开关。流式宏 LOG_* 写默认通道，
 * LOGGER_*(logger) 写指定通道。
 */

#ifndef SJ_CORE_LOGGER_H
#define SJ_CORE_LOGGER_H

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
#include <thread>
#include <atomic>
#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <cctype>

namespace sj {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    FATAL = 5,
    OFF   = 6   ///< 只用作阈值
};

namespace detail {

struct LevelStyle {
    const char *label;   ///< 定宽 5
    const char *color;
};

inline const LevelStyle& level_style(LogLevel level) {
    static const LevelStyle styles[] = {
        {"TRACE", "\033[90m"},
        {"DEBUG", "\033[36m"},
        {"INFO ", "\033[32m"},
        {"WARN ", "\033[33m"},
        {"ERROR", "\033[31m"},
        {"FATAL", "\033[35;1m"},
        {"?????", ""},
    };
    return styles[std::min(static_cast<int>(level), 6)];
}

} // namespace detail

inline const char* level_to_string(LogLevel level) {
    return detail::level_style(level).label;
}

/**
 * @brief 解析配置里的级别名（大小写不敏感），无法识别时返回 fallback
 */
inline LogLevel parse_log_level(std::string s, LogLevel fallback = LogLevel::INFO) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    static const char *names[] = {"trace", "debug", "info", "warn", "error", "fatal", "off"};
    for (int i = 0; i < 7; i++) {
        if (s == names[i]) {
            return static_cast<LogLevel>(i);
        }
    }
    return s == "warning" ? LogLevel::WARN : fallback;
}

//==============================================================================
// 输出端
//==============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(LogLevel level, const std::string &line) = 0;
    virtual void flush() = 0;
};

/**
 * @brief 控制台输出
 *
 * 低于 min_level 的行直接丢掉；WARN 及以上写 stderr，其余写 stdout。
 */
class ConsoleSink : public LogSink {
private:
    bool color_;
    LogLevel min_level_;
    std::mutex mutex_;

public:
    explicit ConsoleSink(bool color = true, LogLevel min_level = LogLevel::TRACE)
        : color_(color), min_level_(min_level) {}

    void write(LogLevel level, const std::string &line) override {
        if (level < min_level_) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostream &out = level >= LogLevel::WARN ? std::cerr : std::cout;
        if (color_) {
            out << detail::level_style(level).color << line << "\033[0m\n";
        } else {
            out << line << '\n';
        }
        if (level >= LogLevel::WARN) {
            out.flush();
        }
    }

    void flush() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout.flush();
        std::cerr.flush();
    }
};

/**
 * @brief 追加写文件；WARN 及以上立即落盘，其余由 flush() 落盘
 */
class FileSink : public LogSink {
private:
    std::ofstream file_;
    std::mutex mutex_;

public:
    explicit FileSink(const std::string &path) : file_(path, std::ios::app) {}

    bool is_open() const { return file_.is_open(); }

    void write(LogLevel level, const std::string &line) override {
        std::lock_guard<std::mutex> lock(mutex_);
        file_ << line << '\n';
        if (level >= LogLevel::WARN) {
            file_.flush();
        }
    }

    void flush() override {
        std::lock_guard<std::mutex> lock(mutex_);
        file_.flush();
    }
};

//==============================================================================
// Logger
//==============================================================================

class Logger {
private:
    std::string name_;
    std::atomic<LogLevel> level_{LogLevel::INFO};
    std::vector<std::shared_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;

    bool timestamp_ = true;
    bool name_tag_ = true;
    bool thread_tag_ = false;
    bool location_ = false;

    static void put_timestamp(std::ostream &os) {
        auto now = std::chrono::system_clock::now();
        std::time_t secs = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm tm_buf;
        localtime_r(&secs, &tm_buf);
        os << '[' << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
           << ms << "] ";
    }

    std::string format(LogLevel level, const char *file, int line, const std::string &message) const {
        std::ostringstream oss;
        if (timestamp_) {
            put_timestamp(oss);
        }
        oss << '[' << level_to_string(level) << "] ";
        if (name_tag_) {
            oss << '[' << name_ << "] ";
        }
        if (thread_tag_) {
            oss << "[t" << std::this_thread::get_id() << "] ";
        }
        if (location_ && file) {
            const char *base = std::strrchr(file, '/');
            oss << '[' << (base ? base + 1 : file) << ':' << line << "] ";
        }
        oss << message;
        return oss.str();
    }

public:
    explicit Logger(std::string name = "sj") : name_(std::move(name)) {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    Logger& set_level(LogLevel level) { level_ = level; return *this; }
    Logger& show_timestamp(bool on) { timestamp_ = on; return *this; }
    Logger& show_name(bool on) { name_tag_ = on; return *this; }
    Logger& show_thread(bool on) { thread_tag_ = on; return *this; }
    Logger& show_location(bool on) { location_ = on; return *this; }

    LogLevel level() const { return level_.load(); }
    const std::string& name() const { return name_; }

    bool enabled(LogLevel level) const {
        LogLevel threshold = level_.load();
        return threshold != LogLevel::OFF && level >= threshold;
    }

    Logger& add_sink(std::shared_ptr<LogSink> sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.push_back(std::move(sink));
        return *this;
    }

    Logger& add_console(bool color = true, LogLevel min_level = LogLevel::TRACE) {
        return add_sink(std::make_shared<ConsoleSink>(color, min_level));
    }

    /**
     * @brief 挂一个文件输出
     * @return 文件打不开时返回 false，不挂
     */
    bool add_file(const std::string &path) {
        auto sink = std::make_shared<FileSink>(path);
        if (!sink->is_open()) {
            return false;
        }
        add_sink(std::move(sink));
        return true;
    }

    void clear_sinks() {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.clear();
    }

    void flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &sink : sinks_) {
            sink->flush();
        }
    }

    void log(LogLevel level, const char *file, int line, const std::string &message) {
        if (!enabled(level)) {
            return;
        }
        std::string formatted = format(level, file, line, message);
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &sink : sinks_) {
            sink->write(level, formatted);
        }
    }

    void logf(LogLevel level, const char *file, int line, const char *fmt, ...) {
        if (!enabled(level)) {
            return;
        }
        va_list args;
        va_start(args, fmt);
        va_list copy;
        va_copy(copy, args);
        int n = std::vsnprintf(nullptr, 0, fmt, copy);
        va_end(copy);
        std::string buf(n > 0 ? static_cast<size_t>(n) : 0, '\0');
        if (n > 0) {
            std::vsnprintf(&buf[0], buf.size() + 1, fmt, args);
        }
        va_end(args);
        log(level, file, line, buf);
    }
};

/**
 * @brief 进程级默认通道，带控制台输出
 */
inline Logger& default_logger() {
    static Logger logger("sj");
    static std::once_flag once;
    std::call_once(once, [] { logger.add_console(true); });
    return logger;
}

/**
 * @brief 流式构建一行日志，析构时提交
 */
class LogStream {
private:
    Logger &logger_;
    LogLevel level_;
    const char *file_;
    int line_;
    bool on_;
    std::ostringstream stream_;

public:
    LogStream(Logger &logger, LogLevel level, const char *file, int line)
        : logger_(logger), level_(level), file_(file), line_(line), on_(logger.enabled(level)) {}

    ~LogStream() {
        if (on_) {
            logger_.log(level_, file_, line_, stream_.str());
        }
    }

    template<typename T>
    LogStream& operator<<(const T &value) {
        if (on_) {
            stream_ << value;
        }
        return *this;
    }
};

} // namespace sj

#define LOGGER_TRACE(logger) sj::LogStream(logger, sj::LogLevel::TRACE, __FILE__, __LINE__)
#define LOGGER_DEBUG(logger) sj::LogStream(logger, sj::LogLevel::DEBUG, __FILE__, __LINE__)
#define LOGGER_INFO(logger)  sj::LogStream(logger, sj::LogLevel::INFO,  __FILE__, __LINE__)
#define LOGGER_WARN(logger)  sj::LogStream(logger, sj::LogLevel::WARN,  __FILE__, __LINE__)
#define LOGGER_ERROR(logger) sj::LogStream(logger, sj::LogLevel::ERROR, __FILE__, __LINE__)
#define LOGGER_FATAL(logger) sj::LogStream(logger, sj::LogLevel::FATAL, __FILE__, __LINE__)

#define LOG_TRACE LOGGER_TRACE(sj::default_logger())
#define LOG_DEBUG LOGGER_DEBUG(sj::default_logger())
#define LOG_INFO  LOGGER_INFO(sj::default_logger())
#define LOG_WARN  LOGGER_WARN(sj::default_logger())
#define LOG_ERROR LOGGER_ERROR(sj::default_logger())

#endif // SJ_CORE_LOGGER_H
