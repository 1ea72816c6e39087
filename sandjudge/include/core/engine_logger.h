/**
 * @file engine_logger.h
 * @brief 评测引擎专用日志通道
 *
 * 为引擎各子系统提供预配置的日志器：
 * - main     主日志（控制台 + 文件）
 * - router   策略路由
 * - sandbox  沙箱生命周期与执行
 * - judge    评测过程
 * - worker   队列与工作线程
 * - audit    安全违规审计
 */

#ifndef SJ_CORE_ENGINE_LOGGER_H
#define SJ_CORE_ENGINE_LOGGER_H

#include "logger.h"
#include "utils.h"
#include <string>
#include <iostream>

namespace sj {

/**
 * @brief 引擎日志管理器
 */
class EngineLogger {
private:
    Logger main_logger_;      ///< 主日志
    Logger router_logger_;    ///< 路由日志
    Logger sandbox_logger_;   ///< 沙箱日志
    Logger judge_logger_;     ///< 评测日志
    Logger worker_logger_;    ///< 工作线程日志
    Logger audit_logger_;     ///< 审计日志（始终写文件）
    std::string log_dir_;
    bool initialized_ = false;

    Logger* all_[6];

public:
    explicit EngineLogger(const std::string &log_dir = "/tmp/sandjudge/log")
        : main_logger_("main"),
          router_logger_("router"),
          sandbox_logger_("sandbox"),
          judge_logger_("judge"),
          worker_logger_("worker"),
          audit_logger_("audit"),
          log_dir_(log_dir),
          all_{&main_logger_, &router_logger_, &sandbox_logger_,
               &judge_logger_, &worker_logger_, &audit_logger_} {
        // 未初始化时子通道也输出到控制台，测试与工具代码无需额外配置
        for (Logger *l : all_) {
            l->set_level(LogLevel::WARN).add_console(true);
        }
    }

    /**
     * @brief 初始化日志系统
     *
     * @param level   所有通道的日志级别
     * @param console 是否输出到控制台：main 通道全部输出，其余通道只输出 WARN 及以上
     */
    void init(LogLevel level = LogLevel::INFO, bool console = true) {
        if (initialized_) {
            set_all_levels(level);
            return;
        }

        auto made = make_dirs(log_dir_, 0755);
        if (made.is_error()) {
            std::cerr << "Cannot create log directory: " << made.error().message() << std::endl;
        }

        for (Logger *l : all_) {
            l->clear_sinks();
            l->set_level(level)
              .show_timestamp(true)
              .show_location(level <= LogLevel::DEBUG);
            std::string path = log_dir_ + "/" + l->name() + ".log";
            if (!l->add_file(path)) {
                std::cerr << "Cannot open log file " << path << std::endl;
            }
            if (console) {
                l->add_console(true, l == &main_logger_ ? LogLevel::TRACE : LogLevel::WARN);
            }
        }
        worker_logger_.show_thread(true);
        audit_logger_.set_level(LogLevel::INFO);
        initialized_ = true;
    }

    /**
     * @brief 设置日志目录（需要在 init 之前调用）
     */
    void set_log_dir(const std::string &dir) {
        log_dir_ = dir;
    }

    const std::string& log_dir() const { return log_dir_; }

    Logger& main()    { return main_logger_; }
    Logger& router()  { return router_logger_; }
    Logger& sandbox() { return sandbox_logger_; }
    Logger& judge()   { return judge_logger_; }
    Logger& worker()  { return worker_logger_; }
    Logger& audit()   { return audit_logger_; }

    void flush_all() {
        for (Logger *l : all_) {
            l->flush();
        }
    }

    void set_all_levels(LogLevel level) {
        for (Logger *l : all_) {
            l->set_level(level);
        }
    }
};

/**
 * @brief 获取全局引擎日志器
 */
inline EngineLogger& engine_log() {
    static EngineLogger instance;
    return instance;
}

} // namespace sj

//==============================================================================
// 引擎专用日志宏
//==============================================================================

// 主日志
#define ELOG_DEBUG LOGGER_DEBUG(sj::engine_log().main())
#define ELOG_INFO  LOGGER_INFO(sj::engine_log().main())
#define ELOG_WARN  LOGGER_WARN(sj::engine_log().main())
#define ELOG_ERROR LOGGER_ERROR(sj::engine_log().main())
#define ELOG_FATAL LOGGER_FATAL(sj::engine_log().main())

// 路由日志
#define RTLOG_DEBUG LOGGER_DEBUG(sj::engine_log().router())
#define RTLOG_INFO  LOGGER_INFO(sj::engine_log().router())
#define RTLOG_WARN  LOGGER_WARN(sj::engine_log().router())

// 沙箱日志
#define SLOG_TRACE LOGGER_TRACE(sj::engine_log().sandbox())
#define SLOG_DEBUG LOGGER_DEBUG(sj::engine_log().sandbox())
#define SLOG_INFO  LOGGER_INFO(sj::engine_log().sandbox())
#define SLOG_WARN  LOGGER_WARN(sj::engine_log().sandbox())
#define SLOG_ERROR LOGGER_ERROR(sj::engine_log().sandbox())

// 评测日志
#define JLOG_DEBUG LOGGER_DEBUG(sj::engine_log().judge())
#define JLOG_INFO  LOGGER_INFO(sj::engine_log().judge())
#define JLOG_WARN  LOGGER_WARN(sj::engine_log().judge())

// 工作线程日志
#define WLOG_DEBUG LOGGER_DEBUG(sj::engine_log().worker())
#define WLOG_INFO  LOGGER_INFO(sj::engine_log().worker())
#define WLOG_WARN  LOGGER_WARN(sj::engine_log().worker())
#define WLOG_ERROR LOGGER_ERROR(sj::engine_log().worker())

// 审计日志
#define ALOG_INFO  LOGGER_INFO(sj::engine_log().audit())
#define ALOG_WARN  LOGGER_WARN(sj::engine_log().audit())

// printf 风格
#define ELOG_INFOF(fmt, ...)  sj::engine_log().main().logf(sj::LogLevel::INFO, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define SLOG_DEBUGF(fmt, ...) sj::engine_log().sandbox().logf(sj::LogLevel::DEBUG, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define WLOG_INFOF(fmt, ...)  sj::engine_log().worker().logf(sj::LogLevel::INFO, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#endif // SJ_CORE_ENGINE_LOGGER_H
