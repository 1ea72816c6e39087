/**
 * @file config.h
 * @brief 引擎配置
 *
 * 从 engine.yaml 读取，缺省键取默认值，类型错误或取值越界返回
 * CONFIG_INVALID_VALUE。相对路径以配置文件所在目录为基准。
 */

#ifndef SJ_CORE_CONFIG_H
#define SJ_CORE_CONFIG_H

#include <string>
#include <vector>

#include "core/types.h"
#include "core/error.h"
#include "core/logger.h"
#include "core/yaml_config.h"

namespace sj {

struct LogConfig {
    LogLevel level = LogLevel::INFO;
    std::string dir = "/tmp/sandjudge/log";
};

struct PathsConfig {
    std::string languages = "config/languages";
    std::string heuristics = "config/heuristics.yaml";
    std::string problems = "config/problems";
    std::string scratch_root = "/tmp/sandjudge/boxes";
};

struct WorkersConfig {
    int min = 2;
    int max = 8;
    int scale_up_queue_depth = 4;    ///< 队列深度超过该值时扩容
    int64_t idle_timeout_ms = 30000;
    int max_deliveries = 2;          ///< 同一提交最多被投递次数
};

struct PoolConfig {
    int64_t idle_ttl_ms = 5 * 60 * 1000;
    int max_idle_per_language = 4;
    int provision_attempts = 5;
    int64_t backoff_initial_ms = 50;
    double backoff_factor = 2.0;
    int64_t reaper_interval_ms = 1000;
};

/// 已结束的自定义测试在内存中保留多久（不持久化，过期或超量即丢弃）
struct RetentionConfig {
    int64_t custom_test_ttl_ms = 10 * 60 * 1000;
    int max_custom_tests = 1024;
};

struct IsolationConfig {
    bool strict = true;               ///< 隔离步骤失败即判 SystemError
    bool use_namespace = true;
    bool use_cgroup = true;
    bool use_seccomp = true;
    int64_t tmpfs_size_bytes = 64 * MiB;
    std::vector<std::string> readonly_paths = {"/bin", "/lib", "/lib64", "/usr", "/etc/alternatives"};
    int64_t output_limit_bytes = 64 * MiB;
};

struct NotificationsConfig {
    size_t channel_capacity = 1024;
};

/**
 * @brief 引擎配置
 */
struct EngineConfig {
    LogConfig log;
    PathsConfig paths;
    WorkersConfig workers;
    PoolConfig pool;
    IsolationConfig isolation;
    ResourceLimits custom_test_limits = limits::CUSTOM_TEST;
    RetentionConfig retention;
    NotificationsConfig notifications;

    /**
     * @brief 从 YAML 文件加载
     */
    static Result<EngineConfig> load(const std::string &path) {
        auto root = yaml::load_yaml(path);
        if (root.is_error()) {
            return Err<EngineConfig>(root.error());
        }
        std::string base;
        size_t slash = path.find_last_of('/');
        if (slash != std::string::npos) {
            base = path.substr(0, slash);
        }
        return from_yaml(root.value(), base);
    }

    /**
     * @brief 从已解析的节点构造
     * @param base_dir 解析相对路径的基准目录，空表示保持原样
     */
    static Result<EngineConfig> from_yaml(const yaml::YamlNodePtr &root, const std::string &base_dir = "") {
        EngineConfig cfg;
        if (!root) {
            return cfg;
        }

        // log
        if (auto lv = (*root)["log.level"]) {
            LogLevel parsed = parse_log_level(lv->as_string(), LogLevel::OFF);
            if (parsed == LogLevel::OFF && lv->as_string() != "off") {
                return invalid("log.level", lv->as_string());
            }
            cfg.log.level = parsed;
        }
        cfg.log.dir = root->str_at("log.dir", cfg.log.dir);

        // paths
        cfg.paths.languages = resolve(base_dir, root->str_at("paths.languages", cfg.paths.languages));
        cfg.paths.heuristics = resolve(base_dir, root->str_at("paths.heuristics", cfg.paths.heuristics));
        cfg.paths.problems = resolve(base_dir, root->str_at("paths.problems", cfg.paths.problems));
        cfg.paths.scratch_root = resolve(base_dir, root->str_at("paths.scratch_root", cfg.paths.scratch_root));

        // workers
        SJ_TRY(read_int(root, "workers.min", 0, cfg.workers.min));
        SJ_TRY(read_int(root, "workers.max", 1, cfg.workers.max));
        SJ_TRY(read_int(root, "workers.scale_up_queue_depth", 0, cfg.workers.scale_up_queue_depth));
        SJ_TRY(read_int(root, "workers.idle_timeout_ms", 0, cfg.workers.idle_timeout_ms));
        SJ_TRY(read_int(root, "workers.max_deliveries", 1, cfg.workers.max_deliveries));
        if (cfg.workers.min > cfg.workers.max) {
            return invalid("workers.min", "greater than workers.max");
        }

        // pool
        SJ_TRY(read_int(root, "pool.idle_ttl_ms", 0, cfg.pool.idle_ttl_ms));
        SJ_TRY(read_int(root, "pool.max_idle_per_language", 0, cfg.pool.max_idle_per_language));
        SJ_TRY(read_int(root, "pool.provision_attempts", 1, cfg.pool.provision_attempts));
        SJ_TRY(read_int(root, "pool.backoff_initial_ms", 0, cfg.pool.backoff_initial_ms));
        SJ_TRY(read_int(root, "pool.reaper_interval_ms", 1, cfg.pool.reaper_interval_ms));
        if (auto f = (*root)["pool.backoff_factor"]) {
            if (!f->is_number() || f->as_double() < 1.0) {
                return invalid("pool.backoff_factor", f->as_string());
            }
            cfg.pool.backoff_factor = f->as_double();
        }

        // isolation
        cfg.isolation.strict = root->bool_at("isolation.strict", cfg.isolation.strict);
        cfg.isolation.use_namespace = root->bool_at("isolation.use_namespace", cfg.isolation.use_namespace);
        cfg.isolation.use_cgroup = root->bool_at("isolation.use_cgroup", cfg.isolation.use_cgroup);
        cfg.isolation.use_seccomp = root->bool_at("isolation.use_seccomp", cfg.isolation.use_seccomp);
        SJ_TRY(read_int(root, "isolation.tmpfs_size_bytes", 1, cfg.isolation.tmpfs_size_bytes));
        SJ_TRY(read_int(root, "isolation.output_limit_bytes", 1, cfg.isolation.output_limit_bytes));
        if (auto ro = (*root)["isolation.readonly_paths"]) {
            cfg.isolation.readonly_paths = ro->as_string_list();
        }

        // limits.custom_test
        SJ_TRY(read_int(root, "limits.custom_test.time_limit_ms", 1, cfg.custom_test_limits.time_limit_ms));
        SJ_TRY(read_int(root, "limits.custom_test.memory_limit_bytes", 1, cfg.custom_test_limits.memory_limit_bytes));
        SJ_TRY(read_int(root, "limits.custom_test.cpu_quota", 1, cfg.custom_test_limits.cpu_quota));
        SJ_TRY(read_int(root, "limits.custom_test.pids_limit", 1, cfg.custom_test_limits.pids_limit));

        // retention
        SJ_TRY(read_int(root, "retention.custom_test_ttl_ms", 0, cfg.retention.custom_test_ttl_ms));
        SJ_TRY(read_int(root, "retention.max_custom_tests", 0, cfg.retention.max_custom_tests));

        // notifications
        int64_t capacity = static_cast<int64_t>(cfg.notifications.channel_capacity);
        SJ_TRY(read_int(root, "notifications.channel_capacity", 1, capacity));
        cfg.notifications.channel_capacity = static_cast<size_t>(capacity);

        return cfg;
    }

private:
    static Error invalid(const std::string &key, const std::string &value) {
        return SJ_ERROR(ErrorCode::CONFIG_INVALID_VALUE, key + ": " + value);
    }

    static std::string resolve(const std::string &base, const std::string &path) {
        if (base.empty() || path.empty() || path[0] == '/') return path;
        return base + "/" + path;
    }

    template<typename T>
    static Result<void> read_int(const yaml::YamlNodePtr &root, const std::string &key,
                                 int64_t min_value, T &out) {
        auto node = (*root)[key];
        if (!node || node->is_null()) {
            return Ok();
        }
        if (!node->is_int()) {
            return invalid(key, node->as_string());
        }
        int64_t v = node->as_int();
        if (v < min_value) {
            return invalid(key, std::to_string(v) + " < " + std::to_string(min_value));
        }
        out = static_cast<T>(v);
        return Ok();
    }
};

} // namespace sj

#endif // SJ_CORE_CONFIG_H
