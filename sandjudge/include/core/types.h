/**
 * @file types.h
 * @brief 核心数据结构定义
 *
 * 包含评测引擎使用的所有基础数据结构：
 * - ResourceLimits: 资源限制
 * - RawResult: 沙箱单次运行结果
 * - TestCase / TestCaseResult / Verdict: 评测数据与结果
 * - Submission: 提交及其状态机
 * - ExecutionStrategy / CodeAnalysis: 路由决策
 * - SecurityViolation / ResourceMetrics: 审计与指标记录
 */

#ifndef SJ_CORE_TYPES_H
#define SJ_CORE_TYPES_H

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>

namespace sj {

using Timestamp = std::chrono::system_clock::time_point;

inline Timestamp now() {
    return std::chrono::system_clock::now();
}

/**
 * @brief 毫秒级 Unix 时间戳
 */
inline int64_t to_unix_ms(Timestamp t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

constexpr int64_t KiB = 1024;
constexpr int64_t MiB = 1024 * KiB;

//==============================================================================
// 资源限制
//==============================================================================

/**
 * @brief 资源限制配置
 */
struct ResourceLimits {
    int64_t time_limit_ms;      ///< 墙钟时间限制（毫秒）
    int64_t memory_limit_bytes; ///< 内存限制（字节）
    int64_t cpu_quota;          ///< CPU 配额（微秒 / 100000 微秒周期）
    int64_t pids_limit;         ///< 进程数上限

    ResourceLimits()
        : time_limit_ms(5000), memory_limit_bytes(512 * MiB),
          cpu_quota(50000), pids_limit(50) {}

    ResourceLimits(int64_t time_ms, int64_t memory_bytes,
                   int64_t cpu = 50000, int64_t pids = 50)
        : time_limit_ms(time_ms), memory_limit_bytes(memory_bytes),
          cpu_quota(cpu), pids_limit(pids) {}
};

// 预定义资源限制常量
namespace limits {
    constexpr int64_t CPU_PERIOD_US = 100000;
    const ResourceLimits CUSTOM_TEST = ResourceLimits(5000, 512 * MiB, 50000, 50);
    const ResourceLimits COMPILER    = ResourceLimits(30000, 1024 * MiB, 100000, 64);
}

//==============================================================================
// 沙箱运行结果
//==============================================================================

/**
 * @brief 单次运行的结束方式
 *
 * 超限不是错误，而是结束方式的一种；只有基础设施故障才走 Result 的错误分支。
 */
enum class RunStatus {
    EXITED,             ///< 正常退出（退出码可能非零）
    SIGNALED,           ///< 被信号终止（段错误等）
    TIME_LIMIT,         ///< 墙钟超时
    MEMORY_LIMIT,       ///< 内存超限（memory.current 或 OOM）
    SYSCALL_VIOLATION,  ///< seccomp 拦截（SIGSYS）
    PROCESS_LIMIT,      ///< pids.max 拒绝了 fork
    COMPILE_ERROR,      ///< 编译失败，诊断信息在 stderr
    CANCELLED           ///< RunContext 被取消
};

inline const char* run_status_str(RunStatus s) {
    switch (s) {
        case RunStatus::EXITED:            return "EXITED";
        case RunStatus::SIGNALED:          return "SIGNALED";
        case RunStatus::TIME_LIMIT:        return "TIME_LIMIT";
        case RunStatus::MEMORY_LIMIT:      return "MEMORY_LIMIT";
        case RunStatus::SYSCALL_VIOLATION: return "SYSCALL_VIOLATION";
        case RunStatus::PROCESS_LIMIT:     return "PROCESS_LIMIT";
        case RunStatus::COMPILE_ERROR:     return "COMPILE_ERROR";
        case RunStatus::CANCELLED:         return "CANCELLED";
        default:                           return "UNKNOWN";
    }
}

/**
 * @brief 策略违规描述（来自沙箱）
 */
struct Breach {
    std::string type;              ///< forbidden_syscall / process_limit
    std::string attempted_action;  ///< 人类可读的动作描述
};

/**
 * @brief 沙箱单次运行的原始结果
 */
struct RawResult {
    RunStatus kind = RunStatus::EXITED;
    int exit_code = -1;
    int signal = 0;
    std::string stdout_data;
    std::string stderr_data;
    int64_t cpu_time_ms = 0;
    int64_t wall_time_ms = 0;
    int64_t peak_memory_bytes = 0;
    int64_t context_switches = 0;
    int64_t page_faults = 0;
    std::optional<Breach> violation;

    bool exited_cleanly() const { return kind == RunStatus::EXITED && exit_code == 0; }

    /**
     * @brief 是否触发了隔离策略（需要销毁沙箱并审计）
     */
    bool is_policy_breach() const {
        return kind == RunStatus::SYSCALL_VIOLATION || kind == RunStatus::PROCESS_LIMIT;
    }

    /**
     * @brief 是否突破了任意硬限制（沙箱不再复用）
     */
    bool is_limit_breach() const {
        return is_policy_breach() || kind == RunStatus::MEMORY_LIMIT ||
               kind == RunStatus::TIME_LIMIT || kind == RunStatus::CANCELLED;
    }
};

//==============================================================================
// 评测结果
//==============================================================================

enum class VerdictKind {
    ACCEPTED,
    WRONG_ANSWER,
    TIME_LIMIT_EXCEEDED,
    MEMORY_LIMIT_EXCEEDED,
    RUNTIME_ERROR,
    COMPILATION_ERROR,
    SECURITY_VIOLATION,
    SYSTEM_ERROR
};

/**
 * @brief 获取结果类型的字符串描述
 */
inline const char* verdict_kind_str(VerdictKind kind) {
    switch (kind) {
        case VerdictKind::ACCEPTED:              return "Accepted";
        case VerdictKind::WRONG_ANSWER:          return "Wrong Answer";
        case VerdictKind::TIME_LIMIT_EXCEEDED:   return "Time Limit Exceeded";
        case VerdictKind::MEMORY_LIMIT_EXCEEDED: return "Memory Limit Exceeded";
        case VerdictKind::RUNTIME_ERROR:         return "Runtime Error";
        case VerdictKind::COMPILATION_ERROR:     return "Compilation Error";
        case VerdictKind::SECURITY_VIOLATION:    return "Security Violation";
        case VerdictKind::SYSTEM_ERROR:          return "System Error";
        default:                                 return "Unknown Result";
    }
}

/**
 * @brief 测试点
 */
struct TestCase {
    std::string id;
    std::string input;
    std::optional<std::string> expected_output;  ///< 仅自定义输入时为空
    int64_t time_limit_ms = 5000;
    int64_t memory_limit_bytes = 512 * MiB;
    bool is_hidden = false;
};

/**
 * @brief 单个测试点的结果，追加后不再修改
 */
struct TestCaseResult {
    std::string test_case_id;
    bool passed = false;
    VerdictKind verdict_kind = VerdictKind::SYSTEM_ERROR;
    int64_t execution_time_ms = 0;
    int64_t memory_used_bytes = 0;
    std::optional<std::string> actual_output;
    std::optional<std::string> error;
    int attempt = 1;                            ///< 产生该结果的投递轮次
};

/**
 * @brief 最终判定
 */
struct Verdict {
    VerdictKind status = VerdictKind::SYSTEM_ERROR;
    int passed_tests = 0;
    int total_tests = 0;
    int64_t max_time_ms = 0;
    int64_t max_memory_bytes = 0;
    std::optional<int> failed_test_case;        ///< 1-based
    std::optional<std::string> error_message;

    bool accepted() const { return status == VerdictKind::ACCEPTED; }

    static Verdict system_error(const std::string &message, int total = 0) {
        Verdict v;
        v.status = VerdictKind::SYSTEM_ERROR;
        v.total_tests = total;
        v.error_message = message;
        return v;
    }
};

//==============================================================================
// 路由决策
//==============================================================================

enum class StrategyKind { CLIENT, SERVER, HYBRID };

inline const char* strategy_kind_str(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::CLIENT: return "client";
        case StrategyKind::SERVER: return "server";
        case StrategyKind::HYBRID: return "hybrid";
        default:                   return "server";
    }
}

struct ExecutionStrategy {
    StrategyKind kind = StrategyKind::SERVER;
    std::string rationale;
    double estimated_cost_units = 0.0;
    int64_t estimated_latency_ms = 0;
};

enum class Complexity { LOW, MEDIUM, HIGH };

inline const char* complexity_str(Complexity c) {
    switch (c) {
        case Complexity::LOW:    return "low";
        case Complexity::MEDIUM: return "medium";
        case Complexity::HIGH:   return "high";
        default:                 return "high";
    }
}

struct CodeAnalysis {
    bool has_unsafe_operations = false;
    Complexity complexity = Complexity::LOW;
    int64_t estimated_memory_bytes = 0;
    int64_t estimated_cpu_units = 0;
    bool requires_compilation = false;
    bool can_run_in_browser = false;
    int loop_count = 0;
    int recursion_count = 0;
    std::vector<std::string> matched_rules;  ///< 命中的启发式规则名
};

/**
 * @brief 路由时的系统负载快照
 */
struct SystemLoad {
    double server_load = 0.0;   ///< 0..1
    size_t queue_depth = 0;
};

//==============================================================================
// 提交与状态机
//==============================================================================

enum class SubmissionStatus {
    QUEUED,
    RUNNING,
    JUDGING,
    COMPLETED,
    FAILED,
    CANCELLED
};

inline const char* submission_status_str(SubmissionStatus s) {
    switch (s) {
        case SubmissionStatus::QUEUED:    return "queued";
        case SubmissionStatus::RUNNING:   return "running";
        case SubmissionStatus::JUDGING:   return "judging";
        case SubmissionStatus::COMPLETED: return "completed";
        case SubmissionStatus::FAILED:    return "failed";
        case SubmissionStatus::CANCELLED: return "cancelled";
        default:                          return "unknown";
    }
}

inline bool is_terminal(SubmissionStatus s) {
    return s == SubmissionStatus::COMPLETED || s == SubmissionStatus::FAILED ||
           s == SubmissionStatus::CANCELLED;
}

/**
 * @brief 状态转移是否合法
 *
 * Queued -> Running -> Judging -> {Completed | Failed | Cancelled}
 * Queued/Running 也可以直接进入 Failed（如投递次数耗尽、配置错误）。
 */
inline bool can_transition(SubmissionStatus from, SubmissionStatus to) {
    switch (from) {
        case SubmissionStatus::QUEUED:
            return to == SubmissionStatus::RUNNING || to == SubmissionStatus::CANCELLED ||
                   to == SubmissionStatus::FAILED;
        case SubmissionStatus::RUNNING:
            return to == SubmissionStatus::JUDGING || to == SubmissionStatus::COMPLETED ||
                   to == SubmissionStatus::FAILED || to == SubmissionStatus::CANCELLED ||
                   to == SubmissionStatus::QUEUED;
        case SubmissionStatus::JUDGING:
            return to == SubmissionStatus::COMPLETED || to == SubmissionStatus::FAILED ||
                   to == SubmissionStatus::CANCELLED || to == SubmissionStatus::QUEUED;
        default:
            return false;
    }
}

struct Submission {
    std::string id;
    std::string user_id;
    std::string problem_id;
    std::string code;
    std::string language;
    bool is_custom_test = false;
    std::optional<std::string> custom_input;

    SubmissionStatus status = SubmissionStatus::QUEUED;
    std::optional<ExecutionStrategy> strategy;  ///< 路由后写入一次
    std::vector<TestCaseResult> test_results;   ///< 只追加；重新投递后旧轮次的结果保留
    int attempt = 1;                            ///< 当前投递轮次
    std::optional<Verdict> verdict;

    Timestamp created_at{};
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> completed_at;
};

//==============================================================================
// 审计与指标
//==============================================================================

struct SecurityViolation {
    std::string submission_id;
    std::string user_id;
    std::string violation_type;
    std::string attempted_action;
    Timestamp timestamp{};
};

struct ResourceMetrics {
    std::string submission_id;
    int64_t cpu_time_ms = 0;
    int64_t wall_time_ms = 0;
    int64_t peak_memory_bytes = 0;
    std::optional<int64_t> syscall_count;  ///< seccomp 无法计数，通常为空
    int64_t context_switches = 0;
    int64_t page_faults = 0;
};

//==============================================================================
// 题目
//==============================================================================

struct ComparisonMode {
    bool trim_whitespace = true;
    bool ignore_trailing_spaces = true;
    bool ignore_empty_lines = false;
};

struct Problem {
    std::string id;
    std::string title;
    int64_t time_limit_ms = 5000;
    int64_t memory_limit_bytes = 512 * MiB;
    std::vector<TestCase> test_cases;
    std::vector<TestCase> hidden_test_cases;
    ComparisonMode comparison_mode;
    std::vector<std::string> supported_languages;

    bool supports(const std::string &language) const {
        if (supported_languages.empty()) return true;
        for (const auto &l : supported_languages) {
            if (l == language) return true;
        }
        return false;
    }
};

struct SystemStatus {
    size_t queue_depth = 0;
    size_t active_workers = 0;
    size_t total_workers = 0;
    int64_t avg_execution_time_ms = 0;
    double server_load = 0.0;
};

} // namespace sj

#endif // SJ_CORE_TYPES_H
