/**
 * @file judge_engine.h
 * @brief 评测引擎：逐个运行测试点、分类结果、生成最终判定
 *
 * 引擎本身不接触沙箱，只通过 run_fn 获得每个测试点的 RawResult。
 */

#ifndef SJ_JUDGE_JUDGE_ENGINE_H
#define SJ_JUDGE_JUDGE_ENGINE_H

#include <string>
#include <vector>
#include <functional>
#include <algorithm>
#include <csignal>
#include <cstring>
#include <optional>

#include "core/error.h"
#include "core/types.h"
#include "core/utils.h"
#include "core/engine_logger.h"
#include "judge/compare.h"

namespace sj {
namespace judge {

struct JudgeOptions {
    bool stop_on_first_failure = true;
    ComparisonMode comparison_mode;
};

/// 运行一个测试点（index 从 0 开始）
using RunFn = std::function<Result<RawResult>(const TestCase &test_case, size_t index)>;

/// 每个测试点结果产生后的回调
using ResultFn = std::function<void(const TestCaseResult &result, size_t index)>;

/**
 * @brief 一次评测的完整输出
 */
struct JudgeOutcome {
    Verdict verdict;
    std::vector<TestCaseResult> results;
    bool cancelled = false;           ///< 运行被取消，verdict 无意义
};

class JudgeEngine {
private:
    static constexpr size_t ERROR_EXCERPT = 1024;

    static std::string signal_message(int sig) {
        if (sig == SIGXFSZ) {
            return "Output limit exceeded";
        }
        const char *name = strsignal(sig);
        return "Killed by signal " + std::to_string(sig) + (name ? std::string(" (") + name + ")" : "");
    }

public:
    /**
     * @brief 把一次运行的原始结果分类为测试点结果
     */
    static TestCaseResult classify(const TestCase &tc, const RawResult &raw, const ComparisonMode &mode) {
        TestCaseResult r;
        r.test_case_id = tc.id;
        r.execution_time_ms = raw.wall_time_ms;
        r.memory_used_bytes = raw.peak_memory_bytes;
        r.passed = false;

        switch (raw.kind) {
            case RunStatus::TIME_LIMIT:
                r.verdict_kind = VerdictKind::TIME_LIMIT_EXCEEDED;
                return r;
            case RunStatus::MEMORY_LIMIT:
                r.verdict_kind = VerdictKind::MEMORY_LIMIT_EXCEEDED;
                return r;
            case RunStatus::SYSCALL_VIOLATION:
            case RunStatus::PROCESS_LIMIT:
                r.verdict_kind = VerdictKind::SECURITY_VIOLATION;
                r.error = raw.violation ? raw.violation->attempted_action
                                        : std::string(run_status_str(raw.kind));
                return r;
            case RunStatus::COMPILE_ERROR:
                r.verdict_kind = VerdictKind::COMPILATION_ERROR;
                r.error = raw.stderr_data;
                return r;
            case RunStatus::CANCELLED:
                r.verdict_kind = VerdictKind::SYSTEM_ERROR;
                r.error = "Cancelled";
                return r;
            case RunStatus::SIGNALED:
            case RunStatus::EXITED:
                break;
            default:
                r.verdict_kind = VerdictKind::RUNTIME_ERROR;
                return r;
        }

        // 超时或超内存优先于退出方式与输出
        if (raw.wall_time_ms > tc.time_limit_ms) {
            r.verdict_kind = VerdictKind::TIME_LIMIT_EXCEEDED;
            return r;
        }
        if (raw.peak_memory_bytes > tc.memory_limit_bytes) {
            r.verdict_kind = VerdictKind::MEMORY_LIMIT_EXCEEDED;
            return r;
        }
        if (raw.kind == RunStatus::SIGNALED) {
            r.verdict_kind = VerdictKind::RUNTIME_ERROR;
            r.error = signal_message(raw.signal);
            return r;
        }
        if (raw.exit_code != 0) {
            r.verdict_kind = VerdictKind::RUNTIME_ERROR;
            std::string msg = "Exit code " + std::to_string(raw.exit_code);
            if (!raw.stderr_data.empty()) {
                msg += ": " + truncate(raw.stderr_data, ERROR_EXCERPT);
            }
            r.error = msg;
            return r;
        }

        r.actual_output = raw.stdout_data;
        // 自定义输入没有期望输出，运行成功即通过
        r.passed = !tc.expected_output || compare_output(raw.stdout_data, *tc.expected_output, mode);
        r.verdict_kind = r.passed ? VerdictKind::ACCEPTED : VerdictKind::WRONG_ANSWER;
        return r;
    }

    /**
     * @brief 由已执行的测试点结果生成判定
     */
    static Verdict make_verdict(const std::vector<TestCaseResult> &results, size_t total) {
        Verdict v;
        v.total_tests = static_cast<int>(total);
        std::optional<size_t> first_failure;
        for (size_t i = 0; i < results.size(); i++) {
            const auto &r = results[i];
            v.max_time_ms = std::max(v.max_time_ms, r.execution_time_ms);
            v.max_memory_bytes = std::max(v.max_memory_bytes, r.memory_used_bytes);
            if (r.passed) {
                v.passed_tests++;
            } else if (!first_failure) {
                first_failure = i;
            }
        }

        if (!first_failure && results.size() == total) {
            v.status = VerdictKind::ACCEPTED;
            return v;
        }
        if (!first_failure) {
            v.status = VerdictKind::SYSTEM_ERROR;
            v.error_message = "Judging stopped after " + std::to_string(results.size()) +
                              " of " + std::to_string(total) + " test cases";
            return v;
        }
        const auto &failed = results[*first_failure];
        v.status = failed.verdict_kind;
        v.failed_test_case = static_cast<int>(*first_failure) + 1;
        v.error_message = failed.error;
        return v;
    }

    /**
     * @brief 评测一组测试点
     *
     * 编译失败立即结束，判定为 CompilationError，error_message 为编译器原始输出。
     * run_fn 返回错误时该测试点记为 SystemError 并结束评测。
     */
    JudgeOutcome evaluate(const std::vector<TestCase> &test_cases, const RunFn &run_fn,
                          const JudgeOptions &options, const ResultFn &on_result = nullptr) const {
        JudgeOutcome out;

        for (size_t i = 0; i < test_cases.size(); i++) {
            const TestCase &tc = test_cases[i];
            auto raw = run_fn(tc, i);

            if (raw.is_error()) {
                JLOG_WARN << "Test case " << tc.id << " failed to run: " << raw.error().to_string();
                TestCaseResult r;
                r.test_case_id = tc.id;
                r.verdict_kind = VerdictKind::SYSTEM_ERROR;
                r.error = raw.error().message();
                out.results.push_back(r);
                if (on_result) on_result(r, i);
                break;
            }

            const RawResult &rr = raw.value();
            if (rr.kind == RunStatus::CANCELLED) {
                out.cancelled = true;
                break;
            }
            if (rr.kind == RunStatus::COMPILE_ERROR) {
                out.verdict.status = VerdictKind::COMPILATION_ERROR;
                out.verdict.total_tests = static_cast<int>(test_cases.size());
                out.verdict.error_message = rr.stderr_data;
                JLOG_INFO << "Compilation failed";
                return out;
            }

            TestCaseResult r = classify(tc, rr, options.comparison_mode);
            JLOG_DEBUG << "Test case " << (i + 1) << "/" << test_cases.size() << " "
                       << verdict_kind_str(r.verdict_kind) << " time=" << r.execution_time_ms
                       << "ms mem=" << r.memory_used_bytes;
            out.results.push_back(r);
            if (on_result) on_result(r, i);

            if (!r.passed && options.stop_on_first_failure) {
                break;
            }
        }

        if (out.cancelled) {
            out.verdict = Verdict::system_error("Cancelled", static_cast<int>(test_cases.size()));
            return out;
        }
        out.verdict = make_verdict(out.results, test_cases.size());
        return out;
    }
};

} // namespace judge
} // namespace sj

#endif // SJ_JUDGE_JUDGE_ENGINE_H
