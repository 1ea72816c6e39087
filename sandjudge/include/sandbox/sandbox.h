/**
 * @file sandbox.h
 * @brief 沙箱接口与基于进程的实现
 *
 * 沙箱目录结构：
 *
 *   <scratch_root>/<id>/
 *     work/     源文件、编译产物、输入输出文件（沙箱内为 /box）
 *     root/     新根文件系统的挂载点
 */

#ifndef SJ_SANDBOX_SANDBOX_H
#define SJ_SANDBOX_SANDBOX_H

#include <string>
#include <memory>
#include <mutex>
#include <atomic>
#include <optional>

#include "core/error.h"
#include "core/types.h"
#include "core/utils.h"
#include "core/language.h"
#include "core/engine_logger.h"
#include "sandbox/run_context.h"
#include "sandbox/isolation_profile.h"
#include "sandbox/executor.h"

namespace sj {
namespace sandbox {

enum class SandboxKind { EPHEMERAL, WARM };

inline const char* sandbox_kind_str(SandboxKind kind) {
    return kind == SandboxKind::WARM ? "warm" : "ephemeral";
}

enum class SandboxStatus { IDLE, BUSY, TERMINATED };

inline const char* sandbox_status_str(SandboxStatus status) {
    switch (status) {
        case SandboxStatus::IDLE:       return "idle";
        case SandboxStatus::BUSY:       return "busy";
        case SandboxStatus::TERMINATED: return "terminated";
        default:                        return "unknown";
    }
}

/**
 * @brief 执行环境记录
 */
struct ExecutionEnvironment {
    std::string id;
    SandboxKind kind = SandboxKind::EPHEMERAL;
    std::string language;
    SandboxStatus status = SandboxStatus::IDLE;
    Timestamp created_at{};
    Timestamp last_used_at{};
    int64_t execution_count = 0;
};

/**
 * @brief 一次运行请求
 */
struct RunRequest {
    std::string code;
    std::string input;
    ResourceLimits limits;
};

//==============================================================================
// 沙箱接口
//==============================================================================

class Sandbox {
private:
    mutable std::mutex mutex_;
    ExecutionEnvironment info_;

public:
    Sandbox(const std::string &id, SandboxKind kind, const std::string &language) {
        info_.id = id;
        info_.kind = kind;
        info_.language = language;
        info_.created_at = now();
        info_.last_used_at = info_.created_at;
    }

    virtual ~Sandbox() = default;

    Sandbox(const Sandbox&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;

    /// 准备运行环境
    virtual Result<void> provision() = 0;

    /// 运行一次；限制突破体现在 RawResult::kind 中，不是错误
    virtual Result<RawResult> run(const RunRequest &request, RunContext &ctx) = 0;

    /// 无条件销毁，之后不可再用
    virtual void destroy() = 0;

    ExecutionEnvironment info() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return info_;
    }

    const std::string& id() const { return info_.id; }
    const std::string& language() const { return info_.language; }
    SandboxKind kind() const { return info_.kind; }

    SandboxStatus status() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return info_.status;
    }

    /**
     * @brief 状态变更；TERMINATED 之后不再改变
     */
    void set_status(SandboxStatus status) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (info_.status != SandboxStatus::TERMINATED) {
            info_.status = status;
        }
    }

protected:
    void record_use() {
        std::lock_guard<std::mutex> lock(mutex_);
        info_.execution_count++;
        info_.last_used_at = now();
    }
};

using SandboxPtr = std::shared_ptr<Sandbox>;

//==============================================================================
// 基于进程的沙箱
//==============================================================================

class ProcessSandbox : public Sandbox {
private:
    std::shared_ptr<const LanguagePlugin> lang_;
    IsolationProfilePtr profile_;
    std::string base_dir_;
    std::string work_dir_;
    std::string root_dir_;

    std::atomic<bool> terminated_{false};
    std::mutex run_mutex_;
    std::optional<uint64_t> built_hash_;   ///< 当前编译产物对应的代码哈希

    static constexpr const char* PROGRAM_NAME = "main";

    std::string work_path(const std::string &name) const {
        return work_dir_ + "/" + name;
    }

    ExecSpec base_spec(const CommandLine &cmd, const ResourceLimits &limits) const {
        ExecSpec spec;
        spec.command = cmd;
        spec.work_dir = work_dir_;
        spec.root_dir = root_dir_;
        spec.limits = limits;
        spec.output_limit_bytes = profile_->output_limit_bytes;
        spec.profile = profile_;
        return spec;
    }

    /**
     * @brief 编译；成功返回 nullopt，失败返回 COMPILE_ERROR（或取消）结果
     */
    Result<std::optional<RawResult>> compile(const std::string &code, RunContext &ctx) {
        uint64_t hash = fnv1a(code);
        if (built_hash_ && *built_hash_ == hash && file_exists(work_path(PROGRAM_NAME))) {
            SLOG_DEBUG << "Sandbox " << id() << " reuses compiled artifact";
            return std::optional<RawResult>();
        }
        built_hash_.reset();
        ::unlink(work_path(PROGRAM_NAME).c_str());

        ExecSpec spec = base_spec(lang_->compile_command(lang_->source_name(), PROGRAM_NAME),
                                  lang_->compiler_limits());
        spec.work_writable = true;
        spec.compile_step = true;
        spec.stdout_path = work_path("compile.out");
        spec.stderr_path = work_path("compile.err");

        SJ_TRY_UNWRAP(raw, Executor::run(spec, ctx, &terminated_));
        if (raw.kind == RunStatus::CANCELLED) {
            return std::optional<RawResult>(raw);
        }
        if (!raw.exited_cleanly() || !file_exists(work_path(PROGRAM_NAME))) {
            RawResult failed = raw;
            failed.kind = RunStatus::COMPILE_ERROR;
            failed.stderr_data = raw.stderr_data + raw.stdout_data;
            if (raw.kind == RunStatus::TIME_LIMIT) {
                failed.stderr_data += "Compilation time limit exceeded";
            } else if (raw.kind == RunStatus::MEMORY_LIMIT) {
                failed.stderr_data += "Compilation memory limit exceeded";
            }
            return std::optional<RawResult>(failed);
        }
        built_hash_ = hash;
        return std::optional<RawResult>();
    }

public:
    /**
     * @param scratch_root 所有沙箱目录的父目录
     */
    ProcessSandbox(const std::string &id, SandboxKind kind,
                   std::shared_ptr<const LanguagePlugin> lang,
                   IsolationProfilePtr profile,
                   const std::string &scratch_root)
        : Sandbox(id, kind, lang->id()),
          lang_(std::move(lang)),
          profile_(std::move(profile)),
          base_dir_(scratch_root + "/" + id),
          work_dir_(base_dir_ + "/work"),
          root_dir_(base_dir_ + "/root") {}

    ~ProcessSandbox() override {
        destroy();
    }

    Result<void> provision() override {
        if (terminated_) {
            return SJ_ERROR(ErrorCode::SANDBOX_TERMINATED, "Sandbox " + id() + " was destroyed");
        }
        std::string tool = lang_->toolchain_binary();
        if (tool.find('/') == std::string::npos) {
            tool = which(tool);
        }
        if (tool.empty() || !is_executable(tool)) {
            return SJ_ERROR(ErrorCode::COMPILER_NOT_FOUND,
                            "Toolchain for " + lang_->id() + " not found: " + lang_->toolchain_binary());
        }
        SJ_TRY(make_dirs(work_dir_, 0755));
        SJ_TRY(make_dirs(root_dir_, 0755));
        SLOG_DEBUG << "Provisioned " << sandbox_kind_str(kind()) << " sandbox " << id()
                   << " (" << lang_->id() << ") at " << base_dir_;
        return Ok();
    }

    Result<RawResult> run(const RunRequest &request, RunContext &ctx) override {
        std::lock_guard<std::mutex> lock(run_mutex_);
        if (terminated_) {
            return SJ_ERROR(ErrorCode::SANDBOX_TERMINATED, "Sandbox " + id() + " was destroyed");
        }
        record_use();

        SJ_TRY(write_file(work_path(lang_->source_name()), request.code));

        std::string program = lang_->source_name();
        if (lang_->needs_compile()) {
            SJ_TRY_UNWRAP(compiled, compile(request.code, ctx));
            if (compiled) {
                return *compiled;
            }
            program = std::string("./") + PROGRAM_NAME;
        }

        SJ_TRY(write_file(work_path("input.txt"), request.input));

        // request.limits 已由调用方按语言调整过
        ExecSpec spec = base_spec(lang_->run_command(program), request.limits);
        spec.stdin_path = work_path("input.txt");
        spec.stdout_path = work_path("stdout.txt");
        spec.stderr_path = work_path("stderr.txt");
        return Executor::run(spec, ctx, &terminated_);
    }

    void destroy() override {
        bool was = terminated_.exchange(true);
        set_status(SandboxStatus::TERMINATED);
        if (was) {
            return;
        }
        // 正在运行的进程会在下一个轮询周期被杀死，这里等它退出
        std::lock_guard<std::mutex> lock(run_mutex_);
        if (!remove_tree(base_dir_)) {
            SLOG_WARN << "Cannot remove sandbox directory " << base_dir_;
        }
        SLOG_DEBUG << "Destroyed sandbox " << id();
    }

    const std::string& work_dir() const { return work_dir_; }
    const IsolationProfile& profile() const { return *profile_; }
};

} // namespace sandbox
} // namespace sj

#endif // SJ_SANDBOX_SANDBOX_H
