/**
 * @file orchestrator.h
 * @brief 执行编排：沙箱的获取、运行、归还与预热池
 *
 * 预热池按语言分组，每种语言一把锁。pools_mutex_ 只保护分组表本身的
 * 查找与插入，不在持有它的时候操作沙箱。
 */

#ifndef SJ_ENGINE_ORCHESTRATOR_H
#define SJ_ENGINE_ORCHESTRATOR_H

#include <string>
#include <map>
#include <deque>
#include <vector>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <functional>
#include <condition_variable>

#include "core/error.h"
#include "core/types.h"
#include "core/utils.h"
#include "core/config.h"
#include "core/language.h"
#include "core/engine_logger.h"
#include "sandbox/run_context.h"
#include "sandbox/sandbox.h"
#include "engine/sinks.h"

namespace sj {
namespace engine {

using sandbox::SandboxPtr;
using sandbox::SandboxKind;
using sandbox::SandboxStatus;

/**
 * @brief 创建（尚未 provision 的）沙箱
 */
using SandboxFactory = std::function<Result<SandboxPtr>(const std::string &id,
                                                        const std::string &language,
                                                        SandboxKind kind)>;

/**
 * @brief 默认工厂：按语言创建 ProcessSandbox，隔离配置按语言缓存
 */
class ProcessSandboxFactory {
private:
    const LanguageRegistry &registry_;
    IsolationConfig isolation_;
    std::string scratch_root_;
    std::mutex mutex_;
    std::map<std::string, sandbox::IsolationProfilePtr> profiles_;

public:
    ProcessSandboxFactory(const LanguageRegistry &registry, const IsolationConfig &isolation,
                          const std::string &scratch_root)
        : registry_(registry), isolation_(isolation), scratch_root_(scratch_root) {}

    Result<SandboxPtr> operator()(const std::string &id, const std::string &language, SandboxKind kind) {
        auto lang = registry_.get(language);
        if (!lang) {
            return SJ_ERROR(ErrorCode::UNSUPPORTED_LANGUAGE, "Unknown language: " + language);
        }
        sandbox::IsolationProfilePtr profile;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto &slot = profiles_[language];
            if (!slot) {
                slot = sandbox::build_isolation_profile(*lang, isolation_);
            }
            profile = slot;
        }
        return SandboxPtr(std::make_shared<sandbox::ProcessSandbox>(id, kind, lang, profile, scratch_root_));
    }
};

class Orchestrator;

//==============================================================================
// SandboxLease
//==============================================================================

/**
 * @brief 沙箱租约，析构时自动归还
 *
 * 同一时刻一个沙箱只被一个租约持有。
 */
class SandboxLease {
private:
    Orchestrator *owner_ = nullptr;
    SandboxPtr sandbox_;
    bool tainted_ = false;   ///< 触发了隔离策略，不能复用
    bool breached_ = false;  ///< 最近一次运行突破了限制

    friend class Orchestrator;

    SandboxLease(Orchestrator *owner, SandboxPtr sandbox)
        : owner_(owner), sandbox_(std::move(sandbox)) {}

    SandboxPtr take() {
        owner_ = nullptr;
        return std::move(sandbox_);
    }

public:
    SandboxLease() = default;

    SandboxLease(SandboxLease &&other) noexcept
        : owner_(other.owner_), sandbox_(std::move(other.sandbox_)),
          tainted_(other.tainted_), breached_(other.breached_) {
        other.owner_ = nullptr;
    }

    SandboxLease& operator=(SandboxLease &&other) noexcept {
        if (this != &other) {
            reset();
            owner_ = other.owner_;
            sandbox_ = std::move(other.sandbox_);
            tainted_ = other.tainted_;
            breached_ = other.breached_;
            other.owner_ = nullptr;
        }
        return *this;
    }

    SandboxLease(const SandboxLease&) = delete;
    SandboxLease& operator=(const SandboxLease&) = delete;

    ~SandboxLease() { reset(); }

    /// 归还给编排器
    inline void reset();

    bool valid() const { return sandbox_ != nullptr; }
    explicit operator bool() const { return valid(); }

    sandbox::Sandbox* operator->() const { return sandbox_.get(); }
    const SandboxPtr& sandbox() const { return sandbox_; }

    bool tainted() const { return tainted_; }
    bool breached() const { return breached_; }
    void taint() { tainted_ = true; }
};

//==============================================================================
// Orchestrator
//==============================================================================

class Orchestrator {
private:
    struct IdleEntry {
        SandboxPtr sandbox;
        SteadyClock::time_point expires_at;
    };

    /// 单个语言的预热池
    struct LanguagePool {
        std::mutex mutex;
        std::deque<IdleEntry> idle;
    };

    SandboxFactory factory_;
    PoolConfig config_;
    MetricsSinkPtr metrics_;
    AuditSinkPtr audit_;

    std::mutex pools_mutex_;
    std::map<std::string, std::shared_ptr<LanguagePool>> pools_;

    std::mutex active_mutex_;
    std::map<std::string, SandboxPtr> active_;   ///< 所有未销毁的沙箱（含空闲）

    std::atomic<bool> shutdown_{false};
    std::mutex reaper_mutex_;
    std::condition_variable reaper_cv_;
    std::thread reaper_;

    std::shared_ptr<LanguagePool> pool_for(const std::string &language) {
        std::lock_guard<std::mutex> lock(pools_mutex_);
        auto &slot = pools_[language];
        if (!slot) {
            slot = std::make_shared<LanguagePool>();
        }
        return slot;
    }

    std::vector<std::shared_ptr<LanguagePool>> all_pools() {
        std::lock_guard<std::mutex> lock(pools_mutex_);
        std::vector<std::shared_ptr<LanguagePool>> out;
        for (const auto &kv : pools_) {
            out.push_back(kv.second);
        }
        return out;
    }

    SandboxPtr take_idle(const std::string &language) {
        auto pool = pool_for(language);
        std::lock_guard<std::mutex> lock(pool->mutex);
        while (!pool->idle.empty()) {
            SandboxPtr sb = std::move(pool->idle.back().sandbox);
            pool->idle.pop_back();
            if (sb->status() != SandboxStatus::TERMINATED) {
                sb->set_status(SandboxStatus::BUSY);
                return sb;
            }
        }
        return nullptr;
    }

    void destroy_sandbox(const SandboxPtr &sb) {
        sb->destroy();
        std::lock_guard<std::mutex> lock(active_mutex_);
        active_.erase(sb->id());
    }

    Result<SandboxPtr> provision_with_backoff(const std::string &language, SandboxKind kind, RunContext &ctx) {
        int64_t delay_ms = config_.backoff_initial_ms;
        Error last(ErrorCode::PROVISION_FAILED, "no attempt made");

        for (int attempt = 1; attempt <= config_.provision_attempts; attempt++) {
            if (ctx.cancelled()) {
                return SJ_ERROR(ErrorCode::CANCELLED, "Provisioning cancelled");
            }
            auto created = factory_(generate_uuid(), language, kind);
            if (created.is_error()) {
                if (created.error().code() == ErrorCode::UNSUPPORTED_LANGUAGE) {
                    return created.error();
                }
                last = created.error();
            } else {
                SandboxPtr sb = created.value();
                auto provisioned = sb->provision();
                if (provisioned.ok()) {
                    std::lock_guard<std::mutex> lock(active_mutex_);
                    active_[sb->id()] = sb;
                    return sb;
                }
                last = provisioned.error();
                sb->destroy();
            }

            SLOG_WARN << "Provision attempt " << attempt << "/" << config_.provision_attempts
                      << " for " << language << " failed: " << last.to_string();
            if (attempt < config_.provision_attempts) {
                if (ctx.sleep_for(std::chrono::milliseconds(delay_ms))) {
                    return SJ_ERROR(ErrorCode::CANCELLED, "Provisioning cancelled");
                }
                delay_ms = static_cast<int64_t>(delay_ms * config_.backoff_factor);
            }
        }
        return SJ_ERROR(ErrorCode::PROVISION_FAILED,
                        "Cannot provision " + language + " sandbox after " +
                        std::to_string(config_.provision_attempts) + " attempts: " + last.message());
    }

    void reaper_loop() {
        std::unique_lock<std::mutex> lock(reaper_mutex_);
        while (!shutdown_) {
            reaper_cv_.wait_for(lock, std::chrono::milliseconds(config_.reaper_interval_ms),
                                [this] { return shutdown_.load(); });
            if (shutdown_) break;
            lock.unlock();
            reap_expired();
            lock.lock();
        }
    }

public:
    Orchestrator(SandboxFactory factory, const PoolConfig &config,
                 MetricsSinkPtr metrics = nullptr, AuditSinkPtr audit = nullptr)
        : factory_(std::move(factory)),
          config_(config),
          metrics_(metrics ? std::move(metrics) : std::make_shared<LogMetricsSink>()),
          audit_(audit ? std::move(audit) : std::make_shared<LogAuditSink>()) {
        reaper_ = std::thread(&Orchestrator::reaper_loop, this);
    }

    ~Orchestrator() {
        shutdown();
    }

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * @brief 获取沙箱
     *
     * hybrid 策略优先取同语言的空闲预热沙箱，没有则新建 WARM 沙箱；
     * 其它策略总是新建 EPHEMERAL 沙箱。
     */
    Result<SandboxLease> acquire(const std::string &language, StrategyKind strategy, RunContext &ctx) {
        if (shutdown_) {
            return SJ_ERROR(ErrorCode::INVALID_STATE, "Orchestrator is shut down");
        }
        SandboxKind kind = strategy == StrategyKind::HYBRID ? SandboxKind::WARM : SandboxKind::EPHEMERAL;
        if (kind == SandboxKind::WARM) {
            if (SandboxPtr sb = take_idle(language)) {
                SLOG_DEBUG << "Reusing warm sandbox " << sb->id() << " for " << language;
                return SandboxLease(this, std::move(sb));
            }
        }
        SJ_TRY_UNWRAP(sb, provision_with_backoff(language, kind, ctx));
        sb->set_status(SandboxStatus::BUSY);
        return SandboxLease(this, std::move(sb));
    }

    /**
     * @brief 在租约的沙箱中运行一次
     *
     * 每次运行记录一条资源指标；触发隔离策略时记录一条审计并标记租约。
     */
    Result<RawResult> run(SandboxLease &lease, const std::string &code, const std::string &input,
                          const ResourceLimits &limits, RunContext &ctx) {
        SJ_ENSURE(lease.valid(), ErrorCode::INVALID_STATE, "Lease does not hold a sandbox");

        sandbox::RunRequest request{code, input, limits};
        auto raw = lease->run(request, ctx);
        if (raw.is_error()) {
            lease.taint();
            return raw;
        }

        const RawResult &r = raw.value();
        ResourceMetrics m;
        m.submission_id = ctx.submission_id();
        m.cpu_time_ms = r.cpu_time_ms;
        m.wall_time_ms = r.wall_time_ms;
        m.peak_memory_bytes = r.peak_memory_bytes;
        m.context_switches = r.context_switches;
        m.page_faults = r.page_faults;
        metrics_->record(m);

        if (r.is_policy_breach()) {
            SecurityViolation v;
            v.submission_id = ctx.submission_id();
            v.user_id = ctx.user_id();
            v.violation_type = r.violation ? r.violation->type : run_status_str(r.kind);
            v.attempted_action = r.violation ? r.violation->attempted_action : run_status_str(r.kind);
            v.timestamp = now();
            audit_->record(v);
            lease.taint();
        }
        if (r.is_limit_breach()) {
            lease.breached_ = true;
        }
        return raw;
    }

    /**
     * @brief 归还租约
     *
     * 未被污染、未突破限制的 WARM 沙箱回到预热池，其余立即销毁。
     */
    void release(SandboxLease &lease) {
        bool reusable = !lease.tainted_ && !lease.breached_;
        SandboxPtr sb = lease.take();
        if (!sb) {
            return;
        }
        if (reusable && !shutdown_ && sb->kind() == SandboxKind::WARM &&
            sb->status() != SandboxStatus::TERMINATED) {
            auto pool = pool_for(sb->language());
            std::lock_guard<std::mutex> lock(pool->mutex);
            if (static_cast<int>(pool->idle.size()) < config_.max_idle_per_language) {
                sb->set_status(SandboxStatus::IDLE);
                pool->idle.push_back({sb, SteadyClock::now() + std::chrono::milliseconds(config_.idle_ttl_ms)});
                SLOG_DEBUG << "Sandbox " << sb->id() << " returned to " << sb->language() << " pool";
                return;
            }
        }
        destroy_sandbox(sb);
    }

    /**
     * @brief 立即销毁指定沙箱（空闲或正在使用）
     */
    Result<void> terminate(const std::string &sandbox_id) {
        SandboxPtr sb;
        {
            std::lock_guard<std::mutex> lock(active_mutex_);
            auto it = active_.find(sandbox_id);
            if (it == active_.end()) {
                return SJ_ERROR(ErrorCode::SANDBOX_TERMINATED, "No live sandbox " + sandbox_id);
            }
            sb = it->second;
        }
        SLOG_INFO << "Terminating sandbox " << sandbox_id;
        destroy_sandbox(sb);
        return Ok();
    }

    /**
     * @brief 销毁过期的空闲沙箱
     * @return 销毁数量
     */
    size_t reap_expired() {
        auto now_tp = SteadyClock::now();
        std::vector<SandboxPtr> expired;
        for (auto &pool : all_pools()) {
            std::lock_guard<std::mutex> lock(pool->mutex);
            auto &idle = pool->idle;
            for (auto it = idle.begin(); it != idle.end();) {
                if (it->expires_at <= now_tp || it->sandbox->status() == SandboxStatus::TERMINATED) {
                    expired.push_back(std::move(it->sandbox));
                    it = idle.erase(it);
                } else {
                    ++it;
                }
            }
        }
        for (const auto &sb : expired) {
            SLOG_DEBUG << "Idle sandbox " << sb->id() << " expired";
            destroy_sandbox(sb);
        }
        return expired.size();
    }

    /**
     * @brief 停止回收线程并销毁所有空闲沙箱；已租出的沙箱归还时销毁
     */
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(reaper_mutex_);
            if (shutdown_.exchange(true)) {
                return;
            }
        }
        reaper_cv_.notify_all();
        if (reaper_.joinable()) {
            reaper_.join();
        }
        std::vector<SandboxPtr> idle;
        for (auto &pool : all_pools()) {
            std::lock_guard<std::mutex> lock(pool->mutex);
            for (auto &e : pool->idle) {
                idle.push_back(std::move(e.sandbox));
            }
            pool->idle.clear();
        }
        for (const auto &sb : idle) {
            destroy_sandbox(sb);
        }
        SLOG_INFO << "Orchestrator shut down, destroyed " << idle.size() << " idle sandboxes";
    }

    size_t idle_count(const std::string &language) {
        auto pool = pool_for(language);
        std::lock_guard<std::mutex> lock(pool->mutex);
        return pool->idle.size();
    }

    size_t live_count() {
        std::lock_guard<std::mutex> lock(active_mutex_);
        return active_.size();
    }

    bool is_shutdown() const { return shutdown_; }
};

inline void SandboxLease::reset() {
    if (owner_ && sandbox_) {
        owner_->release(*this);
    }
    owner_ = nullptr;
    sandbox_.reset();
}

} // namespace engine
} // namespace sj

#endif // SJ_ENGINE_ORCHESTRATOR_H
