/**
 * @file judge_service.h
 * @brief 评测服务入口
 *
 * 负责提交校验、状态机推进、工作线程处理流程和取消：
 *
 *   submit -> Queued -> (worker) Running -> 路由 -> 获取沙箱
 *          -> Judging -> 逐个测试点 -> 归还沙箱 -> Completed / Failed / Cancelled
 *
 * 每个提交有自己的锁，状态变更在锁内按顺序发布。
 */

#ifndef SJ_ENGINE_JUDGE_SERVICE_H
#define SJ_ENGINE_JUDGE_SERVICE_H

#include <string>
#include <vector>
#include <map>
#include <deque>
#include <memory>
#include <mutex>
#include <atomic>
#include <optional>

#include "core/error.h"
#include "core/types.h"
#include "core/utils.h"
#include "core/config.h"
#include "core/language.h"
#include "core/engine_logger.h"
#include "sandbox/run_context.h"
#include "router/strategy_router.h"
#include "judge/judge_engine.h"
#include "engine/sinks.h"
#include "engine/store.h"
#include "engine/notifications.h"
#include "engine/orchestrator.h"
#include "engine/submission_queue.h"
#include "engine/worker_pool.h"

namespace sj {
namespace engine {

struct SubmissionRequest {
    std::string code;
    std::string language;
    std::string problem_id;
    std::string user_id;
    bool is_custom_test = false;
    std::optional<std::string> custom_input;
};

/**
 * @brief 服务依赖
 */
struct ServiceDeps {
    router::HeuristicsPtr heuristics;
    ProblemCatalogPtr catalog;
    SandboxFactory sandbox_factory;
    SubmissionStorePtr store;          ///< 空则使用 InMemorySubmissionStore
    MetricsSinkPtr metrics;            ///< 空则写日志
    AuditSinkPtr audit;                ///< 空则写审计日志
};

class JudgeService {
private:
    /// 一个正在处理（或自定义测试已结束）的提交
    struct Record {
        std::mutex mutex;
        Submission submission;
        std::vector<TestCase> test_cases;       ///< 题目配置的原始限制
        std::vector<ResourceLimits> run_limits; ///< 与 test_cases 一一对应
        ComparisonMode comparison_mode;
        CancelTokenPtr token = std::make_shared<CancelToken>();
    };
    using RecordPtr = std::shared_ptr<Record>;

    EngineConfig config_;
    const LanguageRegistry &languages_;
    router::StrategyRouter router_;
    ProblemCatalogPtr catalog_;
    SubmissionStorePtr store_;

    SubmissionQueue queue_;
    NotificationHub hub_;
    Orchestrator orchestrator_;
    judge::JudgeEngine judge_;
    std::unique_ptr<WorkerPool> pool_;

    mutable std::mutex records_mutex_;
    std::map<std::string, RecordPtr> records_;
    /// 已结束、仍留在 records_ 里的自定义测试，按结束顺序
    std::deque<std::pair<std::string, std::chrono::steady_clock::time_point>> finished_custom_;

    std::atomic<uint64_t> finished_count_{0};
    std::atomic<int64_t> finished_time_ms_{0};
    std::atomic<bool> stopped_{false};

    RecordPtr find_record(const std::string &id) const {
        std::lock_guard<std::mutex> lock(records_mutex_);
        auto it = records_.find(id);
        return it != records_.end() ? it->second : nullptr;
    }

    /**
     * @brief 丢弃过期或超量的已结束自定义测试；调用方持有 records_mutex_
     */
    void evict_custom_tests_locked() {
        const RetentionConfig &keep = config_.retention;
        auto cutoff = std::chrono::steady_clock::now() - std::chrono::milliseconds(keep.custom_test_ttl_ms);
        while (!finished_custom_.empty() &&
               (finished_custom_.size() > static_cast<size_t>(keep.max_custom_tests) ||
                finished_custom_.front().second <= cutoff)) {
            records_.erase(finished_custom_.front().first);
            finished_custom_.pop_front();
        }
    }

    /// 调用方持有 rec.mutex
    StatusUpdate make_update_locked(const Record &rec) const {
        StatusUpdate u;
        u.submission_id = rec.submission.id;
        u.user_id = rec.submission.user_id;
        u.status = rec.submission.status;
        return u;
    }

    /**
     * @brief 推进状态并发布；调用方持有 rec.mutex
     */
    Result<void> transition_locked(Record &rec, SubmissionStatus to) {
        Submission &s = rec.submission;
        if (!can_transition(s.status, to)) {
            return SJ_ERROR(ErrorCode::INVALID_STATE,
                            std::string("Submission ") + s.id + ": " + submission_status_str(s.status) +
                                " -> " + submission_status_str(to));
        }
        s.status = to;
        if (to == SubmissionStatus::RUNNING && !s.started_at) {
            s.started_at = now();
        }
        WLOG_DEBUG << "Submission " << s.id << " -> " << submission_status_str(to);
        if (!is_terminal(to)) {
            hub_.publish(make_update_locked(rec));
        }
        return Ok();
    }

    Result<void> transition(Record &rec, SubmissionStatus to) {
        std::lock_guard<std::mutex> lock(rec.mutex);
        return transition_locked(rec, to);
    }

    /**
     * @brief 进入终态：Completed/Failed 附带判定，Cancelled 不带
     */
    void finish(const RecordPtr &rec, SubmissionStatus to, std::optional<Verdict> verdict) {
        Submission snapshot;
        {
            std::lock_guard<std::mutex> lock(rec->mutex);
            Submission &s = rec->submission;
            if (is_terminal(s.status)) {
                return;
            }
            auto moved = transition_locked(*rec, to);
            if (moved.is_error()) {
                WLOG_ERROR << moved.error().to_string();
                return;
            }
            s.verdict = to == SubmissionStatus::CANCELLED ? std::nullopt : verdict;
            s.completed_at = now();

            StatusUpdate u = make_update_locked(*rec);
            u.verdict = s.verdict;
            u.test_results = s.test_results;
            hub_.publish(std::move(u));
            snapshot = s;
        }

        if (snapshot.started_at) {
            finished_count_++;
            finished_time_ms_ += std::chrono::duration_cast<std::chrono::milliseconds>(
                *snapshot.completed_at - *snapshot.started_at).count();
        }

        WLOG_INFO << "Submission " << snapshot.id << " " << submission_status_str(snapshot.status)
                  << (snapshot.verdict ? std::string(": ") + verdict_kind_str(snapshot.verdict->status) : "");

        if (snapshot.is_custom_test) {
            std::lock_guard<std::mutex> lock(records_mutex_);
            finished_custom_.emplace_back(snapshot.id, std::chrono::steady_clock::now());
            evict_custom_tests_locked();
            return;
        }
        auto saved = store_->save(snapshot);
        if (saved.is_error()) {
            WLOG_ERROR << "Cannot persist " << snapshot.id << ": " << saved.error().to_string();
            return;
        }
        std::lock_guard<std::mutex> lock(records_mutex_);
        records_.erase(snapshot.id);
    }

    void fail(const RecordPtr &rec, const std::string &message) {
        size_t total;
        {
            std::lock_guard<std::mutex> lock(rec->mutex);
            total = rec->test_cases.size();
        }
        finish(rec, SubmissionStatus::FAILED, Verdict::system_error(message, static_cast<int>(total)));
    }

    SystemLoad current_load() const {
        SystemLoad load;
        load.queue_depth = queue_.depth();
        if (pool_) {
            int max = pool_->options().max_workers;
            load.server_load = max > 0 ? static_cast<double>(pool_->active_workers()) / max : 0.0;
        }
        return load;
    }

    /**
     * @brief 工作线程处理一个认领
     */
    void process(const Claim &claim, const std::string &worker_id) {
        RecordPtr rec = find_record(claim.submission_id);
        if (!rec) {
            queue_.ack(claim.submission_id);
            return;
        }

        {
            std::lock_guard<std::mutex> lock(rec->mutex);
            SubmissionStatus st = rec->submission.status;
            if (st == SubmissionStatus::RUNNING || st == SubmissionStatus::JUDGING) {
                // 上一次投递的工作线程中途异常，从头重新评测；已发布的结果留在上一轮次名下
                WLOG_WARN << "Redelivering " << claim.submission_id << " (delivery " << claim.delivery << ")";
                auto requeued = transition_locked(*rec, SubmissionStatus::QUEUED);
                if (requeued.is_error()) {
                    WLOG_ERROR << requeued.error().to_string();
                }
                rec->submission.attempt++;
            }
            auto running = transition_locked(*rec, SubmissionStatus::RUNNING);
            if (running.is_error()) {
                WLOG_DEBUG << worker_id << " skips " << claim.submission_id << ": " << running.error().message();
                queue_.ack(claim.submission_id);
                return;
            }
        }

        run_submission(rec);
        queue_.ack(claim.submission_id);
    }

    void run_submission(const RecordPtr &rec) {
        std::string code, language;
        std::vector<TestCase> cases;
        std::vector<ResourceLimits> run_limits;
        ComparisonMode mode;
        RunContext ctx(rec->token);
        {
            std::lock_guard<std::mutex> lock(rec->mutex);
            const Submission &s = rec->submission;
            code = s.code;
            language = s.language;
            cases = rec->test_cases;
            run_limits = rec->run_limits;
            mode = rec->comparison_mode;
            ctx.with_submission(s.id, s.user_id);
        }

        if (ctx.cancelled()) {
            finish(rec, SubmissionStatus::CANCELLED, std::nullopt);
            return;
        }

        ExecutionStrategy strategy = router_.route(code, language, current_load());
        {
            std::lock_guard<std::mutex> lock(rec->mutex);
            if (!rec->submission.strategy) {
                rec->submission.strategy = strategy;
            }
        }

        auto lease = orchestrator_.acquire(language, strategy.kind, ctx);
        if (lease.is_error()) {
            if (ctx.cancelled() || lease.error().code() == ErrorCode::CANCELLED) {
                finish(rec, SubmissionStatus::CANCELLED, std::nullopt);
            } else {
                fail(rec, lease.error().message());
            }
            return;
        }
        SandboxLease &held = lease.value();

        auto run_fn = [&](const TestCase &tc, size_t index) -> Result<RawResult> {
            if (index == 0) {
                SJ_TRY(transition(*rec, SubmissionStatus::JUDGING));
            }
            if (ctx.cancelled()) {
                RawResult cancelled;
                cancelled.kind = RunStatus::CANCELLED;
                return cancelled;
            }
            return orchestrator_.run(held, code, tc.input, run_limits[index], ctx);
        };
        auto on_result = [&](const TestCaseResult &r, size_t index) {
            std::lock_guard<std::mutex> lock(rec->mutex);
            TestCaseResult tagged = r;
            tagged.attempt = rec->submission.attempt;
            rec->submission.test_results.push_back(tagged);
            StatusUpdate u = make_update_locked(*rec);
            u.current_test_index = index;
            u.test_result = std::move(tagged);
            hub_.publish(std::move(u));
        };

        judge::JudgeOptions options;
        options.comparison_mode = mode;
        judge::JudgeOutcome outcome = judge_.evaluate(cases, run_fn, options, on_result);
        held.reset();

        if (outcome.cancelled || ctx.cancelled()) {
            finish(rec, SubmissionStatus::CANCELLED, std::nullopt);
            return;
        }
        SubmissionStatus to = outcome.verdict.status == VerdictKind::SYSTEM_ERROR
                                  ? SubmissionStatus::FAILED
                                  : SubmissionStatus::COMPLETED;
        finish(rec, to, outcome.verdict);
    }

    void on_exhausted(const std::string &id, const std::string &reason) {
        if (RecordPtr rec = find_record(id)) {
            fail(rec, "Worker crashed: " + reason);
        }
    }

    /**
     * @brief 生成测试点与对应的运行限制
     */
    Result<void> plan_cases(const SubmissionRequest &req, const LanguagePlugin &lang,
                            const Problem &problem, Record &rec) const {
        std::vector<TestCase> cases;
        ResourceLimits base = config_.custom_test_limits;
        if (req.is_custom_test && req.custom_input) {
            TestCase tc;
            tc.id = "custom";
            tc.input = *req.custom_input;
            tc.time_limit_ms = base.time_limit_ms;
            tc.memory_limit_bytes = base.memory_limit_bytes;
            cases.push_back(tc);
        } else if (req.is_custom_test) {
            cases = problem.test_cases;
        } else {
            base = ResourceLimits();
            cases = problem.test_cases;
            cases.insert(cases.end(), problem.hidden_test_cases.begin(), problem.hidden_test_cases.end());
        }
        if (cases.empty()) {
            return SJ_ERROR(ErrorCode::VALIDATION_ERROR, "Problem " + problem.id + " has no runnable test cases");
        }

        for (const auto &tc : cases) {
            rec.run_limits.push_back(lang.adjust_limits(
                ResourceLimits(tc.time_limit_ms, tc.memory_limit_bytes, base.cpu_quota, base.pids_limit)));
        }
        rec.test_cases = std::move(cases);
        rec.comparison_mode = problem.comparison_mode;
        return Ok();
    }

public:
    JudgeService(const EngineConfig &config, const LanguageRegistry &languages, ServiceDeps deps)
        : config_(config),
          languages_(languages),
          router_(std::move(deps.heuristics)),
          catalog_(std::move(deps.catalog)),
          store_(deps.store ? std::move(deps.store) : std::make_shared<InMemorySubmissionStore>()),
          queue_(config.workers.max_deliveries),
          hub_(config.notifications.channel_capacity),
          orchestrator_(std::move(deps.sandbox_factory), config.pool,
                        std::move(deps.metrics), std::move(deps.audit)) {}

    ~JudgeService() {
        stop();
    }

    JudgeService(const JudgeService&) = delete;
    JudgeService& operator=(const JudgeService&) = delete;

    /**
     * @brief 启动分发线程与工作线程池
     */
    void start() {
        hub_.start();
        pool_ = std::make_unique<WorkerPool>(
            queue_,
            [this](const Claim &claim, const std::string &worker_id) { process(claim, worker_id); },
            WorkerPoolOptions::from(config_.workers),
            [this](const std::string &id, const std::string &reason) { on_exhausted(id, reason); });
        pool_->start();
        ELOG_INFO << "Judge service started";
    }

    /**
     * @brief 停止接收提交，处理完进行中的提交后关闭
     */
    void stop() {
        if (stopped_.exchange(true)) {
            return;
        }
        queue_.close();
        for (const auto &id : queue_.clear()) {
            if (RecordPtr rec = find_record(id)) {
                fail(rec, "Service stopped");
            }
        }
        if (pool_) {
            pool_->stop();
        }
        orchestrator_.shutdown();
        hub_.stop();
        ELOG_INFO << "Judge service stopped";
    }

    /**
     * @brief 接收提交
     * @return 提交 id
     */
    Result<std::string> submit(const SubmissionRequest &req) {
        if (is_blank(req.code)) {
            return SJ_ERROR(ErrorCode::VALIDATION_ERROR, "Code cannot be empty");
        }
        auto lang = languages_.get(req.language);
        if (!lang) {
            return SJ_ERROR(ErrorCode::UNSUPPORTED_LANGUAGE, "Unsupported language: " + req.language);
        }
        auto problem = catalog_ ? catalog_->find(req.problem_id) : nullptr;
        if (!problem) {
            return SJ_ERROR(ErrorCode::PROBLEM_NOT_FOUND, "Problem not found: " + req.problem_id);
        }
        if (!problem->supports(req.language)) {
            return SJ_ERROR(ErrorCode::UNSUPPORTED_LANGUAGE,
                            "Problem " + problem->id + " does not accept " + req.language);
        }

        auto rec = std::make_shared<Record>();
        SJ_TRY(plan_cases(req, *lang, *problem, *rec));

        Submission &s = rec->submission;
        s.id = generate_uuid();
        s.user_id = req.user_id;
        s.problem_id = req.problem_id;
        s.code = req.code;
        s.language = req.language;
        s.is_custom_test = req.is_custom_test;
        s.custom_input = req.custom_input;
        s.status = SubmissionStatus::QUEUED;
        s.created_at = now();
        std::string id = s.id;

        {
            std::lock_guard<std::mutex> lock(records_mutex_);
            evict_custom_tests_locked();
            records_[id] = rec;
        }
        {
            std::lock_guard<std::mutex> lock(rec->mutex);
            hub_.publish(make_update_locked(*rec));
        }
        auto queued = queue_.enqueue(id);
        if (queued.is_error()) {
            std::lock_guard<std::mutex> lock(records_mutex_);
            records_.erase(id);
            return queued.error();
        }
        WLOG_INFO << "Accepted " << (req.is_custom_test ? "custom test " : "submission ") << id
                  << " user=" << req.user_id << " problem=" << req.problem_id << " lang=" << req.language;
        return id;
    }

    /**
     * @brief 提交快照：先查进行中的记录，再查存储
     */
    Result<Submission> get_submission(const std::string &id) const {
        if (RecordPtr rec = find_record(id)) {
            std::lock_guard<std::mutex> lock(rec->mutex);
            return rec->submission;
        }
        if (auto stored = store_->load(id)) {
            return *stored;
        }
        return SJ_ERROR(ErrorCode::SUBMISSION_NOT_FOUND, "Submission not found: " + id);
    }

    /**
     * @brief 取消自定义测试
     *
     * 排队中的直接移出队列；运行中的通过 CancelToken 终止，
     * 由工作线程在下一个轮询周期内标记为 Cancelled。
     */
    Result<void> cancel(const std::string &id) {
        RecordPtr rec = find_record(id);
        if (!rec) {
            return SJ_ERROR(ErrorCode::SUBMISSION_NOT_FOUND, "Submission not found: " + id);
        }
        {
            std::lock_guard<std::mutex> lock(rec->mutex);
            const Submission &s = rec->submission;
            if (!s.is_custom_test) {
                return SJ_ERROR(ErrorCode::INVALID_STATE, "Only custom tests can be cancelled");
            }
            if (is_terminal(s.status)) {
                return SJ_ERROR(ErrorCode::INVALID_STATE,
                                std::string("Submission already ") + submission_status_str(s.status));
            }
        }

        rec->token->cancel();
        if (queue_.remove(id)) {
            finish(rec, SubmissionStatus::CANCELLED, std::nullopt);
        }
        WLOG_INFO << "Cancellation requested for " << id;
        return Ok();
    }

    /**
     * @brief 1-based 排队位置，不在队中返回 -1
     */
    int queue_position(const std::string &id) const {
        return queue_.position(id);
    }

    SystemStatus system_status() const {
        SystemStatus st;
        SystemLoad load = current_load();
        st.queue_depth = load.queue_depth;
        st.server_load = load.server_load;
        if (pool_) {
            st.active_workers = pool_->active_workers();
            st.total_workers = pool_->total_workers();
        }
        uint64_t n = finished_count_.load();
        st.avg_execution_time_ms = n > 0 ? finished_time_ms_.load() / static_cast<int64_t>(n) : 0;
        return st;
    }

    /// 内存中仍跟踪的提交数（进行中的加上保留期内的自定义测试）
    size_t tracked_submissions() const {
        std::lock_guard<std::mutex> lock(records_mutex_);
        return records_.size();
    }

    void subscribe(const std::string &user_id, UpdateSinkPtr sink) {
        hub_.subscribe(user_id, std::move(sink));
    }

    void unsubscribe(const std::string &user_id, const UpdateSinkPtr &sink) {
        hub_.unsubscribe(user_id, sink);
    }

    Orchestrator& orchestrator() { return orchestrator_; }
    const router::StrategyRouter& router() const { return router_; }
    const NotificationHub& notifications() const { return hub_; }
};

} // namespace engine
} // namespace sj

#endif // SJ_ENGINE_JUDGE_SERVICE_H
