/**
 * @file service_test.cpp
 * @brief 评测服务：提交校验、状态机、取消、持久化
 */

#include <gtest/gtest.h>

#include <condition_variable>
#include <functional>
#include <thread>
#include <set>
#include <chrono>

#include "core/language_loader.h"
#include "engine/judge_service.h"
#include "fake_sandbox.h"

using namespace sj;
using namespace sj::engine;

namespace {

bool wait_until(const std::function<bool()> &pred, int timeout_ms = 5000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

/**
 * @brief 记录收到的所有更新
 */
class RecordingSink : public UpdateSink {
private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<StatusUpdate> updates_;

public:
    void on_update(const StatusUpdate &u) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            updates_.push_back(u);
        }
        cv_.notify_all();
    }

    std::vector<StatusUpdate> updates_for(const std::string &id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<StatusUpdate> out;
        for (const auto &u : updates_) {
            if (u.submission_id == id) out.push_back(u);
        }
        return out;
    }

    /// 只含状态变化（不含测试点结果）的序列
    std::vector<SubmissionStatus> statuses_for(const std::string &id) const {
        std::vector<SubmissionStatus> out;
        for (const auto &u : updates_for(id)) {
            if (!u.test_result) out.push_back(u.status);
        }
        return out;
    }

    bool wait_status(const std::string &id, SubmissionStatus status, int timeout_ms = 5000) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [&] {
            for (const auto &u : updates_) {
                if (u.submission_id == id && u.status == status) return true;
            }
            return false;
        });
    }

    std::optional<StatusUpdate> wait_terminal(const std::string &id, int timeout_ms = 5000) {
        std::unique_lock<std::mutex> lock(mutex_);
        std::optional<StatusUpdate> found;
        cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [&] {
            for (const auto &u : updates_) {
                if (u.submission_id == id && is_terminal(u.status)) {
                    found = u;
                    return true;
                }
            }
            return false;
        });
        return found;
    }
};

} // namespace

class JudgeServiceTest : public ::testing::Test {
protected:
    LanguageRegistry languages;
    EngineConfig config;
    std::shared_ptr<fake::FakeWorld> world = std::make_shared<fake::FakeWorld>();
    std::shared_ptr<YamlProblemCatalog> catalog = std::make_shared<YamlProblemCatalog>();
    std::shared_ptr<InMemorySubmissionStore> store = std::make_shared<InMemorySubmissionStore>();
    std::shared_ptr<MemoryAuditSink> audit = std::make_shared<MemoryAuditSink>();
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();
    router::HeuristicsPtr heuristics;
    std::unique_ptr<JudgeService> service;

    void SetUp() override {
        std::string dir = SJ_CONFIG_DIR;
        ASSERT_TRUE(load_languages_from_directory(dir + "/languages", languages).ok());
        ASSERT_TRUE(catalog->load_directory(dir + "/problems").ok());
        auto loaded = router::HeuristicsTable::load(dir + "/heuristics.yaml");
        ASSERT_TRUE(loaded.ok());
        heuristics = loaded.value();

        config.workers.min = 2;
        config.workers.max = 4;
        config.workers.max_deliveries = 2;
        config.pool.backoff_initial_ms = 1;
        config.pool.reaper_interval_ms = 50;
        make_service();
    }

    /// 按当前 config 重建服务
    void make_service() {
        service.reset();
        ServiceDeps deps;
        deps.heuristics = heuristics;
        deps.catalog = catalog;
        deps.sandbox_factory = fake::fake_factory(world);
        deps.store = store;
        deps.metrics = std::make_shared<MemoryMetricsSink>();
        deps.audit = audit;
        service.reset(new JudgeService(config, languages, std::move(deps)));
        service->subscribe("alice", sink);
    }

    void TearDown() override {
        service.reset();
    }

    SubmissionRequest request(const std::string &code, const std::string &language = "python",
                              const std::string &problem = "a-plus-b") {
        SubmissionRequest req;
        req.code = code;
        req.language = language;
        req.problem_id = problem;
        req.user_id = "alice";
        return req;
    }

    std::string submit_ok(const SubmissionRequest &req) {
        auto id = service->submit(req);
        EXPECT_TRUE(id.ok()) << id.error().to_string();
        return id.ok() ? id.value() : std::string();
    }

    Verdict judged_verdict(const std::string &id) {
        auto last = sink->wait_terminal(id);
        EXPECT_TRUE(last.has_value()) << "no terminal update for " << id;
        if (!last || !last->verdict) {
            return Verdict::system_error("missing");
        }
        return *last->verdict;
    }
};

//==============================================================================
// 提交校验
//==============================================================================

TEST_F(JudgeServiceTest, RejectsInvalidSubmissions) {
    auto r = service->submit(request("  \n\t"));
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().code(), ErrorCode::VALIDATION_ERROR);
    EXPECT_EQ(r.error().message(), "Code cannot be empty");

    r = service->submit(request("SUM", "cobol"));
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().code(), ErrorCode::UNSUPPORTED_LANGUAGE);

    r = service->submit(request("SUM", "python", "no-such-problem"));
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().code(), ErrorCode::PROBLEM_NOT_FOUND);

    Problem cpp_only;
    cpp_only.id = "cpp-only";
    cpp_only.supported_languages = {"cpp"};
    TestCase tc;
    tc.id = "1";
    tc.expected_output = "";
    cpp_only.test_cases.push_back(tc);
    catalog->add(cpp_only);
    r = service->submit(request("SUM", "python", "cpp-only"));
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().code(), ErrorCode::UNSUPPORTED_LANGUAGE);

    EXPECT_EQ(service->queue_position("anything"), -1);
    EXPECT_EQ(service->system_status().queue_depth, 0u);
}

//==============================================================================
// 评测流程
//==============================================================================

TEST_F(JudgeServiceTest, AcceptedSubmissionWalksStateMachine) {
    service->start();
    std::string id = submit_ok(request("SUM"));

    Verdict v = judged_verdict(id);
    EXPECT_EQ(v.status, VerdictKind::ACCEPTED);
    EXPECT_EQ(v.passed_tests, 4);
    EXPECT_EQ(v.total_tests, 4);

    EXPECT_EQ(sink->statuses_for(id),
              (std::vector<SubmissionStatus>{SubmissionStatus::QUEUED, SubmissionStatus::RUNNING,
                                             SubmissionStatus::JUDGING, SubmissionStatus::COMPLETED}));

    std::vector<size_t> indices;
    for (const auto &u : sink->updates_for(id)) {
        if (u.test_result) {
            EXPECT_EQ(u.status, SubmissionStatus::JUDGING);
            indices.push_back(*u.current_test_index);
        }
        if (is_terminal(u.status)) {
            EXPECT_EQ(u.test_results.size(), 4u);
        }
    }
    EXPECT_EQ(indices, (std::vector<size_t>{0, 1, 2, 3}));

    // 普通提交在终态持久化
    ASSERT_TRUE(wait_until([&] { return store->size() == 1; }));
    auto stored = service->get_submission(id);
    ASSERT_TRUE(stored.ok());
    const Submission &s = stored.value();
    EXPECT_EQ(s.status, SubmissionStatus::COMPLETED);
    ASSERT_TRUE(s.strategy.has_value());
    EXPECT_EQ(s.strategy->kind, StrategyKind::CLIENT);
    EXPECT_TRUE(s.started_at.has_value());
    EXPECT_TRUE(s.completed_at.has_value());
    EXPECT_EQ(s.test_results.size(), 4u);
    EXPECT_EQ(s.test_results[2].test_case_id, "big");
}

// 测试：每个提交在 Running 之前处于 Queued，且 Running 之前没有任何测试点结果
TEST_F(JudgeServiceTest, NoTestCaseRunsBeforeRunning) {
    service->start();
    std::vector<std::string> ids;
    for (int i = 0; i < 6; i++) {
        ids.push_back(submit_ok(request(i % 2 ? "SUM" : "SLOW SUM")));
    }
    for (const auto &id : ids) {
        ASSERT_TRUE(sink->wait_terminal(id).has_value()) << id;
        auto updates = sink->updates_for(id);
        ASSERT_FALSE(updates.empty());
        EXPECT_EQ(updates.front().status, SubmissionStatus::QUEUED);

        bool running = false;
        SubmissionStatus previous = SubmissionStatus::QUEUED;
        for (size_t i = 0; i < updates.size(); i++) {
            const StatusUpdate &u = updates[i];
            if (u.test_result) {
                EXPECT_TRUE(running) << id << " reported a test result before Running";
                continue;
            }
            if (u.status == SubmissionStatus::RUNNING) {
                EXPECT_EQ(previous, SubmissionStatus::QUEUED) << id;
                running = true;
            }
            if (i > 0) {
                previous = u.status;
            }
        }
        EXPECT_TRUE(running) << id;
        EXPECT_EQ(sink->statuses_for(id),
                  (std::vector<SubmissionStatus>{SubmissionStatus::QUEUED, SubmissionStatus::RUNNING,
                                                 SubmissionStatus::JUDGING, SubmissionStatus::COMPLETED}));
    }
}

// 测试：题目限制 1000ms，解释型语言运行 1500ms 仍判超时，时间限制不按语言放宽
TEST_F(JudgeServiceTest, OvertimeRunIsTimeLimitExceeded) {
    service->start();
    for (const char *language : {"python", "javascript"}) {
        std::string id = submit_ok(request("SUM OVERTIME", language));
        Verdict v = judged_verdict(id);
        EXPECT_EQ(v.status, VerdictKind::TIME_LIMIT_EXCEEDED) << language;
        EXPECT_EQ(*v.failed_test_case, 1) << language;
        EXPECT_EQ(world->last_time_limit_ms.load(), 1000) << language;
    }
}

TEST_F(JudgeServiceTest, WrongAnswerStopsAtFirstFailure) {
    service->start();
    std::string id = submit_ok(request("print(input())"));
    Verdict v = judged_verdict(id);
    EXPECT_EQ(v.status, VerdictKind::WRONG_ANSWER);
    EXPECT_EQ(*v.failed_test_case, 1);
    EXPECT_EQ(v.passed_tests, 0);

    ASSERT_TRUE(wait_until([&] { return store->size() == 1; }));
    EXPECT_EQ(service->get_submission(id).value().test_results.size(), 1u);
}

TEST_F(JudgeServiceTest, CompilationErrorCompletes) {
    service->start();
    std::string id = submit_ok(request("COMPILE_ERROR", "cpp"));
    auto last = sink->wait_terminal(id);
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->status, SubmissionStatus::COMPLETED);
    ASSERT_TRUE(last->verdict.has_value());
    EXPECT_EQ(last->verdict->status, VerdictKind::COMPILATION_ERROR);
    EXPECT_EQ(*last->verdict->error_message, "main: syntax error");
    EXPECT_TRUE(last->test_results.empty());
}

TEST_F(JudgeServiceTest, MemoryLimitVerdict) {
    service->start();
    std::string id = submit_ok(request("MLE"));
    EXPECT_EQ(judged_verdict(id).status, VerdictKind::MEMORY_LIMIT_EXCEEDED);
}

TEST_F(JudgeServiceTest, SecurityViolationAudited) {
    service->start();
    std::string id = submit_ok(request("SYSCALL"));
    Verdict v = judged_verdict(id);
    EXPECT_EQ(v.status, VerdictKind::SECURITY_VIOLATION);
    EXPECT_EQ(*v.error_message, "socket");

    ASSERT_EQ(audit->size(), 1u);
    EXPECT_EQ(audit->records()[0].submission_id, id);
    EXPECT_EQ(audit->records()[0].user_id, "alice");
    EXPECT_EQ(world->destroyed.load(), world->provisioned.load());
}

// 测试：工作线程两次异常后提交进入 Failed
TEST_F(JudgeServiceTest, WorkerCrashRedeliversThenFails) {
    service->start();
    std::string id = submit_ok(request("THROW"));
    auto last = sink->wait_terminal(id);
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->status, SubmissionStatus::FAILED);
    ASSERT_TRUE(last->verdict.has_value());
    EXPECT_EQ(last->verdict->status, VerdictKind::SYSTEM_ERROR);
    EXPECT_NE(last->verdict->error_message->find("Worker crashed"), std::string::npos);

    EXPECT_EQ(sink->statuses_for(id),
              (std::vector<SubmissionStatus>{SubmissionStatus::QUEUED, SubmissionStatus::RUNNING,
                                             SubmissionStatus::JUDGING, SubmissionStatus::QUEUED,
                                             SubmissionStatus::RUNNING, SubmissionStatus::JUDGING,
                                             SubmissionStatus::FAILED}));
    EXPECT_EQ(world->runs.load(), 2);
}

// 测试：重新投递后，上一轮已发布的测试点结果保留并标明轮次
TEST_F(JudgeServiceTest, RedeliveryKeepsEarlierResults) {
    service->start();
    std::string id = submit_ok(request("SUM FLAKY"));
    Verdict v = judged_verdict(id);
    EXPECT_TRUE(v.accepted());
    EXPECT_EQ(v.passed_tests, 4);

    ASSERT_TRUE(wait_until([&] { return store->size() == 1; }));
    Submission s = service->get_submission(id).value();
    EXPECT_EQ(s.attempt, 2);
    ASSERT_EQ(s.test_results.size(), 5u);
    EXPECT_EQ(s.test_results[0].attempt, 1);
    EXPECT_EQ(s.test_results[0].test_case_id, "sample-1");
    for (size_t i = 1; i < s.test_results.size(); i++) {
        EXPECT_EQ(s.test_results[i].attempt, 2);
    }

    std::vector<int> streamed;
    for (const auto &u : sink->updates_for(id)) {
        if (u.test_result) streamed.push_back(u.test_result->attempt);
    }
    EXPECT_EQ(streamed, (std::vector<int>{1, 2, 2, 2, 2}));
}

//==============================================================================
// 并发提交
//==============================================================================

TEST_F(JudgeServiceTest, ConcurrentSubmitsGetDistinctIds) {
    const int threads = 8;
    const int per_thread = 25;
    std::mutex mutex;
    std::vector<std::string> ids;
    std::vector<std::thread> submitters;
    for (int t = 0; t < threads; t++) {
        submitters.emplace_back([&] {
            for (int i = 0; i < per_thread; i++) {
                auto id = service->submit(request("SUM"));
                ASSERT_TRUE(id.ok());
                std::lock_guard<std::mutex> lock(mutex);
                ids.push_back(id.value());
            }
        });
    }
    for (auto &th : submitters) {
        th.join();
    }
    ASSERT_EQ(ids.size(), static_cast<size_t>(threads * per_thread));
    EXPECT_EQ(std::set<std::string>(ids.begin(), ids.end()).size(), ids.size());
    EXPECT_EQ(service->system_status().queue_depth, ids.size());
}

//==============================================================================
// 自定义测试
//==============================================================================

TEST_F(JudgeServiceTest, CustomInputRunsOnceAndIsNotPersisted) {
    service->start();
    SubmissionRequest req = request("SUM");
    req.is_custom_test = true;
    req.custom_input = "4 5\n";
    std::string id = submit_ok(req);

    auto last = sink->wait_terminal(id);
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->status, SubmissionStatus::COMPLETED);
    ASSERT_EQ(last->test_results.size(), 1u);
    EXPECT_EQ(last->test_results[0].test_case_id, "custom");
    EXPECT_EQ(*last->test_results[0].actual_output, "9\n");
    EXPECT_TRUE(last->verdict->accepted());

    auto s = service->get_submission(id);
    ASSERT_TRUE(s.ok());
    EXPECT_TRUE(s.value().is_custom_test);
    EXPECT_EQ(store->size(), 0u);
}

TEST_F(JudgeServiceTest, CustomTestWithoutInputUsesPublicCases) {
    service->start();
    SubmissionRequest req = request("SUM");
    req.is_custom_test = true;
    std::string id = submit_ok(req);
    Verdict v = judged_verdict(id);
    EXPECT_TRUE(v.accepted());
    EXPECT_EQ(v.total_tests, 2);
}

// 测试：已结束的自定义测试超过保留上限后被移出内存
TEST_F(JudgeServiceTest, FinishedCustomTestsEvictedOverCap) {
    config.retention.max_custom_tests = 2;
    make_service();
    service->start();

    std::vector<std::string> ids;
    for (int i = 0; i < 4; i++) {
        SubmissionRequest req = request("SUM");
        req.is_custom_test = true;
        req.custom_input = "1 " + std::to_string(i);
        ids.push_back(submit_ok(req));
        ASSERT_TRUE(sink->wait_terminal(ids.back()).has_value());
    }
    ASSERT_TRUE(wait_until([&] { return service->tracked_submissions() == 2; }));

    for (int i = 0; i < 2; i++) {
        auto gone = service->get_submission(ids[i]);
        ASSERT_TRUE(gone.is_error());
        EXPECT_EQ(gone.error().code(), ErrorCode::SUBMISSION_NOT_FOUND);
    }
    EXPECT_TRUE(service->get_submission(ids[2]).ok());
    EXPECT_TRUE(service->get_submission(ids[3]).ok());
    EXPECT_EQ(store->size(), 0u);
}

TEST_F(JudgeServiceTest, FinishedCustomTestsExpire) {
    config.retention.custom_test_ttl_ms = 50;
    make_service();
    service->start();

    SubmissionRequest req = request("SUM");
    req.is_custom_test = true;
    req.custom_input = "2 2";
    std::string first = submit_ok(req);
    ASSERT_TRUE(sink->wait_terminal(first).has_value());
    ASSERT_TRUE(wait_until([&] { return service->tracked_submissions() == 1; }));

    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    std::string second = submit_ok(req);
    auto gone = service->get_submission(first);
    ASSERT_TRUE(gone.is_error());
    EXPECT_EQ(gone.error().code(), ErrorCode::SUBMISSION_NOT_FOUND);

    ASSERT_TRUE(sink->wait_terminal(second).has_value());
    EXPECT_TRUE(service->get_submission(second).ok());
}

TEST_F(JudgeServiceTest, CancelQueuedCustomTest) {
    // 不启动工作线程，提交停留在队列中
    SubmissionRequest req = request("SUM");
    req.is_custom_test = true;
    req.custom_input = "1 1";
    std::string first = submit_ok(req);
    std::string second = submit_ok(req);
    EXPECT_EQ(service->queue_position(first), 1);
    EXPECT_EQ(service->queue_position(second), 2);
    EXPECT_EQ(service->system_status().queue_depth, 2u);

    ASSERT_TRUE(service->cancel(first).ok());
    EXPECT_EQ(service->queue_position(first), -1);
    EXPECT_EQ(service->queue_position(second), 1);

    auto s = service->get_submission(first);
    ASSERT_TRUE(s.ok());
    EXPECT_EQ(s.value().status, SubmissionStatus::CANCELLED);
    EXPECT_FALSE(s.value().verdict.has_value());

    auto again = service->cancel(first);
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().code(), ErrorCode::INVALID_STATE);
}

TEST_F(JudgeServiceTest, CancelRunningCustomTest) {
    service->start();
    SubmissionRequest req = request("HANG");
    req.is_custom_test = true;
    req.custom_input = "";
    std::string id = submit_ok(req);

    ASSERT_TRUE(sink->wait_status(id, SubmissionStatus::JUDGING));
    auto begin = std::chrono::steady_clock::now();
    ASSERT_TRUE(service->cancel(id).ok());

    auto last = sink->wait_terminal(id);
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->status, SubmissionStatus::CANCELLED);
    EXPECT_FALSE(last->verdict.has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::milliseconds(2000));
}

TEST_F(JudgeServiceTest, OnlyCustomTestsCanBeCancelled) {
    std::string id = submit_ok(request("SUM"));
    auto r = service->cancel(id);
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().code(), ErrorCode::INVALID_STATE);

    r = service->cancel("missing");
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().code(), ErrorCode::SUBMISSION_NOT_FOUND);
}

//==============================================================================
// 查询与关闭
//==============================================================================

TEST_F(JudgeServiceTest, UnknownSubmissionNotFound) {
    auto r = service->get_submission("missing");
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().code(), ErrorCode::SUBMISSION_NOT_FOUND);
}

TEST_F(JudgeServiceTest, SystemStatusReflectsWorkers) {
    EXPECT_EQ(service->system_status().total_workers, 0u);
    service->start();
    SystemStatus st = service->system_status();
    EXPECT_EQ(st.total_workers, 2u);
    EXPECT_DOUBLE_EQ(st.server_load, 0.0);

    std::string id = submit_ok(request("SLOW"));
    ASSERT_TRUE(sink->wait_status(id, SubmissionStatus::JUDGING));
    st = service->system_status();
    EXPECT_GE(st.active_workers, 1u);
    EXPECT_GT(st.server_load, 0.0);

    judged_verdict(id);
    ASSERT_TRUE(wait_until([&] { return service->system_status().active_workers == 0; }));
    EXPECT_GT(service->system_status().avg_execution_time_ms, 0);
}

TEST_F(JudgeServiceTest, StopFailsQueuedSubmissions) {
    std::string id = submit_ok(request("SUM"));
    service->stop();

    auto s = service->get_submission(id);
    ASSERT_TRUE(s.ok());
    EXPECT_EQ(s.value().status, SubmissionStatus::FAILED);
    EXPECT_EQ(*s.value().verdict->error_message, "Service stopped");

    auto r = service->submit(request("SUM"));
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().code(), ErrorCode::QUEUE_CLOSED);
}
