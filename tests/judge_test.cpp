/**
 * @file judge_test.cpp
 * @brief 输出比较、结果分类与判定生成
 */

#include <gtest/gtest.h>

#include <csignal>

#include "judge/judge_engine.h"

using namespace sj;
using namespace sj::judge;

namespace {

TestCase make_case(const std::string &id, const std::string &input, const std::string &expected) {
    TestCase tc;
    tc.id = id;
    tc.input = input;
    tc.expected_output = expected;
    tc.time_limit_ms = 1000;
    tc.memory_limit_bytes = 64 * MiB;
    return tc;
}

RawResult exited(const std::string &out, int64_t ms = 10, int64_t mem = 1 * MiB) {
    RawResult r;
    r.kind = RunStatus::EXITED;
    r.exit_code = 0;
    r.stdout_data = out;
    r.wall_time_ms = ms;
    r.peak_memory_bytes = mem;
    return r;
}

} // namespace

//==============================================================================
// 输出比较
//==============================================================================

TEST(CompareOutputTest, DefaultModeTrimsAndIgnoresTrailingSpaces) {
    ComparisonMode mode;
    EXPECT_TRUE(compare_output("3\n", "3", mode));
    EXPECT_TRUE(compare_output("  1 2  \n3\t\n\n", "1 2\n3", mode));
    EXPECT_TRUE(compare_output("a\r\nb\r\n", "a\nb", mode));
    EXPECT_FALSE(compare_output("1  2", "1 2", mode));
    EXPECT_FALSE(compare_output("a\n\nb", "a\nb", mode));
}

// 测试：默认模式整体去掉首尾空白，末尾多出的空行不影响结果
TEST(CompareOutputTest, TrailingBlankLinesTrimmedByDefault) {
    ComparisonMode mode;
    EXPECT_TRUE(compare_output("5\n\n", "5", mode));
    EXPECT_TRUE(compare_output("\n5", "5\n\n\n", mode));

    mode.trim_whitespace = false;
    mode.ignore_trailing_spaces = false;
    EXPECT_FALSE(compare_output("5\n\n", "5", mode));
}

TEST(CompareOutputTest, EmptyLinesIgnoredWhenRequested) {
    ComparisonMode mode;
    mode.ignore_empty_lines = true;
    EXPECT_TRUE(compare_output("a\n\n  \nb\n", "a\nb", mode));
}

TEST(CompareOutputTest, ExactModeComparesBytes) {
    ComparisonMode mode;
    mode.trim_whitespace = false;
    mode.ignore_trailing_spaces = false;
    EXPECT_FALSE(compare_output("3\n", "3", mode));
    EXPECT_TRUE(compare_output("3\n", "3\n", mode));
    EXPECT_EQ(normalize_output(" x ", mode), " x ");
}

//==============================================================================
// 分类
//==============================================================================

class ClassifyTest : public ::testing::Test {
protected:
    TestCase tc = make_case("1", "1 2\n", "3\n");
    ComparisonMode mode;
};

TEST_F(ClassifyTest, AcceptedAndWrongAnswer) {
    TestCaseResult r = JudgeEngine::classify(tc, exited("3"), mode);
    EXPECT_TRUE(r.passed);
    EXPECT_EQ(r.verdict_kind, VerdictKind::ACCEPTED);
    EXPECT_EQ(r.test_case_id, "1");
    ASSERT_TRUE(r.actual_output.has_value());
    EXPECT_EQ(*r.actual_output, "3");

    r = JudgeEngine::classify(tc, exited("4"), mode);
    EXPECT_FALSE(r.passed);
    EXPECT_EQ(r.verdict_kind, VerdictKind::WRONG_ANSWER);
}

TEST_F(ClassifyTest, NonZeroExitIsRuntimeError) {
    RawResult raw = exited("");
    raw.exit_code = 1;
    raw.stderr_data = "Traceback: ZeroDivisionError";
    TestCaseResult r = JudgeEngine::classify(tc, raw, mode);
    EXPECT_EQ(r.verdict_kind, VerdictKind::RUNTIME_ERROR);
    ASSERT_TRUE(r.error.has_value());
    EXPECT_NE(r.error->find("Exit code 1"), std::string::npos);
    EXPECT_NE(r.error->find("ZeroDivisionError"), std::string::npos);
}

TEST_F(ClassifyTest, SignalAndLimits) {
    RawResult raw = exited("");
    raw.kind = RunStatus::SIGNALED;
    raw.signal = SIGSEGV;
    EXPECT_EQ(JudgeEngine::classify(tc, raw, mode).verdict_kind, VerdictKind::RUNTIME_ERROR);

    raw.signal = SIGXFSZ;
    EXPECT_EQ(*JudgeEngine::classify(tc, raw, mode).error, "Output limit exceeded");

    raw = exited("3");
    raw.kind = RunStatus::TIME_LIMIT;
    EXPECT_EQ(JudgeEngine::classify(tc, raw, mode).verdict_kind, VerdictKind::TIME_LIMIT_EXCEEDED);

    // 正常退出但超过限制
    raw = exited("3", 1500);
    EXPECT_EQ(JudgeEngine::classify(tc, raw, mode).verdict_kind, VerdictKind::TIME_LIMIT_EXCEEDED);
    raw = exited("3", 10, 128 * MiB);
    EXPECT_EQ(JudgeEngine::classify(tc, raw, mode).verdict_kind, VerdictKind::MEMORY_LIMIT_EXCEEDED);
}

// 测试：超时、超内存的判定先于非零退出码和信号
TEST_F(ClassifyTest, LimitBreachOutranksExitStatus) {
    RawResult raw = exited("", 1500);
    raw.exit_code = 1;
    raw.stderr_data = "Killed";
    EXPECT_EQ(JudgeEngine::classify(tc, raw, mode).verdict_kind, VerdictKind::TIME_LIMIT_EXCEEDED);

    raw = exited("", 10, 128 * MiB);
    raw.exit_code = 137;
    EXPECT_EQ(JudgeEngine::classify(tc, raw, mode).verdict_kind, VerdictKind::MEMORY_LIMIT_EXCEEDED);

    raw = exited("", 1001);
    raw.kind = RunStatus::SIGNALED;
    raw.signal = SIGKILL;
    EXPECT_EQ(JudgeEngine::classify(tc, raw, mode).verdict_kind, VerdictKind::TIME_LIMIT_EXCEEDED);

    // 恰好等于限制不算超时
    raw = exited("", 1000);
    raw.exit_code = 2;
    EXPECT_EQ(JudgeEngine::classify(tc, raw, mode).verdict_kind, VerdictKind::RUNTIME_ERROR);
}

TEST_F(ClassifyTest, PolicyBreachIsSecurityViolation) {
    RawResult raw = exited("");
    raw.kind = RunStatus::SYSCALL_VIOLATION;
    raw.violation = Breach{"forbidden_syscall", "socket"};
    TestCaseResult r = JudgeEngine::classify(tc, raw, mode);
    EXPECT_EQ(r.verdict_kind, VerdictKind::SECURITY_VIOLATION);
    EXPECT_EQ(*r.error, "socket");
}

TEST_F(ClassifyTest, CustomInputWithoutExpectedOutputPasses) {
    tc.expected_output.reset();
    TestCaseResult r = JudgeEngine::classify(tc, exited("anything"), mode);
    EXPECT_TRUE(r.passed);
    EXPECT_EQ(*r.actual_output, "anything");
}

//==============================================================================
// 判定
//==============================================================================

TEST(MakeVerdictTest, AllPassedIsAccepted) {
    std::vector<TestCaseResult> results(2);
    results[0].passed = true;
    results[0].verdict_kind = VerdictKind::ACCEPTED;
    results[0].execution_time_ms = 30;
    results[0].memory_used_bytes = 2 * MiB;
    results[1].passed = true;
    results[1].verdict_kind = VerdictKind::ACCEPTED;
    results[1].execution_time_ms = 20;
    results[1].memory_used_bytes = 5 * MiB;

    Verdict v = JudgeEngine::make_verdict(results, 2);
    EXPECT_TRUE(v.accepted());
    EXPECT_EQ(v.passed_tests, 2);
    EXPECT_EQ(v.total_tests, 2);
    EXPECT_EQ(v.max_time_ms, 30);
    EXPECT_EQ(v.max_memory_bytes, 5 * MiB);
    EXPECT_FALSE(v.failed_test_case.has_value());
}

TEST(MakeVerdictTest, FirstFailureDecides) {
    std::vector<TestCaseResult> results(3);
    results[0].passed = true;
    results[0].verdict_kind = VerdictKind::ACCEPTED;
    results[1].verdict_kind = VerdictKind::TIME_LIMIT_EXCEEDED;
    results[2].verdict_kind = VerdictKind::WRONG_ANSWER;

    Verdict v = JudgeEngine::make_verdict(results, 3);
    EXPECT_EQ(v.status, VerdictKind::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(v.passed_tests, 1);
    EXPECT_EQ(*v.failed_test_case, 2);
}

TEST(MakeVerdictTest, IncompleteRunIsSystemError) {
    std::vector<TestCaseResult> results(1);
    results[0].passed = true;
    Verdict v = JudgeEngine::make_verdict(results, 3);
    EXPECT_EQ(v.status, VerdictKind::SYSTEM_ERROR);
}

//==============================================================================
// evaluate
//==============================================================================

class EvaluateTest : public ::testing::Test {
protected:
    JudgeEngine engine;
    JudgeOptions options;
    std::vector<TestCase> cases;
    std::vector<size_t> ran;

    void SetUp() override {
        cases.push_back(make_case("1", "1 2", "3"));
        cases.push_back(make_case("2", "2 2", "4"));
        cases.push_back(make_case("3", "5 5", "10"));
    }

    /// 依次返回给定输出
    RunFn scripted(std::vector<Result<RawResult>> script) {
        auto shared = std::make_shared<std::vector<Result<RawResult>>>(std::move(script));
        return [this, shared](const TestCase &, size_t index) -> Result<RawResult> {
            ran.push_back(index);
            return (*shared)[index];
        };
    }
};

TEST_F(EvaluateTest, AllCasesPass) {
    std::vector<size_t> reported;
    auto out = engine.evaluate(cases, scripted({exited("3"), exited("4"), exited("10")}), options,
                               [&](const TestCaseResult &, size_t i) { reported.push_back(i); });
    EXPECT_FALSE(out.cancelled);
    EXPECT_TRUE(out.verdict.accepted());
    EXPECT_EQ(out.verdict.passed_tests, 3);
    EXPECT_EQ(out.results.size(), 3u);
    EXPECT_EQ(reported, (std::vector<size_t>{0, 1, 2}));
}

// 测试：第二个测试点失败后不再运行第三个
TEST_F(EvaluateTest, StopsOnFirstFailure) {
    auto out = engine.evaluate(cases, scripted({exited("3"), exited("5"), exited("10")}), options);
    EXPECT_EQ(ran, (std::vector<size_t>{0, 1}));
    EXPECT_EQ(out.results.size(), 2u);
    EXPECT_EQ(out.verdict.status, VerdictKind::WRONG_ANSWER);
    EXPECT_EQ(*out.verdict.failed_test_case, 2);
    EXPECT_EQ(out.verdict.total_tests, 3);
    EXPECT_EQ(out.verdict.passed_tests, 1);
}

TEST_F(EvaluateTest, RunsAllCasesWhenNotStopping) {
    options.stop_on_first_failure = false;
    auto out = engine.evaluate(cases, scripted({exited("3"), exited("5"), exited("10")}), options);
    EXPECT_EQ(out.results.size(), 3u);
    EXPECT_EQ(out.verdict.passed_tests, 2);
    EXPECT_EQ(*out.verdict.failed_test_case, 2);
}

TEST_F(EvaluateTest, CompileErrorEndsImmediately) {
    RawResult ce;
    ce.kind = RunStatus::COMPILE_ERROR;
    ce.exit_code = 1;
    ce.stderr_data = "main.cpp:1:1: error: expected unqualified-id";
    auto out = engine.evaluate(cases, scripted({ce, exited("4"), exited("10")}), options);
    EXPECT_EQ(ran.size(), 1u);
    EXPECT_TRUE(out.results.empty());
    EXPECT_EQ(out.verdict.status, VerdictKind::COMPILATION_ERROR);
    EXPECT_EQ(*out.verdict.error_message, ce.stderr_data);
}

TEST_F(EvaluateTest, SandboxFailureIsSystemError) {
    Result<RawResult> failure = Error(ErrorCode::FORK_FAILED, "clone failed");
    auto out = engine.evaluate(cases, scripted({exited("3"), failure, exited("10")}), options);
    ASSERT_EQ(out.results.size(), 2u);
    EXPECT_EQ(out.results[1].verdict_kind, VerdictKind::SYSTEM_ERROR);
    EXPECT_EQ(out.verdict.status, VerdictKind::SYSTEM_ERROR);
    EXPECT_EQ(*out.verdict.failed_test_case, 2);
}

TEST_F(EvaluateTest, CancelledRunStopsWithoutResult) {
    RawResult cancelled;
    cancelled.kind = RunStatus::CANCELLED;
    auto out = engine.evaluate(cases, scripted({exited("3"), cancelled, exited("10")}), options);
    EXPECT_TRUE(out.cancelled);
    EXPECT_EQ(out.results.size(), 1u);
    EXPECT_EQ(ran.size(), 2u);
}
