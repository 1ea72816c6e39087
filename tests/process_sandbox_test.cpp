/**
 * @file process_sandbox_test.cpp
 * @brief ProcessSandbox 在无隔离配置下的真实进程运行
 */

#include <gtest/gtest.h>

#include <thread>
#include <chrono>
#include <unistd.h>

#include "core/language_loader.h"
#include "sandbox/sandbox.h"

using namespace sj;
using namespace sj::sandbox;

class ProcessSandboxTest : public ::testing::Test {
protected:
    std::string scratch;
    std::shared_ptr<const LanguagePlugin> shell;
    IsolationProfilePtr profile;
    RunContext ctx;

    void SetUp() override {
        scratch = "/tmp/sj-process-sandbox-test-" + std::to_string(getpid());
        auto plugin = YamlLanguagePlugin::from_yaml(yaml::parse_yaml(
            "language:\n"
            "  id: shell\n"
            "  extensions: [sh]\n"
            "runtime:\n"
            "  command: /bin/sh\n"
            "  args: [\"{program}\"]\n"));
        ASSERT_TRUE(plugin.ok()) << plugin.error().to_string();
        shell = plugin.value();
        profile = std::make_shared<IsolationProfile>(IsolationProfile::relaxed("shell"));
    }

    void TearDown() override {
        remove_tree(scratch);
    }

    std::shared_ptr<ProcessSandbox> make(const std::string &id = "box") {
        auto sb = std::make_shared<ProcessSandbox>(id, SandboxKind::EPHEMERAL, shell, profile, scratch);
        auto provisioned = sb->provision();
        EXPECT_TRUE(provisioned.ok()) << provisioned.error().to_string();
        return sb;
    }

    static RunRequest request(const std::string &code, const std::string &input = "",
                              int64_t time_ms = 2000) {
        return RunRequest{code, input, ResourceLimits(time_ms, 64 * MiB)};
    }
};

TEST_F(ProcessSandboxTest, RunsProgramWithInput) {
    auto sb = make();
    auto raw = sb->run(request("read a b\necho $((a + b))\n", "1 2\n"), ctx);
    ASSERT_TRUE(raw.ok()) << raw.error().to_string();
    EXPECT_EQ(raw.value().kind, RunStatus::EXITED);
    EXPECT_EQ(raw.value().exit_code, 0);
    EXPECT_EQ(raw.value().stdout_data, "3\n");
    EXPECT_EQ(sb->info().execution_count, 1);
    EXPECT_TRUE(file_exists(sb->work_dir() + "/main.sh"));
}

TEST_F(ProcessSandboxTest, NonZeroExitAndStderr) {
    auto sb = make();
    auto raw = sb->run(request("echo oops >&2\nexit 3\n"), ctx);
    ASSERT_TRUE(raw.ok());
    EXPECT_EQ(raw.value().kind, RunStatus::EXITED);
    EXPECT_EQ(raw.value().exit_code, 3);
    EXPECT_EQ(raw.value().stderr_data, "oops\n");
}

TEST_F(ProcessSandboxTest, WallClockLimit) {
    auto sb = make();
    auto raw = sb->run(request("while :; do :; done\n", "", 200), ctx);
    ASSERT_TRUE(raw.ok());
    EXPECT_EQ(raw.value().kind, RunStatus::TIME_LIMIT);
    EXPECT_GE(raw.value().wall_time_ms, 200);
    EXPECT_LT(raw.value().wall_time_ms, 3000);
}

TEST_F(ProcessSandboxTest, CancelStopsRun) {
    auto sb = make();
    std::thread canceller([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        ctx.cancel();
    });
    auto raw = sb->run(request("while :; do :; done\n", "", 10000), ctx);
    canceller.join();
    ASSERT_TRUE(raw.ok());
    EXPECT_EQ(raw.value().kind, RunStatus::CANCELLED);
}

TEST_F(ProcessSandboxTest, DestroyRemovesDirectory) {
    auto sb = make("doomed");
    ASSERT_TRUE(sb->run(request("echo hi\n"), ctx).ok());
    std::string dir = scratch + "/doomed";
    EXPECT_TRUE(file_exists(dir));

    sb->destroy();
    EXPECT_FALSE(file_exists(dir));
    EXPECT_EQ(sb->status(), SandboxStatus::TERMINATED);

    auto raw = sb->run(request("echo hi\n"), ctx);
    ASSERT_TRUE(raw.is_error());
    EXPECT_EQ(raw.error().code(), ErrorCode::SANDBOX_TERMINATED);
    EXPECT_TRUE(sb->provision().is_error());
}

TEST_F(ProcessSandboxTest, MissingToolchainFailsProvision) {
    auto plugin = YamlLanguagePlugin::from_yaml(yaml::parse_yaml(
        "language:\n"
        "  id: ghost\n"
        "runtime:\n"
        "  command: /nonexistent/bin/ghost\n"));
    ASSERT_TRUE(plugin.ok());
    ProcessSandbox sb("ghost-box", SandboxKind::EPHEMERAL, plugin.value(),
                      std::make_shared<IsolationProfile>(IsolationProfile::relaxed("ghost")), scratch);
    auto provisioned = sb.provision();
    ASSERT_TRUE(provisioned.is_error());
    EXPECT_EQ(provisioned.error().code(), ErrorCode::COMPILER_NOT_FOUND);
}

TEST_F(ProcessSandboxTest, PythonFromShippedConfig) {
    LanguageRegistry registry;
    ASSERT_TRUE(load_languages_from_directory(std::string(SJ_CONFIG_DIR) + "/languages", registry).ok());
    auto python = registry.get("python");
    if (!is_executable(python->toolchain_binary())) {
        GTEST_SKIP() << python->toolchain_binary() << " not installed";
    }
    ProcessSandbox sb("py", SandboxKind::WARM, python,
                      std::make_shared<IsolationProfile>(IsolationProfile::relaxed("python")), scratch);
    ASSERT_TRUE(sb.provision().ok());

    RunRequest req{"a, b = map(int, input().split())\nprint(a + b)\n", "20 22\n",
                   python->adjust_limits(ResourceLimits(2000, 512 * MiB))};
    auto raw = sb.run(req, ctx);
    ASSERT_TRUE(raw.ok()) << raw.error().to_string();
    EXPECT_EQ(raw.value().exit_code, 0);
    EXPECT_EQ(raw.value().stdout_data, "42\n");

    // 同一个预热沙箱可以连续运行
    req.input = "1 1\n";
    raw = sb.run(req, ctx);
    ASSERT_TRUE(raw.ok());
    EXPECT_EQ(raw.value().stdout_data, "2\n");
}

// 测试：python 死循环在题目给的 1000ms 处被截停，不按语言放宽
TEST_F(ProcessSandboxTest, PythonBusyLoopStopsAtConfiguredLimit) {
    LanguageRegistry registry;
    ASSERT_TRUE(load_languages_from_directory(std::string(SJ_CONFIG_DIR) + "/languages", registry).ok());
    auto python = registry.get("python");
    if (!is_executable(python->toolchain_binary())) {
        GTEST_SKIP() << python->toolchain_binary() << " not installed";
    }
    ProcessSandbox sb("py-loop", SandboxKind::EPHEMERAL, python,
                      std::make_shared<IsolationProfile>(IsolationProfile::relaxed("python")), scratch);
    ASSERT_TRUE(sb.provision().ok());

    RunRequest req{"while True:\n    pass\n", "", python->adjust_limits(ResourceLimits(1000, 256 * MiB))};
    EXPECT_EQ(req.limits.time_limit_ms, 1000);
    auto raw = sb.run(req, ctx);
    ASSERT_TRUE(raw.ok()) << raw.error().to_string();
    EXPECT_EQ(raw.value().kind, RunStatus::TIME_LIMIT);
    EXPECT_GE(raw.value().wall_time_ms, 1000);
    EXPECT_LE(raw.value().wall_time_ms, 1500);
}
