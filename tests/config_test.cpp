/**
 * @file config_test.cpp
 * @brief 引擎配置加载
 */

#include <gtest/gtest.h>

#include "core/config.h"

using namespace sj;

TEST(EngineConfigTest, ShippedConfigLoads) {
    auto cfg = EngineConfig::load(std::string(SJ_CONFIG_DIR) + "/engine.yaml");
    ASSERT_TRUE(cfg.ok()) << cfg.error().to_string();
    const EngineConfig &c = cfg.value();

    EXPECT_EQ(c.workers.min, 2);
    EXPECT_EQ(c.workers.max, 8);
    EXPECT_EQ(c.workers.max_deliveries, 2);
    EXPECT_EQ(c.pool.provision_attempts, 5);
    EXPECT_EQ(c.pool.backoff_initial_ms, 50);
    EXPECT_DOUBLE_EQ(c.pool.backoff_factor, 2.0);
    EXPECT_EQ(c.pool.idle_ttl_ms, 300000);
    EXPECT_TRUE(c.isolation.strict);
    EXPECT_EQ(c.custom_test_limits.time_limit_ms, 5000);
    EXPECT_EQ(c.custom_test_limits.memory_limit_bytes, 512 * MiB);
    EXPECT_EQ(c.custom_test_limits.cpu_quota, 50000);
    EXPECT_EQ(c.custom_test_limits.pids_limit, 50);
    EXPECT_EQ(c.notifications.channel_capacity, 1024u);
    EXPECT_EQ(c.retention.custom_test_ttl_ms, 600000);
    EXPECT_EQ(c.retention.max_custom_tests, 1024);

    // 相对路径以配置文件目录为基准
    EXPECT_EQ(c.paths.languages, std::string(SJ_CONFIG_DIR) + "/languages");
    EXPECT_EQ(c.paths.heuristics, std::string(SJ_CONFIG_DIR) + "/heuristics.yaml");
    EXPECT_EQ(c.paths.scratch_root, "/tmp/sandjudge/boxes");
}

TEST(EngineConfigTest, MissingKeysTakeDefaults) {
    auto cfg = EngineConfig::from_yaml(yaml::parse_yaml("log:\n  level: debug\n"));
    ASSERT_TRUE(cfg.ok());
    EXPECT_EQ(cfg.value().log.level, LogLevel::DEBUG);
    EXPECT_EQ(cfg.value().workers.max, 8);
    EXPECT_EQ(cfg.value().pool.max_idle_per_language, 4);
    EXPECT_EQ(cfg.value().isolation.tmpfs_size_bytes, 64 * MiB);
}

TEST(EngineConfigTest, MalformedValuesRejected) {
    const char *cases[] = {
        "workers:\n  min: 4\n  max: 2\n",
        "workers:\n  max: many\n",
        "workers:\n  max: 0\n",
        "pool:\n  backoff_factor: 0.5\n",
        "log:\n  level: loud\n",
        "notifications:\n  channel_capacity: 0\n",
        "retention:\n  max_custom_tests: -1\n",
    };
    for (const char *text : cases) {
        auto cfg = EngineConfig::from_yaml(yaml::parse_yaml(text));
        ASSERT_TRUE(cfg.is_error()) << text;
        EXPECT_EQ(cfg.error().code(), ErrorCode::CONFIG_INVALID_VALUE) << text;
    }
}

TEST(EngineConfigTest, MissingFile) {
    auto cfg = EngineConfig::load("/nonexistent/engine.yaml");
    ASSERT_TRUE(cfg.is_error());
    EXPECT_EQ(cfg.error().code(), ErrorCode::FILE_NOT_FOUND);
}
