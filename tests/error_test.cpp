/**
 * @file error_test.cpp
 * @brief Result / Error 与错误传播宏
 */

#include <gtest/gtest.h>

#include "core/error.h"

using namespace sj;

namespace {

Result<int> parse_positive(int v) {
    SJ_ENSURE(v > 0, ErrorCode::VALIDATION_ERROR, "not positive");
    return v;
}

Result<int> doubled(int v) {
    SJ_TRY_UNWRAP(x, parse_positive(v));
    return x * 2;
}

Result<int> load_value(int v, const std::string &source) {
    SJ_TRY_UNWRAP_CTX(x, doubled(v), source);
    return x;
}

Result<void> check_all(const std::vector<int> &values) {
    for (int v : values) {
        SJ_TRY(parse_positive(v));
    }
    return Ok();
}

} // namespace

TEST(ResultTest, HoldsValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.ok());
    EXPECT_FALSE(r.is_error());
    EXPECT_EQ(r.value(), 42);
    EXPECT_EQ(r.value_or(0), 42);
}

TEST(ResultTest, HoldsError) {
    Result<int> r = Err<int>(ErrorCode::FILE_NOT_FOUND, "missing");
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().code(), ErrorCode::FILE_NOT_FOUND);
    EXPECT_EQ(r.error().message(), "missing");
    EXPECT_EQ(r.value_or(7), 7);
    EXPECT_THROW(r.unwrap(), std::runtime_error);
}

// 测试：宏把内层错误原样传出
TEST(ResultTest, MacrosPropagate) {
    auto ok = doubled(3);
    ASSERT_TRUE(ok.ok());
    EXPECT_EQ(ok.value(), 6);

    auto err = doubled(-1);
    ASSERT_TRUE(err.is_error());
    EXPECT_EQ(err.error().code(), ErrorCode::VALIDATION_ERROR);
    EXPECT_GT(err.error().line(), 0);

    EXPECT_TRUE(check_all({1, 2, 3}).ok());
    EXPECT_EQ(check_all({1, 0, 3}).error().code(), ErrorCode::VALIDATION_ERROR);
}

TEST(ErrorTest, ToStringIncludesCodeAndContext) {
    Error e(ErrorCode::CONFIG_INVALID_VALUE, "workers.max: 0");
    e.with_context("engine.yaml");
    std::string s = e.to_string();
    EXPECT_NE(s.find("CONFIG_INVALID_VALUE"), std::string::npos);
    EXPECT_NE(s.find("workers.max"), std::string::npos);
    EXPECT_NE(s.find("engine.yaml"), std::string::npos);
    EXPECT_TRUE(static_cast<bool>(e));
    EXPECT_FALSE(static_cast<bool>(Error()));
}

// 测试：上下文由内向外串起来
TEST(ErrorTest, ContextChain) {
    auto r = load_value(-2, "a.yaml");
    ASSERT_TRUE(r.is_error());
    r.error().with_context("problems/");
    ASSERT_EQ(r.error().contexts().size(), 2u);
    EXPECT_EQ(r.error().contexts()[0], "a.yaml");
    EXPECT_NE(r.error().to_string().find("(in a.yaml <- problems/)"), std::string::npos);
    EXPECT_EQ(load_value(4, "a.yaml").value(), 8);
}

TEST(ErrorTest, CodeNames) {
    EXPECT_STREQ(error_code_str(ErrorCode::PROVISION_FAILED), "PROVISION_FAILED");
    EXPECT_STREQ(error_code_str(ErrorCode::QUEUE_CLOSED), "QUEUE_CLOSED");
    EXPECT_STREQ(error_code_str(ErrorCode::UNKNOWN_ERROR), "UNKNOWN_ERROR");
    EXPECT_STREQ(error_group_str(ErrorCode::SANDBOX_TERMINATED), "sandbox");
    EXPECT_STREQ(error_group_str(ErrorCode::QUEUE_CLOSED), "submission");
    EXPECT_STREQ(error_group_str(ErrorCode::PIPE_FAILED), "system");
}
