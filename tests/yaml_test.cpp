/**
 * @file yaml_test.cpp
 * @brief YAML 解析器
 */

#include <gtest/gtest.h>

#include "core/yaml_config.h"

using namespace sj;

TEST(YamlTest, ScalarsAndPaths) {
    auto root = yaml::parse_yaml(R"(
name: sandjudge      # 注释
workers:
  min: 2
  ratio: 0.75
  strict: yes
  empty: ~
)");
    ASSERT_TRUE(root->is_map());
    EXPECT_EQ(root->str_at("name"), "sandjudge");
    EXPECT_EQ(root->int_at("workers.min"), 2);
    EXPECT_DOUBLE_EQ(root->double_at("workers.ratio"), 0.75);
    EXPECT_TRUE(root->bool_at("workers.strict"));
    EXPECT_TRUE((*root)["workers.empty"]->is_null());
    EXPECT_EQ(root->str_at("workers.empty", "dflt"), "dflt");
    EXPECT_EQ(root->int_at("workers.missing", 9), 9);
    EXPECT_EQ((*root)["nope.deeper"], nullptr);
}

TEST(YamlTest, Lists) {
    auto root = yaml::parse_yaml(R"(
flow: [a, b, "c d"]
block:
  - one
  - 2
maps:
  - id: x
    value: 1
  - id: y
    value: 2
)");
    EXPECT_EQ(root->get("flow")->as_string_list(), (std::vector<std::string>{"a", "b", "c d"}));
    auto block = root->get("block");
    ASSERT_TRUE(block->is_list());
    EXPECT_EQ(block->get(size_t(0))->as_string(), "one");
    EXPECT_EQ(block->get(size_t(1))->as_int(), 2);

    auto maps = root->get("maps")->as_list();
    ASSERT_EQ(maps.size(), 2u);
    EXPECT_EQ(maps[1]->str_at("id"), "y");
    EXPECT_EQ(maps[1]->int_at("value"), 2);
}

// 测试：单引号原样保留反斜杠，双引号处理转义
TEST(YamlTest, QuotedStrings) {
    auto root = yaml::parse_yaml(
        "raw: '\\bfor\\b'\n"
        "escaped: \"a\\tb\"\n"
        "hash: 'x # not a comment'\n"
        "placeholder: \"{program}\"\n");
    EXPECT_EQ(root->str_at("raw"), "\\bfor\\b");
    EXPECT_EQ(root->str_at("escaped"), "a\tb");
    EXPECT_EQ(root->str_at("hash"), "x # not a comment");
    EXPECT_EQ(root->str_at("placeholder"), "{program}");
}

TEST(YamlTest, LiteralBlocks) {
    auto root = yaml::parse_yaml(R"(
cases:
  - input: |
      1 2

      3
    keep: |-
      no newline
  - input: |
      x
)");
    auto cases = root->get("cases")->as_list();
    ASSERT_EQ(cases.size(), 2u);
    EXPECT_EQ(cases[0]->str_at("input"), "1 2\n\n3\n");
    EXPECT_EQ(cases[0]->str_at("keep"), "no newline");
    EXPECT_EQ(cases[1]->str_at("input"), "x\n");
}

// 测试：流式列表里引号内的逗号不切分
TEST(YamlTest, FlowListKeepsQuotedCommas) {
    auto root = yaml::parse_yaml("args: [\"a, b\", c]\nlimits: {time: 1000, memory: 64}\n");
    EXPECT_EQ(root->get("args")->as_string_list(), (std::vector<std::string>{"a, b", "c"}));
    EXPECT_EQ(root->int_at("limits.memory"), 64);
}

TEST(YamlTest, ParseErrorsCarryLineNumbers) {
    auto bad_key = yaml::YamlParser().parse("a: 1\njust text\n");
    ASSERT_TRUE(bad_key.is_error());
    EXPECT_EQ(bad_key.error().code(), ErrorCode::CONFIG_PARSE_ERROR);
    EXPECT_NE(bad_key.error().message().find("line 2"), std::string::npos);

    auto bad_indent = yaml::YamlParser().parse("a: 1\n    b: 2\n");
    ASSERT_TRUE(bad_indent.is_error());
    EXPECT_NE(bad_indent.error().message().find("indentation"), std::string::npos);

    auto tab = yaml::YamlParser().parse("a:\n\tb: 2\n");
    ASSERT_TRUE(tab.is_error());
    EXPECT_NE(tab.error().message().find("tab"), std::string::npos);

    EXPECT_THROW(yaml::parse_yaml("a: 1\njust text\n"), std::runtime_error);
    EXPECT_TRUE(yaml::parse_yaml("# only comments\n\n")->is_map());
}

TEST(YamlTest, MissingFile) {
    auto r = yaml::load_yaml("/nonexistent/sandjudge.yaml");
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().code(), ErrorCode::FILE_NOT_FOUND);
}

TEST(YamlTest, ShippedConfigsParse) {
    auto engine = yaml::load_yaml(std::string(SJ_CONFIG_DIR) + "/engine.yaml");
    ASSERT_TRUE(engine.ok()) << engine.error().to_string();
    EXPECT_EQ(engine.value()->int_at("workers.max_deliveries"), 2);

    auto heuristics = yaml::load_yaml(std::string(SJ_CONFIG_DIR) + "/heuristics.yaml");
    ASSERT_TRUE(heuristics.ok());
    EXPECT_TRUE(heuristics.value()->get("unsafe_patterns")->is_list());
}
