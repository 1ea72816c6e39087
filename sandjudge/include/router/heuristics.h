/**
 * @file heuristics.h
 * @brief 路由启发式规则表（config/heuristics.yaml）
 *
 * 正则在加载时编译，非法表达式直接返回 CONFIG_INVALID_VALUE，
 * 分析阶段不会再遇到编译错误。
 */

#ifndef SJ_ROUTER_HEURISTICS_H
#define SJ_ROUTER_HEURISTICS_H

#include <string>
#include <vector>
#include <set>
#include <regex>
#include <memory>

#include "core/error.h"
#include "core/types.h"
#include "core/yaml_config.h"

namespace sj {
namespace router {

/**
 * @brief 一条命名的正则规则
 */
struct PatternRule {
    std::string name;
    std::string source;
    std::regex regex;
};

/**
 * @brief 某一策略的估算代价
 */
struct StrategyCost {
    double cost_units = 0.0;
    int64_t latency_ms = 0;
};

/**
 * @brief 启发式规则表
 */
struct HeuristicsTable {
    std::vector<PatternRule> unsafe_patterns;        ///< 不区分大小写
    PatternRule loop_pattern;
    std::vector<PatternRule> function_definitions;   ///< 第一个捕获组是函数名

    int high_loop_threshold = 5;
    int high_recursion_threshold = 2;
    int medium_loop_threshold = 2;

    int64_t memory_per_char_bytes = 100;
    int64_t memory_per_loop_bytes = 1 * MiB;
    int64_t cpu_per_loop = 100;
    int64_t cpu_per_recursion = 200;

    std::set<std::string> browser_languages = {"javascript", "python"};
    std::set<std::string> compiled_languages = {"cpp", "rust"};

    int64_t client_memory_limit_bytes = 100 * MiB;
    double overload_threshold = 0.8;
    size_t max_line_length = 4096;                   ///< 超长行视为无法分析

    StrategyCost client{0.0, 100};
    StrategyCost client_overload{0.0, 200};
    StrategyCost server_isolated{0.001, 2000};
    StrategyCost hybrid{0.0005, 1000};
    StrategyCost server_default{0.001, 2000};

    static Result<std::shared_ptr<const HeuristicsTable>> load(const std::string &path) {
        auto root = yaml::load_yaml(path);
        if (root.is_error()) {
            return root.error();
        }
        SJ_TRY_UNWRAP_CTX(table, from_yaml(root.value()), path);
        return std::shared_ptr<const HeuristicsTable>(std::make_shared<HeuristicsTable>(std::move(table)));
    }

    static Result<HeuristicsTable> from_yaml(const yaml::YamlNodePtr &root) {
        HeuristicsTable t;
        if (!root || !root->is_map()) {
            return SJ_ERROR(ErrorCode::CONFIG_PARSE_ERROR, "Heuristics table must be a map");
        }

        auto unsafe = root->get("unsafe_patterns");
        if (!unsafe || !unsafe->is_list() || unsafe->as_list().empty()) {
            return SJ_ERROR(ErrorCode::CONFIG_MISSING_KEY, "unsafe_patterns");
        }
        for (const auto &item : unsafe->as_list()) {
            SJ_TRY_UNWRAP(rule, compile_rule(item->str_at("name"), item->str_at("pattern"), true));
            t.unsafe_patterns.push_back(std::move(rule));
        }

        std::string loop = root->str_at("loop_pattern");
        if (loop.empty()) {
            return SJ_ERROR(ErrorCode::CONFIG_MISSING_KEY, "loop_pattern");
        }
        SJ_TRY_UNWRAP(loop_rule, compile_rule("loop", loop, false));
        t.loop_pattern = std::move(loop_rule);

        if (auto defs = root->get("function_definitions")) {
            for (const auto &src : defs->as_string_list()) {
                SJ_TRY_UNWRAP(rule, compile_rule("function", src, false));
                if (rule.regex.mark_count() < 1) {
                    return SJ_ERROR(ErrorCode::CONFIG_INVALID_VALUE,
                                    "function_definitions needs a capture group: " + src);
                }
                t.function_definitions.push_back(std::move(rule));
            }
        }

        t.high_loop_threshold = static_cast<int>(root->int_at("complexity.high_loops", t.high_loop_threshold));
        t.high_recursion_threshold =
            static_cast<int>(root->int_at("complexity.high_recursion", t.high_recursion_threshold));
        t.medium_loop_threshold =
            static_cast<int>(root->int_at("complexity.medium_loops", t.medium_loop_threshold));

        t.memory_per_char_bytes = root->int_at("estimates.memory_per_char_bytes", t.memory_per_char_bytes);
        t.memory_per_loop_bytes = root->int_at("estimates.memory_per_loop_bytes", t.memory_per_loop_bytes);
        t.cpu_per_loop = root->int_at("estimates.cpu_per_loop", t.cpu_per_loop);
        t.cpu_per_recursion = root->int_at("estimates.cpu_per_recursion", t.cpu_per_recursion);

        if (auto langs = root->get("browser_languages")) {
            auto v = langs->as_string_list();
            t.browser_languages = std::set<std::string>(v.begin(), v.end());
        }
        if (auto langs = root->get("compiled_languages")) {
            auto v = langs->as_string_list();
            t.compiled_languages = std::set<std::string>(v.begin(), v.end());
        }

        t.client_memory_limit_bytes = root->int_at("client_memory_limit_bytes", t.client_memory_limit_bytes);
        t.overload_threshold = root->double_at("overload_threshold", t.overload_threshold);
        t.max_line_length = static_cast<size_t>(
            root->int_at("max_line_length", static_cast<int64_t>(t.max_line_length)));
        if (t.overload_threshold < 0.0 || t.overload_threshold > 1.0 || t.max_line_length == 0) {
            return SJ_ERROR(ErrorCode::CONFIG_INVALID_VALUE, "overload_threshold / max_line_length");
        }

        read_cost(root, "strategies.client", t.client);
        read_cost(root, "strategies.client_overload", t.client_overload);
        read_cost(root, "strategies.server_isolated", t.server_isolated);
        read_cost(root, "strategies.hybrid", t.hybrid);
        read_cost(root, "strategies.server_default", t.server_default);
        return t;
    }

private:
    static Result<PatternRule> compile_rule(const std::string &name, const std::string &source,
                                            bool ignore_case) {
        if (name.empty() || source.empty()) {
            return SJ_ERROR(ErrorCode::CONFIG_MISSING_KEY, "Pattern rule needs name and pattern");
        }
        auto flags = std::regex::ECMAScript | std::regex::optimize;
        if (ignore_case) {
            flags |= std::regex::icase;
        }
        PatternRule rule;
        rule.name = name;
        rule.source = source;
        try {
            rule.regex = std::regex(source, flags);
        } catch (const std::regex_error &e) {
            return SJ_ERROR(ErrorCode::CONFIG_INVALID_VALUE,
                            "Invalid regex for " + name + " (" + source + "): " + e.what());
        }
        return rule;
    }

    static void read_cost(const yaml::YamlNodePtr &root, const std::string &key, StrategyCost &out) {
        out.cost_units = root->double_at(key + ".cost_units", out.cost_units);
        out.latency_ms = root->int_at(key + ".latency_ms", out.latency_ms);
    }
};

using HeuristicsPtr = std::shared_ptr<const HeuristicsTable>;

} // namespace router
} // namespace sj

#endif // SJ_ROUTER_HEURISTICS_H
