/**
 * @file strategy_router.h
 * @brief 执行策略路由
 *
 * analyze() 与 select_strategy() 都是纯函数：同样的输入总是得到同样的结果，
 * 不读时钟，不改状态。
 */

#ifndef SJ_ROUTER_STRATEGY_ROUTER_H
#define SJ_ROUTER_STRATEGY_ROUTER_H

#include <string>
#include <vector>
#include <set>
#include <sstream>
#include <cctype>
#include <algorithm>
#include <iterator>

#include "core/types.h"
#include "core/utils.h"
#include "core/engine_logger.h"
#include "router/heuristics.h"

namespace sj {
namespace router {

class StrategyRouter {
private:
    HeuristicsPtr table_;

    static bool is_ident_char(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
    }

    /**
     * @brief 统计 name 作为调用 (name 后跟可选空白与左括号) 出现的次数
     */
    static int count_calls(const std::string &line, const std::string &name) {
        int count = 0;
        size_t pos = 0;
        while ((pos = line.find(name, pos)) != std::string::npos) {
            size_t end = pos + name.size();
            bool left_ok = pos == 0 || !is_ident_char(line[pos - 1]);
            size_t k = end;
            while (k < line.size() && (line[k] == ' ' || line[k] == '\t')) k++;
            if (left_ok && k < line.size() && line[k] == '(' &&
                (end == line.size() || !is_ident_char(line[end]))) {
                count++;
            }
            pos = end;
        }
        return count;
    }

    static std::vector<std::string> split_lines(const std::string &code) {
        std::vector<std::string> lines;
        std::istringstream iss(code);
        std::string line;
        while (std::getline(iss, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    static void mark_unparseable(CodeAnalysis &a) {
        a.has_unsafe_operations = true;
        a.matched_rules.push_back("unparseable");
    }

public:
    explicit StrategyRouter(HeuristicsPtr table) : table_(std::move(table)) {}

    const HeuristicsTable& table() const { return *table_; }

    /**
     * @brief 静态分析代码
     *
     * 正则按行匹配。含 NUL 字节、非法 UTF-8 或超长行的代码无法分析，
     * 按不安全处理。
     */
    CodeAnalysis analyze(const std::string &code, const std::string &language) const {
        const HeuristicsTable &t = *table_;
        CodeAnalysis a;
        a.requires_compilation = t.compiled_languages.count(language) > 0;

        bool classifiable = code.find('\0') == std::string::npos && is_valid_utf8(code);
        std::vector<std::string> lines;
        if (classifiable) {
            lines = split_lines(code);
            for (const auto &line : lines) {
                if (line.size() > t.max_line_length) {
                    classifiable = false;
                    break;
                }
            }
        }

        if (!classifiable) {
            mark_unparseable(a);
        } else {
            std::set<std::string> functions;
            for (const auto &line : lines) {
                for (const auto &rule : t.unsafe_patterns) {
                    if (std::regex_search(line, rule.regex) &&
                        std::find(a.matched_rules.begin(), a.matched_rules.end(), rule.name) ==
                            a.matched_rules.end()) {
                        a.matched_rules.push_back(rule.name);
                        a.has_unsafe_operations = true;
                    }
                }
                auto begin = std::sregex_iterator(line.begin(), line.end(), t.loop_pattern.regex);
                a.loop_count += static_cast<int>(std::distance(begin, std::sregex_iterator()));

                for (const auto &def : t.function_definitions) {
                    for (auto it = std::sregex_iterator(line.begin(), line.end(), def.regex);
                         it != std::sregex_iterator(); ++it) {
                        if ((*it)[1].matched) {
                            functions.insert((*it)[1].str());
                        }
                    }
                }
            }

            // 每个函数的出现次数减去定义本身
            for (const auto &name : functions) {
                int calls = 0;
                for (const auto &line : lines) {
                    calls += count_calls(line, name);
                }
                if (calls > 1) {
                    a.recursion_count += calls - 1;
                }
            }
        }

        if (a.loop_count > t.high_loop_threshold || a.recursion_count > t.high_recursion_threshold) {
            a.complexity = Complexity::HIGH;
        } else if (a.loop_count > t.medium_loop_threshold) {
            a.complexity = Complexity::MEDIUM;
        } else {
            a.complexity = Complexity::LOW;
        }

        a.estimated_memory_bytes = static_cast<int64_t>(code.size()) * t.memory_per_char_bytes +
                                   a.loop_count * t.memory_per_loop_bytes;
        a.estimated_cpu_units = a.loop_count * t.cpu_per_loop + a.recursion_count * t.cpu_per_recursion;
        a.can_run_in_browser = t.browser_languages.count(language) > 0 && !a.has_unsafe_operations;
        return a;
    }

    /**
     * @brief 按优先级选择执行策略
     */
    ExecutionStrategy select_strategy(const CodeAnalysis &a, const SystemLoad &load) const {
        const HeuristicsTable &t = *table_;
        auto make = [](StrategyKind kind, const char *why, const StrategyCost &cost) {
            ExecutionStrategy s;
            s.kind = kind;
            s.rationale = why;
            s.estimated_cost_units = cost.cost_units;
            s.estimated_latency_ms = cost.latency_ms;
            return s;
        };

        if (a.can_run_in_browser && !a.has_unsafe_operations && a.complexity == Complexity::LOW &&
            a.estimated_memory_bytes < t.client_memory_limit_bytes) {
            return make(StrategyKind::CLIENT, "Safe, simple code suitable for browser execution", t.client);
        }
        if (a.can_run_in_browser && !a.has_unsafe_operations && load.server_load > t.overload_threshold) {
            return make(StrategyKind::CLIENT, "Server overloaded, routing to client-side", t.client_overload);
        }
        if (a.has_unsafe_operations || a.complexity == Complexity::HIGH) {
            return make(StrategyKind::SERVER, "Complex or unsafe code requires server-side isolation",
                        t.server_isolated);
        }
        if (a.complexity == Complexity::MEDIUM) {
            return make(StrategyKind::HYBRID, "Medium complexity, using pre-warmed sandboxes", t.hybrid);
        }
        return make(StrategyKind::SERVER, "Default server-side execution", t.server_default);
    }

    /**
     * @brief analyze + select_strategy，并记录路由日志
     */
    ExecutionStrategy route(const std::string &code, const std::string &language,
                            const SystemLoad &load, CodeAnalysis *analysis_out = nullptr) const {
        CodeAnalysis a = analyze(code, language);
        ExecutionStrategy s = select_strategy(a, load);
        RTLOG_INFO << language << " code routed to " << strategy_kind_str(s.kind)
                   << " (complexity=" << complexity_str(a.complexity)
                   << ", loops=" << a.loop_count << ", recursion=" << a.recursion_count
                   << ", rules=[" << join(a.matched_rules, ",") << "]): " << s.rationale;
        if (analysis_out) {
            *analysis_out = a;
        }
        return s;
    }
};

} // namespace router
} // namespace sj

#endif // SJ_ROUTER_STRATEGY_ROUTER_H
