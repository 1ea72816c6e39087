/**
 * @file store.h
 * @brief 提交持久化与题目目录
 */

#ifndef SJ_ENGINE_STORE_H
#define SJ_ENGINE_STORE_H

#include <string>
#include <map>
#include <mutex>
#include <memory>
#include <optional>

#include "core/error.h"
#include "core/types.h"
#include "core/utils.h"
#include "core/logger.h"
#include "core/yaml_config.h"

namespace sj {
namespace engine {

//==============================================================================
// 提交存储
//==============================================================================

/**
 * @brief 已结束的正式提交的存储（自定义测试不会写入）
 */
class SubmissionStore {
public:
    virtual ~SubmissionStore() = default;
    virtual Result<void> save(const Submission &submission) = 0;
    virtual std::optional<Submission> load(const std::string &id) const = 0;
    virtual size_t size() const = 0;
};

using SubmissionStorePtr = std::shared_ptr<SubmissionStore>;

class InMemorySubmissionStore : public SubmissionStore {
private:
    mutable std::mutex mutex_;
    std::map<std::string, Submission> items_;

public:
    Result<void> save(const Submission &submission) override {
        std::lock_guard<std::mutex> lock(mutex_);
        items_[submission.id] = submission;
        return Ok();
    }

    std::optional<Submission> load(const std::string &id) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = items_.find(id);
        if (it == items_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    size_t size() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }
};

//==============================================================================
// 题目目录
//==============================================================================

class ProblemCatalog {
public:
    virtual ~ProblemCatalog() = default;
    virtual std::shared_ptr<const Problem> find(const std::string &id) const = 0;
};

using ProblemCatalogPtr = std::shared_ptr<ProblemCatalog>;

/**
 * @brief 从 YAML 文件加载题目
 *
 * 文件格式：
 *
 *   id: a-plus-b
 *   title: A + B
 *   time_limit_ms: 1000
 *   memory_limit_bytes: 268435456
 *   supported_languages: [python, cpp]
 *   comparison:
 *     ignore_empty_lines: false
 *   test_cases:
 *     - id: "1"
 *       input: |
 *         1 2
 *       expected_output: |
 *         3
 *   hidden_test_cases:
 *     - ...
 */
class YamlProblemCatalog : public ProblemCatalog {
private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<const Problem>> problems_;

    static Result<void> read_cases(const yaml::YamlNodePtr &root, const std::string &key,
                                   const Problem &problem, bool hidden,
                                   std::vector<TestCase> &out) {
        auto list = root->get(key);
        if (!list || list->is_null()) {
            return Ok();
        }
        if (!list->is_list()) {
            return SJ_ERROR(ErrorCode::CONFIG_INVALID_VALUE, key + " must be a list");
        }
        size_t index = 0;
        for (const auto &item : list->as_list()) {
            index++;
            if (!item || !item->is_map()) {
                return SJ_ERROR(ErrorCode::CONFIG_INVALID_VALUE, key + " item must be a map");
            }
            if (!item->has("expected_output")) {
                return SJ_ERROR(ErrorCode::CONFIG_MISSING_KEY,
                                key + "[" + std::to_string(index) + "].expected_output");
            }
            TestCase tc;
            tc.id = item->str_at("id", (hidden ? "hidden-" : "") + std::to_string(index));
            tc.input = item->str_at("input");
            tc.expected_output = item->str_at("expected_output");
            tc.time_limit_ms = item->int_at("time_limit_ms", problem.time_limit_ms);
            tc.memory_limit_bytes = item->int_at("memory_limit_bytes", problem.memory_limit_bytes);
            tc.is_hidden = hidden;
            out.push_back(std::move(tc));
        }
        return Ok();
    }

public:
    /**
     * @brief 解析单个题目
     */
    static Result<Problem> parse(const yaml::YamlNodePtr &root) {
        if (!root || !root->is_map()) {
            return SJ_ERROR(ErrorCode::CONFIG_PARSE_ERROR, "Problem file must be a map");
        }
        Problem p;
        p.id = root->str_at("id");
        if (p.id.empty()) {
            return SJ_ERROR(ErrorCode::CONFIG_MISSING_KEY, "id");
        }
        p.title = root->str_at("title", p.id);
        p.time_limit_ms = root->int_at("time_limit_ms", p.time_limit_ms);
        p.memory_limit_bytes = root->int_at("memory_limit_bytes", p.memory_limit_bytes);
        if (p.time_limit_ms <= 0 || p.memory_limit_bytes <= 0) {
            return SJ_ERROR(ErrorCode::CONFIG_INVALID_VALUE, "Problem " + p.id + " has non-positive limits");
        }
        if (auto langs = root->get("supported_languages")) {
            p.supported_languages = langs->as_string_list();
        }
        p.comparison_mode.trim_whitespace =
            root->bool_at("comparison.trim_whitespace", p.comparison_mode.trim_whitespace);
        p.comparison_mode.ignore_trailing_spaces =
            root->bool_at("comparison.ignore_trailing_spaces", p.comparison_mode.ignore_trailing_spaces);
        p.comparison_mode.ignore_empty_lines =
            root->bool_at("comparison.ignore_empty_lines", p.comparison_mode.ignore_empty_lines);

        SJ_TRY(read_cases(root, "test_cases", p, false, p.test_cases));
        SJ_TRY(read_cases(root, "hidden_test_cases", p, true, p.hidden_test_cases));
        if (p.test_cases.empty() && p.hidden_test_cases.empty()) {
            return SJ_ERROR(ErrorCode::CONFIG_INVALID_VALUE, "Problem " + p.id + " has no test cases");
        }
        return p;
    }

    void add(Problem problem) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string id = problem.id;
        problems_[id] = std::make_shared<const Problem>(std::move(problem));
    }

    /**
     * @brief 加载目录下所有 .yaml 文件
     * @return 加载的题目数
     */
    Result<size_t> load_directory(const std::string &dir) {
        auto files = list_files(dir, ".yaml");
        if (files.empty()) {
            return Err<size_t>(ErrorCode::FILE_NOT_FOUND, "No problem files in " + dir);
        }
        for (const auto &file : files) {
            auto node = yaml::load_yaml(file);
            if (node.is_error()) {
                return Err<size_t>(node.error());
            }
            SJ_TRY_UNWRAP_CTX(problem, parse(node.value()), file);
            LOG_DEBUG << "Loaded problem " << problem.id << " from " << file;
            add(std::move(problem));
        }
        return files.size();
    }

    std::shared_ptr<const Problem> find(const std::string &id) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = problems_.find(id);
        return it != problems_.end() ? it->second : nullptr;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return problems_.size();
    }
};

} // namespace engine
} // namespace sj

#endif // SJ_ENGINE_STORE_H
