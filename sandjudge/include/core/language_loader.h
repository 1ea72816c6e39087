/**
 * @file language_loader.h
 * @brief 从 YAML 文件加载语言配置
 *
 * 配置格式：
 *
 *   language:
 *     id: cpp
 *     display_name: C++17
 *     extensions: [cpp, cc]
 *     needs_compile: true
 *     source_name: main.cpp
 *   compiler:
 *     command: /usr/bin/g++
 *     args: ["-O2", "-std=c++17", "-o", "{output}", "{source}"]
 *     time_limit_ms: 30000
 *     memory_limit_bytes: 1073741824
 *   runtime:
 *     command: "{program}"
 *     max_processes: 1
 *   env:
 *     runtime:
 *       LANG: C.UTF-8
 *   syscall:
 *     runtime:
 *       allow: [brk, mmap]
 */

#ifndef SJ_CORE_LANGUAGE_LOADER_H
#define SJ_CORE_LANGUAGE_LOADER_H

#include "language.h"
#include "yaml_config.h"
#include "syscall_policy.h"
#include "utils.h"
#include "logger.h"

namespace sj {

/**
 * @brief YAML 配置驱动的语言插件
 */
class YamlLanguagePlugin : public LanguagePlugin {
private:
    std::string id_;
    std::string display_name_;
    std::vector<std::string> extensions_;
    std::string source_name_;
    bool needs_compile_ = false;

    // 编译配置
    std::string compiler_command_;
    std::vector<std::string> compiler_args_;
    ResourceLimits compiler_limits_ = limits::COMPILER;
    std::map<std::string, std::string> compile_env_;

    // 运行配置
    std::string runtime_command_;
    std::vector<std::string> runtime_args_;
    int max_processes_ = 1;
    std::map<std::string, std::string> runtime_env_;

    SyscallPolicy runtime_policy_;

    YamlLanguagePlugin() = default;

    static std::map<std::string, std::string> load_env(const yaml::YamlNodePtr &node) {
        std::map<std::string, std::string> env;
        if (!node) return env;
        for (const auto& kv : node->as_map()) {
            env[kv.first] = kv.second->as_string();
        }
        return env;
    }

public:
    /**
     * @brief 从配置节点构造，缺少必需字段或白名单含未知调用时返回错误
     */
    static Result<std::shared_ptr<YamlLanguagePlugin>> from_yaml(const yaml::YamlNodePtr &config) {
        auto lang = config ? config->get("language") : nullptr;
        if (!lang || !lang->is_map()) {
            return Err<std::shared_ptr<YamlLanguagePlugin>>(
                ErrorCode::CONFIG_MISSING_KEY, "Missing 'language' section");
        }

        std::shared_ptr<YamlLanguagePlugin> p(new YamlLanguagePlugin());
        p->id_ = lang->str_at("id");
        if (p->id_.empty()) {
            return Err<std::shared_ptr<YamlLanguagePlugin>>(
                ErrorCode::CONFIG_MISSING_KEY, "Missing language.id");
        }
        p->display_name_ = lang->str_at("display_name", p->id_);
        if (auto ext = lang->get("extensions")) {
            p->extensions_ = ext->as_string_list();
        }
        p->needs_compile_ = lang->bool_at("needs_compile", false);
        p->source_name_ = lang->str_at("source_name",
            "main." + (p->extensions_.empty() ? std::string("txt") : p->extensions_.front()));

        if (p->needs_compile_) {
            auto compiler = config->get("compiler");
            if (!compiler || compiler->str_at("command").empty()) {
                return Err<std::shared_ptr<YamlLanguagePlugin>>(
                    ErrorCode::CONFIG_MISSING_KEY, "Language " + p->id_ + " needs compiler.command");
            }
            p->compiler_command_ = compiler->str_at("command");
            if (auto args = compiler->get("args")) {
                p->compiler_args_ = args->as_string_list();
            }
            p->compiler_limits_.time_limit_ms =
                compiler->int_at("time_limit_ms", limits::COMPILER.time_limit_ms);
            p->compiler_limits_.memory_limit_bytes =
                compiler->int_at("memory_limit_bytes", limits::COMPILER.memory_limit_bytes);
            p->compiler_limits_.pids_limit =
                compiler->int_at("max_processes", limits::COMPILER.pids_limit);
        }

        auto runtime = config->get("runtime");
        if (!runtime || runtime->str_at("command").empty()) {
            return Err<std::shared_ptr<YamlLanguagePlugin>>(
                ErrorCode::CONFIG_MISSING_KEY, "Language " + p->id_ + " needs runtime.command");
        }
        p->runtime_command_ = runtime->str_at("command");
        if (auto args = runtime->get("args")) {
            p->runtime_args_ = args->as_string_list();
        }
        p->max_processes_ = static_cast<int>(runtime->int_at("max_processes", 1));
        if (p->max_processes_ < 0) {
            return Err<std::shared_ptr<YamlLanguagePlugin>>(
                ErrorCode::CONFIG_INVALID_VALUE, "Invalid runtime limits for " + p->id_);
        }

        if (auto env = config->get("env")) {
            p->compile_env_ = load_env(env->get("compile"));
            p->runtime_env_ = load_env(env->get("runtime"));
        }

        std::vector<std::string> extra;
        if (auto allow = (*config)["syscall.runtime.allow"]) {
            extra = allow->as_string_list();
        }
        SJ_TRY_UNWRAP_CTX(policy, build_runtime_policy(extra), "language " + p->id_);
        p->runtime_policy_ = std::move(policy);
        return p;
    }

    // LanguagePlugin 接口实现
    std::string id() const override { return id_; }
    std::string display_name() const override { return display_name_; }
    std::vector<std::string> file_extensions() const override { return extensions_; }
    std::string source_name() const override { return source_name_; }
    bool needs_compile() const override { return needs_compile_; }
    ResourceLimits compiler_limits() const override { return compiler_limits_; }
    SyscallPolicy runtime_policy() const override { return runtime_policy_; }
    int max_processes() const override { return max_processes_; }

    std::string toolchain_binary() const override {
        return needs_compile_ ? compiler_command_ : runtime_command_;
    }

    CommandLine compile_command(const std::string &source, const std::string &output) const override {
        CommandLine cmd;
        if (!needs_compile_) return cmd;
        cmd.argv.push_back(compiler_command_);
        for (const auto& arg : compiler_args_) {
            cmd.argv.push_back(replace_all(replace_all(arg, "{source}", source), "{output}", output));
        }
        cmd.env = compile_env_;
        return cmd;
    }

    CommandLine run_command(const std::string &program) const override {
        CommandLine cmd;
        cmd.argv.push_back(replace_all(runtime_command_, "{program}", program));
        for (const auto& arg : runtime_args_) {
            cmd.argv.push_back(replace_all(arg, "{program}", program));
        }
        cmd.env = runtime_env_;
        return cmd;
    }
};

/**
 * @brief 从目录加载所有语言配置
 *
 * 任何一个文件出错都返回错误。
 * @return 成功加载的语言数
 */
inline Result<size_t> load_languages_from_directory(const std::string& dir, LanguageRegistry& registry) {
    auto files = list_files(dir, ".yaml");
    if (files.empty()) {
        return Err<size_t>(ErrorCode::FILE_NOT_FOUND, "No language configs in " + dir);
    }
    size_t loaded = 0;
    for (const auto& file : files) {
        auto node = yaml::load_yaml(file);
        if (node.is_error()) {
            return Err<size_t>(node.error());
        }
        SJ_TRY_UNWRAP_CTX(plugin, YamlLanguagePlugin::from_yaml(node.value()), file);
        LOG_DEBUG << "Loaded language " << plugin->id() << " from " << file;
        registry.register_plugin(plugin);
        loaded++;
    }
    return loaded;
}

} // namespace sj

#endif // SJ_CORE_LANGUAGE_LOADER_H
