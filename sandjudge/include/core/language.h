/**
 * @file language.h
 * @brief 语言插件系统
 *
 * 定义语言插件接口和注册表。具体语言全部由 YAML 配置描述，
 * 见 language_loader.h。
 */

#ifndef SJ_CORE_LANGUAGE_H
#define SJ_CORE_LANGUAGE_H

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>

#include "core/types.h"
#include "core/syscall_policy.h"

namespace sj {

/**
 * @brief 一条待执行的命令（argv[0] 为可执行文件）
 */
struct CommandLine {
    std::vector<std::string> argv;
    std::map<std::string, std::string> env;

    const std::string& program() const { return argv.front(); }
    bool empty() const { return argv.empty(); }
};

/**
 * @brief 语言插件接口
 */
class LanguagePlugin {
public:
    virtual ~LanguagePlugin() = default;

    //==========================================================================
    // 基本信息
    //==========================================================================

    /// 语言标识符（如 "python", "cpp"）
    virtual std::string id() const = 0;

    virtual std::string display_name() const { return id(); }

    virtual std::vector<std::string> file_extensions() const = 0;

    /// 源文件在沙箱工作目录中的文件名（如 main.py）
    virtual std::string source_name() const = 0;

    //==========================================================================
    // 编译
    //==========================================================================

    virtual bool needs_compile() const { return false; }

    /// 编译命令，{source}/{output} 已替换
    virtual CommandLine compile_command(const std::string &source, const std::string &output) const {
        (void)source;
        (void)output;
        return {};
    }

    virtual ResourceLimits compiler_limits() const { return limits::COMPILER; }

    virtual SyscallPolicy compiler_policy() const { return get_compiler_policy(); }

    //==========================================================================
    // 运行
    //==========================================================================

    /// 运行命令，{program} 已替换为源文件（解释型）或编译产物
    virtual CommandLine run_command(const std::string &program) const = 0;

    /// 运行时 syscall 白名单
    virtual SyscallPolicy runtime_policy() const { return get_base_runtime_policy(); }

    /// 工具链可执行文件（provision 时检查存在）
    virtual std::string toolchain_binary() const = 0;

    /// 运行时允许的最大进程/线程数（node 之类的运行时需要多个线程）
    virtual int max_processes() const { return 1; }

    /**
     * @brief 按语言调整资源限制
     *
     * 只会抬高进程数下限；时间和内存限制原样保留，评测按题目配置的值判定。
     */
    virtual ResourceLimits adjust_limits(const ResourceLimits &base) const {
        ResourceLimits adjusted = base;
        if (max_processes() > 0 && adjusted.pids_limit < max_processes()) {
            adjusted.pids_limit = max_processes();
        }
        return adjusted;
    }
};

/**
 * @brief 语言注册表
 *
 * 管理所有注册的语言插件，读多写少。
 */
class LanguageRegistry {
private:
    std::map<std::string, std::shared_ptr<const LanguagePlugin>> plugins_;
    mutable std::mutex mutex_;

public:
    LanguageRegistry() = default;

    /// 进程级默认注册表
    static LanguageRegistry& instance() {
        static LanguageRegistry registry;
        return registry;
    }

    void register_plugin(std::shared_ptr<const LanguagePlugin> plugin) {
        std::lock_guard<std::mutex> lock(mutex_);
        plugins_[plugin->id()] = std::move(plugin);
    }

    template<typename T, typename... Args>
    void register_language(Args&&... args) {
        register_plugin(std::make_shared<T>(std::forward<Args>(args)...));
    }

    std::shared_ptr<const LanguagePlugin> get(const std::string &id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = plugins_.find(id);
        return (it != plugins_.end()) ? it->second : nullptr;
    }

    bool has(const std::string &id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return plugins_.find(id) != plugins_.end();
    }

    std::vector<std::string> list() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> result;
        for (const auto &kv : plugins_) {
            result.push_back(kv.first);
        }
        return result;
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return plugins_.size();
    }
};

} // namespace sj

#endif // SJ_CORE_LANGUAGE_H
