/**
 * @file isolation_profile.h
 * @brief 隔离配置（每种语言一份，构造后不可变）
 *
 * 由语言插件和 engine.yaml 的 isolation 段合成：
 *
 * isolation:
 *   strict: true
 *   use_namespace: true     # pid/net/ipc/uts/mount
 *   use_cgroup: true
 *   use_seccomp: true
 *   tmpfs_size_bytes: 67108864
 *   readonly_paths: [/bin, /lib, /lib64, /usr]
 */

#ifndef SJ_SANDBOX_ISOLATION_PROFILE_H
#define SJ_SANDBOX_ISOLATION_PROFILE_H

#include <string>
#include <vector>
#include <memory>
#include <sched.h>

#include "core/types.h"
#include "core/config.h"
#include "core/language.h"
#include "core/syscall_policy.h"

namespace sj {
namespace sandbox {

/**
 * @brief 命名空间类型
 */
enum class NamespaceType {
    NONE    = 0,
    PID     = CLONE_NEWPID,    ///< 进程 ID 命名空间
    MOUNT   = CLONE_NEWNS,     ///< 挂载命名空间
    NETWORK = CLONE_NEWNET,    ///< 网络命名空间
    UTS     = CLONE_NEWUTS,    ///< UTS 命名空间
    IPC     = CLONE_NEWIPC,    ///< IPC 命名空间
};

inline int operator|(NamespaceType a, NamespaceType b) {
    return static_cast<int>(a) | static_cast<int>(b);
}

inline int operator|(int a, NamespaceType b) {
    return a | static_cast<int>(b);
}

/**
 * @brief 文件系统策略
 *
 * 新根是一个带大小上限的 tmpfs，只读绑定系统目录，
 * 工作目录绑定到 /box，/tmp 是可写的临时区。
 */
struct FsPolicy {
    bool pivot_root = true;                   ///< 是否切换到最小根文件系统
    std::vector<std::string> readonly;        ///< 只读绑定挂载的宿主路径
    std::vector<std::string> devices = {"/dev/null", "/dev/zero", "/dev/urandom"};
    int64_t tmpfs_size_bytes = 64 * MiB;      ///< 新根 tmpfs 大小（含 /tmp）
    std::string box_dir = "/box";             ///< 工作目录在沙箱内的位置
};

/**
 * @brief 隔离配置
 */
struct IsolationProfile {
    std::string language;
    ResourceLimits default_limits;
    int64_t output_limit_bytes = 64 * MiB;

    FsPolicy fs;
    SyscallPolicy runtime_syscalls;
    SyscallPolicy compiler_syscalls;

    int namespace_flags = 0;
    bool use_cgroup = true;
    bool use_seccomp = true;
    bool strict = true;

    bool uses_pid_namespace() const { return (namespace_flags & CLONE_NEWPID) != 0; }
    bool uses_mount_namespace() const { return (namespace_flags & CLONE_NEWNS) != 0; }

    /**
     * @brief 不做任何隔离的配置（测试与本地调试用）
     */
    static IsolationProfile relaxed(const std::string &language) {
        IsolationProfile p;
        p.language = language;
        p.fs.pivot_root = false;
        p.namespace_flags = 0;
        p.use_cgroup = false;
        p.use_seccomp = false;
        p.strict = false;
        return p;
    }
};

using IsolationProfilePtr = std::shared_ptr<const IsolationProfile>;

/**
 * @brief 由语言插件与引擎隔离配置合成
 */
inline IsolationProfilePtr build_isolation_profile(const LanguagePlugin &lang,
                                                   const IsolationConfig &iso) {
    auto p = std::make_shared<IsolationProfile>();
    p->language = lang.id();
    p->default_limits = lang.adjust_limits(ResourceLimits());
    p->output_limit_bytes = iso.output_limit_bytes;

    p->fs.pivot_root = iso.use_namespace;
    p->fs.readonly = iso.readonly_paths;
    p->fs.tmpfs_size_bytes = iso.tmpfs_size_bytes;

    p->runtime_syscalls = lang.runtime_policy();
    p->compiler_syscalls = lang.compiler_policy();

    if (iso.use_namespace) {
        p->namespace_flags = NamespaceType::PID | NamespaceType::MOUNT |
                             NamespaceType::NETWORK | NamespaceType::IPC | NamespaceType::UTS;
    }
    p->use_cgroup = iso.use_cgroup;
    p->use_seccomp = iso.use_seccomp;
    p->strict = iso.strict;
    return p;
}

} // namespace sandbox
} // namespace sj

#endif // SJ_SANDBOX_ISOLATION_PROFILE_H
