/**
 * @file syscall_policy.h
 * @brief Syscall 白名单策略
 *
 * 语言配置只需列出运行时额外需要的调用，基础集合在这里统一提供。
 * 未在白名单中的调用一律 KILL_PROCESS（默认拒绝）。
 */

#ifndef SJ_CORE_SYSCALL_POLICY_H
#define SJ_CORE_SYSCALL_POLICY_H

#include <string>
#include <vector>
#include <set>

#include "error.h"
#include "syscall_map.h"

namespace sj {

/**
 * @brief Syscall 白名单
 */
struct SyscallPolicy {
    std::set<int> allowed;

    SyscallPolicy& allow(int syscall_nr) {
        if (syscall_nr >= 0) allowed.insert(syscall_nr);
        return *this;
    }

    /// 按名称允许，当前架构不存在的调用忽略
    SyscallPolicy& allow(const std::string& name) {
        return allow(syscall_name_to_nr(name));
    }

    SyscallPolicy& allow(std::initializer_list<const char*> names) {
        for (const char* n : names) allow(std::string(n));
        return *this;
    }

    SyscallPolicy& merge(const SyscallPolicy& other) {
        allowed.insert(other.allowed.begin(), other.allowed.end());
        return *this;
    }

    bool permits(int syscall_nr) const { return allowed.count(syscall_nr) > 0; }
    bool empty() const { return allowed.empty(); }
};

/**
 * @brief 所有运行时共享的基础策略
 *
 * 过滤器在 execve 之前安装，所以 execve 本身必须在集合中。
 */
inline SyscallPolicy get_base_runtime_policy() {
    SyscallPolicy policy;

    policy.allow({"execve", "exit", "exit_group", "restart_syscall"});

    // 文件 I/O（只读打开由文件系统隔离兜底）
    policy.allow({"read", "write", "readv", "writev", "pread64", "close",
                  "open", "openat", "fstat", "stat", "lstat", "newfstatat", "statx",
                  "lseek", "access", "faccessat", "faccessat2",
                  "readlink", "readlinkat", "dup", "dup2", "dup3",
                  "fcntl", "ioctl", "getcwd"});

    // 内存管理
    policy.allow({"mmap", "mprotect", "munmap", "brk", "mremap", "madvise"});

    // 信号
    policy.allow({"rt_sigaction", "rt_sigprocmask", "rt_sigreturn", "sigaltstack"});

    // 进程信息与动态链接器
    policy.allow({"arch_prctl", "set_tid_address", "set_robust_list", "rseq",
                  "getpid", "gettid", "getuid", "geteuid", "getgid", "getegid",
                  "prlimit64", "getrlimit", "getrandom", "futex", "uname"});

    // 时间
    policy.allow({"clock_gettime", "clock_getres", "gettimeofday", "nanosleep",
                  "clock_nanosleep", "times"});

    return policy;
}

/**
 * @brief 编译器策略：需要 fork/exec 子进程（cc1、as、ld）以及写产物
 */
inline SyscallPolicy get_compiler_policy() {
    SyscallPolicy policy = get_base_runtime_policy();

    policy.allow({"clone", "clone3", "fork", "vfork", "execveat", "wait4", "waitid",
                  "kill", "tgkill", "getppid", "getpgid", "setpgid",
                  "pipe", "pipe2", "getdents", "getdents64", "chdir", "fchdir",
                  "umask", "rename", "renameat", "renameat2", "unlink", "unlinkat",
                  "mkdir", "mkdirat", "rmdir", "chmod", "fchmod", "ftruncate",
                  "flock", "fsync", "fdatasync", "statfs", "fstatfs",
                  "sched_getaffinity", "sched_yield", "sysinfo", "prctl",
                  "getrusage", "setrlimit", "poll", "ppoll", "select", "pselect6",
                  "epoll_create1", "epoll_ctl", "epoll_wait", "epoll_pwait",
                  "eventfd2", "membarrier", "copy_file_range", "memfd_create",
                  "pwrite64", "msync", "mincore", "rt_sigpending", "rt_sigsuspend",
                  "getresuid", "getresgid", "getgroups"});
    return policy;
}

/**
 * @brief 由基础策略与语言白名单（按名称）构造最终策略
 */
inline Result<SyscallPolicy> build_runtime_policy(const std::vector<std::string>& extra_names) {
    auto resolved = SyscallMap::instance().resolve(extra_names);
    if (resolved.is_error()) {
        return resolved.error();
    }
    SyscallPolicy policy = get_base_runtime_policy();
    policy.allowed.insert(resolved.value().begin(), resolved.value().end());
    return policy;
}

} // namespace sj

#endif // SJ_CORE_SYSCALL_POLICY_H
