/**
 * @file syscall_map.h
 * @brief 统一的 syscall 名称与编号映射
 *
 * 语言配置里的 seccomp 白名单按名称书写，加载时统一在这里解析；
 * 违规审计时再反查名称。
 */

#ifndef SJ_CORE_SYSCALL_MAP_H
#define SJ_CORE_SYSCALL_MAP_H

#include <string>
#include <map>
#include <set>
#include <vector>
#include <sys/syscall.h>

#include "error.h"

namespace sj {

/**
 * @brief Syscall 名称到编号的映射（只包含当前架构存在的调用）
 */
class SyscallMap {
public:
    static SyscallMap& instance() {
        static SyscallMap inst;
        return inst;
    }

    /**
     * @return syscall 编号，未知返回 -1
     */
    int name_to_nr(const std::string& name) const {
        auto it = by_name_.find(name);
        return it != by_name_.end() ? it->second : -1;
    }

    /**
     * @return syscall 名称，未知返回 "syscall#<nr>"
     */
    std::string nr_to_name(int nr) const {
        auto it = by_nr_.find(nr);
        if (it != by_nr_.end()) return it->second;
        return "syscall#" + std::to_string(nr);
    }

    /**
     * @brief 批量解析名称，任何未知名称都视为配置错误
     */
    Result<std::set<int>> resolve(const std::vector<std::string>& names) const {
        std::set<int> out;
        std::vector<std::string> unknown;
        for (const auto& name : names) {
            int nr = name_to_nr(name);
            if (nr < 0) {
                unknown.push_back(name);
            } else {
                out.insert(nr);
            }
        }
        if (!unknown.empty()) {
            std::string list;
            for (const auto& u : unknown) {
                if (!list.empty()) list += ", ";
                list += u;
            }
            return Err<std::set<int>>(ErrorCode::CONFIG_INVALID_VALUE,
                                      "Unknown syscall(s) for this architecture: " + list);
        }
        return out;
    }

    size_t size() const { return by_name_.size(); }

private:
    void add(const char* name, int nr) {
        by_name_[name] = nr;
        by_nr_[nr] = name;
    }

#define SJ_SYSCALL(name) add(#name, __NR_##name)

    SyscallMap() {
        // 文件 I/O
        SJ_SYSCALL(read);
        SJ_SYSCALL(write);
        SJ_SYSCALL(close);
        SJ_SYSCALL(openat);
        SJ_SYSCALL(fstat);
        SJ_SYSCALL(newfstatat);
        SJ_SYSCALL(statx);
        SJ_SYSCALL(faccessat);
#ifdef __NR_faccessat2
        SJ_SYSCALL(faccessat2);
#endif
        SJ_SYSCALL(readlinkat);
        SJ_SYSCALL(getdents64);
        SJ_SYSCALL(lseek);
        SJ_SYSCALL(pread64);
        SJ_SYSCALL(pwrite64);
        SJ_SYSCALL(readv);
        SJ_SYSCALL(writev);
        SJ_SYSCALL(dup);
        SJ_SYSCALL(dup3);
        SJ_SYSCALL(pipe2);
        SJ_SYSCALL(fcntl);
        SJ_SYSCALL(flock);
        SJ_SYSCALL(fsync);
        SJ_SYSCALL(fdatasync);
        SJ_SYSCALL(ftruncate);
        SJ_SYSCALL(unlinkat);
        SJ_SYSCALL(renameat);
        SJ_SYSCALL(mkdirat);
        SJ_SYSCALL(getcwd);
        SJ_SYSCALL(chdir);
        SJ_SYSCALL(fchdir);
        SJ_SYSCALL(fchmod);
        SJ_SYSCALL(umask);
        SJ_SYSCALL(statfs);
        SJ_SYSCALL(fstatfs);
#ifdef __NR_renameat2
        SJ_SYSCALL(renameat2);
#endif
#ifdef __NR_copy_file_range
        SJ_SYSCALL(copy_file_range);
#endif
#ifdef __NR_memfd_create
        SJ_SYSCALL(memfd_create);
#endif
        // x86 上的旧式调用，aarch64 不存在
#ifdef __NR_open
        SJ_SYSCALL(open);
        SJ_SYSCALL(stat);
        SJ_SYSCALL(lstat);
        SJ_SYSCALL(access);
        SJ_SYSCALL(readlink);
        SJ_SYSCALL(getdents);
        SJ_SYSCALL(dup2);
        SJ_SYSCALL(pipe);
        SJ_SYSCALL(unlink);
        SJ_SYSCALL(rename);
        SJ_SYSCALL(mkdir);
        SJ_SYSCALL(rmdir);
        SJ_SYSCALL(chmod);
        SJ_SYSCALL(poll);
        SJ_SYSCALL(select);
        SJ_SYSCALL(fork);
        SJ_SYSCALL(vfork);
        SJ_SYSCALL(epoll_create);
        SJ_SYSCALL(epoll_wait);
        SJ_SYSCALL(time);
        SJ_SYSCALL(arch_prctl);
#endif

        // 内存管理
        SJ_SYSCALL(mmap);
        SJ_SYSCALL(mprotect);
        SJ_SYSCALL(munmap);
        SJ_SYSCALL(brk);
        SJ_SYSCALL(mremap);
        SJ_SYSCALL(madvise);
        SJ_SYSCALL(msync);
        SJ_SYSCALL(mincore);

        // 进程控制
        SJ_SYSCALL(clone);
#ifdef __NR_clone3
        SJ_SYSCALL(clone3);
#endif
        SJ_SYSCALL(execve);
#ifdef __NR_execveat
        SJ_SYSCALL(execveat);
#endif
        SJ_SYSCALL(exit);
        SJ_SYSCALL(exit_group);
        SJ_SYSCALL(wait4);
        SJ_SYSCALL(waitid);
        SJ_SYSCALL(kill);
        SJ_SYSCALL(tkill);
        SJ_SYSCALL(tgkill);
        SJ_SYSCALL(getpid);
        SJ_SYSCALL(gettid);
        SJ_SYSCALL(getppid);
        SJ_SYSCALL(getpgid);
        SJ_SYSCALL(setpgid);
        SJ_SYSCALL(setsid);

        // 用户/组 ID
        SJ_SYSCALL(getuid);
        SJ_SYSCALL(geteuid);
        SJ_SYSCALL(getgid);
        SJ_SYSCALL(getegid);
        SJ_SYSCALL(getresuid);
        SJ_SYSCALL(getresgid);
        SJ_SYSCALL(getgroups);

        // 信号
        SJ_SYSCALL(rt_sigaction);
        SJ_SYSCALL(rt_sigprocmask);
        SJ_SYSCALL(rt_sigreturn);
        SJ_SYSCALL(rt_sigpending);
        SJ_SYSCALL(rt_sigsuspend);
        SJ_SYSCALL(sigaltstack);
        SJ_SYSCALL(restart_syscall);

        // 时间
        SJ_SYSCALL(gettimeofday);
        SJ_SYSCALL(clock_gettime);
        SJ_SYSCALL(clock_getres);
        SJ_SYSCALL(clock_nanosleep);
        SJ_SYSCALL(nanosleep);
        SJ_SYSCALL(times);

        // 系统信息与资源
        SJ_SYSCALL(uname);
        SJ_SYSCALL(sysinfo);
        SJ_SYSCALL(getrlimit);
        SJ_SYSCALL(setrlimit);
        SJ_SYSCALL(prlimit64);
        SJ_SYSCALL(getrusage);
        SJ_SYSCALL(prctl);
        SJ_SYSCALL(getrandom);
        SJ_SYSCALL(membarrier);

        // 同步与调度
        SJ_SYSCALL(futex);
        SJ_SYSCALL(set_tid_address);
        SJ_SYSCALL(set_robust_list);
        SJ_SYSCALL(get_robust_list);
        SJ_SYSCALL(sched_yield);
        SJ_SYSCALL(sched_getaffinity);
        SJ_SYSCALL(sched_setaffinity);
        SJ_SYSCALL(sched_getparam);
        SJ_SYSCALL(sched_getscheduler);
#ifdef __NR_rseq
        SJ_SYSCALL(rseq);
#endif

        // 事件与多路复用
        SJ_SYSCALL(ppoll);
        SJ_SYSCALL(pselect6);
        SJ_SYSCALL(epoll_create1);
        SJ_SYSCALL(epoll_ctl);
        SJ_SYSCALL(epoll_pwait);
#ifdef __NR_epoll_pwait2
        SJ_SYSCALL(epoll_pwait2);
#endif
        SJ_SYSCALL(eventfd2);
        SJ_SYSCALL(ioctl);
        SJ_SYSCALL(io_uring_setup);
        SJ_SYSCALL(io_uring_enter);
        SJ_SYSCALL(io_uring_register);

        // 网络（白名单中一般不出现，保留用于审计名称反查）
        SJ_SYSCALL(socket);
        SJ_SYSCALL(socketpair);
        SJ_SYSCALL(connect);
        SJ_SYSCALL(accept);
        SJ_SYSCALL(accept4);
        SJ_SYSCALL(bind);
        SJ_SYSCALL(listen);
        SJ_SYSCALL(sendto);
        SJ_SYSCALL(recvfrom);
        SJ_SYSCALL(sendmsg);
        SJ_SYSCALL(recvmsg);
        SJ_SYSCALL(shutdown);
        SJ_SYSCALL(getsockname);
        SJ_SYSCALL(getpeername);
        SJ_SYSCALL(setsockopt);
        SJ_SYSCALL(getsockopt);

        // 特权操作（同上，仅用于反查）
        SJ_SYSCALL(ptrace);
        SJ_SYSCALL(mount);
        SJ_SYSCALL(umount2);
        SJ_SYSCALL(pivot_root);
        SJ_SYSCALL(chroot);
        SJ_SYSCALL(unshare);
        SJ_SYSCALL(setns);
        SJ_SYSCALL(setuid);
        SJ_SYSCALL(setgid);
        SJ_SYSCALL(reboot);
        SJ_SYSCALL(init_module);
        SJ_SYSCALL(bpf);
    }

#undef SJ_SYSCALL

    std::map<std::string, int> by_name_;
    std::map<int, std::string> by_nr_;
};

inline int syscall_name_to_nr(const std::string& name) {
    return SyscallMap::instance().name_to_nr(name);
}

inline std::string syscall_nr_to_name(int nr) {
    return SyscallMap::instance().nr_to_name(nr);
}

} // namespace sj

#endif // SJ_CORE_SYSCALL_MAP_H
