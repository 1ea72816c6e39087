/**
 * @file seccomp.h
 * @brief seccomp-bpf 白名单
 *
 * 程序在 fork 之前编译好，子进程里只调用 install()，不再分配内存。
 *
 *   [arch != 本机 -> KILL]
 *   ld nr
 *   [x86_64: nr >= X32 位 -> KILL]
 *   (jeq nr_i ? 下一条 : 跳过一条 ; ret ALLOW) * n
 *   ret <违规动作>
 *
 * 每个允许的调用两条指令，跳转偏移恒为 0/1，白名单再长也不会超出 8 位跳转范围。
 */

#ifndef SJ_SANDBOX_SECCOMP_H
#define SJ_SANDBOX_SECCOMP_H

#include <vector>
#include <set>
#include <cstdint>
#include <cstddef>
#include <cerrno>

#include <sys/prctl.h>
#include <sys/syscall.h>
#include <linux/seccomp.h>
#include <linux/filter.h>
#include <linux/audit.h>

#include "core/syscall_policy.h"

namespace sj {
namespace sandbox {

/// 白名单外的调用怎么处理
enum class SeccompAction {
    KILL,       ///< 杀死进程，父进程看到 SIGSYS
    TRAP,       ///< 发 SIGSYS，进程可捕获
    ERRNO,      ///< 调用失败并返回 errno
    LOG,        ///< 只记内核审计日志
    ALLOW
};

struct FilterOptions {
    SeccompAction on_violation = SeccompAction::KILL;
    int errno_value = EPERM;
    bool check_arch = true;
};

namespace bpf {

inline sock_filter load_field(uint32_t offset) {
    return sock_filter{BPF_LD | BPF_W | BPF_ABS, 0, 0, offset};
}

inline sock_filter jump_if_eq(uint32_t k, uint8_t jt, uint8_t jf) {
    return sock_filter{BPF_JMP | BPF_JEQ | BPF_K, jt, jf, k};
}

inline sock_filter jump_if_ge(uint32_t k, uint8_t jt, uint8_t jf) {
    return sock_filter{BPF_JMP | BPF_JGE | BPF_K, jt, jf, k};
}

inline sock_filter ret(uint32_t value) {
    return sock_filter{BPF_RET | BPF_K, 0, 0, value};
}

} // namespace bpf

class SeccompFilter {
private:
#if defined(__x86_64__)
    static constexpr uint32_t HOST_ARCH = AUDIT_ARCH_X86_64;
    static constexpr bool X32_GUARD = true;
#elif defined(__aarch64__)
    static constexpr uint32_t HOST_ARCH = AUDIT_ARCH_AARCH64;
    static constexpr bool X32_GUARD = false;
#else
    #error "seccomp filter: unsupported architecture"
#endif
    static constexpr uint32_t X32_BIT = 0x40000000;

    std::set<int> allowed_;
    FilterOptions options_;
    std::vector<sock_filter> program_;

    uint32_t violation_value() const {
        switch (options_.on_violation) {
            case SeccompAction::KILL:  return SECCOMP_RET_KILL_PROCESS;
            case SeccompAction::TRAP:  return SECCOMP_RET_TRAP;
            case SeccompAction::ERRNO: return SECCOMP_RET_ERRNO | (static_cast<uint32_t>(options_.errno_value) & SECCOMP_RET_DATA);
            case SeccompAction::LOG:   return SECCOMP_RET_LOG;
            case SeccompAction::ALLOW: return SECCOMP_RET_ALLOW;
        }
        return SECCOMP_RET_KILL_PROCESS;
    }

    void emit() {
        program_.clear();
        program_.reserve(header_size(options_.check_arch) + allowed_.size() * 2 + 1);
        if (options_.check_arch) {
            program_.push_back(bpf::load_field(offsetof(struct seccomp_data, arch)));
            program_.push_back(bpf::jump_if_eq(HOST_ARCH, 1, 0));
            program_.push_back(bpf::ret(SECCOMP_RET_KILL_PROCESS));
        }
        program_.push_back(bpf::load_field(offsetof(struct seccomp_data, nr)));
        if (X32_GUARD) {
            program_.push_back(bpf::jump_if_ge(X32_BIT, 0, 1));
            program_.push_back(bpf::ret(SECCOMP_RET_KILL_PROCESS));
        }
        for (int nr : allowed_) {
            program_.push_back(bpf::jump_if_eq(static_cast<uint32_t>(nr), 0, 1));
            program_.push_back(bpf::ret(SECCOMP_RET_ALLOW));
        }
        program_.push_back(bpf::ret(violation_value()));
    }

    SeccompFilter(std::set<int> allowed, FilterOptions options)
        : allowed_(std::move(allowed)), options_(options) {
        emit();
    }

public:
    /// 白名单之前的固定指令数
    static constexpr size_t header_size(bool check_arch) {
        return (check_arch ? 3 : 0) + 1 + (X32_GUARD ? 2 : 0);
    }

    static SeccompFilter compile(const std::set<int> &allowed, const FilterOptions &options = FilterOptions()) {
        return SeccompFilter(allowed, options);
    }

    static SeccompFilter compile(const SyscallPolicy &policy, const FilterOptions &options = FilterOptions()) {
        return SeccompFilter(policy.allowed, options);
    }

    /**
     * @brief 给当前进程装上过滤器（先置 no_new_privs）
     * @return 0 成功，否则为 errno
     */
    int install() const {
        if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) < 0) {
            return errno;
        }
        sock_fprog prog;
        prog.len = static_cast<unsigned short>(program_.size());
        prog.filter = const_cast<sock_filter*>(program_.data());
        if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog) < 0) {
            return errno;
        }
        return 0;
    }

    size_t instruction_count() const { return program_.size(); }
    size_t allowed_count() const { return allowed_.size(); }
    bool permits(int nr) const { return allowed_.count(nr) > 0; }
};

} // namespace sandbox
} // namespace sj

#endif // SJ_SANDBOX_SECCOMP_H
