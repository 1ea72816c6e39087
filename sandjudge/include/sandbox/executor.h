/**
 * @file executor.h
 * @brief 进程执行器：fork + 隔离 + 等待 + 资源统计
 *
 * 进程结构（启用 PID 命名空间时）：
 *
 *   engine ──fork──> init（新进程组，unshare）──fork──> 用户程序（PID 1）
 *
 * 父进程在子进程开始之前把它加入本次运行的 cgroup，然后以 1ms 间隔轮询
 * wait4，同时检查截止时间、取消令牌和 cgroup 事件。子进程的准备步骤失败时
 * 通过 CLOEXEC 管道把 (阶段, errno) 报告给父进程。
 */

#ifndef SJ_SANDBOX_EXECUTOR_H
#define SJ_SANDBOX_EXECUTOR_H

#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <atomic>
#include <thread>
#include <cstring>
#include <climits>
#include <optional>

#include <unistd.h>
#include <sys/wait.h>
#include <sys/mount.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <sys/prctl.h>
#include <signal.h>
#include <fcntl.h>
#include <errno.h>
#include <sched.h>

#include "core/error.h"
#include "core/types.h"
#include "core/utils.h"
#include "core/language.h"
#include "core/engine_logger.h"
#include "sandbox/cgroup.h"
#include "sandbox/seccomp.h"
#include "sandbox/run_context.h"
#include "sandbox/isolation_profile.h"

namespace sj {
namespace sandbox {

//==============================================================================
// 执行描述
//==============================================================================

/**
 * @brief 一次执行的完整描述
 *
 * 所有路径都是宿主路径。命令中的程序路径相对于工作目录，
 * 因此启用与不启用 pivot_root 时命令行相同。
 */
struct ExecSpec {
    CommandLine command;
    std::string work_dir;         ///< 宿主工作目录（沙箱内为 /box）
    std::string root_dir;         ///< 新根挂载点，pivot_root 时使用
    bool work_writable = false;   ///< 编译阶段需要写产物

    std::string stdin_path;
    std::string stdout_path;
    std::string stderr_path;

    ResourceLimits limits;
    int64_t output_limit_bytes = 64 * MiB;
    bool compile_step = false;    ///< 使用编译器 syscall 白名单

    IsolationProfilePtr profile;
};

/**
 * @brief 子进程准备阶段（用于错误报告）
 */
enum class SetupStage : int32_t {
    UNSHARE = 1,
    MOUNT_PRIVATE,
    NEW_ROOT,
    MOUNT_PROC,
    CHDIR,
    IO_REDIRECT,
    RLIMIT,
    SECCOMP,
    FORK,
    EXEC
};

inline const char* setup_stage_str(SetupStage stage) {
    switch (stage) {
        case SetupStage::UNSHARE:       return "unshare";
        case SetupStage::MOUNT_PRIVATE: return "mount-private";
        case SetupStage::NEW_ROOT:      return "new-root";
        case SetupStage::MOUNT_PROC:    return "mount-proc";
        case SetupStage::CHDIR:         return "chdir";
        case SetupStage::IO_REDIRECT:   return "io-redirect";
        case SetupStage::RLIMIT:        return "rlimit";
        case SetupStage::SECCOMP:       return "seccomp";
        case SetupStage::FORK:          return "fork";
        case SetupStage::EXEC:          return "exec";
        default: return "unknown";
    }
}

/**
 * @brief 子进程通过错误管道写回的记录
 */
struct ChildReport {
    int32_t stage;
    int32_t err;
    int32_t fatal;
};

//==============================================================================
// 执行器
//==============================================================================

class Executor {
private:
    /**
     * @brief 一个绑定挂载（fork 之前在父进程中准备好，子进程中不再分配内存）
     */
    struct BindMount {
        std::string source;
        std::string target;
        bool is_dir = true;
        bool is_link = false;
        std::string link_target;
        bool readonly = true;
    };

    /**
     * @brief 子进程需要的全部数据
     */
    struct ChildPlan {
        int ns_flags = 0;
        bool pivot = false;
        bool mount_proc = false;
        bool strict = true;

        std::string root_dir;
        std::string tmpfs_opts;
        std::vector<std::string> mkdirs;     ///< 按顺序创建的目录
        std::vector<BindMount> binds;
        std::string box_target;              ///< <root>/box
        std::string tmp_target;              ///< <root>/tmp
        std::string proc_target;             ///< <root>/proc
        std::string chdir_path;

        std::string stdin_path;
        std::string stdout_path;
        std::string stderr_path;

        rlim_t cpu_seconds = 0;
        rlim_t address_space = 0;            ///< 0 表示不限制（cgroup 接管内存）
        rlim_t stack_bytes = 0;
        rlim_t fsize_bytes = 0;

        const SeccompFilter *filter = nullptr;

        std::vector<std::string> argv_storage;
        std::vector<std::string> env_storage;
        std::vector<const char*> argv;
        std::vector<const char*> envp;

        int report_fd = -1;
    };

    static std::atomic<uint64_t> run_counter_;

    //==========================================================================
    // 子进程侧
    //==========================================================================

    static void report(const ChildPlan &plan, SetupStage stage, int err, bool fatal) {
        ChildReport r{static_cast<int32_t>(stage), err, fatal ? 1 : 0};
        ssize_t n = write(plan.report_fd, &r, sizeof(r));
        (void)n;
    }

    /// 准备失败：严格模式下终止，否则记录后继续
    static bool setup_failed(const ChildPlan &plan, SetupStage stage, int err) {
        report(plan, stage, err, plan.strict);
        if (plan.strict) {
            _exit(127);
        }
        return false;
    }

    static bool bind_one(const BindMount &b) {
        if (b.is_link) {
            return symlink(b.link_target.c_str(), b.target.c_str()) == 0 || errno == EEXIST;
        }
        if (b.is_dir) {
            if (mkdir(b.target.c_str(), 0755) != 0 && errno != EEXIST) return false;
        } else {
            int fd = open(b.target.c_str(), O_CREAT | O_RDONLY | O_CLOEXEC, 0644);
            if (fd < 0) return false;
            close(fd);
        }
        if (mount(b.source.c_str(), b.target.c_str(), nullptr, MS_BIND | MS_REC, nullptr) != 0) {
            return false;
        }
        if (b.readonly) {
            if (mount(nullptr, b.target.c_str(), nullptr,
                      MS_BIND | MS_REMOUNT | MS_RDONLY | MS_NOSUID, nullptr) != 0) {
                return false;
            }
        }
        return true;
    }

    /**
     * @brief 在 tmpfs 上搭建最小根文件系统并 pivot_root
     */
    static bool setup_new_root(const ChildPlan &plan) {
        if (mount("tmpfs", plan.root_dir.c_str(), "tmpfs", MS_NOSUID | MS_NODEV,
                  plan.tmpfs_opts.c_str()) != 0) {
            return false;
        }
        for (const auto &dir : plan.mkdirs) {
            if (mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) return false;
        }
        chmod(plan.tmp_target.c_str(), 01777);

        for (const auto &b : plan.binds) {
            if (!bind_one(b)) return false;
        }

        if (syscall(__NR_pivot_root, plan.root_dir.c_str(), plan.root_dir.c_str()) == 0) {
            umount2("/", MNT_DETACH);
        } else if (chroot(plan.root_dir.c_str()) != 0) {
            return false;
        }
        return chdir("/") == 0;
    }

    static void apply_rlimits(const ChildPlan &plan) {
        struct rlimit rl;

        rl.rlim_cur = plan.cpu_seconds;
        rl.rlim_max = plan.cpu_seconds + 1;
        if (setrlimit(RLIMIT_CPU, &rl) != 0) setup_failed(plan, SetupStage::RLIMIT, errno);

        if (plan.address_space > 0) {
            rl.rlim_cur = rl.rlim_max = plan.address_space;
            if (setrlimit(RLIMIT_AS, &rl) != 0) setup_failed(plan, SetupStage::RLIMIT, errno);
        }

        rl.rlim_cur = rl.rlim_max = plan.stack_bytes;
        if (setrlimit(RLIMIT_STACK, &rl) != 0) setup_failed(plan, SetupStage::RLIMIT, errno);

        rl.rlim_cur = rl.rlim_max = plan.fsize_bytes;
        if (setrlimit(RLIMIT_FSIZE, &rl) != 0) setup_failed(plan, SetupStage::RLIMIT, errno);

        rl.rlim_cur = rl.rlim_max = 0;
        setrlimit(RLIMIT_CORE, &rl);
    }

    /**
     * @brief 用户程序进程：文件系统、重定向、rlimit、seccomp、execve
     */
    [[noreturn]] static void exec_program(const ChildPlan &plan, bool fs_isolated) {
        // 宿主路径必须在切换根之前打开
        int in_fd = open(plan.stdin_path.empty() ? "/dev/null" : plan.stdin_path.c_str(), O_RDONLY);
        int out_fd = open(plan.stdout_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        int err_fd = open(plan.stderr_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        if (in_fd < 0 || out_fd < 0 || err_fd < 0) {
            report(plan, SetupStage::IO_REDIRECT, errno, true);
            _exit(127);
        }

        bool rooted = false;
        if (fs_isolated && plan.pivot) {
            if (setup_new_root(plan)) {
                rooted = true;
            } else {
                setup_failed(plan, SetupStage::NEW_ROOT, errno);
            }
        }
        if (rooted && plan.mount_proc) {
            if (mount("proc", "/proc", "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC | MS_RDONLY, nullptr) != 0) {
                report(plan, SetupStage::MOUNT_PROC, errno, false);
            }
        }
        if (fs_isolated) {
            sethostname("sandbox", 7);
        }

        const char *dir = rooted ? "/box" : plan.chdir_path.c_str();
        if (chdir(dir) != 0) {
            report(plan, SetupStage::CHDIR, errno, true);
            _exit(127);
        }

        if (dup2(in_fd, STDIN_FILENO) < 0 || dup2(out_fd, STDOUT_FILENO) < 0 ||
            dup2(err_fd, STDERR_FILENO) < 0) {
            report(plan, SetupStage::IO_REDIRECT, errno, true);
            _exit(127);
        }
        close(in_fd);
        close(out_fd);
        close(err_fd);

        apply_rlimits(plan);

        // 注意：从这里开始不能再有白名单外的调用（write 报告管道除外）
        if (plan.filter) {
            int rc = plan.filter->install();
            if (rc != 0) {
                setup_failed(plan, SetupStage::SECCOMP, rc);
            }
        }

        execve(plan.argv[0], const_cast<char* const*>(plan.argv.data()),
               const_cast<char* const*>(plan.envp.data()));
        report(plan, SetupStage::EXEC, errno, true);
        _exit(127);
    }

    /**
     * @brief 沙箱 init 进程
     *
     * 建立新进程组与命名空间。启用 PID 命名空间时再 fork 一次，
     * 由孙进程成为命名空间内的 PID 1，本进程等待并转发退出状态。
     */
    [[noreturn]] static void child_main(const ChildPlan &plan, int sync_fd) {
        setpgid(0, 0);
        prctl(PR_SET_PDEATHSIG, SIGKILL);

        char buf;
        ssize_t n;
        do {
            n = read(sync_fd, &buf, 1);
        } while (n < 0 && errno == EINTR);
        close(sync_fd);
        if (n != 1) {
            _exit(127);
        }

        bool isolated = false;
        if (plan.ns_flags != 0) {
            if (unshare(plan.ns_flags) == 0) {
                isolated = true;
            } else {
                setup_failed(plan, SetupStage::UNSHARE, errno);
            }
        }
        if (isolated && (plan.ns_flags & CLONE_NEWNS)) {
            if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) {
                setup_failed(plan, SetupStage::MOUNT_PRIVATE, errno);
                isolated = false;
            }
        }

        if (!isolated || !(plan.ns_flags & CLONE_NEWPID)) {
            exec_program(plan, isolated);
        }

        pid_t pid = fork();
        if (pid < 0) {
            report(plan, SetupStage::FORK, errno, true);
            _exit(127);
        }
        if (pid == 0) {
            prctl(PR_SET_PDEATHSIG, SIGKILL);
            exec_program(plan, true);
        }

        close(plan.report_fd);

        int status = 0;
        while (waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) _exit(127);
        }
        if (WIFEXITED(status)) {
            _exit(WEXITSTATUS(status));
        }
        int sig = WIFSIGNALED(status) ? WTERMSIG(status) : SIGKILL;
        struct rlimit no_core = {0, 0};
        setrlimit(RLIMIT_CORE, &no_core);
        signal(sig, SIG_DFL);
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, sig);
        sigprocmask(SIG_UNBLOCK, &set, nullptr);
        kill(getpid(), sig);
        _exit(128 + sig);
    }

    //==========================================================================
    // 父进程侧
    //==========================================================================

    static std::string parent_of(const std::string &path) {
        size_t slash = path.find_last_of('/');
        if (slash == std::string::npos || slash == 0) return "";
        return path.substr(0, slash);
    }

    /**
     * @brief 把 path 的各级父目录（位于 root 之下）按顺序加入 mkdirs
     */
    static void add_parents(ChildPlan &plan, const std::string &target) {
        std::vector<std::string> chain;
        for (std::string p = parent_of(target); p.size() > plan.root_dir.size(); p = parent_of(p)) {
            chain.push_back(p);
        }
        for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
            plan.mkdirs.push_back(*it);
        }
    }

    static void add_bind(ChildPlan &plan, const std::string &source,
                         const std::string &target, bool readonly) {
        struct stat lst;
        if (lstat(source.c_str(), &lst) != 0) {
            return;  // 宿主上不存在，跳过
        }
        BindMount b;
        b.source = source;
        b.target = target;
        b.readonly = readonly;
        add_parents(plan, target);
        if (S_ISLNK(lst.st_mode)) {
            char link[PATH_MAX];
            ssize_t len = readlink(source.c_str(), link, sizeof(link) - 1);
            if (len <= 0) return;
            link[len] = '\0';
            b.is_link = true;
            b.link_target = link;
        } else {
            b.is_dir = S_ISDIR(lst.st_mode);
        }
        plan.binds.push_back(std::move(b));
    }

    static ChildPlan make_plan(const ExecSpec &spec, bool cgroup_active) {
        const IsolationProfile &profile = *spec.profile;
        ChildPlan plan;
        plan.ns_flags = profile.namespace_flags;
        plan.pivot = profile.fs.pivot_root && profile.uses_mount_namespace() && !spec.root_dir.empty();
        plan.mount_proc = profile.uses_pid_namespace();
        plan.strict = profile.strict;
        plan.chdir_path = spec.work_dir;

        if (plan.pivot) {
            plan.root_dir = spec.root_dir;
            plan.tmpfs_opts = "size=" + std::to_string(profile.fs.tmpfs_size_bytes);
            plan.box_target = plan.root_dir + profile.fs.box_dir;
            plan.tmp_target = plan.root_dir + "/tmp";
            plan.proc_target = plan.root_dir + "/proc";
            plan.mkdirs = {plan.box_target, plan.tmp_target, plan.proc_target, plan.root_dir + "/dev"};

            for (const auto &path : profile.fs.readonly) {
                add_bind(plan, path, plan.root_dir + path, true);
            }
            for (const auto &dev : profile.fs.devices) {
                add_bind(plan, dev, plan.root_dir + dev, false);
            }
            BindMount box;
            box.source = spec.work_dir;
            box.target = plan.box_target;
            box.readonly = !spec.work_writable;
            plan.binds.push_back(box);
        }

        plan.stdin_path = spec.stdin_path;
        plan.stdout_path = spec.stdout_path;
        plan.stderr_path = spec.stderr_path;

        const ResourceLimits &rl = spec.limits;
        plan.cpu_seconds = static_cast<rlim_t>((rl.time_limit_ms + 999) / 1000 + 1);
        plan.address_space = cgroup_active ? 0 : static_cast<rlim_t>(rl.memory_limit_bytes) * 2;
        plan.stack_bytes = static_cast<rlim_t>(rl.memory_limit_bytes);
        plan.fsize_bytes = static_cast<rlim_t>(spec.output_limit_bytes);

        plan.argv_storage = spec.command.argv;
        for (const auto &kv : spec.command.env) {
            plan.env_storage.push_back(kv.first + "=" + kv.second);
        }
        if (spec.command.env.find("PATH") == spec.command.env.end()) {
            plan.env_storage.push_back("PATH=/usr/bin:/bin");
        }
        if (spec.command.env.find("HOME") == spec.command.env.end()) {
            plan.env_storage.push_back("HOME=/tmp");
        }
        for (const auto &a : plan.argv_storage) plan.argv.push_back(a.c_str());
        plan.argv.push_back(nullptr);
        for (const auto &e : plan.env_storage) plan.envp.push_back(e.c_str());
        plan.envp.push_back(nullptr);
        return plan;
    }

    /**
     * @brief 为本次运行建立 cgroup；严格模式下失败即返回错误
     */
    static Result<std::unique_ptr<RunCgroup>> make_cgroup(const ExecSpec &spec) {
        using Ptr = std::unique_ptr<RunCgroup>;
        if (!spec.profile->use_cgroup) {
            return Ptr();
        }
        auto fail = [&spec](const Error &err) -> Result<Ptr> {
            if (spec.profile->strict) {
                return Error(ErrorCode::ISOLATION_UNAVAILABLE, err.message());
            }
            SLOG_WARN << "Running without cgroup: " << err.message();
            return Ptr();
        };

        auto ready = CgroupHierarchy::instance().setup();
        if (ready.is_error()) {
            return fail(ready.error());
        }
        std::string name = "run-" + std::to_string(getpid()) + "-" + std::to_string(++run_counter_);
        auto cg = RunCgroup::open(CgroupHierarchy::instance().run_parent(), name, CgroupLimits::from(spec.limits));
        if (cg.is_error()) {
            return fail(cg.error());
        }
        return std::move(cg).value();
    }

    static void kill_tree(pid_t pid, RunCgroup *cgroup) {
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
        if (cgroup) {
            auto r = cgroup->kill_all();
            if (r.is_error()) {
                SLOG_TRACE << "cgroup.kill unavailable: " << r.error().message();
            }
        }
    }

    /**
     * @brief 读取子进程报告；返回第一个致命错误
     */
    static std::optional<Error> drain_reports(int fd, const ExecSpec &spec) {
        std::optional<Error> fatal;
        ChildReport r;
        while (read(fd, &r, sizeof(r)) == static_cast<ssize_t>(sizeof(r))) {
            SetupStage stage = static_cast<SetupStage>(r.stage);
            std::string what = std::string(setup_stage_str(stage)) + ": " + strerror(r.err);
            if (!r.fatal) {
                SLOG_WARN << "Isolation step skipped (" << what << ")";
                continue;
            }
            if (fatal) continue;
            ErrorCode code;
            switch (stage) {
                case SetupStage::EXEC:
                    code = ErrorCode::EXEC_FAILED;
                    what = "Cannot execute " + spec.command.program() + ": " + strerror(r.err);
                    break;
                case SetupStage::CHDIR:
                case SetupStage::IO_REDIRECT:
                case SetupStage::FORK:
                    code = ErrorCode::SYSTEM_ERROR;
                    break;
                default:
                    code = ErrorCode::ISOLATION_UNAVAILABLE;
            }
            fatal = SJ_ERROR(code, what);
        }
        return fatal;
    }

    static int64_t timeval_ms(const struct timeval &tv) {
        return static_cast<int64_t>(tv.tv_sec) * 1000 + tv.tv_usec / 1000;
    }

public:
    /**
     * @brief 执行一条命令
     * @param abort 额外的终止标志（沙箱被销毁时置位），可为空
     * @return 运行结果；只有基础设施失败（fork、隔离不可用、exec 失败）返回错误
     */
    static Result<RawResult> run(const ExecSpec &spec, RunContext &ctx,
                                 const std::atomic<bool> *abort = nullptr) {
        SJ_ENSURE(spec.profile != nullptr, ErrorCode::SYSTEM_ERROR, "ExecSpec without profile");
        SJ_ENSURE(!spec.command.empty(), ErrorCode::EXEC_FAILED, "Empty command");

        RawResult result;
        if (ctx.cancelled()) {
            result.kind = RunStatus::CANCELLED;
            return result;
        }

        SJ_TRY_UNWRAP(cgroup, make_cgroup(spec));

        ChildPlan plan = make_plan(spec, cgroup != nullptr);
        std::unique_ptr<SeccompFilter> filter;
        if (spec.profile->use_seccomp) {
            filter = std::make_unique<SeccompFilter>(SeccompFilter::compile(
                spec.compile_step ? spec.profile->compiler_syscalls : spec.profile->runtime_syscalls));
            plan.filter = filter.get();
        }

        int sync_pipe[2];
        int report_pipe[2];
        if (pipe2(sync_pipe, O_CLOEXEC) < 0) {
            return SJ_ERROR(ErrorCode::PIPE_FAILED, std::string("pipe: ") + strerror(errno));
        }
        if (pipe2(report_pipe, O_CLOEXEC) < 0) {
            close(sync_pipe[0]);
            close(sync_pipe[1]);
            return SJ_ERROR(ErrorCode::PIPE_FAILED, std::string("pipe: ") + strerror(errno));
        }
        plan.report_fd = report_pipe[1];

        auto start = SteadyClock::now();
        pid_t pid = fork();
        if (pid < 0) {
            int err = errno;
            close(sync_pipe[0]);
            close(sync_pipe[1]);
            close(report_pipe[0]);
            close(report_pipe[1]);
            return SJ_ERROR(ErrorCode::FORK_FAILED, std::string("fork: ") + strerror(err));
        }

        if (pid == 0) {
            close(sync_pipe[1]);
            close(report_pipe[0]);
            child_main(plan, sync_pipe[0]);
        }

        close(sync_pipe[0]);
        close(report_pipe[1]);
        setpgid(pid, pid);

        if (cgroup) {
            auto added = cgroup->attach(pid);
            if (added.is_error()) {
                if (spec.profile->strict) {
                    kill(pid, SIGKILL);
                    close(sync_pipe[1]);
                    close(report_pipe[0]);
                    int st;
                    waitpid(pid, &st, 0);
                    return SJ_ERROR(ErrorCode::ISOLATION_UNAVAILABLE, added.error().message());
                }
                SLOG_WARN << "Cannot attach to cgroup: " << added.error().message();
                cgroup.reset();
            }
        }

        ssize_t w = write(sync_pipe[1], "x", 1);
        (void)w;
        close(sync_pipe[1]);

        auto deadline = start + std::chrono::milliseconds(spec.limits.time_limit_ms);
        if (ctx.deadline() && *ctx.deadline() < deadline) {
            deadline = *ctx.deadline();
        }

        int status = 0;
        struct rusage usage;
        memset(&usage, 0, sizeof(usage));
        std::optional<RunStatus> forced;
        uint64_t ticks = 0;

        while (true) {
            pid_t ret = wait4(pid, &status, WNOHANG, &usage);
            if (ret == pid) break;
            if (ret < 0) {
                if (errno == EINTR) continue;
                int err = errno;
                kill_tree(pid, cgroup.get());
                close(report_pipe[0]);
                return SJ_ERROR(ErrorCode::SYSTEM_ERROR, std::string("wait4: ") + strerror(err));
            }

            if (ctx.cancelled() || (abort && abort->load())) {
                forced = RunStatus::CANCELLED;
            } else if (SteadyClock::now() >= deadline) {
                forced = RunStatus::TIME_LIMIT;
            } else if (cgroup && ++ticks % 10 == 0) {
                CgroupUsage stats = cgroup->usage();
                if (stats.oom_kills > 0) {
                    forced = RunStatus::MEMORY_LIMIT;
                } else if (stats.pids_denied > 0) {
                    forced = RunStatus::PROCESS_LIMIT;
                }
            }

            if (forced) {
                kill_tree(pid, cgroup.get());
                while (wait4(pid, &status, 0, &usage) < 0 && errno == EINTR) {}
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }

        // 用户程序可能留下后台进程
        kill(-pid, SIGKILL);

        result.wall_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            SteadyClock::now() - start).count();

        int flags = fcntl(report_pipe[0], F_GETFL);
        fcntl(report_pipe[0], F_SETFL, flags | O_NONBLOCK);
        std::optional<Error> setup_error = drain_reports(report_pipe[0], spec);
        close(report_pipe[0]);
        if (setup_error && !forced) {
            return *setup_error;
        }

        result.cpu_time_ms = timeval_ms(usage.ru_utime) + timeval_ms(usage.ru_stime);
        result.peak_memory_bytes = static_cast<int64_t>(usage.ru_maxrss) * 1024;
        result.context_switches = usage.ru_nvcsw + usage.ru_nivcsw;
        result.page_faults = usage.ru_minflt + usage.ru_majflt;

        CgroupUsage stats;
        if (cgroup) {
            stats = cgroup->usage();
            if (stats.cpu_usec > 0) {
                result.cpu_time_ms = static_cast<int64_t>(stats.cpu_usec / 1000);
            }
            if (stats.memory_peak > 0) {
                result.peak_memory_bytes = static_cast<int64_t>(stats.memory_peak);
            }
            auto destroyed = cgroup->remove();
            if (destroyed.is_error()) {
                SLOG_WARN << destroyed.error().message();
            }
        }

        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.signal = WTERMSIG(status);
        }

        if (forced) {
            result.kind = *forced;
        } else if (stats.oom_kills > 0) {
            result.kind = RunStatus::MEMORY_LIMIT;
        } else if (stats.pids_denied > 0) {
            result.kind = RunStatus::PROCESS_LIMIT;
        } else if (WIFSIGNALED(status)) {
            switch (result.signal) {
                case SIGSYS:
                    result.kind = RunStatus::SYSCALL_VIOLATION;
                    break;
                case SIGXCPU:
                    result.kind = RunStatus::TIME_LIMIT;
                    break;
                case SIGKILL:
                    result.kind = result.cpu_time_ms >= spec.limits.time_limit_ms
                                      ? RunStatus::TIME_LIMIT : RunStatus::SIGNALED;
                    break;
                default:
                    result.kind = RunStatus::SIGNALED;
            }
        } else {
            result.kind = RunStatus::EXITED;
        }

        if (result.kind == RunStatus::EXITED && !cgroup &&
            result.peak_memory_bytes > spec.limits.memory_limit_bytes) {
            result.kind = RunStatus::MEMORY_LIMIT;
        }

        if (result.kind == RunStatus::SYSCALL_VIOLATION) {
            result.violation = Breach{"forbidden_syscall",
                                      "system call outside the allow-list (killed by SIGSYS)"};
        } else if (result.kind == RunStatus::PROCESS_LIMIT) {
            result.violation = Breach{"process_limit",
                                      "fork denied by pids limit " + std::to_string(spec.limits.pids_limit)};
        }

        size_t cap = static_cast<size_t>(spec.output_limit_bytes);
        result.stdout_data = read_file_prefix(spec.stdout_path, cap);
        result.stderr_data = read_file_prefix(spec.stderr_path, cap);

        SLOG_DEBUG << "pid " << pid << " " << run_status_str(result.kind)
                   << " exit=" << result.exit_code << " sig=" << result.signal
                   << " cpu=" << result.cpu_time_ms << "ms wall=" << result.wall_time_ms
                   << "ms mem=" << result.peak_memory_bytes;
        return result;
    }
};

inline std::atomic<uint64_t> Executor::run_counter_{0};

} // namespace sandbox
} // namespace sj

#endif // SJ_SANDBOX_EXECUTOR_H
