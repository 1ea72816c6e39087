/**
 * @file cgroup.h
 * @brief cgroup v2：每次运行一个 cgroup
 *
 * 运行 cgroup 用完即删，memory.peak、memory.events、pids.events
 * 因此总是从零开始计数。
 *
 * 目录布局（cgroup v2 要求有子 cgroup 的节点本身不含进程）：
 *
 *   <base>/                 引擎启动时所在的 cgroup（或根）
 *   ├── engine/             引擎进程迁入这里
 *   └── sandbox/            所有运行 cgroup 的父节点
 *       └── run-<pid>-<n>/
 */

#ifndef SJ_SANDBOX_CGROUP_H
#define SJ_SANDBOX_CGROUP_H

#include <string>
#include <fstream>
#include <sstream>
#include <memory>
#include <mutex>
#include <cstdint>
#include <cstdlib>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/vfs.h>
#include <linux/magic.h>

#include "core/error.h"
#include "core/types.h"
#include "core/engine_logger.h"

namespace sj {
namespace sandbox {

/// 一次运行结束时（或轮询时）读到的用量
struct CgroupUsage {
    uint64_t memory_peak = 0;
    uint64_t oom_kills = 0;      ///< memory.events: oom_kill
    uint64_t cpu_usec = 0;       ///< cpu.stat: usage_usec
    uint64_t pids_denied = 0;    ///< pids.events: max，被拒绝的 fork 次数
};

struct CgroupLimits {
    uint64_t memory_max = 0;     ///< 0 表示不写
    uint64_t cpu_quota_usec = 0;
    uint64_t cpu_period_usec = limits::CPU_PERIOD_US;
    uint64_t pids_max = 0;

    static CgroupLimits from(const ResourceLimits &rl) {
        CgroupLimits l;
        l.memory_max = rl.memory_limit_bytes > 0 ? static_cast<uint64_t>(rl.memory_limit_bytes) : 0;
        l.cpu_quota_usec = rl.cpu_quota > 0 ? static_cast<uint64_t>(rl.cpu_quota) : 0;
        l.pids_max = rl.pids_limit > 0 ? static_cast<uint64_t>(rl.pids_limit) : 0;
        return l;
    }
};

namespace cgroupfs {

inline bool exists(const std::string &path) {
    return access(path.c_str(), F_OK) == 0;
}

inline Result<void> write_text(const std::string &path, const std::string &value) {
    std::ofstream out(path);
    if (!out) {
        return SJ_ERROR(ErrorCode::FILE_WRITE_ERROR, "Cannot open " + path + ": " + strerror(errno));
    }
    out << value;
    out.flush();
    if (!out) {
        return SJ_ERROR(ErrorCode::FILE_WRITE_ERROR, "Cannot write '" + value + "' to " + path);
    }
    return Ok();
}

inline std::string read_text(const std::string &path) {
    std::ifstream in(path);
    std::ostringstream oss;
    if (in) {
        oss << in.rdbuf();
    }
    return oss.str();
}

/**
 * @brief 读取 "key value" 每行一项的文件（memory.events、cpu.stat 等）中的一项
 */
inline uint64_t keyed_value(const std::string &path, const std::string &key) {
    std::istringstream lines(read_text(path));
    std::string k;
    uint64_t v;
    while (lines >> k >> v) {
        if (k == key) {
            return v;
        }
    }
    return 0;
}

/// 单值文件；"max" 视为 0
inline uint64_t single_value(const std::string &path) {
    std::string text = read_text(path);
    return std::strtoull(text.c_str(), nullptr, 10);
}

} // namespace cgroupfs

//==============================================================================
// 运行 cgroup
//==============================================================================

class RunCgroup {
private:
    std::string path_;
    bool live_ = false;

    explicit RunCgroup(std::string path) : path_(std::move(path)) {}

    std::string file(const char *name) const { return path_ + "/" + name; }

public:
    /**
     * @brief 在 parent 下建立 name 并写入限制；任何一步失败都会删掉已建的目录
     */
    static Result<std::unique_ptr<RunCgroup>> open(const std::string &parent, const std::string &name,
                                                   const CgroupLimits &limits) {
        std::unique_ptr<RunCgroup> cg(new RunCgroup(parent + "/" + name));
        if (mkdir(cg->path_.c_str(), 0755) < 0 && errno != EEXIST) {
            return SJ_ERROR(ErrorCode::ISOLATION_UNAVAILABLE,
                            "Cannot create cgroup " + cg->path_ + ": " + strerror(errno));
        }
        cg->live_ = true;

        if (limits.memory_max > 0) {
            SJ_TRY(cgroupfs::write_text(cg->file("memory.max"), std::to_string(limits.memory_max)));
            // 没有 swap 控制器时没有这个文件
            if (cgroupfs::exists(cg->file("memory.swap.max"))) {
                SJ_TRY(cgroupfs::write_text(cg->file("memory.swap.max"), "0"));
            }
        }
        if (limits.cpu_quota_usec > 0) {
            SJ_TRY(cgroupfs::write_text(cg->file("cpu.max"), std::to_string(limits.cpu_quota_usec) + " " +
                                                                 std::to_string(limits.cpu_period_usec)));
        }
        if (limits.pids_max > 0) {
            SJ_TRY(cgroupfs::write_text(cg->file("pids.max"), std::to_string(limits.pids_max)));
        }
        return Result<std::unique_ptr<RunCgroup>>(std::move(cg));
    }

    ~RunCgroup() {
        if (live_) {
            auto removed = remove();
            if (removed.is_error()) {
                SLOG_WARN << removed.error().message();
            }
        }
    }

    RunCgroup(const RunCgroup&) = delete;
    RunCgroup& operator=(const RunCgroup&) = delete;

    Result<void> attach(pid_t pid) {
        return cgroupfs::write_text(file("cgroup.procs"), std::to_string(pid));
    }

    /// 需要内核 5.14+
    Result<void> kill_all() {
        return cgroupfs::write_text(file("cgroup.kill"), "1");
    }

    CgroupUsage usage() const {
        CgroupUsage u;
        u.memory_peak = cgroupfs::single_value(file("memory.peak"));
        u.oom_kills = cgroupfs::keyed_value(file("memory.events"), "oom_kill");
        u.cpu_usec = cgroupfs::keyed_value(file("cpu.stat"), "usage_usec");
        u.pids_denied = cgroupfs::keyed_value(file("pids.events"), "max");
        return u;
    }

    /**
     * @brief 杀掉剩余进程并删除目录
     *
     * 进程退出前 rmdir 返回 EBUSY，最多等 100ms。
     */
    Result<void> remove() {
        if (!live_) {
            return Ok();
        }
        live_ = false;
        if (kill_all().is_error()) {
            SLOG_TRACE << "cgroup.kill unavailable for " << path_;
        }
        for (int attempt = 0; attempt < 50; attempt++) {
            if (rmdir(path_.c_str()) == 0 || errno == ENOENT) {
                return Ok();
            }
            usleep(2000);
        }
        return SJ_ERROR(ErrorCode::FILE_WRITE_ERROR, "Cannot remove cgroup " + path_ + ": " + strerror(errno));
    }

    const std::string& path() const { return path_; }
};

//==============================================================================
// 层级初始化
//==============================================================================

/**
 * @brief 进程级单例：建立 engine/ 与 sandbox/，并把引擎迁入 engine/
 *
 * 引擎必须先离开 base，base 才能打开 subtree_control。
 */
class CgroupHierarchy {
private:
    std::mutex mutex_;
    std::string base_;
    std::string run_parent_;
    bool ready_ = false;

    CgroupHierarchy() = default;

    static bool is_cgroup2(const char *mount) {
        struct statfs fs;
        return statfs(mount, &fs) == 0 && fs.f_type == CGROUP2_SUPER_MAGIC;
    }

    /// /proc/self/cgroup 中 "0::/path" 的 path
    static std::string own_cgroup() {
        std::istringstream lines(cgroupfs::read_text("/proc/self/cgroup"));
        std::string line;
        while (std::getline(lines, line)) {
            if (line.rfind("0::", 0) == 0) {
                return line.substr(3);
            }
        }
        return "";
    }

    static Result<void> make_child(const std::string &path) {
        if (mkdir(path.c_str(), 0755) < 0 && errno != EEXIST) {
            return SJ_ERROR(ErrorCode::ISOLATION_UNAVAILABLE, "Cannot create cgroup " + path + ": " + strerror(errno));
        }
        return Ok();
    }

    static void delegate_controllers(const std::string &path) {
        auto r = cgroupfs::write_text(path + "/cgroup.subtree_control", "+memory +cpu +pids");
        if (r.is_error()) {
            SLOG_WARN << "Controllers not delegated at " << path << ": " << r.error().message();
        }
    }

public:
    static constexpr const char *MOUNT = "/sys/fs/cgroup";

    static CgroupHierarchy& instance() {
        static CgroupHierarchy h;
        return h;
    }

    Result<void> setup() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ready_) {
            return Ok();
        }
        if (!is_cgroup2(MOUNT)) {
            return SJ_ERROR(ErrorCode::ISOLATION_UNAVAILABLE, "cgroups v2 is not mounted");
        }
        std::string own = own_cgroup();
        base_ = std::string(MOUNT) + (own == "/" ? "" : own);

        std::string engine = base_ + "/engine";
        SJ_TRY(make_child(engine));
        auto moved = cgroupfs::write_text(engine + "/cgroup.procs", std::to_string(getpid()));
        if (moved.is_error()) {
            return SJ_ERROR(ErrorCode::ISOLATION_UNAVAILABLE, "Cannot move engine into " + engine);
        }
        delegate_controllers(base_);

        run_parent_ = base_ + "/sandbox";
        SJ_TRY(make_child(run_parent_));
        delegate_controllers(run_parent_);

        SLOG_INFO << "cgroup hierarchy ready under " << base_;
        ready_ = true;
        return Ok();
    }

    const std::string& run_parent() const { return run_parent_; }
    bool ready() const { return ready_; }
};

} // namespace sandbox
} // namespace sj

#endif // SJ_SANDBOX_CGROUP_H
