/**
 * @file sinks.h
 * @brief 资源指标与安全审计的输出端
 *
 * 默认实现写入引擎日志通道；Memory* 实现把记录留在内存中供检查。
 */

#ifndef SJ_ENGINE_SINKS_H
#define SJ_ENGINE_SINKS_H

#include <vector>
#include <mutex>
#include <memory>

#include "core/types.h"
#include "core/engine_logger.h"

namespace sj {
namespace engine {

//==============================================================================
// 接口
//==============================================================================

class MetricsSink {
public:
    virtual ~MetricsSink() = default;
    virtual void record(const ResourceMetrics &metrics) = 0;
};

class AuditSink {
public:
    virtual ~AuditSink() = default;
    virtual void record(const SecurityViolation &violation) = 0;
};

using MetricsSinkPtr = std::shared_ptr<MetricsSink>;
using AuditSinkPtr = std::shared_ptr<AuditSink>;

//==============================================================================
// 日志实现
//==============================================================================

class LogMetricsSink : public MetricsSink {
public:
    void record(const ResourceMetrics &m) override {
        ELOG_DEBUG << "metrics submission=" << m.submission_id
                   << " cpu=" << m.cpu_time_ms << "ms wall=" << m.wall_time_ms
                   << "ms peak=" << m.peak_memory_bytes << "B ctxsw=" << m.context_switches
                   << " faults=" << m.page_faults;
    }
};

class LogAuditSink : public AuditSink {
public:
    void record(const SecurityViolation &v) override {
        ALOG_WARN << "violation submission=" << v.submission_id << " user=" << v.user_id
                  << " type=" << v.violation_type << " action=\"" << v.attempted_action
                  << "\" at=" << to_unix_ms(v.timestamp);
    }
};

//==============================================================================
// 内存实现
//==============================================================================

class MemoryMetricsSink : public MetricsSink {
private:
    mutable std::mutex mutex_;
    std::vector<ResourceMetrics> records_;

public:
    void record(const ResourceMetrics &m) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(m);
    }

    std::vector<ResourceMetrics> records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }
};

class MemoryAuditSink : public AuditSink {
private:
    mutable std::mutex mutex_;
    std::vector<SecurityViolation> records_;

public:
    void record(const SecurityViolation &v) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(v);
    }

    std::vector<SecurityViolation> records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }
};

} // namespace engine
} // namespace sj

#endif // SJ_ENGINE_SINKS_H
