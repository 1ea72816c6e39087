/**
 * @file worker_pool.h
 * @brief 弹性工作线程池
 *
 * 工作线程从 SubmissionQueue 认领提交并交给处理函数。监督线程每 100ms
 * 检查一次：队列深度超过阈值时扩容（不超过 max），空闲超时的线程在
 * 数量多于 min 时退出。
 */

#ifndef SJ_ENGINE_WORKER_POOL_H
#define SJ_ENGINE_WORKER_POOL_H

#include <string>
#include <map>
#include <vector>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <functional>
#include <exception>
#include <condition_variable>

#include "core/config.h"
#include "core/engine_logger.h"
#include "engine/submission_queue.h"

namespace sj {
namespace engine {

struct WorkerPoolOptions {
    int min_workers = 2;
    int max_workers = 8;
    int scale_up_queue_depth = 4;
    std::chrono::milliseconds idle_timeout{30000};
    std::chrono::milliseconds supervisor_interval{100};
    std::chrono::milliseconds poll_interval{100};      ///< 工作线程等待队列的粒度

    static WorkerPoolOptions from(const WorkersConfig &cfg) {
        WorkerPoolOptions o;
        o.min_workers = cfg.min;
        o.max_workers = cfg.max;
        o.scale_up_queue_depth = cfg.scale_up_queue_depth;
        o.idle_timeout = std::chrono::milliseconds(cfg.idle_timeout_ms);
        return o;
    }
};

/// 处理一个认领；负责在结束时 ack
using ProcessFn = std::function<void(const Claim &claim, const std::string &worker_id)>;

/// 投递次数耗尽（工作线程异常后无法再投递）的提交
using ExhaustedFn = std::function<void(const std::string &submission_id, const std::string &reason)>;

class WorkerPool {
private:
    struct Worker {
        std::string id;
        std::thread thread;
        std::atomic<bool> finished{false};
    };

    SubmissionQueue &queue_;
    ProcessFn process_;
    ExhaustedFn on_exhausted_;
    WorkerPoolOptions options_;

    std::mutex workers_mutex_;
    std::map<std::string, std::unique_ptr<Worker>> workers_;
    int live_workers_ = 0;             ///< 未决定退出的工作线程数（受 workers_mutex_ 保护）
    uint64_t next_worker_ = 0;

    std::atomic<bool> stop_{false};
    std::atomic<size_t> active_{0};
    std::atomic<uint64_t> completed_{0};

    std::thread supervisor_;
    std::mutex supervisor_mutex_;
    std::condition_variable supervisor_cv_;

    /// 调用方持有 workers_mutex_
    void spawn_locked() {
        auto w = std::make_unique<Worker>();
        w->id = "worker-" + std::to_string(++next_worker_);
        Worker *raw = w.get();
        live_workers_++;
        workers_[w->id] = std::move(w);
        raw->thread = std::thread(&WorkerPool::worker_loop, this, raw);
        WLOG_DEBUG << "Spawned " << raw->id << " (live=" << live_workers_ << ")";
    }

    /**
     * @brief 空闲超时后是否允许退出
     */
    bool try_retire() {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        if (live_workers_ > options_.min_workers) {
            live_workers_--;
            return true;
        }
        return false;
    }

    void handle_crash(const std::string &worker_id, const std::string &what) {
        WLOG_ERROR << worker_id << " caught exception: " << what;
        for (const auto &id : queue_.requeue_claimed(worker_id)) {
            if (on_exhausted_) {
                on_exhausted_(id, what);
            }
        }
    }

    void worker_loop(Worker *self) {
        auto idle_since = std::chrono::steady_clock::now();
        bool retired = false;

        while (!stop_) {
            auto claim = queue_.dequeue_for(self->id, options_.poll_interval);
            if (!claim) {
                if (queue_.is_closed()) {
                    break;
                }
                if (std::chrono::steady_clock::now() - idle_since >= options_.idle_timeout && try_retire()) {
                    retired = true;
                    WLOG_DEBUG << self->id << " idle timeout, exiting";
                    break;
                }
                continue;
            }

            active_++;
            try {
                process_(*claim, self->id);
            } catch (const std::exception &e) {
                handle_crash(self->id, e.what());
            }
            active_--;
            completed_++;
            idle_since = std::chrono::steady_clock::now();
        }

        if (!retired) {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            live_workers_--;
        }
        self->finished = true;
    }

    /// 回收已退出的线程
    void join_finished() {
        std::vector<std::unique_ptr<Worker>> done;
        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            for (auto it = workers_.begin(); it != workers_.end();) {
                if (it->second->finished) {
                    done.push_back(std::move(it->second));
                    it = workers_.erase(it);
                } else {
                    ++it;
                }
            }
        }
        for (auto &w : done) {
            if (w->thread.joinable()) {
                w->thread.join();
            }
        }
    }

    void supervise_once() {
        join_finished();
        std::lock_guard<std::mutex> lock(workers_mutex_);
        if (stop_ || queue_.is_closed()) {
            return;
        }
        while (live_workers_ < options_.min_workers) {
            spawn_locked();
        }
        size_t depth = queue_.depth();
        if (live_workers_ == 0 && depth > 0) {
            spawn_locked();
        } else if (static_cast<int>(depth) > options_.scale_up_queue_depth &&
                   live_workers_ < options_.max_workers) {
            spawn_locked();
            WLOG_INFO << "Scaled up to " << live_workers_ << " workers (queue depth " << depth << ")";
        }
    }

    void supervisor_loop() {
        std::unique_lock<std::mutex> lock(supervisor_mutex_);
        while (!stop_) {
            supervisor_cv_.wait_for(lock, options_.supervisor_interval, [this] { return stop_.load(); });
            if (stop_) break;
            lock.unlock();
            supervise_once();
            lock.lock();
        }
    }

public:
    WorkerPool(SubmissionQueue &queue, ProcessFn process, const WorkerPoolOptions &options,
               ExhaustedFn on_exhausted = nullptr)
        : queue_(queue),
          process_(std::move(process)),
          on_exhausted_(std::move(on_exhausted)),
          options_(options) {
        if (options_.max_workers < 1) options_.max_workers = 1;
        if (options_.min_workers < 0) options_.min_workers = 0;
        if (options_.min_workers > options_.max_workers) options_.min_workers = options_.max_workers;
    }

    ~WorkerPool() {
        stop();
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief 启动 min_workers 个工作线程和监督线程
     */
    void start() {
        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            for (int i = live_workers_; i < options_.min_workers; i++) {
                spawn_locked();
            }
        }
        supervisor_ = std::thread(&WorkerPool::supervisor_loop, this);
        WLOG_INFOF("Worker pool started: min=%d max=%d", options_.min_workers, options_.max_workers);
    }

    /**
     * @brief 停止所有线程；正在处理的提交会先处理完
     */
    void stop() {
        {
            std::lock_guard<std::mutex> lock(supervisor_mutex_);
            if (stop_.exchange(true)) {
                return;
            }
        }
        supervisor_cv_.notify_all();
        if (supervisor_.joinable()) {
            supervisor_.join();
        }
        std::map<std::string, std::unique_ptr<Worker>> workers;
        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            workers.swap(workers_);
        }
        for (auto &kv : workers) {
            if (kv.second->thread.joinable()) {
                kv.second->thread.join();
            }
        }
        WLOG_INFO << "Worker pool stopped, completed=" << completed_.load();
    }

    size_t active_workers() const { return active_.load(); }

    size_t total_workers() {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        return static_cast<size_t>(live_workers_);
    }

    uint64_t completed() const { return completed_.load(); }
    const WorkerPoolOptions& options() const { return options_; }
};

} // namespace engine
} // namespace sj

#endif // SJ_ENGINE_WORKER_POOL_H
