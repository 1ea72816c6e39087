/**
 * @file notifications.h
 * @brief 提交状态推送
 *
 * 评测线程通过 publish() 把更新放进有界通道（满了就丢弃），
 * 分发线程按用户 id 转交给订阅者。
 */

#ifndef SJ_ENGINE_NOTIFICATIONS_H
#define SJ_ENGINE_NOTIFICATIONS_H

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <optional>
#include <algorithm>
#include <exception>

#include "core/types.h"
#include "core/engine_logger.h"
#include "engine/channel.h"

namespace sj {
namespace engine {

/**
 * @brief 一次状态变更
 */
struct StatusUpdate {
    std::string submission_id;
    std::string user_id;
    SubmissionStatus status = SubmissionStatus::QUEUED;
    std::optional<size_t> current_test_index;      ///< 刚完成的测试点（从 0 开始）
    std::optional<TestCaseResult> test_result;
    std::optional<Verdict> verdict;
    std::vector<TestCaseResult> test_results;      ///< 仅终态更新携带完整列表
};

class UpdateSink {
public:
    virtual ~UpdateSink() = default;
    virtual void on_update(const StatusUpdate &update) = 0;
};

using UpdateSinkPtr = std::shared_ptr<UpdateSink>;

class NotificationHub {
private:
    Channel<StatusUpdate> channel_;
    std::mutex subscribers_mutex_;
    std::map<std::string, std::vector<UpdateSinkPtr>> subscribers_;
    std::thread dispatcher_;
    std::atomic<bool> started_{false};
    std::atomic<uint64_t> delivered_{0};

    std::vector<UpdateSinkPtr> sinks_for(const std::string &user_id) {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        auto it = subscribers_.find(user_id);
        return it != subscribers_.end() ? it->second : std::vector<UpdateSinkPtr>();
    }

    void dispatch_loop() {
        while (auto update = channel_.recv()) {
            for (const auto &sink : sinks_for(update->user_id)) {
                try {
                    sink->on_update(*update);
                } catch (const std::exception &e) {
                    WLOG_WARN << "Update sink for " << update->user_id << " threw: " << e.what();
                }
            }
            delivered_++;
        }
    }

public:
    explicit NotificationHub(size_t capacity) : channel_(capacity) {}

    ~NotificationHub() {
        stop();
    }

    NotificationHub(const NotificationHub&) = delete;
    NotificationHub& operator=(const NotificationHub&) = delete;

    void start() {
        if (!started_.exchange(true)) {
            dispatcher_ = std::thread(&NotificationHub::dispatch_loop, this);
        }
    }

    /**
     * @brief 关闭通道，分发完剩余更新后停止
     */
    void stop() {
        channel_.close();
        if (dispatcher_.joinable()) {
            dispatcher_.join();
        }
    }

    /**
     * @brief 非阻塞发布
     * @return false 表示被丢弃
     */
    bool publish(StatusUpdate update) {
        std::string id = update.submission_id;
        if (!channel_.try_send(std::move(update))) {
            WLOG_DEBUG << "Update for " << id << " dropped (channel full or closed)";
            return false;
        }
        return true;
    }

    void subscribe(const std::string &user_id, UpdateSinkPtr sink) {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        subscribers_[user_id].push_back(std::move(sink));
    }

    void unsubscribe(const std::string &user_id, const UpdateSinkPtr &sink) {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        auto it = subscribers_.find(user_id);
        if (it == subscribers_.end()) {
            return;
        }
        auto &v = it->second;
        v.erase(std::remove(v.begin(), v.end(), sink), v.end());
        if (v.empty()) {
            subscribers_.erase(it);
        }
    }

    uint64_t dropped() const { return channel_.dropped(); }
    uint64_t delivered() const { return delivered_.load(); }
    size_t pending() const { return channel_.size(); }
};

} // namespace engine
} // namespace sj

#endif // SJ_ENGINE_NOTIFICATIONS_H
