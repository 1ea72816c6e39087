/**
 * @file channel.h
 * @brief 有界消息通道（发送端永不阻塞）
 *
 * 通道满时 try_send 直接丢弃消息并计数：状态推送是尽力而为的，
 * 评测线程不能因为订阅者处理慢而停顿。
 */

#ifndef SJ_ENGINE_CHANNEL_H
#define SJ_ENGINE_CHANNEL_H

#include <deque>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <chrono>
#include <optional>

namespace sj {
namespace engine {

template<typename T>
class Channel {
private:
    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    size_t capacity_;
    bool closed_ = false;
    std::atomic<uint64_t> dropped_{0};

public:
    explicit Channel(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /**
     * @brief 非阻塞发送
     * @return false 表示通道已满或已关闭，消息被丢弃
     */
    bool try_send(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || items_.size() >= capacity_) {
                dropped_++;
                return false;
            }
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief 阻塞接收；通道关闭且为空时返回 nullopt
     */
    std::optional<T> recv() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return !items_.empty() || closed_; });
        return take_locked();
    }

    std::optional<T> recv_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_for(lock, timeout, [this] { return !items_.empty() || closed_; });
        return take_locked();
    }

    std::optional<T> try_recv() {
        std::lock_guard<std::mutex> lock(mutex_);
        return take_locked();
    }

    /// 关闭后不再接受新消息，已有消息仍可取出
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }
    uint64_t dropped() const { return dropped_.load(); }

private:
    std::optional<T> take_locked() {
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }
};

} // namespace engine
} // namespace sj

#endif // SJ_ENGINE_CHANNEL_H
