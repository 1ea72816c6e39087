/**
 * @file submission_queue.h
 * @brief 线程安全的 FIFO 提交队列（带投递认领）
 *
 * 出队即认领：记录 (提交 id -> 工作线程 id)，ack 之后认领结束。
 * 工作线程崩溃时 requeue_claimed 把它的认领放回队首；
 * 投递次数达到上限的提交不再入队，交给调用方标记为 Failed。
 */

#ifndef SJ_ENGINE_SUBMISSION_QUEUE_H
#define SJ_ENGINE_SUBMISSION_QUEUE_H

#include <string>
#include <deque>
#include <map>
#include <vector>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <optional>

#include "core/error.h"
#include "core/engine_logger.h"

namespace sj {
namespace engine {

/**
 * @brief 一次投递
 */
struct Claim {
    std::string submission_id;
    int delivery = 1;          ///< 第几次投递（从 1 开始）
};

class SubmissionQueue {
private:
    struct Item {
        std::string id;
        int deliveries = 0;
    };

    struct ClaimRecord {
        std::string worker_id;
        int deliveries = 0;
    };

    std::deque<Item> items_;
    std::map<std::string, ClaimRecord> claims_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    int max_deliveries_;
    bool closed_ = false;

    std::optional<Claim> claim_front_locked(const std::string &worker_id) {
        if (items_.empty()) {
            return std::nullopt;
        }
        Item item = std::move(items_.front());
        items_.pop_front();
        item.deliveries++;
        claims_[item.id] = ClaimRecord{worker_id, item.deliveries};
        return Claim{item.id, item.deliveries};
    }

public:
    explicit SubmissionQueue(int max_deliveries = 2)
        : max_deliveries_(max_deliveries < 1 ? 1 : max_deliveries) {}

    SubmissionQueue(const SubmissionQueue&) = delete;
    SubmissionQueue& operator=(const SubmissionQueue&) = delete;

    Result<void> enqueue(const std::string &id) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return SJ_ERROR(ErrorCode::QUEUE_CLOSED, "Queue is closed");
            }
            items_.push_back(Item{id, 0});
        }
        not_empty_.notify_one();
        return Ok();
    }

    /**
     * @brief 阻塞出队；队列关闭且为空时返回 nullopt
     */
    std::optional<Claim> dequeue(const std::string &worker_id) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return !items_.empty() || closed_; });
        return claim_front_locked(worker_id);
    }

    std::optional<Claim> try_dequeue(const std::string &worker_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return claim_front_locked(worker_id);
    }

    std::optional<Claim> dequeue_for(const std::string &worker_id, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_for(lock, timeout, [this] { return !items_.empty() || closed_; });
        return claim_front_locked(worker_id);
    }

    /**
     * @brief 结束认领
     * @return false 表示该提交没有被认领
     */
    bool ack(const std::string &id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return claims_.erase(id) > 0;
    }

    /**
     * @brief 把某个工作线程的认领放回队首
     * @return 投递次数已达上限、没有放回的提交 id
     */
    std::vector<std::string> requeue_claimed(const std::string &worker_id) {
        std::vector<std::string> exhausted;
        std::vector<Item> back;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto it = claims_.begin(); it != claims_.end();) {
                if (it->second.worker_id != worker_id) {
                    ++it;
                    continue;
                }
                if (it->second.deliveries >= max_deliveries_ || closed_) {
                    exhausted.push_back(it->first);
                } else {
                    back.push_back(Item{it->first, it->second.deliveries});
                }
                it = claims_.erase(it);
            }
            for (auto it = back.rbegin(); it != back.rend(); ++it) {
                items_.push_front(*it);
            }
        }
        for (size_t i = 0; i < back.size(); i++) {
            not_empty_.notify_one();
        }
        if (!back.empty() || !exhausted.empty()) {
            WLOG_WARN << "Worker " << worker_id << " dropped claims: requeued=" << back.size()
                      << " exhausted=" << exhausted.size();
        }
        return exhausted;
    }

    /**
     * @brief 1-based 排队位置，不在队中返回 -1
     */
    int position(const std::string &id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t i = 0; i < items_.size(); i++) {
            if (items_[i].id == id) {
                return static_cast<int>(i) + 1;
            }
        }
        return -1;
    }

    size_t depth() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    /**
     * @brief 从队中移除（未被认领的）提交
     */
    bool remove(const std::string &id) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = items_.begin(); it != items_.end(); ++it) {
            if (it->id == id) {
                items_.erase(it);
                return true;
            }
        }
        return false;
    }

    bool is_claimed(const std::string &id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return claims_.count(id) > 0;
    }

    size_t claimed_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return claims_.size();
    }

    /**
     * @brief 清空待处理项（不影响已认领的）
     * @return 被清除的提交 id
     */
    std::vector<std::string> clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> ids;
        for (const auto &item : items_) {
            ids.push_back(item.id);
        }
        items_.clear();
        return ids;
    }

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

    int max_deliveries() const { return max_deliveries_; }
};

} // namespace engine
} // namespace sj

#endif // SJ_ENGINE_SUBMISSION_QUEUE_H
