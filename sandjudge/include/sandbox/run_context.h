/**
 * @file run_context.h
 * @brief 运行上下文：截止时间 + 取消令牌
 *
 * 沙箱等待循环、预置退避和队列等待都通过它感知取消，
 * 不使用异常传递超时或取消。
 */

#ifndef SJ_SANDBOX_RUN_CONTEXT_H
#define SJ_SANDBOX_RUN_CONTEXT_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace sj {

using SteadyClock = std::chrono::steady_clock;

/**
 * @brief 可共享的取消令牌
 *
 * cancel() 之后所有 wait_for() 立即返回。
 */
class CancelToken {
private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;

public:
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_.store(true);
        }
        cv_.notify_all();
    }

    bool is_cancelled() const { return cancelled_.load(); }

    /**
     * @brief 可被取消的睡眠
     * @return true 表示在等待期间被取消
     */
    template<typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period> &d) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, d, [this] { return cancelled_.load(); });
    }
};

using CancelTokenPtr = std::shared_ptr<CancelToken>;

/**
 * @brief 运行上下文
 */
class RunContext {
private:
    CancelTokenPtr token_;
    std::optional<SteadyClock::time_point> deadline_;
    std::string submission_id_;
    std::string user_id_;

public:
    RunContext() : token_(std::make_shared<CancelToken>()) {}

    explicit RunContext(CancelTokenPtr token)
        : token_(token ? std::move(token) : std::make_shared<CancelToken>()) {}

    RunContext& with_submission(const std::string &submission_id, const std::string &user_id) {
        submission_id_ = submission_id;
        user_id_ = user_id;
        return *this;
    }

    RunContext& set_deadline(SteadyClock::time_point deadline) {
        deadline_ = deadline;
        return *this;
    }

    RunContext& set_timeout(std::chrono::milliseconds timeout) {
        deadline_ = SteadyClock::now() + timeout;
        return *this;
    }

    void clear_deadline() { deadline_.reset(); }

    const std::optional<SteadyClock::time_point>& deadline() const { return deadline_; }

    bool expired() const {
        return deadline_ && SteadyClock::now() >= *deadline_;
    }

    bool cancelled() const { return token_->is_cancelled(); }
    void cancel() { token_->cancel(); }

    const CancelTokenPtr& token() const { return token_; }

    /**
     * @brief 可被取消的睡眠
     * @return true 表示被取消
     */
    bool sleep_for(std::chrono::milliseconds d) { return token_->wait_for(d); }

    const std::string& submission_id() const { return submission_id_; }
    const std::string& user_id() const { return user_id_; }
};

} // namespace sj

#endif // SJ_SANDBOX_RUN_CONTEXT_H
