#pragma once

#include "../types.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace gurgeh {
namespace engine {

/**
 * @brief Thread-safe MPMC queue of pending exchanges
 *
 * Callers push from any thread; the agent's worker threads pop. After
 * shutdown() pushes are refused and pop() returns nullopt once the queue
 * is empty. Pending requests survive shutdown until drained.
 */
class RequestQueue {
public:
    /**
     * @param max_size Maximum pending requests (0 = unlimited)
     */
    explicit RequestQueue(size_t max_size = 0)
        : max_size_(max_size)
    {}

    /**
     * @brief Enqueue a request without blocking.
     *
     * @return AgentNotRunning after shutdown, QueueFull at capacity
     */
    Expected<void> push(ExchangeRequest request) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (shutdown_) {
            return tl::unexpected(Error{ErrorCode::AgentNotRunning, "Agent is not running"});
        }
        if (max_size_ > 0 && queue_.size() >= max_size_) {
            return tl::unexpected(Error{
                ErrorCode::QueueFull,
                "Request queue is full",
                "capacity " + std::to_string(max_size_)
            });
        }
        queue_.push_back(std::move(request));
        lock.unlock();
        cv_.notify_one();
        return {};
    }

    /**
     * @brief Pop a request, blocking until one is available or shutdown.
     *
     * @return nullopt once shutdown is signaled and the queue is empty
     */
    std::optional<ExchangeRequest> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] {
            return !queue_.empty() || shutdown_;
        });
        return take_front();
    }

    template<typename Rep, typename Period>
    std::optional<ExchangeRequest> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] {
            return !queue_.empty() || shutdown_;
        });
        return take_front();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    /// Wake every waiting consumer and refuse further pushes.
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_ = true;
        }
        cv_.notify_all();
    }

    bool is_shutdown() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return shutdown_;
    }

    /// Remove and return every pending request, oldest first.
    std::vector<ExchangeRequest> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ExchangeRequest> drained;
        drained.reserve(queue_.size());
        for (auto& request : queue_) {
            drained.push_back(std::move(request));
        }
        queue_.clear();
        return drained;
    }

private:
    // Must be called with mutex_ held
    std::optional<ExchangeRequest> take_front() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        ExchangeRequest request = std::move(queue_.front());
        queue_.pop_front();
        return request;
    }

    std::deque<ExchangeRequest> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t max_size_;
    bool shutdown_ = false;
};

} // namespace engine
} // namespace gurgeh
