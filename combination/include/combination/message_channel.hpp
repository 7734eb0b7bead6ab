#ifndef COMBINATION_MESSAGE_CHANNEL_HPP
#define COMBINATION_MESSAGE_CHANNEL_HPP

#include "combination/messages.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace combination {

// =============================================================================
// MessageChannel
// =============================================================================
// Many workers push, one coordinator pops. Messages from a single worker come
// out in the order that worker pushed them; no ordering across workers.

class MessageChannel : public SearchSink {
public:
    void emit(WorkerMessage&& message) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push_back(std::move(message));
        }
        cv_.notify_one();
    }

    // Blocks for at most `timeout`. Returns nullopt if nothing arrived.
    template<typename Rep, typename Period>
    std::optional<WorkerMessage> pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
            return std::nullopt;
        }
        WorkerMessage message = std::move(queue_.front());
        queue_.pop_front();
        return message;
    }

    std::optional<WorkerMessage> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) return std::nullopt;
        WorkerMessage message = std::move(queue_.front());
        queue_.pop_front();
        return message;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    bool empty() const { return size() == 0; }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<WorkerMessage> queue_;
};

}  // namespace combination

#endif  // COMBINATION_MESSAGE_CHANNEL_HPP
