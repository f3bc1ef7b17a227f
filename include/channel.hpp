#pragma once

#include "context.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace rangefetch {

// Bounded multi-producer multi-consumer queue.
//
// After close() pushes fail and pops drain what is left, then return
// nullopt. The Context overloads give up once the context is done; the
// context has no wakeup of its own, so waiters re-check it every
// kPollInterval.
template<typename T>
class Channel {
public:
    static constexpr std::chrono::milliseconds kPollInterval{10};

    explicit Channel(size_t capacity) : capacity_(capacity > 0 ? capacity : 1) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    bool push(T value) {
        std::unique_lock lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
        return push_locked(lock, std::move(value));
    }

    bool push(T value, const Context& ctx) {
        std::unique_lock lock(mutex_);
        while (!closed_ && queue_.size() >= capacity_) {
            if (ctx.done()) return false;
            not_full_.wait_for(lock, kPollInterval);
        }
        return push_locked(lock, std::move(value));
    }

    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        return pop_locked(lock);
    }

    std::optional<T> pop(const Context& ctx) {
        std::unique_lock lock(mutex_);
        while (!closed_ && queue_.empty()) {
            if (ctx.done()) return std::nullopt;
            not_empty_.wait_for(lock, kPollInterval);
        }
        return pop_locked(lock);
    }

    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

private:
    bool push_locked(std::unique_lock<std::mutex>& lock, T value) {
        if (closed_) return false;
        queue_.push_back(std::move(value));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    std::optional<T> pop_locked(std::unique_lock<std::mutex>& lock) {
        if (queue_.empty()) return std::nullopt;
        T value = std::move(queue_.front());
        queue_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return value;
    }

    const size_t capacity_;
    std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> queue_;
    bool closed_ = false;
};

} // namespace rangefetch
