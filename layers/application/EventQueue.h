#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace application {

// One-directional hand-off between the acquisition worker and whoever consumes
// its events. push() never blocks; with a capacity set, the oldest expendable
// item (or the oldest item, if none is) is dropped when the consumer falls behind.
template <typename T>
class EventQueue {
public:
    using Predicate = std::function<bool(const T&)>;

    explicit EventQueue(std::size_t capacity = 0, Predicate expendable = {})
        : capacity_(capacity), expendable_(std::move(expendable)) {}

    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    void push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (capacity_ != 0 && items_.size() >= capacity_) {
                evictLocked();
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
    }

    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mutex_);
        return popLocked();
    }

    std::optional<T> waitPop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !items_.empty(); });
        return popLocked();
    }

    std::vector<T> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> out;
        out.reserve(items_.size());
        while (!items_.empty()) {
            out.push_back(std::move(items_.front()));
            items_.pop_front();
        }
        return out;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool empty() const { return size() == 0; }

private:
    void evictLocked() {
        auto victim = items_.begin();
        if (expendable_) {
            const auto it = std::find_if(items_.begin(), items_.end(), expendable_);
            if (it != items_.end()) {
                victim = it;
            }
        }
        items_.erase(victim);
    }

    std::optional<T> popLocked() {
        if (items_.empty()) {
            return std::nullopt;
        }
        std::optional<T> item(std::move(items_.front()));
        items_.pop_front();
        return item;
    }

    std::size_t capacity_;
    Predicate expendable_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
};

} // namespace application
