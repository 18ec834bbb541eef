#pragma once
#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <condition_variable>

// Blocking FIFO used as an event channel between the job worker and the
// thread that reports progress and outcomes.
template<class T>
class ThreadSafeDeque {
  public:
    bool empty() const {
        std::lock_guard<std::mutex> lock{ mutex };
        return deque.empty();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock{ mutex };
        return deque.size();
    }

    T pop_front_waiting() {
        // unique_lock can be unlocked, lock_guard can not
        std::unique_lock<std::mutex> lock{ mutex };
        condition.wait(lock, [this] { return !deque.empty(); });
        auto t = std::move(deque.front());
        deque.pop_front();
        return t;
    }

    // returns std::nullopt if nothing arrived before the timeout
    template<class Rep, class Period>
    std::optional<T> pop_front_waiting_for(const std::chrono::duration<Rep, Period> &timeout) {
        std::unique_lock<std::mutex> lock{ mutex };
        if (!condition.wait_for(lock, timeout, [this] { return !deque.empty(); })) {
            return std::nullopt;
        }
        auto t = std::move(deque.front());
        deque.pop_front();
        return t;
    }

    std::optional<T> try_pop_front() {
        std::lock_guard<std::mutex> lock{ mutex };
        if (deque.empty()) {
            return std::nullopt;
        }
        auto t = std::move(deque.front());
        deque.pop_front();
        return t;
    }

    void push_back(T t) {
        std::unique_lock<std::mutex> lock{ mutex };
        deque.push_back(std::move(t));
        lock.unlock();
        condition.notify_one(); // wakes up pop_front_waiting
    }
  private:
    std::deque<T> deque;
    mutable std::mutex mutex;
    std::condition_variable condition;
};
