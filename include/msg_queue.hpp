#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>

// capacity > 0 이면 가득 찼을 때 가장 오래된 항목을 버린다
template<typename T>
class MsgQueue {
public:
    explicit MsgQueue(size_t capacity = 0) : cap_(capacity) {}

    void push(const T& v) {
        {
            std::lock_guard<std::mutex> lk(m_);
            if (stop_) return;
            if (cap_ > 0 && q_.size() >= cap_) { q_.pop(); ++dropped_; }
            q_.push(v);
        }
        cv_.notify_one();
    }
    bool pop_for(T& out, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(m_);
        if (!cv_.wait_for(lk, timeout, [&] { return stop_ || !q_.empty(); })) return false;
        if (q_.empty()) return false;
        out = q_.front(); q_.pop(); return true;
    }
    void shutdown() { { std::lock_guard<std::mutex> lk(m_); stop_ = true; } cv_.notify_all(); }
    void reopen() { std::lock_guard<std::mutex> lk(m_); stop_ = false; }
    size_t size() const { std::lock_guard<std::mutex> lk(m_); return q_.size(); }
    size_t dropped() const { std::lock_guard<std::mutex> lk(m_); return dropped_; }
private:
    std::queue<T> q_;
    mutable std::mutex m_;
    std::condition_variable cv_;
    size_t cap_;
    size_t dropped_ = 0;
    bool stop_ = false;
};
