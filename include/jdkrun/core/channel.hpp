/*
 * Message channel - jdkrun
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace jdkrun {

// Unbounded multi-producer queue. pop() blocks until a message arrives or the
// channel is closed and drained.
template <typename T>
class Channel {
public:
    // Returns false if the channel is already closed (message dropped).
    bool push(T msg) {
        {
            std::lock_guard<std::mutex> lk(m_mu);
            if (m_closed) return false;
            m_queue.push_back(std::move(msg));
        }
        m_cv.notify_one();
        return true;
    }

    std::optional<T> pop() {
        std::unique_lock<std::mutex> lk(m_mu);
        m_cv.wait(lk, [&]{ return m_closed || !m_queue.empty(); });
        if (m_queue.empty()) return std::nullopt;
        T msg = std::move(m_queue.front());
        m_queue.pop_front();
        return msg;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_closed = true;
        }
        m_cv.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(m_mu);
        return m_closed;
    }

private:
    mutable std::mutex m_mu;
    std::condition_variable m_cv;
    std::deque<T> m_queue;
    bool m_closed = false;
};

} // namespace jdkrun
