#include "Core/Events/Subscriber.hpp"

Subscriber::Subscriber(std::uint64_t id, size_t maxPending)
    : m_id(id), m_maxPending(maxPending) {
}

bool Subscriber::push(std::string frame) {
    bool accepted = false;
    {
        std::lock_guard<std::mutex> lk(m_mx);
        if (m_closed) return false;
        if (m_frames.size() >= m_maxPending) {
            m_closed = true;
        }
        else {
            m_frames.push_back(std::move(frame));
            accepted = true;
        }
    }
    m_cv.notify_all();
    return accepted;
}

bool Subscriber::popNext(std::string& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(m_mx);
    if (m_frames.empty()) {
        if (!m_cv.wait_for(lk, timeout, [&] { return !m_frames.empty() || m_closed; })) return false;
        if (m_frames.empty()) return false;
    }
    out = std::move(m_frames.front());
    m_frames.pop_front();
    return true;
}

void Subscriber::close() {
    {
        std::lock_guard<std::mutex> lk(m_mx);
        m_closed = true;
    }
    m_cv.notify_all();
}

bool Subscriber::isClosed() const {
    std::lock_guard<std::mutex> lk(m_mx);
    return m_closed;
}

size_t Subscriber::pending() const {
    std::lock_guard<std::mutex> lk(m_mx);
    return m_frames.size();
}
