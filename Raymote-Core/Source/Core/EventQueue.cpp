#include "Core/EventQueue.hpp"

bool EventQueue::publish(DecodedEvent ev) {
    {
        std::lock_guard<std::mutex> lk(m_mx);
        if (m_closed) return false;
        m_q.push_back(std::move(ev));
        if (m_q.size() > kMax) { m_q.pop_front(); ++m_dropped; }
    }
    m_cv.notify_one();
    return true;
}

bool EventQueue::popNext(DecodedEvent& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(m_mx);
    if (m_q.empty()) {
        if (!m_cv.wait_for(lk, timeout, [&] { return !m_q.empty() || m_closed; })) return false;
        if (m_q.empty()) return false; // chiusa
    }
    out = std::move(m_q.front());
    m_q.pop_front();
    return true;
}

void EventQueue::close() {
    {
        std::lock_guard<std::mutex> lk(m_mx);
        m_closed = true;
    }
    m_cv.notify_all();
}

void EventQueue::reopen() {
    std::lock_guard<std::mutex> lk(m_mx);
    m_closed = false;
}

void EventQueue::clear() {
    std::lock_guard<std::mutex> lk(m_mx);
    m_q.clear();
}

size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lk(m_mx);
    return m_q.size();
}

size_t EventQueue::dropped() const {
    std::lock_guard<std::mutex> lk(m_mx);
    return m_dropped;
}
