#include "Core/Events/EventBroadcaster.hpp"
#include <fmt/core.h>

EventBroadcaster::EventBroadcaster(asio::io_context& io, std::chrono::milliseconds keepaliveInterval,
                                   size_t maxPendingPerSubscriber)
    : m_io(io), m_interval(keepaliveInterval), m_maxPending(maxPendingPerSubscriber) {
}

EventBroadcaster::~EventBroadcaster() { clear(); }

std::shared_ptr<Subscriber> EventBroadcaster::subscribe() {
    Entry entry;
    {
        std::lock_guard<std::mutex> lk(m_mx);
        entry.sub = std::make_shared<Subscriber>(m_nextId++, m_maxPending);
        entry.timer = std::make_shared<asio::steady_timer>(m_io);
        m_subs.emplace(entry.sub->id(), entry);
    }

    std::weak_ptr<Subscriber> weak = entry.sub;
    auto timer = entry.timer;
    // i timer si toccano solo dal thread dell'io_context
    asio::post(m_io, [this, weak, timer] {
        // rimosso (o broadcaster distrutto) prima di arrivare qui
        auto sub = weak.lock();
        if (!sub || sub->isClosed()) return;
        armKeepalive(weak, timer);
    });

    fmt::print("[EVT] Client connesso allo stream eventi (#{})\n", entry.sub->id());
    return entry.sub;
}

void EventBroadcaster::unsubscribe(const std::shared_ptr<Subscriber>& sub) {
    if (!sub) return;
    remove(sub->id());
}

void EventBroadcaster::remove(std::uint64_t id) {
    Entry entry;
    {
        std::lock_guard<std::mutex> lk(m_mx);
        auto it = m_subs.find(id);
        if (it == m_subs.end()) return;
        entry = std::move(it->second);
        m_subs.erase(it);
    }

    entry.sub->close();
    auto timer = entry.timer;
    asio::post(m_io, [timer] { timer->cancel(); });
    fmt::print("[EVT] Client disconnesso dallo stream eventi (#{})\n", id);
}

size_t EventBroadcaster::publish(const DecodedEvent& ev) {
    const std::string frame = FormatEventFrame(ev);

    std::vector<std::shared_ptr<Subscriber>> targets;
    {
        std::lock_guard<std::mutex> lk(m_mx);
        targets.reserve(m_subs.size());
        for (auto& [id, entry] : m_subs) targets.push_back(entry.sub);
    }

    size_t delivered = 0;
    std::vector<std::uint64_t> failed;
    for (auto& sub : targets) {
        if (sub->push(frame)) ++delivered;
        else failed.push_back(sub->id());
    }

    for (auto id : failed) remove(id);
    return delivered;
}

void EventBroadcaster::clear() {
    std::vector<std::uint64_t> ids;
    {
        std::lock_guard<std::mutex> lk(m_mx);
        for (auto& [id, entry] : m_subs) ids.push_back(id);
    }
    for (auto id : ids) remove(id);
}

size_t EventBroadcaster::size() const {
    std::lock_guard<std::mutex> lk(m_mx);
    return m_subs.size();
}

void EventBroadcaster::armKeepalive(std::weak_ptr<Subscriber> weak, std::shared_ptr<asio::steady_timer> timer) {
    timer->expires_after(m_interval);
    timer->async_wait([this, weak, timer](const asio::error_code& ec) {
        if (ec) return; // cancellato da unsubscribe

        auto sub = weak.lock();
        if (!sub || sub->isClosed()) return;

        if (!sub->push(std::string(kKeepaliveFrame))) {
            remove(sub->id());
            return;
        }
        armKeepalive(weak, timer);
    });
}
