#pragma once
#include "Core/Events/Subscriber.hpp"
#include "Core/IrProtocol.hpp"
#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

inline constexpr std::chrono::milliseconds kKeepaliveInterval{ 30000 };

// Insieme dei subscriber vivi dello stream eventi.
// subscribe/unsubscribe arrivano dai thread HTTP, publish dal pump degli
// eventi: il set è protetto da mutex, mai tenuto durante le push.
// I timer di keepalive girano sull'io_context passato al costruttore.
class EventBroadcaster {
public:
    explicit EventBroadcaster(asio::io_context& io,
                              std::chrono::milliseconds keepaliveInterval = kKeepaliveInterval,
                              size_t maxPendingPerSubscriber = Subscriber::kDefaultMaxPending);
    ~EventBroadcaster();

    EventBroadcaster(const EventBroadcaster&) = delete;
    EventBroadcaster& operator=(const EventBroadcaster&) = delete;

    // Registra un subscriber e avvia il suo keepalive periodico
    std::shared_ptr<Subscriber> subscribe();

    // Rimuove e chiude il subscriber. No-op se già rimosso.
    void unsubscribe(const std::shared_ptr<Subscriber>& sub);

    // Consegna a tutti; chi fallisce viene rimosso senza toccare gli altri.
    // Ritorna il numero di consegne riuscite.
    size_t publish(const DecodedEvent& ev);

    // Chiude e rimuove tutti i subscriber (shutdown)
    void clear();

    [[nodiscard]] size_t size() const;

private:
    struct Entry {
        std::shared_ptr<Subscriber> sub;
        std::shared_ptr<asio::steady_timer> timer;
    };

    void armKeepalive(std::weak_ptr<Subscriber> weak, std::shared_ptr<asio::steady_timer> timer);
    void remove(std::uint64_t id);

    asio::io_context& m_io;
    const std::chrono::milliseconds m_interval;
    const size_t m_maxPending;

    mutable std::mutex m_mx;
    std::map<std::uint64_t, Entry> m_subs;
    std::uint64_t m_nextId{ 1 };
};
