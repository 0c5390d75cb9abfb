#pragma once
#include "Core/IrProtocol.hpp"
#include <mutex>
#include <deque>
#include <condition_variable>
#include <chrono>

// Canale ricevitore -> broadcaster.
class EventQueue {
public:
    // Pubblica un evento (thread-safe). Mantiene al max 1024 eventi.
    // Ritorna false se la coda è chiusa.
    bool publish(DecodedEvent ev);

    // Estrae il prossimo evento, con timeout. Ritorna false su timeout o coda chiusa e vuota.
    bool popNext(DecodedEvent& out, std::chrono::milliseconds timeout);

    // Sveglia i consumatori in attesa; le publish successive vengono scartate
    void close();
    void reopen();

    // Utilities
    void clear();
    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t dropped() const;

private:
    mutable std::mutex m_mx;
    std::condition_variable m_cv;
    std::deque<DecodedEvent> m_q;
    bool m_closed{ false };
    size_t m_dropped{ 0 };
    static constexpr size_t kMax = 1024;
};
