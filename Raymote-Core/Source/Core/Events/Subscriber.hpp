#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>

// Canale di uscita verso un client dello stream eventi.
// Il broadcaster fa push dei frame, il layer HTTP li estrae con popNext.
class Subscriber {
public:
    explicit Subscriber(std::uint64_t id, size_t maxPending = kDefaultMaxPending);

    Subscriber(const Subscriber&) = delete;
    Subscriber& operator=(const Subscriber&) = delete;

    [[nodiscard]] std::uint64_t id() const { return m_id; }

    // false se chiuso o se la coda è piena (client troppo lento): in
    // quel caso il canale viene chiuso.
    bool push(std::string frame);

    // Estrae il prossimo frame, con timeout. false su timeout o se chiuso e vuoto.
    bool popNext(std::string& out, std::chrono::milliseconds timeout);

    void close();
    [[nodiscard]] bool isClosed() const;
    [[nodiscard]] size_t pending() const;

    static constexpr size_t kDefaultMaxPending = 256;

private:
    const std::uint64_t m_id;
    const size_t m_maxPending;

    mutable std::mutex m_mx;
    std::condition_variable m_cv;
    std::deque<std::string> m_frames;
    bool m_closed{ false };
};
