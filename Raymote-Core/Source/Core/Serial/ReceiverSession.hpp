#pragma once
#include "Core/Serial/SerialSession.hpp"
#include "Core/EventQueue.hpp"
#include <atomic>
#include <memory>
#include <string>

// Legge linee CR+LF dal ricevitore IR e pubblica su EventQueue solo
// quelle con un marker riconosciuto ("Decoded" / "Ready to receive").
class ReceiverSession : public SerialSession {
public:
    ReceiverSession(asio::io_context& io, EventQueue& out);

    [[nodiscard]] size_t linesRead() const { return m_linesRead.load(); }
    [[nodiscard]] size_t linesForwarded() const { return m_linesForwarded.load(); }

protected:
    void onOpened() override;

private:
    void doRead(std::uint64_t gen);
    void handleLine(std::string line);

    EventQueue& m_out;
    std::shared_ptr<asio::streambuf> m_buffer;
    std::atomic<size_t> m_linesRead{ 0 };
    std::atomic<size_t> m_linesForwarded{ 0 };
};
