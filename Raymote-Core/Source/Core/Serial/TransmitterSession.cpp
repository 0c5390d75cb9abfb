#include "Core/Serial/TransmitterSession.hpp"
#include "Core/Errors.hpp"
#include <fmt/core.h>

TransmitterSession::TransmitterSession(asio::io_context& io)
    : SerialSession(io, "TX") {
}

TransmitterSession::~TransmitterSession() {
    failPending(fmt::format("{}: connection closed", kErrWriteFailed));
}

void TransmitterSession::send(const TransmitCommand& cmd, SendHandler done) {
    if (!isOpen()) {
        done(kErrNotConnected);
        return;
    }

    auto line = std::make_shared<const std::string>(FormatTransmitLine(cmd));
    fmt::print("[TX] Sending IR command: {},{},{}\n", cmd.protocol, cmd.bitLength, cmd.code);

    const bool idle = m_queue.empty();
    m_queue.push_back(PendingWrite{ std::move(line), std::move(done) });
    if (idle) doWrite(generation());
}

void TransmitterSession::doWrite(std::uint64_t gen) {
    // i byte restano vivi fino al completamento, anche se la coda viene svuotata
    auto bytes = m_queue.front().bytes;
    asio::async_write(port(), asio::buffer(*bytes),
        [this, gen, bytes](const asio::error_code& ec, std::size_t) {
            if (gen != generation()) return; // già completata da failPending

            SendHandler done = std::move(m_queue.front().done);
            m_queue.pop_front();

            if (ec) {
                // dispositivo perso: chiude la porta e fallisce le write accodate
                fail(ec.message());
                done(fmt::format("{}: {}", kErrWriteFailed, ec.message()));
                return;
            }

            if (!m_queue.empty()) doWrite(gen);
            done({});
        });
}

void TransmitterSession::onClosing() {
    failPending(fmt::format("{}: connection closed", kErrWriteFailed));
}

void TransmitterSession::failPending(const std::string& err) {
    auto pending = std::move(m_queue);
    m_queue.clear();
    for (auto& w : pending) {
        if (w.done) w.done(err);
    }
}
