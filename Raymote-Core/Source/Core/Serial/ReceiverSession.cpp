#include "Core/Serial/ReceiverSession.hpp"
#include <fmt/core.h>

ReceiverSession::ReceiverSession(asio::io_context& io, EventQueue& out)
    : SerialSession(io, "RX"), m_out(out) {
}

void ReceiverSession::onOpened() {
    // buffer nuovo per ogni connessione: una read abortita della
    // connessione precedente non deve toccare quello corrente
    m_buffer = std::make_shared<asio::streambuf>();
    doRead(generation());
}

void ReceiverSession::doRead(std::uint64_t gen) {
    auto buf = m_buffer;
    asio::async_read_until(port(), *buf, std::string(kLineDelimiter),
        [this, gen, buf](const asio::error_code& ec, std::size_t bytes) {
            if (gen != generation()) return; // connessione già chiusa: scarta

            if (!ec) {
                const auto begin = asio::buffers_begin(buf->data());
                std::string line(begin, begin + static_cast<std::ptrdiff_t>(bytes - kLineDelimiter.size()));
                buf->consume(bytes);
                handleLine(std::move(line));
                doRead(gen); // continua
            }
            else if (ec != asio::error::operation_aborted) {
                fail(ec.message());
            }
        });
}

void ReceiverSession::handleLine(std::string line) {
    ++m_linesRead;
    if (!IsForwardedLine(line)) return; // chiacchiere del firmware

    DecodedEvent ev{ std::chrono::system_clock::now(), std::move(line) };
    fmt::print("[{}] {}\n", FormatLocalTime(ev.timestamp), ev.rawLine);
    ++m_linesForwarded;
    m_out.publish(std::move(ev));
}
