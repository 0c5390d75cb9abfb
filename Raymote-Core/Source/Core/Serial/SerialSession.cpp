#include "Core/Serial/SerialSession.hpp"
#include "Core/Errors.hpp"
#include "Core/IrProtocol.hpp"
#include <fmt/core.h>

SerialSession::SerialSession(asio::io_context& io, std::string name)
    : m_io(io), m_name(std::move(name)) {
}

SerialSession::~SerialSession() {
    if (m_serial) {
        // niente hook virtuali dal distruttore: le sottoclassi chiudono da sé
        ++m_generation;
        asio::error_code ignored;
        m_serial->cancel(ignored);
        m_serial->close(ignored);
        m_serial.reset();
    }
}

bool SerialSession::connect(const std::optional<std::string>& path, ConnectResult& out, std::string& err) {
    // mai due connessioni per lo stesso ruolo
    closePort();

    if (!path || path->empty()) {
        setState(SessionStatus::Disconnected);
        out.connected = false;
        return true;
    }

    setState(SessionStatus::Connecting);

    auto serial = std::make_unique<asio::serial_port>(m_io);
    asio::error_code ec;
    serial->open(*path, ec);
    if (!ec) serial->set_option(asio::serial_port_base::baud_rate(kSerialBaudRate), ec);
    if (!ec) serial->set_option(asio::serial_port_base::character_size(8), ec);
    if (!ec) serial->set_option(asio::serial_port_base::parity(asio::serial_port_base::parity::none), ec);
    if (!ec) serial->set_option(asio::serial_port_base::stop_bits(asio::serial_port_base::stop_bits::one), ec);
    if (!ec) serial->set_option(asio::serial_port_base::flow_control(asio::serial_port_base::flow_control::none), ec);

    if (ec) {
        fmt::print("[{}] Errore apertura {}: {}\n", m_name, *path, ec.message());
        asio::error_code ignored;
        serial->close(ignored);
        err = fmt::format("{}: {}", kErrOpenFailed, ec.message());
        setState(SessionStatus::Failed, ec.message());
        return false;
    }

    m_serial = std::move(serial);
    ++m_generation;
    {
        std::lock_guard<std::mutex> lk(m_mx);
        m_path = *path;
    }
    setState(SessionStatus::Connected);
    fmt::print("[{}] Connesso a {} @ {}\n", m_name, *path, kSerialBaudRate);

    onOpened();
    out.connected = true;
    return true;
}

void SerialSession::disconnect() {
    closePort();
    setState(SessionStatus::Disconnected);
}

void SerialSession::fail(const std::string& reason) {
    fmt::print("[{}] Errore IO: {}\n", m_name, reason);
    closePort();
    setState(SessionStatus::Failed, reason);
}

void SerialSession::closePort() {
    if (!m_serial) return;

    onClosing();
    ++m_generation;
    asio::error_code ignored;
    m_serial->cancel(ignored);
    m_serial->close(ignored);
    m_serial.reset();

    std::string path;
    {
        std::lock_guard<std::mutex> lk(m_mx);
        path = std::move(m_path);
        m_path.clear();
    }
    fmt::print("[{}] Disconnesso da {}\n", m_name, path);
}

void SerialSession::setState(SessionStatus status, std::string reason) {
    std::lock_guard<std::mutex> lk(m_mx);
    m_state.status = status;
    m_state.reason = std::move(reason);
}

SessionState SerialSession::state() const {
    std::lock_guard<std::mutex> lk(m_mx);
    return m_state;
}

std::string SerialSession::portPath() const {
    std::lock_guard<std::mutex> lk(m_mx);
    return m_path;
}

bool SerialSession::isOpen() const {
    return m_serial && m_serial->is_open();
}
