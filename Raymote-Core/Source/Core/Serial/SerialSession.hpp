#pragma once
#include "Core/SessionState.hpp"
#include <asio.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

// Possiede al massimo una connessione seriale aperta per un ruolo.
// connect/disconnect e tutte le operazioni asincrone vanno chiamate sul
// thread dell'io_context; state()/portPath() sono thread-safe.
class SerialSession {
public:
    SerialSession(asio::io_context& io, std::string name);
    virtual ~SerialSession();

    SerialSession(const SerialSession&) = delete;
    SerialSession& operator=(const SerialSession&) = delete;

    // Chiude l'eventuale connessione esistente, poi apre path @ 9600 8N1.
    // path assente o vuoto = richiesta di disconnessione (out.connected=false, ritorna true).
    // In caso di errore: err = "open_failed: <motivo>", stato Failed.
    bool connect(const std::optional<std::string>& path, ConnectResult& out, std::string& err);

    void disconnect();

    [[nodiscard]] SessionState state() const;
    [[nodiscard]] std::string portPath() const;
    [[nodiscard]] bool isOpen() const;

protected:
    // Hook per le sottoclassi, sul thread dell'io_context
    virtual void onOpened() {}
    virtual void onClosing() {}

    // Errore I/O non richiesto (cavo scollegato): chiude e passa a Failed
    void fail(const std::string& reason);

    asio::serial_port& port() { return *m_serial; }

    // Incrementata a ogni apertura/chiusura: gli handler con generazione
    // diversa appartengono a una connessione già chiusa e vanno scartati.
    [[nodiscard]] std::uint64_t generation() const { return m_generation; }

    const std::string& name() const { return m_name; }

private:
    void closePort();
    void setState(SessionStatus status, std::string reason = {});

    asio::io_context& m_io;
    std::string m_name;
    std::unique_ptr<asio::serial_port> m_serial;
    std::uint64_t m_generation{ 0 };

    mutable std::mutex m_mx;
    SessionState m_state;
    std::string m_path;
};
