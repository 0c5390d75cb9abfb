#pragma once
#include <string>

// Ruolo funzionale di uno dei due slot seriali
enum class SessionRole {
    Receiver,
    Transmitter
};

enum class SessionStatus {
    Disconnected,
    Connecting,
    Connected,
    Failed
};

// Stato di una sessione; reason valorizzato solo in Failed
struct SessionState {
    SessionStatus status = SessionStatus::Disconnected;
    std::string reason;

    bool isConnected() const { return status == SessionStatus::Connected; }
};

// Risultato di connect(): connected=false per una richiesta di disconnessione
struct ConnectResult {
    bool connected = false;
};

inline const char* ToString(SessionRole role) {
    return role == SessionRole::Receiver ? "receiver" : "transmitter";
}

inline const char* ToString(SessionStatus status) {
    switch (status) {
    case SessionStatus::Disconnected: return "disconnected";
    case SessionStatus::Connecting:   return "connecting";
    case SessionStatus::Connected:    return "connected";
    case SessionStatus::Failed:       return "failed";
    }
    return "unknown";
}
