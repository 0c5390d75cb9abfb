#pragma once

// Codici di errore restituiti via "std::string& err".
// Formato: "<codice>" oppure "<codice>: <motivo>".
inline constexpr const char* kErrEnumerationFailed = "enumeration_failed";
inline constexpr const char* kErrOpenFailed = "open_failed";
inline constexpr const char* kErrNotConnected = "not_connected";
inline constexpr const char* kErrWriteFailed = "write_failed";
inline constexpr const char* kErrPersistFailed = "persist_failed";
inline constexpr const char* kErrNotRunning = "not_running";
