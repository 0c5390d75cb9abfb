#pragma once
#include <chrono>
#include <string>
#include <string_view>

// Linea decodificata dal firmware del ricevitore, pronta per il broadcast.
struct DecodedEvent {
    std::chrono::system_clock::time_point timestamp;
    std::string rawLine;
};

// Richiesta di trasmissione verso il firmware del trasmettitore.
struct TransmitCommand {
    std::string protocol;   // es. "NEC"
    int bitLength = 0;      // es. 32
    std::string code;       // es. "0x20DF10EF"
};

// Framing fisso imposto dal firmware
inline constexpr unsigned kSerialBaudRate = 9600;
inline constexpr std::string_view kLineDelimiter = "\r\n";

// Marker riconosciuti nelle linee del ricevitore
inline constexpr std::string_view kDecodedMarker = "Decoded";
inline constexpr std::string_view kReadyMarker = "Ready to receive";

inline constexpr std::string_view kKeepaliveFrame = ": keepalive\n\n";

// true se la linea contiene uno dei marker; le altre sono rumore del firmware
bool IsForwardedLine(std::string_view line);

// "<protocol>,<bitLength>,<code>\n"
std::string FormatTransmitLine(const TransmitCommand& cmd);

// Rifiuta campi vuoti o contenenti ',', '\r' o '\n' (romperebbero il framing)
bool ValidateTransmitCommand(const TransmitCommand& cmd, std::string& err);

// Ora locale "HH:MM:SS"
std::string FormatLocalTime(std::chrono::system_clock::time_point tp);

// "data: {\"data\":...,\"timestamp\":...}\n\n"
std::string FormatEventFrame(const DecodedEvent& ev);
