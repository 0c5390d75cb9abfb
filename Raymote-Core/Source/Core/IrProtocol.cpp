#include "Core/IrProtocol.hpp"
#include <ctime>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

static bool hasFramingChars(std::string_view s) {
    return s.find_first_of(",\r\n") != std::string_view::npos;
}

bool IsForwardedLine(std::string_view line) {
    return line.find(kDecodedMarker) != std::string_view::npos
        || line.find(kReadyMarker) != std::string_view::npos;
}

std::string FormatTransmitLine(const TransmitCommand& cmd) {
    return fmt::format("{},{},{}\n", cmd.protocol, cmd.bitLength, cmd.code);
}

bool ValidateTransmitCommand(const TransmitCommand& cmd, std::string& err) {
    if (cmd.protocol.empty()) { err = "missing_protocol"; return false; }
    if (cmd.code.empty()) { err = "missing_code"; return false; }
    if (cmd.bitLength <= 0) { err = "invalid_bits"; return false; }
    if (hasFramingChars(cmd.protocol) || hasFramingChars(cmd.code)) {
        err = "invalid_characters";
        return false;
    }
    return true;
}

std::string FormatLocalTime(std::chrono::system_clock::time_point tp) {
    const auto tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&tt, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
    return buf;
}

std::string FormatEventFrame(const DecodedEvent& ev) {
    nlohmann::json msg = {
        {"timestamp", FormatLocalTime(ev.timestamp)},
        {"data",      ev.rawLine}
    };
    // il firmware può emettere byte non UTF-8: sostituiti invece di lanciare
    return "data: " + msg.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n\n";
}
