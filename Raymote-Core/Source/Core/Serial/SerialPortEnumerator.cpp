#include "Core/Serial/SerialPortEnumerator.hpp"
#include "Core/Errors.hpp"
#include <algorithm>
#include <filesystem>
#include <fmt/core.h>
#include <fstream>

namespace fs = std::filesystem;

static inline std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    auto e = s.find_last_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    return s.substr(b, e - b + 1);
}

// Risale dal nodo "device" fino al dispositivo USB che espone "manufacturer".
// ttyACM: device -> interfaccia -> dispositivo; ttyUSB: un livello in più.
static std::string readManufacturer(const fs::path& ttyDir) {
    std::error_code ec;
    fs::path dev = fs::canonical(ttyDir / "device", ec);
    if (ec) return "Unknown";

    for (int depth = 0; depth < 4 && !dev.empty(); ++depth) {
        std::ifstream f(dev / "manufacturer");
        if (f) {
            std::string name;
            std::getline(f, name);
            name = trim(name);
            if (!name.empty()) return name;
        }
        if (dev == dev.parent_path()) break;
        dev = dev.parent_path();
    }
    return "Unknown";
}

bool IsUsbSerialName(const std::string& name) {
    return name.rfind("ttyUSB", 0) == 0 || name.rfind("ttyACM", 0) == 0;
}

bool ListSerialPorts(std::vector<PortDescriptor>& out, std::string& err, const std::string& sysfsRoot) {
    out.clear();

    std::error_code ec;
    fs::directory_iterator it(sysfsRoot, ec);
    if (ec) {
        err = fmt::format("{}: {}", kErrEnumerationFailed, ec.message());
        return false;
    }

    for (const auto& entry : it) {
        const std::string name = entry.path().filename().string();
        if (!IsUsbSerialName(name)) continue;
        out.push_back(PortDescriptor{ "/dev/" + name, readManufacturer(entry.path()) });
    }

    std::sort(out.begin(), out.end(),
        [](const PortDescriptor& a, const PortDescriptor& b) { return a.path < b.path; });
    return true;
}
