#pragma once
#include <string>
#include <vector>

struct PortDescriptor {
    std::string path;           // es. "/dev/ttyUSB0"
    std::string manufacturer;   // "Unknown" se non disponibile
};

inline constexpr const char* kDefaultSysfsTtyRoot = "/sys/class/tty";

// Elenca solo le seriali USB (ttyUSB*, ttyACM*), escluse quelle di bordo (ttyS*).
// Ordinate per path. Lista vuota = nessun dispositivo, non è un errore.
// Se la directory sysfs non è leggibile: false, err = "enumeration_failed: <motivo>".
bool ListSerialPorts(std::vector<PortDescriptor>& out, std::string& err,
                     const std::string& sysfsRoot = kDefaultSysfsTtyRoot);

bool IsUsbSerialName(const std::string& name);
