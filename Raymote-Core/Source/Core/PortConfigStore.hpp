#pragma once
#include <optional>
#include <string>

// Porte salvate per il riconnessione all'avvio
struct PersistedPortConfig {
    std::optional<std::string> receiverPath;
    std::optional<std::string> transmitterPath;
};

// Persistenza della configurazione porte, fornita dal layer applicativo.
class PortConfigStore {
public:
    virtual ~PortConfigStore() = default;

    // Mai fallisce: file assente o illeggibile = config vuota
    virtual PersistedPortConfig load() = 0;

    // err = "persist_failed: <motivo>"
    virtual bool save(const PersistedPortConfig& cfg, std::string& err) = 0;
};
