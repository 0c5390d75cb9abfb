#pragma once
#include "Core/PortConfigStore.hpp"
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

// Config porte su file JSON: { "receiverPort": "/dev/ttyUSB0" | null, "transmitterPort": ... }
class JsonPortConfigStore : public PortConfigStore {
public:
    explicit JsonPortConfigStore(std::string path);

    PersistedPortConfig load() override;
    bool save(const PersistedPortConfig& cfg, std::string& err) override;

    static nlohmann::json ToJson(const PersistedPortConfig& cfg);

private:
    std::string m_path;
    std::mutex m_mx;
};
