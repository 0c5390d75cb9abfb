#include "utils/JsonPortConfigStore.hpp"
#include "utils/Log.hpp"
#include "utils/Utils.hpp"
#include "Core/Errors.hpp"
#include <filesystem>

using Json = nlohmann::json;

static std::optional<std::string> pathField(const Json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string()) return std::nullopt;
    auto v = j[key].get<std::string>();
    if (v.empty()) return std::nullopt;
    return v;
}

JsonPortConfigStore::JsonPortConfigStore(std::string path)
    : m_path(std::move(path)) {
}

PersistedPortConfig JsonPortConfigStore::load() {
    std::lock_guard<std::mutex> lk(m_mx);
    PersistedPortConfig cfg;

    std::error_code ec;
    if (!std::filesystem::exists(m_path, ec)) return cfg; // primo avvio

    Json j;
    std::string err;
    if (!ReadJsonFile(m_path, j, err)) {
        LOGF("Errore caricamento config porte: {}", err);
        return cfg;
    }
    if (!j.is_object()) {
        LOGF("Errore caricamento config porte: radice non oggetto");
        return cfg;
    }

    cfg.receiverPath = pathField(j, "receiverPort");
    cfg.transmitterPath = pathField(j, "transmitterPort");
    return cfg;
}

bool JsonPortConfigStore::save(const PersistedPortConfig& cfg, std::string& err) {
    std::lock_guard<std::mutex> lk(m_mx);
    std::string why;
    if (!WriteJsonFile(m_path, ToJson(cfg), why)) {
        err = std::string(kErrPersistFailed) + ": " + why;
        return false;
    }
    return true;
}

Json JsonPortConfigStore::ToJson(const PersistedPortConfig& cfg) {
    Json j = Json::object();
    j["receiverPort"] = cfg.receiverPath ? Json(*cfg.receiverPath) : Json(nullptr);
    j["transmitterPort"] = cfg.transmitterPath ? Json(*cfg.transmitterPath) : Json(nullptr);
    return j;
}
