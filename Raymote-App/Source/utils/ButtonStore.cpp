#include "utils/ButtonStore.hpp"
#include "utils/Log.hpp"
#include "utils/Utils.hpp"
#include <algorithm>
#include <filesystem>

ButtonStore::ButtonStore(std::string path)
    : m_path(std::move(path)) {
}

ButtonStore::Json ButtonStore::loadLocked() {
    std::error_code ec;
    if (!std::filesystem::exists(m_path, ec)) return Json::array();

    Json j;
    std::string err;
    if (!ReadJsonFile(m_path, j, err)) {
        LOGF("Errore caricamento pulsanti: {}", err);
        return Json::array();
    }
    if (!j.is_array()) {
        LOGF("Errore caricamento pulsanti: radice non array");
        return Json::array();
    }
    return j;
}

std::string ButtonStore::nextIdLocked() {
    // due create nello stesso millisecondo non devono collidere
    m_lastId = std::max(NowMillis(), m_lastId + 1);
    return std::to_string(m_lastId);
}

ButtonStore::Json ButtonStore::list() {
    std::lock_guard<std::mutex> lk(m_mx);
    return loadLocked();
}

bool ButtonStore::create(Json button, Json& all, std::string& err) {
    if (!button.is_object()) { err = "button_must_be_object"; return false; }

    std::lock_guard<std::mutex> lk(m_mx);
    Json buttons = loadLocked();
    button["id"] = nextIdLocked();
    buttons.push_back(std::move(button));

    if (!WriteJsonFile(m_path, buttons, err)) return false;
    all = std::move(buttons);
    return true;
}

bool ButtonStore::remove(const std::string& id, Json& all, std::string& err) {
    std::lock_guard<std::mutex> lk(m_mx);
    Json buttons = loadLocked();

    Json kept = Json::array();
    for (auto& b : buttons) {
        const bool match = b.is_object() && b.contains("id") && b["id"].is_string() && b["id"].get<std::string>() == id;
        if (!match) kept.push_back(b);
    }

    if (!WriteJsonFile(m_path, kept, err)) return false;
    all = std::move(kept);
    return true;
}
