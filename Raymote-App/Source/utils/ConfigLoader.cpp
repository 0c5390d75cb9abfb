#include "utils/ConfigLoader.hpp"
#include <fstream>
#include <initializer_list>
#include <nlohmann/json.hpp>

using nlohmann::json;

static bool rejectUnknownKeys(const json& obj, std::initializer_list<const char*> known,
                              const std::string& ctx, std::string& outErr) {
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        bool ok = false;
        for (const char* k : known) if (it.key() == k) { ok = true; break; }
        if (!ok) { outErr = "Chiave sconosciuta: '" + ctx + it.key() + "'."; return false; }
    }
    return true;
}

static bool readString(const json& obj, const char* key, std::string& out,
                       const std::string& ctx, std::string& outErr) {
    if (!obj.contains(key)) return true;
    if (!obj[key].is_string()) { outErr = "Chiave '" + ctx + key + "' deve essere stringa."; return false; }
    out = obj[key].get<std::string>();
    if (out.empty()) { outErr = "Chiave '" + ctx + key + "' vuota."; return false; }
    return true;
}

static bool parseHttp(AppConfig& cfg, std::string& outErr, const json& h) {
    if (!h.is_object()) { outErr = "Chiave 'http' non oggetto."; return false; }
    if (!rejectUnknownKeys(h, { "host", "port", "cors", "maxEventStreams" }, "http.", outErr)) return false;

    if (!readString(h, "host", cfg.http.host, "http.", outErr)) return false;
    if (h.contains("port")) {
        if (!h["port"].is_number_unsigned()) { outErr = "Chiave 'http.port' non intero positivo."; return false; }
        const auto p = h["port"].get<unsigned>();
        if (p == 0 || p > 65535) { outErr = "Chiave 'http.port' fuori range (1..65535)."; return false; }
        cfg.http.port = static_cast<int>(p);
    }
    if (h.contains("cors")) {
        if (!h["cors"].is_boolean()) { outErr = "Chiave 'http.cors' non booleana."; return false; }
        cfg.http.cors = h["cors"].get<bool>();
    }
    if (h.contains("maxEventStreams")) {
        if (!h["maxEventStreams"].is_number_unsigned() || h["maxEventStreams"].get<unsigned>() == 0) {
            outErr = "Chiave 'http.maxEventStreams' deve essere un intero > 0.";
            return false;
        }
        cfg.http.maxEventStreams = h["maxEventStreams"].get<unsigned>();
    }
    return true;
}

static bool parseFiles(AppConfig& cfg, std::string& outErr, const json& f) {
    if (!f.is_object()) { outErr = "Chiave 'files' non oggetto."; return false; }
    if (!rejectUnknownKeys(f, { "portConfig", "buttons", "public" }, "files.", outErr)) return false;

    return readString(f, "portConfig", cfg.files.portConfig, "files.", outErr)
        && readString(f, "buttons", cfg.files.buttons, "files.", outErr)
        && readString(f, "public", cfg.files.publicDir, "files.", outErr);
}

static bool parseEvents(AppConfig& cfg, std::string& outErr, const json& e) {
    if (!e.is_object()) { outErr = "Chiave 'events' non oggetto."; return false; }
    if (!rejectUnknownKeys(e, { "keepaliveSeconds" }, "events.", outErr)) return false;

    if (e.contains("keepaliveSeconds")) {
        if (!e["keepaliveSeconds"].is_number_unsigned() || e["keepaliveSeconds"].get<unsigned>() == 0) {
            outErr = "Chiave 'events.keepaliveSeconds' deve essere un intero > 0.";
            return false;
        }
        cfg.keepaliveSeconds = e["keepaliveSeconds"].get<unsigned>();
    }
    return true;
}

bool LoadConfigStrict(AppConfig& cfg, std::string& outErr, const std::string& configPath) {
    cfg = {};

    try {
        std::ifstream f(configPath);
        if (!f) { outErr = "Impossibile aprire il file: " + configPath; return false; }

        json j; f >> j; // può lanciare

        if (!j.is_object()) { outErr = "La radice del config deve essere un oggetto."; return false; }
        if (!rejectUnknownKeys(j, { "http", "files", "events" }, "", outErr)) return false;

        if (j.contains("http") && !parseHttp(cfg, outErr, j["http"])) return false;
        if (j.contains("files") && !parseFiles(cfg, outErr, j["files"])) return false;
        if (j.contains("events") && !parseEvents(cfg, outErr, j["events"])) return false;

        return true;
    }
    catch (const std::exception& ex) {
        outErr = std::string("Errore di parsing JSON: ") + ex.what() + ". Ricorda: il JSON standard non supporta i commenti.";
        return false;
    }
}
