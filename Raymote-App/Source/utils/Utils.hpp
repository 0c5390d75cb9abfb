#pragma once
#include <chrono>
#include <cstdint>
#include <fstream>
#include <string>
#include <nlohmann/json.hpp>

// millisecondi dall'epoch
static inline std::int64_t NowMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// Legge un file JSON. false se il file non si apre o non è JSON valido.
static inline bool ReadJsonFile(const std::string& path, nlohmann::json& out, std::string& err) {
    try {
        std::ifstream f(path, std::ios::binary);
        if (!f) { err = "cannot_open: " + path; return false; }
        f >> out; // può lanciare
        return true;
    }
    catch (const std::exception& ex) {
        err = std::string("bad_json: ") + ex.what();
        return false;
    }
}

// Scrive un file JSON indentato a 2 spazi
static inline bool WriteJsonFile(const std::string& path, const nlohmann::json& j, std::string& err) {
    try {
        std::ofstream f(path, std::ios::binary | std::ios::trunc);
        if (!f) { err = "cannot_write: " + path; return false; }
        f << j.dump(2);
        f.close();
        if (!f) { err = "cannot_write: " + path; return false; }
        return true;
    }
    catch (const std::exception& ex) {
        err = std::string("cannot_write: ") + ex.what();
        return false;
    }
}
