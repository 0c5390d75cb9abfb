#pragma once
#include <cstdint>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

// Pulsanti salvati: array JSON di oggetti arbitrari con campo "id".
class ButtonStore {
public:
    using Json = nlohmann::json;

    explicit ButtonStore(std::string path);

    // Errori di lettura: loggati, lista vuota
    Json list();

    // Assegna "id" (ms dall'epoch), aggiunge e salva. all = lista aggiornata.
    bool create(Json button, Json& all, std::string& err);

    // Rimuove per id (assente = no-op) e salva. all = lista aggiornata.
    bool remove(const std::string& id, Json& all, std::string& err);

private:
    Json loadLocked();
    std::string nextIdLocked();

    std::string m_path;
    std::mutex m_mx;
    std::int64_t m_lastId{ 0 };
};
