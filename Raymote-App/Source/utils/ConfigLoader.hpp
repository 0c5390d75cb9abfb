#pragma once
#include <string>
#include "utils/Config.hpp"

// Carica e valida il JSON (strict). Ritorna true se valido.
// Le chiavi assenti mantengono il default; chiavi sconosciute o di tipo
// sbagliato sono un errore.
bool LoadConfigStrict(AppConfig& cfg, std::string& outErr, const std::string& configPath);
