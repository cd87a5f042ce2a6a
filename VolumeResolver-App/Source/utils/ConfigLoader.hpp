#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "utils/Config.hpp"

// Carica e valida il JSON (strict). Ritorna true se valido.
// "configPath" può essere, ad esempio, "Source/config.json" o "config.json".
bool LoadConfigStrict(AppConfig& cfg, std::string& outErr, const std::string& configPath);

// Stessa validazione su un JSON già in memoria (usata da PUT /config/validate)
bool ParseConfigStrict(AppConfig& cfg, std::string& outErr, const nlohmann::json& j);

// AppConfig -> JSON nel formato del file
nlohmann::json ConfigToJson(const AppConfig& cfg);
