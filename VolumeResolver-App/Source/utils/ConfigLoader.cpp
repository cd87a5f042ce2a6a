#include "utils/ConfigLoader.hpp"
#include <fstream>
#include "utils/Utils.hpp"

using nlohmann::json;

static bool parseVolumeSection(AppConfig& cfg, std::string& outErr, const json& j) {
    if (!j.contains("volume") || !j["volume"].is_object()) { outErr = "Chiave 'volume' mancante o non oggetto."; return false; }
    const auto& v = j["volume"];

    if (!v.contains("target") || !v["target"].is_string()) { outErr = "Chiave 'volume.target' mancante o non stringa."; return false; }
    const std::string raw = v["target"].get<std::string>();
    auto mode = parseTargetMode(toLower(raw));
    if (!mode) { outErr = "volume.target non valido: '" + raw + "' (ammessi: builtin, active_display)"; return false; }
    cfg.target = *mode;
    return true;
}

static bool parseApiSection(AppConfig& cfg, std::string& outErr, const json& j) {
    if (!j.contains("api")) return true; // opzionale: restano i default
    const auto& a = j["api"];
    if (!a.is_object()) { outErr = "Chiave 'api' non oggetto."; return false; }

    if (a.contains("host")) {
        if (!a["host"].is_string() || a["host"].get<std::string>().empty()) { outErr = "'api.host' deve essere una stringa non vuota."; return false; }
        cfg.api.host = a["host"].get<std::string>();
    }
    if (a.contains("port")) {
        if (!a["port"].is_number_integer()) { outErr = "'api.port' deve essere un intero."; return false; }
        const auto p = a["port"].get<long long>();
        if (p < 1 || p > 65535) { outErr = "'api.port' fuori range (1..65535)."; return false; }
        cfg.api.port = static_cast<int>(p);
    }
    if (a.contains("cors")) {
        if (!a["cors"].is_boolean()) { outErr = "'api.cors' deve essere booleano."; return false; }
        cfg.api.cors = a["cors"].get<bool>();
    }
    return true;
}

bool ParseConfigStrict(AppConfig& cfg, std::string& outErr, const json& j) {
    cfg = {};
    if (!j.is_object()) { outErr = "La radice del config deve essere un oggetto."; return false; }
    if (!parseVolumeSection(cfg, outErr, j)) return false;
    if (!parseApiSection(cfg, outErr, j)) return false;
    return true;
}

bool LoadConfigStrict(AppConfig& cfg, std::string& outErr, const std::string& configPath) {
    try {
        std::ifstream f(configPath);
        if (!f) { outErr = "Impossibile aprire il file: " + configPath; return false; }

        json j; f >> j; // può lanciare
        return ParseConfigStrict(cfg, outErr, j);
    }
    catch (const json::exception& ex) {
        outErr = std::string("Errore di parsing JSON: ") + ex.what() + ". Ricorda: il JSON standard non supporta i commenti.";
        return false;
    }
}

json ConfigToJson(const AppConfig& cfg) {
    return json{
        {"volume", { {"target", toString(cfg.target)} }},
        {"api",    { {"host", cfg.api.host}, {"port", cfg.api.port}, {"cors", cfg.api.cors} }}
    };
}
