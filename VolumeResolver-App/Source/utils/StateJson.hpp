#pragma once
#include <nlohmann/json.hpp>
#include "Core/VolumeTypes.hpp"

// Serializzazione dello stato pubblicato per REST/SSE
nlohmann::json TargetToJson(const VolumeTarget& t);
nlohmann::json StateToJson(const ObservableVolumeState& s);
