#include "Core/VolumeTypes.hpp"

const char* toString(DeviceCategory c) {
    switch (c) {
    case DeviceCategory::None:        return "none";
    case DeviceCategory::AirPods:     return "airpods";
    case DeviceCategory::AirPodsPro:  return "airpods_pro";
    case DeviceCategory::AirPodsMax:  return "airpods_max";
    case DeviceCategory::AirPodsGen3: return "airpods_gen3";
    case DeviceCategory::Beats:       return "beats";
    case DeviceCategory::Earbuds:     return "earbuds";
    case DeviceCategory::Headphones:  return "headphones";
    }
    return "none";
}

const char* toString(TargetMode m) {
    return m == TargetMode::ActiveDisplay ? "active_display" : "builtin";
}

std::optional<TargetMode> parseTargetMode(const std::string& s) {
    if (s == "builtin") return TargetMode::Builtin;
    if (s == "active_display") return TargetMode::ActiveDisplay;
    return std::nullopt;
}
