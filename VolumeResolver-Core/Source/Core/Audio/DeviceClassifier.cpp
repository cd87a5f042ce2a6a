#include "Core/Audio/DeviceClassifier.hpp"
#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

bool containsAny(const std::string& s, std::initializer_list<const char*> needles) {
    for (const char* n : needles) if (s.find(n) != std::string::npos) return true;
    return false;
}

DeviceCategory classifyByName(const std::string& name) {
    if (name.empty()) return DeviceCategory::None;

    if (containsAny(name, { "airpods" })) {
        if (containsAny(name, { "max" })) return DeviceCategory::AirPodsMax;
        if (containsAny(name, { "pro" })) return DeviceCategory::AirPodsPro;
        if (containsAny(name, { "3", "gen 3", "third" })) return DeviceCategory::AirPodsGen3;
        return DeviceCategory::AirPods;
    }

    if (containsAny(name, { "beats", "powerbeats", "studio buds" }))
        return DeviceCategory::Beats;

    if (containsAny(name, { "buds", "earbuds", "earbud", "galaxy buds", "pixel buds", "jabra", "wf-" }))
        return DeviceCategory::Earbuds;

    if (containsAny(name, { "headphone", "headset", "wh-", "bose", "quietcomfort",
                            "sennheiser", "momentum", "jbl", "skullcandy",
                            "audio-technica", "anker", "soundcore", "sony" }))
        return DeviceCategory::Headphones;

    return DeviceCategory::None;
}

} // namespace

DeviceCategory ClassifyOutputDevice(const std::string& deviceName, bool isBluetooth) {
    const DeviceCategory c = classifyByName(toLower(deviceName));
    if (c == DeviceCategory::None && isBluetooth) return DeviceCategory::Headphones;
    return c;
}

const char* SymbolForCategory(DeviceCategory c) {
    switch (c) {
    case DeviceCategory::AirPods:     return "airpods";
    case DeviceCategory::AirPodsPro:  return "airpodspro";
    case DeviceCategory::AirPodsMax:  return "airpodsmax";
    case DeviceCategory::AirPodsGen3: return "airpods.gen3";
    case DeviceCategory::Beats:       return "beats.headphones";
    case DeviceCategory::Earbuds:     return "earbuds";
    case DeviceCategory::Headphones:  return "headphones";
    case DeviceCategory::None:        break;
    }
    return nullptr;
}
