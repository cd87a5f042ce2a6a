#pragma once
#include <cstdint>
#include <string>
#include <optional>
#include <chrono>

// Identificativo opaco di un display (CGDirectDisplayID su macOS)
using DisplayId = uint32_t;

// Passo di volume: 1/16 della scala
inline constexpr float kVolumeStep = 1.0f / 16.0f;

// Clamp su [0,1] (NaN -> 0)
inline float clampVolume(float v) {
    if (!(v > 0.f)) return 0.f;
    if (v > 1.f) return 1.f;
    return v;
}

// Target di una operazione di volume: device interno o display esterno
struct VolumeTarget {
    enum class Kind { Builtin, ExternalDisplay };

    Kind kind = Kind::Builtin;
    DisplayId display = 0;       // valido solo per ExternalDisplay

    static VolumeTarget builtin() { return VolumeTarget{}; }
    static VolumeTarget externalDisplay(DisplayId id) { return VolumeTarget{ Kind::ExternalDisplay, id }; }

    bool isExternal() const { return kind == Kind::ExternalDisplay; }

    bool operator==(const VolumeTarget& o) const {
        return kind == o.kind && (kind == Kind::Builtin || display == o.display);
    }
    bool operator!=(const VolumeTarget& o) const { return !(*this == o); }
};

// Preferenza utente: quale target controllano i tasti volume
enum class TargetMode {
    Builtin,         // "builtin"
    ActiveDisplay    // "active_display"
};

// Coppia nativa DDC/CI (VCP 0x62)
struct RawDeviceVolume {
    uint16_t current = 0;
    uint16_t max = 0;
};

// Categoria del device di uscita (per le icone)
enum class DeviceCategory {
    None,
    AirPods,
    AirPodsPro,
    AirPodsMax,
    AirPodsGen3,
    Beats,
    Earbuds,
    Headphones
};

struct DeviceIdentity {
    std::string name;
    DeviceCategory category = DeviceCategory::None;
};

// Stato pubblicato agli osservatori (unica fonte di verità)
struct ObservableVolumeState {
    float rawVolume = 0.f;                                  // 0..1
    bool  isMuted = false;
    std::chrono::system_clock::time_point lastChangeAt{};   // epoch = "mai"
    std::optional<VolumeTarget> lastChangeTarget;
    std::string activeDeviceName;
    DeviceCategory activeDeviceCategory = DeviceCategory::None;
};

const char* toString(DeviceCategory c);
const char* toString(TargetMode m);
std::optional<TargetMode> parseTargetMode(const std::string& s);
