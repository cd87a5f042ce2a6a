#pragma once
#include <optional>
#include <functional>
#include "Core/VolumeTypes.hpp"
#include "Core/Audio/AudioHal.hpp"

// Volume/mute del device di uscita predefinito tramite HAL.
// Ordine: VirtualMainVolume -> scalare main -> canali 1..4, ogni scrittura verificata.
class CoreAudioBackend {
public:
    explicit CoreAudioBackend(AudioHal& hal);

    bool hasDevice();

    // 0..1; media dei canali se manca il volume virtuale
    std::optional<float> readVolume();

    // false se nessun livello ha confermato la scrittura
    bool writeVolume(float v01);

    // nullopt = nessun mute hardware (usare il mute software)
    std::optional<bool> readHardwareMute();
    bool setHardwareMute(bool mute);

    DeviceIdentity deviceIdentity();

    // Sottoscrive cambio device/volume/mute; il sink deve solo accodare l'evento
    void subscribe(std::function<void(HalChange)> sink);
    void unsubscribe();

    // Dopo un cambio di device predefinito (dal contesto worker)
    void followDefaultDevice();

    static constexpr float kStrictTolerance = 0.02f;
    static constexpr float kChannelTolerance = 0.05f;
    static constexpr uint32_t kMaxChannel = 4;

private:
    std::optional<float> averageScalars(AudioDeviceId dev);

    AudioHal& m_hal;
};
