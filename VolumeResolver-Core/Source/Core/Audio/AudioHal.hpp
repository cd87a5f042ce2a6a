#pragma once
#include <cstdint>
#include <string>
#include <optional>
#include <functional>

using AudioDeviceId = uint32_t;
inline constexpr AudioDeviceId kNoAudioDevice = 0;   // kAudioObjectUnknown

// Elemento "main" delle proprietà HAL; i canali partono da 1
inline constexpr uint32_t kMainElement = 0;

enum class AudioTransport {
    Unknown,
    BuiltIn,
    Usb,
    Bluetooth,
    Other
};

// Eventi di cambio proprietà inoltrati dal HAL
enum class HalChange {
    DefaultDevice,
    Volume,
    Mute
};

// Accesso minimo alle proprietà del device di uscita.
// Nessuna eccezione: proprietà assenti o errori = nullopt / false.
class AudioHal {
public:
    virtual ~AudioHal() = default;

    virtual AudioDeviceId defaultOutputDevice() = 0;

    // kAudioHardwareServiceDeviceProperty_VirtualMainVolume
    virtual bool hasVirtualMainVolume(AudioDeviceId dev) = 0;
    virtual std::optional<float> getVirtualMainVolume(AudioDeviceId dev) = 0;
    virtual bool setVirtualMainVolume(AudioDeviceId dev, float v) = 0;

    // kAudioDevicePropertyVolumeScalar per elemento (main, 1..n)
    virtual std::optional<float> getVolumeScalar(AudioDeviceId dev, uint32_t element) = 0;
    virtual bool setVolumeScalar(AudioDeviceId dev, uint32_t element, float v) = 0;

    // kAudioDevicePropertyMute; nullopt se il device non ha un mute hardware
    virtual std::optional<bool> getMute(AudioDeviceId dev) = 0;
    virtual bool setMute(AudioDeviceId dev, bool mute) = 0;

    virtual std::string deviceName(AudioDeviceId dev) = 0;
    virtual AudioTransport transportType(AudioDeviceId dev) = 0;

    // onChange può arrivare su un thread HAL qualsiasi
    virtual void startListening(std::function<void(HalChange)> onChange) = 0;
    virtual void stopListening() = 0;

    // Sposta i listener di volume/mute sul device predefinito corrente.
    // Mai dal thread HAL: va chiamato dal contesto che consuma gli eventi.
    virtual void followDefaultDevice() = 0;
};
