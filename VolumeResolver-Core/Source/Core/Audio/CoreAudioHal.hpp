#pragma once
#include <mutex>
#include <vector>
#include <CoreAudio/CoreAudio.h>
#include "Core/Audio/AudioHal.hpp"

// AudioHal su CoreAudio (AudioObject*)
class CoreAudioHal : public AudioHal {
public:
    CoreAudioHal() = default;
    ~CoreAudioHal() override;

    CoreAudioHal(const CoreAudioHal&) = delete;
    CoreAudioHal& operator=(const CoreAudioHal&) = delete;

    AudioDeviceId defaultOutputDevice() override;

    bool hasVirtualMainVolume(AudioDeviceId dev) override;
    std::optional<float> getVirtualMainVolume(AudioDeviceId dev) override;
    bool setVirtualMainVolume(AudioDeviceId dev, float v) override;

    std::optional<float> getVolumeScalar(AudioDeviceId dev, uint32_t element) override;
    bool setVolumeScalar(AudioDeviceId dev, uint32_t element, float v) override;

    std::optional<bool> getMute(AudioDeviceId dev) override;
    bool setMute(AudioDeviceId dev, bool mute) override;

    std::string deviceName(AudioDeviceId dev) override;
    AudioTransport transportType(AudioDeviceId dev) override;

    void startListening(std::function<void(HalChange)> onChange) override;
    void stopListening() override;
    void followDefaultDevice() override;

private:
    static OSStatus OnSystemChanged(AudioObjectID, UInt32, const AudioObjectPropertyAddress*, void* self);
    static OSStatus OnDeviceChanged(AudioObjectID, UInt32, const AudioObjectPropertyAddress*, void* self);

    // richiedono m_attachMx
    void attachDevice_(AudioDeviceId dev);
    void detachDevice_();
    void emit(HalChange c);

    // m_attachMx serializza Add/RemovePropertyListener e non viene mai preso dai callback HAL:
    // RemovePropertyListener attende i callback in volo.
    std::mutex m_attachMx;
    std::mutex m_mx;                                   // solo m_onChange
    std::function<void(HalChange)> m_onChange;
    bool m_listening = false;
    AudioDeviceId m_watchedDevice = kNoAudioDevice;
    std::vector<AudioObjectPropertyAddress> m_deviceAddrs;   // listener registrati sul device
};
