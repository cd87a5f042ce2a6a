#include "Core/Audio/CoreAudioBackend.hpp"
#include "Core/Audio/DeviceClassifier.hpp"
#include "Core/Log.hpp"
#include <cmath>

CoreAudioBackend::CoreAudioBackend(AudioHal& hal) : m_hal(hal) {
}

bool CoreAudioBackend::hasDevice() {
    return m_hal.defaultOutputDevice() != kNoAudioDevice;
}

std::optional<float> CoreAudioBackend::averageScalars(AudioDeviceId dev) {
    float sum = 0.f;
    int n = 0;
    for (uint32_t el = kMainElement; el <= kMaxChannel; ++el) {
        if (auto v = m_hal.getVolumeScalar(dev, el)) { sum += *v; ++n; }
    }
    if (n == 0) return std::nullopt;
    return sum / static_cast<float>(n);
}

std::optional<float> CoreAudioBackend::readVolume() {
    const AudioDeviceId dev = m_hal.defaultOutputDevice();
    if (dev == kNoAudioDevice) return std::nullopt;

    // VirtualMainVolume funziona anche con device USB multi-canale
    if (m_hal.hasVirtualMainVolume(dev)) {
        if (auto v = m_hal.getVirtualMainVolume(dev)) return clampVolume(*v);
    }
    if (auto avg = averageScalars(dev)) return clampVolume(*avg);
    return std::nullopt;
}

bool CoreAudioBackend::writeVolume(float v01) {
    const AudioDeviceId dev = m_hal.defaultOutputDevice();
    if (dev == kNoAudioDevice) return false;
    const float v = clampVolume(v01);

    // 1) volume virtuale, verificato (alcuni USB dicono ok ma non applicano)
    if (m_hal.hasVirtualMainVolume(dev) && m_hal.setVirtualMainVolume(dev, v)) {
        auto rb = m_hal.getVirtualMainVolume(dev);
        if (rb && std::fabs(*rb - v) < kStrictTolerance) return true;
        LOGF("[HAL] device {}: VirtualMainVolume non applicato (letto {})", dev, rb ? *rb : -1.f);
    }

    // 2) scalare sull'elemento main
    if (m_hal.setVolumeScalar(dev, kMainElement, v)) {
        auto rb = m_hal.getVolumeScalar(dev, kMainElement);
        if (rb && std::fabs(*rb - v) < kStrictTolerance) return true;
    }

    // 3) singoli canali: basta che uno confermi
    bool confirmed = false;
    for (uint32_t ch = 1; ch <= kMaxChannel; ++ch) {
        if (!m_hal.setVolumeScalar(dev, ch, v)) continue;
        auto rb = m_hal.getVolumeScalar(dev, ch);
        if (rb && std::fabs(*rb - v) < kChannelTolerance) confirmed = true;
    }
    if (!confirmed) LOGF("[HAL] device {}: scrittura volume {:.3f} non verificata", dev, v);
    return confirmed;
}

std::optional<bool> CoreAudioBackend::readHardwareMute() {
    const AudioDeviceId dev = m_hal.defaultOutputDevice();
    if (dev == kNoAudioDevice) return std::nullopt;
    return m_hal.getMute(dev);
}

bool CoreAudioBackend::setHardwareMute(bool mute) {
    const AudioDeviceId dev = m_hal.defaultOutputDevice();
    if (dev == kNoAudioDevice) return false;
    return m_hal.setMute(dev, mute);
}

DeviceIdentity CoreAudioBackend::deviceIdentity() {
    DeviceIdentity id;
    const AudioDeviceId dev = m_hal.defaultOutputDevice();
    if (dev == kNoAudioDevice) return id;

    id.name = m_hal.deviceName(dev);
    id.category = ClassifyOutputDevice(id.name, m_hal.transportType(dev) == AudioTransport::Bluetooth);
    return id;
}

void CoreAudioBackend::subscribe(std::function<void(HalChange)> sink) {
    m_hal.startListening(std::move(sink));
}

void CoreAudioBackend::unsubscribe() {
    m_hal.stopListening();
}

void CoreAudioBackend::followDefaultDevice() {
    m_hal.followDefaultDevice();
}
