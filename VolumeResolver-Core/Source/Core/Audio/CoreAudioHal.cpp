#include "Core/Audio/CoreAudioHal.hpp"
#include "Core/Log.hpp"

#include <AudioToolbox/AudioServices.h>

namespace {

AudioObjectPropertyAddress outputAddr(AudioObjectPropertySelector sel, UInt32 element = kAudioObjectPropertyElementMain) {
    return AudioObjectPropertyAddress{ sel, kAudioDevicePropertyScopeOutput, element };
}

AudioObjectPropertyAddress globalAddr(AudioObjectPropertySelector sel) {
    return AudioObjectPropertyAddress{ sel, kAudioObjectPropertyScopeGlobal, kAudioObjectPropertyElementMain };
}

// Proprietà presente e con payload della dimensione attesa
bool hasSizedProperty(AudioObjectID obj, const AudioObjectPropertyAddress& addr, UInt32 expected) {
    if (!AudioObjectHasProperty(obj, &addr)) return false;
    UInt32 size = 0;
    if (AudioObjectGetPropertyDataSize(obj, &addr, 0, nullptr, &size) != noErr) return false;
    return size == expected;
}

bool isSettable(AudioObjectID obj, const AudioObjectPropertyAddress& addr) {
    Boolean settable = false;
    if (AudioObjectIsPropertySettable(obj, &addr, &settable) != noErr) return false;
    return settable != 0;
}

} // namespace

CoreAudioHal::~CoreAudioHal() {
    stopListening();
}

AudioDeviceId CoreAudioHal::defaultOutputDevice() {
    AudioObjectID dev = kAudioObjectUnknown;
    UInt32 size = sizeof(dev);
    auto addr = globalAddr(kAudioHardwarePropertyDefaultOutputDevice);
    if (AudioObjectGetPropertyData(kAudioObjectSystemObject, &addr, 0, nullptr, &size, &dev) != noErr)
        return kNoAudioDevice;
    return dev;
}

bool CoreAudioHal::hasVirtualMainVolume(AudioDeviceId dev) {
    auto addr = outputAddr(kAudioHardwareServiceDeviceProperty_VirtualMainVolume);
    return dev != kNoAudioDevice && AudioObjectHasProperty(dev, &addr);
}

std::optional<float> CoreAudioHal::getVirtualMainVolume(AudioDeviceId dev) {
    auto addr = outputAddr(kAudioHardwareServiceDeviceProperty_VirtualMainVolume);
    Float32 v = 0;
    UInt32 size = sizeof(v);
    if (AudioObjectGetPropertyData(dev, &addr, 0, nullptr, &size, &v) != noErr) return std::nullopt;
    return v;
}

bool CoreAudioHal::setVirtualMainVolume(AudioDeviceId dev, float v) {
    auto addr = outputAddr(kAudioHardwareServiceDeviceProperty_VirtualMainVolume);
    Float32 val = v;
    return AudioObjectSetPropertyData(dev, &addr, 0, nullptr, sizeof(val), &val) == noErr;
}

std::optional<float> CoreAudioHal::getVolumeScalar(AudioDeviceId dev, uint32_t element) {
    auto addr = outputAddr(kAudioDevicePropertyVolumeScalar, element);
    if (!hasSizedProperty(dev, addr, sizeof(Float32))) return std::nullopt;
    Float32 v = 0;
    UInt32 size = sizeof(v);
    if (AudioObjectGetPropertyData(dev, &addr, 0, nullptr, &size, &v) != noErr) return std::nullopt;
    return v;
}

bool CoreAudioHal::setVolumeScalar(AudioDeviceId dev, uint32_t element, float v) {
    auto addr = outputAddr(kAudioDevicePropertyVolumeScalar, element);
    if (!AudioObjectHasProperty(dev, &addr) || !isSettable(dev, addr)) return false;
    Float32 val = v;
    return AudioObjectSetPropertyData(dev, &addr, 0, nullptr, sizeof(val), &val) == noErr;
}

std::optional<bool> CoreAudioHal::getMute(AudioDeviceId dev) {
    auto addr = outputAddr(kAudioDevicePropertyMute);
    if (!hasSizedProperty(dev, addr, sizeof(UInt32))) return std::nullopt;
    UInt32 muted = 0;
    UInt32 size = sizeof(muted);
    if (AudioObjectGetPropertyData(dev, &addr, 0, nullptr, &size, &muted) != noErr) return std::nullopt;
    return muted != 0;
}

bool CoreAudioHal::setMute(AudioDeviceId dev, bool mute) {
    auto addr = outputAddr(kAudioDevicePropertyMute);
    if (!hasSizedProperty(dev, addr, sizeof(UInt32))) return false;
    UInt32 val = mute ? 1 : 0;
    return AudioObjectSetPropertyData(dev, &addr, 0, nullptr, sizeof(val), &val) == noErr;
}

std::string CoreAudioHal::deviceName(AudioDeviceId dev) {
    auto addr = globalAddr(kAudioObjectPropertyName);
    if (!AudioObjectHasProperty(dev, &addr)) return {};

    CFStringRef name = nullptr;
    UInt32 size = sizeof(name);
    if (AudioObjectGetPropertyData(dev, &addr, 0, nullptr, &size, &name) != noErr || !name) return {};

    char buf[256] = {};
    std::string out;
    if (CFStringGetCString(name, buf, sizeof(buf), kCFStringEncodingUTF8)) out = buf;
    CFRelease(name);
    return out;
}

AudioTransport CoreAudioHal::transportType(AudioDeviceId dev) {
    auto addr = globalAddr(kAudioDevicePropertyTransportType);
    if (!AudioObjectHasProperty(dev, &addr)) return AudioTransport::Unknown;

    UInt32 t = 0;
    UInt32 size = sizeof(t);
    if (AudioObjectGetPropertyData(dev, &addr, 0, nullptr, &size, &t) != noErr) return AudioTransport::Unknown;

    switch (t) {
    case kAudioDeviceTransportTypeBuiltIn:   return AudioTransport::BuiltIn;
    case kAudioDeviceTransportTypeUSB:       return AudioTransport::Usb;
    case kAudioDeviceTransportTypeBluetooth:
    case kAudioDeviceTransportTypeBluetoothLE: return AudioTransport::Bluetooth;
    default:                                 return AudioTransport::Other;
    }
}

// -----------------------------------------------------------------------------
// Listener: i callback inoltrano soltanto l'evento
// -----------------------------------------------------------------------------
void CoreAudioHal::startListening(std::function<void(HalChange)> onChange) {
    std::lock_guard<std::mutex> attach(m_attachMx);
    {
        std::lock_guard<std::mutex> lk(m_mx);
        m_onChange = std::move(onChange);
    }
    if (m_listening) return;

    auto addr = globalAddr(kAudioHardwarePropertyDefaultOutputDevice);
    if (AudioObjectAddPropertyListener(kAudioObjectSystemObject, &addr, &CoreAudioHal::OnSystemChanged, this) != noErr) {
        LOGF("[HAL] listener device predefinito non registrato");
    }
    m_listening = true;
    attachDevice_(defaultOutputDevice());
}

void CoreAudioHal::stopListening() {
    std::lock_guard<std::mutex> attach(m_attachMx);
    if (!m_listening) return;

    // i callback ancora in volo trovano il sink vuoto
    {
        std::lock_guard<std::mutex> lk(m_mx);
        m_onChange = nullptr;
    }

    auto addr = globalAddr(kAudioHardwarePropertyDefaultOutputDevice);
    AudioObjectRemovePropertyListener(kAudioObjectSystemObject, &addr, &CoreAudioHal::OnSystemChanged, this);
    detachDevice_();
    m_listening = false;
}

void CoreAudioHal::followDefaultDevice() {
    std::lock_guard<std::mutex> attach(m_attachMx);
    if (!m_listening) return;
    const AudioDeviceId dev = defaultOutputDevice();
    if (dev == m_watchedDevice) return;
    attachDevice_(dev);
}

void CoreAudioHal::attachDevice_(AudioDeviceId dev) {
    detachDevice_();
    if (dev == kNoAudioDevice) return;

    std::vector<AudioObjectPropertyAddress> wanted;
    auto mainVol = outputAddr(kAudioDevicePropertyVolumeScalar);
    if (AudioObjectHasProperty(dev, &mainVol)) wanted.push_back(mainVol);
    else {
        for (UInt32 ch : { 1u, 2u }) {
            auto chVol = outputAddr(kAudioDevicePropertyVolumeScalar, ch);
            if (AudioObjectHasProperty(dev, &chVol)) wanted.push_back(chVol);
        }
    }
    auto mute = outputAddr(kAudioDevicePropertyMute);
    if (AudioObjectHasProperty(dev, &mute)) wanted.push_back(mute);

    for (auto& a : wanted) {
        if (AudioObjectAddPropertyListener(dev, &a, &CoreAudioHal::OnDeviceChanged, this) == noErr)
            m_deviceAddrs.push_back(a);
    }
    m_watchedDevice = dev;
}

void CoreAudioHal::detachDevice_() {
    for (auto& a : m_deviceAddrs)
        AudioObjectRemovePropertyListener(m_watchedDevice, &a, &CoreAudioHal::OnDeviceChanged, this);
    m_deviceAddrs.clear();
    m_watchedDevice = kNoAudioDevice;
}

void CoreAudioHal::emit(HalChange c) {
    std::function<void(HalChange)> cb;
    {
        std::lock_guard<std::mutex> lk(m_mx);
        cb = m_onChange;
    }
    if (cb) cb(c);
}

OSStatus CoreAudioHal::OnSystemChanged(AudioObjectID, UInt32, const AudioObjectPropertyAddress*, void* self) {
    // il riaggancio dei listener avviene fuori dal thread HAL (followDefaultDevice)
    static_cast<CoreAudioHal*>(self)->emit(HalChange::DefaultDevice);
    return noErr;
}

OSStatus CoreAudioHal::OnDeviceChanged(AudioObjectID, UInt32 count, const AudioObjectPropertyAddress* addrs, void* self) {
    auto* hal = static_cast<CoreAudioHal*>(self);
    bool mute = false;
    for (UInt32 i = 0; i < count; ++i) if (addrs[i].mSelector == kAudioDevicePropertyMute) mute = true;
    hal->emit(mute ? HalChange::Mute : HalChange::Volume);
    return noErr;
}
