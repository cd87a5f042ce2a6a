#pragma once
#include <deque>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "Core/Audio/AudioHal.hpp"
#include "Core/Audio/ScriptRunner.hpp"
#include "Core/Ddc/DdcTransport.hpp"
#include "Core/Display/DisplayEnvironment.hpp"

namespace testing_fakes {

// Risposta Get VCP valida (o con flag di errore) con checksum corretto
inline Ddc::Reply MakeReply(uint16_t current, uint16_t max, uint8_t resultCode = 0x00) {
    Ddc::Reply r{ 0x6E, 0x88, Ddc::kGetVcpReplyOpcode, resultCode, Ddc::kVcpAudioVolume, 0x00,
                  static_cast<uint8_t>(max >> 8), static_cast<uint8_t>(max & 0xFF),
                  static_cast<uint8_t>(current >> 8), static_cast<uint8_t>(current & 0xFF), 0 };
    r[10] = Ddc::Checksum(Ddc::kReplySeed, r.data(), 10);
    return r;
}

struct SleepLog {
    std::vector<std::chrono::milliseconds> calls;
};

// Monitor simulato dietro la logica comune di retry/framing.
// Le risposte in coda hanno la precedenza; poi, se online, risponde con current/max.
class FakeDdcTransport : public DdcVolumeTransport {
public:
    explicit FakeDdcTransport(std::shared_ptr<SleepLog> log = std::make_shared<SleepLog>(),
                              RetryPolicy read = RetryPolicy{ 3, std::chrono::milliseconds(10), false },
                              RetryPolicy write = RetryPolicy{ 3, std::chrono::milliseconds(10), false })
        : DdcVolumeTransport(read, write, [log](std::chrono::milliseconds d) { log->calls.push_back(d); }),
          sleeps(std::move(log)) {
    }

    const char* name() const override { return label.c_str(); }

    std::string label = "fake";
    bool online = true;                         // risponde alle letture
    bool acceptWrites = true;
    int dropWrites = 0;                         // scritture iniziali perse
    uint16_t current = 50;
    uint16_t max = 100;

    std::deque<std::optional<Ddc::Reply>> queued;   // nullopt = nessuna risposta
    std::vector<uint16_t> sent;
    int reads = 0;
    std::shared_ptr<SleepLog> sleeps;

protected:
    bool exchangeGetVcp(uint8_t vcp, Ddc::Reply& reply, int) override {
        ++reads;
        if (vcp != Ddc::kVcpAudioVolume) return false;
        if (!queued.empty()) {
            auto next = queued.front();
            queued.pop_front();
            if (!next) return false;
            reply = *next;
            return true;
        }
        if (!online) return false;
        reply = MakeReply(current, max);
        return true;
    }

    bool sendSetVcp(uint8_t, uint16_t value) override {
        sent.push_back(value);
        if (dropWrites > 0) { --dropWrites; return false; }
        if (!acceptWrites) return false;
        current = value;
        return true;
    }
};

// HAL in memoria: il device "esiste" se device != kNoAudioDevice
class FakeAudioHal : public AudioHal {
public:
    AudioDeviceId device = 42;

    bool hasVirtual = true;
    float virtualVolume = 0.5f;
    bool virtualApplies = true;                // false = dice ok ma non applica

    std::map<uint32_t, float> scalars;         // elementi presenti
    bool scalarsApply = true;

    std::optional<bool> mute;                  // nullopt = nessun mute hardware

    std::string name = "MacBook Pro Speakers";
    AudioTransport transport = AudioTransport::BuiltIn;

    std::function<void(HalChange)> listener;
    int setVirtualCalls = 0;
    int setScalarCalls = 0;
    int followCalls = 0;

    AudioDeviceId defaultOutputDevice() override { return device; }

    bool hasVirtualMainVolume(AudioDeviceId dev) override { return dev == device && hasVirtual; }
    std::optional<float> getVirtualMainVolume(AudioDeviceId dev) override {
        if (!hasVirtualMainVolume(dev)) return std::nullopt;
        return virtualVolume;
    }
    bool setVirtualMainVolume(AudioDeviceId dev, float v) override {
        if (!hasVirtualMainVolume(dev)) return false;
        ++setVirtualCalls;
        if (virtualApplies) virtualVolume = v;
        return true;
    }

    std::optional<float> getVolumeScalar(AudioDeviceId dev, uint32_t element) override {
        if (dev != device) return std::nullopt;
        auto it = scalars.find(element);
        if (it == scalars.end()) return std::nullopt;
        return it->second;
    }
    bool setVolumeScalar(AudioDeviceId dev, uint32_t element, float v) override {
        if (dev != device) return false;
        auto it = scalars.find(element);
        if (it == scalars.end()) return false;
        ++setScalarCalls;
        if (scalarsApply) it->second = v;
        return true;
    }

    std::optional<bool> getMute(AudioDeviceId dev) override {
        if (dev != device) return std::nullopt;
        return mute;
    }
    bool setMute(AudioDeviceId dev, bool m) override {
        if (dev != device || !mute) return false;
        mute = m;
        return true;
    }

    std::string deviceName(AudioDeviceId dev) override { return dev == device ? name : std::string(); }
    AudioTransport transportType(AudioDeviceId dev) override { return dev == device ? transport : AudioTransport::Unknown; }

    void startListening(std::function<void(HalChange)> onChange) override { listener = std::move(onChange); }
    void stopListening() override { listener = nullptr; }
    void followDefaultDevice() override { ++followCalls; }

    void fire(HalChange c) { if (listener) listener(c); }
};

class FakeDisplayEnvironment : public DisplayEnvironment {
public:
    std::set<DisplayId> builtins{ 1 };
    std::optional<DisplayId> pointer;
    std::vector<DisplayId> active{ 1 };
    std::function<void()> handler;

    bool isBuiltin(DisplayId id) const override { return builtins.count(id) != 0; }
    std::optional<DisplayId> displayUnderPointer() const override { return pointer; }
    std::vector<DisplayId> activeDisplays() const override { return active; }
    void setReconfigurationHandler(std::function<void()> h) override { handler = std::move(h); }

    void reconfigure() { if (handler) handler(); }
};

class FakeScriptRunner : public ScriptRunner {
public:
    std::vector<std::string> scripts;
    bool readSucceeds = true;
    std::string readOutput = "50\n";

    bool run(const std::string& script, std::string* output) override {
        scripts.push_back(script);
        if (output) {
            if (!readSucceeds) return false;
            *output = readOutput;
        }
        return true;
    }

    // solo gli script di scrittura
    std::vector<std::string> setScripts() const {
        std::vector<std::string> out;
        for (auto& s : scripts) if (s.rfind("set volume", 0) == 0) out.push_back(s);
        return out;
    }
};

} // namespace testing_fakes
