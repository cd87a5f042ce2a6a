#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <vector>
#include <optional>
#include <functional>
#include "Core/VolumeTypes.hpp"
#include "Core/Ddc/DdcTransport.hpp"
#include "Core/Display/DisplayEnvironment.hpp"
#include "Core/Volume/SoftwareMute.hpp"

// Volume dei display esterni via DDC/CI.
// Cache per-display del trasporto scoperto + max/current noti + mute software.
class ExternalDisplayVolumeController {
public:
    // Crea un trasporto candidato per il display (nullptr se non applicabile)
    using TransportFactory = std::function<std::unique_ptr<DdcTransport>(DisplayId)>;

    struct MuteResult {
        float volume = 0.f;
        bool  muted = false;
    };

    // factories in ordine di priorità (I2C IOKit, poi servizio per-display)
    ExternalDisplayVolumeController(const DisplayEnvironment& displays, std::vector<TransportFactory> factories);

    // true se esiste (o viene scoperto ora) un trasporto per il display
    bool canControl(DisplayId id);

    // 0..1; dalla cache se la lettura fallisce ma il display è noto
    std::optional<float> volume(DisplayId id);

    // Scrive round(max * clamp(v)); 0 => mute software
    bool setVolume(DisplayId id, float v);

    // Mute/unmute emulato; nullopt se il display non è controllabile o la scrittura fallisce
    std::optional<MuteResult> toggleMute(DisplayId id);

    bool isMuted(DisplayId id);

    // Rimuove i display non più collegati (riconfigurazione schermi)
    void pruneDisconnected(const std::vector<DisplayId>& activeIds);

    [[nodiscard]] size_t cachedTransportCount() const;

private:
    struct Entry {
        std::unique_ptr<DdcTransport> transport;   // immutabile fino alla disconnessione
        std::mutex io;                             // una transazione DDC alla volta
        uint16_t cachedMax = 100;
        uint16_t lastCurrent = 100;
        SoftwareMute mute;
    };

    std::shared_ptr<Entry> entryFor(DisplayId id);
    std::unique_ptr<DdcTransport> discover(DisplayId id);

    // richiedono entry.io già acquisito
    static void refreshCache(Entry& e);
    static float normalized(const Entry& e);
    static bool writeNormalized(Entry& e, float v);

    const DisplayEnvironment& m_displays;
    std::vector<TransportFactory> m_factories;

    mutable std::mutex m_mx;
    std::map<DisplayId, std::shared_ptr<Entry>> m_entries;
};
