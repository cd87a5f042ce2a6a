#include "Core/Display/ExternalDisplayVolumeController.hpp"
#include "Core/Log.hpp"
#include <algorithm>
#include <cmath>
#include <set>

ExternalDisplayVolumeController::ExternalDisplayVolumeController(const DisplayEnvironment& displays, std::vector<TransportFactory> factories)
    : m_displays(displays), m_factories(std::move(factories)) {
}

std::unique_ptr<DdcTransport> ExternalDisplayVolumeController::discover(DisplayId id) {
    for (auto& factory : m_factories) {
        if (!factory) continue;
        auto t = factory(id);
        if (t && t->isSupported()) {
            LOGF("[DDC] display {}: trasporto {} attivo", id, t->name());
            return t;
        }
    }
    return nullptr;
}

std::shared_ptr<ExternalDisplayVolumeController::Entry> ExternalDisplayVolumeController::entryFor(DisplayId id) {
    if (id == 0 || m_displays.isBuiltin(id)) return nullptr;

    {
        std::lock_guard<std::mutex> lk(m_mx);
        auto it = m_entries.find(id);
        if (it != m_entries.end()) return it->second;
    }

    // discovery fuori dal lock: le transazioni I2C sono lente
    auto transport = discover(id);
    if (!transport) return nullptr;

    auto e = std::make_shared<Entry>();
    e->transport = std::move(transport);
    refreshCache(*e);

    std::lock_guard<std::mutex> lk(m_mx);
    // se un altro thread ha già registrato un trasporto, vince il primo
    auto ins = m_entries.emplace(id, std::move(e));
    return ins.first->second;
}

void ExternalDisplayVolumeController::refreshCache(Entry& e) {
    // solo risposte validate aggiornano la cache
    if (auto raw = e.transport->readVolume()) {
        e.cachedMax = std::max<uint16_t>(1, raw->max);
        e.lastCurrent = std::min(raw->current, e.cachedMax);
    }
}

float ExternalDisplayVolumeController::normalized(const Entry& e) {
    if (e.cachedMax == 0) return 0.f;
    return clampVolume(static_cast<float>(e.lastCurrent) / static_cast<float>(e.cachedMax));
}

bool ExternalDisplayVolumeController::writeNormalized(Entry& e, float v) {
    refreshCache(e);
    const uint16_t target = static_cast<uint16_t>(std::lround(static_cast<float>(e.cachedMax) * clampVolume(v)));
    if (!e.transport->writeVolume(target, e.cachedMax)) return false;
    e.lastCurrent = target;
    return true;
}

bool ExternalDisplayVolumeController::canControl(DisplayId id) {
    return entryFor(id) != nullptr;
}

std::optional<float> ExternalDisplayVolumeController::volume(DisplayId id) {
    auto e = entryFor(id);
    if (!e) return std::nullopt;

    std::lock_guard<std::mutex> lk(e->io);
    refreshCache(*e);
    return normalized(*e);
}

bool ExternalDisplayVolumeController::setVolume(DisplayId id, float v) {
    auto e = entryFor(id);
    if (!e) return false;

    const float clamped = clampVolume(v);
    std::lock_guard<std::mutex> lk(e->io);
    if (!writeNormalized(*e, clamped)) return false;
    e->mute.noteVolume(clamped);
    return true;
}

std::optional<ExternalDisplayVolumeController::MuteResult> ExternalDisplayVolumeController::toggleMute(DisplayId id) {
    auto e = entryFor(id);
    if (!e) return std::nullopt;

    std::lock_guard<std::mutex> lk(e->io);
    refreshCache(*e);
    const float current = normalized(*e);

    if (current > kSilentVolume) {
        if (!writeNormalized(*e, 0.f)) return std::nullopt;
        e->mute.mute(current);
        return MuteResult{ 0.f, true };
    }

    if (!e->mute.muted()) {
        // già a 0 senza mute: nulla da fare
        return MuteResult{ 0.f, false };
    }

    const float restore = e->mute.restoreValue();
    if (!writeNormalized(*e, restore)) return std::nullopt;
    e->mute.unmute();
    return MuteResult{ restore, false };
}

bool ExternalDisplayVolumeController::isMuted(DisplayId id) {
    std::shared_ptr<Entry> e;
    {
        std::lock_guard<std::mutex> lk(m_mx);
        auto it = m_entries.find(id);
        if (it == m_entries.end()) return false;
        e = it->second;
    }
    std::lock_guard<std::mutex> lk(e->io);
    return e->mute.muted();
}

void ExternalDisplayVolumeController::pruneDisconnected(const std::vector<DisplayId>& activeIds) {
    const std::set<DisplayId> active(activeIds.begin(), activeIds.end());
    std::lock_guard<std::mutex> lk(m_mx);
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (active.count(it->first) == 0) {
            LOGF("[DDC] display {} scollegato: trasporto rimosso", it->first);
            it = m_entries.erase(it);
        }
        else ++it;
    }
}

size_t ExternalDisplayVolumeController::cachedTransportCount() const {
    std::lock_guard<std::mutex> lk(m_mx);
    return m_entries.size();
}
