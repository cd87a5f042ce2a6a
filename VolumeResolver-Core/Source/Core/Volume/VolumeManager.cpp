#include "Core/Volume/VolumeManager.hpp"
#include "Core/Audio/DeviceClassifier.hpp"
#include "Core/Log.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace {

std::string describe(const VolumeTarget& t) {
    return t.isExternal() ? fmt::format("display {}", t.display) : std::string("builtin");
}

// sotto questa soglia il volume precedente conta come silenzio
constexpr float kEffectivelySilent = 0.01f;

} // namespace

const char* toString(VolumeManager::Stage s) {
    switch (s) {
    case VolumeManager::Stage::Idle:      return "idle";
    case VolumeManager::Stage::Writing:   return "writing";
    case VolumeManager::Stage::Verifying: return "verifying";
    case VolumeManager::Stage::Published: return "published";
    }
    return "?";
}

const char* toString(VolumeManager::Tier t) {
    switch (t) {
    case VolumeManager::Tier::None:            return "none";
    case VolumeManager::Tier::ExternalDisplay: return "ddc";
    case VolumeManager::Tier::CoreAudio:       return "coreaudio";
    case VolumeManager::Tier::Scripting:       return "script";
    }
    return "?";
}

VolumeManager::VolumeManager(asio::io_context& main, asio::io_context& worker,
                             ExternalDisplayVolumeController& external,
                             CoreAudioBackend& audio,
                             ScriptingFallbackBackend& scripting,
                             DisplayEnvironment& displays,
                             ModeProvider mode,
                             Feedback onAudible)
    : m_main(main), m_worker(worker), m_external(external), m_audio(audio),
      m_scripting(scripting), m_displays(displays), m_mode(std::move(mode)),
      m_onAudible(std::move(onAudible)) {
}

VolumeManager::~VolumeManager() {
    stop();
}

// -----------------------------------------------------------------------------
// Ciclo di vita
// -----------------------------------------------------------------------------
void VolumeManager::start() {
    if (m_started.exchange(true)) return;

    // i callback HAL arrivano su un thread qualsiasi: accodano e basta
    m_audio.subscribe([this](HalChange c) {
        asio::post(m_worker, [this, c] {
            if (c == HalChange::DefaultDevice) {
                LOGF("[HAL] device di uscita cambiato");
                m_audio.followDefaultDevice();
            }
            fetchCurrent();
        });
    });

    m_displays.setReconfigurationHandler([this] {
        asio::post(m_worker, [this] { m_external.pruneDisconnected(m_displays.activeDisplays()); });
    });

    asio::post(m_worker, [this] { fetchCurrent(); });
}

void VolumeManager::stop() {
    if (!m_started.exchange(false)) return;
    m_audio.unsubscribe();
    m_displays.setReconfigurationHandler({});
}

// -----------------------------------------------------------------------------
// API pubblica: tutto sul worker
// -----------------------------------------------------------------------------
void VolumeManager::increase(float stepDivisor, std::optional<DisplayId> hint) {
    asio::post(m_worker, [this, stepDivisor, hint] { doStep(+1.f, stepDivisor, hint); });
}

void VolumeManager::decrease(float stepDivisor, std::optional<DisplayId> hint) {
    asio::post(m_worker, [this, stepDivisor, hint] { doStep(-1.f, stepDivisor, hint); });
}

void VolumeManager::setAbsolute(float value, std::optional<DisplayId> hint) {
    asio::post(m_worker, [this, value, hint] { doSetAbsolute(clampVolume(value), resolveTarget(hint)); });
}

void VolumeManager::toggleMute(std::optional<DisplayId> hint) {
    asio::post(m_worker, [this, hint] { doToggleMute(resolveTarget(hint)); });
}

void VolumeManager::refresh() {
    asio::post(m_worker, [this] { doRefresh(); });
}

std::string VolumeManager::iconFor(float value, bool isMuted) const {
    if (isMuted || value <= 0.0001f) return "speaker.slash.fill";

    if (const char* sym = SymbolForCategory(m_store.get().activeDeviceCategory)) return sym;

    if (value < 0.33f) return "speaker.wave.1.fill";
    if (value < 0.66f) return "speaker.wave.2.fill";
    return "speaker.wave.3.fill";
}

void VolumeManager::subscribe(Observer obs) {
    std::lock_guard<std::mutex> lk(m_obsMx);
    m_observers.push_back(std::move(obs));
}

// -----------------------------------------------------------------------------
// Worker
// -----------------------------------------------------------------------------
VolumeTarget VolumeManager::resolveTarget(std::optional<DisplayId> hint) const {
    const TargetMode mode = m_mode ? m_mode() : TargetMode::Builtin;
    const VolumeTarget target = ResolveVolumeTarget(mode, hint, m_displays);
    // la notifica di riconfigurazione può mancare: la lista attiva resta la fonte di verità
    if (target.isExternal()) m_external.pruneDisconnected(m_displays.activeDisplays());
    return target;
}

void VolumeManager::doStep(float sign, float stepDivisor, std::optional<DisplayId> hint) {
    const float divisor = std::max(stepDivisor, kMinStepDivisor);
    const float delta = kVolumeStep / divisor;
    const VolumeTarget target = resolveTarget(hint);

    std::optional<float> current;
    if (target.isExternal() && m_external.canControl(target.display)) current = m_external.volume(target.display);
    if (!current) current = stepBaseInternal();

    doSetAbsolute(clampVolume(current.value_or(m_lastVolume) + sign * delta), target);
}

void VolumeManager::doSetAbsolute(float clamped, const VolumeTarget& target) {
    refreshDevice();
    Session s{ ++m_sessionSeq, target };

    if (target.isExternal() && trySetExternal(s, clamped)) return;

    const std::optional<bool> hwMute = m_audio.readHardwareMute();
    const bool currentlyMuted = hwMute ? *hwMute : m_softMute.muted();
    const bool wasSilent = currentlyMuted || m_lastVolume < kEffectivelySilent;

    if (hwMute && *hwMute && clamped > 0.f && !m_audio.setHardwareMute(false))
        LOGF("[VOL] #{} unmute hardware fallito", s.id);

    const Tier tier = writeInternal(s, clamped);

    // volume 0 => muto; mai muto con volume udibile
    m_softMute.noteVolume(clamped);
    if (hwMute && clamped <= kSilentVolume && !*hwMute && !m_audio.setHardwareMute(true))
        LOGF("[VOL] #{} mute hardware fallito", s.id);

    advance(s, Stage::Published, tier);
    publish(clamped, isMutedInternal(), true, target);
    fireFeedbackIf(wasSilent, clamped);
}

bool VolumeManager::trySetExternal(Session& s, float clamped) {
    const DisplayId id = s.target.display;
    if (!m_external.canControl(id)) return false;

    const float previous = m_external.volume(id).value_or(m_lastVolume);

    advance(s, Stage::Writing, Tier::ExternalDisplay);
    if (!m_external.setVolume(id, clamped)) {
        LOGF("[VOL] #{} DDC/CI su display {} fallito, provo CoreAudio", s.id, id);
        return false;
    }

    advance(s, Stage::Published, Tier::ExternalDisplay);
    publish(clamped, clamped <= kSilentVolume, true, s.target);
    fireFeedbackIf(previous < kEffectivelySilent, clamped);
    return true;
}

VolumeManager::Tier VolumeManager::writeInternal(Session& s, float v) {
    advance(s, Stage::Writing, Tier::CoreAudio);
    if (m_audio.hasDevice()) {
        // writeVolume rilegge e confronta con tolleranza
        advance(s, Stage::Verifying, Tier::CoreAudio);
        if (m_audio.writeVolume(v)) return Tier::CoreAudio;
        LOGF("[VOL] #{} verifica CoreAudio fallita, uso lo script", s.id);
    }

    advance(s, Stage::Writing, Tier::Scripting);
    m_scripting.writeVolume(v);
    return Tier::Scripting;
}

std::optional<float> VolumeManager::readInternal() {
    if (m_audio.hasDevice()) {
        if (auto v = m_audio.readVolume()) return v;
    }
    return m_scripting.readVolume();
}

std::optional<float> VolumeManager::stepBaseInternal() {
    // lo script applica le scritture in ritardo: rileggere perderebbe i passi accodati
    if (m_scripting.pendingPercent() || m_lastTier.load() == Tier::Scripting) return m_lastVolume;
    return readInternal();
}

bool VolumeManager::isMutedInternal() {
    if (auto hw = m_audio.readHardwareMute()) return *hw;
    return m_softMute.muted();
}

void VolumeManager::doToggleMute(const VolumeTarget& target) {
    refreshDevice();
    Session s{ ++m_sessionSeq, target };

    if (target.isExternal() && m_external.canControl(target.display)) {
        advance(s, Stage::Writing, Tier::ExternalDisplay);
        if (auto r = m_external.toggleMute(target.display)) {
            if (!r->muted && r->volume <= kSilentVolume) {
                LOGF("[VOL] #{} mute a volume 0 su display {}: nessuna azione", s.id, target.display);
                return;
            }
            advance(s, Stage::Published, Tier::ExternalDisplay);
            publish(r->volume, r->muted, true, target);
            return;
        }
        LOGF("[VOL] #{} mute DDC/CI su display {} fallito, provo il device interno", s.id, target.display);
    }

    if (auto hw = m_audio.readHardwareMute()) {
        const bool next = !*hw;
        advance(s, Stage::Writing, Tier::CoreAudio);
        if (m_audio.setHardwareMute(next)) {
            float vol = readInternal().value_or(m_lastVolume);
            Tier tier = Tier::CoreAudio;
            if (!next && vol <= kSilentVolume) {
                // unmute non deve lasciare il volume a 0
                vol = m_softMute.restoreValue();
                tier = writeInternal(s, vol);
            }
            advance(s, Stage::Published, tier);
            publish(vol, next, true, target);
            return;
        }
        LOGF("[VOL] #{} mute hardware non applicato, uso il mute software", s.id);
    }

    toggleSoftwareMute(s);
}

void VolumeManager::toggleSoftwareMute(Session& s) {
    if (m_softMute.muted()) {
        const float restore = m_softMute.unmute();
        const Tier tier = writeInternal(s, restore);
        advance(s, Stage::Published, tier);
        publish(restore, false, true, s.target);
        return;
    }

    const float current = readInternal().value_or(m_lastVolume);
    if (current <= kSilentVolume) {
        LOGF("[VOL] #{} mute a volume 0: nessuna azione", s.id);
        return;
    }

    m_softMute.mute(current);
    const Tier tier = writeInternal(s, 0.f);
    advance(s, Stage::Published, tier);
    publish(0.f, true, true, s.target);
}

void VolumeManager::doRefresh() {
    const VolumeTarget target = resolveTarget(std::nullopt);
    if (target.isExternal() && m_external.canControl(target.display)) {
        if (auto v = m_external.volume(target.display)) {
            publish(*v, *v <= kSilentVolume, false, target);
            return;
        }
    }
    fetchCurrent();
}

void VolumeManager::fetchCurrent() {
    refreshDevice();

    const std::optional<float> vol = readInternal();
    const bool muted = isMutedInternal();
    const float v = vol ? clampVolume(*vol) : m_lastVolume;

    const bool changed = v != m_lastVolume || muted != m_lastMuted;
    const bool touch = m_didInitialFetch && changed;
    if (touch && v != m_lastVolume) fireFeedbackIf(m_lastVolume < kEffectivelySilent, v);

    if (vol) m_didInitialFetch = true;
    if (!vol && !changed) return;

    std::optional<VolumeTarget> target;
    if (touch) target = resolveTarget(std::nullopt);
    publish(v, muted, touch, target);
}

void VolumeManager::refreshDevice() {
    publishDevice(m_audio.deviceIdentity());
}

void VolumeManager::advance(Session& s, Stage next, Tier tier) {
    s.stage = next;
    if (next != Stage::Published) return;
    m_lastTier.store(tier);
    LOGF("[VOL] #{} {}: {} via {}", s.id, describe(s.target), toString(next), toString(tier));
}

void VolumeManager::fireFeedbackIf(bool wasSilent, float now) {
    if (!wasSilent || now < kVolumeStep * 0.5f || !m_onAudible) return;
    asio::post(m_main, [cb = m_onAudible] { cb(); });
}

// -----------------------------------------------------------------------------
// Pubblicazione: sempre sul contesto main
// -----------------------------------------------------------------------------
void VolumeManager::publish(float volume, bool muted, bool touch, const std::optional<VolumeTarget>& target) {
    const float v = clampVolume(volume);
    m_lastVolume = v;
    m_lastMuted = muted;

    asio::post(m_main, [this, v, muted, touch, target] {
        if (m_store.update(v, muted, touch, target)) notifyObservers();
    });
}

void VolumeManager::publishDevice(const DeviceIdentity& id) {
    asio::post(m_main, [this, id] {
        if (m_store.updateDevice(id)) notifyObservers();
    });
}

void VolumeManager::notifyObservers() {
    std::vector<Observer> obs;
    {
        std::lock_guard<std::mutex> lk(m_obsMx);
        obs = m_observers;
    }
    const ObservableVolumeState snap = m_store.get();
    for (auto& o : obs) if (o) o(snap);
}
