#pragma once
#include <mutex>
#include <atomic>
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <asio.hpp>
#include "Core/VolumeTypes.hpp"
#include "Core/VolumeState.hpp"
#include "Core/Audio/CoreAudioBackend.hpp"
#include "Core/Audio/ScriptingFallbackBackend.hpp"
#include "Core/Display/DisplayEnvironment.hpp"
#include "Core/Display/ExternalDisplayVolumeController.hpp"
#include "Core/Volume/SoftwareMute.hpp"

// Punto di ingresso unico per il volume di uscita.
//
// Le operazioni pubbliche accodano il lavoro sul contesto worker (tutto l'I/O
// hardware gira lì) e ritornano subito. Lo stato pubblicato viene aggiornato
// sul contesto main, dove vengono chiamati anche gli osservatori.
//
// Catena dei livelli: display esterno (DDC/CI) -> CoreAudio -> script.
class VolumeManager {
public:
    using Observer = std::function<void(const ObservableVolumeState&)>;
    using ModeProvider = std::function<TargetMode()>;
    using Feedback = std::function<void()>;

    enum class Stage { Idle, Writing, Verifying, Published };
    enum class Tier { None, ExternalDisplay, CoreAudio, Scripting };

    // Restore di default del mute software sul device interno
    static constexpr float kDefaultRestoreVolume = 0.2f;
    static constexpr float kMinStepDivisor = 0.25f;

    VolumeManager(asio::io_context& main, asio::io_context& worker,
                  ExternalDisplayVolumeController& external,
                  CoreAudioBackend& audio,
                  ScriptingFallbackBackend& scripting,
                  DisplayEnvironment& displays,
                  ModeProvider mode,
                  Feedback onAudible = {});
    ~VolumeManager();

    VolumeManager(const VolumeManager&) = delete;
    VolumeManager& operator=(const VolumeManager&) = delete;

    // Listener HAL + riconfigurazione schermi + prima lettura
    void start();
    void stop();

    void increase(float stepDivisor = 1.f, std::optional<DisplayId> hint = std::nullopt);
    void decrease(float stepDivisor = 1.f, std::optional<DisplayId> hint = std::nullopt);
    void setAbsolute(float value, std::optional<DisplayId> hint = std::nullopt);
    void toggleMute(std::optional<DisplayId> hint = std::nullopt);

    // Rilegge lo stato; sempre sul worker (la lettura via script è bloccante)
    void refresh();

    // Lo script è un fallback universale
    bool supportsVolumeControl() const { return true; }

    std::string iconFor(float value, bool isMuted) const;

    ObservableVolumeState state() const { return m_store.get(); }
    void subscribe(Observer obs);

    // Livello che ha completato l'ultima scrittura (diagnostica)
    [[nodiscard]] Tier lastTier() const { return m_lastTier.load(); }

private:
    struct Session {
        uint64_t id = 0;
        VolumeTarget target;
        Stage stage = Stage::Idle;
    };

    // --- sul worker ---
    VolumeTarget resolveTarget(std::optional<DisplayId> hint) const;
    void doStep(float sign, float stepDivisor, std::optional<DisplayId> hint);
    void doSetAbsolute(float value, const VolumeTarget& target);
    void doToggleMute(const VolumeTarget& target);
    void doRefresh();
    void fetchCurrent();
    void refreshDevice();

    bool trySetExternal(Session& s, float clamped);
    Tier writeInternal(Session& s, float v);
    std::optional<float> readInternal();
    std::optional<float> stepBaseInternal();
    bool isMutedInternal();
    void toggleSoftwareMute(Session& s);

    void advance(Session& s, Stage next, Tier tier);
    void fireFeedbackIf(bool wasSilent, float now);

    // --- pubblicazione (post su main) ---
    void publish(float volume, bool muted, bool touch, const std::optional<VolumeTarget>& target);
    void publishDevice(const DeviceIdentity& id);
    void notifyObservers();

    asio::io_context& m_main;
    asio::io_context& m_worker;
    ExternalDisplayVolumeController& m_external;
    CoreAudioBackend& m_audio;
    ScriptingFallbackBackend& m_scripting;
    DisplayEnvironment& m_displays;
    ModeProvider m_mode;
    Feedback m_onAudible;

    // Vista del worker sull'ultimo valore pubblicato
    float m_lastVolume = 0.f;
    bool  m_lastMuted = false;
    bool  m_didInitialFetch = false;
    SoftwareMute m_softMute{ kDefaultRestoreVolume, 0.f };   // device interno: ripristino esatto
    uint64_t m_sessionSeq = 0;

    std::atomic<Tier> m_lastTier{ Tier::None };
    std::atomic<bool> m_started{ false };

    VolumeStateStore m_store;

    mutable std::mutex m_obsMx;
    std::vector<Observer> m_observers;
};

const char* toString(VolumeManager::Stage s);
const char* toString(VolumeManager::Tier t);
