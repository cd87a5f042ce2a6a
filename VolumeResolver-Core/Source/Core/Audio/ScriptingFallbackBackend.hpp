#pragma once
#include <mutex>
#include <chrono>
#include <cstdint>
#include <optional>
#include <functional>
#include <asio.hpp>
#include "Core/Audio/ScriptRunner.hpp"

// Ultimo livello: volume di sistema via script.
// Le scritture sono coalescenti: vince solo l'ultima richiesta entro la finestra di debounce.
class ScriptingFallbackBackend {
public:
    static constexpr std::chrono::milliseconds kDefaultDebounce{ 50 };

    // io: contesto worker su cui scade il timer e gira lo script.
    // isUiThread: true se il chiamante è sul contesto UI (lettura vietata).
    ScriptingFallbackBackend(asio::io_context& io, ScriptRunner& runner,
                             std::function<bool()> isUiThread,
                             std::chrono::milliseconds debounce = kDefaultDebounce);

    // Programma la scrittura (0..1 -> 0..100 %); sostituisce quella pendente
    void writeVolume(float v01);

    // Lettura sincrona; nullopt sul thread UI o se lo script fallisce
    std::optional<float> readVolume();

    // Percentuale pendente non ancora eseguita
    [[nodiscard]] std::optional<int> pendingPercent() const;

    static int ToPercent(float v01);
    static std::string SetVolumeScript(int percent);
    static const char* ReadVolumeScript();

private:
    void fire(uint64_t generation);

    asio::io_context& m_io;
    ScriptRunner& m_runner;
    std::function<bool()> m_isUiThread;
    std::chrono::milliseconds m_debounce;

    asio::steady_timer m_timer;

    mutable std::mutex m_mx;
    std::optional<int> m_pending;   // slot singolo
    uint64_t m_generation = 0;
};
