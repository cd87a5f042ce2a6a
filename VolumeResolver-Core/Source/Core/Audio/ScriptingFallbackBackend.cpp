#include "Core/Audio/ScriptingFallbackBackend.hpp"
#include "Core/System/ProcessUtils.hpp"
#include "Core/VolumeTypes.hpp"
#include "Core/Log.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fmt/format.h>

ScriptingFallbackBackend::ScriptingFallbackBackend(asio::io_context& io, ScriptRunner& runner,
                                                   std::function<bool()> isUiThread,
                                                   std::chrono::milliseconds debounce)
    : m_io(io), m_runner(runner), m_isUiThread(std::move(isUiThread)), m_debounce(debounce), m_timer(io) {
}

int ScriptingFallbackBackend::ToPercent(float v01) {
    const long p = std::lround(clampVolume(v01) * 100.f);
    return static_cast<int>(std::min(100L, std::max(0L, p)));
}

std::string ScriptingFallbackBackend::SetVolumeScript(int percent) {
    // alcuni device restano bloccati in mute: lo togliamo sempre
    return fmt::format("set volume without output muted\nset volume output volume {}", percent);
}

const char* ScriptingFallbackBackend::ReadVolumeScript() {
    return "output volume of (get volume settings)";
}

void ScriptingFallbackBackend::writeVolume(float v01) {
    const int pct = ToPercent(v01);
    uint64_t gen = 0;
    {
        std::lock_guard<std::mutex> lk(m_mx);
        m_pending = pct;
        gen = ++m_generation;
    }

    // il timer vive solo sul contesto worker
    asio::dispatch(m_io, [this, gen] {
        m_timer.expires_after(m_debounce);
        m_timer.async_wait([this, gen](const asio::error_code& ec) {
            if (ec == asio::error::operation_aborted) return;
            if (ec) { LOGF("[OSA] timer debounce: {}", ec.message()); return; }
            fire(gen);
        });
    });
}

void ScriptingFallbackBackend::fire(uint64_t generation) {
    int pct = 0;
    {
        std::lock_guard<std::mutex> lk(m_mx);
        // superata da una richiesta più recente
        if (generation != m_generation || !m_pending) return;
        pct = *m_pending;
        m_pending.reset();
    }

    if (!m_runner.run(SetVolumeScript(pct), nullptr)) {
        LOGF("[OSA] set volume {}% fallito", pct);
    }
}

std::optional<float> ScriptingFallbackBackend::readVolume() {
    // lettura bloccante: mai sul contesto UI
    if (m_isUiThread && m_isUiThread()) return std::nullopt;

    std::string out;
    if (!m_runner.run(ReadVolumeScript(), &out)) return std::nullopt;

    const std::string s = ProcUtils::Trim(out);
    if (s.empty()) return std::nullopt;
    char* end = nullptr;
    const long pct = std::strtol(s.c_str(), &end, 10);
    if (end == s.c_str()) {
        LOGF("[OSA] output volume non numerico: '{}'", s);
        return std::nullopt;
    }
    return clampVolume(static_cast<float>(pct) / 100.f);
}

std::optional<int> ScriptingFallbackBackend::pendingPercent() const {
    std::lock_guard<std::mutex> lk(m_mx);
    return m_pending;
}
