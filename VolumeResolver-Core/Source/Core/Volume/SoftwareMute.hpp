#pragma once
#include <optional>
#include <algorithm>
#include "Core/VolumeTypes.hpp"

// Sotto questa soglia il volume è considerato 0
inline constexpr float kSilentVolume = 0.001f;

// Mute emulato: ricorda l'ultimo volume udibile e lo ripristina all'unmute.
// Non thread-safe: protetto da chi lo possiede.
class SoftwareMute {
public:
    SoftwareMute() = default;
    // floor: minimo ripristinato all'unmute (0 = valore memorizzato esatto)
    explicit SoftwareMute(float initialRestore, float floor = kVolumeStep)
        : m_floor(floor), m_restore(initialRestore) {}

    bool muted() const { return m_muted; }

    // Un volume scritto esplicitamente: 0 => muto, altrimenti diventa il punto di ripristino
    void noteVolume(float v) {
        if (v > kSilentVolume) { m_restore = v; m_muted = false; }
        else m_muted = true;
    }

    // Mute a partire dal volume corrente
    void mute(float current) {
        if (current > kSilentVolume) m_restore = current;
        m_muted = true;
    }

    // Unmute: ritorna il valore da riscrivere (mai 0)
    float unmute() {
        m_muted = false;
        return restoreValue();
    }

    float restoreValue() const {
        if (!m_restore) return std::max(kVolumeStep, m_floor);
        return std::max(m_floor, clampVolume(*m_restore));
    }

private:
    bool m_muted = false;
    float m_floor = kVolumeStep;
    std::optional<float> m_restore;
};
