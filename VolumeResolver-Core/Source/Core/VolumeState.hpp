#pragma once
#include <mutex>
#include <cmath>
#include "Core/VolumeTypes.hpp"

// Storage thread-safe dell'ultimo stato pubblicato
class VolumeStateStore {
public:
    // Sostituisce lo stato corrente
    void set(const ObservableVolumeState& s) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_state = s;
    }

    // Restituisce una copia dello stato corrente
    ObservableVolumeState get() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_state;
    }

    // Aggiorna volume/mute; se touch=true aggiorna anche timestamp e target.
    // Ritorna true se qualcosa è cambiato.
    bool update(float volume, bool muted, bool touch, const std::optional<VolumeTarget>& target) {
        std::lock_guard<std::mutex> lock(m_mutex);
        const float v = clampVolume(volume);
        const bool changed = m_state.rawVolume != v || m_state.isMuted != muted;
        if (!changed && !touch) return false;

        if (touch) {
            m_state.lastChangeAt = std::chrono::system_clock::now();
            m_state.lastChangeTarget = target;
        }
        m_state.rawVolume = v;
        m_state.isMuted = muted;
        return true;
    }

    // Aggiorna nome/categoria del device attivo
    bool updateDevice(const DeviceIdentity& id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state.activeDeviceName == id.name && m_state.activeDeviceCategory == id.category) return false;
        m_state.activeDeviceName = id.name;
        m_state.activeDeviceCategory = id.category;
        return true;
    }

private:
    mutable std::mutex m_mutex;
    ObservableVolumeState m_state{};
};
