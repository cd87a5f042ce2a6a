#pragma once
#include <vector>
#include <optional>
#include <functional>
#include "Core/VolumeTypes.hpp"

// Vista minima sugli schermi collegati (CoreGraphics su macOS, fake nei test)
class DisplayEnvironment {
public:
    virtual ~DisplayEnvironment() = default;

    virtual bool isBuiltin(DisplayId id) const = 0;

    // Display sotto il puntatore (nullopt se non determinabile)
    virtual std::optional<DisplayId> displayUnderPointer() const = 0;

    virtual std::vector<DisplayId> activeDisplays() const = 0;

    // Chiamato dopo ogni riconfigurazione degli schermi, su un contesto qualsiasi
    virtual void setReconfigurationHandler(std::function<void()> handler) = 0;
};

// Risolve il target per la modalità configurata.
// ActiveDisplay: hint, poi display sotto il puntatore; interno o nessuno => Builtin.
VolumeTarget ResolveVolumeTarget(TargetMode mode, std::optional<DisplayId> hint, const DisplayEnvironment& env);
