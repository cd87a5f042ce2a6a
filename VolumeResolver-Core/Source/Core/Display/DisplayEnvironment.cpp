#include "Core/Display/DisplayEnvironment.hpp"

VolumeTarget ResolveVolumeTarget(TargetMode mode, std::optional<DisplayId> hint, const DisplayEnvironment& env) {
    if (mode == TargetMode::Builtin) return VolumeTarget::builtin();

    std::optional<DisplayId> id = (hint && *hint != 0) ? hint : env.displayUnderPointer();
    if (!id || *id == 0 || env.isBuiltin(*id)) return VolumeTarget::builtin();
    return VolumeTarget::externalDisplay(*id);
}
