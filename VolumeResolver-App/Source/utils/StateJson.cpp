#include "utils/StateJson.hpp"
#include "utils/Utils.hpp"

using Json = nlohmann::json;

Json TargetToJson(const VolumeTarget& t) {
    if (t.isExternal()) return Json{ {"kind", "external_display"}, {"display", t.display} };
    return Json{ {"kind", "builtin"} };
}

Json StateToJson(const ObservableVolumeState& s) {
    Json out = {
        {"volume", s.rawVolume},
        {"muted",  s.isMuted},
        {"device", { {"name", s.activeDeviceName}, {"category", toString(s.activeDeviceCategory)} }}
    };
    // epoch = nessuna modifica ancora
    if (s.lastChangeAt.time_since_epoch().count() == 0) out["lastChangeAt"] = nullptr;
    else out["lastChangeAt"] = IsoUtc(s.lastChangeAt);
    out["lastChangeTarget"] = s.lastChangeTarget ? TargetToJson(*s.lastChangeTarget) : Json(nullptr);
    return out;
}
