#include "Api/ApiWiring.hpp"
#include "utils/MainApp.hpp"

ApiServer::Callbacks ApiWiring::MakeCallbacks(MainApp& app) {
    ApiServer::Callbacks cbs;
    cbs.getStateJson = [&app]() { return app.getVolumeJson(); };
    cbs.getConfigJson = [&app]() { return app.getConfigJson(); };
    cbs.validateConfigJson = [&app](const nlohmann::json& j, std::string& err) { return app.validateConfigJson(j, err); };
    cbs.setConfigJsonStrict = [&app](const nlohmann::json& j, std::string& err) { return app.setConfigJsonStrict(j, err); };
    cbs.getVersionJson = []() { return nlohmann::json{ {"app","VolumeResolver"},{"api","1.0.0"},{"build","dev"} }; };

    cbs.setVolume = [&app](float v, ApiServer::Hint hint) { app.volume().setAbsolute(v, hint); };
    cbs.stepVolume = [&app](int direction, float divisor, ApiServer::Hint hint) {
        if (direction > 0) app.volume().increase(divisor, hint);
        else app.volume().decrease(divisor, hint);
        };
    cbs.toggleMute = [&app](ApiServer::Hint hint) { app.volume().toggleMute(hint); };
    cbs.refreshVolume = [&app]() { app.volume().refresh(); };
    cbs.iconFor = [&app](float v, bool muted) { return app.volume().iconFor(v, muted); };

    cbs.eventsHead = [&app]() { return app.eventsHead(); };
    cbs.waitNextEvent = [&app](uint64_t& cursor, nlohmann::json& out, int timeoutMs) {
        return app.waitNextEvent(cursor, out, std::chrono::milliseconds(timeoutMs));
        };

    cbs.requestShutdown = [&app]() { app.requestShutdown(); };
    return cbs;
}
