#pragma once
#include <string>
#include <mutex>
#include <memory>
#include <thread>
#include <chrono>
#include <optional>
#include <nlohmann/json.hpp>
#include <asio.hpp>
#include <CoreFoundation/CoreFoundation.h>
#include "utils/Config.hpp"
#include "utils/EventBus.hpp"
#include "Api/ApiServer.hpp"
#include "Core/Audio/CoreAudioHal.hpp"
#include "Core/Audio/CoreAudioBackend.hpp"
#include "Core/Audio/ScriptRunner.hpp"
#include "Core/Audio/ScriptingFallbackBackend.hpp"
#include "Core/Display/CGDisplayEnvironment.hpp"
#include "Core/Display/ExternalDisplayVolumeController.hpp"
#include "Core/Volume/VolumeManager.hpp"

class MainApp {
public:
    explicit MainApp(std::string configPath = "Source/config.json");
    ~MainApp();

    int run();

    // ---- API ----
    nlohmann::json getVolumeJson();                                     // /volume
    nlohmann::json getConfigJson();                                     // /config (GET)
    bool validateConfigJson(const nlohmann::json& j, std::string& err); // /config/validate (PUT)
    bool setConfigJsonStrict(const nlohmann::json& j, std::string& err);// /config (PUT)
    void requestShutdown();

    VolumeManager& volume() { return *m_volume; }

    // Event bus per SSE
    [[nodiscard]] uint64_t eventsHead() const { return m_events.head(); }
    bool waitNextEvent(uint64_t& cursor, nlohmann::json& out, std::chrono::milliseconds timeout);

    // Letta a ogni operazione di volume
    TargetMode targetMode() const;

private:
    bool loadConfigStrict();
    void buildBackends();
    void startWorker();
    void stopWorker();
    void onStateChanged(const ObservableVolumeState& s);
    void runMainLoop();
    static void OnRunLoopTick(CFRunLoopTimerRef timer, void* info);

    // ---- stato app ----
    std::string m_configPath;
    AppConfig   m_cfg;
    mutable std::mutex m_cfgMtx;

    // contesti di esecuzione: main (pubblicazione) + worker (I/O hardware)
    asio::io_context m_mainIo;
    asio::io_context m_workerIo;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> m_workerGuard;
    std::thread m_workerThr;

    // cadenza con cui il run loop CF drena il contesto main
    static constexpr CFTimeInterval kMainPumpInterval = 0.01;

    // backend (ordine = ordine di distruzione inverso)
    CoreAudioHal         m_hal;
    CGDisplayEnvironment m_displays;
    OsaScriptRunner      m_osa;
    std::unique_ptr<CoreAudioBackend>                m_audio;
    std::unique_ptr<ScriptingFallbackBackend>        m_scripting;
    std::unique_ptr<ExternalDisplayVolumeController> m_external;
    std::unique_ptr<VolumeManager>                   m_volume;

    EventBus m_events;

    // API
    std::unique_ptr<ApiServer> m_api;
};
