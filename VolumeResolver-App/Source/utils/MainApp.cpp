#include "utils/MainApp.hpp"
#include "utils/ConfigLoader.hpp"
#include "utils/StateJson.hpp"
#include "utils/Utils.hpp"
#include "Api/ApiWiring.hpp"
#include "Core/Ddc/AppleSiliconServiceTransport.hpp"
#include "Core/Ddc/IntelI2CTransport.hpp"
#include "Core/Log.hpp"

#include <fstream>
#include <csignal>

using Json = nlohmann::json;

// -----------------------------------------------------------------------------
// Costruzione/distruzione
// -----------------------------------------------------------------------------
MainApp::MainApp(std::string configPath)
    : m_configPath(std::move(configPath)) {
}

MainApp::~MainApp() {
    if (m_api) { m_api->stop(); m_api.reset(); }
    if (m_volume) m_volume->stop();
    stopWorker();
}

bool MainApp::loadConfigStrict() {
    std::string cfgErr;
    AppConfig cfg;
    if (!LoadConfigStrict(cfg, cfgErr, m_configPath)) {
        LOGF("[CFG] ERRORE CONFIG: {}", cfgErr);
        return false;
    }
    std::lock_guard<std::mutex> lock(m_cfgMtx);
    m_cfg = cfg;
    return true;
}

TargetMode MainApp::targetMode() const {
    std::lock_guard<std::mutex> lock(m_cfgMtx);
    return m_cfg.target;
}

// -----------------------------------------------------------------------------
// Backend
// -----------------------------------------------------------------------------
void MainApp::buildBackends() {
    m_audio = std::make_unique<CoreAudioBackend>(m_hal);

    // la lettura via script è vietata sul contesto main
    m_scripting = std::make_unique<ScriptingFallbackBackend>(m_workerIo, m_osa,
        [this] { return m_mainIo.get_executor().running_in_this_thread(); });

    // prima I2C del framebuffer, poi il servizio per-display
    std::vector<ExternalDisplayVolumeController::TransportFactory> factories;
    factories.emplace_back([](DisplayId id) -> std::unique_ptr<DdcTransport> { return IntelI2CTransport::Create(id); });
    factories.emplace_back([](DisplayId id) -> std::unique_ptr<DdcTransport> { return AppleSiliconServiceTransport::Create(id); });
    m_external = std::make_unique<ExternalDisplayVolumeController>(m_displays, std::move(factories));

    m_volume = std::make_unique<VolumeManager>(m_mainIo, m_workerIo, *m_external, *m_audio, *m_scripting, m_displays,
        [this] { return targetMode(); },
        [this] { m_events.publish(Json{ {"type", "feedback"}, {"timestamp", NowIsoUtc()} }); });

    m_volume->subscribe([this](const ObservableVolumeState& s) { onStateChanged(s); });
}

void MainApp::startWorker() {
    m_workerGuard.emplace(asio::make_work_guard(m_workerIo));
    m_workerThr = std::thread([this] {
        try {
            m_workerIo.run();
        }
        catch (const std::exception& e) {
            LOGF("[VOL] FATAL nel worker: {}", e.what());
        }
        });
}

void MainApp::stopWorker() {
    if (m_workerGuard) m_workerGuard.reset();
    m_workerIo.stop();
    if (m_workerThr.joinable()) m_workerThr.join();
}

void MainApp::onStateChanged(const ObservableVolumeState& s) {
    Json ev = StateToJson(s);
    ev["type"] = "volume";
    ev["timestamp"] = NowIsoUtc();
    m_events.publish(ev);
}

// -----------------------------------------------------------------------------
// Thin wrappers per ApiWiring (REST)
// -----------------------------------------------------------------------------
Json MainApp::getVolumeJson() {
    const ObservableVolumeState s = m_volume->state();
    Json out = StateToJson(s);
    out["icon"] = m_volume->iconFor(s.rawVolume, s.isMuted);
    out["supported"] = m_volume->supportsVolumeControl();
    out["target"] = toString(targetMode());
    return out;
}

Json MainApp::getConfigJson() {
    std::lock_guard<std::mutex> lock(m_cfgMtx);
    return ConfigToJson(m_cfg);
}

bool MainApp::validateConfigJson(const Json& j, std::string& err) {
    AppConfig testCfg;
    return ParseConfigStrict(testCfg, err, j);
}

bool MainApp::setConfigJsonStrict(const Json& j, std::string& err) {
    AppConfig newCfg;
    if (!ParseConfigStrict(newCfg, err, j)) return false;

    std::lock_guard<std::mutex> lock(m_cfgMtx);
    {
        std::ofstream f(m_configPath, std::ios::binary | std::ios::trunc);
        if (!f) { err = "cannot_write_config_file"; return false; }
        f << ConfigToJson(newCfg).dump(2);
        if (!f) { err = "cannot_write_config_file"; return false; }
    }

    if (newCfg.api.host != m_cfg.api.host || newCfg.api.port != m_cfg.api.port)
        LOGF("[CFG] indirizzo API cambiato: attivo al prossimo avvio");

    m_cfg = newCfg;
    LOGF("[CFG] target volume: {}", toString(m_cfg.target));
    return true;
}

bool MainApp::waitNextEvent(uint64_t& cursor, Json& out, std::chrono::milliseconds timeout) {
    return m_events.waitNext(cursor, out, timeout);
}

void MainApp::requestShutdown() {
    // io_context::stop è thread-safe: il tick successivo ferma il run loop
    m_mainIo.stop();
}

// -----------------------------------------------------------------------------
// Loop principale: run loop CF (callback CoreGraphics) + drenaggio asio
// -----------------------------------------------------------------------------
void MainApp::OnRunLoopTick(CFRunLoopTimerRef, void* info) {
    auto* self = static_cast<MainApp*>(info);
    try {
        self->m_mainIo.poll();
    }
    catch (const std::exception& e) {
        LOGF("[MAIN] eccezione nel contesto main: {}", e.what());
    }
    if (self->m_mainIo.stopped()) CFRunLoopStop(CFRunLoopGetCurrent());
}

void MainApp::runMainLoop() {
    CFRunLoopTimerContext ctx{};
    ctx.info = this;
    CFRunLoopTimerRef timer = CFRunLoopTimerCreate(kCFAllocatorDefault,
        CFAbsoluteTimeGetCurrent() + kMainPumpInterval, kMainPumpInterval, 0, 0, &MainApp::OnRunLoopTick, &ctx);
    if (!timer) {
        // senza timer niente notifiche di riconfigurazione: resta solo asio
        LOGF("[MAIN] CFRunLoopTimerCreate fallita, uso il solo contesto asio");
        m_mainIo.run();
        return;
    }
    CFRunLoopAddTimer(CFRunLoopGetCurrent(), timer, kCFRunLoopCommonModes);

    // CFRunLoopStop può arrivare tra due giri: si riparte finché il contesto è vivo
    while (!m_mainIo.stopped()) CFRunLoopRun();

    CFRunLoopTimerInvalidate(timer);
    CFRelease(timer);
}

// -----------------------------------------------------------------------------
// run(): ciclo di vita principale dell'app
// -----------------------------------------------------------------------------
int MainApp::run() {
    if (!loadConfigStrict()) return 2;

    buildBackends();
    startWorker();
    m_volume->start();

    ApiConfig api;
    {
        std::lock_guard<std::mutex> lock(m_cfgMtx);
        api = m_cfg.api;
    }

    // Callbacks REST (wiring separato)
    ApiServer::Callbacks cbs = ApiWiring::MakeCallbacks(*this);
    m_api = std::make_unique<ApiServer>(api.host, api.port, cbs, api.cors);
    if (!m_api->start()) {
        LOGF("[API] server non avviato");
        return 4;
    }

    LOGF("REST su http://{}:{}  |  Ctrl+C per uscire.", api.host, api.port);

    asio::signal_set signals(m_mainIo, SIGINT, SIGTERM);
    signals.async_wait([this](const asio::error_code& ec, int sig) {
        if (ec) return;
        LOGF("Segnale {} ricevuto, chiusura.", sig);
        requestShutdown();
        });

    // il main resta vivo finché non arriva lo shutdown
    auto guard = asio::make_work_guard(m_mainIo);
    runMainLoop();

    // Teardown ordinato
    if (m_api) { m_api->stop(); m_api.reset(); }
    m_events.close();
    m_volume->stop();
    stopWorker();

    return 0;
}
