#include "Api/ApiServer.hpp"
#include "Core/Log.hpp"
#include <cmath>
#include <cstring>
#include <limits>
#include <stdexcept>

using Json = nlohmann::json;

ApiServer::ApiServer(std::string host, int port, Callbacks cbs, bool enableCORS)
    : m_host(std::move(host)), m_port(port), m_cbs(std::move(cbs)), m_cors(enableCORS) {
}

ApiServer::~ApiServer() { stop(); }

bool ApiServer::start() {
    if (m_running.exchange(true)) return false;
    m_srv = std::make_unique<httplib::Server>();
    installRoutes();
    try {
        m_thr = std::thread(&ApiServer::run, this);   // può lanciare std::system_error
    }
    catch (const std::system_error& e) {
        LOGF("[API] FATAL: impossibile avviare il thread del server: {}", e.what());
        m_srv.reset();
        m_running.store(false);
        return false;
    }
    return true;
}

void ApiServer::stop() {
    if (!m_running.exchange(false)) return;
    if (m_srv) m_srv->stop();
    if (m_thr.joinable()) m_thr.join();
    m_srv.reset();
}

void ApiServer::run() {
    try {
        LOGF("[API] in ascolto su http://{}:{} (CORS: {})", m_host, m_port, m_cors ? "on" : "off");
        if (!m_srv->listen(m_host.c_str(), m_port)) {
            LOGF("[API] listen() fallita o server fermato");
        }
    }
    catch (const std::exception& e) {
        LOGF("[API] FATAL nel thread del server: {}", e.what());
    }
}

void ApiServer::setCORSHeaders(httplib::Response& res) const {
    if (!m_cors) return;
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "GET,PUT,POST,OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization");
}

void ApiServer::ok(httplib::Response& res, const Json& result) {
    res.status = 200;
    Json env = { {"ok", true}, {"result", result} };
    res.set_content(env.dump(), "application/json");
}

void ApiServer::fail(httplib::Response& res, int status, const std::string& msg) {
    res.status = status;
    Json env = { {"ok", false}, {"error", msg} };
    res.set_content(env.dump(), "application/json");
}

bool ApiServer::bodyJson(const httplib::Request& req, Json& out) {
    if (req.body.empty()) { out = Json::object(); return true; }
    out = Json::parse(req.body, nullptr, /*allow_exceptions=*/false);
    return out.is_object();
}

bool ApiServer::ParseHint(const Json& body, Hint& out, std::string& err) {
    out.reset();
    if (!body.contains("display") || body["display"].is_null()) return true;
    const auto& d = body["display"];
    if (!d.is_number_unsigned() || d.get<uint64_t>() > std::numeric_limits<DisplayId>::max()) {
        err = "bad_display";
        return false;
    }
    out = static_cast<DisplayId>(d.get<uint64_t>());
    return true;
}

bool ApiServer::ParseIconValue(const std::string& raw, float& out, std::string& err) {
    try {
        size_t used = 0;
        const float v = std::stof(raw, &used);
        // niente "nan"/"inf" né coda non numerica
        if (used != raw.size() || !std::isfinite(v)) { err = "bad_value"; return false; }
        out = v;
        return true;
    }
    catch (const std::logic_error&) {
        err = "bad_value";
        return false;
    }
}

std::string ApiServer::SseEventName(const Json& ev) {
    const auto it = ev.find("type");
    if (it == ev.end() || !it->is_string() || it->get<std::string>().empty()) return "message";
    const std::string type = it->get<std::string>();
    // nome storico per i cambi di stato
    if (type == "volume") return "volumeChanged";
    return type;
}

std::string ApiServer::FormatSseEvent(const Json& ev) {
    return "event: " + SseEventName(ev) + "\ndata: " + ev.dump() + "\n\n";
}

bool ApiServer::ParseDivisor(const Json& body, float& out, std::string& err) {
    out = 1.f;
    if (!body.contains("divisor")) return true;
    const auto& d = body["divisor"];
    if (!d.is_number() || !(d.get<double>() > 0.0)) { err = "bad_divisor"; return false; }
    out = static_cast<float>(d.get<double>());
    return true;
}

void ApiServer::installRoutes() {
    m_srv->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        LOGF("[HTTP] {} {} -> {}", req.method, req.path, res.status);
        });

    // 404 JSON
    m_srv->set_error_handler([this](const httplib::Request&, httplib::Response& res) {
        if (res.status == 404) fail(res, 404, "not_found");
        setCORSHeaders(res);
        });

    // Preflight CORS
    m_srv->Options(R"(.*)", [this](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
        setCORSHeaders(res);
        });

    // GET /health
    m_srv->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        ok(res, Json{ {"alive", true} });
        setCORSHeaders(res);
        });

    // GET /version
    m_srv->Get("/version", [this](const httplib::Request&, httplib::Response& res) {
        if (!m_cbs.getVersionJson) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
        ok(res, m_cbs.getVersionJson());
        setCORSHeaders(res);
        });

    installVolumeRoutes();
    installConfigRoutes();
    installEventRoutes();

    // POST /shutdown
    m_srv->Post("/shutdown", [this](const httplib::Request&, httplib::Response& res) {
        if (!m_cbs.requestShutdown) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
        ok(res, Json{ {"shutting_down", true} });
        setCORSHeaders(res);
        // la risposta parte prima che il main loop chiuda il server
        std::thread([cb = m_cbs.requestShutdown] {
            using namespace std::chrono_literals;
            std::this_thread::sleep_for(100ms);
            cb();
            }).detach();
        });
}

void ApiServer::installVolumeRoutes() {
    // GET /volume
    m_srv->Get("/volume", [this](const httplib::Request&, httplib::Response& res) {
        if (!m_cbs.getStateJson) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
        ok(res, m_cbs.getStateJson());
        setCORSHeaders(res);
        });

    // PUT /volume { "value": 0..1, "display"?: N }
    m_srv->Put("/volume", [this](const httplib::Request& req, httplib::Response& res) {
        if (!m_cbs.setVolume) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
        Json j;
        if (!bodyJson(req, j)) { fail(res, 400, "bad_json"); setCORSHeaders(res); return; }
        if (!j.contains("value") || !j["value"].is_number()) { fail(res, 400, "missing_value"); setCORSHeaders(res); return; }
        const double v = j["value"].get<double>();
        if (!std::isfinite(v)) { fail(res, 400, "bad_value"); setCORSHeaders(res); return; }

        Hint hint; std::string err;
        if (!ParseHint(j, hint, err)) { fail(res, 400, err); setCORSHeaders(res); return; }

        m_cbs.setVolume(static_cast<float>(v), hint);
        ok(res, Json{ {"accepted", true}, {"value", clampVolume(static_cast<float>(v))} });
        setCORSHeaders(res);
        });

    // POST /volume/increase | /volume/decrease { "divisor"?: x, "display"?: N }
    auto step = [this](int direction) {
        return [this, direction](const httplib::Request& req, httplib::Response& res) {
            if (!m_cbs.stepVolume) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
            Json j;
            if (!bodyJson(req, j)) { fail(res, 400, "bad_json"); setCORSHeaders(res); return; }

            float divisor = 1.f; Hint hint; std::string err;
            if (!ParseDivisor(j, divisor, err) || !ParseHint(j, hint, err)) { fail(res, 400, err); setCORSHeaders(res); return; }

            m_cbs.stepVolume(direction, divisor, hint);
            ok(res, Json{ {"accepted", true} });
            setCORSHeaders(res);
            };
        };
    m_srv->Post("/volume/increase", step(+1));
    m_srv->Post("/volume/decrease", step(-1));

    // POST /volume/mute { "display"?: N }
    m_srv->Post("/volume/mute", [this](const httplib::Request& req, httplib::Response& res) {
        if (!m_cbs.toggleMute) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
        Json j;
        if (!bodyJson(req, j)) { fail(res, 400, "bad_json"); setCORSHeaders(res); return; }
        Hint hint; std::string err;
        if (!ParseHint(j, hint, err)) { fail(res, 400, err); setCORSHeaders(res); return; }

        m_cbs.toggleMute(hint);
        ok(res, Json{ {"accepted", true} });
        setCORSHeaders(res);
        });

    // POST /volume/refresh
    m_srv->Post("/volume/refresh", [this](const httplib::Request&, httplib::Response& res) {
        if (!m_cbs.refreshVolume) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
        m_cbs.refreshVolume();
        ok(res, Json{ {"accepted", true} });
        setCORSHeaders(res);
        });

    // GET /volume/icon?value=0.5&muted=0
    m_srv->Get("/volume/icon", [this](const httplib::Request& req, httplib::Response& res) {
        if (!m_cbs.iconFor) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
        if (!req.has_param("value")) { fail(res, 400, "missing_value"); setCORSHeaders(res); return; }

        float value = 0.f; std::string err;
        if (!ParseIconValue(req.get_param_value("value"), value, err)) { fail(res, 400, err); setCORSHeaders(res); return; }

        const std::string m = req.has_param("muted") ? req.get_param_value("muted") : "0";
        const bool muted = (m == "1" || m == "true");
        ok(res, Json{ {"icon", m_cbs.iconFor(value, muted)} });
        setCORSHeaders(res);
        });
}

void ApiServer::installConfigRoutes() {
    // GET /config
    m_srv->Get("/config", [this](const httplib::Request&, httplib::Response& res) {
        if (!m_cbs.getConfigJson) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
        ok(res, m_cbs.getConfigJson());
        setCORSHeaders(res);
        });

    // PUT /config (apply)
    m_srv->Put("/config", [this](const httplib::Request& req, httplib::Response& res) {
        if (!m_cbs.setConfigJsonStrict) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
        Json j;
        if (!bodyJson(req, j)) { fail(res, 400, "bad_json"); setCORSHeaders(res); return; }
        std::string err;
        if (!m_cbs.setConfigJsonStrict(j, err)) { fail(res, 400, err.empty() ? "invalid_config" : err); }
        else { ok(res, Json{ {"applied", true} }); }
        setCORSHeaders(res);
        });

    // PUT /config/validate (no-apply)
    m_srv->Put("/config/validate", [this](const httplib::Request& req, httplib::Response& res) {
        if (!m_cbs.validateConfigJson) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
        Json j;
        if (!bodyJson(req, j)) { fail(res, 400, "bad_json"); setCORSHeaders(res); return; }
        std::string err;
        if (!m_cbs.validateConfigJson(j, err)) { fail(res, 400, err.empty() ? "invalid_config" : err); }
        else { ok(res, Json{ {"valid", true} }); }
        setCORSHeaders(res);
        });
}

void ApiServer::installEventRoutes() {
    // SSE: GET /events
    m_srv->Get("/events", [this](const httplib::Request&, httplib::Response& res) {
        if (!m_cbs.waitNextEvent || !m_cbs.eventsHead) { fail(res, 404, "not_supported"); setCORSHeaders(res); return; }

        res.set_header("Cache-Control", "no-cache, no-transform");
        res.set_header("Connection", "keep-alive");
        res.set_header("X-Accel-Buffering", "no");
        setCORSHeaders(res);

        // ogni client parte dagli eventi successivi alla connessione
        auto cursor = std::make_shared<uint64_t>(m_cbs.eventsHead());

        res.set_chunked_content_provider("text/event-stream",
            [this, cursor](size_t, httplib::DataSink& sink) -> bool {
                try {
                    const char* hello = ": connected\n\n";
                    sink.write(hello, std::strlen(hello));

                    if (m_cbs.getStateJson) {
                        std::string line = "event: snapshot\ndata: " + m_cbs.getStateJson().dump() + "\n\n";
                        sink.write(line.c_str(), line.size());
                    }

                    while (m_running.load() && sink.is_writable()) {
                        Json ev;
                        if (m_cbs.waitNextEvent(*cursor, ev, /*timeoutMs*/1000)) {
                            const std::string line = FormatSseEvent(ev);
                            if (!sink.write(line.c_str(), line.size())) break;
                        }
                        else {
                            const char* hb = ": heartbeat\n\n";
                            if (!sink.write(hb, std::strlen(hb))) break;
                        }
                    }
                    sink.done();
                    return true;
                }
                catch (const std::exception& e) {
                    LOGF("[SSE] errore provider: {}", e.what());
                    sink.done();
                    return false;
                }
            });
        });
}
