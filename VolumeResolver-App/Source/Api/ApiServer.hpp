#pragma once
#include <string>
#include <thread>
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <httplib.h>
#include "Core/VolumeTypes.hpp"

class ApiServer {
public:
    using Json = nlohmann::json;
    using Hint = std::optional<DisplayId>;

    struct Callbacks {
        // Letture
        std::function<Json()> getStateJson;
        std::function<Json()> getConfigJson;
        std::function<Json()> getVersionJson;

        // Config
        std::function<bool(const Json& j, std::string& err)> setConfigJsonStrict;   // valida + applica
        std::function<bool(const Json& j, std::string& err)> validateConfigJson;    // valida soltanto

        // Volume (asincrone: lo stato arriva su /volume o /events)
        std::function<void(float value, Hint hint)> setVolume;
        std::function<void(int direction, float divisor, Hint hint)> stepVolume;
        std::function<void(Hint hint)> toggleMute;
        std::function<void()> refreshVolume;
        std::function<std::string(float value, bool muted)> iconFor;

        // SSE: cursore iniziale + attesa del prossimo evento
        std::function<uint64_t()> eventsHead;
        std::function<bool(uint64_t& cursor, Json& out, int timeoutMs)> waitNextEvent;

        std::function<void()> requestShutdown;
    };

    ApiServer(std::string host, int port, Callbacks cbs, bool enableCORS = false);
    ~ApiServer();

    bool start();
    void stop();

    // Body opzionale {"display": N}; false se il campo c'è ma non è valido
    static bool ParseHint(const Json& body, Hint& out, std::string& err);

    // Divisore opzionale {"divisor": x}, default 1, deve essere > 0
    static bool ParseDivisor(const Json& body, float& out, std::string& err);

    // ?value= di /volume/icon: solo numeri finiti
    static bool ParseIconValue(const std::string& raw, float& out, std::string& err);

    // Nome SSE dal campo "type" dell'evento; "volume" -> "volumeChanged"
    static std::string SseEventName(const Json& ev);
    static std::string FormatSseEvent(const Json& ev);

private:
    void run();
    void installRoutes();
    void installVolumeRoutes();
    void installConfigRoutes();
    void installEventRoutes();

    // Envelope helpers
    void setCORSHeaders(httplib::Response& res) const;
    static void ok(httplib::Response& res, const Json& result);
    static void fail(httplib::Response& res, int status, const std::string& msg);

    // body vuoto => oggetto vuoto; false se non è JSON oggetto
    static bool bodyJson(const httplib::Request& req, Json& out);

    std::string   m_host;
    int           m_port;
    Callbacks     m_cbs;
    bool          m_cors{ false };

    std::unique_ptr<httplib::Server> m_srv;
    std::thread       m_thr;
    std::atomic<bool> m_running{ false };
};
