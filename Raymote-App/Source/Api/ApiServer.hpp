#pragma once
#include <string>
#include <thread>
#include <atomic>
#include <functional>
#include <vector>
#include <memory>
#include <optional>
#include <nlohmann/json.hpp>
#include <httplib.h>

#include "Core/IrProtocol.hpp"
#include "Core/SessionState.hpp"
#include "Core/Events/Subscriber.hpp"

class ApiServer {
public:
    using Json = nlohmann::json;

    struct Callbacks {
        // Seriale
        std::function<bool(Json& out, std::string& err)> listSerialPorts;
        std::function<bool(SessionRole role, const std::optional<std::string>& port, bool& connected, std::string& err)> connectPort;
        std::function<Json()> getConfigJson;
        std::function<Json()> getStatusJson;

        // Pulsanti
        std::function<Json()> listButtons;
        std::function<bool(const Json& button, Json& out, std::string& err)> createButton;
        std::function<bool(const std::string& id, Json& out, std::string& err)> deleteButton;

        // Trasmissione IR
        std::function<bool(const TransmitCommand& cmd, std::string& err)> sendCommand;

        // SSE
        std::function<std::shared_ptr<Subscriber>()> subscribe;
        std::function<void(const std::shared_ptr<Subscriber>&)> unsubscribe;
    };

    ApiServer(std::string host, int port, Callbacks cbs, bool enableCORS = false, std::string publicDir = {});
    ~ApiServer();

    // Worker HTTP oltre a quelli riservati agli stream SSE
    static constexpr size_t kWorkerThreads = 8;

    // Prima di start(): ogni stream /api/events aperto occupa un worker
    void setMaxEventStreams(size_t n) { m_maxStreams = n; }
    [[nodiscard]] size_t openStreams() const { return m_openStreams.load(); }

    bool start();
    // Chiude anche gli stream SSE aperti (entro ~1 s)
    void stop();

    // Helpers di parsing, esposti per i test
    static bool ParseRole(const std::string& type, SessionRole& out);
    static bool ParseTransmitCommand(const Json& j, TransmitCommand& out, std::string& err);

private:
    void run();
    void installRoutes();

    // Envelope helpers
    void setCORSHeaders(httplib::Response& res) const;
    static void ok(httplib::Response& res, const Json& result);
    static void fail(httplib::Response& res, int status, const std::string& msg);

    std::string   m_host;
    int           m_port;
    Callbacks     m_cbs;
    bool          m_cors{ false };
    std::string   m_publicDir;

    std::unique_ptr<httplib::Server> m_srv;
    std::thread       m_thr;
    std::atomic<bool> m_running{ false };

    size_t              m_maxStreams{ 8 };
    std::atomic<size_t> m_openStreams{ 0 };
};
