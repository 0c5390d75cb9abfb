#include "Api/ApiServer.hpp"
#include "utils/Log.hpp"
#include <chrono>
#include <filesystem>

using Json = nlohmann::json;

ApiServer::ApiServer(std::string host, int port, Callbacks cbs, bool enableCORS, std::string publicDir)
    : m_host(std::move(host)), m_port(port), m_cbs(std::move(cbs)), m_cors(enableCORS), m_publicDir(std::move(publicDir)) {
}

ApiServer::~ApiServer() { stop(); }

bool ApiServer::start() {
    if (m_running.exchange(true)) return false;
    m_srv = std::make_unique<httplib::Server>();
    const size_t threads = m_maxStreams + kWorkerThreads;
    m_srv->new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
    installRoutes();
    try {
        m_thr = std::thread(&ApiServer::run, this);   // <<-- può lanciare std::system_error
    }
    catch (const std::system_error& e) {
        LOGF("[API] FATAL: cannot start server thread: {}", e.what());
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
        LOGF("[API] Listening http://{}:{} (CORS: {})", m_host, m_port, m_cors ? "on" : "off");
        if (!m_srv->listen(m_host.c_str(), m_port)) {
            LOGF("[API] listen() failed or stopped");
        }
    }
    catch (const std::exception& e) {
        LOGF("[API] FATAL in server thread: {}", e.what());
    }
}

void ApiServer::setCORSHeaders(httplib::Response& res) const {
    if (!m_cors) return;
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "GET,POST,DELETE,OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
}

// Il frontend si aspetta il JSON "nudo", senza envelope
void ApiServer::ok(httplib::Response& res, const Json& result) {
    res.status = 200;
    res.set_content(result.dump(), "application/json");
}

void ApiServer::fail(httplib::Response& res, int status, const std::string& msg) {
    res.status = status;
    Json env = { {"error", msg} };
    res.set_content(env.dump(), "application/json");
}

bool ApiServer::ParseRole(const std::string& type, SessionRole& out) {
    if (type == "receiver") { out = SessionRole::Receiver; return true; }
    if (type == "transmitter") { out = SessionRole::Transmitter; return true; }
    return false;
}

bool ApiServer::ParseTransmitCommand(const Json& j, TransmitCommand& out, std::string& err) {
    if (!j.is_object()) { err = "bad_json"; return false; }
    if (!j.contains("protocol") || !j["protocol"].is_string()) { err = "missing_protocol"; return false; }
    if (!j.contains("code") || !j["code"].is_string()) { err = "missing_code"; return false; }
    if (!j.contains("bits")) { err = "invalid_bits"; return false; }

    // "bits" arriva come numero o come stringa numerica dal form
    const auto& bits = j["bits"];
    if (bits.is_number_integer()) {
        out.bitLength = bits.get<int>();
    }
    else if (bits.is_string()) {
        try {
            size_t used = 0;
            const std::string s = bits.get<std::string>();
            out.bitLength = std::stoi(s, &used);
            if (used != s.size()) { err = "invalid_bits"; return false; }
        }
        catch (const std::exception&) {
            err = "invalid_bits";
            return false;
        }
    }
    else {
        err = "invalid_bits";
        return false;
    }

    out.protocol = j["protocol"].get<std::string>();
    out.code = j["code"].get<std::string>();
    return ValidateTransmitCommand(out, err);
}

void ApiServer::installRoutes() {
    m_srv->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        LOGF("[HTTP] {} {} -> {}", req.method, req.path, res.status);
        });

    // Pagina web e script statici
    std::error_code ec;
    if (!m_publicDir.empty() && std::filesystem::is_directory(m_publicDir, ec)) {
        m_srv->set_mount_point("/", m_publicDir);
    }

    // 404 JSON (chiamato per ogni status >= 400: non sovrascrivere i body già impostati)
    m_srv->set_error_handler([this](const httplib::Request&, httplib::Response& res) {
        if (res.body.empty()) fail(res, res.status, res.status == 404 ? "Not Found" : "error");
        setCORSHeaders(res);
        });

    // Preflight CORS
    m_srv->Options(R"(.*)", [this](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
        setCORSHeaders(res);
        });

    // GET /api/ports
    m_srv->Get("/api/ports", [this](const httplib::Request&, httplib::Response& res) {
        if (!m_cbs.listSerialPorts) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
        Json out;
        std::string err;
        if (m_cbs.listSerialPorts(out, err)) ok(res, out);
        else fail(res, 500, err);
        setCORSHeaders(res);
        });

    // POST /api/connect  { "port": "/dev/ttyUSB0" | "" | null, "type": "receiver" | "transmitter" }
    m_srv->Post("/api/connect", [this](const httplib::Request& req, httplib::Response& res) {
        if (!m_cbs.connectPort) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
        try {
            auto j = Json::parse(req.body);
            const std::string type = j.value("type", "");
            SessionRole role;
            if (!ParseRole(type, role)) { fail(res, 400, "unknown_type"); setCORSHeaders(res); return; }

            std::optional<std::string> port;
            if (j.contains("port") && !j["port"].is_null()) {
                if (!j["port"].is_string()) { fail(res, 400, "invalid_port"); setCORSHeaders(res); return; }
                port = j["port"].get<std::string>();
            }

            bool connected = false;
            std::string err;
            if (!m_cbs.connectPort(role, port, connected, err)) {
                fail(res, 500, err.empty() ? "connect_failed" : err);
            }
            else {
                ok(res, Json{
                    {"success", true},
                    {"port", port ? Json(*port) : Json(nullptr)},
                    {"type", type},
                    {"disconnected", !connected}
                    });
            }
        }
        catch (const std::exception&) {
            fail(res, 400, "bad_json");
        }
        setCORSHeaders(res);
        });

    // GET /api/config
    m_srv->Get("/api/config", [this](const httplib::Request&, httplib::Response& res) {
        if (!m_cbs.getConfigJson) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
        ok(res, m_cbs.getConfigJson());
        setCORSHeaders(res);
        });

    // GET /api/status
    m_srv->Get("/api/status", [this](const httplib::Request&, httplib::Response& res) {
        if (!m_cbs.getStatusJson) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
        ok(res, m_cbs.getStatusJson());
        setCORSHeaders(res);
        });

    // GET /api/buttons
    m_srv->Get("/api/buttons", [this](const httplib::Request&, httplib::Response& res) {
        if (!m_cbs.listButtons) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
        ok(res, m_cbs.listButtons());
        setCORSHeaders(res);
        });

    // POST /api/buttons
    m_srv->Post("/api/buttons", [this](const httplib::Request& req, httplib::Response& res) {
        if (!m_cbs.createButton) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
        Json button;
        try {
            button = Json::parse(req.body);
        }
        catch (const std::exception&) {
            fail(res, 400, "bad_json"); setCORSHeaders(res); return;
        }

        Json all;
        std::string err;
        if (m_cbs.createButton(button, all, err)) ok(res, all);
        else fail(res, err == "button_must_be_object" ? 400 : 500, err);
        setCORSHeaders(res);
        });

    // DELETE /api/buttons/<id>
    m_srv->Delete(R"(/api/buttons/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        if (!m_cbs.deleteButton) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
        Json all;
        std::string err;
        if (m_cbs.deleteButton(req.matches[1].str(), all, err)) ok(res, all);
        else fail(res, 500, err);
        setCORSHeaders(res);
        });

    // POST /api/send  { "protocol": "NEC", "bits": 32, "code": "0x20DF10EF" }
    m_srv->Post("/api/send", [this](const httplib::Request& req, httplib::Response& res) {
        if (!m_cbs.sendCommand) { fail(res, 500, "not_available"); setCORSHeaders(res); return; }
        TransmitCommand cmd;
        std::string err;
        try {
            if (!ParseTransmitCommand(Json::parse(req.body), cmd, err)) {
                fail(res, 400, err); setCORSHeaders(res); return;
            }
        }
        catch (const std::exception&) {
            fail(res, 400, "bad_json"); setCORSHeaders(res); return;
        }

        if (m_cbs.sendCommand(cmd, err)) ok(res, Json{ {"success", true} });
        else fail(res, 500, err);
        setCORSHeaders(res);
        });

    // SSE: GET /api/events
    m_srv->Get("/api/events", [this](const httplib::Request&, httplib::Response& res) {
        if (!m_cbs.subscribe || !m_cbs.unsubscribe) { fail(res, 404, "not_supported"); setCORSHeaders(res); return; }

        // oltre il limite niente stream: i worker restano alle altre route
        if (m_openStreams.fetch_add(1) >= m_maxStreams) {
            --m_openStreams;
            fail(res, 503, "too_many_streams"); setCORSHeaders(res); return;
        }

        auto sub = m_cbs.subscribe();

        res.set_header("Cache-Control", "no-cache");
        res.set_header("Connection", "keep-alive");
        if (m_cors) res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("X-Accel-Buffering", "no");

        res.set_chunked_content_provider("text/event-stream",
            [this, sub](size_t, httplib::DataSink& sink) -> bool {
                // frame e keepalive arrivano già formattati dal broadcaster
                std::string frame;
                while (m_running.load() && sink.is_writable()) {
                    if (sub->popNext(frame, std::chrono::milliseconds(1000))) {
                        if (!sink.write(frame.data(), frame.size())) break;
                    }
                    else if (sub->isClosed()) {
                        break;
                    }
                }
                sink.done();
                return true;
            },
            [this, sub](bool) {
                m_cbs.unsubscribe(sub);
                --m_openStreams;
            }
        );
        });
}
