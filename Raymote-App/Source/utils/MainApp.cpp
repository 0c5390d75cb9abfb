#include "utils/MainApp.hpp"
#include "utils/ConfigLoader.hpp"
#include "utils/Log.hpp"
#include "Api/ApiWiring.hpp"

#include <chrono>
#include <csignal>
#include <thread>

using Json = nlohmann::json;

// impostato da SIGINT/SIGTERM, consumato nel loop di run()
static std::atomic<bool> s_signalled{ false };

static void OnSignal(int) {
    s_signalled.store(true);
}

static Json sessionJson(const DeviceSupervisor& dev, SessionRole role) {
    const SessionState st = dev.state(role);
    const std::string port = dev.portPath(role);
    Json out = { {"status", ToString(st.status)} };
    out["port"] = port.empty() ? Json(nullptr) : Json(port);
    if (st.status == SessionStatus::Failed) out["reason"] = st.reason;
    return out;
}

// -----------------------------------------------------------------------------
// Costruzione/distruzione
// -----------------------------------------------------------------------------
MainApp::MainApp(std::optional<std::string> configPath)
    : m_configPath(std::move(configPath)) {
}

MainApp::~MainApp() { shutdown(); }

bool MainApp::loadConfig() {
    if (!m_configPath) return true; // default

    std::string cfgErr;
    if (!LoadConfigStrict(m_cfg, cfgErr, *m_configPath)) {
        LOGF("ERRORE CONFIG: {}", cfgErr);
        return false;
    }
    return true;
}

// -----------------------------------------------------------------------------
// Thin wrappers per ApiWiring (REST)
// -----------------------------------------------------------------------------
bool MainApp::listSerialPorts(Json& out, std::string& err) {
    std::vector<PortDescriptor> ports;
    if (!m_devices->listPorts(ports, err)) {
        LOGF("Errore elenco porte: {}", err);
        return false;
    }
    out = Json::array();
    for (auto& p : ports) out.push_back({ {"path", p.path}, {"manufacturer", p.manufacturer} });
    return true;
}

bool MainApp::connectPort(SessionRole role, const std::optional<std::string>& port, bool& connected, std::string& err) {
    ConnectResult res;
    if (!m_devices->connect(role, port, res, err)) return false;
    connected = res.connected;
    return true;
}

Json MainApp::getConfigJson() {
    return JsonPortConfigStore::ToJson(m_portStore->load());
}

Json MainApp::getStatusJson() const {
    return Json{
        {"receiver",    sessionJson(*m_devices, SessionRole::Receiver)},
        {"transmitter", sessionJson(*m_devices, SessionRole::Transmitter)},
        {"subscribers", m_devices->subscriberCount()}
    };
}

Json MainApp::listButtons() {
    return m_buttons->list();
}

bool MainApp::createButton(const Json& b, Json& out, std::string& err) {
    if (!m_buttons->create(b, out, err)) {
        LOGF("Errore salvataggio pulsanti: {}", err);
        return false;
    }
    return true;
}

bool MainApp::deleteButton(const std::string& id, Json& out, std::string& err) {
    if (!m_buttons->remove(id, out, err)) {
        LOGF("Errore salvataggio pulsanti: {}", err);
        return false;
    }
    return true;
}

bool MainApp::sendCommand(const TransmitCommand& cmd, std::string& err) {
    if (!m_devices->send(cmd, err)) {
        LOGF("Invio comando IR fallito: {}", err);
        return false;
    }
    return true;
}

std::shared_ptr<Subscriber> MainApp::subscribe() {
    return m_devices->subscribe();
}

void MainApp::unsubscribe(const std::shared_ptr<Subscriber>& sub) {
    m_devices->unsubscribe(sub);
}

void MainApp::requestShutdown() {
    m_shouldExit.store(true, std::memory_order_relaxed);
}

// -----------------------------------------------------------------------------
// run(): ciclo di vita principale dell'app
// -----------------------------------------------------------------------------
int MainApp::run() {
    if (!loadConfig()) return 2;

    m_portStore = std::make_unique<JsonPortConfigStore>(m_cfg.files.portConfig);
    m_buttons = std::make_unique<ButtonStore>(m_cfg.files.buttons);

    DeviceSupervisor::Options opts;
    opts.keepaliveInterval = std::chrono::seconds(m_cfg.keepaliveSeconds);
    m_devices = std::make_unique<DeviceSupervisor>(*m_portStore, opts);
    m_devices->start();

    // Callbacks REST (wiring separato)
    ApiServer::Callbacks cbs = ApiWiring::MakeCallbacks(*this);
    m_api = std::make_unique<ApiServer>(m_cfg.http.host, m_cfg.http.port, cbs, m_cfg.http.cors, m_cfg.files.publicDir);
    m_api->setMaxEventStreams(m_cfg.http.maxEventStreams);
    if (!m_api->start()) {
        shutdown();
        return 3;
    }

    LOGF("=== Raymote IR Remote Control ===");
    LOGF("Web server su http://localhost:{}  |  Ctrl+C per uscire.", m_cfg.http.port);

    // Riconnessione alle porte salvate: i fallimenti non fermano il server
    m_devices->bootstrap();

    std::signal(SIGINT, OnSignal);
    std::signal(SIGTERM, OnSignal);

    // Loop principale
    while (!m_shouldExit.load(std::memory_order_relaxed) && !s_signalled.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    LOGF("Arresto in corso...");
    shutdown();
    return 0;
}

void MainApp::shutdown() {
    // Teardown ordinato: stream SSE, richieste HTTP, poi le seriali
    if (m_devices) m_devices->closeSubscribers();
    if (m_api) { m_api->stop(); m_api.reset(); }
    if (m_devices) { m_devices->stop(); m_devices.reset(); }
}
