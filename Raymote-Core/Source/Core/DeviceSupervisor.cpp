#include "Core/DeviceSupervisor.hpp"
#include "Core/Errors.hpp"
#include <fmt/core.h>
#include <future>

DeviceSupervisor::DeviceSupervisor(PortConfigStore& store)
    : DeviceSupervisor(store, Options{}) {
}

DeviceSupervisor::DeviceSupervisor(PortConfigStore& store, Options opts)
    : m_store(store),
      m_opts(std::move(opts)),
      m_receiver(m_reactor.io(), m_events),
      m_transmitter(m_reactor.io()),
      m_broadcaster(m_reactor.io(), m_opts.keepaliveInterval) {
}

DeviceSupervisor::~DeviceSupervisor() { stop(); }

void DeviceSupervisor::start() {
    if (m_running.exchange(true)) return;

    m_events.reopen();
    m_reactor.start();
    m_pump = std::thread(&DeviceSupervisor::pumpEvents, this);
}

void DeviceSupervisor::stop() {
    if (!m_running.exchange(false)) return;

    try {
        m_reactor.call([this] {
            m_receiver.disconnect();
            m_transmitter.disconnect();
        });
    }
    catch (const std::exception& e) {
        fmt::print("[SUP] Errore chiusura sessioni: {}\n", e.what());
    }

    m_events.close();
    if (m_pump.joinable()) m_pump.join();
    m_events.clear();

    m_broadcaster.clear();
    m_reactor.stop();
}

void DeviceSupervisor::pumpEvents() {
    while (m_running.load()) {
        DecodedEvent ev;
        if (m_events.popNext(ev, std::chrono::milliseconds(200))) {
            m_broadcaster.publish(ev);
        }
    }
}

void DeviceSupervisor::bootstrap() {
    const PersistedPortConfig cfg = m_store.load();

    auto reconnect = [this](SessionRole role, const std::optional<std::string>& path) {
        if (!path || path->empty()) return;

        fmt::print("[SUP] Riconnessione {} a {}...\n", ToString(role), *path);
        std::lock_guard<std::mutex> lk(m_connectMx);
        ConnectResult res;
        std::string err;
        if (!connectSession(role, path, res, err)) {
            fmt::print("[SUP] Riconnessione {} fallita: {}\n", ToString(role), err);
        }
    };

    // ruoli indipendenti: un fallimento non blocca l'altro
    reconnect(SessionRole::Receiver, cfg.receiverPath);
    reconnect(SessionRole::Transmitter, cfg.transmitterPath);
}

bool DeviceSupervisor::listPorts(std::vector<PortDescriptor>& out, std::string& err) const {
    return ListSerialPorts(out, err, m_opts.sysfsRoot);
}

bool DeviceSupervisor::connect(SessionRole role, const std::optional<std::string>& path, ConnectResult& out, std::string& err) {
    // connect e salvataggio nello stesso ordine: il file segue lo stato live
    std::lock_guard<std::mutex> lk(m_connectMx);
    if (!connectSession(role, path, out, err)) return false;
    persist(role, path);
    return true;
}

bool DeviceSupervisor::connectSession(SessionRole role, const std::optional<std::string>& path, ConnectResult& out, std::string& err) {
    if (!m_running.load()) { err = kErrNotRunning; return false; }

    try {
        return m_reactor.call([&] { return session(role).connect(path, out, err); });
    }
    catch (const std::exception& e) {
        err = fmt::format("{}: {}", kErrOpenFailed, e.what());
        return false;
    }
}

void DeviceSupervisor::persist(SessionRole role, const std::optional<std::string>& path) {
    PersistedPortConfig cfg = m_store.load();
    std::optional<std::string> value;
    if (path && !path->empty()) value = *path;

    if (role == SessionRole::Receiver) cfg.receiverPath = value;
    else cfg.transmitterPath = value;

    std::string err;
    if (!m_store.save(cfg, err)) {
        // lo stato live resta quello autorevole
        fmt::print("[SUP] Salvataggio config porte fallito: {}\n", err);
    }
}

bool DeviceSupervisor::send(const TransmitCommand& cmd, std::string& err) {
    if (!m_running.load()) { err = kErrNotRunning; return false; }

    auto done = std::make_shared<std::promise<std::string>>();
    auto fut = done->get_future();
    const bool queued = m_reactor.post([this, cmd, done] {
        m_transmitter.send(cmd, [done](const std::string& e) { done->set_value(e); });
    });
    if (!queued) { err = kErrNotRunning; return false; }

    try {
        err = fut.get();
    }
    catch (const std::future_error& e) {
        // reactor distrutto prima del completamento
        err = fmt::format("{}: {}", kErrWriteFailed, e.what());
    }
    return err.empty();
}

std::shared_ptr<Subscriber> DeviceSupervisor::subscribe() {
    return m_broadcaster.subscribe();
}

void DeviceSupervisor::unsubscribe(const std::shared_ptr<Subscriber>& sub) {
    m_broadcaster.unsubscribe(sub);
}

void DeviceSupervisor::closeSubscribers() {
    m_broadcaster.clear();
}

SessionState DeviceSupervisor::state(SessionRole role) const {
    return session(role).state();
}

std::string DeviceSupervisor::portPath(SessionRole role) const {
    return session(role).portPath();
}

SerialSession& DeviceSupervisor::session(SessionRole role) {
    if (role == SessionRole::Receiver) return m_receiver;
    return m_transmitter;
}

const SerialSession& DeviceSupervisor::session(SessionRole role) const {
    if (role == SessionRole::Receiver) return m_receiver;
    return m_transmitter;
}
