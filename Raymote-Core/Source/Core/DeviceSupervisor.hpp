#pragma once
#include "Core/EventQueue.hpp"
#include "Core/PortConfigStore.hpp"
#include "Core/Reactor.hpp"
#include "Core/SessionState.hpp"
#include "Core/Events/EventBroadcaster.hpp"
#include "Core/Serial/ReceiverSession.hpp"
#include "Core/Serial/SerialPortEnumerator.hpp"
#include "Core/Serial/TransmitterSession.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// Proprietario unico di ricevitore, trasmettitore e broadcaster.
// I metodi pubblici sono thread-safe e bloccano il chiamante fino al
// completamento sul reactor: non chiamarli dal thread del reactor.
class DeviceSupervisor {
public:
    struct Options {
        std::chrono::milliseconds keepaliveInterval = kKeepaliveInterval;
        std::string sysfsRoot = kDefaultSysfsTtyRoot;
    };

    explicit DeviceSupervisor(PortConfigStore& store);
    DeviceSupervisor(PortConfigStore& store, Options opts);
    ~DeviceSupervisor();

    DeviceSupervisor(const DeviceSupervisor&) = delete;
    DeviceSupervisor& operator=(const DeviceSupervisor&) = delete;

    // Avvia reactor e pump degli eventi
    void start();
    // Chiude entrambe le sessioni, svuota i subscriber, ferma pump e reactor
    void stop();
    [[nodiscard]] bool isRunning() const { return m_running.load(); }

    // Da chiamare una volta all'avvio: riconnette le porte salvate.
    // Gli errori sono loggati, per ruolo, e non interrompono nulla.
    void bootstrap();

    bool listPorts(std::vector<PortDescriptor>& out, std::string& err) const;

    // Connette (o disconnette con path vuoto) il ruolo e, se riesce,
    // salva la nuova porta. Un errore di salvataggio è solo loggato.
    bool connect(SessionRole role, const std::optional<std::string>& path, ConnectResult& out, std::string& err);

    // Attende il flush della scrittura. err: "not_connected" / "write_failed: ..."
    bool send(const TransmitCommand& cmd, std::string& err);

    std::shared_ptr<Subscriber> subscribe();
    void unsubscribe(const std::shared_ptr<Subscriber>& sub);
    // Chiude tutti gli stream aperti (prima di fermare il server HTTP)
    void closeSubscribers();

    [[nodiscard]] SessionState state(SessionRole role) const;
    [[nodiscard]] std::string portPath(SessionRole role) const;
    [[nodiscard]] size_t subscriberCount() const { return m_broadcaster.size(); }

private:
    bool connectSession(SessionRole role, const std::optional<std::string>& path, ConnectResult& out, std::string& err);
    void persist(SessionRole role, const std::optional<std::string>& path);
    void pumpEvents();

    SerialSession& session(SessionRole role);
    const SerialSession& session(SessionRole role) const;

    PortConfigStore& m_store;
    Options m_opts;

    // l'ordine conta: il reactor deve sopravvivere a sessioni e timer
    Reactor m_reactor;
    EventQueue m_events;
    ReceiverSession m_receiver;
    TransmitterSession m_transmitter;
    EventBroadcaster m_broadcaster;

    std::thread m_pump;
    std::atomic<bool> m_running{ false };
    std::mutex m_connectMx; // connect + persist
};
