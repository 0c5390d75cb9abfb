#pragma once
#include <string>
#include <memory>
#include <optional>
#include <atomic>
#include <nlohmann/json.hpp>
#include "utils/Config.hpp"
#include "utils/ButtonStore.hpp"
#include "utils/JsonPortConfigStore.hpp"
#include "Core/DeviceSupervisor.hpp"
#include "Api/ApiServer.hpp"

class MainApp {
public:
    // configPath assente = tutti i default
    explicit MainApp(std::optional<std::string> configPath = std::nullopt);
    ~MainApp();

    int run();

    // ---- API ----
    bool listSerialPorts(nlohmann::json& out, std::string& err);                 // GET /api/ports
    bool connectPort(SessionRole role, const std::optional<std::string>& port,
                     bool& connected, std::string& err);                          // POST /api/connect
    nlohmann::json getConfigJson();                                              // GET /api/config
    nlohmann::json getStatusJson() const;                                        // GET /api/status

    nlohmann::json listButtons();                                                // GET /api/buttons
    bool createButton(const nlohmann::json& b, nlohmann::json& out, std::string& err);  // POST /api/buttons
    bool deleteButton(const std::string& id, nlohmann::json& out, std::string& err);   // DELETE /api/buttons/<id>

    bool sendCommand(const TransmitCommand& cmd, std::string& err);              // POST /api/send

    std::shared_ptr<Subscriber> subscribe();                                     // GET /api/events
    void unsubscribe(const std::shared_ptr<Subscriber>& sub);

    void requestShutdown();

private:
    bool loadConfig();
    void shutdown();

    std::optional<std::string> m_configPath;
    AppConfig m_cfg;

    std::atomic<bool> m_shouldExit{ false };

    // componenti runtime, creati dopo il caricamento del config
    std::unique_ptr<JsonPortConfigStore> m_portStore;
    std::unique_ptr<ButtonStore>         m_buttons;
    std::unique_ptr<DeviceSupervisor>    m_devices;

    // API
    std::unique_ptr<ApiServer> m_api;
};
