#include "Api/ApiWiring.hpp"
#include "utils/MainApp.hpp"

ApiServer::Callbacks ApiWiring::MakeCallbacks(MainApp& app) {
    ApiServer::Callbacks cbs;
    cbs.listSerialPorts = [&app](nlohmann::json& out, std::string& err) { return app.listSerialPorts(out, err); };
    cbs.connectPort = [&app](SessionRole role, const std::optional<std::string>& port, bool& connected, std::string& err) {
        return app.connectPort(role, port, connected, err);
        };
    cbs.getConfigJson = [&app]() { return app.getConfigJson(); };
    cbs.getStatusJson = [&app]() { return app.getStatusJson(); };

    cbs.listButtons = [&app]() { return app.listButtons(); };
    cbs.createButton = [&app](const nlohmann::json& b, nlohmann::json& out, std::string& err) {
        return app.createButton(b, out, err);
        };
    cbs.deleteButton = [&app](const std::string& id, nlohmann::json& out, std::string& err) {
        return app.deleteButton(id, out, err);
        };

    cbs.sendCommand = [&app](const TransmitCommand& cmd, std::string& err) { return app.sendCommand(cmd, err); };

    cbs.subscribe = [&app]() { return app.subscribe(); };
    cbs.unsubscribe = [&app](const std::shared_ptr<Subscriber>& sub) { app.unsubscribe(sub); };

    return cbs;
}
