#include "utils/MainApp.hpp"
#include "utils/Log.hpp"
#include <exception>
#include <fmt/format.h>
#include <system_error>

// uso: raymote [config.json]
int main(int argc, char** argv) {
    std::optional<std::string> configPath;
    if (argc > 1) configPath = argv[1];

    try {
        MainApp app{ configPath };
        return app.run();
    }
    catch (const fmt::format_error& e) {
        LOGF("[FATAL] fmt::format_error: {}", e.what());
        return 1;
    }
    catch (const std::system_error& e) {
        LOGF("[FATAL] std::system_error: {} (code {})", e.what(), (int)e.code().value());
        return 4;
    }
    catch (const std::exception& e) {
        LOGF("[FATAL] std::exception: {}", e.what());
        return 5;
    }
}
