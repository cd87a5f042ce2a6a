#include "utils/MainApp.hpp"
#include "Core/Log.hpp"
#include <exception>
#include <system_error>
#include <fmt/format.h>

int main(int argc, char** argv) {
    const std::string configPath = argc > 1 ? argv[1] : "Source/config.json";

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
        return 2;
    }
    catch (const std::exception& e) {
        LOGF("[FATAL] std::exception: {}", e.what());
        return 3;
    }
}
