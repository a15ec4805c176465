#include "app/Application.hpp"
#include "core/types/ScanError.hpp"

#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    try {
        tcpscan::app::Application app(argc, argv);
        return app.run();
    } catch (const tcpscan::core::ScanError& e) {
        spdlog::error("{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
