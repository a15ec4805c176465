#pragma once

#include "app/CommandLine.hpp"
#include "core/types/ScanConfig.hpp"

#include <spdlog/logger.h>

#include <memory>

namespace tcpscan::app {

/// Program version reported by --version.
inline constexpr const char* kVersion = "1.4.0";

/**
 * @brief Top-level run context of the scanner.
 *
 * Sets up logging, builds the ScanConfig from the optional config file and
 * the command line, then runs either a scan or the passive listener. All
 * components of a run are created and torn down inside run().
 */
class Application {
public:
    /**
     * @brief Parses the command line and loads configuration.
     * @throws core::ScanError on any configuration error.
     */
    Application(int argc, const char* const argv[]);

    /**
     * @brief Runs the requested mode.
     * @return Process exit status; 0 also after an interrupt.
     * @throws core::ScanError on configuration errors detected before scanning.
     */
    int run();

    const core::ScanConfig& config() const { return config_; }

    /**
     * @brief Creates the logger used for runtime stats lines.
     */
    static std::shared_ptr<spdlog::logger> createStatsLogger();

private:
    static void initializeLogging();
    int runScan();
    int runListener();

    CommandLine commandLine_;
    core::ScanConfig config_;
};

} // namespace tcpscan::app
