/**
 * @file ScanConfig.hpp
 * @brief Run configuration shared by every scan component.
 */

#pragma once

#include "core/types/PortSpec.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace tcpscan::core {

/**
 * @brief How many passes the loop controller runs over the host sequence.
 */
enum class LoopPolicy {
    FixedCount,    ///< loopCount passes (1 if unset, unbounded if 0)
    UntilAllOpen,  ///< Repeat until a pass finds every probed port open
    UntilAllClosed ///< Repeat until a pass finds every probed port closed
};

/**
 * @brief Configuration for one invocation.
 *
 * Built once at startup from the config file and the command line, then
 * passed by const reference into each component.
 */
struct ScanConfig {
    std::string target{"127.0.0.1"}; ///< Address, CIDR network or hostname
    std::string ports;               ///< Port spec, empty for the default list
    std::string skipPorts;           ///< Ports never probed
    std::string skipNetwork;         ///< Hosts in this CIDR block are skipped

    int workers{100}; ///< Maximum concurrent connect attempts

    std::optional<std::chrono::milliseconds> timeout; ///< Explicit connect timeout
    std::chrono::milliseconds lanTimeout{70};          ///< Default for private addresses
    std::chrono::milliseconds wanTimeout{180};         ///< Default for public addresses

    bool shuffleHosts{false};
    bool shufflePorts{false};
    bool showClosed{false};
    bool verbose{false};
    bool resolveDns{false};
    bool listen{false};

    std::string outputPath; ///< CSV output file, empty for none

    std::chrono::seconds runtimeStatsInterval{0}; ///< 0 disables runtime stats

    LoopPolicy loopPolicy{LoopPolicy::FixedCount};
    std::optional<int64_t> loopCount;              ///< Pass count, 0 for continuous
    std::chrono::milliseconds interPassDelay{700}; ///< Pause between passes

    std::string defaultPorts{kDefaultPortList};

    /**
     * @brief Port spec actually scanned: the explicit one or the default list.
     */
    [[nodiscard]] const std::string& effectivePorts() const {
        return ports.empty() ? defaultPorts : ports;
    }

    /**
     * @brief Maximum number of passes allowed by the loop settings.
     * @return 1 when no loop was requested, otherwise the count, with
     *         continuous and until-condition policies treated as unbounded.
     */
    [[nodiscard]] int64_t passLimit() const;

    /**
     * @brief True when the user asked for any kind of repetition.
     */
    [[nodiscard]] bool loopRequested() const {
        return loopPolicy != LoopPolicy::FixedCount || loopCount.has_value();
    }
};

} // namespace tcpscan::core
