/**
 * @file PortScanResult.hpp
 * @brief Per-port and per-host scan outcomes.
 */

#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace tcpscan::core {

/**
 * @brief Outcome of a single port probe.
 */
enum class PortState : int {
    Open = 0,    ///< The connect handshake completed
    Closed = 1,  ///< Refused, timed out or unreachable
    Excluded = 2 ///< Listed in the skip-port set, never probed
};

/**
 * @brief Result of probing a single port.
 */
struct PortScanResult {
    std::string targetAddress;        ///< Address that was probed
    uint16_t port{0};                 ///< Port that was probed
    PortState state{PortState::Closed}; ///< Probe outcome
    std::string hostname;             ///< Reverse DNS name, empty if not resolved

    /**
     * @brief Converts this result's state to its output keyword.
     * @return "open", "closed" or "port-excluded".
     */
    [[nodiscard]] std::string stateToString() const;

    /**
     * @brief Converts a PortState to its output keyword.
     */
    static std::string portStateToString(PortState state);

    bool operator==(const PortScanResult& other) const = default;
};

/// Status keyword printed for a host inside the excluded network.
inline constexpr const char* kHostExcluded = "host-excluded";

/**
 * @brief Results of one Host Scan: port number to open flag.
 *
 * Only probed ports appear; excluded ports are never keys.
 */
struct ScanResult {
    std::string targetAddress;
    std::map<uint16_t, bool> ports;

    /// True when no probed port is closed.
    [[nodiscard]] bool allOpen() const;

    /// True when no probed port is open.
    [[nodiscard]] bool allClosed() const;

    [[nodiscard]] size_t openCount() const;
    [[nodiscard]] size_t size() const { return ports.size(); }
    [[nodiscard]] bool empty() const { return ports.empty(); }
};

} // namespace tcpscan::core
