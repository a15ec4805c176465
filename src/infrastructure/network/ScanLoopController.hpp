#pragma once

#include "core/types/PortScanResult.hpp"
#include "core/types/ScanConfig.hpp"
#include "core/types/ScanCounters.hpp"
#include "infrastructure/network/HostScanner.hpp"
#include "infrastructure/network/Ipv4Network.hpp"
#include "infrastructure/output/ResultWriter.hpp"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tcpscan::infra {

/**
 * @brief Why the loop controller stopped.
 */
enum class TerminationReason {
    PassLimitReached, ///< The configured number of passes completed
    AllOpen,          ///< Until-all-open condition met
    AllClosed,        ///< Until-all-closed condition met
    Interrupted       ///< cancel() was called
};

std::string terminationReasonToString(TerminationReason reason);

/**
 * @brief Result of a complete run of the loop controller.
 */
struct LoopOutcome {
    TerminationReason reason{TerminationReason::PassLimitReached};
    int64_t passes{0}; ///< Passes started, including an interrupted one
    std::chrono::steady_clock::duration elapsed{};
};

/**
 * @brief Drives repeated passes of host scans over the host sequence.
 *
 * Applies the configured loop policy, skips hosts inside the excluded
 * network and chooses the connect timeout from the first scanned address
 * when none was configured. Passes are separated by a short, interruptible
 * pause.
 */
class ScanLoopController {
public:
    /**
     * @brief Constructs a ScanLoopController.
     * @param config Run configuration (loop policy, timeouts, verbosity).
     * @param scanner Scanner used for every host.
     * @param counters Run counters; hostsSkipped is incremented here.
     * @param writer Destination of host-excluded records and loop markers.
     */
    ScanLoopController(const core::ScanConfig& config, HostScanner& scanner,
                       core::ScanCounters& counters, ResultWriter& writer);

    /**
     * @brief Runs passes until the loop policy is satisfied or cancel() is called.
     * @param hosts Host sequence for every pass.
     * @param excluded Hosts inside this network are never scanned.
     * @return How and after how many passes the loop ended.
     */
    LoopOutcome run(const std::vector<asio::ip::address_v4>& hosts,
                    const std::optional<Ipv4Network>& excluded = std::nullopt);

    /**
     * @brief Interrupts the current host scan and the loop. Safe from any thread.
     */
    void cancel();

    [[nodiscard]] bool isCancelled() const { return cancelled_.load(); }

    /**
     * @brief The connect timeout in use, once the first host has been scanned.
     */
    [[nodiscard]] std::optional<std::chrono::milliseconds> connectTimeout() const;

    /**
     * @brief Connect timeout for a run whose first scanned host is `address`.
     */
    static std::chrono::milliseconds selectTimeout(const core::ScanConfig& config,
                                                   const asio::ip::address_v4& address);

private:
    bool pauseBetweenPasses();
    void writePassMarker(int64_t passes);

    const core::ScanConfig& config_;
    HostScanner& scanner_;
    core::ScanCounters& counters_;
    ResultWriter& writer_;

    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    std::condition_variable wakeup_;
    std::optional<std::chrono::milliseconds> timeout_;
};

} // namespace tcpscan::infra
