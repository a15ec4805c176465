#pragma once

#include "core/types/PortScanResult.hpp"
#include "core/types/ScanConfig.hpp"
#include "core/types/ScanCounters.hpp"
#include "infrastructure/network/PortProbe.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <random>
#include <semaphore>
#include <vector>

namespace tcpscan::infra {

/**
 * @brief Probes every configured port of one host with bounded concurrency.
 *
 * At most `config.workers` connect attempts are in flight at any time. The
 * port list is resolved once at construction, so a malformed spec fails
 * before any scanning starts.
 *
 * @note The scanner must outlive the probes it starts; the destructor waits
 * for in-flight attempts, which are bounded by the connect timeout.
 */
class HostScanner {
public:
    /**
     * @brief Constructs a HostScanner.
     * @param config Run configuration (ports, workers, shuffle-ports).
     * @param probe Probe used for every port.
     * @param counters Run counters; hostsScanned is incremented per scan().
     * @throws core::InvalidSpecError if the port spec is malformed.
     */
    HostScanner(const core::ScanConfig& config, PortProbe& probe, core::ScanCounters& counters);

    /**
     * @brief Destructor. Cancels and waits for in-flight probes.
     */
    ~HostScanner();

    HostScanner(const HostScanner&) = delete;
    HostScanner& operator=(const HostScanner&) = delete;

    /**
     * @brief Scans one host.
     *
     * Returns once every submitted probe has completed, or as soon as
     * cancel() is called, in which case the result holds only the ports
     * that completed so far.
     *
     * @param address Dotted-quad host address.
     * @param timeout Connect timeout for each probe.
     * @return Open flag for every probed, non-excluded port.
     */
    core::ScanResult scan(const std::string& address, std::chrono::milliseconds timeout);

    /**
     * @brief Stops submitting probes and releases a waiting scan().
     *
     * Probes already in flight are not aborted, only no longer awaited.
     * Cancellation is permanent for the lifetime of the scanner.
     */
    void cancel();

    [[nodiscard]] bool isCancelled() const { return cancelled_.load(); }

    /**
     * @brief The resolved port list, in spec order.
     */
    [[nodiscard]] const std::vector<uint16_t>& ports() const { return ports_; }

private:
    struct ScanState {
        core::ScanResult result;
        size_t submitted{0};
        size_t completed{0};
    };

    bool acquireSlot();
    void finishProbe(const std::shared_ptr<ScanState>& state, const core::PortScanResult& result);

    const core::ScanConfig& config_;
    PortProbe& probe_;
    core::ScanCounters& counters_;
    std::vector<uint16_t> ports_;
    std::mt19937 rng_;

    std::unique_ptr<std::counting_semaphore<>> slots_;
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable completion_;
    size_t inFlight_{0};
};

} // namespace tcpscan::infra
