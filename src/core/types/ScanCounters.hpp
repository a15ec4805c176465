/**
 * @file ScanCounters.hpp
 * @brief Run-wide counters updated concurrently by port probes.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace tcpscan::core {

/**
 * @brief Point-in-time copy of the run counters.
 */
struct ScanStatistics {
    uint64_t hostsScanned{0};
    uint64_t hostsSkipped{0};
    uint64_t portsScanned{0};
    uint64_t portsSkipped{0};
    uint64_t portsOpened{0};
    size_t activeHosts{0}; ///< Hosts with at least one open port

    bool operator==(const ScanStatistics& other) const = default;
};

/**
 * @brief Monotonic counters for one run.
 *
 * Owned by the loop controller and shared by reference with the host
 * scanner, the port probes and the runtime stats reporter. Every mutator is
 * safe to call from any thread.
 */
class ScanCounters {
public:
    void hostScanned() { hostsScanned_.fetch_add(1, std::memory_order_relaxed); }
    void hostSkipped() { hostsSkipped_.fetch_add(1, std::memory_order_relaxed); }
    void portScanned() { portsScanned_.fetch_add(1, std::memory_order_relaxed); }
    void portSkipped() { portsSkipped_.fetch_add(1, std::memory_order_relaxed); }

    /**
     * @brief Counts an open port and records it under its host.
     * @param address Host the port belongs to.
     * @param port The open port.
     */
    void portOpened(const std::string& address, uint16_t port);

    [[nodiscard]] uint64_t hostsScanned() const { return hostsScanned_.load(); }
    [[nodiscard]] uint64_t hostsSkipped() const { return hostsSkipped_.load(); }
    [[nodiscard]] uint64_t portsScanned() const { return portsScanned_.load(); }
    [[nodiscard]] uint64_t portsSkipped() const { return portsSkipped_.load(); }
    [[nodiscard]] uint64_t portsOpened() const { return portsOpened_.load(); }

    /**
     * @brief Open ports found so far, keyed by host address.
     */
    [[nodiscard]] std::map<std::string, std::vector<uint16_t>> activeHosts() const;

    [[nodiscard]] ScanStatistics snapshot() const;

private:
    std::atomic<uint64_t> hostsScanned_{0};
    std::atomic<uint64_t> hostsSkipped_{0};
    std::atomic<uint64_t> portsScanned_{0};
    std::atomic<uint64_t> portsSkipped_{0};
    std::atomic<uint64_t> portsOpened_{0};

    mutable std::mutex mutex_;
    std::map<std::string, std::vector<uint16_t>> activeHosts_;
};

} // namespace tcpscan::core
