#pragma once

#include "core/services/ITcpConnector.hpp"
#include "core/types/PortScanResult.hpp"
#include "core/types/ScanConfig.hpp"
#include "core/types/ScanCounters.hpp"
#include "infrastructure/network/DnsCache.hpp"
#include "infrastructure/output/ResultWriter.hpp"

#include <chrono>
#include <functional>
#include <set>
#include <string>

namespace tcpscan::infra {

/**
 * @brief Probes a single (host, port) pair.
 *
 * Classifies the port, updates the run counters and writes the result
 * record when the configuration asks for it. Excluded ports are reported
 * without any network I/O.
 */
class PortProbe {
public:
    using ProbeCallback = std::function<void(const core::PortScanResult&)>;

    /**
     * @brief Constructs a probe.
     * @param config Run configuration (show-closed, verbose, resolve-dns, skip ports).
     * @param connector Performs the connect attempt.
     * @param counters Run counters to update.
     * @param writer Destination of result records.
     * @param dnsCache Reverse lookups for open ports when resolve-dns is set.
     * @throws core::InvalidSpecError if the skip-port spec is malformed.
     */
    PortProbe(const core::ScanConfig& config, core::ITcpConnector& connector,
              core::ScanCounters& counters, ResultWriter& writer, DnsCache& dnsCache);

    /**
     * @brief Probes one port.
     *
     * Excluded ports complete synchronously. Otherwise the callback runs
     * on an I/O thread once the connect attempt has finished and the
     * record has been written. The reverse lookup of an open port is
     * bounded by the same timeout as the connect. The callback fires
     * exactly once even if recording the result fails.
     *
     * @param address Dotted-quad host address.
     * @param port Port to probe.
     * @param timeout Connect timeout.
     * @param onComplete Receives the outcome, may be empty.
     */
    void probe(const std::string& address, uint16_t port, std::chrono::milliseconds timeout,
               ProbeCallback onComplete);

    [[nodiscard]] bool isExcluded(uint16_t port) const { return excludedPorts_.count(port) > 0; }
    [[nodiscard]] const std::set<uint16_t>& excludedPorts() const { return excludedPorts_; }

private:
    void complete(core::PortScanResult result, std::chrono::milliseconds timeout,
                  const ProbeCallback& onComplete);
    void recordWithHostname(const core::PortScanResult& result, std::chrono::milliseconds timeout,
                            const ProbeCallback& onComplete);
    void write(const core::PortScanResult& result, bool includeHostname = false);

    const core::ScanConfig& config_;
    core::ITcpConnector& connector_;
    core::ScanCounters& counters_;
    ResultWriter& writer_;
    DnsCache& dnsCache_;
    std::set<uint16_t> excludedPorts_;
};

} // namespace tcpscan::infra
