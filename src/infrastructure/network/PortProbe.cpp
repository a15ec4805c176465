#include "infrastructure/network/PortProbe.hpp"

#include <spdlog/spdlog.h>

namespace tcpscan::infra {

PortProbe::PortProbe(const core::ScanConfig& config, core::ITcpConnector& connector,
                     core::ScanCounters& counters, ResultWriter& writer, DnsCache& dnsCache)
    : config_(config), connector_(connector), counters_(counters), writer_(writer),
      dnsCache_(dnsCache), excludedPorts_(core::resolveExcludedPorts(config.skipPorts)) {}

void PortProbe::probe(const std::string& address, uint16_t port, std::chrono::milliseconds timeout,
                      ProbeCallback onComplete) {
    core::PortScanResult result;
    result.targetAddress = address;
    result.port = port;

    if (isExcluded(port)) {
        result.state = core::PortState::Excluded;
        counters_.portSkipped();
        complete(std::move(result), timeout, onComplete);
        return;
    }

    counters_.portScanned();
    connector_.connectAsync(
        address, port, timeout,
        [this, result = std::move(result), timeout, onComplete = std::move(onComplete)](bool open) mutable {
            result.state = open ? core::PortState::Open : core::PortState::Closed;
            complete(std::move(result), timeout, onComplete);
        });
}

void PortProbe::complete(core::PortScanResult result, std::chrono::milliseconds timeout,
                         const ProbeCallback& onComplete) {
    try {
        switch (result.state) {
        case core::PortState::Open:
            counters_.portOpened(result.targetAddress, result.port);
            if (config_.resolveDns) {
                recordWithHostname(result, timeout, onComplete);
                return;
            }
            write(result);
            break;
        case core::PortState::Closed:
            if (config_.showClosed) {
                write(result);
            }
            break;
        case core::PortState::Excluded:
            if (config_.verbose) {
                write(result);
            }
            break;
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to record {}:{}: {}", result.targetAddress, result.port, e.what());
    }

    if (onComplete) {
        onComplete(result);
    }
}

void PortProbe::recordWithHostname(const core::PortScanResult& result, std::chrono::milliseconds timeout,
                                   const ProbeCallback& onComplete) {
    dnsCache_.lookupAsync(result.targetAddress, timeout,
                          [this, result, onComplete](const std::string& hostname) mutable {
                              result.hostname = hostname;
                              write(result, true);
                              if (onComplete) {
                                  onComplete(result);
                              }
                          });
}

void PortProbe::write(const core::PortScanResult& result, bool includeHostname) {
    try {
        writer_.writeResult(result, includeHostname);
    } catch (const std::exception& e) {
        spdlog::error("Failed to write result for {}:{}: {}", result.targetAddress, result.port, e.what());
    }
}

} // namespace tcpscan::infra
