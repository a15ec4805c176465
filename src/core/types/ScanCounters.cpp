#include "core/types/ScanCounters.hpp"

namespace tcpscan::core {

void ScanCounters::portOpened(const std::string& address, uint16_t port) {
    portsOpened_.fetch_add(1, std::memory_order_relaxed);

    std::lock_guard lock(mutex_);
    activeHosts_[address].push_back(port);
}

std::map<std::string, std::vector<uint16_t>> ScanCounters::activeHosts() const {
    std::lock_guard lock(mutex_);
    return activeHosts_;
}

ScanStatistics ScanCounters::snapshot() const {
    ScanStatistics stats;
    stats.hostsScanned = hostsScanned_.load();
    stats.hostsSkipped = hostsSkipped_.load();
    stats.portsScanned = portsScanned_.load();
    stats.portsSkipped = portsSkipped_.load();
    stats.portsOpened = portsOpened_.load();

    std::lock_guard lock(mutex_);
    stats.activeHosts = activeHosts_.size();
    return stats;
}

} // namespace tcpscan::core
