#include "core/types/PortScanResult.hpp"

#include <algorithm>

namespace tcpscan::core {

std::string PortScanResult::stateToString() const {
    return portStateToString(state);
}

std::string PortScanResult::portStateToString(PortState state) {
    switch (state) {
    case PortState::Open:
        return "open";
    case PortState::Closed:
        return "closed";
    case PortState::Excluded:
        return "port-excluded";
    }
    return "closed";
}

bool ScanResult::allOpen() const {
    return std::none_of(ports.begin(), ports.end(), [](const auto& entry) { return !entry.second; });
}

bool ScanResult::allClosed() const {
    return std::none_of(ports.begin(), ports.end(), [](const auto& entry) { return entry.second; });
}

size_t ScanResult::openCount() const {
    return static_cast<size_t>(
        std::count_if(ports.begin(), ports.end(), [](const auto& entry) { return entry.second; }));
}

} // namespace tcpscan::core
