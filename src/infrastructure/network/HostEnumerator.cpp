#include "infrastructure/network/HostEnumerator.hpp"

#include "core/types/ScanError.hpp"
#include "infrastructure/network/Ipv4Network.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <random>

namespace tcpscan::infra {

HostEnumerator::HostEnumerator(core::IHostResolver& resolver) : resolver_(resolver) {}

bool HostEnumerator::isHostname(const std::string& target) {
    return std::any_of(target.begin(), target.end(),
                       [](char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0; });
}

std::vector<asio::ip::address_v4> HostEnumerator::enumerate(const std::string& target,
                                                            bool shuffle) const {
    if (isHostname(target)) {
        auto resolved = resolver_.resolve(target);
        if (!resolved) {
            throw core::UnresolvableHostError(target);
        }

        asio::error_code ec;
        auto address = asio::ip::make_address_v4(*resolved, ec);
        if (ec) {
            throw core::UnresolvableHostError(target);
        }

        spdlog::debug("Resolved {} to {}", target, *resolved);
        return {address};
    }

    auto hosts = Ipv4Network::parse(target).hosts();
    if (shuffle) {
        std::mt19937 rng(std::random_device{}());
        std::shuffle(hosts.begin(), hosts.end(), rng);
    }

    spdlog::debug("Target {} expands to {} hosts", target, hosts.size());
    return hosts;
}

} // namespace tcpscan::infra
