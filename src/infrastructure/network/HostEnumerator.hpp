#pragma once

#include "core/services/IHostResolver.hpp"

#include <asio.hpp>
#include <string>
#include <vector>

namespace tcpscan::infra {

/**
 * @brief Expands a target expression into the addresses to scan.
 *
 * A target containing letters is a hostname and yields its single resolved
 * address. Anything else is parsed as an IPv4 network or address.
 */
class HostEnumerator {
public:
    explicit HostEnumerator(core::IHostResolver& resolver);

    /**
     * @brief Enumerates the hosts of a target.
     * @param target Hostname, address or CIDR network.
     * @param shuffle Randomize the order of a network's hosts.
     * @return Host addresses, ascending unless shuffled.
     * @throws core::UnresolvableHostError if a hostname does not resolve.
     * @throws core::InvalidTargetError if the target cannot be parsed.
     */
    std::vector<asio::ip::address_v4> enumerate(const std::string& target, bool shuffle = false) const;

    /**
     * @brief True when the target must go through a forward DNS lookup.
     */
    static bool isHostname(const std::string& target);

private:
    core::IHostResolver& resolver_;
};

} // namespace tcpscan::infra
