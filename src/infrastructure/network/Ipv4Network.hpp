#pragma once

#include <asio.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace tcpscan::infra {

/**
 * @brief An IPv4 network in CIDR notation.
 *
 * Parsing is strict: a network with host bits set (e.g. "10.0.0.5/24") is
 * rejected. A bare address parses as a /32.
 */
class Ipv4Network {
public:
    Ipv4Network() = default;

    /**
     * @brief Parses "a.b.c.d/n" or "a.b.c.d".
     * @param text Network or address text.
     * @return The parsed network.
     * @throws core::InvalidTargetError if the text is not a valid IPv4 network.
     */
    static Ipv4Network parse(const std::string& text);

    /**
     * @brief Returns true if the address lies inside this network.
     */
    [[nodiscard]] bool contains(const asio::ip::address_v4& address) const;

    /**
     * @brief Returns the usable host addresses in ascending order.
     *
     * Network and broadcast addresses are excluded, except for /31 (both
     * addresses) and /32 (the single address).
     */
    [[nodiscard]] std::vector<asio::ip::address_v4> hosts() const;

    /**
     * @brief Number of addresses covered by the network, including network
     * and broadcast addresses.
     */
    [[nodiscard]] uint64_t addressCount() const;

    [[nodiscard]] asio::ip::address_v4 address() const { return network_.network(); }
    [[nodiscard]] unsigned short prefixLength() const { return network_.prefix_length(); }
    [[nodiscard]] std::string toString() const { return network_.to_string(); }

private:
    explicit Ipv4Network(asio::ip::network_v4 network) : network_(network) {}

    asio::ip::network_v4 network_{asio::ip::address_v4::any(), 32};
};

/**
 * @brief Checks whether an address belongs to an IANA special-purpose
 * (private, loopback, link-local, documentation or reserved) range.
 *
 * Used to choose between the LAN and WAN connect timeouts.
 */
bool isPrivateAddress(const asio::ip::address_v4& address);

} // namespace tcpscan::infra
