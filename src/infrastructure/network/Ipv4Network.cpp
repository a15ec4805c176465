#include "infrastructure/network/Ipv4Network.hpp"

#include "core/types/ScanError.hpp"

#include <array>

namespace tcpscan::infra {

namespace {

uint32_t maskFor(unsigned short prefix) {
    return prefix == 0 ? 0u : 0xFFFFFFFFu << (32 - prefix);
}

struct PrivateRange {
    uint32_t network;
    unsigned short prefix;
};

constexpr uint32_t ip(uint32_t a, uint32_t b, uint32_t c, uint32_t d) {
    return (a << 24) | (b << 16) | (c << 8) | d;
}

constexpr std::array<PrivateRange, 14> kPrivateRanges{{
    {ip(0, 0, 0, 0), 8},
    {ip(10, 0, 0, 0), 8},
    {ip(127, 0, 0, 0), 8},
    {ip(169, 254, 0, 0), 16},
    {ip(172, 16, 0, 0), 12},
    {ip(192, 0, 0, 0), 29},
    {ip(192, 0, 0, 170), 31},
    {ip(192, 0, 2, 0), 24},
    {ip(192, 168, 0, 0), 16},
    {ip(198, 18, 0, 0), 15},
    {ip(198, 51, 100, 0), 24},
    {ip(203, 0, 113, 0), 24},
    {ip(240, 0, 0, 0), 4},
    {ip(255, 255, 255, 255), 32},
}};

} // namespace

Ipv4Network Ipv4Network::parse(const std::string& text) {
    asio::ip::network_v4 network;

    try {
        if (text.find('/') == std::string::npos) {
            network = asio::ip::network_v4(asio::ip::make_address_v4(text), 32);
        } else {
            network = asio::ip::make_network_v4(text);
        }
    } catch (const std::exception&) {
        throw core::InvalidTargetError("'" + text + "' does not appear to be an IPv4 network");
    }

    if (network.address() != network.network()) {
        throw core::InvalidTargetError(text + " has host bits set");
    }

    return Ipv4Network(network);
}

bool Ipv4Network::contains(const asio::ip::address_v4& address) const {
    auto mask = maskFor(network_.prefix_length());
    return (address.to_uint() & mask) == network_.network().to_uint();
}

uint64_t Ipv4Network::addressCount() const {
    return uint64_t{1} << (32 - network_.prefix_length());
}

std::vector<asio::ip::address_v4> Ipv4Network::hosts() const {
    uint64_t first = network_.network().to_uint();
    uint64_t count = addressCount();

    if (count > 2) {
        ++first;
        count -= 2;
    }

    std::vector<asio::ip::address_v4> result;
    result.reserve(static_cast<size_t>(count));
    for (uint64_t i = 0; i < count; ++i) {
        result.emplace_back(static_cast<uint32_t>(first + i));
    }
    return result;
}

bool isPrivateAddress(const asio::ip::address_v4& address) {
    auto value = address.to_uint();
    for (const auto& range : kPrivateRanges) {
        if ((value & maskFor(range.prefix)) == range.network) {
            return true;
        }
    }
    return false;
}

} // namespace tcpscan::infra
