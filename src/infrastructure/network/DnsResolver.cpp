#include "infrastructure/network/DnsResolver.hpp"

#include <spdlog/spdlog.h>

namespace tcpscan::infra {

std::optional<std::string> DnsResolver::resolve(const std::string& hostname) {
    asio::ip::tcp::resolver resolver(ioContext_);
    asio::error_code ec;

    auto results = resolver.resolve(asio::ip::tcp::v4(), hostname, "", ec);
    if (ec || results.empty()) {
        spdlog::debug("Forward lookup of {} failed: {}", hostname, ec.message());
        return std::nullopt;
    }

    return results.begin()->endpoint().address().to_string();
}

std::optional<std::string> DnsResolver::reverseLookup(const std::string& address) {
    asio::error_code ec;
    auto ip = asio::ip::make_address_v4(address, ec);
    if (ec) {
        return std::nullopt;
    }

    asio::ip::tcp::resolver resolver(ioContext_);
    auto results = resolver.resolve(asio::ip::tcp::endpoint(ip, 0), ec);
    if (ec || results.empty()) {
        spdlog::debug("Reverse lookup of {} failed: {}", address, ec.message());
        return std::nullopt;
    }

    // getnameinfo falls back to the numeric form when no PTR record exists
    auto name = results.begin()->host_name();
    if (name.empty() || name == address) {
        return std::nullopt;
    }
    return name;
}

} // namespace tcpscan::infra
