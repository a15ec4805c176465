#pragma once

#include "core/services/IHostResolver.hpp"

#include <asio.hpp>

namespace tcpscan::infra {

/**
 * @brief System resolver lookups through asio::ip::tcp::resolver.
 *
 * Lookups are synchronous and safe to issue from several threads at once.
 * Implements core::IHostResolver.
 */
class DnsResolver : public core::IHostResolver {
public:
    std::optional<std::string> resolve(const std::string& hostname) override;
    std::optional<std::string> reverseLookup(const std::string& address) override;

private:
    asio::io_context ioContext_;
};

} // namespace tcpscan::infra
