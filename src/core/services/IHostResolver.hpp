/**
 * @file IHostResolver.hpp
 * @brief Interface for forward and reverse DNS lookups.
 */

#pragma once

#include <optional>
#include <string>

namespace tcpscan::core {

/**
 * @brief Name resolution used by the host enumerator and the DNS cache.
 */
class IHostResolver {
public:
    virtual ~IHostResolver() = default;

    /**
     * @brief Resolves a hostname to one IPv4 address.
     * @param hostname Name to look up.
     * @return Dotted-quad address, or nullopt if the lookup failed.
     */
    virtual std::optional<std::string> resolve(const std::string& hostname) = 0;

    /**
     * @brief Looks up the name registered for an address.
     * @param address Dotted-quad IPv4 address.
     * @return The hostname, or nullopt if none could be found.
     */
    virtual std::optional<std::string> reverseLookup(const std::string& address) = 0;
};

} // namespace tcpscan::core
