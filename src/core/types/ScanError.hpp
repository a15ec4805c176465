/**
 * @file ScanError.hpp
 * @brief Exception types raised while building a scan from user input.
 *
 * All of these are configuration-time failures. Network failures during a
 * scan are never reported through exceptions.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace tcpscan::core {

/**
 * @brief Base class for every fatal scanner error.
 */
class ScanError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A port or skip-port specification could not be parsed.
 */
class InvalidSpecError : public ScanError {
public:
    using ScanError::ScanError;
};

/**
 * @brief A target or excluded network expression could not be parsed.
 */
class InvalidTargetError : public ScanError {
public:
    using ScanError::ScanError;
};

/**
 * @brief A hostname target did not resolve to an IPv4 address.
 */
class UnresolvableHostError : public ScanError {
public:
    explicit UnresolvableHostError(const std::string& hostname)
        : ScanError("Unable to resolve hostname: " + hostname), hostname_(hostname) {}

    const std::string& hostname() const { return hostname_; }

private:
    std::string hostname_;
};

/**
 * @brief Conflicting or malformed options, or an unreadable config file.
 */
class ConfigError : public ScanError {
public:
    using ScanError::ScanError;
};

} // namespace tcpscan::core
