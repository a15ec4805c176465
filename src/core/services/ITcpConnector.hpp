/**
 * @file ITcpConnector.hpp
 * @brief Interface for a bounded-timeout TCP connect attempt.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace tcpscan::core {

/**
 * @brief Performs one TCP connect handshake and reports whether it succeeded.
 *
 * Implementations never throw from connectAsync(); any failure (refusal,
 * timeout, unreachable network, malformed address) is reported as closed.
 */
class ITcpConnector {
public:
    /**
     * @brief Callback invoked exactly once per attempt.
     * @param open True if the handshake completed within the timeout.
     */
    using ConnectCallback = std::function<void(bool open)>;

    virtual ~ITcpConnector() = default;

    /**
     * @brief Starts a connect attempt.
     * @param address Dotted-quad IPv4 address.
     * @param port Target port.
     * @param timeout Upper bound on the attempt.
     * @param onComplete Invoked on a worker thread when the attempt finishes.
     */
    virtual void connectAsync(const std::string& address, uint16_t port,
                              std::chrono::milliseconds timeout, ConnectCallback onComplete) = 0;
};

} // namespace tcpscan::core
