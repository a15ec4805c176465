#pragma once

#include "core/services/ITcpConnector.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>
#include <atomic>

namespace tcpscan::infra {

/**
 * @brief TCP connect prober built on asio.
 *
 * Each attempt races an async_connect against a steady_timer on a private
 * strand; whichever finishes first decides the outcome and closes the
 * socket. Implements core::ITcpConnector.
 */
class TcpConnector : public core::ITcpConnector {
public:
    explicit TcpConnector(AsioContext& context);

    void connectAsync(const std::string& address, uint16_t port,
                      std::chrono::milliseconds timeout, ConnectCallback onComplete) override;

private:
    struct Attempt {
        explicit Attempt(asio::io_context& io)
            : strand(asio::make_strand(io)), socket(strand), timer(strand) {}

        asio::strand<asio::io_context::executor_type> strand;
        asio::ip::tcp::socket socket;
        asio::steady_timer timer;
        ConnectCallback onComplete;
        std::atomic<bool> completed{false};
    };

    static void finish(const std::shared_ptr<Attempt>& attempt, bool open);

    AsioContext& context_;
};

} // namespace tcpscan::infra
