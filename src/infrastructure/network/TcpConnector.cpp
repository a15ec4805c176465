#include "infrastructure/network/TcpConnector.hpp"

#include <spdlog/spdlog.h>

namespace tcpscan::infra {

TcpConnector::TcpConnector(AsioContext& context) : context_(context) {}

void TcpConnector::connectAsync(const std::string& address, uint16_t port,
                                std::chrono::milliseconds timeout, ConnectCallback onComplete) {
    asio::error_code ec;
    auto ip = asio::ip::make_address_v4(address, ec);
    if (ec) {
        spdlog::debug("Cannot connect to {}:{} - {}", address, port, ec.message());
        context_.post([onComplete = std::move(onComplete)]() { onComplete(false); });
        return;
    }

    auto attempt = std::make_shared<Attempt>(context_.getContext());
    attempt->onComplete = std::move(onComplete);

    asio::post(attempt->strand, [attempt, endpoint = asio::ip::tcp::endpoint(ip, port), timeout]() {
        attempt->timer.expires_after(timeout);
        attempt->timer.async_wait([attempt](const asio::error_code& ec) {
            if (ec) {
                return; // Cancelled after the connect completed
            }
            finish(attempt, false);
        });

        attempt->socket.async_connect(endpoint, [attempt](const asio::error_code& ec) {
            if (ec == asio::error::operation_aborted) {
                return; // Socket closed by the timeout
            }
            finish(attempt, !ec);
        });
    });
}

void TcpConnector::finish(const std::shared_ptr<Attempt>& attempt, bool open) {
    if (attempt->completed.exchange(true)) {
        return;
    }

    attempt->timer.cancel();

    asio::error_code ignored;
    attempt->socket.close(ignored);

    attempt->onComplete(open);
}

} // namespace tcpscan::infra
