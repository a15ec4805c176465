#pragma once

#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/DnsCache.hpp"
#include "infrastructure/output/ResultWriter.hpp"

#include <asio.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tcpscan::infra {

/**
 * @brief One accepted inbound connection.
 */
struct ConnectionRecord {
    std::string timestamp;     ///< Local time of the accept
    std::string localAddress;  ///< Listening address
    uint16_t localPort{0};     ///< Listening port
    std::string remoteAddress; ///< Peer address, or its name when resolved
    uint16_t remotePort{0};    ///< Peer port
};

/**
 * @brief Passive mode: logs every inbound TCP connection and closes it.
 *
 * Binds one acceptor per requested port on all interfaces. Each accepted
 * connection is written through the ResultWriter, optionally resolving the
 * peer through the shared DNS cache, then closed immediately.
 *
 * @note This class is non-copyable.
 */
class ConnectionListener : public std::enable_shared_from_this<ConnectionListener> {
public:
    using ConnectionCallback = std::function<void(const ConnectionRecord&)>;

    /**
     * @brief Constructs a ConnectionListener.
     * @param context AsioContext that runs the acceptors.
     * @param writer Destination of the connection records.
     * @param dnsCache Cache used to name peers, or nullptr to log addresses.
     */
    ConnectionListener(AsioContext& context, ResultWriter& writer, DnsCache* dnsCache = nullptr);

    ~ConnectionListener();

    ConnectionListener(const ConnectionListener&) = delete;
    ConnectionListener& operator=(const ConnectionListener&) = delete;

    /**
     * @brief Binds every port and starts accepting.
     * @param ports Ports to listen on.
     * @param bindAddress Local address to bind, all interfaces by default.
     * @throws std::system_error if a port cannot be bound.
     */
    void start(const std::vector<uint16_t>& ports, const std::string& bindAddress = "0.0.0.0");

    /**
     * @brief Closes every acceptor.
     */
    void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

    /**
     * @brief Registers an observer called after each connection is logged.
     */
    void setConnectionCallback(ConnectionCallback callback);

    [[nodiscard]] uint64_t connectionCount() const { return connections_.load(); }

private:
    void startAccept(const std::shared_ptr<asio::ip::tcp::acceptor>& acceptor);
    void handleConnection(const std::shared_ptr<asio::ip::tcp::socket>& socket);

    AsioContext& context_;
    ResultWriter& writer_;
    DnsCache* dnsCache_;

    std::mutex mutex_;
    std::vector<std::shared_ptr<asio::ip::tcp::acceptor>> acceptors_;
    ConnectionCallback connectionCallback_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> connections_{0};
};

} // namespace tcpscan::infra
