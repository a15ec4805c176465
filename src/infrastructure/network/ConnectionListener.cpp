#include "infrastructure/network/ConnectionListener.hpp"

#include <spdlog/spdlog.h>

namespace tcpscan::infra {

ConnectionListener::ConnectionListener(AsioContext& context, ResultWriter& writer,
                                       DnsCache* dnsCache)
    : context_(context), writer_(writer), dnsCache_(dnsCache) {}

ConnectionListener::~ConnectionListener() {
    stop();
}

void ConnectionListener::start(const std::vector<uint16_t>& ports, const std::string& bindAddress) {
    if (running_.exchange(true)) {
        return;
    }

    auto address = asio::ip::make_address_v4(bindAddress);

    try {
        std::lock_guard lock(mutex_);
        for (uint16_t port : ports) {
            auto acceptor = std::make_shared<asio::ip::tcp::acceptor>(
                context_.getContext(), asio::ip::tcp::endpoint(address, port));
            acceptors_.push_back(acceptor);
            writer_.writeLine("Listening for incoming TCP connections on " + bindAddress + ":" +
                              std::to_string(port));
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to listen: {}", e.what());
        stop();
        throw;
    }

    std::lock_guard lock(mutex_);
    for (const auto& acceptor : acceptors_) {
        startAccept(acceptor);
    }
}

void ConnectionListener::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    std::lock_guard lock(mutex_);
    for (auto& acceptor : acceptors_) {
        asio::error_code ec;
        acceptor->close(ec);
    }
    acceptors_.clear();
    spdlog::debug("Listener stopped after {} connections", connections_.load());
}

void ConnectionListener::setConnectionCallback(ConnectionCallback callback) {
    std::lock_guard lock(mutex_);
    connectionCallback_ = std::move(callback);
}

void ConnectionListener::startAccept(const std::shared_ptr<asio::ip::tcp::acceptor>& acceptor) {
    if (!running_.load()) {
        return;
    }

    auto socket = std::make_shared<asio::ip::tcp::socket>(context_.getContext());
    auto self = shared_from_this();

    acceptor->async_accept(*socket, [this, self, acceptor, socket](const asio::error_code& ec) {
        if (!ec && running_.load()) {
            handleConnection(socket);
        }
        if (running_.load() && ec != asio::error::operation_aborted) {
            startAccept(acceptor);
        }
    });
}

void ConnectionListener::handleConnection(const std::shared_ptr<asio::ip::tcp::socket>& socket) {
    asio::error_code ec;
    auto local = socket->local_endpoint(ec);
    asio::ip::tcp::endpoint remote;
    if (!ec) {
        remote = socket->remote_endpoint(ec);
    }
    if (ec) {
        spdlog::debug("Dropped connection before it could be logged: {}", ec.message());
        return;
    }

    ConnectionRecord record;
    record.timestamp = ResultWriter::timestamp();
    record.localAddress = local.address().to_string();
    record.localPort = local.port();
    record.remoteAddress = remote.address().to_string();
    record.remotePort = remote.port();

    if (dnsCache_) {
        auto name = dnsCache_->lookup(record.remoteAddress);
        if (!name.empty()) {
            record.remoteAddress = name;
        }
    }

    writer_.writeConnection(record.timestamp,
                            record.localAddress + ":" + std::to_string(record.localPort),
                            record.remoteAddress + ":" + std::to_string(record.remotePort));
    ++connections_;

    socket->close(ec);

    ConnectionCallback callback;
    {
        std::lock_guard lock(mutex_);
        callback = connectionCallback_;
    }
    if (callback) {
        callback(record);
    }
}

} // namespace tcpscan::infra
