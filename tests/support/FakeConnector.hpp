#pragma once

#include "core/services/ITcpConnector.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace tcpscan::test {

/**
 * Connector that answers from a predicate instead of the network, and
 * records how many attempts were in flight at once.
 */
class FakeConnector : public core::ITcpConnector {
public:
    using OpenPredicate = std::function<bool(const std::string& address, uint16_t port)>;

    FakeConnector(infra::AsioContext& context, std::set<uint16_t> openPorts,
                  std::chrono::milliseconds latency = std::chrono::milliseconds(0))
        : context_(context), latency_(latency) {
        setOpenPorts(std::move(openPorts));
    }

    void connectAsync(const std::string& address, uint16_t port,
                      std::chrono::milliseconds /*timeout*/, ConnectCallback onComplete) override {
        int current = ++inFlight_;
        int observed = maxInFlight_.load();
        while (current > observed && !maxInFlight_.compare_exchange_weak(observed, current)) {
        }

        {
            std::lock_guard lock(mutex_);
            attempts_.emplace_back(address, port);
        }

        context_.post([this, address, port, onComplete = std::move(onComplete)]() {
            if (latency_.count() > 0) {
                std::this_thread::sleep_for(latency_);
            }

            bool open;
            {
                std::lock_guard lock(mutex_);
                open = predicate_(address, port);
            }

            --inFlight_;
            onComplete(open);
        });
    }

    void setOpenPorts(std::set<uint16_t> openPorts) {
        std::lock_guard lock(mutex_);
        predicate_ = [ports = std::move(openPorts)](const std::string&, uint16_t port) {
            return ports.count(port) > 0;
        };
    }

    void setPredicate(OpenPredicate predicate) {
        std::lock_guard lock(mutex_);
        predicate_ = std::move(predicate);
    }

    int maxInFlight() const { return maxInFlight_.load(); }

    size_t attemptCount() const {
        std::lock_guard lock(mutex_);
        return attempts_.size();
    }

    std::vector<std::pair<std::string, uint16_t>> attempts() const {
        std::lock_guard lock(mutex_);
        return attempts_;
    }

private:
    infra::AsioContext& context_;
    std::chrono::milliseconds latency_;

    mutable std::mutex mutex_;
    OpenPredicate predicate_;
    std::vector<std::pair<std::string, uint16_t>> attempts_;
    std::atomic<int> inFlight_{0};
    std::atomic<int> maxInFlight_{0};
};

} // namespace tcpscan::test
