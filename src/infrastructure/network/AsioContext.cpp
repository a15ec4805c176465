#include "infrastructure/network/AsioContext.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace tcpscan::infra {

AsioContext::AsioContext(size_t threadCount) : threadCount_(threadCount > 0 ? threadCount : 1) {}

AsioContext::~AsioContext() {
    stop();
}

void AsioContext::start() {
    if (running_.exchange(true)) {
        return;
    }

    workGuard_.emplace(asio::make_work_guard(ioContext_));

    threads_.reserve(threadCount_);
    for (size_t index = 0; index < threadCount_; ++index) {
        threads_.emplace_back(&AsioContext::runHandlers, this, index);
    }

    spdlog::debug("{} I/O threads serving connect attempts", threadCount_);
}

void AsioContext::runHandlers(size_t index) {
    // A handler exception is logged and the thread goes back to run()
    for (;;) {
        try {
            ioContext_.run();
            break;
        } catch (const std::exception& e) {
            ++handlerFailures_;
            spdlog::error("I/O thread {}: handler failed: {}", index, e.what());
        }
    }
}

void AsioContext::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    workGuard_.reset();
    ioContext_.stop();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    // Allows a later start() on the same context
    ioContext_.restart();
    spdlog::debug("I/O threads joined, {} handler failures", handlerFailures_.load());
}

size_t AsioContext::threadCountFor(int workers) {
    size_t hardware = std::max(4u, std::thread::hardware_concurrency());
    return std::clamp<size_t>(static_cast<size_t>(std::max(workers, 1)), 1, hardware);
}

} // namespace tcpscan::infra
