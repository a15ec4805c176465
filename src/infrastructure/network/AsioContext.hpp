#pragma once

#include <asio.hpp>
#include <atomic>
#include <cstdint>
#include <optional>
#include <thread>
#include <vector>

namespace tcpscan::infra {

/**
 * @brief Owns the asio::io_context and the threads that run its handlers.
 *
 * Connect attempts, timeouts, the runtime stats timer, the listener
 * acceptors and signal handling all complete on these threads. An
 * executor_work_guard keeps the threads alive until stop() is called.
 *
 * @note This class is non-copyable.
 */
class AsioContext {
public:
    /**
     * @brief Constructs an AsioContext with the specified number of threads.
     * @param threadCount Number of handler threads, at least one.
     */
    explicit AsioContext(size_t threadCount = std::thread::hardware_concurrency());

    /**
     * @brief Destructor. Stops the context and joins all threads.
     */
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Spawns the handler threads. Has no effect if already running.
     */
    void start();

    /**
     * @brief Releases the work guard, stops the io_context and joins the threads.
     */
    void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }
    [[nodiscard]] size_t threadCount() const { return threadCount_; }

    /**
     * @brief Number of completion handlers that escaped with an exception.
     */
    [[nodiscard]] uint64_t handlerFailures() const { return handlerFailures_.load(); }

    asio::io_context& getContext() { return ioContext_; }

    /**
     * @brief Posts a handler to be executed on one of the handler threads.
     */
    template <typename Handler>
    void post(Handler&& handler) {
        asio::post(ioContext_, std::forward<Handler>(handler));
    }

    /**
     * @brief Picks a handler thread count for a scan with the given worker count.
     *
     * Handlers only do bookkeeping, so a handful of threads serve any
     * number of in-flight connects.
     */
    static size_t threadCountFor(int workers);

private:
    void runHandlers(size_t index);

    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> handlerFailures_{0};
    size_t threadCount_;
};

} // namespace tcpscan::infra
