#pragma once

#include "core/types/ScanCounters.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>
#include <spdlog/logger.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>

namespace tcpscan::infra {

/**
 * @brief Periodically logs the scan rate while a scan runs.
 *
 * Every interval it writes "hosts:<n>  ports:<n>  ports/sec:<n>" through
 * the given logger, where ports/sec covers the time since the previous
 * report. The reporter only reads the counters. stop() is the single
 * cancellation signal; no report is written after it returns.
 */
class RuntimeStatsReporter {
public:
    /**
     * @brief Constructs a reporter.
     * @param context AsioContext that runs the timer.
     * @param counters Counters to report on.
     * @param interval Time between reports, at least one second.
     * @param logger Destination of the report lines.
     */
    RuntimeStatsReporter(AsioContext& context, const core::ScanCounters& counters,
                         std::chrono::seconds interval, std::shared_ptr<spdlog::logger> logger);

    /**
     * @brief Destructor. Stops reporting.
     */
    ~RuntimeStatsReporter();

    RuntimeStatsReporter(const RuntimeStatsReporter&) = delete;
    RuntimeStatsReporter& operator=(const RuntimeStatsReporter&) = delete;

    /**
     * @brief Records the starting point and schedules the first report.
     */
    void start();

    /**
     * @brief Cancels the pending report.
     */
    void stop();

    /**
     * @brief Writes one last report covering the time since the previous one.
     *
     * The rate divisor is the elapsed whole seconds, at least one.
     */
    void reportFinal();

    [[nodiscard]] bool isRunning() const;

    /**
     * @brief Number of periodic reports written so far.
     */
    [[nodiscard]] uint64_t reportCount() const;

private:
    struct Schedule {
        Schedule(asio::io_context& io, const core::ScanCounters& counters,
                 std::chrono::seconds interval, std::shared_ptr<spdlog::logger> logger)
            : timer(io), counters(counters), interval(interval), logger(std::move(logger)) {}

        asio::steady_timer timer;
        const core::ScanCounters& counters;
        std::chrono::seconds interval;
        std::shared_ptr<spdlog::logger> logger;

        std::mutex mutex;
        bool active{false};
        uint64_t lastPortCount{0};
        std::chrono::steady_clock::time_point lastReport;
        uint64_t reports{0};
    };

    static void scheduleNext(const std::shared_ptr<Schedule>& schedule);
    static void report(Schedule& schedule, std::chrono::steady_clock::time_point now,
                       double elapsedSeconds);

    std::shared_ptr<Schedule> schedule_;
};

} // namespace tcpscan::infra
