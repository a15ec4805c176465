#include "infrastructure/network/RuntimeStatsReporter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace tcpscan::infra {

RuntimeStatsReporter::RuntimeStatsReporter(AsioContext& context,
                                           const core::ScanCounters& counters,
                                           std::chrono::seconds interval,
                                           std::shared_ptr<spdlog::logger> logger)
    : schedule_(std::make_shared<Schedule>(context.getContext(), counters,
                                           std::max(interval, std::chrono::seconds(1)),
                                           std::move(logger))) {}

RuntimeStatsReporter::~RuntimeStatsReporter() {
    stop();
}

void RuntimeStatsReporter::start() {
    std::lock_guard lock(schedule_->mutex);
    if (schedule_->active) {
        return;
    }

    schedule_->active = true;
    schedule_->lastPortCount = schedule_->counters.portsScanned();
    schedule_->lastReport = std::chrono::steady_clock::now();
    scheduleNext(schedule_);

    spdlog::debug("Runtime stats every {}s", schedule_->interval.count());
}

void RuntimeStatsReporter::stop() {
    std::lock_guard lock(schedule_->mutex);
    if (!schedule_->active) {
        return;
    }

    schedule_->active = false;
    schedule_->timer.cancel();
}

bool RuntimeStatsReporter::isRunning() const {
    std::lock_guard lock(schedule_->mutex);
    return schedule_->active;
}

uint64_t RuntimeStatsReporter::reportCount() const {
    std::lock_guard lock(schedule_->mutex);
    return schedule_->reports;
}

void RuntimeStatsReporter::reportFinal() {
    std::lock_guard lock(schedule_->mutex);

    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - schedule_->lastReport);
    report(*schedule_, now, static_cast<double>(std::max<int64_t>(elapsed.count(), 1)));
}

// Called with schedule->mutex held.
void RuntimeStatsReporter::scheduleNext(const std::shared_ptr<Schedule>& schedule) {
    schedule->timer.expires_after(schedule->interval);
    schedule->timer.async_wait([schedule](const asio::error_code& ec) {
        if (ec) {
            return;
        }

        std::lock_guard lock(schedule->mutex);
        if (!schedule->active) {
            return;
        }

        scheduleNext(schedule);

        auto now = std::chrono::steady_clock::now();
        auto ports = schedule->counters.portsScanned();
        if (ports == 0) {
            // The next rate covers one interval, not the time spent silent
            schedule->lastPortCount = ports;
            schedule->lastReport = now;
            return;
        }

        std::chrono::duration<double> elapsed = now - schedule->lastReport;
        report(*schedule, now, std::max(elapsed.count(), 1.0));
        ++schedule->reports;
    });
}

void RuntimeStatsReporter::report(Schedule& schedule, std::chrono::steady_clock::time_point now,
                                  double elapsedSeconds) {
    auto ports = schedule.counters.portsScanned();
    auto rate = static_cast<uint64_t>(static_cast<double>(ports - schedule.lastPortCount) /
                                      elapsedSeconds);

    schedule.logger->info("hosts:{}\tports:{}\tports/sec:{}", schedule.counters.hostsScanned(),
                          ports, rate);

    schedule.lastPortCount = ports;
    schedule.lastReport = now;
}

} // namespace tcpscan::infra
