#include "infrastructure/network/HostScanner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace tcpscan::infra {

namespace {

constexpr auto kSlotPollInterval = std::chrono::milliseconds(50);

} // namespace

HostScanner::HostScanner(const core::ScanConfig& config, PortProbe& probe,
                         core::ScanCounters& counters)
    : config_(config), probe_(probe), counters_(counters),
      ports_(core::resolvePortSpec(config.effectivePorts())), rng_(std::random_device{}()),
      slots_(std::make_unique<std::counting_semaphore<>>(std::max(config.workers, 1))) {}

HostScanner::~HostScanner() {
    cancel();

    std::unique_lock lock(mutex_);
    completion_.wait(lock, [this] { return inFlight_ == 0; });
}

core::ScanResult HostScanner::scan(const std::string& address, std::chrono::milliseconds timeout) {
    counters_.hostScanned();

    auto ports = ports_;
    if (config_.shufflePorts) {
        std::shuffle(ports.begin(), ports.end(), rng_);
    }

    auto state = std::make_shared<ScanState>();
    state->result.targetAddress = address;

    spdlog::debug("Scanning {} on {} ports, timeout {}ms", address, ports.size(), timeout.count());

    for (uint16_t port : ports) {
        if (cancelled_) {
            break;
        }

        if (probe_.isExcluded(port)) {
            probe_.probe(address, port, timeout, nullptr);
            continue;
        }

        if (!acquireSlot()) {
            break;
        }

        {
            std::lock_guard lock(mutex_);
            ++state->submitted;
            ++inFlight_;
        }

        try {
            probe_.probe(address, port, timeout,
                         [this, state](const core::PortScanResult& result) {
                             finishProbe(state, result);
                         });
        } catch (const std::exception& e) {
            spdlog::debug("Probe of {}:{} failed to start - {}", address, port, e.what());
            core::PortScanResult result;
            result.targetAddress = address;
            result.port = port;
            result.state = core::PortState::Closed;
            finishProbe(state, result);
        }
    }

    std::unique_lock lock(mutex_);
    completion_.wait(lock, [this, &state] {
        return state->completed == state->submitted || cancelled_.load();
    });

    if (state->completed < state->submitted) {
        spdlog::debug("Scan of {} interrupted with {} of {} probes complete", address,
                      state->completed, state->submitted);
    }

    return state->result;
}

void HostScanner::cancel() {
    cancelled_ = true;
    {
        std::lock_guard lock(mutex_);
    }
    completion_.notify_all();
}

bool HostScanner::acquireSlot() {
    while (!slots_->try_acquire_for(kSlotPollInterval)) {
        if (cancelled_) {
            return false;
        }
    }

    if (cancelled_) {
        slots_->release();
        return false;
    }
    return true;
}

void HostScanner::finishProbe(const std::shared_ptr<ScanState>& state,
                              const core::PortScanResult& result) {
    slots_->release();

    std::lock_guard lock(mutex_);
    state->result.ports[result.port] = result.state == core::PortState::Open;
    ++state->completed;
    --inFlight_;
    completion_.notify_all();
}

} // namespace tcpscan::infra
