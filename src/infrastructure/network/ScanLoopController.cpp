#include "infrastructure/network/ScanLoopController.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace tcpscan::infra {

std::string terminationReasonToString(TerminationReason reason) {
    switch (reason) {
    case TerminationReason::PassLimitReached:
        return "pass limit reached";
    case TerminationReason::AllOpen:
        return "all ports open";
    case TerminationReason::AllClosed:
        return "all ports closed";
    case TerminationReason::Interrupted:
        return "interrupted";
    }
    return "unknown";
}

ScanLoopController::ScanLoopController(const core::ScanConfig& config, HostScanner& scanner,
                                       core::ScanCounters& counters, ResultWriter& writer)
    : config_(config), scanner_(scanner), counters_(counters), writer_(writer) {}

std::chrono::milliseconds ScanLoopController::selectTimeout(const core::ScanConfig& config,
                                                            const asio::ip::address_v4& address) {
    if (config.timeout) {
        return *config.timeout;
    }
    return isPrivateAddress(address) ? config.lanTimeout : config.wanTimeout;
}

LoopOutcome ScanLoopController::run(const std::vector<asio::ip::address_v4>& hosts,
                                    const std::optional<Ipv4Network>& excluded) {
    LoopOutcome outcome;
    auto start = std::chrono::steady_clock::now();
    auto limit = config_.passLimit();

    for (int64_t pass = 0; pass < limit; ++pass) {
        if (cancelled_) {
            outcome.reason = TerminationReason::Interrupted;
            break;
        }

        outcome.passes = pass + 1;
        core::ScanResult last;

        for (const auto& host : hosts) {
            if (cancelled_) {
                break;
            }

            auto address = host.to_string();

            if (excluded && excluded->contains(host)) {
                counters_.hostSkipped();
                if (config_.verbose) {
                    writer_.writeHostExcluded(address);
                }
                continue;
            }

            std::chrono::milliseconds timeout;
            {
                std::lock_guard lock(mutex_);
                if (!timeout_) {
                    timeout_ = selectTimeout(config_, host);
                    spdlog::debug("Connect timeout {}ms", timeout_->count());
                }
                timeout = *timeout_;
            }

            last = scanner_.scan(address, timeout);
        }

        if (cancelled_) {
            outcome.reason = TerminationReason::Interrupted;
            break;
        }

        if (config_.loopPolicy == core::LoopPolicy::UntilAllOpen && last.allOpen()) {
            writePassMarker(outcome.passes);
            writer_.writeLine("\a");
            outcome.reason = TerminationReason::AllOpen;
            break;
        }

        if (config_.loopPolicy == core::LoopPolicy::UntilAllClosed && last.allClosed()) {
            writePassMarker(outcome.passes);
            writer_.writeLine("\a");
            outcome.reason = TerminationReason::AllClosed;
            break;
        }

        if (config_.loopRequested()) {
            writePassMarker(outcome.passes);
            writer_.writeLine("");
        }

        if (pass + 1 < limit && !pauseBetweenPasses()) {
            outcome.reason = TerminationReason::Interrupted;
            break;
        }
    }

    outcome.elapsed = std::chrono::steady_clock::now() - start;
    spdlog::debug("Scan loop ended after {} passes: {}", outcome.passes,
                  terminationReasonToString(outcome.reason));
    return outcome;
}

void ScanLoopController::cancel() {
    if (cancelled_.exchange(true)) {
        return;
    }

    spdlog::debug("Cancelling scan loop");
    scanner_.cancel();

    {
        std::lock_guard lock(mutex_);
    }
    wakeup_.notify_all();
}

std::optional<std::chrono::milliseconds> ScanLoopController::connectTimeout() const {
    std::lock_guard lock(mutex_);
    return timeout_;
}

bool ScanLoopController::pauseBetweenPasses() {
    std::unique_lock lock(mutex_);
    return !wakeup_.wait_for(lock, config_.interPassDelay, [this] { return cancelled_.load(); });
}

void ScanLoopController::writePassMarker(int64_t passes) {
    writer_.writeLine(fmt::format("[{}] completed loops:{}", ResultWriter::timestamp(), passes));
}

} // namespace tcpscan::infra
