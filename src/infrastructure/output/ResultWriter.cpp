#include "infrastructure/output/ResultWriter.hpp"

#include "core/types/ScanError.hpp"

#include <spdlog/fmt/chrono.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>

namespace tcpscan::infra {

ResultWriter::ResultWriter(std::ostream& out) : out_(out) {}

void ResultWriter::openCsv(const std::filesystem::path& path, bool append,
                           std::string_view header) {
    std::lock_guard lock(mutex_);

    bool existed = std::filesystem::exists(path);
    auto mode = (append && existed) ? std::ios::app : std::ios::trunc;

    csv_.open(path, std::ios::out | mode);
    if (!csv_) {
        throw core::ConfigError("Unable to open output file: " + path.string());
    }

    if (mode == std::ios::trunc && !header.empty()) {
        csv_ << header << '\n';
        csv_.flush();
    }

    spdlog::debug("Writing CSV output to {}", path.string());
}

void ResultWriter::writeResult(const core::PortScanResult& result, bool includeHostname) {
    auto port = std::to_string(result.port);
    auto state = result.stateToString();

    if (includeHostname) {
        emit(formatRecord({result.targetAddress, port, state, result.hostname}));
    } else {
        emit(formatRecord({result.targetAddress, port, state}));
    }
}

void ResultWriter::writeHostExcluded(const std::string& address) {
    emit(formatRecord({address, "n/a", core::kHostExcluded}));
}

void ResultWriter::writeConnection(const std::string& timestamp, const std::string& local,
                                   const std::string& remote) {
    std::lock_guard lock(mutex_);
    out_ << fmt::format("[{}] Incoming connection on {} from {}\n", timestamp, local, remote)
         << std::flush;

    if (csv_.is_open()) {
        csv_ << timestamp << ',' << local << ',' << remote << '\n';
        csv_.flush();
    }
}

void ResultWriter::writeLine(std::string_view line) {
    std::lock_guard lock(mutex_);
    out_ << line << '\n' << std::flush;
}

void ResultWriter::emit(const std::string& record) {
    std::lock_guard lock(mutex_);
    out_ << record << '\n' << std::flush;

    if (csv_.is_open()) {
        auto row = record;
        std::replace(row.begin(), row.end(), '\t', ',');
        csv_ << row << '\n';
        csv_.flush();
    }
}

void ResultWriter::writeSummary(const ScanSummary& summary, bool verbose) {
    const auto& stats = summary.statistics;
    std::lock_guard lock(mutex_);

    if (verbose) {
        out_ << '\n'
             << fmt::format("Scan Time      :  {}\n", formatElapsed(summary.elapsed))
             << fmt::format("Active Hosts   :  {}\n", stats.activeHosts)
             << fmt::format("Hosts Scanned  :  {}\n", stats.hostsScanned)
             << fmt::format("Skipped Hosts  :  {}\n", stats.hostsSkipped)
             << fmt::format("Opened Ports   :  {}\n", stats.portsOpened)
             << fmt::format("Skipped Ports  :  {}\n", stats.portsSkipped)
             << fmt::format("Ports Scanned  :  {}\n", stats.portsScanned)
             << fmt::format("Completed Loops:  {}\n", summary.passes) << '\n';
    } else if (stats.portsOpened == 0) {
        out_ << '\n'
             << fmt::format("Opened Ports :  {}\n", stats.portsOpened)
             << fmt::format("Hosts Scanned:  {}\n", stats.hostsScanned)
             << fmt::format("Ports Scanned:  {}\n", stats.portsScanned) << '\n';
    }
    out_ << std::flush;
}

std::string ResultWriter::formatRecord(std::initializer_list<std::string_view> fields) {
    std::string record;
    bool first = true;
    for (auto field : fields) {
        if (!first) {
            record += '\t';
        }
        record += field;
        first = false;
    }
    return record;
}

std::string ResultWriter::timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", local);
}

std::string ResultWriter::formatElapsed(std::chrono::steady_clock::duration elapsed) {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count();
    auto hours = micros / 3'600'000'000LL;
    auto minutes = (micros / 60'000'000LL) % 60;
    auto seconds = (micros / 1'000'000LL) % 60;
    return fmt::format("{}:{:02}:{:02}.{:06}", hours, minutes, seconds, micros % 1'000'000LL);
}

} // namespace tcpscan::infra
