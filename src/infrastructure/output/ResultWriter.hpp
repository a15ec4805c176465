#pragma once

#include "core/types/PortScanResult.hpp"
#include "core/types/ScanCounters.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace tcpscan::infra {

/**
 * @brief Final figures printed when a scan ends.
 */
struct ScanSummary {
    core::ScanStatistics statistics;
    std::chrono::steady_clock::duration elapsed{};
    int64_t passes{0};
};

/**
 * @brief Writes result records to the console and an optional CSV file.
 *
 * Console records are tab separated; the CSV copy of each record uses
 * commas and is flushed immediately. A single mutex serializes writers so
 * that every record reaches both outputs as one complete line.
 */
class ResultWriter {
public:
    explicit ResultWriter(std::ostream& out = std::cout);

    /**
     * @brief Opens the CSV copy of the output.
     * @param path File to write.
     * @param append Keep existing content instead of truncating.
     * @param header Line written first when the file is created or truncated.
     * @throws core::ConfigError if the file cannot be opened.
     */
    void openCsv(const std::filesystem::path& path, bool append = false,
                 std::string_view header = {});

    [[nodiscard]] bool hasCsv() const { return csv_.is_open(); }

    /**
     * @brief Writes "host\tport\tstatus" with an optional fourth hostname field.
     * @param result Probe outcome to record.
     * @param includeHostname Append result.hostname, even when empty.
     */
    void writeResult(const core::PortScanResult& result, bool includeHostname = false);

    /**
     * @brief Writes "host\tn/a\thost-excluded".
     */
    void writeHostExcluded(const std::string& address);

    /**
     * @brief Records an accepted listener connection.
     *
     * Console: "[timestamp] Incoming connection on local from remote".
     * CSV: "timestamp,local,remote".
     */
    void writeConnection(const std::string& timestamp, const std::string& local,
                         const std::string& remote);

    /**
     * @brief Writes a console-only line such as a loop marker.
     */
    void writeLine(std::string_view line);

    /**
     * @brief Prints the end-of-run figures.
     *
     * Verbose runs get the full block. Otherwise a short block is printed
     * only when no open port was found.
     */
    void writeSummary(const ScanSummary& summary, bool verbose);

    /**
     * @brief Joins fields into one tab separated record.
     */
    static std::string formatRecord(std::initializer_list<std::string_view> fields);

    /**
     * @brief Current local time as "YYYY-mm-dd HH:MM:SS".
     */
    static std::string timestamp();

    /**
     * @brief Formats a duration as H:MM:SS.ffffff.
     */
    static std::string formatElapsed(std::chrono::steady_clock::duration elapsed);

private:
    void emit(const std::string& record);

    std::mutex mutex_;
    std::ostream& out_;
    std::ofstream csv_;
};

} // namespace tcpscan::infra
