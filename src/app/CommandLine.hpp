#pragma once

#include "core/types/ScanConfig.hpp"

#include <boost/program_options.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace tcpscan::app {

/**
 * @brief Command-line front end of the scanner.
 *
 * Parsing and applying are separate steps so that a configuration file
 * named on the command line can be loaded before the remaining options
 * override it.
 */
class CommandLine {
public:
    CommandLine();

    /**
     * @brief Parses the arguments.
     * @throws core::ConfigError on unknown options or malformed values.
     */
    void parse(int argc, const char* const argv[]);

    /**
     * @brief Overrides fields of `config` with the parsed options.
     * @throws core::ConfigError on conflicting or out-of-range options.
     */
    void applyTo(core::ScanConfig& config) const;

    [[nodiscard]] bool helpRequested() const { return vm_.count("help") > 0; }
    [[nodiscard]] bool versionRequested() const { return vm_.count("version") > 0; }
    [[nodiscard]] bool debugRequested() const { return vm_.count("debug") > 0; }

    /**
     * @brief Path given with --config, if any.
     */
    [[nodiscard]] std::optional<std::filesystem::path> configFile() const;

    /**
     * @brief Usage text listing every option.
     */
    [[nodiscard]] std::string usage() const;

private:
    boost::program_options::options_description options_;
    boost::program_options::positional_options_description positional_;
    boost::program_options::variables_map vm_;
};

} // namespace tcpscan::app
