#pragma once

#include "core/types/ScanConfig.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>

namespace tcpscan::infra {

/**
 * @brief Loads scanner defaults from a JSON file.
 *
 * The file holds a "scanner" object:
 * @code
 * {
 *   "scanner": {
 *     "workers": 100,
 *     "timeout_lan_ms": 70,
 *     "timeout_wan_ms": 180,
 *     "inter_pass_delay_ms": 700,
 *     "default_ports": "22,80,443"
 *   }
 * }
 * @endcode
 * Missing keys keep their built-in defaults; unknown keys are ignored.
 * Command-line options are applied on top of the loaded values.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the given file.
     * @param configPath Path to the JSON configuration file.
     */
    explicit ConfigManager(std::filesystem::path configPath);

    /**
     * @brief Loads the configuration file.
     * @return True if the file was read, false if it does not exist.
     * @throws core::ConfigError if the file is unreadable, malformed or holds
     *         out-of-range values.
     */
    bool load();

    core::ScanConfig& config() { return config_; }
    const core::ScanConfig& config() const { return config_; }

    [[nodiscard]] const std::filesystem::path& configPath() const { return configPath_; }

    /**
     * @brief Serializes the scanner defaults of the current configuration.
     */
    [[nodiscard]] nlohmann::json toJson() const;

    /**
     * @brief Applies the "scanner" object of a parsed document.
     * @throws core::ConfigError on wrong types or out-of-range values.
     */
    void fromJson(const nlohmann::json& j);

private:
    std::filesystem::path configPath_;
    core::ScanConfig config_;
};

} // namespace tcpscan::infra
