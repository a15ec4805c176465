#include "infrastructure/config/ConfigManager.hpp"

#include "core/types/ScanError.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace tcpscan::infra {

ConfigManager::ConfigManager(std::filesystem::path configPath)
    : configPath_(std::move(configPath)) {}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::warn("Config file {} not found, using defaults", configPath_.string());
        return false;
    }

    std::ifstream file(configPath_);
    if (!file) {
        throw core::ConfigError("Failed to open config file: " + configPath_.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw core::ConfigError("Failed to parse config file " + configPath_.string() + ": " +
                                e.what());
    }

    fromJson(j);
    spdlog::debug("Loaded configuration from {}", configPath_.string());
    return true;
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    j["scanner"]["workers"] = config_.workers;
    j["scanner"]["timeout_lan_ms"] = config_.lanTimeout.count();
    j["scanner"]["timeout_wan_ms"] = config_.wanTimeout.count();
    j["scanner"]["inter_pass_delay_ms"] = config_.interPassDelay.count();
    j["scanner"]["default_ports"] = config_.defaultPorts;

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("scanner")) {
        return;
    }

    try {
        const auto& s = j["scanner"];

        config_.workers = s.value("workers", config_.workers);
        config_.lanTimeout = std::chrono::milliseconds(
            s.value("timeout_lan_ms", static_cast<int64_t>(config_.lanTimeout.count())));
        config_.wanTimeout = std::chrono::milliseconds(
            s.value("timeout_wan_ms", static_cast<int64_t>(config_.wanTimeout.count())));
        config_.interPassDelay = std::chrono::milliseconds(
            s.value("inter_pass_delay_ms", static_cast<int64_t>(config_.interPassDelay.count())));
        config_.defaultPorts = s.value("default_ports", config_.defaultPorts);
    } catch (const nlohmann::json::exception& e) {
        throw core::ConfigError(std::string("Invalid scanner configuration: ") + e.what());
    }

    if (config_.workers < 1) {
        throw core::ConfigError("scanner.workers must be at least 1");
    }
    if (config_.lanTimeout.count() <= 0 || config_.wanTimeout.count() <= 0) {
        throw core::ConfigError("scanner timeouts must be positive");
    }
    if (config_.interPassDelay.count() <= 0) {
        throw core::ConfigError("scanner.inter_pass_delay_ms must be positive");
    }

    // Validate now so a bad list fails before the command line is applied
    core::PortSpec::parse(config_.defaultPorts);
}

} // namespace tcpscan::infra
