#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace ftpprobe::infra {

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    if (!std::filesystem::exists(configDir_)) {
        std::filesystem::create_directories(configDir_);
    }

    configPath_ = configDir_ / "config.json";
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, using defaults");
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        fromJson(j);

        spdlog::debug("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson();

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    // Probe
    j["probe"]["timeout_seconds"] = config_.timeoutSeconds;
    j["probe"]["max_workers"] = config_.maxWorkers;
    j["probe"]["progress_interval"] = config_.progressInterval;

    // Brute force
    j["brute_force"]["default_usernames"] = config_.defaultUsernames;
    j["brute_force"]["default_passwords"] = config_.defaultPasswords;

    // Logging
    j["logging"]["level"] = config_.logLevel;
    j["logging"]["log_file"] = config_.logFile;

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    const AppConfig defaults;

    // Probe
    if (j.contains("probe")) {
        const auto& p = j["probe"];
        config_.timeoutSeconds = p.value("timeout_seconds", defaults.timeoutSeconds);
        config_.maxWorkers = p.value("max_workers", defaults.maxWorkers);
        config_.progressInterval = p.value("progress_interval", defaults.progressInterval);
    }

    // Brute force
    if (j.contains("brute_force")) {
        const auto& b = j["brute_force"];
        config_.defaultUsernames = b.value("default_usernames", defaults.defaultUsernames);
        config_.defaultPasswords = b.value("default_passwords", defaults.defaultPasswords);
    }

    // Logging
    if (j.contains("logging")) {
        const auto& l = j["logging"];
        config_.logLevel = l.value("level", defaults.logLevel);
        config_.logFile = l.value("log_file", defaults.logFile);
    }

    if (config_.timeoutSeconds < 1) {
        spdlog::warn("Invalid probe.timeout_seconds {}, using {}", config_.timeoutSeconds,
                     defaults.timeoutSeconds);
        config_.timeoutSeconds = defaults.timeoutSeconds;
    }
    if (config_.maxWorkers < 1) {
        spdlog::warn("Invalid probe.max_workers {}, using {}", config_.maxWorkers,
                     defaults.maxWorkers);
        config_.maxWorkers = defaults.maxWorkers;
    }
    if (config_.progressInterval < 1) {
        spdlog::warn("Invalid probe.progress_interval {}, using {}", config_.progressInterval,
                     defaults.progressInterval);
        config_.progressInterval = defaults.progressInterval;
    }
}

} // namespace ftpprobe::infra
