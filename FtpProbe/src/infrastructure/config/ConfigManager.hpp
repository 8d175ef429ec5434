#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ftpprobe::infra {

/**
 * @brief Application configuration settings.
 *
 * Defaults for the probe run, the brute-force word lists and logging.
 * Command-line options override these values for a single run.
 */
struct AppConfig {
    // Probe defaults
    int timeoutSeconds{10};   ///< Per-stage network timeout in seconds.
    int maxWorkers{5};        ///< Concurrent probes.
    int progressInterval{10}; ///< Brute-force progress line every N completions.

    // Brute force
    std::vector<std::string> defaultUsernames{"anonymous", "ftp", "admin", "root", "guest"};
    std::vector<std::string> defaultPasswords{"anonymous", "ftp",      "admin",    "root",
                                              "guest",     "123456",   "password", ""};

    // Logging
    std::string logLevel{"info"}; ///< spdlog level name.
    std::string logFile;          ///< Rotating log file path; empty disables file logging.
};

/**
 * @brief Manages application configuration persistence.
 *
 * Handles loading and saving of the configuration as config.json in the
 * configuration directory.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified config directory.
     * @param configDir Path to the configuration directory (created if missing).
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk, writing defaults if no file exists.
     * @return True if loaded successfully, false otherwise.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    /**
     * @brief Returns the path to the configuration file.
     * @return Path to config.json.
     */
    std::filesystem::path configPath() const { return configPath_; }

    std::string configDir() const { return configDir_.string(); }

private:
    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace ftpprobe::infra
