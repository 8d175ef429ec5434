#include <catch2/catch_test_macros.hpp>

#include "infrastructure/config/ConfigManager.hpp"

#include <filesystem>
#include <fstream>

using namespace ftpprobe::infra;

namespace {

class TestConfigDir {
public:
    TestConfigDir()
        : configDir_(std::filesystem::temp_directory_path() / "ftpprobe_config_test") {
        cleanup();
        std::filesystem::create_directories(configDir_);
    }

    ~TestConfigDir() { cleanup(); }

    std::filesystem::path path() const { return configDir_; }

private:
    void cleanup() {
        if (std::filesystem::exists(configDir_)) {
            std::filesystem::remove_all(configDir_);
        }
    }

    std::filesystem::path configDir_;
};

void writeConfig(const std::filesystem::path& dir, const std::string& content) {
    std::ofstream file(dir / "config.json");
    file << content;
}

} // namespace

TEST_CASE("ConfigManager constructor", "[ConfigManager]") {
    SECTION("Creates config directory if it does not exist") {
        auto tempPath = std::filesystem::temp_directory_path() / "ftpprobe_config_new_test";
        std::filesystem::remove_all(tempPath);

        REQUIRE_FALSE(std::filesystem::exists(tempPath));

        ConfigManager manager(tempPath);

        REQUIRE(std::filesystem::is_directory(tempPath));

        std::filesystem::remove_all(tempPath);
    }

    SECTION("Sets correct paths") {
        TestConfigDir testDir;
        ConfigManager manager(testDir.path());

        REQUIRE(manager.configPath() == testDir.path() / "config.json");
        REQUIRE(manager.configDir() == testDir.path().string());
    }
}

TEST_CASE("ConfigManager load operations", "[ConfigManager]") {
    TestConfigDir testDir;

    SECTION("load creates config file with defaults when file does not exist") {
        ConfigManager manager(testDir.path());

        REQUIRE_FALSE(std::filesystem::exists(manager.configPath()));
        REQUIRE(manager.load());
        REQUIRE(std::filesystem::exists(manager.configPath()));

        const auto& config = manager.config();
        REQUIRE(config.timeoutSeconds == 10);
        REQUIRE(config.maxWorkers == 5);
        REQUIRE(config.progressInterval == 10);
        REQUIRE(config.defaultUsernames ==
                std::vector<std::string>{"anonymous", "ftp", "admin", "root", "guest"});
        REQUIRE(config.defaultPasswords.size() == 8);
        REQUIRE(config.defaultPasswords.back().empty());
        REQUIRE(config.logLevel == "info");
        REQUIRE(config.logFile.empty());
    }

    SECTION("load reads existing config file") {
        nlohmann::json j;
        j["probe"]["timeout_seconds"] = 3;
        j["probe"]["max_workers"] = 20;
        j["brute_force"]["default_usernames"] = {"ops"};
        j["logging"]["level"] = "debug";
        j["logging"]["log_file"] = "/tmp/ftpprobe.log";
        writeConfig(testDir.path(), j.dump(2));

        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());

        REQUIRE(manager.config().timeoutSeconds == 3);
        REQUIRE(manager.config().maxWorkers == 20);
        REQUIRE(manager.config().progressInterval == 10);
        REQUIRE(manager.config().defaultUsernames == std::vector<std::string>{"ops"});
        REQUIRE(manager.config().defaultPasswords.size() == 8);
        REQUIRE(manager.config().logLevel == "debug");
        REQUIRE(manager.config().logFile == "/tmp/ftpprobe.log");
    }

    SECTION("Non-positive numbers fall back to defaults") {
        writeConfig(testDir.path(),
                    R"({"probe": {"timeout_seconds": 0, "max_workers": -4, "progress_interval": 0}})");

        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());

        REQUIRE(manager.config().timeoutSeconds == 10);
        REQUIRE(manager.config().maxWorkers == 5);
        REQUIRE(manager.config().progressInterval == 10);
    }

    SECTION("load returns false for invalid JSON") {
        writeConfig(testDir.path(), "{ invalid json content }}}");

        ConfigManager manager(testDir.path());
        REQUIRE_FALSE(manager.load());
    }

    SECTION("load returns false for mistyped values") {
        writeConfig(testDir.path(), R"({"probe": {"timeout_seconds": "ten"}})");

        ConfigManager manager(testDir.path());
        REQUIRE_FALSE(manager.load());
    }
}

TEST_CASE("ConfigManager save operations", "[ConfigManager]") {
    TestConfigDir testDir;

    SECTION("save round-trips modified values") {
        {
            ConfigManager manager(testDir.path());
            manager.config().maxWorkers = 12;
            manager.config().defaultPasswords = {"hunter2"};
            manager.config().logFile = "probe.log";
            REQUIRE(manager.save());
        }

        ConfigManager reloaded(testDir.path());
        REQUIRE(reloaded.load());
        REQUIRE(reloaded.config().maxWorkers == 12);
        REQUIRE(reloaded.config().defaultPasswords == std::vector<std::string>{"hunter2"});
        REQUIRE(reloaded.config().logFile == "probe.log");
    }

    SECTION("save writes the documented sections") {
        ConfigManager manager(testDir.path());
        REQUIRE(manager.save());

        std::ifstream file(manager.configPath());
        auto j = nlohmann::json::parse(file);

        REQUIRE(j.contains("probe"));
        REQUIRE(j.contains("brute_force"));
        REQUIRE(j.contains("logging"));
        REQUIRE(j["probe"]["timeout_seconds"] == 10);
        REQUIRE(j["brute_force"]["default_passwords"].size() == 8);
    }
}
