#include <catch2/catch_test_macros.hpp>

#include "infrastructure/config/ConfigManager.hpp"

#include <filesystem>
#include <fstream>

using namespace portsweep::infra;
using namespace portsweep::core;

namespace {

class TestConfigDir {
public:
    TestConfigDir()
        : configDir_(std::filesystem::temp_directory_path() / "portsweep_config_test") {
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

} // namespace

TEST_CASE("ConfigManager defaults", "[ConfigManager]") {
    TestConfigDir testDir;
    ConfigManager manager(testDir.path() / "portsweep.json");

    SECTION("Scan defaults") {
        const auto& scan = manager.config().scan;
        REQUIRE(scan.timeout == std::chrono::milliseconds(500));
        REQUIRE(scan.workers == 200);
        REQUIRE_FALSE(scan.pingFirst);
        REQUIRE_FALSE(scan.pingTimeout.has_value());
        REQUIRE(scan.pingWorkersMax == kMaxPingWorkers);
        REQUIRE(scan.progressInterval == 100);
        REQUIRE(scan.maxHosts == kDefaultMaxHosts);
        REQUIRE(scan.isValid());
    }

    SECTION("Logging defaults") {
        const auto& logging = manager.config().logging;
        REQUIRE(logging.level == "info");
        REQUIRE(logging.file.empty());
        REQUIRE(logging.maxFileSize == 5 * 1024 * 1024);
        REQUIRE(logging.maxFiles == 3);
    }

    SECTION("Sets correct config path") {
        REQUIRE(manager.configPath() == testDir.path() / "portsweep.json");
    }
}

TEST_CASE("ConfigManager load and save", "[ConfigManager]") {
    TestConfigDir testDir;
    auto path = testDir.path() / "nested" / "portsweep.json";

    SECTION("Missing file is created with defaults") {
        ConfigManager manager(path);
        REQUIRE(manager.load());
        REQUIRE(std::filesystem::exists(path));
        REQUIRE(manager.config() == AppConfig{});
    }

    SECTION("Saved values are loaded back") {
        {
            ConfigManager manager(path);
            manager.config().scan.timeout = std::chrono::milliseconds(1500);
            manager.config().scan.workers = 64;
            manager.config().scan.pingFirst = true;
            manager.config().scan.pingTimeout = std::chrono::milliseconds(2000);
            manager.config().logging.level = "debug";
            manager.config().logging.file = "/tmp/portsweep.log";
            REQUIRE(manager.save());
        }

        ConfigManager loaded(path);
        REQUIRE(loaded.load());
        REQUIRE(loaded.config().scan.timeout == std::chrono::milliseconds(1500));
        REQUIRE(loaded.config().scan.workers == 64);
        REQUIRE(loaded.config().scan.pingFirst);
        REQUIRE(loaded.config().scan.pingTimeout == std::chrono::milliseconds(2000));
        REQUIRE(loaded.config().logging.level == "debug");
        REQUIRE(loaded.config().logging.file == "/tmp/portsweep.log");
    }

    SECTION("Malformed file fails to load and keeps defaults") {
        std::filesystem::create_directories(path.parent_path());
        {
            std::ofstream file(path);
            file << "{ not json";
        }

        ConfigManager manager(path);
        REQUIRE_FALSE(manager.load());
        REQUIRE(manager.config() == AppConfig{});
    }
}

TEST_CASE("ConfigManager JSON mapping", "[ConfigManager]") {
    SECTION("Absent keys keep defaults") {
        auto config = ConfigManager::fromJson(nlohmann::json::parse(R"({"scan": {"workers": 10}})"));
        REQUIRE(config.scan.workers == 10);
        REQUIRE(config.scan.timeout == std::chrono::milliseconds(500));
        REQUIRE(config.logging.level == "info");
    }

    SECTION("Unset ping timeout is not written") {
        auto j = ConfigManager::toJson(AppConfig{});
        REQUIRE(j["scan"].contains("timeout_ms"));
        REQUIRE_FALSE(j["scan"].contains("ping_timeout_ms"));
        REQUIRE(j["logging"]["level"].get<std::string>() == "info");
    }

    SECTION("Wrong value types are reported") {
        REQUIRE_THROWS(
            ConfigManager::fromJson(nlohmann::json::parse(R"({"scan": {"workers": "many"}})")));
    }
}

TEST_CASE("ScanConfig derived values", "[ConfigManager]") {
    ScanConfig scan;

    SECTION("Ping workers are capped") {
        scan.workers = 500;
        REQUIRE(scan.pingWorkers() == kMaxPingWorkers);
        scan.workers = 16;
        REQUIRE(scan.pingWorkers() == 16);
    }

    SECTION("Ping timeout defaults to whole seconds, at least one") {
        scan.timeout = std::chrono::milliseconds(500);
        REQUIRE(scan.effectivePingTimeout() == std::chrono::seconds(1));
        scan.timeout = std::chrono::milliseconds(2700);
        REQUIRE(scan.effectivePingTimeout() == std::chrono::seconds(2));
        scan.pingTimeout = std::chrono::milliseconds(300);
        REQUIRE(scan.effectivePingTimeout() == std::chrono::milliseconds(300));
    }

    SECTION("Non-positive values are invalid") {
        scan.workers = 0;
        REQUIRE_FALSE(scan.isValid());
    }

    SECTION("Timeouts above one hour are invalid") {
        scan.timeout = std::chrono::hours(1);
        REQUIRE(scan.isValid());
        scan.timeout = std::chrono::hours(1) + std::chrono::milliseconds(1);
        REQUIRE_FALSE(scan.isValid());
        scan.timeout = std::chrono::milliseconds(500);
        scan.pingTimeout = std::chrono::hours(2);
        REQUIRE_FALSE(scan.isValid());
    }
}
