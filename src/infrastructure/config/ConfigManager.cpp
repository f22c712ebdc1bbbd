#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <fstream>

namespace portsweep::infra {

ConfigManager::ConfigManager(const std::filesystem::path& configPath) : configPath_(configPath) {}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file {} not found, writing defaults", configPath_.string());
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
        config_ = fromJson(j);

        spdlog::debug("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson(config_);

        if (configPath_.has_parent_path()) {
            std::filesystem::create_directories(configPath_.parent_path());
        }

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

nlohmann::json ConfigManager::toJson(const AppConfig& config) {
    nlohmann::json j;

    // Scan
    j["scan"]["timeout_ms"] = config.scan.timeout.count();
    j["scan"]["workers"] = config.scan.workers;
    j["scan"]["ping_first"] = config.scan.pingFirst;
    if (config.scan.pingTimeout) {
        j["scan"]["ping_timeout_ms"] = config.scan.pingTimeout->count();
    }
    j["scan"]["ping_workers_max"] = config.scan.pingWorkersMax;
    j["scan"]["progress_interval"] = config.scan.progressInterval;
    j["scan"]["max_hosts"] = config.scan.maxHosts;

    // Logging
    j["logging"]["level"] = config.logging.level;
    j["logging"]["file"] = config.logging.file;
    j["logging"]["max_file_size"] = config.logging.maxFileSize;
    j["logging"]["max_files"] = config.logging.maxFiles;

    return j;
}

AppConfig ConfigManager::fromJson(const nlohmann::json& j) {
    AppConfig config;
    const AppConfig defaults;

    // Scan
    if (j.contains("scan")) {
        const auto& s = j["scan"];
        config.scan.timeout =
            std::chrono::milliseconds(s.value("timeout_ms", defaults.scan.timeout.count()));
        config.scan.workers = s.value("workers", defaults.scan.workers);
        config.scan.pingFirst = s.value("ping_first", defaults.scan.pingFirst);
        if (s.contains("ping_timeout_ms")) {
            config.scan.pingTimeout =
                std::chrono::milliseconds(s["ping_timeout_ms"].get<int64_t>());
        }
        config.scan.pingWorkersMax = s.value("ping_workers_max", defaults.scan.pingWorkersMax);
        config.scan.progressInterval =
            s.value("progress_interval", defaults.scan.progressInterval);
        config.scan.maxHosts = s.value("max_hosts", defaults.scan.maxHosts);
    }

    // Logging
    if (j.contains("logging")) {
        const auto& l = j["logging"];
        config.logging.level = l.value("level", defaults.logging.level);
        config.logging.file = l.value("file", defaults.logging.file);
        config.logging.maxFileSize = l.value("max_file_size", defaults.logging.maxFileSize);
        config.logging.maxFiles = l.value("max_files", defaults.logging.maxFiles);
    }

    return config;
}

} // namespace portsweep::infra
