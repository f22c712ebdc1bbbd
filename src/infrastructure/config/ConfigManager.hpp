#pragma once

#include "core/types/ScanConfig.hpp"

#include <cstddef>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace portsweep::infra {

/**
 * @brief Logging settings.
 */
struct LoggingConfig {
    std::string level{"info"};               ///< Console level (trace..critical, off).
    std::string file;                        ///< Optional rotating log file path.
    std::size_t maxFileSize{5 * 1024 * 1024}; ///< Rotate after this many bytes.
    std::size_t maxFiles{3};                 ///< Rotated files to keep.

    bool operator==(const LoggingConfig& other) const = default;
};

/**
 * @brief Application configuration settings.
 *
 * Contains scan defaults and logging preferences. Command-line options
 * override these values for a single invocation.
 */
struct AppConfig {
    core::ScanConfig scan;  ///< Scan defaults.
    LoggingConfig logging;  ///< Logging preferences.

    bool operator==(const AppConfig& other) const = default;
};

/**
 * @brief Manages configuration persistence.
 *
 * Handles loading and saving of the configuration from a JSON file.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified config file.
     * @param configPath Path to the JSON configuration file.
     */
    explicit ConfigManager(const std::filesystem::path& configPath);

    /**
     * @brief Loads configuration from disk.
     *
     * A missing file is created with the default values.
     *
     * @return True if loaded successfully, false otherwise.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    /**
     * @brief Returns a mutable reference to the configuration.
     * @return Reference to AppConfig.
     */
    AppConfig& config() { return config_; }

    /**
     * @brief Returns a const reference to the configuration.
     * @return Const reference to AppConfig.
     */
    const AppConfig& config() const { return config_; }

    /**
     * @brief Returns the path to the configuration file.
     */
    std::filesystem::path configPath() const { return configPath_; }

    /**
     * @brief Serialises a configuration to JSON.
     */
    static nlohmann::json toJson(const AppConfig& config);

    /**
     * @brief Reads a configuration from JSON, keeping defaults for absent keys.
     */
    static AppConfig fromJson(const nlohmann::json& j);

private:
    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace portsweep::infra
