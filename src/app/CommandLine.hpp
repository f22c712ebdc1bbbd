#pragma once

#include "core/types/TargetSpec.hpp"
#include "infrastructure/config/ConfigManager.hpp"

#include <boost/program_options.hpp>
#include <spdlog/common.h>

#include <filesystem>
#include <optional>
#include <string>

namespace portsweep::app {

/**
 * @brief Options given on the command line.
 *
 * Unset optionals fall back to the configuration file, then to built-in defaults.
 */
struct CommandLineOptions {
    core::TargetSpec target;                        ///< Exactly one target selector.
    std::string ports;                              ///< Port specification string.
    std::optional<double> timeoutSeconds;           ///< TCP probe timeout.
    std::optional<int> workers;                     ///< Scan worker count.
    bool pingFirst{false};                          ///< Enable the liveness prefilter.
    std::optional<std::filesystem::path> output;    ///< .csv or .json destination.
    bool noPrint{false};                            ///< Suppress console result lines.
    std::optional<std::filesystem::path> configPath; ///< JSON configuration file.
    std::optional<std::string> logLevel;            ///< Console log level.
    std::optional<std::string> logFile;             ///< Rotating log file.
    std::optional<int> progressEvery;               ///< Progress cadence.

    /**
     * @brief Overrides configuration values with the options that were given.
     * @param config Configuration loaded from file or defaults.
     */
    void applyTo(infra::AppConfig& config) const;
};

/**
 * @brief Parses a log level name.
 * @param name One of trace, debug, info, warn, warning, error, critical, off.
 * @return The level, or nullopt if the name is unknown.
 */
std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& name);

/**
 * @brief Command-line parser built on Boost.Program_options.
 */
class CommandLine {
public:
    enum class Action { Run, Help, Version };

    CommandLine();

    /**
     * @brief Parses the command line.
     * @param argc Argument count.
     * @param argv Argument vector, argv[0] being the program name.
     * @return What the program should do next.
     * @throws ScanError InvalidArgument on unknown options, bad values, or a
     *         missing or conflicting target selector.
     */
    Action parse(int argc, const char* const argv[]);

    /**
     * @brief Returns the parsed options. Valid after parse() returned Run.
     */
    const CommandLineOptions& options() const { return options_; }

    /**
     * @brief Returns the help text.
     */
    std::string usage() const;

private:
    boost::program_options::options_description description_;
    CommandLineOptions options_;
};

} // namespace portsweep::app
