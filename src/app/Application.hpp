#pragma once

#include "app/CommandLine.hpp"
#include "core/services/ILivenessProbe.hpp"
#include "core/services/IPortProbe.hpp"
#include "core/types/ProbeTask.hpp"
#include "infrastructure/config/ConfigManager.hpp"

#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace portsweep::app {

/**
 * @brief Main application class that wires the scan pipeline together.
 *
 * Sets up logging, merges the configuration file with command-line options,
 * then runs target expansion, port parsing, the optional liveness prefilter,
 * the scan and the result output in that order.
 */
class Application {
public:
    static constexpr const char* kVersion = PORTSWEEP_VERSION;

    /**
     * @brief Constructs the application with the network probes.
     * @param options Parsed command-line options.
     */
    explicit Application(CommandLineOptions options);

    /**
     * @brief Constructs the application with caller-supplied probes and result stream.
     * @param options Parsed command-line options.
     * @param portProbe TCP probe used by the scan engine.
     * @param livenessProbe ICMP probe used when the prefilter is enabled.
     * @param out Stream receiving live open lines and the final listing.
     */
    Application(CommandLineOptions options, std::unique_ptr<core::IPortProbe> portProbe,
                std::unique_ptr<core::ILivenessProbe> livenessProbe, std::ostream& out);

    ~Application() = default;

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /**
     * @brief Runs the scan pipeline to completion.
     * @return Process exit status, 0 on success.
     * @throws ScanError for invalid targets or ports and for output failures.
     */
    int run();

    /**
     * @brief Returns the effective configuration after command-line overrides.
     */
    const infra::AppConfig& config() const { return config_; }

    /**
     * @brief Installs the "portsweep" logger as spdlog's default.
     *
     * Console output goes to stderr; a rotating file sink is added when
     * a log file is configured.
     */
    static void initializeLogging(const infra::LoggingConfig& logging);

private:
    void initializeConfig();
    std::vector<std::string> prefilter(std::vector<std::string> hosts);
    void writeResults(const std::vector<core::OpenPair>& pairs);

    CommandLineOptions options_;
    infra::AppConfig config_;
    std::unique_ptr<core::IPortProbe> portProbe_;
    std::unique_ptr<core::ILivenessProbe> livenessProbe_;
    std::ostream& out_;
    std::mutex outMutex_;
};

} // namespace portsweep::app
