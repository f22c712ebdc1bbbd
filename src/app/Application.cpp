#include "app/Application.hpp"

#include "core/targets/PortSetParser.hpp"
#include "core/targets/TargetExpander.hpp"
#include "core/types/ScanError.hpp"
#include "engine/LivenessFilter.hpp"
#include "engine/ScanEngine.hpp"
#include "infrastructure/network/PingService.hpp"
#include "infrastructure/network/TcpProbe.hpp"
#include "infrastructure/output/ResultWriter.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iostream>
#include <utility>

namespace portsweep::app {

Application::Application(CommandLineOptions options)
    : Application(std::move(options), std::make_unique<infra::TcpProbe>(), nullptr, std::cout) {}

Application::Application(CommandLineOptions options, std::unique_ptr<core::IPortProbe> portProbe,
                         std::unique_ptr<core::ILivenessProbe> livenessProbe, std::ostream& out)
    : options_(std::move(options)), portProbe_(std::move(portProbe)),
      livenessProbe_(std::move(livenessProbe)), out_(out) {
    infra::LoggingConfig bootstrap;
    if (options_.logLevel) {
        bootstrap.level = *options_.logLevel;
    }
    initializeLogging(bootstrap);

    initializeConfig();
    initializeLogging(config_.logging);
}

void Application::initializeLogging(const infra::LoggingConfig& logging) {
    auto level = parseLogLevel(logging.level);

    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_level(level.value_or(spdlog::level::info));

    std::vector<spdlog::sink_ptr> sinks{consoleSink};
    std::string fileError;
    if (!logging.file.empty()) {
        try {
            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logging.file, logging.maxFileSize, logging.maxFiles);
            fileSink->set_level(spdlog::level::debug);
            sinks.push_back(fileSink);
        } catch (const spdlog::spdlog_ex& e) {
            fileError = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("portsweep", sinks.begin(), sinks.end());
    logger->set_level(std::min(consoleSink->level(), spdlog::level::debug));
    spdlog::set_default_logger(logger);

    if (!level) {
        spdlog::warn("Unknown log level '{}', using info", logging.level);
    }
    if (!fileError.empty()) {
        spdlog::warn("Log file {} unavailable: {}", logging.file, fileError);
    } else if (!logging.file.empty()) {
        spdlog::debug("Log file: {}", logging.file);
    }
}

void Application::initializeConfig() {
    if (options_.configPath) {
        infra::ConfigManager manager(*options_.configPath);
        if (manager.load()) {
            config_ = manager.config();
        } else {
            spdlog::error("Using default configuration");
        }
    }

    options_.applyTo(config_);

    if (!config_.scan.isValid()) {
        throw core::ScanError(core::ErrorCode::InvalidArgument,
                              "Scan settings must have timeouts between 1 ms and 1 hour and "
                              "positive worker counts, progress interval and host limit");
    }
}

int Application::run() {
    spdlog::info("PortSweep {} scanning {}", kVersion, core::describeTarget(options_.target));

    auto hosts = core::TargetExpander::expand(options_.target, config_.scan.maxHosts);
    auto ports = core::PortSetParser::parseNonEmpty(options_.ports);
    spdlog::info("{} hosts, {} ports, timeout {}ms, {} workers", hosts.size(), ports.size(),
                 config_.scan.timeout.count(), config_.scan.workers);

    if (config_.scan.pingFirst) {
        hosts = prefilter(std::move(hosts));
    }

    engine::ScanEngine engine(*portProbe_, config_.scan);

    engine::ScanEngine::ResultCallback onOpen;
    if (!options_.noPrint) {
        onOpen = [this](const core::OpenPair& pair) {
            std::lock_guard lock(outMutex_);
            out_ << infra::ResultWriter::formatOpenLine(pair) << std::endl;
        };
    }

    auto onProgress = [](const engine::ScanProgress& progress) {
        spdlog::info("Progress: {}/{} ({:.1f}%), {} open", progress.completedTasks,
                     progress.totalTasks, progress.percentComplete(), progress.openPairs);
    };

    auto summary = engine.run(hosts, ports, onOpen, onProgress);
    writeResults(summary.openPairs);
    return 0;
}

std::vector<std::string> Application::prefilter(std::vector<std::string> hosts) {
    if (!livenessProbe_) {
        livenessProbe_ = std::make_unique<infra::PingService>();
    }

    engine::LivenessFilter filter(*livenessProbe_,
                                  static_cast<std::size_t>(config_.scan.pingWorkers()),
                                  config_.scan.effectivePingTimeout());
    return filter.filter(hosts);
}

void Application::writeResults(const std::vector<core::OpenPair>& pairs) {
    if (options_.output) {
        infra::ResultWriter::writeFile(*options_.output, pairs);
        std::lock_guard lock(outMutex_);
        out_ << "Results saved to " << options_.output->string() << " (" << pairs.size()
             << " open records)" << std::endl;
        return;
    }

    if (!options_.noPrint) {
        std::lock_guard lock(outMutex_);
        infra::ResultWriter::writeConsole(out_, pairs);
    }
}

} // namespace portsweep::app
