#include "app/CommandLine.hpp"

#include "core/types/ScanConfig.hpp"
#include "core/types/ScanError.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace po = boost::program_options;

namespace portsweep::app {

namespace {

constexpr double kMaxTimeoutSeconds =
    std::chrono::duration<double>(core::kMaxTimeout).count();

core::ScanError usageError(const std::string& message) {
    return core::ScanError(core::ErrorCode::InvalidArgument, message);
}

} // namespace

std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error" || name == "err") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    return std::nullopt;
}

void CommandLineOptions::applyTo(infra::AppConfig& config) const {
    if (timeoutSeconds) {
        auto ms = std::llround(*timeoutSeconds * 1000.0);
        config.scan.timeout = std::chrono::milliseconds(std::max<long long>(1, ms));
    }
    if (workers) {
        config.scan.workers = *workers;
    }
    if (pingFirst) {
        config.scan.pingFirst = true;
    }
    if (progressEvery) {
        config.scan.progressInterval = *progressEvery;
    }
    if (logLevel) {
        config.logging.level = *logLevel;
    }
    if (logFile) {
        config.logging.file = *logFile;
    }
}

CommandLine::CommandLine() : description_("Options") {
    // clang-format off
    description_.add_options()
        ("help,h", "show this help and exit")
        ("version", "print the version and exit")
        ("network,n", po::value<std::string>(), "IPv4 or IPv6 network in CIDR notation, e.g. 192.168.1.0/24")
        ("hosts-file,f", po::value<std::string>(), "file with one host per line")
        ("start-end", po::value<std::vector<std::string>>()->multitoken(),
            "inclusive IPv4 range: START END")
        ("host,H", po::value<std::string>(), "single host name or address")
        ("ports,p", po::value<std::string>(), "ports, e.g. 22,80,443,8000-8100 (required)")
        ("timeout", po::value<double>(), "TCP connect timeout in seconds (default 0.5)")
        ("workers", po::value<int>(), "concurrent probes (default 200)")
        ("ping-first", "drop hosts that do not answer an ICMP echo before scanning")
        ("output,o", po::value<std::string>(), "write results to a .csv or .json file")
        ("no-print", "do not print open ports to the console")
        ("config,c", po::value<std::string>(), "JSON configuration file")
        ("log-level", po::value<std::string>(), "trace, debug, info, warn, error, critical or off")
        ("log-file", po::value<std::string>(), "also log to a rotating file")
        ("progress-every", po::value<int>(), "log progress every N completed probes");
    // clang-format on
}

CommandLine::Action CommandLine::parse(int argc, const char* const argv[]) {
    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(description_).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw usageError(e.what());
    }

    if (vm.count("help")) {
        return Action::Help;
    }
    if (vm.count("version")) {
        return Action::Version;
    }

    CommandLineOptions options;

    int selectors = 0;
    for (const char* name : {"network", "hosts-file", "start-end", "host"}) {
        if (vm.count(name)) {
            ++selectors;
        }
    }
    if (selectors == 0) {
        throw usageError("one of --network, --hosts-file, --start-end or --host is required");
    }
    if (selectors > 1) {
        throw usageError("--network, --hosts-file, --start-end and --host are mutually exclusive");
    }

    if (vm.count("network")) {
        options.target = core::CidrTarget{vm["network"].as<std::string>()};
    } else if (vm.count("hosts-file")) {
        options.target = core::HostsFileTarget{vm["hosts-file"].as<std::string>()};
    } else if (vm.count("start-end")) {
        const auto& bounds = vm["start-end"].as<std::vector<std::string>>();
        if (bounds.size() != 2) {
            throw usageError("--start-end takes exactly two addresses: START END");
        }
        options.target = core::RangeTarget{bounds[0], bounds[1]};
    } else {
        options.target = core::SingleHostTarget{vm["host"].as<std::string>()};
    }

    if (!vm.count("ports")) {
        throw usageError("--ports is required");
    }
    options.ports = vm["ports"].as<std::string>();

    if (vm.count("timeout")) {
        auto seconds = vm["timeout"].as<double>();
        if (!std::isfinite(seconds) || seconds <= 0.0) {
            throw usageError("--timeout must be a positive number of seconds");
        }
        if (seconds > kMaxTimeoutSeconds) {
            throw usageError("--timeout must not exceed " +
                             std::to_string(static_cast<int>(kMaxTimeoutSeconds)) + " seconds");
        }
        options.timeoutSeconds = seconds;
    }
    if (vm.count("workers")) {
        auto workers = vm["workers"].as<int>();
        if (workers <= 0) {
            throw usageError("--workers must be positive");
        }
        options.workers = workers;
    }
    if (vm.count("progress-every")) {
        auto every = vm["progress-every"].as<int>();
        if (every <= 0) {
            throw usageError("--progress-every must be positive");
        }
        options.progressEvery = every;
    }
    if (vm.count("log-level")) {
        auto level = vm["log-level"].as<std::string>();
        if (!parseLogLevel(level)) {
            throw usageError("unknown log level: " + level);
        }
        options.logLevel = level;
    }

    options.pingFirst = vm.count("ping-first") > 0;
    options.noPrint = vm.count("no-print") > 0;
    if (vm.count("output")) {
        options.output = std::filesystem::path(vm["output"].as<std::string>());
    }
    if (vm.count("config")) {
        options.configPath = std::filesystem::path(vm["config"].as<std::string>());
    }
    if (vm.count("log-file")) {
        options.logFile = vm["log-file"].as<std::string>();
    }

    options_ = std::move(options);
    return Action::Run;
}

std::string CommandLine::usage() const {
    std::ostringstream oss;
    oss << "Usage: portsweep (-n CIDR | -f FILE | --start-end START END | -H HOST) -p PORTS "
           "[options]\n\n"
        << "Concurrent TCP connect scanner.\n\n"
        << description_;
    return oss.str();
}

} // namespace portsweep::app
