#include <catch2/catch_test_macros.hpp>

#include "app/CommandLine.hpp"
#include "core/types/ScanError.hpp"

#include <utility>
#include <variant>
#include <vector>

using namespace portsweep::app;
using namespace portsweep::core;

namespace {

CommandLine::Action parse(CommandLine& cli, std::vector<const char*> args) {
    args.insert(args.begin(), "portsweep");
    return cli.parse(static_cast<int>(args.size()), args.data());
}

ErrorCode parseError(std::vector<const char*> args) {
    CommandLine cli;
    try {
        parse(cli, std::move(args));
    } catch (const ScanError& e) {
        return e.code();
    }
    FAIL("expected ScanError");
    return ErrorCode::OutputWriteFailed;
}

} // namespace

TEST_CASE("CommandLine target selectors", "[CommandLine]") {
    CommandLine cli;

    SECTION("Network") {
        REQUIRE(parse(cli, {"-n", "10.0.0.0/24", "-p", "22"}) == CommandLine::Action::Run);
        REQUIRE(std::get<CidrTarget>(cli.options().target).cidr == "10.0.0.0/24");
        REQUIRE(cli.options().ports == "22");
    }

    SECTION("Hosts file") {
        parse(cli, {"--hosts-file", "hosts.txt", "--ports", "80"});
        REQUIRE(std::get<HostsFileTarget>(cli.options().target).path == "hosts.txt");
    }

    SECTION("Start and end") {
        parse(cli, {"--start-end", "10.0.0.1", "10.0.0.9", "-p", "1-1024"});
        const auto& range = std::get<RangeTarget>(cli.options().target);
        REQUIRE(range.start == "10.0.0.1");
        REQUIRE(range.end == "10.0.0.9");
        REQUIRE(cli.options().ports == "1-1024");
    }

    SECTION("Single host") {
        parse(cli, {"-H", "example.com", "-p", "443"});
        REQUIRE(std::get<SingleHostTarget>(cli.options().target).host == "example.com");
    }
}

TEST_CASE("CommandLine defaults and options", "[CommandLine]") {
    CommandLine cli;

    SECTION("Unset options stay unset") {
        parse(cli, {"-H", "h", "-p", "22"});
        const auto& options = cli.options();
        REQUIRE_FALSE(options.timeoutSeconds.has_value());
        REQUIRE_FALSE(options.workers.has_value());
        REQUIRE_FALSE(options.pingFirst);
        REQUIRE_FALSE(options.output.has_value());
        REQUIRE_FALSE(options.noPrint);
        REQUIRE_FALSE(options.configPath.has_value());
    }

    SECTION("All options") {
        parse(cli, {"-H", "h", "-p", "22", "--timeout", "1.5", "--workers", "32", "--ping-first",
                    "-o", "out.json", "--no-print", "-c", "cfg.json", "--log-level", "debug",
                    "--log-file", "scan.log", "--progress-every", "10"});
        const auto& options = cli.options();
        REQUIRE(options.timeoutSeconds == 1.5);
        REQUIRE(options.workers == 32);
        REQUIRE(options.pingFirst);
        REQUIRE(options.output == std::filesystem::path("out.json"));
        REQUIRE(options.noPrint);
        REQUIRE(options.configPath == std::filesystem::path("cfg.json"));
        REQUIRE(options.logLevel == std::string("debug"));
        REQUIRE(options.logFile == std::string("scan.log"));
        REQUIRE(options.progressEvery == 10);
    }

    SECTION("applyTo overrides only what was given") {
        parse(cli, {"-H", "h", "-p", "22", "--timeout", "0.25", "--ping-first"});
        portsweep::infra::AppConfig config;
        config.scan.workers = 77;
        cli.options().applyTo(config);

        REQUIRE(config.scan.timeout == std::chrono::milliseconds(250));
        REQUIRE(config.scan.pingFirst);
        REQUIRE(config.scan.workers == 77);
        REQUIRE(config.logging.level == "info");
    }
}

TEST_CASE("CommandLine help and version", "[CommandLine]") {
    CommandLine cli;
    REQUIRE(parse(cli, {"--help"}) == CommandLine::Action::Help);
    REQUIRE(parse(cli, {"-h"}) == CommandLine::Action::Help);
    REQUIRE(parse(cli, {"--version"}) == CommandLine::Action::Version);
    REQUIRE(cli.usage().find("--ports") != std::string::npos);
}

TEST_CASE("CommandLine usage errors", "[CommandLine]") {
    SECTION("Target selector is required") {
        REQUIRE(parseError({"-p", "22"}) == ErrorCode::InvalidArgument);
    }

    SECTION("Target selectors are mutually exclusive") {
        REQUIRE(parseError({"-n", "10.0.0.0/24", "-H", "h", "-p", "22"}) ==
                ErrorCode::InvalidArgument);
    }

    SECTION("Ports are required") {
        REQUIRE(parseError({"-H", "h"}) == ErrorCode::InvalidArgument);
    }

    SECTION("Start and end need two addresses") {
        REQUIRE(parseError({"--start-end", "10.0.0.1", "-p", "22"}) == ErrorCode::InvalidArgument);
    }

    SECTION("Bad values") {
        REQUIRE(parseError({"-H", "h", "-p", "22", "--workers", "0"}) ==
                ErrorCode::InvalidArgument);
        REQUIRE(parseError({"-H", "h", "-p", "22", "--workers", "many"}) ==
                ErrorCode::InvalidArgument);
        REQUIRE(parseError({"-H", "h", "-p", "22", "--timeout", "0"}) ==
                ErrorCode::InvalidArgument);
        REQUIRE(parseError({"-H", "h", "-p", "22", "--timeout", "-1"}) ==
                ErrorCode::InvalidArgument);
        REQUIRE(parseError({"-H", "h", "-p", "22", "--log-level", "loud"}) ==
                ErrorCode::InvalidArgument);
    }

    SECTION("Timeout has an upper bound") {
        REQUIRE(parseError({"-H", "h", "-p", "22", "--timeout", "1e30"}) ==
                ErrorCode::InvalidArgument);
        REQUIRE(parseError({"-H", "h", "-p", "22", "--timeout", "3600.5"}) ==
                ErrorCode::InvalidArgument);

        CommandLine cli;
        parse(cli, {"-H", "h", "-p", "22", "--timeout", "3600"});
        portsweep::infra::AppConfig config;
        cli.options().applyTo(config);
        REQUIRE(config.scan.timeout == std::chrono::milliseconds(3600000));
    }

    SECTION("Unknown option") {
        REQUIRE(parseError({"-H", "h", "-p", "22", "--turbo"}) == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("parseLogLevel", "[CommandLine]") {
    REQUIRE(parseLogLevel("debug") == spdlog::level::debug);
    REQUIRE(parseLogLevel("warning") == spdlog::level::warn);
    REQUIRE_FALSE(parseLogLevel("verbose").has_value());
}
