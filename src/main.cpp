#include "app/Application.hpp"
#include "app/CommandLine.hpp"
#include "core/types/ScanError.hpp"

#include <spdlog/spdlog.h>

#include <iostream>

int main(int argc, char* argv[]) {
    using portsweep::app::CommandLine;

    CommandLine commandLine;
    try {
        switch (commandLine.parse(argc, argv)) {
        case CommandLine::Action::Help:
            std::cout << commandLine.usage();
            return 0;
        case CommandLine::Action::Version:
            std::cout << "portsweep " << portsweep::app::Application::kVersion << "\n";
            return 0;
        case CommandLine::Action::Run:
            break;
        }
    } catch (const portsweep::core::ScanError& e) {
        std::cerr << "portsweep: error: " << e.what() << "\n"
                  << "Try 'portsweep --help' for more information.\n";
        return e.exitStatus();
    }

    try {
        portsweep::app::Application app(commandLine.options());
        return app.run();
    } catch (const portsweep::core::ScanError& e) {
        spdlog::error("{}: {}", portsweep::core::errorCodeToString(e.code()), e.what());
        return e.exitStatus();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
