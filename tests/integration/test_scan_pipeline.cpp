#include <catch2/catch_test_macros.hpp>

#include "core/targets/PortSetParser.hpp"
#include "core/targets/TargetExpander.hpp"
#include "engine/ScanEngine.hpp"
#include "infrastructure/network/TcpProbe.hpp"
#include "infrastructure/output/ResultWriter.hpp"

#include <asio.hpp>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <vector>

using namespace portsweep::core;
using namespace portsweep::engine;
using namespace portsweep::infra;

namespace {

/// Binds n loopback listeners on ephemeral ports, plus one port that was freed again.
class LoopbackPorts {
public:
    explicit LoopbackPorts(int n) {
        for (int i = 0; i < n; ++i) {
            auto acceptor = std::make_unique<asio::ip::tcp::acceptor>(
                io_, asio::ip::tcp::endpoint(asio::ip::address_v4::loopback(), 0));
            open_.push_back(acceptor->local_endpoint().port());
            acceptors_.push_back(std::move(acceptor));
        }

        asio::ip::tcp::acceptor closed(io_,
                                       asio::ip::tcp::endpoint(asio::ip::address_v4::loopback(), 0));
        closed_ = closed.local_endpoint().port();
    }

    const std::vector<uint16_t>& open() const { return open_; }
    uint16_t closed() const { return closed_; }

private:
    asio::io_context io_;
    std::vector<std::unique_ptr<asio::ip::tcp::acceptor>> acceptors_;
    std::vector<uint16_t> open_;
    uint16_t closed_{0};
};

} // namespace

TEST_CASE("Loopback scan writes the open ports to CSV", "[integration]") {
    LoopbackPorts ports(3);

    std::string spec = std::to_string(ports.closed());
    for (auto port : ports.open()) {
        spec += "," + std::to_string(port);
    }

    auto hosts = TargetExpander::expand(SingleHostTarget{"127.0.0.1"});
    auto portList = PortSetParser::parseNonEmpty(spec);
    REQUIRE(portList.size() == 4);

    ScanConfig config;
    config.timeout = std::chrono::milliseconds(1000);
    config.workers = 8;

    TcpProbe probe;
    ScanEngine engine(probe, config);
    auto summary = engine.run(hosts, portList);

    std::vector<uint16_t> expected = ports.open();
    std::sort(expected.begin(), expected.end());

    REQUIRE(summary.completedTasks == 4);
    REQUIRE(summary.openPairs.size() == expected.size());
    for (std::size_t i = 0; i < expected.size(); ++i) {
        REQUIRE(summary.openPairs[i] == OpenPair{"127.0.0.1", expected[i]});
    }

    auto path = std::filesystem::temp_directory_path() / "portsweep_pipeline_test.csv";
    ResultWriter::writeFile(path, summary.openPairs);

    std::ifstream file(path);
    std::string line;
    std::getline(file, line);
    REQUIRE(line == "host,port");

    std::size_t rows = 0;
    while (std::getline(file, line)) {
        REQUIRE(line.rfind("127.0.0.1,", 0) == 0);
        ++rows;
    }
    REQUIRE(rows == expected.size());

    std::filesystem::remove(path);
}

TEST_CASE("Range scan over loopback addresses", "[integration]") {
    LoopbackPorts ports(1);
    auto port = ports.open().front();

    // Only 127.0.0.1 has the listener; the rest of 127.0.0.0/8 refuses.
    auto hosts = TargetExpander::expand(RangeTarget{"127.0.0.3", "127.0.0.1"});
    REQUIRE(hosts.size() == 3);

    ScanConfig config;
    config.timeout = std::chrono::milliseconds(1000);
    config.workers = 4;
    config.progressInterval = 1;

    std::atomic<int> progressCalls{0};
    TcpProbe probe;
    ScanEngine engine(probe, config);
    auto summary =
        engine.run(hosts, {port}, {}, [&](const ScanProgress&) { progressCalls.fetch_add(1); });

    REQUIRE(summary.openPairs == std::vector<OpenPair>{{"127.0.0.1", port}});
    REQUIRE(progressCalls.load() == 3);
}
