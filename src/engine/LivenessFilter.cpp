#include "engine/LivenessFilter.hpp"

#include "engine/WorkerPool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <exception>

namespace portsweep::engine {

LivenessFilter::LivenessFilter(core::ILivenessProbe& probe, std::size_t workers,
                               std::chrono::milliseconds timeout)
    : probe_(probe), workers_(workers), timeout_(timeout) {}

std::vector<std::string> LivenessFilter::filter(const std::vector<std::string>& hosts) {
    spdlog::info("Pinging {} hosts to filter live targets (workers={}, timeout={} ms)",
                 hosts.size(), std::min(workers_, hosts.size()), timeout_.count());

    // One slot per host; each worker writes only the slot of its own index.
    std::vector<uint8_t> alive(hosts.size(), 0);

    WorkerPool pool(workers_, "ping");
    pool.run(hosts.size(), [&](std::size_t index) {
        try {
            auto result = probe_.ping(hosts[index], timeout_);
            if (result.success) {
                spdlog::debug("{} is alive ({:.2f} ms)", hosts[index], result.latencyMs());
                alive[index] = 1;
            } else {
                spdlog::trace("{} did not answer: {}", hosts[index], result.errorMessage);
            }
        } catch (const std::exception& e) {
            spdlog::trace("Ping of {} failed: {}", hosts[index], e.what());
        }
    });

    std::vector<std::string> liveHosts;
    for (std::size_t i = 0; i < hosts.size(); ++i) {
        if (alive[i]) {
            liveHosts.push_back(hosts[i]);
        }
    }

    spdlog::info("Live hosts: {} of {}", liveHosts.size(), hosts.size());
    return liveHosts;
}

} // namespace portsweep::engine
