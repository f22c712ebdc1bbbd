#pragma once

#include "core/services/ILivenessProbe.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace portsweep::engine {

/**
 * @brief Optional prefilter that keeps only hosts answering an ICMP echo.
 *
 * Runs its own bounded WorkerPool, independent of the scan pool. It is a
 * best-effort optimisation: a failed or timed-out ping means "not alive" and
 * never an error.
 */
class LivenessFilter {
public:
    /**
     * @brief Constructs a LivenessFilter.
     * @param probe Ping implementation; must be safe to call concurrently.
     * @param workers Number of concurrent pings (already capped by the caller).
     * @param timeout Timeout per ping.
     */
    LivenessFilter(core::ILivenessProbe& probe, std::size_t workers,
                   std::chrono::milliseconds timeout);

    /**
     * @brief Pings every host once and returns those that answered.
     * @param hosts Hosts to check.
     * @return Alive hosts in input order; possibly empty.
     */
    std::vector<std::string> filter(const std::vector<std::string>& hosts);

private:
    core::ILivenessProbe& probe_;
    std::size_t workers_;
    std::chrono::milliseconds timeout_;
};

} // namespace portsweep::engine
