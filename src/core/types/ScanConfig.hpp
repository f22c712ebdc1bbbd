/**
 * @file ScanConfig.hpp
 * @brief Tunables for one scan invocation.
 */

#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <optional>

namespace portsweep::core {

/// Upper bound on concurrent ICMP probes, independent of the scan worker count.
constexpr int kMaxPingWorkers = 200;

/// Longest accepted probe timeout.
constexpr std::chrono::milliseconds kMaxTimeout = std::chrono::hours(1);

/// Largest host list a target specification may expand to (a /8 network).
constexpr std::size_t kDefaultMaxHosts = std::size_t{1} << 24;

/**
 * @brief Configuration for a scan operation.
 *
 * Specifies probe timeouts, pool sizes and progress cadence.
 */
struct ScanConfig {
    std::chrono::milliseconds timeout{500};      ///< Timeout per TCP probe
    int workers{200};                            ///< Maximum concurrent TCP probes
    bool pingFirst{false};                       ///< Run the liveness prefilter first
    std::optional<std::chrono::milliseconds> pingTimeout; ///< Timeout per ICMP probe
    int pingWorkersMax{kMaxPingWorkers};         ///< Cap on concurrent ICMP probes
    int progressInterval{100};                   ///< Report progress every N completions
    std::size_t maxHosts{kDefaultMaxHosts};      ///< Largest accepted host list

    /**
     * @brief Number of workers for the liveness prefilter.
     * @return The requested worker count, capped at pingWorkersMax.
     */
    [[nodiscard]] int pingWorkers() const { return std::max(1, std::min(workers, pingWorkersMax)); }

    /**
     * @brief Timeout for each ICMP probe.
     * @return pingTimeout if set, otherwise defaultPingTimeout(timeout).
     */
    [[nodiscard]] std::chrono::milliseconds effectivePingTimeout() const {
        return pingTimeout.value_or(defaultPingTimeout(timeout));
    }

    /**
     * @brief Validates the configuration.
     * @return True if all pool sizes are positive and timeouts lie in (0, kMaxTimeout].
     */
    [[nodiscard]] bool isValid() const {
        auto validTimeout = [](std::chrono::milliseconds t) {
            return t.count() > 0 && t <= kMaxTimeout;
        };
        return validTimeout(timeout) && workers > 0 && (!pingTimeout || validTimeout(*pingTimeout)) &&
               pingWorkersMax > 0 && progressInterval > 0 && maxHosts > 0;
    }

    /**
     * @brief Default ICMP timeout derived from a TCP probe timeout.
     * @param probeTimeout The TCP probe timeout.
     * @return Whole seconds of probeTimeout, at least one second.
     */
    static std::chrono::milliseconds defaultPingTimeout(std::chrono::milliseconds probeTimeout) {
        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(probeTimeout);
        return std::max<std::chrono::milliseconds>(std::chrono::seconds(1), seconds);
    }

    bool operator==(const ScanConfig& other) const = default;
};

} // namespace portsweep::core
