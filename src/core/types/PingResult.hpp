/**
 * @file PingResult.hpp
 * @brief Result of a single ICMP echo used by the liveness prefilter.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace portsweep::core {

/**
 * @brief Result of a single ICMP ping operation.
 *
 * Contains timing, success status, and any error information. A host is
 * considered alive exactly when success is true.
 */
struct PingResult {
    std::string address;                  ///< Address that was pinged
    std::chrono::microseconds latency{0}; ///< Round-trip time in microseconds
    bool success{false};                  ///< Whether the ping received a response
    std::optional<int> ttl;               ///< Time-to-live from the response (if available)
    std::string errorMessage;             ///< Error message if the ping failed

    /**
     * @brief Converts the latency to milliseconds.
     * @return Latency as a floating-point number of milliseconds.
     */
    [[nodiscard]] double latencyMs() const {
        return static_cast<double>(latency.count()) / 1000.0;
    }

    bool operator==(const PingResult& other) const = default;
};

} // namespace portsweep::core
