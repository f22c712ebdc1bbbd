/**
 * @file ProbeTask.hpp
 * @brief Probe task, outcome and open-pair types for TCP reachability scans.
 *
 * This file defines the unit of work of a scan (a host/port pair), the
 * outcome of probing it, and service name lookup for well-known ports.
 */

#pragma once

#include <compare>
#include <cstdint>
#include <string>
#include <vector>

namespace portsweep::core {

/**
 * @brief Outcome of a single TCP connect probe.
 */
enum class ProbeOutcome : int {
    NotOpen = 0, ///< Timeout, refusal, unreachable or resolution failure
    Open = 1     ///< The TCP handshake completed within the timeout
};

/**
 * @brief A single (host, port) pair to probe.
 *
 * Tasks are identified by the pair itself. Ordering is lexicographic on the
 * host string, then numeric on the port.
 */
struct ProbeTask {
    std::string host; ///< IP literal or hostname
    uint16_t port{0}; ///< Destination TCP port

    /**
     * @brief Formats the task as "host:port".
     * @return Printable endpoint string.
     */
    [[nodiscard]] std::string toString() const;

    auto operator<=>(const ProbeTask& other) const = default;
    bool operator==(const ProbeTask& other) const = default;
};

/**
 * @brief A (host, port) pair confirmed to accept TCP connections.
 */
using OpenPair = ProbeTask;

/**
 * @brief Result of probing one task.
 */
struct ProbeResult {
    ProbeTask task;                              ///< The probed pair
    ProbeOutcome outcome{ProbeOutcome::NotOpen}; ///< What the probe observed

    [[nodiscard]] bool isOpen() const { return outcome == ProbeOutcome::Open; }

    /**
     * @brief Converts a ProbeOutcome enum to a string.
     * @param outcome The outcome to convert.
     * @return "Open" or "NotOpen".
     */
    static std::string outcomeToString(ProbeOutcome outcome);

    bool operator==(const ProbeResult& other) const = default;
};

/**
 * @brief Utility class for naming services by port number.
 *
 * Provides static methods to identify common services running on standard ports.
 */
class ServiceDetector {
public:
    /**
     * @brief Detects the likely service running on a port.
     * @param port The port number to look up.
     * @return Service name if known, empty string otherwise.
     */
    static std::string detectService(uint16_t port);
};

} // namespace portsweep::core
