/**
 * @file ILivenessProbe.hpp
 * @brief Interface for the ICMP host liveness check.
 */

#pragma once

#include "core/types/PingResult.hpp"

#include <chrono>
#include <string>

namespace portsweep::core {

/**
 * @brief Interface for ICMP ping service.
 *
 * Provides a single blocking echo probe with an explicit timeout.
 *
 * @note On Linux, raw ICMP requires CAP_NET_RAW capability or root privileges.
 */
class ILivenessProbe {
public:
    virtual ~ILivenessProbe() = default;

    /**
     * @brief Sends one echo request and waits for the matching reply.
     * @param address IP address or hostname to ping.
     * @param timeout Maximum time to wait for a response.
     * @return The ping result; failures are reported in the result, never thrown.
     */
    virtual PingResult ping(const std::string& address, std::chrono::milliseconds timeout) = 0;
};

} // namespace portsweep::core
