/**
 * @file IPortProbe.hpp
 * @brief Interface for probing a single TCP endpoint.
 *
 * This file defines the abstract interface the scan engine drives once per
 * (host, port) task.
 */

#pragma once

#include "core/types/ProbeTask.hpp"

#include <chrono>

namespace portsweep::core {

/**
 * @brief Interface for a TCP connect probe.
 *
 * Implementations block the calling worker until the connection is
 * established or the timeout expires. Every failure is reported as
 * ProbeOutcome::NotOpen; implementations may throw, and the caller treats
 * an exception the same way.
 */
class IPortProbe {
public:
    virtual ~IPortProbe() = default;

    /**
     * @brief Attempts a TCP connection to the task's endpoint.
     * @param task Host and port to connect to.
     * @param timeout Upper bound for resolution plus connection.
     * @return Open if the handshake completed in time, NotOpen otherwise.
     */
    virtual ProbeOutcome probe(const ProbeTask& task, std::chrono::milliseconds timeout) = 0;
};

} // namespace portsweep::core
