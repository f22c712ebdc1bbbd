#pragma once

#include "core/services/IPortProbe.hpp"

#include <chrono>

namespace portsweep::infra {

/**
 * @brief TCP connect probe built on Asio.
 *
 * Each call runs an asynchronous resolve and connect on a private
 * io_context, bounded by a steady_timer that cancels the operation when the
 * timeout expires. The calling worker blocks only on its own probe, so the
 * probe is safe to use from many threads at once.
 * Implements the core::IPortProbe interface.
 */
class TcpProbe : public core::IPortProbe {
public:
    TcpProbe() = default;
    ~TcpProbe() override = default;

    /**
     * @brief Attempts a TCP connection to the task's endpoint.
     * @param task Host (IP literal or hostname) and port.
     * @param timeout Upper bound for the connection attempt.
     * @return Open if the handshake completed, NotOpen on any failure or timeout.
     */
    core::ProbeOutcome probe(const core::ProbeTask& task,
                             std::chrono::milliseconds timeout) override;
};

} // namespace portsweep::infra
