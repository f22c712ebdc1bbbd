#pragma once

#include "core/services/IPortProbe.hpp"
#include "core/types/ScanConfig.hpp"
#include "engine/ScanRun.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace portsweep::engine {

/**
 * @brief Final outcome of a scan.
 */
struct ScanSummary {
    std::vector<core::OpenPair> openPairs; ///< Open pairs sorted by (host, port)
    std::size_t totalTasks{0};             ///< Size of the host x port universe
    std::size_t completedTasks{0};         ///< Tasks finished (equals totalTasks)
    std::chrono::milliseconds elapsed{0};  ///< Wall-clock duration of the scan
};

/**
 * @brief Concurrent TCP connect scanner over a host x port universe.
 *
 * Every (host, port) task is probed exactly once by a bounded WorkerPool.
 * Probe failures of any kind, including exceptions, are recorded as
 * NotOpen and never abort the run.
 */
class ScanEngine {
public:
    /**
     * @brief Callback invoked once per open pair, from a worker thread.
     */
    using ResultCallback = std::function<void(const core::OpenPair&)>;

    /**
     * @brief Callback invoked every progressInterval completions and at the
     *        final one, from a worker thread.
     */
    using ProgressCallback = std::function<void(const ScanProgress&)>;

    /**
     * @brief Constructs a ScanEngine.
     * @param probe Probe used for every task; must be safe to call concurrently.
     * @param config Timeout, worker count and progress cadence.
     */
    ScanEngine(core::IPortProbe& probe, const core::ScanConfig& config);

    /**
     * @brief Probes every host x port pair and blocks until all are done.
     * @param hosts Hosts to scan.
     * @param ports Ports to scan on every host.
     * @param onOpen Optional callback for each open pair.
     * @param onProgress Optional progress callback.
     * @return Summary with the sorted open pairs.
     */
    ScanSummary run(const std::vector<std::string>& hosts, const std::vector<uint16_t>& ports,
                    ResultCallback onOpen = {}, ProgressCallback onProgress = {});

    /**
     * @brief Checks if a scan is currently in progress.
     * @return True if scanning, false otherwise.
     */
    bool isScanning() const { return scanning_.load(); }

    /**
     * @brief Probes one task, mapping any exception to NotOpen.
     * @param probe Probe to use.
     * @param task The (host, port) pair.
     * @param timeout Probe timeout.
     * @return The task together with its outcome.
     */
    static core::ProbeResult probeTask(core::IPortProbe& probe, const core::ProbeTask& task,
                                       std::chrono::milliseconds timeout);

private:
    core::IPortProbe& probe_;
    core::ScanConfig config_;
    std::atomic<bool> scanning_{false};
};

} // namespace portsweep::engine
