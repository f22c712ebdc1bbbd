#include "engine/ScanEngine.hpp"

#include "engine/WorkerPool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <stdexcept>

namespace portsweep::engine {

namespace {

struct ScanningGuard {
    std::atomic<bool>& flag;
    ~ScanningGuard() { flag = false; }
};

} // namespace

ScanEngine::ScanEngine(core::IPortProbe& probe, const core::ScanConfig& config)
    : probe_(probe), config_(config) {}

core::ProbeResult ScanEngine::probeTask(core::IPortProbe& probe, const core::ProbeTask& task,
                                        std::chrono::milliseconds timeout) {
    core::ProbeResult result;
    result.task = task;
    try {
        result.outcome = probe.probe(task, timeout);
        spdlog::trace("{}: {}", task.toString(), core::ProbeResult::outcomeToString(result.outcome));
    } catch (const std::exception& e) {
        spdlog::trace("Probe of {} failed: {}", task.toString(), e.what());
        result.outcome = core::ProbeOutcome::NotOpen;
    }
    return result;
}

ScanSummary ScanEngine::run(const std::vector<std::string>& hosts,
                            const std::vector<uint16_t>& ports, ResultCallback onOpen,
                            ProgressCallback onProgress) {
    if (scanning_.exchange(true)) {
        throw std::logic_error("Scan already in progress");
    }
    ScanningGuard guard{scanning_};

    auto started = std::chrono::steady_clock::now();
    const std::size_t total = hosts.size() * ports.size();
    ScanRun scanRun(total);

    ScanSummary summary;
    summary.totalTasks = total;

    if (total == 0) {
        spdlog::info("Nothing to scan: {} hosts x {} ports", hosts.size(), ports.size());
        return summary;
    }

    auto workers = static_cast<std::size_t>(std::max(1, config_.workers));
    auto interval = static_cast<std::size_t>(std::max(1, config_.progressInterval));

    spdlog::info("Scanning {} ports on {} hosts: {} tasks, workers={}", ports.size(),
                 hosts.size(), total, std::min(workers, total));

    WorkerPool pool(workers, "scan");
    pool.run(total, [&](std::size_t index) {
        core::ProbeTask task{hosts[index / ports.size()], ports[index % ports.size()]};
        auto result = probeTask(probe_, task, config_.timeout);

        auto progress = scanRun.record(result);
        if (result.isOpen()) {
            spdlog::debug("Open: {}", task.toString());
            if (onOpen) {
                onOpen(task);
            }
        }
        if (onProgress && (progress.completedTasks % interval == 0 || progress.isFinal())) {
            onProgress(progress);
        }
    });

    auto finished = scanRun.progress();
    if (!finished.isFinal()) {
        spdlog::warn("Scan finished with {} of {} tasks completed", finished.completedTasks,
                     finished.totalTasks);
    }

    summary.openPairs = scanRun.openPairs();
    summary.completedTasks = finished.completedTasks;
    summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    spdlog::info("Scan complete: {} open of {} probed in {} ms", summary.openPairs.size(),
                 summary.completedTasks, summary.elapsed.count());

    return summary;
}

} // namespace portsweep::engine
