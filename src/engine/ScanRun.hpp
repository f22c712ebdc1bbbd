/**
 * @file ScanRun.hpp
 * @brief Shared aggregate of one scan: progress counters and open pairs.
 */

#pragma once

#include "core/types/ProbeTask.hpp"

#include <atomic>
#include <cstddef>
#include <mutex>
#include <set>
#include <vector>

namespace portsweep::engine {

/**
 * @brief Progress information during a scan.
 */
struct ScanProgress {
    std::size_t totalTasks{0};     ///< Total number of probe tasks
    std::size_t completedTasks{0}; ///< Number of tasks finished so far
    std::size_t openPairs{0};      ///< Number of open pairs found so far

    /**
     * @brief Calculates the completion percentage.
     * @return Percentage of tasks completed (0-100).
     */
    [[nodiscard]] double percentComplete() const {
        return totalTasks > 0
                   ? (static_cast<double>(completedTasks) / static_cast<double>(totalTasks)) * 100.0
                   : 0.0;
    }

    [[nodiscard]] bool isFinal() const { return completedTasks == totalTasks; }
};

/**
 * @brief In-memory state of one scan invocation, safe for concurrent workers.
 *
 * Workers call record() once per finished task. Open pairs live in an
 * ordered set, so duplicates collapse and the snapshot is sorted no matter
 * which order tasks complete in.
 */
class ScanRun {
public:
    explicit ScanRun(std::size_t totalTasks);

    ScanRun(const ScanRun&) = delete;
    ScanRun& operator=(const ScanRun&) = delete;

    /**
     * @brief Records the result of one finished task.
     * @param result The probe result.
     * @return Progress including this task.
     */
    ScanProgress record(const core::ProbeResult& result);

    /**
     * @brief Returns the current progress.
     */
    ScanProgress progress() const;

    /**
     * @brief Returns the open pairs sorted by (host, port).
     */
    std::vector<core::OpenPair> openPairs() const;

    std::size_t totalTasks() const { return totalTasks_; }
    std::size_t completedTasks() const { return completed_.load(); }

private:
    const std::size_t totalTasks_;
    std::atomic<std::size_t> completed_{0};
    std::set<core::OpenPair> openPairs_;
    mutable std::mutex mutex_;
};

} // namespace portsweep::engine
