#include "engine/ScanRun.hpp"

namespace portsweep::engine {

ScanRun::ScanRun(std::size_t totalTasks) : totalTasks_(totalTasks) {}

ScanProgress ScanRun::record(const core::ProbeResult& result) {
    ScanProgress progress;
    progress.totalTasks = totalTasks_;

    // Insert and count under one lock: each report is a consistent snapshot.
    std::lock_guard lock(mutex_);
    if (result.isOpen()) {
        openPairs_.insert(result.task);
    }
    progress.completedTasks = ++completed_;
    progress.openPairs = openPairs_.size();
    return progress;
}

ScanProgress ScanRun::progress() const {
    std::lock_guard lock(mutex_);
    return {totalTasks_, completed_.load(), openPairs_.size()};
}

std::vector<core::OpenPair> ScanRun::openPairs() const {
    std::lock_guard lock(mutex_);
    return {openPairs_.begin(), openPairs_.end()};
}

} // namespace portsweep::engine
