#include "engine/WorkerPool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace portsweep::engine {

WorkerPool::WorkerPool(std::size_t threadCount, std::string name)
    : threadCount_(threadCount > 0 ? threadCount : 1), name_(std::move(name)) {
    spdlog::debug("WorkerPool '{}' created with up to {} threads", name_, threadCount_);
}

WorkerPool::~WorkerPool() {
    join();
}

void WorkerPool::run(std::size_t taskCount, const Task& task) {
    if (running_.exchange(true)) {
        throw std::logic_error("WorkerPool '" + name_ + "' is already running");
    }

    if (taskCount == 0) {
        spdlog::debug("WorkerPool '{}' has no tasks, no workers started", name_);
        running_ = false;
        return;
    }

    nextIndex_ = 0;
    auto workerCount = std::min(threadCount_, taskCount);
    threads_.reserve(workerCount);

    for (std::size_t i = 0; i < workerCount; ++i) {
        try {
            startWorker(i, taskCount, task);
        } catch (const std::system_error& e) {
            if (threads_.empty()) {
                running_ = false;
                throw;
            }
            spdlog::warn("WorkerPool '{}' could only start {} of {} workers: {}", name_,
                         threads_.size(), workerCount, e.what());
            break;
        }
    }

    spdlog::debug("WorkerPool '{}' running {} tasks on {} workers", name_, taskCount,
                  threads_.size());
    join();
    running_ = false;
}

void WorkerPool::startWorker(std::size_t id, std::size_t taskCount, const Task& task) {
    threads_.emplace_back([this, id, taskCount, &task]() {
        spdlog::trace("{} worker {} started", name_, id);
        for (auto index = nextIndex_.fetch_add(1); index < taskCount;
             index = nextIndex_.fetch_add(1)) {
            try {
                task(index);
            } catch (const std::exception& e) {
                spdlog::warn("{} task {} failed: {}", name_, index, e.what());
            }
        }
        spdlog::trace("{} worker {} stopped", name_, id);
    });
}

void WorkerPool::join() {
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
}

} // namespace portsweep::engine
