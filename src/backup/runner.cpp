#include "mbk/backup/runner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace mbk::backup {

BackupRunner::BackupRunner(BackupOrchestrator& orchestrator, std::size_t max_concurrent, std::size_t max_queued)
    : orchestrator_(orchestrator),
      queue_(std::max<std::size_t>(max_queued, 1)) {

    const auto threads = std::max<std::size_t>(max_concurrent, 1);
    workers_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
}

BackupRunner::~BackupRunner() {
    shutdown();
}

Outcome<std::future<BackupResult>> BackupRunner::submit(BackupConfiguration config, ProgressObserver progress) {
    std::lock_guard lock(mutex_);
    if (shut_down_) {
        return Fail<std::future<BackupResult>>(ErrorCode::Validation, "Backup runner is shutting down");
    }
    if (active_ids_.count(config.id) > 0) {
        return Fail<std::future<BackupResult>>(
            ErrorCode::Validation,
            "Backup for configuration " + std::to_string(config.id) + " is already queued or running");
    }

    const auto id = config.id;
    auto job = std::make_unique<Job>();
    job->config = std::move(config);
    job->progress = std::move(progress);
    auto future = job->promise.get_future();

    if (!queue_.try_push(std::move(job))) {
        return Fail<std::future<BackupResult>>(
            ErrorCode::Validation,
            "Backup queue is full (" + std::to_string(queue_.capacity()) + " waiting)");
    }
    active_ids_.insert(id);
    return Ok(std::move(future));
}

void BackupRunner::shutdown() {
    if (shut_down_.exchange(true)) {
        return;
    }
    cancel_.cancel();
    queue_.shutdown();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

std::size_t BackupRunner::active() const {
    std::lock_guard lock(mutex_);
    return active_ids_.size();
}

void BackupRunner::worker_loop() {
    while (auto job = queue_.pop()) {
        auto& current = **job;
        const auto id = current.config.id;
        try {
            auto result = orchestrator_.execute_backup(current.config, current.progress, cancel_.token());
            {
                std::lock_guard lock(mutex_);
                active_ids_.erase(id);
            }
            current.promise.set_value(std::move(result));
        } catch (const std::exception& e) {
            spdlog::error("Backup for configuration {} aborted: {}", id, e.what());
            {
                std::lock_guard lock(mutex_);
                active_ids_.erase(id);
            }
            current.promise.set_exception(std::current_exception());
        }
    }
}

} // namespace mbk::backup
