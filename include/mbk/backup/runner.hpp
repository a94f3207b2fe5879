#pragma once

#include "mbk/backup/orchestrator.hpp"
#include "mbk/backup/types.hpp"
#include "mbk/core/cancellation.hpp"
#include "mbk/core/error.hpp"
#include "mbk/core/work_queue.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace mbk::backup {

/**
 * @brief Runs independent backups on a fixed set of worker threads
 *
 * At most max_concurrent runs execute at once and at most max_queued wait
 * behind them. A configuration id that is already queued or running is
 * declined, as is any submission once the queue is full.
 *
 * THREAD SAFETY: submit() may be called from any thread.
 */
class BackupRunner {
public:
    BackupRunner(BackupOrchestrator& orchestrator, std::size_t max_concurrent = 2, std::size_t max_queued = 16);
    ~BackupRunner();

    BackupRunner(const BackupRunner&) = delete;
    BackupRunner& operator=(const BackupRunner&) = delete;

    /**
     * @brief Queue a run
     *
     * RETURNS: future of the run's result, or Validation if declined
     */
    Outcome<std::future<BackupResult>> submit(BackupConfiguration config, ProgressObserver progress = {});

    /// Cancels running backups, lets queued ones finish as Cancelled, joins the workers.
    void shutdown();

    /// Queued plus running.
    [[nodiscard]] std::size_t active() const;
    [[nodiscard]] std::size_t max_concurrent() const noexcept { return workers_.size(); }

private:
    struct Job {
        BackupConfiguration config;
        ProgressObserver progress;
        std::promise<BackupResult> promise;
    };

    void worker_loop();

    BackupOrchestrator& orchestrator_;
    core::WorkQueue<std::unique_ptr<Job>> queue_;
    core::CancellationSource cancel_;

    mutable std::mutex mutex_;
    std::set<std::int64_t> active_ids_;
    std::atomic<bool> shut_down_{false};

    std::vector<std::thread> workers_;
};

} // namespace mbk::backup
