#pragma once

#include "mbk/backup/types.hpp"
#include "mbk/core/error.hpp"

#include <chrono>
#include <mutex>
#include <string>

namespace mbk::backup {

/**
 * @brief Status and progress of a single backup run
 *
 * Enforces the phase order Queued -> StoppingMySQL -> Compressing ->
 * [Encrypting] -> Transferring -> Verifying -> StartingMySQL -> Completed.
 * Failed and Cancelled are reachable from every non-terminal state.
 * A resumed run enters at Transferring and goes from Verifying straight
 * to Completed; no other run may skip StartingMySQL.
 *
 * THREAD SAFETY: all members are guarded; chunk-sender threads may report
 * progress while the orchestrator thread transitions.
 */
class BackupRun {
public:
    explicit BackupRun(std::string operation_id);

    [[nodiscard]] const std::string& operation_id() const noexcept { return operation_id_; }
    [[nodiscard]] BackupStatus status() const;
    [[nodiscard]] BackupProgress snapshot() const;

    Outcome<void> transition_to(BackupStatus next, std::string operation_text);
    Outcome<void> resume_at_transfer(std::string operation_text);

    /// Raises overall progress; values below the current one are ignored.
    BackupProgress report(double overall_progress, std::string operation_text = {});
    BackupProgress report_transfer(double overall_progress, const transfer::TransferProgress& progress);

    [[nodiscard]] std::chrono::milliseconds elapsed() const;

private:
    [[nodiscard]] bool can_transition(BackupStatus target) const noexcept;

    const std::string operation_id_;
    const std::chrono::steady_clock::time_point started_;
    mutable std::mutex mutex_;
    BackupProgress progress_;
    bool resumed_ = false;
};

} // namespace mbk::backup
