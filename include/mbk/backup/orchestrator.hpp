#pragma once

#include "mbk/backup/backup_run.hpp"
#include "mbk/backup/types.hpp"
#include "mbk/backup/validation.hpp"
#include "mbk/core/cancellation.hpp"
#include "mbk/core/error.hpp"
#include "mbk/events/event_bus.hpp"
#include "mbk/services/checksum.hpp"
#include "mbk/services/compression.hpp"
#include "mbk/services/encryption.hpp"
#include "mbk/services/mysql_control.hpp"
#include "mbk/services/repositories.hpp"
#include "mbk/transfer/file_transfer_client.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace mbk::backup {

struct OrchestratorOptions {
    std::filesystem::path work_directory;                   ///< Local archives are built here
    std::string server_name;                                ///< {server} in file names
    std::uint64_t min_free_bytes = 1024ULL * 1024 * 1024;   ///< Warning threshold for the work directory
};

/**
 * @brief Runs one backup end to end
 *
 * PHASES:
 * StoppingMySQL -> Compressing -> [Encrypting] -> Transferring -> Verifying
 * -> StartingMySQL -> Completed
 *
 * FAILURE POLICY:
 * - Invalid configuration: nothing is touched, no log row is written
 * - Stop fails: the run fails, MySQL is not started
 * - Anything after a successful stop: MySQL is started exactly once before
 *   the run is recorded as Failed or Cancelled; a failed restart is logged
 *   and does not replace the original error
 * - Transfer fails with a resume token: the local artefact and the token
 *   stay on the log so resume_backup() can continue the upload
 * - A progress observer that throws is logged and ignored; any other
 *   exception inside a phase fails the run with Io
 *
 * Every phase change updates the BackupLog, publishes a
 * BackupStatusChangedEvent and reports progress. Cancellation is checked
 * before each external call and between chunk sends.
 *
 * THREAD SAFETY: independent runs may execute concurrently on one
 * orchestrator; it holds no per-run state.
 */
class BackupOrchestrator {
public:
    BackupOrchestrator(OrchestratorOptions options,
                       services::MySqlController& mysql,
                       services::CompressionService& compression,
                       services::EncryptionService& encryption,
                       const services::ChecksumService& checksums,
                       transfer::FileTransferService& transfer,
                       services::BackupLogRepository& logs,
                       events::EventBus* bus = nullptr);

    BackupOrchestrator(const BackupOrchestrator&) = delete;
    BackupOrchestrator& operator=(const BackupOrchestrator&) = delete;

    [[nodiscard]] ValidationReport validate_configuration(const BackupConfiguration& config) const;

    BackupResult execute_backup(const BackupConfiguration& config,
                                const ProgressObserver& progress = {},
                                const core::CancellationToken& cancel = {});

    /**
     * @brief Continue the upload of a failed or cancelled run
     *
     * Starts a new log row at Transferring from the token and local artefact
     * recorded on log @p log_id. MySQL is not touched.
     */
    BackupResult resume_backup(std::int64_t log_id,
                               const ProgressObserver& progress = {},
                               const core::CancellationToken& cancel = {});

    [[nodiscard]] const OrchestratorOptions& options() const noexcept { return options_; }

private:
    struct RunContext;

    Outcome<void> run_phases(RunContext& ctx, const BackupConfiguration& config);
    Outcome<void> capture(RunContext& ctx, const BackupConfiguration& config);
    Outcome<void> transfer_artifact(RunContext& ctx, const std::string& resume_token);
    Outcome<void> verify(RunContext& ctx);

    /// Turns an escaping exception into an error so fail() still restarts MySQL.
    Outcome<void> guarded(RunContext& ctx, const std::function<Outcome<void>()>& phases);

    Outcome<void> enter(RunContext& ctx, BackupStatus next, std::string operation_text, double progress);
    void notify(RunContext& ctx, const BackupProgress& progress) const;
    void save_log(RunContext& ctx);
    void discard_artifact(RunContext& ctx);

    BackupResult complete(RunContext& ctx);
    BackupResult fail(RunContext& ctx, const Error& error);
    Outcome<void> open_log(RunContext& ctx, std::int64_t configuration_id, const std::string& name);

    OrchestratorOptions options_;
    services::MySqlController& mysql_;
    services::CompressionService& compression_;
    services::EncryptionService& encryption_;
    const services::ChecksumService& checksums_;
    transfer::FileTransferService& transfer_;
    services::BackupLogRepository& logs_;
    events::EventBus* bus_;
};

/// "BK_<unix seconds>_<8 hex>"
[[nodiscard]] std::string generate_operation_id();

} // namespace mbk::backup
