#include "mbk/backup/orchestrator.hpp"

#include "mbk/backup/naming.hpp"
#include "mbk/events/events.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <iomanip>
#include <optional>
#include <random>
#include <sstream>
#include <vector>

namespace mbk::backup {
namespace fs = std::filesystem;

namespace {

// Overall progress milestones
constexpr double kStopping = 0.05;
constexpr double kCompressStart = 0.10;
constexpr double kCompressEnd = 0.40;
constexpr double kEncryptEnd = 0.45;
constexpr double kTransferStart = 0.45;
constexpr double kTransferEnd = 0.85;
constexpr double kVerifying = 0.90;
constexpr double kStarting = 0.95;

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            oss << separator;
        }
        oss << parts[i];
    }
    return oss.str();
}

/// Result for a run that never got as far as touching anything external.
BackupResult rejected(const std::string& operation_id, const Error& error, std::vector<std::string> warnings) {
    BackupResult result;
    result.operation_id = operation_id;
    result.success = false;
    result.final_status = BackupStatus::Failed;
    result.error_code = error.code;
    result.error_message = error.message;
    result.completed_at = std::chrono::system_clock::now();
    result.warnings = std::move(warnings);
    return result;
}

transfer::TransferConfig make_transfer_config(const BackupConfiguration& config, const std::string& file_name) {
    transfer::TransferConfig transfer_config;
    transfer_config.endpoint = config.target;
    transfer_config.target_directory = config.target_directory;
    transfer_config.target_file_name = file_name;
    transfer_config.chunking = config.chunking;
    transfer_config.max_retries = config.max_retries;
    transfer_config.timeout = config.transfer_timeout;
    return transfer_config;
}

} // namespace

std::string generate_operation_id() {
    thread_local std::mt19937 engine{std::random_device{}()};
    const auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::ostringstream oss;
    oss << "BK_" << now << "_" << std::hex << std::setw(8) << std::setfill('0') << engine();
    return oss.str();
}

struct BackupOrchestrator::RunContext {
    RunContext(std::string operation_id, const ProgressObserver& observer_ref, const core::CancellationToken& cancel_ref)
        : run(std::move(operation_id)), observer(observer_ref), cancel(cancel_ref) {}

    BackupRun run;
    BackupLog log;
    const ProgressObserver& observer;
    const core::CancellationToken& cancel;

    std::string service_name;
    bool mysql_stopped = false;
    bool mysql_start_attempted = false;

    fs::path artifact;
    transfer::TransferResult transfer;
    std::string sha256;
    std::vector<std::string> warnings;
};

BackupOrchestrator::BackupOrchestrator(OrchestratorOptions options,
                                       services::MySqlController& mysql,
                                       services::CompressionService& compression,
                                       services::EncryptionService& encryption,
                                       const services::ChecksumService& checksums,
                                       transfer::FileTransferService& transfer,
                                       services::BackupLogRepository& logs,
                                       events::EventBus* bus)
    : options_(std::move(options)),
      mysql_(mysql),
      compression_(compression),
      encryption_(encryption),
      checksums_(checksums),
      transfer_(transfer),
      logs_(logs),
      bus_(bus) {

    if (options_.work_directory.empty()) {
        options_.work_directory = fs::temp_directory_path() / "mbk-work";
    }
}

ValidationReport BackupOrchestrator::validate_configuration(const BackupConfiguration& config) const {
    ValidationOptions validation;
    validation.work_directory = options_.work_directory;
    validation.min_free_bytes = options_.min_free_bytes;
    return backup::validate_configuration(config, validation);
}

BackupResult BackupOrchestrator::execute_backup(const BackupConfiguration& config,
                                                const ProgressObserver& progress,
                                                const core::CancellationToken& cancel) {
    const auto operation_id = generate_operation_id();

    auto report = validate_configuration(config);
    if (!report.is_valid()) {
        spdlog::warn("Backup '{}' rejected: {}", config.name, join(report.errors, "; "));
        return rejected(operation_id, Error(ErrorCode::Validation, join(report.errors, "; ")),
                        std::move(report.warnings));
    }
    for (const auto& warning : report.warnings) {
        spdlog::warn("Backup '{}': {}", config.name, warning);
    }

    RunContext ctx(operation_id, progress, cancel);
    ctx.warnings = std::move(report.warnings);
    ctx.service_name = config.mysql.service_name;

    if (auto opened = open_log(ctx, config.id, config.name); opened.is_error()) {
        return rejected(operation_id, opened.error(), std::move(ctx.warnings));
    }

    auto outcome = guarded(ctx, [&]() { return run_phases(ctx, config); });
    if (outcome.is_error()) {
        return fail(ctx, outcome.error());
    }
    return complete(ctx);
}

BackupResult BackupOrchestrator::resume_backup(std::int64_t log_id,
                                               const ProgressObserver& progress,
                                               const core::CancellationToken& cancel) {
    const auto operation_id = generate_operation_id();

    auto previous = logs_.get(log_id);
    if (previous.is_error()) {
        return rejected(operation_id, previous.error(), {});
    }
    const auto& prior = previous.value();
    if (prior.resume_token.empty() || prior.local_artifact.empty()) {
        return rejected(operation_id,
                        Error(ErrorCode::Validation, "Backup log " + std::to_string(log_id) + " has no resumable transfer"),
                        {});
    }
    std::error_code ec;
    if (!fs::is_regular_file(prior.local_artifact, ec)) {
        return rejected(operation_id,
                        Error(ErrorCode::Validation, "Local backup file " + prior.local_artifact + " no longer exists"),
                        {});
    }

    RunContext ctx(operation_id, progress, cancel);
    ctx.artifact = prior.local_artifact;
    ctx.log.transfer_config = prior.transfer_config;
    ctx.log.local_artifact = prior.local_artifact;
    ctx.log.resume_token = prior.resume_token;

    if (auto opened = open_log(ctx, prior.configuration_id, "resume of log " + std::to_string(log_id));
        opened.is_error()) {
        return rejected(operation_id, opened.error(), {});
    }

    if (auto resumed = ctx.run.resume_at_transfer("Resuming transfer"); resumed.is_error()) {
        return fail(ctx, resumed.error());
    }
    if (bus_) {
        bus_->emit(events::BackupStatusChangedEvent{operation_id, BackupStatus::Queued,
                                                    BackupStatus::Transferring, "Resuming transfer"});
    }

    auto outcome = guarded(ctx, [&]() -> Outcome<void> {
        if (auto transferred = transfer_artifact(ctx, prior.resume_token); transferred.is_error()) {
            return transferred;
        }
        return verify(ctx);
    });
    if (outcome.is_error()) {
        return fail(ctx, outcome.error());
    }
    return complete(ctx);
}

Outcome<void> BackupOrchestrator::open_log(RunContext& ctx, std::int64_t configuration_id, const std::string& name) {
    ctx.log.configuration_id = configuration_id;
    ctx.log.operation_id = ctx.run.operation_id();
    ctx.log.status = BackupStatus::Queued;
    ctx.log.current_operation = "Queued";
    ctx.log.start_time = std::chrono::system_clock::now();

    auto added = logs_.add(ctx.log);
    if (added.is_error()) {
        return Err<void>(added.error());
    }
    ctx.log.id = added.value();

    if (bus_) {
        bus_->emit(events::BackupStartedEvent{ctx.run.operation_id(), std::to_string(configuration_id), name});
    }
    notify(ctx, ctx.run.snapshot());
    return Ok();
}

Outcome<void> BackupOrchestrator::run_phases(RunContext& ctx, const BackupConfiguration& config) {
    if (ctx.cancel.is_cancelled()) {
        return Fail<void>(ErrorCode::Cancelled, "Backup cancelled before MySQL was stopped");
    }
    if (auto entered = enter(ctx, BackupStatus::StoppingMySQL, "Stopping MySQL service " + ctx.service_name, kStopping);
        entered.is_error()) {
        return entered;
    }
    if (auto stopped = mysql_.stop_instance(ctx.service_name); stopped.is_error()) {
        return stopped;
    }
    ctx.mysql_stopped = true;

    if (auto captured = capture(ctx, config); captured.is_error()) {
        return captured;
    }

    if (ctx.cancel.is_cancelled()) {
        return Fail<void>(ErrorCode::Cancelled, "Backup cancelled before transfer");
    }
    ctx.log.local_artifact = ctx.artifact.string();
    ctx.log.transfer_config = make_transfer_config(config, ctx.artifact.filename().string());
    if (auto transferred = transfer_artifact(ctx, {}); transferred.is_error()) {
        return transferred;
    }

    if (auto verified = verify(ctx); verified.is_error()) {
        return verified;
    }

    // The database is restarted even if cancellation arrives now.
    if (auto entered = enter(ctx, BackupStatus::StartingMySQL, "Starting MySQL service " + ctx.service_name, kStarting);
        entered.is_error()) {
        return entered;
    }
    ctx.mysql_start_attempted = true;
    if (auto started = mysql_.start_instance(ctx.service_name); started.is_error()) {
        return started;
    }
    auto available = mysql_.verify_instance_availability(config.mysql, config.mysql_verify_timeout, ctx.cancel);
    if (available.is_error()) {
        const auto code = available.error().code == ErrorCode::Cancelled ? ErrorCode::Cancelled : ErrorCode::MySqlService;
        return Fail<void>(code, "MySQL did not become available: " + available.error().message);
    }
    return Ok();
}

Outcome<void> BackupOrchestrator::capture(RunContext& ctx, const BackupConfiguration& config) {
    if (ctx.cancel.is_cancelled()) {
        return Fail<void>(ErrorCode::Cancelled, "Backup cancelled before compression");
    }
    if (auto entered = enter(ctx, BackupStatus::Compressing, "Compressing " + config.mysql.data_directory, kCompressStart);
        entered.is_error()) {
        return entered;
    }

    std::error_code ec;
    fs::create_directories(options_.work_directory, ec);
    if (ec) {
        return Fail<void>(ErrorCode::Io, "Cannot create work directory " + options_.work_directory.string() +
                                         ": " + ec.message());
    }

    const auto file_name = generate_file_name(config.naming.value_or(FileNamingStrategy{}), options_.server_name,
                                              config.mysql.service_name, std::chrono::system_clock::now());
    auto on_progress = [this, &ctx](const services::CompressionProgress& progress) {
        const double overall = kCompressStart + (kCompressEnd - kCompressStart) * progress.progress;
        notify(ctx, ctx.run.report(overall, progress.current_file.empty()
                                                ? std::string()
                                                : "Compressing " + progress.current_file));
    };
    auto archived = compression_.compress_directory(config.mysql.data_directory, options_.work_directory / file_name,
                                                    on_progress, ctx.cancel);
    if (archived.is_error()) {
        return Err<void>(archived.error());
    }
    ctx.artifact = archived.value();
    notify(ctx, ctx.run.report(kCompressEnd));

    if (!config.encryption.enabled) {
        return Ok();
    }

    if (ctx.cancel.is_cancelled()) {
        return Fail<void>(ErrorCode::Cancelled, "Backup cancelled before encryption");
    }
    if (auto entered = enter(ctx, BackupStatus::Encrypting, "Encrypting " + ctx.artifact.filename().string(), kCompressEnd);
        entered.is_error()) {
        return entered;
    }
    const fs::path encrypted_path = ctx.artifact.string() + ".enc";
    auto encrypted = encryption_.encrypt(ctx.artifact, encrypted_path, config.encryption.password, ctx.cancel);
    if (encrypted.is_error()) {
        return Err<void>(encrypted.error());
    }
    discard_artifact(ctx);
    ctx.artifact = encrypted_path;
    notify(ctx, ctx.run.report(kEncryptEnd));
    return Ok();
}

Outcome<void> BackupOrchestrator::transfer_artifact(RunContext& ctx, const std::string& resume_token) {
    const auto& endpoint = ctx.log.transfer_config.endpoint;
    if (auto entered = enter(ctx, BackupStatus::Transferring,
                             "Transferring " + ctx.artifact.filename().string() + " to " +
                             endpoint.host + ":" + std::to_string(endpoint.port),
                             kTransferStart);
        entered.is_error()) {
        return entered;
    }

    auto on_progress = [this, &ctx](const transfer::TransferProgress& progress) {
        const double fraction = progress.total_bytes == 0
            ? 1.0
            : static_cast<double>(progress.bytes_transferred) / static_cast<double>(progress.total_bytes);
        const auto snapshot = ctx.run.report_transfer(kTransferStart + (kTransferEnd - kTransferStart) * fraction, progress);
        ctx.log.percent_complete = snapshot.overall_progress * 100.0;
        ctx.log.transfer_rate = snapshot.transfer_rate;
        ctx.log.eta = snapshot.eta;
        ctx.log.current_operation = snapshot.current_operation;
        save_log(ctx);
        notify(ctx, snapshot);
    };

    if (resume_token.empty()) {
        ctx.transfer = transfer_.transfer_file(ctx.artifact, ctx.log.transfer_config, ctx.cancel, on_progress);
    } else {
        ctx.transfer = transfer_.resume_transfer(resume_token, ctx.artifact, ctx.log.transfer_config,
                                                 ctx.cancel, on_progress);
    }

    if (!ctx.transfer.resume_token.empty()) {
        ctx.log.resume_token = ctx.transfer.resume_token;
    }
    if (!ctx.transfer.success) {
        return Fail<void>(ctx.transfer.error_code.value_or(ErrorCode::TransientNetwork),
                          "Transfer failed: " + ctx.transfer.error_message);
    }
    return Ok();
}

Outcome<void> BackupOrchestrator::verify(RunContext& ctx) {
    if (auto entered = enter(ctx, BackupStatus::Verifying, "Verifying " + ctx.transfer.remote_path, kVerifying);
        entered.is_error()) {
        return entered;
    }
    // The receiver has finalized; its token is gone.
    ctx.log.resume_token.clear();

    auto digest = checksums_.digest_file(ctx.artifact);
    if (digest.is_error()) {
        return Err<void>(digest.error());
    }
    const auto& local = digest.value();
    if (ctx.transfer.remote_size != local.size) {
        return Fail<void>(ErrorCode::ChecksumMismatch,
                          "Remote size " + std::to_string(ctx.transfer.remote_size) +
                          " differs from local size " + std::to_string(local.size));
    }
    if (!ctx.transfer.remote_sha256.empty() && ctx.transfer.remote_sha256 != local.sha256) {
        return Fail<void>(ErrorCode::ChecksumMismatch, "Remote SHA-256 does not match the local backup file");
    }

    ctx.sha256 = local.sha256;
    ctx.log.file_path = ctx.transfer.remote_path;
    ctx.log.file_size = ctx.transfer.remote_size;
    return Ok();
}

Outcome<void> BackupOrchestrator::enter(RunContext& ctx, BackupStatus next, std::string operation_text, double progress) {
    const auto previous = ctx.run.status();
    if (auto moved = ctx.run.transition_to(next, operation_text); moved.is_error()) {
        return moved;
    }
    const auto snapshot = ctx.run.report(progress, operation_text);

    ctx.log.status = next;
    ctx.log.current_operation = operation_text;
    ctx.log.percent_complete = snapshot.overall_progress * 100.0;
    save_log(ctx);

    if (bus_ && previous != next) {
        bus_->emit(events::BackupStatusChangedEvent{ctx.run.operation_id(), previous, next, operation_text});
    }
    notify(ctx, snapshot);
    return Ok();
}

Outcome<void> BackupOrchestrator::guarded(RunContext& ctx, const std::function<Outcome<void>()>& phases) {
    try {
        return phases();
    } catch (const std::exception& e) {
        spdlog::error("[{}] Unexpected exception during {}: {}",
                      ctx.run.operation_id(), to_string(ctx.run.status()), e.what());
        return Fail<void>(ErrorCode::Io, std::string("Unexpected error: ") + e.what());
    }
}

void BackupOrchestrator::notify(RunContext& ctx, const BackupProgress& progress) const {
    if (!ctx.observer) {
        return;
    }
    try {
        ctx.observer(progress);
    } catch (const std::exception& e) {
        spdlog::warn("[{}] Progress observer threw: {}", ctx.run.operation_id(), e.what());
    }
}

void BackupOrchestrator::save_log(RunContext& ctx) {
    if (auto updated = logs_.update(ctx.log); updated.is_error()) {
        spdlog::warn("[{}] Failed to update backup log {}: {}",
                     ctx.run.operation_id(), ctx.log.id, updated.error().message);
    }
}

void BackupOrchestrator::discard_artifact(RunContext& ctx) {
    if (ctx.artifact.empty()) {
        return;
    }
    if (auto removed = compression_.cleanup(ctx.artifact); removed.is_error()) {
        spdlog::warn("[{}] Could not remove {}: {}", ctx.run.operation_id(), ctx.artifact.string(),
                     removed.error().message);
        ctx.warnings.push_back("Local file " + ctx.artifact.string() + " was not removed");
    }
    ctx.artifact.clear();
}

BackupResult BackupOrchestrator::complete(RunContext& ctx) {
    discard_artifact(ctx);
    ctx.log.local_artifact.clear();
    ctx.log.resume_token.clear();
    ctx.log.end_time = std::chrono::system_clock::now();
    ctx.log.eta = std::chrono::milliseconds{0};

    if (auto entered = enter(ctx, BackupStatus::Completed, "Backup completed", 1.0); entered.is_error()) {
        return fail(ctx, entered.error());
    }

    const auto duration = ctx.run.elapsed();
    if (bus_) {
        bus_->emit(events::BackupCompletedEvent{ctx.run.operation_id(), ctx.log.file_path, ctx.log.file_size, duration});
    }

    BackupResult result;
    result.operation_id = ctx.run.operation_id();
    result.success = true;
    result.final_status = BackupStatus::Completed;
    result.backup_file_path = ctx.log.file_path;
    result.file_size = ctx.log.file_size;
    result.checksum_sha256 = ctx.sha256;
    result.log_id = ctx.log.id;
    result.duration = duration;
    result.completed_at = *ctx.log.end_time;
    result.warnings = std::move(ctx.warnings);
    return result;
}

BackupResult BackupOrchestrator::fail(RunContext& ctx, const Error& error) {
    const auto failed_at = ctx.run.status();
    const bool cancelled = error.code == ErrorCode::Cancelled;

    if (ctx.mysql_stopped && !ctx.mysql_start_attempted) {
        ctx.mysql_start_attempted = true;
        spdlog::warn("[{}] {} during {}, restarting MySQL service {}",
                     ctx.run.operation_id(), cancelled ? "Cancelled" : "Failed",
                     to_string(failed_at), ctx.service_name);
        if (auto restarted = mysql_.start_instance(ctx.service_name); restarted.is_error()) {
            spdlog::error("[{}] MySQL restart after failure also failed: {}",
                          ctx.run.operation_id(), restarted.error().message);
            ctx.warnings.push_back("MySQL restart failed: " + restarted.error().message);
        }
    }

    const bool resumable = failed_at == BackupStatus::Transferring && !ctx.log.resume_token.empty();
    if (resumable) {
        ctx.log.local_artifact = ctx.artifact.string();
    } else {
        discard_artifact(ctx);
        ctx.log.local_artifact.clear();
        ctx.log.resume_token.clear();
    }

    ctx.log.error_message = describe(error);
    ctx.log.end_time = std::chrono::system_clock::now();
    const auto final_status = cancelled ? BackupStatus::Cancelled : BackupStatus::Failed;
    if (auto entered = enter(ctx, final_status, error.message, 0.0); entered.is_error()) {
        spdlog::error("[{}] {}", ctx.run.operation_id(), entered.error().message);
    }

    if (bus_ && !cancelled) {
        bus_->emit(events::BackupFailedEvent{ctx.run.operation_id(), failed_at, error.message, ctx.log.resume_token});
    }

    BackupResult result;
    result.operation_id = ctx.run.operation_id();
    result.success = false;
    result.final_status = final_status;
    result.error_code = error.code;
    result.error_message = error.message;
    result.resume_token = ctx.log.resume_token;
    result.local_artifact = ctx.log.local_artifact;
    result.log_id = ctx.log.id;
    result.duration = ctx.run.elapsed();
    result.completed_at = *ctx.log.end_time;
    result.warnings = std::move(ctx.warnings);
    return result;
}

} // namespace mbk::backup
