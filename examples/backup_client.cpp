/**
 * @file backup_client.cpp
 * @brief Runs a MySQL backup and ships it to a backup receiver
 *
 * USAGE:
 *   mbk_client --config client.json                      # one backup
 *   mbk_client --config client.json --validate-only      # check the config
 *   mbk_client --config client.json --resume RT_... --file /var/tmp/mbk/x.tar.gz
 *
 * Exit codes: 0 success, 1 failure, 2 bad usage or config.
 */

#include "mbk/backup/orchestrator.hpp"
#include "mbk/backup/runner.hpp"
#include "mbk/config/config.hpp"
#include "mbk/core/cancellation.hpp"
#include "mbk/events/components.hpp"
#include "mbk/events/event_bus.hpp"
#include "mbk/network/retry_service.hpp"
#include "mbk/network/tcp_transfer_channel.hpp"
#include "mbk/services/checksum.hpp"
#include "mbk/services/compression.hpp"
#include "mbk/services/encryption.hpp"
#include "mbk/services/mysql_control.hpp"
#include "mbk/services/repositories.hpp"
#include "mbk/transfer/file_transfer_client.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <future>
#include <iostream>
#include <string>

namespace {

volatile std::sig_atomic_t g_stop_signal = 0;

void signal_handler(int signal) {
    g_stop_signal = signal;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " --config <client.json> [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <path>   Client configuration file (required)\n";
    std::cout << "  --validate-only   Check the configuration and exit\n";
    std::cout << "  --resume <token>  Continue an interrupted upload (needs --file)\n";
    std::cout << "  --file <path>     Local backup file for --resume\n";
    std::cout << "  --verbose         Debug logging\n";
    std::cout << "  --help            Show this help\n";
}

/// Waits for @p future, cancelling through @p on_signal once SIGINT/SIGTERM arrives.
template<typename T, typename OnSignal>
T wait_interruptible(std::future<T>& future, OnSignal on_signal) {
    bool signalled = false;
    while (future.wait_for(std::chrono::milliseconds(200)) != std::future_status::ready) {
        if (g_stop_signal != 0 && !signalled) {
            spdlog::warn("Received signal {}, cancelling", static_cast<int>(g_stop_signal));
            signalled = true;
            on_signal();
        }
    }
    return future.get();
}

int report_transfer(const mbk::transfer::TransferResult& result) {
    if (result.success) {
        spdlog::info("Upload complete: {} ({} bytes, sha256 {})",
                     result.remote_path, result.remote_size, result.remote_sha256);
        return 0;
    }
    spdlog::error("Upload failed: {}", result.error_message);
    if (!result.resume_token.empty()) {
        spdlog::info("Resume with: --resume {}", result.resume_token);
    }
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::string config_path;
    std::string resume_token;
    std::string resume_file;
    bool validate_only = false;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--resume" && i + 1 < argc) {
            resume_token = argv[++i];
        } else if (arg == "--file" && i + 1 < argc) {
            resume_file = argv[++i];
        } else if (arg == "--validate-only") {
            validate_only = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else {
            spdlog::error("Unknown or incomplete option: {}", arg);
            print_usage(argv[0]);
            return 2;
        }
    }

    if (config_path.empty() || (!resume_token.empty() && resume_file.empty())) {
        spdlog::error(config_path.empty() ? "--config is required" : "--resume needs --file");
        print_usage(argv[0]);
        return 2;
    }

    auto loaded = mbk::config::load_client_config(config_path);
    if (loaded.is_error()) {
        spdlog::error("{}", mbk::describe(loaded.error()));
        return 2;
    }
    const auto config = std::move(loaded.value());
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::from_str(config.log_level));

    mbk::events::EventBus bus;
    mbk::events::LoggerComponent logger(bus);
    mbk::events::MetricsComponent metrics(bus);

    mbk::services::OpenSslChecksumService checksums;
    mbk::network::NetworkRetryService retry(config.retry);
    mbk::transfer::FileTransferClient transfer_client(mbk::network::make_tcp_channel_factory(), checksums, retry);
    mbk::services::TarGzCompressionService compression;
    mbk::services::AesEncryptionService encryption;
    mbk::services::ServiceCommandMySqlController mysql(config.mysql_commands, retry);
    mbk::services::InMemoryBackupLogRepository logs;

    mbk::backup::OrchestratorOptions options;
    options.work_directory = config.work_directory;
    options.server_name = config.server_name;
    mbk::backup::BackupOrchestrator orchestrator(options, mysql, compression, encryption, checksums,
                                                 transfer_client, logs, &bus);

    if (validate_only) {
        const auto report = orchestrator.validate_configuration(config.backup);
        for (const auto& warning : report.warnings) {
            spdlog::warn("{}", warning);
        }
        for (const auto& error : report.errors) {
            spdlog::error("{}", error);
        }
        if (!report.is_valid()) {
            return 1;
        }
        spdlog::info("Configuration '{}' is valid", config.backup.name);
        return 0;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (!resume_token.empty()) {
        mbk::transfer::TransferConfig transfer_config;
        transfer_config.endpoint = config.backup.target;
        transfer_config.target_directory = config.backup.target_directory;
        transfer_config.target_file_name = std::filesystem::path(resume_file).filename().string();
        transfer_config.chunking = config.backup.chunking;
        transfer_config.max_retries = config.backup.max_retries;
        transfer_config.timeout = config.backup.transfer_timeout;

        mbk::core::CancellationSource cancel;
        auto on_progress = [](const mbk::transfer::TransferProgress& p) {
            spdlog::info("Chunk {}/{} ({} / {} bytes, {:.1f} KiB/s)", p.chunks_completed, p.total_chunks,
                         p.bytes_transferred, p.total_bytes, p.average_rate / 1024.0);
        };
        auto pending = std::async(std::launch::async, [&]() {
            return transfer_client.resume_transfer(resume_token, std::filesystem::path(resume_file),
                                                   transfer_config, cancel.token(), on_progress);
        });
        return report_transfer(wait_interruptible(pending, [&cancel]() { cancel.cancel(); }));
    }

    mbk::backup::BackupRunner runner(orchestrator, config.max_concurrent_backups, config.max_queued_backups);
    std::atomic<int> last_percent{-1};
    auto observer = [&last_percent](const mbk::backup::BackupProgress& p) {
        const int percent = static_cast<int>(p.overall_progress * 100.0);
        if (last_percent.exchange(percent) != percent) {
            spdlog::info("[{:>3}%] {} {}", percent, mbk::backup::to_string(p.status), p.current_operation);
        }
    };

    auto submitted = runner.submit(config.backup, observer);
    if (submitted.is_error()) {
        spdlog::error("{}", mbk::describe(submitted.error()));
        return 1;
    }
    auto result = wait_interruptible(submitted.value(), [&runner]() { runner.shutdown(); });

    metrics.print_stats();
    for (const auto& warning : result.warnings) {
        spdlog::warn("{}", warning);
    }
    if (result.success) {
        spdlog::info("Backup {} completed: {} ({} bytes) in {}ms", result.operation_id,
                     result.backup_file_path, result.file_size, result.duration.count());
        return 0;
    }
    spdlog::error("Backup {} {}: {}", result.operation_id,
                  mbk::backup::to_string(result.final_status), result.error_message);
    if (!result.resume_token.empty()) {
        spdlog::info("Resume with: --resume {} --file {}", result.resume_token, result.local_artifact);
    }
    return 1;
}
