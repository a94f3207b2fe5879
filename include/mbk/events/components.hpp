/**
 * @file components.hpp
 * @brief Event-driven logging and metrics
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 */

#pragma once

#include "mbk/events/event_bus.hpp"
#include "mbk/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace mbk::events {

/**
 * @brief Logs every backup, transfer and receiver event with spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<BackupStartedEvent>([](const BackupStartedEvent& e) {
            spdlog::info("[BackupStarted] operation={} configuration={} ({})",
                         e.operation_id, e.configuration_id, e.configuration_name);
        });

        bus_.subscribe<BackupStatusChangedEvent>([](const BackupStatusChangedEvent& e) {
            spdlog::info("[BackupStatus] operation={} {} -> {}: {}",
                         e.operation_id, backup::to_string(e.previous), backup::to_string(e.current),
                         e.current_operation);
        });

        bus_.subscribe<BackupCompletedEvent>([](const BackupCompletedEvent& e) {
            spdlog::info("[BackupCompleted] operation={} path={} bytes={} duration={}ms",
                         e.operation_id, e.file_path, e.file_size, e.duration.count());
        });

        bus_.subscribe<BackupFailedEvent>([](const BackupFailedEvent& e) {
            if (e.resume_token.empty()) {
                spdlog::error("[BackupFailed] operation={} during {}: {}",
                              e.operation_id, backup::to_string(e.failed_at), e.error_message);
            } else {
                spdlog::error("[BackupFailed] operation={} during {}: {} (resume token {})",
                              e.operation_id, backup::to_string(e.failed_at), e.error_message, e.resume_token);
            }
        });

        bus_.subscribe<TransferStartedEvent>([](const TransferStartedEvent& e) {
            spdlog::info("[TransferStarted] transfer={} client={} file={} bytes={} chunks={}{}",
                         e.transfer_id, e.client_id, e.file_name, e.total_bytes, e.total_chunks,
                         e.resumed ? " (resumed)" : "");
        });

        bus_.subscribe<ChunkAcceptedEvent>([](const ChunkAcceptedEvent& e) {
            spdlog::debug("[ChunkAccepted] transfer={} chunk={} bytes={}", e.transfer_id, e.chunk_index, e.bytes);
        });

        bus_.subscribe<ChunkRejectedEvent>([](const ChunkRejectedEvent& e) {
            spdlog::warn("[ChunkRejected] transfer={} chunk={}: {}", e.transfer_id, e.chunk_index, e.reason);
        });

        bus_.subscribe<TransferCompletedEvent>([](const TransferCompletedEvent& e) {
            spdlog::info("[TransferCompleted] transfer={} path={} bytes={} sha256={} duration={}ms",
                         e.transfer_id, e.file_path, e.total_bytes, e.sha256, e.duration.count());
        });

        bus_.subscribe<ReceiverStartedEvent>([](const ReceiverStartedEvent& e) {
            spdlog::info("════════════════════════════════════════════");
            spdlog::info("Backup receiver listening on port {}", e.port);
            spdlog::info("════════════════════════════════════════════");
        });

        bus_.subscribe<ReceiverStoppingEvent>([](const ReceiverStoppingEvent& e) {
            spdlog::info("Backup receiver stopping ({}), {} request(s) in flight", e.reason, e.in_flight_requests);
        });
    }

private:
    EventBus& bus_;
};

/**
 * @brief Counters for runs and transfers
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.print_stats();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> backups_started{0};
        std::atomic<uint64_t> backups_completed{0};
        std::atomic<uint64_t> backups_failed{0};
        std::atomic<uint64_t> backups_cancelled{0};
        std::atomic<uint64_t> bytes_backed_up{0};
        std::atomic<uint64_t> transfers_started{0};
        std::atomic<uint64_t> transfers_resumed{0};
        std::atomic<uint64_t> transfers_completed{0};
        std::atomic<uint64_t> chunks_accepted{0};
        std::atomic<uint64_t> chunks_rejected{0};
        std::atomic<uint64_t> bytes_received{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<BackupStartedEvent>([this](const BackupStartedEvent&) {
            stats_.backups_started++;
        });

        bus_.subscribe<BackupStatusChangedEvent>([this](const BackupStatusChangedEvent& e) {
            if (e.current == backup::BackupStatus::Cancelled) {
                stats_.backups_cancelled++;
            }
        });

        bus_.subscribe<BackupCompletedEvent>([this](const BackupCompletedEvent& e) {
            stats_.backups_completed++;
            stats_.bytes_backed_up += e.file_size;
        });

        bus_.subscribe<BackupFailedEvent>([this](const BackupFailedEvent&) {
            stats_.backups_failed++;
        });

        bus_.subscribe<TransferStartedEvent>([this](const TransferStartedEvent& e) {
            stats_.transfers_started++;
            if (e.resumed) {
                stats_.transfers_resumed++;
            }
        });

        bus_.subscribe<ChunkAcceptedEvent>([this](const ChunkAcceptedEvent& e) {
            stats_.chunks_accepted++;
            stats_.bytes_received += e.bytes;
        });

        bus_.subscribe<ChunkRejectedEvent>([this](const ChunkRejectedEvent&) {
            stats_.chunks_rejected++;
        });

        bus_.subscribe<TransferCompletedEvent>([this](const TransferCompletedEvent&) {
            stats_.transfers_completed++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Backup Statistics:");
        spdlog::info("  Backups started:    {}", stats_.backups_started.load());
        spdlog::info("  Backups completed:  {}", stats_.backups_completed.load());
        spdlog::info("  Backups failed:     {}", stats_.backups_failed.load());
        spdlog::info("  Backups cancelled:  {}", stats_.backups_cancelled.load());
        spdlog::info("  Bytes backed up:    {}", stats_.bytes_backed_up.load());
        spdlog::info("  Transfers started:  {}", stats_.transfers_started.load());
        spdlog::info("  Transfers resumed:  {}", stats_.transfers_resumed.load());
        spdlog::info("  Transfers done:     {}", stats_.transfers_completed.load());
        spdlog::info("  Chunks accepted:    {}", stats_.chunks_accepted.load());
        spdlog::info("  Chunks rejected:    {}", stats_.chunks_rejected.load());
        spdlog::info("  Bytes received:     {}", stats_.bytes_received.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace mbk::events
