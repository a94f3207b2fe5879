/**
 * @file events.hpp
 * @brief Event types published by backup runs, transfers and the receiver
 *
 * NAMING CONVENTION:
 * - Events are past-tense: BackupCompletedEvent, ChunkAcceptedEvent
 */

#pragma once

#include "mbk/backup/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace mbk::events {

// ════════════════════════════════════════════════════════
// Backup Events (client side)
// ════════════════════════════════════════════════════════

struct BackupStartedEvent {
    std::string operation_id;
    std::string configuration_id;
    std::string configuration_name;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

/**
 * @brief Emitted on every phase change of a run
 *
 * WHO SUBSCRIBES:
 * - Logger (phase trail)
 * - Metrics (failure and cancellation counters)
 */
struct BackupStatusChangedEvent {
    std::string operation_id;
    backup::BackupStatus previous;
    backup::BackupStatus current;
    std::string current_operation;
};

struct BackupCompletedEvent {
    std::string operation_id;
    std::string file_path;
    std::uint64_t file_size = 0;
    std::chrono::milliseconds duration{0};
};

struct BackupFailedEvent {
    std::string operation_id;
    backup::BackupStatus failed_at;
    std::string error_message;
    std::string resume_token;      ///< Non-empty when the transfer can be resumed
};

// ════════════════════════════════════════════════════════
// Transfer Events (receiver side)
// ════════════════════════════════════════════════════════

struct TransferStartedEvent {
    std::string transfer_id;
    std::string client_id;
    std::string file_name;
    std::uint64_t total_bytes = 0;
    std::uint32_t total_chunks = 0;
    bool resumed = false;
};

struct ChunkAcceptedEvent {
    std::string transfer_id;
    std::uint32_t chunk_index = 0;
    std::uint64_t bytes = 0;
};

struct ChunkRejectedEvent {
    std::string transfer_id;
    std::uint32_t chunk_index = 0;
    std::string reason;
};

struct TransferCompletedEvent {
    std::string transfer_id;
    std::string client_id;
    std::string file_path;
    std::uint64_t total_bytes = 0;
    std::string sha256;
    std::chrono::milliseconds duration{0};
};

// ════════════════════════════════════════════════════════
// Receiver Lifecycle
// ════════════════════════════════════════════════════════

struct ReceiverStartedEvent {
    std::uint16_t port = 0;
};

struct ReceiverStoppingEvent {
    std::string reason;
    std::size_t in_flight_requests = 0;
};

} // namespace mbk::events
