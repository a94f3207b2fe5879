#pragma once

#include "mbk/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mbk::transfer {

/**
 * @brief Identity and integrity data of the file being transferred
 *
 * Invariant: file_size equals the sum of all chunk sizes, every chunk but
 * the last is exactly chunk_size bytes.
 */
struct FileMetadata {
    std::string file_name;
    std::uint64_t file_size = 0;
    std::string md5;              ///< Whole-file MD5, lowercase hex (optional)
    std::string sha256;           ///< Whole-file SHA-256, lowercase hex (optional)
    std::uint64_t chunk_size = 0;
    std::uint32_t chunk_count = 0;

    [[nodiscard]] std::uint64_t expected_chunk_size(std::uint32_t index) const noexcept;
    [[nodiscard]] bool same_identity(const FileMetadata& other) const noexcept;
};

/**
 * @brief One transfer unit: a fixed-index slice of the file
 */
struct ChunkData {
    std::uint32_t index = 0;
    std::vector<std::uint8_t> data;
    std::string checksum;         ///< MD5 of data, lowercase hex
};

/**
 * @brief Outcome of delivering one chunk to the receiver
 */
enum class ChunkStatus {
    Accepted,
    Duplicate,
    ChecksumMismatch,
    UnknownTransfer
};

[[nodiscard]] std::string_view to_string(ChunkStatus status) noexcept;
[[nodiscard]] std::optional<ChunkStatus> chunk_status_from_string(std::string_view name) noexcept;

struct CompletedChunk {
    std::uint64_t size = 0;
    std::string checksum;
    std::chrono::system_clock::time_point completed_at{};
};

/**
 * @brief Durable record that lets an interrupted transfer continue
 *
 * The completed set only grows while the token lives.
 */
struct ResumeToken {
    std::string token;
    std::string transfer_id;
    std::string client_id;
    FileMetadata metadata;
    std::string target_path;
    std::string staging_directory;
    std::map<std::uint32_t, CompletedChunk> completed_chunks;
    std::chrono::system_clock::time_point created_at{};
    std::chrono::system_clock::time_point last_activity{};
    bool completed = false;
};

struct ResumeInfo {
    std::string transfer_id;
    std::string client_id;                         ///< Owner; empty when any client may resume
    FileMetadata metadata;
    std::int64_t last_completed_chunk = -1;
    std::vector<std::uint32_t> completed_chunks;   ///< Ascending
};

/**
 * @brief Per-file chunk sizing
 */
struct ChunkingStrategy {
    static constexpr std::uint64_t kDefaultChunkSize = 10ULL * 1024 * 1024;
    static constexpr std::uint64_t kMinChunkSize = 64ULL * 1024;
    static constexpr std::uint64_t kMaxChunkSize = 100ULL * 1024 * 1024;
    static constexpr std::uint32_t kDefaultConcurrency = 4;
    static constexpr std::uint32_t kMaxConcurrency = 10;

    std::uint64_t chunk_size = kDefaultChunkSize;
    std::uint32_t max_concurrent_chunks = kDefaultConcurrency;

    /// Larger files get larger chunks and more parallel sends, capped at 25 MiB / 8.
    [[nodiscard]] static ChunkingStrategy for_file_size(std::uint64_t file_size);

    /// Same strategy with both values clamped to their supported ranges.
    [[nodiscard]] ChunkingStrategy clamped() const;

    [[nodiscard]] std::uint32_t chunk_count(std::uint64_t file_size) const noexcept;
};

struct Endpoint {
    std::string host;
    std::uint32_t port = 0;
    std::string client_id;
    std::string client_secret;
};

struct TransferConfig {
    Endpoint endpoint;
    std::string target_directory;
    std::string target_file_name;
    std::optional<ChunkingStrategy> chunking;   ///< Derived from file size when empty
    std::uint32_t max_retries = 3;              ///< Bound on per-chunk checksum re-sends
    std::chrono::seconds timeout{300};          ///< Per request
};

struct TransferProgress {
    std::uint64_t bytes_transferred = 0;
    std::uint64_t total_bytes = 0;
    std::uint32_t chunks_completed = 0;
    std::uint32_t total_chunks = 0;
    double instantaneous_rate = 0.0;            ///< Bytes per second, last chunk
    double average_rate = 0.0;                  ///< Bytes per second, rolling window
    std::chrono::milliseconds eta{0};
};

struct TransferResult {
    bool success = false;
    std::uint64_t bytes_transferred = 0;
    std::chrono::milliseconds duration{0};
    std::string error_message;
    std::optional<ErrorCode> error_code;
    std::string resume_token;                   ///< Set when the transfer can be continued
    std::string remote_path;
    std::uint64_t remote_size = 0;
    std::string remote_sha256;
};

} // namespace mbk::transfer
