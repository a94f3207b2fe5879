#pragma once

#include "mbk/core/error.hpp"
#include "mbk/transfer/types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mbk::backup {

enum class BackupStatus {
    Queued,
    StoppingMySQL,
    Compressing,
    Encrypting,
    Transferring,
    Verifying,
    StartingMySQL,
    Completed,
    Failed,
    Cancelled
};

[[nodiscard]] std::string_view to_string(BackupStatus status) noexcept;
[[nodiscard]] bool is_terminal(BackupStatus status) noexcept;

struct MySqlConnectionInfo {
    std::string username;
    std::string password;
    std::string service_name;
    std::string data_directory;
    std::string host = "localhost";
    std::uint32_t port = 3306;
};

/**
 * @brief Output file naming for a backup run
 *
 * Placeholders: {timestamp}, {database}, {server}. date_format is a
 * std::strftime format.
 */
struct FileNamingStrategy {
    std::string pattern = "{timestamp}_{database}_{server}.tar.gz";
    std::string date_format = "%Y%m%d_%H%M%S";
    bool include_server_name = true;
    bool include_database_name = true;
};

struct EncryptionSettings {
    bool enabled = false;
    std::string password;
};

struct BackupConfiguration {
    std::int64_t id = 0;
    std::string name;
    MySqlConnectionInfo mysql;
    transfer::Endpoint target;
    std::string target_directory;
    std::optional<FileNamingStrategy> naming;
    EncryptionSettings encryption;
    std::optional<transfer::ChunkingStrategy> chunking;
    std::uint32_t max_retries = 3;
    std::chrono::seconds transfer_timeout{300};
    std::chrono::seconds mysql_verify_timeout{30};
    bool active = true;
};

/**
 * @brief One record per backup attempt
 *
 * Written only by the orchestrator that owns the run; immutable once the
 * status is terminal.
 */
struct BackupLog {
    std::int64_t id = 0;
    std::int64_t configuration_id = 0;
    std::string operation_id;
    BackupStatus status = BackupStatus::Queued;
    std::string current_operation;
    double percent_complete = 0.0;
    double transfer_rate = 0.0;
    std::chrono::milliseconds eta{0};
    std::chrono::system_clock::time_point start_time{};
    std::optional<std::chrono::system_clock::time_point> end_time;
    std::string file_path;           ///< Remote path once verified
    std::uint64_t file_size = 0;
    std::string error_message;
    std::string resume_token;        ///< Present while the transfer can be continued
    std::string local_artifact;      ///< Local file kept for resume
    transfer::TransferConfig transfer_config;
};

struct BackupProgress {
    std::string operation_id;
    BackupStatus status = BackupStatus::Queued;
    double overall_progress = 0.0;   ///< [0, 1], never decreases within a run
    std::string current_operation;
    std::uint64_t bytes_transferred = 0;
    std::uint64_t total_bytes = 0;
    std::chrono::milliseconds elapsed{0};
    double transfer_rate = 0.0;
    std::chrono::milliseconds eta{0};
};

using ProgressObserver = std::function<void(const BackupProgress&)>;

struct BackupResult {
    std::string operation_id;
    bool success = false;
    BackupStatus final_status = BackupStatus::Queued;
    std::optional<ErrorCode> error_code;
    std::string error_message;
    std::string backup_file_path;
    std::uint64_t file_size = 0;
    std::string checksum_sha256;
    std::string resume_token;
    std::string local_artifact;  ///< Kept upload source when resume_token is set
    std::int64_t log_id = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point completed_at{};
    std::vector<std::string> warnings;
};

struct ValidationReport {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    [[nodiscard]] bool is_valid() const noexcept { return errors.empty(); }
};

} // namespace mbk::backup
