#pragma once

#include "mbk/backup/types.hpp"
#include "mbk/core/error.hpp"
#include "mbk/network/retry_service.hpp"
#include "mbk/services/auth.hpp"
#include "mbk/services/mysql_control.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace mbk::config {

/**
 * @brief Client-side settings: one backup configuration plus how to run it
 *
 * EXAMPLE (client.json):
 * {
 *   "backup": {
 *     "id": 1, "name": "nightly",
 *     "mysql": { "username": "backup", "service_name": "mysql", "data_directory": "/var/lib/mysql" },
 *     "target": { "host": "backup.example.org", "port": 9400, "client_id": "db01", "client_secret": "..." },
 *     "target_directory": "db01"
 *   },
 *   "work_directory": "/var/tmp/mbk"
 * }
 */
struct ClientConfig {
    backup::BackupConfiguration backup;
    network::RetryPolicy retry;
    services::ServiceCommandOptions mysql_commands;
    std::filesystem::path work_directory = "/var/tmp/mbk";
    std::string server_name;                        ///< Defaults to the local host name
    std::size_t max_concurrent_backups = 2;
    std::size_t max_queued_backups = 16;
    std::string log_level = "info";
};

struct ServerConfig {
    std::uint16_t port = 9400;
    std::string bind_address = "0.0.0.0";
    std::size_t io_threads = 4;
    std::filesystem::path storage_root = "/var/lib/mbk/backups";
    std::filesystem::path staging_root;             ///< Defaults to <storage_root>/.staging
    std::filesystem::path token_directory;          ///< Defaults to <storage_root>/.tokens
    std::chrono::hours max_token_age{72};
    std::uint64_t min_free_bytes = 0;
    std::chrono::seconds stop_grace{30};
    std::vector<services::ClientCredentials> clients;
    std::string log_level = "info";
};

/// Missing keys take the defaults above; malformed JSON or a wrongly typed value is Validation.
[[nodiscard]] Outcome<ClientConfig> parse_client_config(const std::string& text);
[[nodiscard]] Outcome<ServerConfig> parse_server_config(const std::string& text);

/// NotFound when the file cannot be opened.
[[nodiscard]] Outcome<ClientConfig> load_client_config(const std::filesystem::path& path);
[[nodiscard]] Outcome<ServerConfig> load_server_config(const std::filesystem::path& path);

} // namespace mbk::config
