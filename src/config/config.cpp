#include "mbk/config/config.hpp"

#include <nlohmann/json.hpp>
#include <unistd.h>

#include <array>
#include <fstream>
#include <sstream>

namespace mbk::config {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

std::string local_host_name() {
    std::array<char, 256> name{};
    if (gethostname(name.data(), name.size() - 1) != 0) {
        return "localhost";
    }
    return name.data();
}

Outcome<std::string> read_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Fail<std::string>(ErrorCode::NotFound, "Cannot open config file " + path.string());
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return Ok(oss.str());
}

void read_mysql(const json& j, backup::MySqlConnectionInfo& mysql) {
    mysql.username = j.value("username", mysql.username);
    mysql.password = j.value("password", mysql.password);
    mysql.service_name = j.value("service_name", mysql.service_name);
    mysql.data_directory = j.value("data_directory", mysql.data_directory);
    mysql.host = j.value("host", mysql.host);
    mysql.port = j.value("port", mysql.port);
}

void read_endpoint(const json& j, transfer::Endpoint& endpoint) {
    endpoint.host = j.value("host", endpoint.host);
    endpoint.port = j.value("port", endpoint.port);
    endpoint.client_id = j.value("client_id", endpoint.client_id);
    endpoint.client_secret = j.value("client_secret", endpoint.client_secret);
}

void read_backup(const json& j, backup::BackupConfiguration& config) {
    config.id = j.value("id", config.id);
    config.name = j.value("name", config.name);
    config.active = j.value("active", config.active);
    config.target_directory = j.value("target_directory", config.target_directory);
    config.max_retries = j.value("max_retries", config.max_retries);
    config.transfer_timeout = std::chrono::seconds(
        j.value("transfer_timeout_seconds", static_cast<std::int64_t>(config.transfer_timeout.count())));
    config.mysql_verify_timeout = std::chrono::seconds(
        j.value("mysql_verify_timeout_seconds", static_cast<std::int64_t>(config.mysql_verify_timeout.count())));

    if (j.contains("mysql")) {
        read_mysql(j.at("mysql"), config.mysql);
    }
    if (j.contains("target")) {
        read_endpoint(j.at("target"), config.target);
    }
    if (j.contains("naming")) {
        const auto& n = j.at("naming");
        backup::FileNamingStrategy naming;
        naming.pattern = n.value("pattern", naming.pattern);
        naming.date_format = n.value("date_format", naming.date_format);
        naming.include_server_name = n.value("include_server_name", naming.include_server_name);
        naming.include_database_name = n.value("include_database_name", naming.include_database_name);
        config.naming = naming;
    }
    if (j.contains("encryption")) {
        const auto& e = j.at("encryption");
        config.encryption.enabled = e.value("enabled", config.encryption.enabled);
        config.encryption.password = e.value("password", config.encryption.password);
    }
    if (j.contains("chunking")) {
        const auto& c = j.at("chunking");
        transfer::ChunkingStrategy chunking;
        chunking.chunk_size = c.value("chunk_size", chunking.chunk_size);
        chunking.max_concurrent_chunks = c.value("max_concurrent_chunks", chunking.max_concurrent_chunks);
        config.chunking = chunking.clamped();
    }
}

void read_retry(const json& j, network::RetryPolicy& retry) {
    retry.max_attempts = j.value("max_attempts", retry.max_attempts);
    retry.base_delay = std::chrono::milliseconds(
        j.value("base_delay_ms", static_cast<std::int64_t>(retry.base_delay.count())));
    retry.max_delay = std::chrono::milliseconds(
        j.value("max_delay_ms", static_cast<std::int64_t>(retry.max_delay.count())));
    retry.enable_jitter = j.value("jitter", retry.enable_jitter);
}

} // namespace

Outcome<ClientConfig> parse_client_config(const std::string& text) {
    ClientConfig config;
    try {
        const auto j = json::parse(text);
        if (!j.is_object()) {
            return Fail<ClientConfig>(ErrorCode::Validation, "Client config must be a JSON object");
        }

        if (j.contains("backup")) {
            read_backup(j.at("backup"), config.backup);
        }
        if (j.contains("retry")) {
            read_retry(j.at("retry"), config.retry);
        }
        if (j.contains("mysql_commands")) {
            const auto& m = j.at("mysql_commands");
            config.mysql_commands.stop_command = m.value("stop", config.mysql_commands.stop_command);
            config.mysql_commands.start_command = m.value("start", config.mysql_commands.start_command);
            if (m.contains("timeout_seconds")) {
                config.mysql_commands.command_timeout = std::chrono::seconds(m.at("timeout_seconds").get<std::int64_t>());
            }
        }
        config.work_directory = j.value("work_directory", config.work_directory.string());
        config.server_name = j.value("server_name", std::string());
        config.max_concurrent_backups = j.value("max_concurrent_backups", config.max_concurrent_backups);
        config.max_queued_backups = j.value("max_queued_backups", config.max_queued_backups);
        config.log_level = j.value("log_level", config.log_level);
    } catch (const json::exception& e) {
        return Fail<ClientConfig>(ErrorCode::Validation, std::string("Invalid client config: ") + e.what());
    }

    if (config.server_name.empty()) {
        config.server_name = local_host_name();
    }
    return Ok(std::move(config));
}

Outcome<ServerConfig> parse_server_config(const std::string& text) {
    ServerConfig config;
    try {
        const auto j = json::parse(text);
        if (!j.is_object()) {
            return Fail<ServerConfig>(ErrorCode::Validation, "Server config must be a JSON object");
        }

        config.port = j.value("port", config.port);
        config.bind_address = j.value("bind_address", config.bind_address);
        config.io_threads = j.value("io_threads", config.io_threads);
        config.storage_root = j.value("storage_root", config.storage_root.string());
        config.staging_root = j.value("staging_root", std::string());
        config.token_directory = j.value("token_directory", std::string());
        config.max_token_age = std::chrono::hours(
            j.value("max_token_age_hours", static_cast<std::int64_t>(config.max_token_age.count())));
        config.min_free_bytes = j.value("min_free_bytes", config.min_free_bytes);
        config.stop_grace = std::chrono::seconds(
            j.value("stop_grace_seconds", static_cast<std::int64_t>(config.stop_grace.count())));
        config.log_level = j.value("log_level", config.log_level);

        for (const auto& c : j.value("clients", json::array())) {
            services::ClientCredentials credentials;
            credentials.client_id = c.at("id").get<std::string>();
            credentials.secret = c.at("secret").get<std::string>();
            if (c.contains("permissions")) {
                credentials.permissions = c.at("permissions").get<std::vector<std::string>>();
            }
            config.clients.push_back(std::move(credentials));
        }
    } catch (const json::exception& e) {
        return Fail<ServerConfig>(ErrorCode::Validation, std::string("Invalid server config: ") + e.what());
    }

    if (config.staging_root.empty()) {
        config.staging_root = config.storage_root / ".staging";
    }
    if (config.token_directory.empty()) {
        config.token_directory = config.storage_root / ".tokens";
    }
    return Ok(std::move(config));
}

Outcome<ClientConfig> load_client_config(const fs::path& path) {
    auto text = read_file(path);
    if (text.is_error()) {
        return Err<ClientConfig>(text.error());
    }
    return parse_client_config(text.value());
}

Outcome<ServerConfig> load_server_config(const fs::path& path) {
    auto text = read_file(path);
    if (text.is_error()) {
        return Err<ServerConfig>(text.error());
    }
    return parse_server_config(text.value());
}

} // namespace mbk::config
