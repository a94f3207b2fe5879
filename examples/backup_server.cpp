/**
 * @file backup_server.cpp
 * @brief Backup receiver: accepts chunked uploads and stores finished backups
 *
 * USAGE:
 *   mbk_server --config server.json [--port N] [--verbose]
 *
 * Exit codes: 0 clean shutdown, 1 runtime failure, 2 bad usage or config.
 */

#include "mbk/config/config.hpp"
#include "mbk/events/components.hpp"
#include "mbk/events/event_bus.hpp"
#include "mbk/network/file_receiver.hpp"
#include "mbk/services/auth.hpp"
#include "mbk/services/checksum.hpp"
#include "mbk/services/repositories.hpp"
#include "mbk/transfer/chunk_manager.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

volatile std::sig_atomic_t g_stop_signal = 0;

void signal_handler(int signal) {
    g_stop_signal = signal;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " --config <server.json> [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <path>  Server configuration file (required)\n";
    std::cout << "  --port <n>       Override the listening port\n";
    std::cout << "  --verbose        Debug logging\n";
    std::cout << "  --help           Show this help\n";
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::string config_path;
    std::optional<std::uint16_t> port_override;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            try {
                const auto value = std::stoul(argv[++i]);
                if (value > 65535) {
                    throw std::out_of_range("port");
                }
                port_override = static_cast<std::uint16_t>(value);
            } catch (const std::exception&) {
                spdlog::error("Invalid port: {}", argv[i]);
                return 2;
            }
        } else if (arg == "--verbose") {
            verbose = true;
        } else {
            spdlog::error("Unknown or incomplete option: {}", arg);
            print_usage(argv[0]);
            return 2;
        }
    }

    if (config_path.empty()) {
        spdlog::error("--config is required");
        print_usage(argv[0]);
        return 2;
    }

    auto loaded = mbk::config::load_server_config(config_path);
    if (loaded.is_error()) {
        spdlog::error("{}", mbk::describe(loaded.error()));
        return 2;
    }
    auto config = std::move(loaded.value());
    if (port_override) {
        config.port = *port_override;
    }
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::from_str(config.log_level));

    std::error_code ec;
    std::filesystem::create_directories(config.storage_root, ec);
    if (ec) {
        spdlog::error("Cannot create storage root {}: {}", config.storage_root.string(), ec.message());
        return 1;
    }

    mbk::events::EventBus bus;
    mbk::events::LoggerComponent logger(bus);
    mbk::events::MetricsComponent metrics(bus);

    mbk::services::OpenSslChecksumService checksums;
    mbk::services::FileResumeTokenStore tokens(config.token_directory);

    mbk::transfer::ChunkManagerOptions chunk_options;
    chunk_options.staging_root = config.staging_root;
    chunk_options.storage_root = config.storage_root;
    chunk_options.max_token_age = config.max_token_age;
    mbk::transfer::ChunkManager chunks(chunk_options, checksums, tokens);

    if (const auto purged = chunks.purge_expired(); purged > 0) {
        spdlog::info("Purged {} expired resume token(s)", purged);
    }

    mbk::services::StaticCredentialAuthenticator authenticator(config.clients);
    if (authenticator.client_count() == 0) {
        spdlog::warn("No clients configured; every upload will be refused");
    }

    mbk::network::FileReceiverOptions receiver_options;
    receiver_options.bind_address = config.bind_address;
    receiver_options.io_threads = config.io_threads;
    receiver_options.min_free_bytes = config.min_free_bytes;
    receiver_options.stop_grace = config.stop_grace;
    mbk::network::FileReceiver receiver(receiver_options, chunks, authenticator, &bus);

    if (auto started = receiver.start_listening(config.port); started.is_error()) {
        spdlog::error("{}", mbk::describe(started.error()));
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    spdlog::info("Storage root: {}", config.storage_root.string());
    spdlog::info("Press Ctrl+C to stop");

    auto next_purge = std::chrono::steady_clock::now() + std::chrono::hours(1);
    while (g_stop_signal == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (std::chrono::steady_clock::now() >= next_purge) {
            if (const auto purged = chunks.purge_expired(); purged > 0) {
                spdlog::info("Purged {} expired resume token(s)", purged);
            }
            next_purge = std::chrono::steady_clock::now() + std::chrono::hours(1);
        }
    }

    spdlog::info("Received signal {}, shutting down", static_cast<int>(g_stop_signal));
    receiver.stop_listening();
    metrics.print_stats();
    spdlog::info("Server shut down cleanly");
    return 0;
}
