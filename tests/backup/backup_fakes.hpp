#pragma once

#include "mbk/backup/types.hpp"
#include "mbk/services/checksum.hpp"
#include "mbk/services/compression.hpp"
#include "mbk/services/mysql_control.hpp"
#include "mbk/transfer/file_transfer_client.hpp"

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mbk::fakes {

/// Records lifecycle calls; each step can be made to fail or to block.
class FakeMySqlController : public services::MySqlController {
public:
    Outcome<void> stop_instance(const std::string& service_name) override {
        record("stop " + service_name);
        {
            std::unique_lock lock(mutex_);
            ++stops_entered_;
            changed_.notify_all();
            changed_.wait(lock, [this]() { return !blocked_; });
        }
        return result(stop_error);
    }

    Outcome<void> start_instance(const std::string& service_name) override {
        record("start " + service_name);
        return result(start_error);
    }

    Outcome<void> verify_instance_availability(const backup::MySqlConnectionInfo&,
                                               std::chrono::seconds,
                                               const core::CancellationToken&) override {
        record("verify");
        return result(verify_error);
    }

    std::vector<std::string> calls() const {
        std::lock_guard lock(mutex_);
        return calls_;
    }

    void block() {
        std::lock_guard lock(mutex_);
        blocked_ = true;
    }

    void release() {
        std::lock_guard lock(mutex_);
        blocked_ = false;
        changed_.notify_all();
    }

    /// Waits until @p count stop calls have begun.
    bool wait_for_stops(int count, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock lock(mutex_);
        return changed_.wait_for(lock, timeout, [&]() { return stops_entered_ >= count; });
    }

    std::optional<Error> stop_error;
    std::optional<Error> start_error;
    std::optional<Error> verify_error;

private:
    void record(std::string call) {
        std::lock_guard lock(mutex_);
        calls_.push_back(std::move(call));
    }

    static Outcome<void> result(const std::optional<Error>& error) {
        if (error) {
            return Err<void>(*error);
        }
        return Ok();
    }

    mutable std::mutex mutex_;
    std::condition_variable changed_;
    std::vector<std::string> calls_;
    bool blocked_ = false;
    int stops_entered_ = 0;
};

/// Writes a small fixed archive instead of walking the data directory.
class FakeCompressionService : public services::CompressionService {
public:
    Outcome<std::filesystem::path> compress_directory(const std::filesystem::path&,
                                                      const std::filesystem::path& target,
                                                      const services::CompressionProgressCallback& progress,
                                                      const core::CancellationToken& cancel) override {
        ++compress_calls;
        if (cancel.is_cancelled()) {
            return Fail<std::filesystem::path>(ErrorCode::Cancelled, "compression cancelled");
        }
        if (error) {
            return Err<std::filesystem::path>(*error);
        }
        if (throw_message) {
            throw std::runtime_error(*throw_message);
        }
        std::ofstream(target, std::ios::binary) << std::string(4096, 'x');
        if (progress) {
            progress(services::CompressionProgress{0.5, "ibdata1", 2048, 4096});
            progress(services::CompressionProgress{1.0, "", 4096, 4096});
        }
        return Ok(target);
    }

    Outcome<void> cleanup(const std::filesystem::path& file) override {
        std::error_code ec;
        std::filesystem::remove(file, ec);
        return Ok();
    }

    std::atomic<int> compress_calls{0};
    std::optional<Error> error;
    std::optional<std::string> throw_message;
};

/**
 * Answers transfers from the local file: success reports the file's real
 * size and SHA-256, failure reports the configured error and token.
 */
class FakeTransferService : public transfer::FileTransferService {
public:
    explicit FakeTransferService(const services::ChecksumService& checksums) : checksums_(checksums) {}

    transfer::TransferResult transfer_file(const std::filesystem::path& file,
                                           const transfer::TransferConfig& config,
                                           const core::CancellationToken& cancel,
                                           const transfer::TransferProgressCallback& progress) override {
        {
            std::lock_guard lock(mutex_);
            files.push_back(file);
            configs.push_back(config);
        }
        return answer(file, cancel, progress);
    }

    transfer::TransferResult resume_transfer(const std::string& resume_token,
                                             const std::optional<std::filesystem::path>& file,
                                             const std::optional<transfer::TransferConfig>&,
                                             const core::CancellationToken& cancel,
                                             const transfer::TransferProgressCallback& progress) override {
        {
            std::lock_guard lock(mutex_);
            resumed_tokens.push_back(resume_token);
            if (file) {
                files.push_back(*file);
            }
        }
        return answer(file.value_or(std::filesystem::path{}), cancel, progress);
    }

    std::mutex mutex_;
    std::vector<std::filesystem::path> files;
    std::vector<transfer::TransferConfig> configs;
    std::vector<std::string> resumed_tokens;

    std::optional<ErrorCode> fail_with;
    std::string failure_token;
    std::function<void()> during_transfer;
    std::int64_t size_skew = 0;

private:
    transfer::TransferResult answer(const std::filesystem::path& file,
                                    const core::CancellationToken& cancel,
                                    const transfer::TransferProgressCallback& progress) {
        transfer::TransferResult result;
        auto digest = checksums_.digest_file(file);
        const auto size = digest.is_ok() ? digest.value().size : 0;

        if (progress) {
            transfer::TransferProgress half;
            half.total_bytes = size;
            half.bytes_transferred = size / 2;
            half.total_chunks = 2;
            half.chunks_completed = 1;
            progress(half);
        }
        if (during_transfer) {
            during_transfer();
        }

        if (cancel.is_cancelled()) {
            result.error_code = ErrorCode::Cancelled;
            result.error_message = "Transfer cancelled";
            result.resume_token = failure_token;
            return result;
        }
        if (fail_with) {
            result.error_code = *fail_with;
            result.error_message = "receiver unreachable";
            result.resume_token = failure_token;
            return result;
        }

        if (progress) {
            transfer::TransferProgress done;
            done.total_bytes = size;
            done.bytes_transferred = size;
            done.total_chunks = 2;
            done.chunks_completed = 2;
            progress(done);
        }
        result.success = true;
        result.bytes_transferred = size;
        result.remote_path = "/var/lib/mbk/backups/db01/" + file.filename().string();
        result.remote_size = static_cast<std::uint64_t>(static_cast<std::int64_t>(size) + size_skew);
        result.remote_sha256 = digest.is_ok() ? digest.value().sha256 : "";
        return result;
    }

    const services::ChecksumService& checksums_;
};

} // namespace mbk::fakes
