#include "mbk/transfer/file_transfer_client.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <deque>
#include <exception>
#include <fstream>
#include <memory>
#include <set>
#include <thread>
#include <utility>
#include <vector>

namespace mbk::transfer {

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;

namespace {

bool breaks_connection(ErrorCode code) {
    return code == ErrorCode::TransientNetwork || code == ErrorCode::Timeout || code == ErrorCode::Protocol;
}

/**
 * @brief Channel opened on first use and dropped after a transport failure
 *
 * The next call after a drop reconnects, which is what a retry needs.
 */
class ChannelHandle {
public:
    ChannelHandle(const ChannelFactory& factory, const TransferConfig& config)
        : factory_(factory), config_(config) {}

    template<typename T, typename Fn>
    Outcome<T> call(Fn&& fn) {
        if (!channel_) {
            auto opened = factory_(config_);
            if (opened.is_error()) {
                return Err<T>(opened.error());
            }
            channel_ = std::move(opened.value());
        }
        Outcome<T> result = fn(*channel_);
        if (result.is_error() && breaks_connection(result.error().code)) {
            channel_.reset();
        }
        return result;
    }

private:
    const ChannelFactory& factory_;
    const TransferConfig& config_;
    std::unique_ptr<TransferChannel> channel_;
};

/**
 * @brief Byte counters plus a rolling-window rate for ETA
 */
class ProgressTracker {
public:
    static constexpr std::size_t kWindow = 10;

    ProgressTracker(std::uint64_t total_bytes, std::uint32_t total_chunks,
                    std::uint64_t present_bytes, std::uint32_t present_chunks,
                    const TransferProgressCallback& callback)
        : callback_(callback) {
        progress_.total_bytes = total_bytes;
        progress_.total_chunks = total_chunks;
        progress_.bytes_transferred = present_bytes;
        progress_.chunks_completed = present_chunks;
        samples_.emplace_back(Clock::now(), present_bytes);
    }

    void chunk_done(std::uint64_t bytes, Clock::duration took) {
        std::lock_guard lock(mutex_);
        progress_.bytes_transferred += bytes;
        progress_.chunks_completed += 1;
        sent_ += bytes;

        const double seconds = std::chrono::duration<double>(took).count();
        progress_.instantaneous_rate = seconds > 0.0 ? static_cast<double>(bytes) / seconds : 0.0;

        const auto now = Clock::now();
        samples_.emplace_back(now, progress_.bytes_transferred);
        while (samples_.size() > kWindow + 1) {
            samples_.pop_front();
        }
        const double span = std::chrono::duration<double>(now - samples_.front().first).count();
        progress_.average_rate = span > 0.0
            ? static_cast<double>(progress_.bytes_transferred - samples_.front().second) / span
            : progress_.instantaneous_rate;

        const auto remaining = progress_.total_bytes - std::min(progress_.total_bytes, progress_.bytes_transferred);
        progress_.eta = progress_.average_rate > 0.0
            ? std::chrono::milliseconds(static_cast<std::int64_t>(static_cast<double>(remaining) / progress_.average_rate * 1000.0))
            : std::chrono::milliseconds(0);

        if (!callback_) {
            return;
        }
        try {
            callback_(progress_);
        } catch (const std::exception& e) {
            spdlog::warn("Progress callback threw: {}", e.what());
        }
    }

    [[nodiscard]] std::uint64_t bytes_sent() const {
        std::lock_guard lock(mutex_);
        return sent_;
    }

private:
    const TransferProgressCallback& callback_;
    mutable std::mutex mutex_;
    TransferProgress progress_;
    std::uint64_t sent_ = 0;
    std::deque<std::pair<Clock::time_point, std::uint64_t>> samples_;
};

/// Work list shared by the sender threads; the first failure stops everyone.
struct SendQueue {
    std::mutex mutex;
    std::deque<std::uint32_t> pending;
    std::optional<Error> failure;

    std::optional<std::uint32_t> next() {
        std::lock_guard lock(mutex);
        if (failure || pending.empty()) {
            return std::nullopt;
        }
        const auto index = pending.front();
        pending.pop_front();
        return index;
    }

    void fail(Error error) {
        std::lock_guard lock(mutex);
        if (!failure) {
            failure = std::move(error);
        }
    }
};

} // anonymous namespace

FileTransferClient::FileTransferClient(ChannelFactory channels,
                                       const services::ChecksumService& checksums,
                                       const network::NetworkRetryService& retry)
    : channels_(std::move(channels))
    , checksums_(checksums)
    , retry_(retry) {
}

Outcome<void> FileTransferClient::validate(const fs::path& file, const TransferConfig& config) {
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        return Fail<void>(ErrorCode::Validation, "Not a regular file: " + file.string());
    }
    if (!std::ifstream(file, std::ios::binary)) {
        return Fail<void>(ErrorCode::Validation, "File is not readable: " + file.string());
    }

    const auto& endpoint = config.endpoint;
    if (endpoint.host.empty()) {
        return Fail<void>(ErrorCode::Validation, "Target host is empty");
    }
    if (endpoint.port == 0 || endpoint.port > 65535) {
        return Fail<void>(ErrorCode::Validation, "Target port out of range: " + std::to_string(endpoint.port));
    }
    if (config.timeout.count() <= 0) {
        return Fail<void>(ErrorCode::Validation, "Transfer timeout must be positive");
    }

    boost::asio::io_context io_context;
    boost::asio::ip::tcp::resolver resolver(io_context);
    boost::system::error_code resolve_ec;
    resolver.resolve(endpoint.host, std::to_string(endpoint.port), resolve_ec);
    if (resolve_ec) {
        return Fail<void>(ErrorCode::Validation, "Cannot resolve target host '" + endpoint.host + "': " + resolve_ec.message());
    }
    return Ok();
}

TransferResult FileTransferClient::transfer_file(const fs::path& file,
                                                 const TransferConfig& config,
                                                 const core::CancellationToken& cancel,
                                                 const TransferProgressCallback& progress) {
    return run(file, config, {}, cancel, progress);
}

TransferResult FileTransferClient::resume_transfer(const std::string& resume_token,
                                                   const std::optional<fs::path>& file,
                                                   const std::optional<TransferConfig>& config,
                                                   const core::CancellationToken& cancel,
                                                   const TransferProgressCallback& progress) {
    std::optional<PendingResume> pending;
    {
        std::lock_guard lock(pending_mutex_);
        if (auto it = pending_.find(resume_token); it != pending_.end()) {
            pending = it->second;
        }
    }

    TransferResult result;
    if (resume_token.empty()) {
        result.error_code = ErrorCode::Validation;
        result.error_message = "Resume token is empty";
        return result;
    }
    if (!file && !pending) {
        result.error_code = ErrorCode::Validation;
        result.error_message = "No file recorded for resume token " + resume_token;
        return result;
    }
    if (!config && !pending) {
        result.error_code = ErrorCode::Validation;
        result.error_message = "No transfer configuration recorded for resume token " + resume_token;
        return result;
    }

    return run(file ? *file : pending->file, config ? *config : pending->config, resume_token, cancel, progress);
}

bool FileTransferClient::has_pending_resume(const std::string& resume_token) const {
    std::lock_guard lock(pending_mutex_);
    return pending_.count(resume_token) > 0;
}

void FileTransferClient::remember(const std::string& resume_token, const fs::path& file, const TransferConfig& config) {
    std::lock_guard lock(pending_mutex_);
    pending_.insert_or_assign(resume_token, PendingResume{file, config});
}

void FileTransferClient::forget(const std::string& resume_token) {
    std::lock_guard lock(pending_mutex_);
    pending_.erase(resume_token);
}

TransferResult FileTransferClient::run(const fs::path& file,
                                       const TransferConfig& config,
                                       const std::string& resume_token,
                                       const core::CancellationToken& cancel,
                                       const TransferProgressCallback& progress) {
    const auto started = Clock::now();
    TransferResult result;
    result.resume_token = resume_token;

    auto finish = [&]() {
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
        return result;
    };
    auto fail = [&](const Error& error) {
        result.success = false;
        result.error_code = error.code;
        result.error_message = error.message;
        return finish();
    };

    if (auto valid = validate(file, config); valid.is_error()) {
        return fail(valid.error());
    }

    auto digest = checksums_.digest_file(file);
    if (digest.is_error()) {
        return fail(digest.error());
    }

    const auto strategy = config.chunking ? config.chunking->clamped()
                                          : ChunkingStrategy::for_file_size(digest.value().size);
    FileMetadata metadata;
    metadata.file_name = config.target_file_name.empty() ? file.filename().string() : config.target_file_name;
    metadata.file_size = digest.value().size;
    metadata.md5 = digest.value().md5;
    metadata.sha256 = digest.value().sha256;
    metadata.chunk_size = strategy.chunk_size;
    metadata.chunk_count = strategy.chunk_count(metadata.file_size);

    BeginRequest request;
    request.metadata = metadata;
    request.target_directory = config.target_directory;
    request.file_name = metadata.file_name;
    request.resume_token = resume_token;

    ChannelHandle control(channels_, config);
    auto begun = retry_.execute_with_retry<BeginReply>([&]() {
        return control.call<BeginReply>([&](TransferChannel& channel) { return channel.begin(request); });
    }, "begin transfer", metadata.file_name, cancel);
    if (begun.is_error()) {
        return fail(begun.error());
    }

    const auto transfer_id = begun.value().transfer_id;
    const auto token = begun.value().resume_token.empty() ? resume_token : begun.value().resume_token;
    if (!token.empty()) {
        remember(token, file, config);
    }
    result.resume_token = token;

    const std::set<std::uint32_t> present(begun.value().completed_chunks.begin(), begun.value().completed_chunks.end());
    SendQueue queue;
    std::uint64_t present_bytes = 0;
    for (std::uint32_t index = 0; index < metadata.chunk_count; ++index) {
        if (present.count(index)) {
            present_bytes += metadata.expected_chunk_size(index);
        } else {
            queue.pending.push_back(index);
        }
    }
    const auto present_chunks = static_cast<std::uint32_t>(metadata.chunk_count - queue.pending.size());

    spdlog::info("Transfer {} ({}): {} bytes in {} chunk(s) of {} bytes, {} already on receiver",
                 transfer_id, metadata.file_name, metadata.file_size, metadata.chunk_count,
                 metadata.chunk_size, present_chunks);

    ProgressTracker tracker(metadata.file_size, metadata.chunk_count, present_bytes, present_chunks, progress);

    auto deliver = [&](ChannelHandle& channel, std::ifstream& in, std::uint32_t index) -> Outcome<void> {
        for (std::uint32_t resend = 0;; ++resend) {
            ChunkData chunk;
            chunk.index = index;
            chunk.data.resize(metadata.expected_chunk_size(index));
            in.clear();
            in.seekg(static_cast<std::streamoff>(static_cast<std::uint64_t>(index) * metadata.chunk_size));
            in.read(reinterpret_cast<char*>(chunk.data.data()), static_cast<std::streamsize>(chunk.data.size()));
            if (static_cast<std::uint64_t>(in.gcount()) != chunk.data.size()) {
                return Fail<void>(ErrorCode::Io, "Short read of chunk " + std::to_string(index) + " from " + file.string());
            }
            chunk.checksum = checksums_.md5(chunk.data);

            const auto sent_at = Clock::now();
            auto status = retry_.execute_with_retry<ChunkStatus>([&]() {
                return channel.call<ChunkStatus>([&](TransferChannel& ch) { return ch.send_chunk(transfer_id, chunk); });
            }, "send chunk " + std::to_string(index), transfer_id, cancel);
            if (status.is_error()) {
                return Err<void>(status.error());
            }

            switch (status.value()) {
                case ChunkStatus::Accepted:
                case ChunkStatus::Duplicate:
                    tracker.chunk_done(chunk.data.size(), Clock::now() - sent_at);
                    return Ok();
                case ChunkStatus::ChecksumMismatch:
                    if (resend >= config.max_retries) {
                        return Fail<void>(ErrorCode::ChecksumMismatch,
                                          "Chunk " + std::to_string(index) + " rejected after " +
                                          std::to_string(resend + 1) + " send(s)");
                    }
                    spdlog::warn("Transfer {}: chunk {} failed checksum on receipt, re-sending", transfer_id, index);
                    continue;
                case ChunkStatus::UnknownTransfer:
                    return Fail<void>(ErrorCode::UnknownTransfer, "Receiver no longer knows transfer " + transfer_id);
            }
            return Fail<void>(ErrorCode::Protocol, "Unexpected chunk status");
        }
    };

    const auto workers = std::min<std::size_t>(strategy.max_concurrent_chunks, queue.pending.size());
    std::vector<std::thread> senders;
    senders.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
        senders.emplace_back([&]() {
            ChannelHandle channel(channels_, config);
            std::ifstream in(file, std::ios::binary);
            if (!in) {
                queue.fail(Error(ErrorCode::Io, "Cannot open " + file.string()));
                return;
            }
            while (!cancel.is_cancelled()) {
                const auto index = queue.next();
                if (!index) {
                    break;
                }
                if (auto delivered = deliver(channel, in, *index); delivered.is_error()) {
                    queue.fail(delivered.error());
                    break;
                }
            }
        });
    }
    for (auto& sender : senders) {
        sender.join();
    }
    result.bytes_transferred = tracker.bytes_sent();

    auto abort_with = [&](const Error& error) {
        auto checkpoint = control.call<std::string>([&](TransferChannel& channel) { return channel.checkpoint(transfer_id); });
        if (checkpoint.is_ok() && !checkpoint.value().empty()) {
            result.resume_token = checkpoint.value();
            remember(result.resume_token, file, config);
        } else if (checkpoint.is_error()) {
            spdlog::warn("Transfer {}: checkpoint failed ({}), keeping token {}",
                         transfer_id, checkpoint.error().message, result.resume_token);
        }
        spdlog::error("Transfer {} stopped: {}{}", transfer_id, error.message,
                      result.resume_token.empty() ? "" : " (resume with " + result.resume_token + ")");
        return fail(error);
    };

    if (queue.failure) {
        return abort_with(*queue.failure);
    }
    if (cancel.is_cancelled()) {
        return abort_with(Error(ErrorCode::Cancelled, "Transfer cancelled"));
    }

    auto finalized = retry_.execute_with_retry<FinalizeReply>([&]() {
        return control.call<FinalizeReply>([&](TransferChannel& channel) { return channel.finalize(transfer_id); });
    }, "finalize transfer", transfer_id, cancel);
    if (finalized.is_error()) {
        return abort_with(finalized.error());
    }

    const auto& remote = finalized.value();
    if (remote.file_size != metadata.file_size || (!remote.sha256.empty() && remote.sha256 != metadata.sha256)) {
        forget(token);
        result.resume_token.clear();
        return fail(Error(ErrorCode::ChecksumMismatch,
                          "Receiver reports " + std::to_string(remote.file_size) + " bytes / " + remote.sha256 +
                          ", expected " + std::to_string(metadata.file_size) + " bytes / " + metadata.sha256));
    }

    forget(token);
    result.success = true;
    result.resume_token.clear();
    result.remote_path = remote.file_path;
    result.remote_size = remote.file_size;
    result.remote_sha256 = remote.sha256;
    spdlog::info("Transfer {} complete: {} ({} bytes sent)", transfer_id, remote.file_path, result.bytes_transferred);
    return finish();
}

} // namespace mbk::transfer
