#pragma once

#include "mbk/core/cancellation.hpp"
#include "mbk/core/error.hpp"
#include "mbk/network/retry_service.hpp"
#include "mbk/services/checksum.hpp"
#include "mbk/transfer/channel.hpp"
#include "mbk/transfer/types.hpp"

#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace mbk::transfer {

using TransferProgressCallback = std::function<void(const TransferProgress&)>;

/**
 * @brief Uploads a local file to a backup receiver
 */
class FileTransferService {
public:
    virtual ~FileTransferService() = default;

    virtual TransferResult transfer_file(const std::filesystem::path& file,
                                         const TransferConfig& config,
                                         const core::CancellationToken& cancel = {},
                                         const TransferProgressCallback& progress = {}) = 0;

    virtual TransferResult resume_transfer(const std::string& resume_token,
                                           const std::optional<std::filesystem::path>& file = std::nullopt,
                                           const std::optional<TransferConfig>& config = std::nullopt,
                                           const core::CancellationToken& cancel = {},
                                           const TransferProgressCallback& progress = {}) = 0;
};

/**
 * @brief Client side of the chunked, resumable upload
 *
 * The file is split per ChunkingStrategy and up to max_concurrent_chunks
 * sender threads each hold their own channel. Every send goes through the
 * retry service; a ChecksumMismatch reply re-reads and re-sends that chunk,
 * at most TransferConfig::max_retries times.
 *
 * When a chunk cannot be delivered, or @p cancel fires, no new sends start,
 * in-flight sends finish, and the result carries the resume token the
 * receiver issued for this transfer. The file and config of a failed
 * transfer are remembered under that token, so resume_transfer(token) needs
 * nothing else within the same process.
 *
 * THREAD SAFETY: independent transfers may run concurrently on one client.
 * The progress callback is called from sender threads, one call at a time.
 */
class FileTransferClient : public FileTransferService {
public:
    FileTransferClient(ChannelFactory channels,
                       const services::ChecksumService& checksums,
                       const network::NetworkRetryService& retry);

    TransferResult transfer_file(const std::filesystem::path& file,
                                 const TransferConfig& config,
                                 const core::CancellationToken& cancel = {},
                                 const TransferProgressCallback& progress = {}) override;

    /// Sends only the chunks the receiver does not already hold for @p resume_token.
    TransferResult resume_transfer(const std::string& resume_token,
                                   const std::optional<std::filesystem::path>& file = std::nullopt,
                                   const std::optional<TransferConfig>& config = std::nullopt,
                                   const core::CancellationToken& cancel = {},
                                   const TransferProgressCallback& progress = {}) override;

    /// File must be a readable regular file; host must resolve; port in [1, 65535].
    [[nodiscard]] static Outcome<void> validate(const std::filesystem::path& file, const TransferConfig& config);

    [[nodiscard]] bool has_pending_resume(const std::string& resume_token) const;

private:
    struct PendingResume {
        std::filesystem::path file;
        TransferConfig config;
    };

    TransferResult run(const std::filesystem::path& file,
                       const TransferConfig& config,
                       const std::string& resume_token,
                       const core::CancellationToken& cancel,
                       const TransferProgressCallback& progress);

    void remember(const std::string& resume_token, const std::filesystem::path& file, const TransferConfig& config);
    void forget(const std::string& resume_token);

    ChannelFactory channels_;
    const services::ChecksumService& checksums_;
    const network::NetworkRetryService& retry_;

    mutable std::mutex pending_mutex_;
    std::unordered_map<std::string, PendingResume> pending_;
};

} // namespace mbk::transfer
