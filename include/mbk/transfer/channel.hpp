#pragma once

#include "mbk/core/error.hpp"
#include "mbk/transfer/types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace mbk::transfer {

/**
 * @brief Client -> server handshake that opens or resumes a transfer
 */
struct BeginRequest {
    FileMetadata metadata;
    std::string target_directory;
    std::string file_name;
    std::string resume_token;       ///< Empty for a fresh transfer
};

struct BeginReply {
    std::string transfer_id;
    std::string resume_token;       ///< Empty until the first chunk lands
    std::vector<std::uint32_t> completed_chunks;
};

struct FinalizeReply {
    std::string file_path;
    std::uint64_t file_size = 0;
    std::string sha256;
};

/**
 * @brief One authenticated conversation with a receiver
 *
 * Implementations are not thread-safe; each sender thread owns its own
 * channel. Connection-level failures are reported as TransientNetwork or
 * Timeout so the caller's retry policy applies.
 */
class TransferChannel {
public:
    virtual ~TransferChannel() = default;

    virtual Outcome<BeginReply> begin(const BeginRequest& request) = 0;
    virtual Outcome<ChunkStatus> send_chunk(const std::string& transfer_id, const ChunkData& chunk) = 0;
    virtual Outcome<std::string> checkpoint(const std::string& transfer_id) = 0;
    virtual Outcome<FinalizeReply> finalize(const std::string& transfer_id) = 0;
};

using ChannelFactory = std::function<Outcome<std::unique_ptr<TransferChannel>>(const TransferConfig&)>;

} // namespace mbk::transfer
