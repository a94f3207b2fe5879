#pragma once

#include "mbk/network/tcp_client.hpp"
#include "mbk/transfer/channel.hpp"

#include <chrono>
#include <memory>

namespace mbk::network {

/**
 * @brief TransferChannel over one TCP connection
 *
 * open() connects and completes the hello exchange; every later call is a
 * single request/reply round trip bounded by the configured timeout.
 */
class TcpTransferChannel : public transfer::TransferChannel {
public:
    static Outcome<std::unique_ptr<transfer::TransferChannel>> open(const transfer::TransferConfig& config);

    Outcome<transfer::BeginReply> begin(const transfer::BeginRequest& request) override;
    Outcome<transfer::ChunkStatus> send_chunk(const std::string& transfer_id, const transfer::ChunkData& chunk) override;
    Outcome<std::string> checkpoint(const std::string& transfer_id) override;
    Outcome<transfer::FinalizeReply> finalize(const std::string& transfer_id) override;

private:
    explicit TcpTransferChannel(std::chrono::milliseconds timeout) : timeout_(timeout) {}

    TcpClient client_;
    std::chrono::milliseconds timeout_;
};

/// Factory suitable for FileTransferClient.
[[nodiscard]] transfer::ChannelFactory make_tcp_channel_factory();

} // namespace mbk::network
