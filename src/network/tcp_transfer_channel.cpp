#include "mbk/network/tcp_transfer_channel.hpp"
#include "mbk/services/auth.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace mbk::network {

namespace {
constexpr std::chrono::milliseconds kMaxConnectTimeout{30000};
}

Outcome<std::unique_ptr<transfer::TransferChannel>> TcpTransferChannel::open(const transfer::TransferConfig& config) {
    using ChannelPtr = std::unique_ptr<transfer::TransferChannel>;

    const auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config.timeout);
    std::unique_ptr<TcpTransferChannel> channel(new TcpTransferChannel(timeout));

    const auto& endpoint = config.endpoint;
    if (auto connected = channel->client_.connect(endpoint.host, endpoint.port, std::min(timeout, kMaxConnectTimeout));
        connected.is_error()) {
        return Err<ChannelPtr>(connected.error());
    }

    const auto token = services::encode_auth_token(endpoint.client_id, endpoint.client_secret);
    auto reply = channel->client_.request(make_hello(endpoint.client_id, token), timeout);
    if (reply.is_error()) {
        return Err<ChannelPtr>(reply.error());
    }
    if (auto accepted = expect_ok(reply.value()); accepted.is_error()) {
        spdlog::warn("Receiver {}:{} rejected client {}: {}",
                     endpoint.host, endpoint.port, endpoint.client_id, accepted.error().message);
        return Err<ChannelPtr>(accepted.error());
    }

    return Ok(ChannelPtr(std::move(channel)));
}

Outcome<transfer::BeginReply> TcpTransferChannel::begin(const transfer::BeginRequest& request) {
    auto reply = client_.request(make_begin(request), timeout_);
    if (reply.is_error()) {
        return Err<transfer::BeginReply>(reply.error());
    }
    return parse_begin_reply(reply.value());
}

Outcome<transfer::ChunkStatus> TcpTransferChannel::send_chunk(const std::string& transfer_id,
                                                              const transfer::ChunkData& chunk) {
    auto reply = client_.request(make_chunk(transfer_id, chunk), timeout_);
    if (reply.is_error()) {
        return Err<transfer::ChunkStatus>(reply.error());
    }
    return parse_chunk_reply(reply.value());
}

Outcome<std::string> TcpTransferChannel::checkpoint(const std::string& transfer_id) {
    auto reply = client_.request(make_checkpoint(transfer_id), timeout_);
    if (reply.is_error()) {
        return Err<std::string>(reply.error());
    }
    auto body = expect_ok(reply.value());
    if (body.is_error()) {
        return Err<std::string>(body.error());
    }
    return Ok(body.value().value("resume_token", std::string{}));
}

Outcome<transfer::FinalizeReply> TcpTransferChannel::finalize(const std::string& transfer_id) {
    auto reply = client_.request(make_finalize(transfer_id), timeout_);
    if (reply.is_error()) {
        return Err<transfer::FinalizeReply>(reply.error());
    }
    return parse_finalize_reply(reply.value());
}

transfer::ChannelFactory make_tcp_channel_factory() {
    return [](const transfer::TransferConfig& config) {
        return TcpTransferChannel::open(config);
    };
}

} // namespace mbk::network
