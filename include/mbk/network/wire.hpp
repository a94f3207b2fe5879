#pragma once

#include "mbk/core/error.hpp"
#include "mbk/transfer/channel.hpp"
#include "mbk/transfer/types.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace mbk::network {

/**
 * Frame layout (all integers big-endian):
 *
 *   [u32 header_len][u32 payload_len][header: JSON text][payload: raw bytes]
 *
 * Every request frame is answered by exactly one response frame on the same
 * connection. The header always carries a "type" field.
 */
constexpr std::size_t kFramePrefixBytes = 8;
constexpr std::uint32_t kMaxHeaderBytes = 1024 * 1024;
constexpr std::uint32_t kMaxPayloadBytes = 128u * 1024 * 1024;

namespace message_type {
inline constexpr const char* kHello = "hello";
inline constexpr const char* kBegin = "begin";
inline constexpr const char* kChunk = "chunk";
inline constexpr const char* kCheckpoint = "checkpoint";
inline constexpr const char* kFinalize = "finalize";
inline constexpr const char* kReply = "reply";
} // namespace message_type

struct Frame {
    nlohmann::json header;
    std::vector<std::uint8_t> payload;

    [[nodiscard]] std::string type() const { return header.value("type", ""); }
};

struct FrameSizes {
    std::uint32_t header_bytes = 0;
    std::uint32_t payload_bytes = 0;
};

[[nodiscard]] Outcome<std::vector<std::uint8_t>> encode_frame(const Frame& frame);
[[nodiscard]] Outcome<FrameSizes> decode_prefix(const std::array<std::uint8_t, kFramePrefixBytes>& prefix);
[[nodiscard]] Outcome<Frame> decode_body(const std::vector<std::uint8_t>& header_bytes,
                                         std::vector<std::uint8_t> payload);

// Request builders
[[nodiscard]] Frame make_hello(const std::string& client_id, const std::string& auth_token);
[[nodiscard]] Frame make_begin(const transfer::BeginRequest& request);
[[nodiscard]] Frame make_chunk(const std::string& transfer_id, const transfer::ChunkData& chunk);
[[nodiscard]] Frame make_checkpoint(const std::string& transfer_id);
[[nodiscard]] Frame make_finalize(const std::string& transfer_id);

// Reply builders
[[nodiscard]] Frame make_ok_reply(nlohmann::json body = nlohmann::json::object());
[[nodiscard]] Frame make_error_reply(const Error& error);
[[nodiscard]] Frame make_chunk_reply(std::uint32_t index, transfer::ChunkStatus status);

// Request parsers (server side)
[[nodiscard]] Outcome<transfer::BeginRequest> parse_begin(const Frame& frame);
[[nodiscard]] Outcome<transfer::ChunkData> parse_chunk(Frame frame, std::string& transfer_id);

// Reply parsers (client side); an error reply becomes the carried Error
[[nodiscard]] Outcome<nlohmann::json> expect_ok(const Frame& reply);
[[nodiscard]] Outcome<transfer::BeginReply> parse_begin_reply(const Frame& reply);
[[nodiscard]] Outcome<transfer::ChunkStatus> parse_chunk_reply(const Frame& reply);
[[nodiscard]] Outcome<transfer::FinalizeReply> parse_finalize_reply(const Frame& reply);

} // namespace mbk::network
