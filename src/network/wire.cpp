#include "mbk/network/wire.hpp"
#include "mbk/transfer/serialization.hpp"

#include <algorithm>
#include <utility>

namespace mbk::network {

using nlohmann::json;

namespace {

void put_u32(std::vector<std::uint8_t>& out, std::size_t offset, std::uint32_t value) {
    out[offset] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
    out[offset + 1] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
    out[offset + 2] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
    out[offset + 3] = static_cast<std::uint8_t>(value & 0xFF);
}

std::uint32_t get_u32(const std::uint8_t* in) {
    return (static_cast<std::uint32_t>(in[0]) << 24) |
           (static_cast<std::uint32_t>(in[1]) << 16) |
           (static_cast<std::uint32_t>(in[2]) << 8) |
           static_cast<std::uint32_t>(in[3]);
}

template<typename T>
Outcome<T> protocol_error(const std::string& message) {
    return Fail<T>(ErrorCode::Protocol, message);
}

Frame request(const char* type) {
    Frame frame;
    frame.header = json{{"type", type}};
    return frame;
}

} // anonymous namespace

Outcome<std::vector<std::uint8_t>> encode_frame(const Frame& frame) {
    const std::string header = frame.header.dump();
    if (header.size() > kMaxHeaderBytes) {
        return protocol_error<std::vector<std::uint8_t>>("Frame header exceeds " + std::to_string(kMaxHeaderBytes) + " bytes");
    }
    if (frame.payload.size() > kMaxPayloadBytes) {
        return protocol_error<std::vector<std::uint8_t>>("Frame payload exceeds " + std::to_string(kMaxPayloadBytes) + " bytes");
    }

    std::vector<std::uint8_t> out(kFramePrefixBytes + header.size() + frame.payload.size());
    put_u32(out, 0, static_cast<std::uint32_t>(header.size()));
    put_u32(out, 4, static_cast<std::uint32_t>(frame.payload.size()));
    std::copy(header.begin(), header.end(), out.begin() + kFramePrefixBytes);
    std::copy(frame.payload.begin(), frame.payload.end(),
              out.begin() + static_cast<std::ptrdiff_t>(kFramePrefixBytes + header.size()));
    return Ok(std::move(out));
}

Outcome<FrameSizes> decode_prefix(const std::array<std::uint8_t, kFramePrefixBytes>& prefix) {
    FrameSizes sizes;
    sizes.header_bytes = get_u32(prefix.data());
    sizes.payload_bytes = get_u32(prefix.data() + 4);
    if (sizes.header_bytes == 0 || sizes.header_bytes > kMaxHeaderBytes) {
        return protocol_error<FrameSizes>("Invalid frame header length " + std::to_string(sizes.header_bytes));
    }
    if (sizes.payload_bytes > kMaxPayloadBytes) {
        return protocol_error<FrameSizes>("Frame payload too large: " + std::to_string(sizes.payload_bytes));
    }
    return Ok(sizes);
}

Outcome<Frame> decode_body(const std::vector<std::uint8_t>& header_bytes, std::vector<std::uint8_t> payload) {
    Frame frame;
    frame.header = json::parse(header_bytes.begin(), header_bytes.end(), nullptr, false);
    if (frame.header.is_discarded() || !frame.header.is_object()) {
        return protocol_error<Frame>("Frame header is not a JSON object");
    }
    if (!frame.header.contains("type") || !frame.header["type"].is_string()) {
        return protocol_error<Frame>("Frame header has no type");
    }
    frame.payload = std::move(payload);
    return Ok(std::move(frame));
}

Frame make_hello(const std::string& client_id, const std::string& auth_token) {
    auto frame = request(message_type::kHello);
    frame.header["client_id"] = client_id;
    frame.header["auth_token"] = auth_token;
    return frame;
}

Frame make_begin(const transfer::BeginRequest& request_data) {
    auto frame = request(message_type::kBegin);
    frame.header["metadata"] = request_data.metadata;
    frame.header["target_directory"] = request_data.target_directory;
    frame.header["file_name"] = request_data.file_name;
    if (!request_data.resume_token.empty()) {
        frame.header["resume_token"] = request_data.resume_token;
    }
    return frame;
}

Frame make_chunk(const std::string& transfer_id, const transfer::ChunkData& chunk) {
    auto frame = request(message_type::kChunk);
    frame.header["transfer_id"] = transfer_id;
    frame.header["chunk_index"] = chunk.index;
    frame.header["chunk_size"] = chunk.data.size();
    frame.header["checksum"] = chunk.checksum;
    frame.payload = chunk.data;
    return frame;
}

Frame make_checkpoint(const std::string& transfer_id) {
    auto frame = request(message_type::kCheckpoint);
    frame.header["transfer_id"] = transfer_id;
    return frame;
}

Frame make_finalize(const std::string& transfer_id) {
    auto frame = request(message_type::kFinalize);
    frame.header["transfer_id"] = transfer_id;
    return frame;
}

Frame make_ok_reply(json body) {
    auto frame = request(message_type::kReply);
    frame.header["ok"] = true;
    frame.header["body"] = std::move(body);
    return frame;
}

Frame make_error_reply(const Error& error) {
    auto frame = request(message_type::kReply);
    frame.header["ok"] = false;
    frame.header["error_code"] = std::string(to_string(error.code));
    frame.header["error_message"] = error.message;
    return frame;
}

Frame make_chunk_reply(std::uint32_t index, transfer::ChunkStatus status) {
    return make_ok_reply(json{{"chunk_index", index}, {"status", std::string(transfer::to_string(status))}});
}

Outcome<transfer::BeginRequest> parse_begin(const Frame& frame) {
    try {
        transfer::BeginRequest parsed;
        parsed.metadata = frame.header.at("metadata").get<transfer::FileMetadata>();
        parsed.target_directory = frame.header.value("target_directory", "");
        parsed.file_name = frame.header.value("file_name", "");
        parsed.resume_token = frame.header.value("resume_token", "");
        return Ok(std::move(parsed));
    } catch (const json::exception& e) {
        return protocol_error<transfer::BeginRequest>(std::string("Malformed begin request: ") + e.what());
    }
}

Outcome<transfer::ChunkData> parse_chunk(Frame frame, std::string& transfer_id) {
    try {
        transfer_id = frame.header.at("transfer_id").get<std::string>();
        transfer::ChunkData chunk;
        chunk.index = frame.header.at("chunk_index").get<std::uint32_t>();
        chunk.checksum = frame.header.value("checksum", "");
        const auto declared = frame.header.value("chunk_size", std::uint64_t{frame.payload.size()});
        if (declared != frame.payload.size()) {
            return protocol_error<transfer::ChunkData>("Chunk " + std::to_string(chunk.index) + " declares " +
                                                       std::to_string(declared) + " bytes but carries " +
                                                       std::to_string(frame.payload.size()));
        }
        chunk.data = std::move(frame.payload);
        return Ok(std::move(chunk));
    } catch (const json::exception& e) {
        return protocol_error<transfer::ChunkData>(std::string("Malformed chunk request: ") + e.what());
    }
}

Outcome<json> expect_ok(const Frame& reply) {
    if (reply.type() != message_type::kReply) {
        return protocol_error<json>("Expected reply frame, got '" + reply.type() + "'");
    }
    if (reply.header.value("ok", false)) {
        return Ok(reply.header.value("body", json::object()));
    }
    const auto code = error_code_from_string(reply.header.value("error_code", "Protocol"));
    return Fail<json>(code, reply.header.value("error_message", "Receiver reported an error"));
}

Outcome<transfer::BeginReply> parse_begin_reply(const Frame& reply) {
    auto body = expect_ok(reply);
    if (body.is_error()) {
        return Err<transfer::BeginReply>(body.error());
    }
    try {
        const auto& value = body.value();
        transfer::BeginReply parsed;
        parsed.transfer_id = value.at("transfer_id").get<std::string>();
        parsed.resume_token = value.value("resume_token", "");
        parsed.completed_chunks = value.value("completed_chunks", std::vector<std::uint32_t>{});
        return Ok(std::move(parsed));
    } catch (const json::exception& e) {
        return protocol_error<transfer::BeginReply>(std::string("Malformed begin reply: ") + e.what());
    }
}

Outcome<transfer::ChunkStatus> parse_chunk_reply(const Frame& reply) {
    auto body = expect_ok(reply);
    if (body.is_error()) {
        return Err<transfer::ChunkStatus>(body.error());
    }
    const auto status = transfer::chunk_status_from_string(body.value().value("status", ""));
    if (!status) {
        return protocol_error<transfer::ChunkStatus>("Unknown chunk status in reply");
    }
    return Ok(*status);
}

Outcome<transfer::FinalizeReply> parse_finalize_reply(const Frame& reply) {
    auto body = expect_ok(reply);
    if (body.is_error()) {
        return Err<transfer::FinalizeReply>(body.error());
    }
    try {
        const auto& value = body.value();
        transfer::FinalizeReply parsed;
        parsed.file_path = value.at("file_path").get<std::string>();
        parsed.file_size = value.value("file_size", std::uint64_t{0});
        parsed.sha256 = value.value("sha256", "");
        return Ok(std::move(parsed));
    } catch (const json::exception& e) {
        return protocol_error<transfer::FinalizeReply>(std::string("Malformed finalize reply: ") + e.what());
    }
}

} // namespace mbk::network
