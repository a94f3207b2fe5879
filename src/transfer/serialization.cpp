#include "mbk/transfer/serialization.hpp"

namespace mbk::transfer {

using json = nlohmann::json;

std::int64_t to_unix_millis(std::chrono::system_clock::time_point tp) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_unix_millis(std::int64_t millis) noexcept {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(millis));
}

void to_json(json& j, const FileMetadata& metadata) {
    j = json{
        {"file_name", metadata.file_name},
        {"file_size", metadata.file_size},
        {"md5", metadata.md5},
        {"sha256", metadata.sha256},
        {"chunk_size", metadata.chunk_size},
        {"chunk_count", metadata.chunk_count},
    };
}

void from_json(const json& j, FileMetadata& metadata) {
    metadata.file_name = j.value("file_name", "");
    metadata.file_size = j.value("file_size", static_cast<std::uint64_t>(0));
    metadata.md5 = j.value("md5", "");
    metadata.sha256 = j.value("sha256", "");
    metadata.chunk_size = j.value("chunk_size", static_cast<std::uint64_t>(0));
    metadata.chunk_count = j.value("chunk_count", static_cast<std::uint32_t>(0));
}

void to_json(json& j, const ResumeToken& token) {
    json chunks = json::array();
    for (const auto& [index, chunk] : token.completed_chunks) {
        chunks.push_back(json{
            {"index", index},
            {"size", chunk.size},
            {"checksum", chunk.checksum},
            {"completed_at", to_unix_millis(chunk.completed_at)},
        });
    }

    j = json{
        {"token", token.token},
        {"transfer_id", token.transfer_id},
        {"client_id", token.client_id},
        {"metadata", token.metadata},
        {"target_path", token.target_path},
        {"staging_directory", token.staging_directory},
        {"completed_chunks", std::move(chunks)},
        {"created_at", to_unix_millis(token.created_at)},
        {"last_activity", to_unix_millis(token.last_activity)},
        {"completed", token.completed},
    };
}

void from_json(const json& j, ResumeToken& token) {
    token.token = j.at("token").get<std::string>();
    token.transfer_id = j.at("transfer_id").get<std::string>();
    token.client_id = j.value("client_id", "");
    token.metadata = j.at("metadata").get<FileMetadata>();
    token.target_path = j.value("target_path", "");
    token.staging_directory = j.value("staging_directory", "");
    token.created_at = from_unix_millis(j.value("created_at", static_cast<std::int64_t>(0)));
    token.last_activity = from_unix_millis(j.value("last_activity", static_cast<std::int64_t>(0)));
    token.completed = j.value("completed", false);

    token.completed_chunks.clear();
    for (const auto& entry : j.value("completed_chunks", json::array())) {
        CompletedChunk chunk;
        chunk.size = entry.value("size", static_cast<std::uint64_t>(0));
        chunk.checksum = entry.value("checksum", "");
        chunk.completed_at = from_unix_millis(entry.value("completed_at", static_cast<std::int64_t>(0)));
        token.completed_chunks.emplace(entry.at("index").get<std::uint32_t>(), std::move(chunk));
    }
}

Outcome<ResumeToken> parse_resume_token(const std::string& text) {
    auto document = json::parse(text, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return Fail<ResumeToken>(ErrorCode::Protocol, "Resume token document is not valid JSON");
    }
    try {
        return Ok(document.get<ResumeToken>());
    } catch (const json::exception& e) {
        return Fail<ResumeToken>(ErrorCode::Protocol, std::string("Malformed resume token: ") + e.what());
    }
}

} // namespace mbk::transfer
