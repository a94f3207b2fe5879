#include "mbk/transfer/chunk_manager.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>

namespace mbk::transfer {
namespace fs = std::filesystem;
namespace {

std::string random_hex(std::size_t digits) {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::ostringstream oss;
    while (oss.tellp() < static_cast<std::streamoff>(digits)) {
        oss << std::hex << std::setw(16) << std::setfill('0') << engine();
    }
    return oss.str().substr(0, digits);
}

std::string describe_missing(const std::vector<std::uint32_t>& missing) {
    std::ostringstream oss;
    oss << missing.size() << " chunk(s) missing: ";
    const std::size_t shown = std::min<std::size_t>(missing.size(), 8);
    for (std::size_t i = 0; i < shown; ++i) {
        oss << (i == 0 ? "" : ",") << missing[i];
    }
    if (missing.size() > shown) {
        oss << ",...";
    }
    return oss.str();
}

} // namespace

std::string generate_resume_token() {
    const auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "RT_" + std::to_string(now) + "_" + random_hex(16);
}

std::string generate_transfer_id() {
    return "TX_" + random_hex(32);
}

std::string ChunkManager::chunk_file_name(std::uint32_t index) {
    std::array<char, 32> name{};
    std::snprintf(name.data(), name.size(), "chunk_%06u.dat", index);
    return name.data();
}

ChunkManager::ChunkManager(ChunkManagerOptions options,
                           const services::ChecksumService& checksums,
                           services::ResumeTokenStore& tokens)
    : options_(std::move(options)),
      checksums_(checksums),
      tokens_(tokens) {
    std::error_code ec;
    fs::create_directories(options_.staging_root, ec);
    if (ec) {
        spdlog::error("Failed to create staging root {}: {}", options_.staging_root.string(), ec.message());
    }
    if (!options_.storage_root.empty()) {
        fs::create_directories(options_.storage_root, ec);
        if (ec) {
            spdlog::error("Failed to create storage root {}: {}", options_.storage_root.string(), ec.message());
        }
    }
}

Outcome<std::string> ChunkManager::initialize_transfer(const FileMetadata& metadata,
                                                       std::string target_path,
                                                       std::string client_id) {
    if (metadata.chunk_size == 0 || metadata.chunk_count == 0) {
        return Fail<std::string>(ErrorCode::Validation, "Chunk size and chunk count must be positive");
    }
    const std::uint64_t capacity = metadata.chunk_size * metadata.chunk_count;
    const std::uint64_t floor = metadata.chunk_size * (metadata.chunk_count - 1);
    if (metadata.file_size > capacity || (metadata.file_size > 0 && metadata.file_size <= floor)) {
        return Fail<std::string>(ErrorCode::Validation,
                                 "Chunk count " + std::to_string(metadata.chunk_count) +
                                 " does not match file size " + std::to_string(metadata.file_size));
    }

    auto session = std::make_shared<Session>();
    session->transfer_id = generate_transfer_id();
    session->client_id = std::move(client_id);
    session->metadata = metadata;
    session->staging_directory = options_.staging_root / session->transfer_id;
    session->target_path = std::move(target_path);
    session->created_at = std::chrono::system_clock::now();
    session->last_activity = session->created_at;

    std::error_code ec;
    fs::create_directories(session->staging_directory, ec);
    if (ec) {
        return Fail<std::string>(ErrorCode::Io,
                                 "Failed to create staging directory " +
                                 session->staging_directory.string() + ": " + ec.message());
    }

    const auto id = session->transfer_id;
    {
        std::lock_guard lock(mutex_);
        sessions_.emplace(id, std::move(session));
    }

    spdlog::info("Transfer {} initialized: file={} size={} chunks={}x{}",
                 id, metadata.file_name, metadata.file_size, metadata.chunk_count, metadata.chunk_size);
    return Ok(id);
}

Outcome<ChunkStatus> ChunkManager::receive_chunk(const std::string& transfer_id, const ChunkData& chunk) {
    SessionPtr session;
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(transfer_id);
        if (it == sessions_.end()) {
            return Ok(ChunkStatus::UnknownTransfer);
        }
        session = it->second;

        if (chunk.index >= session->metadata.chunk_count) {
            return Fail<ChunkStatus>(ErrorCode::Validation,
                                     "Chunk index " + std::to_string(chunk.index) + " out of range [0, " +
                                     std::to_string(session->metadata.chunk_count) + ")");
        }
        if (session->completed.count(chunk.index) > 0 || session->in_flight.count(chunk.index) > 0) {
            return Ok(ChunkStatus::Duplicate);
        }
        if (chunk.data.size() != session->metadata.expected_chunk_size(chunk.index)) {
            spdlog::warn("Transfer {} chunk {} has {} bytes, expected {}",
                         transfer_id, chunk.index, chunk.data.size(),
                         session->metadata.expected_chunk_size(chunk.index));
            return Ok(ChunkStatus::ChecksumMismatch);
        }
        session->in_flight.insert(chunk.index);
    }

    auto release = [&]() {
        std::lock_guard lock(mutex_);
        session->in_flight.erase(chunk.index);
    };

    if (!checksums_.validate_chunk(chunk.data, chunk.checksum)) {
        release();
        spdlog::warn("Transfer {} chunk {} failed checksum validation", transfer_id, chunk.index);
        return Ok(ChunkStatus::ChecksumMismatch);
    }

    if (auto written = write_chunk_file(*session, chunk); written.is_error()) {
        release();
        return Err<ChunkStatus>(written.error());
    }

    {
        std::lock_guard lock(mutex_);
        session->in_flight.erase(chunk.index);
        const auto now = std::chrono::system_clock::now();
        session->completed.emplace(chunk.index, CompletedChunk{chunk.data.size(), chunk.checksum, now});
        session->last_activity = now;
    }

    if (auto persisted = persist_token(session); persisted.is_error()) {
        spdlog::warn("Transfer {}: chunk {} stored but resume token not updated: {}",
                     transfer_id, chunk.index, persisted.error().message);
    }
    return Ok(ChunkStatus::Accepted);
}

Outcome<fs::path> ChunkManager::finalize_transfer(const std::string& transfer_id,
                                                  const std::optional<fs::path>& target_path) {
    SessionPtr session;
    std::map<std::uint32_t, CompletedChunk> completed;
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(transfer_id);
        if (it == sessions_.end()) {
            return Fail<fs::path>(ErrorCode::UnknownTransfer, "Unknown transfer: " + transfer_id);
        }
        session = it->second;
        if (session->finalizing) {
            return Fail<fs::path>(ErrorCode::Validation, "Transfer is already being finalized: " + transfer_id);
        }

        std::vector<std::uint32_t> missing;
        for (std::uint32_t index = 0; index < session->metadata.chunk_count; ++index) {
            if (session->completed.count(index) == 0) {
                missing.push_back(index);
            }
        }
        if (!missing.empty() || !session->in_flight.empty()) {
            return Fail<fs::path>(ErrorCode::IncompleteTransfer, describe_missing(missing));
        }
        session->finalizing = true;
        completed = session->completed;
    }

    const auto lost = missing_chunk_files(session->staging_directory, completed, false);
    if (!lost.empty()) {
        {
            std::lock_guard lock(mutex_);
            for (auto index : lost) {
                session->completed.erase(index);
            }
            session->finalizing = false;
        }
        spdlog::warn("Transfer {}: stored chunks disappeared, {}", transfer_id, describe_missing(lost));
        if (auto persisted = persist_token(session); persisted.is_error()) {
            spdlog::warn("Transfer {}: failed to update resume token: {}", transfer_id, persisted.error().message);
        }
        return Fail<fs::path>(ErrorCode::IncompleteTransfer, describe_missing(lost));
    }

    const auto destination = resolve_target(*session, target_path);
    if (auto assembled = assemble(*session, destination); assembled.is_error()) {
        std::lock_guard lock(mutex_);
        session->finalizing = false;
        return Err<fs::path>(assembled.error());
    }

    std::string token;
    {
        std::lock_guard persist(session->persist_mutex);
        std::lock_guard lock(mutex_);
        token = session->resume_token;
        sessions_.erase(transfer_id);
        if (!token.empty()) {
            token_index_.erase(token);
        }
    }
    if (!token.empty()) {
        if (auto removed = tokens_.remove(token); removed.is_error()) {
            spdlog::warn("Transfer {}: failed to remove resume token {}: {}",
                         transfer_id, token, removed.error().message);
        }
    }
    remove_staging(session->staging_directory);

    spdlog::info("Transfer {} finalized: {} ({} bytes)", transfer_id, destination.string(), session->metadata.file_size);
    return Ok(destination);
}

Outcome<std::string> ChunkManager::create_resume_token(const std::string& transfer_id) {
    auto session = find_session(transfer_id);
    if (!session) {
        return Fail<std::string>(ErrorCode::UnknownTransfer, "Unknown transfer: " + transfer_id);
    }
    if (auto persisted = persist_token(session); persisted.is_error()) {
        return Err<std::string>(persisted.error());
    }
    std::lock_guard lock(mutex_);
    return Ok(session->resume_token);
}

Outcome<ResumeInfo> ChunkManager::get_resume_info(const std::string& resume_token) const {
    ResumeInfo info;
    if (auto session = find_session_by_token(resume_token)) {
        std::lock_guard lock(mutex_);
        info.transfer_id = session->transfer_id;
        info.client_id = session->client_id;
        info.metadata = session->metadata;
        for (const auto& [index, chunk] : session->completed) {
            info.completed_chunks.push_back(index);
        }
    } else {
        auto loaded = tokens_.load(resume_token);
        if (loaded.is_error()) {
            return Err<ResumeInfo>(loaded.error());
        }
        const auto& token = loaded.value();
        if (token.completed || is_expired(token.last_activity)) {
            return Fail<ResumeInfo>(ErrorCode::NotFound, "Resume token is no longer valid: " + resume_token);
        }
        info.transfer_id = token.transfer_id;
        info.client_id = token.client_id;
        info.metadata = token.metadata;
        for (const auto& [index, chunk] : token.completed_chunks) {
            info.completed_chunks.push_back(index);
        }
    }

    if (!info.completed_chunks.empty()) {
        info.last_completed_chunk = info.completed_chunks.back();
    }
    return Ok(std::move(info));
}

Outcome<std::string> ChunkManager::restore_transfer(const std::string& resume_token,
                                                    const std::optional<FileMetadata>& metadata) {
    if (auto live = find_session_by_token(resume_token)) {
        std::lock_guard lock(mutex_);
        if (metadata && !metadata->same_identity(live->metadata)) {
            return Fail<std::string>(ErrorCode::Validation, "Resume token describes a different file");
        }
        live->last_activity = std::chrono::system_clock::now();
        return Ok(live->transfer_id);
    }

    auto loaded = tokens_.load(resume_token);
    if (loaded.is_error()) {
        return Err<std::string>(loaded.error());
    }
    auto token = std::move(loaded.value());
    if (token.completed) {
        return Fail<std::string>(ErrorCode::NotFound, "Transfer already completed for token " + resume_token);
    }
    if (is_expired(token.last_activity)) {
        return Fail<std::string>(ErrorCode::NotFound, "Resume token expired: " + resume_token);
    }
    if (metadata && !metadata->same_identity(token.metadata)) {
        return Fail<std::string>(ErrorCode::Validation, "Resume token describes a different file");
    }

    auto session = std::make_shared<Session>();
    session->transfer_id = generate_transfer_id();
    session->client_id = token.client_id;
    session->metadata = token.metadata;
    session->staging_directory = token.staging_directory.empty()
        ? options_.staging_root / token.transfer_id
        : fs::path(token.staging_directory);
    session->target_path = token.target_path;
    session->completed = token.completed_chunks;
    session->resume_token = resume_token;
    session->created_at = token.created_at;
    session->last_activity = std::chrono::system_clock::now();

    std::error_code ec;
    fs::create_directories(session->staging_directory, ec);
    if (ec) {
        return Fail<std::string>(ErrorCode::Io, "Failed to recreate staging directory: " + ec.message());
    }

    const auto dropped = missing_chunk_files(session->staging_directory, session->completed, true);
    for (auto index : dropped) {
        session->completed.erase(index);
    }
    if (!dropped.empty()) {
        spdlog::warn("Resume token {}: {} recorded chunk(s) unusable and will be resent",
                     resume_token, dropped.size());
    }

    const auto id = session->transfer_id;
    {
        std::lock_guard lock(mutex_);
        sessions_.emplace(id, session);
        token_index_[resume_token] = id;
    }
    if (auto persisted = persist_token(session); persisted.is_error()) {
        spdlog::warn("Transfer {}: failed to update restored token: {}", id, persisted.error().message);
    }

    spdlog::info("Transfer {} restored from {} (was {}), {}/{} chunks present",
                 id, resume_token, token.transfer_id, session->completed.size(), session->metadata.chunk_count);
    return Ok(id);
}

Outcome<void> ChunkManager::cleanup_resume_token(const std::string& resume_token) {
    if (auto live = find_session_by_token(resume_token)) {
        drop_session(live->transfer_id);
        remove_staging(live->staging_directory);
    } else if (auto stored = tokens_.load(resume_token); stored.is_ok()) {
        if (!stored.value().staging_directory.empty()) {
            remove_staging(stored.value().staging_directory);
        }
    }
    return tokens_.remove(resume_token);
}

Outcome<void> ChunkManager::abandon_transfer(const std::string& transfer_id) {
    auto session = find_session(transfer_id);
    if (!session) {
        return Fail<void>(ErrorCode::UnknownTransfer, "Unknown transfer: " + transfer_id);
    }
    std::string token;
    {
        std::lock_guard persist(session->persist_mutex);
        std::lock_guard lock(mutex_);
        token = session->resume_token;
    }
    drop_session(transfer_id);
    remove_staging(session->staging_directory);
    if (!token.empty()) {
        return tokens_.remove(token);
    }
    return Ok();
}

std::size_t ChunkManager::purge_expired() {
    std::vector<std::string> idle;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, session] : sessions_) {
            if (session->in_flight.empty() && !session->finalizing && is_expired(session->last_activity)) {
                idle.push_back(id);
            }
        }
    }

    std::size_t removed = 0;
    for (const auto& id : idle) {
        if (abandon_transfer(id).is_ok()) {
            ++removed;
        }
    }

    for (const auto& token : tokens_.list()) {
        if (find_session_by_token(token.token)) {
            continue;
        }
        if (!token.completed && !is_expired(token.last_activity)) {
            continue;
        }
        if (!token.staging_directory.empty()) {
            remove_staging(token.staging_directory);
        }
        if (tokens_.remove(token.token).is_ok()) {
            ++removed;
        }
    }

    if (removed > 0) {
        spdlog::info("Purged {} expired transfer(s)", removed);
    }
    return removed;
}

std::optional<TransferSnapshot> ChunkManager::snapshot(const std::string& transfer_id) const {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(transfer_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    const auto& session = *it->second;
    TransferSnapshot view;
    view.transfer_id = session.transfer_id;
    view.client_id = session.client_id;
    view.metadata = session.metadata;
    view.resume_token = session.resume_token;
    view.chunks_completed = static_cast<std::uint32_t>(session.completed.size());
    for (const auto& [index, chunk] : session.completed) {
        view.bytes_received += chunk.size;
    }
    view.created_at = session.created_at;
    return view;
}

std::size_t ChunkManager::active_transfers() const {
    std::lock_guard lock(mutex_);
    return sessions_.size();
}

ChunkManager::SessionPtr ChunkManager::find_session(const std::string& transfer_id) const {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(transfer_id);
    return it == sessions_.end() ? nullptr : it->second;
}

ChunkManager::SessionPtr ChunkManager::find_session_by_token(const std::string& resume_token) const {
    std::lock_guard lock(mutex_);
    auto token_it = token_index_.find(resume_token);
    if (token_it == token_index_.end()) {
        return nullptr;
    }
    auto it = sessions_.find(token_it->second);
    return it == sessions_.end() ? nullptr : it->second;
}

Outcome<void> ChunkManager::persist_token(const SessionPtr& session) {
    std::lock_guard persist(session->persist_mutex);
    ResumeToken token;
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(session->transfer_id);
        if (it == sessions_.end() || it->second != session) {
            return Ok();
        }
        if (session->resume_token.empty()) {
            session->resume_token = generate_resume_token();
            token_index_[session->resume_token] = session->transfer_id;
        }
        token = make_token_locked(*session);
    }
    return tokens_.save(token);
}

ResumeToken ChunkManager::make_token_locked(const Session& session) const {
    ResumeToken token;
    token.token = session.resume_token;
    token.transfer_id = session.transfer_id;
    token.client_id = session.client_id;
    token.metadata = session.metadata;
    token.target_path = session.target_path;
    token.staging_directory = session.staging_directory.string();
    token.completed_chunks = session.completed;
    token.created_at = session.created_at;
    token.last_activity = session.last_activity;
    token.completed = false;
    return token;
}

Outcome<void> ChunkManager::write_chunk_file(const Session& session, const ChunkData& chunk) const {
    const auto final_path = session.staging_directory / chunk_file_name(chunk.index);
    auto part_path = final_path;
    part_path += ".part";

    {
        std::ofstream out(part_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Fail<void>(ErrorCode::Io, "Failed to create chunk file: " + part_path.string());
        }
        out.write(reinterpret_cast<const char*>(chunk.data.data()), static_cast<std::streamsize>(chunk.data.size()));
        out.flush();
        if (!out) {
            return Fail<void>(ErrorCode::Io, "Failed to write chunk file: " + part_path.string());
        }
    }

    std::error_code ec;
    fs::rename(part_path, final_path, ec);
    if (ec) {
        fs::remove(part_path, ec);
        return Fail<void>(ErrorCode::Io, "Failed to commit chunk " + std::to_string(chunk.index) + ": " + ec.message());
    }
    return Ok();
}

Outcome<void> ChunkManager::assemble(const Session& session, const fs::path& destination) const {
    std::error_code ec;
    fs::create_directories(destination.parent_path(), ec);
    if (ec && !fs::exists(destination.parent_path())) {
        return Fail<void>(ErrorCode::Io, "Failed to create directory: " + destination.parent_path().string());
    }

    auto part_path = destination;
    part_path += ".part";

    std::uint64_t written = 0;
    {
        std::ofstream out(part_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Fail<void>(ErrorCode::Io, "Failed to create output file: " + part_path.string());
        }

        std::vector<char> buffer(64 * 1024);
        for (std::uint32_t index = 0; index < session.metadata.chunk_count; ++index) {
            const auto chunk_path = session.staging_directory / chunk_file_name(index);
            std::ifstream in(chunk_path, std::ios::binary);
            if (!in) {
                out.close();
                fs::remove(part_path, ec);
                return Fail<void>(ErrorCode::IncompleteTransfer, "Chunk file missing: " + chunk_path.string());
            }
            while (in.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || in.gcount() > 0) {
                out.write(buffer.data(), in.gcount());
                written += static_cast<std::uint64_t>(in.gcount());
            }
        }
        out.flush();
        if (!out) {
            out.close();
            fs::remove(part_path, ec);
            return Fail<void>(ErrorCode::Io, "Failed to write output file: " + part_path.string());
        }
    }

    if (written != session.metadata.file_size) {
        fs::remove(part_path, ec);
        return Fail<void>(ErrorCode::IncompleteTransfer,
                          "Reassembled " + std::to_string(written) + " bytes, expected " +
                          std::to_string(session.metadata.file_size));
    }

    if (!session.metadata.md5.empty() || !session.metadata.sha256.empty()) {
        auto digest = checksums_.digest_file(part_path);
        if (digest.is_error()) {
            fs::remove(part_path, ec);
            return Err<void>(digest.error());
        }
        const bool md5_ok = session.metadata.md5.empty() || digest.value().md5 == session.metadata.md5;
        const bool sha_ok = session.metadata.sha256.empty() || digest.value().sha256 == session.metadata.sha256;
        if (!md5_ok || !sha_ok) {
            fs::remove(part_path, ec);
            return Fail<void>(ErrorCode::ChecksumMismatch, "Final checksum mismatch for " + session.metadata.file_name);
        }
    }

    fs::rename(part_path, destination, ec);
    if (ec) {
        fs::remove(part_path, ec);
        return Fail<void>(ErrorCode::Io, "Failed to move output file into place: " + destination.string());
    }
    return Ok();
}

std::vector<std::uint32_t> ChunkManager::missing_chunk_files(const fs::path& staging,
                                                             const std::map<std::uint32_t, CompletedChunk>& completed,
                                                             bool verify_checksums) const {
    std::vector<std::uint32_t> missing;
    for (const auto& [index, chunk] : completed) {
        const auto path = staging / chunk_file_name(index);
        std::error_code ec;
        const auto size = fs::file_size(path, ec);
        if (ec || size != chunk.size) {
            missing.push_back(index);
            continue;
        }
        if (!verify_checksums) {
            continue;
        }
        std::ifstream in(path, std::ios::binary);
        std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
        in.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!in || !checksums_.validate_chunk(data, chunk.checksum)) {
            missing.push_back(index);
        }
    }
    return missing;
}

void ChunkManager::remove_staging(const fs::path& directory) const {
    std::error_code ec;
    fs::remove_all(directory, ec);
    if (ec) {
        spdlog::warn("Failed to remove staging directory {}: {}", directory.string(), ec.message());
    }
}

void ChunkManager::drop_session(const std::string& transfer_id) {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(transfer_id);
    if (it == sessions_.end()) {
        return;
    }
    if (!it->second->resume_token.empty()) {
        token_index_.erase(it->second->resume_token);
    }
    sessions_.erase(it);
}

fs::path ChunkManager::resolve_target(const Session& session, const std::optional<fs::path>& override_path) const {
    fs::path chosen;
    if (override_path && !override_path->empty()) {
        chosen = *override_path;
    } else if (!session.target_path.empty()) {
        chosen = session.target_path;
    } else {
        chosen = session.metadata.file_name;
    }
    if (chosen.is_absolute() || options_.storage_root.empty()) {
        return chosen;
    }
    return options_.storage_root / chosen;
}

bool ChunkManager::is_expired(std::chrono::system_clock::time_point last_activity) const {
    return std::chrono::system_clock::now() - last_activity > options_.max_token_age;
}

} // namespace mbk::transfer
