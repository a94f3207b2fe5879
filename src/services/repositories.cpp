#include "mbk/services/repositories.hpp"
#include "mbk/transfer/serialization.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace mbk::services {
namespace fs = std::filesystem;

// ──────────────────────────────────────────────────────────
// InMemoryBackupLogRepository
// ──────────────────────────────────────────────────────────

Outcome<std::int64_t> InMemoryBackupLogRepository::add(backup::BackupLog log) {
    std::lock_guard lock(mutex_);
    log.id = next_id_++;
    const auto id = log.id;
    logs_.emplace(id, std::move(log));
    return Ok(id);
}

Outcome<void> InMemoryBackupLogRepository::update(const backup::BackupLog& log) {
    std::lock_guard lock(mutex_);
    auto it = logs_.find(log.id);
    if (it == logs_.end()) {
        return Fail<void>(ErrorCode::NotFound, "Backup log not found: " + std::to_string(log.id));
    }
    it->second = log;
    return Ok();
}

Outcome<backup::BackupLog> InMemoryBackupLogRepository::get(std::int64_t id) const {
    std::lock_guard lock(mutex_);
    auto it = logs_.find(id);
    if (it == logs_.end()) {
        return Fail<backup::BackupLog>(ErrorCode::NotFound, "Backup log not found: " + std::to_string(id));
    }
    return Ok(it->second);
}

std::vector<backup::BackupLog> InMemoryBackupLogRepository::list() const {
    std::lock_guard lock(mutex_);
    std::vector<backup::BackupLog> out;
    out.reserve(logs_.size());
    for (const auto& [id, log] : logs_) {
        out.push_back(log);
    }
    return out;
}

// ──────────────────────────────────────────────────────────
// InMemoryResumeTokenStore
// ──────────────────────────────────────────────────────────

Outcome<void> InMemoryResumeTokenStore::save(const transfer::ResumeToken& token) {
    std::lock_guard lock(mutex_);
    tokens_[token.token] = token;
    return Ok();
}

Outcome<transfer::ResumeToken> InMemoryResumeTokenStore::load(const std::string& token) const {
    std::lock_guard lock(mutex_);
    auto it = tokens_.find(token);
    if (it == tokens_.end()) {
        return Fail<transfer::ResumeToken>(ErrorCode::NotFound, "Resume token not found: " + token);
    }
    return Ok(it->second);
}

Outcome<void> InMemoryResumeTokenStore::remove(const std::string& token) {
    std::lock_guard lock(mutex_);
    tokens_.erase(token);
    return Ok();
}

std::vector<transfer::ResumeToken> InMemoryResumeTokenStore::list() const {
    std::lock_guard lock(mutex_);
    std::vector<transfer::ResumeToken> out;
    out.reserve(tokens_.size());
    for (const auto& [key, token] : tokens_) {
        out.push_back(token);
    }
    return out;
}

// ──────────────────────────────────────────────────────────
// FileResumeTokenStore
// ──────────────────────────────────────────────────────────

FileResumeTokenStore::FileResumeTokenStore(fs::path directory)
    : directory_(std::move(directory)) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        spdlog::error("Failed to create resume token directory {}: {}", directory_.string(), ec.message());
    }
}

fs::path FileResumeTokenStore::path_for(const std::string& token) const {
    return directory_ / (token + ".json");
}

Outcome<void> FileResumeTokenStore::save(const transfer::ResumeToken& token) {
    if (token.token.empty() || token.token.find_first_of("/\\.") != std::string::npos) {
        return Fail<void>(ErrorCode::Validation, "Invalid resume token name: " + token.token);
    }

    std::lock_guard lock(mutex_);
    const auto final_path = path_for(token.token);
    auto temp_path = final_path;
    temp_path += ".tmp";

    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Fail<void>(ErrorCode::Io, "Failed to write resume token: " + temp_path.string());
        }
        out << nlohmann::json(token).dump(2);
        if (!out) {
            return Fail<void>(ErrorCode::Io, "Failed to write resume token: " + temp_path.string());
        }
    }

    std::error_code ec;
    fs::rename(temp_path, final_path, ec);
    if (ec) {
        return Fail<void>(ErrorCode::Io, "Failed to store resume token " + token.token + ": " + ec.message());
    }
    return Ok();
}

Outcome<transfer::ResumeToken> FileResumeTokenStore::load(const std::string& token) const {
    if (token.empty() || token.find_first_of("/\\.") != std::string::npos) {
        return Fail<transfer::ResumeToken>(ErrorCode::NotFound, "Resume token not found: " + token);
    }

    std::lock_guard lock(mutex_);
    std::ifstream input(path_for(token), std::ios::binary);
    if (!input) {
        return Fail<transfer::ResumeToken>(ErrorCode::NotFound, "Resume token not found: " + token);
    }
    std::ostringstream oss;
    oss << input.rdbuf();
    return transfer::parse_resume_token(oss.str());
}

Outcome<void> FileResumeTokenStore::remove(const std::string& token) {
    std::lock_guard lock(mutex_);
    std::error_code ec;
    fs::remove(path_for(token), ec);
    if (ec) {
        return Fail<void>(ErrorCode::Io, "Failed to remove resume token " + token + ": " + ec.message());
    }
    return Ok();
}

std::vector<transfer::ResumeToken> FileResumeTokenStore::list() const {
    std::vector<transfer::ResumeToken> out;
    std::lock_guard lock(mutex_);
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(directory_, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }
        std::ifstream input(entry.path(), std::ios::binary);
        std::ostringstream oss;
        oss << input.rdbuf();
        auto parsed = transfer::parse_resume_token(oss.str());
        if (parsed.is_ok()) {
            out.push_back(std::move(parsed.value()));
        } else {
            spdlog::warn("Skipping unreadable resume token {}: {}", entry.path().string(), parsed.error().message);
        }
    }
    return out;
}

} // namespace mbk::services
