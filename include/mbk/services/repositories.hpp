#pragma once

#include "mbk/backup/types.hpp"
#include "mbk/core/error.hpp"
#include "mbk/transfer/types.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace mbk::services {

/**
 * @brief CRUD access to BackupLog rows
 */
class BackupLogRepository {
public:
    virtual ~BackupLogRepository() = default;

    /// Assigns and returns a fresh id.
    virtual Outcome<std::int64_t> add(backup::BackupLog log) = 0;
    virtual Outcome<void> update(const backup::BackupLog& log) = 0;
    [[nodiscard]] virtual Outcome<backup::BackupLog> get(std::int64_t id) const = 0;
    [[nodiscard]] virtual std::vector<backup::BackupLog> list() const = 0;
};

class InMemoryBackupLogRepository : public BackupLogRepository {
public:
    Outcome<std::int64_t> add(backup::BackupLog log) override;
    Outcome<void> update(const backup::BackupLog& log) override;
    [[nodiscard]] Outcome<backup::BackupLog> get(std::int64_t id) const override;
    [[nodiscard]] std::vector<backup::BackupLog> list() const override;

private:
    mutable std::mutex mutex_;
    std::map<std::int64_t, backup::BackupLog> logs_;
    std::int64_t next_id_ = 1;
};

/**
 * @brief Durable storage of resume tokens keyed by token string
 */
class ResumeTokenStore {
public:
    virtual ~ResumeTokenStore() = default;

    virtual Outcome<void> save(const transfer::ResumeToken& token) = 0;
    [[nodiscard]] virtual Outcome<transfer::ResumeToken> load(const std::string& token) const = 0;
    virtual Outcome<void> remove(const std::string& token) = 0;
    [[nodiscard]] virtual std::vector<transfer::ResumeToken> list() const = 0;
};

class InMemoryResumeTokenStore : public ResumeTokenStore {
public:
    Outcome<void> save(const transfer::ResumeToken& token) override;
    [[nodiscard]] Outcome<transfer::ResumeToken> load(const std::string& token) const override;
    Outcome<void> remove(const std::string& token) override;
    [[nodiscard]] std::vector<transfer::ResumeToken> list() const override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, transfer::ResumeToken> tokens_;
};

/**
 * @brief One JSON document per token: <directory>/<token>.json
 *
 * Writes go to a temporary file that is renamed over the previous version,
 * so a crash never leaves a truncated token behind.
 */
class FileResumeTokenStore : public ResumeTokenStore {
public:
    explicit FileResumeTokenStore(std::filesystem::path directory);

    Outcome<void> save(const transfer::ResumeToken& token) override;
    [[nodiscard]] Outcome<transfer::ResumeToken> load(const std::string& token) const override;
    Outcome<void> remove(const std::string& token) override;
    [[nodiscard]] std::vector<transfer::ResumeToken> list() const override;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }

private:
    [[nodiscard]] std::filesystem::path path_for(const std::string& token) const;

    std::filesystem::path directory_;
    mutable std::mutex mutex_;
};

} // namespace mbk::services
