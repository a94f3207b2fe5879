#pragma once

#include "mbk/core/error.hpp"
#include "mbk/services/checksum.hpp"
#include "mbk/services/repositories.hpp"
#include "mbk/transfer/types.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace mbk::transfer {

struct ChunkManagerOptions {
    std::filesystem::path staging_root;
    std::filesystem::path storage_root;             ///< Default destination directory
    std::chrono::hours max_token_age{72};
};

/**
 * @brief Read-only view of a live transfer session
 */
struct TransferSnapshot {
    std::string transfer_id;
    std::string client_id;
    FileMetadata metadata;
    std::string resume_token;
    std::uint32_t chunks_completed = 0;
    std::uint64_t bytes_received = 0;
    std::chrono::system_clock::time_point created_at{};
};

/**
 * @brief Server-side transfer sessions: chunk intake, reassembly, resume tokens
 *
 * Chunks may arrive in any order and from several connections at once.
 * Each accepted chunk is stored as its own file under
 * <staging_root>/<transfer_id>/chunk_%06d.dat, written to a ".part" file
 * first and renamed, so a connection drop mid-write never leaves a chunk
 * that looks complete.
 *
 * THREAD SAFETY:
 * - All public members may be called concurrently
 * - A given chunk index is written at most once; concurrent duplicates
 *   observe Duplicate
 * - Token persistence is serialised per transfer so the stored completed
 *   set never shrinks
 */
class ChunkManager {
public:
    ChunkManager(ChunkManagerOptions options,
                 const services::ChecksumService& checksums,
                 services::ResumeTokenStore& tokens);

    ChunkManager(const ChunkManager&) = delete;
    ChunkManager& operator=(const ChunkManager&) = delete;

    /// Fresh session, no resume token yet.
    Outcome<std::string> initialize_transfer(const FileMetadata& metadata,
                                             std::string target_path = {},
                                             std::string client_id = {});

    /**
     * @brief Validate and store one chunk
     *
     * RETURNS:
     * - Accepted          stored and recorded
     * - Duplicate         index already recorded (or being written); storage untouched
     * - ChecksumMismatch  payload does not match checksum or expected size; index stays missing
     * - UnknownTransfer   no live session with this id
     * - error             index out of range or disk failure
     */
    Outcome<ChunkStatus> receive_chunk(const std::string& transfer_id, const ChunkData& chunk);

    /**
     * @brief Reassemble strictly by index and move into place
     *
     * Fails with IncompleteTransfer while any index in [0, chunk_count) is
     * missing, including a chunk whose stored file has disappeared. On
     * success the session and its resume token are removed.
     */
    Outcome<std::filesystem::path> finalize_transfer(const std::string& transfer_id,
                                                     const std::optional<std::filesystem::path>& target_path = std::nullopt);

    /// Returns the existing token or issues a new one; persists the current completed set.
    Outcome<std::string> create_resume_token(const std::string& transfer_id);

    [[nodiscard]] Outcome<ResumeInfo> get_resume_info(const std::string& resume_token) const;

    /**
     * @brief Attach a live session to a token
     *
     * A token whose session is still live returns that session's id. A
     * token known only to the store (e.g. after a restart) is rebuilt under a
     * new transfer id; recorded chunks whose files are missing or corrupt
     * are dropped from the set. If @p metadata is given it must describe the
     * same file.
     */
    Outcome<std::string> restore_transfer(const std::string& resume_token,
                                          const std::optional<FileMetadata>& metadata = std::nullopt);

    /// Forget the token; a live session using it is abandoned with its staging data.
    Outcome<void> cleanup_resume_token(const std::string& resume_token);

    Outcome<void> abandon_transfer(const std::string& transfer_id);

    /// Drops tokens and idle sessions older than max_token_age. Returns how many were removed.
    std::size_t purge_expired();

    [[nodiscard]] std::optional<TransferSnapshot> snapshot(const std::string& transfer_id) const;
    [[nodiscard]] std::size_t active_transfers() const;
    [[nodiscard]] const ChunkManagerOptions& options() const noexcept { return options_; }

    [[nodiscard]] static std::string chunk_file_name(std::uint32_t index);

private:
    struct Session {
        std::string transfer_id;
        std::string client_id;
        FileMetadata metadata;
        std::filesystem::path staging_directory;
        std::string target_path;
        std::map<std::uint32_t, CompletedChunk> completed;
        std::set<std::uint32_t> in_flight;
        std::string resume_token;
        std::chrono::system_clock::time_point created_at{};
        std::chrono::system_clock::time_point last_activity{};
        bool finalizing = false;
        std::mutex persist_mutex;
    };

    using SessionPtr = std::shared_ptr<Session>;

    [[nodiscard]] SessionPtr find_session(const std::string& transfer_id) const;
    [[nodiscard]] SessionPtr find_session_by_token(const std::string& resume_token) const;

    Outcome<void> persist_token(const SessionPtr& session);
    [[nodiscard]] ResumeToken make_token_locked(const Session& session) const;

    Outcome<void> write_chunk_file(const Session& session, const ChunkData& chunk) const;
    Outcome<void> assemble(const Session& session, const std::filesystem::path& destination) const;
    [[nodiscard]] std::vector<std::uint32_t> missing_chunk_files(const std::filesystem::path& staging,
                                                                 const std::map<std::uint32_t, CompletedChunk>& completed,
                                                                 bool verify_checksums) const;
    void remove_staging(const std::filesystem::path& directory) const;
    void drop_session(const std::string& transfer_id);

    [[nodiscard]] std::filesystem::path resolve_target(const Session& session,
                                                       const std::optional<std::filesystem::path>& override_path) const;
    [[nodiscard]] bool is_expired(std::chrono::system_clock::time_point last_activity) const;

    ChunkManagerOptions options_;
    const services::ChecksumService& checksums_;
    services::ResumeTokenStore& tokens_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, SessionPtr> sessions_;
    std::unordered_map<std::string, std::string> token_index_;   ///< token -> transfer_id
};

/// "RT_<unix seconds>_<16 hex>"
[[nodiscard]] std::string generate_resume_token();
[[nodiscard]] std::string generate_transfer_id();

} // namespace mbk::transfer
