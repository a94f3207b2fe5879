#pragma once

#include "mbk/core/cancellation.hpp"
#include "mbk/core/error.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace mbk::services {

struct CompressionProgress {
    double progress = 0.0;              ///< [0, 1]
    std::string current_file;
    std::uint64_t processed_bytes = 0;
    std::uint64_t total_bytes = 0;
};

using CompressionProgressCallback = std::function<void(const CompressionProgress&)>;

class CompressionService {
public:
    virtual ~CompressionService() = default;

    /// Archives @p source into @p target; returns the archive path.
    virtual Outcome<std::filesystem::path> compress_directory(const std::filesystem::path& source,
                                                              const std::filesystem::path& target,
                                                              const CompressionProgressCallback& progress = {},
                                                              const core::CancellationToken& cancel = {}) = 0;

    /// Removes an archive produced by compress_directory; a missing file is not an error.
    virtual Outcome<void> cleanup(const std::filesystem::path& file) = 0;
};

/**
 * @brief gzip-compressed tar archive written through libarchive
 *
 * Regular files and directories are archived below the source directory's
 * own name in pax-restricted format; other entry types are skipped with a
 * warning. The archive is written to "<target>.part" and renamed when
 * complete. Cancellation is honoured between entries and between buffers.
 */
class TarGzCompressionService : public CompressionService {
public:
    /// @p level is the gzip compression level, clamped to [1, 9].
    explicit TarGzCompressionService(int level = 6) : level_(level) {}

    Outcome<std::filesystem::path> compress_directory(const std::filesystem::path& source,
                                                      const std::filesystem::path& target,
                                                      const CompressionProgressCallback& progress = {},
                                                      const core::CancellationToken& cancel = {}) override;

    Outcome<void> cleanup(const std::filesystem::path& file) override;

    /// Unpacks an archive; entries that would land outside @p destination are rejected.
    Outcome<void> extract(const std::filesystem::path& archive, const std::filesystem::path& destination) const;

private:
    int level_;
};

} // namespace mbk::services
