#pragma once

#include "mbk/backup/types.hpp"

#include <cstdint>
#include <filesystem>

namespace mbk::backup {

struct ValidationOptions {
    std::filesystem::path work_directory;                       ///< Free space is checked here when set
    std::uint64_t min_free_bytes = 1024ULL * 1024 * 1024;       ///< Below this only a warning is raised
};

/**
 * @brief Check a configuration before anything external is touched
 *
 * Pure apart from filesystem reads: the data directory must exist and
 * the work directory's free space is sampled.
 */
[[nodiscard]] ValidationReport validate_configuration(const BackupConfiguration& config,
                                                      const ValidationOptions& options = {});

} // namespace mbk::backup
