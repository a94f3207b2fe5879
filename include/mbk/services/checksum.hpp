#pragma once

#include "mbk/core/error.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace mbk::services {

struct FileDigest {
    std::string md5;
    std::string sha256;
    std::uint64_t size = 0;
};

/**
 * @brief Content hashing for chunk and whole-file integrity
 *
 * All digests are lowercase hex.
 */
class ChecksumService {
public:
    virtual ~ChecksumService() = default;

    [[nodiscard]] virtual std::string md5(const std::uint8_t* data, std::size_t size) const = 0;
    [[nodiscard]] virtual std::string sha256(const std::uint8_t* data, std::size_t size) const = 0;

    /// Single pass over the file computing both digests and the size.
    [[nodiscard]] virtual Outcome<FileDigest> digest_file(const std::filesystem::path& path) const = 0;

    [[nodiscard]] std::string md5(const std::vector<std::uint8_t>& data) const {
        return md5(data.data(), data.size());
    }

    [[nodiscard]] std::string sha256(const std::vector<std::uint8_t>& data) const {
        return sha256(data.data(), data.size());
    }

    [[nodiscard]] bool validate_chunk(const std::vector<std::uint8_t>& data,
                                      const std::string& expected_md5) const {
        return !expected_md5.empty() && md5(data) == expected_md5;
    }
};

class OpenSslChecksumService : public ChecksumService {
public:
    [[nodiscard]] std::string md5(const std::uint8_t* data, std::size_t size) const override;
    [[nodiscard]] std::string sha256(const std::uint8_t* data, std::size_t size) const override;
    [[nodiscard]] Outcome<FileDigest> digest_file(const std::filesystem::path& path) const override;

    using ChecksumService::md5;
    using ChecksumService::sha256;
};

} // namespace mbk::services
