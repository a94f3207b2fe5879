#include "mbk/services/checksum.hpp"

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace mbk::services {
namespace fs = std::filesystem;
namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext make_context() {
    return DigestContext(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
}

std::string to_hex(const unsigned char* bytes, unsigned int length) {
    std::ostringstream oss;
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

std::string one_shot(const EVP_MD* algorithm, const std::uint8_t* data, std::size_t size) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_Digest(data, size, hash, &hash_len, algorithm, nullptr) != 1) {
        return {};
    }
    return to_hex(hash, hash_len);
}

Outcome<std::string> finish(EVP_MD_CTX* ctx) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &hash_len) != 1) {
        return Fail<std::string>(ErrorCode::Io, "Failed to finalize digest");
    }
    return Ok(to_hex(hash, hash_len));
}

} // namespace

std::string OpenSslChecksumService::md5(const std::uint8_t* data, std::size_t size) const {
    return one_shot(EVP_md5(), data, size);
}

std::string OpenSslChecksumService::sha256(const std::uint8_t* data, std::size_t size) const {
    return one_shot(EVP_sha256(), data, size);
}

Outcome<FileDigest> OpenSslChecksumService::digest_file(const fs::path& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Fail<FileDigest>(ErrorCode::Io, "Failed to open file for hashing: " + path.string());
    }

    auto md5_ctx = make_context();
    auto sha_ctx = make_context();
    if (!md5_ctx || !sha_ctx) {
        return Fail<FileDigest>(ErrorCode::Io, "Failed to create digest context");
    }
    if (EVP_DigestInit_ex(md5_ctx.get(), EVP_md5(), nullptr) != 1 ||
        EVP_DigestInit_ex(sha_ctx.get(), EVP_sha256(), nullptr) != 1) {
        return Fail<FileDigest>(ErrorCode::Io, "Failed to initialize digest");
    }

    FileDigest digest;
    std::array<char, 64 * 1024> buffer{};
    while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
        const auto count = static_cast<std::size_t>(file.gcount());
        if (EVP_DigestUpdate(md5_ctx.get(), buffer.data(), count) != 1 ||
            EVP_DigestUpdate(sha_ctx.get(), buffer.data(), count) != 1) {
            return Fail<FileDigest>(ErrorCode::Io, "Failed to update digest for " + path.string());
        }
        digest.size += count;
    }
    if (file.bad()) {
        return Fail<FileDigest>(ErrorCode::Io, "Read error while hashing " + path.string());
    }

    auto md5_hex = finish(md5_ctx.get());
    if (md5_hex.is_error()) {
        return Err<FileDigest>(md5_hex.error());
    }
    auto sha_hex = finish(sha_ctx.get());
    if (sha_hex.is_error()) {
        return Err<FileDigest>(sha_hex.error());
    }
    digest.md5 = std::move(md5_hex.value());
    digest.sha256 = std::move(sha_hex.value());
    return Ok(std::move(digest));
}

} // namespace mbk::services
