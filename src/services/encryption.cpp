#include "mbk/services/encryption.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>

#include <array>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

namespace mbk::services {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kBufferSize = 1024 * 1024;
constexpr std::size_t kBlockSize = 16;
constexpr std::size_t kHeaderSize = AesEncryptionService::kMagicSize + AesEncryptionService::kSaltSize +
                                    AesEncryptionService::kIvSize;

using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;
using Key = std::array<unsigned char, AesEncryptionService::kKeySize>;

struct FileHeader {
    std::array<unsigned char, AesEncryptionService::kSaltSize> salt{};
    std::array<unsigned char, AesEncryptionService::kIvSize> iv{};
};

std::string to_hex(const unsigned char* bytes, std::size_t length) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

Outcome<Key> derive_key(const std::string& password, const unsigned char* salt) {
    Key key{};
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                          salt, static_cast<int>(AesEncryptionService::kSaltSize),
                          static_cast<int>(AesEncryptionService::kIterations), EVP_sha256(),
                          static_cast<int>(key.size()), key.data()) != 1) {
        return Fail<Key>(ErrorCode::Io, "Key derivation failed");
    }
    return Ok(key);
}

Outcome<FileHeader> read_header(std::istream& in, const fs::path& path) {
    std::array<char, AesEncryptionService::kMagicSize> magic{};
    FileHeader header;
    in.read(magic.data(), static_cast<std::streamsize>(magic.size()));
    in.read(reinterpret_cast<char*>(header.salt.data()), static_cast<std::streamsize>(header.salt.size()));
    in.read(reinterpret_cast<char*>(header.iv.data()), static_cast<std::streamsize>(header.iv.size()));
    if (!in) {
        return Fail<FileHeader>(ErrorCode::Validation, "Not an encrypted backup (too short): " + path.string());
    }
    if (std::memcmp(magic.data(), AesEncryptionService::kMagic, magic.size()) != 0) {
        return Fail<FileHeader>(ErrorCode::Validation, "Not an encrypted backup (bad magic): " + path.string());
    }
    return Ok(header);
}

/// Streams @p in through an initialised cipher context into @p out.
Outcome<void> pump(EVP_CIPHER_CTX* ctx, std::istream& in, std::ostream& out,
                   const core::CancellationToken& cancel, const char* what) {
    std::vector<unsigned char> input(kBufferSize);
    std::vector<unsigned char> output(kBufferSize + kBlockSize);
    int produced = 0;

    while (in) {
        if (cancel.is_cancelled()) {
            return Fail<void>(ErrorCode::Cancelled, std::string(what) + " cancelled");
        }
        in.read(reinterpret_cast<char*>(input.data()), static_cast<std::streamsize>(input.size()));
        const auto got = in.gcount();
        if (got <= 0) {
            break;
        }
        if (EVP_CipherUpdate(ctx, output.data(), &produced, input.data(), static_cast<int>(got)) != 1) {
            return Fail<void>(ErrorCode::Io, std::string(what) + " failed");
        }
        out.write(reinterpret_cast<const char*>(output.data()), produced);
    }

    if (EVP_CipherFinal_ex(ctx, output.data(), &produced) != 1) {
        return Fail<void>(ErrorCode::Validation, std::string(what) + " failed: wrong password or corrupt data");
    }
    out.write(reinterpret_cast<const char*>(output.data()), produced);
    if (!out) {
        return Fail<void>(ErrorCode::Io, std::string(what) + ": write failed");
    }
    return Ok();
}

Outcome<void> commit(const fs::path& part, const fs::path& target) {
    std::error_code ec;
    fs::rename(part, target, ec);
    if (ec) {
        fs::remove(part, ec);
        return Fail<void>(ErrorCode::Io, "Failed to move " + part.string() + " into place");
    }
    return Ok();
}

} // anonymous namespace

Outcome<EncryptionMetadata> AesEncryptionService::encrypt(const fs::path& input,
                                                          const fs::path& output,
                                                          const std::string& password,
                                                          const core::CancellationToken& cancel) {
    if (password.empty()) {
        return Fail<EncryptionMetadata>(ErrorCode::Validation, "Encryption password is empty");
    }

    std::ifstream in(input, std::ios::binary);
    if (!in) {
        return Fail<EncryptionMetadata>(ErrorCode::Io, "Cannot open " + input.string());
    }

    FileHeader header;
    if (RAND_bytes(header.salt.data(), static_cast<int>(header.salt.size())) != 1 ||
        RAND_bytes(header.iv.data(), static_cast<int>(header.iv.size())) != 1) {
        return Fail<EncryptionMetadata>(ErrorCode::Io, "Random generator failure");
    }
    auto key = derive_key(password, header.salt.data());
    if (key.is_error()) {
        return Err<EncryptionMetadata>(key.error());
    }

    CipherContext ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx || EVP_CipherInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.value().data(), header.iv.data(), 1) != 1) {
        return Fail<EncryptionMetadata>(ErrorCode::Io, "Cipher initialisation failed");
    }

    const auto part = fs::path(output.string() + ".part");
    {
        std::ofstream out(part, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Fail<EncryptionMetadata>(ErrorCode::Io, "Cannot create " + part.string());
        }
        out.write(kMagic, static_cast<std::streamsize>(kMagicSize));
        out.write(reinterpret_cast<const char*>(header.salt.data()), static_cast<std::streamsize>(header.salt.size()));
        out.write(reinterpret_cast<const char*>(header.iv.data()), static_cast<std::streamsize>(header.iv.size()));

        if (auto pumped = pump(ctx.get(), in, out, cancel, "Encryption"); pumped.is_error()) {
            out.close();
            std::error_code ignored;
            fs::remove(part, ignored);
            return Err<EncryptionMetadata>(pumped.error());
        }
    }
    if (auto committed = commit(part, output); committed.is_error()) {
        return Err<EncryptionMetadata>(committed.error());
    }

    EncryptionMetadata metadata;
    metadata.iterations = kIterations;
    metadata.salt = to_hex(header.salt.data(), header.salt.size());
    metadata.iv = to_hex(header.iv.data(), header.iv.size());
    std::error_code ec;
    metadata.original_size = fs::file_size(input, ec);
    spdlog::info("Encrypted {} -> {} ({})", input.string(), output.string(), metadata.algorithm);
    return Ok(std::move(metadata));
}

Outcome<void> AesEncryptionService::decrypt(const fs::path& input,
                                            const fs::path& output,
                                            const std::string& password,
                                            const core::CancellationToken& cancel) {
    std::ifstream in(input, std::ios::binary);
    if (!in) {
        return Fail<void>(ErrorCode::Io, "Cannot open " + input.string());
    }
    auto header = read_header(in, input);
    if (header.is_error()) {
        return Err<void>(header.error());
    }
    auto key = derive_key(password, header.value().salt.data());
    if (key.is_error()) {
        return Err<void>(key.error());
    }

    CipherContext ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx || EVP_CipherInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.value().data(),
                                  header.value().iv.data(), 0) != 1) {
        return Fail<void>(ErrorCode::Io, "Cipher initialisation failed");
    }

    const auto part = fs::path(output.string() + ".part");
    {
        std::ofstream out(part, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Fail<void>(ErrorCode::Io, "Cannot create " + part.string());
        }
        if (auto pumped = pump(ctx.get(), in, out, cancel, "Decryption"); pumped.is_error()) {
            out.close();
            std::error_code ignored;
            fs::remove(part, ignored);
            return pumped;
        }
    }
    return commit(part, output);
}

bool AesEncryptionService::validate_password(const fs::path& encrypted_file, const std::string& password) const {
    std::ifstream in(encrypted_file, std::ios::binary);
    if (!in) {
        return false;
    }
    auto header = read_header(in, encrypted_file);
    if (header.is_error()) {
        return false;
    }

    std::error_code ec;
    const auto size = fs::file_size(encrypted_file, ec);
    if (ec || size < kHeaderSize + kBlockSize || (size - kHeaderSize) % kBlockSize != 0) {
        return false;
    }

    // Decrypting the last block with the one before it as IV is enough to check the padding.
    std::array<unsigned char, kBlockSize> previous = header.value().iv;
    std::array<unsigned char, kBlockSize> last{};
    if (size >= kHeaderSize + 2 * kBlockSize) {
        in.seekg(static_cast<std::streamoff>(size - 2 * kBlockSize));
        in.read(reinterpret_cast<char*>(previous.data()), kBlockSize);
    } else {
        in.seekg(static_cast<std::streamoff>(kHeaderSize));
    }
    in.read(reinterpret_cast<char*>(last.data()), kBlockSize);
    if (!in) {
        return false;
    }

    auto key = derive_key(password, header.value().salt.data());
    if (key.is_error()) {
        return false;
    }
    CipherContext ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx || EVP_CipherInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.value().data(), previous.data(), 0) != 1) {
        return false;
    }
    std::array<unsigned char, 2 * kBlockSize> plain{};
    int produced = 0;
    if (EVP_CipherUpdate(ctx.get(), plain.data(), &produced, last.data(), static_cast<int>(last.size())) != 1) {
        return false;
    }
    return EVP_CipherFinal_ex(ctx.get(), plain.data() + produced, &produced) == 1;
}

Outcome<EncryptionMetadata> AesEncryptionService::read_metadata(const fs::path& encrypted_file) const {
    std::ifstream in(encrypted_file, std::ios::binary);
    if (!in) {
        return Fail<EncryptionMetadata>(ErrorCode::Io, "Cannot open " + encrypted_file.string());
    }
    auto header = read_header(in, encrypted_file);
    if (header.is_error()) {
        return Err<EncryptionMetadata>(header.error());
    }

    EncryptionMetadata metadata;
    metadata.iterations = kIterations;
    metadata.salt = to_hex(header.value().salt.data(), header.value().salt.size());
    metadata.iv = to_hex(header.value().iv.data(), header.value().iv.size());
    return Ok(std::move(metadata));
}

} // namespace mbk::services
