#pragma once

#include "mbk/core/cancellation.hpp"
#include "mbk/core/error.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace mbk::services {

struct EncryptionMetadata {
    std::string algorithm = "AES-256-CBC";
    std::string key_derivation = "PBKDF2-HMAC-SHA256";
    std::uint32_t iterations = 100000;
    std::string salt;                   ///< Lowercase hex
    std::string iv;                     ///< Lowercase hex
    std::uint64_t original_size = 0;    ///< Plaintext size; 0 when read back from a file
};

class EncryptionService {
public:
    virtual ~EncryptionService() = default;

    virtual Outcome<EncryptionMetadata> encrypt(const std::filesystem::path& input,
                                                const std::filesystem::path& output,
                                                const std::string& password,
                                                const core::CancellationToken& cancel = {}) = 0;

    /// A wrong password fails with Validation.
    virtual Outcome<void> decrypt(const std::filesystem::path& input,
                                  const std::filesystem::path& output,
                                  const std::string& password,
                                  const core::CancellationToken& cancel = {}) = 0;

    [[nodiscard]] virtual bool validate_password(const std::filesystem::path& encrypted_file,
                                                 const std::string& password) const = 0;

    [[nodiscard]] virtual Outcome<EncryptionMetadata> read_metadata(const std::filesystem::path& encrypted_file) const = 0;
};

/**
 * @brief AES-256-CBC file encryption through OpenSSL EVP
 *
 * File layout: "MBKENC01" | salt (16) | iv (16) | ciphertext (PKCS#7 padded).
 * The key is PBKDF2-HMAC-SHA256 of the password with 100 000 iterations.
 */
class AesEncryptionService : public EncryptionService {
public:
    static constexpr const char* kMagic = "MBKENC01";
    static constexpr std::size_t kMagicSize = 8;
    static constexpr std::size_t kSaltSize = 16;
    static constexpr std::size_t kIvSize = 16;
    static constexpr std::size_t kKeySize = 32;
    static constexpr std::uint32_t kIterations = 100000;

    Outcome<EncryptionMetadata> encrypt(const std::filesystem::path& input,
                                        const std::filesystem::path& output,
                                        const std::string& password,
                                        const core::CancellationToken& cancel = {}) override;

    Outcome<void> decrypt(const std::filesystem::path& input,
                          const std::filesystem::path& output,
                          const std::string& password,
                          const core::CancellationToken& cancel = {}) override;

    [[nodiscard]] bool validate_password(const std::filesystem::path& encrypted_file,
                                         const std::string& password) const override;

    [[nodiscard]] Outcome<EncryptionMetadata> read_metadata(const std::filesystem::path& encrypted_file) const override;
};

} // namespace mbk::services
