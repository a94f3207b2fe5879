#include "mbk/services/encryption.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using mbk::ErrorCode;
using mbk::services::AesEncryptionService;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    fs::path dir = fs::temp_directory_path() / ("mbk_encryption_test_" + std::to_string(counter.fetch_add(1)));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

} // namespace

TEST(AesEncryptionTest, EncryptThenDecryptRestoresContent) {
    const auto dir = create_temp_dir();
    std::string content;
    for (int i = 0; i < 3 * 1024 * 1024 + 5; ++i) {
        content.push_back(static_cast<char>((i * 31) % 256));
    }
    write_file(dir / "backup.tar.gz", content);

    AesEncryptionService encryption;
    auto metadata = encryption.encrypt(dir / "backup.tar.gz", dir / "backup.tar.gz.enc", "correct horse");
    ASSERT_TRUE(metadata.is_ok());
    EXPECT_EQ(metadata.value().algorithm, "AES-256-CBC");
    EXPECT_EQ(metadata.value().key_derivation, "PBKDF2-HMAC-SHA256");
    EXPECT_EQ(metadata.value().iterations, 100000u);
    EXPECT_EQ(metadata.value().salt.size(), 32u);
    EXPECT_EQ(metadata.value().iv.size(), 32u);
    EXPECT_EQ(metadata.value().original_size, content.size());
    EXPECT_FALSE(fs::exists(dir / "backup.tar.gz.enc.part"));

    const auto encrypted = read_file(dir / "backup.tar.gz.enc");
    EXPECT_EQ(encrypted.substr(0, 8), "MBKENC01");
    EXPECT_EQ((encrypted.size() - 40) % 16, 0u);
    EXPECT_GT(encrypted.size(), content.size() + 40);

    ASSERT_TRUE(encryption.decrypt(dir / "backup.tar.gz.enc", dir / "restored.tar.gz", "correct horse").is_ok());
    EXPECT_EQ(read_file(dir / "restored.tar.gz"), content);

    fs::remove_all(dir);
}

TEST(AesEncryptionTest, ReadMetadataMatchesEncryption) {
    const auto dir = create_temp_dir();
    write_file(dir / "plain", "small");

    AesEncryptionService encryption;
    auto written = encryption.encrypt(dir / "plain", dir / "plain.enc", "pw");
    ASSERT_TRUE(written.is_ok());

    auto read = encryption.read_metadata(dir / "plain.enc");
    ASSERT_TRUE(read.is_ok());
    EXPECT_EQ(read.value().salt, written.value().salt);
    EXPECT_EQ(read.value().iv, written.value().iv);

    fs::remove_all(dir);
}

TEST(AesEncryptionTest, ValidatePasswordChecksPadding) {
    const auto dir = create_temp_dir();
    write_file(dir / "plain", std::string(1000, 'q'));

    AesEncryptionService encryption;
    ASSERT_TRUE(encryption.encrypt(dir / "plain", dir / "plain.enc", "right").is_ok());

    EXPECT_TRUE(encryption.validate_password(dir / "plain.enc", "right"));
    EXPECT_FALSE(encryption.validate_password(dir / "plain", "right"));

    fs::remove_all(dir);
}

TEST(AesEncryptionTest, EmptyInputStillProducesOneBlock) {
    const auto dir = create_temp_dir();
    write_file(dir / "empty", "");

    AesEncryptionService encryption;
    ASSERT_TRUE(encryption.encrypt(dir / "empty", dir / "empty.enc", "pw").is_ok());
    EXPECT_EQ(fs::file_size(dir / "empty.enc"), 56u);
    EXPECT_TRUE(encryption.validate_password(dir / "empty.enc", "pw"));

    ASSERT_TRUE(encryption.decrypt(dir / "empty.enc", dir / "empty.out", "pw").is_ok());
    EXPECT_EQ(fs::file_size(dir / "empty.out"), 0u);

    fs::remove_all(dir);
}

TEST(AesEncryptionTest, EmptyPasswordIsRejected) {
    const auto dir = create_temp_dir();
    write_file(dir / "plain", "data");

    AesEncryptionService encryption;
    auto result = encryption.encrypt(dir / "plain", dir / "plain.enc", "");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Validation);
    EXPECT_FALSE(fs::exists(dir / "plain.enc"));

    fs::remove_all(dir);
}

TEST(AesEncryptionTest, NotAnEncryptedFile) {
    const auto dir = create_temp_dir();
    write_file(dir / "plain", std::string(100, 'z'));

    AesEncryptionService encryption;
    auto metadata = encryption.read_metadata(dir / "plain");
    ASSERT_TRUE(metadata.is_error());
    EXPECT_EQ(metadata.error().code, ErrorCode::Validation);

    auto decrypted = encryption.decrypt(dir / "plain", dir / "out", "pw");
    ASSERT_TRUE(decrypted.is_error());
    EXPECT_EQ(decrypted.error().code, ErrorCode::Validation);
    EXPECT_FALSE(fs::exists(dir / "out"));

    fs::remove_all(dir);
}
