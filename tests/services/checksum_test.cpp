#include "mbk/services/checksum.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using mbk::services::OpenSslChecksumService;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    fs::path dir = fs::temp_directory_path() / ("mbk_checksum_test_" + std::to_string(counter.fetch_add(1)));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

std::vector<std::uint8_t> bytes(const std::string& text) {
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

} // namespace

TEST(ChecksumServiceTest, KnownDigests) {
    OpenSslChecksumService checksums;
    const auto abc = bytes("abc");

    EXPECT_EQ(checksums.md5(abc), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(checksums.sha256(abc), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(checksums.md5(std::vector<std::uint8_t>{}), "d41d8cd98f00b204e9800998ecf8427e");
}

TEST(ChecksumServiceTest, ValidateChunk) {
    OpenSslChecksumService checksums;
    const auto data = bytes("chunk payload");
    const auto digest = checksums.md5(data);

    EXPECT_TRUE(checksums.validate_chunk(data, digest));
    EXPECT_FALSE(checksums.validate_chunk(bytes("chunk payloaD"), digest));
    EXPECT_FALSE(checksums.validate_chunk(data, ""));
}

TEST(ChecksumServiceTest, DigestFileMatchesBufferDigest) {
    OpenSslChecksumService checksums;
    const auto dir = create_temp_dir();
    const auto file = dir / "data.bin";

    std::string content;
    for (int i = 0; i < 200000; ++i) {
        content.push_back(static_cast<char>(i % 251));
    }
    {
        std::ofstream out(file, std::ios::binary);
        out << content;
    }

    auto digest = checksums.digest_file(file);
    ASSERT_TRUE(digest.is_ok());
    EXPECT_EQ(digest.value().size, content.size());
    EXPECT_EQ(digest.value().md5, checksums.md5(bytes(content)));
    EXPECT_EQ(digest.value().sha256, checksums.sha256(bytes(content)));

    fs::remove_all(dir);
}

TEST(ChecksumServiceTest, DigestOfMissingFileFails) {
    OpenSslChecksumService checksums;
    auto digest = checksums.digest_file(fs::temp_directory_path() / "mbk_no_such_file.bin");
    EXPECT_TRUE(digest.is_error());
}
