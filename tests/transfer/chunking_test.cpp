#include "mbk/transfer/serialization.hpp"
#include "mbk/transfer/types.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

using namespace mbk::transfer;

namespace {

constexpr std::uint64_t kMiB = 1024ULL * 1024;

} // namespace

TEST(ChunkingStrategyTest, SizeTiers) {
    struct Case {
        std::uint64_t file_size;
        std::uint64_t chunk_size;
        std::uint32_t concurrency;
    };
    const Case cases[] = {
        {0, 1 * kMiB, 2},
        {10 * kMiB - 1, 1 * kMiB, 2},
        {10 * kMiB, 5 * kMiB, 4},
        {99 * kMiB, 5 * kMiB, 4},
        {100 * kMiB, 10 * kMiB, 6},
        {1023 * kMiB, 10 * kMiB, 6},
        {1024 * kMiB, 25 * kMiB, 8},
        {50ULL * 1024 * kMiB, 25 * kMiB, 8},
    };

    for (const auto& c : cases) {
        const auto strategy = ChunkingStrategy::for_file_size(c.file_size);
        EXPECT_EQ(strategy.chunk_size, c.chunk_size) << "file_size=" << c.file_size;
        EXPECT_EQ(strategy.max_concurrent_chunks, c.concurrency) << "file_size=" << c.file_size;
    }
}

TEST(ChunkingStrategyTest, ChunkCountRoundsUpAndEmptyFileHasOneChunk) {
    ChunkingStrategy strategy;
    strategy.chunk_size = 1 * kMiB;

    EXPECT_EQ(strategy.chunk_count(0), 1u);
    EXPECT_EQ(strategy.chunk_count(1), 1u);
    EXPECT_EQ(strategy.chunk_count(kMiB), 1u);
    EXPECT_EQ(strategy.chunk_count(kMiB + 1), 2u);
    EXPECT_EQ(strategy.chunk_count(10 * kMiB), 10u);
}

TEST(ChunkingStrategyTest, ClampedKeepsValuesInRange) {
    ChunkingStrategy tiny;
    tiny.chunk_size = 1;
    tiny.max_concurrent_chunks = 0;
    auto fixed = tiny.clamped();
    EXPECT_EQ(fixed.chunk_size, ChunkingStrategy::kMinChunkSize);
    EXPECT_EQ(fixed.max_concurrent_chunks, 1u);

    ChunkingStrategy huge;
    huge.chunk_size = 1024 * kMiB;
    huge.max_concurrent_chunks = 50;
    fixed = huge.clamped();
    EXPECT_EQ(fixed.chunk_size, ChunkingStrategy::kMaxChunkSize);
    EXPECT_EQ(fixed.max_concurrent_chunks, ChunkingStrategy::kMaxConcurrency);
}

TEST(FileMetadataTest, ExpectedChunkSizeHandlesShortLastChunk) {
    FileMetadata metadata;
    metadata.file_size = 2500;
    metadata.chunk_size = 1000;
    metadata.chunk_count = 3;

    EXPECT_EQ(metadata.expected_chunk_size(0), 1000u);
    EXPECT_EQ(metadata.expected_chunk_size(1), 1000u);
    EXPECT_EQ(metadata.expected_chunk_size(2), 500u);
    EXPECT_EQ(metadata.expected_chunk_size(3), 0u);
}

TEST(FileMetadataTest, SameIdentityComparesContentFields) {
    FileMetadata a;
    a.file_name = "nightly.tar.gz";
    a.file_size = 42;
    a.sha256 = "ab";
    a.chunk_size = 64;
    a.chunk_count = 1;

    FileMetadata b = a;
    EXPECT_TRUE(a.same_identity(b));
    b.sha256 = "cd";
    EXPECT_FALSE(a.same_identity(b));
}

TEST(ChunkStatusTest, NamesRoundTrip) {
    for (auto status : {ChunkStatus::Accepted, ChunkStatus::Duplicate,
                        ChunkStatus::ChecksumMismatch, ChunkStatus::UnknownTransfer}) {
        auto parsed = chunk_status_from_string(to_string(status));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, status);
    }
    EXPECT_FALSE(chunk_status_from_string("Bogus").has_value());
}

TEST(ResumeTokenSerializationTest, PreservesCompletedChunks) {
    ResumeToken token;
    token.token = "RT_1_abc";
    token.transfer_id = "TX_1";
    token.client_id = "db01";
    token.metadata.file_name = "nightly.tar.gz";
    token.metadata.file_size = 2500;
    token.metadata.chunk_size = 1000;
    token.metadata.chunk_count = 3;
    token.completed_chunks[2] = CompletedChunk{500, "cc", from_unix_millis(1700000000123)};
    token.created_at = from_unix_millis(1700000000000);
    token.last_activity = from_unix_millis(1700000000123);

    nlohmann::json doc = token;
    auto parsed = parse_resume_token(doc.dump());
    ASSERT_TRUE(parsed.is_ok());

    const auto& restored = parsed.value();
    EXPECT_EQ(restored.token, "RT_1_abc");
    EXPECT_EQ(restored.client_id, "db01");
    EXPECT_TRUE(restored.metadata.same_identity(token.metadata));
    ASSERT_EQ(restored.completed_chunks.size(), 1u);
    EXPECT_EQ(restored.completed_chunks.at(2).size, 500u);
    EXPECT_EQ(to_unix_millis(restored.last_activity), 1700000000123);
    EXPECT_FALSE(restored.completed);
}

TEST(ResumeTokenSerializationTest, MalformedDocumentIsProtocolError) {
    auto parsed = parse_resume_token("{\"token\": 12");
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().code, mbk::ErrorCode::Protocol);

    auto missing = parse_resume_token("{\"token\": \"RT_1\"}");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, mbk::ErrorCode::Protocol);
}
