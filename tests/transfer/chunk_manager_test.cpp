#include "mbk/services/checksum.hpp"
#include "mbk/services/repositories.hpp"
#include "mbk/transfer/chunk_manager.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <numeric>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using mbk::ErrorCode;
using mbk::services::FileResumeTokenStore;
using mbk::services::InMemoryResumeTokenStore;
using mbk::services::OpenSslChecksumService;
using namespace mbk::transfer;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    fs::path dir = fs::temp_directory_path() / ("mbk_chunk_manager_test_" + std::to_string(counter.fetch_add(1)));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

std::vector<std::uint8_t> make_payload(std::size_t size) {
    std::vector<std::uint8_t> payload(size);
    std::uint32_t state = 2463534242u;
    for (auto& byte : payload) {
        state ^= state << 13;
        state ^= state >> 17;
        state ^= state << 5;
        byte = static_cast<std::uint8_t>(state);
    }
    return payload;
}

std::vector<std::uint8_t> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

class ChunkManagerTest : public ::testing::Test {
protected:
    static constexpr std::uint64_t kChunkSize = 1024;

    void SetUp() override {
        root_ = create_temp_dir();
        options_.staging_root = root_ / "staging";
        options_.storage_root = root_ / "storage";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    FileMetadata metadata_for(const std::vector<std::uint8_t>& payload, const std::string& name = "nightly.tar.gz") const {
        FileMetadata metadata;
        metadata.file_name = name;
        metadata.file_size = payload.size();
        metadata.md5 = checksums_.md5(payload);
        metadata.sha256 = checksums_.sha256(payload);
        metadata.chunk_size = kChunkSize;
        metadata.chunk_count = static_cast<std::uint32_t>(std::max<std::size_t>(1, (payload.size() + kChunkSize - 1) / kChunkSize));
        return metadata;
    }

    std::vector<ChunkData> split(const std::vector<std::uint8_t>& payload) const {
        std::vector<ChunkData> chunks;
        const auto count = std::max<std::size_t>(1, (payload.size() + kChunkSize - 1) / kChunkSize);
        for (std::size_t i = 0; i < count; ++i) {
            ChunkData chunk;
            chunk.index = static_cast<std::uint32_t>(i);
            const auto begin = std::min<std::size_t>(i * kChunkSize, payload.size());
            const auto end = std::min<std::size_t>(begin + kChunkSize, payload.size());
            chunk.data.assign(payload.begin() + begin, payload.begin() + end);
            chunk.checksum = checksums_.md5(chunk.data);
            chunks.push_back(std::move(chunk));
        }
        return chunks;
    }

    fs::path root_;
    ChunkManagerOptions options_;
    OpenSslChecksumService checksums_;
};

} // namespace

TEST_F(ChunkManagerTest, ReassemblesChunksDeliveredOutOfOrder) {
    InMemoryResumeTokenStore tokens;
    ChunkManager manager(options_, checksums_, tokens);

    const auto payload = make_payload(9 * kChunkSize + 500);
    const auto chunks = split(payload);
    ASSERT_EQ(chunks.size(), 10u);

    auto id = manager.initialize_transfer(metadata_for(payload));
    ASSERT_TRUE(id.is_ok());

    std::vector<std::uint32_t> order{0, 2, 1, 3, 4, 5, 6, 7, 8, 9};
    for (auto index : order) {
        auto status = manager.receive_chunk(id.value(), chunks[index]);
        ASSERT_TRUE(status.is_ok());
        EXPECT_EQ(status.value(), ChunkStatus::Accepted) << "chunk " << index;
    }

    auto path = manager.finalize_transfer(id.value());
    ASSERT_TRUE(path.is_ok()) << path.error().message;
    EXPECT_EQ(path.value(), options_.storage_root / "nightly.tar.gz");
    EXPECT_EQ(read_file(path.value()), payload);
    EXPECT_EQ(manager.active_transfers(), 0u);
    EXPECT_FALSE(fs::exists(options_.staging_root / id.value()));
}

TEST_F(ChunkManagerTest, ReverseOrderProducesSameFile) {
    InMemoryResumeTokenStore tokens;
    ChunkManager manager(options_, checksums_, tokens);

    const auto payload = make_payload(5 * kChunkSize);
    auto chunks = split(payload);
    std::reverse(chunks.begin(), chunks.end());

    auto id = manager.initialize_transfer(metadata_for(payload), "db01/reversed.bin");
    ASSERT_TRUE(id.is_ok());
    for (const auto& chunk : chunks) {
        ASSERT_EQ(manager.receive_chunk(id.value(), chunk).value(), ChunkStatus::Accepted);
    }

    auto path = manager.finalize_transfer(id.value());
    ASSERT_TRUE(path.is_ok());
    EXPECT_EQ(path.value(), options_.storage_root / "db01" / "reversed.bin");
    EXPECT_EQ(read_file(path.value()), payload);
}

TEST_F(ChunkManagerTest, DuplicateChunkLeavesStateUnchanged) {
    InMemoryResumeTokenStore tokens;
    ChunkManager manager(options_, checksums_, tokens);

    const auto payload = make_payload(3 * kChunkSize);
    const auto chunks = split(payload);
    auto id = manager.initialize_transfer(metadata_for(payload));
    ASSERT_TRUE(id.is_ok());

    EXPECT_EQ(manager.receive_chunk(id.value(), chunks[1]).value(), ChunkStatus::Accepted);
    EXPECT_EQ(manager.receive_chunk(id.value(), chunks[1]).value(), ChunkStatus::Duplicate);

    auto view = manager.snapshot(id.value());
    ASSERT_TRUE(view.has_value());
    EXPECT_EQ(view->chunks_completed, 1u);
    EXPECT_EQ(view->bytes_received, kChunkSize);
}

TEST_F(ChunkManagerTest, ChecksumMismatchKeepsIndexMissing) {
    InMemoryResumeTokenStore tokens;
    ChunkManager manager(options_, checksums_, tokens);

    const auto payload = make_payload(2 * kChunkSize);
    auto chunks = split(payload);
    auto id = manager.initialize_transfer(metadata_for(payload));
    ASSERT_TRUE(id.is_ok());

    ASSERT_EQ(manager.receive_chunk(id.value(), chunks[0]).value(), ChunkStatus::Accepted);

    auto corrupted = chunks[1];
    corrupted.checksum = std::string(32, '0');
    EXPECT_EQ(manager.receive_chunk(id.value(), corrupted).value(), ChunkStatus::ChecksumMismatch);

    auto early = manager.finalize_transfer(id.value());
    ASSERT_TRUE(early.is_error());
    EXPECT_EQ(early.error().code, ErrorCode::IncompleteTransfer);

    EXPECT_EQ(manager.receive_chunk(id.value(), chunks[1]).value(), ChunkStatus::Accepted);
    auto path = manager.finalize_transfer(id.value());
    ASSERT_TRUE(path.is_ok());
    EXPECT_EQ(read_file(path.value()), payload);
}

TEST_F(ChunkManagerTest, WrongSizedChunkIsRejected) {
    InMemoryResumeTokenStore tokens;
    ChunkManager manager(options_, checksums_, tokens);

    const auto payload = make_payload(2 * kChunkSize);
    auto chunks = split(payload);
    auto id = manager.initialize_transfer(metadata_for(payload));
    ASSERT_TRUE(id.is_ok());

    auto truncated = chunks[0];
    truncated.data.resize(10);
    truncated.checksum = checksums_.md5(truncated.data);
    EXPECT_EQ(manager.receive_chunk(id.value(), truncated).value(), ChunkStatus::ChecksumMismatch);
    EXPECT_EQ(manager.snapshot(id.value())->chunks_completed, 0u);
}

TEST_F(ChunkManagerTest, OutOfRangeIndexIsValidationError) {
    InMemoryResumeTokenStore tokens;
    ChunkManager manager(options_, checksums_, tokens);

    const auto payload = make_payload(kChunkSize);
    auto chunks = split(payload);
    auto id = manager.initialize_transfer(metadata_for(payload));
    ASSERT_TRUE(id.is_ok());

    chunks[0].index = 7;
    auto status = manager.receive_chunk(id.value(), chunks[0]);
    ASSERT_TRUE(status.is_error());
    EXPECT_EQ(status.error().code, ErrorCode::Validation);
}

TEST_F(ChunkManagerTest, UnknownTransferIsReported) {
    InMemoryResumeTokenStore tokens;
    ChunkManager manager(options_, checksums_, tokens);

    const auto chunks = split(make_payload(100));
    auto status = manager.receive_chunk("TX_missing", chunks[0]);
    ASSERT_TRUE(status.is_ok());
    EXPECT_EQ(status.value(), ChunkStatus::UnknownTransfer);

    auto finalized = manager.finalize_transfer("TX_missing");
    ASSERT_TRUE(finalized.is_error());
    EXPECT_EQ(finalized.error().code, ErrorCode::UnknownTransfer);
}

TEST_F(ChunkManagerTest, RejectsInconsistentMetadata) {
    InMemoryResumeTokenStore tokens;
    ChunkManager manager(options_, checksums_, tokens);

    FileMetadata metadata;
    metadata.file_name = "bad.bin";
    metadata.file_size = 10 * kChunkSize;
    metadata.chunk_size = kChunkSize;
    metadata.chunk_count = 3;

    auto id = manager.initialize_transfer(metadata);
    ASSERT_TRUE(id.is_error());
    EXPECT_EQ(id.error().code, ErrorCode::Validation);

    metadata.chunk_size = 0;
    EXPECT_TRUE(manager.initialize_transfer(metadata).is_error());
}

TEST_F(ChunkManagerTest, EmptyFileHasSingleEmptyChunk) {
    InMemoryResumeTokenStore tokens;
    ChunkManager manager(options_, checksums_, tokens);

    const std::vector<std::uint8_t> payload;
    auto id = manager.initialize_transfer(metadata_for(payload, "empty.bin"));
    ASSERT_TRUE(id.is_ok());

    const auto chunks = split(payload);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(manager.receive_chunk(id.value(), chunks[0]).value(), ChunkStatus::Accepted);

    auto path = manager.finalize_transfer(id.value());
    ASSERT_TRUE(path.is_ok()) << path.error().message;
    EXPECT_EQ(fs::file_size(path.value()), 0u);
}

TEST_F(ChunkManagerTest, DeletedChunkFileIsReportedAndCanBeResent) {
    InMemoryResumeTokenStore tokens;
    ChunkManager manager(options_, checksums_, tokens);

    const auto payload = make_payload(10 * kChunkSize);
    const auto chunks = split(payload);
    auto id = manager.initialize_transfer(metadata_for(payload));
    ASSERT_TRUE(id.is_ok());

    for (const auto& chunk : chunks) {
        ASSERT_EQ(manager.receive_chunk(id.value(), chunk).value(), ChunkStatus::Accepted);
    }

    fs::remove(options_.staging_root / id.value() / ChunkManager::chunk_file_name(5));

    auto finalized = manager.finalize_transfer(id.value());
    ASSERT_TRUE(finalized.is_error());
    EXPECT_EQ(finalized.error().code, ErrorCode::IncompleteTransfer);
    EXPECT_NE(finalized.error().message.find('5'), std::string::npos);

    EXPECT_EQ(manager.receive_chunk(id.value(), chunks[5]).value(), ChunkStatus::Accepted);
    auto path = manager.finalize_transfer(id.value());
    ASSERT_TRUE(path.is_ok());
    EXPECT_EQ(read_file(path.value()), payload);
}

TEST_F(ChunkManagerTest, ResumeInfoListsCompletedChunks) {
    InMemoryResumeTokenStore tokens;
    ChunkManager manager(options_, checksums_, tokens);

    const auto payload = make_payload(6 * kChunkSize);
    const auto chunks = split(payload);
    auto id = manager.initialize_transfer(metadata_for(payload));
    ASSERT_TRUE(id.is_ok());

    for (std::uint32_t index : {0u, 1u, 3u}) {
        ASSERT_EQ(manager.receive_chunk(id.value(), chunks[index]).value(), ChunkStatus::Accepted);
    }

    auto token = manager.create_resume_token(id.value());
    ASSERT_TRUE(token.is_ok());
    EXPECT_EQ(token.value().rfind("RT_", 0), 0u);

    auto again = manager.create_resume_token(id.value());
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value(), token.value());

    auto info = manager.get_resume_info(token.value());
    ASSERT_TRUE(info.is_ok());
    EXPECT_EQ(info.value().transfer_id, id.value());
    EXPECT_EQ(info.value().completed_chunks, (std::vector<std::uint32_t>{0, 1, 3}));
    EXPECT_EQ(info.value().last_completed_chunk, 3);
}

TEST_F(ChunkManagerTest, RestoresTransferAfterRestart) {
    FileResumeTokenStore tokens(root_ / "tokens");

    const auto payload = make_payload(10 * kChunkSize);
    const auto chunks = split(payload);
    const auto metadata = metadata_for(payload);

    std::string token;
    {
        ChunkManager first(options_, checksums_, tokens);
        auto id = first.initialize_transfer(metadata, "db01/nightly.tar.gz", "db01");
        ASSERT_TRUE(id.is_ok());
        for (std::uint32_t index = 0; index < 4; ++index) {
            ASSERT_EQ(first.receive_chunk(id.value(), chunks[index]).value(), ChunkStatus::Accepted);
        }
        auto issued = first.create_resume_token(id.value());
        ASSERT_TRUE(issued.is_ok());
        token = issued.value();
    }

    ChunkManager second(options_, checksums_, tokens);
    auto info = second.get_resume_info(token);
    ASSERT_TRUE(info.is_ok());
    EXPECT_EQ(info.value().completed_chunks.size(), 4u);

    auto restored = second.restore_transfer(token, metadata);
    ASSERT_TRUE(restored.is_ok()) << restored.error().message;

    auto view = second.snapshot(restored.value());
    ASSERT_TRUE(view.has_value());
    EXPECT_EQ(view->chunks_completed, 4u);
    EXPECT_EQ(view->client_id, "db01");

    EXPECT_EQ(second.receive_chunk(restored.value(), chunks[2]).value(), ChunkStatus::Duplicate);
    for (std::uint32_t index = 4; index < chunks.size(); ++index) {
        ASSERT_EQ(second.receive_chunk(restored.value(), chunks[index]).value(), ChunkStatus::Accepted);
    }

    auto path = second.finalize_transfer(restored.value());
    ASSERT_TRUE(path.is_ok());
    EXPECT_EQ(path.value(), options_.storage_root / "db01" / "nightly.tar.gz");
    EXPECT_EQ(read_file(path.value()), payload);
    EXPECT_TRUE(tokens.load(token).is_error());
}

TEST_F(ChunkManagerTest, RestoreDropsCorruptedChunks) {
    FileResumeTokenStore tokens(root_ / "tokens");

    const auto payload = make_payload(4 * kChunkSize);
    const auto chunks = split(payload);
    const auto metadata = metadata_for(payload);

    std::string token;
    fs::path staging;
    {
        ChunkManager first(options_, checksums_, tokens);
        auto id = first.initialize_transfer(metadata);
        ASSERT_TRUE(id.is_ok());
        for (std::uint32_t index = 0; index < 3; ++index) {
            ASSERT_EQ(first.receive_chunk(id.value(), chunks[index]).value(), ChunkStatus::Accepted);
        }
        token = first.create_resume_token(id.value()).value();
        staging = options_.staging_root / id.value();
    }

    {
        const auto chunk_path = staging / ChunkManager::chunk_file_name(1);
        auto bytes = read_file(chunk_path);
        ASSERT_EQ(bytes.size(), kChunkSize);
        bytes[10] = static_cast<std::uint8_t>(~bytes[10]);
        std::ofstream out(chunk_path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }

    ChunkManager second(options_, checksums_, tokens);
    auto restored = second.restore_transfer(token);
    ASSERT_TRUE(restored.is_ok());
    EXPECT_EQ(second.snapshot(restored.value())->chunks_completed, 2u);

    auto info = second.get_resume_info(token);
    ASSERT_TRUE(info.is_ok());
    EXPECT_EQ(info.value().completed_chunks, (std::vector<std::uint32_t>{0, 2}));
}

TEST_F(ChunkManagerTest, RestoreRejectsDifferentFile) {
    InMemoryResumeTokenStore tokens;
    ChunkManager manager(options_, checksums_, tokens);

    const auto payload = make_payload(2 * kChunkSize);
    auto id = manager.initialize_transfer(metadata_for(payload));
    ASSERT_TRUE(id.is_ok());
    auto token = manager.create_resume_token(id.value());
    ASSERT_TRUE(token.is_ok());

    auto other = metadata_for(make_payload(2 * kChunkSize + 1), "other.bin");
    auto restored = manager.restore_transfer(token.value(), other);
    ASSERT_TRUE(restored.is_error());
    EXPECT_EQ(restored.error().code, ErrorCode::Validation);

    auto unknown = manager.restore_transfer("RT_0_unknown");
    EXPECT_TRUE(unknown.is_error());
}

TEST_F(ChunkManagerTest, CleanupResumeTokenAbandonsLiveSession) {
    InMemoryResumeTokenStore tokens;
    ChunkManager manager(options_, checksums_, tokens);

    const auto payload = make_payload(2 * kChunkSize);
    const auto chunks = split(payload);
    auto id = manager.initialize_transfer(metadata_for(payload));
    ASSERT_TRUE(id.is_ok());
    ASSERT_EQ(manager.receive_chunk(id.value(), chunks[0]).value(), ChunkStatus::Accepted);
    auto token = manager.create_resume_token(id.value());
    ASSERT_TRUE(token.is_ok());

    ASSERT_TRUE(manager.cleanup_resume_token(token.value()).is_ok());
    EXPECT_EQ(manager.active_transfers(), 0u);
    EXPECT_FALSE(fs::exists(options_.staging_root / id.value()));
    EXPECT_TRUE(tokens.list().empty());
}

TEST_F(ChunkManagerTest, PurgeRemovesExpiredTransfers) {
    options_.max_token_age = std::chrono::hours(0);
    InMemoryResumeTokenStore tokens;
    ChunkManager manager(options_, checksums_, tokens);

    const auto payload = make_payload(2 * kChunkSize);
    const auto chunks = split(payload);
    auto id = manager.initialize_transfer(metadata_for(payload));
    ASSERT_TRUE(id.is_ok());
    ASSERT_EQ(manager.receive_chunk(id.value(), chunks[0]).value(), ChunkStatus::Accepted);

    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    EXPECT_EQ(manager.purge_expired(), 1u);
    EXPECT_EQ(manager.active_transfers(), 0u);
    EXPECT_TRUE(tokens.list().empty());
    EXPECT_FALSE(fs::exists(options_.staging_root / id.value()));
}

TEST_F(ChunkManagerTest, ConcurrentDeliveryStoresEachChunkOnce) {
    InMemoryResumeTokenStore tokens;
    ChunkManager manager(options_, checksums_, tokens);

    const auto payload = make_payload(16 * kChunkSize + 7);
    const auto chunks = split(payload);
    auto id = manager.initialize_transfer(metadata_for(payload));
    ASSERT_TRUE(id.is_ok());

    std::atomic<int> accepted{0};
    std::vector<std::thread> senders;
    for (int t = 0; t < 4; ++t) {
        senders.emplace_back([&, t]() {
            for (std::size_t i = 0; i < chunks.size(); ++i) {
                const auto& chunk = chunks[(i + static_cast<std::size_t>(t) * 5) % chunks.size()];
                auto status = manager.receive_chunk(id.value(), chunk);
                if (status.is_ok() && status.value() == ChunkStatus::Accepted) {
                    accepted.fetch_add(1);
                }
            }
        });
    }
    for (auto& sender : senders) {
        sender.join();
    }

    EXPECT_EQ(accepted.load(), static_cast<int>(chunks.size()));
    auto path = manager.finalize_transfer(id.value());
    ASSERT_TRUE(path.is_ok());
    EXPECT_EQ(read_file(path.value()), payload);
}
