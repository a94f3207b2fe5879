#include "mbk/transfer/types.hpp"

#include <algorithm>
#include <array>

namespace mbk::transfer {
namespace {

constexpr std::uint64_t kMiB = 1024ULL * 1024;

struct Tier {
    std::uint64_t below;
    std::uint64_t chunk_size;
    std::uint32_t concurrency;
};

constexpr std::array<Tier, 3> kTiers {{
    {10 * kMiB, 1 * kMiB, 2},
    {100 * kMiB, 5 * kMiB, 4},
    {1024 * kMiB, 10 * kMiB, 6},
}};

constexpr std::array<std::pair<ChunkStatus, std::string_view>, 4> kStatusNames {{
    {ChunkStatus::Accepted, "Accepted"},
    {ChunkStatus::Duplicate, "Duplicate"},
    {ChunkStatus::ChecksumMismatch, "ChecksumMismatch"},
    {ChunkStatus::UnknownTransfer, "UnknownTransfer"},
}};

} // namespace

std::uint64_t FileMetadata::expected_chunk_size(std::uint32_t index) const noexcept {
    if (chunk_size == 0 || index >= chunk_count) {
        return 0;
    }
    const std::uint64_t offset = static_cast<std::uint64_t>(index) * chunk_size;
    if (offset >= file_size) {
        return 0;
    }
    return std::min(chunk_size, file_size - offset);
}

bool FileMetadata::same_identity(const FileMetadata& other) const noexcept {
    return file_name == other.file_name && file_size == other.file_size &&
           md5 == other.md5 && sha256 == other.sha256 &&
           chunk_size == other.chunk_size && chunk_count == other.chunk_count;
}

std::string_view to_string(ChunkStatus status) noexcept {
    for (const auto& [value, name] : kStatusNames) {
        if (value == status) {
            return name;
        }
    }
    return "UnknownTransfer";
}

std::optional<ChunkStatus> chunk_status_from_string(std::string_view name) noexcept {
    for (const auto& [value, text] : kStatusNames) {
        if (text == name) {
            return value;
        }
    }
    return std::nullopt;
}

ChunkingStrategy ChunkingStrategy::for_file_size(std::uint64_t file_size) {
    ChunkingStrategy strategy;
    strategy.chunk_size = 25 * kMiB;
    strategy.max_concurrent_chunks = 8;
    for (const auto& tier : kTiers) {
        if (file_size < tier.below) {
            strategy.chunk_size = tier.chunk_size;
            strategy.max_concurrent_chunks = tier.concurrency;
            break;
        }
    }
    return strategy;
}

ChunkingStrategy ChunkingStrategy::clamped() const {
    ChunkingStrategy out = *this;
    out.chunk_size = std::clamp(chunk_size, kMinChunkSize, kMaxChunkSize);
    out.max_concurrent_chunks = std::clamp<std::uint32_t>(max_concurrent_chunks, 1, kMaxConcurrency);
    return out;
}

std::uint32_t ChunkingStrategy::chunk_count(std::uint64_t file_size) const noexcept {
    if (chunk_size == 0) {
        return 0;
    }
    if (file_size == 0) {
        return 1;
    }
    return static_cast<std::uint32_t>((file_size + chunk_size - 1) / chunk_size);
}

} // namespace mbk::transfer
