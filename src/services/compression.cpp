#include "mbk/services/compression.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <memory>
#include <vector>

namespace mbk::services {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kCopyBuffer = 1024 * 1024;
constexpr std::size_t kReadBlock = 64 * 1024;

using ArchiveWriter = std::unique_ptr<archive, decltype(&archive_write_free)>;
using ArchiveReader = std::unique_ptr<archive, decltype(&archive_read_free)>;
using ArchiveEntry = std::unique_ptr<archive_entry, decltype(&archive_entry_free)>;

struct Entry {
    fs::path path;
    std::string name;       ///< Archive name, '/'-separated
    bool directory = false;
    std::uint64_t size = 0;
};

std::string archive_message(archive* a) {
    const char* message = archive_error_string(a);
    return message ? message : "unknown libarchive error";
}

std::int64_t modification_time(const fs::path& path) {
    std::error_code ec;
    const auto time = fs::last_write_time(path, ec);
    if (ec) {
        return 0;
    }
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::file_clock::to_sys(time).time_since_epoch()).count();
}

/// Writes the header of @p entry and, for a regular file, its contents.
Outcome<void> write_entry(archive* out, const Entry& entry, std::vector<char>& buffer,
                          std::uint64_t& processed, const core::CancellationToken& cancel) {
    ArchiveEntry header(archive_entry_new(), &archive_entry_free);
    archive_entry_set_pathname(header.get(), entry.name.c_str());
    archive_entry_set_filetype(header.get(), entry.directory ? AE_IFDIR : AE_IFREG);
    archive_entry_set_perm(header.get(), entry.directory ? 0755 : 0644);
    archive_entry_set_size(header.get(), entry.directory ? 0 : static_cast<la_int64_t>(entry.size));
    archive_entry_set_mtime(header.get(), modification_time(entry.path), 0);

    const int status = archive_write_header(out, header.get());
    if (status < ARCHIVE_WARN) {
        return Fail<void>(ErrorCode::Io, "Cannot add " + entry.name + " to archive: " + archive_message(out));
    }
    if (status == ARCHIVE_WARN) {
        spdlog::warn("Archiving {}: {}", entry.name, archive_message(out));
    }
    if (entry.directory) {
        return Ok();
    }

    std::ifstream in(entry.path, std::ios::binary);
    if (!in) {
        return Fail<void>(ErrorCode::Io, "Cannot open " + entry.path.string());
    }
    std::uint64_t remaining = entry.size;
    while (remaining > 0) {
        if (cancel.is_cancelled()) {
            return Fail<void>(ErrorCode::Cancelled, "Compression cancelled");
        }
        const auto want = static_cast<std::streamsize>(std::min<std::uint64_t>(remaining, buffer.size()));
        in.read(buffer.data(), want);
        if (in.gcount() != want) {
            return Fail<void>(ErrorCode::Io, "File changed while archiving: " + entry.path.string());
        }
        if (archive_write_data(out, buffer.data(), static_cast<std::size_t>(want)) != want) {
            return Fail<void>(ErrorCode::Io, "Archive write failed for " + entry.name + ": " + archive_message(out));
        }
        remaining -= static_cast<std::uint64_t>(want);
        processed += static_cast<std::uint64_t>(want);
    }
    return Ok();
}

Outcome<std::vector<Entry>> collect_entries(const fs::path& source, std::uint64_t& total_bytes) {
    std::vector<Entry> entries;
    const auto root_name = source.filename().string();
    entries.push_back(Entry{source, root_name + "/", true, 0});

    std::error_code ec;
    fs::recursive_directory_iterator it(source, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return Fail<std::vector<Entry>>(ErrorCode::Io, "Cannot read " + source.string() + ": " + ec.message());
    }
    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return Fail<std::vector<Entry>>(ErrorCode::Io, "Cannot read " + source.string() + ": " + ec.message());
        }
        const auto& path = it->path();
        const auto relative = fs::relative(path, source, ec).generic_string();
        if (ec) {
            return Fail<std::vector<Entry>>(ErrorCode::Io, "Cannot relativise " + path.string());
        }

        if (it->is_symlink(ec)) {
            spdlog::warn("Skipping symbolic link {}", path.string());
            it.disable_recursion_pending();
            continue;
        }
        if (it->is_directory(ec)) {
            entries.push_back(Entry{path, root_name + "/" + relative + "/", true, 0});
        } else if (it->is_regular_file(ec)) {
            const auto size = it->file_size(ec);
            if (ec) {
                return Fail<std::vector<Entry>>(ErrorCode::Io, "Cannot stat " + path.string() + ": " + ec.message());
            }
            entries.push_back(Entry{path, root_name + "/" + relative, false, size});
            total_bytes += size;
        } else {
            spdlog::warn("Skipping special file {}", path.string());
        }
    }

    std::sort(entries.begin() + 1, entries.end(), [](const Entry& a, const Entry& b) { return a.name < b.name; });
    return Ok(std::move(entries));
}

bool is_safe_entry(const fs::path& name) {
    if (name.empty() || name.is_absolute() || name.has_root_name()) {
        return false;
    }
    return std::none_of(name.begin(), name.end(), [](const fs::path& part) { return part == ".."; });
}

} // anonymous namespace

Outcome<fs::path> TarGzCompressionService::compress_directory(const fs::path& source,
                                                              const fs::path& target,
                                                              const CompressionProgressCallback& progress,
                                                              const core::CancellationToken& cancel) {
    std::error_code ec;
    if (!fs::is_directory(source, ec)) {
        return Fail<fs::path>(ErrorCode::Io, "Source is not a directory: " + source.string());
    }
    const auto canonical_source = fs::weakly_canonical(source, ec);
    if (ec) {
        return Fail<fs::path>(ErrorCode::Io, "Cannot resolve " + source.string() + ": " + ec.message());
    }
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
    }

    std::uint64_t total_bytes = 0;
    auto entries = collect_entries(canonical_source, total_bytes);
    if (entries.is_error()) {
        return Err<fs::path>(entries.error());
    }

    const auto part = fs::path(target.string() + ".part");
    ArchiveWriter out(archive_write_new(), &archive_write_free);
    archive_write_add_filter_gzip(out.get());
    archive_write_set_format_pax_restricted(out.get());
    const auto level = std::to_string(std::clamp(level_, 1, 9));
    archive_write_set_filter_option(out.get(), "gzip", "compression-level", level.c_str());
    if (archive_write_open_filename(out.get(), part.c_str()) != ARCHIVE_OK) {
        return Fail<fs::path>(ErrorCode::Io, "Cannot create archive " + part.string() + ": " + archive_message(out.get()));
    }

    auto abandon = [&](const Error& error) {
        out.reset();
        std::error_code ignored;
        fs::remove(part, ignored);
        return Err<fs::path>(error);
    };

    spdlog::info("Compressing {} ({} entries, {} bytes) into {}",
                 canonical_source.string(), entries.value().size(), total_bytes, target.string());

    std::vector<char> buffer(kCopyBuffer);
    std::uint64_t processed = 0;

    for (const auto& entry : entries.value()) {
        if (cancel.is_cancelled()) {
            return abandon(Error(ErrorCode::Cancelled, "Compression cancelled"));
        }
        if (auto written = write_entry(out.get(), entry, buffer, processed, cancel); written.is_error()) {
            return abandon(written.error());
        }
        if (!entry.directory && progress) {
            progress(CompressionProgress{
                total_bytes == 0 ? 1.0 : static_cast<double>(processed) / static_cast<double>(total_bytes),
                entry.name, processed, total_bytes});
        }
    }

    if (archive_write_close(out.get()) != ARCHIVE_OK) {
        return abandon(Error(ErrorCode::Io, "Failed to finish archive " + part.string() + ": " + archive_message(out.get())));
    }
    out.reset();

    fs::rename(part, target, ec);
    if (ec) {
        fs::remove(part, ec);
        return Fail<fs::path>(ErrorCode::Io, "Failed to move archive into place: " + target.string());
    }

    if (progress) {
        progress(CompressionProgress{1.0, {}, processed, total_bytes});
    }
    spdlog::info("Archive {} written ({} bytes)", target.string(), fs::file_size(target, ec));
    return Ok(target);
}

Outcome<void> TarGzCompressionService::cleanup(const fs::path& file) {
    std::error_code ec;
    fs::remove(file, ec);
    if (ec) {
        return Fail<void>(ErrorCode::Io, "Failed to remove " + file.string() + ": " + ec.message());
    }
    return Ok();
}

Outcome<void> TarGzCompressionService::extract(const fs::path& archive_path, const fs::path& destination) const {
    ArchiveReader in(archive_read_new(), &archive_read_free);
    archive_read_support_filter_gzip(in.get());
    archive_read_support_format_tar(in.get());
    if (archive_read_open_filename(in.get(), archive_path.c_str(), kReadBlock) != ARCHIVE_OK) {
        return Fail<void>(ErrorCode::Io, "Cannot open archive " + archive_path.string() + ": " + archive_message(in.get()));
    }

    std::error_code ec;
    fs::create_directories(destination, ec);
    std::vector<char> buffer(kCopyBuffer);

    for (;;) {
        archive_entry* header = nullptr;
        const int status = archive_read_next_header(in.get(), &header);
        if (status == ARCHIVE_EOF) {
            break;
        }
        if (status < ARCHIVE_WARN) {
            return Fail<void>(ErrorCode::Io, "Corrupt archive " + archive_path.string() + ": " + archive_message(in.get()));
        }

        const std::string name = archive_entry_pathname(header) ? archive_entry_pathname(header) : "";
        const fs::path relative = fs::path(name).lexically_normal();
        if (!is_safe_entry(relative)) {
            return Fail<void>(ErrorCode::Io, "Unsafe entry '" + name + "' in archive " + archive_path.string());
        }
        const auto output = destination / relative;

        const auto type = archive_entry_filetype(header);
        if (type == AE_IFDIR) {
            fs::create_directories(output, ec);
            if (ec) {
                return Fail<void>(ErrorCode::Io, "Cannot create " + output.string() + ": " + ec.message());
            }
            continue;
        }
        if (type != AE_IFREG) {
            spdlog::warn("Skipping unsupported entry type for {}", name);
            archive_read_data_skip(in.get());
            continue;
        }

        fs::create_directories(output.parent_path(), ec);
        std::ofstream out(output, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Fail<void>(ErrorCode::Io, "Cannot create " + output.string());
        }
        for (;;) {
            const auto got = archive_read_data(in.get(), buffer.data(), buffer.size());
            if (got < 0) {
                return Fail<void>(ErrorCode::Io, "Truncated archive " + archive_path.string() + ": " + archive_message(in.get()));
            }
            if (got == 0) {
                break;
            }
            out.write(buffer.data(), static_cast<std::streamsize>(got));
        }
        if (!out) {
            return Fail<void>(ErrorCode::Io, "Failed writing " + output.string());
        }
    }
    return Ok();
}

} // namespace mbk::services
