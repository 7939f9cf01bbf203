/**
 * @file archive_utils.cpp
 * @brief libarchive-backed zip writer for directory transfers
 *
 * The remote side extracts with `unzip`, so the archive is written in zip
 * format with deflate compression. File permissions and modification times
 * are carried over from the local files.
 *
 * @date 2025
 */

#include "runbox/utils/archive_utils.hpp"

#include "runbox/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <archive.h>
#include <archive_entry.h>

#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <utility>

namespace runbox {
namespace utils {

namespace fs = std::filesystem;

namespace {

core::ArchiveError MakeArchiveError(archive* source, const std::string& context) {
    const char* message = archive_error_string(source);
    return core::ArchiveError(context + ": " + (message ? message : "unknown libarchive error"));
}

// Creates an empty, uniquely named file and returns its path
fs::path MakeTempArchivePath() {
    std::string pattern = (fs::temp_directory_path() / "runbox-transfer-XXXXXX.zip").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    int fd = mkstemps(buffer.data(), 4);
    if (fd < 0) {
        throw core::ArchiveError(std::string("Cannot create temporary archive: ")
                                 + std::strerror(errno));
    }
    close(fd);
    return fs::path(buffer.data());
}

void WriteEntry(archive* writer, const ArchiveEntry& item) {
    struct stat st {};
    if (stat(item.source.c_str(), &st) != 0) {
        throw core::ArchiveError("Cannot stat " + item.source.string() + ": " + std::strerror(errno));
    }

    archive_entry* entry = archive_entry_new();
    archive_entry_set_pathname(entry, item.name.c_str());
    archive_entry_set_filetype(entry, item.directory ? AE_IFDIR : AE_IFREG);
    archive_entry_set_perm(entry, st.st_mode & 07777);
    archive_entry_set_size(entry, item.directory ? 0 : st.st_size);
    archive_entry_set_mtime(entry, st.st_mtime, 0);

    if (archive_write_header(writer, entry) != ARCHIVE_OK) {
        archive_entry_free(entry);
        throw MakeArchiveError(writer, "Cannot write header for " + item.name);
    }
    archive_entry_free(entry);

    if (item.directory) {
        return;
    }

    std::ifstream file(item.source, std::ios::binary);
    if (!file.is_open()) {
        throw core::ArchiveError("Failed to open file: " + item.source.string());
    }

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        auto written = archive_write_data(writer, buffer, static_cast<std::size_t>(file.gcount()));
        if (written < 0) {
            throw MakeArchiveError(writer, "Cannot write data for " + item.name);
        }
    }

    if (archive_write_finish_entry(writer) != ARCHIVE_OK) {
        throw MakeArchiveError(writer, "Cannot finish entry " + item.name);
    }
}

} // namespace

std::vector<ArchiveEntry> CollectArchiveEntries(const fs::path& source_dir) {
    // "dir/" and "dir" must both keep "dir" as the top-level entry name
    fs::path root = source_dir;
    if (!root.has_filename()) {
        root = root.parent_path();
    }
    const fs::path base = root.parent_path();

    std::vector<ArchiveEntry> entries;
    entries.push_back({root, root.filename().generic_string() + "/", true});

    for (const auto& item : fs::recursive_directory_iterator(root)) {
        const bool directory = item.is_directory();
        if (!directory && !item.is_regular_file()) {
            continue;
        }
        ArchiveEntry entry;
        entry.source = item.path();
        entry.name = item.path().lexically_relative(base).generic_string();
        entry.directory = directory;
        if (directory) {
            entry.name += '/';
        }
        entries.push_back(std::move(entry));
    }

    std::sort(entries.begin(), entries.end(),
              [](const ArchiveEntry& a, const ArchiveEntry& b) { return a.name < b.name; });
    return entries;
}

TransferArchive TransferArchive::Create(const fs::path& source_dir) {
    if (!fs::is_directory(source_dir)) {
        throw core::ValidationError("Not a directory: " + source_dir.string());
    }

    auto entries = CollectArchiveEntries(source_dir);
    TransferArchive result(MakeTempArchivePath(), std::move(entries));

    archive* writer = archive_write_new();
    if (writer == nullptr) {
        throw core::ArchiveError("archive_write_new failed");
    }

    try {
        if (archive_write_set_format_zip(writer) != ARCHIVE_OK) {
            throw MakeArchiveError(writer, "Cannot select zip format");
        }
        archive_write_zip_set_compression_deflate(writer);

        if (archive_write_open_filename(writer, result.path_.c_str()) != ARCHIVE_OK) {
            throw MakeArchiveError(writer, "Cannot open " + result.path_.string());
        }

        for (const auto& entry : result.entries_) {
            WriteEntry(writer, entry);
        }

        if (archive_write_close(writer) != ARCHIVE_OK) {
            throw MakeArchiveError(writer, "Cannot finalize " + result.path_.string());
        }
    }
    catch (...) {
        archive_write_free(writer);
        throw;
    }
    archive_write_free(writer);

    spdlog::debug("Packed {} file(s) from {} into {} ({} bytes)",
        result.entries_.size(), source_dir.string(), result.path_.string(), result.Size());
    return result;
}

TransferArchive::TransferArchive(fs::path path, std::vector<ArchiveEntry> entries)
    : path_(std::move(path))
    , entries_(std::move(entries)) {
}

TransferArchive::~TransferArchive() {
    Remove();
}

TransferArchive::TransferArchive(TransferArchive&& other) noexcept
    : path_(std::move(other.path_))
    , entries_(std::move(other.entries_)) {
    other.path_.clear();
}

TransferArchive& TransferArchive::operator=(TransferArchive&& other) noexcept {
    if (this != &other) {
        Remove();
        path_ = std::move(other.path_);
        entries_ = std::move(other.entries_);
        other.path_.clear();
    }
    return *this;
}

std::uintmax_t TransferArchive::Size() const {
    std::error_code ec;
    auto size = fs::file_size(path_, ec);
    return ec ? 0 : size;
}

void TransferArchive::Remove() noexcept {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        spdlog::warn("Could not remove temporary archive {}: {}", path_.string(), ec.message());
    }
    path_.clear();
}

} // namespace utils
} // namespace runbox
