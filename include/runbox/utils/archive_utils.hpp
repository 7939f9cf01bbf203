/**
 * @file archive_utils.hpp
 * @brief Transient zip archives for recursive directory transfers
 *
 * A TransferArchive packs a local directory tree into a uniquely named zip
 * file under the system temp directory. Entry names are relative to the
 * parent of the packed directory, so the directory's own name is the top
 * level of the archive:
 *
 * ```
 * /home/me/project/src/main.cpp  ->  project/src/main.cpp
 * ```
 *
 * Directories, including the top one and empty ones, are recorded as
 * entries ending in `/` so extraction recreates the whole tree.
 *
 * The file is deleted when the archive object is destroyed.
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace runbox {
namespace utils {

/**
 * @struct ArchiveEntry
 * @brief One packed file or directory
 */
struct ArchiveEntry {
    std::filesystem::path source;   ///< Local file or directory
    std::string name;               ///< Name inside the archive, `/`-terminated for directories
    bool directory{false};
};

/**
 * @class TransferArchive
 * @brief Owning handle to a temporary zip file
 *
 * Move-only. The temp file lives exactly as long as the owning object.
 */
class TransferArchive {
public:
    /**
     * @brief Pack source_dir with every directory and regular file below it
     *
     * Entries are sorted by name so identical trees give identical entry lists.
     *
     * @throws core::ValidationError if source_dir is not a directory
     * @throws core::ArchiveError if libarchive fails
     */
    static TransferArchive Create(const std::filesystem::path& source_dir);

    ~TransferArchive();

    TransferArchive(TransferArchive&& other) noexcept;
    TransferArchive& operator=(TransferArchive&& other) noexcept;

    TransferArchive(const TransferArchive&) = delete;
    TransferArchive& operator=(const TransferArchive&) = delete;

    const std::filesystem::path& Path() const { return path_; }
    const std::vector<ArchiveEntry>& Entries() const { return entries_; }

    /// Size of the archive file in bytes
    std::uintmax_t Size() const;

private:
    TransferArchive(std::filesystem::path path, std::vector<ArchiveEntry> entries);

    void Remove() noexcept;

    std::filesystem::path path_;
    std::vector<ArchiveEntry> entries_;
};

/**
 * @brief Collect (path, archive name) pairs for a directory tree
 *
 * The first entry is always the top directory itself.
 */
std::vector<ArchiveEntry> CollectArchiveEntries(const std::filesystem::path& source_dir);

} // namespace utils
} // namespace runbox
