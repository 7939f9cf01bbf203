/**
 * @file file_transfer.hpp
 * @brief File upload, recursive directory transfer and remote file access
 *
 * **Recursive transfer protocol**:
 * ```
 * local dir ──zip──> /tmp/runbox-transfer-XXXXXX.zip   (local temp)
 *           ──upload──> /tmp/runbox-upload-<hex>.zip   (remote temp)
 *           ──"unzip -o ... -d <dest> && rm -f <tmp>"──> <dest>/<dir name>/...
 * ```
 * The local archive is removed when the transfer ends. The remote archive
 * is removed by the extraction command, or by a separate cleanup command
 * when upload or extraction fails.
 *
 * @date 2025
 */

#pragma once

#include "runbox/core/command_executor.hpp"
#include "runbox/core/sandbox_handle.hpp"
#include "runbox/provider/sandbox_provider.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace runbox {
namespace core {

/**
 * @struct TransferJob
 * @brief Copy of a local file or directory into a remote directory
 */
struct TransferJob {
    std::filesystem::path source;   ///< Local file or directory
    std::string destination;        ///< Remote directory
    bool recursive{false};          ///< Required when source is a directory
};

/**
 * @brief Select the half-open line range [start, end) of a file
 *
 * Lines keep their terminators. A negative start counts as 0, an end past
 * the last line is clamped, an empty range yields an empty string and a
 * missing end reads to the end of the file.
 */
std::string ReadLines(const std::string& contents, int start, std::optional<int> end);

/**
 * @class FileTransfer
 * @brief File operations against a running devbox
 *
 * Provider failures surface as ProviderStatusError; callers decide whether
 * they become observations.
 */
class FileTransfer {
public:
    /**
     * @param provider Backend used for uploads and file contents
     * @param executor Executor used for mkdir, unzip, cleanup and listing
     * @param remote_temp_dir Remote directory holding uploaded archives
     */
    FileTransfer(provider::SandboxProvider& provider,
                 CommandExecutor& executor,
                 std::string remote_temp_dir = "/tmp");

    /**
     * @brief Local checks of a copy job, made without touching the devbox
     *
     * @throws ValidationError if the source is missing, or is a directory
     *         and the job is not recursive
     */
    static void Validate(const TransferJob& job);

    /**
     * @brief Copy a local file or directory into a remote directory
     *
     * A file lands at `<destination>/<basename>`. A directory lands at
     * `<destination>/<directory name>/...`, empty subdirectories included.
     *
     * @throws ValidationError if the source is missing, or is a directory
     *         and the job is not recursive (no remote call is made)
     * @throws RemoteCommandFailure if mkdir or extraction exits nonzero
     */
    void CopyTo(const SandboxHandle& handle, const TransferJob& job);

    /**
     * @brief Read the lines [start, end) of a remote text file
     */
    std::string Read(const SandboxHandle& handle,
                     const std::string& path,
                     int start = 0,
                     std::optional<int> end = std::nullopt);

    /**
     * @brief Replace the full contents of a remote file
     */
    void Write(const SandboxHandle& handle,
               const std::string& path,
               const std::string& contents);

    /**
     * @brief Names printed by `ls` for a remote path, split on newlines
     *
     * The trailing newline of `ls` output yields a final empty entry.
     * Names containing newlines are split apart.
     */
    std::vector<std::string> ListFiles(const SandboxHandle& handle,
                                       const std::optional<std::string>& path = std::nullopt);

private:
    provider::SandboxProvider& provider_;
    CommandExecutor& executor_;
    std::string remote_temp_dir_;

    void UploadSingleFile(const SandboxHandle& handle,
                          const std::filesystem::path& source,
                          const std::string& destination);
    void UploadDirectory(const SandboxHandle& handle,
                         const std::filesystem::path& source,
                         const std::string& destination);
};

} // namespace core
} // namespace runbox
