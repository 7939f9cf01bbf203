/**
 * @file file_transfer.cpp
 * @brief Implementation of devbox file operations
 *
 * @date 2025
 */

#include "runbox/core/file_transfer.hpp"

#include "runbox/core/errors.hpp"
#include "runbox/utils/archive_utils.hpp"
#include "runbox/utils/hash_utils.hpp"
#include "runbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace runbox {
namespace core {

namespace fs = std::filesystem;
using utils::StringUtils;

namespace {

std::string JoinRemotePath(const std::string& directory, const std::string& name) {
    if (directory.empty()) {
        return name;
    }
    if (StringUtils::EndsWith(directory, "/")) {
        return directory + name;
    }
    return directory + "/" + name;
}

// Removes an uploaded archive from the devbox unless released
class RemoteTempFile {
public:
    RemoteTempFile(CommandExecutor& executor, const SandboxHandle& handle, std::string path)
        : executor_(executor), handle_(handle), path_(std::move(path)) {}

    ~RemoteTempFile() {
        if (released_) {
            return;
        }
        try {
            auto result = executor_.Execute(handle_, "rm -f " + StringUtils::ShellQuote(path_));
            if (result.exit_code != 0) {
                spdlog::warn("Could not remove remote archive {} (exit {})", path_, result.exit_code);
            }
        }
        catch (const std::exception& e) {
            spdlog::warn("Could not remove remote archive {}: {}", path_, e.what());
        }
    }

    RemoteTempFile(const RemoteTempFile&) = delete;
    RemoteTempFile& operator=(const RemoteTempFile&) = delete;

    const std::string& Path() const { return path_; }

    void Release() { released_ = true; }

private:
    CommandExecutor& executor_;
    const SandboxHandle& handle_;
    std::string path_;
    bool released_{false};
};

} // namespace

std::string ReadLines(const std::string& contents, int start, std::optional<int> end) {
    auto lines = StringUtils::SplitLines(contents);
    const int count = static_cast<int>(lines.size());

    int first = std::min(std::max(start, 0), count);
    int last = end ? std::min(std::max(*end, 0), count) : count;

    std::string selected;
    for (int i = first; i < last; ++i) {
        selected += lines[i];
    }
    return selected;
}

FileTransfer::FileTransfer(provider::SandboxProvider& provider,
                           CommandExecutor& executor,
                           std::string remote_temp_dir)
    : provider_(provider)
    , executor_(executor)
    , remote_temp_dir_(std::move(remote_temp_dir)) {
}

void FileTransfer::Validate(const TransferJob& job) {
    std::error_code ec;
    auto status = fs::status(job.source, ec);
    if (ec || !fs::exists(status)) {
        throw ValidationError("Source does not exist: " + job.source.string());
    }
    if (fs::is_directory(status) && !job.recursive) {
        throw ValidationError("Source is a directory, use a recursive copy: "
                              + job.source.string());
    }
}

void FileTransfer::CopyTo(const SandboxHandle& handle, const TransferJob& job) {
    Validate(job);

    if (fs::is_directory(job.source)) {
        UploadDirectory(handle, job.source, job.destination);
    } else {
        UploadSingleFile(handle, job.source, job.destination);
    }
}

void FileTransfer::UploadSingleFile(const SandboxHandle& handle,
                                    const fs::path& source,
                                    const std::string& destination) {
    executor_.ExecuteChecked(handle, "mkdir -p " + StringUtils::ShellQuote(destination));

    auto remote_path = JoinRemotePath(destination, source.filename().string());
    provider_.UploadFile(handle.Id(), source, remote_path);

    spdlog::info("Copied {} to {}:{}", source.string(), handle.Id(), remote_path);
}

void FileTransfer::UploadDirectory(const SandboxHandle& handle,
                                   const fs::path& source,
                                   const std::string& destination) {
    auto archive = utils::TransferArchive::Create(source);
    spdlog::info("Uploading {} ({} entries, {} bytes, sha256 {})",
        source.string(), archive.Entries().size(), archive.Size(),
        utils::HashUtils::ComputeSHA256(archive.Path()));

    RemoteTempFile remote_archive(executor_, handle,
        JoinRemotePath(remote_temp_dir_, "runbox-upload-" + utils::HashUtils::RandomHex(8) + ".zip"));

    provider_.UploadFile(handle.Id(), archive.Path(), remote_archive.Path());

    const auto quoted_archive = StringUtils::ShellQuote(remote_archive.Path());
    const std::string command = "unzip -o -q " + quoted_archive
                              + " -d " + StringUtils::ShellQuote(destination)
                              + " && rm -f " + quoted_archive;

    auto result = executor_.Execute(handle, command);
    if (result.exit_code != 0) {
        spdlog::error("Extraction into {}:{} failed (exit {})",
            handle.Id(), destination, result.exit_code);
        throw RemoteCommandFailure(command, result.exit_code,
                                   StringUtils::Trim(result.stdout_output));
    }
    remote_archive.Release();

    spdlog::info("Copied {} to {}:{}", source.string(), handle.Id(), destination);
}

std::string FileTransfer::Read(const SandboxHandle& handle,
                               const std::string& path,
                               int start,
                               std::optional<int> end) {
    auto contents = provider_.ReadFileContents(handle.Id(), path);
    return ReadLines(contents, start, end);
}

void FileTransfer::Write(const SandboxHandle& handle,
                         const std::string& path,
                         const std::string& contents) {
    provider_.WriteFileContents(handle.Id(), path, contents);
    spdlog::debug("Wrote {} bytes to {}:{}", contents.size(), handle.Id(), path);
}

std::vector<std::string> FileTransfer::ListFiles(const SandboxHandle& handle,
                                                 const std::optional<std::string>& path) {
    std::string command = "ls";
    if (path && !path->empty()) {
        command += " " + StringUtils::ShellQuote(*path);
    }

    auto result = executor_.Execute(handle, command);
    if (result.exit_code != 0) {
        spdlog::warn("Listing {} exited with {}", path.value_or("."), result.exit_code);
    }
    return StringUtils::Split(result.stdout_output, '\n');
}

} // namespace core
} // namespace runbox
