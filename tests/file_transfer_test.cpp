#include "runbox/core/file_transfer.hpp"

#include "fake_provider.hpp"
#include "temp_dir.hpp"
#include "runbox/core/errors.hpp"
#include "runbox/utils/string_utils.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using runbox::core::CommandExecutor;
using runbox::core::FileTransfer;
using runbox::core::ProviderStatusError;
using runbox::core::ReadLines;
using runbox::core::RemoteCommandFailure;
using runbox::core::SandboxHandle;
using runbox::core::SandboxStatus;
using runbox::core::TransferJob;
using runbox::core::ValidationError;
using runbox::testing::FakeProvider;
using runbox::testing::TempDir;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

const std::string kFiveLines = "one\ntwo\nthree\nfour\nfive\n";

TEST(ReadLinesTest, SelectsHalfOpenRange) {
    EXPECT_EQ(ReadLines(kFiveLines, 2, 4), "three\nfour\n");
}

TEST(ReadLinesTest, ReadsToEndWithoutEnd) {
    EXPECT_EQ(ReadLines(kFiveLines, 0, std::nullopt), kFiveLines);
    EXPECT_EQ(ReadLines(kFiveLines, 3, std::nullopt), "four\nfive\n");
}

TEST(ReadLinesTest, ClampsOutOfRangeBounds) {
    EXPECT_EQ(ReadLines(kFiveLines, -4, 1), "one\n");
    EXPECT_EQ(ReadLines(kFiveLines, 4, 100), "five\n");
    EXPECT_EQ(ReadLines(kFiveLines, 10, std::nullopt), "");
}

TEST(ReadLinesTest, EmptyRangeIsEmpty) {
    EXPECT_EQ(ReadLines(kFiveLines, 3, 3), "");
    EXPECT_EQ(ReadLines(kFiveLines, 4, 2), "");
    EXPECT_EQ(ReadLines("", 0, std::nullopt), "");
}

TEST(ReadLinesTest, KeepsUnterminatedLastLine) {
    EXPECT_EQ(ReadLines("a\nb", 1, std::nullopt), "b");
}

class FileTransferTest : public ::testing::Test {
protected:
    FakeProvider provider;
    CommandExecutor executor{provider};
    FileTransfer transfer{provider, executor};
    SandboxHandle handle{"dbx_fake", SandboxStatus::RUNNING, "runbox"};
    TempDir local;

    std::vector<std::string> RemoteFiles() const {
        std::vector<std::string> names;
        for (const auto& item : provider.files) {
            names.push_back(item.first);
        }
        return names;
    }

    bool HasUploadArchive() const {
        for (const auto& item : provider.files) {
            if (item.first.find("/tmp/runbox-upload-") == 0) {
                return true;
            }
        }
        return false;
    }
};

TEST_F(FileTransferTest, MissingSourceIsRejectedLocally) {
    TransferJob job{local.Path() / "nope.txt", "/workspace", false};
    EXPECT_THROW(transfer.CopyTo(handle, job), ValidationError);
    EXPECT_EQ(provider.TotalCalls(), 0);
}

TEST_F(FileTransferTest, DirectoryWithoutRecursiveIsRejectedLocally) {
    local.WriteFile("project/a.txt", "a");
    TransferJob job{local.Path() / "project", "/workspace", false};

    EXPECT_THROW(transfer.CopyTo(handle, job), ValidationError);
    EXPECT_EQ(provider.TotalCalls(), 0);
}

TEST_F(FileTransferTest, SingleFileLandsUnderDestination) {
    auto source = local.WriteFile("notes.txt", "remember\n");

    transfer.CopyTo(handle, TransferJob{source, "/workspace/docs", false});

    EXPECT_THAT(provider.Commands(), ElementsAre("mkdir -p '/workspace/docs'"));
    EXPECT_EQ(provider.files.at("/workspace/docs/notes.txt"), "remember\n");
    EXPECT_EQ(provider.Calls("upload"), 1);
}

TEST_F(FileTransferTest, RecursiveFlagOnPlainFileUploadsTheFile) {
    auto source = local.WriteFile("notes.txt", "x");

    transfer.CopyTo(handle, TransferJob{source, "/workspace/", true});

    EXPECT_EQ(provider.files.at("/workspace/notes.txt"), "x");
}

TEST_F(FileTransferTest, MkdirFailureStopsBeforeUpload) {
    provider.mkdir_exit_code = 1;
    auto source = local.WriteFile("notes.txt", "x");

    EXPECT_THROW(transfer.CopyTo(handle, TransferJob{source, "/root/locked", false}),
                 RemoteCommandFailure);
    EXPECT_EQ(provider.Calls("upload"), 0);
}

TEST_F(FileTransferTest, RecursiveCopyRecreatesTree) {
    local.WriteFile("project/README.md", "# project\n");
    local.WriteFile("project/src/main.cpp", "int main() {}\n");
    local.WriteFile("project/src/util/helpers.h", "#pragma once\n");

    transfer.CopyTo(handle, TransferJob{local.Path() / "project", "/workspace", true});

    EXPECT_THAT(RemoteFiles(), ElementsAre(
        "/workspace/project/README.md",
        "/workspace/project/src/main.cpp",
        "/workspace/project/src/util/helpers.h"));
    EXPECT_EQ(provider.files.at("/workspace/project/src/main.cpp"), "int main() {}\n");
    EXPECT_FALSE(HasUploadArchive());
}

TEST_F(FileTransferTest, RecursiveCopyOfEmptyDirectoryCreatesIt) {
    std::filesystem::create_directories(local.Path() / "empty");

    transfer.CopyTo(handle, TransferJob{local.Path() / "empty", "/workspace", true});

    EXPECT_THAT(provider.directories, ElementsAre("/workspace/empty"));
    EXPECT_THAT(RemoteFiles(), ElementsAre());
    EXPECT_THAT(transfer.ListFiles(handle), ElementsAre("empty", ""));
}

TEST_F(FileTransferTest, RecursiveCopyKeepsEmptySubdirectories) {
    std::filesystem::create_directories(local.Path() / "project" / "build" / "cache");
    std::filesystem::create_directories(local.Path() / "project" / "logs");

    transfer.CopyTo(handle, TransferJob{local.Path() / "project", "/workspace", true});

    EXPECT_THAT(provider.directories, ElementsAre(
        "/workspace/project",
        "/workspace/project/build",
        "/workspace/project/build/cache",
        "/workspace/project/logs"));
    EXPECT_FALSE(HasUploadArchive());
}

TEST_F(FileTransferTest, ValidateChecksLocallyOnly) {
    local.WriteFile("project/a.txt", "a");

    EXPECT_THROW(FileTransfer::Validate(TransferJob{local.Path() / "project", "/w", false}),
                 ValidationError);
    EXPECT_THROW(FileTransfer::Validate(TransferJob{local.Path() / "missing", "/w", true}),
                 ValidationError);
    EXPECT_NO_THROW(FileTransfer::Validate(TransferJob{local.Path() / "project", "/w", true}));
    EXPECT_NO_THROW(FileTransfer::Validate(TransferJob{local.Path() / "project" / "a.txt", "/w", false}));
    EXPECT_EQ(provider.TotalCalls(), 0);
}

TEST_F(FileTransferTest, RecursiveCopyIsRepeatable) {
    local.WriteFile("project/a.txt", "first");
    TransferJob job{local.Path() / "project", "/workspace", true};

    transfer.CopyTo(handle, job);
    local.WriteFile("project/a.txt", "second");
    transfer.CopyTo(handle, job);

    EXPECT_THAT(RemoteFiles(), ElementsAre("/workspace/project/a.txt"));
    EXPECT_EQ(provider.files.at("/workspace/project/a.txt"), "second");
}

TEST_F(FileTransferTest, ExtractionCommandOverwritesAndCleansUp) {
    local.WriteFile("project/a.txt", "a");

    transfer.CopyTo(handle, TransferJob{local.Path() / "project", "/workspace", true});

    auto commands = provider.Commands();
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_THAT(commands[0], HasSubstr("unzip -o -q '/tmp/runbox-upload-"));
    EXPECT_THAT(commands[0], HasSubstr(".zip' -d '/workspace' && rm -f '/tmp/runbox-upload-"));
}

TEST_F(FileTransferTest, UploadedArchiveNamesAreUnique) {
    local.WriteFile("project/a.txt", "a");
    TransferJob job{local.Path() / "project", "/workspace", true};

    transfer.CopyTo(handle, job);
    transfer.CopyTo(handle, job);

    auto commands = provider.Commands();
    ASSERT_EQ(commands.size(), 2u);
    EXPECT_NE(commands[0], commands[1]);
}

TEST_F(FileTransferTest, FailedExtractionRemovesRemoteArchive) {
    provider.unzip_exit_code = 9;
    local.WriteFile("project/a.txt", "a");

    EXPECT_THROW(transfer.CopyTo(handle, TransferJob{local.Path() / "project", "/workspace", true}),
                 RemoteCommandFailure);

    auto commands = provider.Commands();
    ASSERT_EQ(commands.size(), 2u);
    EXPECT_THAT(commands[1], HasSubstr("rm -f '/tmp/runbox-upload-"));
    EXPECT_FALSE(HasUploadArchive());
}

TEST_F(FileTransferTest, FailedUploadStillCleansUp) {
    provider.fail_upload = true;
    local.WriteFile("project/a.txt", "a");

    EXPECT_THROW(transfer.CopyTo(handle, TransferJob{local.Path() / "project", "/workspace", true}),
                 ProviderStatusError);

    auto commands = provider.Commands();
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_THAT(commands[0], HasSubstr("rm -f '/tmp/runbox-upload-"));
}

TEST_F(FileTransferTest, ReadSelectsLinesFromRemoteFile) {
    provider.files["/workspace/log.txt"] = kFiveLines;

    EXPECT_EQ(transfer.Read(handle, "/workspace/log.txt", 1, 3), "two\nthree\n");
    EXPECT_EQ(transfer.Read(handle, "/workspace/log.txt"), kFiveLines);
}

TEST_F(FileTransferTest, ReadMissingFileRaisesProviderError) {
    EXPECT_THROW(transfer.Read(handle, "/workspace/missing"), ProviderStatusError);
}

TEST_F(FileTransferTest, WriteReplacesContents) {
    provider.files["/workspace/a.txt"] = "old contents";

    transfer.Write(handle, "/workspace/a.txt", "new");

    EXPECT_EQ(provider.files.at("/workspace/a.txt"), "new");
}

TEST_F(FileTransferTest, ListFilesKeepsTrailingEmptyEntry) {
    provider.files["/workspace/a.txt"] = "";
    provider.files["/workspace/b.txt"] = "";

    EXPECT_THAT(transfer.ListFiles(handle), ElementsAre("a.txt", "b.txt", ""));
    EXPECT_THAT(provider.Commands(), ElementsAre("ls"));
}

TEST_F(FileTransferTest, ListFilesQuotesPath) {
    provider.files["/data/sets/x.csv"] = "";

    EXPECT_THAT(transfer.ListFiles(handle, std::string("/data")), ElementsAre("sets", ""));
    EXPECT_THAT(provider.Commands(), ElementsAre("ls '/data'"));
}

}  // namespace
