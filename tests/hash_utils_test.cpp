#include "runbox/utils/hash_utils.hpp"

#include "temp_dir.hpp"

#include "gtest/gtest.h"

#include <regex>

namespace {

using runbox::utils::HashUtils;

const char* kAbcDigest = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

TEST(HashUtilsTest, FileDigest) {
    runbox::testing::TempDir dir;
    auto file = dir.WriteFile("abc.txt", "abc");
    EXPECT_EQ(HashUtils::ComputeSHA256(file), kAbcDigest);
}

TEST(HashUtilsTest, EmptyFileDigest) {
    runbox::testing::TempDir dir;
    auto file = dir.WriteFile("empty", "");
    EXPECT_EQ(HashUtils::ComputeSHA256(file),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(HashUtilsTest, MissingFileThrows) {
    EXPECT_THROW(HashUtils::ComputeSHA256(std::filesystem::path("/nonexistent/file")),
                 std::runtime_error);
}

TEST(HashUtilsTest, RandomHexLength) {
    EXPECT_TRUE(std::regex_match(HashUtils::RandomHex(8), std::regex("[0-9a-f]{16}")));
    EXPECT_EQ(HashUtils::RandomHex(0), "");
}

}  // namespace
