/**
 * @file hash_utils.hpp
 * @brief Digests and random identifiers backed by OpenSSL
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace runbox {
namespace utils {

/**
 * @class HashUtils
 * @brief Static OpenSSL helpers
 */
class HashUtils {
public:
    /**
     * @brief SHA-256 of a file, lowercase hex
     * @throws std::runtime_error if the file cannot be read
     */
    static std::string ComputeSHA256(const std::filesystem::path& file_path);

    /**
     * @brief Hex string built from cryptographically random bytes
     *
     * @param num_bytes Number of random bytes (the result has twice as many characters)
     * @throws std::runtime_error if the OpenSSL generator is not seeded
     */
    static std::string RandomHex(std::size_t num_bytes);

    static std::string BinaryToHex(const unsigned char* data, std::size_t length);
};

} // namespace utils
} // namespace runbox
