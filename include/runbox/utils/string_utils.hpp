/**
 * @file string_utils.hpp
 * @brief String helpers for building remote commands and parsing their output
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace runbox {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string helpers
 *
 * All methods are static - no instantiation required.
 */
class StringUtils {
public:
    /***************************************************************************
     * String Manipulation
     ***************************************************************************/

    static std::string Trim(const std::string& str);

    static std::string ToLower(const std::string& str);

    /**
     * @brief Split on every occurrence of the delimiter
     *
     * Empty tokens are kept, so "a\nb\n" splits on '\n' into
     * {"a", "b", ""} and the empty string splits into {""}.
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Split text into lines, each keeping its trailing '\n'
     *
     * The last line has no terminator when the text does not end with one.
     * Concatenating the result gives back the input.
     */
    static std::vector<std::string> SplitLines(const std::string& text);

    static std::string Join(const std::vector<std::string>& strings,
                            const std::string& delimiter);

    static bool StartsWith(const std::string& str, const std::string& prefix);

    static bool EndsWith(const std::string& str, const std::string& suffix);

    /***************************************************************************
     * Shell
     ***************************************************************************/

    /**
     * @brief Quote an argument for a POSIX shell
     *
     * Wraps the argument in single quotes and escapes embedded single quotes
     * as '\''. The result is always one shell word.
     */
    static std::string ShellQuote(const std::string& argument);
};

} // namespace utils
} // namespace runbox
