/**
 * @file events.hpp
 * @brief Actions accepted by the devbox runtime and observations it returns
 *
 * @date 2025
 */

#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace runbox {
namespace runtime {

/***************************************************************************
 * Actions
 ***************************************************************************/

struct CmdRunAction {
    std::string command;
    int id{0};                       ///< Echoed back as command_id
};

struct FileReadAction {
    std::string path;
    int start{0};                    ///< First line (0-based, inclusive)
    std::optional<int> end;          ///< Last line (exclusive), end of file when unset
};

struct FileWriteAction {
    std::string path;
    std::string content;
};

struct CopyToAction {
    std::filesystem::path host_src;
    std::string sandbox_dest;
    bool recursive{false};
};

struct ListFilesAction {
    std::optional<std::string> path;
};

struct IPythonRunCellAction {
    std::string code;
};

struct BrowseURLAction {
    std::string url;
};

struct BrowseInteractiveAction {
    std::string browser_actions;
};

/***************************************************************************
 * Observations
 ***************************************************************************/

struct CmdOutputObservation {
    std::string content;
    int command_id{0};
    std::string command;
    int exit_code{0};
};

struct FileReadObservation {
    std::string content;
    std::string path;
};

struct FileWriteObservation {
    std::string content;
    std::string path;
};

struct ErrorObservation {
    std::string content;
};

using Observation = std::variant<CmdOutputObservation,
                                 FileReadObservation,
                                 FileWriteObservation,
                                 ErrorObservation>;

inline bool IsError(const Observation& observation) {
    return std::holds_alternative<ErrorObservation>(observation);
}

/**
 * @brief JSON form of an observation: {"observation": <kind>, ...fields}
 */
nlohmann::json ToJson(const Observation& observation);

} // namespace runtime
} // namespace runbox
