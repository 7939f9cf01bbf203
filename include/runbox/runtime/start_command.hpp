/**
 * @file start_command.hpp
 * @brief Entrypoint that launches the remote action server inside a devbox
 *
 * @date 2025
 */

#pragma once

#include "runbox/core/config.hpp"

#include <string>

namespace runbox {
namespace runtime {

/**
 * @brief Build the devbox entrypoint for the remote action server
 *
 * Bootstraps the micromamba/poetry environment, installs the headless
 * browser, then starts the action server on config.action_server_port
 * with the workspace, plugin list, user and optional browsergym
 * evaluation environment from the configuration.
 */
std::string BuildStartCommand(const core::RuntimeConfig& config);

/**
 * @brief Human-readable devbox name for an agent session
 *
 * `runbox-remote-runtime-<session_id>-<random hex>`; an empty session id
 * is replaced by "default".
 */
std::string MakeInstanceName(const std::string& session_id);

} // namespace runtime
} // namespace runbox
