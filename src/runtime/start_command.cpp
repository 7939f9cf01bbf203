/**
 * @file start_command.cpp
 * @brief Remote action server entrypoint and devbox naming
 *
 * @date 2025
 */

#include "runbox/runtime/start_command.hpp"

#include "runbox/utils/hash_utils.hpp"
#include "runbox/utils/string_utils.hpp"

#include <sstream>

namespace runbox {
namespace runtime {

namespace {

constexpr const char* kMicromamba = "/openhands/micromamba/bin/micromamba run -n openhands";

} // namespace

std::string BuildStartCommand(const core::RuntimeConfig& config) {
    std::ostringstream server;
    server << kMicromamba << " poetry run"
           << " python -u -m openhands.runtime.client.client " << config.action_server_port
           << " --working-dir " << config.workspace_mount_path_in_sandbox;

    if (!config.plugins.empty()) {
        server << " --plugins " << utils::StringUtils::Join(config.plugins, " ");
    }

    server << " --username " << (config.run_as_openhands ? "openhands" : "root")
           << " --user-id " << config.user_id;

    if (config.browsergym_eval_env && !config.browsergym_eval_env->empty()) {
        server << " --browsergym-eval-env " << *config.browsergym_eval_env;
    }

    std::ostringstream command;
    command << "export MAMBA_ROOT_PREFIX=/openhands/micromamba && "
            << "cd /openhands/code && "
            << kMicromamba << " poetry config virtualenvs.path /openhands/poetry && "
            << kMicromamba << " poetry run playwright install --with-deps chromium && "
            << server.str();
    return command.str();
}

std::string MakeInstanceName(const std::string& session_id) {
    const std::string sid = session_id.empty() ? "default" : session_id;
    return "runbox-remote-runtime-" + sid + "-" + utils::HashUtils::RandomHex(4);
}

} // namespace runtime
} // namespace runbox
