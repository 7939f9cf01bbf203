/**
 * @file config.hpp
 * @brief Runtime configuration, JSON loading and validation
 *
 * **JSON layout** (every key optional):
 * ```json
 * {
 *   "api_key": "...",
 *   "base_url": "https://api.runloop.ai",
 *   "workspace_mount_path_in_sandbox": "/workspace",
 *   "keep_alive_seconds": 1800,
 *   "prebuilt_image": "openhands",
 *   "debug": false,
 *   "plugins": ["agent_skills", "jupyter"],
 *   "sandbox_timeout_seconds": 120,
 *   "shell_name": "runbox",
 *   "action_server_port": 60000,
 *   "run_as_openhands": true,
 *   "user_id": 1000,
 *   "browsergym_eval_env": null,
 *   "readiness_max_attempts": 90,
 *   "readiness_interval_ms": 750,
 *   "terminate_on_close": true,
 *   "attach_devbox_id": null,
 *   "expose_action_server": true,
 *   "environment": {"KEY": "value"}
 * }
 * ```
 *
 * RUNLOOP_API_KEY and RUNLOOP_BASE_URL override the file.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace runbox {
namespace core {

/**
 * @struct RuntimeConfig
 * @brief Everything the devbox runtime needs to provision and drive a devbox
 */
struct RuntimeConfig {
    // Provider
    std::string api_key;                                         ///< Bearer token
    std::string base_url{"https://api.runloop.ai"};              ///< Provider API root
    std::chrono::seconds sandbox_timeout{120};                   ///< Per-request timeout

    // Devbox
    std::string workspace_mount_path_in_sandbox{"/workspace"};   ///< Shell working directory
    int keep_alive_seconds{1800};                                ///< Idle lifetime
    std::string prebuilt_image{"openhands"};                     ///< Prebuilt image id
    bool debug{false};                                           ///< Adds DEBUG=true to the devbox env
    std::map<std::string, std::string> environment;              ///< Extra devbox env vars
    std::string shell_name{"runbox"};                            ///< Named shell session

    // Remote action server
    std::vector<std::string> plugins;                            ///< Plugin names
    int action_server_port{60000};                               ///< Port tunneled to the outside
    bool run_as_openhands{true};                                 ///< Otherwise root
    int user_id{1000};
    std::optional<std::string> browsergym_eval_env;
    bool expose_action_server{true};                             ///< Start server and create tunnel

    // Readiness
    int readiness_max_attempts{90};
    std::chrono::milliseconds readiness_interval{750};

    // Lifetime
    bool terminate_on_close{true};                               ///< Shut down devboxes we created
    std::optional<std::string> attach_devbox_id;                 ///< Reuse instead of create
};

/**
 * @brief Load configuration from a JSON file, then apply environment overrides
 *
 * @throws ConfigError if the file cannot be read, is not JSON, or a key has
 *         the wrong type
 */
RuntimeConfig LoadConfig(const std::filesystem::path& path);

/**
 * @brief Parse configuration from JSON text (no environment overrides)
 *
 * @throws ConfigError on malformed JSON or wrong value types
 */
RuntimeConfig ParseConfig(const std::string& json_text);

/**
 * @brief Apply RUNLOOP_API_KEY / RUNLOOP_BASE_URL when set
 */
void ApplyEnvironmentOverrides(RuntimeConfig& config);

/**
 * @brief Reject configurations the runtime cannot work with
 *
 * @throws ConfigError naming the first invalid field
 */
void ValidateConfig(const RuntimeConfig& config);

/**
 * @class RuntimeConfigBuilder
 * @brief Fluent API for constructing runtime configurations
 *
 * **Usage Example**:
 * @code
 * auto config = RuntimeConfigBuilder()
 *     .WithApiKey(key)
 *     .WithKeepAlive(3600)
 *     .WithPlugins({"agent_skills"})
 *     .Build();
 * @endcode
 */
class RuntimeConfigBuilder {
public:
    RuntimeConfigBuilder& WithApiKey(const std::string& api_key) {
        config_.api_key = api_key;
        return *this;
    }

    RuntimeConfigBuilder& WithBaseUrl(const std::string& base_url) {
        config_.base_url = base_url;
        return *this;
    }

    RuntimeConfigBuilder& WithWorkspace(const std::string& path) {
        config_.workspace_mount_path_in_sandbox = path;
        return *this;
    }

    RuntimeConfigBuilder& WithKeepAlive(int seconds) {
        config_.keep_alive_seconds = seconds;
        return *this;
    }

    RuntimeConfigBuilder& WithPrebuiltImage(const std::string& image) {
        config_.prebuilt_image = image;
        return *this;
    }

    RuntimeConfigBuilder& WithPlugins(const std::vector<std::string>& plugins) {
        config_.plugins = plugins;
        return *this;
    }

    RuntimeConfigBuilder& WithReadiness(int max_attempts, std::chrono::milliseconds interval) {
        config_.readiness_max_attempts = max_attempts;
        config_.readiness_interval = interval;
        return *this;
    }

    RuntimeConfigBuilder& WithActionServer(bool expose, int port = 60000) {
        config_.expose_action_server = expose;
        config_.action_server_port = port;
        return *this;
    }

    RuntimeConfigBuilder& AttachTo(const std::string& devbox_id) {
        config_.attach_devbox_id = devbox_id;
        return *this;
    }

    RuntimeConfigBuilder& TerminateOnClose(bool terminate) {
        config_.terminate_on_close = terminate;
        return *this;
    }

    RuntimeConfigBuilder& EnableDebug(bool enable = true) {
        config_.debug = enable;
        return *this;
    }

    RuntimeConfig Build() const {
        return config_;
    }

private:
    RuntimeConfig config_;
};

} // namespace core
} // namespace runbox
