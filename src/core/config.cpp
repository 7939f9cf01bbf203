/**
 * @file config.cpp
 * @brief RuntimeConfig loading (nlohmann::json) and validation
 *
 * @date 2025
 */

#include "runbox/core/config.hpp"

#include "runbox/core/errors.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <limits>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace runbox {
namespace core {

namespace {

template <typename T>
void ReadKey(const json& document, const char* key, T& target) {
    auto it = document.find(key);
    if (it == document.end() || it->is_null()) {
        return;
    }
    target = it->get<T>();
}

// Integers only, within [min, max]; floats and out-of-range values are rejected
template <typename T>
void ReadIntegerKey(const json& document, const char* key, T& target,
                    long long min = std::numeric_limits<T>::min(),
                    long long max = std::numeric_limits<T>::max()) {
    auto it = document.find(key);
    if (it == document.end() || it->is_null()) {
        return;
    }
    if (!it->is_number_integer()) {
        throw ConfigError(std::string(key) + " must be an integer");
    }

    const std::string range = " must be in " + std::to_string(min) + ".." + std::to_string(max);
    if (it->is_number_unsigned()) {
        auto value = it->get<std::uint64_t>();
        if (max < 0 || value > static_cast<std::uint64_t>(max)) {
            throw ConfigError(std::string(key) + range);
        }
        target = static_cast<T>(value);
        return;
    }

    auto value = it->get<std::int64_t>();
    if (value < min || value > max) {
        throw ConfigError(std::string(key) + range);
    }
    target = static_cast<T>(value);
}

template <typename T>
void ReadOptionalKey(const json& document, const char* key, std::optional<T>& target) {
    auto it = document.find(key);
    if (it == document.end() || it->is_null()) {
        return;
    }
    target = it->get<T>();
}

} // namespace

RuntimeConfig ParseConfig(const std::string& json_text) {
    RuntimeConfig config;

    try {
        auto document = json::parse(json_text);
        if (!document.is_object()) {
            throw ConfigError("Configuration must be a JSON object");
        }

        ReadKey(document, "api_key", config.api_key);
        ReadKey(document, "base_url", config.base_url);
        ReadKey(document, "workspace_mount_path_in_sandbox", config.workspace_mount_path_in_sandbox);
        ReadIntegerKey(document, "keep_alive_seconds", config.keep_alive_seconds);
        ReadKey(document, "prebuilt_image", config.prebuilt_image);
        ReadKey(document, "debug", config.debug);
        ReadKey(document, "environment", config.environment);
        ReadKey(document, "shell_name", config.shell_name);
        ReadKey(document, "plugins", config.plugins);
        ReadIntegerKey(document, "action_server_port", config.action_server_port, 0, 65535);
        ReadKey(document, "run_as_openhands", config.run_as_openhands);
        ReadIntegerKey(document, "user_id", config.user_id, 0);
        ReadOptionalKey(document, "browsergym_eval_env", config.browsergym_eval_env);
        ReadKey(document, "expose_action_server", config.expose_action_server);
        ReadIntegerKey(document, "readiness_max_attempts", config.readiness_max_attempts);
        ReadKey(document, "terminate_on_close", config.terminate_on_close);
        ReadOptionalKey(document, "attach_devbox_id", config.attach_devbox_id);

        long long timeout_seconds = config.sandbox_timeout.count();
        ReadIntegerKey(document, "sandbox_timeout_seconds", timeout_seconds);
        config.sandbox_timeout = std::chrono::seconds(timeout_seconds);

        long long interval_ms = config.readiness_interval.count();
        ReadIntegerKey(document, "readiness_interval_ms", interval_ms);
        config.readiness_interval = std::chrono::milliseconds(interval_ms);
    }
    catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid configuration: ") + e.what());
    }

    return config;
}

RuntimeConfig LoadConfig(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open configuration file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto config = ParseConfig(buffer.str());
    ApplyEnvironmentOverrides(config);

    spdlog::debug("Loaded configuration from {}", path.string());
    return config;
}

void ApplyEnvironmentOverrides(RuntimeConfig& config) {
    if (const char* api_key = std::getenv("RUNLOOP_API_KEY"); api_key && *api_key) {
        config.api_key = api_key;
    }
    if (const char* base_url = std::getenv("RUNLOOP_BASE_URL"); base_url && *base_url) {
        config.base_url = base_url;
    }
}

void ValidateConfig(const RuntimeConfig& config) {
    if (config.api_key.empty()) {
        throw ConfigError("api_key is required (set it in the config or RUNLOOP_API_KEY)");
    }
    if (config.base_url.empty()) {
        throw ConfigError("base_url must not be empty");
    }
    if (config.keep_alive_seconds <= 0) {
        throw ConfigError("keep_alive_seconds must be > 0");
    }
    if (config.readiness_max_attempts <= 0) {
        throw ConfigError("readiness_max_attempts must be > 0");
    }
    if (config.readiness_interval.count() < 0) {
        throw ConfigError("readiness_interval_ms must be >= 0");
    }
    if (config.shell_name.empty()) {
        throw ConfigError("shell_name must not be empty");
    }
    if (config.sandbox_timeout.count() <= 0) {
        throw ConfigError("sandbox_timeout_seconds must be > 0");
    }
    if (config.expose_action_server
        && (config.action_server_port <= 0 || config.action_server_port > 65535)) {
        throw ConfigError("action_server_port must be in 1..65535");
    }
}

} // namespace core
} // namespace runbox
