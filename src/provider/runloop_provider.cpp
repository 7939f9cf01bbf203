/**
 * @file runloop_provider.cpp
 * @brief Runloop REST implementation of SandboxProvider
 *
 * Request and response bodies are JSON (nlohmann::json). Any non-2xx
 * answer, or a 2xx answer whose body cannot be parsed, becomes a
 * ProviderStatusError carrying the provider's message.
 *
 * @date 2025
 */

#include "runbox/provider/runloop_provider.hpp"

#include "runbox/core/errors.hpp"
#include "runbox/utils/string_utils.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace runbox {
namespace provider {

namespace {

void CheckResponse(const utils::HttpResponse& response, const std::string& operation) {
    if (!response.Ok()) {
        auto message = ExtractErrorMessage(response.status_code, response.body);
        spdlog::debug("{} failed with HTTP {}: {}", operation, response.status_code, message);
        throw core::ProviderStatusError(static_cast<int>(response.status_code), message);
    }
}

json ParseBody(const utils::HttpResponse& response, const std::string& operation) {
    try {
        return json::parse(response.body);
    }
    catch (const json::parse_error& e) {
        throw core::ProviderStatusError(static_cast<int>(response.status_code),
            operation + " returned malformed JSON: " + e.what());
    }
}

DevboxInfo ToDevboxInfo(const json& body, const std::string& operation) {
    try {
        DevboxInfo info;
        info.id = body.at("id").get<std::string>();
        info.status = ParseDevboxStatus(body.value("status", std::string()));
        info.name = body.contains("name") && body["name"].is_string()
                  ? body["name"].get<std::string>() : std::string();
        return info;
    }
    catch (const json::exception& e) {
        throw core::ProviderStatusError(200, operation + " returned an unexpected devbox view: " + e.what());
    }
}

} // namespace

core::SandboxStatus ParseDevboxStatus(const std::string& status) {
    const auto value = utils::StringUtils::ToLower(utils::StringUtils::Trim(status));

    if (value == "running") {
        return core::SandboxStatus::RUNNING;
    }
    if (value == "failure" || value == "failed") {
        return core::SandboxStatus::FAILED;
    }
    if (value == "shutdown" || value == "suspended") {
        return core::SandboxStatus::STOPPED;
    }
    return core::SandboxStatus::PENDING;
}

std::string ExtractErrorMessage(long status_code, const std::string& body) {
    auto document = json::parse(body, nullptr, false);
    if (!document.is_discarded() && document.is_object()) {
        for (const char* key : {"message", "detail", "error"}) {
            auto it = document.find(key);
            if (it != document.end() && it->is_string()) {
                return it->get<std::string>();
            }
        }
    }

    auto trimmed = utils::StringUtils::Trim(body);
    if (!trimmed.empty()) {
        return trimmed;
    }
    return "HTTP " + std::to_string(status_code);
}

RunloopProvider::RunloopProvider(const core::RuntimeConfig& config)
    : http_(config.base_url, config.api_key, config.sandbox_timeout) {
    spdlog::debug("Runloop provider: {}", http_.BaseUrl());
}

std::string RunloopProvider::DevboxPath(const std::string& devbox_id, const std::string& suffix) {
    return "/v1/devboxes/" + devbox_id + suffix;
}

DevboxInfo RunloopProvider::Create(const CreateDevboxRequest& request) {
    json body = {
        {"name", request.name},
        {"prebuilt", request.prebuilt_image},
        {"environment_variables", request.environment},
        {"launch_parameters", {
            {"keep_alive_time_seconds", request.keep_alive_seconds},
            {"available_ports", request.available_ports}
        }}
    };
    if (request.entrypoint) {
        body["entrypoint"] = *request.entrypoint;
    }

    auto response = http_.PostJson("/v1/devboxes", body.dump());
    CheckResponse(response, "create devbox");
    return ToDevboxInfo(ParseBody(response, "create devbox"), "create devbox");
}

DevboxInfo RunloopProvider::Retrieve(const std::string& devbox_id) {
    auto response = http_.Get(DevboxPath(devbox_id));
    CheckResponse(response, "retrieve devbox");
    return ToDevboxInfo(ParseBody(response, "retrieve devbox"), "retrieve devbox");
}

ExecutionResult RunloopProvider::ExecuteSync(const std::string& devbox_id,
                                             const std::string& command,
                                             const std::string& shell_name) {
    json body = {{"command", command}};
    if (!shell_name.empty()) {
        body["shell_name"] = shell_name;
    }

    auto response = http_.PostJson(DevboxPath(devbox_id, "/execute_sync"), body.dump());
    CheckResponse(response, "execute_sync");
    auto result_body = ParseBody(response, "execute_sync");

    ExecutionResult result;
    try {
        result.stdout_output = result_body.value("stdout", std::string());
        result.exit_code = result_body.value("exit_status", 0);
    }
    catch (const json::exception& e) {
        throw core::ProviderStatusError(static_cast<int>(response.status_code),
            std::string("execute_sync returned an unexpected result: ") + e.what());
    }

    auto stderr_it = result_body.find("stderr");
    if (stderr_it != result_body.end() && stderr_it->is_string() && !stderr_it->get<std::string>().empty()) {
        spdlog::debug("[{}] stderr (not returned): {}", devbox_id, stderr_it->get<std::string>());
    }

    return result;
}

std::string RunloopProvider::ReadFileContents(const std::string& devbox_id,
                                              const std::string& file_path) {
    json body = {{"file_path", file_path}};
    auto response = http_.PostJson(DevboxPath(devbox_id, "/read_file_contents"), body.dump());
    CheckResponse(response, "read_file_contents");

    // The endpoint answers with the raw text, some deployments wrap it in a JSON string
    auto document = json::parse(response.body, nullptr, false);
    if (!document.is_discarded() && document.is_string()) {
        return document.get<std::string>();
    }
    return response.body;
}

void RunloopProvider::WriteFileContents(const std::string& devbox_id,
                                        const std::string& file_path,
                                        const std::string& contents) {
    json body = {{"file_path", file_path}, {"contents", contents}};
    auto response = http_.PostJson(DevboxPath(devbox_id, "/write_file_contents"), body.dump());
    CheckResponse(response, "write_file_contents");
}

void RunloopProvider::UploadFile(const std::string& devbox_id,
                                 const std::filesystem::path& local_path,
                                 const std::string& remote_path) {
    auto response = http_.PostMultipart(DevboxPath(devbox_id, "/upload_file"),
                                        {{"path", remote_path}}, "file", local_path);
    CheckResponse(response, "upload_file");
    spdlog::debug("Uploaded {} to {}:{}", local_path.string(), devbox_id, remote_path);
}

TunnelInfo RunloopProvider::CreateTunnel(const std::string& devbox_id, int port) {
    json body = {{"port", port}};
    auto response = http_.PostJson(DevboxPath(devbox_id, "/create_tunnel"), body.dump());
    CheckResponse(response, "create_tunnel");
    auto tunnel_body = ParseBody(response, "create_tunnel");

    TunnelInfo tunnel;
    tunnel.port = port;
    try {
        tunnel.url = tunnel_body.at("url").get<std::string>();
    }
    catch (const json::exception& e) {
        throw core::ProviderStatusError(static_cast<int>(response.status_code),
            std::string("create_tunnel returned no url: ") + e.what());
    }
    return tunnel;
}

void RunloopProvider::Shutdown(const std::string& devbox_id) {
    auto response = http_.PostJson(DevboxPath(devbox_id, "/shutdown"), "{}");
    CheckResponse(response, "shutdown");
}

} // namespace provider
} // namespace runbox
