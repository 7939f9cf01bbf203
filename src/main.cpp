/**
 * @file main.cpp
 * @brief runbox - drive a remote devbox from the command line
 *
 * Provisions (or attaches to) a devbox, waits until it is ready, performs
 * one action and prints the resulting observation as JSON:
 *
 * ```
 * runbox --config runbox.json run "uname -a"
 * runbox --attach dbx_123 --keep read /workspace/README.md --start 0 --end 20
 * runbox --attach dbx_123 --keep copy ./project /workspace -r
 * ```
 *
 * Exit status: 0 on success, 1 on an error observation or failure,
 * CLI11's code on parse errors.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stderr_color_sinks.h>

#include "runbox/core/config.hpp"
#include "runbox/core/errors.hpp"
#include "runbox/provider/runloop_provider.hpp"
#include "runbox/runtime/devbox_runtime.hpp"
#include "runbox/utils/string_utils.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

using json = nlohmann::json;

namespace {

std::string ReadLocalFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw runbox::core::ValidationError("Cannot open " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"runbox - remote devbox runtime"};
    app.require_subcommand(1);

    std::string config_path;
    std::string session_id = "default";
    std::string api_key;
    std::string attach_id;
    bool keep = false;
    bool verbose = false;

    app.add_option("-c,--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_option("-s,--session", session_id, "Agent session id (used in the devbox name)")
        ->default_val("default");
    app.add_option("--api-key", api_key, "Runloop API key (overrides config and RUNLOOP_API_KEY)");
    app.add_option("--attach", attach_id, "Use an existing devbox instead of creating one");
    app.add_flag("--keep", keep, "Leave the devbox running on exit");
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");

    // run
    auto* run_cmd = app.add_subcommand("run", "Run a shell command");
    std::string command;
    run_cmd->add_option("command", command, "Command line")->required();

    // read
    auto* read_cmd = app.add_subcommand("read", "Read a line range of a remote file");
    std::string read_path;
    int read_start = 0;
    int read_end = -1;
    read_cmd->add_option("path", read_path, "Remote file")->required();
    read_cmd->add_option("--start", read_start, "First line (0-based)")->default_val(0);
    read_cmd->add_option("--end", read_end, "Line after the last one (-1: end of file)")->default_val(-1);

    // write
    auto* write_cmd = app.add_subcommand("write", "Replace the contents of a remote file");
    std::string write_path;
    std::string write_content;
    std::string write_from;
    write_cmd->add_option("path", write_path, "Remote file")->required();
    auto* content_opt = write_cmd->add_option("--content", write_content, "New contents");
    auto* from_opt = write_cmd->add_option("--from-file", write_from, "Local file holding the new contents")
        ->check(CLI::ExistingFile);
    content_opt->excludes(from_opt);

    // copy
    auto* copy_cmd = app.add_subcommand("copy", "Copy a local file or directory into the devbox");
    std::string copy_src;
    std::string copy_dest;
    bool copy_recursive = false;
    copy_cmd->add_option("source", copy_src, "Local file or directory")->required()
        ->check(CLI::ExistingPath);
    copy_cmd->add_option("destination", copy_dest, "Remote directory")->required();
    copy_cmd->add_flag("-r,--recursive", copy_recursive, "Copy a directory");

    // ls
    auto* ls_cmd = app.add_subcommand("ls", "List a remote directory");
    std::string ls_path;
    ls_cmd->add_option("path", ls_path, "Remote directory");

    CLI11_PARSE(app, argc, argv);

    // Logs go to stderr, observations to stdout
    auto logger = spdlog::stderr_color_mt("runbox");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        if (*write_cmd && content_opt->count() == 0 && from_opt->count() == 0) {
            throw runbox::core::ValidationError("write needs --content or --from-file");
        }

        runbox::core::RuntimeConfig config;
        if (!config_path.empty()) {
            config = runbox::core::LoadConfig(config_path);
        } else {
            runbox::core::ApplyEnvironmentOverrides(config);
        }
        if (!api_key.empty()) {
            config.api_key = api_key;
        }
        if (!attach_id.empty()) {
            config.attach_devbox_id = attach_id;
            config.expose_action_server = false;
        }
        if (keep) {
            config.terminate_on_close = false;
        }

        spdlog::set_level((verbose || config.debug) ? spdlog::level::debug : spdlog::level::info);

        auto provider = std::make_shared<runbox::provider::RunloopProvider>(config);
        runbox::runtime::DevboxRuntime runtime(config, provider, session_id,
            [](const std::string& status) {
                if (!runbox::utils::StringUtils::Trim(status).empty()) {
                    spdlog::info("[STATUS] {}", status);
                }
            });

        runtime.Connect();

        json output;
        bool failed = false;

        if (*run_cmd) {
            auto observation = runtime.Run({command, 1});
            failed = runbox::runtime::IsError(observation);
            output = runbox::runtime::ToJson(observation);
        } else if (*read_cmd) {
            runbox::runtime::FileReadAction action;
            action.path = read_path;
            action.start = read_start;
            if (read_end >= 0) {
                action.end = read_end;
            }
            auto observation = runtime.Read(action);
            failed = runbox::runtime::IsError(observation);
            output = runbox::runtime::ToJson(observation);
        } else if (*write_cmd) {
            std::string content = write_from.empty() ? write_content : ReadLocalFile(write_from);
            auto observation = runtime.Write({write_path, content});
            failed = runbox::runtime::IsError(observation);
            output = runbox::runtime::ToJson(observation);
        } else if (*copy_cmd) {
            runtime.CopyTo({copy_src, copy_dest, copy_recursive});
            output = {{"copied", copy_src}, {"destination", copy_dest}, {"recursive", copy_recursive}};
        } else if (*ls_cmd) {
            runbox::runtime::ListFilesAction action;
            if (!ls_path.empty()) {
                action.path = ls_path;
            }
            output = runtime.ListFiles(action);
        }

        if (auto url = runtime.RuntimeUrl()) {
            spdlog::info("Action server: {}", *url);
        }
        if (auto id = runtime.RuntimeId()) {
            spdlog::info("Devbox: {}", *id);
        }

        std::cout << output.dump(2) << std::endl;
        runtime.Close();
        return failed ? 1 : 0;

    } catch (const runbox::core::ConfigError& e) {
        spdlog::error("[CONFIG] {}", e.what());
        return 1;
    } catch (const runbox::core::RunboxError& e) {
        spdlog::error("[ERROR] {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    }
}
