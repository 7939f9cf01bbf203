/**
 * @file devbox_runtime.cpp
 * @brief Implementation of the devbox action facade
 *
 * Every action takes the action lock, re-checks readiness through the
 * poller (cheap when the cached handle reports RUNNING), then delegates to
 * the executor or the transfer engine. A provider error during an action
 * marks the cached status stale, so the next action performs a real status
 * query before touching the devbox again.
 *
 * @date 2025
 */

#include "runbox/runtime/devbox_runtime.hpp"

#include "runbox/core/errors.hpp"
#include "runbox/runtime/start_command.hpp"
#include "runbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace runbox {
namespace runtime {

namespace {

// Puts the facade back into READY when an action leaves, however it leaves
class ExecutingScope {
public:
    explicit ExecutingScope(std::atomic<RuntimeState>& state)
        : state_(state) {
        state_.store(RuntimeState::EXECUTING);
    }

    ~ExecutingScope() {
        state_.store(RuntimeState::READY);
    }

    ExecutingScope(const ExecutingScope&) = delete;
    ExecutingScope& operator=(const ExecutingScope&) = delete;

private:
    std::atomic<RuntimeState>& state_;
};

} // namespace

std::string RuntimeStateToString(RuntimeState state) {
    switch (state) {
        case RuntimeState::UNINITIALIZED:  return "uninitialized";
        case RuntimeState::PROVISIONING:   return "provisioning";
        case RuntimeState::AWAITING_READY: return "awaiting_ready";
        case RuntimeState::READY:          return "ready";
        case RuntimeState::EXECUTING:      return "executing";
        case RuntimeState::CLOSED:         return "closed";
    }
    return "unknown";
}

DevboxRuntime::DevboxRuntime(core::RuntimeConfig config,
                             std::shared_ptr<provider::SandboxProvider> provider,
                             std::string session_id,
                             StatusCallback status_callback,
                             core::Sleeper sleeper)
    : config_(std::move(config))
    , provider_(std::move(provider))
    , session_id_(std::move(session_id))
    , status_callback_(std::move(status_callback))
    , executor_(*provider_)
    , transfer_(*provider_, executor_)
    , poller_(*provider_,
              core::RetryPolicy{config_.readiness_max_attempts, config_.readiness_interval},
              config_.workspace_mount_path_in_sandbox,
              std::move(sleeper))
    , tunnels_(*provider_) {
}

DevboxRuntime::~DevboxRuntime() {
    Close();
}

void DevboxRuntime::Connect() {
    std::lock_guard<std::mutex> lock(action_mutex_);

    if (state_.load() != RuntimeState::UNINITIALIZED) {
        throw core::RuntimeStateError("Connect() called in state "
                                      + RuntimeStateToString(state_.load()));
    }

    try {
        SendStatus("STATUS$STARTING_RUNTIME");
        state_.store(RuntimeState::PROVISIONING);
        handle_ = ProvisionDevbox();

        state_.store(RuntimeState::AWAITING_READY);
        SendStatus("STATUS$WAITING_FOR_CLIENT");
        handle_ = poller_.WaitUntilReady(*handle_, true);

        if (config_.expose_action_server) {
            tunnel_ = tunnels_.Expose(*handle_, config_.action_server_port);
        }

        state_.store(RuntimeState::READY);
        SendStatus(" ");
    }
    catch (const std::exception& e) {
        spdlog::error("Devbox runtime startup failed: {}", e.what());
        ReleaseDevbox();
        state_.store(RuntimeState::CLOSED);
        throw;
    }

    spdlog::info("Devbox runtime ready. Runtime ID: {}, URL: {}",
        handle_->Id(), tunnel_ ? tunnel_->public_url : std::string("(no tunnel)"));
    if (!config_.plugins.empty()) {
        spdlog::info("Runtime plugins: {}", utils::StringUtils::Join(config_.plugins, ", "));
    }
}

Observation DevboxRuntime::Run(const CmdRunAction& action) {
    try {
        return WithReadyDevbox("run", [&](const core::SandboxHandle& handle) -> Observation {
            auto result = executor_.Execute(handle, action.command);
            return CmdOutputObservation{result.stdout_output, action.id, action.command, result.exit_code};
        });
    }
    catch (const core::ProviderStatusError& e) {
        return ErrorObservation{e.Message()};
    }
}

Observation DevboxRuntime::Read(const FileReadAction& action) {
    try {
        return WithReadyDevbox("read", [&](const core::SandboxHandle& handle) -> Observation {
            auto content = transfer_.Read(handle, action.path, action.start, action.end);
            return FileReadObservation{content, action.path};
        });
    }
    catch (const core::ProviderStatusError& e) {
        return ErrorObservation{e.Message()};
    }
}

Observation DevboxRuntime::Write(const FileWriteAction& action) {
    try {
        return WithReadyDevbox("write", [&](const core::SandboxHandle& handle) -> Observation {
            transfer_.Write(handle, action.path, action.content);
            return FileWriteObservation{"", action.path};
        });
    }
    catch (const core::ProviderStatusError& e) {
        return ErrorObservation{e.Message()};
    }
}

void DevboxRuntime::CopyTo(const CopyToAction& action) {
    core::TransferJob job;
    job.source = action.host_src;
    job.destination = action.sandbox_dest;
    job.recursive = action.recursive;

    // A job rejected locally must not trigger a forced readiness check
    core::FileTransfer::Validate(job);

    WithReadyDevbox("copy_to", [&](const core::SandboxHandle& handle) {
        transfer_.CopyTo(handle, job);
    });
}

std::vector<std::string> DevboxRuntime::ListFiles(const ListFilesAction& action) {
    try {
        return WithReadyDevbox("list_files", [&](const core::SandboxHandle& handle) {
            return transfer_.ListFiles(handle, action.path);
        });
    }
    catch (const core::ProviderStatusError& e) {
        spdlog::error("Error listing files: {}", e.what());
        throw;
    }
}

Observation DevboxRuntime::RunIPython(const IPythonRunCellAction&) {
    throw core::UnsupportedActionError("run_ipython");
}

Observation DevboxRuntime::Browse(const BrowseURLAction&) {
    throw core::UnsupportedActionError("browse");
}

Observation DevboxRuntime::BrowseInteractive(const BrowseInteractiveAction&) {
    throw core::UnsupportedActionError("browse_interactive");
}

void DevboxRuntime::Close() {
    std::lock_guard<std::mutex> lock(action_mutex_);

    if (state_.load() == RuntimeState::CLOSED) {
        return;
    }

    ReleaseDevbox();
    state_.store(RuntimeState::CLOSED);
    spdlog::info("Devbox runtime closed");
}

std::optional<core::SandboxHandle> DevboxRuntime::Handle() const {
    std::lock_guard<std::mutex> lock(action_mutex_);
    return handle_;
}

std::optional<std::string> DevboxRuntime::RuntimeId() const {
    std::lock_guard<std::mutex> lock(action_mutex_);
    if (!handle_) {
        return std::nullopt;
    }
    return handle_->Id();
}

std::optional<std::string> DevboxRuntime::RuntimeUrl() const {
    std::lock_guard<std::mutex> lock(action_mutex_);
    if (!tunnel_) {
        return std::nullopt;
    }
    return tunnel_->public_url;
}

// Private methods

template <typename Fn>
auto DevboxRuntime::WithReadyDevbox(const char* action, Fn&& fn)
    -> decltype(fn(std::declval<const core::SandboxHandle&>())) {
    std::lock_guard<std::mutex> lock(action_mutex_);

    if (state_.load() != RuntimeState::READY || !handle_) {
        throw core::RuntimeStateError(std::string("Cannot ") + action + " in state "
                                      + RuntimeStateToString(state_.load()));
    }

    handle_ = poller_.WaitUntilReady(*handle_, status_stale_);
    status_stale_ = false;

    ExecutingScope executing(state_);
    try {
        return fn(*handle_);
    }
    catch (const core::ProviderStatusError& e) {
        spdlog::warn("{} on {} failed: {}", action, handle_->Id(), e.what());
        status_stale_ = true;
        throw;
    }
}

core::SandboxHandle DevboxRuntime::ProvisionDevbox() {
    core::ValidateConfig(config_);

    provider::DevboxInfo info;

    if (config_.attach_devbox_id) {
        spdlog::info("Attaching to devbox {}", *config_.attach_devbox_id);
        try {
            info = provider_->Retrieve(*config_.attach_devbox_id);
        }
        catch (const core::ProviderStatusError& e) {
            throw core::ProvisioningError("Cannot attach to devbox "
                                          + *config_.attach_devbox_id + ": " + e.Message());
        }
        owns_devbox_ = false;
    } else {
        provider::CreateDevboxRequest request;
        request.name = MakeInstanceName(session_id_);
        request.prebuilt_image = config_.prebuilt_image;
        request.environment = config_.environment;
        if (config_.debug) {
            request.environment["DEBUG"] = "true";
        }
        request.keep_alive_seconds = config_.keep_alive_seconds;
        if (config_.expose_action_server) {
            request.entrypoint = BuildStartCommand(config_);
            request.available_ports.push_back(config_.action_server_port);
        }

        spdlog::info("Provisioning devbox {} (image: {}, keep-alive: {}s)",
            request.name, request.prebuilt_image, request.keep_alive_seconds);
        if (request.entrypoint) {
            spdlog::debug("Entrypoint: {}", *request.entrypoint);
        }

        try {
            info = provider_->Create(request);
        }
        catch (const core::ProviderStatusError& e) {
            throw core::ProvisioningError("Devbox creation failed: " + e.Message());
        }
        owns_devbox_ = true;
    }

    if (info.id.empty()) {
        throw core::ProvisioningError("Provider returned a devbox without an id");
    }

    spdlog::info("Devbox {} is {}", info.id, core::StatusToString(info.status));
    return core::SandboxHandle(info.id, info.status, config_.shell_name);
}

void DevboxRuntime::ReleaseDevbox() {
    if (!handle_) {
        return;
    }

    if (owns_devbox_ && config_.terminate_on_close) {
        try {
            provider_->Shutdown(handle_->Id());
            spdlog::info("Devbox {} shut down", handle_->Id());
        }
        catch (const std::exception& e) {
            spdlog::warn("Failed to shut down devbox {}: {}", handle_->Id(), e.what());
        }
    } else {
        spdlog::info("Leaving devbox {} running", handle_->Id());
    }

    handle_.reset();
    tunnel_.reset();
}

void DevboxRuntime::SendStatus(const std::string& message) {
    if (status_callback_) {
        status_callback_(message);
    }
}

} // namespace runtime
} // namespace runbox
