/**
 * @file tunnel_provisioner.cpp
 * @brief Implementation of devbox tunnel creation
 *
 * @date 2025
 */

#include "runbox/core/tunnel_provisioner.hpp"

#include "runbox/core/errors.hpp"
#include "runbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

namespace runbox {
namespace core {

TunnelProvisioner::TunnelProvisioner(provider::SandboxProvider& provider)
    : provider_(provider) {
}

Tunnel TunnelProvisioner::Expose(const SandboxHandle& handle, int port) {
    if (port <= 0 || port > 65535) {
        throw ValidationError("Invalid tunnel port: " + std::to_string(port));
    }

    auto info = provider_.CreateTunnel(handle.Id(), port);

    Tunnel tunnel;
    tunnel.sandbox_port = port;
    if (utils::StringUtils::StartsWith(info.url, "https://")
        || utils::StringUtils::StartsWith(info.url, "http://")) {
        tunnel.public_url = info.url;
    } else {
        tunnel.public_url = "https://" + info.url;
    }

    spdlog::info("Tunnel {} -> {}:{}", tunnel.public_url, handle.Id(), port);
    return tunnel;
}

} // namespace core
} // namespace runbox
