/**
 * @file sandbox_handle.cpp
 * @brief SandboxHandle value object
 *
 * @date 2025
 */

#include "runbox/core/sandbox_handle.hpp"

#include <utility>

namespace runbox {
namespace core {

std::string StatusToString(SandboxStatus status) {
    switch (status) {
        case SandboxStatus::PENDING: return "pending";
        case SandboxStatus::RUNNING: return "running";
        case SandboxStatus::FAILED:  return "failed";
        case SandboxStatus::STOPPED: return "stopped";
    }
    return "unknown";
}

SandboxHandle::SandboxHandle(std::string id, SandboxStatus status, std::string shell_name)
    : id_(std::move(id))
    , status_(status)
    , shell_name_(std::move(shell_name)) {
}

SandboxHandle SandboxHandle::WithStatus(SandboxStatus status) const {
    return SandboxHandle(id_, status, shell_name_);
}

} // namespace core
} // namespace runbox
