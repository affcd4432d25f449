/**
 * @file types.cpp
 * @brief String conversions and comparisons for the core data model
 *
 * @date 2025
 */

#include "redock/core/types.hpp"

#include <tuple>

namespace redock {
namespace core {

std::string ActionKindToString(ActionKind kind) {
    switch (kind) {
        case ActionKind::UPDATE: return "UPDATE";
        case ActionKind::SKIP_PINNED: return "SKIP_PINNED";
        case ActionKind::SKIP_MISMATCH: return "SKIP_MISMATCH";
        case ActionKind::PULL_FAIL: return "PULL_FAIL";
        case ActionKind::RECREATE_FAIL: return "RECREATE_FAIL";
        case ActionKind::ROLLBACK_SUCCESS: return "ROLLBACK_SUCCESS";
        case ActionKind::ROLLBACK_FAIL: return "ROLLBACK_FAIL";
        case ActionKind::NOT_FOUND: return "NOT_FOUND";
    }
    return "UNKNOWN";
}

std::optional<ActionKind> ParseActionKind(const std::string& text) {
    if (text == "UPDATE") return ActionKind::UPDATE;
    if (text == "SKIP_PINNED") return ActionKind::SKIP_PINNED;
    if (text == "SKIP_MISMATCH") return ActionKind::SKIP_MISMATCH;
    if (text == "PULL_FAIL") return ActionKind::PULL_FAIL;
    if (text == "RECREATE_FAIL") return ActionKind::RECREATE_FAIL;
    if (text == "ROLLBACK_SUCCESS") return ActionKind::ROLLBACK_SUCCESS;
    if (text == "ROLLBACK_FAIL") return ActionKind::ROLLBACK_FAIL;
    if (text == "NOT_FOUND") return ActionKind::NOT_FOUND;

    // Written by the shell version of this tool
    if (text == "SKIP") return ActionKind::SKIP_PINNED;
    if (text == "FAIL") return ActionKind::RECREATE_FAIL;
    if (text == "ROLLBACK") return ActionKind::ROLLBACK_SUCCESS;

    return std::nullopt;
}

bool IsFailure(ActionKind kind) {
    return kind == ActionKind::PULL_FAIL ||
           kind == ActionKind::RECREATE_FAIL ||
           kind == ActionKind::ROLLBACK_FAIL ||
           kind == ActionKind::NOT_FOUND;
}

std::string PortBinding::ToArgument() const {
    if (!host_ip.empty()) {
        // IPv6 literals need brackets to keep the colons unambiguous
        const std::string ip = host_ip.find(':') != std::string::npos ? "[" + host_ip + "]" : host_ip;
        return ip + ":" + host_port + ":" + container_port;
    }
    if (!host_port.empty()) {
        return host_port + ":" + container_port;
    }
    return container_port;
}

bool PortBinding::operator<(const PortBinding& other) const {
    return std::tie(container_port, host_ip, host_port) <
           std::tie(other.container_port, other.host_ip, other.host_port);
}

bool PortBinding::operator==(const PortBinding& other) const {
    return host_ip == other.host_ip &&
           host_port == other.host_port &&
           container_port == other.container_port;
}

bool Mount::operator==(const Mount& other) const {
    return kind == other.kind &&
           source == other.source &&
           destination == other.destination &&
           read_only == other.read_only;
}

std::string RestartPolicy::ToArgument() const {
    if (name == "on-failure" && maximum_retry_count > 0) {
        return name + ":" + std::to_string(maximum_retry_count);
    }
    return name;
}

bool RestartPolicy::operator==(const RestartPolicy& other) const {
    return name == other.name && maximum_retry_count == other.maximum_retry_count;
}

std::string ProtocolStateToString(ProtocolState state) {
    switch (state) {
        case ProtocolState::INSPECTED: return "inspected";
        case ProtocolState::PULLED: return "pulled";
        case ProtocolState::COMPARED: return "compared";
        case ProtocolState::SKIPPED: return "skipped";
        case ProtocolState::STOPPED: return "stopped";
        case ProtocolState::REMOVED: return "removed";
        case ProtocolState::STARTED: return "started";
        case ProtocolState::VERIFIED: return "verified";
        case ProtocolState::FAILED: return "failed";
    }
    return "unknown";
}

} // namespace core
} // namespace redock
