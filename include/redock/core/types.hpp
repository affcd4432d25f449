/**
 * @file types.hpp
 * @brief Core data model shared by the extractor, protocol, ledger and rollback
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <set>
#include <optional>
#include <variant>

namespace redock {
namespace core {

/**
 * @enum ActionKind
 * @brief Outcome recorded in the ledger for one target
 */
enum class ActionKind {
    UPDATE,            ///< Target recreated on a new identity
    SKIP_PINNED,       ///< Already running the desired identity
    SKIP_MISMATCH,     ///< Drift detected, no override given
    PULL_FAIL,         ///< Replacement could not be pulled or resolved
    RECREATE_FAIL,     ///< Stop/remove/start failed (target may be absent)
    ROLLBACK_SUCCESS,  ///< Rollback reached the selected identity
    ROLLBACK_FAIL,     ///< Rollback did not complete
    NOT_FOUND          ///< Target does not exist
};

/// Alias used where the kind is the decision rather than the recorded outcome
using DecisionOutcome = ActionKind;

/// Ledger spelling ("UPDATE", "SKIP_PINNED", ...)
std::string ActionKindToString(ActionKind kind);

/**
 * @brief Parse a ledger kind, including the legacy "SKIP", "FAIL", "ROLLBACK"
 * @return std::nullopt for unknown text
 */
std::optional<ActionKind> ParseActionKind(const std::string& text);

/// Pull-Fail, Recreate-Fail, Rollback-Fail, Not-Found
bool IsFailure(ActionKind kind);

/**
 * @struct PortBinding
 * @brief One published port in its minimal `docker run -p` form
 */
struct PortBinding {
    std::string host_ip;         ///< Empty for wildcard interfaces
    std::string host_port;       ///< Empty for an ephemeral host port
    std::string container_port;  ///< "80" or "53/udp" ("/tcp" is dropped)

    /// ip:host:container | host:container | ip::container | container
    std::string ToArgument() const;

    bool operator<(const PortBinding& other) const;
    bool operator==(const PortBinding& other) const;
};

enum class MountKind {
    BIND,
    VOLUME,
    TMPFS
};

struct Mount {
    MountKind kind{MountKind::VOLUME};
    std::string source;       ///< Host path (bind) or volume name (volume); empty for tmpfs
    std::string destination;  ///< Path inside the container
    bool read_only{false};

    bool operator==(const Mount& other) const;
};

struct RestartPolicy {
    std::string name;        ///< always, unless-stopped, on-failure
    int maximum_retry_count{0};

    /// "on-failure:3" / "always"
    std::string ToArgument() const;

    bool operator==(const RestartPolicy& other) const;
};

/**
 * @struct ContainerRuntimeSpec
 * @brief Everything needed to relaunch a standalone container unchanged
 */
struct ContainerRuntimeSpec {
    std::string name;
    std::string image;                             ///< Config.Image as launched
    std::string image_id;                          ///< Image ID the container runs
    std::vector<std::string> environment;          ///< KEY=VALUE, original order
    std::set<PortBinding> ports;
    std::vector<Mount> mounts;
    std::optional<RestartPolicy> restart_policy;   ///< Absent for "no"
    std::optional<std::string> network_mode;       ///< Absent for the runtime default
    std::optional<std::string> hostname;           ///< Absent for the generated default
    std::optional<std::vector<std::string>> entrypoint;  ///< Only when overridden
    std::optional<std::vector<std::string>> command;     ///< Only when overridden
};

/**
 * @struct ManagedContext
 * @brief Compose ownership of a container
 */
struct ManagedContext {
    std::string config_file;        ///< Absolute path of the compose file
    std::string working_directory;  ///< Compose project working directory
    std::string service;            ///< Service name inside the compose file
    std::string project;            ///< Compose project name (empty if unlabeled)

    bool operator==(const ManagedContext& other) const {
        return config_file == other.config_file &&
               working_directory == other.working_directory &&
               service == other.service &&
               project == other.project;
    }
};

/// Container not owned by a compose project
struct Standalone {
    ContainerRuntimeSpec spec;
};

/// Container owned by a compose project
struct Managed {
    ManagedContext context;
};

/// Result of the single ownership detection step
using TargetContext = std::variant<Standalone, Managed>;

/**
 * @struct LogRecord
 * @brief One ledger line
 */
struct LogRecord {
    std::string timestamp;        ///< %Y-%m-%dT%H:%M:%S%z
    std::string logical_name;     ///< Container name or compose service
    std::string image_reference;  ///< Reference acted upon
    std::string identity;         ///< Resolved identity (may be empty)
    ActionKind kind{ActionKind::UPDATE};
};

/**
 * @enum ProtocolState
 * @brief Recreate protocol states (last one reached is reported)
 */
enum class ProtocolState {
    INSPECTED,
    PULLED,
    COMPARED,
    SKIPPED,
    STOPPED,
    REMOVED,
    STARTED,
    VERIFIED,
    FAILED
};

std::string ProtocolStateToString(ProtocolState state);

/**
 * @struct TargetResult
 * @brief Outcome of one target's run, carrying its own identity for reporting
 */
struct TargetResult {
    std::string target;            ///< Name as given (container or service)
    std::string logical_name;      ///< Name the ledger record was filed under
    ActionKind outcome{ActionKind::UPDATE};
    ProtocolState final_state{ProtocolState::INSPECTED};
    std::string image_reference;
    std::string identity;
    std::string prior_identity;
    std::string message;

    bool Failed() const { return IsFailure(outcome); }
};

} // namespace core
} // namespace redock
