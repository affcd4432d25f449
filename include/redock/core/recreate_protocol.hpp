/**
 * @file recreate_protocol.hpp
 * @brief Per-target reconcile / recreate state machine
 *
 * Drives one target from inspection to a logged outcome:
 * ```
 * Inspected -> Pulled -> Compared -> Skipped
 *                                 -> Stopped -> Removed -> Started -> Verified
 *                                 -> Failed
 * ```
 * The standalone path stops, removes and relaunches the container from its
 * captured runtime spec. The compose path delegates the recreate to
 * `compose up --force-recreate --no-deps` and verifies the service afterwards.
 *
 * Nothing destructive happens before the replacement identity is resolved,
 * and every run appends exactly one ledger record.
 *
 * @date 2025
 */

#pragma once

#include "redock/core/identity_resolver.hpp"
#include "redock/core/image_reference.hpp"
#include "redock/core/types.hpp"
#include "redock/ledger/history_log.hpp"
#include "redock/runtime/compose_tool.hpp"
#include "redock/runtime/container_runtime.hpp"

#include <optional>
#include <string>

namespace redock {
namespace core {

/**
 * @brief Explicit version request for one target
 *
 * Any populated field counts as an override: it bypasses drift protection
 * but never forces a recreate of an identity that already runs.
 */
struct TargetRequest {
    std::optional<std::string> tag;     ///< Run this tag of the current repository
    std::optional<std::string> digest;  ///< Run this digest (takes precedence over tag)
    bool force{false};                  ///< Override without changing the version

    bool HasOverride() const { return tag.has_value() || digest.has_value() || force; }
};

/**
 * @class RecreateProtocol
 * @brief Reconciles a single standalone container or compose service
 *
 * **Usage Example**:
 * @code
 * RecreateProtocol protocol(docker, compose, ledger);
 * auto result = protocol.Run(detector.Classify("web"), TargetRequest{});
 * if (result.Failed()) {
 *     spdlog::error("{}: {}", result.target, result.message);
 * }
 * @endcode
 */
class RecreateProtocol {
public:
    struct Config {
        bool drift_protection{true};  ///< SKIP_MISMATCH when declaration and running identity diverge
    };

    RecreateProtocol(runtime::ContainerRuntime& runtime,
                     runtime::ComposeTool& compose,
                     const ledger::HistoryLog& ledger);
    RecreateProtocol(runtime::ContainerRuntime& runtime,
                     runtime::ComposeTool& compose,
                     const ledger::HistoryLog& ledger,
                     const Config& config);

    /// Dispatch on the detected context
    TargetResult Run(const TargetContext& context, const TargetRequest& request);

    /**
     * @brief Manual path: recreate a standalone container from its captured spec
     *
     * The target reference is the container's repository with the requested
     * digest or tag, else its configured tag or digest, else `latest`.
     */
    TargetResult RunStandalone(const ContainerRuntimeSpec& spec, const TargetRequest& request);

    /// Compose path for a container detected as part of a compose project
    TargetResult RunManaged(const ManagedContext& context, const TargetRequest& request);

    /**
     * @brief Compose path for one service of a compose file
     *
     * A tag or digest request is applied through a temporary overlay file
     * that only lives for the duration of this call.
     */
    TargetResult RunService(const runtime::ComposeInvocation& invocation,
                            const std::string& service,
                            const TargetRequest& request);

private:
    runtime::ContainerRuntime& runtime_;
    runtime::ComposeTool& compose_;
    const ledger::HistoryLog& ledger_;
    Config config_;
    IdentityResolver resolver_;

    /// Identity of the image a container runs, or its raw image ID
    std::optional<std::string> CurrentIdentity(const std::string& image_id,
                                               const std::string& repository) const;

    /// Append the result's ledger record; a write failure is surfaced in the result
    void Record(TargetResult& result, ActionKind kind,
                const std::string& image_reference, const std::string& identity);

    void Fail(TargetResult& result, ActionKind kind, const std::string& message);
};

/// Reference a target should run: digest request, else tag request, else as configured
ImageReference TargetReference(const ImageReference& configured, const TargetRequest& request);

} // namespace core
} // namespace redock
