/**
 * @file update_engine.hpp
 * @brief Run-level orchestration: mode dispatch, batch isolation, prune, summary
 *
 * Three run modes share the engine:
 * - **Compose file**: every service of a compose file (or one service)
 * - **Containers**: a list of container names, each classified as standalone
 *   or compose managed
 * - **Rollback**: one container or service, driven by the ledger
 *
 * Failures are isolated per target; the run continues with the next one and
 * the report's exit code reflects whether any target failed.
 *
 * @date 2025
 */

#pragma once

#include "redock/core/types.hpp"
#include "redock/ledger/history_log.hpp"
#include "redock/runtime/compose_tool.hpp"
#include "redock/runtime/container_runtime.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace redock {
namespace core {

enum class RunMode {
    COMPOSE_FILE,
    CONTAINERS,
    ROLLBACK
};

/**
 * @struct UpdateRequest
 * @brief What a single invocation was asked to do
 */
struct UpdateRequest {
    RunMode mode{RunMode::CONTAINERS};
    std::filesystem::path compose_file;       ///< COMPOSE_FILE mode
    std::optional<std::string> service;       ///< Restrict COMPOSE_FILE mode to one service
    std::vector<std::string> containers;      ///< CONTAINERS mode
    std::string rollback_target;              ///< ROLLBACK mode
    std::optional<std::string> tag;           ///< Tag (or digest) override for a single target
    bool force{false};                        ///< Recreate despite drift
    bool prune{true};                         ///< Prune images after update modes
};

/**
 * @struct RunReport
 * @brief Per-target results of one invocation
 */
struct RunReport {
    RunMode mode{RunMode::CONTAINERS};
    std::vector<TargetResult> results;
    std::chrono::seconds elapsed{0};
    bool pruned{false};

    std::size_t FailureCount() const;

    /// 0 when no target failed, 1 otherwise
    int ExitCode() const;
};

/**
 * @class UpdateEngine
 * @brief Entry point of the reconciliation core
 *
 * **Usage Example**:
 * @code
 * UpdateEngine engine(docker, compose, ledger, std::cin, std::cout);
 *
 * UpdateRequest request;
 * request.mode = RunMode::CONTAINERS;
 * request.containers = {"web", "worker"};
 *
 * auto report = engine.Execute(request);
 * UpdateEngine::PrintSummary(report, std::cout);
 * return report.ExitCode();
 * @endcode
 */
class UpdateEngine {
public:
    struct Config {
        bool drift_protection{true};           ///< Skip drifted compose services
        bool prune_after_update{true};         ///< Prune images after update modes
        std::size_t rollback_history_limit{5}; ///< Rollback menu entries
    };

    UpdateEngine(runtime::ContainerRuntime& runtime,
                 runtime::ComposeTool& compose,
                 const ledger::HistoryLog& ledger,
                 std::istream& input,
                 std::ostream& output);
    UpdateEngine(runtime::ContainerRuntime& runtime,
                 runtime::ComposeTool& compose,
                 const ledger::HistoryLog& ledger,
                 std::istream& input,
                 std::ostream& output,
                 const Config& config);
    ~UpdateEngine();

    UpdateEngine(const UpdateEngine&) = delete;
    UpdateEngine& operator=(const UpdateEngine&) = delete;

    /**
     * @brief Run the request
     *
     * @throws ArgumentError for an invalid request (nothing executed)
     * @throws NotFound when the compose file or the ledger does not exist
     * @throws RuntimeCommandError when the services of a compose file cannot be listed
     * @throws InputError on an invalid rollback selection
     */
    RunReport Execute(const UpdateRequest& request);

    /// Throws ArgumentError for conflicting or malformed options
    static void Validate(const UpdateRequest& request);

    /// Per-target table plus totals
    static void PrintSummary(const RunReport& report, std::ostream& out);

    /// HH:MM:SS
    static std::string FormatDuration(std::chrono::seconds elapsed);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
    Config config_;

    std::vector<TargetResult> UpdateComposeFile(const UpdateRequest& request);
    std::vector<TargetResult> UpdateContainers(const UpdateRequest& request);
    TargetResult Rollback(const UpdateRequest& request);

    /// NOT_FOUND result, recorded in the ledger
    TargetResult NotFoundResult(const std::string& name, const std::string& message);

    /// Failure result for an unexpected error at the target boundary
    TargetResult ErrorResult(const std::string& name, const std::string& message);
};

} // namespace core
} // namespace redock
