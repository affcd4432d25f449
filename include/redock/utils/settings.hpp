/**
 * @file settings.hpp
 * @brief Tool configuration: defaults, optional JSON file, CLI overrides
 *
 * Example configuration file:
 * @code{.json}
 * {
 *   "ledger_path": "/var/log/redock/history.log",
 *   "compose_command": ["docker", "compose"],
 *   "extra_run_args": ["--log-opt", "max-size=10m"],
 *   "drift_protection": true,
 *   "prune_after_update": false,
 *   "rollback_history_limit": 5,
 *   "log_level": "info"
 * }
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace redock {
namespace utils {

/// Ledger used when neither the config file nor REDOCK_LEDGER names one
inline constexpr const char* kFallbackLedgerPath = "/tmp/docker-update.log";

/**
 * @struct Settings
 * @brief Runtime settings for one invocation
 */
struct Settings {
    std::filesystem::path ledger_path;                            ///< Empty until resolved
    std::string docker_binary{"docker"};                          ///< Runtime executable
    std::vector<std::string> compose_command{"docker", "compose"};  ///< Orchestration prefix
    std::vector<std::string> extra_run_args;                      ///< Appended to docker run
    bool prune_after_update{true};                                ///< Prune after update modes
    bool drift_protection{true};                                  ///< Skip-Mismatch on drift
    int rollback_history_limit{5};                                ///< Rollback menu entries
    std::string log_level{"info"};                                ///< spdlog level name

    /**
     * @brief Overlay values from a JSON document
     *
     * Unknown keys are warned about and ignored.
     * @throws ArgumentError on wrong value types or out-of-range values
     */
    void Apply(const nlohmann::json& document);

    /**
     * @brief Load and apply a JSON configuration file
     * @throws ArgumentError if the file is missing or malformed
     */
    void LoadFile(const std::filesystem::path& path);

    /**
     * @brief Fill ledger_path if still empty
     *
     * Uses REDOCK_LEDGER when set, else kFallbackLedgerPath (with a warning).
     */
    void ResolveLedgerPath();
};

} // namespace utils
} // namespace redock
