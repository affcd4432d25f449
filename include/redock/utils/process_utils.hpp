/**
 * @file process_utils.hpp
 * @brief Child process execution with stdout/stderr capture
 *
 * Every interaction with the container runtime and the orchestration tool
 * goes through RunProcess(). Arguments are passed straight to execvp, so no
 * shell quoting is involved and image references or environment values
 * containing shell metacharacters are forwarded untouched.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <optional>

namespace redock {
namespace utils {

/**
 * @struct ProcessResult
 * @brief Result of a finished child process
 */
struct ProcessResult {
    int exit_code{0};          ///< Exit status (-1 if the process could not be started)
    std::string stdout_output; ///< Captured standard output
    std::string stderr_output; ///< Captured standard error
    bool success{false};       ///< exit_code == 0
};

/**
 * @brief Run a program and wait for it to finish
 *
 * @param argv Program followed by its arguments (argv[0] is looked up in PATH)
 * @param stdin_data Optional data written to the child's standard input
 * @return Exit status and captured output
 */
ProcessResult RunProcess(const std::vector<std::string>& argv,
                         const std::optional<std::string>& stdin_data = std::nullopt);

/**
 * @brief Render argv as a single shell-safe command line (for logs and hints)
 */
std::string FormatCommandLine(const std::vector<std::string>& argv);

/**
 * @brief Strip trailing whitespace and newlines
 */
std::string TrimRight(std::string value);

} // namespace utils
} // namespace redock
