/**
 * @file compose_tool.hpp
 * @brief Capability interface over the declarative orchestration tool
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <optional>

namespace redock {
namespace runtime {

/**
 * @struct ComposeInvocation
 * @brief Which project a compose command operates on
 *
 * Override files are layered after the main file in order, the same way
 * repeated `-f` flags are.
 */
struct ComposeInvocation {
    std::string config_file;                  ///< Main compose file
    std::vector<std::string> override_files;  ///< Layered overrides
    std::string project_directory;            ///< --project-directory (optional)
    std::string project_name;                 ///< -p (optional)
};

/**
 * @class ComposeTool
 * @brief Declarative multi-service pull / up / list primitives
 */
class ComposeTool {
public:
    virtual ~ComposeTool() = default;

    /**
     * @brief Services declared by the (layered) configuration
     * @throws RuntimeCommandError if the configuration cannot be read
     */
    virtual std::vector<std::string> ListServices(const ComposeInvocation& invocation) = 0;

    /**
     * @brief Image reference a service declares after layering overrides
     * @return std::nullopt if the service does not declare an image
     * @throws RuntimeCommandError if the configuration cannot be read
     */
    virtual std::optional<std::string> DeclaredImage(const ComposeInvocation& invocation,
                                                     const std::string& service) = 0;

    /// Pull the image of one service
    virtual bool Pull(const ComposeInvocation& invocation, const std::string& service) = 0;

    /// Force-recreate one service (dependencies untouched)
    virtual bool Up(const ComposeInvocation& invocation, const std::string& service) = 0;

    /// ID of the service's container, std::nullopt if it has none
    virtual std::optional<std::string> ServiceContainerId(const ComposeInvocation& invocation,
                                                          const std::string& service) = 0;
};

} // namespace runtime
} // namespace redock
