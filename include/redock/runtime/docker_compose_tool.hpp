/**
 * @file docker_compose_tool.hpp
 * @brief ComposeTool implementation driving `docker compose`
 *
 * @date 2025
 */

#pragma once

#include "redock/runtime/compose_tool.hpp"
#include "redock/utils/process_utils.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace redock {
namespace runtime {

class DockerComposeTool : public ComposeTool {
public:
    /**
     * @param compose_command Command prefix, e.g. {"docker", "compose"} or {"docker-compose"}
     */
    explicit DockerComposeTool(std::vector<std::string> compose_command = {"docker", "compose"});

    std::vector<std::string> ListServices(const ComposeInvocation& invocation) override;
    std::optional<std::string> DeclaredImage(const ComposeInvocation& invocation,
                                             const std::string& service) override;
    bool Pull(const ComposeInvocation& invocation, const std::string& service) override;
    bool Up(const ComposeInvocation& invocation, const std::string& service) override;
    std::optional<std::string> ServiceContainerId(const ComposeInvocation& invocation,
                                                  const std::string& service) override;

    /// Command prefix plus project selection flags (-f ... --project-directory ... -p ...)
    std::vector<std::string> BaseArguments(const ComposeInvocation& invocation) const;

private:
    std::vector<std::string> compose_command_;

    utils::ProcessResult Execute(const ComposeInvocation& invocation,
                                 const std::vector<std::string>& args) const;
    nlohmann::json ResolvedConfig(const ComposeInvocation& invocation) const;
};

} // namespace runtime
} // namespace redock
