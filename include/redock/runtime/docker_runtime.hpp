/**
 * @file docker_runtime.hpp
 * @brief ContainerRuntime implementation driving the docker CLI
 *
 * @date 2025
 */

#pragma once

#include "redock/runtime/container_runtime.hpp"
#include "redock/utils/process_utils.hpp"

#include <string>
#include <vector>

namespace redock {
namespace runtime {

/**
 * @class DockerRuntime
 * @brief docker CLI backed container runtime
 *
 * **Usage Example**:
 * @code
 * DockerRuntime docker("docker");
 * if (docker.PullImage("nginx:1.27")) {
 *     auto image = docker.InspectImage("nginx:1.27");
 * }
 * @endcode
 */
class DockerRuntime : public ContainerRuntime {
public:
    /**
     * @param docker_binary Executable name or path ("docker", "podman")
     * @param extra_run_args Options appended to every `run` (e.g. "--log-opt", "max-size=10m")
     */
    explicit DockerRuntime(std::string docker_binary = "docker",
                           std::vector<std::string> extra_run_args = {});

    /// `docker --version` succeeds
    bool IsAvailable() const;

    std::optional<nlohmann::json> InspectContainer(const std::string& name) override;
    std::optional<nlohmann::json> InspectImage(const std::string& reference) override;
    bool PullImage(const std::string& reference) override;
    bool StopContainer(const std::string& name) override;
    bool RemoveContainer(const std::string& name) override;
    bool RunContainer(const core::ContainerRuntimeSpec& spec, const std::string& image) override;
    std::vector<std::string> ListContainersByLabel(const std::string& label,
                                                   const std::string& value) override;
    bool PruneImages() override;
    std::string RelaunchHint(const core::ContainerRuntimeSpec& spec, const std::string& image) const override;

    /**
     * @brief Build the `run` argument list (without the binary)
     *
     * Order: run -d --name N [--hostname] [-e]... [-p]... [-v|--tmpfs]...
     * [--restart] [--network] [--entrypoint] extra... IMAGE [args]...
     */
    static std::vector<std::string> BuildRunArguments(const core::ContainerRuntimeSpec& spec,
                                                      const std::string& image,
                                                      const std::vector<std::string>& extra_run_args = {});

private:
    std::string docker_binary_;
    std::vector<std::string> extra_run_args_;

    utils::ProcessResult ExecuteDockerCommand(const std::vector<std::string>& args) const;
    std::optional<nlohmann::json> ParseInspectOutput(const utils::ProcessResult& result) const;
};

} // namespace runtime
} // namespace redock
