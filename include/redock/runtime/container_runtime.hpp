/**
 * @file container_runtime.hpp
 * @brief Capability interface over the container runtime
 *
 * The reconciliation core only depends on this contract. DockerRuntime
 * implements it on top of the docker CLI; tests use an in-memory fake.
 * Introspection results are returned as the runtime's JSON document so that
 * field extraction stays in the extractor/detector, not in the transport.
 *
 * @date 2025
 */

#pragma once

#include "redock/core/types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>
#include <optional>

namespace redock {
namespace runtime {

/**
 * @class ContainerRuntime
 * @brief Create / inspect / stop / remove / pull / run primitives
 *
 * All calls block until the runtime answers.
 */
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    /**
     * @brief Inspect a container
     * @param name Container name or ID
     * @return Inspect document, or std::nullopt when the container does not exist
     */
    virtual std::optional<nlohmann::json> InspectContainer(const std::string& name) = 0;

    /**
     * @brief Inspect a local image
     * @param reference Image reference or image ID
     * @return Inspect document, or std::nullopt when the image is not present locally
     */
    virtual std::optional<nlohmann::json> InspectImage(const std::string& reference) = 0;

    /// Pull an image; false when the pull failed
    virtual bool PullImage(const std::string& reference) = 0;

    virtual bool StopContainer(const std::string& name) = 0;

    virtual bool RemoveContainer(const std::string& name) = 0;

    /**
     * @brief Launch a detached container from a captured runtime spec
     * @param spec Launch configuration (spec.name is the container name)
     * @param image Image reference to run
     * @return true if the runtime accepted the container
     */
    virtual bool RunContainer(const core::ContainerRuntimeSpec& spec, const std::string& image) = 0;

    /// Names of containers (running or not) carrying label=value
    virtual std::vector<std::string> ListContainersByLabel(const std::string& label,
                                                           const std::string& value) = 0;

    /// Remove unused images
    virtual bool PruneImages() = 0;

    /// Command an operator can run to relaunch the container by hand
    virtual std::string RelaunchHint(const core::ContainerRuntimeSpec& spec, const std::string& image) const = 0;
};

} // namespace runtime
} // namespace redock
