/**
 * @file runtime_config_extractor.hpp
 * @brief Reconstructs a container's launch configuration from introspection
 *
 * @date 2025
 */

#pragma once

#include "redock/core/types.hpp"
#include "redock/runtime/container_runtime.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace redock {
namespace runtime {

/**
 * @class RuntimeConfigExtractor
 * @brief Builds a ContainerRuntimeSpec that relaunches a container unchanged
 *
 * Only parameters that differ from what the runtime would pick anyway are
 * kept: wildcard host interfaces, the default network, the generated
 * hostname and the image's own entrypoint/command are dropped so the
 * recreated container does not carry redundant flags.
 *
 * Malformed entries (a mount without destination, an unparsable port key)
 * are dropped with a warning; everything else is still captured.
 */
class RuntimeConfigExtractor {
public:
    explicit RuntimeConfigExtractor(ContainerRuntime& runtime);

    /**
     * @brief Capture the launch configuration of a container
     * @param name Container name or ID
     * @throws ContainerNotFound if the container does not exist
     */
    core::ContainerRuntimeSpec Extract(const std::string& name) const;

    /**
     * @brief Build a spec from inspect documents
     * @param name Fallback name when the document carries none
     * @param container Container inspect document
     * @param image Inspect document of the container's image (std::nullopt if unavailable)
     */
    static core::ContainerRuntimeSpec FromInspect(const std::string& name,
                                                  const nlohmann::json& container,
                                                  const std::optional<nlohmann::json>& image);

private:
    ContainerRuntime& runtime_;
};

} // namespace runtime
} // namespace redock
