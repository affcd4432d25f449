/**
 * @file context_detector.hpp
 * @brief Decides whether a container is owned by a compose project
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

/// Compose ownership labels
namespace labels {
inline constexpr const char* kConfigFiles = "com.docker.compose.project.config_files";
inline constexpr const char* kWorkingDir = "com.docker.compose.project.working_dir";
inline constexpr const char* kService = "com.docker.compose.service";
inline constexpr const char* kProject = "com.docker.compose.project";
} // namespace labels

/**
 * @class ContextDetector
 * @brief Reads compose labels and classifies targets
 *
 * A container is managed only when all three of config file, working
 * directory and service are present. The first entry of the config file
 * list is used; a relative path is resolved against the working directory.
 */
class ContextDetector {
public:
    explicit ContextDetector(ContainerRuntime& runtime);

    /**
     * @brief Managed context of a container (one inspect call)
     * @return std::nullopt for standalone containers
     * @throws ContainerNotFound if the container does not exist
     */
    std::optional<core::ManagedContext> Detect(const std::string& name) const;

    /**
     * @brief Single detection step producing the Standalone/Managed variant
     *
     * Standalone targets get their runtime spec captured here, so a failure
     * to capture stops the target before anything destructive happens.
     * @throws ContainerNotFound if the container does not exist
     */
    core::TargetContext Classify(const std::string& name) const;

    /// Pure label parsing used by Detect()
    static std::optional<core::ManagedContext> DetectFromLabels(const nlohmann::json& labels);

    /// Compose project name label, empty if absent
    static std::string ProjectFromLabels(const nlohmann::json& labels);

private:
    ContainerRuntime& runtime_;
};

} // namespace runtime
} // namespace redock
