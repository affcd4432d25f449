/**
 * @file identity_resolver.hpp
 * @brief Maps image references to content identities
 *
 * Tags are mutable and many-to-one with images, so every "same image?"
 * question in the engine is answered by comparing identities produced here.
 * The resolver only reads the local image store; pulling is the caller's job
 * so that "already current" can be told apart from "freshly fetched".
 *
 * @date 2025
 */

#pragma once

#include "redock/core/image_reference.hpp"
#include "redock/runtime/container_runtime.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace redock {
namespace core {

/**
 * @class IdentityResolver
 * @brief Content identity lookup against the local image store
 *
 * Identity selection order:
 * 1. RepoDigests entry whose repository matches the requested repository
 * 2. First RepoDigests entry
 * 3. Image ID (locally built or never pushed images)
 */
class IdentityResolver {
public:
    explicit IdentityResolver(runtime::ContainerRuntime& runtime);

    /**
     * @brief Resolve a reference that is expected to be present locally
     * @throws ImageNotFound if the runtime has no such image
     */
    std::string Resolve(const ImageReference& reference) const;

    /// Resolve() without the exception
    std::optional<std::string> TryResolve(const ImageReference& reference) const;

    /**
     * @brief Resolve the image a container runs, comparable with Resolve()
     *
     * @param image_id Image ID from the container's inspect document
     * @param repository Repository to prefer when picking a RepoDigests entry
     * @throws ImageNotFound if the image ID is unknown to the runtime
     */
    std::string ResolveImageId(const std::string& image_id, const std::string& repository) const;

    /// Identity of an image inspect document (selection order above)
    static std::optional<std::string> SelectIdentity(const nlohmann::json& image,
                                                     const std::string& normalized_repository);

private:
    runtime::ContainerRuntime& runtime_;
};

} // namespace core
} // namespace redock
