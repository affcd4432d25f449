/**
 * @file identity_resolver.cpp
 * @brief Content identity resolution from image inspect documents
 *
 * @date 2025
 */

#include "redock/core/identity_resolver.hpp"
#include "redock/core/errors.hpp"

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace redock {
namespace core {

IdentityResolver::IdentityResolver(runtime::ContainerRuntime& runtime)
    : runtime_(runtime) {
}

std::string IdentityResolver::Resolve(const ImageReference& reference) const {
    const std::string lookup = reference.PullReference();

    auto image = runtime_.InspectImage(lookup);
    if (!image) {
        throw ImageNotFound(lookup);
    }

    auto identity = SelectIdentity(*image, reference.NormalizedRepository());
    if (!identity) {
        throw ImageNotFound(lookup);
    }

    spdlog::debug("Resolved {} -> {}", lookup, *identity);
    return *identity;
}

std::optional<std::string> IdentityResolver::TryResolve(const ImageReference& reference) const {
    try {
        return Resolve(reference);
    }
    catch (const ImageNotFound& e) {
        spdlog::debug("{}", e.what());
        return std::nullopt;
    }
}

std::string IdentityResolver::ResolveImageId(const std::string& image_id,
                                             const std::string& repository) const {
    auto image = runtime_.InspectImage(image_id);
    if (!image) {
        throw ImageNotFound(image_id);
    }

    std::string normalized = repository;
    if (!repository.empty()) {
        normalized = ImageReference::Parse(repository).NormalizedRepository();
    }

    auto identity = SelectIdentity(*image, normalized);
    if (!identity) {
        throw ImageNotFound(image_id);
    }
    return *identity;
}

std::optional<std::string> IdentityResolver::SelectIdentity(const json& image,
                                                            const std::string& normalized_repository) {
    std::optional<std::string> first_digest;

    if (image.contains("RepoDigests") && image["RepoDigests"].is_array()) {
        for (const auto& entry : image["RepoDigests"]) {
            if (!entry.is_string()) continue;

            const auto text = entry.get<std::string>();
            ImageReference repo_digest;
            try {
                repo_digest = ImageReference::Parse(text);
            }
            catch (const ArgumentError&) {
                spdlog::warn("Ignoring malformed RepoDigests entry '{}'", text);
                continue;
            }
            if (!repo_digest.HasDigest()) continue;

            if (repo_digest.NormalizedRepository() == normalized_repository) {
                return repo_digest.digest;
            }
            if (!first_digest) {
                first_digest = repo_digest.digest;
            }
        }
    }

    if (first_digest) {
        return first_digest;
    }

    if (image.contains("Id") && image["Id"].is_string()) {
        auto id = image["Id"].get<std::string>();
        if (!id.empty()) return id;
    }
    return std::nullopt;
}

} // namespace core
} // namespace redock
