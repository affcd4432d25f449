/**
 * @file image_reference.hpp
 * @brief Parsed container image reference (repository + tag and/or digest)
 *
 * Accepts the same grammar as the Docker CLI:
 * @code
 * [registry[:port]/]path[:tag][@algorithm:hex]
 * @endcode
 * A ':' is a tag separator only when it appears after the last '/', so
 * "registry:5000/app" has no tag.
 *
 * @date 2025
 */

#pragma once

#include <string>

namespace redock {
namespace core {

/**
 * @struct ImageReference
 * @brief Image reference as supplied on the command line or declared by a container
 */
struct ImageReference {
    std::string repository;  ///< Registry + path, e.g. "ghcr.io/acme/api"
    std::string tag;         ///< Tag (empty when absent)
    std::string digest;      ///< "sha256:..." (empty when absent)

    /**
     * @brief Parse a reference string
     * @throws ArgumentError if the string is empty or has an empty repository
     */
    static ImageReference Parse(const std::string& text);

    bool HasTag() const { return !tag.empty(); }
    bool HasDigest() const { return !digest.empty(); }

    /// Same repository, given tag, no digest
    ImageReference WithTag(const std::string& new_tag) const;

    /// Same repository, given digest, no tag
    ImageReference WithDigest(const std::string& new_digest) const;

    /// Canonical string: repository[:tag][@digest]
    std::string ToString() const;

    /// Reference handed to a pull: defaults to ":latest" when neither tag nor digest is set
    std::string PullReference() const;

    /**
     * @brief Repository with Docker Hub defaults stripped
     *
     * "docker.io/library/nginx", "index.docker.io/library/nginx" and "nginx"
     * all normalize to "nginx"; used to match RepoDigests entries.
     */
    std::string NormalizedRepository() const;
};

/// True for "<algorithm>:<hex>" tokens (sha256:..., sha512:...)
bool IsDigest(const std::string& value);

} // namespace core
} // namespace redock
