/**
 * @file image_reference.cpp
 * @brief Image reference parsing and normalization
 *
 * @date 2025
 */

#include "redock/core/image_reference.hpp"
#include "redock/core/errors.hpp"

#include <regex>

namespace redock {
namespace core {

namespace {

std::string StripPrefix(const std::string& value, const std::string& prefix) {
    if (value.compare(0, prefix.size(), prefix) == 0) {
        return value.substr(prefix.size());
    }
    return value;
}

} // anonymous namespace

ImageReference ImageReference::Parse(const std::string& text) {
    if (text.empty()) {
        throw ArgumentError("Empty image reference");
    }

    ImageReference ref;
    std::string name = text;

    auto at = name.find('@');
    if (at != std::string::npos) {
        ref.digest = name.substr(at + 1);
        name = name.substr(0, at);
        if (!IsDigest(ref.digest)) {
            throw ArgumentError("Invalid digest in image reference '" + text + "'");
        }
    }

    auto colon = name.rfind(':');
    auto slash = name.rfind('/');
    if (colon != std::string::npos && (slash == std::string::npos || colon > slash)) {
        ref.tag = name.substr(colon + 1);
        name = name.substr(0, colon);
    }

    ref.repository = name;
    if (ref.repository.empty()) {
        throw ArgumentError("Image reference '" + text + "' has no repository");
    }
    return ref;
}

ImageReference ImageReference::WithTag(const std::string& new_tag) const {
    ImageReference ref;
    ref.repository = repository;
    ref.tag = new_tag;
    return ref;
}

ImageReference ImageReference::WithDigest(const std::string& new_digest) const {
    ImageReference ref;
    ref.repository = repository;
    ref.digest = new_digest;
    return ref;
}

std::string ImageReference::ToString() const {
    std::string out = repository;
    if (HasTag()) out += ":" + tag;
    if (HasDigest()) out += "@" + digest;
    return out;
}

std::string ImageReference::PullReference() const {
    if (!HasTag() && !HasDigest()) {
        return repository + ":latest";
    }
    return ToString();
}

std::string ImageReference::NormalizedRepository() const {
    std::string repo = repository;
    repo = StripPrefix(repo, "index.docker.io/");
    repo = StripPrefix(repo, "registry-1.docker.io/");
    repo = StripPrefix(repo, "docker.io/");
    repo = StripPrefix(repo, "library/");
    return repo;
}

bool IsDigest(const std::string& value) {
    static const std::regex digest_regex(R"(^[a-z0-9]+([+._-][a-z0-9]+)*:[a-fA-F0-9]{32,}$)");
    return std::regex_match(value, digest_regex);
}

} // namespace core
} // namespace redock
