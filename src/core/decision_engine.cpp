/**
 * @file decision_engine.cpp
 * @brief Skip / update decision rules
 *
 * @date 2025
 */

#include "redock/core/decision_engine.hpp"

namespace redock {
namespace core {

DecisionOutcome Decide(const std::optional<std::string>& pulled,
                       const std::optional<std::string>& current,
                       bool has_override,
                       bool drift_detected) {
    if (!pulled || pulled->empty()) {
        return ActionKind::PULL_FAIL;
    }
    if (current && *current == *pulled) {
        return ActionKind::SKIP_PINNED;
    }
    if (!has_override && drift_detected) {
        return ActionKind::SKIP_MISMATCH;
    }
    return ActionKind::UPDATE;
}

bool DetectDrift(const ImageReference& declared,
                 const std::optional<ImageReference>& running,
                 const std::optional<std::string>& current) {
    if (declared.HasDigest()) {
        return current && *current != declared.digest;
    }
    if (!running) {
        return false;
    }
    return !SameReference(declared, *running);
}

bool SameReference(const ImageReference& a, const ImageReference& b) {
    auto effective_tag = [](const ImageReference& ref) {
        return ref.HasTag() || ref.HasDigest() ? ref.tag : std::string("latest");
    };
    return a.NormalizedRepository() == b.NormalizedRepository() &&
           effective_tag(a) == effective_tag(b) &&
           a.digest == b.digest;
}

} // namespace core
} // namespace redock
