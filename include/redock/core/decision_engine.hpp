/**
 * @file decision_engine.hpp
 * @brief Skip / update decision rules
 *
 * Rules, first match wins:
 * 1. pulled identity unresolved            -> PULL_FAIL
 * 2. current identity == pulled identity   -> SKIP_PINNED
 * 3. no override and drift detected        -> SKIP_MISMATCH
 * 4. otherwise                             -> UPDATE
 *
 * An explicit override beats drift protection but never forces a recreate
 * of a target that already runs the requested identity.
 *
 * @date 2025
 */

#pragma once

#include "redock/core/image_reference.hpp"
#include "redock/core/types.hpp"

#include <optional>
#include <string>

namespace redock {
namespace core {

/**
 * @param pulled Identity of the freshly pulled reference (std::nullopt if unresolvable)
 * @param current Identity currently running (std::nullopt if nothing runs)
 * @param has_override An explicit tag/digest/force was requested
 * @param drift_detected Running target diverges from its declaration
 */
DecisionOutcome Decide(const std::optional<std::string>& pulled,
                       const std::optional<std::string>& current,
                       bool has_override,
                       bool drift_detected);

/**
 * @brief Drift between a compose declaration and what actually runs
 *
 * A digest-pinned declaration drifts when the running identity is another
 * one. A tag declaration names no identity of its own, so it drifts only when
 * the container was created from a different reference (another tag, a
 * digest pin left by a rollback). What the tag resolves to in the local image
 * cache is never consulted.
 *
 * @param declared Reference declared by the compose file
 * @param running Reference the container was created from (Config.Image)
 * @param current Identity currently running
 */
bool DetectDrift(const ImageReference& declared,
                 const std::optional<ImageReference>& running,
                 const std::optional<std::string>& current);

/// Same repository, tag (":latest" when neither tag nor digest) and digest
bool SameReference(const ImageReference& a, const ImageReference& b);

} // namespace core
} // namespace redock
