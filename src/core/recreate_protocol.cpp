/**
 * @file recreate_protocol.cpp
 * @brief Implementation of the per-target recreate state machine
 *
 * **Standalone path**:
 * ```
 * captured spec -> pull target -> resolve -> decide
 *   UPDATE: stop -> rm -> run (captured spec, new image) -> inspect
 * ```
 *
 * **Compose path**:
 * ```
 * declared image + running container -> drift -> compose pull -> resolve -> decide
 *   UPDATE: compose up -d --force-recreate --no-deps <svc> -> compose ps
 * ```
 *
 * A container removed but not recreated is always recorded as RECREATE_FAIL
 * with the image reference and identity it ran before, so rollback can find
 * its way back.
 *
 * @date 2025
 */

#include "redock/core/recreate_protocol.hpp"
#include "redock/core/decision_engine.hpp"
#include "redock/core/errors.hpp"
#include "redock/utils/scoped_overlay_file.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <stdexcept>
#include <type_traits>
#include <variant>

using json = nlohmann::json;

namespace redock {
namespace core {

ImageReference TargetReference(const ImageReference& configured, const TargetRequest& request) {
    if (request.digest) {
        return configured.WithDigest(*request.digest);
    }
    if (request.tag) {
        return configured.WithTag(*request.tag);
    }
    return configured;
}

// ============================================================================
// CONSTRUCTION
// ============================================================================

RecreateProtocol::RecreateProtocol(runtime::ContainerRuntime& runtime,
                                   runtime::ComposeTool& compose,
                                   const ledger::HistoryLog& ledger)
    : RecreateProtocol(runtime, compose, ledger, Config{}) {
}

RecreateProtocol::RecreateProtocol(runtime::ContainerRuntime& runtime,
                                   runtime::ComposeTool& compose,
                                   const ledger::HistoryLog& ledger,
                                   const Config& config)
    : runtime_(runtime)
    , compose_(compose)
    , ledger_(ledger)
    , config_(config)
    , resolver_(runtime) {
}

TargetResult RecreateProtocol::Run(const TargetContext& context, const TargetRequest& request) {
    return std::visit([&](const auto& target) -> TargetResult {
        using T = std::decay_t<decltype(target)>;
        if constexpr (std::is_same_v<T, Standalone>) {
            return RunStandalone(target.spec, request);
        } else {
            return RunManaged(target.context, request);
        }
    }, context);
}

// ============================================================================
// STANDALONE PATH
// ============================================================================

TargetResult RecreateProtocol::RunStandalone(const ContainerRuntimeSpec& spec, const TargetRequest& request) {
    TargetResult result;
    result.target = spec.name;
    result.logical_name = spec.name;
    result.final_state = ProtocolState::INSPECTED;

    spdlog::info("[RECREATE] Container '{}' (standalone, image {})", spec.name, spec.image);

    if (spec.image.empty() || IsDigest(spec.image)) {
        Fail(result, ActionKind::PULL_FAIL,
             "container was started from a bare image ID; there is no repository to pull from");
        Record(result, ActionKind::PULL_FAIL, spec.image, "");
        return result;
    }

    ImageReference configured;
    try {
        configured = ImageReference::Parse(spec.image);
    }
    catch (const ArgumentError& e) {
        Fail(result, ActionKind::PULL_FAIL, e.what());
        Record(result, ActionKind::PULL_FAIL, spec.image, "");
        return result;
    }

    const ImageReference target = TargetReference(configured, request);
    const std::string target_text = target.PullReference();
    const std::string prior_reference = spec.image;

    const auto current = CurrentIdentity(spec.image_id, configured.repository);
    result.prior_identity = current.value_or("");
    spdlog::debug("Current identity of {}: {}", spec.name, current.value_or("<unknown>"));

    // Pulled
    if (!runtime_.PullImage(target_text)) {
        Fail(result, ActionKind::PULL_FAIL, "Pull of " + target_text + " failed");
        Record(result, ActionKind::PULL_FAIL, target_text, "");
        return result;
    }
    result.final_state = ProtocolState::PULLED;

    // Compared
    const auto pulled = resolver_.TryResolve(target);
    const auto outcome = Decide(pulled, current, request.HasOverride(), false);
    result.final_state = ProtocolState::COMPARED;

    if (outcome == ActionKind::PULL_FAIL) {
        Fail(result, ActionKind::PULL_FAIL, "Pulled image " + target_text + " cannot be resolved");
        Record(result, ActionKind::PULL_FAIL, target_text, "");
        return result;
    }
    if (outcome == ActionKind::SKIP_PINNED || outcome == ActionKind::SKIP_MISMATCH) {
        spdlog::info("[SKIP] {} already runs {} ({})", spec.name, target_text, *pulled);
        result.final_state = ProtocolState::SKIPPED;
        Record(result, outcome, target_text, *pulled);
        return result;
    }

    spdlog::info("[RECREATE] {}: {} -> {}", spec.name, current.value_or("<unknown>"), *pulled);

    if (!runtime_.StopContainer(spec.name)) {
        Fail(result, ActionKind::RECREATE_FAIL, "Stop failed; container left untouched");
        Record(result, ActionKind::RECREATE_FAIL, prior_reference, result.prior_identity);
        return result;
    }
    result.final_state = ProtocolState::STOPPED;

    if (!runtime_.RemoveContainer(spec.name)) {
        Fail(result, ActionKind::RECREATE_FAIL,
             "Remove failed; container is stopped, bring it back with 'docker start " + spec.name + "'");
        Record(result, ActionKind::RECREATE_FAIL, prior_reference, result.prior_identity);
        return result;
    }
    result.final_state = ProtocolState::REMOVED;

    if (!runtime_.RunContainer(spec, target_text)) {
        spdlog::critical("[RECREATE] '{}' was removed but could not be started from {}", spec.name, target_text);
        spdlog::critical("[RECREATE] Previous image: {} ({})", prior_reference, result.prior_identity);
        spdlog::critical("[RECREATE] Relaunch manually with: {}", runtime_.RelaunchHint(spec, prior_reference));
        Fail(result, ActionKind::RECREATE_FAIL, "Container removed but not recreated");
        Record(result, ActionKind::RECREATE_FAIL, prior_reference, result.prior_identity);
        return result;
    }
    result.final_state = ProtocolState::STARTED;

    // Verified
    if (!runtime_.InspectContainer(spec.name)) {
        spdlog::critical("[RECREATE] '{}' is missing right after start", spec.name);
        spdlog::critical("[RECREATE] Relaunch manually with: {}", runtime_.RelaunchHint(spec, prior_reference));
        Fail(result, ActionKind::RECREATE_FAIL, "Container missing after start");
        Record(result, ActionKind::RECREATE_FAIL, prior_reference, result.prior_identity);
        return result;
    }
    result.final_state = ProtocolState::VERIFIED;

    spdlog::info("[RECREATE] {} now runs {}", spec.name, target_text);
    Record(result, ActionKind::UPDATE, target_text, *pulled);
    return result;
}

// ============================================================================
// COMPOSE PATH
// ============================================================================

TargetResult RecreateProtocol::RunManaged(const ManagedContext& context, const TargetRequest& request) {
    runtime::ComposeInvocation invocation;
    invocation.config_file = context.config_file;
    invocation.project_directory = context.working_directory;
    invocation.project_name = context.project;
    return RunService(invocation, context.service, request);
}

TargetResult RecreateProtocol::RunService(const runtime::ComposeInvocation& invocation,
                                          const std::string& service,
                                          const TargetRequest& request) {
    TargetResult result;
    result.target = service;
    result.logical_name = service;
    result.final_state = ProtocolState::INSPECTED;

    spdlog::info("[RECREATE] Service '{}' ({})", service, invocation.config_file);

    ImageReference declared;
    try {
        auto declared_text = compose_.DeclaredImage(invocation, service);
        if (!declared_text) {
            Fail(result, ActionKind::PULL_FAIL, "Service '" + service + "' declares no image");
            Record(result, ActionKind::PULL_FAIL, "", "");
            return result;
        }
        declared = ImageReference::Parse(*declared_text);
    }
    catch (const std::runtime_error& e) {
        // RuntimeCommandError from compose or ArgumentError from the declared reference
        Fail(result, ActionKind::PULL_FAIL, e.what());
        Record(result, ActionKind::PULL_FAIL, "", "");
        return result;
    }

    // Inspected: what runs now and which reference it was created from
    std::string prior_reference = declared.ToString();
    std::optional<ImageReference> running;
    std::optional<std::string> current;
    if (auto container_id = compose_.ServiceContainerId(invocation, service)) {
        if (auto container = runtime_.InspectContainer(*container_id)) {
            if (container->contains("Config") && (*container)["Config"].is_object()) {
                const auto& config = (*container)["Config"];
                if (config.contains("Image") && config["Image"].is_string()) {
                    prior_reference = config["Image"].get<std::string>();
                    try {
                        running = ImageReference::Parse(prior_reference);
                    }
                    catch (const ArgumentError& e) {
                        spdlog::debug("Running reference of '{}' not comparable: {}", service, e.what());
                    }
                }
            }
            current = CurrentIdentity(container->value("Image", std::string()), declared.repository);
        }
    }
    result.prior_identity = current.value_or("");

    const bool drift = DetectDrift(declared, running, current);
    bool has_override = request.HasOverride();
    if (drift) {
        const std::string running_text = prior_reference + " (" + result.prior_identity + ")";
        if (has_override) {
            spdlog::warn("[DRIFT] '{}' runs {} but declares {}; explicit request wins",
                         service, running_text, declared.ToString());
        } else if (!config_.drift_protection) {
            spdlog::warn("[DRIFT] '{}' runs {} but declares {}; drift protection is off",
                         service, running_text, declared.ToString());
            has_override = true;
        } else {
            spdlog::warn("[DRIFT] '{}' runs {} but declares {}", service, running_text, declared.ToString());
        }
    }

    const ImageReference target = TargetReference(declared, request);
    const std::string target_text = target.PullReference();

    runtime::ComposeInvocation effective = invocation;
    std::optional<utils::ScopedOverlayFile> overlay;
    if (request.tag || request.digest) {
        try {
            overlay.emplace(service, target_text);
        }
        catch (const std::runtime_error& e) {
            Fail(result, ActionKind::PULL_FAIL, e.what());
            Record(result, ActionKind::PULL_FAIL, target_text, "");
            return result;
        }
        effective.override_files.push_back(overlay->path().string());
    }

    // Pulled
    if (!compose_.Pull(effective, service)) {
        Fail(result, ActionKind::PULL_FAIL, "Compose pull of " + target_text + " failed");
        Record(result, ActionKind::PULL_FAIL, target_text, "");
        return result;
    }
    result.final_state = ProtocolState::PULLED;

    // Compared
    const auto pulled = resolver_.TryResolve(target);
    const auto outcome = Decide(pulled, current, has_override, drift);
    result.final_state = ProtocolState::COMPARED;

    switch (outcome) {
        case ActionKind::PULL_FAIL:
            Fail(result, ActionKind::PULL_FAIL, "Pulled image " + target_text + " cannot be resolved");
            Record(result, ActionKind::PULL_FAIL, target_text, "");
            return result;

        case ActionKind::SKIP_PINNED:
            spdlog::info("[SKIP] {} already runs {} ({})", service, target_text, *pulled);
            result.final_state = ProtocolState::SKIPPED;
            Record(result, ActionKind::SKIP_PINNED, target_text, *pulled);
            return result;

        case ActionKind::SKIP_MISMATCH:
            spdlog::warn("[SKIP] {} left as is; pass --tag or --force to recreate it anyway", service);
            result.final_state = ProtocolState::SKIPPED;
            result.message = "Running image differs from the declared image";
            Record(result, ActionKind::SKIP_MISMATCH, target_text, *pulled);
            return result;

        default:
            break;
    }

    spdlog::info("[RECREATE] {}: {} -> {}", service, current.value_or("<none>"), *pulled);

    if (!compose_.Up(effective, service)) {
        spdlog::critical("[RECREATE] Service '{}' could not be recreated from {}", service, target_text);
        spdlog::critical("[RECREATE] Previous image: {} ({})", prior_reference, result.prior_identity);
        Fail(result, ActionKind::RECREATE_FAIL, "compose up failed");
        Record(result, ActionKind::RECREATE_FAIL, prior_reference, result.prior_identity);
        return result;
    }
    result.final_state = ProtocolState::STARTED;

    // Verified
    bool live = false;
    if (auto container_id = compose_.ServiceContainerId(effective, service)) {
        if (auto container = runtime_.InspectContainer(*container_id)) {
            live = true;
            if (container->contains("State") && (*container)["State"].is_object()) {
                live = (*container)["State"].value("Running", true);
            }
        }
    }
    if (!live) {
        spdlog::critical("[RECREATE] Service '{}' has no running container after recreate", service);
        spdlog::critical("[RECREATE] Previous image: {} ({})", prior_reference, result.prior_identity);
        Fail(result, ActionKind::RECREATE_FAIL, "No running container after compose up");
        Record(result, ActionKind::RECREATE_FAIL, prior_reference, result.prior_identity);
        return result;
    }
    result.final_state = ProtocolState::VERIFIED;

    spdlog::info("[RECREATE] {} now runs {}", service, target_text);
    Record(result, ActionKind::UPDATE, target_text, *pulled);
    return result;
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

std::optional<std::string> RecreateProtocol::CurrentIdentity(const std::string& image_id,
                                                             const std::string& repository) const {
    if (image_id.empty()) {
        return std::nullopt;
    }
    try {
        return resolver_.ResolveImageId(image_id, repository);
    }
    catch (const ImageNotFound& e) {
        spdlog::debug("{}; comparing by image ID", e.what());
    }
    catch (const ArgumentError& e) {
        spdlog::debug("{}; comparing by image ID", e.what());
    }
    return image_id;
}

void RecreateProtocol::Record(TargetResult& result, ActionKind kind,
                              const std::string& image_reference, const std::string& identity) {
    result.outcome = kind;
    result.image_reference = image_reference;
    result.identity = identity;

    try {
        ledger_.Append(ledger::HistoryLog::MakeRecord(result.logical_name, image_reference, identity, kind));
    }
    catch (const std::runtime_error& e) {
        spdlog::error("[LEDGER] Could not record {} for {}: {}",
                      ActionKindToString(kind), result.logical_name, e.what());
        if (!result.message.empty()) result.message += "; ";
        result.message += "ledger write failed: " + std::string(e.what());
    }
}

void RecreateProtocol::Fail(TargetResult& result, ActionKind kind, const std::string& message) {
    result.outcome = kind;
    result.final_state = ProtocolState::FAILED;
    result.message = message;

    if (kind == ActionKind::RECREATE_FAIL) {
        spdlog::critical("[RECREATE] {}: {}", result.target, message);
    } else {
        spdlog::error("[{}] {}: {}", ActionKindToString(kind), result.target, message);
    }
}

} // namespace core
} // namespace redock
