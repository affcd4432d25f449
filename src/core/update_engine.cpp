/**
 * @file update_engine.cpp
 * @brief Implementation of run-level orchestration
 *
 * **Run Flow**:
 * ```
 * Validate -> dispatch by mode
 *   COMPOSE_FILE: list services -> RecreateProtocol::RunService per service
 *   CONTAINERS:   ContextDetector::Classify -> RecreateProtocol::Run per name
 *   ROLLBACK:     RollbackSelector::Rollback
 * -> prune (update modes) -> report
 * ```
 *
 * Exceptions escaping a single target are converted into a failed
 * TargetResult at the target boundary so the batch keeps going.
 *
 * @date 2025
 */

#include "redock/core/update_engine.hpp"
#include "redock/core/errors.hpp"
#include "redock/core/image_reference.hpp"
#include "redock/core/recreate_protocol.hpp"
#include "redock/core/rollback_selector.hpp"
#include "redock/runtime/context_detector.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <regex>
#include <sstream>

namespace redock {
namespace core {

namespace {

// Docker tag grammar
const std::regex kTagPattern(R"(^[A-Za-z0-9_][A-Za-z0-9_.-]{0,127}$)");

TargetRequest MakeTargetRequest(const UpdateRequest& request) {
    TargetRequest target;
    if (request.tag) {
        if (IsDigest(*request.tag)) {
            target.digest = *request.tag;
        } else {
            target.tag = *request.tag;
        }
    }
    target.force = request.force;
    return target;
}

std::string ModeName(RunMode mode) {
    switch (mode) {
        case RunMode::COMPOSE_FILE: return "compose file";
        case RunMode::CONTAINERS: return "containers";
        case RunMode::ROLLBACK: return "rollback";
    }
    return "unknown";
}

} // anonymous namespace

// ============================================================================
// RUN REPORT
// ============================================================================

std::size_t RunReport::FailureCount() const {
    return static_cast<std::size_t>(std::count_if(results.begin(), results.end(),
                                                  [](const TargetResult& r) { return r.Failed(); }));
}

int RunReport::ExitCode() const {
    return FailureCount() == 0 ? 0 : 1;
}

// ============================================================================
// PRIVATE IMPLEMENTATION (PIMPL PATTERN)
// ============================================================================

class UpdateEngine::Impl {
public:
    Impl(runtime::ContainerRuntime& runtime,
         runtime::ComposeTool& compose,
         const ledger::HistoryLog& ledger,
         std::istream& input,
         std::ostream& output,
         const UpdateEngine::Config& config)
        : runtime(runtime)
        , compose(compose)
        , ledger(ledger)
        , detector(runtime)
        , protocol(runtime, compose, ledger, RecreateProtocol::Config{config.drift_protection})
        , selector(runtime, ledger, protocol, input, output,
                   RollbackSelector::Config{config.rollback_history_limit}) {
    }

    runtime::ContainerRuntime& runtime;
    runtime::ComposeTool& compose;
    const ledger::HistoryLog& ledger;
    runtime::ContextDetector detector;
    RecreateProtocol protocol;
    RollbackSelector selector;
};

UpdateEngine::UpdateEngine(runtime::ContainerRuntime& runtime,
                           runtime::ComposeTool& compose,
                           const ledger::HistoryLog& ledger,
                           std::istream& input,
                           std::ostream& output)
    : UpdateEngine(runtime, compose, ledger, input, output, Config{}) {
}

UpdateEngine::UpdateEngine(runtime::ContainerRuntime& runtime,
                           runtime::ComposeTool& compose,
                           const ledger::HistoryLog& ledger,
                           std::istream& input,
                           std::ostream& output,
                           const Config& config)
    : impl_(std::make_unique<Impl>(runtime, compose, ledger, input, output, config))
    , config_(config) {
}

UpdateEngine::~UpdateEngine() = default;

// ============================================================================
// EXECUTION
// ============================================================================

RunReport UpdateEngine::Execute(const UpdateRequest& request) {
    Validate(request);

    const auto start = std::chrono::steady_clock::now();

    RunReport report;
    report.mode = request.mode;

    spdlog::info("[START] Mode: {}", ModeName(request.mode));

    switch (request.mode) {
        case RunMode::COMPOSE_FILE:
            report.results = UpdateComposeFile(request);
            break;
        case RunMode::CONTAINERS:
            report.results = UpdateContainers(request);
            break;
        case RunMode::ROLLBACK:
            report.results.push_back(Rollback(request));
            break;
    }

    if (request.mode != RunMode::ROLLBACK) {
        if (request.prune && config_.prune_after_update) {
            report.pruned = impl_->runtime.PruneImages();
        } else {
            spdlog::info("Image prune skipped");
        }
    }

    report.elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start);

    spdlog::info("[DONE] {} target(s), {} failed", report.results.size(), report.FailureCount());
    return report;
}

void UpdateEngine::Validate(const UpdateRequest& request) {
    if (request.tag) {
        if (request.mode == RunMode::ROLLBACK) {
            throw ArgumentError("--tag cannot be combined with --rollback");
        }
        if (request.tag->empty()) {
            throw ArgumentError("--tag must not be empty");
        }
        if (!IsDigest(*request.tag) && !std::regex_match(*request.tag, kTagPattern)) {
            throw ArgumentError("Invalid tag '" + *request.tag + "'");
        }
    }

    switch (request.mode) {
        case RunMode::COMPOSE_FILE:
            if (request.compose_file.empty()) {
                throw ArgumentError("A compose file is required");
            }
            if (request.tag && !request.service) {
                throw ArgumentError("--tag with --file requires --service");
            }
            if (request.service && request.service->empty()) {
                throw ArgumentError("--service must not be empty");
            }
            break;

        case RunMode::CONTAINERS:
            if (request.containers.empty()) {
                throw ArgumentError("At least one container name is required");
            }
            if (request.tag && request.containers.size() != 1) {
                throw ArgumentError("--tag may only be used with a single container");
            }
            break;

        case RunMode::ROLLBACK:
            if (request.rollback_target.empty()) {
                throw ArgumentError("--rollback requires a container or service name");
            }
            break;
    }
}

// ============================================================================
// MODES
// ============================================================================

std::vector<TargetResult> UpdateEngine::UpdateComposeFile(const UpdateRequest& request) {
    if (!std::filesystem::exists(request.compose_file)) {
        throw NotFound("Compose file '" + request.compose_file.string() + "' not found");
    }

    runtime::ComposeInvocation invocation;
    invocation.config_file = std::filesystem::absolute(request.compose_file).string();

    spdlog::info("Reading services from '{}'...", invocation.config_file);
    const auto declared = impl_->compose.ListServices(invocation);

    std::vector<std::string> services;
    std::vector<TargetResult> results;
    if (request.service) {
        if (std::find(declared.begin(), declared.end(), *request.service) == declared.end()) {
            results.push_back(NotFoundResult(*request.service,
                "Service '" + *request.service + "' is not declared in '" + invocation.config_file + "'"));
            return results;
        }
        services.push_back(*request.service);
    } else {
        services = declared;
    }

    spdlog::info("Processing {} service(s)", services.size());

    const auto target_request = MakeTargetRequest(request);
    for (const auto& service : services) {
        try {
            results.push_back(impl_->protocol.RunService(invocation, service, target_request));
        }
        catch (const std::exception& e) {
            results.push_back(ErrorResult(service, e.what()));
        }
    }
    return results;
}

std::vector<TargetResult> UpdateEngine::UpdateContainers(const UpdateRequest& request) {
    std::vector<TargetResult> results;
    results.reserve(request.containers.size());

    const auto target_request = MakeTargetRequest(request);
    for (const auto& name : request.containers) {
        try {
            auto context = impl_->detector.Classify(name);
            auto result = impl_->protocol.Run(context, target_request);
            result.target = name;
            results.push_back(std::move(result));
        }
        catch (const ContainerNotFound& e) {
            results.push_back(NotFoundResult(name, e.what()));
        }
        catch (const std::exception& e) {
            results.push_back(ErrorResult(name, e.what()));
        }
    }
    return results;
}

TargetResult UpdateEngine::Rollback(const UpdateRequest& request) {
    const auto& name = request.rollback_target;

    if (!impl_->ledger.Exists()) {
        throw NotFound("No ledger at " + impl_->ledger.path().string());
    }

    try {
        return impl_->selector.Rollback(name);
    }
    catch (const NotFound& e) {
        spdlog::error("[ROLLBACK] {}", e.what());
    }
    catch (const ContainerNotFound& e) {
        spdlog::error("[ROLLBACK] {}", e.what());
    }

    // Rollback only reads the ledger until a version has been chosen
    TargetResult result;
    result.target = name;
    result.logical_name = name;
    result.outcome = ActionKind::NOT_FOUND;
    result.final_state = ProtocolState::FAILED;
    result.message = "Nothing to roll back to";
    return result;
}

// ============================================================================
// RESULTS
// ============================================================================

TargetResult UpdateEngine::NotFoundResult(const std::string& name, const std::string& message) {
    spdlog::error("[NOT_FOUND] {}", message);

    TargetResult result;
    result.target = name;
    result.logical_name = name;
    result.outcome = ActionKind::NOT_FOUND;
    result.final_state = ProtocolState::FAILED;
    result.message = message;

    try {
        impl_->ledger.Append(ledger::HistoryLog::MakeRecord(name, "", "", ActionKind::NOT_FOUND));
    }
    catch (const std::runtime_error& e) {
        spdlog::error("[LEDGER] Could not record NOT_FOUND for {}: {}", name, e.what());
        result.message += "; ledger write failed: " + std::string(e.what());
    }
    return result;
}

TargetResult UpdateEngine::ErrorResult(const std::string& name, const std::string& message) {
    spdlog::error("[ERROR] {}: {}", name, message);

    TargetResult result;
    result.target = name;
    result.logical_name = name;
    result.outcome = ActionKind::RECREATE_FAIL;
    result.final_state = ProtocolState::FAILED;
    result.message = message;
    return result;
}

// ============================================================================
// SUMMARY
// ============================================================================

void UpdateEngine::PrintSummary(const RunReport& report, std::ostream& out) {
    out << "\n";
    out << "═══════════════════════════════════════════════════════════════\n";
    out << "                         RUN SUMMARY\n";
    out << "═══════════════════════════════════════════════════════════════\n";

    std::size_t updated = 0;
    std::size_t skipped = 0;
    for (const auto& result : report.results) {
        out << "  " << std::left << std::setw(24) << result.target
            << std::setw(18) << ActionKindToString(result.outcome)
            << std::setw(10) << ProtocolStateToString(result.final_state);
        if (!result.image_reference.empty()) {
            out << " " << result.image_reference;
        }
        out << "\n";
        if (!result.message.empty()) {
            out << "      " << result.message << "\n";
        }

        if (result.outcome == ActionKind::UPDATE || result.outcome == ActionKind::ROLLBACK_SUCCESS) {
            ++updated;
        } else if (result.outcome == ActionKind::SKIP_PINNED || result.outcome == ActionKind::SKIP_MISMATCH) {
            ++skipped;
        }
    }

    out << "───────────────────────────────────────────────────────────────\n";
    out << "  " << report.results.size() << " target(s): " << updated << " recreated, "
        << skipped << " skipped, " << report.FailureCount() << " failed\n";
    if (report.mode != RunMode::ROLLBACK) {
        out << "  Script execution time: " << FormatDuration(report.elapsed) << "\n";
    }
}

std::string UpdateEngine::FormatDuration(std::chrono::seconds elapsed) {
    const auto total = elapsed.count() < 0 ? 0 : elapsed.count();
    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(2) << total / 3600 << ":"
        << std::setw(2) << (total % 3600) / 60 << ":"
        << std::setw(2) << total % 60;
    return oss.str();
}

} // namespace core
} // namespace redock
