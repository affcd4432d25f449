/**
 * @file rollback_selector.cpp
 * @brief Implementation of ledger driven rollback
 *
 * **Flow**:
 * ```
 * name -> live context (container, or container labelled with the service)
 *      -> ledger candidates (newest first, one per identity)
 *      -> menu + selection
 *      -> RecreateProtocol with digest override
 *      -> ROLLBACK_SUCCESS / ROLLBACK_FAIL record
 * ```
 *
 * @date 2025
 */

#include "redock/core/rollback_selector.hpp"
#include "redock/core/errors.hpp"
#include "redock/core/image_reference.hpp"
#include "redock/runtime/context_detector.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <limits>
#include <variant>

namespace redock {
namespace core {

namespace {

const std::set<ActionKind> kCandidateKinds = {
    ActionKind::UPDATE,
    ActionKind::SKIP_PINNED,
    ActionKind::ROLLBACK_SUCCESS,
    ActionKind::RECREATE_FAIL
};

std::string Trim(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(text.rbegin(), text.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

} // anonymous namespace

RollbackSelector::RollbackSelector(runtime::ContainerRuntime& runtime,
                                   const ledger::HistoryLog& ledger,
                                   RecreateProtocol& protocol,
                                   std::istream& input,
                                   std::ostream& output)
    : RollbackSelector(runtime, ledger, protocol, input, output, Config{}) {
}

RollbackSelector::RollbackSelector(runtime::ContainerRuntime& runtime,
                                   const ledger::HistoryLog& ledger,
                                   RecreateProtocol& protocol,
                                   std::istream& input,
                                   std::ostream& output,
                                   const Config& config)
    : runtime_(runtime)
    , ledger_(ledger)
    , protocol_(protocol)
    , input_(input)
    , output_(output)
    , config_(config) {
}

// ============================================================================
// ROLLBACK
// ============================================================================

TargetResult RollbackSelector::Rollback(const std::string& name) {
    spdlog::info("[ROLLBACK] Looking up history of '{}' in {}", name, ledger_.path().string());

    std::set<std::string> logical_names = {name};
    auto context = Locate(name, logical_names);

    auto candidates = Candidates(logical_names);
    if (candidates.empty()) {
        throw NotFound("No rollback candidates for '" + name + "' in " + ledger_.path().string());
    }
    if (!context) {
        throw ContainerNotFound(name);
    }

    PrintMenu(name, candidates);

    std::string line;
    if (!std::getline(input_, line)) {
        throw InputError("No selection made");
    }
    const auto& chosen = candidates[ParseSelection(line, candidates.size()) - 1];

    spdlog::info("[ROLLBACK] Rolling back '{}' to {} ({})", name, chosen.identity, chosen.image_reference);

    TargetRequest request;
    request.digest = chosen.identity;
    auto result = protocol_.Run(*context, request);

    const bool reached = (result.outcome == ActionKind::UPDATE || result.outcome == ActionKind::SKIP_PINNED) &&
                         result.identity == chosen.identity;
    const ActionKind kind = reached ? ActionKind::ROLLBACK_SUCCESS : ActionKind::ROLLBACK_FAIL;

    result.target = name;
    result.outcome = kind;
    if (!reached && result.message.empty()) {
        result.message = "Target does not run " + chosen.identity + " after recreate";
    }

    const std::string reference = result.image_reference.empty() ? chosen.image_reference
                                                                  : result.image_reference;
    ledger_.Append(ledger::HistoryLog::MakeRecord(result.logical_name, reference, chosen.identity, kind));

    if (reached) {
        spdlog::info("[ROLLBACK] '{}' now runs {}", name, chosen.identity);
    } else {
        spdlog::error("[ROLLBACK] '{}' could not be rolled back to {}: {}", name, chosen.identity, result.message);
    }
    return result;
}

std::vector<LogRecord> RollbackSelector::Candidates(const std::set<std::string>& logical_names) const {
    auto records = ledger_.Query(logical_names, kCandidateKinds, std::numeric_limits<std::size_t>::max());

    std::vector<LogRecord> candidates;
    std::set<std::string> seen;
    for (auto& record : records) {
        if (candidates.size() >= config_.history_limit) break;
        if (!IsDigest(record.identity)) continue;
        if (!PullableIdentity(record)) continue;
        if (!seen.insert(record.identity).second) continue;
        candidates.push_back(std::move(record));
    }
    return candidates;
}

std::size_t RollbackSelector::ParseSelection(const std::string& text, std::size_t count) {
    const std::string trimmed = Trim(text);
    if (trimmed.empty() || trimmed.size() > 9 ||
        !std::all_of(trimmed.begin(), trimmed.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw InputError("Invalid selection '" + trimmed + "'");
    }

    const std::size_t choice = std::stoul(trimmed);
    if (choice < 1 || choice > count) {
        throw InputError("Selection " + trimmed + " is out of range 1-" + std::to_string(count));
    }
    return choice;
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

bool RollbackSelector::PullableIdentity(LogRecord& record) const {
    // Image IDs share the digest syntax; only a local image can tell them apart
    auto image = runtime_.InspectImage(record.identity);
    if (!image || image->value("Id", std::string()) != record.identity) {
        return true;
    }

    std::string repository;
    try {
        repository = ImageReference::Parse(record.image_reference).NormalizedRepository();
    }
    catch (const ArgumentError& e) {
        spdlog::debug("Ledger reference '{}' not parsable: {}", record.image_reference, e.what());
    }

    auto digest = IdentityResolver::SelectIdentity(*image, repository);
    if (!digest || *digest == record.identity) {
        spdlog::debug("[ROLLBACK] Skipping {} from {}: image ID without a registry digest",
                      record.identity, record.timestamp);
        return false;
    }

    spdlog::debug("[ROLLBACK] Image ID {} from {} resolves to {}", record.identity, record.timestamp, *digest);
    record.identity = *digest;
    return true;
}

std::optional<TargetContext> RollbackSelector::Locate(const std::string& name,
                                                      std::set<std::string>& logical_names) const {
    runtime::ContextDetector detector(runtime_);

    try {
        auto context = detector.Classify(name);
        if (auto managed = std::get_if<Managed>(&context)) {
            logical_names.insert(managed->context.service);
        }
        return context;
    }
    catch (const ContainerNotFound&) {
        spdlog::debug("'{}' is not a container, looking for a compose service of that name", name);
    }

    for (const auto& container : runtime_.ListContainersByLabel(runtime::labels::kService, name)) {
        try {
            auto context = detector.Classify(container);
            if (std::holds_alternative<Managed>(context)) {
                spdlog::debug("Service '{}' located through container '{}'", name, container);
                return context;
            }
        }
        catch (const ContainerNotFound&) {
            continue;
        }
    }
    return std::nullopt;
}

void RollbackSelector::PrintMenu(const std::string& name, const std::vector<LogRecord>& candidates) const {
    output_ << "Available versions of '" << name << "' (newest first):\n";
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        const auto& record = candidates[i];
        output_ << "  " << (i + 1) << ") " << record.timestamp
                << "  " << record.image_reference
                << "  " << record.identity
                << "  [" << ActionKindToString(record.kind) << "]\n";
    }
    output_ << "Select version [1-" << candidates.size() << "]: " << std::flush;
}

} // namespace core
} // namespace redock
