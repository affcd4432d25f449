/**
 * @file settings.cpp
 * @brief JSON configuration loading
 *
 * @date 2025
 */

#include "redock/utils/settings.hpp"
#include "redock/core/errors.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

namespace redock {
namespace utils {

namespace {

template <typename T>
T Get(const json& document, const std::string& key) {
    try {
        return document.at(key).get<T>();
    }
    catch (const json::exception& e) {
        throw ArgumentError("Invalid value for '" + key + "': " + e.what());
    }
}

} // anonymous namespace

void Settings::Apply(const json& document) {
    if (!document.is_object()) {
        throw ArgumentError("Configuration must be a JSON object");
    }

    for (const auto& item : document.items()) {
        const std::string& key = item.key();
        if (key == "ledger_path") {
            ledger_path = Get<std::string>(document, key);
        } else if (key == "docker_binary") {
            docker_binary = Get<std::string>(document, key);
        } else if (key == "compose_command") {
            compose_command = Get<std::vector<std::string>>(document, key);
            if (compose_command.empty()) {
                throw ArgumentError("'compose_command' must not be empty");
            }
        } else if (key == "extra_run_args") {
            extra_run_args = Get<std::vector<std::string>>(document, key);
        } else if (key == "prune_after_update") {
            prune_after_update = Get<bool>(document, key);
        } else if (key == "drift_protection") {
            drift_protection = Get<bool>(document, key);
        } else if (key == "rollback_history_limit") {
            rollback_history_limit = Get<int>(document, key);
            if (rollback_history_limit < 1) {
                throw ArgumentError("'rollback_history_limit' must be at least 1");
            }
        } else if (key == "log_level") {
            log_level = Get<std::string>(document, key);
        } else {
            spdlog::warn("Ignoring unknown configuration key '{}'", key);
        }
    }
}

void Settings::LoadFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw ArgumentError("Cannot open configuration file '" + path.string() + "'");
    }

    json document;
    try {
        in >> document;
    }
    catch (const json::exception& e) {
        throw ArgumentError("Malformed configuration file '" + path.string() + "': " + e.what());
    }

    Apply(document);
    spdlog::debug("Loaded configuration from {}", path.string());
}

void Settings::ResolveLedgerPath() {
    if (!ledger_path.empty()) {
        return;
    }

    if (const char* env = std::getenv("REDOCK_LEDGER"); env != nullptr && *env != '\0') {
        ledger_path = env;
        return;
    }

    ledger_path = kFallbackLedgerPath;
    spdlog::warn("No ledger path configured. Using fallback: {}", ledger_path.string());
    spdlog::warn("Set 'ledger_path' in the configuration file or REDOCK_LEDGER to choose one.");
}

} // namespace utils
} // namespace redock
