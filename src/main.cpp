/**
 * @file main.cpp
 * @brief redock - Command-line interface
 *
 * Entry point for redock. Parses the command line, loads the optional JSON
 * configuration, wires the docker / compose CLI backends into the update
 * engine and prints the run summary.
 *
 * **Exit codes**:
 * - 0: every target was updated, skipped or rolled back
 * - 1: at least one target failed, or a required file is missing
 * - 2: invalid arguments or configuration
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include "redock/core/errors.hpp"
#include "redock/core/update_engine.hpp"
#include "redock/ledger/history_log.hpp"
#include "redock/runtime/docker_compose_tool.hpp"
#include "redock/runtime/docker_runtime.hpp"
#include "redock/utils/settings.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

const char* kExamples = R"(
Examples:
  redock -f docker-compose.yml                 Update every service of a compose file
  redock -f docker-compose.yml -s web -t 1.27  Run tag 1.27 for service 'web'
  redock -c web worker                         Update containers 'web' and 'worker'
  redock -c web -t sha256:...                  Pin container 'web' to a digest
  redock -r web                                Roll 'web' back to a version from the ledger
)";

void ConfigureLogging(const std::string& level_name, bool verbose) {
    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
        spdlog::debug("[DEBUG] Verbose logging enabled");
        return;
    }

    auto level = spdlog::level::from_str(level_name);
    if (level == spdlog::level::off && level_name != "off") {
        spdlog::warn("Unknown log level '{}', using info", level_name);
        level = spdlog::level::info;
    }
    spdlog::set_level(level);
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    // Configure CLI parser
    CLI::App app{"redock - reconcile, recreate and roll back Docker containers"};
    app.footer(kExamples);

    std::string compose_file;
    std::string service;
    std::string tag;
    std::vector<std::string> containers;
    std::string rollback_target;
    std::string ledger_path;
    std::string config_path;
    bool no_prune = false;
    bool force = false;
    bool verbose = false;

    auto* file_opt = app.add_option("-f,--file", compose_file, "Compose file whose services are updated");
    auto* service_opt = app.add_option("-s,--service", service, "Only update this service of the compose file");
    auto* tag_opt = app.add_option("-t,--tag", tag, "Run this tag (or digest) instead of the configured one");
    auto* containers_opt = app.add_option("-c,--containers", containers, "Containers to update");
    auto* rollback_opt = app.add_option("-r,--rollback", rollback_target,
                                        "Roll a container or service back to a logged version");

    service_opt->needs(file_opt);
    file_opt->excludes(containers_opt)->excludes(rollback_opt);
    containers_opt->excludes(rollback_opt);
    rollback_opt->excludes(tag_opt);

    app.add_flag("--no-prune", no_prune, "Do not prune unused images after updating");
    app.add_flag("--force", force, "Recreate compose services even if they drifted from their declaration");
    app.add_option("--ledger", ledger_path, "Ledger file (default: $REDOCK_LEDGER or /tmp/docker-update.log)");
    app.add_option("--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    if (file_opt->count() == 0 && containers_opt->count() == 0 && rollback_opt->count() == 0) {
        std::cerr << app.help() << std::endl;
        return kExitUsage;
    }

    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    redock::utils::Settings settings;
    redock::core::UpdateRequest request;

    try {
        if (!config_path.empty()) {
            settings.LoadFile(config_path);
        }
        ConfigureLogging(settings.log_level, verbose);

        if (!ledger_path.empty()) {
            settings.ledger_path = ledger_path;
        }
        settings.ResolveLedgerPath();

        if (file_opt->count() > 0) {
            request.mode = redock::core::RunMode::COMPOSE_FILE;
            request.compose_file = compose_file;
            if (service_opt->count() > 0) request.service = service;
        } else if (containers_opt->count() > 0) {
            request.mode = redock::core::RunMode::CONTAINERS;
            request.containers = containers;
        } else {
            request.mode = redock::core::RunMode::ROLLBACK;
            request.rollback_target = rollback_target;
        }
        if (tag_opt->count() > 0) request.tag = tag;
        request.force = force;
        request.prune = !no_prune;

        redock::core::UpdateEngine::Validate(request);
    } catch (const redock::ArgumentError& e) {
        spdlog::error("[ERROR] {}", e.what());
        return kExitUsage;
    }

    if (request.mode == redock::core::RunMode::COMPOSE_FILE &&
        !std::filesystem::exists(request.compose_file)) {
        spdlog::error("[ERROR] Compose file '{}' not found.", request.compose_file.string());
        return kExitFailure;
    }

    try {
        spdlog::info("[INIT] Ledger: {}", settings.ledger_path.string());

        redock::runtime::DockerRuntime docker(settings.docker_binary, settings.extra_run_args);
        if (!docker.IsAvailable()) {
            spdlog::error("[ERROR] '{}' is not available", settings.docker_binary);
            return kExitFailure;
        }
        redock::runtime::DockerComposeTool compose(settings.compose_command);
        redock::ledger::HistoryLog ledger(settings.ledger_path);

        redock::core::UpdateEngine::Config config;
        config.drift_protection = settings.drift_protection;
        config.prune_after_update = settings.prune_after_update;
        config.rollback_history_limit = static_cast<std::size_t>(settings.rollback_history_limit);

        redock::core::UpdateEngine engine(docker, compose, ledger, std::cin, std::cout, config);

        spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
        auto report = engine.Execute(request);
        spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");

        redock::core::UpdateEngine::PrintSummary(report, std::cout);
        return report.ExitCode();

    } catch (const redock::ArgumentError& e) {
        spdlog::error("[ERROR] {}", e.what());
        return kExitUsage;
    } catch (const redock::InputError& e) {
        spdlog::error("[ROLLBACK] {}", e.what());
        return kExitFailure;
    } catch (const redock::NotFound& e) {
        spdlog::error("[ERROR] {}", e.what());
        return kExitFailure;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("[ERROR] Filesystem error: {}", e.what());
        return kExitFailure;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return kExitFailure;
    }
}
