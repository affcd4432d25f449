/**
 * @file docker_compose_tool.cpp
 * @brief `docker compose` implementation of the orchestration capability
 *
 * Service images are read from `config --format json`, which already has
 * every `-f` layer merged and variables interpolated, so an override file
 * changes what DeclaredImage() reports exactly as it changes what `up` runs.
 *
 * @date 2025
 */

#include "redock/runtime/docker_compose_tool.hpp"
#include "redock/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

using json = nlohmann::json;

namespace redock {
namespace runtime {

DockerComposeTool::DockerComposeTool(std::vector<std::string> compose_command)
    : compose_command_(std::move(compose_command)) {
    if (compose_command_.empty()) {
        throw ArgumentError("Compose command must not be empty");
    }
}

std::vector<std::string> DockerComposeTool::ListServices(const ComposeInvocation& invocation) {
    auto result = Execute(invocation, {"config", "--services"});
    if (!result.success) {
        throw RuntimeCommandError("Failed to list services of '" + invocation.config_file + "': " +
                                  utils::TrimRight(result.stderr_output));
    }

    std::vector<std::string> services;
    std::istringstream stream(result.stdout_output);
    std::string line;
    while (std::getline(stream, line)) {
        line = utils::TrimRight(line);
        if (!line.empty()) services.push_back(line);
    }
    return services;
}

std::optional<std::string> DockerComposeTool::DeclaredImage(const ComposeInvocation& invocation,
                                                            const std::string& service) {
    json config = ResolvedConfig(invocation);

    if (!config.contains("services") || !config["services"].contains(service)) {
        throw RuntimeCommandError("Service '" + service + "' is not declared in '" +
                                  invocation.config_file + "'");
    }

    const auto& svc = config["services"][service];
    if (!svc.contains("image") || !svc["image"].is_string()) {
        return std::nullopt;
    }
    return svc["image"].get<std::string>();
}

bool DockerComposeTool::Pull(const ComposeInvocation& invocation, const std::string& service) {
    spdlog::info("[PULL] Pulling image for service '{}' from '{}'...", service, invocation.config_file);

    auto result = Execute(invocation, {"pull", service});
    if (!result.success) {
        spdlog::error("Compose pull failed for '{}': {}", service, utils::TrimRight(result.stderr_output));
        return false;
    }
    return true;
}

bool DockerComposeTool::Up(const ComposeInvocation& invocation, const std::string& service) {
    spdlog::info("[RECREATE] Recreating service '{}'...", service);

    auto result = Execute(invocation, {"up", "-d", "--force-recreate", "--no-deps", service});
    if (!result.success) {
        spdlog::error("Compose up failed for '{}': {}", service, utils::TrimRight(result.stderr_output));
        return false;
    }
    return true;
}

std::optional<std::string> DockerComposeTool::ServiceContainerId(const ComposeInvocation& invocation,
                                                                 const std::string& service) {
    auto result = Execute(invocation, {"ps", "-q", service});
    if (!result.success) {
        spdlog::warn("Compose ps failed for '{}': {}", service, utils::TrimRight(result.stderr_output));
        return std::nullopt;
    }

    std::istringstream stream(result.stdout_output);
    std::string line;
    while (std::getline(stream, line)) {
        line = utils::TrimRight(line);
        if (!line.empty()) return line;
    }
    return std::nullopt;
}

std::vector<std::string> DockerComposeTool::BaseArguments(const ComposeInvocation& invocation) const {
    std::vector<std::string> argv = compose_command_;

    argv.push_back("-f");
    argv.push_back(invocation.config_file);
    for (const auto& override_file : invocation.override_files) {
        argv.push_back("-f");
        argv.push_back(override_file);
    }

    if (!invocation.project_directory.empty()) {
        argv.push_back("--project-directory");
        argv.push_back(invocation.project_directory);
    }
    if (!invocation.project_name.empty()) {
        argv.push_back("-p");
        argv.push_back(invocation.project_name);
    }
    return argv;
}

utils::ProcessResult DockerComposeTool::Execute(const ComposeInvocation& invocation,
                                                const std::vector<std::string>& args) const {
    auto argv = BaseArguments(invocation);
    argv.insert(argv.end(), args.begin(), args.end());
    return utils::RunProcess(argv);
}

json DockerComposeTool::ResolvedConfig(const ComposeInvocation& invocation) const {
    auto result = Execute(invocation, {"config", "--format", "json"});
    if (!result.success) {
        throw RuntimeCommandError("Failed to read compose configuration '" + invocation.config_file +
                                  "': " + utils::TrimRight(result.stderr_output));
    }

    try {
        return json::parse(result.stdout_output);
    }
    catch (const json::exception& e) {
        throw RuntimeCommandError("Unparsable compose configuration: " + std::string(e.what()));
    }
}

} // namespace runtime
} // namespace redock
