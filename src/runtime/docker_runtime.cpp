/**
 * @file docker_runtime.cpp
 * @brief docker CLI implementation of the container runtime capability
 *
 * Every primitive is a single docker invocation:
 * ```
 * inspect <name>            -> InspectContainer   (JSON array with one object)
 * image inspect <ref>       -> InspectImage
 * pull <ref>                -> PullImage
 * stop / rm <name>          -> StopContainer / RemoveContainer
 * run -d --name ...         -> RunContainer
 * ps -a --filter label=...  -> ListContainersByLabel
 * image prune -a -f         -> PruneImages
 * ```
 * Non-zero exit codes are reported as `false` / std::nullopt and logged;
 * callers decide whether that is fatal for their target.
 *
 * @date 2025
 */

#include "redock/runtime/docker_runtime.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

using json = nlohmann::json;

namespace redock {
namespace runtime {

// ============================================================================
// CONSTRUCTION
// ============================================================================

DockerRuntime::DockerRuntime(std::string docker_binary, std::vector<std::string> extra_run_args)
    : docker_binary_(std::move(docker_binary))
    , extra_run_args_(std::move(extra_run_args)) {
    spdlog::debug("Docker runtime using binary: {}", docker_binary_);
}

bool DockerRuntime::IsAvailable() const {
    auto result = ExecuteDockerCommand({"--version"});
    if (result.success) {
        spdlog::debug("Runtime version: {}", utils::TrimRight(result.stdout_output));
    }
    return result.success;
}

// ============================================================================
// INTROSPECTION
// ============================================================================

std::optional<json> DockerRuntime::InspectContainer(const std::string& name) {
    auto result = ExecuteDockerCommand({"container", "inspect", name});
    return ParseInspectOutput(result);
}

std::optional<json> DockerRuntime::InspectImage(const std::string& reference) {
    auto result = ExecuteDockerCommand({"image", "inspect", reference});
    return ParseInspectOutput(result);
}

std::vector<std::string> DockerRuntime::ListContainersByLabel(const std::string& label,
                                                              const std::string& value) {
    auto result = ExecuteDockerCommand({
        "ps", "--all",
        "--filter", "label=" + label + "=" + value,
        "--format", "{{.Names}}"
    });

    std::vector<std::string> names;
    if (!result.success) {
        spdlog::warn("Failed to list containers with {}={}: {}",
                     label, value, utils::TrimRight(result.stderr_output));
        return names;
    }

    std::istringstream stream(result.stdout_output);
    std::string line;
    while (std::getline(stream, line)) {
        line = utils::TrimRight(line);
        if (!line.empty()) names.push_back(line);
    }
    return names;
}

// ============================================================================
// LIFECYCLE
// ============================================================================

bool DockerRuntime::PullImage(const std::string& reference) {
    spdlog::info("[PULL] Pulling image '{}'...", reference);

    auto result = ExecuteDockerCommand({"pull", reference});
    if (!result.success) {
        spdlog::error("Failed to pull '{}': {}", reference, utils::TrimRight(result.stderr_output));
        return false;
    }
    return true;
}

bool DockerRuntime::StopContainer(const std::string& name) {
    spdlog::info("Stopping container: {}", name);

    auto result = ExecuteDockerCommand({"stop", name});
    if (!result.success) {
        spdlog::error("Failed to stop container: {}", utils::TrimRight(result.stderr_output));
        return false;
    }
    return true;
}

bool DockerRuntime::RemoveContainer(const std::string& name) {
    spdlog::info("Removing container: {}", name);

    auto result = ExecuteDockerCommand({"rm", name});
    if (!result.success) {
        spdlog::error("Failed to remove container: {}", utils::TrimRight(result.stderr_output));
        return false;
    }
    return true;
}

bool DockerRuntime::RunContainer(const core::ContainerRuntimeSpec& spec, const std::string& image) {
    spdlog::info("Creating container '{}' from '{}'", spec.name, image);

    auto result = ExecuteDockerCommand(BuildRunArguments(spec, image, extra_run_args_));
    if (!result.success) {
        spdlog::error("Failed to run container: {}", utils::TrimRight(result.stderr_output));
        return false;
    }

    spdlog::debug("Container created: {}", utils::TrimRight(result.stdout_output));
    return true;
}

bool DockerRuntime::PruneImages() {
    spdlog::info("Pruning unused images...");

    auto result = ExecuteDockerCommand({"image", "prune", "-a", "-f"});
    if (!result.success) {
        spdlog::warn("Image prune failed: {}", utils::TrimRight(result.stderr_output));
        return false;
    }
    return true;
}

// ============================================================================
// RUN COMMAND CONSTRUCTION
// ============================================================================

namespace {

// --mount is parsed as CSV; quote fields holding a comma or a quote
std::string MountField(const std::string& key, const std::string& value) {
    const std::string field = key + "=" + value;
    if (field.find_first_of(",\"") == std::string::npos) {
        return field;
    }
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    return quoted + "\"";
}

std::string MountArgument(const core::Mount& mount) {
    std::string argument = mount.kind == core::MountKind::BIND ? "type=bind" : "type=volume";
    argument += "," + MountField("source", mount.source);
    argument += "," + MountField("target", mount.destination);
    if (mount.read_only) {
        argument += ",readonly";
    }
    return argument;
}

} // anonymous namespace

std::vector<std::string> DockerRuntime::BuildRunArguments(const core::ContainerRuntimeSpec& spec,
                                                          const std::string& image,
                                                          const std::vector<std::string>& extra_run_args) {
    std::vector<std::string> args = {"run", "-d", "--name", spec.name};

    if (spec.hostname) {
        args.push_back("--hostname");
        args.push_back(*spec.hostname);
    }

    for (const auto& env : spec.environment) {
        args.push_back("-e");
        args.push_back(env);
    }

    for (const auto& port : spec.ports) {
        args.push_back("-p");
        args.push_back(port.ToArgument());
    }

    for (const auto& mount : spec.mounts) {
        switch (mount.kind) {
            case core::MountKind::BIND:
            case core::MountKind::VOLUME:
                args.push_back("--mount");
                args.push_back(MountArgument(mount));
                break;
            case core::MountKind::TMPFS:
                args.push_back("--tmpfs");
                args.push_back(mount.destination + (mount.read_only ? ":ro" : ""));
                break;
        }
    }

    if (spec.restart_policy) {
        args.push_back("--restart");
        args.push_back(spec.restart_policy->ToArgument());
    }

    if (spec.network_mode) {
        args.push_back("--network");
        args.push_back(*spec.network_mode);
    }

    // docker accepts a single executable for --entrypoint; the rest of the
    // entrypoint vector is passed as leading arguments
    std::vector<std::string> trailing;
    if (spec.entrypoint) {
        args.push_back("--entrypoint");
        args.push_back(spec.entrypoint->empty() ? std::string() : spec.entrypoint->front());
        if (spec.entrypoint->size() > 1) {
            trailing.assign(spec.entrypoint->begin() + 1, spec.entrypoint->end());
        }
    }
    if (spec.command) {
        trailing.insert(trailing.end(), spec.command->begin(), spec.command->end());
    }

    args.insert(args.end(), extra_run_args.begin(), extra_run_args.end());

    args.push_back(image);
    args.insert(args.end(), trailing.begin(), trailing.end());
    return args;
}

std::string DockerRuntime::RelaunchHint(const core::ContainerRuntimeSpec& spec,
                                        const std::string& image) const {
    std::vector<std::string> argv = {docker_binary_};
    auto args = BuildRunArguments(spec, image, extra_run_args_);
    argv.insert(argv.end(), args.begin(), args.end());
    return utils::FormatCommandLine(argv);
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

utils::ProcessResult DockerRuntime::ExecuteDockerCommand(const std::vector<std::string>& args) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(docker_binary_);
    argv.insert(argv.end(), args.begin(), args.end());
    return utils::RunProcess(argv);
}

std::optional<json> DockerRuntime::ParseInspectOutput(const utils::ProcessResult& result) const {
    if (!result.success) {
        return std::nullopt;
    }

    try {
        json j = json::parse(result.stdout_output);

        // docker inspect returns an array with a single object
        if (j.is_array()) {
            if (j.empty()) return std::nullopt;
            j = j[0];
        }
        return j;
    }
    catch (const json::exception& e) {
        spdlog::error("Failed to parse inspect output: {}", e.what());
        return std::nullopt;
    }
}

} // namespace runtime
} // namespace redock
