/**
 * @file runtime_config_extractor.cpp
 * @brief Container inspect document -> ContainerRuntimeSpec
 *
 * **Fields read**:
 * ```
 * Name, Id, Image                     -> name, generated-hostname check, image_id
 * Config.Image / Env / Hostname       -> image, environment, hostname
 * Config.Entrypoint / Cmd             -> overrides (compared with the image)
 * HostConfig.PortBindings             -> ports (minimal -p form)
 * HostConfig.RestartPolicy            -> restart policy
 * HostConfig.NetworkMode              -> network
 * HostConfig.Tmpfs, Mounts            -> mounts
 * ```
 *
 * @date 2025
 */

#include "redock/runtime/runtime_config_extractor.hpp"
#include "redock/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <regex>

using json = nlohmann::json;

namespace redock {
namespace runtime {

namespace {

std::string StringField(const json& object, const char* key) {
    if (object.is_object() && object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return "";
}

const json& ObjectField(const json& object, const char* key) {
    static const json empty = json::object();
    if (object.is_object() && object.contains(key) && object[key].is_object()) {
        return object[key];
    }
    return empty;
}

// null / missing -> nullopt; non-string elements make the whole array unusable
std::optional<std::vector<std::string>> StringArray(const json& object, const char* key) {
    if (!object.is_object() || !object.contains(key) || !object[key].is_array()) {
        return std::nullopt;
    }

    std::vector<std::string> values;
    for (const auto& element : object[key]) {
        if (!element.is_string()) {
            spdlog::warn("Ignoring non-string entry in {}", key);
            return std::nullopt;
        }
        values.push_back(element.get<std::string>());
    }
    return values;
}

bool IsWildcardHost(const std::string& host_ip) {
    return host_ip.empty() || host_ip == "0.0.0.0" || host_ip == "::";
}

std::vector<std::string> ExtractEnvironment(const json& config) {
    std::vector<std::string> env;
    if (!config.contains("Env") || !config["Env"].is_array()) {
        return env;
    }

    for (const auto& entry : config["Env"]) {
        if (!entry.is_string()) {
            spdlog::warn("Dropping malformed environment entry: {}", entry.dump());
            continue;
        }
        env.push_back(entry.get<std::string>());
    }
    return env;
}

std::set<core::PortBinding> ExtractPorts(const json& host_config) {
    static const std::regex port_key_regex(R"(^(\d+(-\d+)?)(/(tcp|udp|sctp))?$)");

    std::set<core::PortBinding> ports;
    const json& bindings = ObjectField(host_config, "PortBindings");

    for (auto it = bindings.begin(); it != bindings.end(); ++it) {
        std::smatch match;
        const std::string key = it.key();
        if (!std::regex_match(key, match, port_key_regex)) {
            spdlog::warn("Dropping port binding with unparsable key '{}'", key);
            continue;
        }

        std::string container_port = match[1].str();
        const std::string protocol = match[4].str();
        if (!protocol.empty() && protocol != "tcp") {
            container_port += "/" + protocol;
        }

        if (!it.value().is_array()) continue;

        for (const auto& entry : it.value()) {
            if (!entry.is_object()) {
                spdlog::warn("Dropping malformed binding for port {}", key);
                continue;
            }

            core::PortBinding binding;
            const std::string host_ip = StringField(entry, "HostIp");
            binding.host_ip = IsWildcardHost(host_ip) ? "" : host_ip;
            binding.host_port = StringField(entry, "HostPort");
            binding.container_port = container_port;
            ports.insert(binding);
        }
    }
    return ports;
}

std::vector<core::Mount> ExtractMounts(const json& container, const json& host_config) {
    std::vector<core::Mount> mounts;

    auto seen = [&mounts](const std::string& destination) {
        return std::any_of(mounts.begin(), mounts.end(),
                           [&](const core::Mount& m) { return m.destination == destination; });
    };

    if (container.contains("Mounts") && container["Mounts"].is_array()) {
        for (const auto& entry : container["Mounts"]) {
            const std::string type = StringField(entry, "Type");
            const std::string destination = StringField(entry, "Destination");

            if (destination.empty()) {
                spdlog::warn("Dropping {} mount with empty destination", type.empty() ? "untyped" : type);
                continue;
            }

            core::Mount mount;
            mount.destination = destination;
            mount.read_only = entry.contains("RW") && entry["RW"].is_boolean() && !entry["RW"].get<bool>();

            if (type == "bind") {
                mount.kind = core::MountKind::BIND;
                mount.source = StringField(entry, "Source");
            } else if (type == "volume") {
                mount.kind = core::MountKind::VOLUME;
                mount.source = StringField(entry, "Name");
            } else if (type == "tmpfs") {
                mount.kind = core::MountKind::TMPFS;
            } else {
                spdlog::warn("Dropping mount at {} with unsupported type '{}'", destination, type);
                continue;
            }

            if (mount.kind != core::MountKind::TMPFS && mount.source.empty()) {
                spdlog::warn("Dropping {} mount at {} with empty source", type, destination);
                continue;
            }
            if (seen(destination)) continue;

            mounts.push_back(std::move(mount));
        }
    }

    // --tmpfs mounts only show up here
    const json& tmpfs = ObjectField(host_config, "Tmpfs");
    for (auto it = tmpfs.begin(); it != tmpfs.end(); ++it) {
        if (it.key().empty() || seen(it.key())) continue;

        core::Mount mount;
        mount.kind = core::MountKind::TMPFS;
        mount.destination = it.key();
        const std::string options = it.value().is_string() ? it.value().get<std::string>() : "";
        mount.read_only = std::regex_search(options, std::regex(R"((^|,)ro(,|$))"));
        mounts.push_back(std::move(mount));
    }

    return mounts;
}

} // anonymous namespace

RuntimeConfigExtractor::RuntimeConfigExtractor(ContainerRuntime& runtime)
    : runtime_(runtime) {
}

core::ContainerRuntimeSpec RuntimeConfigExtractor::Extract(const std::string& name) const {
    spdlog::info("Inspecting container '{}'...", name);

    auto container = runtime_.InspectContainer(name);
    if (!container) {
        throw ContainerNotFound(name);
    }

    std::optional<json> image;
    const std::string image_id = StringField(*container, "Image");
    if (!image_id.empty()) {
        image = runtime_.InspectImage(image_id);
    }
    if (!image) {
        spdlog::warn("Image of '{}' cannot be inspected; keeping entrypoint and command verbatim", name);
    }

    return FromInspect(name, *container, image);
}

core::ContainerRuntimeSpec RuntimeConfigExtractor::FromInspect(const std::string& name,
                                                               const json& container,
                                                               const std::optional<json>& image) {
    const json& config = ObjectField(container, "Config");
    const json& host_config = ObjectField(container, "HostConfig");

    core::ContainerRuntimeSpec spec;

    spec.name = StringField(container, "Name");
    if (!spec.name.empty() && spec.name.front() == '/') {
        spec.name.erase(0, 1);
    }
    if (spec.name.empty()) {
        spec.name = name;
    }

    spec.image = StringField(config, "Image");
    spec.image_id = StringField(container, "Image");
    spec.environment = ExtractEnvironment(config);
    spec.ports = ExtractPorts(host_config);
    spec.mounts = ExtractMounts(container, host_config);

    // Restart policy
    const json& restart = ObjectField(host_config, "RestartPolicy");
    const std::string restart_name = StringField(restart, "Name");
    if (!restart_name.empty() && restart_name != "no" && restart_name != "none") {
        core::RestartPolicy policy;
        policy.name = restart_name;
        if (restart.contains("MaximumRetryCount") && restart["MaximumRetryCount"].is_number_integer()) {
            policy.maximum_retry_count = restart["MaximumRetryCount"].get<int>();
        }
        spec.restart_policy = policy;
    }

    // Network
    const std::string network = StringField(host_config, "NetworkMode");
    if (!network.empty() && network != "default" && network != "bridge") {
        spec.network_mode = network;
    }

    // Hostname: docker defaults it to the short container ID, and refuses it
    // together with host / container:<id> networking
    const std::string hostname = StringField(config, "Hostname");
    const std::string id = StringField(container, "Id");
    const bool shares_namespace = network == "host" || network.rfind("container:", 0) == 0;
    if (!hostname.empty() && !shares_namespace && id.compare(0, 12, hostname) != 0) {
        spec.hostname = hostname;
    }

    // Entrypoint / command overrides
    auto entrypoint = StringArray(config, "Entrypoint");
    auto command = StringArray(config, "Cmd");

    if (image) {
        const json& image_config = ObjectField(*image, "Config");
        auto image_entrypoint = StringArray(image_config, "Entrypoint");
        auto image_command = StringArray(image_config, "Cmd");

        if (entrypoint != image_entrypoint) {
            spec.entrypoint = entrypoint.value_or(std::vector<std::string>{});
            // --entrypoint clears the image command, so the full command has to be carried
            if (command && !command->empty()) {
                spec.command = command;
            }
        } else if (command && command != image_command) {
            spec.command = command;
        }
    } else {
        if (entrypoint) spec.entrypoint = entrypoint;
        if (command) spec.command = command;
    }

    return spec;
}

} // namespace runtime
} // namespace redock
