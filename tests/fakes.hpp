/**
 * @file fakes.hpp
 * @brief In-memory container runtime and compose tool for unit tests
 *
 * FakeRuntime keeps a local image store, a "registry" of pullable images and
 * a set of containers as inspect documents. FakeComposeTool declares services
 * and recreates them inside the same FakeRuntime. Both record every call.
 *
 * @date 2025
 */

#pragma once

#include "redock/core/types.hpp"
#include "redock/runtime/compose_tool.hpp"
#include "redock/runtime/container_runtime.hpp"
#include "redock/core/errors.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <string>
#include <vector>

#include <unistd.h>

namespace redock {
namespace testing {

using json = nlohmann::json;

// ============================================================================
// Inspect document builders
// ============================================================================

inline json MakeImage(const std::string& id,
                      const std::vector<std::string>& repo_digests,
                      const std::vector<std::string>& entrypoint = {},
                      const std::vector<std::string>& cmd = {}) {
    json image;
    image["Id"] = id;
    image["RepoDigests"] = repo_digests;
    image["Config"] = json::object();
    image["Config"]["Entrypoint"] = entrypoint.empty() ? json(nullptr) : json(entrypoint);
    image["Config"]["Cmd"] = cmd.empty() ? json(nullptr) : json(cmd);
    return image;
}

inline json MakeContainer(const std::string& name,
                          const std::string& config_image,
                          const std::string& image_id,
                          const json& labels = json::object()) {
    json container;
    container["Id"] = "0123456789ab" + std::string(52, 'c');
    container["Name"] = "/" + name;
    container["Image"] = image_id;
    container["Config"] = {
        {"Image", config_image},
        {"Hostname", "0123456789ab"},
        {"Env", json::array()},
        {"Entrypoint", nullptr},
        {"Cmd", nullptr},
        {"Labels", labels}
    };
    container["HostConfig"] = {
        {"NetworkMode", "bridge"},
        {"RestartPolicy", {{"Name", "no"}, {"MaximumRetryCount", 0}}},
        {"PortBindings", json::object()}
    };
    container["Mounts"] = json::array();
    container["State"] = {{"Running", true}};
    return container;
}

inline json ComposeLabels(const std::string& config_file,
                          const std::string& working_dir,
                          const std::string& service,
                          const std::string& project = "demo") {
    return json{
        {"com.docker.compose.project.config_files", config_file},
        {"com.docker.compose.project.working_dir", working_dir},
        {"com.docker.compose.service", service},
        {"com.docker.compose.project", project}
    };
}

// ============================================================================
// FakeRuntime
// ============================================================================

class FakeRuntime : public runtime::ContainerRuntime {
public:
    std::map<std::string, json> containers;  ///< name -> inspect document
    std::map<std::string, json> images;      ///< local store: reference or ID -> inspect document
    std::map<std::string, json> registry;    ///< pullable references

    std::set<std::string> fail_pull;
    std::set<std::string> fail_stop;
    std::set<std::string> fail_remove;
    std::set<std::string> fail_run;
    bool run_leaves_no_container{false};

    std::vector<std::string> calls;
    std::vector<core::ContainerRuntimeSpec> run_specs;
    int prune_count{0};

    /// Make `reference` pullable and resolve to `image`
    void Publish(const std::string& reference, const json& image) {
        registry[reference] = image;
    }

    /// Put `image` in the local store under `reference` and its ID
    void Store(const std::string& reference, const json& image) {
        images[reference] = image;
        images[image["Id"].get<std::string>()] = image;
    }

    void AddContainer(const json& container) {
        auto name = container["Name"].get<std::string>();
        if (!name.empty() && name[0] == '/') name.erase(0, 1);
        containers[name] = container;
    }

    std::size_t CountCalls(const std::string& prefix) const {
        std::size_t count = 0;
        for (const auto& call : calls) {
            if (call.compare(0, prefix.size(), prefix) == 0) ++count;
        }
        return count;
    }

    bool Destructive() const {
        return CountCalls("stop ") + CountCalls("rm ") + CountCalls("run ") > 0;
    }

    std::optional<json> InspectContainer(const std::string& name) override {
        calls.push_back("inspect " + name);
        auto it = containers.find(name);
        if (it != containers.end()) return it->second;
        for (const auto& [key, doc] : containers) {
            if (doc.value("Id", std::string()) == name) return doc;
        }
        return std::nullopt;
    }

    std::optional<json> InspectImage(const std::string& reference) override {
        auto it = images.find(reference);
        if (it == images.end()) return std::nullopt;
        return it->second;
    }

    bool PullImage(const std::string& reference) override {
        calls.push_back("pull " + reference);
        if (fail_pull.count(reference) > 0) return false;
        auto it = registry.find(reference);
        if (it == registry.end()) return false;
        Store(reference, it->second);
        return true;
    }

    bool StopContainer(const std::string& name) override {
        calls.push_back("stop " + name);
        if (fail_stop.count(name) > 0) return false;
        auto it = containers.find(name);
        if (it == containers.end()) return false;
        it->second["State"]["Running"] = false;
        return true;
    }

    bool RemoveContainer(const std::string& name) override {
        calls.push_back("rm " + name);
        if (fail_remove.count(name) > 0) return false;
        return containers.erase(name) > 0;
    }

    bool RunContainer(const core::ContainerRuntimeSpec& spec, const std::string& image) override {
        calls.push_back("run " + spec.name + " " + image);
        run_specs.push_back(spec);
        if (fail_run.count(spec.name) > 0) return false;

        auto it = images.find(image);
        if (it == images.end()) return false;
        if (!run_leaves_no_container) {
            AddContainer(MakeContainer(spec.name, image, it->second["Id"].get<std::string>()));
        }
        return true;
    }

    std::vector<std::string> ListContainersByLabel(const std::string& label,
                                                   const std::string& value) override {
        std::vector<std::string> names;
        for (const auto& [name, doc] : containers) {
            const auto labels = doc.at("Config").value("Labels", json::object());
            if (labels.is_object() && labels.contains(label) && labels.at(label) == value) {
                names.push_back(name);
            }
        }
        return names;
    }

    bool PruneImages() override {
        calls.push_back("prune");
        ++prune_count;
        return true;
    }

    std::string RelaunchHint(const core::ContainerRuntimeSpec& spec, const std::string& image) const override {
        return "docker run -d --name " + spec.name + " " + image;
    }
};

// ============================================================================
// FakeComposeTool
// ============================================================================

class FakeComposeTool : public runtime::ComposeTool {
public:
    explicit FakeComposeTool(FakeRuntime& runtime) : runtime_(runtime) {}

    std::map<std::string, std::string> declared;  ///< service -> declared image
    std::string project{"demo"};
    std::string working_dir{"/srv/demo"};

    std::set<std::string> fail_up;
    bool list_fails{false};

    std::vector<std::string> calls;
    std::vector<std::string> overlays_seen;        ///< Overlay paths passed to any call
    std::vector<std::string> overlay_images_seen;  ///< Images pinned by those overlays

    std::size_t CountCalls(const std::string& prefix) const {
        std::size_t count = 0;
        for (const auto& call : calls) {
            if (call.compare(0, prefix.size(), prefix) == 0) ++count;
        }
        return count;
    }

    static std::string ContainerName(const std::string& project, const std::string& service) {
        return project + "-" + service + "-1";
    }

    std::vector<std::string> ListServices(const runtime::ComposeInvocation&) override {
        calls.push_back("services");
        if (list_fails) throw RuntimeCommandError("compose config failed");
        std::vector<std::string> services;
        for (const auto& [service, image] : declared) services.push_back(service);
        return services;
    }

    std::optional<std::string> DeclaredImage(const runtime::ComposeInvocation& invocation,
                                             const std::string& service) override {
        calls.push_back("declared " + service);
        auto it = declared.find(service);
        if (it == declared.end()) throw RuntimeCommandError("Service '" + service + "' is not declared");
        if (it->second.empty()) return std::nullopt;
        return EffectiveImage(invocation, service);
    }

    bool Pull(const runtime::ComposeInvocation& invocation, const std::string& service) override {
        calls.push_back("pull " + service);
        return runtime_.PullImage(Qualified(EffectiveImage(invocation, service)));
    }

    bool Up(const runtime::ComposeInvocation& invocation, const std::string& service) override {
        calls.push_back("up " + service);
        if (fail_up.count(service) > 0) return false;

        const auto image = Qualified(EffectiveImage(invocation, service));
        auto it = runtime_.images.find(image);
        if (it == runtime_.images.end()) return false;

        const auto name = ContainerName(project, service);
        runtime_.containers.erase(name);
        runtime_.AddContainer(MakeContainer(name, image, it->second["Id"].get<std::string>(),
                                            ComposeLabels(invocation.config_file, working_dir, service, project)));
        return true;
    }

    std::optional<std::string> ServiceContainerId(const runtime::ComposeInvocation&,
                                                  const std::string& service) override {
        calls.push_back("ps " + service);
        const auto name = ContainerName(project, service);
        if (runtime_.containers.count(name) == 0) return std::nullopt;
        return name;
    }

private:
    FakeRuntime& runtime_;

    static std::string Qualified(const std::string& image) {
        auto slash = image.rfind('/');
        auto colon = image.rfind(':');
        bool has_tag = colon != std::string::npos && (slash == std::string::npos || colon > slash);
        if (image.find('@') != std::string::npos || has_tag) return image;
        return image + ":latest";
    }

    // Declared image with the last overlay applied; overlays are read from disk
    std::string EffectiveImage(const runtime::ComposeInvocation& invocation, const std::string& service) {
        std::string image = declared[service];
        for (const auto& path : invocation.override_files) {
            overlays_seen.push_back(path);
            std::ifstream in(path);
            const auto overlay = json::parse(in);
            const auto pinned = overlay.at("services").at(service).at("image").get<std::string>();
            overlay_images_seen.push_back(pinned);
            image = pinned;
        }
        return image;
    }
};

// ============================================================================
// Temporary directory
// ============================================================================

class TempDir {
public:
    TempDir() {
        static int counter = 0;
        path_ = std::filesystem::temp_directory_path() /
                ("redock_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path File(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

} // namespace testing
} // namespace redock
