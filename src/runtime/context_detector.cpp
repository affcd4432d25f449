/**
 * @file context_detector.cpp
 * @brief Compose label parsing and Standalone/Managed classification
 *
 * The config_files label is a comma-separated list (compose records every
 * -f it was given); only the first file is needed to address the project
 * again. Some compose versions wrap the list in brackets and quotes, which
 * are stripped.
 *
 * @date 2025
 */

#include "redock/runtime/context_detector.hpp"
#include "redock/core/errors.hpp"
#include "redock/runtime/runtime_config_extractor.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

using json = nlohmann::json;

namespace redock {
namespace runtime {

namespace {

std::string Label(const json& labels, const char* key) {
    if (labels.is_object() && labels.contains(key) && labels[key].is_string()) {
        return labels[key].get<std::string>();
    }
    return "";
}

std::string FirstConfigFile(std::string raw) {
    if (!raw.empty() && raw.front() == '[') raw.erase(0, 1);
    if (!raw.empty() && raw.back() == ']') raw.pop_back();

    std::string first = raw.substr(0, raw.find(','));

    std::string cleaned;
    for (char c : first) {
        if (c != '"') cleaned += c;
    }

    auto begin = cleaned.find_first_not_of(" \t");
    auto end = cleaned.find_last_not_of(" \t");
    if (begin == std::string::npos) return "";
    return cleaned.substr(begin, end - begin + 1);
}

const json& LabelsOf(const json& container) {
    static const json empty = json::object();
    if (container.contains("Config") && container["Config"].is_object() &&
        container["Config"].contains("Labels") && container["Config"]["Labels"].is_object()) {
        return container["Config"]["Labels"];
    }
    return empty;
}

} // anonymous namespace

ContextDetector::ContextDetector(ContainerRuntime& runtime)
    : runtime_(runtime) {
}

std::optional<core::ManagedContext> ContextDetector::Detect(const std::string& name) const {
    auto container = runtime_.InspectContainer(name);
    if (!container) {
        throw ContainerNotFound(name);
    }
    return DetectFromLabels(LabelsOf(*container));
}

core::TargetContext ContextDetector::Classify(const std::string& name) const {
    spdlog::info("Inspecting container '{}'...", name);

    auto container = runtime_.InspectContainer(name);
    if (!container) {
        throw ContainerNotFound(name);
    }

    if (auto context = DetectFromLabels(LabelsOf(*container))) {
        spdlog::info("Detected compose-managed service '{}' in '{}'.",
                     context->service, context->config_file);
        return core::Managed{*context};
    }

    std::optional<json> image;
    if (container->contains("Image") && (*container)["Image"].is_string()) {
        image = runtime_.InspectImage((*container)["Image"].get<std::string>());
    }
    if (!image) {
        spdlog::warn("Image of '{}' cannot be inspected; keeping entrypoint and command verbatim", name);
    }

    return core::Standalone{RuntimeConfigExtractor::FromInspect(name, *container, image)};
}

std::optional<core::ManagedContext> ContextDetector::DetectFromLabels(const json& labels) {
    core::ManagedContext context;
    context.config_file = FirstConfigFile(Label(labels, labels::kConfigFiles));
    context.working_directory = Label(labels, labels::kWorkingDir);
    context.service = Label(labels, labels::kService);
    context.project = ProjectFromLabels(labels);

    if (context.config_file.empty() || context.working_directory.empty() || context.service.empty()) {
        return std::nullopt;
    }

    std::filesystem::path config_path(context.config_file);
    if (config_path.is_relative()) {
        context.config_file = (std::filesystem::path(context.working_directory) / config_path).string();
    }
    return context;
}

std::string ContextDetector::ProjectFromLabels(const json& labels) {
    return Label(labels, labels::kProject);
}

} // namespace runtime
} // namespace redock
