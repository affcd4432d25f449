#include <doctest/doctest.h>

#include "redock/core/errors.hpp"
#include "redock/core/types.hpp"
#include "redock/runtime/docker_compose_tool.hpp"
#include "redock/runtime/docker_runtime.hpp"
#include "redock/utils/process_utils.hpp"
#include "redock/utils/scoped_overlay_file.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace redock;
using namespace redock::core;
using redock::runtime::ComposeInvocation;
using redock::runtime::DockerComposeTool;
using redock::runtime::DockerRuntime;
using redock::utils::ScopedOverlayFile;

// ============================================================================
// docker run arguments
// ============================================================================

TEST_CASE("DockerRuntime: run arguments carry the captured configuration") {
    ContainerRuntimeSpec spec;
    spec.name = "web";
    spec.hostname = "web-host";
    spec.environment = {"MODE=prod", "EMPTY="};
    spec.ports.insert(PortBinding{"127.0.0.1", "8080", "80"});
    spec.mounts.push_back(Mount{MountKind::BIND, "/srv/data", "/data", true});
    spec.mounts.push_back(Mount{MountKind::VOLUME, "cache", "/cache", false});
    spec.mounts.push_back(Mount{MountKind::TMPFS, "", "/run", false});
    spec.restart_policy = RestartPolicy{"on-failure", 3};
    spec.network_mode = "backend";
    spec.entrypoint = std::vector<std::string>{"/bin/sh", "-c"};
    spec.command = std::vector<std::string>{"exec nginx"};

    const std::vector<std::string> extra = {"--log-driver", "journald"};
    const auto args = DockerRuntime::BuildRunArguments(spec, "nginx:1.27", extra);

    const std::vector<std::string> expected = {
        "run", "-d", "--name", "web",
        "--hostname", "web-host",
        "-e", "MODE=prod", "-e", "EMPTY=",
        "-p", "127.0.0.1:8080:80",
        "--mount", "type=bind,source=/srv/data,target=/data,readonly",
        "--mount", "type=volume,source=cache,target=/cache",
        "--tmpfs", "/run",
        "--restart", "on-failure:3",
        "--network", "backend",
        "--entrypoint", "/bin/sh",
        "--log-driver", "journald",
        "nginx:1.27",
        "-c", "exec nginx"
    };
    CHECK(args == expected);
}

TEST_CASE("DockerRuntime: mount paths with separators are passed intact") {
    ContainerRuntimeSpec spec;
    spec.name = "web";
    spec.mounts.push_back(Mount{MountKind::BIND, "/srv/data:2025", "/data", false});
    spec.mounts.push_back(Mount{MountKind::BIND, "/srv/a,b", "/ab", true});

    const auto args = DockerRuntime::BuildRunArguments(spec, "nginx:1.27");
    const std::vector<std::string> expected = {
        "run", "-d", "--name", "web",
        "--mount", "type=bind,source=/srv/data:2025,target=/data",
        "--mount", "type=bind,\"source=/srv/a,b\",target=/ab,readonly",
        "nginx:1.27"
    };
    CHECK(args == expected);
}

TEST_CASE("DockerRuntime: defaults add no flags") {
    ContainerRuntimeSpec spec;
    spec.name = "web";

    const auto args = DockerRuntime::BuildRunArguments(spec, "nginx@sha256:" + std::string(64, 'a'));
    const std::vector<std::string> expected = {
        "run", "-d", "--name", "web", "nginx@sha256:" + std::string(64, 'a')
    };
    CHECK(args == expected);
}

TEST_CASE("DockerRuntime: relaunch hint is a copyable shell command") {
    ContainerRuntimeSpec spec;
    spec.name = "web";
    spec.environment = {"GREETING=hello world"};

    DockerRuntime docker("docker");
    CHECK(docker.RelaunchHint(spec, "nginx:1.27") ==
          "docker run -d --name web -e 'GREETING=hello world' nginx:1.27");
}

// ============================================================================
// Shell quoting
// ============================================================================

TEST_CASE("FormatCommandLine: quotes only what the shell would split") {
    const std::vector<std::string> plain = {"docker", "ps", "-a"};
    const std::vector<std::string> empty = {"echo", ""};
    const std::vector<std::string> apostrophe = {"echo", "it's"};
    const std::vector<std::string> variable = {"-e", "A=$HOME"};

    CHECK(utils::FormatCommandLine(plain) == "docker ps -a");
    CHECK(utils::FormatCommandLine(empty) == "echo ''");
    CHECK(utils::FormatCommandLine(apostrophe) == "echo 'it'\\''s'");
    CHECK(utils::FormatCommandLine(variable) == "-e 'A=$HOME'");
}

// ============================================================================
// Compose override files
// ============================================================================

TEST_CASE("ScopedOverlayFile: pins one service and removes itself") {
    std::filesystem::path path;
    {
        ScopedOverlayFile overlay("web", "nginx:1.28");
        path = overlay.path();
        REQUIRE(std::filesystem::exists(path));

        std::ifstream in(path);
        std::stringstream body;
        body << in.rdbuf();
        CHECK(body.str() == ScopedOverlayFile::Render("web", "nginx:1.28"));
    }
    CHECK_FALSE(std::filesystem::exists(path));
}

TEST_CASE("ScopedOverlayFile: body pins the service image") {
    const auto body = nlohmann::json::parse(ScopedOverlayFile::Render("web", "nginx:1.28"));
    CHECK(body.size() == 1);
    CHECK(body.at("services").size() == 1);
    CHECK(body.at("services").at("web").at("image") == "nginx:1.28");
}

TEST_CASE("ScopedOverlayFile: names needing YAML quoting survive") {
    const std::string service = "we\"b: #1\n";
    const std::string image = "registry.local:5000/team/api:2.1 'x'";

    const auto body = nlohmann::json::parse(ScopedOverlayFile::Render(service, image));
    CHECK(body.at("services").at(service).at("image") == image);
}

TEST_CASE("ScopedOverlayFile: each instance gets its own file") {
    ScopedOverlayFile first("web", "nginx:1.28");
    ScopedOverlayFile second("web", "nginx:1.28");
    CHECK(first.path() != second.path());
}

// ============================================================================
// docker compose arguments
// ============================================================================

TEST_CASE("DockerComposeTool: project selection flags") {
    DockerComposeTool compose;

    ComposeInvocation invocation;
    invocation.config_file = "/srv/demo/compose.yml";
    invocation.override_files = {"/tmp/override.yml"};
    invocation.project_directory = "/srv/demo";
    invocation.project_name = "demo";

    const std::vector<std::string> expected = {
        "docker", "compose",
        "-f", "/srv/demo/compose.yml",
        "-f", "/tmp/override.yml",
        "--project-directory", "/srv/demo",
        "-p", "demo"
    };
    CHECK(compose.BaseArguments(invocation) == expected);
}

TEST_CASE("DockerComposeTool: an empty command is rejected") {
    CHECK_THROWS_AS(DockerComposeTool(std::vector<std::string>{}), ArgumentError);
}
