#include <doctest/doctest.h>

#include "fakes.hpp"

#include "redock/core/errors.hpp"
#include "redock/utils/settings.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>

using namespace redock;
using namespace redock::utils;
using redock::testing::TempDir;
using json = nlohmann::json;

namespace {

/// Restores REDOCK_LEDGER when a test case ends
class LedgerEnvGuard {
public:
    LedgerEnvGuard() {
        if (const char* value = std::getenv("REDOCK_LEDGER")) {
            saved_ = value;
            had_value_ = true;
        }
    }
    ~LedgerEnvGuard() {
        if (had_value_) {
            setenv("REDOCK_LEDGER", saved_.c_str(), 1);
        } else {
            unsetenv("REDOCK_LEDGER");
        }
    }

private:
    std::string saved_;
    bool had_value_{false};
};

} // anonymous namespace

TEST_CASE("Settings: defaults") {
    Settings settings;
    CHECK(settings.ledger_path.empty());
    CHECK(settings.docker_binary == "docker");
    const std::vector<std::string> compose_command = {"docker", "compose"};
    CHECK(settings.compose_command == compose_command);
    CHECK(settings.prune_after_update);
    CHECK(settings.drift_protection);
    CHECK(settings.rollback_history_limit == 5);
    CHECK(settings.log_level == "info");
}

TEST_CASE("Settings: values from a document override the defaults") {
    Settings settings;
    settings.Apply(json::parse(R"({
        "ledger_path": "/var/log/redock.log",
        "docker_binary": "podman",
        "compose_command": ["docker-compose"],
        "extra_run_args": ["--log-driver", "journald"],
        "prune_after_update": false,
        "drift_protection": false,
        "rollback_history_limit": 10,
        "log_level": "debug",
        "colour": "always"
    })"));

    CHECK(settings.ledger_path == "/var/log/redock.log");
    CHECK(settings.docker_binary == "podman");
    CHECK(settings.compose_command == std::vector<std::string>{"docker-compose"});
    REQUIRE(settings.extra_run_args.size() == 2);
    CHECK(settings.extra_run_args[1] == "journald");
    CHECK_FALSE(settings.prune_after_update);
    CHECK_FALSE(settings.drift_protection);
    CHECK(settings.rollback_history_limit == 10);
    CHECK(settings.log_level == "debug");
}

TEST_CASE("Settings: invalid values are argument errors") {
    Settings settings;
    CHECK_THROWS_AS(settings.Apply(json::parse(R"({"prune_after_update": "yes"})")), ArgumentError);
    CHECK_THROWS_AS(settings.Apply(json::parse(R"({"rollback_history_limit": 0})")), ArgumentError);
    CHECK_THROWS_AS(settings.Apply(json::parse(R"({"compose_command": []})")), ArgumentError);
    CHECK_THROWS_AS(settings.Apply(json::parse("[1, 2]")), ArgumentError);
}

TEST_CASE("Settings: configuration files") {
    TempDir dir;

    SUBCASE("well formed") {
        const auto path = dir.File("redock.json");
        std::ofstream(path) << R"({"docker_binary": "/usr/local/bin/docker"})";

        Settings settings;
        settings.LoadFile(path);
        CHECK(settings.docker_binary == "/usr/local/bin/docker");
    }
    SUBCASE("malformed") {
        const auto path = dir.File("broken.json");
        std::ofstream(path) << "{ not json";

        Settings settings;
        CHECK_THROWS_AS(settings.LoadFile(path), ArgumentError);
    }
    SUBCASE("missing") {
        Settings settings;
        CHECK_THROWS_AS(settings.LoadFile(dir.File("absent.json")), ArgumentError);
    }
}

TEST_CASE("Settings: ledger path resolution order") {
    LedgerEnvGuard guard;

    SUBCASE("configured path wins") {
        setenv("REDOCK_LEDGER", "/from/env.log", 1);
        Settings settings;
        settings.ledger_path = "/from/config.log";
        settings.ResolveLedgerPath();
        CHECK(settings.ledger_path == "/from/config.log");
    }
    SUBCASE("environment") {
        setenv("REDOCK_LEDGER", "/from/env.log", 1);
        Settings settings;
        settings.ResolveLedgerPath();
        CHECK(settings.ledger_path == "/from/env.log");
    }
    SUBCASE("fallback") {
        unsetenv("REDOCK_LEDGER");
        Settings settings;
        settings.ResolveLedgerPath();
        CHECK(settings.ledger_path == kFallbackLedgerPath);
    }
}
