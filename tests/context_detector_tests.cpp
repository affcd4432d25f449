#include <doctest/doctest.h>

#include "fakes.hpp"

#include "redock/core/errors.hpp"
#include "redock/runtime/context_detector.hpp"

#include <variant>

using namespace redock;
using namespace redock::core;
using namespace redock::runtime;
using namespace redock::testing;

namespace {
const std::string kImageId = "sha256:" + std::string(64, '1');
}

TEST_CASE("ContextDetector: all three labels yield a managed context") {
    auto context = ContextDetector::DetectFromLabels(
        ComposeLabels("/srv/shop/docker-compose.yml", "/srv/shop", "web", "shop"));

    REQUIRE(context.has_value());
    CHECK(context->config_file == "/srv/shop/docker-compose.yml");
    CHECK(context->working_directory == "/srv/shop");
    CHECK(context->service == "web");
    CHECK(context->project == "shop");
}

TEST_CASE("ContextDetector: first of several config files, relative to the working dir") {
    auto context = ContextDetector::DetectFromLabels(
        ComposeLabels("compose.yml,compose.override.yml", "/srv/shop", "db"));

    REQUIRE(context.has_value());
    CHECK(context->config_file == "/srv/shop/compose.yml");
}

TEST_CASE("ContextDetector: any missing label means standalone") {
    auto labels = ComposeLabels("/srv/shop/compose.yml", "/srv/shop", "web");

    auto no_service = labels;
    no_service.erase("com.docker.compose.service");
    CHECK_FALSE(ContextDetector::DetectFromLabels(no_service).has_value());

    auto no_dir = labels;
    no_dir["com.docker.compose.project.working_dir"] = "";
    CHECK_FALSE(ContextDetector::DetectFromLabels(no_dir).has_value());

    CHECK_FALSE(ContextDetector::DetectFromLabels(json::object()).has_value());
}

TEST_CASE("ContextDetector: classification in one inspection") {
    FakeRuntime runtime;
    runtime.AddContainer(MakeContainer("shop-web-1", "nginx:1.27", kImageId,
                                       ComposeLabels("/srv/shop/compose.yml", "/srv/shop", "web", "shop")));
    runtime.AddContainer(MakeContainer("cache", "redis:7", kImageId));

    ContextDetector detector(runtime);

    auto managed = detector.Classify("shop-web-1");
    REQUIRE(std::holds_alternative<Managed>(managed));
    CHECK(std::get<Managed>(managed).context.service == "web");

    auto standalone = detector.Classify("cache");
    REQUIRE(std::holds_alternative<Standalone>(standalone));
    CHECK(std::get<Standalone>(standalone).spec.image == "redis:7");

    CHECK(runtime.CountCalls("inspect ") == 2);
    CHECK_THROWS_AS(detector.Classify("ghost"), ContainerNotFound);
    CHECK_THROWS_AS(detector.Detect("ghost"), ContainerNotFound);
}
