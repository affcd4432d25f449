#include <doctest/doctest.h>

#include "fakes.hpp"

#include "redock/core/errors.hpp"
#include "redock/core/identity_resolver.hpp"

using namespace redock;
using namespace redock::core;
using namespace redock::testing;

namespace {
const std::string kImageId = "sha256:" + std::string(64, '1');
const std::string kDigestA = "sha256:" + std::string(64, 'a');
const std::string kDigestB = "sha256:" + std::string(64, 'b');
}

TEST_CASE("IdentityResolver: RepoDigests entry of the same repository wins") {
    auto image = MakeImage(kImageId, {"mirror.local/nginx@" + kDigestB, "nginx@" + kDigestA});
    CHECK(IdentityResolver::SelectIdentity(image, "nginx") == kDigestA);
}

TEST_CASE("IdentityResolver: first RepoDigests entry when no repository matches") {
    auto image = MakeImage(kImageId, {"mirror.local/nginx@" + kDigestB, "other@" + kDigestA});
    CHECK(IdentityResolver::SelectIdentity(image, "nginx") == kDigestB);
}

TEST_CASE("IdentityResolver: locally built images fall back to the image ID") {
    auto image = MakeImage(kImageId, {});
    CHECK(IdentityResolver::SelectIdentity(image, "myapp") == kImageId);
}

TEST_CASE("IdentityResolver: Docker Hub spellings match each other") {
    FakeRuntime runtime;
    runtime.Store("docker.io/library/nginx:1.27", MakeImage(kImageId, {"nginx@" + kDigestA}));

    IdentityResolver resolver(runtime);
    CHECK(resolver.Resolve(ImageReference::Parse("docker.io/library/nginx:1.27")) == kDigestA);
}

TEST_CASE("IdentityResolver: unknown references are not pulled") {
    FakeRuntime runtime;
    runtime.Publish("nginx:1.27", MakeImage(kImageId, {"nginx@" + kDigestA}));

    IdentityResolver resolver(runtime);
    CHECK_THROWS_AS(resolver.Resolve(ImageReference::Parse("nginx:1.27")), ImageNotFound);
    CHECK_FALSE(resolver.TryResolve(ImageReference::Parse("nginx:1.27")).has_value());
    CHECK(runtime.CountCalls("pull ") == 0);
}

TEST_CASE("IdentityResolver: running image ID resolves to the same identity as its tag") {
    FakeRuntime runtime;
    runtime.Store("nginx:1.27", MakeImage(kImageId, {"nginx@" + kDigestA}));

    IdentityResolver resolver(runtime);
    CHECK(resolver.ResolveImageId(kImageId, "nginx") == resolver.Resolve(ImageReference::Parse("nginx:1.27")));
    CHECK_THROWS_AS(resolver.ResolveImageId("sha256:" + std::string(64, '9'), "nginx"), ImageNotFound);
}
