#include <doctest/doctest.h>

#include "redock/core/errors.hpp"
#include "redock/core/image_reference.hpp"

#include <string>

using namespace redock;
using namespace redock::core;

namespace {
const std::string kDigest = "sha256:" + std::string(64, 'a');
}

TEST_CASE("ImageReference: bare repository has no tag or digest") {
    auto ref = ImageReference::Parse("nginx");
    CHECK(ref.repository == "nginx");
    CHECK_FALSE(ref.HasTag());
    CHECK_FALSE(ref.HasDigest());
    CHECK(ref.PullReference() == "nginx:latest");
}

TEST_CASE("ImageReference: registry port is not mistaken for a tag") {
    auto ref = ImageReference::Parse("registry.local:5000/team/api");
    CHECK(ref.repository == "registry.local:5000/team/api");
    CHECK_FALSE(ref.HasTag());

    auto tagged = ImageReference::Parse("registry.local:5000/team/api:2.1");
    CHECK(tagged.repository == "registry.local:5000/team/api");
    CHECK(tagged.tag == "2.1");
}

TEST_CASE("ImageReference: digest references") {
    auto ref = ImageReference::Parse("ghcr.io/acme/api@" + kDigest);
    CHECK(ref.repository == "ghcr.io/acme/api");
    CHECK(ref.digest == kDigest);
    CHECK(ref.PullReference() == "ghcr.io/acme/api@" + kDigest);

    CHECK_THROWS_AS(ImageReference::Parse("nginx@sha256:xyz"), ArgumentError);
    CHECK_THROWS_AS(ImageReference::Parse(""), ArgumentError);
    CHECK_THROWS_AS(ImageReference::Parse(":1.0"), ArgumentError);
}

TEST_CASE("ImageReference: WithTag and WithDigest replace each other") {
    auto ref = ImageReference::Parse("nginx:1.25");

    auto pinned = ref.WithDigest(kDigest);
    CHECK(pinned.ToString() == "nginx@" + kDigest);
    CHECK_FALSE(pinned.HasTag());

    auto retagged = pinned.WithTag("1.27");
    CHECK(retagged.ToString() == "nginx:1.27");
    CHECK_FALSE(retagged.HasDigest());
}

TEST_CASE("ImageReference: Docker Hub spellings normalize to the same repository") {
    CHECK(ImageReference::Parse("nginx").NormalizedRepository() == "nginx");
    CHECK(ImageReference::Parse("library/nginx").NormalizedRepository() == "nginx");
    CHECK(ImageReference::Parse("docker.io/library/nginx:1.27").NormalizedRepository() == "nginx");
    CHECK(ImageReference::Parse("docker.io/grafana/grafana").NormalizedRepository() == "grafana/grafana");
    CHECK(ImageReference::Parse("ghcr.io/acme/api").NormalizedRepository() == "ghcr.io/acme/api");
}

TEST_CASE("IsDigest: algorithm and hex payload required") {
    CHECK(IsDigest(kDigest));
    CHECK(IsDigest("sha512:" + std::string(128, 'f')));
    CHECK_FALSE(IsDigest("latest"));
    CHECK_FALSE(IsDigest("sha256:"));
    CHECK_FALSE(IsDigest("sha256:abc"));
    CHECK_FALSE(IsDigest(""));
}
