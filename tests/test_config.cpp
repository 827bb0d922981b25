#include <catch2/catch.hpp>
#include <depot/config.hpp>

#include "repo_fixture.hpp"

using namespace depot;

// ===== Parsing =====

TEST_CASE("parse full config", "[config]") {
    auto r = Config::parse(R"(
[android]
sdk = "/opt/android-sdk"

[repositories]
paths = ["/srv/m2", "/home/me/m2"]
defaults = false

[resolve]
use-latest = true
max-passes = 50

[log]
level = "debug"
color = true
)");
    REQUIRE(r.is_ok());
    const Config& c = r.value();
    REQUIRE(c.sdk == "/opt/android-sdk");
    REQUIRE(c.repositories == std::vector<std::string>{"/srv/m2", "/home/me/m2"});
    REQUIRE_FALSE(c.default_repositories);
    REQUIRE(c.use_latest);
    REQUIRE(c.max_passes == 50);
    REQUIRE(c.log_level == log::Debug);
    REQUIRE(c.color);
}

TEST_CASE("parse empty config keeps defaults", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    const Config& c = r.value();
    REQUIRE(c.sdk.empty());
    REQUIRE(c.repositories.empty());
    REQUIRE(c.default_repositories);
    REQUIRE_FALSE(c.use_latest);
    REQUIRE(c.max_passes == 1000);
    REQUIRE_FALSE(c.sdk_set);
    REQUIRE_FALSE(c.log_level_set);
}

TEST_CASE("parse invalid TOML config", "[config]") {
    auto r = Config::parse("not valid [toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == DepotError::Parse);
}

TEST_CASE("reject bad values", "[config]") {
    auto level = Config::parse("[log]\nlevel = \"loud\"\n");
    REQUIRE(level.is_err());
    REQUIRE(level.error().code == DepotError::Config);

    auto passes = Config::parse("[resolve]\nmax-passes = 0\n");
    REQUIRE(passes.is_err());
    REQUIRE(passes.error().code == DepotError::Config);

    auto huge = Config::parse("[resolve]\nmax-passes = 4294967297\n");
    REQUIRE(huge.is_err());
    REQUIRE(huge.error().code == DepotError::Config);

    auto paths = Config::parse("[repositories]\npaths = [1, 2]\n");
    REQUIRE(paths.is_err());
    REQUIRE(paths.error().code == DepotError::Config);
}

TEST_CASE("load reports the file of a bad config", "[config]") {
    TempDir td("depot_config");
    td.write_file("depot.toml", "[log]\nlevel = \"loud\"\n");
    auto r = Config::load((td.path / "depot.toml").string());
    REQUIRE(r.is_err());
    REQUIRE(r.error().file == (td.path / "depot.toml").string());
}

TEST_CASE("load missing config is an IO error", "[config]") {
    auto r = Config::load("/nonexistent/depot/config.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == DepotError::IO);
}

// ===== Layering =====

TEST_CASE("project overrides only what it sets", "[config]") {
    auto global = Config::parse(R"(
[android]
sdk = "/global/sdk"
[resolve]
use-latest = true
[log]
level = "warn"
)").value();
    auto project = Config::parse(R"(
[resolve]
use-latest = false
)").value();

    Config c = Config::effective(global, project);
    REQUIRE(c.sdk == "/global/sdk");
    REQUIRE_FALSE(c.use_latest);
    REQUIRE(c.log_level == log::Warn);
}

TEST_CASE("repository lists are concatenated without duplicates", "[config]") {
    auto global = Config::parse("[repositories]\npaths = [\"/a\", \"/b\"]\n").value();
    auto project = Config::parse("[repositories]\npaths = [\"/b\", \"/c\"]\n").value();

    Config c = Config::effective(global, project);
    REQUIRE(c.repositories == std::vector<std::string>{"/a", "/b", "/c"});
}

TEST_CASE("effective with no layers is the default config", "[config]") {
    Config c = Config::effective(std::nullopt, std::nullopt);
    REQUIRE(c.default_repositories);
    REQUIRE(c.max_passes == 1000);
}

// ===== Repository roots =====

TEST_CASE("repository roots put SDK defaults first", "[config]") {
    auto c = Config::parse("[repositories]\npaths = [\"/srv/m2\"]\n").value();
    auto roots = c.repository_roots();
    REQUIRE(roots.size() == 3);
    REQUIRE(roots[0] == "{{ sdk }}/extras/android/m2repository");
    REQUIRE(roots[1] == "{{ sdk }}/extras/google/m2repository");
    REQUIRE(roots[2] == "/srv/m2");
}

TEST_CASE("SDK defaults can be turned off", "[config]") {
    auto c = Config::parse("[repositories]\ndefaults = false\npaths = [\"/srv/m2\"]\n").value();
    REQUIRE(c.repository_roots() == std::vector<std::string>{"/srv/m2"});
}

TEST_CASE("configured sdk wins over the environment", "[config]") {
    auto c = Config::parse("[android]\nsdk = \"/configured\"\n").value();
    REQUIRE(c.sdk_path() == "/configured");
}

TEST_CASE("apply_logging sets the process log level", "[config]") {
    log::set_level(log::Info);
    auto c = Config::parse("[log]\nlevel = \"error\"\ncolor = false\n").value();
    c.apply_logging();
    REQUIRE(log::get_level() == log::Error);
    REQUIRE_FALSE(log::is_color_enabled());
    log::set_level(log::Info);
}

TEST_CASE("global config lives under the home directory", "[config]") {
    std::string path = global_config_path();
    if (!path.empty()) {
        REQUIRE(path.size() > std::string("/.depot/config.toml").size());
        REQUIRE(path.substr(path.size() - 19) == "/.depot/config.toml");
    }
}
