#include <catch2/catch.hpp>
#include <depot/deployer.hpp>

#include "recording_sink.hpp"
#include "repo_fixture.hpp"

using namespace depot;

namespace {

struct DeployFixture {
    TempDir td{"depot_deploy"};
    MavenRepo repo{td.path / "m2"};
    fs::path dest = td.path / "libs";
    RecordingSink sink;

    Dependency resolved(const std::string& artifact, const std::string& version) const {
        Dependency d("com.example", artifact, version);
        d.add_version(version);
        d.set_repo_path(repo.str());
        return d;
    }

    static CandidateMap map_of(const std::vector<Dependency>& deps) {
        CandidateMap m;
        for (const auto& d : deps) m.emplace(d.versionless_key(), d);
        return m;
    }

    Result<DeployReport> copy(const CandidateMap& m, const ConfirmOverwrite& confirm = {}) {
        ArtifactDeployer deployer(sink);
        return deployer.copy(m, dest.string(), confirm);
    }
};

} // namespace

// ===== Entry names =====

TEST_CASE("version embedded in destination names", "[deployer]") {
    REQUIRE(ArtifactDeployer::embedded_version("foo", "foo-1.2.3.aar") == "1.2.3");
    REQUIRE(ArtifactDeployer::embedded_version("foo", "foo-1.2.3-alpha.aar") == "1.2.3");
    REQUIRE(ArtifactDeployer::embedded_version("foo", "/libs/foo-2.0.jar") == "2.0");
    REQUIRE(ArtifactDeployer::embedded_version("foo", "foo-bar-1.0.aar").empty());
    REQUIRE(ArtifactDeployer::embedded_version("foo", "foo.aar").empty());
    REQUIRE(ArtifactDeployer::embedded_version("foo", "other-1.0.aar").empty());
}

TEST_CASE("only packaging extensions are stripped from entry names", "[deployer]") {
    TempDir td("depot_deploy");
    td.write_file("foo-1.2.3", "bare");
    REQUIRE(ArtifactDeployer::embedded_version("foo", td.path / "foo-1.2.3") == "1.2.3");
    REQUIRE(ArtifactDeployer::embedded_version("foo", "foo-1.2.3.srcaar") == "1.2.3");
    REQUIRE(ArtifactDeployer::embedded_version("foo", "foo-1.2.3.zip") == "1.2.3");
}

// ===== Copying =====

TEST_CASE("copy places each artifact in the destination", "[deployer]") {
    DeployFixture f;
    f.repo.write_artifact("com.example", "widget", "1.0", ".aar");
    f.repo.write_artifact("com.example", "core", "2.1", ".jar");

    auto r = f.copy(DeployFixture::map_of({f.resolved("widget", "1.0"),
                                           f.resolved("core", "2.1")}));
    REQUIRE(r.is_ok());
    REQUIRE(r.value().copied.size() == 2);
    REQUIRE(fs::is_regular_file(f.dest / "widget-1.0.aar"));
    REQUIRE(fs::is_regular_file(f.dest / "core-2.1.jar"));
}

TEST_CASE("srcaar is deployed as aar", "[deployer]") {
    DeployFixture f;
    f.repo.write_artifact("com.example", "widget", "1.0", ".srcaar");

    auto r = f.copy(DeployFixture::map_of({f.resolved("widget", "1.0")}));
    REQUIRE(r.is_ok());
    REQUIRE(fs::is_regular_file(f.dest / "widget-1.0.aar"));
    REQUIRE_FALSE(fs::exists(f.dest / "widget-1.0.srcaar"));
}

TEST_CASE("second copy writes nothing", "[deployer]") {
    DeployFixture f;
    f.repo.write_artifact("com.example", "widget", "1.0", ".aar");
    auto candidates = DeployFixture::map_of({f.resolved("widget", "1.0")});

    auto first = f.copy(candidates);
    REQUIRE(first.is_ok());
    REQUIRE(first.value().copied.size() == 1);

    int asked = 0;
    auto second = f.copy(candidates, [&](const Dependency&, const Dependency&) {
        ++asked;
        return true;
    });
    REQUIRE(second.is_ok());
    REQUIRE(second.value().copied.empty());
    REQUIRE(second.value().removed.empty());
    REQUIRE(second.value().up_to_date == std::vector<std::string>{"com.example:widget:1.0"});
    REQUIRE(asked == 0);
}

TEST_CASE("newer source replaces the destination copy", "[deployer]") {
    DeployFixture f;
    fs::path src = f.repo.write_artifact("com.example", "widget", "1.0", ".aar");
    auto candidates = DeployFixture::map_of({f.resolved("widget", "1.0")});
    REQUIRE(f.copy(candidates).is_ok());

    auto later = fs::last_write_time(f.dest / "widget-1.0.aar") + std::chrono::hours(1);
    fs::last_write_time(src, later);

    auto r = f.copy(candidates);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().copied.size() == 1);
    REQUIRE(r.value().removed.size() == 1);
}

TEST_CASE("unpacked directory counts as the deployed copy", "[deployer]") {
    DeployFixture f;
    f.repo.write_artifact("com.example", "widget", "1.0", ".aar");
    fs::create_directories(f.dest / "widget-1.0" / "res");

    auto r = f.copy(DeployFixture::map_of({f.resolved("widget", "1.0")}));
    REQUIRE(r.is_ok());
    REQUIRE(r.value().up_to_date.size() == 1);
    REQUIRE_FALSE(fs::exists(f.dest / "widget-1.0.aar"));
}

TEST_CASE("missing source artifact is a dependency error", "[deployer]") {
    DeployFixture f;
    auto r = f.copy(DeployFixture::map_of({f.resolved("ghost", "1.0")}));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == DepotError::Dependency);
}

// ===== Stale versions =====

TEST_CASE("approved replacement removes the old version", "[deployer]") {
    DeployFixture f;
    f.repo.write_artifact("com.example", "foo", "1.1.0", ".aar");
    fs::create_directories(f.dest);
    f.td.write_file("libs/foo-1.0.0.aar", "old");
    fs::create_directories(f.dest / "foo-1.0.0");

    int asked = 0;
    std::string old_version;
    auto r = f.copy(DeployFixture::map_of({f.resolved("foo", "1.1.0")}),
                    [&](const Dependency& old_dep, const Dependency& new_dep) {
                        ++asked;
                        old_version = old_dep.best_version();
                        REQUIRE(new_dep.best_version() == "1.1.0");
                        return true;
                    });
    REQUIRE(r.is_ok());
    REQUIRE(asked == 1);
    REQUIRE(old_version == "1.0.0");
    REQUIRE_FALSE(fs::exists(f.dest / "foo-1.0.0.aar"));
    REQUIRE_FALSE(fs::exists(f.dest / "foo-1.0.0"));
    REQUIRE(fs::is_regular_file(f.dest / "foo-1.1.0.aar"));
    REQUIRE(r.value().removed.size() == 2);
}

TEST_CASE("declined replacement leaves the destination alone", "[deployer]") {
    DeployFixture f;
    f.repo.write_artifact("com.example", "foo", "1.1.0", ".aar");
    f.td.write_file("libs/foo-1.0.0.aar", "old");

    int asked = 0;
    auto r = f.copy(DeployFixture::map_of({f.resolved("foo", "1.1.0")}),
                    [&](const Dependency&, const Dependency&) {
                        ++asked;
                        return false;
                    });
    REQUIRE(r.is_ok());
    REQUIRE(asked == 1);
    REQUIRE(fs::exists(f.dest / "foo-1.0.0.aar"));
    REQUIRE_FALSE(fs::exists(f.dest / "foo-1.1.0.aar"));
    REQUIRE(r.value().declined == std::vector<std::string>{"com.example:foo:1.1.0"});
    REQUIRE(f.sink.count(log::Info) == 1);
}

TEST_CASE("no callback replaces without asking", "[deployer]") {
    DeployFixture f;
    f.repo.write_artifact("com.example", "foo", "1.1.0", ".aar");
    f.td.write_file("libs/foo-1.0.0.aar", "old");

    auto r = f.copy(DeployFixture::map_of({f.resolved("foo", "1.1.0")}));
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(fs::exists(f.dest / "foo-1.0.0.aar"));
    REQUIRE(fs::is_regular_file(f.dest / "foo-1.1.0.aar"));
}

TEST_CASE("similarly named artifacts are left alone", "[deployer]") {
    DeployFixture f;
    f.repo.write_artifact("com.example", "foo", "1.1.0", ".aar");
    f.td.write_file("libs/foo-bar-1.0.0.aar", "other");
    f.td.write_file("libs/foobar-1.0.0.aar", "other");

    int asked = 0;
    auto r = f.copy(DeployFixture::map_of({f.resolved("foo", "1.1.0")}),
                    [&](const Dependency&, const Dependency&) {
                        ++asked;
                        return true;
                    });
    REQUIRE(r.is_ok());
    REQUIRE(asked == 0);
    REQUIRE(fs::exists(f.dest / "foo-bar-1.0.0.aar"));
    REQUIRE(fs::exists(f.dest / "foobar-1.0.0.aar"));
}

// ===== remove_path =====

TEST_CASE("remove_path deletes read-only trees", "[deployer]") {
    TempDir td("depot_deploy");
    td.write_file("tree/sub/file.txt", "x");
    fs::permissions(td.path / "tree" / "sub" / "file.txt", fs::perms::owner_read);
    fs::permissions(td.path / "tree" / "sub",
                    fs::perms::owner_read | fs::perms::owner_exec);

    REQUIRE(ArtifactDeployer::remove_path(td.path / "tree").is_ok());
    REQUIRE_FALSE(fs::exists(td.path / "tree"));
}

TEST_CASE("remove_path of a missing path succeeds", "[deployer]") {
    TempDir td("depot_deploy");
    REQUIRE(ArtifactDeployer::remove_path(td.path / "nothing").is_ok());
}
