#pragma once

#include <depot/version.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace depot {

// One Maven coordinate requested by a client or by another artifact's POM.
//
// Identity is (group, artifact). The declared constraint never changes; what
// resolution mutates is the set of possible versions discovered in a
// repository and the bounds narrowed by refine_version_range().
class Dependency {
public:
    using VersionSet = std::set<std::string, VersionLess>;

    Dependency() = default;
    Dependency(std::string group, std::string artifact, std::string version,
               std::vector<std::string> package_ids = {},
               std::vector<std::string> repositories = {});

    const std::string& group() const { return group_; }
    const std::string& artifact() const { return artifact_; }
    const std::string& version() const { return version_; }
    const VersionSpec& spec() const { return spec_; }
    const std::vector<std::string>& package_ids() const { return package_ids_; }
    const std::vector<std::string>& repositories() const { return repositories_; }

    // group:artifact:<declared constraint>
    std::string key() const;
    // group:artifact
    std::string versionless_key() const;
    // group:artifact:<best version>, or key() while nothing is resolved
    std::string resolved_key() const;

    // Repository root the possible versions were read from
    const std::string& repo_path() const { return repo_path_; }
    void set_repo_path(std::string path) { repo_path_ = std::move(path); }

    // <group with '.' replaced by '/'>/<artifact>
    std::string relative_path() const;

    const VersionSet& possible_versions() const { return possible_; }

    // Greatest acceptable possible version, empty if there is none
    std::string best_version() const;
    // <repo_path>/<relative_path>/<best_version>
    std::string best_version_path() const;

    void add_version(const std::string& v);
    void remove_possible_version(const std::string& v);
    bool has_possible_versions() const { return !possible_.empty(); }
    bool is_acceptable_version(const std::string& v) const;

    // Narrow an open-ended constraint to the possible versions `other`
    // accepts. Returns false, leaving this untouched, if the constraint is
    // not open-ended or nothing would remain.
    bool refine_version_range(const Dependency& other);

    // Compares best versions, falling back to the declared constraint for
    // an unresolved side.
    bool is_newer(const Dependency& other) const;

    std::string to_string() const;

private:
    std::string group_;
    std::string artifact_;
    std::string version_;
    VersionSpec spec_;
    std::vector<std::string> package_ids_;
    std::vector<std::string> repositories_;
    std::string repo_path_;

    VersionSet possible_;
    VersionSet removed_;
    std::optional<VersionSpec> floor_;
    std::optional<VersionSpec> ceiling_;

    bool within_bounds(const VersionSpec& v) const;
    VersionSpec effective_version() const;
};

} // namespace depot
