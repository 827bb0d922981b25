#pragma once

#include <depot/result.hpp>
#include <string>
#include <vector>

namespace depot {

// One declared dependency as stored on disk. `version` is the constraint the
// client asked for, never a resolved version.
struct DependencyRecord {
    std::string group_id;
    std::string artifact_id;
    std::string version;
    std::vector<std::string> package_ids;
    std::vector<std::string> repositories;
};

// Contents of a client's dependency file (TOML):
//
//   client = "my-plugin"
//
//   [[dependency]]
//   groupId = "com.android.support"
//   artifactId = "appcompat-v7"
//   version = "23.0+"
//   packageIds = "extra-android-m2repository"
//   repositories = "/opt/m2 /srv/m2"
struct DependencySet {
    std::string client;
    std::vector<DependencyRecord> records;

    // Records missing groupId, artifactId or version are skipped with a warning
    static Result<DependencySet> load(const std::string& path);
    static Result<DependencySet> parse(const std::string& toml_str,
                                       const std::string& filename = "<input>");

    // Written in record order, replacing any existing file
    Status save(const std::string& path) const;
};

} // namespace depot
