#pragma once

#include <depot/result.hpp>
#include <depot/dependency.hpp>
#include <optional>
#include <string>
#include <vector>

namespace depot {

// File name of the per-artifact version listing
inline constexpr const char* kMetadataFile = "maven-metadata.xml";

// Packaging extensions searched in order. ".srcaar" is an AAR published under
// a name build tools ignore; it is deployed as ".aar".
const std::vector<std::string>& packaging_extensions();

// One <dependency> entry of a POM
struct PomDependency {
    std::string group_id;
    std::string artifact_id;
    std::string version;
    std::string scope;
    bool optional = false;
};

// Versions listed under <versioning><versions> in maven-metadata.xml, in file order
Result<std::vector<std::string>> read_metadata_versions(const std::string& path);

// Entries of <project><dependencies>. <dependencyManagement> is not read.
Result<std::vector<PomDependency>> read_pom_dependencies(const std::string& path);

// Turn a POM version into a constraint: "[1.2]" pins 1.2, a missing version
// means any.
std::string pom_version_constraint(const std::string& pom_version);

// <best_version_path>/<artifact>-<best_version><ext> for the first packaging
// extension that exists on disk
std::optional<std::string> find_artifact_file(const Dependency& dep);

// <best_version_path>/<artifact>-<best_version>.pom
std::string pom_path(const Dependency& dep);

} // namespace depot
