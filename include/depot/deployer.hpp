#pragma once

#include <depot/result.hpp>
#include <depot/dependency.hpp>
#include <depot/log.hpp>
#include <depot/resolver.hpp>

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace depot {

// Asked before stale copies of an artifact are removed from the destination.
// Return true to replace old_dep with new_dep.
using ConfirmOverwrite =
    std::function<bool(const Dependency& old_dep, const Dependency& new_dep)>;

struct DeployReport {
    std::vector<std::string> copied;      // destination paths written
    std::vector<std::string> removed;     // stale entries deleted
    std::vector<std::string> up_to_date;  // resolved keys left as they were
    std::vector<std::string> declined;    // resolved keys whose replacement was refused
};

// Copies resolved artifacts into a flat destination directory, keeping at most
// one version of each artifact there.
class ArtifactDeployer {
public:
    explicit ArtifactDeployer(log::Sink& sink = log::default_sink());

    Result<DeployReport> copy(const CandidateMap& candidates,
                              const std::string& dest_dir,
                              const ConfirmOverwrite& confirm = {}) const;

    // Version embedded in a destination entry name for artifact, e.g.
    // "foo-1.2.3-alpha.aar" -> "1.2.3". Empty if the name carries none.
    static std::string embedded_version(const std::string& artifact,
                                        const std::filesystem::path& entry);

    // Delete a file or a directory tree, clearing read-only permissions first
    static Status remove_path(const std::filesystem::path& path);

private:
    log::Sink& sink_;

    Status deploy_one(const Dependency& dep, const std::filesystem::path& dest,
                      const ConfirmOverwrite& confirm, DeployReport& report) const;
};

} // namespace depot
