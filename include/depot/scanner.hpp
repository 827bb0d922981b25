#pragma once

#include <depot/result.hpp>
#include <depot/dependency.hpp>
#include <optional>
#include <string>
#include <vector>

namespace depot {

// Searches local Maven repositories for installed versions of a dependency.
//
// Roots are searched in registration order, then the dependency's own
// repositories. A root may reference {{ sdk }}, which is substituted with the
// SDK path at the moment the root is searched.
class RepositoryScanner {
public:
    explicit RepositoryScanner(std::vector<std::string> roots = {},
                               std::string sdk_path = {});

    // Appends a root unless already registered
    void add_repository(const std::string& root);
    const std::vector<std::string>& repositories() const { return roots_; }

    void set_sdk_path(std::string path) { sdk_path_ = std::move(path); }
    const std::string& sdk_path() const { return sdk_path_; }

    // Copy of dep bound to the first root holding a version that satisfies
    // its constraint and has a packaged artifact on disk. Empty if no root
    // does. Fails if a root needs the SDK path and none is set.
    Result<std::optional<Dependency>> find_candidate(const Dependency& dep) const;

    // Evict possible versions, best first, until the best one has a
    // packaged artifact. Returns false when nothing is left.
    bool settle(Dependency& dep) const;

    // Dependencies declared by the POM of dep's best version, each bound to
    // an installed candidate. Test-scoped and optional entries are skipped.
    Result<std::vector<Dependency>> transitive_dependencies(const Dependency& dep) const;

    // Root with {{ sdk }} substituted
    Result<std::string> expand_root(const std::string& root) const;

private:
    std::vector<std::string> roots_;
    std::string sdk_path_;

    Result<std::optional<Dependency>> find_in_root(const std::string& root,
                                                   const Dependency& dep) const;
};

} // namespace depot
