#include <depot/scanner.hpp>
#include <depot/config.hpp>
#include <depot/log.hpp>
#include <depot/maven.hpp>
#include <depot/swap.hpp>

#include <algorithm>
#include <filesystem>

namespace depot {

namespace fs = std::filesystem;

RepositoryScanner::RepositoryScanner(std::vector<std::string> roots,
                                     std::string sdk_path)
    : sdk_path_(std::move(sdk_path)) {
    for (const auto& root : roots) {
        add_repository(root);
    }
}

void RepositoryScanner::add_repository(const std::string& root) {
    if (root.empty()) return;
    if (std::find(roots_.begin(), roots_.end(), root) == roots_.end()) {
        roots_.push_back(root);
    }
}

Result<std::string> RepositoryScanner::expand_root(const std::string& root) const {
    auto vars = swap_variables(root);
    if (vars.empty()) return Result<std::string>::ok(root);

    bool needs_sdk = std::find(vars.begin(), vars.end(), kSdkVariable) != vars.end();
    if (needs_sdk && sdk_path_.empty()) {
        return DepotError{DepotError::Config,
            "Android SDK path not set, required by repository '" + root + "'",
            kSdkConfigurationHint};
    }

    auto expanded = swap_template(root, SwapMap{{kSdkVariable, sdk_path_}});
    if (expanded.is_err()) {
        auto err = std::move(expanded).error();
        return DepotError{DepotError::Config,
            "invalid repository path: " + err.message, err.hint};
    }
    return expanded;
}

// ---------------------------------------------------------------------------
// find_candidate()
// ---------------------------------------------------------------------------

Result<std::optional<Dependency>> RepositoryScanner::find_candidate(
    const Dependency& dep) const
{
    std::vector<std::string> search = roots_;
    for (const auto& repo : dep.repositories()) {
        if (std::find(search.begin(), search.end(), repo) == search.end()) {
            search.push_back(repo);
        }
    }

    for (const auto& root : search) {
        auto path = expand_root(root);
        if (path.is_err()) return std::move(path).error();

        std::error_code ec;
        if (!fs::is_directory(path.value(), ec)) {
            log::debug("repository not found: %s", path.value().c_str());
            continue;
        }

        auto found = find_in_root(path.value(), dep);
        if (found.is_err()) return std::move(found).error();
        if (found.value().has_value()) return found;
    }

    std::string roots_list;
    for (size_t i = 0; i < search.size(); ++i) {
        if (i > 0) roots_list += ", ";
        roots_list += search[i];
    }
    log::error("unable to find dependency %s in (%s)",
               dep.key().c_str(), roots_list.c_str());
    return Result<std::optional<Dependency>>::ok(std::nullopt);
}

Result<std::optional<Dependency>> RepositoryScanner::find_in_root(
    const std::string& root, const Dependency& dep) const
{
    fs::path metadata = fs::path(root) / dep.relative_path() / kMetadataFile;
    std::error_code ec;
    if (!fs::is_regular_file(metadata, ec)) {
        return Result<std::optional<Dependency>>::ok(std::nullopt);
    }

    auto versions = read_metadata_versions(metadata.string());
    if (versions.is_err()) return std::move(versions).error();

    Dependency candidate = dep;
    for (const auto& v : versions.value()) {
        candidate.add_version(v);
    }
    candidate.set_repo_path(root);

    if (!settle(candidate)) {
        log::debug("%s: no installed version in %s", dep.key().c_str(), root.c_str());
        return Result<std::optional<Dependency>>::ok(std::nullopt);
    }
    return Result<std::optional<Dependency>>::ok(std::move(candidate));
}

// ---------------------------------------------------------------------------
// settle()
// ---------------------------------------------------------------------------

bool RepositoryScanner::settle(Dependency& dep) const {
    while (dep.has_possible_versions()) {
        if (find_artifact_file(dep)) return true;
        log::debug("%s version %s not available, ignoring",
                   dep.key().c_str(), dep.best_version().c_str());
        dep.remove_possible_version(dep.best_version());
    }
    return false;
}

// ---------------------------------------------------------------------------
// transitive_dependencies()
// ---------------------------------------------------------------------------

Result<std::vector<Dependency>> RepositoryScanner::transitive_dependencies(
    const Dependency& dep) const
{
    std::vector<Dependency> result;
    if (dep.best_version().empty()) {
        log::error("no compatible versions of %s given the set of dependencies",
                   dep.key().c_str());
        return Result<std::vector<Dependency>>::ok(std::move(result));
    }

    std::string pom = pom_path(dep);
    std::error_code ec;
    if (!fs::is_regular_file(pom, ec)) {
        log::debug("%s has no POM, assuming no dependencies", dep.resolved_key().c_str());
        return Result<std::vector<Dependency>>::ok(std::move(result));
    }

    auto entries = read_pom_dependencies(pom);
    if (entries.is_err()) return std::move(entries).error();

    for (const auto& pd : entries.value()) {
        if (pd.scope == "test" || pd.optional) {
            log::trace("%s: skipping %s:%s (%s)", dep.resolved_key().c_str(),
                       pd.group_id.c_str(), pd.artifact_id.c_str(),
                       pd.optional ? "optional" : "test scope");
            continue;
        }

        // POMs carry no SDK package ids
        Dependency wanted(pd.group_id, pd.artifact_id,
                          pom_version_constraint(pd.version));
        auto found = find_candidate(wanted);
        if (found.is_err()) return std::move(found).error();
        if (!found.value().has_value()) {
            return DepotError{DepotError::Dependency,
                "cannot find candidate artifact for " + wanted.key(),
                "required by " + dep.resolved_key()};
        }
        result.push_back(std::move(*found.value()));
    }

    return Result<std::vector<Dependency>>::ok(std::move(result));
}

} // namespace depot
