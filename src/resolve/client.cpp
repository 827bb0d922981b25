#include <depot/client.hpp>
#include <depot/glob.hpp>
#include <depot/settings.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace depot {

namespace fs = std::filesystem;

static const char* const kFilePrefix = "Dependencies-";
static const char* const kFileSuffix = ".toml";

Client::Client(std::string name, std::string settings_dir, RepositoryScanner scanner)
    : name_(std::move(name)),
      settings_dir_(std::move(settings_dir)),
      scanner_(std::move(scanner)) {}

bool Client::is_valid_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '.' || c == '_' || c == '-';
    });
}

Result<Client> Client::create(const std::string& name,
                              const std::string& sdk_path,
                              const std::vector<std::string>& extra_repositories,
                              const std::string& settings_dir) {
    if (!is_valid_name(name)) {
        return DepotError{DepotError::InvalidArg,
            "invalid client name '" + name + "'",
            "client names may only contain letters, digits, '.', '_' and '-'"};
    }

    std::vector<std::string> roots = default_repository_roots();
    roots.insert(roots.end(), extra_repositories.begin(), extra_repositories.end());
    RepositoryScanner scanner(std::move(roots),
                              sdk_path.empty() ? sdk_from_environment() : sdk_path);

    Client client(name, settings_dir, std::move(scanner));
    auto own = client.load_dependencies(false, true);
    if (own.is_err()) return std::move(own).error();
    client.dependencies_ = std::move(own).value();
    return Result<Client>::ok(std::move(client));
}

Result<Client> Client::create(const std::string& name,
                              const Config& config,
                              const std::string& settings_dir) {
    if (!is_valid_name(name)) {
        return DepotError{DepotError::InvalidArg,
            "invalid client name '" + name + "'",
            "client names may only contain letters, digits, '.', '_' and '-'"};
    }

    Client client(name, settings_dir,
                  RepositoryScanner(config.repository_roots(), config.sdk_path()));
    auto own = client.load_dependencies(false, true);
    if (own.is_err()) return std::move(own).error();
    client.dependencies_ = std::move(own).value();
    return Result<Client>::ok(std::move(client));
}

std::string Client::dependency_file() const {
    return (fs::path(settings_dir_) / (kFilePrefix + name_ + kFileSuffix)).string();
}

// ---------------------------------------------------------------------------
// Declarations
// ---------------------------------------------------------------------------

Status Client::depend_on(const std::string& group,
                         const std::string& artifact,
                         const std::string& version,
                         const std::vector<std::string>& package_ids,
                         const std::vector<std::string>& repositories) {
    log::debug("%s depends on %s:%s:%s", name_.c_str(),
               group.c_str(), artifact.c_str(), version.c_str());

    Dependency declared(group, artifact, version, package_ids, repositories);
    auto found = scanner_.find_candidate(declared);
    if (found.is_err()) return std::move(found).error();
    Dependency dep = found.value().has_value() ? std::move(*found.value()) : declared;

    auto same_key = [&](const Dependency& d) { return d.key() == dep.key(); };
    auto it = std::find_if(dependencies_.begin(), dependencies_.end(), same_key);
    if (it != dependencies_.end()) {
        *it = std::move(dep);
    } else {
        dependencies_.push_back(std::move(dep));
    }

    return persist();
}

Status Client::clear_dependencies() {
    DEPOT_TRY(ArtifactDeployer::remove_path(dependency_file()));
    auto own = load_dependencies(false, true);
    if (own.is_err()) return std::move(own).error();
    dependencies_ = std::move(own).value();
    return ok_status();
}

Status Client::reset() {
    auto files = glob_entries(settings_dir_, std::string(kFilePrefix) + "*" + kFileSuffix);
    if (files.is_err()) return std::move(files).error();
    for (const auto& file : files.value()) {
        DEPOT_TRY(ArtifactDeployer::remove_path(file));
    }
    return clear_dependencies();
}

Status Client::persist() const {
    DependencySet set;
    set.client = name_;
    for (const auto& dep : dependencies_) {
        DependencyRecord rec;
        rec.group_id = dep.group();
        rec.artifact_id = dep.artifact();
        rec.version = dep.version();
        rec.package_ids = dep.package_ids();
        rec.repositories = dep.repositories();
        set.records.push_back(std::move(rec));
    }
    return set.save(dependency_file());
}

// ---------------------------------------------------------------------------
// Loading
// ---------------------------------------------------------------------------

Result<std::vector<Dependency>> Client::load_dependencies(bool all_clients,
                                                          bool keep_missing) {
    std::vector<std::string> files;
    if (all_clients) {
        auto found = glob_entries(settings_dir_,
                                  std::string(kFilePrefix) + "*" + kFileSuffix);
        if (found.is_err()) return std::move(found).error();
        for (const auto& f : found.value()) files.push_back(f.string());
    } else {
        files.push_back(dependency_file());
    }

    std::vector<Dependency> deps;
    for (const auto& file : files) {
        std::error_code ec;
        if (!fs::is_regular_file(file, ec)) continue;
        DEPOT_TRY(read_file(file, keep_missing, deps));
    }
    return Result<std::vector<Dependency>>::ok(std::move(deps));
}

Status Client::read_file(const std::string& path, bool keep_missing,
                         std::vector<Dependency>& into) {
    auto set = DependencySet::load(path);
    if (set.is_err()) return std::move(set).error();

    for (const auto& rec : set.value().records) {
        Dependency declared(rec.group_id, rec.artifact_id, rec.version,
                            rec.package_ids, rec.repositories);
        for (const auto& repo : rec.repositories) {
            scanner_.add_repository(repo);
        }

        auto found = scanner_.find_candidate(declared);
        if (found.is_err()) return std::move(found).error();

        Dependency dep = declared;
        if (found.value().has_value()) {
            dep = std::move(*found.value());
        } else if (!keep_missing) {
            return DepotError{DepotError::Dependency,
                "cannot find candidate artifact for " + declared.key(),
                "declared in " + path};
        }

        bool seen = std::any_of(into.begin(), into.end(),
            [&](const Dependency& d) { return d.key() == dep.key(); });
        if (!seen) into.push_back(std::move(dep));
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Resolution and deployment
// ---------------------------------------------------------------------------

Result<CandidateMap> Client::resolve_dependencies(bool use_latest, log::Sink& sink) {
    ResolveOptions options;
    options.use_latest = use_latest;
    return resolve_dependencies(options, sink);
}

Result<CandidateMap> Client::resolve_dependencies(const ResolveOptions& options,
                                                  log::Sink& sink) {
    auto declared = load_dependencies(true, false);
    if (declared.is_err()) return std::move(declared).error();

    ResolutionEngine engine(scanner_, sink);
    return engine.resolve(declared.value(), options);
}

Result<DeployReport> Client::copy_dependencies(const CandidateMap& candidates,
                                               const std::string& dest_dir,
                                               const ConfirmOverwrite& confirm,
                                               log::Sink& sink) const {
    ArtifactDeployer deployer(sink);
    return deployer.copy(candidates, dest_dir, confirm);
}

} // namespace depot
