#pragma once

#include <depot/result.hpp>
#include <depot/config.hpp>
#include <depot/dependency.hpp>
#include <depot/deployer.hpp>
#include <depot/log.hpp>
#include <depot/resolver.hpp>
#include <depot/scanner.hpp>

#include <string>
#include <vector>

namespace depot {

// A named consumer of dependencies (a plugin, a module, the app itself).
//
// Each client's declared dependencies are persisted to
// <settings_dir>/Dependencies-<name>.toml as soon as they change.
// resolve_dependencies() covers the files of every client in settings_dir.
class Client {
public:
    // sdk_path empty means $ANDROID_HOME. The SDK default repositories are
    // searched before extra_repositories.
    static Result<Client> create(const std::string& name,
                                 const std::string& sdk_path,
                                 const std::vector<std::string>& extra_repositories,
                                 const std::string& settings_dir);

    static Result<Client> create(const std::string& name,
                                 const Config& config,
                                 const std::string& settings_dir);

    // Letters, digits, '.', '_' and '-' only
    static bool is_valid_name(const std::string& name);

    const std::string& name() const { return name_; }
    const std::string& settings_dir() const { return settings_dir_; }
    std::string dependency_file() const;

    // This client's declared dependencies, in declaration order
    const std::vector<Dependency>& dependencies() const { return dependencies_; }

    RepositoryScanner& scanner() { return scanner_; }
    const RepositoryScanner& scanner() const { return scanner_; }

    // Declare a dependency. `version` may be exact ("1.2"), open-ended
    // ("1.2+") or "LATEST". Persisted immediately.
    Status depend_on(const std::string& group,
                     const std::string& artifact,
                     const std::string& version,
                     const std::vector<std::string>& package_ids = {},
                     const std::vector<std::string>& repositories = {});

    // Forget this client's declarations and delete its file
    Status clear_dependencies();

    // Delete every client's dependency file in the settings directory
    Status reset();

    // Declarations of this client or of every client, each bound to an
    // installed candidate. A declaration with no candidate is kept unbound
    // when keep_missing is set and is an error otherwise.
    Result<std::vector<Dependency>> load_dependencies(bool all_clients,
                                                      bool keep_missing);

    // Resolve every client's declarations together
    Result<CandidateMap> resolve_dependencies(bool use_latest,
                                              log::Sink& sink = log::default_sink());
    Result<CandidateMap> resolve_dependencies(const ResolveOptions& options,
                                              log::Sink& sink = log::default_sink());

    Result<DeployReport> copy_dependencies(const CandidateMap& candidates,
                                           const std::string& dest_dir,
                                           const ConfirmOverwrite& confirm = {},
                                           log::Sink& sink = log::default_sink()) const;

private:
    Client(std::string name, std::string settings_dir, RepositoryScanner scanner);

    std::string name_;
    std::string settings_dir_;
    RepositoryScanner scanner_;
    std::vector<Dependency> dependencies_;

    Status persist() const;
    Status read_file(const std::string& path, bool keep_missing,
                     std::vector<Dependency>& into);
};

} // namespace depot
