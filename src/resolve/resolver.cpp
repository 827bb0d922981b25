#include <depot/resolver.hpp>

#include <set>
#include <unordered_set>

namespace depot {

namespace {

// Dependencies queued for one pass, unique by key()
class Worklist {
public:
    bool add(const Dependency& dep) {
        if (!keys_.insert(dep.key()).second) return false;
        entries_.push_back(dep);
        return true;
    }

    bool contains(const std::string& key) const { return keys_.count(key) > 0; }
    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }

    std::vector<Dependency> take() {
        std::vector<Dependency> out;
        out.swap(entries_);
        keys_.clear();
        return out;
    }

private:
    std::vector<Dependency> entries_;
    std::unordered_set<std::string> keys_;
};

std::string join(const std::set<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ", ";
        out += item;
    }
    return out;
}

// State of one resolve() call
class Resolution {
public:
    Resolution(const RepositoryScanner& scanner, log::Sink& sink,
               const ResolveOptions& options)
        : scanner_(scanner), sink_(sink), options_(options) {}

    Result<CandidateMap> run(const std::vector<Dependency>& declared);

private:
    const RepositoryScanner& scanner_;
    log::Sink& sink_;
    const ResolveOptions& options_;

    std::vector<Dependency> declared_;
    CandidateMap candidates_;
    // versionless key -> resolved keys of the artifacts whose POM asked for it
    std::map<std::string, std::set<std::string>> required_by_;
    std::set<std::string> expanded_;
    std::set<std::string> warned_;

    Status visit(const Dependency& entry, Worklist& next);
    Status resolve_conflict(const Dependency& entry, Dependency& candidate,
                            Worklist& next);
    Status accept(const Dependency& candidate, Worklist& next);

    bool refine_candidate(const Dependency& entry, Dependency& candidate) const;
    bool refine_entry(const Dependency& entry, Dependency& candidate);
    void requeue_declared(const std::string& versionless_key, Worklist& next) const;
    void warn_widened(const Dependency& winner);
};

Result<CandidateMap> Resolution::run(const std::vector<Dependency>& declared) {
    Worklist seed;
    for (const auto& dep : declared) {
        if (seed.add(dep)) declared_.push_back(dep);
    }

    std::vector<Dependency> pending = seed.take();
    int pass = 0;
    while (!pending.empty()) {
        if (++pass > options_.max_passes) {
            return DepotError{DepotError::Dependency,
                "dependency resolution did not converge after " +
                std::to_string(options_.max_passes) + " passes",
                "this is a bug; rerun with log level 'debug' and report the output"};
        }
        log::debug("resolution pass %d: %zu unresolved", pass, pending.size());

        Worklist next;
        for (const auto& entry : pending) {
            DEPOT_TRY(visit(entry, next));
        }
        pending = next.take();
    }

    log::debug("resolved %zu artifacts in %d passes", candidates_.size(), pass);
    return Result<CandidateMap>::ok(std::move(candidates_));
}

Status Resolution::visit(const Dependency& entry, Worklist& next) {
    auto it = candidates_.find(entry.versionless_key());

    if (it == candidates_.end()) {
        auto found = scanner_.find_candidate(entry);
        if (found.is_err()) return std::move(found).error();
        if (!found.value().has_value()) {
            return DepotError{DepotError::Dependency,
                "cannot resolve " + entry.key(),
                "add a repository that provides it or relax the version constraint"};
        }
        auto inserted = candidates_.emplace(entry.versionless_key(),
                                            std::move(*found.value()));
        return accept(inserted.first->second, next);
    }

    Dependency& candidate = it->second;
    if (entry.is_acceptable_version(candidate.best_version())) {
        // Prefer the newer of two compatible requests
        if (entry.is_newer(candidate) &&
            candidate.is_acceptable_version(entry.best_version())) {
            log::debug("%s: candidate %s replaced by %s",
                       entry.versionless_key().c_str(),
                       candidate.best_version().c_str(),
                       entry.best_version().c_str());
            candidate = entry;
        }
        return accept(candidate, next);
    }

    return resolve_conflict(entry, candidate, next);
}

Status Resolution::resolve_conflict(const Dependency& entry, Dependency& candidate,
                                    Worklist& next) {
    bool entry_open = entry.spec().open_ended;
    bool candidate_open = candidate.spec().open_ended;

    // The older open-ended side moves first, then any open-ended side.
    bool entry_first = entry_open && candidate.is_newer(entry);
    bool refined = entry_first && refine_entry(entry, candidate);
    bool refined_entry = refined;
    if (!refined && candidate_open) {
        refined = refine_candidate(entry, candidate);
    }
    if (!refined && entry_open && !entry_first) {
        refined = refined_entry = refine_entry(entry, candidate);
    }

    if (refined) {
        log::debug("%s narrowed to %s", candidate.versionless_key().c_str(),
                   candidate.best_version().c_str());
        requeue_declared(candidate.versionless_key(), next);
        next.add(refined_entry ? candidate : entry);
        return ok_status();
    }

    if (!options_.use_latest) {
        return DepotError{DepotError::Dependency,
            "cannot resolve " + entry.to_string() + " and " + candidate.to_string(),
            "align the version constraints or resolve with use-latest enabled"};
    }

    Dependency winner = entry.is_newer(candidate) ? entry : candidate;
    if (!winner.has_possible_versions()) {
        // Evicted versions stay evicted on that instance; scan with a fresh one
        Dependency fresh(winner.group(), winner.artifact(), winner.version(),
                         winner.package_ids(), winner.repositories());
        auto found = scanner_.find_candidate(fresh);
        if (found.is_err()) return std::move(found).error();
        if (!found.value().has_value()) {
            return DepotError{DepotError::Dependency,
                "cannot resolve " + fresh.key()};
        }
        winner = std::move(*found.value());
    }

    candidate = std::move(winner);
    warn_widened(candidate);
    return accept(candidate, next);
}

bool Resolution::refine_candidate(const Dependency& entry, Dependency& candidate) const {
    Dependency narrowed = candidate;
    if (!narrowed.refine_version_range(entry)) return false;
    if (!scanner_.settle(narrowed)) return false;
    candidate = std::move(narrowed);
    return true;
}

bool Resolution::refine_entry(const Dependency& entry, Dependency& candidate) {
    Dependency narrowed = entry;
    if (!narrowed.refine_version_range(candidate)) return false;
    if (!scanner_.settle(narrowed)) return false;

    for (auto& d : declared_) {
        if (d.key() == narrowed.key()) d = narrowed;
    }
    candidate = std::move(narrowed);
    return true;
}

void Resolution::requeue_declared(const std::string& versionless_key,
                                  Worklist& next) const {
    for (const auto& d : declared_) {
        if (d.versionless_key() == versionless_key) next.add(d);
    }
}

Status Resolution::accept(const Dependency& candidate, Worklist& next) {
    // A concrete version's POM only needs reading once per call
    if (!expanded_.insert(candidate.resolved_key()).second) return ok_status();

    auto transitive = scanner_.transitive_dependencies(candidate);
    if (transitive.is_err()) return std::move(transitive).error();

    for (auto& dep : transitive.value()) {
        if (next.contains(dep.key())) continue;
        log::debug("for %s adding dep %s",
                   candidate.resolved_key().c_str(), dep.key().c_str());
        required_by_[dep.versionless_key()].insert(candidate.resolved_key());
        next.add(dep);
    }
    return ok_status();
}

void Resolution::warn_widened(const Dependency& winner) {
    const std::string key = winner.versionless_key();
    if (!warned_.insert(key).second) return;

    std::string required_by = key + " required by (this app)";
    std::string chain;
    for (const auto& [dep_key, parents] : required_by_) {
        std::string line = dep_key + " required by (" + join(parents) + ")";
        if (dep_key == key) required_by = line;
        chain += "\n    " + line;
    }

    std::string message = "no compatible versions of " + required_by +
                          ", will try using the latest version " +
                          winner.best_version();
    if (!chain.empty()) {
        message += "\n  found dependencies:" + chain;
    }
    sink_.write(log::Warn, message);
}

} // namespace

ResolutionEngine::ResolutionEngine(const RepositoryScanner& scanner, log::Sink& sink)
    : scanner_(scanner), sink_(sink) {}

Result<CandidateMap> ResolutionEngine::resolve(const std::vector<Dependency>& declared,
                                               const ResolveOptions& options) const {
    Resolution resolution(scanner_, sink_, options);
    return resolution.run(declared);
}

} // namespace depot
