#include <depot/dependency.hpp>
#include <filesystem>

namespace depot {

namespace fs = std::filesystem;

Dependency::Dependency(std::string group, std::string artifact, std::string version,
                       std::vector<std::string> package_ids,
                       std::vector<std::string> repositories)
    : group_(std::move(group)),
      artifact_(std::move(artifact)),
      version_(std::move(version)),
      spec_(VersionSpec::parse(version_)),
      package_ids_(std::move(package_ids)),
      repositories_(std::move(repositories)) {}

std::string Dependency::key() const {
    return group_ + ":" + artifact_ + ":" + version_;
}

std::string Dependency::versionless_key() const {
    return group_ + ":" + artifact_;
}

std::string Dependency::resolved_key() const {
    std::string best = best_version();
    if (best.empty()) return key();
    return group_ + ":" + artifact_ + ":" + best;
}

std::string Dependency::relative_path() const {
    std::string path = group_;
    for (char& c : path) {
        if (c == '.') c = '/';
    }
    return path + "/" + artifact_;
}

std::string Dependency::best_version() const {
    if (possible_.empty()) return "";
    return *possible_.rbegin();
}

std::string Dependency::best_version_path() const {
    return (fs::path(repo_path_) / relative_path() / best_version()).string();
}

bool Dependency::within_bounds(const VersionSpec& v) const {
    if (floor_ && v < *floor_) return false;
    if (ceiling_ && v > *ceiling_) return false;
    return true;
}

void Dependency::add_version(const std::string& v) {
    if (removed_.count(v)) return;
    VersionSpec candidate = VersionSpec::parse(v);
    if (!spec_.satisfied_by(candidate) || !within_bounds(candidate)) return;
    possible_.insert(v);
}

void Dependency::remove_possible_version(const std::string& v) {
    possible_.erase(v);
    removed_.insert(v);
}

bool Dependency::is_acceptable_version(const std::string& v) const {
    VersionSpec candidate = VersionSpec::parse(v);
    if (spec_.latest) {
        return !possible_.empty() &&
               compare(candidate, VersionSpec::parse(best_version())) == Ordering::Equal;
    }
    return spec_.satisfied_by(candidate) && within_bounds(candidate);
}

bool Dependency::refine_version_range(const Dependency& other) {
    if (!spec_.open_ended) return false;

    VersionSet narrowed;
    for (const auto& v : possible_) {
        if (other.is_acceptable_version(v)) narrowed.insert(v);
    }
    if (narrowed.empty()) return false;

    VersionSpec lowest = VersionSpec::parse(*narrowed.begin());
    VersionSpec highest = VersionSpec::parse(*narrowed.rbegin());
    bool dropped_below = false;
    bool dropped_above = false;
    for (const auto& v : possible_) {
        if (narrowed.count(v)) continue;
        VersionSpec dropped = VersionSpec::parse(v);
        if (dropped < lowest) dropped_below = true;
        if (dropped > highest) dropped_above = true;
    }

    if (dropped_below && (!floor_ || lowest > *floor_)) floor_ = lowest;
    if (dropped_above && (!ceiling_ || highest < *ceiling_)) ceiling_ = highest;
    possible_ = std::move(narrowed);
    return true;
}

VersionSpec Dependency::effective_version() const {
    std::string best = best_version();
    return VersionSpec::parse(best.empty() ? version_ : best);
}

bool Dependency::is_newer(const Dependency& other) const {
    return compare(effective_version(), other.effective_version()) == Ordering::Greater;
}

std::string Dependency::to_string() const {
    std::string s = key();
    std::string best = best_version();
    if (!best.empty() && best != version_) {
        s += " (best " + best + ")";
    }
    if (!repo_path_.empty()) {
        s += " from " + repo_path_;
    }
    return s;
}

} // namespace depot
