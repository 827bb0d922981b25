#include <depot/deployer.hpp>
#include <depot/glob.hpp>
#include <depot/maven.hpp>

#include <algorithm>
#include <cctype>

namespace depot {

namespace fs = std::filesystem;

ArtifactDeployer::ArtifactDeployer(log::Sink& sink)
    : sink_(sink) {}

std::string ArtifactDeployer::embedded_version(const std::string& artifact,
                                               const fs::path& entry) {
    // Only packaging extensions are stripped; unpacked archives have none
    std::string name = entry.filename().string();
    std::string ext = entry.extension().string();
    const auto& exts = packaging_extensions();
    if (std::find(exts.begin(), exts.end(), ext) != exts.end()) {
        name.resize(name.size() - ext.size());
    }

    std::string prefix = artifact + "-";
    if (name.compare(0, prefix.size(), prefix) != 0) return "";

    std::string version;
    for (size_t i = prefix.size(); i < name.size(); ++i) {
        char c = name[i];
        if (!std::isdigit(static_cast<unsigned char>(c)) && c != '.') break;
        version.push_back(c);
    }
    while (!version.empty() && version.back() == '.') version.pop_back();
    return version;
}

Status ArtifactDeployer::remove_path(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(path, ec))) return ok_status();

    if (fs::is_directory(path, ec)) {
        for (auto it = fs::recursive_directory_iterator(path, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            fs::permissions(it->path(), fs::perms::owner_write,
                            fs::perm_options::add, ec);
            ec.clear();
        }
    }
    fs::permissions(path, fs::perms::owner_write, fs::perm_options::add, ec);
    ec.clear();

    fs::remove_all(path, ec);
    if (ec) {
        return DepotError{DepotError::IO,
            "cannot remove " + path.string() + ": " + ec.message()};
    }
    return ok_status();
}

Result<DeployReport> ArtifactDeployer::copy(const CandidateMap& candidates,
                                            const std::string& dest_dir,
                                            const ConfirmOverwrite& confirm) const {
    fs::path dest(dest_dir);
    std::error_code ec;
    fs::create_directories(dest, ec);
    if (ec) {
        return DepotError{DepotError::IO,
            "cannot create destination directory " + dest_dir + ": " + ec.message()};
    }

    DeployReport report;
    for (const auto& [key, dep] : candidates) {
        DEPOT_TRY(deploy_one(dep, dest, confirm, report));
    }
    return Result<DeployReport>::ok(std::move(report));
}

Status ArtifactDeployer::deploy_one(const Dependency& dep, const fs::path& dest,
                                    const ConfirmOverwrite& confirm,
                                    DeployReport& report) const {
    // The trailing '-' keeps "base" from matching "basement-1.0.aar"
    auto existing = glob_entries(dest, dep.artifact() + "-*");
    if (existing.is_err()) return std::move(existing).error();

    std::vector<fs::path> stale;
    Dependency first_stale;
    for (const auto& entry : existing.value()) {
        std::string version = embedded_version(dep.artifact(), entry);
        if (version.empty()) continue;

        Dependency old_dep(dep.group(), dep.artifact(), version,
                           dep.package_ids(), dep.repositories());
        old_dep.add_version(version);
        if (old_dep.resolved_key() == dep.resolved_key()) continue;

        if (stale.empty()) first_stale = old_dep;
        stale.push_back(entry);
    }

    if (!stale.empty()) {
        bool approved = !confirm || confirm(first_stale, dep);
        if (!approved) {
            sink_.write(log::Info, "keeping " + first_stale.resolved_key() +
                        ", replacement by " + dep.best_version() + " declined");
            report.declined.push_back(dep.resolved_key());
            return ok_status();
        }
        for (const auto& path : stale) {
            log::info("removing stale %s", path.string().c_str());
            DEPOT_TRY(remove_path(path));
            report.removed.push_back(path.string());
        }
    }

    auto source = find_artifact_file(dep);
    if (!source) {
        return DepotError{DepotError::Dependency,
            "cannot find artifact for " + dep.to_string(),
            "the repository changed after resolution; resolve again"};
    }

    fs::path src(*source);
    std::string base = dep.artifact() + "-" + dep.best_version();
    std::string ext = src.extension().string();
    if (ext == ".srcaar") ext = ".aar";
    fs::path target = dest / (base + ext);
    fs::path unpacked = dest / base;

    std::error_code ec;
    fs::path current;
    if (fs::is_regular_file(target, ec)) {
        current = target;
    } else if (fs::is_directory(unpacked, ec)) {
        current = unpacked;
    }

    if (!current.empty()) {
        auto dest_time = fs::last_write_time(current, ec);
        if (ec) {
            return DepotError{DepotError::IO,
                "cannot read timestamp of " + current.string() + ": " + ec.message()};
        }
        auto src_time = fs::last_write_time(src, ec);
        if (ec) {
            return DepotError{DepotError::IO,
                "cannot read timestamp of " + src.string() + ": " + ec.message()};
        }
        if (!(dest_time < src_time)) {
            report.up_to_date.push_back(dep.resolved_key());
            return ok_status();
        }
        DEPOT_TRY(remove_path(current));
        report.removed.push_back(current.string());
    }

    fs::copy_file(src, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return DepotError{DepotError::IO,
            "cannot copy " + src.string() + " to " + target.string() + ": " +
            ec.message()};
    }
    log::info("copied %s", target.filename().string().c_str());
    report.copied.push_back(target.string());
    return ok_status();
}

} // namespace depot
