#include <depot/settings.hpp>
#include <depot/log.hpp>
#include <toml++/toml.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace depot {

namespace fs = std::filesystem;

static std::vector<std::string> split_words(const std::string& s) {
    std::vector<std::string> words;
    std::istringstream in(s);
    std::string word;
    while (in >> word) words.push_back(word);
    return words;
}

static std::string join_words(const std::vector<std::string>& words) {
    std::string out;
    for (const auto& w : words) {
        if (!out.empty()) out += ' ';
        out += w;
    }
    return out;
}

Result<DependencySet> DependencySet::parse(const std::string& toml_str,
                                           const std::string& filename) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, filename);
    } catch (const toml::parse_error& e) {
        return DepotError{DepotError::Parse,
            std::string("dependency file parse error: ") + std::string(e.description()),
            "", filename, static_cast<int>(e.source().begin.line)};
    }

    DependencySet set;
    if (auto v = doc["client"].value<std::string>()) set.client = *v;

    auto deps = doc["dependency"].as_array();
    if (!deps) return Result<DependencySet>::ok(std::move(set));

    size_t index = 0;
    for (const auto& node : *deps) {
        ++index;
        const auto* tbl = node.as_table();
        if (!tbl) {
            log::warn("%s: dependency #%zu is not a table, skipping",
                      filename.c_str(), index);
            continue;
        }

        DependencyRecord rec;
        if (auto v = (*tbl)["groupId"].value<std::string>()) rec.group_id = *v;
        if (auto v = (*tbl)["artifactId"].value<std::string>()) rec.artifact_id = *v;
        if (auto v = (*tbl)["version"].value<std::string>()) rec.version = *v;
        if (auto v = (*tbl)["packageIds"].value<std::string>()) rec.package_ids = split_words(*v);
        if (auto v = (*tbl)["repositories"].value<std::string>()) rec.repositories = split_words(*v);

        if (rec.group_id.empty() || rec.artifact_id.empty() || rec.version.empty()) {
            log::warn("%s: dependency #%zu lacks groupId, artifactId or version, skipping",
                      filename.c_str(), index);
            continue;
        }
        set.records.push_back(std::move(rec));
    }

    return Result<DependencySet>::ok(std::move(set));
}

Result<DependencySet> DependencySet::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return DepotError{DepotError::NotFound,
            "cannot open dependency file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return parse(ss.str(), path);
}

Status DependencySet::save(const std::string& path) const {
    toml::array deps;
    for (const auto& rec : records) {
        toml::table tbl;
        tbl.insert("groupId", rec.group_id);
        tbl.insert("artifactId", rec.artifact_id);
        tbl.insert("version", rec.version);
        if (!rec.package_ids.empty()) tbl.insert("packageIds", join_words(rec.package_ids));
        if (!rec.repositories.empty()) tbl.insert("repositories", join_words(rec.repositories));
        deps.push_back(std::move(tbl));
    }

    toml::table doc;
    doc.insert("client", client);
    if (!deps.empty()) doc.insert("dependency", std::move(deps));

    std::error_code ec;
    fs::path target(path);
    if (target.has_parent_path()) fs::create_directories(target.parent_path(), ec);

    // Written beside the target, then renamed over it
    fs::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            return DepotError{DepotError::IO, "cannot write dependency file: " + tmp.string()};
        }
        out << doc << "\n";
        if (!out) {
            return DepotError{DepotError::IO, "failed writing dependency file: " + tmp.string()};
        }
    }
    fs::rename(tmp, target, ec);
    if (ec) {
        return DepotError{DepotError::IO,
            "cannot replace dependency file " + path + ": " + ec.message()};
    }
    return ok_status();
}

} // namespace depot
