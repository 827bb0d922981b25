#include <depot/maven.hpp>
#include <tinyxml2.h>
#include <filesystem>

namespace depot {

namespace fs = std::filesystem;

using tinyxml2::XMLDocument;
using tinyxml2::XMLElement;

static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

static Status load_document(XMLDocument& doc, const std::string& path) {
    tinyxml2::XMLError rc = doc.LoadFile(path.c_str());
    if (rc == tinyxml2::XML_SUCCESS) return ok_status();

    if (rc == tinyxml2::XML_ERROR_FILE_NOT_FOUND ||
        rc == tinyxml2::XML_ERROR_FILE_COULD_NOT_BE_OPENED ||
        rc == tinyxml2::XML_ERROR_FILE_READ_ERROR) {
        return DepotError{DepotError::IO, "cannot read " + path};
    }
    const char* detail = doc.ErrorStr();
    return DepotError{DepotError::Parse, "malformed XML in " + path,
                      detail ? detail : "", path, doc.ErrorLineNum()};
}

static std::string child_text(const XMLElement* parent, const char* name) {
    const XMLElement* e = parent->FirstChildElement(name);
    if (!e || !e->GetText()) return "";
    return trim(e->GetText());
}

const std::vector<std::string>& packaging_extensions() {
    static const std::vector<std::string> exts = {".aar", ".jar", ".srcaar"};
    return exts;
}

Result<std::vector<std::string>> read_metadata_versions(const std::string& path) {
    XMLDocument doc;
    DEPOT_TRY(load_document(doc, path));

    std::vector<std::string> versions;
    const XMLElement* root = doc.RootElement();
    const XMLElement* versioning = root ? root->FirstChildElement("versioning") : nullptr;
    const XMLElement* list = versioning ? versioning->FirstChildElement("versions") : nullptr;
    if (!list) {
        return Result<std::vector<std::string>>::ok(std::move(versions));
    }
    for (const XMLElement* v = list->FirstChildElement("version"); v;
         v = v->NextSiblingElement("version")) {
        if (!v->GetText()) continue;
        std::string text = trim(v->GetText());
        if (!text.empty()) versions.push_back(std::move(text));
    }
    return Result<std::vector<std::string>>::ok(std::move(versions));
}

Result<std::vector<PomDependency>> read_pom_dependencies(const std::string& path) {
    XMLDocument doc;
    DEPOT_TRY(load_document(doc, path));

    const XMLElement* project = doc.RootElement();
    if (!project || std::string(project->Name()) != "project") {
        std::string found = project ? project->Name() : "";
        return DepotError{DepotError::Manifest,
            "expected <project> as the document element, found <" + found + ">",
            "", path, project ? project->GetLineNum() : 0};
    }

    std::vector<PomDependency> deps;
    const XMLElement* list = project->FirstChildElement("dependencies");
    if (!list) {
        return Result<std::vector<PomDependency>>::ok(std::move(deps));
    }

    for (const XMLElement* node = list->FirstChildElement("dependency"); node;
         node = node->NextSiblingElement("dependency")) {
        PomDependency pd;
        pd.group_id = child_text(node, "groupId");
        pd.artifact_id = child_text(node, "artifactId");
        pd.version = child_text(node, "version");
        pd.scope = child_text(node, "scope");
        pd.optional = child_text(node, "optional") == "true";
        if (pd.group_id.empty() || pd.artifact_id.empty()) {
            return DepotError{DepotError::Manifest,
                "dependency without groupId or artifactId", "", path, node->GetLineNum()};
        }
        deps.push_back(std::move(pd));
    }
    return Result<std::vector<PomDependency>>::ok(std::move(deps));
}

std::string pom_version_constraint(const std::string& pom_version) {
    std::string v = trim(pom_version);
    if (v.empty()) return "0+";
    if (v.size() >= 2 && v.front() == '[' && v.back() == ']' &&
        v.find(',') == std::string::npos) {
        return v.substr(1, v.size() - 2);
    }
    return v;
}

std::optional<std::string> find_artifact_file(const Dependency& dep) {
    std::string best = dep.best_version();
    if (best.empty()) return std::nullopt;

    std::error_code ec;
    for (const auto& ext : packaging_extensions()) {
        fs::path file = fs::path(dep.best_version_path()) /
                        (dep.artifact() + "-" + best + ext);
        if (fs::is_regular_file(file, ec)) return file.string();
    }
    return std::nullopt;
}

std::string pom_path(const Dependency& dep) {
    return (fs::path(dep.best_version_path()) /
            (dep.artifact() + "-" + dep.best_version() + ".pom")).string();
}

} // namespace depot
