#include <depot/config.hpp>
#include <toml++/toml.hpp>
#include <algorithm>
#include <fstream>
#include <limits>
#include <sstream>
#include <cstdlib>

namespace depot {

const char* const kSdkConfigurationHint =
    "set [android] sdk in ~/.depot/config.toml or the project config, "
    "or set the ANDROID_HOME environment variable";

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return DepotError{DepotError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [android] section
    if (auto android = doc["android"].as_table()) {
        if (auto v = (*android)["sdk"].value<std::string>()) {
            cfg.sdk = *v;
            cfg.sdk_set = true;
        }
    }

    // [repositories] section
    if (auto repos = doc["repositories"].as_table()) {
        if (auto arr = (*repos)["paths"].as_array()) {
            for (const auto& elem : *arr) {
                auto s = elem.value<std::string>();
                if (!s) {
                    return DepotError{DepotError::Config,
                        "[repositories] paths must be an array of strings"};
                }
                cfg.repositories.push_back(*s);
            }
        }
        if (auto v = (*repos)["defaults"].value<bool>()) {
            cfg.default_repositories = *v;
            cfg.default_repositories_set = true;
        }
    }

    // [resolve] section
    if (auto resolve = doc["resolve"].as_table()) {
        if (auto v = (*resolve)["use-latest"].value<bool>()) {
            cfg.use_latest = *v;
            cfg.use_latest_set = true;
        }
        if (auto v = (*resolve)["max-passes"].value<int64_t>()) {
            if (*v <= 0) {
                return DepotError{DepotError::Config,
                    "[resolve] max-passes must be positive"};
            }
            if (*v > std::numeric_limits<int>::max()) {
                return DepotError{DepotError::Config,
                    "[resolve] max-passes is too large"};
            }
            cfg.max_passes = static_cast<int>(*v);
            cfg.max_passes_set = true;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            if (!log::parse_level(*v, cfg.log_level)) {
                return DepotError{DepotError::Config,
                    "unknown log level '" + *v + "'",
                    "expected one of: trace, debug, info, warn, error"};
            }
            cfg.log_level_set = true;
        }
        if (auto v = (*lg)["color"].value<bool>()) {
            cfg.color = *v;
            cfg.color_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return DepotError{DepotError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        auto err = std::move(cfg).error();
        err.file = path;
        return err;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.sdk_set) {
        sdk = other.sdk;
        sdk_set = true;
    }

    for (const auto& repo : other.repositories) {
        if (std::find(repositories.begin(), repositories.end(), repo) == repositories.end()) {
            repositories.push_back(repo);
        }
    }
    if (other.default_repositories_set) {
        default_repositories = other.default_repositories;
        default_repositories_set = true;
    }

    if (other.use_latest_set) {
        use_latest = other.use_latest;
        use_latest_set = true;
    }
    if (other.max_passes_set) {
        max_passes = other.max_passes;
        max_passes_set = true;
    }

    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.color_set) {
        color = other.color;
        color_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    return result;
}

std::string Config::sdk_path() const {
    if (!sdk.empty()) return sdk;
    return sdk_from_environment();
}

std::vector<std::string> Config::repository_roots() const {
    std::vector<std::string> roots;
    if (default_repositories) roots = default_repository_roots();
    for (const auto& repo : repositories) {
        if (std::find(roots.begin(), roots.end(), repo) == roots.end()) {
            roots.push_back(repo);
        }
    }
    return roots;
}

void Config::apply_logging() const {
    if (log_level_set) log::set_level(log_level);
    if (color_set) log::set_color_enabled(color);
}

std::vector<std::string> default_repository_roots() {
    return {
        "{{ sdk }}/extras/android/m2repository",
        "{{ sdk }}/extras/google/m2repository",
    };
}

std::string sdk_from_environment() {
    const char* home = std::getenv("ANDROID_HOME");
    return home ? std::string(home) : std::string();
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.depot/config.toml";
}

} // namespace depot
