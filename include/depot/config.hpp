#pragma once

#include <depot/result.hpp>
#include <depot/log.hpp>
#include <string>
#include <vector>
#include <optional>

namespace depot {

// Placeholder substituted with the SDK root in repository paths
inline constexpr const char* kSdkVariable = "sdk";

// Layered configuration: global > project
// Later layers override earlier ones on explicitly-set fields; repository
// lists are concatenated.
struct Config {
    // [android]
    std::string sdk;

    // [repositories]
    std::vector<std::string> repositories;
    bool default_repositories = true;

    // [resolve]
    bool use_latest = false;
    int max_passes = 1000;

    // [log]
    log::Level log_level = log::Info;
    bool color = false;

    // Track which fields were explicitly set (for merge)
    bool sdk_set = false;
    bool default_repositories_set = false;
    bool use_latest_set = false;
    bool max_passes_set = false;
    bool log_level_set = false;
    bool color_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    // Build effective config from layers: global -> project
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project);

    // Configured SDK root, else $ANDROID_HOME, else empty
    std::string sdk_path() const;

    // SDK default roots (when enabled) followed by the extra repositories
    std::vector<std::string> repository_roots() const;

    // Push log level and color settings into depot::log
    void apply_logging() const;
};

// Repository roots shipped with the Android SDK, as {{ sdk }} templates
std::vector<std::string> default_repository_roots();

// $ANDROID_HOME, or empty
std::string sdk_from_environment();

// Remediation text attached to errors about a missing SDK path
extern const char* const kSdkConfigurationHint;

// Discover the global config file path: ~/.depot/config.toml
std::string global_config_path();

} // namespace depot
