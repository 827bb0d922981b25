// demo_resolve.cpp
//
// Declare dependencies for a client, resolve every client in the settings
// directory together and copy the winning artifacts into a directory.
//
//     ./demo_resolve <client> <settings-dir> <dest-dir> [group:artifact:version ...]
//     ./demo_resolve --latest --yes app ./settings ./libs com.android.support:appcompat-v7:23.0+
//
// Options:
//     --config <file>   project config layered over ~/.depot/config.toml
//     --latest          widen conflicting constraints to the newest version
//     --yes             replace older artifacts in dest-dir without asking
//     --clear           forget the client's previous declarations first

#include <depot/client.hpp>
#include <depot/config.hpp>
#include <depot/log.hpp>
#include <depot/result.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace depot;

struct Args {
    std::string client;
    std::string settings_dir;
    std::string dest_dir;
    std::vector<std::string> coordinates;
    std::string config_path;
    bool latest = false;
    bool yes = false;
    bool clear = false;
};

static Result<Args> parse_args(int argc, char** argv) {
    Args args;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--latest") {
            args.latest = true;
        } else if (a == "--yes") {
            args.yes = true;
        } else if (a == "--clear") {
            args.clear = true;
        } else if (a == "--config") {
            if (i + 1 >= argc) {
                return DepotError{DepotError::InvalidArg,
                    "--config needs a file argument"};
            }
            args.config_path = argv[++i];
        } else if (a.size() > 1 && a[0] == '-') {
            return DepotError{DepotError::InvalidArg, "unknown option " + a,
                "options: --config <file> --latest --yes --clear"};
        } else {
            positional.push_back(a);
        }
    }
    if (positional.size() < 3) {
        return DepotError{DepotError::InvalidArg,
            "missing arguments",
            "usage: demo_resolve <client> <settings-dir> <dest-dir> [group:artifact:version ...]"};
    }
    args.client = positional[0];
    args.settings_dir = positional[1];
    args.dest_dir = positional[2];
    args.coordinates.assign(positional.begin() + 3, positional.end());
    return Result<Args>::ok(std::move(args));
}

static Result<Config> load_config(const std::string& project_path) {
    std::optional<Config> global;
    std::string global_path = global_config_path();
    std::error_code ec;
    if (!global_path.empty() && fs::exists(global_path, ec)) {
        auto g = Config::load(global_path);
        if (g.is_err()) return std::move(g).error();
        global = std::move(g).value();
    }

    std::optional<Config> project;
    if (!project_path.empty()) {
        auto p = Config::load(project_path);
        if (p.is_err()) return std::move(p).error();
        project = std::move(p).value();
    }
    return Result<Config>::ok(Config::effective(global, project));
}

// group:artifact:version, where the version may itself contain no ':'
static Status declare(Client& client, const std::string& coordinate) {
    auto first = coordinate.find(':');
    auto second = first == std::string::npos
        ? std::string::npos : coordinate.find(':', first + 1);
    if (second == std::string::npos) {
        return DepotError{DepotError::InvalidArg,
            "malformed coordinate '" + coordinate + "'",
            "expected group:artifact:version"};
    }
    return client.depend_on(coordinate.substr(0, first),
                            coordinate.substr(first + 1, second - first - 1),
                            coordinate.substr(second + 1));
}

static bool ask_overwrite(const Dependency& old_dep, const Dependency& new_dep) {
    std::cout << "replace " << old_dep.resolved_key() << " with "
              << new_dep.resolved_key() << "? [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) return false;
    return answer == "y" || answer == "Y" || answer == "yes";
}

static Status run(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    DEPOT_TRY(args);
    const Args& a = args.value();

    auto config = load_config(a.config_path);
    DEPOT_TRY(config);
    config.value().apply_logging();

    auto client = Client::create(a.client, config.value(), a.settings_dir);
    DEPOT_TRY(client);
    Client& c = client.value();

    if (a.clear) DEPOT_TRY(c.clear_dependencies());
    for (const auto& coordinate : a.coordinates) {
        DEPOT_TRY(declare(c, coordinate));
    }
    log::info("%zu dependencies declared for %s", c.dependencies().size(),
              c.name().c_str());

    ResolveOptions options;
    options.use_latest = a.latest || config.value().use_latest;
    options.max_passes = config.value().max_passes;

    auto candidates = c.resolve_dependencies(options);
    DEPOT_TRY(candidates);
    for (const auto& [key, dep] : candidates.value()) {
        std::cout << dep.resolved_key() << "  " << dep.best_version_path() << "\n";
    }

    ConfirmOverwrite confirm;
    if (!a.yes) confirm = ask_overwrite;
    auto report = c.copy_dependencies(candidates.value(), a.dest_dir, confirm);
    DEPOT_TRY(report);

    const DeployReport& r = report.value();
    std::cout << r.copied.size() << " copied, " << r.removed.size() << " removed, "
              << r.up_to_date.size() << " up to date, "
              << r.declined.size() << " declined\n";
    return ok_status();
}

int main(int argc, char** argv) {
    auto result = run(argc, argv);
    if (result.is_err()) {
        std::cerr << "\n" << result.error().format() << "\n";
        return 1;
    }
    return 0;
}
