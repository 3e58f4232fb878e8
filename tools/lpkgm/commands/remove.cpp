/**
 * lpkgm CLI - remove command
 *
 * Delete the files of installed package versions and their registry
 * records.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>
#include <lpkgm/registry.hpp>

#include <unistd.h>

namespace lpkgm::cli::commands {

namespace {

struct RemoveOptions {
    std::string name;
    std::string version = "*";
    bool yes = false;
    std::vector<std::string> keep;
};

bool confirm_removal(size_t count) {
    std::cout << "Remove " << count << " package(s)? Type \"yes\" to proceed: " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return false;
    }
    return answer == "yes" || answer == "y";
}

int cmd_remove(const GlobalOptions& opts, const RemoveOptions& remove_opts) {
    init_warning_collector(opts.json, opts.quiet);
    if (!init_logging(opts)) {
        return kExitUsage;
    }

    auto settings = load_cli_settings(opts);
    if (!settings) {
        return kExitUsage;
    }
    auto platform = require_platform(*settings, opts);
    if (!platform) {
        return kExitUsage;
    }
    auto registry = registry_dir_for(*settings, *platform);
    if (!registry) {
        print_error("cannot resolve packages-registry-dir for " + *platform, opts.json);
        return kExitUsage;
    }

    RecordQuery query;
    query.name_pattern = remove_opts.name;
    query.version_pattern = remove_opts.version;
    for (const auto& k : remove_opts.keep) {
        auto slash = k.find('/');
        if (slash == 0) {
            print_error("bad --keep value \"" + k + "\" (expected name[/version])", opts.json);
            return kExitUsage;
        }
        if (slash == std::string::npos) {
            query.excludes.emplace_back(k, "*");
        } else {
            query.excludes.emplace_back(k.substr(0, slash), k.substr(slash + 1));
        }
    }

    auto found = find_install_records(*registry, query);
    for (const auto& w : found.warnings) {
        print_warning(w);
    }
    if (found.records.empty()) {
        print_error("no installed package matches " + remove_opts.name + "/" + remove_opts.version,
                    opts.json);
        return kExitUsage;
    }

    if (!opts.json) {
        std::cout << "Packages selected for removal:" << std::endl;
        for (const auto& r : found.records) {
            std::cout << "  " << r.package << "/" << r.version << " ("
                      << r.stats.n_files << " files, " << format_size(r.stats.size) << ")"
                      << std::endl;
        }
    }

    if (!remove_opts.yes) {
        if (!isatty(STDIN_FILENO)) {
            print_error("refusing to remove without -y (stdin is not a terminal)", opts.json);
            return kExitUsage;
        }
        if (!confirm_removal(found.records.size())) {
            print_error("removal cancelled", opts.json);
            return kExitUsage;
        }
    }

    nlohmann::json removed = nlohmann::json::array();
    int failures = 0;
    int locked = 0;
    for (const auto& record : found.records) {
        spdlog::info("Removing {}/{}", record.package, record.version);
        auto result = remove_installed_package(record);
        for (const auto& w : result.warnings) {
            print_warning(record.package + "/" + record.version + ": " + w);
        }
        if (!result.ok) {
            if (result.prefix_locked) {
                ++locked;
            } else {
                ++failures;
            }
            print_warning(record.package + "/" + record.version + ": " + result.error +
                          " (record kept)");
            continue;
        }
        removed.push_back({{"package", record.package},
                           {"version", record.version},
                           {"files", result.removed_files},
                           {"directories", result.removed_dirs}});
        if (!opts.json) {
            std::cout << "Removed " << record.package << "/" << record.version << " ("
                      << result.removed_files << " files)" << std::endl;
        }
    }

    if (failures > 0) {
        print_error(std::to_string(failures + locked) + " package(s) could not be removed",
                    opts.json);
        return kExitWriteFailed;
    }
    if (locked > 0) {
        print_error(std::to_string(locked) +
                        " package(s) not removed: prefix locked by another transaction",
                    opts.json);
        return kExitPrefixLocked;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["removed"] = removed;
        output_json(j);
    }

    return kExitOk;
}

} // anonymous namespace

void setup_remove(CLI::App* app, GlobalOptions& opts) {
    static RemoveOptions remove_opts;

    app->add_option("name", remove_opts.name, "Package name (shell wildcard)")->required();
    app->add_option("version", remove_opts.version, "Package version (shell wildcard)");
    app->add_flag("-y,--yes", remove_opts.yes, "Do not ask for confirmation");
    app->add_option("-k,--keep", remove_opts.keep, "Keep name[/version] (wildcards, repeatable)")
        ->allow_extra_args(false);

    app->callback([&opts]() {
        std::exit(cmd_remove(opts, remove_opts));
    });
}

} // namespace lpkgm::cli::commands
