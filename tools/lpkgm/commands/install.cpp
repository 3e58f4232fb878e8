/**
 * lpkgm CLI - install command
 *
 * Run the two-phase install transaction for one package version and record
 * the result in the platform's package registry.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>
#include <lpkgm/build_driver.hpp>
#include <lpkgm/path_utils.hpp>
#include <lpkgm/registry.hpp>

namespace lpkgm::cli::commands {

namespace {

struct InstallOptions {
    std::string name;
    std::string version;
    bool dry_run = false;
    std::string probe_dir;
};

int cmd_install(const GlobalOptions& opts, const InstallOptions& install_opts) {
    init_warning_collector(opts.json, opts.quiet);
    if (!init_logging(opts)) {
        return kExitUsage;
    }

    auto version_check = validate_path_component(install_opts.version);
    if (!version_check.ok) {
        print_error("invalid version \"" + install_opts.version + "\": " +
                        path_error_to_string(version_check.error),
                    opts.json);
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

    auto matches = match_packages(*settings, install_opts.name);
    if (matches.empty()) {
        print_error("no package definition matches \"" + install_opts.name + "\"", opts.json);
        return kExitUsage;
    }
    if (matches.size() > 1) {
        std::string names;
        for (const auto* m : matches) {
            names += (names.empty() ? "" : ", ") + m->name;
        }
        print_error("\"" + install_opts.name + "\" is ambiguous: " + names, opts.json);
        return kExitUsage;
    }
    const auto& package = *matches.front();
    auto name_check = validate_path_component(package.name);
    if (!name_check.ok) {
        print_error("package name \"" + package.name + "\" cannot be used in the registry: " +
                        path_error_to_string(name_check.error),
                    opts.json);
        return kExitUsage;
    }

    if (!version_accepted(package, install_opts.version)) {
        print_error("version \"" + install_opts.version + "\" is not accepted for " +
                        package.name + " (version-regex)",
                    opts.json);
        return kExitUsage;
    }

    auto resolved = resolve_install(*settings, package, *platform, install_opts.version);
    if (!resolved.ok) {
        print_error(package.name + ": " + resolved.error, opts.json);
        return kExitUsage;
    }

    auto rec_path = record_path(resolved.registry_dir, package.name, install_opts.version);
    if (path_exists(rec_path)) {
        print_error(package.name + "/" + install_opts.version + " is already installed (" +
                        rec_path + ")",
                    opts.json);
        return kExitUsage;
    }

    TransactionOptions txn;
    txn.package = package.name;
    txn.version = install_opts.version;
    txn.probe_base = install_opts.probe_dir.empty() ? settings->tmp_dir_prefix
                                                    : install_opts.probe_dir;
    txn.manifest_path = manifest_path(resolved.registry_dir, package.name, install_opts.version);
    txn.dry_run = install_opts.dry_run;

    ShellBuildDriver driver;
    auto result = install(driver, resolved.build_source, resolved.prefix,
                          resolved.build_config, txn);

    for (const auto& w : result.warnings) {
        print_warning(w);
    }

    if (!result.ok) {
        std::string msg = std::string(transaction_error_to_string(result.error)) + ": " +
                          result.message;
        if (opts.json) {
            nlohmann::json j;
            j["ok"] = false;
            j["error"] = msg;
            j["kind"] = transaction_error_to_string(result.error);
            j["phase"] = transaction_phase_to_string(result.phase);
            if (!result.offending_path.empty()) {
                j["path"] = result.offending_path;
            }
            j["prefix_modified"] = result.prefix_modified;
            if (!result.installed_files.empty()) {
                j["manifest"] = result.manifest_path;
                j["installed"] = result.installed_files;
            }
            output_json(j);
        } else {
            std::cerr << "Error: " << msg << std::endl;
            if (!result.offending_path.empty()) {
                std::cerr << "  path: " << result.offending_path << std::endl;
            }
            if (!result.installed_files.empty()) {
                std::cerr << "  manifest: " << result.manifest_path << " ("
                          << result.installed_files.size() << " files to clean up)" << std::endl;
            }
        }
        return exit_code_for(result.error);
    }

    if (install_opts.dry_run) {
        if (opts.json) {
            nlohmann::json j;
            j["ok"] = true;
            j["dry_run"] = true;
            j["package"] = package.name;
            j["version"] = install_opts.version;
            j["prefix"] = resolved.prefix;
            j["footprint"] = result.footprint;
            output_json(j);
        } else {
            for (const auto& rel : result.footprint) {
                std::cout << join_path(resolved.prefix, rel) << std::endl;
            }
        }
        return kExitOk;
    }

    InstallRecord record;
    record.package = package.name;
    record.version = install_opts.version;
    record.installed_at = get_current_timestamp();
    record.prefix = resolved.prefix;
    record.manifest = result.manifest_path;
    record.fs_entries = result.installed_files;
    record.stats = compute_stats(record.fs_entries);

    auto written = write_install_record(rec_path, record);
    if (!written.ok) {
        print_error("cannot write package record " + rec_path + ": " + written.error +
                        " (files are installed; manifest " + result.manifest_path + ")",
                    opts.json);
        return kExitWriteFailed;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["package"] = package.name;
        j["version"] = install_opts.version;
        j["prefix"] = resolved.prefix;
        j["manifest"] = result.manifest_path;
        j["record"] = rec_path;
        j["stats"]["size"] = record.stats.size;
        j["stats"]["nFiles"] = record.stats.n_files;
        output_json(j);
    } else {
        print_success("Installed " + package.name + "/" + install_opts.version + " into " +
                          resolved.prefix + " (" + std::to_string(record.stats.n_files) +
                          " files, " + format_size(record.stats.size) + ")",
                      opts.json);
    }

    return kExitOk;
}

} // anonymous namespace

void setup_install(CLI::App* app, GlobalOptions& opts) {
    static InstallOptions install_opts;

    app->add_option("name", install_opts.name, "Package name (shell wildcard, must match one)")->required();
    app->add_option("version", install_opts.version, "Package version")->required();
    app->add_flag("--dry-run", install_opts.dry_run, "Probe and check for collisions only");
    app->add_option("--probe-dir", install_opts.probe_dir, "Directory for probe installs (default: tmp-dir-prefix)");

    app->callback([&opts]() {
        std::exit(cmd_install(opts, install_opts));
    });
}

} // namespace lpkgm::cli::commands
