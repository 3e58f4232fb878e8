/**
 * lpkgm CLI - Entry Point
 *
 * Installs third-party builds into a shared software tree with a
 * collision-checked, manifest-recording install transaction.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

#ifndef LPKGM_VERSION
#define LPKGM_VERSION "0.0.0"
#endif

namespace lpkgm::cli::commands {
    void setup_install(CLI::App* app, GlobalOptions& opts);
    void setup_remove(CLI::App* app, GlobalOptions& opts);
    void setup_show(CLI::App* app, GlobalOptions& opts);
    void setup_complete(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace lpkgm::cli;

    CLI::App app{"lpkgm - install builds into a shared software tree"};
    app.set_version_flag("-V,--version", LPKGM_VERSION);
    app.require_subcommand(0, 1);
    // Global options may follow the subcommand
    app.fallthrough();

    GlobalOptions opts;

    // Global options
    app.add_option("-c,--settings", opts.settings, "Settings file (default: $LPKGM_SETTINGS or ./lpkgm-settings.json)");
    app.add_option("-D,--define", opts.defines, "Definition key=value (e.g. -Dplatform=el9/x86_64-gcc12)")
        ->allow_extra_args(false);
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Warnings and errors only");
    app.add_option("--log-file", opts.log_file, "Also write the log to this file");

    // Commands
    auto* install_cmd = app.add_subcommand("install", "Install a package version into its prefix");
    install_cmd->alias("add");
    commands::setup_install(install_cmd, opts);

    auto* remove_cmd = app.add_subcommand("remove", "Remove installed package versions");
    remove_cmd->alias("delete");
    remove_cmd->alias("uninstall");
    remove_cmd->alias("rm");
    commands::setup_remove(remove_cmd, opts);

    auto* show_cmd = app.add_subcommand("show", "List installed packages or print one record");
    show_cmd->alias("inspect");
    show_cmd->alias("list");
    commands::setup_show(show_cmd, opts);

    auto* complete_cmd = app.add_subcommand("complete", "Print shell completion candidates");
    commands::setup_complete(complete_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
