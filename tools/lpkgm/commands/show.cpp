/**
 * lpkgm CLI - show command
 *
 * Table of installed packages, or the full record of one package version.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>
#include <lpkgm/registry.hpp>

#include <algorithm>
#include <iomanip>

namespace lpkgm::cli::commands {

namespace {

struct ShowOptions {
    std::string name = "*";
    std::string version;
};

nlohmann::json record_summary(const InstallRecord& r) {
    nlohmann::json j;
    j["package"] = r.package;
    j["version"] = r.version;
    j["installedAt"] = r.installed_at;
    j["size"] = r.stats.size;
    j["nFiles"] = r.stats.n_files;
    return j;
}

int cmd_show(const GlobalOptions& opts, const ShowOptions& show_opts) {
    init_warning_collector(opts.json, opts.quiet);
    if (!init_logging(opts, spdlog::level::warn)) {
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
    query.name_pattern = show_opts.name;
    query.version_pattern = show_opts.version.empty() ? "*" : show_opts.version;
    auto found = find_install_records(*registry, query);
    for (const auto& w : found.warnings) {
        print_warning(w);
    }

    std::sort(found.records.begin(), found.records.end(),
              [](const InstallRecord& a, const InstallRecord& b) {
                  return a.package != b.package ? a.package < b.package : a.version < b.version;
              });

    // One fully specified version: print its record
    if (!show_opts.version.empty() && found.records.size() == 1) {
        std::cout << serialize_install_record(found.records.front());
        return kExitOk;
    }

    if (!show_opts.version.empty() && found.records.empty()) {
        print_error(show_opts.name + "/" + show_opts.version + " is not installed", opts.json);
        return kExitUsage;
    }

    std::uintmax_t total = 0;
    for (const auto& r : found.records) {
        total += r.stats.size;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["platform"] = *platform;
        j["packages"] = nlohmann::json::array();
        for (const auto& r : found.records) {
            j["packages"].push_back(record_summary(r));
        }
        j["totalSize"] = total;
        output_json(j);
        return kExitOk;
    }

    if (found.records.empty()) {
        std::cout << "No packages installed for " << *platform << std::endl;
        return kExitOk;
    }

    size_t name_w = 7;
    size_t version_w = 7;
    for (const auto& r : found.records) {
        name_w = std::max(name_w, r.package.size());
        version_w = std::max(version_w, r.version.size());
    }

    std::cout << std::left << std::setw(static_cast<int>(name_w) + 2) << "PACKAGE"
              << std::setw(static_cast<int>(version_w) + 2) << "VERSION"
              << std::setw(12) << "SIZE" << "INSTALLED" << std::endl;
    for (const auto& r : found.records) {
        std::cout << std::left << std::setw(static_cast<int>(name_w) + 2) << r.package
                  << std::setw(static_cast<int>(version_w) + 2) << r.version
                  << std::setw(12) << format_size(r.stats.size) << r.installed_at << std::endl;
    }
    std::cout << found.records.size() << " package(s), " << format_size(total) << " total"
              << std::endl;

    return kExitOk;
}

} // anonymous namespace

void setup_show(CLI::App* app, GlobalOptions& opts) {
    static ShowOptions show_opts;

    app->add_option("name", show_opts.name, "Package name (shell wildcard)");
    app->add_option("version", show_opts.version, "Package version (shell wildcard)");

    app->callback([&opts]() {
        std::exit(cmd_show(opts, show_opts));
    });
}

} // namespace lpkgm::cli::commands
