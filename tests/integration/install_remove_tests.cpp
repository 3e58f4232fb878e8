/**
 * Integration tests for the settings -> transaction -> registry -> removal
 * flow, using the shell build driver against a scratch software tree.
 */

#include <doctest/doctest.h>
#include <lpkgm/build_driver.hpp>
#include <lpkgm/completion.hpp>
#include <lpkgm/registry.hpp>
#include <lpkgm/settings.hpp>
#include <lpkgm/transaction.hpp>

#include "../test_helpers.hpp"

#include <filesystem>

namespace fs = std::filesystem;

using namespace lpkgm;
using lpkgm::testing::TempDir;
using lpkgm::testing::read_lines;
using lpkgm::testing::slurp;
using lpkgm::testing::tree_listing;
using lpkgm::testing::write_file;

namespace {

// A tiny "source tree" whose install step honours {prefix}
void make_source_tree(const TempDir& temp) {
    write_file(temp.sub("src/hello/install.sh"),
               "#!/bin/sh\n"
               "set -e\n"
               "mkdir -p \"$1/bin\" \"$1/share/hello-$2\"\n"
               "printf 'echo hello %s\\n' \"$2\" > \"$1/bin/hello\"\n"
               "printf '%s\\n' \"$GREETING\" > \"$1/share/hello-$2/greeting\"\n");
    write_file(temp.sub("src/clash/install.sh"),
               "#!/bin/sh\n"
               "mkdir -p \"$1/bin\" && echo clash > \"$1/bin/hello\"\n");
}

Settings load_tree_settings(const TempDir& temp) {
    write_file(temp.sub("lpkgm-settings.json"), R"({
        "root": ")" + temp.sub("sft") + R"(",
        "definitions": {"platform": "el9/x86_64", "sources": ")" + temp.sub("src") + R"("},
        "tmp-dir-prefix": ")" + temp.sub("probes") + R"(",
        "packages": {
            "hello": {
                "build": ["/bin/sh", "install.sh", "{prefix}", "{version}"],
                "source-dir": "{sources}/hello",
                "environment": {"GREETING": "hi from {name}"},
                "version-regex": ["^\\d+\\.\\d+$"]
            },
            "clash": {
                "build": ["/bin/sh", "install.sh", "{prefix}"],
                "source-dir": "{sources}/clash"
            }
        }
    })");
    auto parsed = load_settings_file(temp.sub("lpkgm-settings.json"));
    REQUIRE(parsed.ok);
    return parsed.settings;
}

struct Installed {
    TransactionResult result;
    ResolvedInstall resolved;
    std::string record;
};

Installed install_package(const Settings& settings, const std::string& name,
                          const std::string& version) {
    Installed out;
    const auto& package = settings.packages.at(name);
    auto platform = selected_platform(settings);
    REQUIRE(platform.has_value());

    out.resolved = resolve_install(settings, package, *platform, version);
    REQUIRE(out.resolved.ok);

    TransactionOptions options;
    options.package = name;
    options.version = version;
    options.probe_base = settings.tmp_dir_prefix;
    options.manifest_path = manifest_path(out.resolved.registry_dir, name, version);

    ShellBuildDriver driver;
    out.result = install(driver, out.resolved.build_source, out.resolved.prefix,
                         out.resolved.build_config, options);
    if (!out.result.ok) {
        return out;
    }

    InstallRecord record;
    record.package = name;
    record.version = version;
    record.installed_at = get_current_timestamp();
    record.prefix = out.resolved.prefix;
    record.manifest = out.result.manifest_path;
    record.fs_entries = out.result.installed_files;
    record.stats = compute_stats(record.fs_entries);

    out.record = record_path(out.resolved.registry_dir, name, version);
    REQUIRE(write_install_record(out.record, record).ok);
    return out;
}

} // namespace

TEST_CASE("install, inspect and remove a package end to end") {
    TempDir temp;
    make_source_tree(temp);
    auto settings = load_tree_settings(temp);
    auto prefix = temp.sub("sft/el9/x86_64");

    auto installed = install_package(settings, "hello", "1.0");
    REQUIRE(installed.result.ok);

    std::vector<std::string> expected = {prefix + "/bin/hello",
                                         prefix + "/share/hello-1.0/greeting"};
    CHECK(read_lines(installed.result.manifest_path) == expected);
    CHECK(slurp(prefix + "/share/hello-1.0/greeting") == "hi from hello\n");
    CHECK(fs::exists(installed.record));
    CHECK_FALSE(fs::exists(installed.result.probe_dir));

    auto loaded = load_install_record(installed.record);
    REQUIRE(loaded.ok);
    CHECK(loaded.record.stats.n_files == 2);
    CHECK(loaded.record.fs_entries == expected);

    // The completion resolver sees the new installation
    FilesystemPrefixEnumerator enumerator(settings);
    CHECK(resolve_completions("lpkgm show ", 11, enumerator) == std::vector<std::string>{"hello"});
    CHECK(resolve_completions("lpkgm remove hello ", 19, enumerator) ==
          std::vector<std::string>{"1.0"});
    CHECK(enumerator.platforms() == std::vector<std::string>{"el9/x86_64"});

    RecordQuery query;
    query.name_pattern = "hel*";
    auto found = find_install_records(installed.resolved.registry_dir, query);
    REQUIRE(found.records.size() == 1);

    auto removal = remove_installed_package(found.records.front());
    REQUIRE(removal.ok);
    CHECK(removal.removed_files == 2);
    CHECK_FALSE(fs::exists(prefix + "/bin"));
    CHECK_FALSE(fs::exists(prefix + "/share"));
    CHECK_FALSE(fs::exists(installed.record));
    CHECK_FALSE(fs::exists(installed.result.manifest_path));
    CHECK(fs::is_directory(prefix));
}

TEST_CASE("a second package colliding with an installed one leaves the tree unchanged") {
    TempDir temp;
    make_source_tree(temp);
    auto settings = load_tree_settings(temp);
    auto prefix = temp.sub("sft/el9/x86_64");

    REQUIRE(install_package(settings, "hello", "1.0").result.ok);
    auto before = tree_listing(temp.sub("sft"));
    auto content_before = slurp(prefix + "/bin/hello");

    auto clash = install_package(settings, "clash", "2.0");

    CHECK(clash.result.error == TransactionError::CollisionDetected);
    CHECK(clash.result.offending_path == prefix + "/bin/hello");
    CHECK(tree_listing(temp.sub("sft")) == before);
    CHECK(slurp(prefix + "/bin/hello") == content_before);
    CHECK_FALSE(fs::exists(clash.resolved.registry_dir + "/clash"));
    CHECK(tree_listing(temp.sub("probes")).empty());
}

TEST_CASE("a second version installing the same files collides with the first") {
    TempDir temp;
    make_source_tree(temp);
    auto settings = load_tree_settings(temp);

    REQUIRE(install_package(settings, "hello", "1.0").result.ok);
    auto second = install_package(settings, "hello", "1.1");
    CHECK(second.result.error == TransactionError::CollisionDetected);

    CHECK(version_accepted(settings.packages.at("hello"), "1.1"));
    CHECK_FALSE(version_accepted(settings.packages.at("hello"), "1.1-rc1"));
    CHECK(list_installed_versions(second.resolved.registry_dir, "hello") ==
          std::vector<std::string>{"1.0"});
}
