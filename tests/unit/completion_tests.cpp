#include <doctest/doctest.h>
#include <lpkgm/completion.hpp>
#include <lpkgm/registry.hpp>

#include "../test_helpers.hpp"

#include <filesystem>
#include <map>
#include <stdexcept>

namespace fs = std::filesystem;

using namespace lpkgm;
using lpkgm::testing::TempDir;
using lpkgm::testing::write_file;

namespace {

using Strings = std::vector<std::string>;

class FakeEnumerator : public PrefixEnumerator {
public:
    Strings platforms() const override {
        if (fail) throw std::runtime_error("network filesystem went away");
        return {"el9/x86_64-gcc12", "el9/aarch64-gcc12", "el8/x86_64-gcc11"};
    }

    Strings installed_packages(const std::string& platform) const override {
        if (platform == "el9/x86_64-gcc12") return {"libfoo", "libbar", "tcl"};
        return {};
    }

    Strings installed_versions(const std::string& platform,
                               const std::string& package) const override {
        if (platform == "el9/x86_64-gcc12" && package == "libfoo") {
            return {"1.2.0", "1.2.1", "1.3.0", "1.2.0"};
        }
        return {};
    }

    Strings installable_packages() const override {
        return {"libfoo", "libbaz", "tcl", "tk"};
    }

    Strings installable_versions(const std::string& platform,
                                 const std::string& package) const override {
        (void)platform;
        if (package == "libfoo") return {"2.0.0", "1.9.0"};
        return {};
    }

    std::optional<std::string> default_platform() const override { return default_; }

    Strings flag_values(const std::string& flag, const std::string& platform) const override {
        (void)platform;
        if (flag == "-c" || flag == "--settings") return {"lpkgm-settings.json", "local.json"};
        return {};
    }

    std::optional<std::string> default_;
    bool fail = false;
};

Strings complete(const std::string& line, const PrefixEnumerator& e) {
    return resolve_completions(line, line.size(), e);
}

} // namespace

// ============================================================================
// Tokenizer and context
// ============================================================================

TEST_CASE("tokenize_command_line splits on any whitespace") {
    CHECK(tokenize_command_line("  lpkgm\tinstall   tcl \n") == Strings{"lpkgm", "install", "tcl"});
    CHECK(tokenize_command_line("").empty());
    CHECK(tokenize_command_line("   ").empty());
}

TEST_CASE("subcommand synonyms map to canonical subcommands") {
    CHECK(parse_subcommand("add") == Subcommand::Install);
    CHECK(parse_subcommand("install") == Subcommand::Install);
    CHECK(parse_subcommand("uninstall") == Subcommand::Remove);
    CHECK(parse_subcommand("rm") == Subcommand::Remove);
    CHECK(parse_subcommand("delete") == Subcommand::Remove);
    CHECK(parse_subcommand("inspect") == Subcommand::Show);
    CHECK(parse_subcommand("list") == Subcommand::Show);
    CHECK_FALSE(parse_subcommand("instal").has_value());
}

TEST_CASE("context walks platform, subcommand and positional slots") {
    auto ctx = parse_completion_context("lpkgm -Dplatform=el9/x86_64-gcc12 add tcl 8.6.13 ", 1000);
    REQUIRE(ctx.platform.has_value());
    CHECK(*ctx.platform == "el9/x86_64-gcc12");
    CHECK(ctx.subcommand == Subcommand::Install);
    CHECK(ctx.name.value() == "tcl");
    CHECK(ctx.version.value() == "8.6.13");
    CHECK(ctx.fragment.empty());
    CHECK(ctx.state() == CompletionState::Done);
}

TEST_CASE("context state follows the typing order") {
    CHECK(parse_completion_context("lpkgm ", 6).state() == CompletionState::NoPlatform);
    CHECK(parse_completion_context("lpkgm -Dplatform=p ", 19).state() == CompletionState::NoSubcommand);
    CHECK(parse_completion_context("lpkgm -Dplatform=p rm ", 22).state() == CompletionState::CollectingName);
    CHECK(parse_completion_context("lpkgm -Dplatform=p rm li", 24).state() == CompletionState::CollectingName);
    CHECK(parse_completion_context("lpkgm -Dplatform=p rm libfoo ", 29).state() == CompletionState::CollectingVersion);
    CHECK(parse_completion_context("lpkgm -Dplatform=p rm libfoo 1.", 31).state() == CompletionState::CollectingVersion);
}

TEST_CASE("a flag without an inline value swallows the next token") {
    auto ctx = parse_completion_context("lpkgm -c my.json -Dplatform=p show --log-file x.log tcl ", 1000);
    CHECK(ctx.subcommand == Subcommand::Show);
    CHECK(ctx.name.value() == "tcl");
    CHECK_FALSE(ctx.version.has_value());
    CHECK_FALSE(ctx.ignore_next);

    auto pending = parse_completion_context("lpkgm -Dplatform=p show --log-file ", 1000);
    CHECK(pending.ignore_next);
    CHECK(pending.pending_flag == "--log-file");

    // Inline values do not swallow anything
    auto inline_value = parse_completion_context("lpkgm --settings=my.json -Dplatform=p show tcl ", 1000);
    CHECK(inline_value.name.value() == "tcl");
}

TEST_CASE("lpkgm's own switches do not swallow the next token") {
    auto ctx = parse_completion_context("lpkgm -v -Dplatform=p --json remove -y ", 1000);
    CHECK(ctx.platform.value() == "p");
    CHECK(ctx.subcommand == Subcommand::Remove);
    CHECK_FALSE(ctx.ignore_next);
    CHECK(ctx.state() == CompletionState::CollectingName);

    FakeEnumerator e;
    CHECK(complete("lpkgm -v -Dplatform=el9/x86_64-gcc12 install ", e) ==
          Strings{"libbaz", "libfoo", "tcl", "tk"});
    CHECK(complete("lpkgm -Dplatform=el9/x86_64-gcc12 remove -y ", e) ==
          Strings{"libbar", "libfoo", "tcl"});
    CHECK(complete("lpkgm -Dplatform=el9/x86_64-gcc12 install --dry-run libfoo ", e) ==
          Strings{"1.9.0", "2.0.0"});
}

TEST_CASE("-D platform=<id> selects the platform too") {
    auto ctx = parse_completion_context("lpkgm -D platform=el9 install ", 1000);
    CHECK(ctx.platform.value() == "el9");
    CHECK(ctx.subcommand == Subcommand::Install);
}

TEST_CASE("tokens after both positional slots are ignored") {
    auto ctx = parse_completion_context("lpkgm -Dplatform=p install tcl 8.6 extra more ", 1000);
    CHECK(ctx.name.value() == "tcl");
    CHECK(ctx.version.value() == "8.6");
    CHECK(ctx.state() == CompletionState::Done);
}

TEST_CASE("the cursor position bounds the parsed text") {
    std::string line = "lpkgm -Dplatform=p remove libfoo 1.2.0";
    auto ctx = parse_completion_context(line, line.find("libfoo") + 3);
    CHECK(ctx.fragment == "lib");
    CHECK(ctx.fragment_slot == FragmentSlot::Name);
    CHECK_FALSE(ctx.version.has_value());
}

// ============================================================================
// Resolver
// ============================================================================

TEST_CASE("install with a platform offers installable package names") {
    FakeEnumerator e;
    CHECK(complete("lpkgm -Dplatform=el9/x86_64-gcc12 install ", e) ==
          Strings{"libbaz", "libfoo", "tcl", "tk"});
    CHECK(complete("lpkgm -Dplatform=el9/x86_64-gcc12 install t", e) == Strings{"tcl", "tk"});
}

TEST_CASE("install with a package offers installable versions") {
    FakeEnumerator e;
    CHECK(complete("lpkgm -Dplatform=el9/x86_64-gcc12 install libfoo ", e) ==
          Strings{"1.9.0", "2.0.0"});
}

TEST_CASE("remove offers installed versions matching the typed prefix") {
    FakeEnumerator e;
    e.default_ = "el9/x86_64-gcc12";
    CHECK(complete("lpkgm remove libfoo 1.2.", e) == Strings{"1.2.0", "1.2.1"});
}

TEST_CASE("show and its synonyms offer installed package names") {
    FakeEnumerator e;
    CHECK(complete("lpkgm -Dplatform=el9/x86_64-gcc12 inspect ", e) ==
          Strings{"libbar", "libfoo", "tcl"});
    CHECK(complete("lpkgm -Dplatform=el9/x86_64-gcc12 list lib", e) == Strings{"libbar", "libfoo"});
    CHECK(complete("lpkgm -Dplatform=el9/x86_64-gcc12 rm libfoo ", e) ==
          Strings{"1.2.0", "1.2.1", "1.3.0"});
}

TEST_CASE("no platform token offers a selector for every known platform") {
    FakeEnumerator e;
    CHECK(complete("lpkgm ", e) == Strings{"-Dplatform=el8/x86_64-gcc11",
                                           "-Dplatform=el9/aarch64-gcc12",
                                           "-Dplatform=el9/x86_64-gcc12"});
    CHECK(complete("lpkgm install ", e).size() == 3);
}

TEST_CASE("a partially typed platform selector completes platform ids") {
    FakeEnumerator e;
    CHECK(complete("lpkgm -Dplatform=el9", e) == Strings{"el9/aarch64-gcc12", "el9/x86_64-gcc12"});
    CHECK(complete("lpkgm -Dplatform=", e).size() == 3);
    CHECK(complete("lpkgm -Dpla", e).size() == 3);
    CHECK(complete("lpkgm -Dpla", e).front().rfind("-Dplatform=", 0) == 0);

    // Takes precedence over everything else on the line
    e.default_ = "el9/x86_64-gcc12";
    CHECK(complete("lpkgm -Dplatform=el8/x86_64-gcc11 remove -Dplatform=el8", e) ==
          Strings{"el8/x86_64-gcc11"});
}

TEST_CASE("without a subcommand the keywords and synonyms are offered") {
    FakeEnumerator e;
    auto all = complete("lpkgm -Dplatform=el9/x86_64-gcc12 ", e);
    CHECK(all == Strings{"add", "delete", "inspect", "install", "list", "remove", "rm", "show",
                         "uninstall"});
    CHECK(complete("lpkgm -Dplatform=el9/x86_64-gcc12 in", e) == Strings{"inspect", "install"});

    // A keyword still being typed is completed, not taken as the subcommand
    CHECK(complete("lpkgm -Dplatform=el9/x86_64-gcc12 install", e) == Strings{"install"});
}

TEST_CASE("a flag token followed by end of line offers the flag's values") {
    FakeEnumerator e;
    e.default_ = "el9/x86_64-gcc12";
    CHECK(complete("lpkgm -c ", e) == Strings{"local.json", "lpkgm-settings.json"});
    CHECK(complete("lpkgm install --settings lo", e) == Strings{"local.json"});
    CHECK(complete("lpkgm install --probe-dir ", e).empty());
}

TEST_CASE("nothing is offered once both slots are filled") {
    FakeEnumerator e;
    CHECK(complete("lpkgm -Dplatform=el9/x86_64-gcc12 remove libfoo 1.2.0 ", e).empty());
}

TEST_CASE("nothing is offered while the program name is typed") {
    FakeEnumerator e;
    CHECK(complete("lpk", e).empty());
    CHECK(complete("", e).empty());
}

TEST_CASE("enumeration failures yield an empty candidate set") {
    FakeEnumerator e;
    e.fail = true;
    CHECK(complete("lpkgm ", e).empty());
    CHECK(complete("lpkgm -Dplatform=", e).empty());
}

TEST_CASE("resolver is stateless across calls") {
    FakeEnumerator e;
    auto first = complete("lpkgm -Dplatform=el9/x86_64-gcc12 install ", e);
    complete("lpkgm ", e);
    CHECK(complete("lpkgm -Dplatform=el9/x86_64-gcc12 install ", e) == first);
}

// ============================================================================
// Filesystem enumerator
// ============================================================================

TEST_CASE("FilesystemPrefixEnumerator finds platforms up to three levels deep") {
    TempDir temp;
    fs::create_directories(temp.sub("el9/x86_64-gcc12/.packages"));
    fs::create_directories(temp.sub("el8/.packages"));
    fs::create_directories(temp.sub("a/b/c/.packages"));  // too deep
    fs::create_directories(temp.sub(".hidden/.packages"));
    fs::create_directories(temp.sub("el9/noarch"));

    FilesystemPrefixEnumerator e(temp.path());
    CHECK(e.platforms() == Strings{"el8", "el9/x86_64-gcc12"});
}

TEST_CASE("FilesystemPrefixEnumerator reads installed packages from the registry") {
    TempDir temp;
    auto registry = temp.sub("el9/.packages");
    InstallRecord record;
    record.package = "tcl";
    record.version = "8.6.13";
    REQUIRE(write_install_record(record_path(registry, "tcl", "8.6.13"), record).ok);
    record.version = "8.6.14";
    REQUIRE(write_install_record(record_path(registry, "tcl", "8.6.14"), record).ok);

    FilesystemPrefixEnumerator e(temp.path());
    CHECK(e.installed_packages("el9") == Strings{"tcl"});
    CHECK(e.installed_versions("el9", "tcl").size() == 2);
    CHECK(e.installed_packages("el8").empty());
    CHECK(e.flag_values("-k", "el9").size() == 2);

    CHECK(complete("lpkgm -Dplatform=el9 remove tcl 8.6.1", e) == Strings{"8.6.13", "8.6.14"});
}

TEST_CASE("FilesystemPrefixEnumerator takes installable packages from settings") {
    TempDir temp;
    fs::create_directories(temp.sub("el9/.packages"));
    write_file(temp.sub("cwd/lpkgm-settings.json"), "{}");
    write_file(temp.sub("cwd/notes.txt"), "");

    auto parsed = parse_settings(R"({"root": ")" + temp.path() + R"(",
        "definitions": {"platform": "el9"},
        "packages": {
            "tcl": {"build": ["make"], "versions": ["8.6.13", "8.6.14"]},
            "tk": {"build": ["make"]}
        }})");
    REQUIRE(parsed.ok);

    FilesystemPrefixEnumerator e(parsed.settings);
    e.set_working_directory(temp.sub("cwd"));

    CHECK(e.default_platform().value() == "el9");
    CHECK(e.installable_packages() == Strings{"tcl", "tk"});
    CHECK(e.installable_versions("el9", "tcl") == Strings{"8.6.13", "8.6.14"});
    CHECK(e.flag_values("--settings", "") == Strings{"lpkgm-settings.json"});
    CHECK(e.flag_values("-D", "") == Strings{"platform=el9"});

    CHECK(complete("lpkgm install t", e) == Strings{"tcl", "tk"});
    CHECK(complete("lpkgm install tcl ", e) == Strings{"8.6.13", "8.6.14"});
}
