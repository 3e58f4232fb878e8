#include <doctest/doctest.h>
#include <lpkgm/footprint.hpp>

#include "../test_helpers.hpp"

#include <filesystem>

namespace fs = std::filesystem;

using namespace lpkgm;
using lpkgm::testing::TempDir;
using lpkgm::testing::write_file;

TEST_CASE("extract_footprint lists regular files relative to the root, sorted") {
    TempDir temp;
    write_file(temp.sub("lib/libtcl8.6.so"), "elf");
    write_file(temp.sub("bin/tclsh8.6"), "elf");
    write_file(temp.sub("include/tcl.h"), "header");
    write_file(temp.sub("share/man/man1/tclsh.1"), "man");

    auto result = extract_footprint(temp.path());

    REQUIRE(result.ok);
    CHECK(result.anomalies.empty());
    REQUIRE(result.paths.size() == 4);
    CHECK(result.paths[0] == "bin/tclsh8.6");
    CHECK(result.paths[1] == "include/tcl.h");
    CHECK(result.paths[2] == "lib/libtcl8.6.so");
    CHECK(result.paths[3] == "share/man/man1/tclsh.1");
}

TEST_CASE("extract_footprint skips directories and symlinks") {
    TempDir temp;
    write_file(temp.sub("bin/tclsh8.6"), "elf");
    fs::create_directories(temp.sub("share/empty"));
    fs::create_symlink("tclsh8.6", temp.sub("bin/tclsh"));
    fs::create_directory_symlink(temp.sub("bin"), temp.sub("bin64"));

    auto result = extract_footprint(temp.path());

    REQUIRE(result.ok);
    REQUIRE(result.paths.size() == 1);
    CHECK(result.paths[0] == "bin/tclsh8.6");
}

TEST_CASE("extract_footprint of an empty tree is empty but ok") {
    TempDir temp;
    auto result = extract_footprint(temp.path());
    CHECK(result.ok);
    CHECK(result.paths.empty());
}

TEST_CASE("extract_footprint fails for a missing root") {
    TempDir temp;
    auto result = extract_footprint(temp.sub("does-not-exist"));
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("not a directory") != std::string::npos);
}

TEST_CASE("extract_footprint keeps names with spaces and dots") {
    TempDir temp;
    write_file(temp.sub("share/doc/READ ME.txt"), "x");
    write_file(temp.sub(".hidden/config"), "x");

    auto result = extract_footprint(temp.path());

    REQUIRE(result.ok);
    REQUIRE(result.paths.size() == 2);
    CHECK(result.paths[0] == ".hidden/config");
    CHECK(result.paths[1] == "share/doc/READ ME.txt");
}
