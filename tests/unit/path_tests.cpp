#include <doctest/doctest.h>
#include <lpkgm/path_utils.hpp>
#include <lpkgm/platform.hpp>

using lpkgm::PathError;
using lpkgm::normalize_under_root;
using lpkgm::validate_path_component;
using lpkgm::validate_prefix;

TEST_CASE("normalize simple relative path under root") {
    auto r = normalize_under_root("/sft/el9/x86_64", "bin/tclsh");
    REQUIRE(r.ok);
    CHECK(r.path == "/sft/el9/x86_64/bin/tclsh");
}

TEST_CASE("collapse dot and dotdot segments") {
    auto r = normalize_under_root("/sft/el9/x86_64", "./bin/../lib/./libtcl.so");
    REQUIRE(r.ok);
    CHECK(r.path == "/sft/el9/x86_64/lib/libtcl.so");
}

TEST_CASE("reject escape above root") {
    auto r = normalize_under_root("/sft/el9/x86_64", "../../etc/passwd");
    CHECK_FALSE(r.ok);
    CHECK(r.error == PathError::EscapesRoot);
}

TEST_CASE("reject absolute when not allowed") {
    auto r = normalize_under_root("/sft/el9/x86_64", "/abs/path");
    CHECK_FALSE(r.ok);
    CHECK(r.error == PathError::AbsoluteNotAllowed);
}

TEST_CASE("absolute path is re-rooted when allowed") {
    auto r = normalize_under_root("/sft", "/share/doc", true);
    REQUIRE(r.ok);
    CHECK(r.path == "/sft/share/doc");
}

TEST_CASE("reject NUL bytes") {
    std::string bad = std::string("bin/\0app", 8);
    auto r = normalize_under_root("/sft", bad);
    CHECK_FALSE(r.ok);
    CHECK(r.error == PathError::ContainsNul);
}

TEST_CASE("normalize handles multiple consecutive slashes") {
    auto r = normalize_under_root("/sft", "bin//subdir///file");
    REQUIRE(r.ok);
    CHECK(r.path == "/sft/bin/subdir/file");
}

TEST_CASE("normalized path has no trailing slash") {
    auto r = normalize_under_root("/sft", "lib/pkgconfig/");
    REQUIRE(r.ok);
    CHECK(r.path == "/sft/lib/pkgconfig");
}

// ============================================================================
// Prefix validation
// ============================================================================

TEST_CASE("validate_prefix accepts and normalizes absolute prefixes") {
    auto r = validate_prefix("/sft/el9//x86_64/./");
    REQUIRE(r.ok);
    CHECK(r.path == "/sft/el9/x86_64");
}

TEST_CASE("validate_prefix rejects relative, empty and root prefixes") {
    CHECK(validate_prefix("").error == PathError::Empty);
    CHECK(validate_prefix("sft/el9").error == PathError::NotAbsolute);
    CHECK(validate_prefix("/").error == PathError::IsRoot);
    CHECK(validate_prefix("/sft/..").error == PathError::IsRoot);
    CHECK_FALSE(validate_prefix(std::string("/sft\0x", 6)).ok);
}

TEST_CASE("validate_path_component accepts plain names and versions") {
    CHECK(validate_path_component("tcl").ok);
    CHECK(validate_path_component("8.6.13").ok);
    CHECK(validate_path_component("1.0-rc1+build.5").ok);
    CHECK(validate_path_component("..hidden").ok);
}

TEST_CASE("validate_path_component rejects anything that leaves its directory") {
    CHECK(validate_path_component("").error == PathError::Empty);
    CHECK(validate_path_component(".").error == PathError::NotAComponent);
    CHECK(validate_path_component("..").error == PathError::NotAComponent);
    CHECK(validate_path_component("../../../x").error == PathError::NotAComponent);
    CHECK(validate_path_component("1.0/extra").error == PathError::NotAComponent);
    CHECK(validate_path_component("/abs").error == PathError::NotAComponent);
    CHECK(validate_path_component(std::string("1.0\0x", 5)).error == PathError::ContainsNul);
}

TEST_CASE("path_error_to_string describes every error") {
    CHECK(std::string(lpkgm::path_error_to_string(PathError::NotAComponent)) ==
          "not a single path component");
    CHECK(std::string(lpkgm::path_error_to_string(PathError::EscapesRoot)) == "path escapes root");
    CHECK(std::string(lpkgm::path_error_to_string(PathError::IsRoot)).find("root") !=
          std::string::npos);
}

// ============================================================================
// Wildcards and digests
// ============================================================================

TEST_CASE("wildcard_match follows shell patterns") {
    CHECK(lpkgm::wildcard_match("*", "tcl"));
    CHECK(lpkgm::wildcard_match("tcl*", "tcllib"));
    CHECK(lpkgm::wildcard_match("8.6.?", "8.6.1"));
    CHECK(lpkgm::wildcard_match("lib[fb]oo", "libboo"));
    CHECK_FALSE(lpkgm::wildcard_match("tcl", "tcllib"));
    CHECK_FALSE(lpkgm::wildcard_match("8.6.?", "8.6.13"));
}

TEST_CASE("fnv1a_hex is stable and 16 hex digits") {
    auto a = lpkgm::fnv1a_hex("libfoo");
    CHECK(a.size() == 16);
    CHECK(a == lpkgm::fnv1a_hex("libfoo"));
    CHECK(a != lpkgm::fnv1a_hex("libbar"));
    CHECK(lpkgm::fnv1a_hex("") == "cbf29ce484222325");
}
