#pragma once

#include "lpkgm/build_driver.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lpkgm {

// ============================================================================
// Settings
// ============================================================================

using Definitions = std::map<std::string, std::string>;

struct PackageDefinition {
    std::string name;
    std::vector<std::string> build;          // command tokens, may use {prefix}
    std::string source_dir;                  // default "{pwd}"
    std::string prefix;                      // default "{root}/{platform}"
    std::map<std::string, std::string> environment;
    std::vector<std::string> version_regex;  // empty: any version accepted
    std::vector<std::string> versions;       // offered by completion
    std::string source_path;                 // file the definition came from
};

struct Settings {
    std::string root;
    Definitions definitions;
    std::string registry_dir;    // template, default "{root}/{platform}/.packages"
    std::string tmp_dir_prefix;  // empty: system temp directory
    std::string log_dir;         // template, default "{root}/.lpkgm-logs"
    std::map<std::string, PackageDefinition> packages;
    std::string source_path;
};

struct SettingsParseResult {
    bool ok = false;
    std::string error;
    Settings settings;
    std::vector<std::string> warnings;
};

// Parse settings from a JSON string. `overrides` are -D key=value definitions
// and take precedence over the file's "definitions".
SettingsParseResult parse_settings(const std::string& json_str,
                                   const Definitions& overrides = {},
                                   const std::string& source_path = "");

// Read and parse a settings file
SettingsParseResult load_settings_file(const std::string& path,
                                       const Definitions& overrides = {});

// Settings file location: explicit path > LPKGM_SETTINGS > ./lpkgm-settings.json
std::string resolve_settings_path(const std::string& explicit_path);

// ============================================================================
// String Interpolation
// ============================================================================

struct InterpolationResult {
    bool ok = false;
    std::string error;
    std::string value;
};

// Replace "{name}" references from definitions, then expand $VAR / ${VAR}
// from the environment. "{{" and "}}" are literal braces. Unknown "{name}"
// references are an error.
InterpolationResult interpolate(const std::string& text, const Definitions& definitions);

// Expand definitions that reference each other until nothing changes.
// Fails on unknown references or when no fixed point is reached
// (cyclic definitions).
struct DefinitionsResult {
    bool ok = false;
    std::string error;
    Definitions definitions;
};

DefinitionsResult expand_definitions(const Definitions& definitions);

// ============================================================================
// Package Resolution
// ============================================================================

// Packages whose name matches a shell wildcard
std::vector<const PackageDefinition*> match_packages(const Settings& settings,
                                                     const std::string& name_pattern);

// True when the version matches one of the package's version-regex entries,
// or when the package declares none
bool version_accepted(const PackageDefinition& package, const std::string& version);

// Definitions for one package operation: settings definitions plus root,
// platform, name and version
Definitions package_definitions(const Settings& settings,
                                const std::string& platform,
                                const std::string& name,
                                const std::string& version);

// Fully interpolated inputs of one installation
struct ResolvedInstall {
    bool ok = false;
    std::string error;
    std::string build_source;
    std::string prefix;
    std::string registry_dir;
    BuildConfig build_config;
};

ResolvedInstall resolve_install(const Settings& settings,
                                const PackageDefinition& package,
                                const std::string& platform,
                                const std::string& version);

// Platform selected by the "platform" definition (-Dplatform=...), else
// LPKGM_PLATFORM
std::optional<std::string> selected_platform(const Settings& settings);

// Registry directory for a platform
std::optional<std::string> registry_dir_for(const Settings& settings, const std::string& platform);

// Log directory
std::optional<std::string> log_dir_for(const Settings& settings);

} // namespace lpkgm
