#include "lpkgm/settings.hpp"
#include "lpkgm/platform.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <regex>

namespace lpkgm {

namespace {

constexpr int kMaxExpansionPasses = 32;

const char* kDefaultRegistryDir = "{root}/{platform}/.packages";
const char* kDefaultLogDir = "{root}/.lpkgm-logs";
const char* kDefaultPrefix = "{root}/{platform}";
const char* kDefaultSourceDir = "{pwd}";

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// Helper to safely get a string array from JSON; a single string is accepted
// as a one-element array
std::vector<std::string> get_string_array(const nlohmann::json& j, const std::string& key) {
    std::vector<std::string> result;
    if (!j.contains(key)) return result;
    const auto& v = j[key];
    if (v.is_string()) {
        result.push_back(v.get<std::string>());
    } else if (v.is_array()) {
        for (const auto& elem : v) {
            if (elem.is_string()) {
                result.push_back(elem.get<std::string>());
            }
        }
    }
    return result;
}

std::map<std::string, std::string> get_string_map(const nlohmann::json& j, const std::string& key) {
    std::map<std::string, std::string> result;
    if (j.contains(key) && j[key].is_object()) {
        for (auto& [k, v] : j[key].items()) {
            if (v.is_string()) {
                result[k] = v.get<std::string>();
            }
        }
    }
    return result;
}

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Single left-to-right substitution pass. Inserted values are not rescanned.
bool substitute(const std::string& text, const Definitions& definitions,
                bool unescape, std::string& out, std::string& error) {
    out.clear();
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];

        if (c == '{' || c == '}') {
            if (i + 1 < text.size() && text[i + 1] == c) {
                if (unescape) {
                    out += c;
                } else {
                    out += c;
                    out += c;
                }
                ++i;
                continue;
            }
            if (c == '}') {
                error = "unbalanced '}' in \"" + text + "\"";
                return false;
            }
            auto close = text.find('}', i + 1);
            if (close == std::string::npos) {
                error = "unterminated '{' in \"" + text + "\"";
                return false;
            }
            std::string name = text.substr(i + 1, close - i - 1);
            auto it = definitions.find(name);
            if (it == definitions.end()) {
                error = "undefined reference {" + name + "} in \"" + text + "\"";
                return false;
            }
            out += it->second;
            i = close;
            continue;
        }

        if (c == '$' && i + 1 < text.size()) {
            size_t start = i + 1;
            size_t end = start;
            bool braced = text[start] == '{';
            if (braced) {
                end = text.find('}', start + 1);
                if (end == std::string::npos) {
                    out += c;
                    continue;
                }
                std::string var = text.substr(start + 1, end - start - 1);
                auto value = get_env(var);
                if (value) {
                    out += *value;
                } else {
                    out += text.substr(i, end - i + 1);
                }
                i = end;
                continue;
            }
            while (end < text.size() && is_name_char(text[end])) ++end;
            if (end == start) {
                out += c;
                continue;
            }
            std::string var = text.substr(start, end - start);
            auto value = get_env(var);
            if (value) {
                out += *value;
            } else {
                out += text.substr(i, end - i);
            }
            i = end - 1;
            continue;
        }

        out += c;
    }
    return true;
}

// Python-style named groups "(?P<name>" are accepted for compatibility with
// existing settings files; std::regex has no named groups.
std::string strip_named_groups(const std::string& rx) {
    static const std::regex named(R"(\(\?P<[A-Za-z_][A-Za-z0-9_]*>)");
    return std::regex_replace(rx, named, "(");
}

bool parse_package(const std::string& name, const nlohmann::json& j,
                   const std::string& source_path, PackageDefinition& out,
                   std::string& error) {
    if (!j.is_object()) {
        error = "package \"" + name + "\" must be an object";
        return false;
    }

    out.name = name;
    out.source_path = source_path;
    out.build = get_string_array(j, "build");
    if (out.build.empty()) {
        error = "package \"" + name + "\" has no \"build\" command";
        return false;
    }
    out.source_dir = get_string(j, "source-dir").value_or(kDefaultSourceDir);
    out.prefix = get_string(j, "prefix").value_or(kDefaultPrefix);
    out.environment = get_string_map(j, "environment");
    out.version_regex = get_string_array(j, "version-regex");
    out.versions = get_string_array(j, "versions");

    for (const auto& rx : out.version_regex) {
        try {
            std::regex compiled(strip_named_groups(rx));
            (void)compiled;
        } catch (const std::regex_error& e) {
            error = "package \"" + name + "\": invalid version-regex \"" + rx + "\": " + e.what();
            return false;
        }
    }
    return true;
}

} // namespace

InterpolationResult interpolate(const std::string& text, const Definitions& definitions) {
    InterpolationResult result;
    if (!substitute(text, definitions, true, result.value, result.error)) {
        result.value.clear();
        return result;
    }
    result.ok = true;
    return result;
}

DefinitionsResult expand_definitions(const Definitions& definitions) {
    DefinitionsResult result;
    Definitions current = definitions;

    for (int pass = 0; pass < kMaxExpansionPasses; ++pass) {
        bool changed = false;
        Definitions next;
        for (const auto& [key, value] : current) {
            std::string expanded;
            std::string error;
            if (!substitute(value, current, false, expanded, error)) {
                result.error = "definition \"" + key + "\": " + error;
                return result;
            }
            if (expanded != value) changed = true;
            next[key] = std::move(expanded);
        }
        current = std::move(next);

        if (!changed) {
            for (auto& [key, value] : current) {
                std::string unescaped;
                std::string error;
                Definitions none;
                // Only escapes remain at this point
                if (!substitute(value, none, true, unescaped, error)) {
                    result.error = "definition \"" + key + "\": " + error;
                    return result;
                }
                value = std::move(unescaped);
            }
            result.definitions = std::move(current);
            result.ok = true;
            return result;
        }
    }

    result.error = "definitions do not converge after " +
                   std::to_string(kMaxExpansionPasses) + " passes (cyclic reference?)";
    return result;
}

SettingsParseResult parse_settings(const std::string& json_str,
                                   const Definitions& overrides,
                                   const std::string& source_path) {
    SettingsParseResult result;
    auto& settings = result.settings;
    settings.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        for (auto& [key, value] : j.items()) {
            (void)value;
            if (key != "root" && key != "definitions" && key != "packages" &&
                key != "packages-registry-dir" && key != "tmp-dir-prefix" &&
                key != "log-dir") {
                result.warnings.push_back("unknown settings key \"" + key + "\" ignored");
            }
        }

        // Definitions: file, then -D overrides, then built-ins
        Definitions defs = get_string_map(j, "definitions");
        for (const auto& [k, v] : overrides) {
            defs[k] = v;
        }
        if (defs.find("pwd") == defs.end()) {
            defs["pwd"] = current_directory();
        }

        auto root_template = get_string(j, "root");
        if (!root_template || root_template->empty()) {
            result.error = "\"root\" missing";
            return result;
        }
        // "root" is usable as a definition; a -Droot=... override wins
        if (defs.find("root") == defs.end()) {
            defs["root"] = *root_template;
        }

        auto expanded = expand_definitions(defs);
        if (!expanded.ok) {
            result.error = expanded.error;
            return result;
        }
        settings.definitions = std::move(expanded.definitions);
        settings.root = settings.definitions["root"];

        settings.registry_dir = get_string(j, "packages-registry-dir").value_or(kDefaultRegistryDir);
        settings.log_dir = get_string(j, "log-dir").value_or(kDefaultLogDir);
        if (auto tmp = get_string(j, "tmp-dir-prefix")) {
            auto value = interpolate(*tmp, settings.definitions);
            if (!value.ok) {
                result.error = "\"tmp-dir-prefix\": " + value.error;
                return result;
            }
            settings.tmp_dir_prefix = value.value;
        }

        // Packages: object keyed by name, or array of objects with "name"
        // and/or paths of JSON files holding one definition each
        if (j.contains("packages")) {
            const auto& pkgs = j["packages"];
            if (pkgs.is_object()) {
                for (auto& [name, def] : pkgs.items()) {
                    PackageDefinition pkg;
                    if (!parse_package(name, def, source_path, pkg, result.error)) {
                        return result;
                    }
                    settings.packages[name] = std::move(pkg);
                }
            } else if (pkgs.is_array()) {
                for (const auto& item : pkgs) {
                    nlohmann::json def = item;
                    std::string def_source = source_path;
                    if (item.is_string()) {
                        auto path = interpolate(item.get<std::string>(), settings.definitions);
                        if (!path.ok) {
                            result.error = "package file reference: " + path.error;
                            return result;
                        }
                        auto content = read_file(path.value);
                        if (!content) {
                            result.warnings.push_back("package definition file not found: " + path.value);
                            continue;
                        }
                        def = nlohmann::json::parse(*content);
                        def_source = path.value;
                    }
                    auto name = def.is_object() ? get_string(def, "name") : std::nullopt;
                    if (!name || name->empty()) {
                        result.error = "package definition without \"name\" in " + def_source;
                        return result;
                    }
                    PackageDefinition pkg;
                    if (!parse_package(*name, def, def_source, pkg, result.error)) {
                        return result;
                    }
                    settings.packages[*name] = std::move(pkg);
                }
            } else {
                result.error = "\"packages\" must be an object or an array";
                return result;
            }
        }

        if (settings.packages.empty()) {
            result.warnings.push_back("no package definitions loaded");
        }

        result.ok = true;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON parse error: ") + e.what();
    }

    return result;
}

SettingsParseResult load_settings_file(const std::string& path, const Definitions& overrides) {
    auto content = read_file(path);
    if (!content) {
        SettingsParseResult result;
        result.error = "Not a file: \"" + path + "\"";
        return result;
    }
    auto result = parse_settings(*content, overrides, path);
    if (result.ok) {
        spdlog::debug("{} package(s) known from {}", result.settings.packages.size(), path);
    }
    return result;
}

std::string resolve_settings_path(const std::string& explicit_path) {
    if (!explicit_path.empty()) {
        return explicit_path;
    }
    auto env_path = get_env("LPKGM_SETTINGS");
    if (env_path && !env_path->empty()) {
        return *env_path;
    }
    return "./lpkgm-settings.json";
}

std::vector<const PackageDefinition*> match_packages(const Settings& settings,
                                                     const std::string& name_pattern) {
    std::vector<const PackageDefinition*> out;
    for (const auto& [name, pkg] : settings.packages) {
        if (wildcard_match(name_pattern, name)) {
            out.push_back(&pkg);
        }
    }
    return out;
}

bool version_accepted(const PackageDefinition& package, const std::string& version) {
    if (package.version_regex.empty()) {
        return true;
    }
    for (const auto& rx : package.version_regex) {
        try {
            if (std::regex_match(version, std::regex(strip_named_groups(rx)))) {
                return true;
            }
        } catch (const std::regex_error& e) {
            spdlog::warn("Invalid version-regex \"{}\" for {}: {}", rx, package.name, e.what());
        }
    }
    return false;
}

Definitions package_definitions(const Settings& settings,
                                const std::string& platform,
                                const std::string& name,
                                const std::string& version) {
    Definitions defs = settings.definitions;
    defs["root"] = settings.root;
    if (!platform.empty()) {
        defs["platform"] = platform;
    }
    if (!name.empty()) {
        defs["name"] = name;
    }
    if (!version.empty()) {
        defs["version"] = version;
    }
    return defs;
}

ResolvedInstall resolve_install(const Settings& settings,
                                const PackageDefinition& package,
                                const std::string& platform,
                                const std::string& version) {
    ResolvedInstall result;
    auto defs = package_definitions(settings, platform, package.name, version);

    auto prefix = interpolate(package.prefix, defs);
    if (!prefix.ok) {
        result.error = "prefix: " + prefix.error;
        return result;
    }
    result.prefix = prefix.value;

    auto source = interpolate(package.source_dir, defs);
    if (!source.ok) {
        result.error = "source-dir: " + source.error;
        return result;
    }
    result.build_source = source.value;

    auto registry = interpolate(settings.registry_dir, defs);
    if (!registry.ok) {
        result.error = "packages-registry-dir: " + registry.error;
        return result;
    }
    result.registry_dir = registry.value;

    // The install root differs between the probe and the commit run; the
    // driver fills it in
    defs["prefix"] = "{prefix}";
    for (const auto& token : package.build) {
        auto value = interpolate(token, defs);
        if (!value.ok) {
            result.error = "build: " + value.error;
            return result;
        }
        result.build_config.command.push_back(value.value);
    }
    for (const auto& [key, token] : package.environment) {
        auto value = interpolate(token, defs);
        if (!value.ok) {
            result.error = "environment " + key + ": " + value.error;
            return result;
        }
        result.build_config.environment[key] = value.value;
    }

    result.ok = true;
    return result;
}

std::optional<std::string> selected_platform(const Settings& settings) {
    auto it = settings.definitions.find("platform");
    if (it != settings.definitions.end() && !it->second.empty()) {
        return it->second;
    }
    auto env = get_env("LPKGM_PLATFORM");
    if (env && !env->empty()) {
        return env;
    }
    return std::nullopt;
}

std::optional<std::string> registry_dir_for(const Settings& settings, const std::string& platform) {
    auto value = interpolate(settings.registry_dir, package_definitions(settings, platform, "", ""));
    if (!value.ok) return std::nullopt;
    return value.value;
}

std::optional<std::string> log_dir_for(const Settings& settings) {
    auto value = interpolate(settings.log_dir, package_definitions(settings, "", "", ""));
    if (!value.ok) return std::nullopt;
    return value.value;
}

} // namespace lpkgm
