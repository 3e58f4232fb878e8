/**
 * lpkgm CLI - Common utilities and types
 */

#pragma once

#include <lpkgm/platform.hpp>
#include <lpkgm/settings.hpp>
#include <lpkgm/transaction.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lpkgm::cli {

/**
 * Exit codes. Stable; scripts driving installs branch on them.
 */
enum ExitCode : int {
    kExitOk = 0,
    kExitUsage = 1,           // usage, configuration, refused operation
    kExitBuildFailed = 2,
    kExitCollision = 3,
    kExitIncomplete = 4,
    kExitWriteFailed = 5,     // manifest or registry record
    kExitPrefixLocked = 6,
    kExitInvalidPrefix = 7,
};

inline int exit_code_for(TransactionError error) {
    switch (error) {
        case TransactionError::None: return kExitOk;
        case TransactionError::InvalidOptions: return kExitUsage;
        case TransactionError::InvalidPrefix: return kExitInvalidPrefix;
        case TransactionError::PrefixLocked: return kExitPrefixLocked;
        case TransactionError::BuildFailed: return kExitBuildFailed;
        case TransactionError::CollisionDetected: return kExitCollision;
        case TransactionError::IncompleteInstall: return kExitIncomplete;
        case TransactionError::ManifestWriteFailed: return kExitWriteFailed;
    }
    return kExitUsage;
}

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string settings;              // -c, --settings
    std::vector<std::string> defines;  // -D, --define key=value
    bool json = false;                 // --json
    bool verbose = false;              // -v, --verbose
    bool quiet = false;                // -q, --quiet
    std::string log_file;              // --log-file
};

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static WarningCollector collector;
    return collector;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_warning(const std::string& msg) {
    get_warning_collector().add(msg);
}

inline void print_success(const std::string& msg, bool json_mode) {
    if (!json_mode) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

inline void init_warning_collector(bool json_mode, bool quiet) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
    collector.quiet = quiet;
}

/**
 * Configure the default logger: stderr, plus --log-file when given.
 * Level: -v (debug) > -q (warn) > LPKGM_LOGLEVEL > `fallback`.
 */
inline bool init_logging(const GlobalOptions& opts,
                         spdlog::level::level_enum fallback = spdlog::level::info) {
    auto level = fallback;
    if (auto env = get_env("LPKGM_LOGLEVEL")) {
        auto parsed = spdlog::level::from_str(*env);
        if (parsed != spdlog::level::off || *env == "off") {
            level = parsed;
        }
    }
    if (opts.quiet) level = spdlog::level::warn;
    if (opts.verbose) level = spdlog::level::debug;

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!opts.log_file.empty()) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(opts.log_file);
            file_sink->set_level(spdlog::level::debug);
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            print_error("cannot open log file " + opts.log_file + ": " + e.what(), opts.json);
            return false;
        }
    }

    auto logger = std::make_shared<spdlog::logger>("lpkgm", sinks.begin(), sinks.end());
    sinks.front()->set_level(level);
    logger->set_level(opts.log_file.empty() ? level : std::min(level, spdlog::level::debug));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    return true;
}

/**
 * Parse -D key=value definitions. Returns false and sets `error` on a
 * malformed entry.
 */
inline bool parse_defines(const std::vector<std::string>& defines,
                          Definitions& out,
                          std::string& error) {
    for (const auto& d : defines) {
        auto eq = d.find('=');
        if (eq == std::string::npos || eq == 0) {
            error = "bad definition \"" + d + "\" (expected key=value)";
            return false;
        }
        out[d.substr(0, eq)] = d.substr(eq + 1);
    }
    return true;
}

/**
 * Load the settings file named by -c, LPKGM_SETTINGS or the default
 * location, with -D overrides applied. Prints errors and warnings.
 */
inline std::optional<Settings> load_cli_settings(const GlobalOptions& opts) {
    Definitions overrides;
    std::string error;
    if (!parse_defines(opts.defines, overrides, error)) {
        print_error(error, opts.json);
        return std::nullopt;
    }

    auto path = resolve_settings_path(opts.settings);
    auto result = load_settings_file(path, overrides);
    for (const auto& w : result.warnings) {
        print_warning(w);
    }
    if (!result.ok) {
        print_error("settings " + path + ": " + result.error, opts.json);
        return std::nullopt;
    }
    return std::move(result.settings);
}

/**
 * Platform for commands that act on one platform tree.
 */
inline std::optional<std::string> require_platform(const Settings& settings,
                                                   const GlobalOptions& opts) {
    auto platform = selected_platform(settings);
    if (!platform) {
        print_error("no platform selected (use -Dplatform=<id> or LPKGM_PLATFORM)", opts.json);
    }
    return platform;
}

/**
 * Human-readable size ("1.5 MiB").
 */
inline std::string format_size(std::uintmax_t size) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(size);
    size_t unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    char buf[32];
    if (unit == 0) {
        std::snprintf(buf, sizeof(buf), "%ju %s", size, units[unit]);
    } else {
        std::snprintf(buf, sizeof(buf), "%.1f %s", value, units[unit]);
    }
    return buf;
}

} // namespace lpkgm::cli
