#include "lpkgm/registry.hpp"
#include "lpkgm/path_utils.hpp"
#include "lpkgm/platform.hpp"
#include "lpkgm/prefix_lock.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <optional>
#include <set>

namespace lpkgm {

namespace fs = std::filesystem;

namespace {

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_hidden(const std::string& name) {
    return !name.empty() && name[0] == '.';
}

bool is_strictly_under(const std::string& path, const std::string& root) {
    if (root.empty()) return false;
    std::string r = root;
    if (r.back() != '/') r += '/';
    return path.size() > r.size() && path.compare(0, r.size(), r) == 0;
}

bool is_empty_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec) && fs::is_empty(path, ec) && !ec;
}

} // namespace

InstallRecordParseResult parse_install_record(const std::string& json_str,
                                              const std::string& source_path) {
    InstallRecordParseResult result;
    auto& record = result.record;
    record.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        if (auto package = get_string(j, "package")) {
            record.package = *package;
        } else {
            result.error = "package missing";
            return result;
        }

        if (j.contains("version") && j["version"].is_object()) {
            if (auto full = get_string(j["version"], "fullVersion")) {
                record.version = *full;
            }
        } else if (auto version = get_string(j, "version")) {
            record.version = *version;
        }
        if (record.version.empty()) {
            result.error = "version missing";
            return result;
        }

        record.installed_at = get_string(j, "installedAt").value_or("");
        record.prefix = get_string(j, "prefix").value_or("");
        record.manifest = get_string(j, "manifest").value_or("");

        if (j.contains("fsEntries") && j["fsEntries"].is_array()) {
            for (const auto& entry : j["fsEntries"]) {
                if (entry.is_string()) {
                    record.fs_entries.push_back(entry.get<std::string>());
                }
            }
        }

        if (j.contains("stats") && j["stats"].is_object()) {
            const auto& stats = j["stats"];
            if (stats.contains("size") && stats["size"].is_number_unsigned()) {
                record.stats.size = stats["size"].get<std::uintmax_t>();
            }
            if (stats.contains("nFiles") && stats["nFiles"].is_number_unsigned()) {
                record.stats.n_files = stats["nFiles"].get<std::uint64_t>();
            }
        }

        result.ok = true;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON parse error: ") + e.what();
    }

    return result;
}

InstallRecordParseResult load_install_record(const std::string& path) {
    auto content = read_file(path);
    if (!content) {
        InstallRecordParseResult result;
        result.error = "cannot read " + path;
        return result;
    }
    return parse_install_record(*content, path);
}

std::string serialize_install_record(const InstallRecord& record) {
    nlohmann::json j;
    j["package"] = record.package;
    j["version"]["fullVersion"] = record.version;
    j["installedAt"] = record.installed_at;
    j["prefix"] = record.prefix;
    j["manifest"] = record.manifest;
    j["fsEntries"] = record.fs_entries;
    j["stats"]["size"] = record.stats.size;
    j["stats"]["nFiles"] = record.stats.n_files;
    return j.dump(2) + "\n";
}

RegistryWriteResult write_install_record(const std::string& path, const InstallRecord& record) {
    RegistryWriteResult result;

    auto dir = get_parent_directory(path);
    if (!dir.empty() && !create_directories(dir)) {
        result.error = "cannot create registry directory " + dir;
        return result;
    }

    auto written = atomic_write_file(path, serialize_install_record(record));
    if (!written.ok) {
        result.error = written.error;
        return result;
    }

    result.ok = true;
    return result;
}

InstallStats compute_stats(const std::vector<std::string>& files) {
    InstallStats stats;
    for (const auto& f : files) {
        if (!resolves_to_regular_file(f)) continue;
        if (auto size = file_size(f)) {
            stats.size += *size;
        }
        ++stats.n_files;
    }
    return stats;
}

std::string record_path(const std::string& registry_dir,
                        const std::string& package,
                        const std::string& version) {
    return join_path(join_path(registry_dir, package), version + ".json");
}

std::string manifest_path(const std::string& registry_dir,
                          const std::string& package,
                          const std::string& version) {
    return join_path(join_path(registry_dir, package), version + ".files");
}

std::vector<std::string> list_installed_packages(const std::string& registry_dir) {
    std::vector<std::string> out;
    for (const auto& name : list_directory(registry_dir)) {
        if (is_hidden(name)) continue;
        auto dir = join_path(registry_dir, name);
        if (!is_directory(dir) || is_empty_directory(dir)) continue;
        out.push_back(name);
    }
    return out;
}

std::vector<std::string> list_installed_versions(const std::string& registry_dir,
                                                 const std::string& package) {
    std::vector<std::string> out;
    auto dir = join_path(registry_dir, package);
    for (const auto& name : list_directory(dir)) {
        if (is_hidden(name) || !ends_with(name, ".json")) continue;
        auto record = load_install_record(join_path(dir, name));
        if (!record.ok) {
            spdlog::debug("Skipping {}: {}", name, record.error);
            continue;
        }
        out.push_back(record.record.version);
    }
    return out;
}

RecordQueryResult find_install_records(const std::string& registry_dir, const RecordQuery& query) {
    RecordQueryResult result;

    for (const auto& package : list_installed_packages(registry_dir)) {
        if (!wildcard_match(query.name_pattern, package)) continue;

        auto dir = join_path(registry_dir, package);
        for (const auto& name : list_directory(dir)) {
            if (is_hidden(name) || !ends_with(name, ".json")) continue;

            auto path = join_path(dir, name);
            auto parsed = load_install_record(path);
            if (!parsed.ok) {
                result.warnings.push_back("file \"" + path +
                                          "\" does not seem to be a package record (ignored): " +
                                          parsed.error);
                continue;
            }
            const auto& record = parsed.record;
            if (!wildcard_match(query.version_pattern, record.version)) continue;

            bool excluded = std::any_of(
                query.excludes.begin(), query.excludes.end(),
                [&](const std::pair<std::string, std::string>& ex) {
                    return wildcard_match(ex.first, record.package) &&
                           wildcard_match(ex.second, record.version);
                });
            if (excluded) continue;

            result.records.push_back(record);
        }
    }

    return result;
}

RemovalResult remove_installed_package(const InstallRecord& record) {
    RemovalResult result;

    auto checked = validate_prefix(record.prefix);
    if (!checked.ok) {
        result.error = "invalid prefix \"" + record.prefix + "\" in record: " +
                       path_error_to_string(checked.error);
        return result;
    }
    const std::string prefix = checked.path;

    PrefixLock lock(default_lock_path(prefix));
    if (!lock.locked()) {
        result.prefix_locked = true;
        result.error = lock.error();
        return result;
    }

    std::set<std::string> dirs;

    for (const auto& listed : record.fs_entries) {
        auto entry = fs::path(listed).lexically_normal().generic_string();
        if (!is_strictly_under(entry, prefix)) {
            result.warnings.push_back("outside prefix " + prefix + ", skipped: " + listed);
            continue;
        }

        std::error_code ec;
        auto st = fs::symlink_status(entry, ec);
        if (ec || !fs::exists(st)) {
            result.warnings.push_back("already missing: " + entry);
            continue;
        }

        if (fs::is_directory(st)) {
            dirs.insert(entry);
            continue;
        }

        if (fs::is_symlink(st) || fs::is_regular_file(st)) {
            spdlog::debug("Deleting {}", entry);
            if (!fs::remove(entry, ec) || ec) {
                result.error = "cannot delete " + entry + (ec ? ": " + ec.message() : "");
                return result;
            }
            ++result.removed_files;
            dirs.insert(get_parent_directory(entry));
            continue;
        }

        result.warnings.push_back("unknown type of filesystem entry: " + entry);
    }

    // Longest paths first so children go before their parents
    std::vector<std::string> ordered(dirs.begin(), dirs.end());
    std::sort(ordered.begin(), ordered.end(),
              [](const std::string& a, const std::string& b) { return a.size() > b.size(); });

    for (auto dir : ordered) {
        while (is_strictly_under(dir, prefix) && is_empty_directory(dir)) {
            std::error_code ec;
            fs::remove(dir, ec);
            if (ec) {
                result.warnings.push_back("cannot remove directory " + dir + ": " + ec.message());
                break;
            }
            spdlog::debug("Removed empty directory {}", dir);
            ++result.removed_dirs;
            dir = get_parent_directory(dir);
        }
    }

    if (!record.manifest.empty() && path_exists(record.manifest)) {
        if (!remove_file(record.manifest)) {
            result.error = "cannot delete manifest " + record.manifest;
            return result;
        }
    }

    if (!record.source_path.empty()) {
        spdlog::info("Deleting package record {}", record.source_path);
        if (!remove_file(record.source_path)) {
            result.error = "cannot delete package record " + record.source_path;
            return result;
        }
    }

    result.ok = true;
    return result;
}

} // namespace lpkgm
