#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace lpkgm {

// ============================================================================
// Install Record
// ============================================================================
//
// One JSON file per installed package version:
//   <registry>/<package>/<version>.json
// next to the plain-text manifest
//   <registry>/<package>/<version>.files

struct InstallStats {
    std::uintmax_t size = 0;
    std::uint64_t n_files = 0;
};

struct InstallRecord {
    std::string package;
    std::string version;       // version.fullVersion
    std::string installed_at;  // ISO-8601 UTC
    std::string prefix;
    std::string manifest;      // path of the .files manifest
    std::vector<std::string> fs_entries;
    InstallStats stats;

    // Path the record was loaded from
    std::string source_path;
};

struct InstallRecordParseResult {
    bool ok = false;
    std::string error;
    InstallRecord record;
};

// Parse an install record from JSON. "version" may be an object with
// "fullVersion" or a plain string.
InstallRecordParseResult parse_install_record(const std::string& json_str,
                                              const std::string& source_path = "");

InstallRecordParseResult load_install_record(const std::string& path);

std::string serialize_install_record(const InstallRecord& record);

struct RegistryWriteResult {
    bool ok = false;
    std::string error;
};

// Atomic write; creates the package directory when missing
RegistryWriteResult write_install_record(const std::string& path, const InstallRecord& record);

// Sum sizes of the regular files among the given paths
InstallStats compute_stats(const std::vector<std::string>& files);

// ============================================================================
// Registry Layout
// ============================================================================

std::string record_path(const std::string& registry_dir,
                        const std::string& package,
                        const std::string& version);

std::string manifest_path(const std::string& registry_dir,
                          const std::string& package,
                          const std::string& version);

// Non-hidden, non-empty package directories
std::vector<std::string> list_installed_packages(const std::string& registry_dir);

// version.fullVersion of every non-hidden *.json record of a package.
// Unreadable records are skipped.
std::vector<std::string> list_installed_versions(const std::string& registry_dir,
                                                 const std::string& package);

struct RecordQuery {
    std::string name_pattern = "*";     // shell wildcard
    std::string version_pattern = "*";  // shell wildcard
    // (name, version) wildcard pairs to leave out
    std::vector<std::pair<std::string, std::string>> excludes;
};

struct RecordQueryResult {
    std::vector<InstallRecord> records;
    std::vector<std::string> warnings;
};

RecordQueryResult find_install_records(const std::string& registry_dir, const RecordQuery& query);

// ============================================================================
// Removal
// ============================================================================

struct RemovalResult {
    bool ok = false;
    std::string error;
    std::uint64_t removed_files = 0;
    std::uint64_t removed_dirs = 0;
    std::vector<std::string> warnings;

    // Another transaction holds the prefix lock; nothing was touched
    bool prefix_locked = false;
};

// Delete every file and symlink listed in the record, prune directories left
// empty (never the prefix itself or anything above it), then delete the
// manifest and the record. On failure the record is kept.
// Holds the prefix lock throughout. Entries outside the prefix are skipped
// with a warning.
RemovalResult remove_installed_package(const InstallRecord& record);

} // namespace lpkgm
