#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lpkgm {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content through a synced sibling file renamed over path
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

// Append lines to a text file, creating it if missing. Never truncates.
// Each line is terminated by '\n'; the file is fsync'ed before returning.
AtomicWriteResult append_lines(const std::string& path, const std::vector<std::string>& lines);

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes
std::string to_portable_path(const std::string& path);

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Get the filename from a path
std::string get_filename(const std::string& path);

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

// Check if a path exists (does not follow a dangling symlink)
bool path_exists(const std::string& path);

// Check if a path is a directory
bool is_directory(const std::string& path);

// Check if a path resolves to a regular file, following symlinks.
// Missing parents, dangling links and permission errors all yield false.
bool resolves_to_regular_file(const std::string& path);

// Check if a path is a symlink
bool is_symlink(const std::string& path);

// List directory entries (file names only)
std::vector<std::string> list_directory(const std::string& path);

// Read a whole file
std::optional<std::string> read_file(const std::string& path);

// Size of a regular file, following symlinks
std::optional<std::uintmax_t> file_size(const std::string& path);

// Create parent directories recursively
bool create_directories(const std::string& path);

// Remove a directory recursively; a missing directory is not an error
bool remove_directory(const std::string& path, std::string* error = nullptr);

// Remove a file or symlink
bool remove_file(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

// Get all environment variables as a map
std::unordered_map<std::string, std::string> get_all_env();

// Current working directory
std::string current_directory();

// System temporary directory
std::string temp_directory();

// Get current timestamp as ISO-8601 UTC string
std::string get_current_timestamp();

// 64-bit FNV-1a digest rendered as 16 lowercase hex characters
std::string fnv1a_hex(const std::string& data);

// Shell-style wildcard match (*, ?, [...])
bool wildcard_match(const std::string& pattern, const std::string& text);

} // namespace lpkgm
