#pragma once

#include <string>

namespace lpkgm {

enum class PathError {
    None,
    Empty,
    ContainsNul,
    NotAbsolute,
    AbsoluteNotAllowed,
    EscapesRoot,
    IsRoot,
    NotAComponent,
};

struct PathResult {
    bool ok;
    std::string path;  // normalized absolute path when ok
    PathError error;
};

const char* path_error_to_string(PathError error);

// Normalize a path relative to a root without following symlinks (string-based).
// - Rejects NUL bytes
// - Rejects absolute relative_path when allow_absolute is false
// - Collapses "." and ".." segments
// - Fails if resulting path would escape root
PathResult normalize_under_root(const std::string& root,
                                const std::string& relative_path,
                                bool allow_absolute = false);

// Check that an install prefix is well formed: non-empty, absolute, free of
// NUL bytes and not the filesystem root. Returns the lexically normalized
// path without a trailing slash.
PathResult validate_prefix(const std::string& prefix);

// Check that a package name or version can be used as one path component:
// non-empty, no NUL, no '/', and neither "." nor "..".
PathResult validate_path_component(const std::string& component);

} // namespace lpkgm
