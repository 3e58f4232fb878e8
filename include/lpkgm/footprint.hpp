#pragma once

#include <string>
#include <vector>

namespace lpkgm {

// ============================================================================
// Footprint Extraction
// ============================================================================

// Regular files a build places under an install root, as paths relative to
// that root with forward slashes, in lexicographic order.
struct FootprintResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> paths;
    // Entries that could not be inspected (permission errors, races)
    std::vector<std::string> anomalies;
};

// Walk install_root recursively without following symlinks and collect every
// regular file. Symlinks, directories and special files are not part of the
// footprint.
FootprintResult extract_footprint(const std::string& install_root);

} // namespace lpkgm
