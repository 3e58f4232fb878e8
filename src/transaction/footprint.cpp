#include "lpkgm/footprint.hpp"
#include "lpkgm/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>

namespace lpkgm {

namespace fs = std::filesystem;

FootprintResult extract_footprint(const std::string& install_root) {
    FootprintResult result;

    std::error_code ec;
    if (!fs::is_directory(install_root, ec)) {
        result.error = "install root is not a directory: " + install_root;
        return result;
    }

    fs::path root(install_root);
    auto it = fs::recursive_directory_iterator(root, ec);
    if (ec) {
        result.error = "cannot enumerate " + install_root + ": " + ec.message();
        return result;
    }

    // Iteration errors fail the extraction; per-entry stat errors are only recorded
    for (auto end = fs::recursive_directory_iterator(); it != end;) {
        std::error_code st_ec;
        auto st = it->symlink_status(st_ec);
        if (st_ec) {
            result.anomalies.push_back(it->path().string() + ": " + st_ec.message());
        } else if (fs::is_regular_file(st)) {
            auto rel = it->path().lexically_relative(root);
            result.paths.push_back(to_portable_path(rel.string()));
        }

        it.increment(ec);
        if (ec) {
            result.error = "enumeration of " + install_root + " failed: " + ec.message();
            result.paths.clear();
            return result;
        }
    }

    std::sort(result.paths.begin(), result.paths.end());

    for (const auto& a : result.anomalies) {
        spdlog::warn("Footprint anomaly under {}: {}", install_root, a);
    }

    result.ok = true;
    return result;
}

} // namespace lpkgm
