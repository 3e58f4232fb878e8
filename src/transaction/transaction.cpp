#include "lpkgm/transaction.hpp"
#include "lpkgm/footprint.hpp"
#include "lpkgm/path_utils.hpp"
#include "lpkgm/platform.hpp"
#include "lpkgm/prefix_lock.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <string>

namespace lpkgm {

namespace {

// Keep probe names to a portable character set
std::string sanitize_component(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '.' || c == '_' || c == '-' || c == '+') {
            out += static_cast<char>(c);
        } else {
            out += '_';
        }
    }
    return out.empty() ? "_" : out;
}

// Owns the probe directory for one attempt. remove() is called explicitly
// right after footprint extraction; the destructor covers early returns.
class ProbeDirectory {
public:
    ProbeDirectory(std::string path, std::vector<std::string>& warnings)
        : path_(std::move(path)), warnings_(warnings) {}

    ~ProbeDirectory() {
        if (!removed_) remove();
    }

    ProbeDirectory(const ProbeDirectory&) = delete;
    ProbeDirectory& operator=(const ProbeDirectory&) = delete;

    const std::string& path() const { return path_; }

    void remove() {
        removed_ = true;
        std::string error;
        if (!remove_directory(path_, &error)) {
            std::string msg = "ProbeCleanupFailed: could not remove " + path_ + ": " + error;
            spdlog::warn("{}", msg);
            warnings_.push_back(msg);
            return;
        }
        spdlog::debug("Probe directory {} removed", path_);
    }

private:
    std::string path_;
    std::vector<std::string>& warnings_;
    bool removed_ = false;
};

// Creates the manifest directory when missing
AtomicWriteResult record_manifest(const std::string& manifest_path,
                                  const std::vector<std::string>& files) {
    auto manifest_dir = get_parent_directory(manifest_path);
    if (!manifest_dir.empty() && !create_directories(manifest_dir)) {
        AtomicWriteResult result;
        result.error = "cannot create manifest directory " + manifest_dir;
        return result;
    }
    return append_lines(manifest_path, files);
}

TransactionResult& fail(TransactionResult& result, TransactionError error, std::string message) {
    result.ok = false;
    result.error = error;
    result.message = std::move(message);
    spdlog::error("{}", result.message);
    return result;
}

} // namespace

const char* transaction_error_to_string(TransactionError error) {
    switch (error) {
        case TransactionError::None: return "None";
        case TransactionError::InvalidOptions: return "InvalidOptions";
        case TransactionError::InvalidPrefix: return "InvalidPrefix";
        case TransactionError::PrefixLocked: return "PrefixLocked";
        case TransactionError::BuildFailed: return "BuildFailed";
        case TransactionError::CollisionDetected: return "CollisionDetected";
        case TransactionError::IncompleteInstall: return "IncompleteInstall";
        case TransactionError::ManifestWriteFailed: return "ManifestWriteFailed";
    }
    return "Unknown";
}

const char* transaction_phase_to_string(TransactionPhase phase) {
    switch (phase) {
        case TransactionPhase::Setup: return "setup";
        case TransactionPhase::Discovery: return "discovery";
        case TransactionPhase::Extraction: return "extraction";
        case TransactionPhase::CollisionCheck: return "collision-check";
        case TransactionPhase::Commit: return "commit";
        case TransactionPhase::Verification: return "verification";
        case TransactionPhase::Done: return "done";
    }
    return "unknown";
}

std::string probe_directory_path(const std::string& probe_base,
                                 const std::string& package,
                                 const std::string& version,
                                 const std::string& prefix) {
    std::string base = probe_base.empty() ? temp_directory() : probe_base;
    std::string key = package;
    key += '\0';
    key += version;
    key += '\0';
    key += prefix;
    std::string token = fnv1a_hex(key).substr(0, 12);
    return join_path(base, "lpkgm-" + sanitize_component(package) + "-" +
                               sanitize_component(version) + "." + token + ".probe");
}

std::string find_collision(const std::string& prefix,
                           const std::vector<std::string>& footprint) {
    for (const auto& rel : footprint) {
        std::string target = join_path(prefix, rel);
        if (resolves_to_regular_file(target)) {
            return target;
        }
    }
    return {};
}

InstallTransaction::InstallTransaction(BuildDriver& driver) : driver_(driver) {}

TransactionResult InstallTransaction::install(const std::string& build_source,
                                              const std::string& prefix,
                                              const BuildConfig& config,
                                              const TransactionOptions& options) {
    TransactionResult result;
    result.phase = TransactionPhase::Setup;

    if (options.package.empty() || options.version.empty()) {
        return fail(result, TransactionError::InvalidOptions,
                    "package name and version are required");
    }
    for (const auto* component : {&options.package, &options.version}) {
        auto checked = validate_path_component(*component);
        if (!checked.ok) {
            return fail(result, TransactionError::InvalidOptions,
                        "invalid package name or version \"" + *component + "\": " +
                            path_error_to_string(checked.error));
        }
    }
    if (!options.dry_run && options.manifest_path.empty()) {
        return fail(result, TransactionError::InvalidOptions, "manifest path is required");
    }

    auto checked = validate_prefix(prefix);
    if (!checked.ok) {
        return fail(result, TransactionError::InvalidPrefix,
                    "invalid prefix \"" + prefix + "\": " + path_error_to_string(checked.error));
    }
    const std::string root = checked.path;
    result.manifest_path = options.manifest_path;

    PrefixLock lock(options.lock_path.empty() ? default_lock_path(root) : options.lock_path);
    if (!lock.locked()) {
        return fail(result, TransactionError::PrefixLocked, lock.error());
    }

    // ------------------------------------------------------------------
    // Discovery
    // ------------------------------------------------------------------
    result.phase = TransactionPhase::Discovery;
    result.probe_dir = probe_directory_path(options.probe_base, options.package,
                                            options.version, root);

    if (path_exists(result.probe_dir)) {
        spdlog::info("Removing stale probe directory {}", result.probe_dir);
        std::string error;
        if (!remove_directory(result.probe_dir, &error)) {
            return fail(result, TransactionError::BuildFailed,
                        "cannot remove stale probe directory " + result.probe_dir + ": " + error);
        }
    }
    if (!create_directories(result.probe_dir)) {
        return fail(result, TransactionError::BuildFailed,
                    "cannot create probe directory " + result.probe_dir);
    }

    ProbeDirectory probe(result.probe_dir, result.warnings);

    spdlog::info("Installing {}/{} into probe directory {}", options.package,
                 options.version, probe.path());
    auto probe_build = driver_.install_into(build_source, probe.path(), config);
    if (!probe_build.ok) {
        probe.remove();
        return fail(result, TransactionError::BuildFailed,
                    "probe build failed: " + probe_build.error);
    }

    // ------------------------------------------------------------------
    // Footprint extraction
    // ------------------------------------------------------------------
    result.phase = TransactionPhase::Extraction;
    auto footprint = extract_footprint(probe.path());
    probe.remove();

    for (const auto& a : footprint.anomalies) {
        result.warnings.push_back("footprint anomaly: " + a);
    }
    if (!footprint.ok) {
        return fail(result, TransactionError::BuildFailed,
                    "footprint extraction failed: " + footprint.error);
    }
    result.footprint = std::move(footprint.paths);

    if (result.footprint.empty()) {
        std::string msg = "build of " + options.package + "/" + options.version +
                          " installs no files";
        spdlog::warn("{}", msg);
        result.warnings.push_back(msg);
    }
    spdlog::info("Footprint: {} file(s)", result.footprint.size());

    // ------------------------------------------------------------------
    // Collision check
    // ------------------------------------------------------------------
    result.phase = TransactionPhase::CollisionCheck;
    for (const auto& rel : result.footprint) {
        auto target = normalize_under_root(root, rel);
        if (!target.ok) {
            return fail(result, TransactionError::BuildFailed,
                        "footprint entry \"" + rel + "\" is not a path under the prefix: " +
                            path_error_to_string(target.error));
        }
    }

    auto collision = find_collision(root, result.footprint);
    if (!collision.empty()) {
        result.offending_path = collision;
        return fail(result, TransactionError::CollisionDetected,
                    "file " + collision + " already exists (refusing overwrite)");
    }

    if (options.dry_run) {
        spdlog::info("Dry run: {} file(s) would be installed into {}",
                     result.footprint.size(), root);
        result.phase = TransactionPhase::Done;
        result.ok = true;
        return result;
    }

    // ------------------------------------------------------------------
    // Commit
    // ------------------------------------------------------------------
    result.phase = TransactionPhase::Commit;
    result.prefix_modified = true;
    if (!create_directories(root)) {
        return fail(result, TransactionError::BuildFailed, "cannot create prefix " + root);
    }

    spdlog::info("Installing {}/{} into {}", options.package, options.version, root);
    auto commit_build = driver_.install_into(build_source, root, config);
    if (!commit_build.ok) {
        // The prefix may already hold part of the footprint; record what landed
        for (const auto& rel : result.footprint) {
            std::string target = join_path(root, rel);
            if (resolves_to_regular_file(target)) {
                result.installed_files.push_back(target);
            } else if (result.offending_path.empty()) {
                result.offending_path = target;
            }
        }
        if (!result.installed_files.empty()) {
            auto recorded = record_manifest(options.manifest_path, result.installed_files);
            if (!recorded.ok) {
                result.warnings.push_back("manifest not written: " + recorded.error);
            }
        }
        return fail(result, TransactionError::IncompleteInstall,
                    "build into prefix failed: " + commit_build.error + "; " +
                        std::to_string(result.installed_files.size()) + " of " +
                        std::to_string(result.footprint.size()) +
                        " file(s) were installed and recorded in " + options.manifest_path +
                        "; prefix " + root + " is partially populated and needs manual cleanup");
    }

    // ------------------------------------------------------------------
    // Verification and manifest
    // ------------------------------------------------------------------
    result.phase = TransactionPhase::Verification;
    std::string missing;
    for (const auto& rel : result.footprint) {
        std::string target = join_path(root, rel);
        if (!resolves_to_regular_file(target)) {
            missing = target;
            break;
        }
        result.installed_files.push_back(target);
    }

    // Paths verified before a missing one are recorded as well
    auto appended = record_manifest(options.manifest_path, result.installed_files);

    if (!missing.empty()) {
        result.offending_path = missing;
        if (!appended.ok) {
            result.warnings.push_back("manifest not written: " + appended.error);
        }
        return fail(result, TransactionError::IncompleteInstall,
                    "file " + missing + " does not exist or is not a file "
                    "(assumed to be installed); prefix " + root +
                    " is partially populated and needs manual cleanup");
    }

    if (!appended.ok) {
        return fail(result, TransactionError::ManifestWriteFailed, appended.error);
    }

    spdlog::info("Installed {} file(s); manifest {}", result.installed_files.size(),
                 options.manifest_path);
    result.phase = TransactionPhase::Done;
    result.ok = true;
    return result;
}

TransactionResult install(BuildDriver& driver,
                          const std::string& build_source,
                          const std::string& prefix,
                          const BuildConfig& config,
                          const TransactionOptions& options) {
    InstallTransaction transaction(driver);
    return transaction.install(build_source, prefix, config, options);
}

} // namespace lpkgm
