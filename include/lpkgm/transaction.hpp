#pragma once

#include "lpkgm/build_driver.hpp"

#include <string>
#include <vector>

namespace lpkgm {

// ============================================================================
// Installation Transaction (probe, check, commit, verify)
// ============================================================================
//
// 1. Run the build into a fresh probe directory.
// 2. Collect the footprint and delete the probe directory.
// 3. Refuse if any footprint path already resolves to a regular file under
//    the prefix.
// 4. Run the same build into the prefix.
// 5. Verify every footprint path exists and append it to the manifest.
//
// A failed commit build is IncompleteInstall: the footprint paths already in
// the prefix are appended to the manifest so they can be cleaned up.
//
// The prefix is guarded by a PrefixLock for the whole sequence. Nothing is
// retried or rolled back.

enum class TransactionError {
    None,
    InvalidOptions,       // missing package identity or manifest path
    InvalidPrefix,        // prefix not a well-formed absolute path
    PrefixLocked,         // another transaction holds the prefix lock
    BuildFailed,          // probe build failed; prefix untouched
    CollisionDetected,    // footprint path already present under prefix
    IncompleteInstall,    // commit build failed or a footprint path is missing (fatal)
    ManifestWriteFailed,  // could not append to the manifest (fatal)
};

enum class TransactionPhase {
    Setup,
    Discovery,
    Extraction,
    CollisionCheck,
    Commit,
    Verification,
    Done,
};

const char* transaction_error_to_string(TransactionError error);
const char* transaction_phase_to_string(TransactionPhase phase);

struct TransactionOptions {
    // Package identity; keys the probe directory name
    std::string package;
    std::string version;

    // Where probe directories are created (default: system temp directory)
    std::string probe_base;

    // Manifest file to append to (required unless dry_run)
    std::string manifest_path;

    // Lock file (default: default_lock_path(prefix))
    std::string lock_path;

    // Stop after the collision check
    bool dry_run = false;
};

struct TransactionResult {
    bool ok = false;
    TransactionError error = TransactionError::None;
    TransactionPhase phase = TransactionPhase::Setup;
    std::string message;

    // Offending path for CollisionDetected / IncompleteInstall (absolute);
    // first footprint path missing after a failed commit build
    std::string offending_path;

    std::string probe_dir;
    std::vector<std::string> footprint;        // relative to the install root
    std::vector<std::string> installed_files;  // absolute, as written to manifest
    std::string manifest_path;

    // ProbeCleanupFailed and footprint anomalies; never abort the transaction
    std::vector<std::string> warnings;

    // True once the commit run has started
    bool prefix_modified = false;
};

// Probe directory for a package/version/prefix triple:
// "<probe_base>/lpkgm-<package>-<version>.<token>.probe" where token is a
// digest of the whole triple. Different package/version pairs never share a
// probe directory; the same triple always maps to the same one.
std::string probe_directory_path(const std::string& probe_base,
                                 const std::string& package,
                                 const std::string& version,
                                 const std::string& prefix);

// Collision check: first footprint path that resolves to an existing regular
// file under prefix, or empty when there is none.
std::string find_collision(const std::string& prefix,
                           const std::vector<std::string>& footprint);

class InstallTransaction {
public:
    explicit InstallTransaction(BuildDriver& driver);

    TransactionResult install(const std::string& build_source,
                              const std::string& prefix,
                              const BuildConfig& config,
                              const TransactionOptions& options);

private:
    BuildDriver& driver_;
};

// Convenience wrapper around InstallTransaction
TransactionResult install(BuildDriver& driver,
                          const std::string& build_source,
                          const std::string& prefix,
                          const BuildConfig& config,
                          const TransactionOptions& options);

} // namespace lpkgm
