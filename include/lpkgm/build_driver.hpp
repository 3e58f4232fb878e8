#pragma once

#include <map>
#include <string>
#include <vector>

namespace lpkgm {

// ============================================================================
// Build Configuration
// ============================================================================

// Opaque to the transaction engine: forwarded verbatim to the driver for both
// the probe and the commit run.
struct BuildConfig {
    // Command tokens. "{prefix}" in any token is replaced by the install root.
    std::vector<std::string> command;

    // Extra environment on top of the inherited one; "{prefix}" is replaced
    // in values as well
    std::map<std::string, std::string> environment;
};

struct BuildResult {
    bool ok = false;
    int exit_code = -1;
    std::string error;
};

// ============================================================================
// Build Driver Interface
// ============================================================================

// A capability that builds the tree in build_source and installs it into
// install_root. Must be idempotent given a clean install_root.
class BuildDriver {
public:
    virtual ~BuildDriver() = default;

    virtual BuildResult install_into(const std::string& build_source,
                                     const std::string& install_root,
                                     const BuildConfig& config) = 0;
};

// ============================================================================
// Shell Build Driver
// ============================================================================

// Runs config.command via fork/execvp with build_source as the working
// directory. LPKGM_INSTALL_PREFIX is exported to the child.
class ShellBuildDriver : public BuildDriver {
public:
    BuildResult install_into(const std::string& build_source,
                             const std::string& install_root,
                             const BuildConfig& config) override;
};

// Substitute "{prefix}" occurrences in every command token
std::vector<std::string> expand_build_command(const std::vector<std::string>& command,
                                              const std::string& install_root);

} // namespace lpkgm
