#pragma once

#include "lpkgm/settings.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace lpkgm {

// ============================================================================
// Prefix Enumerator
// ============================================================================

// Read-only view of what can be offered as completions. Implementations may
// throw std::exception on enumeration failure; the resolver turns that into
// an empty candidate set.
class PrefixEnumerator {
public:
    virtual ~PrefixEnumerator() = default;

    // Known platform identifiers
    virtual std::vector<std::string> platforms() const = 0;

    // Installed package names for a platform
    virtual std::vector<std::string> installed_packages(const std::string& platform) const = 0;

    // Installed version strings for a platform and package
    virtual std::vector<std::string> installed_versions(const std::string& platform,
                                                        const std::string& package) const = 0;

    // Package names installable from configuration
    virtual std::vector<std::string> installable_packages() const = 0;

    // Versions offered for installing a package
    virtual std::vector<std::string> installable_versions(const std::string& platform,
                                                          const std::string& package) const = 0;

    // Platform used when the line carries no -Dplatform= token
    virtual std::optional<std::string> default_platform() const { return std::nullopt; }

    // Values accepted by a flag ("-c", "--log-file", ...)
    virtual std::vector<std::string> flag_values(const std::string& flag,
                                                 const std::string& platform) const {
        (void)flag;
        (void)platform;
        return {};
    }
};

// Enumerates the shared tree on disk:
//   <root>/<platform>/.packages/<package>/<version>.json
// Platforms are directories up to three levels below root holding a
// .packages directory. Installable packages come from the settings.
class FilesystemPrefixEnumerator : public PrefixEnumerator {
public:
    explicit FilesystemPrefixEnumerator(std::string root);
    explicit FilesystemPrefixEnumerator(Settings settings);

    // Directory searched for settings files (-c); defaults to the process cwd
    void set_working_directory(std::string dir) { cwd_ = std::move(dir); }

    std::vector<std::string> platforms() const override;
    std::vector<std::string> installed_packages(const std::string& platform) const override;
    std::vector<std::string> installed_versions(const std::string& platform,
                                                const std::string& package) const override;
    std::vector<std::string> installable_packages() const override;
    std::vector<std::string> installable_versions(const std::string& platform,
                                                  const std::string& package) const override;
    std::optional<std::string> default_platform() const override;
    std::vector<std::string> flag_values(const std::string& flag,
                                         const std::string& platform) const override;

private:
    std::string registry_dir(const std::string& platform) const;

    std::string root_;
    std::optional<Settings> settings_;
    std::string cwd_;
};

// ============================================================================
// Completion Context
// ============================================================================

enum class Subcommand {
    None,
    Install,
    Remove,
    Show,
};

enum class CompletionState {
    NoPlatform,
    NoSubcommand,
    CollectingName,
    CollectingVersion,
    Done,
};

// Which positional slot the word under the cursor went into
enum class FragmentSlot {
    None,
    Name,
    Version,
};

const char* subcommand_to_string(Subcommand subcommand);
const char* completion_state_to_string(CompletionState state);

// install|add, remove|delete|uninstall|rm, show|inspect|list
std::optional<Subcommand> parse_subcommand(const std::string& token);

// Canonical keywords followed by their synonyms
const std::vector<std::string>& subcommand_keywords();

// Parse state of a partially typed command line
struct CompletionContext {
    std::optional<std::string> platform;
    Subcommand subcommand = Subcommand::None;
    std::optional<std::string> name;
    std::optional<std::string> version;

    // The last complete token was a flag expecting a value
    bool ignore_next = false;
    std::string pending_flag;

    // Word under the cursor; empty right after whitespace
    std::string fragment;
    FragmentSlot fragment_slot = FragmentSlot::None;

    // The fragment is the value of pending_flag
    bool fragment_is_flag_value = false;

    // The cursor is still on the program name
    bool at_command = false;

    CompletionState state() const;
};

// Split on whitespace
std::vector<std::string> tokenize_command_line(const std::string& line);

// Walk the tokens before `cursor` (a byte offset, clamped to the line). The
// first token is the program name.
CompletionContext parse_completion_context(const std::string& line, std::size_t cursor);

// ============================================================================
// Completion Resolver
// ============================================================================

// Candidates for the word under the cursor, prefix-filtered, sorted and
// deduplicated. Stateless; an enumeration failure yields no candidates.
std::vector<std::string> resolve_completions(const std::string& line,
                                             std::size_t cursor,
                                             const PrefixEnumerator& enumerator);

} // namespace lpkgm
