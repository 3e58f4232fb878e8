#include "lpkgm/completion.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <exception>
#include <set>

namespace lpkgm {

namespace {

const std::string kPlatformSelector = "-Dplatform=";
const std::string kDefineLongPlatform = "--define=platform=";

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// lpkgm's own switches; they never consume the following word
const std::set<std::string> kBooleanFlags = {
    "-h", "--help", "-V", "--version", "-v", "--verbose", "-q", "--quiet",
    "--json", "-y", "--yes", "--dry-run",
};

// "-x" or "--name" without an inline value
bool takes_value(const std::string& token) {
    if (kBooleanFlags.count(token)) {
        return false;
    }
    if (token.size() == 2 && token[0] == '-' && token[1] != '-') {
        return true;
    }
    return token.size() > 2 && starts_with(token, "--") &&
           token.find('=') == std::string::npos;
}

void apply_flag_value(CompletionContext& ctx, const std::string& flag, const std::string& value) {
    if ((flag == "-D" || flag == "--define") && starts_with(value, "platform=")) {
        auto platform = value.substr(9);
        if (!platform.empty()) {
            ctx.platform = platform;
        }
    }
}

// Fragments such as "-D", "-Dpla", "-Dplatform=", "-Dplatform=el9/x"
bool is_platform_selector_fragment(const std::string& fragment) {
    if (starts_with(fragment, "-Dplatform")) {
        return true;
    }
    return fragment.size() >= 2 && starts_with(kPlatformSelector, fragment);
}

std::vector<std::string> filter_candidates(std::vector<std::string> candidates,
                                           const std::string& prefix) {
    candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                    [&](const std::string& c) {
                                        return c.empty() || !starts_with(c, prefix);
                                    }),
                     candidates.end());
    std::sort(candidates.begin(), candidates.end());
    candidates.erase(std::unique(candidates.begin(), candidates.end()), candidates.end());
    return candidates;
}

std::vector<std::string> platform_options(const std::vector<std::string>& platforms) {
    std::vector<std::string> out;
    out.reserve(platforms.size());
    for (const auto& p : platforms) {
        out.push_back(kPlatformSelector + p);
    }
    return out;
}

} // namespace

const char* subcommand_to_string(Subcommand subcommand) {
    switch (subcommand) {
        case Subcommand::None: return "";
        case Subcommand::Install: return "install";
        case Subcommand::Remove: return "remove";
        case Subcommand::Show: return "show";
    }
    return "";
}

const char* completion_state_to_string(CompletionState state) {
    switch (state) {
        case CompletionState::NoPlatform: return "NoPlatform";
        case CompletionState::NoSubcommand: return "NoSubcommand";
        case CompletionState::CollectingName: return "CollectingName";
        case CompletionState::CollectingVersion: return "CollectingVersion";
        case CompletionState::Done: return "Done";
    }
    return "Unknown";
}

std::optional<Subcommand> parse_subcommand(const std::string& token) {
    if (token == "install" || token == "add") {
        return Subcommand::Install;
    }
    if (token == "remove" || token == "delete" || token == "uninstall" || token == "rm") {
        return Subcommand::Remove;
    }
    if (token == "show" || token == "inspect" || token == "list") {
        return Subcommand::Show;
    }
    return std::nullopt;
}

const std::vector<std::string>& subcommand_keywords() {
    static const std::vector<std::string> keywords = {
        "install", "remove", "show",
        "add", "delete", "uninstall", "rm", "inspect", "list",
    };
    return keywords;
}

CompletionState CompletionContext::state() const {
    if (!platform) {
        return CompletionState::NoPlatform;
    }
    if (subcommand == Subcommand::None) {
        return CompletionState::NoSubcommand;
    }
    if (!name || fragment_slot == FragmentSlot::Name) {
        return CompletionState::CollectingName;
    }
    if (!version || fragment_slot == FragmentSlot::Version) {
        return CompletionState::CollectingVersion;
    }
    return CompletionState::Done;
}

std::vector<std::string> tokenize_command_line(const std::string& line) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : line) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                tokens.push_back(std::move(current));
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

CompletionContext parse_completion_context(const std::string& line, std::size_t cursor) {
    CompletionContext ctx;

    const std::string typed = line.substr(0, std::min(cursor, line.size()));
    auto tokens = tokenize_command_line(typed);
    const bool after_space =
        typed.empty() || std::isspace(static_cast<unsigned char>(typed.back()));

    if (tokens.empty() || (tokens.size() == 1 && !after_space)) {
        ctx.at_command = true;
        if (!tokens.empty()) ctx.fragment = tokens.front();
        return ctx;
    }

    if (!after_space) {
        ctx.fragment = tokens.back();
        tokens.pop_back();
    }

    // Complete tokens, program name excluded
    for (size_t i = 1; i < tokens.size(); ++i) {
        const auto& token = tokens[i];

        if (ctx.ignore_next) {
            ctx.ignore_next = false;
            apply_flag_value(ctx, ctx.pending_flag, token);
            ctx.pending_flag.clear();
            continue;
        }

        if (starts_with(token, kPlatformSelector) || starts_with(token, kDefineLongPlatform)) {
            auto value = token.substr(token.find('=') + 1);
            if (!value.empty()) {
                ctx.platform = value;
            }
            continue;
        }

        if (ctx.subcommand == Subcommand::None) {
            if (auto subcommand = parse_subcommand(token)) {
                ctx.subcommand = *subcommand;
                continue;
            }
        }

        if (takes_value(token)) {
            ctx.ignore_next = true;
            ctx.pending_flag = token;
            continue;
        }

        if (token[0] == '-' || ctx.subcommand == Subcommand::None) {
            continue;
        }

        if (!ctx.name) {
            ctx.name = token;
        } else if (!ctx.version) {
            ctx.version = token;
        }
        // Anything past the two positional slots is ignored
    }

    if (ctx.fragment.empty()) {
        return ctx;
    }

    if (ctx.ignore_next) {
        ctx.ignore_next = false;
        ctx.fragment_is_flag_value = true;
    } else if (ctx.fragment[0] != '-' && ctx.subcommand != Subcommand::None) {
        if (!ctx.name) {
            ctx.name = ctx.fragment;
            ctx.fragment_slot = FragmentSlot::Name;
        } else if (!ctx.version) {
            ctx.version = ctx.fragment;
            ctx.fragment_slot = FragmentSlot::Version;
        }
    }

    return ctx;
}

std::vector<std::string> resolve_completions(const std::string& line,
                                             std::size_t cursor,
                                             const PrefixEnumerator& enumerator) {
    try {
        auto ctx = parse_completion_context(line, cursor);
        if (ctx.at_command) {
            return {};
        }
        const auto& fragment = ctx.fragment;

        if (is_platform_selector_fragment(fragment)) {
            auto eq = fragment.find('=');
            if (eq != std::string::npos) {
                return filter_candidates(enumerator.platforms(), fragment.substr(eq + 1));
            }
            return filter_candidates(platform_options(enumerator.platforms()), fragment);
        }

        if (!ctx.platform) {
            ctx.platform = enumerator.default_platform();
        }
        const std::string platform = ctx.platform.value_or("");

        if (ctx.ignore_next || ctx.fragment_is_flag_value) {
            return filter_candidates(enumerator.flag_values(ctx.pending_flag, platform), fragment);
        }

        spdlog::debug("Completion state {} (subcommand \"{}\", platform \"{}\")",
                      completion_state_to_string(ctx.state()),
                      subcommand_to_string(ctx.subcommand), platform);

        switch (ctx.state()) {
            case CompletionState::NoPlatform:
                return filter_candidates(platform_options(enumerator.platforms()), fragment);

            case CompletionState::NoSubcommand:
                return filter_candidates(subcommand_keywords(), fragment);

            case CompletionState::CollectingName:
                if (ctx.subcommand == Subcommand::Install) {
                    return filter_candidates(enumerator.installable_packages(), fragment);
                }
                return filter_candidates(enumerator.installed_packages(platform), fragment);

            case CompletionState::CollectingVersion:
                if (ctx.subcommand == Subcommand::Install) {
                    return filter_candidates(enumerator.installable_versions(platform, *ctx.name),
                                             fragment);
                }
                return filter_candidates(enumerator.installed_versions(platform, *ctx.name),
                                         fragment);

            case CompletionState::Done:
                return {};
        }
    } catch (const std::exception& e) {
        spdlog::debug("Completion enumeration failed: {}", e.what());
    }
    return {};
}

} // namespace lpkgm
