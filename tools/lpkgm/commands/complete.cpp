/**
 * lpkgm CLI - complete command
 *
 * Print completion candidates for a partially typed lpkgm command line, one
 * per line. Called by scripts/lpkgm-completion.bash.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>
#include <lpkgm/completion.hpp>

#include <limits>
#include <memory>

namespace lpkgm::cli::commands {

namespace {

struct CompleteOptions {
    std::string line;
    std::size_t point = std::numeric_limits<std::size_t>::max();
};

std::unique_ptr<FilesystemPrefixEnumerator> make_enumerator(const GlobalOptions& opts) {
    Definitions overrides;
    std::string error;
    if (parse_defines(opts.defines, overrides, error)) {
        auto result = load_settings_file(resolve_settings_path(opts.settings), overrides);
        if (result.ok) {
            return std::make_unique<FilesystemPrefixEnumerator>(std::move(result.settings));
        }
        spdlog::debug("Completing without settings: {}", result.error);
    } else {
        spdlog::debug("Completing without settings: {}", error);
    }
    return std::make_unique<FilesystemPrefixEnumerator>(get_env("LPKGM_ROOT").value_or(""));
}

int cmd_complete(const GlobalOptions& opts, const CompleteOptions& complete_opts) {
    // Anything on stderr would garble the interactive line
    if (!init_logging(opts, spdlog::level::off)) {
        return kExitUsage;
    }

    auto enumerator = make_enumerator(opts);
    auto candidates = resolve_completions(complete_opts.line, complete_opts.point, *enumerator);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["candidates"] = candidates;
        output_json(j);
        return kExitOk;
    }

    for (const auto& c : candidates) {
        std::cout << c << "\n";
    }
    std::cout << std::flush;
    return kExitOk;
}

} // anonymous namespace

void setup_complete(CLI::App* app, GlobalOptions& opts) {
    static CompleteOptions complete_opts;

    app->add_option("--line", complete_opts.line, "Command line typed so far ($COMP_LINE)")->required();
    app->add_option("--point", complete_opts.point, "Cursor offset in the line ($COMP_POINT)");

    app->callback([&opts]() {
        std::exit(cmd_complete(opts, complete_opts));
    });
}

} // namespace lpkgm::cli::commands
