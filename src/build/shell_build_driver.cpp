#include "lpkgm/build_driver.hpp"
#include "lpkgm/platform.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>

#include <sys/wait.h>
#include <unistd.h>

extern "C" char** environ;

namespace lpkgm {

namespace {

const std::string kPrefixPlaceholder = "{prefix}";

std::string replace_prefix(std::string token, const std::string& install_root) {
    size_t pos = 0;
    while ((pos = token.find(kPrefixPlaceholder, pos)) != std::string::npos) {
        token.replace(pos, kPrefixPlaceholder.size(), install_root);
        pos += install_root.size();
    }
    return token;
}

std::vector<std::string> build_environment(const BuildConfig& config,
                                           const std::string& install_root) {
    auto env_map = get_all_env();
    for (const auto& [key, value] : config.environment) {
        env_map[key] = replace_prefix(value, install_root);
    }
    env_map["LPKGM_INSTALL_PREFIX"] = install_root;

    std::vector<std::string> env;
    env.reserve(env_map.size());
    for (const auto& [key, value] : env_map) {
        env.push_back(key + "=" + value);
    }
    return env;
}

std::string join_command(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

} // namespace

std::vector<std::string> expand_build_command(const std::vector<std::string>& command,
                                              const std::string& install_root) {
    std::vector<std::string> out;
    out.reserve(command.size());
    for (const auto& token : command) {
        out.push_back(replace_prefix(token, install_root));
    }
    return out;
}

BuildResult ShellBuildDriver::install_into(const std::string& build_source,
                                           const std::string& install_root,
                                           const BuildConfig& config) {
    BuildResult result;

    if (config.command.empty()) {
        result.error = "empty build command";
        return result;
    }

    auto argv_strings = expand_build_command(config.command, install_root);
    auto env_strings = build_environment(config, install_root);

    spdlog::info("{} $ {}", build_source, join_command(argv_strings));

    std::vector<char*> argv;
    for (auto& s : argv_strings) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<char*> envp;
    for (auto& s : env_strings) {
        envp.push_back(const_cast<char*>(s.c_str()));
    }
    envp.push_back(nullptr);

    pid_t pid = fork();

    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        return result;
    }

    if (pid == 0) {
        if (!build_source.empty()) {
            if (chdir(build_source.c_str()) != 0) {
                _exit(127);
            }
        }

        // execvpe is a GNU extension; swap environ so PATH lookup applies
        environ = envp.data();
        execvp(argv[0], argv.data());

        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            result.error = "waitpid failed: " + std::string(strerror(errno));
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        if (result.exit_code == 0) {
            result.ok = true;
        } else if (result.exit_code == 127) {
            result.error = "build command could not be started (exit code 127): " + argv_strings[0];
        } else {
            result.error = "build command failed with exit code " + std::to_string(result.exit_code);
        }
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.error = "build command killed by signal " + std::to_string(WTERMSIG(status));
    } else {
        result.error = "build command terminated abnormally";
    }

    return result;
}

} // namespace lpkgm
