#include "lpkgm/completion.hpp"
#include "lpkgm/platform.hpp"
#include "lpkgm/registry.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>

namespace lpkgm {

namespace fs = std::filesystem;

namespace {

constexpr int kPlatformSearchDepth = 3;

bool has_extension(const std::string& name, const std::string& ext) {
    return name.size() > ext.size() &&
           name.compare(name.size() - ext.size(), ext.size(), ext) == 0;
}

std::vector<std::string> files_with_extension(const std::string& dir, const std::string& ext,
                                              bool full_paths) {
    std::vector<std::string> out;
    for (const auto& name : list_directory(dir)) {
        if (name[0] == '.' || !has_extension(name, ext)) continue;
        auto path = join_path(dir, name);
        if (!resolves_to_regular_file(path)) continue;
        out.push_back(full_paths ? path : name);
    }
    return out;
}

} // namespace

FilesystemPrefixEnumerator::FilesystemPrefixEnumerator(std::string root)
    : root_(std::move(root)) {}

FilesystemPrefixEnumerator::FilesystemPrefixEnumerator(Settings settings)
    : root_(settings.root), settings_(std::move(settings)) {}

std::string FilesystemPrefixEnumerator::registry_dir(const std::string& platform) const {
    if (settings_) {
        if (auto dir = registry_dir_for(*settings_, platform)) {
            return *dir;
        }
    }
    return join_path(join_path(root_, platform), ".packages");
}

std::vector<std::string> FilesystemPrefixEnumerator::platforms() const {
    std::vector<std::string> out;
    if (root_.empty() || !is_directory(root_)) {
        return out;
    }

    std::error_code ec;
    fs::recursive_directory_iterator it(root_, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::debug("Cannot scan {}: {}", root_, ec.message());
        return out;
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            spdlog::debug("Platform scan of {} stopped: {}", root_, ec.message());
            break;
        }

        const auto& entry = *it;
        auto name = entry.path().filename().string();
        std::error_code type_ec;
        if (!entry.is_directory(type_ec) || type_ec) {
            continue;
        }

        if (name == ".packages") {
            auto platform = entry.path().parent_path().lexically_relative(root_).generic_string();
            if (!platform.empty() && platform != ".") {
                out.push_back(platform);
            }
        }

        // Hidden directories are not searched; depth is counted from root
        if (name[0] == '.' || it.depth() + 1 >= kPlatformSearchDepth) {
            it.disable_recursion_pending();
        }
    }

    std::sort(out.begin(), out.end());
    return out;
}

std::vector<std::string> FilesystemPrefixEnumerator::installed_packages(
    const std::string& platform) const {
    if (platform.empty()) return {};
    return list_installed_packages(registry_dir(platform));
}

std::vector<std::string> FilesystemPrefixEnumerator::installed_versions(
    const std::string& platform, const std::string& package) const {
    if (platform.empty() || package.empty()) return {};
    return list_installed_versions(registry_dir(platform), package);
}

std::vector<std::string> FilesystemPrefixEnumerator::installable_packages() const {
    std::vector<std::string> out;
    if (!settings_) return out;
    for (const auto& [name, pkg] : settings_->packages) {
        out.push_back(name);
    }
    return out;
}

std::vector<std::string> FilesystemPrefixEnumerator::installable_versions(
    const std::string& platform, const std::string& package) const {
    (void)platform;
    if (!settings_) return {};
    auto it = settings_->packages.find(package);
    if (it == settings_->packages.end()) return {};
    return it->second.versions;
}

std::optional<std::string> FilesystemPrefixEnumerator::default_platform() const {
    if (settings_) {
        return selected_platform(*settings_);
    }
    auto env = get_env("LPKGM_PLATFORM");
    if (env && !env->empty()) {
        return env;
    }
    return std::nullopt;
}

std::vector<std::string> FilesystemPrefixEnumerator::flag_values(
    const std::string& flag, const std::string& platform) const {
    std::vector<std::string> out;

    if (flag == "-c" || flag == "--settings") {
        return files_with_extension(cwd_.empty() ? current_directory() : cwd_, ".json", false);
    }

    if (flag == "-D" || flag == "--define") {
        for (const auto& p : platforms()) {
            out.push_back("platform=" + p);
        }
        return out;
    }

    if (flag == "-u" || flag == "--use" || flag == "-k" || flag == "--keep") {
        for (const auto& package : installed_packages(platform)) {
            for (const auto& version : installed_versions(platform, package)) {
                out.push_back(package + "/" + version);
            }
        }
        return out;
    }

    if (flag == "--log-file" && settings_) {
        if (auto dir = log_dir_for(*settings_)) {
            return files_with_extension(*dir, ".log", true);
        }
    }

    return out;
}

} // namespace lpkgm
