#include "lpkgm/path_utils.hpp"
#include "lpkgm/platform.hpp"

#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace lpkgm {

namespace {

bool contains_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream ss(s);
    while (std::getline(ss, current, delim)) {
        parts.push_back(current);
    }
    return parts;
}

std::string join_components(const std::string& root, const std::vector<std::string>& comps) {
    std::filesystem::path p(root);
    for (const auto& c : comps) {
        p /= c;
    }
    return to_portable_path(p.lexically_normal().string());
}

std::string strip_trailing_slashes(std::string p) {
    while (p.size() > 1 && p.back() == '/') {
        p.pop_back();
    }
    return p;
}

} // namespace

const char* path_error_to_string(PathError error) {
    switch (error) {
        case PathError::None: return "none";
        case PathError::Empty: return "path is empty";
        case PathError::ContainsNul: return "path contains NUL byte";
        case PathError::NotAbsolute: return "path is not absolute";
        case PathError::AbsoluteNotAllowed: return "absolute path not allowed";
        case PathError::EscapesRoot: return "path escapes root";
        case PathError::IsRoot: return "path is the filesystem root";
        case PathError::NotAComponent: return "not a single path component";
    }
    return "unknown";
}

PathResult normalize_under_root(const std::string& root,
                                const std::string& relative_path,
                                bool allow_absolute) {
    if (contains_nul(root) || contains_nul(relative_path)) {
        return {false, {}, PathError::ContainsNul};
    }

    std::vector<std::string> components;

    if (!relative_path.empty() && relative_path[0] == '/') {
        if (!allow_absolute) {
            return {false, {}, PathError::AbsoluteNotAllowed};
        }
        auto trimmed = relative_path;
        while (!trimmed.empty() && trimmed[0] == '/') {
            trimmed.erase(trimmed.begin());
        }
        for (auto& part : split(trimmed, '/')) {
            if (!part.empty()) components.push_back(part);
        }
    } else {
        for (auto& part : split(relative_path, '/')) {
            components.push_back(part);
        }
    }

    std::vector<std::string> normalized;
    for (const auto& part : components) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (normalized.empty()) {
                return {false, {}, PathError::EscapesRoot};
            }
            normalized.pop_back();
        } else {
            normalized.push_back(part);
        }
    }

    std::string out = strip_trailing_slashes(join_components(root, normalized));
    // Ensure containment: lexically compare without touching filesystem.
    std::filesystem::path root_path(root);
    std::filesystem::path out_path(out);
    auto lex_root = root_path.lexically_normal();
    auto lex_out = out_path.lexically_normal();
    auto root_it = lex_root.begin();
    auto out_it = lex_out.begin();
    for (; root_it != lex_root.end() && out_it != lex_out.end(); ++root_it, ++out_it) {
        if (root_it->empty()) break;  // trailing separator of root
        if (*root_it != *out_it) {
            return {false, {}, PathError::EscapesRoot};
        }
    }
    if (root_it != lex_root.end() && !root_it->empty()) {
        return {false, {}, PathError::EscapesRoot};
    }

    return {true, out, PathError::None};
}

PathResult validate_prefix(const std::string& prefix) {
    if (prefix.empty()) {
        return {false, {}, PathError::Empty};
    }
    if (contains_nul(prefix)) {
        return {false, {}, PathError::ContainsNul};
    }
    if (prefix[0] != '/') {
        return {false, {}, PathError::NotAbsolute};
    }

    auto normal = strip_trailing_slashes(
        to_portable_path(std::filesystem::path(prefix).lexically_normal().string()));
    if (normal == "/") {
        return {false, {}, PathError::IsRoot};
    }
    return {true, normal, PathError::None};
}

PathResult validate_path_component(const std::string& component) {
    if (component.empty()) {
        return {false, {}, PathError::Empty};
    }
    if (contains_nul(component)) {
        return {false, {}, PathError::ContainsNul};
    }
    if (component.find('/') != std::string::npos || component == "." || component == "..") {
        return {false, {}, PathError::NotAComponent};
    }
    return {true, component, PathError::None};
}

} // namespace lpkgm
