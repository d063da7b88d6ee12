/**
 * @file path.cpp
 * @brief Path normalization for deterministic comparison and output
 */

#include "recon/common.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iterator>
#include <ranges>
#include <string>
#include <vector>

namespace recon::common {

namespace {

/**
 * @brief Split a path string into non-empty components on '/' or '\\'
 */
[[nodiscard]] std::vector<std::string> split_path(std::string_view path)
{
    std::string unified(path);
    std::ranges::replace(unified, '\\', '/');

    std::vector<std::string> parts;
    for (auto part : unified | std::views::split('/')) {
        std::string_view sv(part.begin(), part.end());
        if (!sv.empty()) {
            parts.emplace_back(sv);
        }
    }
    return parts;
}

struct PathPrefix
{
    std::string drive;   ///< "c:" for Windows drive paths, empty otherwise
    std::size_t offset;  ///< First character after the prefix and leading separator
};

[[nodiscard]] PathPrefix split_prefix(std::string_view path)
{
    PathPrefix prefix{.drive = std::string{}, .offset = 0};
    if (path.size() >= 2 && path[1] == ':'
        && std::isalpha(static_cast<unsigned char>(path[0])) != 0) {
        prefix.drive = std::string(1, static_cast<char>(std::tolower(path[0]))) + ":";
        prefix.offset = 2;
    }
    if (prefix.offset < path.size() && (path[prefix.offset] == '/' || path[prefix.offset] == '\\')) {
        ++prefix.offset;
    }
    return prefix;
}

[[nodiscard]] std::vector<std::string> collapse_dots(const std::vector<std::string>& parts,
                                                     bool rooted)
{
    std::vector<std::string> out;
    out.reserve(parts.size());
    for (const auto& part : parts) {
        if (part == ".") {
            continue;
        }
        if (part != "..") {
            out.push_back(part);
            continue;
        }
        if (!out.empty() && out.back() != "..") {
            out.pop_back();
        } else if (!rooted) {
            out.emplace_back("..");
        }
    }
    return out;
}

[[nodiscard]] std::string join_path(const std::vector<std::string>& parts)
{
    std::string joined;
    for (const auto& part : parts) {
        if (!joined.empty()) {
            joined += '/';
        }
        joined += part;
    }
    return joined;
}

}  // namespace

bool is_absolute_path(std::string_view path)
{
    if (path.empty()) {
        return false;
    }
    if (path[0] == '/') {
        return true;
    }
    // C:\ or C:/
    if (path.size() >= 3 && std::isalpha(static_cast<unsigned char>(path[0])) != 0
        && path[1] == ':' && (path[2] == '/' || path[2] == '\\')) {
        return true;
    }
    // UNC
    return path.size() >= 2 && path[0] == '\\' && path[1] == '\\';
}

std::string normalize_path(std::string_view input, std::string_view repo_root)
{
    if (input.empty()) {
        return ".";
    }
    const PathPrefix prefix = split_prefix(input);
    const bool absolute = is_absolute_path(input);
    auto parts = collapse_dots(split_path(input.substr(prefix.offset)), absolute);

    std::string normalized = join_path(parts);
    if (!prefix.drive.empty()) {
        normalized = prefix.drive + "/" + normalized;
    } else if (absolute) {
        normalized = "/" + normalized;
    }

    if (!repo_root.empty() && is_within(normalized, repo_root)) {
        normalized = make_relative(normalized, repo_root);
    }

    return normalized.empty() ? "." : normalized;
}

std::string make_relative(std::string_view path, std::string_view base)
{
    auto path_parts = split_path(normalize_path(path));
    auto base_parts = split_path(normalize_path(base));

    std::size_t common = 0;
    while (common < path_parts.size() && common < base_parts.size()
           && path_parts[common] == base_parts[common]) {
        ++common;
    }

    std::vector<std::string> relative(base_parts.size() - common, "..");
    for (const auto& part : path_parts | std::views::drop(static_cast<std::ptrdiff_t>(common))) {
        relative.push_back(part);
    }
    return relative.empty() ? "." : join_path(relative);
}

bool is_within(std::string_view path, std::string_view base)
{
    const std::string norm_path = normalize_path(path);
    const std::string norm_base = normalize_path(base);
    if (is_absolute_path(norm_path) != is_absolute_path(norm_base)) {
        return false;
    }
    const auto path_parts = split_path(norm_path);
    const auto base_parts = split_path(norm_base);
    if (base_parts.size() > path_parts.size()) {
        return false;
    }
    return std::ranges::equal(base_parts, path_parts | std::views::take(std::ssize(base_parts)));
}

}  // namespace recon::common
