#pragma once

/**
 * @file build_root.hpp
 * @brief Canonical build root and repository root resolution
 */

#include "recon/common.hpp"
#include "recon/project.hpp"

#include <filesystem>
#include <string_view>
#include <vector>

namespace recon::project {

/// Marker entry identifying the root of a git working copy
constexpr std::string_view kVcsMarker = ".git";

/**
 * Distinct normalized base directories of every module and its ancestors,
 * excluding anything inside the local artifact cache. Sorted by path string.
 */
[[nodiscard]] std::vector<std::filesystem::path> collect_base_dirs(const BuildSession& session);

/**
 * Pick the canonical build root: the lexicographically smallest collected
 * base directory, else the session's execution root.
 *
 * @return BuildRootUnresolved when neither exists
 */
[[nodiscard]] recon::Result<std::filesystem::path> resolve_build_root(const BuildSession& session);

/**
 * Attempt to determine the root of the git working copy containing build_root.
 * The build root is often the repository root, but that is not required.
 * If no ".git" entry exists in build_root or any of its ancestors, build_root
 * is returned unchanged.
 */
[[nodiscard]] std::filesystem::path locate_repository_root(const std::filesystem::path& build_root);

/// resolve_build_root followed by locate_repository_root
[[nodiscard]] recon::Result<std::filesystem::path> repository_root(const BuildSession& session);

}  // namespace recon::project
