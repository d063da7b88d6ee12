#pragma once

/**
 * @file diff.hpp
 * @brief Git-style unified diff of two texts
 */

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace recon::tree {

/// Paths shown in the diff header; std::nullopt stands for /dev/null
struct DiffPaths
{
    std::optional<std::string> before;
    std::optional<std::string> after;
};

constexpr std::size_t kDefaultContextLines = 3;

/**
 * Unified diff between before_text and after_text.
 *
 * - Same path on both sides and equal texts: empty string.
 * - Missing before path: new file, missing after path: deleted file.
 * - Different paths: rename header, plus hunks when the texts differ.
 *
 * @param context Unchanged lines kept around each change
 */
[[nodiscard]] std::string unified_diff(std::string_view before_text,
                                       std::string_view after_text,
                                       const DiffPaths& paths,
                                       std::size_t context = kDefaultContextLines);

}  // namespace recon::tree
