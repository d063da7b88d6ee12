#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: error/result types, path normalization
 */

#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace recon {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

}  // namespace recon

namespace recon::common {

// ============================================================================
// Path Normalization
// ============================================================================

/**
 * Normalize a path for deterministic comparison and output
 * - Use '/' as separator
 * - Remove trailing slashes
 * - Resolve '..' and '.'
 * - Lower-case a Windows drive letter
 * - Optionally make relative to repo_root
 *
 * Case is otherwise preserved: two paths differing only in case are distinct.
 *
 * @param input Input path
 * @param repo_root Optional repository root for relative paths
 * @return Normalized path
 */
[[nodiscard]] std::string normalize_path(std::string_view input, std::string_view repo_root = "");

/**
 * Check if path is absolute
 */
[[nodiscard]] bool is_absolute_path(std::string_view path);

/**
 * Make path relative to base
 */
[[nodiscard]] std::string make_relative(std::string_view path, std::string_view base);

/**
 * Check whether path equals base or is nested under it.
 * Comparison is per path component after normalization, so "/cache2" is
 * not within "/cache".
 */
[[nodiscard]] bool is_within(std::string_view path, std::string_view base);

}  // namespace recon::common
