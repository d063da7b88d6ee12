#pragma once

/**
 * @file json_io.hpp
 * @brief JSON document file I/O
 */

#include "recon/common.hpp"

#include <filesystem>

#include <nlohmann/json.hpp>

namespace recon::common {

/**
 * Read and parse a JSON file.
 * @return IOError when unreadable, ParseError when not valid JSON
 */
[[nodiscard]] recon::Result<nlohmann::json> read_json_file(const std::filesystem::path& path);

/**
 * Write a JSON document with object keys in lexicographic order and a
 * trailing newline. Identical documents produce identical bytes.
 */
[[nodiscard]] recon::VoidResult write_json_file(const std::filesystem::path& path,
                                                const nlohmann::json& payload);

}  // namespace recon::common
