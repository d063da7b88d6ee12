#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation utilities
 */

#include "recon/common.hpp"

#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace recon::common {

/**
 * Validate JSON against a JSON Schema file.
 *
 * "$defs" sections and "#/$defs/" references are accepted and mapped onto
 * draft-7 "definitions".
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, error on failure
 */
[[nodiscard]] recon::VoidResult validate_json(const nlohmann::json& j,
                                              const std::filesystem::path& schema_path);

/**
 * Validate a document against "<schema_dir>/<schema_name>.schema.json".
 * Failures are reported as SchemaInvalid with the schema name in the message.
 */
[[nodiscard]] recon::VoidResult validate_document(const nlohmann::json& j,
                                                  const std::filesystem::path& schema_dir,
                                                  std::string_view schema_name);

}  // namespace recon::common
