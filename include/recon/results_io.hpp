#pragma once

/**
 * @file results_io.hpp
 * @brief Loading the transformation engine's results document
 */

#include "recon/common.hpp"
#include "recon/log.hpp"
#include "recon/results.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace recon::results {

/// Deepest source tree a results document may carry
inline constexpr std::size_t kMaxTreeDepth = 1024;

struct ResultsDocument
{
    std::vector<std::string> active_recipes;
    std::vector<TransformationResult> results;
};

/**
 * Convert a results.v1 document (already schema-checked).
 * Trees nested deeper than kMaxTreeDepth are rejected with SchemaInvalid.
 */
[[nodiscard]] recon::Result<ResultsDocument> results_from_json(const nlohmann::json& document);

/**
 * Read, validate and convert a results document.
 * @param schema_dir Directory containing results.v1.schema.json
 */
[[nodiscard]] recon::Result<ResultsDocument> load_results(const std::filesystem::path& path,
                                                          const std::filesystem::path& schema_dir);

/**
 * Results ready for classification: nothing when no recipe was activated,
 * otherwise every result except those whose before source is marked Generated.
 */
[[nodiscard]] std::vector<TransformationResult> select_results(ResultsDocument document,
                                                               const log::Logger& logger);

}  // namespace recon::results
