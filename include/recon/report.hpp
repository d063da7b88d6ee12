#pragma once

/**
 * @file report.hpp
 * @brief Reporting of classified results: change log, patch, summary
 */

#include "recon/common.hpp"
#include "recon/log.hpp"
#include "recon/results.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace recon::report {

enum class RunMode { kDryRun, kRun };

/// File names written into the output directory
constexpr const char* kPatchFileName = "rewrite.patch";
constexpr const char* kSummaryFileName = "summary.json";

/**
 * One line per recipe, children indented four spaces deeper than their
 * parent. Options with a value are rendered as "name: {k=v, k2=v2}".
 */
[[nodiscard]] std::vector<std::string>
describe_recipes(const std::vector<results::RecipeDescriptor>& recipes);

/// Warn-level change log: one headline per result followed by its recipes
void log_changes(const results::ResultsContainer& container,
                 RunMode mode,
                 const log::Logger& logger);

/// Concatenated fenced diffs of every classified result
[[nodiscard]] std::string build_patch(const results::ResultsContainer& container);

/// summary.v1 document for the run
[[nodiscard]] nlohmann::json build_summary(const results::ResultsContainer& container,
                                           const std::optional<results::CleanupReport>& cleanup);

/**
 * Write rewrite.patch (only when there are changes) and summary.json into
 * output_dir, creating it if needed. The summary is schema-checked first.
 */
[[nodiscard]] recon::VoidResult write_reports(const results::ResultsContainer& container,
                                              const std::optional<results::CleanupReport>& cleanup,
                                              const std::filesystem::path& output_dir,
                                              const std::filesystem::path& schema_dir);

}  // namespace recon::report
