/**
 * @file report.cpp
 * @brief Change log, patch and summary for classified results
 */

#include "recon/report.hpp"

#include "recon/json_io.hpp"
#include "recon/schema_validate.hpp"
#include "recon/version.hpp"

#include <format>
#include <fstream>
#include <string_view>
#include <system_error>
#include <utility>

namespace recon::report {

namespace {

namespace fs = std::filesystem;
using results::RecipeDescriptor;
using results::ResultsContainer;
using results::TransformationResult;

[[nodiscard]] std::string path_of(const tree::SourceSnapshot& snapshot)
{
    return common::normalize_path(snapshot.source_path.generic_string());
}

[[nodiscard]] std::string describe_recipe(const RecipeDescriptor& recipe)
{
    std::string options;
    for (const auto& option : recipe.options) {
        if (!option.value) {
            continue;
        }
        if (!options.empty()) {
            options += ", ";
        }
        options += std::format("{}={}", option.name, *option.value);
    }
    if (options.empty()) {
        return recipe.name;
    }
    return std::format("{}: {{{}}}", recipe.name, options);
}

void describe_into(std::vector<std::string>& lines,
                   const RecipeDescriptor& recipe,
                   const std::string& indent)
{
    lines.push_back(indent + describe_recipe(recipe));
    for (const auto& child : recipe.recipes) {
        describe_into(lines, child, indent + "    ");
    }
}

void log_result(const log::Logger& logger,
                const std::string& headline,
                const TransformationResult& result)
{
    logger.warn(headline);
    for (const auto& line : describe_recipes(result.recipes_that_made_changes)) {
        logger.warn(line);
    }
}

[[nodiscard]] std::vector<std::string> recipe_names(const TransformationResult& result)
{
    std::vector<std::string> names;
    names.reserve(result.recipes_that_made_changes.size());
    for (const auto& recipe : result.recipes_that_made_changes) {
        names.push_back(recipe.name);
    }
    return names;
}

[[nodiscard]] nlohmann::json summary_entries(const std::vector<TransformationResult>& category)
{
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& result : category) {
        nlohmann::json entry = {
            {"recipes", recipe_names(result)}
        };
        if (result.before) {
            entry["before"] = path_of(*result.before);
        }
        if (result.after) {
            entry["after"] = path_of(*result.after);
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

[[nodiscard]] recon::VoidResult write_text_file(const fs::path& path, std::string_view text)
{
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        return std::unexpected(
            recon::Error::make("IOError", "Failed to open output file: " + path.string()));
    }
    out << text;
    if (!out) {
        return std::unexpected(
            recon::Error::make("IOError", "Failed to write output file: " + path.string()));
    }
    return {};
}

}  // namespace

std::vector<std::string> describe_recipes(const std::vector<RecipeDescriptor>& recipes)
{
    std::vector<std::string> lines;
    for (const auto& recipe : recipes) {
        describe_into(lines, recipe, "    ");
    }
    return lines;
}

void log_changes(const ResultsContainer& container, RunMode mode, const log::Logger& logger)
{
    const bool dry_run = mode == RunMode::kDryRun;
    for (const auto& result : container.generated()) {
        const std::string path = path_of(*result.after);
        log_result(logger,
                   dry_run ? std::format("These recipes would generate new file {}:", path)
                           : std::format("Generated new file {} by:", path),
                   result);
    }
    for (const auto& result : container.deleted()) {
        const std::string path = path_of(*result.before);
        log_result(logger,
                   dry_run ? std::format("These recipes would delete file {}:", path)
                           : std::format("Deleted file {} by:", path),
                   result);
    }
    for (const auto& result : container.moved()) {
        const std::string from = path_of(*result.before);
        const std::string to = path_of(*result.after);
        log_result(logger,
                   dry_run ? std::format("These recipes would move file from {} to {}:", from, to)
                           : std::format("File has been moved from {} to {} by:", from, to),
                   result);
    }
    for (const auto& result : container.refactored_in_place()) {
        const std::string path = path_of(*result.before);
        log_result(logger,
                   dry_run ? std::format("These recipes would make changes to {}:", path)
                           : std::format("Changes have been made to {} by:", path),
                   result);
    }
}

std::string build_patch(const ResultsContainer& container)
{
    std::string patch;
    for (const auto* category : {&container.generated(),
                                 &container.deleted(),
                                 &container.moved(),
                                 &container.refactored_in_place()}) {
        for (const auto& result : *category) {
            patch += results::diff(result);
        }
    }
    return patch;
}

nlohmann::json build_summary(const ResultsContainer& container,
                             const std::optional<results::CleanupReport>& cleanup)
{
    const auto first_exception = container.first_exception();
    std::string status = "no_changes";
    if (first_exception) {
        status = "failed";
    } else if (container.is_not_empty()) {
        status = "changes";
    }

    nlohmann::json summary = {
        {     "schema_version",                                                   recon::kSummarySchema},
        {               "tool", {{"name", "recon"}, {"version", recon::kVersion}, {"build_id", recon::kBuildId}}},
        {             "status",                                                                  status},
        {       "project_root",                                 container.project_root().generic_string()},
        {          "generated",                                   summary_entries(container.generated())},
        {            "deleted",                                     summary_entries(container.deleted())},
        {              "moved",                                       summary_entries(container.moved())},
        {"refactored_in_place",                         summary_entries(container.refactored_in_place())}
    };
    if (first_exception) {
        summary["first_exception"] = first_exception->message;
    }
    if (cleanup) {
        nlohmann::json removed = nlohmann::json::array();
        for (const auto& dir : cleanup->removed) {
            removed.push_back(dir.generic_string());
        }
        nlohmann::json warnings = nlohmann::json::array();
        for (const auto& failure : cleanup->failures) {
            warnings.push_back(failure.message);
        }
        summary["removed_directories"] = std::move(removed);
        summary["cleanup_warnings"] = std::move(warnings);
    }
    return summary;
}

recon::VoidResult write_reports(const ResultsContainer& container,
                                const std::optional<results::CleanupReport>& cleanup,
                                const fs::path& output_dir,
                                const fs::path& schema_dir)
{
    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
        return std::unexpected(recon::Error::make(
            "IOError",
            std::format("Failed to create output directory {}: {}", output_dir.string(), ec.message())));
    }

    if (container.is_not_empty()) {
        if (auto written = write_text_file(output_dir / kPatchFileName, build_patch(container));
            !written) {
            return written;
        }
    }

    const nlohmann::json summary = build_summary(container, cleanup);
    if (auto valid = common::validate_document(summary, schema_dir, recon::kSummarySchema); !valid) {
        return valid;
    }
    return common::write_json_file(output_dir / kSummaryFileName, summary);
}

}  // namespace recon::report
