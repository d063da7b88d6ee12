/**
 * @file results_container.cpp
 * @brief Result classification, embedded error extraction, empty directory cleanup
 */

#include "recon/results.hpp"

#include "recon/diff.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <functional>
#include <system_error>
#include <utility>

namespace recon::results {

namespace {

namespace fs = std::filesystem;

[[nodiscard]] std::string source_path_of(const tree::SourceSnapshot& snapshot)
{
    return common::normalize_path(snapshot.source_path.generic_string());
}

void append_unique(std::vector<fs::path>& paths, fs::path path)
{
    if (std::ranges::find(paths, path) == paths.end()) {
        paths.push_back(std::move(path));
    }
}

/**
 * @brief Remove dir if it has no entries.
 * @return true when removed, false when left in place
 */
[[nodiscard]] recon::Result<bool> remove_if_empty(const fs::path& dir)
{
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        if (ec) {
            return std::unexpected(Error::make(
                "CleanupFailed", std::format("Failed to stat {}: {}", dir.string(), ec.message())));
        }
        return false;
    }
    fs::directory_iterator contents(dir, ec);
    if (ec) {
        return std::unexpected(Error::make(
            "CleanupFailed", std::format("Failed to list {}: {}", dir.string(), ec.message())));
    }
    if (contents != fs::directory_iterator{}) {
        return false;
    }
    fs::remove(dir, ec);
    if (ec) {
        return std::unexpected(Error::make(
            "CleanupFailed", std::format("Failed to delete {}: {}", dir.string(), ec.message())));
    }
    return true;
}

}  // namespace

std::string diff(const TransformationResult& result, const tree::MarkerPrinter& printer)
{
    tree::DiffPaths paths;
    std::string before_text;
    std::string after_text;
    if (result.before) {
        paths.before = source_path_of(*result.before);
        before_text = tree::print_tree(result.before->tree, printer);
    }
    if (result.after) {
        paths.after = source_path_of(*result.after);
        after_text = tree::print_tree(result.after->tree, printer);
    }
    return tree::unified_diff(before_text, after_text, paths);
}

std::string diff(const TransformationResult& result)
{
    return diff(result, tree::FencedMarkerPrinter{});
}

ResultsContainer::ResultsContainer(fs::path project_root,
                                   std::vector<TransformationResult> results,
                                   const log::Logger& logger)
    : m_project_root(std::move(project_root))
{
    for (auto& result : results) {
        if (!result.before && !result.after) {
            logger.warn("Dropping a transformation result with neither a before nor an after source");
            continue;
        }
        if (!result.before) {
            m_generated.push_back(std::move(result));
        } else if (!result.after) {
            m_deleted.push_back(std::move(result));
        } else if (source_path_of(*result.before) != source_path_of(*result.after)) {
            m_moved.push_back(std::move(result));
        } else if (tree::print_tree(result.before->tree, tree::FencedMarkerPrinter{})
                   != tree::print_tree(result.after->tree, tree::FencedMarkerPrinter{})) {
            // Same path: the diff is non-empty exactly when the fenced renderings differ
            m_refactored_in_place.push_back(std::move(result));
        } else {
            logger.debug(std::format("No effective change to {}",
                                     source_path_of(*result.before)));
        }
    }
}

bool ResultsContainer::is_not_empty() const noexcept
{
    return !m_generated.empty() || !m_deleted.empty() || !m_moved.empty()
           || !m_refactored_in_place.empty();
}

std::optional<recon::Error> ResultsContainer::first_exception() const
{
    const std::array categories{std::cref(m_generated),
                                std::cref(m_deleted),
                                std::cref(m_moved),
                                std::cref(m_refactored_in_place)};
    for (const auto& category : categories) {
        for (const auto& result : category.get()) {
            if (!result.after) {
                continue;
            }
            std::optional<recon::Error> found;
            tree::visit_preorder(result.after->tree, [&found](const tree::TreeNode& node) {
                if (const auto* error = tree::find_marker<tree::ErrorMarkup>(node)) {
                    found = Error::make("RecipeError", error->detail);
                    return false;
                }
                return true;
            });
            if (found) {
                return found;
            }
        }
    }
    return std::nullopt;
}

std::vector<std::string> ResultsContainer::recipe_errors(const TransformationResult& result)
{
    std::vector<std::string> errors;
    if (!result.after) {
        return errors;
    }
    tree::visit_preorder(result.after->tree, [&errors](const tree::TreeNode& node) {
        if (const auto* error = tree::find_marker<tree::ErrorMarkup>(node)) {
            errors.push_back(error->detail);
        }
        return true;
    });
    return errors;
}

CleanupReport ResultsContainer::newly_empty_directories() const
{
    std::vector<fs::path> candidates;
    for (const auto* category : {&m_moved, &m_deleted}) {
        for (const auto& result : *category) {
            if (!result.before) {
                continue;
            }
            append_unique(candidates,
                          (m_project_root / result.before->source_path).lexically_normal().parent_path());
        }
    }

    CleanupReport report;
    for (const auto& dir : candidates) {
        auto removed = remove_if_empty(dir);
        if (!removed) {
            report.failures.push_back(removed.error());
        } else if (*removed) {
            report.removed.push_back(dir);
        }
    }
    return report;
}

}  // namespace recon::results
