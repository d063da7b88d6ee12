#pragma once

/**
 * @file results.hpp
 * @brief Classification of transformation results into reportable categories
 */

#include "recon/common.hpp"
#include "recon/log.hpp"
#include "recon/source_tree.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace recon::results {

struct RecipeOption
{
    std::string name;
    std::optional<std::string> value;
};

/// A recipe that took part in a change, with the sub-recipes it ran
struct RecipeDescriptor
{
    std::string name;
    std::vector<RecipeOption> options;
    std::vector<RecipeDescriptor> recipes;
};

/// Before/after pair for one file; at most one side is expected to be absent
struct TransformationResult
{
    std::optional<tree::SourceSnapshot> before;
    std::optional<tree::SourceSnapshot> after;
    std::vector<RecipeDescriptor> recipes_that_made_changes;
};

/**
 * Diff of one result with its markers rendered by printer.
 * Paths in the header are the snapshots' source paths.
 */
[[nodiscard]] std::string diff(const TransformationResult& result,
                               const tree::MarkerPrinter& printer);

/// diff() with the FencedMarkerPrinter
[[nodiscard]] std::string diff(const TransformationResult& result);

/// Outcome of removing directories emptied by deletions and moves
struct CleanupReport
{
    std::vector<std::filesystem::path> removed;  ///< Directories actually deleted
    std::vector<recon::Error> failures;          ///< One CleanupFailed per directory
};

class ResultsContainer
{
public:
    /**
     * Classify results in one pass. First matching rule wins:
     * - no before, no after: dropped (logged)
     * - no before: generated
     * - no after: deleted
     * - different source paths: moved
     * - same source path: refactored in place when the fenced diff is not
     *   empty, otherwise dropped
     */
    ResultsContainer(std::filesystem::path project_root,
                     std::vector<TransformationResult> results,
                     const log::Logger& logger);

    [[nodiscard]] const std::filesystem::path& project_root() const noexcept
    {
        return m_project_root;
    }
    [[nodiscard]] const std::vector<TransformationResult>& generated() const noexcept
    {
        return m_generated;
    }
    [[nodiscard]] const std::vector<TransformationResult>& deleted() const noexcept
    {
        return m_deleted;
    }
    [[nodiscard]] const std::vector<TransformationResult>& moved() const noexcept
    {
        return m_moved;
    }
    [[nodiscard]] const std::vector<TransformationResult>& refactored_in_place() const noexcept
    {
        return m_refactored_in_place;
    }

    [[nodiscard]] bool is_not_empty() const noexcept;

    /**
     * First ErrorMarkup detail found in an after tree, scanning generated,
     * deleted, moved and refactored-in-place results in that order.
     */
    [[nodiscard]] std::optional<recon::Error> first_exception() const;

    /// Details of the ErrorMarkup markers of result's after tree, in pre-order
    [[nodiscard]] static std::vector<std::string> recipe_errors(const TransformationResult& result);

    /**
     * Delete the directories that held moved or deleted files and are now
     * empty. Each candidate is handled independently; non-empty and missing
     * directories are left alone.
     */
    [[nodiscard]] CleanupReport newly_empty_directories() const;

private:
    std::filesystem::path m_project_root;
    std::vector<TransformationResult> m_generated;
    std::vector<TransformationResult> m_deleted;
    std::vector<TransformationResult> m_moved;
    std::vector<TransformationResult> m_refactored_in_place;
};

}  // namespace recon::results
