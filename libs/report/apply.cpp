/**
 * @file apply.cpp
 * @brief Writing classified results back to the working tree
 */

#include "recon/report/apply.hpp"

#include <format>
#include <fstream>
#include <system_error>

namespace recon::report {

namespace {

namespace fs = std::filesystem;

[[nodiscard]] recon::VoidResult write_source(const fs::path& root,
                                             const tree::SourceSnapshot& snapshot)
{
    const fs::path target = root / snapshot.source_path;
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return std::unexpected(recon::Error::make(
                "ApplyFailed",
                std::format("Failed to create directory for {}: {}", target.string(), ec.message())));
        }
    }
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(
            recon::Error::make("ApplyFailed", "Failed to open " + target.string() + " for writing"));
    }
    out << tree::print_tree(snapshot.tree, tree::PlainMarkerPrinter{});
    if (!out) {
        return std::unexpected(recon::Error::make("ApplyFailed", "Failed to write " + target.string()));
    }
    return {};
}

[[nodiscard]] recon::VoidResult remove_source(const fs::path& root,
                                              const tree::SourceSnapshot& snapshot)
{
    const fs::path target = root / snapshot.source_path;
    std::error_code ec;
    fs::remove(target, ec);
    if (ec) {
        return std::unexpected(recon::Error::make(
            "ApplyFailed", std::format("Failed to delete {}: {}", target.string(), ec.message())));
    }
    return {};
}

}  // namespace

recon::VoidResult apply_changes(const results::ResultsContainer& container)
{
    const fs::path& root = container.project_root();
    for (const auto& result : container.generated()) {
        if (auto applied = write_source(root, *result.after); !applied) {
            return applied;
        }
    }
    for (const auto& result : container.deleted()) {
        if (auto applied = remove_source(root, *result.before); !applied) {
            return applied;
        }
    }
    for (const auto& result : container.moved()) {
        if (auto applied = remove_source(root, *result.before); !applied) {
            return applied;
        }
        if (auto applied = write_source(root, *result.after); !applied) {
            return applied;
        }
    }
    for (const auto& result : container.refactored_in_place()) {
        if (auto applied = write_source(root, *result.after); !applied) {
            return applied;
        }
    }
    return {};
}

}  // namespace recon::report
