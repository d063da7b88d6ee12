/**
 * @file build_root.cpp
 * @brief Canonical build root and repository root resolution
 */

#include "recon/build_root.hpp"

#include <set>
#include <string>
#include <system_error>
#include <unordered_set>

namespace recon::project {

namespace {

namespace fs = std::filesystem;

[[nodiscard]] std::string normalized(const fs::path& path)
{
    return common::normalize_path(path.generic_string());
}

// Walks node -> parent -> ... and stops at the first module without a base
// directory. Cache directories are excluded but the walk goes on past them.
void collect_chain(const BuildSession& session,
                   const ProjectNode& start,
                   const std::string& cache,
                   std::set<std::string>& out)
{
    std::unordered_set<std::string> visited;
    for (const ProjectNode* node = &start; node != nullptr; node = session.parent_of(*node)) {
        if (!visited.insert(node->id).second || !node->base_dir) {
            return;
        }
        std::string base_dir = normalized(*node->base_dir);
        if (common::is_within(base_dir, cache)) {
            continue;
        }
        out.insert(std::move(base_dir));
    }
}

}  // namespace

std::vector<fs::path> collect_base_dirs(const BuildSession& session)
{
    const std::string cache = normalized(session.local_repository());
    std::set<std::string> base_dirs;
    for (const auto& node : session.projects()) {
        collect_chain(session, node, cache, base_dirs);
    }
    return std::vector<fs::path>(base_dirs.begin(), base_dirs.end());
}

recon::Result<fs::path> resolve_build_root(const BuildSession& session)
{
    auto base_dirs = collect_base_dirs(session);
    if (!base_dirs.empty()) {
        return base_dirs.front();
    }
    if (session.execution_root() && !session.execution_root()->empty()) {
        return fs::path(normalized(*session.execution_root()));
    }
    return std::unexpected(Error::make(
        "BuildRootUnresolved",
        "No module has a base directory outside the local repository and no execution root is set"));
}

fs::path locate_repository_root(const fs::path& build_root)
{
    fs::path candidate = build_root;
    while (!candidate.empty()) {
        std::error_code ec;
        if (fs::exists(candidate / kVcsMarker, ec)) {
            return candidate;
        }
        fs::path parent = candidate.parent_path();
        if (parent == candidate) {
            break;
        }
        candidate = std::move(parent);
    }
    return build_root;
}

recon::Result<fs::path> repository_root(const BuildSession& session)
{
    auto build_root = resolve_build_root(session);
    if (!build_root) {
        return std::unexpected(build_root.error());
    }
    return locate_repository_root(*build_root);
}

}  // namespace recon::project
