#pragma once

/**
 * @file project.hpp
 * @brief Build session model: modules, parent links, artifact cache
 */

#include "recon/common.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace recon::project {

/**
 * @brief One module of the build.
 *
 * Parent links are by id and form a tree; a missing base_dir means the
 * module has no resolvable location.
 */
struct ProjectNode
{
    std::string id;
    std::optional<std::filesystem::path> base_dir;
    std::optional<std::string> parent;
};

class BuildSession
{
public:
    BuildSession(std::vector<ProjectNode> projects,
                 std::filesystem::path local_repository,
                 std::optional<std::filesystem::path> execution_root = std::nullopt);

    [[nodiscard]] const std::vector<ProjectNode>& projects() const noexcept { return m_projects; }
    [[nodiscard]] const std::filesystem::path& local_repository() const noexcept
    {
        return m_local_repository;
    }
    [[nodiscard]] const std::optional<std::filesystem::path>& execution_root() const noexcept
    {
        return m_execution_root;
    }

    /// Node with the given id, or nullptr
    [[nodiscard]] const ProjectNode* find(std::string_view id) const;

    /// Parent of node, or nullptr when it has none or the id is unknown
    [[nodiscard]] const ProjectNode* parent_of(const ProjectNode& node) const;

private:
    std::vector<ProjectNode> m_projects;
    std::filesystem::path m_local_repository;
    std::optional<std::filesystem::path> m_execution_root;
};

/**
 * Build a session from a build_session.v1 document (already schema-checked).
 */
[[nodiscard]] recon::Result<BuildSession> session_from_json(const nlohmann::json& document);

/**
 * Read, validate and convert a build session document.
 * @param path build_session.json
 * @param schema_dir Directory containing build_session.v1.schema.json
 */
[[nodiscard]] recon::Result<BuildSession> load_session(const std::filesystem::path& path,
                                                       const std::filesystem::path& schema_dir);

}  // namespace recon::project
