/**
 * @file project.cpp
 * @brief Build session model and loader
 */

#include "recon/project.hpp"

#include "recon/json_io.hpp"
#include "recon/schema_validate.hpp"
#include "recon/version.hpp"

#include <algorithm>
#include <utility>

namespace recon::project {

namespace {

[[nodiscard]] ProjectNode node_from_json(const nlohmann::json& entry)
{
    ProjectNode node{.id = entry.at("id").get<std::string>(),
                     .base_dir = std::nullopt,
                     .parent = std::nullopt};
    if (auto base_dir = entry.find("base_dir"); base_dir != entry.end() && base_dir->is_string()) {
        node.base_dir = std::filesystem::path(base_dir->get<std::string>());
    }
    if (auto parent = entry.find("parent"); parent != entry.end()) {
        node.parent = parent->get<std::string>();
    }
    return node;
}

}  // namespace

BuildSession::BuildSession(std::vector<ProjectNode> projects,
                           std::filesystem::path local_repository,
                           std::optional<std::filesystem::path> execution_root)
    : m_projects(std::move(projects))
    , m_local_repository(std::move(local_repository))
    , m_execution_root(std::move(execution_root))
{}

const ProjectNode* BuildSession::find(std::string_view id) const
{
    auto it = std::ranges::find_if(m_projects,
                                   [id](const ProjectNode& node) { return node.id == id; });
    return it == m_projects.end() ? nullptr : &*it;
}

const ProjectNode* BuildSession::parent_of(const ProjectNode& node) const
{
    if (!node.parent) {
        return nullptr;
    }
    return find(*node.parent);
}

recon::Result<BuildSession> session_from_json(const nlohmann::json& document)
{
    try {
        std::vector<ProjectNode> projects;
        for (const auto& entry : document.at("projects")) {
            projects.push_back(node_from_json(entry));
        }
        std::optional<std::filesystem::path> execution_root;
        if (auto root = document.find("execution_root"); root != document.end()) {
            execution_root = std::filesystem::path(root->get<std::string>());
        }
        return BuildSession(std::move(projects),
                            std::filesystem::path(document.at("local_repository").get<std::string>()),
                            std::move(execution_root));
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("SchemaInvalid", std::string("Malformed build session: ") + ex.what()));
    }
}

recon::Result<BuildSession> load_session(const std::filesystem::path& path,
                                         const std::filesystem::path& schema_dir)
{
    auto document = common::read_json_file(path);
    if (!document) {
        return std::unexpected(document.error());
    }
    if (auto valid = common::validate_document(*document, schema_dir, recon::kBuildSessionSchema);
        !valid) {
        return std::unexpected(valid.error());
    }
    return session_from_json(*document);
}

}  // namespace recon::project
