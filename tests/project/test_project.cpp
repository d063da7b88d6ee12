/**
 * @file test_project.cpp
 * @brief Build session model and loader tests
 */

#include "recon/project.hpp"

#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

using recon::project::BuildSession;
using recon::project::ProjectNode;
using json = nlohmann::json;

namespace {

/// RAII helper to create and clean up a temporary directory
class TempDir
{
public:
    explicit TempDir(const std::string& name)
        : m_path(std::filesystem::temp_directory_path() / name)
    {
        std::filesystem::remove_all(m_path);
        std::filesystem::create_directories(m_path);
    }
    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

json make_session_json()
{
    return json{
        {  "schema_version",                                                   "build_session.v1"},
        {"local_repository",                                                        "/home/dev/.m2"},
        {        "projects", json::array({{{"id", "parent"}, {"base_dir", "/repo"}},
         {{"id", "child"}, {"base_dir", "/repo/child"}, {"parent", "parent"}},
         {{"id", "synthetic"}, {"base_dir", nullptr}}})                                             }
    };
}

void write_file(const std::filesystem::path& path, const std::string& text)
{
    std::ofstream out(path);
    out << text;
}

}  // namespace

TEST(BuildSession, FromJson)
{
    auto session = recon::project::session_from_json(make_session_json());
    ASSERT_TRUE(session.has_value()) << session.error().message;

    ASSERT_EQ(session->projects().size(), 3U);
    EXPECT_EQ(session->local_repository(), std::filesystem::path("/home/dev/.m2"));
    EXPECT_FALSE(session->execution_root().has_value());

    const ProjectNode& child = session->projects()[1];
    EXPECT_EQ(child.id, "child");
    ASSERT_TRUE(child.base_dir.has_value());
    EXPECT_EQ(*child.base_dir, std::filesystem::path("/repo/child"));
    ASSERT_TRUE(child.parent.has_value());
    EXPECT_EQ(*child.parent, "parent");

    EXPECT_FALSE(session->projects()[2].base_dir.has_value());
}

TEST(BuildSession, FindAndParent)
{
    auto session = recon::project::session_from_json(make_session_json());
    ASSERT_TRUE(session.has_value());

    const ProjectNode* child = session->find("child");
    ASSERT_NE(child, nullptr);
    const ProjectNode* parent = session->parent_of(*child);
    ASSERT_NE(parent, nullptr);
    EXPECT_EQ(parent->id, "parent");
    EXPECT_EQ(session->parent_of(*parent), nullptr);
    EXPECT_EQ(session->find("missing"), nullptr);
}

TEST(BuildSession, UnknownParentHasNoParentNode)
{
    BuildSession session({ProjectNode{.id = "orphan", .base_dir = "/repo", .parent = "ghost"}},
                         "/cache");

    EXPECT_EQ(session.parent_of(session.projects().front()), nullptr);
}

TEST(BuildSession, ExecutionRootIsRead)
{
    json document = make_session_json();
    document["execution_root"] = "/work";

    auto session = recon::project::session_from_json(document);
    ASSERT_TRUE(session.has_value());
    ASSERT_TRUE(session->execution_root().has_value());
    EXPECT_EQ(*session->execution_root(), std::filesystem::path("/work"));
}

TEST(BuildSession, LoadValidatesAgainstSchema)
{
    TempDir temp_dir("recon_project_load_test");
    const auto good = temp_dir.path() / "session.json";
    write_file(good, make_session_json().dump());

    auto loaded = recon::project::load_session(good, RECON_SCHEMA_DIR);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_EQ(loaded->projects().size(), 3U);

    json invalid = make_session_json();
    invalid["projects"][0]["base_dir"] = 42;
    const auto bad = temp_dir.path() / "bad.json";
    write_file(bad, invalid.dump());

    auto rejected = recon::project::load_session(bad, RECON_SCHEMA_DIR);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, "SchemaInvalid");
}

TEST(BuildSession, LoadReportsIoAndParseErrors)
{
    TempDir temp_dir("recon_project_error_test");

    auto missing = recon::project::load_session(temp_dir.path() / "absent.json", RECON_SCHEMA_DIR);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, "IOError");

    const auto garbage = temp_dir.path() / "garbage.json";
    write_file(garbage, "{ not json");
    auto unparsable = recon::project::load_session(garbage, RECON_SCHEMA_DIR);
    ASSERT_FALSE(unparsable.has_value());
    EXPECT_EQ(unparsable.error().code, "ParseError");
}
