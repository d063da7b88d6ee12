/**
 * @file test_report.cpp
 * @brief Change log, patch and summary tests
 */

#include "recon/report.hpp"

#include "recon/json_io.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

using namespace recon::results;
using recon::log::Level;
using recon::log::Logger;
using recon::report::RunMode;
using recon::tree::ErrorMarkup;
using recon::tree::Marker;
using recon::tree::SourceSnapshot;
using recon::tree::TreeNode;
namespace fs = std::filesystem;

namespace {

/// RAII helper to create and clean up a temporary directory
class TempDir
{
public:
    explicit TempDir(const std::string& name)
        : m_path(fs::temp_directory_path() / name)
    {
        fs::remove_all(m_path);
        fs::create_directories(m_path);
    }
    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const fs::path& path() const { return m_path; }

private:
    fs::path m_path;
};

SourceSnapshot snapshot(const std::string& path, const std::string& text, std::vector<Marker> markers = {})
{
    return SourceSnapshot{
        .source_path = path,
        .tree = TreeNode{.text = text, .markers = std::move(markers), .children = {}}
    };
}

RecipeDescriptor make_recipe_tree()
{
    return RecipeDescriptor{
        .name = "org.example.Composite",
        .options = {},
        .recipes = {RecipeDescriptor{.name = "org.example.ChangeType",
                                     .options = {RecipeOption{.name = "oldFullyQualifiedTypeName", .value = "a.A"},
                                                 RecipeOption{.name = "newFullyQualifiedTypeName", .value = "b.B"},
                                                 RecipeOption{.name = "ignoreDefinition", .value = std::nullopt}},
                                     .recipes = {}}}
    };
}

std::vector<TransformationResult> make_results()
{
    std::vector<TransformationResult> results;
    results.push_back(TransformationResult{.before = std::nullopt,
                                           .after = snapshot("src/New.java", "class New {}\n"),
                                           .recipes_that_made_changes = {make_recipe_tree()}});
    results.push_back(TransformationResult{.before = snapshot("src/Old.java", "class Old {}\n"),
                                           .after = std::nullopt,
                                           .recipes_that_made_changes = {make_recipe_tree()}});
    results.push_back(TransformationResult{.before = snapshot("src/C.java", "int x;\n"),
                                           .after = snapshot("src/C.java", "int y;\n"),
                                           .recipes_that_made_changes = {make_recipe_tree()}});
    return results;
}

struct Captured
{
    std::vector<std::string> warnings;

    [[nodiscard]] Logger logger()
    {
        return Logger(Level::kInfo, [this](Level level, std::string_view message) {
            if (level == Level::kWarn) {
                warnings.emplace_back(message);
            }
        });
    }
};

std::string read_text(const fs::path& path)
{
    std::ifstream in(path);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

}  // namespace

TEST(Report, DescribeRecipesIndentsNestedRecipes)
{
    EXPECT_EQ(recon::report::describe_recipes({make_recipe_tree()}),
              (std::vector<std::string>{
                  "    org.example.Composite",
                  "        org.example.ChangeType: {oldFullyQualifiedTypeName=a.A, newFullyQualifiedTypeName=b.B}"}));
}

TEST(Report, DryRunChangeLog)
{
    Captured captured;
    const Logger logger = captured.logger();
    ResultsContainer container("/repo", make_results(), logger);

    recon::report::log_changes(container, RunMode::kDryRun, logger);

    ASSERT_EQ(captured.warnings.size(), 9U);
    EXPECT_EQ(captured.warnings[0], "These recipes would generate new file src/New.java:");
    EXPECT_EQ(captured.warnings[1], "    org.example.Composite");
    EXPECT_EQ(captured.warnings[3], "These recipes would delete file src/Old.java:");
    EXPECT_EQ(captured.warnings[6], "These recipes would make changes to src/C.java:");
}

TEST(Report, RunChangeLog)
{
    Captured captured;
    const Logger logger = captured.logger();
    std::vector<TransformationResult> results;
    results.push_back(TransformationResult{.before = snapshot("a/A.java", "a\n"),
                                           .after = snapshot("b/A.java", "a\n"),
                                           .recipes_that_made_changes = {}});
    ResultsContainer container("/repo", std::move(results), logger);

    recon::report::log_changes(container, RunMode::kRun, logger);

    ASSERT_EQ(captured.warnings.size(), 1U);
    EXPECT_EQ(captured.warnings[0], "File has been moved from a/A.java to b/A.java by:");
}

TEST(Report, PatchConcatenatesDiffsInCategoryOrder)
{
    ResultsContainer container("/repo", make_results(), Logger(Level::kError));

    const std::string patch = recon::report::build_patch(container);

    const auto generated = patch.find("diff --git a/src/New.java b/src/New.java\nnew file mode 100644\n");
    const auto deleted = patch.find("diff --git a/src/Old.java b/src/Old.java\ndeleted file mode 100644\n");
    const auto changed = patch.find("diff --git a/src/C.java b/src/C.java\n");
    ASSERT_NE(generated, std::string::npos);
    ASSERT_NE(deleted, std::string::npos);
    ASSERT_NE(changed, std::string::npos);
    EXPECT_LT(generated, deleted);
    EXPECT_LT(deleted, changed);
}

TEST(Report, SummaryStatus)
{
    ResultsContainer empty("/repo", {}, Logger(Level::kError));
    EXPECT_EQ(recon::report::build_summary(empty, std::nullopt).at("status"), "no_changes");

    ResultsContainer changed("/repo", make_results(), Logger(Level::kError));
    auto summary = recon::report::build_summary(changed, std::nullopt);
    EXPECT_EQ(summary.at("status"), "changes");
    EXPECT_EQ(summary.at("generated").at(0).at("after"), "src/New.java");
    EXPECT_EQ(summary.at("generated").at(0).at("recipes").at(0), "org.example.Composite");
    EXPECT_FALSE(summary.contains("removed_directories"));

    std::vector<TransformationResult> failing;
    failing.push_back(TransformationResult{
        .before = std::nullopt,
        .after = snapshot("src/E.java", "x\n", {ErrorMarkup{.id = "e1", .message = "boom", .detail = "stack"}}),
        .recipes_that_made_changes = {}});
    ResultsContainer failed("/repo", std::move(failing), Logger(Level::kError));
    summary = recon::report::build_summary(failed, std::nullopt);
    EXPECT_EQ(summary.at("status"), "failed");
    EXPECT_EQ(summary.at("first_exception"), "stack");
}

TEST(Report, SummaryCarriesCleanup)
{
    ResultsContainer container("/repo", make_results(), Logger(Level::kError));
    CleanupReport cleanup{.removed = {"/repo/src/old"},
                          .failures = {recon::Error::make("CleanupFailed", "Failed to delete /repo/x")}};

    auto summary = recon::report::build_summary(container, cleanup);

    EXPECT_EQ(summary.at("removed_directories"), nlohmann::json::array({"/repo/src/old"}));
    EXPECT_EQ(summary.at("cleanup_warnings"), nlohmann::json::array({"Failed to delete /repo/x"}));
}

TEST(Report, WriteReportsProducesPatchAndSummary)
{
    TempDir temp_dir("recon_report_write_test");
    const fs::path output = temp_dir.path() / "target" / "rewrite";
    ResultsContainer container("/repo", make_results(), Logger(Level::kError));

    auto written = recon::report::write_reports(container, std::nullopt, output, RECON_SCHEMA_DIR);
    ASSERT_TRUE(written.has_value()) << written.error().message;

    EXPECT_EQ(read_text(output / recon::report::kPatchFileName), recon::report::build_patch(container));
    auto summary = recon::common::read_json_file(output / recon::report::kSummaryFileName);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->at("schema_version"), "summary.v1");
    EXPECT_EQ(summary->at("status"), "changes");
}

TEST(Report, NoChangesWritesNoPatch)
{
    TempDir temp_dir("recon_report_empty_test");
    ResultsContainer container("/repo", {}, Logger(Level::kError));

    auto written = recon::report::write_reports(container, std::nullopt, temp_dir.path(), RECON_SCHEMA_DIR);
    ASSERT_TRUE(written.has_value()) << written.error().message;

    EXPECT_FALSE(fs::exists(temp_dir.path() / recon::report::kPatchFileName));
    EXPECT_TRUE(fs::exists(temp_dir.path() / recon::report::kSummaryFileName));
}
