#include "recon/schema_validate.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace recon::common::test {

namespace {

std::string schema_path(const std::string& name)
{
    return std::string(RECON_SCHEMA_DIR) + "/" + name;
}

nlohmann::json make_build_session_json()
{
    return nlohmann::json{
        {  "schema_version",                                                "build_session.v1"},
        {"local_repository",                                                     "/home/dev/.m2"},
        {  "execution_root",                                                             "/repo"},
        {        "projects", nlohmann::json::array({{{"id", "app"}, {"base_dir", "/repo/app"}, {"parent", "root"}},
         {{"id", "root"}, {"base_dir", nullptr}}})                                             }
    };
}

nlohmann::json make_node_json()
{
    return nlohmann::json{
        {    "text",                                                                            "class A {"},
        {"markers", nlohmann::json::array({{{"kind", "search_result"}, {"id", "m1"}, {"description", "hit"}}})},
        {"children",               nlohmann::json::array({{{"text", "}"}, {"markers", nlohmann::json::array()}}})}
    };
}

nlohmann::json make_results_json()
{
    nlohmann::json recipe = {
        {   "name",                                                   "org.example.Rename"},
        {"options", nlohmann::json::array({{{"name", "to"}, {"value", "B"}}, {{"name", "unused"}}})},
        {"recipes",                                                  nlohmann::json::array()}
    };
    return nlohmann::json{
        {"schema_version",                                                           "results.v1"},
        {"active_recipes",                              nlohmann::json::array({"org.example.Rename"})},
        {       "results",
         nlohmann::json::array({{{"before", {{"source_path", "src/A.java"}, {"tree", make_node_json()}}},
         {"after", {{"source_path", "src/B.java"}, {"tree", make_node_json()}}},
         {"recipes", nlohmann::json::array({recipe})}},
         {{"before", nullptr},
         {"after", {{"source_path", "src/C.java"}, {"tree", {{"text", "class C {}"}}}}}}})}
    };
}

nlohmann::json make_summary_json()
{
    return nlohmann::json{
        {     "schema_version",                                                  "summary.v1"},
        {               "tool", {{"name", "recon"}, {"version", "0.1.0"}, {"build_id", "dev"}}},
        {             "status",                                                     "changes"},
        {       "project_root",                                                       "/repo"},
        {          "generated",                          nlohmann::json::array({{{"after", "src/C.java"},
         {"recipes", nlohmann::json::array({"org.example.Gen"})}}})                                },
        {            "deleted",                                        nlohmann::json::array()},
        {              "moved",                                        nlohmann::json::array()},
        {"refactored_in_place",                                        nlohmann::json::array()},
        {"removed_directories",                                nlohmann::json::array({"/repo/old"})},
        {   "cleanup_warnings",                                        nlohmann::json::array()}
    };
}

nlohmann::json make_config_json()
{
    return nlohmann::json{
        { "schema_version",    "config.v1"},
        {        "session", "session.json"},
        {        "results", "results.json"},
        {         "output",     "out/rewrite"},
        {"fail_on_changes",             true},
        {        "verbose",            false}
    };
}

struct SchemaCase
{
    std::string schema_file;
    nlohmann::json valid_json;
};

std::vector<SchemaCase> make_schema_cases()
{
    return {
        {.schema_file = "build_session.v1.schema.json", .valid_json = make_build_session_json()},
        {      .schema_file = "results.v1.schema.json",       .valid_json = make_results_json()},
        {      .schema_file = "summary.v1.schema.json",       .valid_json = make_summary_json()},
        {       .schema_file = "config.v1.schema.json",        .valid_json = make_config_json()}
    };
}

}  // namespace

TEST(SchemaValidateTest, ValidSchemaSamplesPass)
{
    for (const auto& schema_case : make_schema_cases()) {
        SCOPED_TRACE(schema_case.schema_file);
        auto result = recon::common::validate_json(schema_case.valid_json,
                                                   schema_path(schema_case.schema_file));

        EXPECT_TRUE(result) << (result ? "" : result.error().message);
    }
}

TEST(SchemaValidateTest, InvalidSchemaSamplesFail)
{
    for (const auto& schema_case : make_schema_cases()) {
        SCOPED_TRACE(schema_case.schema_file);
        nlohmann::json invalid = schema_case.valid_json;
        invalid["schema_version"] = "invalid.v0";

        auto result = recon::common::validate_json(invalid, schema_path(schema_case.schema_file));

        ASSERT_FALSE(result);
        EXPECT_FALSE(result.error().message.empty());
    }
}

TEST(SchemaValidateTest, NestedMarkerKindIsChecked)
{
    nlohmann::json invalid = make_results_json();
    invalid["results"][0]["after"]["tree"]["children"][0]["markers"] =
        nlohmann::json::array({{{"kind", "bogus"}, {"id", "m9"}}});

    auto result = recon::common::validate_json(invalid, schema_path("results.v1.schema.json"));

    EXPECT_FALSE(result);
}

TEST(SchemaValidateTest, ValidateDocumentReportsSchemaName)
{
    nlohmann::json invalid = make_build_session_json();
    invalid.erase("local_repository");

    auto result = recon::common::validate_document(invalid, RECON_SCHEMA_DIR, "build_session.v1");

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "SchemaInvalid");
    EXPECT_TRUE(result.error().message.starts_with("build_session.v1 schema validation failed"));
}

TEST(SchemaValidateTest, MissingSchemaFileFails)
{
    auto result = recon::common::validate_json(make_config_json(), schema_path("nope.v1.schema.json"));

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "SchemaFileOpenFailed");
}

}  // namespace recon::common::test
