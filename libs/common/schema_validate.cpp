/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "recon/schema_validate.hpp"

#include <format>
#include <fstream>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace recon::common {

namespace {

constexpr std::string_view kDefsRefPrefix = "#/$defs/";

// valijson understands draft-7 "definitions" only.
void rewrite_defs(nlohmann::json& schema)
{
    if (schema.is_array()) {
        for (auto& item : schema) {
            rewrite_defs(item);
        }
        return;
    }
    if (!schema.is_object()) {
        return;
    }
    if (auto defs = schema.find("$defs"); defs != schema.end() && !schema.contains("definitions")) {
        schema["definitions"] = *defs;
    }
    for (auto& [key, value] : schema.items()) {
        if (key == "$ref" && value.is_string()) {
            const auto& ref = value.get_ref<const std::string&>();
            if (ref.starts_with(kDefsRefPrefix)) {
                value = "#/definitions/" + ref.substr(kDefsRefPrefix.size());
            }
            continue;
        }
        rewrite_defs(value);
    }
}

[[nodiscard]] recon::Result<nlohmann::json> load_schema(const std::filesystem::path& schema_path)
{
    std::ifstream in(schema_path);
    if (!in) {
        return std::unexpected(Error::make("SchemaFileOpenFailed",
                                           "Failed to open schema file: " + schema_path.string()));
    }
    nlohmann::json schema;
    try {
        in >> schema;
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make(
            "SchemaParseFailed",
            std::format("Failed to parse schema {}: {}", schema_path.string(), ex.what())));
    }
    rewrite_defs(schema);
    return schema;
}

[[nodiscard]] std::string describe_failures(valijson::ValidationResults& results)
{
    std::vector<std::string> lines;
    valijson::ValidationResults::Error error;
    while (results.popError(error)) {
        std::string pointer;
        for (const auto& part : error.context) {
            pointer += "/" + part;
        }
        lines.push_back(std::format("{}: {}", pointer.empty() ? "/" : pointer, error.description));
    }

    std::string joined;
    for (const auto& line : lines) {
        if (!joined.empty()) {
            joined += '\n';
        }
        joined += line;
    }
    return joined.empty() ? "Schema validation failed." : joined;
}

}  // namespace

recon::VoidResult validate_json(const nlohmann::json& j, const std::filesystem::path& schema_path)
{
    auto schema_json = load_schema(schema_path);
    if (!schema_json) {
        return std::unexpected(schema_json.error());
    }

    valijson::Schema schema;
    try {
        valijson::SchemaParser parser;
        valijson::adapters::NlohmannJsonAdapter schema_adapter(*schema_json);
        parser.populateSchema(schema_adapter, schema);
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("SchemaBuildFailed", std::string("Failed to build schema: ") + ex.what()));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target_adapter(j);
    if (!validator.validate(schema, target_adapter, &results)) {
        return std::unexpected(Error::make("SchemaValidationFailed", describe_failures(results)));
    }
    return {};
}

recon::VoidResult validate_document(const nlohmann::json& j,
                                    const std::filesystem::path& schema_dir,
                                    std::string_view schema_name)
{
    const auto schema_path = schema_dir / (std::string(schema_name) + ".schema.json");
    if (auto result = validate_json(j, schema_path); !result) {
        return std::unexpected(Error::make(
            "SchemaInvalid",
            std::format("{} schema validation failed: {}", schema_name, result.error().message)));
    }
    return {};
}

}  // namespace recon::common
