/**
 * @file results_io.cpp
 * @brief Conversion of the engine's results document into TransformationResults
 */

#include "recon/results_io.hpp"

#include "recon/json_io.hpp"
#include "recon/schema_validate.hpp"
#include "recon/version.hpp"

#include <cstddef>
#include <format>
#include <utility>

namespace recon::results {

namespace {

[[nodiscard]] std::string string_or_empty(const nlohmann::json& object, const char* key)
{
    return object.value(key, std::string{});
}

[[nodiscard]] tree::Marker marker_from_json(const nlohmann::json& entry)
{
    const auto kind = entry.at("kind").get<std::string>();
    auto id = entry.at("id").get<std::string>();
    if (kind == "search_result") {
        tree::SearchResult marker{.id = std::move(id), .description = std::nullopt};
        if (entry.contains("description")) {
            marker.description = entry.at("description").get<std::string>();
        }
        return marker;
    }
    if (kind == "error") {
        return tree::ErrorMarkup{.id = std::move(id),
                                 .message = string_or_empty(entry, "message"),
                                 .detail = string_or_empty(entry, "detail")};
    }
    if (kind == "generated") {
        return tree::Generated{.id = std::move(id)};
    }
    return tree::Other{.id = std::move(id), .type = string_or_empty(entry, "type")};
}

// Checked before schema validation, whose traversal recurses per level.
[[nodiscard]] VoidResult check_tree_depth(const nlohmann::json& document)
{
    auto results = document.find("results");
    if (!document.is_object() || results == document.end() || !results->is_array()) {
        return {};
    }
    std::vector<std::pair<const nlohmann::json*, std::size_t>> pending;
    for (std::size_t index = 0; index < results->size(); ++index) {
        const auto& entry = (*results)[index];
        for (const char* side : {"before", "after"}) {
            if (!entry.is_object()) {
                continue;
            }
            auto snapshot = entry.find(side);
            if (snapshot == entry.end() || !snapshot->is_object()) {
                continue;
            }
            if (auto tree = snapshot->find("tree"); tree != snapshot->end()) {
                pending.emplace_back(&*tree, 1);
            }
        }
        while (!pending.empty()) {
            auto [node, depth] = pending.back();
            pending.pop_back();
            if (depth > kMaxTreeDepth) {
                return std::unexpected(Error::make(
                    "SchemaInvalid",
                    std::format("Source tree of result {} is nested deeper than {} levels", index,
                                kMaxTreeDepth)));
            }
            if (!node->is_object()) {
                continue;
            }
            auto children = node->find("children");
            if (children == node->end() || !children->is_array()) {
                continue;
            }
            for (const auto& child : *children) {
                pending.emplace_back(&child, depth + 1);
            }
        }
    }
    return {};
}

// Trees can be deep; nodes are materialized with an explicit work list.
[[nodiscard]] tree::TreeNode tree_from_json(const nlohmann::json& root)
{
    tree::TreeNode result;
    std::vector<std::pair<const nlohmann::json*, tree::TreeNode*>> pending{
        {&root, &result}
    };
    while (!pending.empty()) {
        auto [json, node] = pending.back();
        pending.pop_back();
        node->text = string_or_empty(*json, "text");
        if (auto markers = json->find("markers"); markers != json->end()) {
            for (const auto& marker : *markers) {
                node->markers.push_back(marker_from_json(marker));
            }
        }
        if (auto children = json->find("children"); children != json->end()) {
            node->children.resize(children->size());
            for (std::size_t i = 0; i < children->size(); ++i) {
                pending.emplace_back(&(*children)[i], &node->children[i]);
            }
        }
    }
    return result;
}

[[nodiscard]] std::optional<tree::SourceSnapshot> snapshot_from_json(const nlohmann::json& result,
                                                                     const char* side)
{
    auto entry = result.find(side);
    if (entry == result.end() || entry->is_null()) {
        return std::nullopt;
    }
    return tree::SourceSnapshot{
        .source_path = std::filesystem::path(entry->at("source_path").get<std::string>()),
        .tree = tree_from_json(entry->at("tree"))};
}

[[nodiscard]] RecipeDescriptor recipe_from_json(const nlohmann::json& entry)
{
    RecipeDescriptor recipe{.name = entry.at("name").get<std::string>(), .options = {}, .recipes = {}};
    if (auto options = entry.find("options"); options != entry.end()) {
        for (const auto& option : *options) {
            RecipeOption parsed{.name = option.at("name").get<std::string>(), .value = std::nullopt};
            if (auto value = option.find("value"); value != option.end() && value->is_string()) {
                parsed.value = value->get<std::string>();
            }
            recipe.options.push_back(std::move(parsed));
        }
    }
    if (auto nested = entry.find("recipes"); nested != entry.end()) {
        for (const auto& child : *nested) {
            recipe.recipes.push_back(recipe_from_json(child));
        }
    }
    return recipe;
}

[[nodiscard]] bool is_generated_source(const TransformationResult& result)
{
    return result.before && tree::find_marker<tree::Generated>(result.before->tree) != nullptr;
}

}  // namespace

recon::Result<ResultsDocument> results_from_json(const nlohmann::json& document)
{
    if (auto shallow = check_tree_depth(document); !shallow) {
        return std::unexpected(shallow.error());
    }
    try {
        ResultsDocument parsed;
        if (auto active = document.find("active_recipes"); active != document.end()) {
            parsed.active_recipes = active->get<std::vector<std::string>>();
        }
        for (const auto& entry : document.at("results")) {
            TransformationResult result{.before = snapshot_from_json(entry, "before"),
                                        .after = snapshot_from_json(entry, "after"),
                                        .recipes_that_made_changes = {}};
            if (auto recipes = entry.find("recipes"); recipes != entry.end()) {
                for (const auto& recipe : *recipes) {
                    result.recipes_that_made_changes.push_back(recipe_from_json(recipe));
                }
            }
            parsed.results.push_back(std::move(result));
        }
        return parsed;
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("SchemaInvalid", std::string("Malformed results document: ") + ex.what()));
    }
}

recon::Result<ResultsDocument> load_results(const std::filesystem::path& path,
                                            const std::filesystem::path& schema_dir)
{
    auto document = common::read_json_file(path);
    if (!document) {
        return std::unexpected(document.error());
    }
    if (auto shallow = check_tree_depth(*document); !shallow) {
        return std::unexpected(shallow.error());
    }
    if (auto valid = common::validate_document(*document, schema_dir, recon::kResultsSchema);
        !valid) {
        return std::unexpected(valid.error());
    }
    return results_from_json(*document);
}

std::vector<TransformationResult> select_results(ResultsDocument document,
                                                 const log::Logger& logger)
{
    std::vector<TransformationResult> selected;
    if (document.active_recipes.empty()) {
        logger.warn(
            "No recipes were activated. Activate a recipe by listing it under \"active_recipes\" "
            "in the configuration handed to the transformation engine.");
        return selected;
    }
    selected.reserve(document.results.size());
    for (auto& result : document.results) {
        if (is_generated_source(result)) {
            logger.debug(std::format("Skipping generated source {}",
                                     result.before->source_path.generic_string()));
            continue;
        }
        selected.push_back(std::move(result));
    }
    return selected;
}

}  // namespace recon::results
