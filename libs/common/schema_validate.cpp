/**
 * @file schema_validate.cpp
 * @brief JSON Schema checks for validated documents (valijson)
 */

#include "docfmt/schema_validate.hpp"

#include "docfmt/file_io.hpp"

#include <exception>
#include <format>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace docfmt::common {

namespace {

constexpr std::string_view kDefsRefPrefix = "#/$defs/";
constexpr std::string_view kDefinitionsRefPrefix = "#/definitions/";

// valijson only knows draft-07 "definitions"; rewrite 2019-09 "$defs" onto it.
void alias_defs(nlohmann::json& schema)
{
    if (schema.is_array()) {
        for (auto& item : schema) {
            alias_defs(item);
        }
        return;
    }
    if (!schema.is_object()) {
        return;
    }
    if (const auto defs = schema.find("$defs");
        defs != schema.end() && !schema.contains("definitions")) {
        schema["definitions"] = *defs;
    }
    for (auto& [key, value] : schema.items()) {
        if (key != "$ref") {
            alias_defs(value);
            continue;
        }
        if (value.is_string()) {
            const auto ref = value.get<std::string>();
            if (ref.starts_with(kDefsRefPrefix)) {
                value = std::string(kDefinitionsRefPrefix) + ref.substr(kDefsRefPrefix.size());
            }
        }
    }
}

[[nodiscard]] docfmt::Result<nlohmann::json> load_schema(const std::filesystem::path& path)
{
    auto text = read_text_file(path);
    if (!text) {
        return std::unexpected(docfmt::Error::make(
            "SchemaFileOpenFailed", "Failed to open schema file: " + path.string()));
    }
    try {
        auto schema = nlohmann::json::parse(*text);
        alias_defs(schema);
        return schema;
    } catch (const nlohmann::json::parse_error& ex) {
        return std::unexpected(docfmt::Error::make(
            "SchemaParseFailed",
            std::format("Failed to parse schema {}: {}", path.string(), ex.what())));
    }
}

[[nodiscard]] std::vector<SchemaViolation> drain_violations(valijson::ValidationResults& results)
{
    std::vector<SchemaViolation> violations;
    valijson::ValidationResults::Error error;
    while (results.popError(error)) {
        std::string pointer;
        for (const auto& part : error.context) {
            // The root context is reported as "<root>".
            if (part != "<root>") {
                pointer += "/" + part;
            }
        }
        if (pointer.empty()) {
            pointer = "/";
        }
        violations.push_back(
            SchemaViolation{.pointer = std::move(pointer), .description = error.description});
    }
    return violations;
}

}  // namespace

std::string SchemaViolation::to_string() const
{
    return std::format("{}: {}", pointer, description);
}

docfmt::Result<std::vector<SchemaViolation>>
check_against_schema(const nlohmann::json& document, const std::filesystem::path& schema_path)
{
    auto schema_json = load_schema(schema_path);
    if (!schema_json) {
        return std::unexpected(schema_json.error());
    }

    const auto schema_dir = schema_path.parent_path();
    std::vector<std::unique_ptr<nlohmann::json>> fetched;
    const auto fetch_doc = [&schema_dir,
                            &fetched](const std::string& uri) -> const nlohmann::json* {
        // Only local files next to the root schema are fetched.
        if (uri.empty() || uri.find("://") != std::string::npos) {
            return nullptr;
        }
        auto loaded = load_schema(schema_dir / uri);
        if (!loaded) {
            return nullptr;
        }
        fetched.push_back(std::make_unique<nlohmann::json>(std::move(*loaded)));
        return fetched.back().get();
    };
    // Fetched documents are owned by `fetched`.
    const auto free_doc = [](const nlohmann::json*) {};

    valijson::Schema schema;
    try {
        valijson::SchemaParser parser;
        valijson::adapters::NlohmannJsonAdapter schema_adapter(*schema_json);
        parser.populateSchema(schema_adapter, schema, fetch_doc, free_doc);
    } catch (const std::exception& ex) {
        return std::unexpected(docfmt::Error::make(
            "SchemaBuildFailed",
            std::format("Failed to build schema {}: {}", schema_path.string(), ex.what())));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target_adapter(document);
    if (validator.validate(schema, target_adapter, &results)) {
        return std::vector<SchemaViolation>{};
    }
    auto violations = drain_violations(results);
    if (violations.empty()) {
        violations.push_back(
            SchemaViolation{.pointer = "/", .description = "Schema validation failed."});
    }
    return violations;
}

}  // namespace docfmt::common
