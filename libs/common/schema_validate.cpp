/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 *
 * Schemas may use draft 2020-12 "$defs"; they are rewritten to
 * "definitions" before valijson parses them.
 */

#include "linkdiff/schema_validate.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace linkdiff::common {

namespace {

constexpr std::string_view kSchemaUriPrefix = "linkdiff:schema/";
constexpr std::string_view kSchemaSuffix = ".schema.json";

void rewrite_defs_ref(nlohmann::json& value)
{
    constexpr std::string_view kDefsPrefix = "#/$defs/";
    if (value.is_string() && value.get_ref<const std::string&>().starts_with(kDefsPrefix)) {
        value = "#/definitions/" + value.get<std::string>().substr(kDefsPrefix.size());
    }
}

void normalize_schema_defs(nlohmann::json& schema)
{
    if (schema.is_array()) {
        for (auto& value : schema) {
            normalize_schema_defs(value);
        }
        return;
    }
    if (!schema.is_object()) {
        return;
    }
    if (schema.contains("$defs") && !schema.contains("definitions")) {
        schema["definitions"] = schema["$defs"];
    }
    for (auto& [key, value] : schema.items()) {
        if (key == "$ref") {
            rewrite_defs_ref(value);
        } else {
            normalize_schema_defs(value);
        }
    }
}

[[nodiscard]] linkdiff::Result<nlohmann::json> load_schema_file(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            Error::make("SchemaFileOpenFailed", std::format("Failed to open schema file: {}", path.string())));
    }
    nlohmann::json schema;
    try {
        in >> schema;
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(Error::make(
            "SchemaParseFailed", std::format("Failed to parse schema {}: {}", path.string(), ex.what())));
    }
    normalize_schema_defs(schema);
    return schema;
}

[[nodiscard]] std::string describe_errors(valijson::ValidationResults& results)
{
    std::string described;
    valijson::ValidationResults::Error error;
    while (results.popError(error)) {
        std::string where;
        for (const auto& part : error.context) {
            where += "/" + part;
        }
        if (!described.empty()) {
            described += '\n';
        }
        described += std::format("{}: {}", where.empty() ? "/" : where, error.description);
    }
    return described.empty() ? std::string("Schema validation failed.") : described;
}

}  // namespace

linkdiff::VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path)
{
    auto schema_json = load_schema_file(schema_path);
    if (!schema_json) {
        return std::unexpected(schema_json.error());
    }

    const auto schema_dir = std::filesystem::path(schema_path).parent_path();
    std::vector<std::unique_ptr<nlohmann::json>> referenced;
    const auto fetch_doc = [&schema_dir,
                            &referenced](const std::string& uri) -> const nlohmann::json* {
        if (!uri.starts_with(kSchemaUriPrefix)) {
            return nullptr;
        }
        auto name = uri.substr(kSchemaUriPrefix.size());
        auto loaded = load_schema_file(schema_dir / (name + std::string(kSchemaSuffix)));
        if (!loaded) {
            return nullptr;
        }
        referenced.push_back(std::make_unique<nlohmann::json>(std::move(*loaded)));
        return referenced.back().get();
    };
    const auto free_doc = [](const nlohmann::json*) {};

    valijson::Schema schema;
    valijson::SchemaParser parser;
    try {
        valijson::adapters::NlohmannJsonAdapter schema_adapter(*schema_json);
        parser.populateSchema(schema_adapter, schema, fetch_doc, free_doc);
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("SchemaBuildFailed", std::string("Failed to build schema: ") + ex.what()));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target_adapter(j);
    if (!validator.validate(schema, target_adapter, &results)) {
        return std::unexpected(Error::make("SchemaValidationFailed", describe_errors(results)));
    }
    return {};
}

linkdiff::VoidResult validate_json_named(const nlohmann::json& j,
                                         const std::string& schema_dir,
                                         std::string_view schema_name)
{
    const auto path =
        std::filesystem::path(schema_dir) / (std::string(schema_name) + std::string(kSchemaSuffix));
    return validate_json(j, path.string());
}

}  // namespace linkdiff::common
