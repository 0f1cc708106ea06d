/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "reposlice/schema_validate.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace reposlice::common {

namespace {

constexpr std::string_view kSchemaUriPrefix = "reposlice:schema/";

// valijson understands draft-07 "definitions"; schemas are written with "$defs".
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
        if (key == "$ref" && value.is_string()) {
            constexpr std::string_view kDefsPrefix = "#/$defs/";
            const auto ref = value.get<std::string>();
            if (ref.starts_with(kDefsPrefix)) {
                value = "#/definitions/" + ref.substr(kDefsPrefix.size());
            }
            continue;
        }
        normalize_schema_defs(value);
    }
}

std::string format_validation_errors(valijson::ValidationResults& results)
{
    std::string result;
    valijson::ValidationResults::Error error;

    while (results.popError(error)) {
        std::string context;
        for (const auto& part : error.context) {
            context += "/" + part;
        }
        if (!result.empty()) {
            result += '\n';
        }
        result += std::format("{}: {}", context.empty() ? "/" : context, error.description);
    }
    return result;
}

}  // namespace

reposlice::Result<nlohmann::json> read_json_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(Error::make("IOError", "Failed to open JSON file: " + path));
    }
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& ex) {
        return std::unexpected(
            Error::make("ParseError", "Failed to parse JSON file: " + path + ": " + ex.what()));
    }
}

reposlice::VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path)
{
    auto schema_json = read_json_file(schema_path);
    if (!schema_json) {
        return std::unexpected(Error::make("SchemaFileOpenFailed", schema_json.error().message));
    }
    normalize_schema_defs(*schema_json);

    const auto schema_dir = std::filesystem::path(schema_path).parent_path();
    std::vector<std::unique_ptr<nlohmann::json>> owned_schemas;
    const auto fetch_doc = [&schema_dir,
                            &owned_schemas](const std::string& uri) -> const nlohmann::json* {
        if (!uri.starts_with(kSchemaUriPrefix)) {
            return nullptr;
        }
        const auto schema_file =
            schema_dir / (uri.substr(kSchemaUriPrefix.size()) + ".schema.json");
        auto loaded = read_json_file(schema_file.string());
        if (!loaded) {
            return nullptr;
        }
        normalize_schema_defs(*loaded);
        owned_schemas.push_back(std::make_unique<nlohmann::json>(std::move(*loaded)));
        return owned_schemas.back().get();
    };
    const auto free_doc = [](const nlohmann::json* schema_ptr) { (void)schema_ptr; };

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
        std::string error = format_validation_errors(results);
        if (error.empty()) {
            error = "Schema validation failed.";
        }
        return std::unexpected(Error::make("SchemaValidationFailed", std::move(error)));
    }
    return {};
}

reposlice::VoidResult validate_json_named(const nlohmann::json& j,
                                          std::string_view schema_dir,
                                          std::string_view schema_name)
{
    const auto path = std::filesystem::path(schema_dir) / (std::string(schema_name) + ".schema.json");
    return validate_json(j, path.string());
}

}  // namespace reposlice::common
