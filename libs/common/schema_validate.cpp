/**
 * @file schema_validate.cpp
 * @brief JSON Schema (draft-07) validation using valijson
 */

#include "jsondelta/schema_validate.hpp"

#include <exception>
#include <format>
#include <fstream>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace jsondelta::common {

namespace {

[[nodiscard]] jsondelta::Result<nlohmann::json> load_schema_document(const std::string& schema_path)
{
    std::ifstream in(schema_path);
    if (!in) {
        return std::unexpected(
            Error::make("SchemaFileOpenFailed", "Failed to open schema file: " + schema_path));
    }
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& ex) {
        return std::unexpected(Error::make(
            "SchemaParseFailed", std::format("Failed to parse schema {}: {}", schema_path, ex.what())));
    }
}

// One "<json pointer>: <description>" line per violation.
[[nodiscard]] std::string describe(valijson::ValidationResults& results)
{
    std::string text;
    valijson::ValidationResults::Error error;
    while (results.popError(error)) {
        std::string pointer;
        for (const auto& part : error.context) {
            pointer += "/" + part;
        }
        if (!text.empty()) {
            text.push_back('\n');
        }
        text += std::format("{}: {}", pointer.empty() ? "/" : pointer, error.description);
    }
    return text.empty() ? "Schema validation failed." : text;
}

}  // namespace

jsondelta::VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path)
{
    auto document = load_schema_document(schema_path);
    if (!document) {
        return std::unexpected(document.error());
    }

    valijson::Schema schema;
    try {
        valijson::SchemaParser parser(valijson::SchemaParser::kDraft7);
        parser.populateSchema(valijson::adapters::NlohmannJsonAdapter(*document), schema);
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make(
            "SchemaBuildFailed", std::format("Failed to build schema {}: {}", schema_path, ex.what())));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    if (!validator.validate(schema, valijson::adapters::NlohmannJsonAdapter(j), &results)) {
        return std::unexpected(Error::make("SchemaValidationFailed", describe(results)));
    }
    return {};
}

}  // namespace jsondelta::common
