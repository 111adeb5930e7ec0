/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "jsonassert/schema_validate.hpp"

#include "jsonassert/json_io.hpp"

#include <exception>
#include <format>
#include <string>
#include <string_view>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace jsonassert::common {

namespace {

// valijson only understands draft-07 style "definitions".
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
        schema.erase("$defs");
    }
    std::vector<std::string> keys;
    keys.reserve(schema.size());
    for (const auto& item : schema.items()) {
        keys.push_back(item.key());
    }
    for (const auto& key : keys) {
        nlohmann::json& value = schema.at(key);
        if (key == "$ref" && value.is_string()) {
            constexpr std::string_view kDefsPrefix = "#/$defs/";
            const std::string ref = value.get<std::string>();
            if (ref.starts_with(kDefsPrefix)) {
                value = "#/definitions/" + ref.substr(kDefsPrefix.size());
            }
            continue;
        }
        rewrite_defs(value);
    }
}

[[nodiscard]] Result<nlohmann::json> load_schema(const std::filesystem::path& path)
{
    auto schema = read_json_file(path);
    if (!schema) {
        const bool missing = schema.error().code == "IOError";
        return std::unexpected(Error::make(missing ? "SchemaFileOpenFailed" : "SchemaParseFailed",
                                           schema.error().message));
    }
    rewrite_defs(*schema);
    return schema;
}

[[nodiscard]] std::string describe_errors(valijson::ValidationResults& results)
{
    std::string described;
    valijson::ValidationResults::Error error;
    while (results.popError(error)) {
        std::string location;
        for (const auto& part : error.context) {
            location += "/" + part;
        }
        if (!described.empty()) {
            described += '\n';
        }
        described += std::format("{}: {}", location.empty() ? "/" : location, error.description);
    }
    return described.empty() ? "Schema validation failed." : described;
}

}  // namespace

VoidResult validate_json(const nlohmann::json& j, const std::filesystem::path& schema_path)
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
    valijson::adapters::NlohmannJsonAdapter target(j);
    if (!validator.validate(schema, target, &results)) {
        return std::unexpected(Error::make("SchemaValidationFailed", describe_errors(results)));
    }
    return {};
}

}  // namespace jsonassert::common
