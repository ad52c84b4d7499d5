#ifndef MCPVISOR_JSON_SCHEMA_HPP
#define MCPVISOR_JSON_SCHEMA_HPP

// JSON Schema validation for tool inputs/outputs and manifests.
//
// Supported keywords: type, enum, const, required, properties, additionalProperties,
// minProperties, maxProperties, items, minItems, maxItems, uniqueItems, minLength,
// maxLength, pattern (subjects up to 4096 bytes), format (uri, email, date-time), minimum, maximum,
// exclusiveMinimum, exclusiveMaximum, multipleOf, allOf, anyOf, oneOf, not, and local
// $ref ("#/..."). Other keywords (title, description, default, $schema, ...) are ignored.
//
// Errors are reported with the same shape as ajv:
//   {"instancePath": "/url", "schemaPath": "#/properties/url/type",
//    "keyword": "type", "params": {"type": "string"}, "message": "must be string"}

#include <nlohmann/json.hpp>
#include <map>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

namespace json_schema {

using json = nlohmann::json;

struct ValidationError {
    std::string instance_path;
    std::string schema_path;
    std::string keyword;
    json params = json::object();
    std::string message;

    json to_json() const;
};

struct ValidationResult {
    bool valid = true;
    std::vector<ValidationError> errors;

    // Errors as a JSON array, suitable for an error response's data.errors.
    json errors_json() const;

    // "/url must be string; must have required property 'id'".
    std::string summary() const;
};

// Thrown when a schema document itself cannot be used (wrong type, bad pattern).
class SchemaError : public std::runtime_error {
public:
    explicit SchemaError(const std::string &message) : std::runtime_error(message) {}
};

// A schema checked and prepared once, validated against many instances.
class Schema {
public:
    Schema();
    explicit Schema(json document);

    ValidationResult validate(const json &instance) const;

    const json &document() const { return document_; }

private:
    void compile(const json &node, const std::string &schema_path);
    void validate_node(const json &schema, const std::string &schema_path,
                       const json &instance, const std::string &instance_path,
                       int depth, std::vector<ValidationError> &errors) const;

    json document_;
    std::map<std::string, std::regex> patterns_;
};

// One-shot validation; compiles the schema on every call.
ValidationResult validate(const json &schema, const json &instance);

} // namespace json_schema

#endif // MCPVISOR_JSON_SCHEMA_HPP
