#include "schema/json_schema.hpp"

#include <cmath>
#include <cstring>
#include <sstream>

namespace json_schema {

// Guards against $ref cycles such as {"$ref": "#"}.
static constexpr int MAXIMUM_DEPTH = 64;

// std::regex recurses once per character, so longer subjects are refused before matching.
static constexpr std::size_t MAXIMUM_PATTERN_SUBJECT = 4096;

// Escapes a property name as a JSON Pointer reference token.
static std::string escape_token(const std::string &token) {
    std::string escaped;
    escaped.reserve(token.size());
    for (char character : token) {
        if (character == '~') {
            escaped += "~0";
        } else if (character == '/') {
            escaped += "~1";
        } else {
            escaped += character;
        }
    }
    return escaped;
}

static std::string child_path(const std::string &base, const std::string &token) {
    return base + "/" + escape_token(token);
}

static std::string child_path(const std::string &base, std::size_t index) {
    return base + "/" + std::to_string(index);
}

static std::string format_number(const json &value) {
    return value.dump();
}

static bool matches_type(const json &instance, const std::string &type) {
    if (type == "object") {
        return instance.is_object();
    }
    if (type == "array") {
        return instance.is_array();
    }
    if (type == "string") {
        return instance.is_string();
    }
    if (type == "boolean") {
        return instance.is_boolean();
    }
    if (type == "null") {
        return instance.is_null();
    }
    if (type == "number") {
        return instance.is_number();
    }
    if (type == "integer") {
        if (instance.is_number_integer()) {
            return true;
        }
        if (instance.is_number_float()) {
            double value = instance.get<double>();
            return std::isfinite(value) && std::floor(value) == value;
        }
        return false;
    }
    return false;
}

// Length in Unicode code points, as JSON Schema counts string length.
static std::size_t code_point_length(const std::string &text) {
    std::size_t count = 0;
    for (unsigned char byte : text) {
        if ((byte & 0xC0u) != 0x80u) {
            ++count;
        }
    }
    return count;
}

static bool is_space(char character) {
    return character == ' ' || character == '\t' || character == '\n' || character == '\r' ||
           character == '\f' || character == '\v';
}

static bool is_alpha(char character) {
    return (character >= 'A' && character <= 'Z') || (character >= 'a' && character <= 'z');
}

static bool is_digit(char character) {
    return character >= '0' && character <= '9';
}

// scheme ":" followed by at least one non-space character.
static bool is_uri(const std::string &value) {
    if (value.empty() || !is_alpha(value[0])) {
        return false;
    }
    std::size_t index = 1;
    while (index < value.size() && (is_alpha(value[index]) || is_digit(value[index]) || value[index] == '+' ||
                                    value[index] == '.' || value[index] == '-')) {
        ++index;
    }
    if (index >= value.size() || value[index] != ':' || index + 1 >= value.size()) {
        return false;
    }
    for (++index; index < value.size(); ++index) {
        if (is_space(value[index])) {
            return false;
        }
    }
    return true;
}

// local "@" domain, where the domain has a dot with text on both sides.
static bool is_email(const std::string &value) {
    std::size_t at = value.find('@');
    if (at == 0 || at == std::string::npos || value.find('@', at + 1) != std::string::npos) {
        return false;
    }
    for (char character : value) {
        if (is_space(character)) {
            return false;
        }
    }
    std::size_t dot = value.rfind('.');
    return dot != std::string::npos && dot > at + 1 && dot + 1 < value.size();
}

static bool read_digits(const std::string &value, std::size_t &index, std::size_t count) {
    for (std::size_t i = 0; i < count; ++i, ++index) {
        if (index >= value.size() || !is_digit(value[index])) {
            return false;
        }
    }
    return true;
}

static bool read_char(const std::string &value, std::size_t &index, const char *accepted) {
    if (index >= value.size() || std::strchr(accepted, value[index]) == nullptr) {
        return false;
    }
    ++index;
    return true;
}

// YYYY-MM-DD[Tt ]hh:mm:ss[.fraction](Z|+hh:mm|-hh:mm)
static bool is_date_time(const std::string &value) {
    std::size_t index = 0;
    if (!read_digits(value, index, 4) || !read_char(value, index, "-") || !read_digits(value, index, 2) ||
        !read_char(value, index, "-") || !read_digits(value, index, 2) || !read_char(value, index, "Tt ") ||
        !read_digits(value, index, 2) || !read_char(value, index, ":") || !read_digits(value, index, 2) ||
        !read_char(value, index, ":") || !read_digits(value, index, 2)) {
        return false;
    }
    if (index < value.size() && value[index] == '.') {
        ++index;
        if (!read_digits(value, index, 1)) {
            return false;
        }
        while (index < value.size() && is_digit(value[index])) {
            ++index;
        }
    }
    if (index < value.size() && (value[index] == 'Z' || value[index] == 'z')) {
        return index + 1 == value.size();
    }
    return read_char(value, index, "+-") && read_digits(value, index, 2) && read_char(value, index, ":") &&
           read_digits(value, index, 2) && index == value.size();
}

static bool matches_format(const std::string &format, const std::string &value) {
    if (format == "uri") {
        return is_uri(value);
    }
    if (format == "email") {
        return is_email(value);
    }
    if (format == "date-time") {
        return is_date_time(value);
    }
    // Unknown formats are not enforced.
    return true;
}

static void add_error(std::vector<ValidationError> &errors, const std::string &instance_path,
                      const std::string &schema_path, const std::string &keyword,
                      json params, const std::string &message) {
    ValidationError error;
    error.instance_path = instance_path;
    error.schema_path = schema_path + "/" + keyword;
    error.keyword = keyword;
    error.params = std::move(params);
    error.message = message;
    errors.push_back(std::move(error));
}

json ValidationError::to_json() const {
    json entry;
    entry["instancePath"] = instance_path;
    entry["schemaPath"] = schema_path;
    entry["keyword"] = keyword;
    entry["params"] = params;
    entry["message"] = message;
    return entry;
}

json ValidationResult::errors_json() const {
    json list = json::array();
    for (const auto &error : errors) {
        list.push_back(error.to_json());
    }
    return list;
}

std::string ValidationResult::summary() const {
    std::ostringstream stream;
    for (std::size_t index = 0; index < errors.size(); ++index) {
        if (index > 0) {
            stream << "; ";
        }
        if (!errors[index].instance_path.empty()) {
            stream << errors[index].instance_path << " ";
        }
        stream << errors[index].message;
    }
    return stream.str();
}

Schema::Schema() : document_(json::object()) {}

Schema::Schema(json document) : document_(std::move(document)) {
    compile(document_, "#");
}

void Schema::compile(const json &node, const std::string &schema_path) {
    if (node.is_boolean()) {
        return;
    }
    if (!node.is_object()) {
        throw SchemaError("Schema at " + schema_path + " must be an object or a boolean");
    }

    if (node.contains("$ref")) {
        const json &reference = node["$ref"];
        if (!reference.is_string() || reference.get<std::string>().rfind("#", 0) != 0) {
            throw SchemaError("Only local $ref values are supported (at " + schema_path + ")");
        }
        std::string pointer = reference.get<std::string>().substr(1);
        if (!pointer.empty()) {
            try {
                if (!document_.contains(json::json_pointer(pointer))) {
                    throw SchemaError("Unresolvable $ref \"" + reference.get<std::string>() + "\"");
                }
            } catch (const json::exception &error) {
                throw SchemaError("Invalid $ref \"" + reference.get<std::string>() + "\": " + error.what());
            }
        }
    }

    if (node.contains("pattern")) {
        if (!node["pattern"].is_string()) {
            throw SchemaError("pattern at " + schema_path + " must be a string");
        }
        try {
            patterns_.emplace(schema_path, std::regex(node["pattern"].get<std::string>(), std::regex::ECMAScript));
        } catch (const std::regex_error &error) {
            throw SchemaError("Invalid pattern at " + schema_path + ": " + error.what());
        }
    }

    for (const char *keyword : {"properties", "definitions", "$defs"}) {
        if (node.contains(keyword) && node[keyword].is_object()) {
            for (auto it = node[keyword].begin(); it != node[keyword].end(); ++it) {
                compile(it.value(), child_path(child_path(schema_path, keyword), it.key()));
            }
        }
    }

    for (const char *keyword : {"additionalProperties", "items", "not"}) {
        if (node.contains(keyword) && node[keyword].is_object()) {
            compile(node[keyword], child_path(schema_path, keyword));
        }
    }

    for (const char *keyword : {"allOf", "anyOf", "oneOf"}) {
        if (!node.contains(keyword)) {
            continue;
        }
        if (!node[keyword].is_array()) {
            throw SchemaError(std::string(keyword) + " at " + schema_path + " must be an array");
        }
        for (std::size_t index = 0; index < node[keyword].size(); ++index) {
            compile(node[keyword][index], child_path(child_path(schema_path, keyword), index));
        }
    }
}

ValidationResult Schema::validate(const json &instance) const {
    ValidationResult result;
    validate_node(document_, "#", instance, "", 0, result.errors);
    result.valid = result.errors.empty();
    return result;
}

void Schema::validate_node(const json &schema, const std::string &schema_path,
                           const json &instance, const std::string &instance_path,
                           int depth, std::vector<ValidationError> &errors) const {
    if (schema.is_boolean()) {
        if (!schema.get<bool>()) {
            ValidationError error;
            error.instance_path = instance_path;
            error.schema_path = schema_path + "/false schema";
            error.keyword = "false schema";
            error.message = "boolean schema is false";
            errors.push_back(std::move(error));
        }
        return;
    }
    if (depth > MAXIMUM_DEPTH) {
        add_error(errors, instance_path, schema_path, "$ref", json::object(), "schema nesting is too deep");
        return;
    }

    if (schema.contains("$ref")) {
        std::string pointer = schema["$ref"].get<std::string>().substr(1);
        const json &target = pointer.empty() ? document_ : document_.at(json::json_pointer(pointer));
        validate_node(target, "#" + pointer, instance, instance_path, depth + 1, errors);
    }

    if (schema.contains("type")) {
        const json &type = schema["type"];
        bool matched = false;
        std::string expected;
        if (type.is_string()) {
            expected = type.get<std::string>();
            matched = matches_type(instance, expected);
        } else if (type.is_array()) {
            for (const auto &candidate : type) {
                if (!candidate.is_string()) {
                    continue;
                }
                if (!expected.empty()) {
                    expected += ",";
                }
                expected += candidate.get<std::string>();
                matched = matched || matches_type(instance, candidate.get<std::string>());
            }
        } else {
            matched = true;
        }
        if (!matched) {
            add_error(errors, instance_path, schema_path, "type", {{"type", expected}}, "must be " + expected);
            // Remaining keywords assume the declared type.
            return;
        }
    }

    if (schema.contains("enum") && schema["enum"].is_array()) {
        bool found = false;
        for (const auto &allowed : schema["enum"]) {
            if (allowed == instance) {
                found = true;
                break;
            }
        }
        if (!found) {
            add_error(errors, instance_path, schema_path, "enum", {{"allowedValues", schema["enum"]}},
                      "must be equal to one of the allowed values");
        }
    }

    if (schema.contains("const") && schema["const"] != instance) {
        add_error(errors, instance_path, schema_path, "const", {{"allowedValue", schema["const"]}},
                  "must be equal to constant");
    }

    if (instance.is_object()) {
        if (schema.contains("required") && schema["required"].is_array()) {
            for (const auto &name : schema["required"]) {
                if (name.is_string() && !instance.contains(name.get<std::string>())) {
                    add_error(errors, instance_path, schema_path, "required",
                              {{"missingProperty", name}},
                              "must have required property '" + name.get<std::string>() + "'");
                }
            }
        }

        const json empty_properties = json::object();
        const json &properties = (schema.contains("properties") && schema["properties"].is_object())
                                     ? schema["properties"]
                                     : empty_properties;
        for (auto it = instance.begin(); it != instance.end(); ++it) {
            std::string property_instance_path = child_path(instance_path, it.key());
            if (properties.contains(it.key())) {
                validate_node(properties[it.key()], child_path(child_path(schema_path, "properties"), it.key()),
                              it.value(), property_instance_path, depth + 1, errors);
                continue;
            }
            if (!schema.contains("additionalProperties")) {
                continue;
            }
            const json &additional = schema["additionalProperties"];
            if (additional.is_boolean() && !additional.get<bool>()) {
                add_error(errors, instance_path, schema_path, "additionalProperties",
                          {{"additionalProperty", it.key()}}, "must NOT have additional properties");
            } else if (additional.is_object()) {
                validate_node(additional, child_path(schema_path, "additionalProperties"),
                              it.value(), property_instance_path, depth + 1, errors);
            }
        }

        if (schema.contains("minProperties") && schema["minProperties"].is_number() &&
            instance.size() < schema["minProperties"].get<std::size_t>()) {
            add_error(errors, instance_path, schema_path, "minProperties", {{"limit", schema["minProperties"]}},
                      "must NOT have fewer than " + format_number(schema["minProperties"]) + " properties");
        }
        if (schema.contains("maxProperties") && schema["maxProperties"].is_number() &&
            instance.size() > schema["maxProperties"].get<std::size_t>()) {
            add_error(errors, instance_path, schema_path, "maxProperties", {{"limit", schema["maxProperties"]}},
                      "must NOT have more than " + format_number(schema["maxProperties"]) + " properties");
        }
    }

    if (instance.is_array()) {
        if (schema.contains("items") && (schema["items"].is_object() || schema["items"].is_boolean())) {
            for (std::size_t index = 0; index < instance.size(); ++index) {
                validate_node(schema["items"], child_path(schema_path, "items"), instance[index],
                              child_path(instance_path, index), depth + 1, errors);
            }
        }
        if (schema.contains("minItems") && schema["minItems"].is_number() &&
            instance.size() < schema["minItems"].get<std::size_t>()) {
            add_error(errors, instance_path, schema_path, "minItems", {{"limit", schema["minItems"]}},
                      "must NOT have fewer than " + format_number(schema["minItems"]) + " items");
        }
        if (schema.contains("maxItems") && schema["maxItems"].is_number() &&
            instance.size() > schema["maxItems"].get<std::size_t>()) {
            add_error(errors, instance_path, schema_path, "maxItems", {{"limit", schema["maxItems"]}},
                      "must NOT have more than " + format_number(schema["maxItems"]) + " items");
        }
        if (schema.contains("uniqueItems") && schema["uniqueItems"].is_boolean() &&
            schema["uniqueItems"].get<bool>()) {
            bool duplicate_found = false;
            for (std::size_t later = 1; later < instance.size() && !duplicate_found; ++later) {
                for (std::size_t earlier = 0; earlier < later; ++earlier) {
                    if (instance[earlier] == instance[later]) {
                        add_error(errors, instance_path, schema_path, "uniqueItems",
                                  {{"i", later}, {"j", earlier}},
                                  "must NOT have duplicate items (items ## " + std::to_string(earlier) +
                                      " and " + std::to_string(later) + " are identical)");
                        duplicate_found = true;
                        break;
                    }
                }
            }
        }
    }

    if (instance.is_string()) {
        const std::string &text = instance.get_ref<const std::string &>();
        std::size_t length = code_point_length(text);
        if (schema.contains("minLength") && schema["minLength"].is_number() &&
            length < schema["minLength"].get<std::size_t>()) {
            add_error(errors, instance_path, schema_path, "minLength", {{"limit", schema["minLength"]}},
                      "must NOT have fewer than " + format_number(schema["minLength"]) + " characters");
        }
        if (schema.contains("maxLength") && schema["maxLength"].is_number() &&
            length > schema["maxLength"].get<std::size_t>()) {
            add_error(errors, instance_path, schema_path, "maxLength", {{"limit", schema["maxLength"]}},
                      "must NOT have more than " + format_number(schema["maxLength"]) + " characters");
        }
        auto pattern_it = patterns_.find(schema_path);
        if (pattern_it != patterns_.end() &&
            (text.size() > MAXIMUM_PATTERN_SUBJECT || !std::regex_search(text, pattern_it->second))) {
            add_error(errors, instance_path, schema_path, "pattern", {{"pattern", schema["pattern"]}},
                      "must match pattern \"" + schema["pattern"].get<std::string>() + "\"");
        }
        if (schema.contains("format") && schema["format"].is_string() &&
            !matches_format(schema["format"].get<std::string>(), text)) {
            add_error(errors, instance_path, schema_path, "format", {{"format", schema["format"]}},
                      "must match format \"" + schema["format"].get<std::string>() + "\"");
        }
    }

    if (instance.is_number()) {
        double value = instance.get<double>();
        struct Bound {
            const char *keyword;
            const char *comparison;
        };
        for (const Bound &bound : {Bound{"minimum", ">="}, Bound{"maximum", "<="},
                                   Bound{"exclusiveMinimum", ">"}, Bound{"exclusiveMaximum", "<"}}) {
            if (!schema.contains(bound.keyword) || !schema[bound.keyword].is_number()) {
                continue;
            }
            double limit = schema[bound.keyword].get<double>();
            std::string comparison = bound.comparison;
            bool satisfied = (comparison == ">=") ? value >= limit
                           : (comparison == "<=") ? value <= limit
                           : (comparison == ">")  ? value > limit
                                                  : value < limit;
            if (!satisfied) {
                add_error(errors, instance_path, schema_path, bound.keyword,
                          {{"comparison", comparison}, {"limit", schema[bound.keyword]}},
                          "must be " + comparison + " " + format_number(schema[bound.keyword]));
            }
        }
        if (schema.contains("multipleOf") && schema["multipleOf"].is_number()) {
            double divisor = schema["multipleOf"].get<double>();
            if (divisor > 0) {
                double quotient = value / divisor;
                if (std::fabs(quotient - std::round(quotient)) > 1e-9) {
                    add_error(errors, instance_path, schema_path, "multipleOf",
                              {{"multipleOf", schema["multipleOf"]}},
                              "must be multiple of " + format_number(schema["multipleOf"]));
                }
            }
        }
    }

    if (schema.contains("allOf")) {
        for (std::size_t index = 0; index < schema["allOf"].size(); ++index) {
            validate_node(schema["allOf"][index], child_path(child_path(schema_path, "allOf"), index),
                          instance, instance_path, depth + 1, errors);
        }
    }

    if (schema.contains("anyOf")) {
        std::vector<ValidationError> branch_errors;
        bool any_passed = false;
        for (std::size_t index = 0; index < schema["anyOf"].size() && !any_passed; ++index) {
            std::vector<ValidationError> attempt;
            validate_node(schema["anyOf"][index], child_path(child_path(schema_path, "anyOf"), index),
                          instance, instance_path, depth + 1, attempt);
            if (attempt.empty()) {
                any_passed = true;
            } else {
                branch_errors.insert(branch_errors.end(), attempt.begin(), attempt.end());
            }
        }
        if (!any_passed) {
            errors.insert(errors.end(), branch_errors.begin(), branch_errors.end());
            add_error(errors, instance_path, schema_path, "anyOf", json::object(), "must match a schema in anyOf");
        }
    }

    if (schema.contains("oneOf")) {
        std::vector<ValidationError> branch_errors;
        json passing = json::array();
        for (std::size_t index = 0; index < schema["oneOf"].size(); ++index) {
            std::vector<ValidationError> attempt;
            validate_node(schema["oneOf"][index], child_path(child_path(schema_path, "oneOf"), index),
                          instance, instance_path, depth + 1, attempt);
            if (attempt.empty()) {
                passing.push_back(index);
            } else {
                branch_errors.insert(branch_errors.end(), attempt.begin(), attempt.end());
            }
        }
        if (passing.size() != 1) {
            if (passing.empty()) {
                errors.insert(errors.end(), branch_errors.begin(), branch_errors.end());
            }
            add_error(errors, instance_path, schema_path, "oneOf",
                      {{"passingSchemas", passing.empty() ? json(nullptr) : passing}},
                      "must match exactly one schema in oneOf");
        }
    }

    if (schema.contains("not")) {
        std::vector<ValidationError> attempt;
        validate_node(schema["not"], child_path(schema_path, "not"), instance, instance_path, depth + 1, attempt);
        if (attempt.empty()) {
            add_error(errors, instance_path, schema_path, "not", json::object(), "must NOT be valid");
        }
    }
}

ValidationResult validate(const json &schema, const json &instance) {
    return Schema(schema).validate(instance);
}

} // namespace json_schema
