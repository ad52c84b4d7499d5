#include "server/manifest.hpp"
#include "schema/json_schema.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <cstdlib>
#include <filesystem>
#include <set>

namespace manifest {

namespace fs = std::filesystem;

static std::int64_t as_int64(const json &value) {
    if (value.is_number_integer()) {
        return value.get<std::int64_t>();
    }
    return static_cast<std::int64_t>(value.get<double>());
}

std::int64_t ToolEntry::effective_timeout_ms(const Limits &limits) const {
    return timeout_ms.has_value() ? *timeout_ms : limits.timeout_ms_default;
}

const ToolEntry *Manifest::find_tool(const std::string &tool_name) const {
    for (const auto &tool : tools) {
        if (tool.name == tool_name) {
            return &tool;
        }
    }
    return nullptr;
}

json Manifest::describe() const {
    json result;
    result["name"] = name;
    result["version"] = version;
    result["vendor"] = vendor.empty() ? json(nullptr) : json(vendor);
    result["transport"] = transport;
    result["limits"] = limits.all;
    return result;
}

const json &manifest_schema() {
    static const json schema = json::parse(R"({
        "type": "object",
        "properties": {
            "name": { "type": "string", "minLength": 1 },
            "version": { "type": "string", "minLength": 1 },
            "description": { "type": "string" },
            "vendor": { "type": "string" },
            "transport": { "type": "string", "enum": ["stdio", "http"] },
            "limits": {
                "type": "object",
                "properties": {
                    "timeout_ms_default": { "type": "integer", "minimum": 1 },
                    "max_concurrency": { "type": "integer", "minimum": 1 },
                    "max_html_size_bytes": { "type": "integer", "minimum": 1 }
                },
                "additionalProperties": true
            },
            "env": { "type": "object", "additionalProperties": { "type": "string" } },
            "tools": {
                "type": "array",
                "minItems": 1,
                "items": {
                    "type": "object",
                    "properties": {
                        "name": { "type": "string", "minLength": 1 },
                        "description": { "type": "string" },
                        "input_schema": { "oneOf": [{ "type": "string" }, { "type": "object" }] },
                        "output_schema": { "oneOf": [{ "type": "string" }, { "type": "object" }] },
                        "input_schema_inline": { "type": "object" },
                        "output_schema_inline": { "type": "object" },
                        "timeout_ms": { "type": "integer", "minimum": 1 },
                        "optional": { "type": "boolean" }
                    },
                    "required": ["name"],
                    "additionalProperties": true
                }
            }
        },
        "required": ["name", "version", "tools"],
        "additionalProperties": true
    })");
    return schema;
}

// A schema given as a path is read relative to the manifest's directory.
static json load_schema_file(const std::string &reference, const std::string &base_directory,
                             const std::string &tool_name) {
    std::string file_path = reference;
    const std::string file_scheme = "file://";
    if (file_path.compare(0, file_scheme.size(), file_scheme) == 0) {
        file_path = file_path.substr(file_scheme.size());
    }
    fs::path resolved(file_path);
    if (resolved.is_relative() && !base_directory.empty()) {
        resolved = fs::path(base_directory) / resolved;
    }

    std::string contents;
    if (!platform::read_file_contents(resolved.string(), contents)) {
        throw ManifestError("Cannot read schema file for tool " + tool_name + ": " + resolved.string());
    }
    try {
        return json::parse(contents);
    } catch (const json::parse_error &error) {
        throw ManifestError("Invalid JSON in schema file for tool " + tool_name + ": " + resolved.string() +
                            " (" + error.what() + ")");
    }
}

// The *_inline key wins over the plain key; the plain key may hold a document or a path.
static json resolve_schema(const json &tool, const std::string &inline_key, const std::string &key,
                           const std::string &base_directory, const std::string &tool_name) {
    if (tool.contains(inline_key) && tool[inline_key].is_object()) {
        return tool[inline_key];
    }
    if (tool.contains(key)) {
        const json &value = tool[key];
        if (value.is_object()) {
            return value;
        }
        if (value.is_string()) {
            return load_schema_file(value.get<std::string>(), base_directory, tool_name);
        }
    }
    return nullptr;
}

// Rejects schema documents the validator cannot use, naming the tool.
static void check_schema(const json &schema, const std::string &tool_name, const std::string &which) {
    if (schema.is_null()) {
        return;
    }
    try {
        json_schema::Schema compiled(schema);
        (void)compiled;
    } catch (const json_schema::SchemaError &error) {
        throw ManifestError("Invalid " + which + " schema for tool " + tool_name + ": " + error.what());
    }
}

Manifest normalize(const json &document, const std::string &base_directory) {
    if (!document.is_object()) {
        throw ManifestError("Invalid manifest structure",
                            json{{"errors", json::array({json{{"instancePath", ""},
                                                              {"schemaPath", "#/type"},
                                                              {"keyword", "type"},
                                                              {"params", {{"type", "object"}}},
                                                              {"message", "must be object"}}})}});
    }

    // Defaults go in before validation so the declared values are checked merged.
    json merged = document;
    if (!merged.contains("transport") || merged["transport"].is_null()) {
        merged["transport"] = "stdio";
    }
    json limits = json{{"timeout_ms_default", DEFAULT_TIMEOUT_MS},
                       {"max_concurrency", DEFAULT_MAX_CONCURRENCY},
                       {"max_html_size_bytes", DEFAULT_MAX_HTML_SIZE_BYTES}};
    if (merged.contains("limits") && merged["limits"].is_object()) {
        for (const auto &item : merged["limits"].items()) {
            limits[item.key()] = item.value();
        }
        merged["limits"] = limits;
    } else if (!merged.contains("limits") || merged["limits"].is_null()) {
        merged["limits"] = limits;
    }

    static const json_schema::Schema meta_schema(manifest_schema());
    json_schema::ValidationResult validation = meta_schema.validate(merged);
    if (!validation.valid) {
        throw ManifestError("Invalid manifest structure", json{{"errors", validation.errors_json()}});
    }

    Manifest result;
    result.name = merged["name"].get<std::string>();
    result.version = merged["version"].get<std::string>();
    result.description = merged.value("description", "");
    result.vendor = merged.value("vendor", "");
    result.transport = merged["transport"].get<std::string>();

    result.limits.all = merged["limits"];
    result.limits.timeout_ms_default = as_int64(result.limits.all["timeout_ms_default"]);
    result.limits.max_concurrency = as_int64(result.limits.all["max_concurrency"]);
    result.limits.max_html_size_bytes = as_int64(result.limits.all["max_html_size_bytes"]);

    if (merged.contains("env") && merged["env"].is_object()) {
        for (const auto &item : merged["env"].items()) {
            result.env[item.key()] = item.value().get<std::string>();
        }
    }

    std::set<std::string> seen;
    for (const auto &tool : merged["tools"]) {
        ToolEntry entry;
        entry.name = tool["name"].get<std::string>();
        if (!seen.insert(entry.name).second) {
            throw ManifestError("Duplicate tool name in manifest: " + entry.name);
        }
        entry.description = tool.value("description", "");
        entry.optional = tool.value("optional", false);
        if (tool.contains("timeout_ms")) {
            entry.timeout_ms = as_int64(tool["timeout_ms"]);
        }

        entry.input_schema = resolve_schema(tool, "input_schema_inline", "input_schema", base_directory, entry.name);
        if (entry.input_schema.is_null()) {
            entry.input_schema = json{{"type", "object"}};
        }
        entry.output_schema = resolve_schema(tool, "output_schema_inline", "output_schema", base_directory, entry.name);
        check_schema(entry.input_schema, entry.name, "input");
        check_schema(entry.output_schema, entry.name, "output");

        result.tools.push_back(std::move(entry));
    }

    return result;
}

// Returns false if the file is missing or not JSON, so lookup can move on.
static bool try_read(const std::string &file_path, json &document) {
    std::string contents;
    if (!platform::read_file_contents(file_path, contents)) {
        return false;
    }
    try {
        document = json::parse(contents);
    } catch (const json::parse_error &error) {
        debug_log::warn("Skipping unparseable manifest " + file_path + ": " + error.what());
        return false;
    }
    return true;
}

Manifest load_file(const std::string &file_path) {
    json document;
    if (!try_read(file_path, document)) {
        throw ManifestError("Manifest not readable: " + file_path);
    }
    Manifest result = normalize(document, fs::path(file_path).parent_path().string());
    result.source_path = file_path;
    return result;
}

std::vector<std::string> candidate_paths(const std::string &override_path,
                                         const std::string &current_directory,
                                         const std::string &package_root) {
    std::vector<std::string> candidates;
    if (!override_path.empty()) {
        candidates.push_back(fs::absolute(fs::path(override_path)).lexically_normal().string());
    }
    if (!current_directory.empty()) {
        candidates.push_back((fs::path(current_directory) / MANIFEST_FILE_NAME).lexically_normal().string());
    }
    if (!package_root.empty()) {
        candidates.push_back((fs::path(package_root) / MANIFEST_FILE_NAME).lexically_normal().string());
        candidates.push_back((fs::path(package_root) / ".." / MANIFEST_FILE_NAME).lexically_normal().string());
    }
    return candidates;
}

Manifest load_first(const std::vector<std::string> &candidates) {
    for (const auto &candidate : candidates) {
        json document;
        if (!try_read(candidate, document)) {
            continue;
        }
        debug_log::log("Using manifest " + candidate);
        Manifest result = normalize(document, fs::path(candidate).parent_path().string());
        result.source_path = candidate;
        return result;
    }

    std::string message = "Manifest not found. Checked:";
    for (const auto &candidate : candidates) {
        message += "\n- " + candidate;
    }
    throw ManifestError(message);
}

Manifest load(const std::string &override_path) {
    std::string explicit_path = override_path;
    if (explicit_path.empty()) {
        const char *environment_path = std::getenv(MANIFEST_PATH_ENV);
        if (environment_path != nullptr) {
            explicit_path = environment_path;
        }
    }

    std::error_code error;
    std::string current_directory = fs::current_path(error).string();
    std::string executable_path = platform::current_executable_path();
    std::string package_root = executable_path.empty() ? "" : fs::path(executable_path).parent_path().string();

    return load_first(candidate_paths(explicit_path, current_directory, package_root));
}

} // namespace manifest
