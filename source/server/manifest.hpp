#ifndef MCPVISOR_MANIFEST_HPP
#define MCPVISOR_MANIFEST_HPP

// Tool-server manifest: locating, validating and normalizing mcp.manifest.json.
//
// Example:
//   {
//     "name": "diagnostics", "version": "1.0.0",
//     "limits": { "timeout_ms_default": 5000 },
//     "tools": [
//       { "name": "echo", "input_schema": "schemas/echo.input.json", "timeout_ms": 2000 }
//     ]
//   }

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace manifest {

using json = nlohmann::json;

constexpr const char *MANIFEST_FILE_NAME = "mcp.manifest.json";
constexpr const char *MANIFEST_PATH_ENV = "MCP_MANIFEST_PATH";

constexpr std::int64_t DEFAULT_TIMEOUT_MS = 12000;
constexpr std::int64_t DEFAULT_MAX_CONCURRENCY = 5;
constexpr std::int64_t DEFAULT_MAX_HTML_SIZE_BYTES = 2000000;

// Raised for every fatal manifest problem. data() carries structured details
// (e.g. {"errors": [...]} for schema violations) or null.
class ManifestError : public std::runtime_error {
public:
    explicit ManifestError(const std::string &message, json data = nullptr)
        : std::runtime_error(message), data_(std::move(data)) {}

    const json &data() const { return data_; }

private:
    json data_;
};

struct Limits {
    std::int64_t timeout_ms_default = DEFAULT_TIMEOUT_MS;
    std::int64_t max_concurrency = DEFAULT_MAX_CONCURRENCY;
    std::int64_t max_html_size_bytes = DEFAULT_MAX_HTML_SIZE_BYTES;
    json all = json::object(); // Declared keys merged over the defaults, unknown keys kept.
};

// One declared tool, with its schemas already resolved to documents.
struct ToolEntry {
    std::string name;
    std::string description;
    json input_schema;   // Never null: defaults to {"type":"object"}.
    json output_schema;  // Null when the tool declares none.
    std::optional<std::int64_t> timeout_ms;
    bool optional = false;

    // timeout_ms, falling back to the manifest default.
    std::int64_t effective_timeout_ms(const Limits &limits) const;
};

struct Manifest {
    std::string name;
    std::string version;
    std::string description;
    std::string vendor;
    std::string transport = "stdio";
    Limits limits;
    std::map<std::string, std::string> env;
    std::vector<ToolEntry> tools;
    std::string source_path; // Empty when built from a document in memory.

    const ToolEntry *find_tool(const std::string &tool_name) const;

    // Payload of manifest/get: name, version, vendor (or null), transport, limits.
    json describe() const;
};

// The meta-schema every manifest document must satisfy.
const json &manifest_schema();

// Apply defaults, validate and normalize a parsed document. Relative schema file paths
// resolve against base_directory.
Manifest normalize(const json &document, const std::string &base_directory);

// Read, parse and normalize one file.
Manifest load_file(const std::string &file_path);

// Candidate locations in lookup order: override (if non-empty), cwd, package root,
// parent of the package root. Duplicates are kept so the error lists every check.
std::vector<std::string> candidate_paths(const std::string &override_path,
                                         const std::string &current_directory,
                                         const std::string &package_root);

// Load the first candidate that can be read and parsed. Throws ManifestError
// "Manifest not found. Checked:" listing every candidate when none can.
Manifest load_first(const std::vector<std::string> &candidates);

// Locate and load the manifest. The first candidate that can be read and parsed wins;
// validation failures of that file are fatal. override_path falls back to
// $MCP_MANIFEST_PATH when empty.
Manifest load(const std::string &override_path = "");

} // namespace manifest

#endif // MCPVISOR_MANIFEST_HPP
