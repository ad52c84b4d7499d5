// Tests for manifest normalization, schema resolution and file lookup.

#include <unistd.h>
#include <nlohmann/json.hpp>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "server/manifest.hpp"
#include "test_support.hpp"

using json = nlohmann::json;
using test_support::report;

namespace test_manifest {

static json minimal_document() {
    return json{{"name", "demo"}, {"version", "1.0.0"}, {"tools", json::array({json{{"name", "echo"}}})}};
}

// Writes contents to a fresh file under the temp directory and returns its path.
static std::string write_temp_file(const std::string &stem, const std::string &contents) {
    std::filesystem::path directory = std::filesystem::temp_directory_path() /
                                      ("mcpvisor-test-" + std::to_string(::getpid()));
    std::filesystem::create_directories(directory);
    std::filesystem::path file_path = directory / stem;
    std::ofstream stream(file_path);
    stream << contents;
    return file_path.string();
}

// Test: omitted fields receive their defaults.
static bool test_defaults_applied() {
    manifest::Manifest result = manifest::normalize(minimal_document(), "");
    const manifest::ToolEntry *echo = result.find_tool("echo");
    bool success = result.transport == "stdio" && result.limits.timeout_ms_default == 12000 &&
                   result.limits.max_concurrency == 5 && result.limits.max_html_size_bytes == 2000000 &&
                   echo != nullptr && echo->input_schema == json{{"type", "object"}} &&
                   echo->output_schema.is_null() && !echo->timeout_ms.has_value() && !echo->optional &&
                   echo->effective_timeout_ms(result.limits) == 12000;
    return report(success, "Defaults are applied to omitted fields");
}

// Test: declared limits merge over the defaults and unknown keys survive.
static bool test_limits_merge() {
    json document = minimal_document();
    document["limits"] = {{"timeout_ms_default", 500}, {"custom_limit", 9}};
    document["tools"][0]["timeout_ms"] = 40;
    manifest::Manifest result = manifest::normalize(document, "");
    bool success = result.limits.timeout_ms_default == 500 && result.limits.max_concurrency == 5 &&
                   result.limits.all["custom_limit"] == 9 && result.limits.all["max_html_size_bytes"] == 2000000 &&
                   result.tools[0].effective_timeout_ms(result.limits) == 40;
    return report(success, "Limits merge over defaults, keeping unknown keys");
}

// Test: structural violations carry validator errors.
static bool test_invalid_structure() {
    json document = minimal_document();
    document.erase("version");
    document["transport"] = "carrier-pigeon";
    try {
        manifest::normalize(document, "");
    } catch (const manifest::ManifestError &error) {
        const json &errors = error.data()["errors"];
        bool success = std::string(error.what()) == "Invalid manifest structure" && errors.is_array() &&
                       errors.size() == 2;
        return report(success, "Invalid structure is rejected with validator errors", error.data().dump());
    }
    return report(false, "Invalid structure is rejected with validator errors", "no exception");
}

// Test: a document that is not an object, or has no tools, is rejected.
static bool test_non_object_and_empty_tools() {
    bool array_rejected = false;
    bool empty_rejected = false;
    try {
        manifest::normalize(json::array(), "");
    } catch (const manifest::ManifestError &error) {
        array_rejected = error.data()["errors"].size() == 1;
    }
    json document = minimal_document();
    document["tools"] = json::array();
    try {
        manifest::normalize(document, "");
    } catch (const manifest::ManifestError &error) {
        empty_rejected = std::string(error.what()) == "Invalid manifest structure";
    }
    return report(array_rejected && empty_rejected, "Non-object documents and empty tool lists are rejected");
}

// Test: a repeated tool name is fatal.
static bool test_duplicate_tool_name() {
    json document = minimal_document();
    document["tools"].push_back(json{{"name", "echo"}});
    try {
        manifest::normalize(document, "");
    } catch (const manifest::ManifestError &error) {
        return report(std::string(error.what()) == "Duplicate tool name in manifest: echo",
                      "Duplicate tool names are rejected", error.what());
    }
    return report(false, "Duplicate tool names are rejected", "no exception");
}

// Test: the inline key wins over the plain key.
static bool test_inline_schema_wins() {
    json document = minimal_document();
    document["tools"][0]["input_schema"] = "does/not/exist.json";
    document["tools"][0]["input_schema_inline"] = {{"type", "object"}, {"required", {"text"}}};
    manifest::Manifest result = manifest::normalize(document, "/nonexistent");
    bool success = result.tools[0].input_schema["required"] == json::array({"text"});
    return report(success, "input_schema_inline takes precedence over input_schema");
}

// Test: a schema file that cannot be read names the tool.
static bool test_missing_schema_file() {
    json document = minimal_document();
    document["tools"][0]["output_schema"] = "schemas/missing.json";
    try {
        manifest::normalize(document, "/nonexistent-dir");
    } catch (const manifest::ManifestError &error) {
        std::string message = error.what();
        bool success = message == "Cannot read schema file for tool echo: /nonexistent-dir/schemas/missing.json";
        return report(success, "Unreadable schema file names the tool", message);
    }
    return report(false, "Unreadable schema file names the tool", "no exception");
}

// Test: a schema the validator cannot compile is rejected at load time.
static bool test_uncompilable_schema() {
    json document = minimal_document();
    document["tools"][0]["input_schema"] = {{"type", "string"}, {"pattern", "(unclosed"}};
    try {
        manifest::normalize(document, "");
    } catch (const manifest::ManifestError &error) {
        bool success = std::string(error.what()).find("Invalid input schema for tool echo") == 0;
        return report(success, "Uncompilable schemas are rejected", error.what());
    }
    return report(false, "Uncompilable schemas are rejected", "no exception");
}

// Test: the fixture file loads with schema files resolved relative to it.
static bool test_load_fixture() {
    manifest::Manifest result = manifest::load_file(test_support::fixture_path("test.manifest.json"));
    const manifest::ToolEntry *echo = result.find_tool("echo");
    const manifest::ToolEntry *sleep = result.find_tool("sleep");
    const manifest::ToolEntry *reserved = result.find_tool("reserved");
    bool success = result.name == "test-tools" && result.tools.size() == 5 && echo != nullptr &&
                   echo->output_schema["required"] == json::array({"message"}) && sleep != nullptr &&
                   sleep->effective_timeout_ms(result.limits) == 300 && reserved != nullptr && reserved->optional &&
                   result.find_tool("missing") == nullptr && !result.source_path.empty();
    return report(success, "Fixture manifest loads with file schemas resolved");
}

// Test: describe() reports vendor as null when absent.
static bool test_describe() {
    manifest::Manifest bare = manifest::normalize(minimal_document(), "");
    json document = minimal_document();
    document["vendor"] = "acme";
    json described = manifest::normalize(document, "").describe();
    json bare_described = bare.describe();
    bool success = bare_described["vendor"].is_null() && bare_described["transport"] == "stdio" &&
                   bare_described["limits"]["max_concurrency"] == 5 && described["vendor"] == "acme" &&
                   described["name"] == "demo" && described["version"] == "1.0.0";
    return report(success, "describe() reports vendor or null, transport and limits");
}

// Test: lookup order is override, cwd, package root, then its parent.
static bool test_candidate_order() {
    std::vector<std::string> candidates = manifest::candidate_paths("/opt/custom.json", "/work", "/opt/app/bin");
    std::vector<std::string> expected = {"/opt/custom.json", "/work/mcp.manifest.json",
                                         "/opt/app/bin/mcp.manifest.json", "/opt/app/mcp.manifest.json"};
    std::vector<std::string> without_override = manifest::candidate_paths("", "/work", "/opt/app/bin");
    bool success = candidates == expected && without_override.size() == 3 &&
                   without_override[0] == "/work/mcp.manifest.json";
    return report(success, "Candidate paths follow lookup order");
}

// Test: unparseable candidates are skipped; the first valid one wins.
static bool test_load_first_skips_unparseable() {
    std::string broken = write_temp_file("broken.manifest.json", "{ not json");
    std::string good = write_temp_file("good.manifest.json", minimal_document().dump());
    manifest::Manifest result = manifest::load_first({"/nonexistent/mcp.manifest.json", broken, good});
    bool success = result.name == "demo" && result.source_path == good;
    std::remove(broken.c_str());
    std::remove(good.c_str());
    return report(success, "load_first skips missing and unparseable candidates");
}

// Test: when nothing loads, every candidate is listed.
static bool test_not_found_lists_candidates() {
    try {
        manifest::load_first({"/nonexistent/a.json", "/nonexistent/b.json"});
    } catch (const manifest::ManifestError &error) {
        std::string expected = "Manifest not found. Checked:\n- /nonexistent/a.json\n- /nonexistent/b.json";
        return report(std::string(error.what()) == expected, "Not found error lists every candidate", error.what());
    }
    return report(false, "Not found error lists every candidate", "no exception");
}

// Test: env entries must be strings.
static bool test_env_entries() {
    json document = minimal_document();
    document["env"] = {{"FEATURE_FLAG", "on"}};
    manifest::Manifest result = manifest::normalize(document, "");
    bool bad_rejected = false;
    document["env"] = {{"FEATURE_FLAG", 1}};
    try {
        manifest::normalize(document, "");
    } catch (const manifest::ManifestError &) {
        bad_rejected = true;
    }
    bool success = result.env.size() == 1 && result.env.at("FEATURE_FLAG") == "on" && bad_rejected;
    return report(success, "env entries are read as strings");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_defaults_applied();
    all_passed &= test_limits_merge();
    all_passed &= test_invalid_structure();
    all_passed &= test_non_object_and_empty_tools();
    all_passed &= test_duplicate_tool_name();
    all_passed &= test_inline_schema_wins();
    all_passed &= test_missing_schema_file();
    all_passed &= test_uncompilable_schema();
    all_passed &= test_load_fixture();
    all_passed &= test_describe();
    all_passed &= test_candidate_order();
    all_passed &= test_load_first_skips_unparseable();
    all_passed &= test_not_found_lists_candidates();
    all_passed &= test_env_entries();
    return all_passed;
}

} // namespace test_manifest
