#ifndef MCPVISOR_JSON_RPC_HPP
#define MCPVISOR_JSON_RPC_HPP

// JSON-RPC 2.0 helpers shared by the host and server halves.
// Uses nlohmann/json for parsing and serialization.

#include <nlohmann/json.hpp>
#include <string>

namespace json_rpc {

using json = nlohmann::json;

constexpr const char *JSONRPC_VERSION = "2.0";

// Standard JSON-RPC error codes.
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// Implementation-defined server error codes.
constexpr int SERVER_ERROR = -32000;
constexpr int INVALID_TOOL_OUTPUT = -32001;

// Shape of a decoded message.
enum class MessageKind {
    request,      // id + method
    response,     // id + result or error
    notification, // method, no id
    invalid,
};

// Build a JSON-RPC 2.0 request. params is omitted when null.
json build_request(const json &request_id, const std::string &method, const json &params);

// Build a JSON-RPC 2.0 notification (no id). params is omitted when null.
json build_notification(const std::string &method, const json &params);

// Build a JSON-RPC 2.0 success response.
json build_response(const json &request_id, const json &result_payload);

// Build a JSON-RPC 2.0 error response.
json build_error_response(const json &request_id, int error_code, const std::string &error_message);

// Build a JSON-RPC 2.0 error response with additional data. Null data is omitted.
json build_error_response(const json &request_id, int error_code, const std::string &error_message, const json &error_data);

// Extract method name from a JSON-RPC request/notification. Returns empty if missing.
std::string get_method(const json &message);

// Extract the id from a JSON-RPC message. Returns nullptr json if missing (notification).
json get_id(const json &message);

// Extract params from a JSON-RPC message. Returns empty object if missing or not an object.
json get_params(const json &message);

// Check if a message is a notification (no id field).
bool is_notification(const json &message);

// Classify a decoded message.
MessageKind classify(const json &message);

} // namespace json_rpc

#endif // MCPVISOR_JSON_RPC_HPP
