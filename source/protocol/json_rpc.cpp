#include "protocol/json_rpc.hpp"

namespace json_rpc {

json build_request(const json &request_id, const std::string &method, const json &params) {
    json request;
    request["jsonrpc"] = JSONRPC_VERSION;
    request["id"] = request_id;
    request["method"] = method;
    if (!params.is_null()) {
        request["params"] = params;
    }
    return request;
}

json build_notification(const std::string &method, const json &params) {
    json notification;
    notification["jsonrpc"] = JSONRPC_VERSION;
    notification["method"] = method;
    if (!params.is_null()) {
        notification["params"] = params;
    }
    return notification;
}

json build_response(const json &request_id, const json &result_payload) {
    json response;
    response["jsonrpc"] = JSONRPC_VERSION;
    response["id"] = request_id;
    response["result"] = result_payload;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message) {
    json response;
    response["jsonrpc"] = JSONRPC_VERSION;
    response["id"] = request_id;
    response["error"]["code"] = error_code;
    response["error"]["message"] = error_message;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message, const json &error_data) {
    json response = build_error_response(request_id, error_code, error_message);
    if (!error_data.is_null()) {
        response["error"]["data"] = error_data;
    }
    return response;
}

std::string get_method(const json &message) {
    if (message.is_object() && message.contains("method") && message["method"].is_string()) {
        return message["method"].get<std::string>();
    }
    return "";
}

json get_id(const json &message) {
    if (message.is_object() && message.contains("id")) {
        return message["id"];
    }
    return nullptr;
}

json get_params(const json &message) {
    if (message.is_object() && message.contains("params") && message["params"].is_object()) {
        return message["params"];
    }
    return json::object();
}

bool is_notification(const json &message) {
    return message.is_object() && !message.contains("id");
}

MessageKind classify(const json &message) {
    if (!message.is_object()) {
        return MessageKind::invalid;
    }
    bool has_method = message.contains("method") && message["method"].is_string();
    if (!message.contains("id")) {
        return has_method ? MessageKind::notification : MessageKind::invalid;
    }
    if (has_method) {
        return MessageKind::request;
    }
    if (message.contains("result") || message.contains("error")) {
        return MessageKind::response;
    }
    return MessageKind::invalid;
}

} // namespace json_rpc
