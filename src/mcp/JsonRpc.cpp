#include "JsonRpc.hpp"

namespace calc_mcp {

Method classify_method(std::string_view name) {
    if (name == "initialize") {
        return Method::Initialize;
    } else if (name == "notifications/initialized") {
        return Method::InitializedNotification;
    } else if (name == "tools/list") {
        return Method::ToolsList;
    } else if (name == "tools/call") {
        return Method::ToolsCall;
    }
    return Method::Unknown;
}

bool is_valid_id(const json& id) {
    return id.is_null() || id.is_string() || id.is_number();
}

Request parse_request(const json& message) {
    auto version = message.find("jsonrpc");
    if (version == message.end() || *version != "2.0") {
        throw JsonRpcError(ErrorCode::InvalidRequest,
                           "Invalid Request: missing or invalid jsonrpc field");
    }

    auto method = message.find("method");
    if (method == message.end() || !method->is_string()) {
        throw JsonRpcError(ErrorCode::InvalidRequest,
                           "Invalid Request: missing method field");
    }

    Request request;
    request.is_notification = !message.contains("id");
    request.id = request.is_notification ? json() : message.at("id");
    request.method = method->get<std::string>();
    request.params = json::object();

    auto params = message.find("params");
    if (params != message.end() && !params->is_null()) {
        if (!params->is_object()) {
            throw JsonRpcError(ErrorCode::InvalidParams,
                               "Invalid params: params must be an object");
        }
        request.params = *params;
    }

    return request;
}

json make_result(const json& id, json result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", std::move(result)}
    };
}

json make_error(const json& id, ErrorCode code, const std::string& message,
                const json& data) {
    json error = {
        {"code", static_cast<int>(code)},
        {"message", message}
    };
    if (!data.is_null()) {
        error["data"] = data;
    }

    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", std::move(error)}
    };
}

} // namespace calc_mcp
