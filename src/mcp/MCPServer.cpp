#include "MCPServer.hpp"
#include "tools/ToolCall.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace calc_mcp {

namespace {
    // Keys accepted for the invocation list of a batch tools/call
    const char* const kCallListKeys[] = {"calls", "toolCalls", "tool_calls"};

    std::string string_member(const json& object, const char* key, const std::string& fallback) {
        auto it = object.find(key);
        return (it != object.end() && it->is_string()) ? it->get<std::string>() : fallback;
    }
}

MCPServer::MCPServer(std::unique_ptr<ITransport> transport, const ToolTable& tools,
                     ServerOptions options)
    : transport_(std::move(transport)), tools_(tools), options_(std::move(options)) {
    if (!transport_) {
        throw std::invalid_argument("Transport cannot be null");
    }
    spdlog::info("MCPServer initialized with {} tools", tools_.size());
}

void MCPServer::run() {
    spdlog::info("MCPServer starting main loop");

    while (transport_->is_open()) {
        json response;

        try {
            TransportMessage incoming = transport_->read_message();

            if (incoming.status == TransportMessage::Status::Closed) {
                spdlog::info("Input closed, stopping server");
                break;
            }

            if (incoming.status == TransportMessage::Status::ParseError) {
                response = make_error(json(), ErrorCode::ParseError, "Parse error", incoming.error);
            } else {
                response = handle_message(incoming.payload);
            }

        } catch (const TransportError&) {
            throw;
        } catch (const std::exception& e) {
            spdlog::error("Error in main loop: {}", e.what());
            response = make_error(json(), ErrorCode::InternalError, "Internal error", e.what());
        }

        // Notifications produce no response
        if (!response.is_null()) {
            transport_->write_message(response);
        }
    }

    spdlog::info("MCPServer stopped");
}

json MCPServer::handle_message(const json& message) {
    if (!message.is_object()) {
        spdlog::warn("Rejecting non-object message");
        return make_error(json(), ErrorCode::InvalidRequest,
                          "Invalid Request: message must be a JSON object");
    }

    const bool is_notification = !message.contains("id");
    json id = is_notification ? json() : message.at("id");
    if (!is_valid_id(id)) {
        spdlog::warn("Rejecting request with invalid id: {}", id.dump());
        return make_error(json(), ErrorCode::InvalidRequest,
                          "Invalid Request: id must be a string, number or null");
    }

    try {
        Request request = parse_request(message);
        spdlog::debug("Handling request: method={}, id={}", request.method, id.dump());

        json result = dispatch(request);
        if (request.is_notification) {
            return json();
        }
        return make_result(id, std::move(result));

    } catch (const JsonRpcError& e) {
        spdlog::warn("Request failed with code {}: {}", static_cast<int>(e.code()), e.what());
        if (is_notification) {
            return json();
        }
        return make_error(id, e.code(), e.what(), e.data());

    } catch (const std::exception& e) {
        spdlog::error("Internal error handling request: {}", e.what());
        if (is_notification) {
            return json();
        }
        return make_error(id, ErrorCode::InternalError, "Internal error", e.what());
    }
}

json MCPServer::dispatch(const Request& request) {
    switch (classify_method(request.method)) {
        case Method::Initialize:
            return handle_initialize(request.params);

        case Method::InitializedNotification:
            spdlog::info("Client sent initialized notification, server is ready");
            return json::object();

        case Method::ToolsList:
            require_initialized(request.method);
            return handle_tools_list();

        case Method::ToolsCall:
            require_initialized(request.method);
            return handle_tools_call(request.params);

        case Method::Unknown:
            break;
    }
    throw JsonRpcError(ErrorCode::MethodNotFound, "Method not found: " + request.method);
}

json MCPServer::handle_initialize(const json& params) {
    spdlog::info("Handling initialize request");

    std::string protocol_version = string_member(params, "protocolVersion", "");
    if (protocol_version.empty()) {
        protocol_version = options_.protocol_version;
    }
    spdlog::info("Protocol version: {}", protocol_version);

    auto client = params.find("clientInfo");
    if (client != params.end() && client->is_object()) {
        spdlog::info("Client: {} version {}",
                     string_member(*client, "name", "unknown"),
                     string_member(*client, "version", "unknown"));
    }

    if (state_ == SessionState::Initialized) {
        spdlog::debug("Repeated initialize, session already initialized");
    }
    state_ = SessionState::Initialized;

    return {
        {"protocolVersion", protocol_version},
        {"capabilities", {
            {"tools", json::object()}
        }},
        {"serverInfo", {
            {"name", options_.name},
            {"version", options_.version}
        }}
    };
}

json MCPServer::handle_tools_list() {
    json tools_array = tools_.descriptors();
    spdlog::debug("Returning {} tools", tools_array.size());
    return {{"tools", tools_array}};
}

json MCPServer::handle_tools_call(const json& params) {
    for (const char* key : kCallListKeys) {
        auto calls = params.find(key);
        if (calls == params.end()) {
            continue;
        }
        if (!calls->is_array()) {
            throw JsonRpcError(ErrorCode::InvalidParams,
                               std::string("Invalid params: '") + key + "' must be an array");
        }

        spdlog::debug("Executing batch of {} tool calls", calls->size());
        json content = json::array();
        for (const auto& call : *calls) {
            content.push_back(execute_call(tools_, call));
        }
        return {{"content", content}};
    }

    // Single call in the standard MCP shape
    auto name = params.find("name");
    if (name == params.end()) {
        throw JsonRpcError(ErrorCode::InvalidParams, "Invalid params: missing calls");
    }
    if (!name->is_string()) {
        throw JsonRpcError(ErrorCode::InvalidParams, "Invalid params: name must be a string");
    }

    json arguments = params.contains("arguments") ? params.at("arguments") : json::object();
    std::string text;
    bool is_error = false;
    try {
        text = run_tool(tools_, name->get<std::string>(), arguments);
    } catch (const ToolError& e) {
        spdlog::warn("Tool {} failed: {}", name->get<std::string>(), e.what());
        text = std::string("Error: ") + e.what();
        is_error = true;
    }

    return {
        {"content", json::array({
            {{"type", "text"}, {"text", text}}
        })},
        {"isError", is_error}
    };
}

void MCPServer::require_initialized(const std::string& method) const {
    if (options_.strict_initialization && state_ != SessionState::Initialized) {
        spdlog::warn("Rejecting {} before initialize", method);
        throw JsonRpcError(ErrorCode::InvalidRequest, "Server not initialized");
    }
}

} // namespace calc_mcp
