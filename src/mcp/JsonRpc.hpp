#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <string_view>

namespace calc_mcp {

using json = nlohmann::ordered_json;

/**
 * @brief Reserved JSON-RPC 2.0 error codes
 */
enum class ErrorCode : int {
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603
};

/**
 * @brief Methods understood by the server
 *
 * Anything not listed maps to Unknown and is answered with MethodNotFound.
 */
enum class Method {
    Initialize,
    InitializedNotification,
    ToolsList,
    ToolsCall,
    Unknown
};

Method classify_method(std::string_view name);

/**
 * @brief Protocol-level failure answered with a top-level error object
 */
class JsonRpcError : public std::runtime_error {
public:
    JsonRpcError(ErrorCode code, const std::string& message, json data = json())
        : std::runtime_error(message), code_(code), data_(std::move(data)) {}

    ErrorCode code() const { return code_; }
    const json& data() const { return data_; }

private:
    ErrorCode code_;
    json data_;
};

/**
 * @brief Decoded JSON-RPC request envelope
 */
struct Request {
    json id;                       // null when absent
    bool is_notification = false;  // true when the id member is absent
    std::string method;
    json params;                   // always an object
};

/**
 * @brief Validate an envelope and extract its members
 *
 * Checks the jsonrpc version, the method member and the params shape.
 * The id must already have been validated by the caller.
 *
 * @param message Decoded JSON object
 * @return Request with params defaulted to an empty object
 * @throws JsonRpcError InvalidRequest or InvalidParams
 */
Request parse_request(const json& message);

/**
 * @brief Check that an id is a string, number or null
 */
bool is_valid_id(const json& id);

/**
 * @brief Build a success response
 */
json make_result(const json& id, json result);

/**
 * @brief Build an error response
 * @param id Request id, or null when it could not be recovered
 * @param code Error code
 * @param message Human-readable message
 * @param data Optional detail, omitted when null
 */
json make_error(const json& id, ErrorCode code, const std::string& message,
                const json& data = json());

} // namespace calc_mcp
