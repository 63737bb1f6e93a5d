#pragma once

#include "ITransport.hpp"
#include "JsonRpc.hpp"
#include "tools/ToolTable.hpp"
#include <memory>
#include <string>

namespace calc_mcp {

/**
 * @brief Session lifecycle; Initialized is terminal
 */
enum class SessionState {
    Uninitialized,
    Initialized
};

/**
 * @brief Server identity and policy knobs
 */
struct ServerOptions {
    std::string name = "calculator-mcp-server";
    std::string version = "1.0.0";
    std::string protocol_version = "2024-11-05";  // used when the client sends none
    bool strict_initialization = false;           // reject tools/* before initialize
};

/**
 * @brief MCP Server implementing JSON-RPC 2.0 protocol
 *
 * Handles request routing over a fixed tool table.
 * Supports methods: initialize, notifications/initialized, tools/list, tools/call
 */
class MCPServer {
public:
    /**
     * @brief Construct MCP server with transport
     * @param transport Unique pointer to transport implementation
     * @param tools Tool table; must outlive the server
     * @param options Identity and initialization policy
     */
    MCPServer(std::unique_ptr<ITransport> transport, const ToolTable& tools,
              ServerOptions options = ServerOptions());

    /**
     * @brief Start server main loop
     *
     * Blocks until the transport closes.
     * Reads requests, dispatches to handlers, sends responses.
     *
     * @throws TransportError when a response cannot be written
     */
    void run();

    /**
     * @brief Handle one decoded message
     * @param message Decoded JSON document
     * @return JSON-RPC response, or null for notifications
     */
    json handle_message(const json& message);

    SessionState state() const { return state_; }

private:
    json dispatch(const Request& request);

    /**
     * @brief Handle initialize method (MCP handshake)
     * @param params Client capabilities and info
     * @return Server capabilities and info
     */
    json handle_initialize(const json& params);

    /**
     * @brief Handle tools/list method
     * @return Object holding the tool descriptors in table order
     */
    json handle_tools_list();

    /**
     * @brief Handle tools/call method
     *
     * Batch form ({calls: [...]}) reports each call inline.
     * Single form ({name, arguments}) answers in the MCP tool-result shape.
     *
     * @param params Request parameters
     * @return Tool execution result
     * @throws JsonRpcError InvalidParams when no call can be found
     */
    json handle_tools_call(const json& params);

    void require_initialized(const std::string& method) const;

    std::unique_ptr<ITransport> transport_;
    const ToolTable& tools_;
    ServerOptions options_;
    SessionState state_ = SessionState::Uninitialized;
};

} // namespace calc_mcp
