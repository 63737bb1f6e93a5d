#include "mcp/MCPServer.hpp"
#include "mcp/StdioTransport.hpp"
#include "tools/ToolTable.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <map>
#include <memory>
#include <string>

int main(int argc, char** argv) {
    // stdout carries the protocol; all diagnostics go to stderr
    spdlog::set_default_logger(spdlog::stderr_color_mt("calculator-mcp"));

    calc_mcp::ServerOptions options;

    // Parse command-line arguments
    CLI::App app{"Calculator MCP Server - arithmetic tools over stdio JSON-RPC"};

    const std::map<std::string, spdlog::level::level_enum> log_levels{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off}
    };

    spdlog::level::level_enum log_level = spdlog::level::info;
    app.add_option("-l,--log-level", log_level,
                   "Log level (trace, debug, info, warn, error, critical, off)")
        ->envname("LOG_LEVEL")
        ->transform(CLI::CheckedTransformer(log_levels, CLI::ignore_case));

    app.add_flag("--strict-init", options.strict_initialization,
                 "Reject tools/list and tools/call until initialize succeeds");

    app.add_option("--protocol-version", options.protocol_version,
                   "Protocol version reported when the client does not send one")
        ->capture_default_str();

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << options.name << " version " << options.version << std::endl;
        return 0;
    }

    spdlog::set_level(log_level);

    spdlog::info("Starting {} {} (stdio)", options.name, options.version);
    spdlog::info("Initialization policy: {}",
                 options.strict_initialization ? "strict" : "permissive");

    try {
        const calc_mcp::ToolTable tools = calc_mcp::ToolTable::arithmetic();
        auto transport = std::make_unique<calc_mcp::StdioTransport>();
        calc_mcp::MCPServer server(std::move(transport), tools, options);

        // Run server (blocks until stdin closes)
        server.run();

        spdlog::info("Server stopped cleanly");
        return 0;

    } catch (const calc_mcp::TransportError& e) {
        spdlog::critical("Transport failure: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
