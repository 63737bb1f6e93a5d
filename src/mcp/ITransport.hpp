#pragma once

#include "JsonRpc.hpp"
#include <stdexcept>
#include <string>

namespace calc_mcp {

/**
 * @brief Outcome of reading one message from a transport
 */
struct TransportMessage {
    enum class Status {
        Ok,          // payload holds a decoded JSON document
        ParseError,  // a line arrived but was not valid JSON; error holds the diagnostic
        Closed       // end of input, no more messages will arrive
    };

    Status status = Status::Closed;
    json payload;
    std::string error;

    static TransportMessage ok(json payload) {
        return {Status::Ok, std::move(payload), {}};
    }
    static TransportMessage parse_error(std::string diagnostic) {
        return {Status::ParseError, json(), std::move(diagnostic)};
    }
    static TransportMessage closed() {
        return {Status::Closed, json(), {}};
    }
};

/**
 * @brief Unrecoverable transport failure (the peer can no longer be reached)
 */
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Abstract interface for MCP transport mechanisms
 *
 * Implementations handle reading/writing JSON-RPC messages over a
 * bidirectional channel, one JSON document per message.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Read next JSON-RPC message from transport
     * @return Decoded message, parse error, or Closed on end of input
     */
    virtual TransportMessage read_message() = 0;

    /**
     * @brief Write JSON-RPC message to transport
     * @param message JSON message to write
     * @throws TransportError if the message could not be delivered
     */
    virtual void write_message(const json& message) = 0;

    /**
     * @brief Check if transport is still open
     * @return true if transport can read/write, false otherwise
     */
    virtual bool is_open() const = 0;
};

} // namespace calc_mcp
