#include "StdioTransport.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace calc_mcp {

namespace {
    bool is_blank(const std::string& line) {
        return line.find_first_not_of(" \t\r\n") == std::string::npos;
    }
}

StdioTransport::StdioTransport(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {
    spdlog::debug("StdioTransport initialized");
}

TransportMessage StdioTransport::read_message() {
    std::string line;

    while (std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (is_blank(line)) {
            spdlog::trace("Skipping blank line");
            continue;
        }

        try {
            json message = json::parse(line);
            spdlog::debug("Read message: {}", line);
            return TransportMessage::ok(std::move(message));
        } catch (const json::exception& e) {
            // Covers syntax errors and out-of-range numbers such as 1e400
            spdlog::error("JSON parse error: {}", e.what());
            return TransportMessage::parse_error(e.what());
        }
    }

    if (in_.eof()) {
        spdlog::debug("Reached end of input stream");
    } else {
        spdlog::error("Error reading from input stream");
    }
    return TransportMessage::closed();
}

void StdioTransport::write_message(const json& message) {
    // Invalid UTF-8 (e.g. echoed in a parser diagnostic) is replaced, not thrown
    std::string serialized = message.dump(-1, ' ', false, json::error_handler_t::replace);
    out_ << serialized << '\n';
    out_.flush();

    if (!out_) {
        throw TransportError("Failed to write message to output stream");
    }
    spdlog::debug("Wrote message: {}", serialized);
}

bool StdioTransport::is_open() const {
    return !in_.bad() && out_.good();
}

} // namespace calc_mcp
