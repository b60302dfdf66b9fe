#include "mcp/mcp_stdio.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

#include <cctype>
#include <iostream>
#include <mutex>

namespace mcp_stdio {

static std::mutex stderr_mutex;

static bool is_space(char character) {
    return std::isspace(static_cast<unsigned char>(character)) != 0;
}

bool read_message(std::istream &input, std::string &message) {
    message.clear();

    char character = 0;

    // Skip whitespace (including blank lines) before the next value.
    do {
        if (!input.get(character)) {
            return false;
        }
    } while (is_space(character));

    // Not an object or array: take the rest of the line as-is.
    if (character != '{' && character != '[') {
        message += character;
        while (input.get(character) && character != '\n') {
            message += character;
        }
        if (!message.empty() && message.back() == '\r') {
            message.pop_back();
        }
        return true;
    }

    int bracket_depth = 1;
    bool inside_string = false;
    bool escape_next = false;
    message += character;

    while (input.get(character)) {
        // Messages are one per line. An unbalanced line ends here and is
        // answered on its own instead of absorbing the lines after it.
        if (character == '\n') {
            if (!message.empty() && message.back() == '\r') {
                message.pop_back();
            }
            return true;
        }

        message += character;

        if (escape_next) {
            escape_next = false;
            continue;
        }

        if (character == '\\' && inside_string) {
            escape_next = true;
            continue;
        }

        if (character == '"') {
            inside_string = !inside_string;
            continue;
        }

        if (inside_string) {
            continue;
        }

        if (character == '{' || character == '[') {
            bracket_depth++;
        } else if (character == '}' || character == ']') {
            bracket_depth--;
            if (bracket_depth == 0) {
                // Complete JSON value received.
                return true;
            }
        }
    }

    // EOF in the middle of a value: hand back what we have so the caller
    // reports a parse error instead of dropping it silently.
    return true;
}

void write_message(std::ostream &output, const std::string &json_string) {
    output << json_string << "\n";
    output.flush();
}

void log_message(const std::string &message) {
    std::lock_guard<std::mutex> lock(stderr_mutex);
    std::cerr << "[nasamcp] " << message << std::endl;
}

int serve(std::istream &input, std::ostream &output, const mcp_dispatch::Dispatcher &dispatcher,
          const std::atomic<bool> &shutdown_requested) {
    // The stdio binding has no mid-request cancellation.
    const mcp_tools::CancellationFlag never_cancelled;

    std::string raw_message;
    while (!shutdown_requested.load()) {
        if (!read_message(input, raw_message)) {
            debug_log::log("EOF on input. Leaving stdio loop.");
            break;
        }

        mcp_dispatch::DispatchResult dispatch_result = dispatcher.dispatch_payload(raw_message, never_cancelled);
        if (dispatch_result.parse_error) {
            log_message("Failed to parse incoming JSON message (" + std::to_string(raw_message.size()) + " bytes)");
        }

        // Notifications produce no frames.
        for (const auto &frame : dispatch_result.frames) {
            write_message(output, json_rpc::encode_response(frame));
        }

        if (!output) {
            log_message("Output stream failed. Leaving stdio loop.");
            return 1;
        }
    }

    return 0;
}

} // namespace mcp_stdio
