#ifndef NASAMCP_MCP_STDIO_HPP
#define NASAMCP_MCP_STDIO_HPP

// MCP stdio transport: JSON-RPC messages in on one stream, responses out on
// another, strictly one at a time in arrival order.

#include <atomic>
#include <iosfwd>
#include <string>

#include "mcp/mcp_dispatch.hpp"

namespace mcp_stdio {

// Read a single complete JSON value from input.
// Objects and arrays are framed by bracket counting that respects strings
// and escapes, so several values on one line are read one at a time. A value
// never spans lines: a line that ends before its brackets balance is returned
// as it stands, and anything that is not an object or array is taken up to
// the end of its line. Both fail to parse and are answered with a parse error.
// Returns false on EOF with nothing buffered.
bool read_message(std::istream &input, std::string &message);

// Write a JSON message followed by a newline, then flush.
void write_message(std::ostream &output, const std::string &json_string);

// Write a log message to stderr. stdout is reserved for protocol frames.
void log_message(const std::string &message);

// Main message loop: read, dispatch, write, until EOF or shutdown_requested.
// Returns the process exit code.
int serve(std::istream &input, std::ostream &output, const mcp_dispatch::Dispatcher &dispatcher,
          const std::atomic<bool> &shutdown_requested);

} // namespace mcp_stdio

#endif // NASAMCP_MCP_STDIO_HPP
