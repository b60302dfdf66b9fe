#ifndef NASAMCP_DEBUG_LOG_HPP
#define NASAMCP_DEBUG_LOG_HPP

#include <string>

namespace debug_log {

// Returns true if NASAMCP_DEBUG env is set to a truthy value (1, true, yes).
// The environment is read once; later changes are not observed.
bool is_debug_enabled();

// Writes message to stderr with [nasamcp] prefix only when is_debug_enabled().
// Safe to call from worker threads.
void log(const std::string &message);

} // namespace debug_log

#endif // NASAMCP_DEBUG_LOG_HPP
