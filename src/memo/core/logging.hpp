#ifndef MEMO_CORE_LOGGING_HPP
#define MEMO_CORE_LOGGING_HPP

#include <memory>

#include <spdlog/spdlog.h>

#include <memo/core/type_definitions.hpp>

namespace memo {

// All memo logging goes through a single spdlog logger registered under this
// name.
extern char const* const memo_logger_name;

// Get the memo logger, creating it (with a colored stderr sink) if nobody has
// registered one yet. Applications that want their own sinks should register
// a logger under memo_logger_name before using the library.
std::shared_ptr<spdlog::logger>
get_memo_logger();

// Create (or reconfigure) the memo logger and set its level.
// :level uses spdlog's level names ("trace", "debug", "info", "warn", ...).
// Unrecognized names turn logging off, as spdlog does.
void
initialize_logging(string const& level);

} // namespace memo

#endif
