#ifndef DRIFT_UTILITIES_LOGGING_H
#define DRIFT_UTILITIES_LOGGING_H

#include <memory>

#include <spdlog/spdlog.h>

#include <drift/core/type_definitions.h>

namespace drift {

// The name under which the drift logger is registered with spdlog.
inline constexpr char const* logger_name = "drift";

// Get the logger that all drift components write to.
// If the embedding application hasn't registered a logger under :logger_name,
// one is created (writing to stdout) on first use.
std::shared_ptr<spdlog::logger>
get_logger();

// Set the level of the drift logger.
void
initialize_logging(spdlog::level::level_enum level);

// Parse a level name ("trace", "debug", "info", "warning", "error",
// "critical" or "off").
// If the name isn't recognized, this throws invalid_enum_string.
spdlog::level::level_enum
parse_log_level(string const& name);

} // namespace drift

#endif
