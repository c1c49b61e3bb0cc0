/**
 * @file logging.h
 * @brief Library-wide spdlog logger.
 *
 * All datapilot components log through one named logger ("datapilot") that
 * writes to stderr. The default level is warn so the library stays quiet when
 * embedded; the command-line tool raises it on request.
 */

#ifndef DATAPILOT_LOGGING_H
#define DATAPILOT_LOGGING_H

#include <memory>

#include <spdlog/spdlog.h>

namespace datapilot {

/// Name under which the logger is registered with spdlog
constexpr const char* LOGGER_NAME = "datapilot";

/// Get the shared logger, creating it on first use.
std::shared_ptr<spdlog::logger> logger();

/// Set the minimum level of the shared logger.
void set_log_level(spdlog::level::level_enum level);

} // namespace datapilot

#endif // DATAPILOT_LOGGING_H
