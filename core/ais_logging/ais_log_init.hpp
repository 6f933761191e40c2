// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef AIS_LOG_INIT_HPP
#define AIS_LOG_INIT_HPP

#include <optional>
#include <string>

#include "ais_console_sink.hpp"
#include "ais_file_sink.hpp"
#include "ais_log_attributes.hpp"

namespace ais {
namespace logging {

struct LoggingConfig {
  ConsoleSinkConfig console;
  FileSinkConfig file;
};

/**
 * Parse a level name ("debug", "info", "warn"/"warning", "error", "fatal"),
 * case-insensitive.
 *
 * @return The parsed level, or std::nullopt if the name is unknown
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Apply environment variable overrides to a LoggingConfig.
 *
 *   AIS_LOG_LEVEL            Level for both sinks
 *   AIS_LOG_CONSOLE_LEVEL    Console level (wins over AIS_LOG_LEVEL)
 *   AIS_LOG_CONSOLE_ENABLED  "true"/"false"
 *   AIS_LOG_COLORS           "true"/"false"
 *   AIS_LOG_FILE_LEVEL       File level (wins over AIS_LOG_LEVEL)
 *   AIS_LOG_FILE_ENABLED     "true"/"false"
 *   AIS_LOG_FILE_DIR         Log directory
 *   AIS_LOG_FORMAT           File format, "json" or "text"
 *
 * Unparseable values leave the field unchanged.
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Install the configured sinks. A second call is ignored until
 * shutdown_logging() has run.
 */
void init_logging(const LoggingConfig& config);

/**
 * Drain and detach the sinks, and clear the run id.
 */
void shutdown_logging();

void flush_logging();

bool is_logging_initialized();

/**
 * Tag every following record from any thread with `id` (the RunId
 * attribute), replacing the previous id.
 */
void set_run_id(const std::string& id);

void clear_run_id();

}  // namespace logging
}  // namespace ais

#endif  // AIS_LOG_INIT_HPP
