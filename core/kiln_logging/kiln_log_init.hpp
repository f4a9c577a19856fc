// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef KILN_LOG_INIT_HPP
#define KILN_LOG_INIT_HPP

#include <boost/log/sinks/sink.hpp>

#include <optional>
#include <string>

#include "kiln_log_severity.hpp"
#include "kiln_sinks.hpp"

namespace kiln {
namespace logging {

/**
 * Sink setup for kiln processes. Filled from the `logging:` section of the
 * server YAML and then from KILN_LOG_* environment variables.
 */
struct LoggingConfig {
  bool console_enabled = true;
  bool console_colors = true;
  severity_level console_level = severity_level::info;

  bool file_enabled = false;
  FileSinkConfig file_config;
  severity_level file_level = severity_level::debug;
};

/**
 * Parse "debug", "info", "warn"/"warning", "error" or "fatal", any case.
 *
 * @return std::nullopt for anything else
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Apply environment overrides in place.
 *
 *   KILN_LOG_LEVEL            both sinks
 *   KILN_LOG_CONSOLE_LEVEL    console sink only
 *   KILN_LOG_CONSOLE_ENABLED  true/false
 *   KILN_LOG_FILE_LEVEL       file sink only
 *   KILN_LOG_FILE_ENABLED     true/false
 *   KILN_LOG_FILE_DIR         log directory
 *   KILN_LOG_FORMAT           "json" or "text"
 *
 * Unparseable values are ignored.
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Install the configured sinks on the Boost.Log core. A second call
 * without an intervening shutdown_logging() is a no-op.
 */
void init_logging(const LoggingConfig& config);

/**
 * Console at INFO with colours, no file sink.
 */
void init_logging_default();

/**
 * Stop async sinks, drain their queues and detach them from the core.
 */
void shutdown_logging();

void add_sink(boost::shared_ptr<boost::log::sinks::sink> sink);

void remove_sink(boost::shared_ptr<boost::log::sinks::sink> sink);

void flush_logging();

/**
 * shutdown_logging() followed by init_logging() with env overrides applied.
 */
void reconfigure_logging(const LoggingConfig& config);

bool is_logging_initialized();

}  // namespace logging
}  // namespace kiln

#endif  // KILN_LOG_INIT_HPP
