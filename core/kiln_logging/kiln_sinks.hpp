// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef KILN_SINKS_HPP
#define KILN_SINKS_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include <cstdint>
#include <string>

#include "kiln_log_severity.hpp"

namespace kiln {
namespace logging {

/**
 * Async console sink. Records are dropped when the queue overflows so a
 * stalled terminal never blocks an upload worker.
 */
typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_ostream_backend,
  boost::log::sinks::bounded_fifo_queue<1000, boost::log::sinks::drop_on_overflow>>
  async_console_sink_t;

/**
 * Async rotating file sink, larger queue for slower I/O.
 */
typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_file_backend,
  boost::log::sinks::bounded_fifo_queue<5000, boost::log::sinks::drop_on_overflow>>
  async_file_sink_t;

struct FileSinkConfig {
  std::string directory = "/var/log/kiln";
  std::string file_pattern = "kiln_%Y%m%d_%H%M%S.log";
  uint64_t rotation_size_mb = 100;
  bool rotate_at_midnight = true;
  int max_files = 10;
  bool format_json = true;  // one JSON object per line
};

/**
 * Create the console sink writing to std::clog.
 *
 * @param min_level Records below this level are filtered out
 * @param use_colors Wrap the severity tag in ANSI colour codes
 */
boost::shared_ptr<async_console_sink_t> create_console_sink(
  severity_level min_level = severity_level::info, bool use_colors = true
);

/**
 * Create the rotating file sink.
 *
 * Falls back to /tmp when the configured directory cannot be created.
 */
boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level = severity_level::debug
);

/**
 * Escape a string for embedding in a JSON string literal (RFC 8259).
 */
std::string escape_json(const std::string& s);

}  // namespace logging
}  // namespace kiln

#endif  // KILN_SINKS_HPP
