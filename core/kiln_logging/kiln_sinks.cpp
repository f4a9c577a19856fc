// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "kiln_sinks.hpp"

#include <boost/core/null_deleter.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/filesystem.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>

#include <cstdio>
#include <iostream>

namespace kiln {
namespace logging {

namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;
namespace sinks = boost::log::sinks;

namespace {

const char* color_for(severity_level level) {
  switch (level) {
    case severity_level::debug:
      return "\033[36m";
    case severity_level::info:
      return "\033[32m";
    case severity_level::warn:
      return "\033[33m";
    case severity_level::error:
      return "\033[31m";
    case severity_level::fatal:
      return "\033[35m";
    default:
      return "";
  }
}

constexpr const char* kResetColor = "\033[0m";

// Trailing " | request_id=... media=..." block shared by the text formatters
void write_context(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  auto rid = boost::log::extract<std::string>("RequestID", rec);
  auto media = boost::log::extract<std::string>("Media", rec);
  if (rid || media) {
    strm << " |";
    if (rid) strm << " request_id=" << *rid;
    if (media) strm << " media=" << *media;
  }
}

void write_timestamp(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  strm << "[";
  auto ts = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec);
  if (ts) {
    strm << *ts;
  }
  strm << "] ";
}

void text_formatter(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  write_timestamp(rec, strm);
  auto sev = boost::log::extract<severity_level>("Severity", rec);
  if (sev) {
    strm << "[" << *sev << "] ";
  }
  strm << rec[expr::smessage];
  write_context(rec, strm);
}

void color_formatter(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  write_timestamp(rec, strm);
  auto sev = boost::log::extract<severity_level>("Severity", rec);
  if (sev) {
    strm << color_for(*sev) << "[" << *sev << "]" << kResetColor << " ";
  }
  strm << rec[expr::smessage];
  write_context(rec, strm);
}

void json_formatter(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  strm << "{\"ts\":\"";
  auto ts = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec);
  if (ts) {
    strm << *ts;
  }
  strm << "\",\"level\":\"";
  auto sev = boost::log::extract<severity_level>("Severity", rec);
  if (sev) {
    strm << *sev;
  }
  strm << "\",\"msg\":\"";
  auto msg = rec[expr::smessage];
  if (msg) {
    strm << escape_json(msg.get());
  }
  strm << "\"";

  auto thread_id =
    boost::log::extract<boost::log::attributes::current_thread_id::value_type>("ThreadID", rec);
  if (thread_id) {
    strm << ",\"thread_id\":\"" << *thread_id << "\"";
  }

  auto rid = boost::log::extract<std::string>("RequestID", rec);
  if (rid) {
    strm << ",\"request_id\":\"" << escape_json(*rid) << "\"";
  }
  auto media = boost::log::extract<std::string>("Media", rec);
  if (media) {
    strm << ",\"media\":\"" << escape_json(*media) << "\"";
  }
  strm << "}";
}

}  // namespace

std::string escape_json(const std::string& s) {
  std::string result;
  result.reserve(s.size() + 16);
  for (unsigned char c : s) {
    switch (c) {
      case '"':
        result += "\\\"";
        break;
      case '\\':
        result += "\\\\";
        break;
      case '\b':
        result += "\\b";
        break;
      case '\f':
        result += "\\f";
        break;
      case '\n':
        result += "\\n";
        break;
      case '\r':
        result += "\\r";
        break;
      case '\t':
        result += "\\t";
        break;
      default:
        if (c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", c);
          result += buf;
        } else {
          result += static_cast<char>(c);
        }
    }
  }
  return result;
}

boost::shared_ptr<async_console_sink_t> create_console_sink(
  severity_level min_level, bool use_colors
) {
  auto backend = boost::make_shared<sinks::text_ostream_backend>();
  backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
  backend->auto_flush(true);

  auto sink = boost::make_shared<async_console_sink_t>(backend);
  sink->set_filter(severity >= min_level);
  if (use_colors) {
    sink->set_formatter(&color_formatter);
  } else {
    sink->set_formatter(&text_formatter);
  }
  return sink;
}

boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level
) {
  std::string log_directory = config.directory;
  boost::filesystem::path dir_path(log_directory);

  if (!boost::filesystem::exists(dir_path)) {
    boost::system::error_code ec;
    boost::filesystem::create_directories(dir_path, ec);
    if (ec) {
      // Logging is not up yet, so this goes straight to stderr
      std::cerr << "[kiln_logging] Warning: Could not create log directory '" << config.directory
                << "': " << ec.message() << ". Falling back to /tmp\n";
      log_directory = "/tmp";
    }
  }

  auto backend = boost::make_shared<sinks::text_file_backend>(
    keywords::file_name = log_directory + "/" + config.file_pattern,
    keywords::rotation_size = config.rotation_size_mb * 1024 * 1024,
    keywords::auto_flush = true
  );

  if (config.rotate_at_midnight) {
    backend->set_time_based_rotation(sinks::file::rotation_at_time_point(0, 0, 0));
  }

  backend->set_file_collector(sinks::file::make_collector(
    keywords::target = log_directory, keywords::max_files = config.max_files
  ));
  backend->scan_for_files();

  auto sink = boost::make_shared<async_file_sink_t>(backend);
  sink->set_filter(severity >= min_level);
  if (config.format_json) {
    sink->set_formatter(&json_formatter);
  } else {
    sink->set_formatter(&text_formatter);
  }
  return sink;
}

}  // namespace logging
}  // namespace kiln
