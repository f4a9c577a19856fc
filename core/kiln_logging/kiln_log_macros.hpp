// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef KILN_LOG_MACROS_HPP
#define KILN_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <sstream>
#include <string>

#include "kiln_log_severity.hpp"

namespace kiln {
namespace logging {

typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

/**
 * Process-wide logger, defined in kiln_log_init.cpp.
 * The _mt variant is required: pipeline workers log concurrently.
 */
logger_type& get_logger();

/**
 * Key-value helper for structured messages.
 * Usage: KILN_LOG_INFO("chunk uploaded" << kv("key", key));
 */
template <typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

template <>
inline std::string kv(const char* name, const std::string& value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

inline std::string kv(const char* name, const char* value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

}  // namespace logging
}  // namespace kiln

// Define KILN_LOG_COMPONENT before including this header:
//   #define KILN_LOG_COMPONENT "chunk_uploader"
//   #include <kiln_log_macros.hpp>
#ifndef KILN_LOG_COMPONENT
#define KILN_LOG_COMPONENT "kiln"
#endif

// DEBUG records are compiled out of release builds
#ifdef NDEBUG
#define KILN_LOG_ENABLE_DEBUG 0
#else
#define KILN_LOG_ENABLE_DEBUG 1
#endif

#define KILN_LOG_DEBUG(msg)                                                                     \
  do {                                                                                          \
    if (KILN_LOG_ENABLE_DEBUG) {                                                                \
      BOOST_LOG_SEV(::kiln::logging::get_logger(), ::kiln::logging::severity_level::debug)      \
        << "[" << KILN_LOG_COMPONENT << "] " << msg;                                            \
    }                                                                                           \
  } while (0)

#define KILN_LOG_INFO(msg)                                                                      \
  do {                                                                                          \
    BOOST_LOG_SEV(::kiln::logging::get_logger(), ::kiln::logging::severity_level::info)         \
      << "[" << KILN_LOG_COMPONENT << "] " << msg;                                              \
  } while (0)

#define KILN_LOG_WARN(msg)                                                                      \
  do {                                                                                          \
    BOOST_LOG_SEV(::kiln::logging::get_logger(), ::kiln::logging::severity_level::warn)         \
      << "[" << KILN_LOG_COMPONENT << "] " << msg;                                              \
  } while (0)

#define KILN_LOG_ERROR(msg)                                                                     \
  do {                                                                                          \
    BOOST_LOG_SEV(::kiln::logging::get_logger(), ::kiln::logging::severity_level::error)        \
      << "[" << KILN_LOG_COMPONENT << "] " << msg;                                              \
  } while (0)

#define KILN_LOG_FATAL(msg)                                                                     \
  do {                                                                                          \
    BOOST_LOG_SEV(::kiln::logging::get_logger(), ::kiln::logging::severity_level::fatal)        \
      << "[" << KILN_LOG_COMPONENT << "] " << msg;                                              \
  } while (0)

// Attaches request context to every record emitted on this thread until scope exit.
// At most one per scope. Usage: KILN_LOG_SCOPED_CONTEXT(request_id, "video");
#define KILN_LOG_SCOPED_CONTEXT(request_id_val, media_val)                                  \
  ::boost::log::scoped_attribute _kiln_log_ctx_request_id =                                 \
    ::boost::log::add_scoped_thread_attribute(                                              \
      "RequestID", ::boost::log::attributes::constant<std::string>(request_id_val)          \
    );                                                                                      \
  ::boost::log::scoped_attribute _kiln_log_ctx_media =                                      \
    ::boost::log::add_scoped_thread_attribute(                                              \
      "Media", ::boost::log::attributes::constant<std::string>(media_val)                   \
    )

#endif  // KILN_LOG_MACROS_HPP
