// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "kiln_log_init.hpp"

#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <vector>

#include "kiln_log_macros.hpp"

namespace kiln {
namespace logging {

namespace {

struct SinkRegistry {
  std::mutex mutex;
  std::vector<boost::shared_ptr<boost::log::sinks::sink>> extra;
  boost::shared_ptr<async_console_sink_t> console;
  boost::shared_ptr<async_file_sink_t> file;
  bool initialized = false;
};

SinkRegistry& registry() {
  static SinkRegistry instance;
  return instance;
}

std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::optional<std::string> env_value(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

std::optional<bool> parse_flag(const std::string& s) {
  const std::string v = lowercase(s);
  if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
  if (v == "false" || v == "0" || v == "no" || v == "off") return false;
  return std::nullopt;
}

void override_level(const char* var, severity_level& target) {
  if (auto raw = env_value(var)) {
    if (auto level = parse_severity_level(*raw)) {
      target = *level;
    }
  }
}

void override_flag(const char* var, bool& target) {
  if (auto raw = env_value(var)) {
    if (auto flag = parse_flag(*raw)) {
      target = *flag;
    }
  }
}

}  // namespace

std::optional<severity_level> parse_severity_level(const std::string& level_str) {
  const std::string v = lowercase(level_str);
  if (v == "debug") return severity_level::debug;
  if (v == "info") return severity_level::info;
  if (v == "warn" || v == "warning") return severity_level::warn;
  if (v == "error") return severity_level::error;
  if (v == "fatal") return severity_level::fatal;
  return std::nullopt;
}

void apply_env_overrides(LoggingConfig& config) {
  if (auto raw = env_value("KILN_LOG_LEVEL")) {
    if (auto level = parse_severity_level(*raw)) {
      config.console_level = *level;
      config.file_level = *level;
    }
  }
  // Per-sink settings win over the global level
  override_level("KILN_LOG_CONSOLE_LEVEL", config.console_level);
  override_level("KILN_LOG_FILE_LEVEL", config.file_level);
  override_flag("KILN_LOG_CONSOLE_ENABLED", config.console_enabled);
  override_flag("KILN_LOG_FILE_ENABLED", config.file_enabled);

  if (auto dir = env_value("KILN_LOG_FILE_DIR")) {
    config.file_config.directory = *dir;
  }
  if (auto format = env_value("KILN_LOG_FORMAT")) {
    const std::string f = lowercase(*format);
    if (f == "json") {
      config.file_config.format_json = true;
    } else if (f == "text") {
      config.file_config.format_json = false;
    }
  }
}

logger_type& get_logger() {
  static logger_type instance;
  return instance;
}

void init_logging(const LoggingConfig& config) {
  auto& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  if (reg.initialized) {
    return;
  }

  auto core = boost::log::core::get();
  boost::log::add_common_attributes();

  if (config.console_enabled) {
    reg.console = create_console_sink(config.console_level, config.console_colors);
    core->add_sink(reg.console);
  }
  if (config.file_enabled) {
    reg.file = create_file_sink(config.file_config, config.file_level);
    core->add_sink(reg.file);
  }
  reg.initialized = true;
}

void init_logging_default() {
  init_logging(LoggingConfig{});
}

void shutdown_logging() {
  auto& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  if (!reg.initialized) {
    return;
  }

  auto core = boost::log::core::get();
  if (reg.console) {
    core->remove_sink(reg.console);
    reg.console->stop();
    reg.console->flush();
    reg.console.reset();
  }
  if (reg.file) {
    core->remove_sink(reg.file);
    reg.file->stop();
    reg.file->flush();
    reg.file.reset();
  }
  for (auto& sink : reg.extra) {
    core->remove_sink(sink);
  }
  reg.extra.clear();
  reg.initialized = false;
}

void add_sink(boost::shared_ptr<boost::log::sinks::sink> sink) {
  auto& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  boost::log::core::get()->add_sink(sink);
  reg.extra.push_back(sink);
}

void remove_sink(boost::shared_ptr<boost::log::sinks::sink> sink) {
  auto& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  boost::log::core::get()->remove_sink(sink);
  reg.extra.erase(std::remove(reg.extra.begin(), reg.extra.end(), sink), reg.extra.end());
}

void flush_logging() {
  auto& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  if (reg.console) reg.console->flush();
  if (reg.file) reg.file->flush();
  for (auto& sink : reg.extra) {
    sink->flush();
  }
}

void reconfigure_logging(const LoggingConfig& config) {
  LoggingConfig effective = config;
  apply_env_overrides(effective);
  shutdown_logging();
  init_logging(effective);
}

bool is_logging_initialized() {
  auto& reg = registry();
  std::lock_guard<std::mutex> lock(reg.mutex);
  return reg.initialized;
}

}  // namespace logging
}  // namespace kiln
