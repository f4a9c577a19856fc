// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef KILN_SERVER_CONFIG_PARSER_HPP
#define KILN_SERVER_CONFIG_PARSER_HPP

#include <yaml-cpp/yaml.h>

#include <string>

#include <kiln_log_init.hpp>
#include <resilient_store.hpp>

#include "server_config.hpp"

namespace kiln {
namespace server {

/**
 * Convert the YAML logging section to kiln::logging::LoggingConfig.
 * Unknown level names keep the library default.
 */
void convert_logging_config(const LoggingConfig& yaml_config, logging::LoggingConfig& log_config);

/**
 * Build the store retry policy from the `retry:` section.
 */
storage::ResilienceConfig to_resilience_config(const RetryConfig& retry);

class ConfigParser {
public:
  ConfigParser() = default;

  /**
   * Load configuration from YAML file
   */
  bool load_from_file(const std::string& path, ServerConfig& config);

  /**
   * Load configuration from YAML string
   */
  bool load_from_string(const std::string& yaml_content, ServerConfig& config);

  /**
   * Validate configuration
   */
  static bool validate(const ServerConfig& config, std::string& error_msg);

  /**
   * Get last error message
   */
  std::string get_last_error() const {
    return last_error_;
  }

private:
  bool parse_server(const YAML::Node& node, HttpServerConfig& http);
  bool parse_storage(const YAML::Node& node, StorageConfig& storage);
  bool parse_retry(const YAML::Node& node, RetryConfig& retry);
  bool parse_pipeline(const YAML::Node& node, PipelineSettings& pipeline);
  bool parse_logging(const YAML::Node& node, LoggingConfig& logging);

  mutable std::string last_error_;
};

}  // namespace server
}  // namespace kiln

#endif  // KILN_SERVER_CONFIG_PARSER_HPP
