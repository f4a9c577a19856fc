// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "config_parser.hpp"

#include <fstream>

#define KILN_LOG_COMPONENT "config_parser"
#include <kiln_log_macros.hpp>

namespace kiln {
namespace server {

void convert_logging_config(const LoggingConfig& yaml_config, logging::LoggingConfig& log_config) {
  log_config.console_enabled = yaml_config.console_enabled;
  log_config.console_colors = yaml_config.console_colors;
  if (auto level = logging::parse_severity_level(yaml_config.console_level)) {
    log_config.console_level = *level;
  }

  log_config.file_enabled = yaml_config.file_enabled;
  if (auto level = logging::parse_severity_level(yaml_config.file_level)) {
    log_config.file_level = *level;
  }
  log_config.file_config.directory = yaml_config.file_directory;
  log_config.file_config.file_pattern = yaml_config.file_pattern;
  log_config.file_config.format_json = (yaml_config.file_format != "text");
  log_config.file_config.rotation_size_mb = yaml_config.rotation_size_mb;
  log_config.file_config.max_files = static_cast<int>(yaml_config.max_files);
  log_config.file_config.rotate_at_midnight = yaml_config.rotate_at_midnight;
}

storage::ResilienceConfig to_resilience_config(const RetryConfig& retry) {
  storage::ResilienceConfig config;
  config.max_attempts = retry.max_attempts;
  config.bucket_initial_delay = std::chrono::milliseconds(retry.bucket_initial_delay_ms);
  config.operation_initial_delay = std::chrono::milliseconds(retry.operation_initial_delay_ms);
  config.retrieval_fallback = (retry.retrieval_fallback == "empty")
                                ? storage::RetrievalFallback::EMPTY
                                : storage::RetrievalFallback::RAISE;
  return config;
}

// ============================================================================
// ConfigParser Implementation
// ============================================================================

bool ConfigParser::load_from_file(const std::string& path, ServerConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(path);
    return load_from_string(YAML::Dump(yaml), config);
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML file: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::load_from_string(const std::string& yaml_content, ServerConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);

    if (node["server"] && !parse_server(node["server"], config.http)) {
      return false;
    }
    if (node["storage"] && !parse_storage(node["storage"], config.storage)) {
      return false;
    }
    if (node["retry"] && !parse_retry(node["retry"], config.retry)) {
      return false;
    }
    if (node["pipeline"] && !parse_pipeline(node["pipeline"], config.pipeline)) {
      return false;
    }
    if (node["logging"] && !parse_logging(node["logging"], config.logging)) {
      return false;
    }
    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML content: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::parse_server(const YAML::Node& node, HttpServerConfig& http) {
  if (node["host"]) {
    http.host = node["host"].as<std::string>();
  }
  if (node["port"]) {
    http.port = node["port"].as<uint16_t>();
  }
  if (node["workers"]) {
    http.workers = node["workers"].as<int>();
  }
  if (node["queue_capacity"]) {
    http.queue_capacity = node["queue_capacity"].as<size_t>();
  }
  if (node["max_body_mb"]) {
    http.max_body_mb = node["max_body_mb"].as<uint64_t>();
  }
  if (node["read_timeout_sec"]) {
    http.read_timeout_sec = node["read_timeout_sec"].as<int>();
  }
  return true;
}

bool ConfigParser::parse_storage(const YAML::Node& node, StorageConfig& storage) {
  if (node["endpoint_url"]) {
    storage.s3.endpoint_url = node["endpoint_url"].as<std::string>();
  }
  if (node["bucket"]) {
    storage.bucket = node["bucket"].as<std::string>();
  }
  if (node["region"]) {
    storage.s3.region = node["region"].as<std::string>();
  }
  if (node["use_ssl"]) {
    storage.s3.use_ssl = node["use_ssl"].as<bool>();
  }
  if (node["verify_ssl"]) {
    storage.s3.verify_ssl = node["verify_ssl"].as<bool>();
  }
  if (node["access_key"]) {
    storage.s3.access_key = node["access_key"].as<std::string>();
  }
  if (node["secret_key"]) {
    storage.s3.secret_key = node["secret_key"].as<std::string>();
  }
  if (node["public_base_url"]) {
    storage.public_base_url = node["public_base_url"].as<std::string>();
  }
  if (node["connect_timeout_ms"]) {
    storage.s3.connect_timeout_ms = node["connect_timeout_ms"].as<int>();
  }
  if (node["request_timeout_ms"]) {
    storage.s3.request_timeout_ms = node["request_timeout_ms"].as<int>();
  }
  return true;
}

bool ConfigParser::parse_retry(const YAML::Node& node, RetryConfig& retry) {
  if (node["max_attempts"]) {
    retry.max_attempts = node["max_attempts"].as<int>();
  }
  if (node["bucket_initial_delay_ms"]) {
    retry.bucket_initial_delay_ms = node["bucket_initial_delay_ms"].as<int>();
  }
  if (node["operation_initial_delay_ms"]) {
    retry.operation_initial_delay_ms = node["operation_initial_delay_ms"].as<int>();
  }
  if (node["retrieval_fallback"]) {
    retry.retrieval_fallback = node["retrieval_fallback"].as<std::string>();
    if (retry.retrieval_fallback != "raise" && retry.retrieval_fallback != "empty") {
      last_error_ = "retry.retrieval_fallback must be 'raise' or 'empty', got '" +
                    retry.retrieval_fallback + "'";
      return false;
    }
  }
  return true;
}

bool ConfigParser::parse_pipeline(const YAML::Node& node, PipelineSettings& pipeline) {
  if (node["staging_dir"]) {
    pipeline.staging_dir = node["staging_dir"].as<std::string>();
  }
  if (node["output_dir"]) {
    pipeline.output_dir = node["output_dir"].as<std::string>();
  }
  if (node["ffmpeg_path"]) {
    pipeline.ffmpeg_path = node["ffmpeg_path"].as<std::string>();
  }
  if (node["hls_time_sec"]) {
    pipeline.hls_time_sec = node["hls_time_sec"].as<int>();
  }
  if (node["transcode_timeout_sec"]) {
    pipeline.transcode_timeout_sec = node["transcode_timeout_sec"].as<int>();
  }
  if (node["photo"]) {
    const auto& photo = node["photo"];
    if (photo["max_width"]) {
      pipeline.photo_max_width = photo["max_width"].as<int>();
    }
    if (photo["max_height"]) {
      pipeline.photo_max_height = photo["max_height"].as<int>();
    }
    if (photo["quality"]) {
      pipeline.photo_quality = photo["quality"].as<int>();
    }
    if (photo["max_pixels"]) {
      pipeline.photo_max_pixels = photo["max_pixels"].as<uint64_t>();
    }
    if (photo["url_expiry_minutes"]) {
      pipeline.photo_url_expiry_minutes = photo["url_expiry_minutes"].as<int>();
    }
  }
  if (node["upload_url_expiry_minutes"]) {
    pipeline.upload_url_expiry_minutes = node["upload_url_expiry_minutes"].as<int>();
  }
  return true;
}

bool ConfigParser::parse_logging(const YAML::Node& node, LoggingConfig& logging) {
  if (node["console"]) {
    const auto& console = node["console"];
    if (console["enabled"]) {
      logging.console_enabled = console["enabled"].as<bool>();
    }
    if (console["colors"]) {
      logging.console_colors = console["colors"].as<bool>();
    }
    if (console["level"]) {
      logging.console_level = console["level"].as<std::string>();
    }
  }

  if (node["file"]) {
    const auto& file = node["file"];
    if (file["enabled"]) {
      logging.file_enabled = file["enabled"].as<bool>();
    }
    if (file["level"]) {
      logging.file_level = file["level"].as<std::string>();
    }
    if (file["directory"]) {
      logging.file_directory = file["directory"].as<std::string>();
    }
    if (file["pattern"]) {
      logging.file_pattern = file["pattern"].as<std::string>();
    }
    if (file["format"]) {
      logging.file_format = file["format"].as<std::string>();
    }
    if (file["rotation_size_mb"]) {
      logging.rotation_size_mb = file["rotation_size_mb"].as<size_t>();
    }
    if (file["max_files"]) {
      logging.max_files = file["max_files"].as<size_t>();
    }
    if (file["rotate_at_midnight"]) {
      logging.rotate_at_midnight = file["rotate_at_midnight"].as<bool>();
    }
  }
  return true;
}

bool ConfigParser::validate(const ServerConfig& config, std::string& error_msg) {
  if (config.storage.bucket.empty()) {
    error_msg = "storage.bucket is empty";
    return false;
  }
  if (config.http.port == 0) {
    error_msg = "server.port must be > 0";
    return false;
  }
  if (config.http.workers <= 0) {
    error_msg = "server.workers must be > 0";
    return false;
  }
  if (config.http.max_body_mb == 0) {
    error_msg = "server.max_body_mb must be > 0";
    return false;
  }
  if (config.http.read_timeout_sec <= 0) {
    error_msg = "server.read_timeout_sec must be > 0";
    return false;
  }
  if (config.retry.max_attempts <= 0) {
    error_msg = "retry.max_attempts must be > 0";
    return false;
  }
  if (config.pipeline.staging_dir.empty() || config.pipeline.output_dir.empty()) {
    error_msg = "pipeline.staging_dir and pipeline.output_dir must be set";
    return false;
  }
  if (config.pipeline.photo_max_width <= 0 || config.pipeline.photo_max_height <= 0) {
    error_msg = "pipeline.photo max_width/max_height must be > 0";
    return false;
  }
  if (config.pipeline.photo_quality < 1 || config.pipeline.photo_quality > 100) {
    error_msg = "pipeline.photo.quality must be in [1, 100]";
    return false;
  }
  if (config.pipeline.photo_max_pixels == 0) {
    error_msg = "pipeline.photo.max_pixels must be > 0";
    return false;
  }
  if (config.pipeline.transcode_timeout_sec < 0) {
    error_msg = "pipeline.transcode_timeout_sec must be >= 0";
    return false;
  }
  if (config.logging.file_enabled && config.logging.file_directory.empty()) {
    error_msg = "logging.file.directory is empty";
    return false;
  }
  KILN_LOG_DEBUG("Configuration valid" << logging::kv("bucket", config.storage.bucket));
  return true;
}

}  // namespace server
}  // namespace kiln
