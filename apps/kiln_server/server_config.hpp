// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef KILN_SERVER_CONFIG_HPP
#define KILN_SERVER_CONFIG_HPP

#include <cstdint>
#include <string>

#include <s3_object_store.hpp>

namespace kiln {
namespace server {

struct HttpServerConfig {
  std::string host = "0.0.0.0";
  uint16_t port = 8080;
  int workers = 4;
  size_t queue_capacity = 64;
  uint64_t max_body_mb = 512;
  int read_timeout_sec = 30;  // per read or write of one connection
};

struct StorageConfig {
  storage::S3Config s3;
  std::string bucket;
  std::string public_base_url = "http://localhost:9000";
};

struct RetryConfig {
  int max_attempts = 3;
  int bucket_initial_delay_ms = 500;
  int operation_initial_delay_ms = 1000;
  std::string retrieval_fallback = "raise";  // "raise" or "empty"
};

struct PipelineSettings {
  std::string staging_dir = "/tmp/kiln/staging";
  std::string output_dir = "/tmp/kiln/output";
  std::string ffmpeg_path = "ffmpeg";
  int hls_time_sec = 10;
  int transcode_timeout_sec = 0;
  int photo_max_width = 800;
  int photo_max_height = 600;
  int photo_quality = 85;
  uint64_t photo_max_pixels = 50000000;  // decoded width * height
  int photo_url_expiry_minutes = 60;
  int upload_url_expiry_minutes = 60;
};

/**
 * Logging section as written in YAML. Levels stay strings here and are
 * parsed by convert_logging_config().
 */
struct LoggingConfig {
  bool console_enabled = true;
  bool console_colors = true;
  std::string console_level = "info";

  bool file_enabled = false;
  std::string file_level = "debug";
  std::string file_directory = "/var/log/kiln";
  std::string file_pattern = "kiln_%Y%m%d_%H%M%S.log";
  std::string file_format = "json";
  size_t rotation_size_mb = 100;
  size_t max_files = 10;
  bool rotate_at_midnight = true;
};

struct ServerConfig {
  HttpServerConfig http;
  StorageConfig storage;
  RetryConfig retry;
  PipelineSettings pipeline;
  LoggingConfig logging;
};

}  // namespace server
}  // namespace kiln

#endif  // KILN_SERVER_CONFIG_HPP
