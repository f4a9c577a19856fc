// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <thread>

#include <ffmpeg_transcoder.hpp>
#include <kiln_log_init.hpp>
#include <media_pipeline.hpp>
#include <photo_transcoder.hpp>
#include <resilient_store.hpp>
#include <s3_object_store.hpp>

#include "config_parser.hpp"
#include "http_server.hpp"
#include "kiln_version.hpp"

#define KILN_LOG_COMPONENT "main"
#include <kiln_log_macros.hpp>

namespace kiln {
namespace server {

namespace {

std::atomic<bool> g_should_exit(false);

void signal_handler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_should_exit.store(true);
  }
}

void print_usage(const char* program_name) {
  std::cout << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Media ingestion server: HLS remux for video, resize for photos,\n"
            << "chunked upload to an S3-compatible object store.\n"
            << "\n"
            << "Options:\n"
            << "  --config PATH     Path to YAML configuration file\n"
            << "  --port PORT       Override server.port\n"
            << "  --bucket NAME     Override storage.bucket\n"
            << "  --version         Print version and exit\n"
            << "  -h, --help        Show this help\n"
            << "\n"
            << "Environment:\n"
            << "  AWS_ACCESS_KEY_ID / AWS_SECRET_ACCESS_KEY   store credentials\n"
            << "  KILN_LOG_LEVEL, KILN_LOG_FILE_DIR, ...      logging overrides\n"
            << "\n"
            << "Example:\n"
            << "  " << program_name << " --config config/kiln.yaml\n";
}

}  // namespace

int run(int argc, char* argv[]) {
  std::string config_file;
  int cli_port = -1;
  std::string cli_bucket;

  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
      print_usage(argv[0]);
      return 0;
    } else if (strcmp(argv[i], "--version") == 0) {
      std::cout << "kiln " << KILN_VERSION_STRING << std::endl;
      return 0;
    } else if (strcmp(argv[i], "--config") == 0) {
      if (i + 1 < argc) {
        config_file = argv[++i];
      } else {
        std::cerr << "Error: --config requires a file argument" << std::endl;
        return 1;
      }
    } else if (strcmp(argv[i], "--port") == 0) {
      if (i + 1 < argc) {
        cli_port = std::atoi(argv[++i]);
      } else {
        std::cerr << "Error: --port requires a number" << std::endl;
        return 1;
      }
    } else if (strcmp(argv[i], "--bucket") == 0) {
      if (i + 1 < argc) {
        cli_bucket = argv[++i];
      } else {
        std::cerr << "Error: --bucket requires a name" << std::endl;
        return 1;
      }
    } else {
      std::cerr << "Error: Unknown argument: " << argv[i] << std::endl;
      print_usage(argv[0]);
      return 1;
    }
  }

  ServerConfig config;
  if (!config_file.empty()) {
    ConfigParser parser;
    if (!parser.load_from_file(config_file, config)) {
      std::cerr << "Error: " << parser.get_last_error() << std::endl;
      return 1;
    }
  }
  if (cli_port >= 0) {
    if (cli_port > 65535) {
      std::cerr << "Error: --port out of range: " << cli_port << std::endl;
      return 1;
    }
    config.http.port = static_cast<uint16_t>(cli_port);
  }
  if (!cli_bucket.empty()) {
    config.storage.bucket = cli_bucket;
  }

  std::string error_msg;
  if (!ConfigParser::validate(config, error_msg)) {
    std::cerr << "Error: Invalid configuration: " << error_msg << std::endl;
    print_usage(argv[0]);
    return 1;
  }

  logging::LoggingConfig log_config;
  convert_logging_config(config.logging, log_config);
  logging::apply_env_overrides(log_config);
  logging::init_logging(log_config);

  KILN_LOG_INFO(
    "Starting kiln " << KILN_VERSION_STRING << logging::kv("bucket", config.storage.bucket)
                     << logging::kv("endpoint", config.storage.s3.endpoint_url)
  );

  int exit_code = 0;
  try {
    auto s3 = std::make_shared<storage::S3ObjectStore>(config.storage.s3);
    auto store = std::make_shared<storage::ResilientStore>(s3, to_resilience_config(config.retry));

    media::FfmpegOptions ffmpeg_options;
    ffmpeg_options.ffmpeg_path = config.pipeline.ffmpeg_path;
    ffmpeg_options.output_dir = config.pipeline.output_dir;
    ffmpeg_options.hls_time_sec = config.pipeline.hls_time_sec;
    ffmpeg_options.timeout = std::chrono::seconds(config.pipeline.transcode_timeout_sec);

    media::PhotoOptions photo_options;
    photo_options.output_dir = config.pipeline.output_dir;
    photo_options.max_width = config.pipeline.photo_max_width;
    photo_options.max_height = config.pipeline.photo_max_height;
    photo_options.jpeg_quality = config.pipeline.photo_quality;
    photo_options.max_pixels = config.pipeline.photo_max_pixels;

    media::PipelineConfig pipeline_config;
    pipeline_config.bucket = config.storage.bucket;
    pipeline_config.public_base_url = config.storage.public_base_url;
    pipeline_config.photo_url_expiry_minutes = config.pipeline.photo_url_expiry_minutes;

    media::MediaPipeline pipeline(
      pipeline_config,
      media::TempStaging(config.pipeline.staging_dir),
      std::make_shared<media::FfmpegTranscoder>(ffmpeg_options),
      std::make_shared<media::PhotoTranscoder>(photo_options),
      store
    );

    const int upload_expiry = config.pipeline.upload_url_expiry_minutes;
    HttpServer::Callbacks callbacks;
    callbacks.upload_video = [&pipeline](const media::UploadRequest& request) {
      return pipeline.upload_video(request);
    };
    callbacks.upload_photo = [&pipeline](const media::UploadRequest& request) {
      return pipeline.upload_photo(request);
    };
    callbacks.presigned_upload_url = [&pipeline, upload_expiry](const std::string& object_name) {
      return pipeline.presigned_upload_url(object_name, upload_expiry);
    };
    callbacks.open_chunk = [&pipeline](const std::string& prefix, const std::string& name) {
      return pipeline.open_chunk(prefix, name);
    };

    HttpServer server(config.http);
    server.register_callbacks(callbacks);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (!server.start()) {
      KILN_LOG_FATAL("Failed to start HTTP server: " << server.get_last_error());
      exit_code = 1;
    } else {
      while (!g_should_exit.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
      }
      KILN_LOG_INFO("Shutdown requested");
      server.stop();
    }
  } catch (const std::exception& e) {
    KILN_LOG_FATAL("Startup failed: " << e.what());
    exit_code = 1;
  }

  logging::shutdown_logging();
  return exit_code;
}

}  // namespace server
}  // namespace kiln

int main(int argc, char* argv[]) {
  return kiln::server::run(argc, argv);
}
