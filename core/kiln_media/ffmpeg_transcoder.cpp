// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "ffmpeg_transcoder.hpp"

#include <filesystem>
#include <utility>

#include "media_errors.hpp"
#include "object_key.hpp"

#define KILN_LOG_COMPONENT "ffmpeg"
#include <kiln_log_macros.hpp>

namespace kiln {
namespace media {

std::vector<std::string> build_hls_command(
  const std::string& ffmpeg_path, const std::string& input_path, const std::string& playlist_path,
  int hls_time_sec
) {
  return {
    ffmpeg_path,
    "-i",
    input_path,
    "-codec",
    "copy",
    "-start_number",
    "0",
    "-hls_time",
    std::to_string(hls_time_sec),
    "-hls_list_size",
    "0",
    "-f",
    "hls",
    playlist_path,
  };
}

FfmpegTranscoder::FfmpegTranscoder(
  FfmpegOptions options, std::shared_ptr<IFileSystem> fs, ProcessRunFn runner
)
    : options_(std::move(options))
    , fs_(std::move(fs))
    , runner_(std::move(runner)) {}

TranscodeOutput FfmpegTranscoder::transcode(const StagedFile& input) {
  TranscodeOutput output = create_output_directory(fs_, options_.output_dir, "hls");

  std::error_code ec;
  std::string input_path = std::filesystem::absolute(input.path(), ec).string();
  if (ec) {
    input_path = input.path();
  }
  const std::string playlist = output.chunk_path(kPlaylistName);
  const auto cmd = build_hls_command(options_.ffmpeg_path, input_path, playlist, options_.hls_time_sec);

  KILN_LOG_INFO(
    "Starting HLS transcode" << logging::kv("input", input_path)
                             << logging::kv("output", output.directory())
  );

  ProcessResult result;
  try {
    result = runner_(
      cmd,
      [](const std::string& line) { KILN_LOG_DEBUG(line); },
      std::chrono::duration_cast<std::chrono::milliseconds>(options_.timeout)
    );
  } catch (const ProcessSpawnError& e) {
    throw IOFailure(std::string("Cannot start ffmpeg: ") + e.what());
  }

  if (result.timed_out) {
    throw TranscodeFailure(
      -1, "timed out after " + std::to_string(options_.timeout.count()) + "s"
    );
  }
  if (result.exit_code != 0) {
    KILN_LOG_ERROR(
      "ffmpeg failed" << logging::kv("exit_code", result.exit_code)
                      << logging::kv("last_line", result.last_line)
    );
    throw TranscodeFailure(result.exit_code, result.last_line);
  }

  KILN_LOG_INFO(
    "HLS transcode finished" << logging::kv("chunks", output.chunk_names().size())
  );
  return output;
}

}  // namespace media
}  // namespace kiln
