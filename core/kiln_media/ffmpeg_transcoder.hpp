// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef KILN_FFMPEG_TRANSCODER_HPP
#define KILN_FFMPEG_TRANSCODER_HPP

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "process_runner.hpp"
#include "transcoder.hpp"

namespace kiln {
namespace media {

struct FfmpegOptions {
  std::string ffmpeg_path = "ffmpeg";
  std::string output_dir = "/tmp/kiln/output";
  int hls_time_sec = 10;
  std::chrono::seconds timeout{0};  // 0 = wait forever
};

/**
 * Command line for a stream-copy HLS remux:
 * ffmpeg -i <input> -codec copy -start_number 0 -hls_time <n> -hls_list_size 0 -f hls <playlist>
 */
std::vector<std::string> build_hls_command(
  const std::string& ffmpeg_path, const std::string& input_path, const std::string& playlist_path,
  int hls_time_sec
);

/**
 * Remuxes a staged video into HLS segments plus playlist.m3u8 under
 * `<output_dir>/hls-<uuid>`.
 */
class FfmpegTranscoder : public ITranscoder {
public:
  explicit FfmpegTranscoder(
    FfmpegOptions options, std::shared_ptr<IFileSystem> fs = local_file_system(),
    ProcessRunFn runner = run_process
  );

  TranscodeOutput transcode(const StagedFile& input) override;

  const FfmpegOptions& options() const {
    return options_;
  }

private:
  FfmpegOptions options_;
  std::shared_ptr<IFileSystem> fs_;
  ProcessRunFn runner_;
};

}  // namespace media
}  // namespace kiln

#endif  // KILN_FFMPEG_TRANSCODER_HPP
