// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef KILN_MEDIA_PIPELINE_HPP
#define KILN_MEDIA_PIPELINE_HPP

#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include <resilient_store.hpp>

#include "chunk_uploader.hpp"
#include "temp_staging.hpp"
#include "transcoder.hpp"

namespace kiln {
namespace media {

/**
 * Stages of one upload attempt.
 *
 * STAGED -> TRANSCODED -> BUCKET_ENSURED -> CHUNKS_UPLOADING -> COMPLETE
 * Any stage may move to FAILED. Staged input and transcode output are
 * already released when COMPLETE or FAILED is reported.
 */
enum class PipelineState {
  STAGED,
  TRANSCODED,
  BUCKET_ENSURED,
  CHUNKS_UPLOADING,
  COMPLETE,
  FAILED
};

inline std::string state_to_string(PipelineState state) {
  switch (state) {
    case PipelineState::STAGED:
      return "staged";
    case PipelineState::TRANSCODED:
      return "transcoded";
    case PipelineState::BUCKET_ENSURED:
      return "bucket_ensured";
    case PipelineState::CHUNKS_UPLOADING:
      return "chunks_uploading";
    case PipelineState::COMPLETE:
      return "complete";
    case PipelineState::FAILED:
      return "failed";
    default:
      return "unknown";
  }
}

/**
 * Called on every transition. Parameters: (filename, from_state, to_state)
 */
using PipelineObserver =
  std::function<void(const std::string&, PipelineState, PipelineState)>;

struct PipelineConfig {
  std::string bucket;
  std::string public_base_url;  // prefix of stream URLs, e.g. "http://localhost:9000"
  int photo_url_expiry_minutes = 60;
};

struct PhotoUploadResult {
  std::string key;  // object key of the resized derivative
  std::string url;  // presigned GET URL for it
};

struct ChunkStream {
  std::string bytes;
  std::string content_type;
};

/**
 * Orchestrates staging, transcoding and chunk upload for one media file
 * per call. Holds no per-upload state between calls, so one instance
 * serves all request workers concurrently.
 */
class MediaPipeline {
public:
  MediaPipeline(
    PipelineConfig config, TempStaging staging, std::shared_ptr<ITranscoder> video_transcoder,
    std::shared_ptr<ITranscoder> photo_transcoder, std::shared_ptr<storage::ResilientStore> store
  );

  // Non-copyable
  MediaPipeline(const MediaPipeline&) = delete;
  MediaPipeline& operator=(const MediaPipeline&) = delete;

  /**
   * Remux a video to HLS and upload all segments.
   *
   * @return public URL of the uploaded playlist
   * @throws InvalidInput, IOFailure, TranscodeFailure, storage::StoreError
   */
  std::string upload_video(const UploadRequest& request);

  /**
   * Resize a photo and upload the original plus the derivative.
   *
   * @return key and presigned GET URL of the derivative
   */
  PhotoUploadResult upload_photo(const UploadRequest& request);

  /**
   * Presigned PUT URL letting a client upload `object_name` directly.
   */
  std::string presigned_upload_url(const std::string& object_name, int expiry_minutes);

  /**
   * Fetch one stored HLS chunk, e.g. ("movie", "seg0003.ts").
   *
   * @throws InvalidInput for empty or path-like components,
   *         storage::StoreError (not_found()) when the object is missing
   */
  ChunkStream open_chunk(const std::string& video_prefix, const std::string& chunk_name);

  /**
   * Register a transition observer. Replaces any previous one.
   */
  void set_observer(PipelineObserver observer);

  const PipelineConfig& config() const {
    return config_;
  }

private:
  void validate(const UploadRequest& request) const;
  void notify(const std::string& filename, PipelineState from, PipelineState to) const;

  PipelineConfig config_;
  TempStaging staging_;
  std::shared_ptr<ITranscoder> video_transcoder_;
  std::shared_ptr<ITranscoder> photo_transcoder_;
  std::shared_ptr<storage::ResilientStore> store_;
  ChunkUploader uploader_;

  mutable std::mutex observer_mutex_;
  PipelineObserver observer_;
};

}  // namespace media
}  // namespace kiln

#endif  // KILN_MEDIA_PIPELINE_HPP
