// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "media_pipeline.hpp"

#include <utility>

#include "media_errors.hpp"
#include "object_key.hpp"
#include "photo_transcoder.hpp"

#define KILN_LOG_COMPONENT "pipeline"
#include <kiln_log_macros.hpp>

namespace kiln {
namespace media {

namespace {

std::string short_request_id() {
  return unique_id().substr(0, 8);
}

// One key segment that can be echoed into a quoted header value
bool is_path_component(const std::string& s) {
  if (s.empty() || s == "." || s == "..") {
    return false;
  }
  for (char c : s) {
    if (c == '/' || c == '\\' || c == '"' || static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
      return false;
    }
  }
  return true;
}

}  // namespace

MediaPipeline::MediaPipeline(
  PipelineConfig config, TempStaging staging, std::shared_ptr<ITranscoder> video_transcoder,
  std::shared_ptr<ITranscoder> photo_transcoder, std::shared_ptr<storage::ResilientStore> store
)
    : config_(std::move(config))
    , staging_(std::move(staging))
    , video_transcoder_(std::move(video_transcoder))
    , photo_transcoder_(std::move(photo_transcoder))
    , store_(std::move(store))
    , uploader_(store_, config_.bucket) {}

void MediaPipeline::set_observer(PipelineObserver observer) {
  std::lock_guard<std::mutex> lock(observer_mutex_);
  observer_ = std::move(observer);
}

void MediaPipeline::notify(const std::string& filename, PipelineState from, PipelineState to) const {
  KILN_LOG_DEBUG(
    "Pipeline transition" << logging::kv("from", state_to_string(from))
                          << logging::kv("to", state_to_string(to))
  );
  PipelineObserver observer;
  {
    std::lock_guard<std::mutex> lock(observer_mutex_);
    observer = observer_;
  }
  if (observer) {
    observer(filename, from, to);
  }
}

void MediaPipeline::validate(const UploadRequest& request) const {
  if (request.content.empty()) {
    throw InvalidInput("File is empty.");
  }
  if (request.filename.empty()) {
    throw InvalidInput("File name is empty.");
  }
  if (!is_path_component(request.filename) ||
      !is_path_component(strip_extension(request.filename))) {
    throw InvalidInput("File name is not usable as an object key: " + request.filename);
  }
}

std::string MediaPipeline::upload_video(const UploadRequest& request) {
  validate(request);
  KILN_LOG_SCOPED_CONTEXT(short_request_id(), "video");
  KILN_LOG_INFO(
    "Video upload received" << logging::kv("file", request.filename)
                            << logging::kv("bytes", request.content.size())
  );

  PipelineState state = PipelineState::STAGED;
  try {
    StagedFile staged = staging_.stage(request);

    TranscodeOutput output = video_transcoder_->transcode(staged);
    notify(request.filename, state, PipelineState::TRANSCODED);
    state = PipelineState::TRANSCODED;

    store_->ensure_bucket(config_.bucket);
    notify(request.filename, state, PipelineState::BUCKET_ENSURED);
    state = PipelineState::BUCKET_ENSURED;

    notify(request.filename, state, PipelineState::CHUNKS_UPLOADING);
    state = PipelineState::CHUNKS_UPLOADING;
    const std::string filename = request.filename;
    uploader_.upload(
      output,
      [&filename](const std::string& chunk) { return object_key(filename, chunk); },
      video_chunk_content_type, {kPlaylistName}
    );

    output.release();
    staged.release();
  } catch (const std::exception& e) {
    KILN_LOG_ERROR(
      "Video upload failed" << logging::kv("file", request.filename)
                            << logging::kv("stage", state_to_string(state))
                            << logging::kv("error", e.what())
    );
    notify(request.filename, state, PipelineState::FAILED);
    throw;
  }

  notify(request.filename, state, PipelineState::COMPLETE);
  const std::string url = stream_url(config_.public_base_url, config_.bucket, request.filename);
  KILN_LOG_INFO("Video upload complete" << logging::kv("url", url));
  return url;
}

PhotoUploadResult MediaPipeline::upload_photo(const UploadRequest& request) {
  validate(request);
  KILN_LOG_SCOPED_CONTEXT(short_request_id(), "photo");
  KILN_LOG_INFO(
    "Photo upload received" << logging::kv("file", request.filename)
                            << logging::kv("bytes", request.content.size())
  );

  PipelineState state = PipelineState::STAGED;
  PhotoUploadResult result;
  try {
    StagedFile staged = staging_.stage(request);

    TranscodeOutput output = photo_transcoder_->transcode(staged);
    notify(request.filename, state, PipelineState::TRANSCODED);
    state = PipelineState::TRANSCODED;

    store_->ensure_bucket(config_.bucket);
    notify(request.filename, state, PipelineState::BUCKET_ENSURED);
    state = PipelineState::BUCKET_ENSURED;

    notify(request.filename, state, PipelineState::CHUNKS_UPLOADING);
    state = PipelineState::CHUNKS_UPLOADING;
    const std::string filename = request.filename;
    uploader_.upload(
      output,
      [&filename](const std::string& chunk) { return object_key(filename, chunk); },
      [](const std::string& chunk) { return content_type(chunk); }, {kPhotoDerivativeName}
    );

    result.key = object_key(request.filename, kPhotoDerivativeName);
    result.url = store_->presigned_url(
      config_.bucket, result.key, storage::HttpMethod::GET, config_.photo_url_expiry_minutes
    );

    output.release();
    staged.release();
  } catch (const std::exception& e) {
    KILN_LOG_ERROR(
      "Photo upload failed" << logging::kv("file", request.filename)
                            << logging::kv("stage", state_to_string(state))
                            << logging::kv("error", e.what())
    );
    notify(request.filename, state, PipelineState::FAILED);
    throw;
  }

  notify(request.filename, state, PipelineState::COMPLETE);
  KILN_LOG_INFO("Photo upload complete" << logging::kv("key", result.key));
  return result;
}

std::string MediaPipeline::presigned_upload_url(const std::string& object_name, int expiry_minutes) {
  if (object_name.empty()) {
    throw InvalidInput("Object name is empty.");
  }
  if (expiry_minutes <= 0) {
    throw InvalidInput("Expiry must be positive.");
  }
  return store_->presigned_url(config_.bucket, object_name, storage::HttpMethod::PUT, expiry_minutes);
}

ChunkStream MediaPipeline::open_chunk(const std::string& video_prefix, const std::string& chunk_name) {
  if (!is_path_component(video_prefix) || !is_path_component(chunk_name)) {
    throw InvalidInput("Invalid chunk path: " + video_prefix + "/" + chunk_name);
  }
  ChunkStream stream;
  stream.bytes = store_->get_object(config_.bucket, video_prefix + "/" + chunk_name);
  stream.content_type = content_type(chunk_name);
  return stream;
}

}  // namespace media
}  // namespace kiln
