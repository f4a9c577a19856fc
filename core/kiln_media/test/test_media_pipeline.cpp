// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_media_pipeline.cpp
 * @brief End-to-end pipeline behavior with mocked transcoder and object store
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include <resilient_store.hpp>
#include <storage_mocks.hpp>

#include "media_errors.hpp"
#include "media_mocks.hpp"
#include "media_pipeline.hpp"
#include "test_helpers.hpp"

using namespace kiln::media;
using namespace kiln::media::test;
using kiln::storage::HttpMethod;
using kiln::storage::ResilienceConfig;
using kiln::storage::ResilientStore;
using kiln::storage::ServiceUnavailable;
using kiln::storage::StoreError;
using kiln::storage::test::MockObjectStore;
using kiln::storage::test::RecordingSleeper;
using kiln::storage::test::transient_error;
using ::testing::_;
using ::testing::AnyNumber;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

namespace {

struct Transition {
  PipelineState from;
  PipelineState to;
};

}  // namespace

class MediaPipelineTest : public ::testing::Test {
protected:
  void SetUp() override {
    store_mock_ = std::make_shared<NiceMock<MockObjectStore>>();
    video_ = std::make_shared<MockTranscoder>();
    photo_ = std::make_shared<MockTranscoder>();

    ON_CALL(*store_mock_, bucket_exists(_)).WillByDefault(Return(true));
    ON_CALL(*store_mock_, put_object(_, _, _, _, _))
      .WillByDefault(Invoke([this](const std::string&, const std::string& key, std::istream& in,
                                   uint64_t, const std::string& type) {
        std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        stored_[key] = body;
        types_[key] = type;
      }));

    PipelineConfig config;
    config.bucket = "media";
    config.public_base_url = "http://localhost:9000";

    auto store = std::make_shared<ResilientStore>(
      store_mock_, ResilienceConfig{}, std::ref(sleeper_)
    );
    pipeline_ = std::make_unique<MediaPipeline>(
      config, TempStaging(dir_.sub("staging")), video_, photo_, store
    );
    pipeline_->set_observer([this](const std::string&, PipelineState from, PipelineState to) {
      transitions_.push_back({from, to});
    });
  }

  UploadRequest request(const std::string& name, const std::string& content = "payload") {
    UploadRequest r;
    r.filename = name;
    r.content = content;
    r.declared_size = content.size();
    return r;
  }

  // Transcoder stand-in producing a playlist and one segment
  std::function<TranscodeOutput(const StagedFile&)> hlsOutput() {
    return [this](const StagedFile& staged) {
      EXPECT_TRUE(fs::exists(staged.path()));
      TranscodeOutput out = create_output_directory(local_file_system(), dir_.sub("out"), "hls");
      write_file(out.chunk_path("playlist.m3u8"), "#EXTM3U\n#EXTINF:10,\nseg0000.ts\n");
      write_file(out.chunk_path("seg0000.ts"), "TSDATA");
      return out;
    };
  }

  std::function<TranscodeOutput(const StagedFile&)> photoOutput() {
    return [this](const StagedFile& staged) {
      TranscodeOutput out = create_output_directory(local_file_system(), dir_.sub("out"), "photo");
      write_file(out.chunk_path("original_" + staged.original_filename()), "ORIG");
      write_file(out.chunk_path("image.jpg"), "JPEG");
      return out;
    };
  }

  size_t leftovers() const {
    return count_entries(dir_.sub("staging")) + count_entries(dir_.sub("out"));
  }

  TempDir dir_;
  std::shared_ptr<NiceMock<MockObjectStore>> store_mock_;
  std::shared_ptr<MockTranscoder> video_;
  std::shared_ptr<MockTranscoder> photo_;
  RecordingSleeper sleeper_;
  std::unique_ptr<MediaPipeline> pipeline_;
  std::map<std::string, std::string> stored_;
  std::map<std::string, std::string> types_;
  std::vector<Transition> transitions_;
};

// ============================================================================
// Video
// ============================================================================

TEST_F(MediaPipelineTest, VideoEndToEnd) {
  EXPECT_CALL(*video_, transcode(_)).WillOnce(Invoke(hlsOutput()));

  const std::string url = pipeline_->upload_video(request("movie.mp4"));

  EXPECT_EQ(url, "http://localhost:9000/media/movie/playlist.m3u8");
  ASSERT_EQ(stored_.size(), 2u);
  EXPECT_EQ(stored_["movie/seg0000.ts"], "TSDATA");
  EXPECT_EQ(types_["movie/playlist.m3u8"], "application/vnd.apple.mpegurl");
  EXPECT_EQ(types_["movie/seg0000.ts"], "video/MP2T");
  EXPECT_EQ(leftovers(), 0u);

  ASSERT_EQ(transitions_.size(), 4u);
  EXPECT_EQ(transitions_[0].to, PipelineState::TRANSCODED);
  EXPECT_EQ(transitions_[1].to, PipelineState::BUCKET_ENSURED);
  EXPECT_EQ(transitions_[2].to, PipelineState::CHUNKS_UPLOADING);
  EXPECT_EQ(transitions_[3].to, PipelineState::COMPLETE);
}

TEST_F(MediaPipelineTest, MissingBucketIsCreatedBeforeUpload) {
  EXPECT_CALL(*video_, transcode(_)).WillOnce(Invoke(hlsOutput()));
  {
    ::testing::InSequence seq;
    EXPECT_CALL(*store_mock_, bucket_exists("media")).WillOnce(Return(false));
    EXPECT_CALL(*store_mock_, make_bucket("media"));
    EXPECT_CALL(*store_mock_, put_object("media", _, _, _, _)).Times(2);
  }
  pipeline_->upload_video(request("movie.mp4"));
}

TEST_F(MediaPipelineTest, EmptyFileRejectedWithoutSideEffects) {
  EXPECT_CALL(*video_, transcode(_)).Times(0);
  EXPECT_CALL(*photo_, transcode(_)).Times(0);
  EXPECT_CALL(*store_mock_, bucket_exists(_)).Times(0);
  EXPECT_CALL(*store_mock_, put_object(_, _, _, _, _)).Times(0);

  EXPECT_THROW(pipeline_->upload_video(request("movie.mp4", "")), InvalidInput);
  EXPECT_THROW(pipeline_->upload_photo(request("cat.jpg", "")), InvalidInput);
  EXPECT_THROW(pipeline_->upload_video(request("", "data")), InvalidInput);
  EXPECT_FALSE(fs::exists(dir_.sub("staging")));
  EXPECT_TRUE(transitions_.empty());
}

TEST_F(MediaPipelineTest, TranscodeFailureCleansUpAndSkipsStore) {
  EXPECT_CALL(*video_, transcode(_))
    .WillOnce(Invoke([](const StagedFile&) -> TranscodeOutput { throw TranscodeFailure(1, "bad"); }));
  EXPECT_CALL(*store_mock_, bucket_exists(_)).Times(0);

  EXPECT_THROW(pipeline_->upload_video(request("movie.mp4")), TranscodeFailure);
  EXPECT_EQ(leftovers(), 0u);
  ASSERT_EQ(transitions_.size(), 1u);
  EXPECT_EQ(transitions_[0].from, PipelineState::STAGED);
  EXPECT_EQ(transitions_[0].to, PipelineState::FAILED);
}

TEST_F(MediaPipelineTest, EmptyTranscodeOutputIsNotReportedAsComplete) {
  EXPECT_CALL(*video_, transcode(_)).WillOnce(Invoke([this](const StagedFile&) {
    return create_output_directory(local_file_system(), dir_.sub("out"), "hls");
  }));
  EXPECT_CALL(*store_mock_, put_object(_, _, _, _, _)).Times(0);

  EXPECT_THROW(pipeline_->upload_video(request("movie.mp4")), IOFailure);
  EXPECT_EQ(leftovers(), 0u);
  ASSERT_FALSE(transitions_.empty());
  EXPECT_EQ(transitions_.back().to, PipelineState::FAILED);
}

TEST_F(MediaPipelineTest, SegmentsWithoutPlaylistAreIOFailure) {
  EXPECT_CALL(*video_, transcode(_)).WillOnce(Invoke([this](const StagedFile&) {
    TranscodeOutput out = create_output_directory(local_file_system(), dir_.sub("out"), "hls");
    write_file(out.chunk_path("seg0000.ts"), "TSDATA");
    return out;
  }));
  EXPECT_CALL(*store_mock_, put_object(_, _, _, _, _)).Times(0);

  EXPECT_THROW(pipeline_->upload_video(request("movie.mp4")), IOFailure);
  EXPECT_EQ(leftovers(), 0u);
  EXPECT_EQ(transitions_.back().from, PipelineState::CHUNKS_UPLOADING);
  EXPECT_EQ(transitions_.back().to, PipelineState::FAILED);
}

TEST_F(MediaPipelineTest, PhotoWithoutDerivativeIsIOFailure) {
  EXPECT_CALL(*photo_, transcode(_)).WillOnce(Invoke([this](const StagedFile& staged) {
    TranscodeOutput out = create_output_directory(local_file_system(), dir_.sub("out"), "photo");
    write_file(out.chunk_path("original_" + staged.original_filename()), "ORIG");
    return out;
  }));
  EXPECT_CALL(*store_mock_, put_object(_, _, _, _, _)).Times(0);
  EXPECT_CALL(*store_mock_, presigned_url(_, _, _, _)).Times(0);

  EXPECT_THROW(pipeline_->upload_photo(request("cat.jpg")), IOFailure);
  EXPECT_EQ(leftovers(), 0u);
}

TEST_F(MediaPipelineTest, FilenameWithPathSeparatorRejected) {
  EXPECT_CALL(*video_, transcode(_)).Times(0);
  EXPECT_CALL(*photo_, transcode(_)).Times(0);
  EXPECT_CALL(*store_mock_, bucket_exists(_)).Times(0);

  EXPECT_THROW(pipeline_->upload_video(request("a/b.mp4")), InvalidInput);
  EXPECT_THROW(pipeline_->upload_video(request("..\\b.mp4")), InvalidInput);
  EXPECT_THROW(pipeline_->upload_photo(request("../cat.jpg")), InvalidInput);
  EXPECT_THROW(pipeline_->upload_video(request("..")), InvalidInput);
  EXPECT_THROW(pipeline_->upload_video(request(".mp4")), InvalidInput);
  EXPECT_THROW(pipeline_->upload_video(request("say \"hi\".mp4")), InvalidInput);
  EXPECT_THROW(pipeline_->upload_video(request("line\r\nbreak.mp4")), InvalidInput);
  EXPECT_FALSE(fs::exists(dir_.sub("staging")));
  EXPECT_TRUE(transitions_.empty());
}

TEST_F(MediaPipelineTest, TransientPutFailuresBelowBudgetSucceed) {
  EXPECT_CALL(*video_, transcode(_)).WillOnce(Invoke(hlsOutput()));
  int failures_left = 2;
  EXPECT_CALL(*store_mock_, put_object(_, _, _, _, _))
    .WillRepeatedly(Invoke([&](const std::string&, const std::string& key, std::istream&, uint64_t,
                               const std::string&) {
      if (key == "movie/seg0000.ts" && failures_left-- > 0) {
        throw transient_error("SlowDown");
      }
      stored_[key] = "ok";
    }));

  EXPECT_NO_THROW(pipeline_->upload_video(request("movie.mp4")));
  EXPECT_EQ(stored_.size(), 2u);
  ASSERT_EQ(sleeper_.delays.size(), 2u);
  EXPECT_EQ(sleeper_.delays[0].count(), 1000);
  EXPECT_EQ(sleeper_.delays[1].count(), 2000);
}

TEST_F(MediaPipelineTest, PersistentPutFailureIsServiceUnavailable) {
  EXPECT_CALL(*video_, transcode(_)).WillOnce(Invoke(hlsOutput()));
  EXPECT_CALL(*store_mock_, put_object(_, "movie/playlist.m3u8", _, _, _))
    .WillOnce(Invoke([this](const std::string&, const std::string& key, std::istream&, uint64_t,
                            const std::string&) { stored_[key] = "ok"; }));
  EXPECT_CALL(*store_mock_, put_object(_, "movie/seg0000.ts", _, _, _))
    .Times(3)
    .WillRepeatedly(Throw(transient_error()));

  EXPECT_THROW(pipeline_->upload_video(request("movie.mp4")), ServiceUnavailable);
  // No rollback of chunks already stored
  EXPECT_EQ(stored_.count("movie/playlist.m3u8"), 1u);
  EXPECT_EQ(leftovers(), 0u);
  EXPECT_EQ(transitions_.back().to, PipelineState::FAILED);
  EXPECT_EQ(transitions_.back().from, PipelineState::CHUNKS_UPLOADING);
}

TEST_F(MediaPipelineTest, RandomizedRunsLeaveNothingBehind) {
  std::mt19937 rng(1234);
  std::uniform_int_distribution<int> outcome(0, 3);

  EXPECT_CALL(*video_, transcode(_))
    .Times(AnyNumber())
    .WillRepeatedly(Invoke([&](const StagedFile& staged) -> TranscodeOutput {
      if (outcome(rng) == 0) {
        throw TranscodeFailure(1, "random failure");
      }
      return hlsOutput()(staged);
    }));
  EXPECT_CALL(*store_mock_, put_object(_, _, _, _, _))
    .Times(AnyNumber())
    .WillRepeatedly(Invoke([&](const std::string&, const std::string&, std::istream&, uint64_t,
                               const std::string&) {
      if (outcome(rng) == 0) {
        throw StoreError("denied", "AccessDenied", false);
      }
    }));

  for (int i = 0; i < 40; ++i) {
    try {
      pipeline_->upload_video(request("clip" + std::to_string(i) + ".mp4"));
    } catch (const PipelineError&) {
    } catch (const StoreError&) {
    }
    ASSERT_EQ(leftovers(), 0u) << "iteration " << i;
  }
}

// ============================================================================
// Photo
// ============================================================================

TEST_F(MediaPipelineTest, PhotoUploadReturnsPresignedDerivative) {
  EXPECT_CALL(*photo_, transcode(_)).WillOnce(Invoke(photoOutput()));
  EXPECT_CALL(*store_mock_, presigned_url("media", "cat/image.jpg", HttpMethod::GET, 60))
    .WillOnce(Return("http://localhost:9000/media/cat/image.jpg?X-Amz-Signature=abc"));

  PhotoUploadResult result = pipeline_->upload_photo(request("cat.png"));

  EXPECT_EQ(result.key, "cat/image.jpg");
  EXPECT_EQ(result.url, "http://localhost:9000/media/cat/image.jpg?X-Amz-Signature=abc");
  EXPECT_EQ(stored_["cat/image.jpg"], "JPEG");
  EXPECT_EQ(stored_["cat/original_cat.png"], "ORIG");
  EXPECT_EQ(types_["cat/image.jpg"], "image/jpeg");
  EXPECT_EQ(types_["cat/original_cat.png"], "image/png");
  EXPECT_EQ(leftovers(), 0u);
}

// ============================================================================
// Presign / retrieval
// ============================================================================

TEST_F(MediaPipelineTest, PresignedUploadUrl) {
  EXPECT_CALL(*store_mock_, presigned_url("media", "uploads/raw.mp4", HttpMethod::PUT, 60))
    .WillOnce(Return("http://put-url"));
  EXPECT_EQ(pipeline_->presigned_upload_url("uploads/raw.mp4", 60), "http://put-url");
  EXPECT_THROW(pipeline_->presigned_upload_url("", 60), InvalidInput);
}

TEST_F(MediaPipelineTest, OpenChunkReturnsBytesAndType) {
  EXPECT_CALL(*store_mock_, get_object("media", "movie/seg0000.ts")).WillOnce(Return("TS"));
  ChunkStream chunk = pipeline_->open_chunk("movie", "seg0000.ts");
  EXPECT_EQ(chunk.bytes, "TS");
  EXPECT_EQ(chunk.content_type, "video/MP2T");
}

TEST_F(MediaPipelineTest, OpenChunkMissingIsNotFound) {
  EXPECT_CALL(*store_mock_, get_object("media", "movie/nope.ts"))
    .WillOnce(Throw(StoreError("missing", "NoSuchKey", false)));
  try {
    pipeline_->open_chunk("movie", "nope.ts");
    FAIL() << "expected StoreError";
  } catch (const StoreError& e) {
    EXPECT_TRUE(e.not_found());
  }
}

TEST_F(MediaPipelineTest, OpenChunkRejectsTraversal) {
  EXPECT_CALL(*store_mock_, get_object(_, _)).Times(0);
  EXPECT_THROW(pipeline_->open_chunk("..", "seg0000.ts"), InvalidInput);
  EXPECT_THROW(pipeline_->open_chunk("movie", "a/b.ts"), InvalidInput);
  EXPECT_THROW(pipeline_->open_chunk("", "seg0000.ts"), InvalidInput);
}

TEST(PipelineStateTest, Names) {
  EXPECT_EQ(state_to_string(PipelineState::STAGED), "staged");
  EXPECT_EQ(state_to_string(PipelineState::CHUNKS_UPLOADING), "chunks_uploading");
  EXPECT_EQ(state_to_string(PipelineState::FAILED), "failed");
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
