// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_object_key.cpp
 * @brief Object key, stream URL and content type derivation
 */

#include <gtest/gtest.h>

#include <set>
#include <string>

#include "media_errors.hpp"
#include "object_key.hpp"

using namespace kiln::media;

// ============================================================================
// strip_extension
// ============================================================================

TEST(StripExtensionTest, RemovesOnlyLastExtension) {
  EXPECT_EQ(strip_extension("movie.mp4"), "movie");
  EXPECT_EQ(strip_extension("a.b.c"), "a.b");
  EXPECT_EQ(strip_extension("noext"), "noext");
}

TEST(StripExtensionTest, EdgeCases) {
  EXPECT_EQ(strip_extension(""), "");
  EXPECT_EQ(strip_extension(".mp4"), "");
  EXPECT_EQ(strip_extension("trailing."), "trailing.");
  EXPECT_EQ(strip_extension("holiday 2024.MOV"), "holiday 2024");
}

// ============================================================================
// object_key / stream_url
// ============================================================================

TEST(ObjectKeyTest, PrefixIsStrippedFilename) {
  EXPECT_EQ(object_key("movie.mp4", "playlist.m3u8"), "movie/playlist.m3u8");
  EXPECT_EQ(object_key("movie.mp4", "playlist0.ts"), "movie/playlist0.ts");
  EXPECT_EQ(object_key("a.b.c", "seg0000.ts"), "a.b/seg0000.ts");
}

TEST(ObjectKeyTest, Deterministic) {
  for (int i = 0; i < 10; ++i) {
    EXPECT_EQ(object_key("clip.mkv", "seg0001.ts"), object_key("clip.mkv", "seg0001.ts"));
  }
}

TEST(ObjectKeyTest, EmptyFilenameIsInvalid) {
  EXPECT_THROW(object_key("", "seg0000.ts"), InvalidInput);
}

TEST(StreamUrlTest, Format) {
  EXPECT_EQ(
    stream_url("http://localhost:9000", "media", "movie.mp4"),
    "http://localhost:9000/media/movie/playlist.m3u8"
  );
  EXPECT_EQ(
    stream_url("https://cdn.example.com", "videos", "a.b.c"),
    "https://cdn.example.com/videos/a.b/playlist.m3u8"
  );
}

TEST(StreamUrlTest, MatchesObjectKeyOfPlaylist) {
  const std::string base = "http://minio:9000";
  const std::string bucket = "media";
  for (const std::string f : {"x.mp4", "y.mov", "noext"}) {
    EXPECT_EQ(stream_url(base, bucket, f), base + "/" + bucket + "/" + object_key(f, kPlaylistName));
  }
}

// ============================================================================
// content types
// ============================================================================

TEST(ContentTypeTest, Table) {
  EXPECT_EQ(content_type("playlist.m3u8"), "application/vnd.apple.mpegurl");
  EXPECT_EQ(content_type("seg0000.ts"), "video/MP2T");
  EXPECT_EQ(content_type("image.jpg"), "image/jpeg");
  EXPECT_EQ(content_type("image.jpeg"), "image/jpeg");
  EXPECT_EQ(content_type("icon.png"), "image/png");
  EXPECT_EQ(content_type("anim.gif"), "image/gif");
  EXPECT_EQ(content_type("readme.txt"), "application/octet-stream");
  EXPECT_EQ(content_type("noext"), "application/octet-stream");
}

TEST(ContentTypeTest, CaseInsensitive) {
  EXPECT_EQ(content_type("PHOTO.JPG"), "image/jpeg");
  EXPECT_EQ(content_type("Playlist.M3U8"), "application/vnd.apple.mpegurl");
  EXPECT_EQ(content_type("SEG.Ts"), "video/MP2T");
}

TEST(ContentTypeTest, VideoChunks) {
  EXPECT_EQ(video_chunk_content_type("playlist.m3u8"), "application/vnd.apple.mpegurl");
  EXPECT_EQ(video_chunk_content_type("seg0000.ts"), "video/MP2T");
  // Anything that is not the playlist is treated as a segment
  EXPECT_EQ(video_chunk_content_type("seg0000.m4s"), "video/MP2T");
}

// ============================================================================
// randomized photo keys
// ============================================================================

TEST(RandomizedPhotoKeyTest, UniqueWithPrefixAndName) {
  std::set<std::string> keys;
  for (int i = 0; i < 100; ++i) {
    const std::string key = randomized_photo_key("cat.png");
    EXPECT_EQ(key.rfind("photos/", 0), 0u);
    EXPECT_EQ(key.substr(key.size() - 8), "_cat.png");
    keys.insert(key);
  }
  EXPECT_EQ(keys.size(), 100u);
}

TEST(UniqueIdTest, LooksLikeUuid) {
  const std::string id = unique_id();
  ASSERT_EQ(id.size(), 36u);
  EXPECT_EQ(id[8], '-');
  EXPECT_EQ(id[13], '-');
  EXPECT_NE(id, unique_id());
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
