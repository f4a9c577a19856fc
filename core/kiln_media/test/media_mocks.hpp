// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef KILN_MEDIA_MOCKS_HPP
#define KILN_MEDIA_MOCKS_HPP

#include <gmock/gmock.h>

#include <istream>
#include <memory>
#include <string>
#include <vector>

#include "file_system.hpp"
#include "transcoder.hpp"

namespace kiln {
namespace media {
namespace test {

/**
 * Mock implementation of IFileSystem for testing
 */
class MockFileSystem : public IFileSystem {
public:
  MOCK_METHOD(bool, exists, (const std::string& path), (const, override));
  MOCK_METHOD(std::unique_ptr<std::istream>, open_read, (const std::string& path), (const, override));
  MOCK_METHOD(bool, remove, (const std::string& path), (const, override));
  MOCK_METHOD(bool, remove_all, (const std::string& path), (const, override));
  MOCK_METHOD(bool, create_directories, (const std::string& path), (const, override));
  MOCK_METHOD(bool, write_file, (const std::string& path, const std::string& data),
              (const, override));
  MOCK_METHOD(bool, copy_file, (const std::string& from, const std::string& to), (const, override));
  MOCK_METHOD(bool, list_files, (const std::string& dir, std::vector<std::string>& names),
              (const, override));
};

/**
 * Mock implementation of ITranscoder for testing
 */
class MockTranscoder : public ITranscoder {
public:
  MOCK_METHOD(TranscodeOutput, transcode, (const StagedFile& input), (override));
};

}  // namespace test
}  // namespace media
}  // namespace kiln

#endif  // KILN_MEDIA_MOCKS_HPP
