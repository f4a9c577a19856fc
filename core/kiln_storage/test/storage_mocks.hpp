// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef KILN_STORAGE_MOCKS_HPP
#define KILN_STORAGE_MOCKS_HPP

#include <gmock/gmock.h>

#include <chrono>
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

#include "object_store.hpp"

namespace kiln {
namespace storage {
namespace test {

/**
 * Mock implementation of IObjectStore for testing
 */
class MockObjectStore : public IObjectStore {
public:
  MOCK_METHOD(bool, bucket_exists, (const std::string& bucket), (override));
  MOCK_METHOD(void, make_bucket, (const std::string& bucket), (override));
  MOCK_METHOD(
    void, put_object,
    (const std::string& bucket, const std::string& key, std::istream& data, uint64_t length,
     const std::string& content_type),
    (override)
  );
  MOCK_METHOD(std::string, get_object, (const std::string& bucket, const std::string& key),
              (override));
  MOCK_METHOD(
    std::string, presigned_url,
    (const std::string& bucket, const std::string& key, HttpMethod method, int expiry_minutes),
    (override)
  );
};

/**
 * Sleeper that records requested delays instead of sleeping
 */
class RecordingSleeper {
public:
  void operator()(std::chrono::milliseconds delay) {
    delays.push_back(delay);
  }

  std::vector<std::chrono::milliseconds> delays;
};

inline StoreError transient_error(const std::string& code = "NetworkingError") {
  return StoreError("simulated " + code, code, true);
}

inline StoreError terminal_error(const std::string& code = "AccessDenied") {
  return StoreError("simulated " + code, code, false);
}

}  // namespace test
}  // namespace storage
}  // namespace kiln

#endif  // KILN_STORAGE_MOCKS_HPP
