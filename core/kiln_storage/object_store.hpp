// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef KILN_OBJECT_STORE_HPP
#define KILN_OBJECT_STORE_HPP

#include <cstdint>
#include <istream>
#include <stdexcept>
#include <string>
#include <utility>

namespace kiln {
namespace storage {

enum class HttpMethod { GET, PUT };

inline const char* to_string(HttpMethod method) {
  return method == HttpMethod::GET ? "GET" : "PUT";
}

/**
 * Failure reported by an object store.
 *
 * `code` carries the S3 error code (NoSuchKey, SlowDown, NetworkingError...)
 * and `retryable` marks transient conditions worth another attempt.
 */
class StoreError : public std::runtime_error {
public:
  StoreError(const std::string& message, std::string code, bool retryable)
      : std::runtime_error(message)
      , code_(std::move(code))
      , retryable_(retryable) {}

  const std::string& code() const {
    return code_;
  }

  bool retryable() const {
    return retryable_;
  }

  bool not_found() const {
    return code_ == "NoSuchKey" || code_ == "NoSuchBucket" || code_ == "NotFound";
  }

private:
  std::string code_;
  bool retryable_;
};

/**
 * Raised once the retry budget for an operation is spent.
 * Never retryable itself, so nested retry wrappers do not multiply attempts.
 */
class ServiceUnavailable : public StoreError {
public:
  explicit ServiceUnavailable(const std::string& message)
      : StoreError(message, "ServiceUnavailable", false) {}
};

/**
 * Object store capability used by the media pipeline.
 * Implementations raise StoreError on failure.
 */
class IObjectStore {
public:
  virtual ~IObjectStore() = default;

  virtual bool bucket_exists(const std::string& bucket) = 0;

  virtual void make_bucket(const std::string& bucket) = 0;

  /**
   * Store `length` bytes read from `data` under `key`.
   */
  virtual void put_object(
    const std::string& bucket, const std::string& key, std::istream& data, uint64_t length,
    const std::string& content_type
  ) = 0;

  /**
   * Fetch the whole object body. A missing object raises StoreError with
   * code "NoSuchKey".
   */
  virtual std::string get_object(const std::string& bucket, const std::string& key) = 0;

  /**
   * Time-limited URL granting `method` on the object without credentials.
   */
  virtual std::string presigned_url(
    const std::string& bucket, const std::string& key, HttpMethod method, int expiry_minutes
  ) = 0;
};

}  // namespace storage
}  // namespace kiln

#endif  // KILN_OBJECT_STORE_HPP
