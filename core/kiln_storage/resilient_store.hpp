// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef KILN_RESILIENT_STORE_HPP
#define KILN_RESILIENT_STORE_HPP

#include <chrono>
#include <cstdint>
#include <istream>
#include <memory>
#include <string>

#include "object_store.hpp"
#include "retry_handler.hpp"

namespace kiln {
namespace storage {

/**
 * What get_object does once its retries are exhausted.
 */
enum class RetrievalFallback {
  RAISE,  // throw ServiceUnavailable
  EMPTY   // return an empty body
};

struct ResilienceConfig {
  int max_attempts = 3;
  std::chrono::milliseconds bucket_initial_delay{500};
  std::chrono::milliseconds operation_initial_delay{1000};
  RetrievalFallback retrieval_fallback = RetrievalFallback::RAISE;
};

/**
 * True for a StoreError flagged retryable. Everything else is terminal.
 */
bool is_transient_store_error(const std::exception& e);

/**
 * Wraps an IObjectStore so that every call is retried with exponential
 * backoff on transient failures and surfaces ServiceUnavailable once the
 * budget is spent.
 */
class ResilientStore {
public:
  explicit ResilientStore(
    std::shared_ptr<IObjectStore> store, const ResilienceConfig& config = {},
    Sleeper sleeper = sleep_for_delay
  );

  /**
   * Create the bucket unless it already exists.
   */
  void ensure_bucket(const std::string& bucket);

  std::string presigned_url(
    const std::string& bucket, const std::string& key, HttpMethod method, int expiry_minutes
  );

  /**
   * Upload from a seekable stream. The stream is rewound before each attempt.
   */
  void put_object(
    const std::string& bucket, const std::string& key, std::istream& data, uint64_t length,
    const std::string& content_type
  );

  std::string get_object(const std::string& bucket, const std::string& key);

  const ResilienceConfig& config() const {
    return config_;
  }

private:
  RetryHandler handler_for(std::chrono::milliseconds initial_delay) const;

  std::shared_ptr<IObjectStore> store_;
  ResilienceConfig config_;
  Sleeper sleeper_;
};

}  // namespace storage
}  // namespace kiln

#endif  // KILN_RESILIENT_STORE_HPP
