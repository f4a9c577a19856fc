// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "resilient_store.hpp"

#include <stdexcept>
#include <utility>

#define KILN_LOG_COMPONENT "resilient_store"
#include <kiln_log_macros.hpp>

namespace kiln {
namespace storage {

namespace {

[[noreturn]] void give_up(const char* operation, int attempts, const std::exception& last) {
  KILN_LOG_ERROR(
    "Object store unavailable" << logging::kv("operation", operation)
                               << logging::kv("attempts", attempts) << logging::kv("error", last.what())
  );
  throw ServiceUnavailable(
    std::string("Object store is persistently unavailable (") + operation + " failed after " +
    std::to_string(attempts) + " attempts): " + last.what()
  );
}

void log_retry(const char* operation, const std::string& key, int attempt,
               std::chrono::milliseconds delay, const std::exception& e) {
  KILN_LOG_WARN(
    operation << " failed, retrying" << logging::kv("key", key) << logging::kv("attempt", attempt)
              << logging::kv("delay_ms", delay.count()) << logging::kv("error", e.what())
  );
}

}  // namespace

bool is_transient_store_error(const std::exception& e) {
  auto* store_error = dynamic_cast<const StoreError*>(&e);
  return store_error != nullptr && store_error->retryable();
}

ResilientStore::ResilientStore(
  std::shared_ptr<IObjectStore> store, const ResilienceConfig& config, Sleeper sleeper
)
    : store_(std::move(store))
    , config_(config)
    , sleeper_(std::move(sleeper)) {
  if (!store_) {
    throw std::invalid_argument("ResilientStore requires an object store");
  }
  if (!sleeper_) {
    sleeper_ = sleep_for_delay;
  }
}

RetryHandler ResilientStore::handler_for(std::chrono::milliseconds initial_delay) const {
  RetryConfig rc;
  rc.max_attempts = config_.max_attempts;
  rc.initial_delay = initial_delay;
  return RetryHandler(rc);
}

void ResilientStore::ensure_bucket(const std::string& bucket) {
  const int attempts = config_.max_attempts;
  with_retry(
    [&]() {
      if (!store_->bucket_exists(bucket)) {
        store_->make_bucket(bucket);
        KILN_LOG_INFO("Bucket created" << logging::kv("bucket", bucket));
      }
    },
    handler_for(config_.bucket_initial_delay),
    is_transient_store_error,
    [&](const std::exception& e) { give_up("ensure_bucket", attempts, e); },
    sleeper_,
    [&](int attempt, std::chrono::milliseconds delay, const std::exception& e) {
      log_retry("ensure_bucket", bucket, attempt, delay, e);
    }
  );
}

std::string ResilientStore::presigned_url(
  const std::string& bucket, const std::string& key, HttpMethod method, int expiry_minutes
) {
  const int attempts = config_.max_attempts;
  return with_retry(
    [&]() { return store_->presigned_url(bucket, key, method, expiry_minutes); },
    handler_for(config_.operation_initial_delay),
    is_transient_store_error,
    [&](const std::exception& e) -> std::string { give_up("presigned_url", attempts, e); },
    sleeper_,
    [&](int attempt, std::chrono::milliseconds delay, const std::exception& e) {
      log_retry("presigned_url", key, attempt, delay, e);
    }
  );
}

void ResilientStore::put_object(
  const std::string& bucket, const std::string& key, std::istream& data, uint64_t length,
  const std::string& content_type
) {
  const int attempts = config_.max_attempts;
  with_retry(
    [&]() {
      data.clear();
      data.seekg(0, std::ios::beg);
      store_->put_object(bucket, key, data, length, content_type);
    },
    handler_for(config_.operation_initial_delay),
    is_transient_store_error,
    [&](const std::exception& e) { give_up("put_object", attempts, e); },
    sleeper_,
    [&](int attempt, std::chrono::milliseconds delay, const std::exception& e) {
      log_retry("put_object", key, attempt, delay, e);
    }
  );
}

std::string ResilientStore::get_object(const std::string& bucket, const std::string& key) {
  const int attempts = config_.max_attempts;
  const RetrievalFallback fallback = config_.retrieval_fallback;
  return with_retry(
    [&]() { return store_->get_object(bucket, key); },
    handler_for(config_.operation_initial_delay),
    is_transient_store_error,
    [&](const std::exception& e) -> std::string {
      if (fallback == RetrievalFallback::EMPTY) {
        KILN_LOG_WARN(
          "get_object exhausted retries, returning empty body" << logging::kv("key", key)
                                                               << logging::kv("error", e.what())
        );
        return std::string();
      }
      give_up("get_object", attempts, e);
    },
    sleeper_,
    [&](int attempt, std::chrono::milliseconds delay, const std::exception& e) {
      log_retry("get_object", key, attempt, delay, e);
    }
  );
}

}  // namespace storage
}  // namespace kiln
