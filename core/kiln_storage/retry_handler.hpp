// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef KILN_RETRY_HANDLER_HPP
#define KILN_RETRY_HANDLER_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <thread>

namespace kiln {
namespace storage {

/**
 * Configuration for retry behavior
 */
struct RetryConfig {
  int max_attempts = 3;                           // Total attempts including the first
  std::chrono::milliseconds initial_delay{1000};  // Delay after the first failure
  std::chrono::milliseconds max_delay{300000};    // Cap on any single delay
  double exponential_base = 2.0;
  bool jitter = false;
  double jitter_factor = 0.5;  // Jitter range: [1-factor, 1+factor]
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

/**
 * Backoff schedule: initial_delay * base^failures, capped, optionally jittered.
 *
 * Thread-safe: getDelay() may be called concurrently.
 */
class RetryHandler {
public:
  explicit RetryHandler(const RetryConfig& config = {})
      : config_(config)
      , rng_(std::random_device{}()) {}

  /**
   * @param failures Number of failed attempts so far minus one (0-indexed)
   */
  std::chrono::milliseconds getDelay(int failures) const {
    double delay_ms = static_cast<double>(config_.initial_delay.count()) *
                      std::pow(config_.exponential_base, static_cast<double>(failures));
    delay_ms = std::min(delay_ms, static_cast<double>(config_.max_delay.count()));

    if (config_.jitter) {
      std::lock_guard<std::mutex> lock(rng_mutex_);
      std::uniform_real_distribution<> dist(
        1.0 - config_.jitter_factor, 1.0 + config_.jitter_factor
      );
      delay_ms *= dist(rng_);
    }

    delay_ms = std::max(delay_ms, 1.0);
    return std::chrono::milliseconds(static_cast<int64_t>(delay_ms));
  }

  /**
   * @param attempts Attempts made so far
   */
  bool shouldRetry(int attempts) const {
    return attempts < config_.max_attempts;
  }

  int maxAttempts() const {
    return config_.max_attempts;
  }

  /**
   * Transient S3/MinIO/network error codes.
   */
  static bool isRetryableError(const std::string& error_code) {
    static const std::set<std::string> retryable = {// S3/HTTP errors
                                                    "RequestTimeout",
                                                    "ServiceUnavailable",
                                                    "InternalError",
                                                    "SlowDown",
                                                    "RequestTimeTooSkewed",
                                                    "OperationAborted",

                                                    // Network errors
                                                    "ConnectionReset",
                                                    "ConnectionTimeout",
                                                    "ConnectionRefused",
                                                    "NetworkingError",
                                                    "UnknownEndpoint",

                                                    // MinIO-specific
                                                    "XMinioServerNotInitialized",

                                                    // Generic
                                                    "Throttling",
                                                    "ThrottlingException",
                                                    "TransientError"};
    return retryable.count(error_code) > 0;
  }

  const RetryConfig& config() const {
    return config_;
  }

private:
  RetryConfig config_;
  mutable std::mt19937 rng_;
  mutable std::mutex rng_mutex_;
};

inline void sleep_for_delay(std::chrono::milliseconds delay) {
  std::this_thread::sleep_for(delay);
}

/**
 * Run `operation` until it succeeds, fails terminally or the attempt budget
 * is spent.
 *
 * A failure for which `is_transient` returns false is rethrown unchanged
 * without consuming budget. After the last transient failure `recovery` is
 * called with that exception; it either returns a substitute value or throws.
 *
 * @param on_retry Optional hook invoked as (attempt, delay, error) before each sleep
 */
template <typename Operation, typename Recovery>
auto with_retry(
  Operation&& operation, const RetryHandler& handler,
  const std::function<bool(const std::exception&)>& is_transient, Recovery&& recovery,
  const Sleeper& sleeper = sleep_for_delay,
  const std::function<void(int, std::chrono::milliseconds, const std::exception&)>& on_retry =
    nullptr
) -> decltype(operation()) {
  for (int attempt = 1;; ++attempt) {
    try {
      return operation();
    } catch (const std::exception& e) {
      if (!is_transient(e)) {
        throw;
      }
      if (!handler.shouldRetry(attempt)) {
        return recovery(e);
      }
      const auto delay = handler.getDelay(attempt - 1);
      if (on_retry) {
        on_retry(attempt, delay, e);
      }
      sleeper(delay);
    }
  }
}

}  // namespace storage
}  // namespace kiln

#endif  // KILN_RETRY_HANDLER_HPP
