// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for RetryHandler and with_retry
 */

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <stdexcept>

#include "retry_handler.hpp"
#include "storage_mocks.hpp"

using namespace kiln::storage;
using namespace kiln::storage::test;

namespace {

bool store_transient(const std::exception& e) {
  auto* err = dynamic_cast<const StoreError*>(&e);
  return err != nullptr && err->retryable();
}

}  // namespace

class RetryHandlerTest : public ::testing::Test {
protected:
  RetryHandler makeHandler(int initial_ms, int max_attempts = 3) {
    RetryConfig config;
    config.max_attempts = max_attempts;
    config.initial_delay = std::chrono::milliseconds(initial_ms);
    return RetryHandler(config);
  }
};

TEST_F(RetryHandlerTest, DefaultsGiveExactDoubling) {
  RetryHandler handler;
  EXPECT_EQ(handler.maxAttempts(), 3);
  EXPECT_EQ(handler.getDelay(0).count(), 1000);
  EXPECT_EQ(handler.getDelay(1).count(), 2000);
  EXPECT_EQ(handler.getDelay(2).count(), 4000);
}

TEST_F(RetryHandlerTest, MaxDelayCap) {
  RetryConfig config;
  config.max_delay = std::chrono::milliseconds(5000);
  RetryHandler handler(config);
  EXPECT_EQ(handler.getDelay(10).count(), 5000);
}

TEST_F(RetryHandlerTest, JitterStaysInRange) {
  RetryConfig config;
  config.jitter = true;
  config.jitter_factor = 0.5;
  RetryHandler handler(config);
  for (int i = 0; i < 50; ++i) {
    auto d = handler.getDelay(0).count();
    EXPECT_GE(d, 500);
    EXPECT_LE(d, 1500);
  }
}

TEST_F(RetryHandlerTest, ShouldRetryCountsAttempts) {
  auto handler = makeHandler(1000);
  EXPECT_TRUE(handler.shouldRetry(1));
  EXPECT_TRUE(handler.shouldRetry(2));
  EXPECT_FALSE(handler.shouldRetry(3));
}

TEST_F(RetryHandlerTest, RetryableErrorCodes) {
  EXPECT_TRUE(RetryHandler::isRetryableError("SlowDown"));
  EXPECT_TRUE(RetryHandler::isRetryableError("RequestTimeout"));
  EXPECT_TRUE(RetryHandler::isRetryableError("NetworkingError"));
  EXPECT_TRUE(RetryHandler::isRetryableError("XMinioServerNotInitialized"));
  EXPECT_FALSE(RetryHandler::isRetryableError("NoSuchKey"));
  EXPECT_FALSE(RetryHandler::isRetryableError("AccessDenied"));
  EXPECT_FALSE(RetryHandler::isRetryableError(""));
}

// ============================================================================
// with_retry
// ============================================================================

class WithRetryTest : public RetryHandlerTest {
protected:
  RecordingSleeper sleeper_;
};

TEST_F(WithRetryTest, SucceedsFirstTime) {
  int calls = 0;
  int result = with_retry(
    [&]() { return ++calls; }, makeHandler(500), store_transient,
    [](const std::exception&) -> int { throw std::logic_error("unreachable"); },
    std::ref(sleeper_)
  );
  EXPECT_EQ(result, 1);
  EXPECT_EQ(calls, 1);
  EXPECT_TRUE(sleeper_.delays.empty());
}

TEST_F(WithRetryTest, FewerThanThreeTransientFailuresSucceed) {
  for (int k = 1; k < 3; ++k) {
    RecordingSleeper sleeper;
    int calls = 0;
    bool recovered = false;
    std::string result = with_retry(
      [&]() -> std::string {
        if (++calls <= k) throw transient_error();
        return "ok";
      },
      makeHandler(500), store_transient,
      [&](const std::exception&) -> std::string {
        recovered = true;
        return "";
      },
      std::ref(sleeper)
    );
    EXPECT_EQ(result, "ok");
    EXPECT_EQ(calls, k + 1);
    EXPECT_FALSE(recovered);
    ASSERT_EQ(sleeper.delays.size(), static_cast<size_t>(k));
    EXPECT_EQ(sleeper.delays[0].count(), 500);
    if (k == 2) {
      EXPECT_EQ(sleeper.delays[1].count(), 1000);
    }
  }
}

TEST_F(WithRetryTest, ThreeTransientFailuresInvokeRecovery) {
  int calls = 0;
  EXPECT_THROW(
    with_retry(
      [&]() {
        ++calls;
        throw transient_error("SlowDown");
      },
      makeHandler(1000), store_transient,
      [](const std::exception& e) { throw ServiceUnavailable(e.what()); }, std::ref(sleeper_)
    ),
    ServiceUnavailable
  );
  EXPECT_EQ(calls, 3);
  ASSERT_EQ(sleeper_.delays.size(), 2u);
  EXPECT_EQ(sleeper_.delays[0].count(), 1000);
  EXPECT_EQ(sleeper_.delays[1].count(), 2000);
}

TEST_F(WithRetryTest, RecoveryValueIsReturned) {
  std::string body = with_retry(
    []() -> std::string { throw transient_error(); }, makeHandler(1000), store_transient,
    [](const std::exception&) { return std::string(); }, std::ref(sleeper_)
  );
  EXPECT_TRUE(body.empty());
}

TEST_F(WithRetryTest, TerminalFailurePropagatesImmediately) {
  int calls = 0;
  bool recovered = false;
  try {
    with_retry(
      [&]() {
        ++calls;
        throw terminal_error("AccessDenied");
      },
      makeHandler(1000), store_transient, [&](const std::exception&) { recovered = true; },
      std::ref(sleeper_)
    );
    FAIL() << "expected StoreError";
  } catch (const StoreError& e) {
    EXPECT_EQ(e.code(), "AccessDenied");
  }
  EXPECT_EQ(calls, 1);
  EXPECT_FALSE(recovered);
  EXPECT_TRUE(sleeper_.delays.empty());
}

TEST_F(WithRetryTest, OnRetryHookSeesEachRetry) {
  std::vector<int> attempts;
  int calls = 0;
  with_retry(
    [&]() {
      if (++calls < 3) throw transient_error();
    },
    makeHandler(10), store_transient, [](const std::exception&) {}, std::ref(sleeper_),
    [&](int attempt, std::chrono::milliseconds, const std::exception&) {
      attempts.push_back(attempt);
    }
  );
  EXPECT_EQ(attempts, (std::vector<int>{1, 2}));
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
