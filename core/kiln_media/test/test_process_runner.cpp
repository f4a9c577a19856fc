// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_process_runner.cpp
 * @brief Subprocess exit codes, merged output capture and timeouts
 */

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "process_runner.hpp"

using namespace kiln::media;

namespace {

std::vector<std::string> sh(const std::string& script) {
  return {"/bin/sh", "-c", script};
}

}  // namespace

TEST(ProcessRunnerTest, ZeroExit) {
  auto result = run_process(sh("exit 0"), nullptr);
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_FALSE(result.timed_out);
}

TEST(ProcessRunnerTest, NonZeroExitCodeIsReported) {
  auto result = run_process(sh("exit 3"), nullptr);
  EXPECT_EQ(result.exit_code, 3);
}

TEST(ProcessRunnerTest, StdoutAndStderrAreMergedLineByLine) {
  std::vector<std::string> lines;
  auto result = run_process(
    sh("echo first; echo second 1>&2; printf 'no newline'"),
    [&](const std::string& line) { lines.push_back(line); }
  );
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(lines, (std::vector<std::string>{"first", "second", "no newline"}));
  EXPECT_EQ(result.last_line, "no newline");
}

TEST(ProcessRunnerTest, CarriageReturnsSplitProgressLines) {
  std::vector<std::string> lines;
  run_process(sh("printf 'frame=1\\rframe=2\\r\\n'"), [&](const std::string& line) {
    lines.push_back(line);
  });
  EXPECT_EQ(lines, (std::vector<std::string>{"frame=1", "frame=2"}));
}

TEST(ProcessRunnerTest, LastLineKeptForErrors) {
  auto result = run_process(sh("echo starting; echo 'Invalid data found' 1>&2; exit 1"), nullptr);
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_EQ(result.last_line, "Invalid data found");
}

TEST(ProcessRunnerTest, MissingBinaryIsSpawnError) {
  EXPECT_THROW(
    run_process({"/nonexistent/kiln-no-such-binary", "-version"}, nullptr), ProcessSpawnError
  );
}

TEST(ProcessRunnerTest, EmptyArgvIsSpawnError) {
  EXPECT_THROW(run_process({}, nullptr), ProcessSpawnError);
}

TEST(ProcessRunnerTest, TimeoutKillsChild) {
  const auto start = std::chrono::steady_clock::now();
  auto result = run_process(sh("sleep 10"), nullptr, std::chrono::milliseconds(200));
  const auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_TRUE(result.timed_out);
  EXPECT_EQ(result.exit_code, -1);
  EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(ProcessRunnerTest, FastChildFinishesWithinTimeout) {
  auto result = run_process(sh("echo done"), nullptr, std::chrono::milliseconds(5000));
  EXPECT_FALSE(result.timed_out);
  EXPECT_EQ(result.exit_code, 0);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
