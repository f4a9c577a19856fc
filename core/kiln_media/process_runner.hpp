// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef KILN_PROCESS_RUNNER_HPP
#define KILN_PROCESS_RUNNER_HPP

#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace kiln {
namespace media {

/**
 * The child could not be started (pipe/fork failure, binary not found).
 */
class ProcessSpawnError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct ProcessResult {
  int exit_code = -1;  // 128 + signal number when killed by a signal
  bool timed_out = false;
  std::string last_line;  // last non-empty output line, for error messages
};

using LineCallback = std::function<void(const std::string&)>;

/**
 * Run argv[0] (looked up in PATH) with stdout and stderr merged into one
 * pipe. Each output line is handed to `on_line` as it arrives. Blocks
 * until the child exits.
 *
 * @param timeout Zero means no limit; otherwise the child is killed with
 *                SIGKILL once it elapses and timed_out is set
 * @throws ProcessSpawnError
 */
ProcessResult run_process(
  const std::vector<std::string>& argv, const LineCallback& on_line,
  std::chrono::milliseconds timeout = std::chrono::milliseconds::zero()
);

using ProcessRunFn = std::function<ProcessResult(
  const std::vector<std::string>&, const LineCallback&, std::chrono::milliseconds
)>;

}  // namespace media
}  // namespace kiln

#endif  // KILN_PROCESS_RUNNER_HPP
