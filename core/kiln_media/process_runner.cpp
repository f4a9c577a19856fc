// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "process_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

#define KILN_LOG_COMPONENT "process"
#include <kiln_log_macros.hpp>

namespace kiln {
namespace media {

namespace {

std::string errno_message(const std::string& what, int err) {
  return what + ": " + std::error_code(err, std::generic_category()).message();
}

class Pipe {
public:
  explicit Pipe(int flags) {
    if (::pipe2(fds_, flags) == -1) {
      throw ProcessSpawnError(errno_message("pipe failed", errno));
    }
  }

  ~Pipe() {
    close_read();
    close_write();
  }

  Pipe(const Pipe&) = delete;
  Pipe& operator=(const Pipe&) = delete;

  int read_fd() const {
    return fds_[0];
  }

  int write_fd() const {
    return fds_[1];
  }

  void close_read() {
    if (fds_[0] != -1) {
      ::close(fds_[0]);
      fds_[0] = -1;
    }
  }

  void close_write() {
    if (fds_[1] != -1) {
      ::close(fds_[1]);
      fds_[1] = -1;
    }
  }

private:
  int fds_[2] = {-1, -1};
};

// Splits the output stream into lines and forwards them
class LineSplitter {
public:
  LineSplitter(const LineCallback& on_line, std::string& last_line)
      : on_line_(on_line)
      , last_line_(last_line) {}

  void feed(const char* data, size_t n) {
    for (size_t i = 0; i < n; ++i) {
      const char c = data[i];
      // ffmpeg rewrites its progress line with '\r'
      if (c == '\n' || c == '\r') {
        flush();
      } else {
        pending_ += c;
      }
    }
  }

  void flush() {
    if (pending_.empty()) {
      return;
    }
    last_line_ = pending_;
    if (on_line_) {
      on_line_(pending_);
    }
    pending_.clear();
  }

private:
  const LineCallback& on_line_;
  std::string& last_line_;
  std::string pending_;
};

int decode_status(int wstatus) {
  if (WIFEXITED(wstatus)) {
    return WEXITSTATUS(wstatus);
  }
  if (WIFSIGNALED(wstatus)) {
    return 128 + WTERMSIG(wstatus);
  }
  return -1;
}

int wait_child(pid_t pid) {
  int wstatus = 0;
  while (::waitpid(pid, &wstatus, 0) == -1) {
    if (errno != EINTR) {
      throw ProcessSpawnError(errno_message("waitpid failed", errno));
    }
  }
  return decode_status(wstatus);
}

}  // namespace

ProcessResult run_process(
  const std::vector<std::string>& argv, const LineCallback& on_line,
  std::chrono::milliseconds timeout
) {
  if (argv.empty()) {
    throw ProcessSpawnError("empty command line");
  }

  Pipe output(O_CLOEXEC);
  // Closed by a successful exec; carries errno back if exec fails
  Pipe exec_status(O_CLOEXEC);

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& a : argv) {
    args.push_back(const_cast<char*>(a.c_str()));
  }
  args.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid == -1) {
    throw ProcessSpawnError(errno_message("fork failed", errno));
  }

  if (pid == 0) {
    // CHILD: only async-signal-safe calls from here on
    const int null_fd = ::open("/dev/null", O_RDONLY);
    if (null_fd != -1) {
      ::dup2(null_fd, STDIN_FILENO);
      ::close(null_fd);
    }
    if (::dup2(output.write_fd(), STDOUT_FILENO) == -1 ||
        ::dup2(output.write_fd(), STDERR_FILENO) == -1) {
      _exit(127);
    }
    ::execvp(args[0], args.data());
    const int err = errno;
    ssize_t ignored = ::write(exec_status.write_fd(), &err, sizeof(err));
    (void)ignored;
    _exit(127);
  }

  // PARENT
  output.close_write();
  exec_status.close_write();

  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(exec_status.read_fd(), &child_errno, sizeof(child_errno));
  } while (n == -1 && errno == EINTR);
  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    wait_child(pid);
    throw ProcessSpawnError(errno_message("cannot execute '" + argv[0] + "'", child_errno));
  }

  KILN_LOG_DEBUG("Started process" << logging::kv("pid", pid) << logging::kv("cmd", argv[0]));

  ProcessResult result;
  LineSplitter splitter(on_line, result.last_line);
  const bool bounded = timeout.count() > 0;
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  char buffer[4096];
  for (;;) {
    int wait_ms = -1;
    if (bounded) {
      const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()
      );
      if (left.count() <= 0) {
        KILN_LOG_WARN(
          "Process timed out, killing" << logging::kv("pid", pid)
                                       << logging::kv("timeout_ms", timeout.count())
        );
        ::kill(pid, SIGKILL);
        result.timed_out = true;
        break;
      }
      wait_ms = static_cast<int>(left.count());
    }

    pollfd pfd{output.read_fd(), POLLIN, 0};
    const int ready = ::poll(&pfd, 1, wait_ms);
    if (ready == -1) {
      if (errno == EINTR) {
        continue;
      }
      const int err = errno;
      ::kill(pid, SIGKILL);
      wait_child(pid);
      throw ProcessSpawnError(errno_message("poll failed", err));
    }
    if (ready == 0) {
      continue;
    }

    const ssize_t got = ::read(output.read_fd(), buffer, sizeof(buffer));
    if (got > 0) {
      splitter.feed(buffer, static_cast<size_t>(got));
    } else if (got == 0) {
      break;  // EOF: child closed its output
    } else if (errno != EINTR) {
      break;
    }
  }
  splitter.flush();

  const int status = wait_child(pid);
  result.exit_code = result.timed_out ? -1 : status;
  KILN_LOG_DEBUG(
    "Process finished" << logging::kv("pid", pid) << logging::kv("exit_code", result.exit_code)
  );
  return result;
}

}  // namespace media
}  // namespace kiln
