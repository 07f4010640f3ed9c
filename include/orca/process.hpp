/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file process.hpp
 * @brief Child process handle with stdin/stdout/stderr pipes.
 *
 * Subprocess spawns a program in its own session (so the whole process
 * group can be killed at once) and exposes:
 *   - WriteStdin: blocking full write to the child's stdin
 *   - ReadLine:   line read from stdout with a poll(2) timeout
 *   - Wait:       waitpid with optional timeout
 *   - Kill:       SIGKILL to the child's process group, then reap
 *
 * Long-lived interactive children (the worker sessions in worker_pool.hpp)
 * are driven entirely through WriteStdin/ReadLine.
 */

#ifndef ORCA_PROCESS_HPP_
#define ORCA_PROCESS_HPP_

#include "orca/platform.hpp"

#if defined(ORCA_PLATFORM_POSIX)

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

namespace orca {

// ============================================================================
// ProcessResult
// ============================================================================

enum class ProcessResult : int8_t {
  kSuccess = 0,
  kFailed = -1,   ///< fork/pipe/write error
  kTimeout = -2,  ///< Deadline elapsed before the operation completed
  kClosed = -3,   ///< Peer closed the pipe (EOF / EPIPE)
};

namespace detail {

/// @brief Sleep for @p ms milliseconds (nanosleep, not deprecated usleep).
inline void SleepMs(uint32_t ms) {
  struct timespec ts;
  ts.tv_sec = static_cast<time_t>(ms / 1000U);
  ts.tv_nsec = static_cast<long>(ms % 1000U) * 1000000L;  // NOLINT
  nanosleep(&ts, nullptr);
}

/**
 * @brief Ignore SIGPIPE process-wide, once.
 *
 * A worker session that dies between commands turns the next stdin write
 * into EPIPE; without this the whole orchestrator would be killed.
 */
inline void IgnoreSigpipeOnce() {
  static std::once_flag flag;
  std::call_once(flag, []() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = SIG_IGN;
    sigemptyset(&sa.sa_mask);
    (void)sigaction(SIGPIPE, &sa, nullptr);
  });
}

// ============================================================================
// PipeGuard - RAII wrapper for pipe file descriptors
// ============================================================================

class PipeGuard {
 public:
  PipeGuard() : fd_{-1, -1} {}
  ~PipeGuard() { CloseAll(); }

  /// @brief Create a close-on-exec pipe. Returns false on failure.
  bool Create() {
#if defined(__APPLE__)
    if (pipe(fd_) != 0) return false;  // NOLINT
    return fcntl(fd_[0], F_SETFD, FD_CLOEXEC) == 0 &&
           fcntl(fd_[1], F_SETFD, FD_CLOEXEC) == 0;
#else
    // Atomic: a concurrent fork must not inherit a half-configured pipe.
    return pipe2(fd_, O_CLOEXEC) == 0;  // NOLINT
#endif
  }

  int ReadEnd() const { return fd_[0]; }
  int WriteEnd() const { return fd_[1]; }

  void CloseRead() {
    if (fd_[0] >= 0) {
      close(fd_[0]);  // NOLINT
      fd_[0] = -1;
    }
  }
  void CloseWrite() {
    if (fd_[1] >= 0) {
      close(fd_[1]);  // NOLINT
      fd_[1] = -1;
    }
  }
  void CloseAll() {
    CloseRead();
    CloseWrite();
  }

  int ReleaseRead() {
    int r = fd_[0];
    fd_[0] = -1;
    return r;
  }
  int ReleaseWrite() {
    int r = fd_[1];
    fd_[1] = -1;
    return r;
  }

  PipeGuard(const PipeGuard&) = delete;
  PipeGuard& operator=(const PipeGuard&) = delete;

 private:
  int fd_[2];
};

inline bool SetNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0) return false;
  return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

inline int64_t RemainingMs(std::chrono::steady_clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  return left.count() > 0 ? static_cast<int64_t>(left.count()) : 0;
}

}  // namespace detail

/// @brief True if @p path names an existing directory.
inline bool IsDirectory(const std::string& path) {
  struct stat st;
  return !path.empty() && ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

/**
 * @brief Locate @p program on PATH (or check it directly if it has a '/').
 * @return true if an executable file was found.
 */
inline bool FindExecutable(const std::string& program) {
  if (program.empty()) return false;
  if (program.find('/') != std::string::npos) {
    return ::access(program.c_str(), X_OK) == 0;
  }
  const char* path_env = std::getenv("PATH");
  std::string path = (path_env != nullptr) ? path_env : "/usr/bin:/bin";
  size_t start = 0;
  while (start <= path.size()) {
    size_t end = path.find(':', start);
    if (end == std::string::npos) end = path.size();
    std::string dir = path.substr(start, end - start);
    if (dir.empty()) dir = ".";
    std::string candidate = dir + "/" + program;
    if (::access(candidate.c_str(), X_OK) == 0) return true;
    start = end + 1;
  }
  return false;
}

// ============================================================================
// Subprocess
// ============================================================================

struct SubprocessConfig {
  std::vector<std::string> argv;  ///< argv[0] is the program (PATH lookup)
  std::string working_dir;        ///< chdir before exec (empty = inherit)
  bool pipe_stdin = false;        ///< Child stdin from a pipe (else /dev/null)
  bool capture_stdout = false;    ///< Child stdout to a pipe (else inherit)
  bool capture_stderr = false;    ///< Child stderr to a pipe
  bool discard_stderr = false;    ///< Child stderr to /dev/null
};

struct WaitResult {
  bool exited = false;    ///< true if child exited normally
  int exit_code = -1;     ///< Exit code (valid if exited==true)
  bool signaled = false;  ///< true if child was killed by signal
  int term_signal = 0;    ///< Signal number (valid if signaled==true)
  bool timed_out = false; ///< true if wait timed out
};

/**
 * @brief Child process handle.
 *
 * RAII: the destructor kills the child's process group if it is still alive
 * and closes all pipes.
 *
 * @code
 *   orca::SubprocessConfig cfg;
 *   cfg.argv = {"/bin/bash", "--noprofile", "--norc"};
 *   cfg.pipe_stdin = true;
 *   cfg.capture_stdout = true;
 *
 *   orca::Subprocess proc;
 *   if (proc.Start(cfg) == orca::ProcessResult::kSuccess) {
 *     proc.WriteStdin("echo hi\n");
 *     std::string line;
 *     proc.ReadLine(line, 1000);
 *   }
 * @endcode
 */
class Subprocess {
 public:
  Subprocess() = default;
  ~Subprocess() { Kill(); }

  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;
  Subprocess(Subprocess&&) = delete;
  Subprocess& operator=(Subprocess&&) = delete;

  /**
   * @brief Spawn the child process.
   * @return kSuccess, or kFailed on pipe/fork error. An exec failure shows
   *         up later as exit code 127.
   */
  ProcessResult Start(const SubprocessConfig& cfg) {
    if (cfg.argv.empty() || pid_ > 0) return ProcessResult::kFailed;
    detail::IgnoreSigpipeOnce();

    std::vector<char*> argv;
    argv.reserve(cfg.argv.size() + 1U);
    for (const auto& arg : cfg.argv) {
      argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    detail::PipeGuard in_pipe, out_pipe, err_pipe;
    if (cfg.pipe_stdin && !in_pipe.Create()) return ProcessResult::kFailed;
    if (cfg.capture_stdout && !out_pipe.Create()) return ProcessResult::kFailed;
    if (cfg.capture_stderr && !err_pipe.Create()) return ProcessResult::kFailed;

    pid_t child = fork();
    if (child < 0) return ProcessResult::kFailed;

    if (child == 0) {
      // -- Child process --
      // New session: the parent kills the whole group on timeout.
      setsid();

      struct sigaction sa_dfl;
      std::memset(&sa_dfl, 0, sizeof(sa_dfl));
      sa_dfl.sa_handler = SIG_DFL;
      for (int sig = 1; sig < 32; ++sig) {
        sigaction(sig, &sa_dfl, nullptr);  // uncatchable signals fail, fine
      }

      if (!cfg.working_dir.empty() && chdir(cfg.working_dir.c_str()) != 0) {
        _exit(127);
      }

      int devnull = open("/dev/null", O_RDWR);  // NOLINT
      if (cfg.pipe_stdin) {
        dup2(in_pipe.ReadEnd(), STDIN_FILENO);
      } else if (devnull >= 0) {
        dup2(devnull, STDIN_FILENO);
      }
      if (cfg.capture_stdout) {
        dup2(out_pipe.WriteEnd(), STDOUT_FILENO);
      }
      if (cfg.capture_stderr) {
        dup2(err_pipe.WriteEnd(), STDERR_FILENO);
      } else if (cfg.discard_stderr && devnull >= 0) {
        dup2(devnull, STDERR_FILENO);
      }

      execvp(argv[0], argv.data());
      _exit(127);
    }

    // -- Parent process --
    pid_ = child;
    if (cfg.pipe_stdin) {
      in_pipe.CloseRead();
      stdin_fd_ = in_pipe.ReleaseWrite();
    }
    if (cfg.capture_stdout) {
      out_pipe.CloseWrite();
      stdout_fd_ = out_pipe.ReleaseRead();
      detail::SetNonBlocking(stdout_fd_);
    }
    if (cfg.capture_stderr) {
      err_pipe.CloseWrite();
      stderr_fd_ = err_pipe.ReleaseRead();
      detail::SetNonBlocking(stderr_fd_);
    }
    return ProcessResult::kSuccess;
  }

  /**
   * @brief Write all of @p data to the child's stdin.
   * @return kSuccess, kClosed if the child closed its end, kFailed otherwise.
   */
  ProcessResult WriteStdin(const std::string& data) {
    if (stdin_fd_ < 0) return ProcessResult::kClosed;
    size_t off = 0;
    while (off < data.size()) {
      ssize_t n = ::write(stdin_fd_, data.data() + off, data.size() - off);
      if (n < 0) {
        if (errno == EINTR) continue;
        return (errno == EPIPE) ? ProcessResult::kClosed : ProcessResult::kFailed;
      }
      off += static_cast<size_t>(n);
    }
    return ProcessResult::kSuccess;
  }

  /// @brief Close the child's stdin (it sees EOF).
  void CloseStdin() {
    if (stdin_fd_ >= 0) {
      close(stdin_fd_);  // NOLINT
      stdin_fd_ = -1;
    }
  }

  /**
   * @brief Read one '\n'-terminated line from stdout.
   * @param[out] line Line without the trailing newline.
   * @param timeout_ms Upper bound on the whole read.
   * @return kSuccess, kTimeout, kClosed (EOF before a full line) or kFailed.
   */
  ProcessResult ReadLine(std::string& line, uint32_t timeout_ms) {
    if (stdout_fd_ < 0) return ProcessResult::kClosed;
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(timeout_ms);
    for (;;) {
      size_t nl = line_buf_.find('\n');
      if (nl != std::string::npos) {
        line.assign(line_buf_, 0, nl);
        line_buf_.erase(0, nl + 1U);
        return ProcessResult::kSuccess;
      }

      int64_t remaining = detail::RemainingMs(deadline);
      if (remaining == 0) return ProcessResult::kTimeout;

      struct pollfd pfd;
      pfd.fd = stdout_fd_;
      pfd.events = POLLIN;
      pfd.revents = 0;
      int rc = ::poll(&pfd, 1, static_cast<int>(remaining));
      if (rc < 0) {
        if (errno == EINTR) continue;
        return ProcessResult::kFailed;
      }
      if (rc == 0) return ProcessResult::kTimeout;

      char buf[4096];
      ssize_t n = ::read(stdout_fd_, buf, sizeof(buf));
      if (n > 0) {
        line_buf_.append(buf, static_cast<size_t>(n));
      } else if (n == 0) {
        return ProcessResult::kClosed;
      } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
        return ProcessResult::kFailed;
      }
    }
  }

  /// @brief Drain stderr until EOF (blocking). Only for capture_stderr.
  std::string ReadAllStderr() { return ReadAllFd(stderr_fd_); }

  /**
   * @brief Wait for the child to exit.
   * @param timeout_ms 0 = wait forever.
   */
  WaitResult Wait(uint32_t timeout_ms = 0) {
    WaitResult wr;
    if (pid_ <= 0) {
      wr.exited = true;
      return wr;
    }

    if (timeout_ms == 0) {
      int status;
      pid_t w = waitpid(pid_, &status, 0);
      if (w > 0) {
        FillWaitResult(status, wr);
        pid_ = -1;
      }
      return wr;
    }

    uint32_t elapsed = 0;
    constexpr uint32_t kPollIntervalMs = 5;
    while (elapsed < timeout_ms) {
      int status;
      pid_t w = waitpid(pid_, &status, WNOHANG);
      if (w > 0) {
        FillWaitResult(status, wr);
        pid_ = -1;
        return wr;
      }
      if (w < 0) break;
      detail::SleepMs(kPollIntervalMs);
      elapsed += kPollIntervalMs;
    }
    wr.timed_out = true;
    return wr;
  }

  /**
   * @brief SIGKILL the child's process group, reap it and close pipes.
   *
   * Safe to call repeatedly and on a handle that never started.
   */
  void Kill() {
    CloseStdin();
    CloseFd(stdout_fd_);
    CloseFd(stderr_fd_);
    if (pid_ > 0) {
      (void)::kill(-pid_, SIGKILL);
      (void)::kill(pid_, SIGKILL);
      int status;
      (void)waitpid(pid_, &status, 0);
      pid_ = -1;
    }
    line_buf_.clear();
  }

  pid_t GetPid() const { return pid_; }

  /// @brief True while the child is alive. Reaps it if it has exited.
  bool IsRunning() {
    if (pid_ <= 0) return false;
    int status;
    pid_t w = waitpid(pid_, &status, WNOHANG);
    if (w == 0) return true;
    pid_ = -1;
    return false;
  }

 private:
  pid_t pid_ = -1;
  int stdin_fd_ = -1;
  int stdout_fd_ = -1;
  int stderr_fd_ = -1;
  std::string line_buf_;

  static void CloseFd(int& fd) {
    if (fd >= 0) {
      close(fd);  // NOLINT
      fd = -1;
    }
  }

  static std::string ReadAllFd(int fd) {
    std::string result;
    if (fd < 0) return result;
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
      fcntl(fd, F_SETFL, flags & ~O_NONBLOCK);
    }
    char buf[4096];
    for (;;) {
      ssize_t n = read(fd, buf, sizeof(buf));
      if (n < 0 && errno == EINTR) continue;
      if (n <= 0) break;
      result.append(buf, static_cast<size_t>(n));
    }
    return result;
  }

  static void FillWaitResult(int status, WaitResult& wr) {
    if (WIFEXITED(status)) {
      wr.exited = true;
      wr.exit_code = WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
      wr.signaled = true;
      wr.term_signal = WTERMSIG(status);
    }
  }
};

}  // namespace orca

#endif  // defined(ORCA_PLATFORM_POSIX)

#endif  // ORCA_PROCESS_HPP_
