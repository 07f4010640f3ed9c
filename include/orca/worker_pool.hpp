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
 * @file worker_pool.hpp
 * @brief Pool of long-lived bash sessions keyed by working directory.
 *
 * Architecture:
 *
 *   Checkout(dir) ──> idle worker for dir?         ──> lease (reused)
 *                 ├─> below capacity_per_key?       ──> spawn pooled worker
 *                 ├─> wait up to checkout_wait for a Checkin
 *                 └─> still nothing                 ──> spawn transient worker
 *
 *   Execute(lease, argv) runs one command in the lease's session.
 *   Checkin(lease) returns pooled workers to Idle; transient and Dead
 *   workers are destroyed and their slots freed.
 *
 * Session protocol (one bash process per worker, stderr silenced):
 *   startup:  printf '__ORCA_READY__\n'
 *   command:  ( cd -- DIR && exec ARGV ) >OUT 2>ERR </dev/null;
 *             printf '__ORCA_DONE__ TOKEN %d\n' "$?"
 *   probe:    printf '__ORCA_HEALTHY__\n'
 *   shutdown: exit 0
 *
 * stdout and stderr of the command land in temporary files so that the
 * session's own stdout carries nothing but protocol markers. A transport
 * failure or command timeout marks the worker Dead and kills its process
 * group; a non-zero exit is a normal result.
 *
 * Housekeeping runs on a TimerScheduler: idle workers older than
 * idle_timeout are reaped, idle workers are probed every
 * health_check_interval.
 */

#ifndef ORCA_WORKER_POOL_HPP_
#define ORCA_WORKER_POOL_HPP_

#include "orca/log.hpp"
#include "orca/process.hpp"
#include "orca/timer.hpp"
#include "orca/vocabulary.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <climits>
#include <unistd.h>

namespace orca {

// ============================================================================
// WorkerHealth / WorkerError
// ============================================================================

enum class WorkerHealth : uint8_t {
  kIdle = 0,
  kInUse,
  kDead,
};

inline const char* WorkerHealthName(WorkerHealth h) noexcept {
  switch (h) {
    case WorkerHealth::kIdle:
      return "idle";
    case WorkerHealth::kInUse:
      return "in_use";
    case WorkerHealth::kDead:
      return "dead";
  }
  return "unknown";
}

enum class WorkerError : uint8_t {
  kSpawnFailed = 0,   ///< Session could not be started or never became ready
  kTimeout,           ///< Command exceeded command_timeout
  kProcessDied,       ///< Session exited or closed its pipe mid-command
  kProtocol,          ///< Malformed protocol marker or temp file failure
  kPoolFull,          ///< Transient cap reached, or pool shut down
  kWorkingDirectory,  ///< Working directory missing or not a directory
};

inline const char* WorkerErrorMessage(WorkerError e) noexcept {
  switch (e) {
    case WorkerError::kSpawnFailed:
      return "failed to spawn worker session";
    case WorkerError::kTimeout:
      return "command timed out";
    case WorkerError::kProcessDied:
      return "worker session died unexpectedly";
    case WorkerError::kProtocol:
      return "worker session protocol error";
    case WorkerError::kPoolFull:
      return "worker pool is at capacity";
    case WorkerError::kWorkingDirectory:
      return "working directory access error";
  }
  return "unknown worker error";
}

/// @brief Transient conditions; retrying later may succeed.
inline constexpr bool IsRecoverable(WorkerError e) noexcept {
  return e == WorkerError::kTimeout || e == WorkerError::kPoolFull ||
         e == WorkerError::kProcessDied;
}

inline constexpr bool IsResourceExhaustion(WorkerError e) noexcept {
  return e == WorkerError::kTimeout || e == WorkerError::kPoolFull;
}

inline constexpr bool IsIoError(WorkerError e) noexcept {
  return e == WorkerError::kSpawnFailed || e == WorkerError::kWorkingDirectory;
}

inline const char* WorkerErrorCategory(WorkerError e) noexcept {
  switch (e) {
    case WorkerError::kSpawnFailed:
    case WorkerError::kWorkingDirectory:
      return "IO";
    case WorkerError::kTimeout:
      return "TIMEOUT";
    case WorkerError::kProcessDied:
      return "PROCESS";
    case WorkerError::kProtocol:
      return "SERIALIZATION";
    case WorkerError::kPoolFull:
      return "RESOURCE";
  }
  return "UNKNOWN";
}

inline log::Level WorkerErrorSeverity(WorkerError e) noexcept {
  return IsResourceExhaustion(e) ? log::Level::kWarn : log::Level::kError;
}

// ============================================================================
// Configuration / results
// ============================================================================

struct PoolConfig {
  uint32_t capacity_per_key{2U};
  uint32_t max_total_workers{20U};
  uint32_t max_transient_workers{16U};
  std::chrono::milliseconds idle_timeout{std::chrono::minutes(30)};
  std::chrono::milliseconds reap_interval{std::chrono::minutes(5)};
  std::chrono::milliseconds health_check_interval{std::chrono::minutes(1)};
  std::chrono::milliseconds spawn_timeout{std::chrono::seconds(5)};
  std::chrono::milliseconds command_timeout{std::chrono::minutes(5)};
  std::chrono::milliseconds checkout_wait{100};
  std::chrono::milliseconds health_probe_timeout{std::chrono::seconds(2)};
  std::string shell{"/bin/bash"};
  bool enabled{true};
};

struct CommandOutput {
  int exit_code = -1;
  std::string stdout_text;
  std::string stderr_text;
  std::chrono::milliseconds duration{0};

  bool Succeeded() const noexcept { return exit_code == 0; }
};

/**
 * @brief Reported form of a command's two output channels.
 *
 * diagnostics is non-empty only when both channels had content; otherwise
 * whichever channel had content is the single output.
 */
struct MergedOutput {
  std::string output;
  std::string diagnostics;
};

inline MergedOutput MergeOutput(const std::string& primary,
                                const std::string& diagnostic) {
  MergedOutput m;
  if (primary.empty()) {
    m.output = diagnostic;
  } else {
    m.output = primary;
    m.diagnostics = diagnostic;
  }
  return m;
}

inline MergedOutput MergeOutput(const CommandOutput& out) {
  return MergeOutput(out.stdout_text, out.stderr_text);
}

struct PoolStats {
  size_t pools = 0;             ///< Working directories with pooled workers
  size_t pooled_workers = 0;
  size_t idle = 0;
  size_t in_use = 0;
  size_t transient_active = 0;
  uint64_t spawned = 0;         ///< Pooled workers spawned
  uint64_t reused = 0;          ///< Checkouts served by an idle worker
  uint64_t transient_spawned = 0;
  uint64_t discarded = 0;       ///< Dead, reaped or shut-down pooled workers
  uint32_t capacity_per_key = 0;
  uint32_t max_total_workers = 0;
};

// ============================================================================
// Helpers
// ============================================================================

/// @brief Single-quote @p arg for bash: it's -> 'it'\''s'.
inline std::string ShellQuote(const std::string& arg) {
  std::string out = "'";
  for (char c : arg) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

namespace detail {

inline bool ReadWholeFile(const std::string& path, std::string& out) {
  FILE* f = std::fopen(path.c_str(), "rb");
  if (f == nullptr) return false;
  char buf[8192];
  size_t n;
  while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0U) {
    out.append(buf, n);
  }
  std::fclose(f);
  return true;
}

/// @brief Create an empty temp file; returns its path or "" on failure.
inline std::string MakeTempFile(const char* tag) {
  const char* tmp = std::getenv("TMPDIR");
  std::string tmpl = (tmp != nullptr && tmp[0] != '\0') ? tmp : "/tmp";
  tmpl += "/orca-";
  tmpl += tag;
  tmpl += "-XXXXXX";
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
  int fd = ::mkstemp(buf.data());
  if (fd < 0) return std::string();
  ::close(fd);  // NOLINT
  return std::string(buf.data());
}

inline std::string CanonicalDir(const std::string& dir) {
  char resolved[PATH_MAX];
  if (::realpath(dir.c_str(), resolved) != nullptr) {
    return std::string(resolved);
  }
  return dir;
}

inline uint32_t ToMs(std::chrono::milliseconds d) {
  if (d.count() <= 0) return 1U;
  if (d.count() > static_cast<int64_t>(UINT32_MAX)) return UINT32_MAX;
  return static_cast<uint32_t>(d.count());
}

constexpr const char* kReadyMarker = "__ORCA_READY__";
constexpr const char* kHealthyMarker = "__ORCA_HEALTHY__";
constexpr const char* kDoneMarker = "__ORCA_DONE__";

}  // namespace detail

// ============================================================================
// PooledWorker
// ============================================================================

/**
 * @brief One bash session bound to one working directory.
 *
 * Health is owned by the pool (changed under the pool lock). The session
 * itself is only touched by the current lease holder, or by the pool while
 * the worker is reserved for a probe.
 */
class PooledWorker final {
 public:
  using SteadyTimePoint = std::chrono::steady_clock::time_point;

  PooledWorker(std::string working_dir, bool pooled, uint64_t serial)
      : working_dir_(std::move(working_dir)), pooled_(pooled), serial_(serial) {}

  ~PooledWorker() { proc_.Kill(); }

  PooledWorker(const PooledWorker&) = delete;
  PooledWorker& operator=(const PooledWorker&) = delete;
  PooledWorker(PooledWorker&&) = delete;
  PooledWorker& operator=(PooledWorker&&) = delete;

  /// @brief Start the session and wait for the ready marker.
  expected<void, WorkerError> Spawn(const PoolConfig& cfg) {
    SubprocessConfig pc;
    pc.argv = {cfg.shell, "--noprofile", "--norc"};
    pc.working_dir = working_dir_;
    pc.pipe_stdin = true;
    pc.capture_stdout = true;
    pc.discard_stderr = true;
    if (proc_.Start(pc) != ProcessResult::kSuccess) {
      broken_ = true;
      return expected<void, WorkerError>::error(WorkerError::kSpawnFailed);
    }

    std::string line;
    ProcessResult r = proc_.WriteStdin(std::string("printf '") +
                                       detail::kReadyMarker + "\\n'\n");
    if (r == ProcessResult::kSuccess) {
      r = proc_.ReadLine(line, detail::ToMs(cfg.spawn_timeout));
    }
    if (r != ProcessResult::kSuccess || line != detail::kReadyMarker) {
      ORCA_LOG_WARN("WorkerPool", "worker #%llu in %s failed handshake",
                    static_cast<unsigned long long>(serial_), working_dir_.c_str());
      broken_ = true;
      proc_.Kill();
      return expected<void, WorkerError>::error(WorkerError::kSpawnFailed);
    }
    ORCA_LOG_DEBUG("WorkerPool", "worker #%llu ready in %s (pid %d, %s)",
                   static_cast<unsigned long long>(serial_), working_dir_.c_str(),
                   static_cast<int>(proc_.GetPid()),
                   pooled_ ? "pooled" : "transient");
    return expected<void, WorkerError>::success();
  }

  /**
   * @brief Run @p argv in the session.
   *
   * A non-zero exit status is a successful Execute. Any transport failure
   * or timeout marks the worker broken and kills the session.
   */
  expected<CommandOutput, WorkerError> Execute(const std::vector<std::string>& argv,
                                               std::chrono::milliseconds timeout) {
    using Result = expected<CommandOutput, WorkerError>;
    if (argv.empty()) {
      return Result::error(WorkerError::kProtocol);
    }
    if (broken_) {
      return Result::error(WorkerError::kProcessDied);
    }

    const std::string out_path = detail::MakeTempFile("out");
    const std::string err_path = detail::MakeTempFile("err");
    ORCA_SCOPE_EXIT({
      if (!out_path.empty()) ::unlink(out_path.c_str());
      if (!err_path.empty()) ::unlink(err_path.c_str());
    });
    if (out_path.empty() || err_path.empty()) {
      return Result::error(WorkerError::kProtocol);
    }

    const std::string token = std::to_string(++command_seq_);
    std::string line = "( cd -- " + ShellQuote(working_dir_) + " && exec";
    for (const auto& arg : argv) {
      line += " ";
      line += ShellQuote(arg);
    }
    line += " ) >" + ShellQuote(out_path) + " 2>" + ShellQuote(err_path) +
            " </dev/null; printf '" + detail::kDoneMarker + " " + token +
            " %d\\n' \"$?\"\n";

    const auto start = std::chrono::steady_clock::now();
    if (proc_.WriteStdin(line) != ProcessResult::kSuccess) {
      MarkBroken("stdin write failed");
      return Result::error(WorkerError::kProcessDied);
    }

    const std::string expect_prefix = std::string(detail::kDoneMarker) + " " + token + " ";
    const auto deadline = start + timeout;
    int exit_code = -1;
    for (;;) {
      std::string reply;
      const int64_t left = detail::RemainingMs(deadline);
      const auto remaining = static_cast<uint32_t>(
          std::min<int64_t>(left, static_cast<int64_t>(UINT32_MAX)));
      ProcessResult r = (remaining == 0U) ? ProcessResult::kTimeout
                                          : proc_.ReadLine(reply, remaining);
      if (r == ProcessResult::kTimeout) {
        MarkBroken("command timed out");
        return Result::error(WorkerError::kTimeout);
      }
      if (r != ProcessResult::kSuccess) {
        MarkBroken("session closed");
        return Result::error(WorkerError::kProcessDied);
      }
      if (reply.compare(0, expect_prefix.size(), expect_prefix) != 0) {
        // Stray output from the session itself; keep reading.
        continue;
      }
      char* end = nullptr;
      const char* code_str = reply.c_str() + expect_prefix.size();
      long code = std::strtol(code_str, &end, 10);
      if (end == code_str) {
        MarkBroken("malformed completion marker");
        return Result::error(WorkerError::kProtocol);
      }
      exit_code = static_cast<int>(code);
      break;
    }

    CommandOutput out;
    out.exit_code = exit_code;
    out.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    if (!detail::ReadWholeFile(out_path, out.stdout_text) ||
        !detail::ReadWholeFile(err_path, out.stderr_text)) {
      return Result::error(WorkerError::kProtocol);
    }
    last_used_ = std::chrono::steady_clock::now();
    return Result::success(std::move(out));
  }

  /// @brief Round-trip a probe marker. Marks the worker broken on failure.
  bool HealthCheck(std::chrono::milliseconds timeout) {
    if (broken_) return false;
    std::string reply;
    ProcessResult r = proc_.WriteStdin(std::string("printf '") +
                                       detail::kHealthyMarker + "\\n'\n");
    if (r == ProcessResult::kSuccess) {
      r = proc_.ReadLine(reply, detail::ToMs(timeout));
    }
    if (r != ProcessResult::kSuccess || reply != detail::kHealthyMarker) {
      MarkBroken("health probe failed");
      return false;
    }
    return true;
  }

  /// @brief Ask the session to exit, then make sure it is gone.
  void Terminate() {
    if (!broken_ && proc_.WriteStdin("exit 0\n") == ProcessResult::kSuccess) {
      proc_.CloseStdin();
      (void)proc_.Wait(200);
    }
    proc_.Kill();
  }

  const std::string& working_dir() const noexcept { return working_dir_; }
  bool pooled() const noexcept { return pooled_; }
  bool broken() const noexcept { return broken_; }
  uint64_t serial() const noexcept { return serial_; }
  pid_t pid() const { return proc_.GetPid(); }
  SteadyTimePoint last_used() const noexcept { return last_used_; }

 private:
  friend class WorkerPool;

  void MarkBroken(const char* why) {
    ORCA_LOG_WARN("WorkerPool", "worker #%llu in %s marked dead: %s",
                  static_cast<unsigned long long>(serial_), working_dir_.c_str(), why);
    broken_ = true;
    proc_.Kill();
  }

  std::string working_dir_;
  bool pooled_;
  uint64_t serial_;
  Subprocess proc_;
  bool broken_ = false;
  uint64_t command_seq_ = 0;
  SteadyTimePoint last_used_ = std::chrono::steady_clock::now();

  // Guarded by the owning pool's mutex.
  WorkerHealth health_ = WorkerHealth::kInUse;
  SteadyTimePoint idle_since_ = std::chrono::steady_clock::now();
};

class WorkerPool;

// ============================================================================
// WorkerLease
// ============================================================================

/**
 * @brief Exclusive hold on one worker for one command.
 *
 * Move-only. A lease that is destroyed without an explicit Checkin checks
 * itself in.
 */
class WorkerLease final {
 public:
  WorkerLease() = default;
  ~WorkerLease();

  WorkerLease(WorkerLease&& other) noexcept
      : pool_(other.pool_),
        worker_(other.worker_),
        transient_(std::move(other.transient_)) {
    other.pool_ = nullptr;
    other.worker_ = nullptr;
  }

  WorkerLease& operator=(WorkerLease&& other) = delete;
  WorkerLease(const WorkerLease&) = delete;
  WorkerLease& operator=(const WorkerLease&) = delete;

  bool valid() const noexcept { return worker_ != nullptr; }
  PooledWorker* worker() const noexcept { return worker_; }
  bool transient() const noexcept { return transient_ != nullptr; }

 private:
  friend class WorkerPool;

  WorkerLease(WorkerPool* pool, PooledWorker* worker) : pool_(pool), worker_(worker) {}
  WorkerLease(WorkerPool* pool, std::unique_ptr<PooledWorker> transient)
      : pool_(pool), worker_(transient.get()), transient_(std::move(transient)) {}

  WorkerPool* pool_ = nullptr;
  PooledWorker* worker_ = nullptr;
  std::unique_ptr<PooledWorker> transient_;
};

// ============================================================================
// WorkerPool
// ============================================================================

class WorkerPool final {
 public:
  explicit WorkerPool(const PoolConfig& cfg = PoolConfig{})
      : cfg_(cfg), maintenance_(2) {
    if (cfg_.capacity_per_key == 0U) cfg_.capacity_per_key = 1U;
  }

  ~WorkerPool() { Shutdown(); }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

  const PoolConfig& config() const noexcept { return cfg_; }

  /// @brief Arm the idle reaper and the health probe.
  expected<void, TimerError> Start() {
    if (!cfg_.enabled) {
      return expected<void, TimerError>::success();
    }
    auto reap = maintenance_.Add(detail::ToMs(cfg_.reap_interval),
                                 &WorkerPool::ReapTick, this);
    if (!reap.has_value()) {
      return expected<void, TimerError>::error(reap.get_error());
    }
    auto probe = maintenance_.Add(detail::ToMs(cfg_.health_check_interval),
                                  &WorkerPool::HealthTick, this);
    if (!probe.has_value()) {
      return expected<void, TimerError>::error(probe.get_error());
    }
    return maintenance_.Start();
  }

  // ======================== Checkout / Execute / Checkin ========================

  /**
   * @brief Hand out a worker bound to @p working_dir.
   *
   * Never returns a worker that is already in use. Blocks at most
   * checkout_wait (plus spawn time) before falling back to a transient
   * worker.
   */
  expected<WorkerLease, WorkerError> Checkout(const std::string& working_dir) {
    using Result = expected<WorkerLease, WorkerError>;
    if (!IsDirectory(working_dir)) {
      ORCA_LOG_WARN("WorkerPool", "working directory %s does not exist",
                    working_dir.c_str());
      return Result::error(WorkerError::kWorkingDirectory);
    }
    const std::string key = detail::CanonicalDir(working_dir);
    const auto deadline = std::chrono::steady_clock::now() + cfg_.checkout_wait;

    std::unique_lock<std::mutex> lock(mutex_);
    while (!shutdown_ && cfg_.enabled) {
      auto& workers = pools_[key];
      for (auto& w : workers) {
        if (w->health_ == WorkerHealth::kIdle) {
          w->health_ = WorkerHealth::kInUse;
          ++reused_;
          return Result::success(WorkerLease(this, w.get()));
        }
      }

      if (workers.size() < cfg_.capacity_per_key &&
          PooledCountLocked() < cfg_.max_total_workers) {
        workers.push_back(std::make_unique<PooledWorker>(key, true, ++serial_));
        PooledWorker* raw = workers.back().get();
        lock.unlock();
        auto spawned = raw->Spawn(cfg_);
        lock.lock();
        if (!spawned.has_value()) {
          std::unique_ptr<PooledWorker> doomed = DetachLocked(raw);
          cv_.notify_all();
          lock.unlock();
          return Result::error(spawned.get_error());
        }
        ++spawned_;
        return Result::success(WorkerLease(this, raw));
      }

      if (std::chrono::steady_clock::now() >= deadline) break;
      (void)cv_.wait_until(lock, deadline);
    }

    if (shutdown_) {
      return Result::error(WorkerError::kPoolFull);
    }
    if (transient_active_ >= cfg_.max_transient_workers) {
      ORCA_LOG_WARN("WorkerPool", "transient worker cap (%u) reached for %s",
                    cfg_.max_transient_workers, key.c_str());
      return Result::error(WorkerError::kPoolFull);
    }
    ++transient_active_;
    ++transient_spawned_;
    const uint64_t serial = ++serial_;
    lock.unlock();

    auto worker = std::make_unique<PooledWorker>(key, false, serial);
    auto spawned = worker->Spawn(cfg_);
    if (!spawned.has_value()) {
      std::lock_guard<std::mutex> relock(mutex_);
      --transient_active_;
      return Result::error(spawned.get_error());
    }
    ORCA_LOG_DEBUG("WorkerPool", "serving %s with transient worker #%llu",
                   key.c_str(), static_cast<unsigned long long>(serial));
    return Result::success(WorkerLease(this, std::move(worker)));
  }

  /// @brief Run @p argv on the leased worker, bounded by command_timeout.
  expected<CommandOutput, WorkerError> Execute(WorkerLease& lease,
                                               const std::vector<std::string>& argv) {
    if (!lease.valid() || lease.pool_ != this) {
      return expected<CommandOutput, WorkerError>::error(WorkerError::kProtocol);
    }
    return lease.worker()->Execute(argv, cfg_.command_timeout);
  }

  /**
   * @brief Return the leased worker. Idempotent on an emptied lease.
   */
  void Checkin(WorkerLease& lease) {
    if (!lease.valid() || lease.pool_ != this) return;
    PooledWorker* w = lease.worker_;
    std::unique_ptr<PooledWorker> transient = std::move(lease.transient_);
    lease.pool_ = nullptr;
    lease.worker_ = nullptr;

    std::unique_ptr<PooledWorker> doomed;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (transient) {
        --transient_active_;
      } else if (w->broken() || shutdown_) {
        w->health_ = WorkerHealth::kDead;
        doomed = DetachLocked(w);
        ++discarded_;
      } else {
        w->health_ = WorkerHealth::kIdle;
        w->idle_since_ = std::chrono::steady_clock::now();
      }
    }
    cv_.notify_all();

    if (transient) transient->Terminate();
    if (doomed) doomed->Terminate();
  }

  /// @brief Checkout + Execute + Checkin.
  expected<CommandOutput, WorkerError> Run(const std::string& working_dir,
                                           const std::vector<std::string>& argv) {
    auto lease = Checkout(working_dir);
    if (!lease.has_value()) {
      return expected<CommandOutput, WorkerError>::error(lease.get_error());
    }
    auto result = Execute(lease.value(), argv);
    Checkin(lease.value());
    return result;
  }

  // ======================== Maintenance ========================

  /// @brief Destroy idle pooled workers older than idle_timeout.
  size_t ReapIdle() {
    std::vector<std::unique_ptr<PooledWorker>> doomed;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      const auto now = std::chrono::steady_clock::now();
      for (auto it = pools_.begin(); it != pools_.end();) {
        auto& workers = it->second;
        for (auto wit = workers.begin(); wit != workers.end();) {
          PooledWorker* w = wit->get();
          if (w->health_ == WorkerHealth::kIdle &&
              now - w->idle_since_ > cfg_.idle_timeout) {
            doomed.push_back(std::move(*wit));
            wit = workers.erase(wit);
          } else {
            ++wit;
          }
        }
        it = workers.empty() ? pools_.erase(it) : std::next(it);
      }
      discarded_ += doomed.size();
    }
    for (auto& w : doomed) {
      ORCA_LOG_DEBUG("WorkerPool", "reaping idle worker #%llu in %s",
                     static_cast<unsigned long long>(w->serial()),
                     w->working_dir().c_str());
      w->Terminate();
    }
    if (!doomed.empty()) cv_.notify_all();
    return doomed.size();
  }

  /// @brief Probe every idle worker; destroy the unresponsive ones.
  size_t HealthCheckIdle() {
    std::vector<PooledWorker*> probing;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (auto& kv : pools_) {
        for (auto& w : kv.second) {
          if (w->health_ == WorkerHealth::kIdle) {
            w->health_ = WorkerHealth::kInUse;
            probing.push_back(w.get());
          }
        }
      }
    }

    std::vector<PooledWorker*> failed;
    for (PooledWorker* w : probing) {
      if (!w->HealthCheck(cfg_.health_probe_timeout)) failed.push_back(w);
    }

    std::vector<std::unique_ptr<PooledWorker>> doomed;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (PooledWorker* w : probing) {
        if (w->broken() || shutdown_) {
          w->health_ = WorkerHealth::kDead;
          doomed.push_back(DetachLocked(w));
          ++discarded_;
        } else {
          w->health_ = WorkerHealth::kIdle;
        }
      }
    }
    cv_.notify_all();
    for (auto& w : doomed) {
      if (w) w->Terminate();
    }
    return failed.size();
  }

  PoolStats Stats() const {
    PoolStats st;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& kv : pools_) {
      if (!kv.second.empty()) ++st.pools;
      for (const auto& w : kv.second) {
        ++st.pooled_workers;
        if (w->health_ == WorkerHealth::kIdle) ++st.idle;
        if (w->health_ == WorkerHealth::kInUse) ++st.in_use;
      }
    }
    st.transient_active = transient_active_;
    st.spawned = spawned_;
    st.reused = reused_;
    st.transient_spawned = transient_spawned_;
    st.discarded = discarded_;
    st.capacity_per_key = cfg_.capacity_per_key;
    st.max_total_workers = cfg_.max_total_workers;
    return st;
  }

  /// @brief Pooled workers currently bound to @p working_dir.
  size_t WorkerCount(const std::string& working_dir) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pools_.find(detail::CanonicalDir(working_dir));
    return (it == pools_.end()) ? 0U : it->second.size();
  }

  /**
   * @brief Stop maintenance and terminate idle workers.
   *
   * Workers still leased are destroyed at their Checkin. Idempotent.
   */
  void Shutdown() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (shutdown_) return;
      shutdown_ = true;
    }
    maintenance_.Stop();

    std::vector<std::unique_ptr<PooledWorker>> doomed;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (auto& kv : pools_) {
        auto& workers = kv.second;
        for (auto wit = workers.begin(); wit != workers.end();) {
          if ((*wit)->health_ == WorkerHealth::kIdle) {
            doomed.push_back(std::move(*wit));
            wit = workers.erase(wit);
          } else {
            ++wit;
          }
        }
      }
      discarded_ += doomed.size();
    }
    cv_.notify_all();
    for (auto& w : doomed) w->Terminate();
    ORCA_LOG_INFO("WorkerPool", "shut down (%zu idle workers terminated)",
                  doomed.size());
  }

 private:
  using WorkerList = std::vector<std::unique_ptr<PooledWorker>>;

  size_t PooledCountLocked() const {
    size_t n = 0;
    for (const auto& kv : pools_) n += kv.second.size();
    return n;
  }

  /// @brief Remove @p w from its key's list and hand ownership back.
  std::unique_ptr<PooledWorker> DetachLocked(PooledWorker* w) {
    auto it = pools_.find(w->working_dir());
    if (it == pools_.end()) return nullptr;
    auto& workers = it->second;
    for (auto wit = workers.begin(); wit != workers.end(); ++wit) {
      if (wit->get() == w) {
        std::unique_ptr<PooledWorker> owned = std::move(*wit);
        workers.erase(wit);
        if (workers.empty()) pools_.erase(it);
        return owned;
      }
    }
    return nullptr;
  }

  static void ReapTick(void* ctx) { static_cast<WorkerPool*>(ctx)->ReapIdle(); }
  static void HealthTick(void* ctx) {
    static_cast<WorkerPool*>(ctx)->HealthCheckIdle();
  }

  PoolConfig cfg_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::unordered_map<std::string, WorkerList> pools_;
  size_t transient_active_ = 0;
  uint64_t serial_ = 0;
  uint64_t spawned_ = 0;
  uint64_t reused_ = 0;
  uint64_t transient_spawned_ = 0;
  uint64_t discarded_ = 0;
  bool shutdown_ = false;
  TimerScheduler maintenance_;

  friend class WorkerLease;
};

inline WorkerLease::~WorkerLease() {
  if (pool_ != nullptr && worker_ != nullptr) {
    pool_->Checkin(*this);
  }
}

}  // namespace orca

#endif  // ORCA_WORKER_POOL_HPP_
