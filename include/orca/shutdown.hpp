/**
 * @file shutdown.hpp
 * @brief SIGINT/SIGTERM handling for the orchestrator server.
 *
 * The signal handler only stores a flag and writes one byte to a self-pipe.
 * The server polls WakeupFd() next to stdin, so a signal interrupts the
 * read loop without any work in signal context. Cleanup callbacks run once,
 * in LIFO order, from RunCallbacks().
 */

#ifndef ORCA_SHUTDOWN_HPP_
#define ORCA_SHUTDOWN_HPP_

#include "orca/platform.hpp"
#include "orca/vocabulary.hpp"

#include <atomic>
#include <csignal>
#include <cstdint>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace orca {

enum class ShutdownError : uint8_t {
  kCallbacksFull = 0,
  kPipeCreationFailed,
  kSignalInstallFailed,
  kAlreadyInstantiated,
};

/// @brief Cleanup callback. Receives the signal number (0 for manual).
using ShutdownFn = void (*)(int signo, void* ctx);

class ShutdownManager;

namespace detail {

/// Exactly one ShutdownManager may own the signal handlers.
inline ShutdownManager*& GetShutdownInstance() {
  static ShutdownManager* ptr = nullptr;
  return ptr;
}

}  // namespace detail

/**
 * @code
 *   orca::ShutdownManager mgr;
 *   mgr.Register([](int, void* d) { static_cast<Dispatcher*>(d)->Shutdown(); },
 *                &dispatcher);
 *   mgr.InstallSignalHandlers();
 *   ... poll(stdin, mgr.WakeupFd()) ...
 *   mgr.RunCallbacks();
 * @endcode
 */
class ShutdownManager final {
 public:
  explicit ShutdownManager(uint32_t max_callbacks = 16) : max_callbacks_(max_callbacks) {
    if (detail::GetShutdownInstance() != nullptr) {
      return;
    }
    if (::pipe(pipe_fd_) != 0) {
      pipe_fd_[0] = -1;
      pipe_fd_[1] = -1;
      return;
    }
    for (int fd : pipe_fd_) {
      ::fcntl(fd, F_SETFD, FD_CLOEXEC);
      ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK);
    }
    detail::GetShutdownInstance() = this;
    valid_ = true;
  }

  ~ShutdownManager() {
    if (detail::GetShutdownInstance() == this) {
      RestoreSignalHandlers();
      detail::GetShutdownInstance() = nullptr;
    }
    if (pipe_fd_[0] >= 0) ::close(pipe_fd_[0]);
    if (pipe_fd_[1] >= 0) ::close(pipe_fd_[1]);
  }

  ShutdownManager(const ShutdownManager&) = delete;
  ShutdownManager& operator=(const ShutdownManager&) = delete;
  ShutdownManager(ShutdownManager&&) = delete;
  ShutdownManager& operator=(ShutdownManager&&) = delete;

  /// @brief False for a second instance or when the pipe could not be made.
  bool IsValid() const noexcept { return valid_; }

  expected<void, ShutdownError> Register(ShutdownFn fn, void* ctx = nullptr) {
    if (!valid_) {
      return expected<void, ShutdownError>::error(ShutdownError::kAlreadyInstantiated);
    }
    if (fn == nullptr || callbacks_.size() >= max_callbacks_) {
      return expected<void, ShutdownError>::error(ShutdownError::kCallbacksFull);
    }
    callbacks_.push_back(Callback{fn, ctx});
    return expected<void, ShutdownError>::success();
  }

  expected<void, ShutdownError> InstallSignalHandlers() {
    if (!valid_) {
      return expected<void, ShutdownError>::error(ShutdownError::kAlreadyInstantiated);
    }
    struct sigaction sa;
    sa.sa_handler = &ShutdownManager::SignalHandler;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (::sigaction(SIGINT, &sa, &old_int_) != 0 ||
        ::sigaction(SIGTERM, &sa, &old_term_) != 0) {
      return expected<void, ShutdownError>::error(ShutdownError::kSignalInstallFailed);
    }
    installed_ = true;
    return expected<void, ShutdownError>::success();
  }

  /// @brief Request shutdown from normal code (e.g. stdin closed).
  void Quit(int signo = 0) noexcept {
    bool expected_val = false;
    if (shutdown_flag_.compare_exchange_strong(expected_val, true)) {
      signo_.store(signo, std::memory_order_relaxed);
      Wake();
    }
  }

  bool IsShutdownRequested() const noexcept { return shutdown_flag_.load(); }

  /// @brief Readable once shutdown has been requested.
  int WakeupFd() const noexcept { return pipe_fd_[0]; }

  /// @brief Block until shutdown is requested or @p timeout_ms passes (-1: forever).
  bool WaitForShutdown(int timeout_ms = -1) const {
    if (shutdown_flag_.load()) return true;
    if (pipe_fd_[0] < 0) return false;
    struct pollfd pfd;
    pfd.fd = pipe_fd_[0];
    pfd.events = POLLIN;
    pfd.revents = 0;
    (void)::poll(&pfd, 1, timeout_ms);
    return shutdown_flag_.load();
  }

  /// @brief Run registered callbacks in LIFO order. Only the first call runs them.
  void RunCallbacks() {
    bool expected_val = false;
    if (!callbacks_ran_.compare_exchange_strong(expected_val, true)) return;
    const int signo = signo_.load(std::memory_order_relaxed);
    for (auto it = callbacks_.rbegin(); it != callbacks_.rend(); ++it) {
      it->fn(signo, it->ctx);
    }
  }

  int Signal() const noexcept { return signo_.load(std::memory_order_relaxed); }

 private:
  struct Callback {
    ShutdownFn fn;
    void* ctx;
  };

  void Wake() noexcept {
    if (pipe_fd_[1] >= 0) {
      const uint8_t byte = 1;
      // A full pipe already signals readiness.
      (void)::write(pipe_fd_[1], &byte, 1);
    }
  }

  void RestoreSignalHandlers() noexcept {
    if (!installed_) return;
    (void)::sigaction(SIGINT, &old_int_, nullptr);
    (void)::sigaction(SIGTERM, &old_term_, nullptr);
    installed_ = false;
  }

  /// Async-signal-safe: atomic stores and write(2) only.
  static void SignalHandler(int signo) {
    ShutdownManager* self = detail::GetShutdownInstance();
    if (self != nullptr) {
      self->signo_.store(signo, std::memory_order_relaxed);
      self->shutdown_flag_.store(true);
      self->Wake();
    }
  }

  std::vector<Callback> callbacks_;
  uint32_t max_callbacks_;
  std::atomic<bool> shutdown_flag_{false};
  std::atomic<bool> callbacks_ran_{false};
  std::atomic<int> signo_{0};
  int pipe_fd_[2] = {-1, -1};
  struct sigaction old_int_ {};
  struct sigaction old_term_ {};
  bool installed_ = false;
  bool valid_ = false;
};

}  // namespace orca

#endif  // ORCA_SHUTDOWN_HPP_
