/**
 * @file notifier.hpp
 * @brief Progress events for background operations and their delivery.
 *
 * A background operation emits, in order:
 *
 *   Started ──> (Progress | Output)* ──> Completed
 *
 * NotificationDispatcher keeps one phase per operation id and suppresses any
 * event that is out of order or repeats a once-only kind. Phases advance on
 * the delivery attempt, not on its success, so a failed Started is never
 * retried. Delivery failures are classified as CallbackError and logged at
 * the error's severity; they never affect the operation itself.
 */

#ifndef ORCA_NOTIFIER_HPP_
#define ORCA_NOTIFIER_HPP_

#include "orca/callback_error.hpp"
#include "orca/log.hpp"
#include "orca/operation.hpp"
#include "orca/vocabulary.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>

namespace orca {

// ============================================================================
// ProgressUpdate
// ============================================================================

namespace progress {

struct Started {
  std::string operation_id;
  std::string command;
  std::string description;
};

struct Progress {
  std::string operation_id;
  std::string message;
  std::optional<double> percentage;
  std::optional<std::string> current_step;
};

/// One line of command output from a publisher that streams it. The
/// dispatcher does not: it reads output once the command exits and
/// reports it in Completed::report.
struct Output {
  std::string operation_id;
  std::string line;
  bool is_stderr = false;
};

struct Completed {
  std::string operation_id;
  OperationState state = OperationState::kCompleted;
  std::string message;
  std::chrono::milliseconds duration{0};
  std::string report;  ///< Full result text, as `wait` would render it
};

}  // namespace progress

using ProgressUpdate = std::variant<progress::Started, progress::Progress,
                                    progress::Output, progress::Completed>;

inline const std::string& OperationIdOf(const ProgressUpdate& update) {
  return std::visit(
      [](const auto& u) -> const std::string& { return u.operation_id; }, update);
}

inline const char* UpdateKindName(const ProgressUpdate& update) noexcept {
  switch (update.index()) {
    case 0:
      return "started";
    case 1:
      return "progress";
    case 2:
      return "output";
    case 3:
      return "completed";
    default:
      return "unknown";
  }
}

/// @brief Single-line human rendering, used by LoggingSender and the server.
inline std::string ToString(const ProgressUpdate& update) {
  return std::visit(
      [](const auto& u) -> std::string {
        using T = std::decay_t<decltype(u)>;
        if constexpr (std::is_same_v<T, progress::Started>) {
          return "[" + u.operation_id + "] started: " + u.command + " (" +
                 u.description + ")";
        } else if constexpr (std::is_same_v<T, progress::Progress>) {
          std::string s = "[" + u.operation_id + "] " + u.message;
          if (u.percentage.has_value()) {
            char pct[32];
            std::snprintf(pct, sizeof(pct), " (%.1f%%)", *u.percentage);
            s += pct;
          }
          if (u.current_step.has_value()) s += " step: " + *u.current_step;
          return s;
        } else if constexpr (std::is_same_v<T, progress::Output>) {
          return "[" + u.operation_id + "] " + (u.is_stderr ? "stderr: " : "stdout: ") +
                 u.line;
        } else {
          return "[" + u.operation_id + "] " + StatusString(u.state) + " in " +
                 std::to_string(u.duration.count()) + "ms: " + u.message;
        }
      },
      update);
}

// ============================================================================
// CallbackSender
// ============================================================================

/**
 * @brief Subscriber channel for one session's progress events.
 *
 * Implementations must be safe to call from background task threads.
 */
class CallbackSender {
 public:
  virtual ~CallbackSender() = default;

  virtual expected<void, CallbackError> Send(const ProgressUpdate& update) = 0;
};

/// @brief Accepts and drops everything.
class NoOpSender final : public CallbackSender {
 public:
  expected<void, CallbackError> Send(const ProgressUpdate&) override {
    return expected<void, CallbackError>::success();
  }
};

/// @brief Writes each event to the log at INFO.
class LoggingSender final : public CallbackSender {
 public:
  explicit LoggingSender(std::string category = "Progress")
      : category_(std::move(category)) {}

  expected<void, CallbackError> Send(const ProgressUpdate& update) override {
    ORCA_LOG_INFO(category_.c_str(), "%s", ToString(update).c_str());
    return expected<void, CallbackError>::success();
  }

 private:
  std::string category_;
};

/// @brief Forwards to a std::function. An empty function is a SendFailed.
class FunctionSender final : public CallbackSender {
 public:
  using Fn = std::function<expected<void, CallbackError>(const ProgressUpdate&)>;

  explicit FunctionSender(Fn fn) : fn_(std::move(fn)) {}

  expected<void, CallbackError> Send(const ProgressUpdate& update) override {
    if (!fn_) {
      return expected<void, CallbackError>::error(
          CallbackError::SendFailed("no callback bound"));
    }
    return fn_(update);
  }

 private:
  Fn fn_;
};

/**
 * @brief Bounded queue drained by a front end thread.
 *
 * Send fails with SendFailed when the queue is full and with Disconnected
 * once Close() has been called.
 */
class ChannelSender final : public CallbackSender {
 public:
  explicit ChannelSender(size_t capacity = 256) : capacity_(capacity) {}

  ChannelSender(const ChannelSender&) = delete;
  ChannelSender& operator=(const ChannelSender&) = delete;

  expected<void, CallbackError> Send(const ProgressUpdate& update) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) {
        return expected<void, CallbackError>::error(CallbackError::Disconnected());
      }
      if (queue_.size() >= capacity_) {
        return expected<void, CallbackError>::error(
            CallbackError::SendFailed("channel full"));
      }
      queue_.push_back(update);
    }
    cv_.notify_one();
    return expected<void, CallbackError>::success();
  }

  /// @brief Block up to @p timeout for the next event.
  std::optional<ProgressUpdate> Pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; })) {
      return std::nullopt;
    }
    if (queue_.empty()) return std::nullopt;
    ProgressUpdate u = std::move(queue_.front());
    queue_.pop_front();
    return u;
  }

  std::optional<ProgressUpdate> TryPop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) return std::nullopt;
    ProgressUpdate u = std::move(queue_.front());
    queue_.pop_front();
    return u;
  }

  /// @brief Reject further sends; queued events stay poppable.
  void Close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  bool IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

 private:
  size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<ProgressUpdate> queue_;
  bool closed_ = false;
};

// ============================================================================
// NotificationDispatcher
// ============================================================================

enum class DeliveryStatus : uint8_t {
  kDelivered = 0,
  kSuppressed,  ///< Out of order, duplicate, or no subscriber
};

struct NotifierStats {
  uint64_t delivered = 0;
  uint64_t suppressed = 0;
  uint64_t failed = 0;
  uint64_t recoverable_failures = 0;
};

class NotificationDispatcher final {
 public:
  NotificationDispatcher() = default;

  NotificationDispatcher(const NotificationDispatcher&) = delete;
  NotificationDispatcher& operator=(const NotificationDispatcher&) = delete;
  NotificationDispatcher(NotificationDispatcher&&) = delete;
  NotificationDispatcher& operator=(NotificationDispatcher&&) = delete;

  /**
   * @brief Deliver @p update through @p sender if ordering allows it.
   * @return kDelivered, kSuppressed, or the sender's classified error.
   */
  expected<DeliveryStatus, CallbackError> Publish(CallbackSender* sender,
                                                  const ProgressUpdate& update) {
    using Result = expected<DeliveryStatus, CallbackError>;
    const std::string& id = OperationIdOf(update);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (sender == nullptr || !AdvanceLocked(id, update)) {
        ++stats_.suppressed;
        ORCA_LOG_DEBUG("Notifier", "suppressed %s for %s", UpdateKindName(update),
                       id.c_str());
        return Result::success(DeliveryStatus::kSuppressed);
      }
    }

    auto sent = sender->Send(update);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!sent.has_value()) {
      const CallbackError& err = sent.get_error();
      ++stats_.failed;
      if (err.IsRecoverable()) ++stats_.recoverable_failures;
      ORCA_LOG_AT(err.Severity(), "Notifier", "%s for %s [%s]: %s",
                  UpdateKindName(update), id.c_str(), err.ErrorCode(),
                  err.ToString().c_str());
      return Result::error(err);
    }
    ++stats_.delivered;
    return Result::success(DeliveryStatus::kDelivered);
  }

  expected<DeliveryStatus, CallbackError> Publish(
      const std::shared_ptr<CallbackSender>& sender, const ProgressUpdate& update) {
    return Publish(sender.get(), update);
  }

  /// @brief Drop ordering state for @p id.
  void Forget(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    phases_.erase(id);
  }

  bool HasCompleted(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = phases_.find(id);
    return it != phases_.end() && it->second == Phase::kCompleted;
  }

  size_t Tracked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return phases_.size();
  }

  NotifierStats Stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
  }

 private:
  enum class Phase : uint8_t { kNone = 0, kStarted, kCompleted };

  /// @brief Returns false (and leaves the phase alone) when suppressed.
  bool AdvanceLocked(const std::string& id, const ProgressUpdate& update) {
    auto it = phases_.find(id);
    Phase phase = (it == phases_.end()) ? Phase::kNone : it->second;
    switch (update.index()) {
      case 0:  // Started
        if (phase != Phase::kNone) return false;
        phases_[id] = Phase::kStarted;
        return true;
      case 1:  // Progress
      case 2:  // Output
        return phase == Phase::kStarted;
      case 3:  // Completed
        if (phase != Phase::kStarted) return false;
        phases_[id] = Phase::kCompleted;
        return true;
      default:
        return false;
    }
  }

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Phase> phases_;
  NotifierStats stats_;
};

}  // namespace orca

#endif  // ORCA_NOTIFIER_HPP_
