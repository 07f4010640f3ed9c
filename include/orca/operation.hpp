/**
 * @file operation.hpp
 * @brief Operation record and its lifecycle state machine.
 *
 *   Pending ──> Running ──> Completed
 *                      ├──> Failed
 *                      ├──> TimedOut
 *                      └──> Cancelled
 *
 * Terminal states are final. Pending is the window between id minting and
 * the background task starting the external command.
 */

#ifndef ORCA_OPERATION_HPP_
#define ORCA_OPERATION_HPP_

#include "orca/platform.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <optional>
#include <string>

#include <strings.h>

namespace orca {

// ============================================================================
// OperationState
// ============================================================================

enum class OperationState : uint8_t {
  kPending = 0,
  kRunning,
  kCompleted,
  kFailed,
  kCancelled,
  kTimedOut,
};

inline constexpr bool IsActive(OperationState s) noexcept {
  return s == OperationState::kPending || s == OperationState::kRunning;
}

inline constexpr bool IsTerminal(OperationState s) noexcept {
  return !IsActive(s);
}

inline constexpr bool IsSuccess(OperationState s) noexcept {
  return s == OperationState::kCompleted;
}

inline constexpr bool IsFailure(OperationState s) noexcept {
  return s == OperationState::kFailed || s == OperationState::kCancelled ||
         s == OperationState::kTimedOut;
}

/// @brief Legal FSM edges. Self-transitions are rejected.
inline constexpr bool CanTransition(OperationState from,
                                    OperationState to) noexcept {
  return (from == OperationState::kPending && to == OperationState::kRunning) ||
         (from == OperationState::kRunning && IsTerminal(to));
}

/// @brief Upper-case form used in reports: "RUNNING", "TIMED_OUT", ...
inline constexpr const char* StatusString(OperationState s) noexcept {
  switch (s) {
    case OperationState::kPending:
      return "PENDING";
    case OperationState::kRunning:
      return "RUNNING";
    case OperationState::kCompleted:
      return "COMPLETED";
    case OperationState::kFailed:
      return "FAILED";
    case OperationState::kCancelled:
      return "CANCELLED";
    case OperationState::kTimedOut:
      return "TIMED_OUT";
  }
  return "UNKNOWN";
}

/// @brief Lower-case form used by state filters: "pending" .. "timedout".
inline constexpr const char* LowercaseString(OperationState s) noexcept {
  switch (s) {
    case OperationState::kPending:
      return "pending";
    case OperationState::kRunning:
      return "running";
    case OperationState::kCompleted:
      return "completed";
    case OperationState::kFailed:
      return "failed";
    case OperationState::kCancelled:
      return "cancelled";
    case OperationState::kTimedOut:
      return "timedout";
  }
  return "unknown";
}

/// @brief Coarse bucket for progress displays.
inline constexpr const char* ProgressCategory(OperationState s) noexcept {
  switch (s) {
    case OperationState::kPending:
      return "waiting";
    case OperationState::kRunning:
      return "active";
    case OperationState::kCompleted:
      return "success";
    case OperationState::kFailed:
      return "error";
    case OperationState::kCancelled:
      return "cancelled";
    case OperationState::kTimedOut:
      return "timeout";
  }
  return "unknown";
}

/**
 * @brief Parse a user-supplied state filter, case-insensitively.
 *
 * Accepts the lower-case form, the status form and "timed_out".
 */
inline std::optional<OperationState> ParseStateFilter(const std::string& text) {
  static constexpr std::array<OperationState, 6> kAll = {
      OperationState::kPending,   OperationState::kRunning,
      OperationState::kCompleted, OperationState::kFailed,
      OperationState::kCancelled, OperationState::kTimedOut};
  for (OperationState s : kAll) {
    if (strcasecmp(text.c_str(), LowercaseString(s)) == 0 ||
        strcasecmp(text.c_str(), StatusString(s)) == 0) {
      return s;
    }
  }
  return std::nullopt;
}

inline constexpr std::array<OperationState, 2> kActiveStates = {
    OperationState::kPending, OperationState::kRunning};
inline constexpr std::array<OperationState, 4> kTerminalStates = {
    OperationState::kCompleted, OperationState::kFailed,
    OperationState::kCancelled, OperationState::kTimedOut};
inline constexpr std::array<OperationState, 3> kFailureStates = {
    OperationState::kFailed, OperationState::kCancelled,
    OperationState::kTimedOut};

// ============================================================================
// Operation
// ============================================================================

using SteadyTime = std::chrono::steady_clock::time_point;
using WallTime = std::chrono::system_clock::time_point;

/**
 * @brief One tracked background invocation.
 *
 * Copies handed out by the registry are snapshots; the registry's own record
 * is the source of truth.
 */
struct Operation {
  std::string id;
  std::string command_kind;
  std::string description;
  std::string working_directory;
  OperationState state = OperationState::kPending;

  SteadyTime created_at{};
  WallTime created_wall{};
  std::optional<SteadyTime> started_at;
  std::optional<SteadyTime> ended_at;

  std::chrono::milliseconds timeout{0};  ///< Observation timeout for wait.

  std::string output;          ///< Merged output, set once on termination.
  std::string result_summary;  ///< e.g. "exit status 101", empty on success.

  /// @brief Time from start (or creation) to end (or now).
  std::chrono::milliseconds Elapsed() const {
    SteadyTime from = started_at.value_or(created_at);
    SteadyTime to = ended_at.value_or(std::chrono::steady_clock::now());
    return std::chrono::duration_cast<std::chrono::milliseconds>(to - from);
  }
};

/// @brief What the owning task records when the operation terminates.
struct OperationOutcome {
  OperationState state = OperationState::kCompleted;
  std::string output;
  std::string result_summary;
};

// ============================================================================
// Clock formatting
// ============================================================================

/// @brief Local wall-clock time as H:MM:SS (no leading zero on the hour).
inline std::string FormatClockTime(WallTime t) {
  std::time_t tt = std::chrono::system_clock::to_time_t(t);
  struct tm tm_buf;
  localtime_r(&tt, &tm_buf);
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%d:%02d:%02d", tm_buf.tm_hour,
                tm_buf.tm_min, tm_buf.tm_sec);
  return buf;
}

inline std::string CurrentClockTime() {
  return FormatClockTime(std::chrono::system_clock::now());
}

}  // namespace orca

#endif  // ORCA_OPERATION_HPP_
