/**
 * @file hints.hpp
 * @brief Advisory guidance attached to tool replies.
 *
 * Three pieces of text steer an automated caller away from blocking:
 *   - a preview block appended when an operation goes to the background,
 *   - a concurrency hint on the first premature wait for an operation,
 *   - a polling hint once status has been asked too often for one id.
 *
 * Nothing here changes operation behaviour.
 */

#ifndef ORCA_HINTS_HPP_
#define ORCA_HINTS_HPP_

#include "orca/operation.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace orca {

struct HintConfig {
  std::chrono::milliseconds concurrency_threshold{std::chrono::seconds(5)};
  std::chrono::milliseconds target_gap{std::chrono::seconds(30)};
  uint32_t status_poll_threshold{3U};
};

/**
 * @brief Guidance block for a freshly backgrounded operation.
 */
inline std::string PreviewHint(const std::string& operation_id,
                               const std::string& command_kind) {
  std::string s;
  s += "\n\n### ASYNC BUILD OPERATION: " + command_kind + " (ID: " + operation_id + ")\n";
  s += "1. The operation is running in the background; do not assume it's complete.\n";
  s += "2. What to do now (pick one):\n";
  s += " - Update the plan: mark this step in progress and note the operation ID.\n";
  s += " - Do unrelated code, tests, or docs not blocked by this `" + command_kind +
       "`.\n";
  s += " - If you'll need these results soon, schedule a later `status` check "
       "instead of polling.\n";
  s += " - If you have nothing else to do and need results to proceed, use `wait` "
       "with operation_ids=['" + operation_id + "'].\n";
  s += "3. Tips:\n";
  s += " - Prefer `status` for non-blocking checks; avoid tight polling.\n";
  s += " - Batch actions: start several operations, then wait for them together.\n";
  s += " - Always specify explicit operation IDs; never pass an empty list.\n";
  s += " - You'll also receive a completion notification via progress updates.\n";
  s += "\nNext: Continue useful work now. Check `status` later, or `wait` only if "
       "you're blocked.\n\n";
  return s;
}

inline std::string ConcurrencyHint(const std::string& operation_id,
                                   std::chrono::milliseconds gap,
                                   std::chrono::milliseconds target_gap) {
  const double gap_s = static_cast<double>(gap.count()) / 1000.0;
  const double target_ms = static_cast<double>(target_gap.count());
  const double pct =
      target_ms > 0.0 ? static_cast<double>(gap.count()) / target_ms * 100.0 : 0.0;
  char buf[256];
  std::snprintf(buf, sizeof(buf),
                "CONCURRENCY HINT: You waited for '%s' after only %.1fs "
                "(efficiency: %.0f%%). Consider performing other tasks while "
                "operations run in the background.",
                operation_id.c_str(), gap_s, pct);
  return buf;
}

inline std::string StatusPollingHint(const std::string& operation_id, uint32_t count) {
  return "STATUS POLLING DETECTED: You've called status " + std::to_string(count) +
         " times for operation '" + operation_id +
         "'. Instead of repeatedly polling, consider using 'wait' with "
         "enable_async_notification=true for automatic results via progress "
         "notifications.\n";
}

// ============================================================================
// HintEngine
// ============================================================================

class HintEngine final {
 public:
  explicit HintEngine(const HintConfig& cfg = HintConfig{}) : cfg_(cfg) {}

  HintEngine(const HintEngine&) = delete;
  HintEngine& operator=(const HintEngine&) = delete;

  const HintConfig& config() const noexcept { return cfg_; }

  std::string Preview(const std::string& operation_id,
                      const std::string& command_kind) const {
    return PreviewHint(operation_id, command_kind);
  }

  /**
   * @brief Record a wait for @p id.
   *
   * Only the first wait per id is considered. Returns a hint when it came
   * less than concurrency_threshold after @p started_at.
   */
  std::optional<std::string> ObserveWait(const std::string& id, SteadyTime started_at,
                                         SteadyTime now = std::chrono::steady_clock::now()) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!waited_.insert(id).second) return std::nullopt;
    }
    auto gap = std::chrono::duration_cast<std::chrono::milliseconds>(now - started_at);
    if (gap < std::chrono::milliseconds(0)) gap = std::chrono::milliseconds(0);
    if (gap >= cfg_.concurrency_threshold) return std::nullopt;
    return ConcurrencyHint(id, gap, cfg_.target_gap);
  }

  /// @brief Count a status call for @p id; hint once the threshold is reached.
  std::optional<std::string> ObserveStatus(const std::string& id) {
    uint32_t count;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      count = ++status_counts_[id];
    }
    if (count < cfg_.status_poll_threshold) return std::nullopt;
    return StatusPollingHint(id, count);
  }

  uint32_t StatusCount(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = status_counts_.find(id);
    return (it == status_counts_.end()) ? 0U : it->second;
  }

  bool HasWaited(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waited_.count(id) != 0U;
  }

  /// @brief Drop all observations for @p id.
  void Forget(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_counts_.erase(id);
    waited_.erase(id);
  }

 private:
  HintConfig cfg_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, uint32_t> status_counts_;
  std::unordered_set<std::string> waited_;
};

}  // namespace orca

#endif  // ORCA_HINTS_HPP_
