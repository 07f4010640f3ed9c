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
 * @file operation_registry.hpp
 * @brief Authoritative store of background operations.
 *
 * - Register mints an "op_" id and inserts a Pending record.
 * - MarkRunning / MarkTerminal are called by the owning background task
 *   only; illegal calls are logged and returned as errors.
 * - Status / List / Statistics take snapshots under the lock.
 * - Wait blocks the calling thread until every requested id is terminal or
 *   the call's own deadline passes. Every terminal transition broadcasts,
 *   so concurrent waiters on the same id are all released.
 * - Sweep evicts aged terminal operations, oldest end time first. It runs
 *   on a TimerScheduler thread when MonitorConfig::auto_cleanup is set.
 *
 * Issued ids are remembered for the registry's lifetime so an evicted id
 * is never handed out again, even when callers pick their own ids.
 */

#ifndef ORCA_OPERATION_REGISTRY_HPP_
#define ORCA_OPERATION_REGISTRY_HPP_

#include "orca/log.hpp"
#include "orca/operation.hpp"
#include "orca/timer.hpp"
#include "orca/vocabulary.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace orca {

// ============================================================================
// MonitorConfig
// ============================================================================

struct MonitorConfig {
  std::chrono::milliseconds default_timeout{std::chrono::seconds(300)};
  std::chrono::milliseconds cleanup_interval{std::chrono::seconds(30)};
  size_t max_history_size{1000U};
  std::chrono::milliseconds retention{std::chrono::hours(1)};
  bool auto_cleanup{true};
};

// ============================================================================
// Errors and result types
// ============================================================================

enum class RegistryError : uint8_t {
  kNotFound = 0,
  kInvalidTransition,
  kEmptyIdList,
  kDuplicateId,
  kInvalidId,
  kShutdown,
};

inline const char* RegistryErrorMessage(RegistryError e) noexcept {
  switch (e) {
    case RegistryError::kNotFound:
      return "operation not found";
    case RegistryError::kInvalidTransition:
      return "invalid operation state transition";
    case RegistryError::kEmptyIdList:
      return "operation_ids cannot be empty; provide at least one operation ID";
    case RegistryError::kDuplicateId:
      return "operation id already issued";
    case RegistryError::kInvalidId:
      return "operation id must be non-empty and printable";
    case RegistryError::kShutdown:
      return "operation registry is shut down";
  }
  return "unknown registry error";
}

struct RegisterRequest {
  std::string command_kind;
  std::string description;
  std::string working_directory;
  std::optional<std::chrono::milliseconds> timeout;  ///< Default: config
  std::optional<std::string> id;                     ///< Default: minted
};

enum class WaitStatus : uint8_t {
  kTerminal = 0,    ///< Operation reached a terminal state
  kTimedOutOnWait,  ///< The wait call's own deadline passed first
  kNotFound,        ///< Unknown or already evicted id
};

struct WaitOutcome {
  std::string id;
  WaitStatus status = WaitStatus::kNotFound;
  Operation snapshot;  ///< Valid unless status == kNotFound
};

struct OperationFilter {
  std::optional<std::string> working_directory;
  std::optional<OperationState> state;
};

struct OperationStatistics {
  size_t total = 0;
  size_t pending = 0;
  size_t running = 0;
  size_t completed = 0;
  size_t failed = 0;
  size_t cancelled = 0;
  size_t timed_out = 0;
  std::chrono::milliseconds total_duration{0};    ///< Terminal ops only
  std::chrono::milliseconds average_duration{0};  ///< Terminal ops only
  double success_rate = 0.0;  ///< Percent of terminal ops that completed
  double failure_rate = 0.0;  ///< Percent of terminal ops that failed
};

// ============================================================================
// OperationRegistry
// ============================================================================

class OperationRegistry final {
 public:
  explicit OperationRegistry(const MonitorConfig& cfg = MonitorConfig{})
      : cfg_(cfg), rng_(std::random_device{}()), sweeper_(1) {}

  ~OperationRegistry() { Shutdown(); }

  OperationRegistry(const OperationRegistry&) = delete;
  OperationRegistry& operator=(const OperationRegistry&) = delete;
  OperationRegistry(OperationRegistry&&) = delete;
  OperationRegistry& operator=(OperationRegistry&&) = delete;

  const MonitorConfig& config() const noexcept { return cfg_; }

  /**
   * @brief Arm the periodic cleanup sweep (no-op unless auto_cleanup).
   */
  expected<void, TimerError> Start() {
    if (!cfg_.auto_cleanup) {
      return expected<void, TimerError>::success();
    }
    auto period = static_cast<uint32_t>(cfg_.cleanup_interval.count());
    auto added = sweeper_.Add(period, &OperationRegistry::SweepTick, this);
    if (!added.has_value()) {
      return expected<void, TimerError>::error(added.get_error());
    }
    return sweeper_.Start();
  }

  /// Called once per evicted id, after the registry lock is released.
  using EvictionListener = std::function<void(const std::string& id)>;

  /**
   * @brief Install (or clear, with nullptr) the single eviction listener.
   *
   * Blocks until a listener call in progress has returned, so after
   * clearing, the old listener is never invoked again.
   */
  void SetEvictionListener(EvictionListener fn) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    on_evict_ = std::move(fn);
  }

  // ======================== Lifecycle writes ========================

  /// @brief Register with a command kind only.
  expected<std::string, RegistryError> Register(
      const std::string& command_kind,
      std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
    RegisterRequest req;
    req.command_kind = command_kind;
    req.timeout = timeout;
    return Register(req);
  }

  /**
   * @brief Insert a Pending record and return its id.
   * @return kDuplicateId if a caller-supplied id was issued before,
   *         kInvalidId if it is empty, kShutdown after Shutdown().
   */
  expected<std::string, RegistryError> Register(const RegisterRequest& req) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
      return expected<std::string, RegistryError>::error(RegistryError::kShutdown);
    }

    std::string id;
    if (req.id.has_value()) {
      if (!IsValidId(*req.id)) {
        return expected<std::string, RegistryError>::error(RegistryError::kInvalidId);
      }
      if (issued_.count(*req.id) != 0U) {
        return expected<std::string, RegistryError>::error(
            RegistryError::kDuplicateId);
      }
      id = *req.id;
    } else {
      id = MintIdLocked();
    }

    Operation op;
    op.id = id;
    op.command_kind = req.command_kind;
    op.description = req.description.empty() ? req.command_kind : req.description;
    op.working_directory = req.working_directory;
    op.state = OperationState::kPending;
    op.created_at = std::chrono::steady_clock::now();
    op.created_wall = std::chrono::system_clock::now();
    op.timeout = req.timeout.value_or(cfg_.default_timeout);

    issued_.insert(id);
    ops_.emplace(id, std::move(op));
    ORCA_LOG_DEBUG("Registry", "registered %s (%s)", id.c_str(),
                   req.command_kind.c_str());
    return expected<std::string, RegistryError>::success(std::move(id));
  }

  /// @brief Pending -> Running.
  expected<void, RegistryError> MarkRunning(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = ops_.find(id);
    if (it == ops_.end()) {
      ORCA_LOG_ERROR("Registry", "MarkRunning on unknown operation %s", id.c_str());
      return expected<void, RegistryError>::error(RegistryError::kNotFound);
    }
    Operation& op = it->second;
    if (!CanTransition(op.state, OperationState::kRunning)) {
      ORCA_LOG_ERROR("Registry", "MarkRunning on %s in state %s", id.c_str(),
                     StatusString(op.state));
      return expected<void, RegistryError>::error(RegistryError::kInvalidTransition);
    }
    op.state = OperationState::kRunning;
    op.started_at = std::chrono::steady_clock::now();
    cv_.notify_all();
    return expected<void, RegistryError>::success();
  }

  /**
   * @brief Running -> terminal. The stored result is frozen afterwards.
   */
  expected<void, RegistryError> MarkTerminal(const std::string& id,
                                             OperationOutcome outcome) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = ops_.find(id);
      if (it == ops_.end()) {
        ORCA_LOG_ERROR("Registry", "MarkTerminal on unknown operation %s",
                       id.c_str());
        return expected<void, RegistryError>::error(RegistryError::kNotFound);
      }
      Operation& op = it->second;
      if (!IsTerminal(outcome.state) || !CanTransition(op.state, outcome.state)) {
        ORCA_LOG_ERROR("Registry", "MarkTerminal %s: %s -> %s rejected",
                       id.c_str(), StatusString(op.state),
                       StatusString(outcome.state));
        return expected<void, RegistryError>::error(
            RegistryError::kInvalidTransition);
      }
      op.state = outcome.state;
      op.ended_at = std::chrono::steady_clock::now();
      op.output = std::move(outcome.output);
      op.result_summary = std::move(outcome.result_summary);
      ORCA_LOG_INFO("Registry", "%s -> %s after %lldms", id.c_str(),
                    StatusString(op.state),
                    static_cast<long long>(op.Elapsed().count()));
    }
    cv_.notify_all();
    return expected<void, RegistryError>::success();
  }

  // ======================== Reads ========================

  expected<Operation, RegistryError> Status(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = ops_.find(id);
    if (it == ops_.end()) {
      return expected<Operation, RegistryError>::error(RegistryError::kNotFound);
    }
    return expected<Operation, RegistryError>::success(it->second);
  }

  /// @brief Snapshots matching @p filter, oldest first.
  std::vector<Operation> List(const OperationFilter& filter = OperationFilter{}) const {
    std::vector<Operation> out;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (const auto& kv : ops_) {
        const Operation& op = kv.second;
        if (filter.state.has_value() && op.state != *filter.state) continue;
        if (filter.working_directory.has_value() &&
            op.working_directory != *filter.working_directory) {
          continue;
        }
        out.push_back(op);
      }
    }
    std::sort(out.begin(), out.end(), [](const Operation& a, const Operation& b) {
      return a.created_at < b.created_at;
    });
    return out;
  }

  OperationStatistics Statistics() const {
    OperationStatistics st;
    std::lock_guard<std::mutex> lock(mutex_);
    st.total = ops_.size();
    size_t terminal = 0;
    for (const auto& kv : ops_) {
      const Operation& op = kv.second;
      switch (op.state) {
        case OperationState::kPending:
          ++st.pending;
          break;
        case OperationState::kRunning:
          ++st.running;
          break;
        case OperationState::kCompleted:
          ++st.completed;
          break;
        case OperationState::kFailed:
          ++st.failed;
          break;
        case OperationState::kCancelled:
          ++st.cancelled;
          break;
        case OperationState::kTimedOut:
          ++st.timed_out;
          break;
      }
      if (IsTerminal(op.state)) {
        ++terminal;
        st.total_duration += op.Elapsed();
      }
    }
    if (terminal > 0U) {
      st.average_duration = std::chrono::milliseconds(
          st.total_duration.count() / static_cast<int64_t>(terminal));
      st.success_rate = 100.0 * static_cast<double>(st.completed) /
                        static_cast<double>(terminal);
      st.failure_rate =
          100.0 * static_cast<double>(st.failed + st.cancelled + st.timed_out) /
          static_cast<double>(terminal);
    }
    return st;
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ops_.size();
  }

  // ======================== Wait ========================

  /**
   * @brief Block until every id is terminal or the call's deadline passes.
   *
   * @param ids     Non-empty list of ids; duplicates are reported once each.
   * @param timeout Observation bound for this call. When absent, the longest
   *                per-operation timeout among the requested ids is used.
   * @return Per-id outcomes in request order, or kEmptyIdList.
   *
   * A kTimedOutOnWait outcome leaves the operation untouched; a later Wait
   * or Status still observes its true result.
   */
  expected<std::vector<WaitOutcome>, RegistryError> Wait(
      const std::vector<std::string>& ids,
      std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
    using Result = expected<std::vector<WaitOutcome>, RegistryError>;
    if (ids.empty()) {
      return Result::error(RegistryError::kEmptyIdList);
    }

    std::unique_lock<std::mutex> lock(mutex_);
    std::chrono::milliseconds bound = timeout.value_or(std::chrono::milliseconds(0));
    if (!timeout.has_value()) {
      for (const auto& id : ids) {
        auto it = ops_.find(id);
        if (it != ops_.end() && it->second.timeout > bound) {
          bound = it->second.timeout;
        }
      }
    }
    const SteadyTime deadline = std::chrono::steady_clock::now() + bound;

    auto settled = [this, &ids]() {
      if (shutdown_) return true;
      for (const auto& id : ids) {
        auto it = ops_.find(id);
        if (it != ops_.end() && IsActive(it->second.state)) return false;
      }
      return true;
    };
    (void)cv_.wait_until(lock, deadline, settled);

    std::vector<WaitOutcome> outcomes;
    outcomes.reserve(ids.size());
    for (const auto& id : ids) {
      WaitOutcome wo;
      wo.id = id;
      auto it = ops_.find(id);
      if (it == ops_.end()) {
        wo.status = WaitStatus::kNotFound;
      } else {
        wo.snapshot = it->second;
        wo.status = IsTerminal(it->second.state) ? WaitStatus::kTerminal
                                                 : WaitStatus::kTimedOutOnWait;
      }
      outcomes.push_back(std::move(wo));
    }
    return Result::success(std::move(outcomes));
  }

  // ======================== Cleanup ========================

  /**
   * @brief Evict aged and over-limit terminal operations.
   * @return Number of evicted operations.
   */
  size_t Sweep() {
    std::vector<std::string> evicted;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      const SteadyTime now = std::chrono::steady_clock::now();
      const size_t before = ops_.size();

      std::vector<std::pair<SteadyTime, std::string>> terminal;
      for (auto it = ops_.begin(); it != ops_.end();) {
        const Operation& op = it->second;
        if (IsTerminal(op.state) && op.ended_at.has_value()) {
          if (now - *op.ended_at > cfg_.retention) {
            evicted.push_back(it->first);
            it = ops_.erase(it);
            continue;
          }
          terminal.emplace_back(*op.ended_at, it->first);
        }
        ++it;
      }

      if (ops_.size() > cfg_.max_history_size) {
        std::sort(terminal.begin(), terminal.end());
        size_t excess = ops_.size() - cfg_.max_history_size;
        for (size_t i = 0; i < terminal.size() && excess > 0U; ++i, --excess) {
          ops_.erase(terminal[i].second);
          evicted.push_back(terminal[i].second);
        }
      }

      if (evicted.empty()) return 0U;
      ORCA_LOG_DEBUG("Registry", "swept %zu operations (%zu -> %zu)", evicted.size(),
                     before, ops_.size());
      cv_.notify_all();
    }

    std::lock_guard<std::mutex> lock(listener_mutex_);
    if (on_evict_) {
      for (const auto& id : evicted) on_evict_(id);
    }
    return evicted.size();
  }

  /**
   * @brief Stop the sweep, release waiters and reject new registrations.
   *
   * Idempotent. Records stay readable after shutdown.
   */
  void Shutdown() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (shutdown_) return;
      shutdown_ = true;
    }
    sweeper_.Stop();
    cv_.notify_all();
    ORCA_LOG_INFO("Registry", "shut down");
  }

  bool IsShutdown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shutdown_;
  }

 private:
  MonitorConfig cfg_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::unordered_map<std::string, Operation> ops_;
  std::unordered_set<std::string> issued_;
  std::mt19937_64 rng_;
  std::mutex listener_mutex_;
  EvictionListener on_evict_;
  TimerScheduler sweeper_;
  bool shutdown_ = false;

  static void SweepTick(void* ctx) {
    static_cast<OperationRegistry*>(ctx)->Sweep();
  }

  static bool IsValidId(const std::string& id) {
    if (id.empty() || id.size() > 128U) return false;
    return std::all_of(id.begin(), id.end(), [](char c) {
      return c > ' ' && c < 0x7f;
    });
  }

  std::string MintIdLocked() {
    static const char kHex[] = "0123456789abcdef";
    for (;;) {
      uint64_t bits = rng_();
      std::string id = "op_";
      for (int i = 0; i < 12; ++i) {
        id.push_back(kHex[bits & 0xFU]);
        bits >>= 4U;
      }
      if (issued_.count(id) == 0U) return id;
    }
  }
};

}  // namespace orca

#endif  // ORCA_OPERATION_REGISTRY_HPP_
