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
 * @file dispatcher.hpp
 * @brief Entry point for every tool invocation.
 *
 *   Invoke(req)
 *     ├─ gate: disabled tool?            ──> ToolError{kToolDisabled}
 *     ├─ status / wait / sleep           ──> built-in handlers
 *     ├─ quick command                   ──> WorkerPool::Run, reply now
 *     └─ long-running command
 *          ├─ synchronous mode           ──> WorkerPool::Run, reply now
 *          └─ background mode            ──> Register, reply with id + preview,
 *                                            task thread: Running, Started,
 *                                            Progress, Run, terminal, Completed
 *
 * The dispatcher owns nothing but its task threads; registry, pool,
 * notifier, hints and catalog are shared and outlive it.
 */

#ifndef ORCA_DISPATCHER_HPP_
#define ORCA_DISPATCHER_HPP_

#include "orca/command_catalog.hpp"
#include "orca/hints.hpp"
#include "orca/log.hpp"
#include "orca/notifier.hpp"
#include "orca/operation_registry.hpp"
#include "orca/task_group.hpp"
#include "orca/vocabulary.hpp"
#include "orca/worker_pool.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace orca {

// ============================================================================
// Execution mode
// ============================================================================

enum class ExecutionMode : uint8_t {
  kSynchronous = 0,
  kBackground,
};

inline constexpr const char* ExecutionModeName(ExecutionMode m) noexcept {
  return m == ExecutionMode::kBackground ? "background" : "synchronous";
}

/**
 * @brief Decide how a long-running command executes.
 *
 *   process_synchronous | per-call flag | mode
 *   --------------------+---------------+-----------
 *   true                | any           | synchronous
 *   false               | true          | background
 *   false               | false/absent  | synchronous
 */
inline constexpr ExecutionMode ResolveExecutionMode(
    bool process_synchronous, std::optional<bool> enable_async_notification) noexcept {
  return (!process_synchronous && enable_async_notification.has_value() &&
          *enable_async_notification)
             ? ExecutionMode::kBackground
             : ExecutionMode::kSynchronous;
}

/// Longest accepted sleep; larger requests are invalid.
inline constexpr uint64_t kMaxSleepMs = 24ULL * 60ULL * 60ULL * 1000ULL;

// ============================================================================
// Requests, replies, errors
// ============================================================================

enum class ToolErrorCode : uint8_t {
  kToolDisabled = 0,
  kUnknownTool,
  kInvalidRequest,
  kEmptyOperationIds,
  kOperationNotFound,
  kShuttingDown,
};

/// @brief Stable machine-readable prefix of every ToolError message.
inline constexpr const char* ToolErrorMarker(ToolErrorCode c) noexcept {
  switch (c) {
    case ToolErrorCode::kToolDisabled:
      return "tool_disabled";
    case ToolErrorCode::kUnknownTool:
      return "unknown_tool";
    case ToolErrorCode::kInvalidRequest:
      return "invalid_request";
    case ToolErrorCode::kEmptyOperationIds:
      return "empty_operation_ids";
    case ToolErrorCode::kOperationNotFound:
      return "operation_not_found";
    case ToolErrorCode::kShuttingDown:
      return "shutting_down";
  }
  return "unknown_error";
}

struct ToolError {
  ToolErrorCode code = ToolErrorCode::kInvalidRequest;
  std::string message;  ///< "<marker>: <detail>"
};

inline ToolError MakeToolError(ToolErrorCode code, const std::string& detail) {
  return ToolError{code, std::string(ToolErrorMarker(code)) + ": " + detail};
}

struct ToolRequest {
  std::string tool;
  std::string working_directory;
  std::vector<std::string> args;
  std::optional<bool> enable_async_notification;
  std::optional<std::string> operation_id;  ///< Caller id, or status target
  std::vector<std::string> operation_ids;   ///< wait targets
  std::optional<uint64_t> duration_ms;      ///< sleep
  std::optional<std::string> state_filter;  ///< status listing
  std::optional<std::chrono::milliseconds> wait_timeout;
};

struct ToolReply {
  std::string text;
  bool is_error = false;
  std::optional<std::string> operation_id;  ///< Set for background starts
};

struct DispatcherConfig {
  bool synchronous_mode = false;
  std::unordered_set<std::string> disabled_tools;
};

struct ToolDescriptor {
  std::string name;
  std::string description;
  bool builtin = false;
  CommandKind kind = CommandKind::kLongRunning;
};

constexpr const char* kNoOutputPlaceholder = "(no command output captured)";

// ============================================================================
// Reply formatting
// ============================================================================

inline std::string JoinCommandLine(const std::vector<std::string>& argv) {
  std::string s;
  for (const auto& a : argv) {
    if (!s.empty()) s += ' ';
    s += a;
  }
  return s;
}

/**
 * @brief Reply for a finished command.
 *
 * Success: "+ Label completed successfully in DIR.\nOutput: ..." with an
 * "Errors:" section only when both channels had content. Failure puts
 * "Error:" before the output under the same condition.
 */
inline std::string FormatCommandReply(const std::string& label, const std::string& dir,
                                      const CommandOutput& out) {
  MergedOutput merged = MergeOutput(out);
  const std::string body = merged.output.empty() ? kNoOutputPlaceholder : merged.output;
  std::string text;
  if (out.Succeeded()) {
    text = "+ " + label + " completed successfully in " + dir + ".\nOutput: " + body;
    if (!merged.diagnostics.empty()) text += "\nErrors: " + merged.diagnostics;
  } else {
    text = "- " + label + " failed in " + dir + ".\n";
    if (!merged.diagnostics.empty()) text += "Error: " + merged.diagnostics + "\n";
    text += "Output: " + body;
  }
  return text;
}

inline std::string FormatWorkerFailure(const std::string& label, const std::string& dir,
                                       WorkerError err) {
  return "- " + label + " failed in " + dir + ".\nError: " + WorkerErrorMessage(err) +
         " [" + WorkerErrorCategory(err) + "]";
}

/// @brief Per-id section of a wait reply.
inline std::string FormatWaitOutcome(const WaitOutcome& wo,
                                     std::chrono::milliseconds waited) {
  if (wo.status == WaitStatus::kNotFound) {
    return "No operation found with ID '" + wo.id + "'";
  }
  const Operation& op = wo.snapshot;
  if (wo.status == WaitStatus::kTimedOutOnWait) {
    return "WAIT TIMED OUT: operation '" + op.id + "' is still " +
           StatusString(op.state) + " after " + std::to_string(waited.count()) +
           "ms. The operation continues in the background; call wait again or "
           "check status later.";
  }
  const bool ok = IsSuccess(op.state);
  std::string text = ok ? "OPERATION COMPLETED: '" : "OPERATION FAILED: '";
  text += op.id + "'\n";
  if (!ok) text += std::string("State: ") + StatusString(op.state) + "\n";
  text += "Command: " + op.command_kind + "\n";
  text += "Description: " + op.description + "\n";
  text += "Working Directory: " + op.working_directory + "\n";
  text += "Duration: " + std::to_string(op.Elapsed().count()) + "ms\n";
  if (!op.result_summary.empty()) text += "Result: " + op.result_summary + "\n";
  text += ok ? "\n=== FULL OUTPUT ===\n" : "\n=== FULL ERROR OUTPUT ===\n";
  text += op.output.empty() ? kNoOutputPlaceholder : op.output;
  return text;
}

inline std::string FormatStatus(const Operation& op) {
  std::string text = "Operation '" + op.id + "': " + StatusString(op.state) + "\n";
  text += "Command: " + op.command_kind + "\n";
  text += "Description: " + op.description + "\n";
  text += "Working Directory: " + op.working_directory + "\n";
  text += "Started: " + FormatClockTime(op.created_wall) + "\n";
  text += "Elapsed: " + std::to_string(op.Elapsed().count()) + "ms";
  if (IsTerminal(op.state)) {
    text += "\n\n=== OUTPUT ===\n";
    text += op.output.empty() ? kNoOutputPlaceholder : op.output;
  }
  return text;
}

inline std::string FormatStatistics(const OperationStatistics& st) {
  char buf[256];
  std::snprintf(buf, sizeof(buf),
                "Statistics: total=%zu pending=%zu running=%zu completed=%zu "
                "failed=%zu cancelled=%zu timed_out=%zu success_rate=%.1f%% "
                "avg_duration=%lldms",
                st.total, st.pending, st.running, st.completed, st.failed,
                st.cancelled, st.timed_out, st.success_rate,
                static_cast<long long>(st.average_duration.count()));
  return buf;
}

// ============================================================================
// Dispatcher
// ============================================================================

class Dispatcher final {
 public:
  Dispatcher(OperationRegistry& registry, WorkerPool& pool,
             NotificationDispatcher& notifier, HintEngine& hints,
             const CommandCatalog& catalog, DispatcherConfig cfg = DispatcherConfig{})
      : registry_(registry),
        pool_(pool),
        notifier_(notifier),
        hints_(hints),
        catalog_(catalog),
        cfg_(std::move(cfg)) {
    // Hint and ordering state lives exactly as long as the registry record.
    registry_.SetEvictionListener([this](const std::string& id) {
      hints_.Forget(id);
      notifier_.Forget(id);
    });
  }

  ~Dispatcher() {
    Shutdown();
    registry_.SetEvictionListener(nullptr);
  }

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;
  Dispatcher(Dispatcher&&) = delete;
  Dispatcher& operator=(Dispatcher&&) = delete;

  const DispatcherConfig& config() const noexcept { return cfg_; }

  bool IsDisabled(const std::string& tool) const {
    if (cfg_.disabled_tools.count(tool) != 0U) return true;
    const CommandSpec* spec = catalog_.Find(tool);
    return spec != nullptr && cfg_.disabled_tools.count(spec->name) != 0U;
  }

  /// @brief Tools visible to callers: built-ins plus enabled catalog entries.
  std::vector<ToolDescriptor> Tools() const {
    std::vector<ToolDescriptor> tools;
    const char* mode_note = cfg_.synchronous_mode ? kSyncAddendum : kAsyncAddendum;
    const std::pair<const char*, const char*> builtins[] = {
        {"status", "Report one operation, or list operations with statistics."},
        {"wait", "Block until the listed operations finish and return their "
                 "full output. operation_ids must not be empty."},
        {"sleep", "Sleep for duration_ms; useful for exercising background "
                  "operations."},
    };
    for (const auto& b : builtins) {
      if (IsDisabled(b.first)) continue;
      tools.push_back(ToolDescriptor{b.first, std::string(b.second) + mode_note, true,
                                     CommandKind::kQuick});
    }
    for (const auto& spec : catalog_.Commands()) {
      if (IsDisabled(spec.name)) continue;
      tools.push_back(ToolDescriptor{
          spec.name, CommandCatalog::DescribeFor(spec, cfg_.synchronous_mode), false,
          spec.kind});
    }
    return tools;
  }

  /**
   * @brief Handle one tool call.
   * @param sender Subscriber for background progress events; may be null.
   */
  expected<ToolReply, ToolError> Invoke(const ToolRequest& req,
                                        std::shared_ptr<CallbackSender> sender = nullptr) {
    using Result = expected<ToolReply, ToolError>;
    if (req.tool.empty()) {
      return Result::error(MakeToolError(ToolErrorCode::kInvalidRequest,
                                         "tool name is required"));
    }
    if (IsDisabled(req.tool)) {
      ORCA_LOG_INFO("Dispatcher", "rejected disabled tool %s", req.tool.c_str());
      return Result::error(MakeToolError(
          ToolErrorCode::kToolDisabled,
          "the '" + req.tool + "' tool is disabled on this server"));
    }
    if (IsShuttingDown()) {
      return Result::error(
          MakeToolError(ToolErrorCode::kShuttingDown, "server is shutting down"));
    }

    if (req.tool == "status") return HandleStatus(req);
    if (req.tool == "wait") return HandleWait(req);
    if (req.tool == "sleep") return HandleSleep(req, std::move(sender));

    const CommandSpec* spec = catalog_.Find(req.tool);
    if (spec == nullptr) {
      return Result::error(MakeToolError(ToolErrorCode::kUnknownTool,
                                         "no tool named '" + req.tool + "'"));
    }
    if (req.working_directory.empty()) {
      return Result::error(MakeToolError(ToolErrorCode::kInvalidRequest,
                                         "working_directory is required"));
    }
    if (!IsDirectory(req.working_directory)) {
      return Result::error(MakeToolError(
          ToolErrorCode::kInvalidRequest,
          "working_directory '" + req.working_directory + "' is not a directory"));
    }

    const std::string label = CommandLabel(spec->name);
    const std::string missing = CommandCatalog::MissingBinary(*spec);
    if (!missing.empty()) {
      ToolReply reply;
      reply.is_error = true;
      reply.text = "- " + label + " unavailable in " + req.working_directory +
                   ".\nError: '" + missing + "' is not installed or not on PATH. "
                   "Install it to use the " + spec->name + " tool.";
      return Result::success(std::move(reply));
    }

    std::vector<std::string> argv = spec->argv;
    argv.insert(argv.end(), req.args.begin(), req.args.end());

    const ExecutionMode mode =
        (spec->kind == CommandKind::kQuick)
            ? ExecutionMode::kSynchronous
            : ResolveExecutionMode(cfg_.synchronous_mode, req.enable_async_notification);
    ORCA_LOG_DEBUG("Dispatcher", "%s in %s (%s)", spec->name.c_str(),
                   req.working_directory.c_str(), ExecutionModeName(mode));

    if (mode == ExecutionMode::kSynchronous) {
      return Result::success(RunSync(label, req.working_directory, argv));
    }
    return StartBackground(*spec, req, std::move(argv), std::move(sender));
  }

  /// @brief Background tasks that have not finished yet.
  size_t ActiveTasks() const { return tasks_.Active(); }

  bool IsShuttingDown() const {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    return shutting_down_;
  }

  /**
   * @brief Refuse new calls, interrupt sleeps and join every task.
   *
   * Commands already running in the pool finish (or hit command_timeout)
   * before their task is joined. Idempotent.
   */
  void Shutdown() {
    {
      std::lock_guard<std::mutex> lock(tasks_mutex_);
      shutting_down_ = true;
    }
    shutdown_cv_.notify_all();
    const size_t joined = tasks_.CloseAndJoin();
    if (joined > 0U) {
      ORCA_LOG_INFO("Dispatcher", "joined %zu background tasks", joined);
    }
  }

 private:

  // ======================== Command paths ========================

  ToolReply RunSync(const std::string& label, const std::string& dir,
                    const std::vector<std::string>& argv) {
    ToolReply reply;
    auto result = pool_.Run(dir, argv);
    if (!result.has_value()) {
      ORCA_LOG_AT(WorkerErrorSeverity(result.get_error()), "Dispatcher",
                  "%s in %s: %s", label.c_str(), dir.c_str(),
                  WorkerErrorMessage(result.get_error()));
      reply.text = FormatWorkerFailure(label, dir, result.get_error());
      reply.is_error = true;
      return reply;
    }
    reply.text = FormatCommandReply(label, dir, result.value());
    reply.is_error = !result.value().Succeeded();
    return reply;
  }

  expected<ToolReply, ToolError> StartBackground(const CommandSpec& spec,
                                                 const ToolRequest& req,
                                                 std::vector<std::string> argv,
                                                 std::shared_ptr<CallbackSender> sender) {
    RegisterRequest rr;
    rr.command_kind = spec.name;
    rr.description = JoinCommandLine(argv);
    rr.working_directory = req.working_directory;
    rr.id = req.operation_id;
    auto id = RegisterOrError(rr);
    if (!id.has_value()) {
      return expected<ToolReply, ToolError>::error(id.get_error());
    }
    const std::string op_id = id.value();
    const std::string label = CommandLabel(spec.name);

    const bool spawned = SpawnTask([this, op_id, label, argv, sender,
                                    dir = req.working_directory,
                                    kind = spec.name]() {
      RunBackgroundCommand(op_id, label, kind, dir, argv, sender.get());
    });
    if (!spawned) {
      AbandonOperation(op_id);
      return expected<ToolReply, ToolError>::error(
          MakeToolError(ToolErrorCode::kShuttingDown, "server is shutting down"));
    }

    ToolReply reply;
    reply.operation_id = op_id;
    reply.text = "+ " + label + " operation '" + op_id + "' started in background at " +
                 CurrentClockTime() + "." + hints_.Preview(op_id, spec.name);
    return expected<ToolReply, ToolError>::success(std::move(reply));
  }

  void RunBackgroundCommand(const std::string& id, const std::string& label,
                            const std::string& kind, const std::string& dir,
                            const std::vector<std::string>& argv,
                            CallbackSender* sender) {
    if (!registry_.MarkRunning(id).has_value()) return;
    const std::string command_line = JoinCommandLine(argv);
    PublishLogged(sender, progress::Started{id, kind, command_line});
    PublishLogged(sender, progress::Progress{id, "Running " + command_line + " in " + dir,
                                             std::nullopt, std::string("executing")});

    OperationOutcome outcome;
    auto result = pool_.Run(dir, argv);
    if (!result.has_value()) {
      const WorkerError err = result.get_error();
      outcome.state = (err == WorkerError::kTimeout) ? OperationState::kTimedOut
                                                     : OperationState::kFailed;
      outcome.output = FormatWorkerFailure(label, dir, err);
      outcome.result_summary = WorkerErrorMessage(err);
    } else {
      const CommandOutput& out = result.value();
      outcome.state = out.Succeeded() ? OperationState::kCompleted : OperationState::kFailed;
      outcome.output = FormatCommandReply(label, dir, out);
      if (!out.Succeeded()) {
        outcome.result_summary = "exit status " + std::to_string(out.exit_code);
      }
    }
    Finish(id, label, std::move(outcome), sender);
  }

  // ======================== Built-in tools ========================

  expected<ToolReply, ToolError> HandleStatus(const ToolRequest& req) {
    using Result = expected<ToolReply, ToolError>;
    ToolReply reply;
    if (req.operation_id.has_value()) {
      auto op = registry_.Status(*req.operation_id);
      if (!op.has_value()) {
        return Result::error(
            MakeToolError(ToolErrorCode::kOperationNotFound,
                          "No operation found with ID '" + *req.operation_id + "'"));
      }
      reply.text = FormatStatus(op.value());
      auto hint = hints_.ObserveStatus(*req.operation_id);
      if (hint.has_value()) reply.text += "\n\n" + *hint;
      return Result::success(std::move(reply));
    }

    OperationFilter filter;
    if (!req.working_directory.empty()) filter.working_directory = req.working_directory;
    if (req.state_filter.has_value()) {
      filter.state = ParseStateFilter(*req.state_filter);
      if (!filter.state.has_value()) {
        return Result::error(MakeToolError(ToolErrorCode::kInvalidRequest,
                                           "unknown state filter '" +
                                               *req.state_filter + "'"));
      }
    }
    const std::vector<Operation> ops = registry_.List(filter);
    if (ops.empty()) {
      reply.text = "No operations found.";
    } else {
      reply.text = "Operations (" + std::to_string(ops.size()) + "):";
      for (const auto& op : ops) {
        reply.text += "\n- " + op.id + " [" + StatusString(op.state) + "] " +
                      op.command_kind + " in " + op.working_directory + " (" +
                      std::to_string(op.Elapsed().count()) + "ms)";
      }
    }
    reply.text += "\n\n" + FormatStatistics(registry_.Statistics());
    return Result::success(std::move(reply));
  }

  expected<ToolReply, ToolError> HandleWait(const ToolRequest& req) {
    using Result = expected<ToolReply, ToolError>;
    if (req.operation_ids.empty()) {
      return Result::error(MakeToolError(ToolErrorCode::kEmptyOperationIds,
                                         RegistryErrorMessage(RegistryError::kEmptyIdList)));
    }

    // The gap is measured at call time, before blocking.
    std::vector<std::string> hints;
    const SteadyTime now = std::chrono::steady_clock::now();
    for (const auto& id : req.operation_ids) {
      auto op = registry_.Status(id);
      if (!op.has_value()) continue;
      auto hint = hints_.ObserveWait(id, op.value().started_at.value_or(op.value().created_at),
                                     now);
      if (hint.has_value()) hints.push_back(std::move(*hint));
    }

    auto outcomes = registry_.Wait(req.operation_ids, req.wait_timeout);
    if (!outcomes.has_value()) {
      return Result::error(MakeToolError(ToolErrorCode::kEmptyOperationIds,
                                         RegistryErrorMessage(outcomes.get_error())));
    }
    const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - now);

    ToolReply reply;
    for (const auto& wo : outcomes.value()) {
      if (!reply.text.empty()) reply.text += "\n\n";
      reply.text += FormatWaitOutcome(wo, waited);
    }
    for (const auto& h : hints) reply.text += "\n\n" + h;
    return Result::success(std::move(reply));
  }

  expected<ToolReply, ToolError> HandleSleep(const ToolRequest& req,
                                             std::shared_ptr<CallbackSender> sender) {
    using Result = expected<ToolReply, ToolError>;
    if (!req.duration_ms.has_value()) {
      return Result::error(
          MakeToolError(ToolErrorCode::kInvalidRequest, "duration_ms is required"));
    }
    const uint64_t ms = *req.duration_ms;
    if (ms > kMaxSleepMs) {
      return Result::error(MakeToolError(
          ToolErrorCode::kInvalidRequest,
          "duration_ms must not exceed " + std::to_string(kMaxSleepMs)));
    }
    const ExecutionMode mode =
        ResolveExecutionMode(cfg_.synchronous_mode, req.enable_async_notification);

    if (mode == ExecutionMode::kSynchronous) {
      ToolReply reply;
      if (!InterruptibleSleep(std::chrono::milliseconds(ms))) {
        reply.text = "Sleep interrupted by shutdown";
        reply.is_error = true;
      } else {
        reply.text = "Slept for " + std::to_string(ms) + "ms";
      }
      return Result::success(std::move(reply));
    }

    RegisterRequest rr;
    rr.command_kind = "sleep";
    rr.description = "sleep " + std::to_string(ms) + "ms";
    rr.working_directory = req.working_directory;
    rr.id = req.operation_id;
    auto id = RegisterOrError(rr);
    if (!id.has_value()) return Result::error(id.get_error());
    const std::string op_id = id.value();

    const bool spawned = SpawnTask([this, op_id, ms, sender]() {
      if (!registry_.MarkRunning(op_id).has_value()) return;
      PublishLogged(sender.get(), progress::Started{op_id, "sleep",
                                                    "sleep " + std::to_string(ms) + "ms"});
      OperationOutcome outcome;
      if (InterruptibleSleep(std::chrono::milliseconds(ms))) {
        outcome.state = OperationState::kCompleted;
        outcome.output = "Slept for " + std::to_string(ms) + "ms";
      } else {
        outcome.state = OperationState::kCancelled;
        outcome.output = "Sleep interrupted by shutdown";
        outcome.result_summary = "cancelled";
      }
      Finish(op_id, "Sleep", std::move(outcome), sender.get());
    });
    if (!spawned) {
      AbandonOperation(op_id);
      return Result::error(
          MakeToolError(ToolErrorCode::kShuttingDown, "server is shutting down"));
    }

    ToolReply reply;
    reply.operation_id = op_id;
    reply.text = "+ Sleep operation '" + op_id + "' started in background at " +
                 CurrentClockTime() + "." + hints_.Preview(op_id, "sleep");
    return Result::success(std::move(reply));
  }

  // ======================== Helpers ========================

  expected<std::string, ToolError> RegisterOrError(const RegisterRequest& rr) {
    auto id = registry_.Register(rr);
    if (id.has_value()) {
      return expected<std::string, ToolError>::success(id.value());
    }
    const ToolErrorCode code = (id.get_error() == RegistryError::kShutdown)
                                   ? ToolErrorCode::kShuttingDown
                                   : ToolErrorCode::kInvalidRequest;
    return expected<std::string, ToolError>::error(
        MakeToolError(code, RegistryErrorMessage(id.get_error())));
  }

  /// @brief Settle a registered operation whose task was never started.
  void AbandonOperation(const std::string& id) {
    OperationOutcome outcome;
    outcome.state = OperationState::kCancelled;
    outcome.output = "Operation not started: server is shutting down";
    outcome.result_summary = "cancelled";
    if (!registry_.MarkRunning(id).has_value() ||
        !registry_.MarkTerminal(id, std::move(outcome)).has_value()) {
      ORCA_LOG_WARN("Dispatcher", "unstarted operation %s left unsettled", id.c_str());
    }
    hints_.Forget(id);
  }

  /// @brief Record the outcome, then announce it.
  void Finish(const std::string& id, const std::string& label, OperationOutcome outcome,
              CallbackSender* sender) {
    const OperationState state = outcome.state;
    if (!registry_.MarkTerminal(id, std::move(outcome)).has_value()) return;

    auto snapshot = registry_.Status(id);
    if (!snapshot.has_value()) return;
    const Operation& op = snapshot.value();
    WaitOutcome wo;
    wo.id = id;
    wo.status = WaitStatus::kTerminal;
    wo.snapshot = op;

    progress::Completed done;
    done.operation_id = id;
    done.state = state;
    done.message = label + (IsSuccess(state) ? " completed successfully"
                                             : std::string(" ended ") + StatusString(state));
    done.duration = op.Elapsed();
    done.report = FormatWaitOutcome(wo, op.Elapsed());
    PublishLogged(sender, done);
    notifier_.Forget(id);
  }

  void PublishLogged(CallbackSender* sender, const ProgressUpdate& update) {
    // Failures are logged by the notifier and never touch the operation.
    auto delivered = notifier_.Publish(sender, update);
    if (!delivered.has_value() && !delivered.get_error().IsRecoverable()) {
      ORCA_LOG_DEBUG("Dispatcher", "subscriber for %s is gone",
                     OperationIdOf(update).c_str());
    }
  }

  /// @return false when interrupted by Shutdown().
  bool InterruptibleSleep(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lock(tasks_mutex_);
    return !shutdown_cv_.wait_for(lock, d, [this] { return shutting_down_; });
  }

  /// Holds tasks_mutex_ so no task starts after Shutdown() flips the flag.
  template <typename Fn>
  bool SpawnTask(Fn&& fn) {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    if (shutting_down_) return false;
    return tasks_.Spawn(std::forward<Fn>(fn));
  }

  OperationRegistry& registry_;
  WorkerPool& pool_;
  NotificationDispatcher& notifier_;
  HintEngine& hints_;
  const CommandCatalog& catalog_;
  DispatcherConfig cfg_;

  mutable std::mutex tasks_mutex_;
  std::condition_variable shutdown_cv_;
  bool shutting_down_ = false;
  TaskGroup tasks_;
};

}  // namespace orca

#endif  // ORCA_DISPATCHER_HPP_
