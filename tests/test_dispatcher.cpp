/**
 * @file test_dispatcher.cpp
 * @brief Tests for dispatcher.hpp
 */

#include "orca/dispatcher.hpp"

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using orca::ExecutionMode;
using orca::ToolErrorCode;
using orca::ToolRequest;
using orca_test::Contains;
using std::chrono::milliseconds;

namespace {

orca::CommandCatalog TestCatalog() {
  orca::CommandCatalog cat;
  auto add = [&cat](const std::string& name, std::vector<std::string> argv,
                    orca::CommandKind kind, std::vector<std::string> aliases) {
    orca::CommandSpec spec;
    spec.name = name;
    spec.argv = std::move(argv);
    spec.kind = kind;
    spec.description = "Test " + name + ".";
    spec.aliases = std::move(aliases);
    REQUIRE(cat.Add(std::move(spec)).has_value());
  };
  add("build", {"sh", "-c", "echo built"}, orca::CommandKind::kLongRunning, {"b"});
  add("shell", {"sh", "-c"}, orca::CommandKind::kLongRunning, {});
  add("version", {"sh", "-c", "echo 1.0"}, orca::CommandKind::kQuick, {});
  add("ghost", {"orca-definitely-not-installed-xyz"}, orca::CommandKind::kLongRunning, {});
  return cat;
}

orca::MonitorConfig TestMonitorConfig() {
  orca::MonitorConfig cfg;
  cfg.auto_cleanup = false;
  cfg.default_timeout = milliseconds(10000);
  return cfg;
}

/// One dispatcher with its collaborators; destroyed dispatcher first.
struct Harness {
  explicit Harness(orca::DispatcherConfig cfg = orca::DispatcherConfig{},
                   const orca::MonitorConfig& monitor = TestMonitorConfig())
      : registry(monitor),
        catalog(TestCatalog()),
        dispatcher(registry, pool, notifier, hints, catalog, std::move(cfg)) {}

  orca_test::TempDir dir;
  orca::OperationRegistry registry;
  orca::WorkerPool pool;
  orca::NotificationDispatcher notifier;
  orca::HintEngine hints;
  orca::CommandCatalog catalog;
  orca::Dispatcher dispatcher;
};

ToolRequest Command(const std::string& tool, const std::string& dir) {
  ToolRequest req;
  req.tool = tool;
  req.working_directory = dir;
  return req;
}

ToolRequest Shell(const std::string& dir, const std::string& script, bool async) {
  ToolRequest req = Command("shell", dir);
  req.args = {script};
  if (async) req.enable_async_notification = true;
  return req;
}

ToolRequest Sleep(uint64_t ms, const std::string& id) {
  ToolRequest req;
  req.tool = "sleep";
  req.duration_ms = ms;
  req.enable_async_notification = true;
  req.operation_id = id;
  return req;
}

ToolRequest Wait(std::vector<std::string> ids,
                 std::optional<milliseconds> timeout = std::nullopt) {
  ToolRequest req;
  req.tool = "wait";
  req.operation_ids = std::move(ids);
  req.wait_timeout = timeout;
  return req;
}

}  // namespace

// ============================================================================
// Execution mode
// ============================================================================

TEST_CASE("ResolveExecutionMode truth table", "[dispatcher][mode]") {
  static_assert(orca::ResolveExecutionMode(false, true) == ExecutionMode::kBackground,
                "async flag selects background");
  REQUIRE(orca::ResolveExecutionMode(true, true) == ExecutionMode::kSynchronous);
  REQUIRE(orca::ResolveExecutionMode(true, false) == ExecutionMode::kSynchronous);
  REQUIRE(orca::ResolveExecutionMode(true, std::nullopt) == ExecutionMode::kSynchronous);
  REQUIRE(orca::ResolveExecutionMode(false, true) == ExecutionMode::kBackground);
  REQUIRE(orca::ResolveExecutionMode(false, false) == ExecutionMode::kSynchronous);
  REQUIRE(orca::ResolveExecutionMode(false, std::nullopt) == ExecutionMode::kSynchronous);
}

// ============================================================================
// Gate and request validation
// ============================================================================

TEST_CASE("Disabled tools are rejected by name and alias", "[dispatcher][gate]") {
  orca::DispatcherConfig cfg;
  cfg.disabled_tools = {"build", "sleep"};
  Harness h(cfg);

  for (const char* name : {"build", "b"}) {
    auto r = h.dispatcher.Invoke(Command(name, h.dir.path()));
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error().code == ToolErrorCode::kToolDisabled);
    REQUIRE(r.get_error().message.rfind("tool_disabled: ", 0) == 0U);
  }
  auto s = h.dispatcher.Invoke(Sleep(10, "op_gate"));
  REQUIRE(s.get_error().code == ToolErrorCode::kToolDisabled);
  REQUIRE(h.registry.Size() == 0U);

  bool listed = false;
  for (const auto& t : h.dispatcher.Tools()) {
    if (t.name == "build" || t.name == "sleep") listed = true;
  }
  REQUIRE(!listed);
}

TEST_CASE("Tools lists builtins and catalog entries", "[dispatcher][gate]") {
  Harness h;
  auto tools = h.dispatcher.Tools();
  REQUIRE(tools.size() == 7U);
  REQUIRE(tools[0].name == "status");
  REQUIRE(tools[0].builtin);
  REQUIRE(tools[3].name == "build");
  REQUIRE(Contains(tools[3].description, "enable_async_notification=true"));
}

TEST_CASE("Unknown tools and bad requests", "[dispatcher][gate]") {
  Harness h;
  auto unknown = h.dispatcher.Invoke(Command("deploy", h.dir.path()));
  REQUIRE(unknown.get_error().code == ToolErrorCode::kUnknownTool);
  REQUIRE(unknown.get_error().message == "unknown_tool: no tool named 'deploy'");

  auto no_name = h.dispatcher.Invoke(Command("", h.dir.path()));
  REQUIRE(no_name.get_error().code == ToolErrorCode::kInvalidRequest);

  auto no_dir = h.dispatcher.Invoke(Command("build", ""));
  REQUIRE(no_dir.get_error().code == ToolErrorCode::kInvalidRequest);

  auto bad_dir = h.dispatcher.Invoke(Command("build", h.dir.path() + "/missing"));
  REQUIRE(bad_dir.get_error().code == ToolErrorCode::kInvalidRequest);
  REQUIRE(Contains(bad_dir.get_error().message, "is not a directory"));

  ToolRequest sleep_req;
  sleep_req.tool = "sleep";
  REQUIRE(h.dispatcher.Invoke(sleep_req).get_error().code == ToolErrorCode::kInvalidRequest);
}

TEST_CASE("A missing binary is reported in the reply", "[dispatcher][gate]") {
  Harness h;
  auto r = h.dispatcher.Invoke(Command("ghost", h.dir.path()));
  REQUIRE(r.has_value());
  REQUIRE(r.value().is_error);
  REQUIRE(Contains(r.value().text, "'orca-definitely-not-installed-xyz' is not installed"));
  REQUIRE(h.registry.Size() == 0U);
}

// ============================================================================
// Synchronous commands
// ============================================================================

TEST_CASE("Synchronous success reply with diagnostics", "[dispatcher][sync]") {
  Harness h;
  auto r = h.dispatcher.Invoke(Shell(h.dir.path(), "echo out; echo err >&2", false));
  REQUIRE(r.has_value());
  REQUIRE(!r.value().is_error);
  REQUIRE(!r.value().operation_id.has_value());
  REQUIRE(r.value().text == "+ Shell completed successfully in " + h.dir.path() +
                                ".\nOutput: out\n\nErrors: err\n");
}

TEST_CASE("Synchronous failure with only stderr", "[dispatcher][sync]") {
  Harness h;
  auto r = h.dispatcher.Invoke(Shell(h.dir.path(), "echo oops >&2; exit 2", false));
  REQUIRE(r.has_value());
  REQUIRE(r.value().is_error);
  REQUIRE(r.value().text == "- Shell failed in " + h.dir.path() + ".\nOutput: oops\n");
}

TEST_CASE("Synchronous failure with both channels", "[dispatcher][sync]") {
  Harness h;
  auto r = h.dispatcher.Invoke(Shell(h.dir.path(), "echo partial; echo bad >&2; exit 1", false));
  REQUIRE(r.value().text == "- Shell failed in " + h.dir.path() +
                                ".\nError: bad\n\nOutput: partial\n");
}

TEST_CASE("Silent commands get the placeholder", "[dispatcher][sync]") {
  Harness h;
  auto r = h.dispatcher.Invoke(Shell(h.dir.path(), "true", false));
  REQUIRE(r.value().text == "+ Shell completed successfully in " + h.dir.path() +
                                ".\nOutput: (no command output captured)");
}

TEST_CASE("Quick commands ignore the async flag", "[dispatcher][sync]") {
  Harness h;
  ToolRequest req = Command("version", h.dir.path());
  req.enable_async_notification = true;
  auto r = h.dispatcher.Invoke(req);
  REQUIRE(r.has_value());
  REQUIRE(!r.value().operation_id.has_value());
  REQUIRE(!Contains(r.value().text, "started in background"));
  REQUIRE(Contains(r.value().text, "Output: 1.0"));
  REQUIRE(h.registry.Size() == 0U);
}

TEST_CASE("Synchronous mode overrides the async flag", "[dispatcher][sync]") {
  orca::DispatcherConfig cfg;
  cfg.synchronous_mode = true;
  Harness h(cfg);
  auto r = h.dispatcher.Invoke(Shell(h.dir.path(), "echo now", true));
  REQUIRE(r.has_value());
  REQUIRE(!r.value().operation_id.has_value());
  REQUIRE(Contains(r.value().text, "Output: now"));
  REQUIRE(h.registry.Size() == 0U);

  auto s = h.dispatcher.Invoke(Sleep(20, "op_sync_sleep"));
  REQUIRE(s.value().text == "Slept for 20ms");
  REQUIRE(Contains(h.dispatcher.Tools()[0].description, "synchronous mode"));
}

// ============================================================================
// Background commands
// ============================================================================

TEST_CASE("Background command emits started, progress, completed", "[dispatcher][background]") {
  Harness h;
  auto channel = std::make_shared<orca::ChannelSender>();
  auto r = h.dispatcher.Invoke(Shell(h.dir.path(), "echo bg", true), channel);
  REQUIRE(r.has_value());
  REQUIRE(r.value().operation_id.has_value());
  const std::string id = *r.value().operation_id;
  REQUIRE(Contains(r.value().text, "+ Shell operation '" + id + "' started in background at "));
  REQUIRE(Contains(r.value().text, "ASYNC BUILD OPERATION: shell (ID: " + id + ")"));

  std::vector<std::string> kinds;
  std::string report;
  for (int i = 0; i < 3; ++i) {
    auto u = channel->Pop(milliseconds(10000));
    REQUIRE(u.has_value());
    REQUIRE(orca::OperationIdOf(*u) == id);
    kinds.emplace_back(orca::UpdateKindName(*u));
    if (const auto* done = std::get_if<orca::progress::Completed>(&*u)) {
      REQUIRE(done->state == orca::OperationState::kCompleted);
      report = done->report;
    }
  }
  REQUIRE(kinds == std::vector<std::string>{"started", "progress", "completed"});
  // Output travels in the completion report, not as separate line events.
  REQUIRE(!channel->Pop(milliseconds(50)).has_value());
  REQUIRE(Contains(report, "OPERATION COMPLETED: '" + id + "'"));
  REQUIRE(Contains(report, "Output: bg"));

  auto w = h.dispatcher.Invoke(Wait({id}, milliseconds(5000)));
  REQUIRE(w.has_value());
  REQUIRE(Contains(w.value().text, "OPERATION COMPLETED: '" + id + "'"));
  REQUIRE(Contains(w.value().text, "=== FULL OUTPUT ==="));
  REQUIRE(Contains(w.value().text, "Command: shell"));
}

TEST_CASE("Background failure is reported by wait", "[dispatcher][background]") {
  Harness h;
  auto r = h.dispatcher.Invoke(Shell(h.dir.path(), "echo broken >&2; exit 3", true));
  REQUIRE(r.has_value());
  const std::string id = *r.value().operation_id;

  auto w = h.dispatcher.Invoke(Wait({id}, milliseconds(10000)));
  REQUIRE(w.has_value());
  const std::string& text = w.value().text;
  REQUIRE(Contains(text, "OPERATION FAILED: '" + id + "'"));
  REQUIRE(Contains(text, "State: FAILED"));
  REQUIRE(Contains(text, "Result: exit status 3"));
  REQUIRE(Contains(text, "=== FULL ERROR OUTPUT ==="));
  REQUIRE(Contains(text, "broken"));
  REQUIRE(h.registry.Status(id).value().state == orca::OperationState::kFailed);
}

TEST_CASE("Background runs without a subscriber", "[dispatcher][background]") {
  Harness h;
  auto r = h.dispatcher.Invoke(Command("build", h.dir.path()));
  REQUIRE(!r.value().operation_id.has_value());  // no async flag: synchronous

  ToolRequest req = Command("b", h.dir.path());
  req.enable_async_notification = true;
  auto bg = h.dispatcher.Invoke(req, nullptr);
  REQUIRE(bg.has_value());
  const std::string id = *bg.value().operation_id;
  auto w = h.dispatcher.Invoke(Wait({id}, milliseconds(10000)));
  REQUIRE(Contains(w.value().text, "built"));
  REQUIRE(h.notifier.Stats().delivered == 0U);
}

// ============================================================================
// sleep / wait
// ============================================================================

TEST_CASE("Short background sleep completes", "[dispatcher][sleep]") {
  Harness h;
  auto r = h.dispatcher.Invoke(Sleep(300, "op_sleep_short"));
  REQUIRE(r.has_value());
  REQUIRE(r.value().operation_id == std::string("op_sleep_short"));
  REQUIRE(Contains(r.value().text, "+ Sleep operation 'op_sleep_short' started in background"));

  auto w = h.dispatcher.Invoke(Wait({"op_sleep_short"}));
  REQUIRE(w.has_value());
  REQUIRE(Contains(w.value().text, "OPERATION COMPLETED: 'op_sleep_short'"));
  REQUIRE(Contains(w.value().text, "Slept for 300ms"));
}

TEST_CASE("Wait timeout does not disturb the operation", "[dispatcher][sleep]") {
  Harness h;
  REQUIRE(h.dispatcher.Invoke(Sleep(2000, "op_sleep_long")).has_value());

  const auto t0 = std::chrono::steady_clock::now();
  auto early = h.dispatcher.Invoke(Wait({"op_sleep_long"}, milliseconds(1000)));
  const auto waited = std::chrono::steady_clock::now() - t0;
  REQUIRE(early.has_value());
  REQUIRE(Contains(early.value().text, "WAIT TIMED OUT: operation 'op_sleep_long' is still RUNNING"));
  REQUIRE(waited >= milliseconds(950));
  REQUIRE(waited < milliseconds(2000));

  auto late = h.dispatcher.Invoke(Wait({"op_sleep_long"}, milliseconds(5000)));
  REQUIRE(late.has_value());
  REQUIRE(Contains(late.value().text, "OPERATION COMPLETED: 'op_sleep_long'"));
  REQUIRE(Contains(late.value().text, "Slept for 2000ms"));
}

TEST_CASE("Wait with no ids is rejected", "[dispatcher][wait]") {
  Harness h;
  auto r = h.dispatcher.Invoke(Wait({}));
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().code == ToolErrorCode::kEmptyOperationIds);
  REQUIRE(r.get_error().message.rfind("empty_operation_ids: ", 0) == 0U);
}

TEST_CASE("Wait on an unknown id", "[dispatcher][wait]") {
  Harness h;
  auto r = h.dispatcher.Invoke(Wait({"op_unknown"}, milliseconds(10)));
  REQUIRE(r.has_value());
  REQUIRE(r.value().text == "No operation found with ID 'op_unknown'");
}

TEST_CASE("An immediate wait earns a concurrency hint", "[dispatcher][wait]") {
  Harness h;
  REQUIRE(h.dispatcher.Invoke(Sleep(100, "op_hasty")).has_value());
  auto w = h.dispatcher.Invoke(Wait({"op_hasty"}, milliseconds(5000)));
  REQUIRE(Contains(w.value().text, "CONCURRENCY HINT: You waited for 'op_hasty'"));

  auto again = h.dispatcher.Invoke(Wait({"op_hasty"}, milliseconds(5000)));
  REQUIRE(!Contains(again.value().text, "CONCURRENCY HINT"));
}

TEST_CASE("A reused caller id is rejected", "[dispatcher][wait]") {
  Harness h;
  REQUIRE(h.dispatcher.Invoke(Sleep(10, "op_once")).has_value());
  auto dup = h.dispatcher.Invoke(Sleep(10, "op_once"));
  REQUIRE(!dup.has_value());
  REQUIRE(dup.get_error().code == ToolErrorCode::kInvalidRequest);
}

TEST_CASE("Sleep rejects durations past the limit", "[dispatcher][sleep]") {
  orca::DispatcherConfig sync_cfg;
  sync_cfg.synchronous_mode = true;
  Harness h(sync_cfg);

  ToolRequest req;
  req.tool = "sleep";
  req.duration_ms = UINT64_MAX;
  const auto t0 = std::chrono::steady_clock::now();
  auto huge = h.dispatcher.Invoke(req);
  REQUIRE(std::chrono::steady_clock::now() - t0 < milliseconds(1000));
  REQUIRE(!huge.has_value());
  REQUIRE(huge.get_error().code == ToolErrorCode::kInvalidRequest);
  REQUIRE(Contains(huge.get_error().message, "duration_ms"));

  req.duration_ms = orca::kMaxSleepMs + 1U;
  REQUIRE(h.dispatcher.Invoke(req).get_error().code == ToolErrorCode::kInvalidRequest);

  Harness bg;
  auto refused = bg.dispatcher.Invoke(Sleep(UINT64_MAX, "op_forever_and_ever"));
  REQUIRE(refused.get_error().code == ToolErrorCode::kInvalidRequest);
  REQUIRE(!bg.registry.Status("op_forever_and_ever").has_value());
}

// ============================================================================
// status
// ============================================================================

TEST_CASE("Status reports one operation and hints at polling", "[dispatcher][status]") {
  Harness h;
  REQUIRE(h.dispatcher.Invoke(Sleep(50, "op_polled")).has_value());
  REQUIRE(h.dispatcher.Invoke(Wait({"op_polled"}, milliseconds(5000))).has_value());

  ToolRequest req;
  req.tool = "status";
  req.operation_id = std::string("op_polled");
  std::string last;
  for (int i = 0; i < 3; ++i) {
    auto r = h.dispatcher.Invoke(req);
    REQUIRE(r.has_value());
    last = r.value().text;
    if (i < 2) REQUIRE(!Contains(last, "STATUS POLLING DETECTED"));
  }
  REQUIRE(Contains(last, "Operation 'op_polled': COMPLETED"));
  REQUIRE(Contains(last, "=== OUTPUT ===\nSlept for 50ms"));
  REQUIRE(Contains(last, "STATUS POLLING DETECTED: You've called status 3 times"));
}

TEST_CASE("Status of an unknown id", "[dispatcher][status]") {
  Harness h;
  ToolRequest req;
  req.tool = "status";
  req.operation_id = std::string("op_nobody");
  auto r = h.dispatcher.Invoke(req);
  REQUIRE(r.get_error().code == ToolErrorCode::kOperationNotFound);
  REQUIRE(Contains(r.get_error().message, "No operation found with ID 'op_nobody'"));
}

TEST_CASE("Status listing filters by state", "[dispatcher][status]") {
  Harness h;
  REQUIRE(h.dispatcher.Invoke(Sleep(10, "op_fast")).has_value());
  REQUIRE(h.dispatcher.Invoke(Wait({"op_fast"}, milliseconds(5000))).has_value());

  ToolRequest list;
  list.tool = "status";
  auto all = h.dispatcher.Invoke(list);
  REQUIRE(Contains(all.value().text, "Operations (1):"));
  REQUIRE(Contains(all.value().text, "- op_fast [COMPLETED] sleep"));
  REQUIRE(Contains(all.value().text, "Statistics: total=1"));

  list.state_filter = std::string("running");
  auto none = h.dispatcher.Invoke(list);
  REQUIRE(Contains(none.value().text, "No operations found."));

  list.state_filter = std::string("sideways");
  REQUIRE(h.dispatcher.Invoke(list).get_error().code == ToolErrorCode::kInvalidRequest);
}

TEST_CASE("Evicted operations drop their hint state", "[dispatcher][status]") {
  orca::MonitorConfig monitor = TestMonitorConfig();
  monitor.retention = milliseconds(20);
  Harness h(orca::DispatcherConfig{}, monitor);

  REQUIRE(h.dispatcher.Invoke(Sleep(10, "op_swept")).has_value());
  REQUIRE(h.dispatcher.Invoke(Wait({"op_swept"}, milliseconds(5000))).has_value());
  ToolRequest req;
  req.tool = "status";
  req.operation_id = std::string("op_swept");
  for (int i = 0; i < 3; ++i) REQUIRE(h.dispatcher.Invoke(req).has_value());
  REQUIRE(h.hints.StatusCount("op_swept") == 3U);
  REQUIRE(h.hints.HasWaited("op_swept"));

  std::this_thread::sleep_for(milliseconds(50));
  REQUIRE(h.registry.Sweep() == 1U);
  REQUIRE(h.hints.StatusCount("op_swept") == 0U);
  REQUIRE(!h.hints.HasWaited("op_swept"));
}

// ============================================================================
// Shutdown
// ============================================================================

TEST_CASE("Shutdown cancels sleeps and refuses new calls", "[dispatcher][shutdown]") {
  Harness h;
  REQUIRE(h.dispatcher.Invoke(Sleep(30000, "op_forever")).has_value());
  REQUIRE(orca_test::WaitUntil(
      [&] {
        return h.registry.Status("op_forever").value().state ==
               orca::OperationState::kRunning;
      },
      milliseconds(5000)));

  const auto t0 = std::chrono::steady_clock::now();
  h.dispatcher.Shutdown();
  REQUIRE(std::chrono::steady_clock::now() - t0 < milliseconds(5000));
  REQUIRE(h.dispatcher.IsShuttingDown());
  REQUIRE(h.dispatcher.ActiveTasks() == 0U);

  auto op = h.registry.Status("op_forever");
  REQUIRE(op.value().state == orca::OperationState::kCancelled);
  REQUIRE(op.value().output == "Sleep interrupted by shutdown");

  auto refused = h.dispatcher.Invoke(Sleep(10, "op_late"));
  REQUIRE(refused.get_error().code == ToolErrorCode::kShuttingDown);
  h.dispatcher.Shutdown();
}

TEST_CASE("Shutdown racing background starts leaves nothing pending",
          "[dispatcher][shutdown]") {
  Harness h;
  std::optional<ToolErrorCode> refusal;
  std::thread caller([&h, &refusal] {
    for (int i = 0; i < 500; ++i) {
      auto r = h.dispatcher.Invoke(Sleep(5, "op_race_" + std::to_string(i)));
      if (!r.has_value()) {
        refusal = r.get_error().code;
        return;
      }
    }
  });
  std::this_thread::sleep_for(milliseconds(20));
  h.dispatcher.Shutdown();
  caller.join();
  if (refusal.has_value()) REQUIRE(*refusal == ToolErrorCode::kShuttingDown);

  orca::OperationFilter active;
  active.state = orca::OperationState::kPending;
  REQUIRE(h.registry.List(active).empty());
  active.state = orca::OperationState::kRunning;
  REQUIRE(h.registry.List(active).empty());
  for (const auto& op : h.registry.List(orca::OperationFilter{})) {
    REQUIRE(orca::IsTerminal(op.state));
  }
}
