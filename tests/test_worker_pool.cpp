/**
 * @file test_worker_pool.cpp
 * @brief Tests for worker_pool.hpp
 */

#include "orca/worker_pool.hpp"

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using orca::WorkerError;
using std::chrono::milliseconds;

namespace {

orca::PoolConfig TestPoolConfig() {
  orca::PoolConfig cfg;
  cfg.shell = "/bin/bash";
  cfg.command_timeout = milliseconds(10000);
  cfg.checkout_wait = milliseconds(50);
  return cfg;
}

}  // namespace

// ============================================================================
// Output merging and quoting
// ============================================================================

TEST_CASE("MergeOutput falls back to stderr when stdout is empty", "[worker_pool][merge]") {
  auto m = orca::MergeOutput("", "error: could not compile");
  REQUIRE(m.output == "error: could not compile");
  REQUIRE(m.diagnostics.empty());
}

TEST_CASE("MergeOutput keeps stderr as diagnostics beside stdout", "[worker_pool][merge]") {
  auto m = orca::MergeOutput("test result: ok", "warning: unused");
  REQUIRE(m.output == "test result: ok");
  REQUIRE(m.diagnostics == "warning: unused");

  auto only_out = orca::MergeOutput("done", "");
  REQUIRE(only_out.output == "done");
  REQUIRE(only_out.diagnostics.empty());

  auto neither = orca::MergeOutput("", "");
  REQUIRE(neither.output.empty());
  REQUIRE(neither.diagnostics.empty());
}

TEST_CASE("ShellQuote wraps and escapes single quotes", "[worker_pool]") {
  REQUIRE(orca::ShellQuote("plain") == "'plain'");
  REQUIRE(orca::ShellQuote("") == "''");
  REQUIRE(orca::ShellQuote("it's") == "'it'\\''s'");
  REQUIRE(orca::ShellQuote("$HOME; rm -rf /") == "'$HOME; rm -rf /'");
}

TEST_CASE("WorkerError classification", "[worker_pool]") {
  REQUIRE(orca::IsResourceExhaustion(WorkerError::kTimeout));
  REQUIRE(orca::IsResourceExhaustion(WorkerError::kPoolFull));
  REQUIRE(orca::IsIoError(WorkerError::kWorkingDirectory));
  REQUIRE(orca::WorkerErrorSeverity(WorkerError::kPoolFull) == orca::log::Level::kWarn);
  REQUIRE(orca::WorkerErrorSeverity(WorkerError::kSpawnFailed) == orca::log::Level::kError);
  REQUIRE(std::string(orca::WorkerHealthName(orca::WorkerHealth::kIdle)) == "idle");
}

// ============================================================================
// Running commands
// ============================================================================

TEST_CASE("Run captures stdout, stderr and the exit code", "[worker_pool]") {
  orca_test::TempDir dir;
  orca::WorkerPool pool(TestPoolConfig());

  auto r = pool.Run(dir.path(), {"sh", "-c", "echo out; echo err >&2; exit 3"});
  REQUIRE(r.has_value());
  REQUIRE(r.value().exit_code == 3);
  REQUIRE(!r.value().Succeeded());
  REQUIRE(r.value().stdout_text == "out\n");
  REQUIRE(r.value().stderr_text == "err\n");

  auto merged = orca::MergeOutput(r.value());
  REQUIRE(merged.output == "out\n");
  REQUIRE(merged.diagnostics == "err\n");
}

TEST_CASE("Run executes in the working directory", "[worker_pool]") {
  orca_test::TempDir dir;
  dir.WriteFile("Cargo.toml", "[package]\n");
  orca::WorkerPool pool(TestPoolConfig());

  auto r = pool.Run(dir.path(), {"ls"});
  REQUIRE(r.has_value());
  REQUIRE(r.value().Succeeded());
  REQUIRE(r.value().stdout_text == "Cargo.toml\n");
}

TEST_CASE("Run passes arguments verbatim", "[worker_pool]") {
  orca_test::TempDir dir;
  orca::WorkerPool pool(TestPoolConfig());
  auto r = pool.Run(dir.path(), {"printf", "%s", "it's a $HOME `test`"});
  REQUIRE(r.has_value());
  REQUIRE(r.value().stdout_text == "it's a $HOME `test`");
}

TEST_CASE("Run reports a missing program as exit 127", "[worker_pool]") {
  orca_test::TempDir dir;
  orca::WorkerPool pool(TestPoolConfig());
  auto r = pool.Run(dir.path(), {"orca-definitely-not-installed-xyz"});
  REQUIRE(r.has_value());
  REQUIRE(r.value().exit_code == 127);
  REQUIRE(r.value().stdout_text.empty());
  REQUIRE(!r.value().stderr_text.empty());
}

TEST_CASE("Run rejects a missing working directory", "[worker_pool]") {
  orca_test::TempDir dir;
  orca::WorkerPool pool(TestPoolConfig());
  auto r = pool.Run(dir.path() + "/nope", {"true"});
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == WorkerError::kWorkingDirectory);
}

TEST_CASE("A command past its timeout kills the worker", "[worker_pool]") {
  orca_test::TempDir dir;
  orca::PoolConfig cfg = TestPoolConfig();
  cfg.command_timeout = milliseconds(200);
  orca::WorkerPool pool(cfg);

  const auto t0 = std::chrono::steady_clock::now();
  auto r = pool.Run(dir.path(), {"sleep", "5"});
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == WorkerError::kTimeout);
  REQUIRE(std::chrono::steady_clock::now() - t0 < milliseconds(3000));

  // The broken worker is discarded at check-in, and the next run is fresh.
  REQUIRE(pool.WorkerCount(dir.path()) == 0U);
  REQUIRE(pool.Stats().discarded == 1U);
  auto again = pool.Run(dir.path(), {"true"});
  REQUIRE(again.has_value());
  REQUIRE(again.value().Succeeded());
}

// ============================================================================
// Pooling
// ============================================================================

TEST_CASE("Sequential runs reuse one worker per directory", "[worker_pool][pooling]") {
  orca_test::TempDir dir;
  orca::WorkerPool pool(TestPoolConfig());

  for (int i = 0; i < 3; ++i) {
    auto r = pool.Run(dir.path(), {"true"});
    REQUIRE(r.has_value());
  }
  auto st = pool.Stats();
  REQUIRE(st.spawned == 1U);
  REQUIRE(st.reused == 2U);
  REQUIRE(st.pools == 1U);
  REQUIRE(st.idle == 1U);
  REQUIRE(st.in_use == 0U);
  REQUIRE(pool.WorkerCount(dir.path()) == 1U);
}

TEST_CASE("Workers are keyed by directory", "[worker_pool][pooling]") {
  orca_test::TempDir a;
  orca_test::TempDir b;
  orca::WorkerPool pool(TestPoolConfig());
  REQUIRE(pool.Run(a.path(), {"true"}).has_value());
  REQUIRE(pool.Run(b.path(), {"true"}).has_value());
  REQUIRE(pool.Stats().pools == 2U);
  REQUIRE(pool.WorkerCount(a.path()) == 1U);
  REQUIRE(pool.WorkerCount(b.path()) == 1U);
}

TEST_CASE("A held worker is never handed out twice", "[worker_pool][pooling]") {
  orca_test::TempDir dir;
  orca::PoolConfig cfg = TestPoolConfig();
  cfg.capacity_per_key = 1;
  orca::WorkerPool pool(cfg);

  auto first = pool.Checkout(dir.path());
  REQUIRE(first.has_value());
  REQUIRE(!first.value().transient());

  auto second = pool.Checkout(dir.path());
  REQUIRE(second.has_value());
  REQUIRE(second.value().transient());
  REQUIRE(second.value().worker() != first.value().worker());

  auto r = pool.Execute(second.value(), {"echo", "overflow"});
  REQUIRE(r.has_value());
  REQUIRE(r.value().stdout_text == "overflow\n");

  auto st = pool.Stats();
  REQUIRE(st.transient_spawned == 1U);
  REQUIRE(st.transient_active == 1U);
  REQUIRE(st.in_use == 1U);

  pool.Checkin(second.value());
  pool.Checkin(first.value());
  pool.Checkin(first.value());  // emptied lease: no-op
  st = pool.Stats();
  REQUIRE(st.transient_active == 0U);
  REQUIRE(st.idle == 1U);
}

TEST_CASE("A checkout waits briefly for a returning worker", "[worker_pool][pooling]") {
  orca_test::TempDir dir;
  orca::PoolConfig cfg = TestPoolConfig();
  cfg.capacity_per_key = 1;
  cfg.checkout_wait = milliseconds(2000);
  orca::WorkerPool pool(cfg);

  auto first = pool.Checkout(dir.path());
  REQUIRE(first.has_value());
  std::thread releaser([&] {
    std::this_thread::sleep_for(milliseconds(50));
    pool.Checkin(first.value());
  });
  auto second = pool.Checkout(dir.path());
  releaser.join();
  REQUIRE(second.has_value());
  REQUIRE(!second.value().transient());
  REQUIRE(pool.Stats().reused == 1U);
}

TEST_CASE("The transient cap turns overflow into kPoolFull", "[worker_pool][pooling]") {
  orca_test::TempDir dir;
  orca::PoolConfig cfg = TestPoolConfig();
  cfg.capacity_per_key = 1;
  cfg.max_transient_workers = 0;
  orca::WorkerPool pool(cfg);

  auto first = pool.Checkout(dir.path());
  REQUIRE(first.has_value());
  auto second = pool.Checkout(dir.path());
  REQUIRE(!second.has_value());
  REQUIRE(second.get_error() == WorkerError::kPoolFull);
}

TEST_CASE("A lease checks itself in when destroyed", "[worker_pool][pooling]") {
  orca_test::TempDir dir;
  orca::WorkerPool pool(TestPoolConfig());
  {
    auto lease = pool.Checkout(dir.path());
    REQUIRE(lease.has_value());
    REQUIRE(pool.Stats().in_use == 1U);
  }
  REQUIRE(pool.Stats().in_use == 0U);
  REQUIRE(pool.Stats().idle == 1U);
}

TEST_CASE("A disabled pool serves every command transiently", "[worker_pool][pooling]") {
  orca_test::TempDir dir;
  orca::PoolConfig cfg = TestPoolConfig();
  cfg.enabled = false;
  orca::WorkerPool pool(cfg);
  REQUIRE(pool.Start().has_value());

  REQUIRE(pool.Run(dir.path(), {"true"}).has_value());
  REQUIRE(pool.Run(dir.path(), {"true"}).has_value());
  auto st = pool.Stats();
  REQUIRE(st.pooled_workers == 0U);
  REQUIRE(st.transient_spawned == 2U);
}

TEST_CASE("A broken shell fails the spawn", "[worker_pool]") {
  orca_test::TempDir dir;
  orca::PoolConfig cfg = TestPoolConfig();
  cfg.shell = "/nonexistent/orca-shell";
  cfg.spawn_timeout = milliseconds(500);
  orca::WorkerPool pool(cfg);
  auto r = pool.Run(dir.path(), {"true"});
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == WorkerError::kSpawnFailed);
  REQUIRE(pool.WorkerCount(dir.path()) == 0U);
}

// ============================================================================
// Maintenance
// ============================================================================

TEST_CASE("ReapIdle removes workers idle past the timeout", "[worker_pool][maintenance]") {
  orca_test::TempDir dir;
  orca::PoolConfig cfg = TestPoolConfig();
  cfg.idle_timeout = milliseconds(10);
  orca::WorkerPool pool(cfg);

  REQUIRE(pool.Run(dir.path(), {"true"}).has_value());
  auto held = pool.Checkout(dir.path());
  REQUIRE(held.has_value());
  REQUIRE(pool.Run(dir.path(), {"true"}).has_value());  // second pooled worker
  std::this_thread::sleep_for(milliseconds(40));

  // Only the idle one goes; the leased one stays.
  REQUIRE(pool.ReapIdle() == 1U);
  REQUIRE(pool.WorkerCount(dir.path()) == 1U);
  pool.Checkin(held.value());
}

TEST_CASE("HealthCheckIdle keeps responsive workers", "[worker_pool][maintenance]") {
  orca_test::TempDir dir;
  orca::WorkerPool pool(TestPoolConfig());
  REQUIRE(pool.Run(dir.path(), {"true"}).has_value());
  REQUIRE(pool.HealthCheckIdle() == 0U);
  auto st = pool.Stats();
  REQUIRE(st.idle == 1U);
  REQUIRE(st.discarded == 0U);
}

TEST_CASE("Shutdown terminates idle workers and refuses checkouts", "[worker_pool][maintenance]") {
  orca_test::TempDir dir;
  orca::WorkerPool pool(TestPoolConfig());
  REQUIRE(pool.Start().has_value());
  REQUIRE(pool.Run(dir.path(), {"true"}).has_value());

  pool.Shutdown();
  REQUIRE(pool.WorkerCount(dir.path()) == 0U);
  auto r = pool.Run(dir.path(), {"true"});
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == WorkerError::kPoolFull);
  pool.Shutdown();
}
