/**
 * @file test_hints.cpp
 * @brief Tests for hints.hpp
 */

#include "orca/hints.hpp"

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>

using orca_test::Contains;
using std::chrono::milliseconds;

TEST_CASE("Preview names the operation and the wait syntax", "[hints]") {
  orca::HintEngine hints;
  const std::string p = hints.Preview("op_abc", "build");
  REQUIRE(Contains(p, "ASYNC BUILD OPERATION: build (ID: op_abc)"));
  REQUIRE(Contains(p, "operation_ids=['op_abc']"));
  REQUIRE(Contains(p, "never pass an empty list"));
}

TEST_CASE("A quick first wait produces a concurrency hint", "[hints]") {
  orca::HintEngine hints;
  const auto started = std::chrono::steady_clock::now();
  auto h = hints.ObserveWait("op_a", started, started + milliseconds(1500));
  REQUIRE(h.has_value());
  REQUIRE(Contains(*h, "CONCURRENCY HINT: You waited for 'op_a' after only 1.5s"));
  REQUIRE(Contains(*h, "(efficiency: 5%)"));
  REQUIRE(hints.HasWaited("op_a"));
}

TEST_CASE("Only the first wait per operation is judged", "[hints]") {
  orca::HintEngine hints;
  const auto started = std::chrono::steady_clock::now();
  REQUIRE(hints.ObserveWait("op_a", started, started + milliseconds(100)).has_value());
  REQUIRE(!hints.ObserveWait("op_a", started, started + milliseconds(200)).has_value());
}

TEST_CASE("A patient wait produces no hint", "[hints]") {
  orca::HintEngine hints;
  const auto started = std::chrono::steady_clock::now();
  REQUIRE(!hints.ObserveWait("op_a", started, started + milliseconds(5000)).has_value());
  REQUIRE(!hints.ObserveWait("op_b", started, started + milliseconds(60000)).has_value());
}

TEST_CASE("The concurrency threshold is configurable", "[hints]") {
  orca::HintConfig cfg;
  cfg.concurrency_threshold = milliseconds(100);
  orca::HintEngine hints(cfg);
  const auto started = std::chrono::steady_clock::now();
  REQUIRE(!hints.ObserveWait("op_a", started, started + milliseconds(150)).has_value());
  REQUIRE(hints.ObserveWait("op_b", started, started + milliseconds(50)).has_value());
}

TEST_CASE("Status polling hint fires from the threshold on", "[hints]") {
  orca::HintEngine hints;
  REQUIRE(!hints.ObserveStatus("op_a").has_value());
  REQUIRE(!hints.ObserveStatus("op_a").has_value());
  auto third = hints.ObserveStatus("op_a");
  REQUIRE(third.has_value());
  REQUIRE(Contains(*third, "You've called status 3 times for operation 'op_a'"));
  auto fourth = hints.ObserveStatus("op_a");
  REQUIRE(fourth.has_value());
  REQUIRE(Contains(*fourth, "status 4 times"));

  REQUIRE(!hints.ObserveStatus("op_b").has_value());
  REQUIRE(hints.StatusCount("op_a") == 4U);
  REQUIRE(hints.StatusCount("op_b") == 1U);
}

TEST_CASE("Forget clears both observations", "[hints]") {
  orca::HintEngine hints;
  const auto started = std::chrono::steady_clock::now();
  (void)hints.ObserveStatus("op_a");
  (void)hints.ObserveWait("op_a", started, started);
  hints.Forget("op_a");
  REQUIRE(hints.StatusCount("op_a") == 0U);
  REQUIRE(!hints.HasWaited("op_a"));
  REQUIRE(hints.ObserveWait("op_a", started, started).has_value());
}
