/**
 * @file test_notifier.cpp
 * @brief Tests for notifier.hpp
 */

#include "orca/notifier.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using orca::DeliveryStatus;
using orca::ProgressUpdate;

namespace {

ProgressUpdate MakeStarted(const std::string& id) {
  return orca::progress::Started{id, "build", "Build project"};
}

ProgressUpdate MakeProgress(const std::string& id, const std::string& msg) {
  orca::progress::Progress p;
  p.operation_id = id;
  p.message = msg;
  return p;
}

ProgressUpdate MakeCompleted(const std::string& id) {
  orca::progress::Completed c;
  c.operation_id = id;
  c.state = orca::OperationState::kCompleted;
  c.message = "done";
  c.duration = std::chrono::milliseconds(1500);
  return c;
}

/// Records the kind of every event that reaches it.
class RecordingSender final : public orca::CallbackSender {
 public:
  orca::expected<void, orca::CallbackError> Send(const ProgressUpdate& u) override {
    kinds.emplace_back(orca::UpdateKindName(u));
    return orca::expected<void, orca::CallbackError>::success();
  }
  std::vector<std::string> kinds;
};

}  // namespace

// ============================================================================
// ProgressUpdate helpers
// ============================================================================

TEST_CASE("ProgressUpdate helpers", "[notifier]") {
  const ProgressUpdate s = MakeStarted("op_1");
  REQUIRE(orca::OperationIdOf(s) == "op_1");
  REQUIRE(std::string(orca::UpdateKindName(s)) == "started");
  REQUIRE(orca::ToString(s) == "[op_1] started: build (Build project)");

  orca::progress::Progress p;
  p.operation_id = "op_1";
  p.message = "compiling";
  p.percentage = 42.0;
  p.current_step = std::string("serde");
  REQUIRE(orca::ToString(ProgressUpdate(p)) == "[op_1] compiling (42.0%) step: serde");

  orca::progress::Output o{"op_1", "warning: unused", true};
  REQUIRE(orca::ToString(ProgressUpdate(o)) == "[op_1] stderr: warning: unused");

  REQUIRE(orca::ToString(MakeCompleted("op_1")) == "[op_1] COMPLETED in 1500ms: done");
}

// ============================================================================
// Ordering
// ============================================================================

TEST_CASE("Publish enforces started before progress before completed", "[notifier]") {
  orca::NotificationDispatcher n;
  RecordingSender rec;

  REQUIRE(n.Publish(&rec, MakeProgress("op_a", "early")).value() ==
          DeliveryStatus::kSuppressed);
  REQUIRE(n.Publish(&rec, MakeCompleted("op_a")).value() == DeliveryStatus::kSuppressed);
  REQUIRE(n.Publish(&rec, MakeStarted("op_a")).value() == DeliveryStatus::kDelivered);
  REQUIRE(n.Publish(&rec, MakeStarted("op_a")).value() == DeliveryStatus::kSuppressed);
  REQUIRE(n.Publish(&rec, MakeProgress("op_a", "1")).value() == DeliveryStatus::kDelivered);
  REQUIRE(n.Publish(&rec, MakeProgress("op_a", "2")).value() == DeliveryStatus::kDelivered);
  REQUIRE(n.Publish(&rec, MakeCompleted("op_a")).value() == DeliveryStatus::kDelivered);
  REQUIRE(n.HasCompleted("op_a"));

  // Nothing follows completion.
  REQUIRE(n.Publish(&rec, MakeProgress("op_a", "late")).value() ==
          DeliveryStatus::kSuppressed);
  REQUIRE(n.Publish(&rec, MakeCompleted("op_a")).value() == DeliveryStatus::kSuppressed);

  REQUIRE(rec.kinds ==
          std::vector<std::string>{"started", "progress", "progress", "completed"});
  auto st = n.Stats();
  REQUIRE(st.delivered == 4U);
  REQUIRE(st.suppressed == 5U);
}

TEST_CASE("Operations are ordered independently", "[notifier]") {
  orca::NotificationDispatcher n;
  RecordingSender rec;
  REQUIRE(n.Publish(&rec, MakeStarted("op_a")).has_value());
  REQUIRE(n.Publish(&rec, MakeStarted("op_b")).value() == DeliveryStatus::kDelivered);
  REQUIRE(n.Publish(&rec, MakeCompleted("op_b")).value() == DeliveryStatus::kDelivered);
  REQUIRE(!n.HasCompleted("op_a"));
  REQUIRE(n.Tracked() == 2U);
  n.Forget("op_b");
  REQUIRE(n.Tracked() == 1U);
}

TEST_CASE("A missing subscriber suppresses without state change", "[notifier]") {
  orca::NotificationDispatcher n;
  std::shared_ptr<orca::CallbackSender> none;
  REQUIRE(n.Publish(none, MakeStarted("op_a")).value() == DeliveryStatus::kSuppressed);
  REQUIRE(n.Tracked() == 0U);
}

TEST_CASE("A failed send still consumes the event", "[notifier]") {
  orca::NotificationDispatcher n;
  int calls = 0;
  orca::FunctionSender flaky([&](const ProgressUpdate&) {
    ++calls;
    return orca::expected<void, orca::CallbackError>::error(
        orca::CallbackError::Timeout("slow client"));
  });

  auto r = n.Publish(&flaky, MakeStarted("op_a"));
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().kind() == orca::CallbackErrorKind::kTimeout);

  // At most once: a retry of the same event is suppressed.
  REQUIRE(n.Publish(&flaky, MakeStarted("op_a")).value() == DeliveryStatus::kSuppressed);
  REQUIRE(calls == 1);

  auto st = n.Stats();
  REQUIRE(st.failed == 1U);
  REQUIRE(st.recoverable_failures == 1U);
}

// ============================================================================
// Senders
// ============================================================================

TEST_CASE("FunctionSender without a function fails", "[notifier][sender]") {
  orca::FunctionSender empty(nullptr);
  auto r = empty.Send(MakeStarted("op_a"));
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error().ToString() == "Failed to send progress update: no callback bound");
}

TEST_CASE("NoOpSender and LoggingSender accept everything", "[notifier][sender]") {
  orca::NoOpSender noop;
  REQUIRE(noop.Send(MakeStarted("op_a")).has_value());
  auto prev = orca::log::GetLevel();
  orca::log::SetLevel(orca::log::Level::kOff);
  orca::LoggingSender logging;
  REQUIRE(logging.Send(MakeCompleted("op_a")).has_value());
  orca::log::SetLevel(prev);
}

TEST_CASE("ChannelSender queues, bounds and closes", "[notifier][sender]") {
  orca::ChannelSender ch(2);
  REQUIRE(ch.Send(MakeStarted("op_a")).has_value());
  REQUIRE(ch.Send(MakeProgress("op_a", "x")).has_value());

  auto full = ch.Send(MakeCompleted("op_a"));
  REQUIRE(!full.has_value());
  REQUIRE(full.get_error() == orca::CallbackError::SendFailed("channel full"));
  REQUIRE(ch.Size() == 2U);

  auto first = ch.TryPop();
  REQUIRE(first.has_value());
  REQUIRE(std::string(orca::UpdateKindName(*first)) == "started");

  ch.Close();
  REQUIRE(ch.IsClosed());
  auto closed = ch.Send(MakeCompleted("op_a"));
  REQUIRE(!closed.has_value());
  REQUIRE(closed.get_error().kind() == orca::CallbackErrorKind::kDisconnected);

  // Queued events survive Close.
  auto second = ch.Pop(std::chrono::milliseconds(10));
  REQUIRE(second.has_value());
  REQUIRE(std::string(orca::UpdateKindName(*second)) == "progress");
  REQUIRE(!ch.Pop(std::chrono::milliseconds(10)).has_value());
}

TEST_CASE("ChannelSender Pop wakes on a send from another thread", "[notifier][sender]") {
  orca::ChannelSender ch;
  std::thread producer([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    (void)ch.Send(MakeStarted("op_a"));
  });
  auto got = ch.Pop(std::chrono::milliseconds(5000));
  producer.join();
  REQUIRE(got.has_value());
  REQUIRE(orca::OperationIdOf(*got) == "op_a");
}
