/**
 * @file test_callback_error.cpp
 * @brief Tests for callback_error.hpp
 */

#include "orca/callback_error.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using orca::CallbackError;
using orca::CallbackErrorKind;

TEST_CASE("CallbackError facets per alternative", "[callback_error]") {
  const CallbackError send = CallbackError::SendFailed("pipe closed");
  REQUIRE(send.kind() == CallbackErrorKind::kSendFailed);
  REQUIRE(send.IsRecoverable());
  REQUIRE(!send.IsUserInitiated());
  REQUIRE(std::string(send.ErrorCode()) == "SEND_FAILED");
  REQUIRE(send.Severity() == orca::log::Level::kError);

  const CallbackError timeout = CallbackError::Timeout("5s");
  REQUIRE(timeout.IsRecoverable());
  REQUIRE(std::string(timeout.ErrorCode()) == "TIMEOUT");

  const CallbackError gone = CallbackError::Disconnected();
  REQUIRE(!gone.IsRecoverable());
  REQUIRE(!gone.IsUserInitiated());
  REQUIRE(std::string(gone.ErrorCode()) == "DISCONNECTED");
  REQUIRE(std::string(gone.SeverityString()) == "ERROR");

  const CallbackError cancelled = CallbackError::Cancelled();
  REQUIRE(!cancelled.IsRecoverable());
  REQUIRE(cancelled.IsUserInitiated());
  REQUIRE(std::string(cancelled.ErrorCode()) == "CANCELLED");
  REQUIRE(cancelled.Severity() == orca::log::Level::kWarn);
  REQUIRE(std::string(cancelled.SeverityString()) == "WARN");
}

TEST_CASE("CallbackError detail and rendering", "[callback_error]") {
  const CallbackError send = CallbackError::SendFailed("pipe closed");
  REQUIRE(send.MessageDetail() == std::string("pipe closed"));
  REQUIRE(send.ToString() == "Failed to send progress update: pipe closed");
  REQUIRE(CallbackError::Timeout("5s").ToString() == "Callback timeout: 5s");
  REQUIRE(CallbackError::Disconnected().ToString() == "Callback receiver disconnected");
  REQUIRE(CallbackError::Cancelled().ToString() == "Operation was cancelled");
  REQUIRE(!CallbackError::Cancelled().MessageDetail().has_value());
}

TEST_CASE("CallbackError equality compares kind and detail", "[callback_error]") {
  REQUIRE(CallbackError::SendFailed("a") == CallbackError::SendFailed("a"));
  REQUIRE(CallbackError::SendFailed("a") != CallbackError::SendFailed("b"));
  REQUIRE(CallbackError::SendFailed("a") != CallbackError::Timeout("a"));
  REQUIRE(CallbackError::Disconnected() == CallbackError::Disconnected());
  REQUIRE(CallbackError::Disconnected() != CallbackError::Cancelled());
}
