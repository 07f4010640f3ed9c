/**
 * @file callback_error.hpp
 * @brief Closed classification of notification delivery failures.
 *
 * CallbackError wraps a std::variant over four alternatives. Every facet
 * (recoverability, user initiation, stable code, severity) is read from a
 * single table indexed by the alternative, so adding a variant without a
 * table row fails to compile.
 *
 *   | variant      | recoverable | user | code         | severity |
 *   |--------------|-------------|------|--------------|----------|
 *   | SendFailed   | yes         | no   | SEND_FAILED  | ERROR    |
 *   | Timeout      | yes         | no   | TIMEOUT      | ERROR    |
 *   | Disconnected | no          | no   | DISCONNECTED | ERROR    |
 *   | Cancelled    | no          | yes  | CANCELLED    | WARN     |
 */

#ifndef ORCA_CALLBACK_ERROR_HPP_
#define ORCA_CALLBACK_ERROR_HPP_

#include "orca/log.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace orca {

namespace callback {

struct SendFailed {
  std::string detail;
};
struct Timeout {
  std::string detail;
};
struct Disconnected {};
struct Cancelled {};

}  // namespace callback

enum class CallbackErrorKind : uint8_t {
  kSendFailed = 0,
  kTimeout,
  kDisconnected,
  kCancelled,
};

namespace detail {

struct CallbackErrorFacets {
  CallbackErrorKind kind;
  bool recoverable;
  bool user_initiated;
  const char* code;
  log::Level severity;
};

// Row order must match the alternative order of CallbackError::Variant.
inline constexpr std::array<CallbackErrorFacets, 4> kCallbackErrorTable = {{
    {CallbackErrorKind::kSendFailed, true, false, "SEND_FAILED", log::Level::kError},
    {CallbackErrorKind::kTimeout, true, false, "TIMEOUT", log::Level::kError},
    {CallbackErrorKind::kDisconnected, false, false, "DISCONNECTED", log::Level::kError},
    {CallbackErrorKind::kCancelled, false, true, "CANCELLED", log::Level::kWarn},
}};

}  // namespace detail

class CallbackError final {
 public:
  using Variant = std::variant<callback::SendFailed, callback::Timeout,
                               callback::Disconnected, callback::Cancelled>;

  static_assert(std::variant_size_v<Variant> == detail::kCallbackErrorTable.size(),
                "every CallbackError alternative needs a facet row");

  static CallbackError SendFailed(std::string detail) {
    return CallbackError(callback::SendFailed{std::move(detail)});
  }
  static CallbackError Timeout(std::string detail) {
    return CallbackError(callback::Timeout{std::move(detail)});
  }
  static CallbackError Disconnected() {
    return CallbackError(callback::Disconnected{});
  }
  static CallbackError Cancelled() { return CallbackError(callback::Cancelled{}); }

  CallbackErrorKind kind() const noexcept { return Facets().kind; }
  const Variant& variant() const noexcept { return value_; }

  bool IsRecoverable() const noexcept { return Facets().recoverable; }
  bool IsUserInitiated() const noexcept { return Facets().user_initiated; }
  const char* ErrorCode() const noexcept { return Facets().code; }
  log::Level Severity() const noexcept { return Facets().severity; }
  const char* SeverityString() const noexcept {
    return log::detail::LevelTag(Facets().severity);
  }

  /// @brief Free-form detail; present only for SendFailed and Timeout.
  std::optional<std::string> MessageDetail() const {
    if (const auto* s = std::get_if<callback::SendFailed>(&value_)) {
      return s->detail;
    }
    if (const auto* t = std::get_if<callback::Timeout>(&value_)) {
      return t->detail;
    }
    return std::nullopt;
  }

  std::string ToString() const {
    switch (kind()) {
      case CallbackErrorKind::kSendFailed:
        return "Failed to send progress update: " + *MessageDetail();
      case CallbackErrorKind::kTimeout:
        return "Callback timeout: " + *MessageDetail();
      case CallbackErrorKind::kDisconnected:
        return "Callback receiver disconnected";
      case CallbackErrorKind::kCancelled:
        return "Operation was cancelled";
    }
    return "unknown callback error";
  }

  bool operator==(const CallbackError& rhs) const {
    return kind() == rhs.kind() && MessageDetail() == rhs.MessageDetail();
  }
  bool operator!=(const CallbackError& rhs) const { return !(*this == rhs); }

 private:
  explicit CallbackError(Variant v) : value_(std::move(v)) {}

  const detail::CallbackErrorFacets& Facets() const noexcept {
    return detail::kCallbackErrorTable[value_.index()];
  }

  Variant value_;
};

}  // namespace orca

#endif  // ORCA_CALLBACK_ERROR_HPP_
