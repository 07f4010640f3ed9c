/**
 * @file vocabulary.hpp
 * @brief Vocabulary types shared by every orca module.
 *
 * - expected<V, E>: value-or-error return type (no exceptions on the
 *   control path); E is usually one of the error enums below.
 * - NewType<T, Tag>: strong typedef for ids that must not be mixed.
 * - ScopeGuard / ORCA_SCOPE_EXIT: run cleanup on scope exit.
 * - and_then / or_else: free-function combinators over expected.
 */

#ifndef ORCA_VOCABULARY_HPP_
#define ORCA_VOCABULARY_HPP_

#include "orca/platform.hpp"

#include <cstdint>
#include <type_traits>
#include <utility>
#include <optional>
#include <variant>

namespace orca {

// ============================================================================
// Error enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue,
};

enum class TimerError : uint8_t {
  kInvalidPeriod = 0,
  kSlotsFull,
  kNotRunning,
  kAlreadyRunning,
};

inline const char* ConfigErrorMessage(ConfigError e) noexcept {
  switch (e) {
    case ConfigError::kFileNotFound:
      return "config file not found";
    case ConfigError::kParseError:
      return "config parse error";
    case ConfigError::kFormatNotSupported:
      return "config format not supported by this build";
    case ConfigError::kBufferFull:
      return "config has too many entries";
    case ConfigError::kInvalidValue:
      return "config value out of range";
  }
  return "unknown config error";
}

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Constructed only through the named factories so the intent is visible at
 * the call site:
 * @code
 *   return expected<int, ConfigError>::success(42);
 *   return expected<int, ConfigError>::error(ConfigError::kParseError);
 * @endcode
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) {
    return expected(std::in_place_index<0>, v);
  }
  static expected success(V&& v) {
    return expected(std::in_place_index<0>, std::move(v));
  }
  static expected error(const E& e) {
    return expected(std::in_place_index<1>, e);
  }
  static expected error(E&& e) {
    return expected(std::in_place_index<1>, std::move(e));
  }

  bool has_value() const noexcept { return storage_.index() == 0U; }
  explicit operator bool() const noexcept { return has_value(); }

  V& value() & {
    ORCA_ASSERT(has_value());
    return std::get<0>(storage_);
  }
  const V& value() const& {
    ORCA_ASSERT(has_value());
    return std::get<0>(storage_);
  }
  V&& value() && {
    ORCA_ASSERT(has_value());
    return std::get<0>(std::move(storage_));
  }

  const E& get_error() const& {
    ORCA_ASSERT(!has_value());
    return std::get<1>(storage_);
  }

  V value_or(V default_val) const& {
    return has_value() ? std::get<0>(storage_) : std::move(default_val);
  }

 private:
  template <size_t I, typename Arg>
  expected(std::in_place_index_t<I> tag, Arg&& arg)
      : storage_(tag, std::forward<Arg>(arg)) {}

  std::variant<V, E> storage_;
};

/// @brief Specialization for operations that return nothing on success.
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(); }
  static expected error(E e) { return expected(std::move(e)); }

  bool has_value() const noexcept { return ok_; }
  explicit operator bool() const noexcept { return ok_; }

  const E& get_error() const& {
    ORCA_ASSERT(!ok_);
    return *err_;
  }

 private:
  expected() : ok_(true) {}
  explicit expected(E e) : ok_(false), err_(std::move(e)) {}

  bool ok_;
  std::optional<E> err_;
};

// ============================================================================
// and_then / or_else
// ============================================================================

template <typename V, typename E, typename F>
auto and_then(const expected<V, E>& r, F&& fn) -> decltype(fn(r.value())) {
  using Result = decltype(fn(r.value()));
  if (!r.has_value()) {
    return Result::error(r.get_error());
  }
  return fn(r.value());
}

template <typename V, typename E, typename F>
void or_else(const expected<V, E>& r, F&& fn) {
  if (!r.has_value()) {
    fn(r.get_error());
  }
}

// ============================================================================
// NewType<T, Tag>
// ============================================================================

template <typename T, typename Tag>
class NewType {
 public:
  constexpr explicit NewType(T v) noexcept : value_(v) {}
  constexpr T value() const noexcept { return value_; }

  constexpr bool operator==(const NewType& rhs) const noexcept {
    return value_ == rhs.value_;
  }
  constexpr bool operator!=(const NewType& rhs) const noexcept {
    return value_ != rhs.value_;
  }

 private:
  T value_;
};

struct TimerTaskIdTag {};
using TimerTaskId = NewType<uint32_t, TimerTaskIdTag>;

// ============================================================================
// ScopeGuard
// ============================================================================

template <typename F>
class ScopeGuard final {
 public:
  explicit ScopeGuard(F fn) noexcept(std::is_nothrow_move_constructible<F>::value)
      : fn_(std::move(fn)), active_(true) {}

  ScopeGuard(ScopeGuard&& other) noexcept(
      std::is_nothrow_move_constructible<F>::value)
      : fn_(std::move(other.fn_)), active_(other.active_) {
    other.active_ = false;
  }

  ~ScopeGuard() {
    if (active_) {
      fn_();
    }
  }

  void release() noexcept { active_ = false; }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

 private:
  F fn_;
  bool active_;
};

template <typename F>
ScopeGuard<F> MakeScopeGuard(F fn) {
  return ScopeGuard<F>(std::move(fn));
}

#define ORCA_SCOPE_EXIT(code) \
  auto ORCA_CONCAT(orca_scope_exit_, __LINE__) = ::orca::MakeScopeGuard([&]() { code; })

}  // namespace orca

#endif  // ORCA_VOCABULARY_HPP_
