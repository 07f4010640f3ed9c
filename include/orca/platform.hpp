/**
 * @file platform.hpp
 * @brief Platform gate, printf-format attribute, and ORCA_ASSERT.
 *
 * The orchestrator drives bash sessions through fork/exec and poll(2), so
 * only POSIX targets are supported; Linux is the tested platform.
 */

#ifndef ORCA_PLATFORM_HPP_
#define ORCA_PLATFORM_HPP_

#include <cstdio>
#include <cstdlib>

#if defined(__linux__) || defined(__APPLE__) || defined(__unix__)
#define ORCA_PLATFORM_POSIX 1
#else
#error "orca needs a POSIX host (fork, pipe, poll, killpg)"
#endif

#if defined(__GNUC__) || defined(__clang__)
#define ORCA_PRINTF_FORMAT(fmt_idx, args_idx) \
  __attribute__((format(printf, fmt_idx, args_idx)))
#else
#define ORCA_PRINTF_FORMAT(fmt_idx, args_idx)
#endif

#define ORCA_CONCAT_IMPL(a, b) a##b
#define ORCA_CONCAT(a, b) ORCA_CONCAT_IMPL(a, b)

namespace orca {
namespace detail {

/// Debug builds only: report the broken precondition and stop.
[[noreturn]] inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "[orca] precondition violated: %s (%s:%d)\n", cond, file,
                     line);
  std::abort();
}

}  // namespace detail
}  // namespace orca

// Programmer preconditions only; runtime failures go through expected<>.
#ifdef NDEBUG
#define ORCA_ASSERT(cond) ((void)0)
#else
#define ORCA_ASSERT(cond) \
  ((cond) ? ((void)0) : ::orca::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

#endif  // ORCA_PLATFORM_HPP_
