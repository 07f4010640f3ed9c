/**
 * @file log.hpp
 * @brief Process-wide leveled logger.
 *
 * Every record goes to stderr (stdout belongs to the tool protocol) and,
 * after Init() with a path, is mirrored to an append-mode file sink.
 *
 * Record format:
 *   [2026-01-02 13:04:05.123] [INFO] [Registry] registered op_1a2b (file.hpp:42)
 *
 * Init() is an init-once gate: the first call wins, later calls are no-ops
 * until Shutdown(). Records may be written before Init(); they go to stderr
 * only.
 *
 * Compile-time floor: records below ORCA_LOG_MIN_LEVEL (0=debug .. 4=fatal)
 * compile to nothing.
 */

#ifndef ORCA_LOG_HPP_
#define ORCA_LOG_HPP_

#include "orca/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

#include <strings.h>
#include <sys/time.h>

#ifndef ORCA_LOG_MIN_LEVEL
#define ORCA_LOG_MIN_LEVEL 0
#endif

namespace orca {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo,
  kWarn,
  kError,
  kFatal,
  kOff,
};

namespace detail {

struct LogState {
#ifdef NDEBUG
  std::atomic<Level> level{Level::kInfo};
#else
  std::atomic<Level> level{Level::kDebug};
#endif
  std::mutex mutex;
  FILE* file_sink = nullptr;
  bool initialized = false;
};

inline LogState& State() {
  static LogState state;
  return state;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
    case Level::kFatal:
      return "FATAL";
    case Level::kOff:
      return "OFF";
  }
  return "?";
}

/// @brief Strip directories so records carry "worker_pool.hpp", not a path.
inline const char* ShortFile(const char* file) noexcept {
  const char* slash = std::strrchr(file, '/');
  return (slash != nullptr) ? slash + 1 : file;
}

inline void FormatTimestamp(char* buf, size_t size) noexcept {
  struct timeval tv;
  gettimeofday(&tv, nullptr);
  struct tm tm_buf;
  localtime_r(&tv.tv_sec, &tm_buf);
  size_t n = std::strftime(buf, size, "%Y-%m-%d %H:%M:%S", &tm_buf);
  std::snprintf(buf + n, size - n, ".%03ld",
                static_cast<long>(tv.tv_usec / 1000));  // NOLINT
}

}  // namespace detail

// ============================================================================
// Level control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::State().level.store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::State().level.load(std::memory_order_relaxed);
}

/// @brief Parse "debug" / "INFO" / "warn" / "error" / "fatal" / "off".
inline bool ParseLevel(const char* text, Level& out) noexcept {
  static const struct {
    const char* name;
    Level level;
  } kNames[] = {
      {"debug", Level::kDebug}, {"info", Level::kInfo},
      {"warn", Level::kWarn},   {"warning", Level::kWarn},
      {"error", Level::kError}, {"fatal", Level::kFatal},
      {"off", Level::kOff},
  };
  if (text == nullptr) return false;
  for (const auto& entry : kNames) {
    if (strcasecmp(text, entry.name) == 0) {
      out = entry.level;
      return true;
    }
  }
  return false;
}

// ============================================================================
// Init / Shutdown
// ============================================================================

/**
 * @brief Initialize the logger once per process.
 * @param file_path Optional append-mode mirror file (nullptr = stderr only).
 * @return true if this call initialized the logger, false if it was already
 *         initialized (the call is then a no-op).
 */
inline bool Init(const char* file_path = nullptr) {
  detail::LogState& st = detail::State();
  std::lock_guard<std::mutex> lock(st.mutex);
  if (st.initialized) {
    return false;
  }
  if (file_path != nullptr && file_path[0] != '\0') {
    st.file_sink = std::fopen(file_path, "a");
    if (st.file_sink == nullptr) {
      (void)std::fprintf(stderr, "[orca] cannot open log file %s, using stderr only\n",
                         file_path);
    }
  }
  st.initialized = true;
  return true;
}

inline void Shutdown() {
  detail::LogState& st = detail::State();
  std::lock_guard<std::mutex> lock(st.mutex);
  if (st.file_sink != nullptr) {
    std::fclose(st.file_sink);
    st.file_sink = nullptr;
  }
  st.initialized = false;
}

inline bool IsInitialized() {
  detail::LogState& st = detail::State();
  std::lock_guard<std::mutex> lock(st.mutex);
  return st.initialized;
}

// ============================================================================
// Writers
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) {
  if (level < GetLevel() || level == Level::kOff) {
    return;
  }

  char msg[1024];
  std::vsnprintf(msg, sizeof(msg), fmt, args);

  char ts[40];
  detail::FormatTimestamp(ts, sizeof(ts));

  detail::LogState& st = detail::State();
  {
    std::lock_guard<std::mutex> lock(st.mutex);
    (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts,
                       detail::LevelTag(level), category, msg,
                       detail::ShortFile(file), line);
    if (st.file_sink != nullptr) {
      (void)std::fprintf(st.file_sink, "[%s] [%s] [%s] %s (%s:%d)\n", ts,
                         detail::LevelTag(level), category, msg,
                         detail::ShortFile(file), line);
      (void)std::fflush(st.file_sink);
    }
  }

  if (level == Level::kFatal) {
    std::abort();
  }
}

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) ORCA_PRINTF_FORMAT(5, 6);

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace orca

// ============================================================================
// Macros
// ============================================================================

#if ORCA_LOG_MIN_LEVEL <= 0
#define ORCA_LOG_DEBUG(cat, fmt, ...)                                     \
  ::orca::log::LogWrite(::orca::log::Level::kDebug, cat, __FILE__, __LINE__, \
                        fmt, ##__VA_ARGS__)
#else
#define ORCA_LOG_DEBUG(cat, fmt, ...) ((void)0)
#endif

#if ORCA_LOG_MIN_LEVEL <= 1
#define ORCA_LOG_INFO(cat, fmt, ...)                                     \
  ::orca::log::LogWrite(::orca::log::Level::kInfo, cat, __FILE__, __LINE__, \
                        fmt, ##__VA_ARGS__)
#else
#define ORCA_LOG_INFO(cat, fmt, ...) ((void)0)
#endif

#if ORCA_LOG_MIN_LEVEL <= 2
#define ORCA_LOG_WARN(cat, fmt, ...)                                     \
  ::orca::log::LogWrite(::orca::log::Level::kWarn, cat, __FILE__, __LINE__, \
                        fmt, ##__VA_ARGS__)
#else
#define ORCA_LOG_WARN(cat, fmt, ...) ((void)0)
#endif

#if ORCA_LOG_MIN_LEVEL <= 3
#define ORCA_LOG_ERROR(cat, fmt, ...)                                     \
  ::orca::log::LogWrite(::orca::log::Level::kError, cat, __FILE__, __LINE__, \
                        fmt, ##__VA_ARGS__)
#else
#define ORCA_LOG_ERROR(cat, fmt, ...) ((void)0)
#endif

#define ORCA_LOG_FATAL(cat, fmt, ...)                                     \
  ::orca::log::LogWrite(::orca::log::Level::kFatal, cat, __FILE__, __LINE__, \
                        fmt, ##__VA_ARGS__)

/// @brief Log at a level chosen at runtime (e.g. a classified severity).
#define ORCA_LOG_AT(level, cat, fmt, ...) \
  ::orca::log::LogWrite(level, cat, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#endif  // ORCA_LOG_HPP_
