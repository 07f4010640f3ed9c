/**
 * @file settings.hpp
 * @brief Typed orchestrator settings read from a ConfigStore.
 *
 *   [monitor]  default_timeout_secs cleanup_interval_secs max_history_size
 *              retention_secs auto_cleanup
 *   [pool]     capacity_per_key max_total_workers max_transient_workers
 *              idle_timeout_secs reap_interval_secs health_check_interval_secs
 *              spawn_timeout_ms command_timeout_secs checkout_wait_ms shell enabled
 *   [hints]    concurrency_threshold_ms target_gap_ms status_poll_threshold
 *   [server]   synchronous disabled_tools program
 *   [log]      level file
 *
 * Missing keys keep their defaults.
 */

#ifndef ORCA_SETTINGS_HPP_
#define ORCA_SETTINGS_HPP_

#include "orca/config.hpp"
#include "orca/dispatcher.hpp"
#include "orca/hints.hpp"
#include "orca/log.hpp"
#include "orca/operation_registry.hpp"
#include "orca/vocabulary.hpp"
#include "orca/worker_pool.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace orca {

struct OrcaSettings {
  MonitorConfig monitor;
  PoolConfig pool;
  HintConfig hints;
  DispatcherConfig dispatcher;
  std::string program{"cargo"};
  log::Level log_level{log::Level::kInfo};
  std::string log_file;
};

namespace detail {

inline std::chrono::milliseconds Secs(const ConfigStore& c, const char* sec, const char* key,
                                      std::chrono::milliseconds def) {
  auto s = std::chrono::duration_cast<std::chrono::seconds>(def).count();
  return std::chrono::seconds(c.GetUint(sec, key, static_cast<uint32_t>(s)));
}

inline std::chrono::milliseconds Millis(const ConfigStore& c, const char* sec,
                                        const char* key, std::chrono::milliseconds def) {
  return std::chrono::milliseconds(
      c.GetUint(sec, key, static_cast<uint32_t>(def.count())));
}

}  // namespace detail

/**
 * @brief Map @p store onto OrcaSettings.
 * @return kInvalidValue for a zero capacity, an empty shell or an unknown
 *         log level.
 */
inline expected<OrcaSettings, ConfigError> LoadSettings(const ConfigStore& store) {
  using Result = expected<OrcaSettings, ConfigError>;
  OrcaSettings s;

  MonitorConfig& m = s.monitor;
  m.default_timeout = detail::Secs(store, "monitor", "default_timeout_secs", m.default_timeout);
  m.cleanup_interval =
      detail::Secs(store, "monitor", "cleanup_interval_secs", m.cleanup_interval);
  m.max_history_size = store.GetUint("monitor", "max_history_size",
                                     static_cast<uint32_t>(m.max_history_size));
  m.retention = detail::Secs(store, "monitor", "retention_secs", m.retention);
  m.auto_cleanup = store.GetBool("monitor", "auto_cleanup", m.auto_cleanup);

  PoolConfig& p = s.pool;
  p.capacity_per_key = store.GetUint("pool", "capacity_per_key", p.capacity_per_key);
  p.max_total_workers = store.GetUint("pool", "max_total_workers", p.max_total_workers);
  p.max_transient_workers =
      store.GetUint("pool", "max_transient_workers", p.max_transient_workers);
  p.idle_timeout = detail::Secs(store, "pool", "idle_timeout_secs", p.idle_timeout);
  p.reap_interval = detail::Secs(store, "pool", "reap_interval_secs", p.reap_interval);
  p.health_check_interval =
      detail::Secs(store, "pool", "health_check_interval_secs", p.health_check_interval);
  p.spawn_timeout = detail::Millis(store, "pool", "spawn_timeout_ms", p.spawn_timeout);
  p.command_timeout = detail::Secs(store, "pool", "command_timeout_secs", p.command_timeout);
  p.checkout_wait = detail::Millis(store, "pool", "checkout_wait_ms", p.checkout_wait);
  p.shell = std::string(store.GetString("pool", "shell", p.shell.c_str()));
  p.enabled = store.GetBool("pool", "enabled", p.enabled);
  if (p.capacity_per_key == 0U || p.max_total_workers == 0U || p.shell.empty()) {
    return Result::error(ConfigError::kInvalidValue);
  }
  if (m.cleanup_interval.count() == 0 || p.reap_interval.count() == 0 ||
      p.health_check_interval.count() == 0) {
    return Result::error(ConfigError::kInvalidValue);
  }

  HintConfig& h = s.hints;
  h.concurrency_threshold =
      detail::Millis(store, "hints", "concurrency_threshold_ms", h.concurrency_threshold);
  h.target_gap = detail::Millis(store, "hints", "target_gap_ms", h.target_gap);
  h.status_poll_threshold =
      store.GetUint("hints", "status_poll_threshold", h.status_poll_threshold);

  s.dispatcher.synchronous_mode = store.GetBool("server", "synchronous", false);
  for (const auto& tool : store.GetList("server", "disabled_tools")) {
    s.dispatcher.disabled_tools.insert(tool);
  }
  s.program = std::string(store.GetString("server", "program", s.program.c_str()));
  if (s.program.empty()) return Result::error(ConfigError::kInvalidValue);

  if (store.HasKey("log", "level") &&
      !log::ParseLevel(store.GetString("log", "level"), s.log_level)) {
    return Result::error(ConfigError::kInvalidValue);
  }
  s.log_file = store.GetString("log", "file", "");
  return Result::success(std::move(s));
}

}  // namespace orca

#endif  // ORCA_SETTINGS_HPP_
