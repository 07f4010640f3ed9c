/**
 * @file config.hpp
 * @brief Multi-format configuration reader with template-based backend dispatch.
 *
 * Design:
 *   - Tag dispatch: IniBackend / JsonBackend / YamlBackend type tags
 *   - Template specialization: ConfigParser<Backend> per-format parsers
 *   - Variadic templates: Config<Backends...> compile-time composition
 *   - ConfigStore holds the flattened "section + key = value" entries
 *
 * Backends:
 *   - JsonBackend : nlohmann/json (always available)
 *   - IniBackend  : inih          (ORCA_CONFIG_INI_ENABLED)
 *   - YamlBackend : fkYAML        (ORCA_CONFIG_YAML_ENABLED)
 *
 * Nested values deeper than one section are not supported. JSON and YAML
 * lists of scalars are flattened to a comma-separated string.
 *
 * @code
 *   orca::MultiConfig cfg;
 *   cfg.LoadFile("orca.json");
 *   uint32_t cap = cfg.GetUint("pool", "capacity_per_key", 2);
 * @endcode
 */

#ifndef ORCA_CONFIG_HPP_
#define ORCA_CONFIG_HPP_

#include "orca/platform.hpp"
#include "orca/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#ifdef ORCA_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef ORCA_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace orca {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline char AsciiLower(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
}

inline bool ExtCaseEqual(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    if (AsciiLower(*a) != AsciiLower(*b)) return false;
    ++a;
    ++b;
  }
  return *a == *b;
}

inline std::string LowerCopy(const std::string& s) {
  std::string out = s;
  for (auto& c : out) c = AsciiLower(c);
  return out;
}

inline std::string TrimCopy(const std::string& s) {
  size_t b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return std::string();
  size_t e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

}  // namespace detail

// ============================================================================
// Backend tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::ExtCaseEqual(ext, "ini") || detail::ExtCaseEqual(ext, "cfg") ||
           detail::ExtCaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::ExtCaseEqual(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::ExtCaseEqual(ext, "yaml") || detail::ExtCaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

/**
 * @brief Flat, case-insensitive section/key store with typed getters.
 *
 * Later entries for the same section and key overwrite earlier ones, so
 * several files can be layered.
 */
class ConfigStore {
 public:
  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const std::string* v = FindEntry(section, key);
    return (v != nullptr) ? v->c_str() : default_val;
  }

  int32_t GetInt(const char* section, const char* key, int32_t default_val = 0) const {
    auto v = FindInt(section, key);
    return v.has_value() ? *v : default_val;
  }

  /// @brief Negative or malformed values fall back to @p default_val.
  uint32_t GetUint(const char* section, const char* key, uint32_t default_val = 0) const {
    const std::string* v = FindEntry(section, key);
    if (v == nullptr) return default_val;
    char* end = nullptr;
    long long val = std::strtoll(v->c_str(), &end, 10);
    if (end == v->c_str() || val < 0) return default_val;
    return (val > static_cast<long long>(UINT32_MAX)) ? UINT32_MAX
                                                      : static_cast<uint32_t>(val);
  }

  bool GetBool(const char* section, const char* key, bool default_val = false) const {
    const std::string* v = FindEntry(section, key);
    return (v != nullptr) ? ParseBool(*v) : default_val;
  }

  double GetDouble(const char* section, const char* key, double default_val = 0.0) const {
    const std::string* v = FindEntry(section, key);
    if (v == nullptr) return default_val;
    char* end = nullptr;
    double val = std::strtod(v->c_str(), &end);
    return (end == v->c_str()) ? default_val : val;
  }

  std::optional<int32_t> FindInt(const char* section, const char* key) const {
    const std::string* v = FindEntry(section, key);
    if (v == nullptr) return std::nullopt;
    char* end = nullptr;
    long val = std::strtol(v->c_str(), &end, 10);
    if (end == v->c_str()) return std::nullopt;
    return static_cast<int32_t>(val);
  }

  std::optional<bool> FindBool(const char* section, const char* key) const {
    const std::string* v = FindEntry(section, key);
    if (v == nullptr) return std::nullopt;
    return ParseBool(*v);
  }

  /// @brief Comma-separated list, items trimmed, empty items dropped.
  std::vector<std::string> GetList(const char* section, const char* key) const {
    std::vector<std::string> out;
    const std::string* v = FindEntry(section, key);
    if (v == nullptr) return out;
    size_t start = 0;
    while (start <= v->size()) {
      size_t comma = v->find(',', start);
      if (comma == std::string::npos) comma = v->size();
      std::string item = detail::TrimCopy(v->substr(start, comma - start));
      if (!item.empty()) out.push_back(std::move(item));
      start = comma + 1;
    }
    return out;
  }

  bool HasSection(const char* section) const {
    ORCA_ASSERT(section != nullptr);
    const std::string sec = detail::LowerCopy(section);
    for (const auto& kv : entries_) {
      if (kv.first.first == sec) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept { return static_cast<uint32_t>(entries_.size()); }

  void Set(const char* section, const char* key, const std::string& value) {
    AddEntry(section, key, value);
  }

 protected:
  using Key = std::pair<std::string, std::string>;

  std::map<Key, std::string> entries_;

  void AddEntry(const std::string& section, const std::string& key,
                const std::string& value) {
    entries_[Key(detail::LowerCopy(section), detail::LowerCopy(key))] = value;
  }

  const std::string* FindEntry(const char* section, const char* key) const {
    ORCA_ASSERT(section != nullptr && key != nullptr);
    auto it = entries_.find(Key(detail::LowerCopy(section), detail::LowerCopy(key)));
    return (it != entries_.end()) ? &it->second : nullptr;
  }

  static expected<std::string, ConfigError> ReadFile(const char* path) {
    FILE* f = std::fopen(path, "rb");
    if (f == nullptr) {
      return expected<std::string, ConfigError>::error(ConfigError::kFileNotFound);
    }
    std::string data;
    char buf[4096];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0U) data.append(buf, n);
    std::fclose(f);
    return expected<std::string, ConfigError>::success(std::move(data));
  }

  static bool ParseBool(const std::string& s) noexcept {
    return detail::ExtCaseEqual(s.c_str(), "true") || s == "1" ||
           detail::ExtCaseEqual(s.c_str(), "yes") || detail::ExtCaseEqual(s.c_str(), "on");
  }

  static const char* GetExtension(const char* path) noexcept {
    const char* dot = nullptr;
    for (const char* p = path; *p != '\0'; ++p) {
      if (*p == '.') dot = p;
      if (*p == '/') dot = nullptr;
    }
    return (dot != nullptr) ? dot + 1 : nullptr;
  }

  template <typename>
  friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Default: format not compiled in. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const std::string&) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

// --- INI ---

#ifdef ORCA_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    int result = ini_parse(path, Handler, &store);
    if (result == -1) {
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    }
    if (result != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const std::string& data) {
    if (ini_parse_string(data.c_str(), Handler, &store) != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* s = static_cast<ConfigStore*>(user);
    s->AddEntry(section ? section : "", name ? name : "", value ? value : "");
    return 1;
  }
};
#endif

// --- JSON ---

template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    auto data = ConfigStore::ReadFile(path);
    if (!data.has_value()) return expected<void, ConfigError>::error(data.get_error());
    return ParseBuffer(store, data.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const std::string& data) {
    auto j = nlohmann::json::parse(data, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          store.AddEntry(it.key(), kit.key(), ToStr(*kit));
        }
      } else {
        store.AddEntry("", it.key(), ToStr(*it));
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToStr(const nlohmann::json& n) {
    if (n.is_string()) return n.get<std::string>();
    if (n.is_boolean()) return n.get<bool>() ? "true" : "false";
    if (n.is_number_integer()) return std::to_string(n.get<int64_t>());
    if (n.is_number_float()) {
      char b[64];
      std::snprintf(b, sizeof(b), "%g", n.get<double>());
      return b;
    }
    if (n.is_array()) {
      std::string joined;
      for (const auto& item : n) {
        if (!joined.empty()) joined += ',';
        joined += ToStr(item);
      }
      return joined;
    }
    return n.is_null() ? std::string() : n.dump();
  }
};

// --- YAML ---

#ifdef ORCA_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    auto data = ConfigStore::ReadFile(path);
    if (!data.has_value()) return expected<void, ConfigError>::error(data.get_error());
    return ParseBuffer(store, data.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const std::string& data) {
    auto root = fkyaml::node::deserialize(data);
    if (root.is_null() || !root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      auto sec = it.key().get_value<std::string>();
      auto& node = *it;
      if (node.is_mapping()) {
        for (auto kit = node.begin(); kit != node.end(); ++kit) {
          store.AddEntry(sec, kit.key().get_value<std::string>(), ToStr(*kit));
        }
      } else {
        store.AddEntry("", sec, ToStr(node));
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToStr(const fkyaml::node& n) {
    if (n.is_string()) return n.get_value<std::string>();
    if (n.is_boolean()) return n.get_value<bool>() ? "true" : "false";
    if (n.is_integer()) return std::to_string(n.get_value<int64_t>());
    if (n.is_float_number()) {
      char b[64];
      std::snprintf(b, sizeof(b), "%g", n.get_value<double>());
      return b;
    }
    if (n.is_sequence()) {
      std::string joined;
      for (const auto& item : n) {
        if (!joined.empty()) joined += ',';
        joined += ToStr(item);
      }
      return joined;
    }
    return std::string();
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  Config() = default;

  expected<void, ConfigError> LoadFile(const char* path,
                                       ConfigFormat format = ConfigFormat::kAuto) {
    ORCA_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return DispatchFile<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const std::string& data, ConfigFormat format) {
    return DispatchBuffer<Backends...>(data, format);
  }

 private:
  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchFile(const char* path, ConfigFormat format) {
    if (First::kFormat == format) return ConfigParser<First>::ParseFile(*this, path);
    if constexpr (sizeof...(Rest) > 0) return DispatchFile<Rest...>(path, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchBuffer(const std::string& data, ConfigFormat format) {
    if (First::kFormat == format) return ConfigParser<First>::ParseBuffer(*this, data);
    if constexpr (sizeof...(Rest) > 0) return DispatchBuffer<Rest...>(data, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  ConfigFormat DetectFormat(const char* path) const noexcept {
    const char* ext = GetExtension(path);
    if (ext == nullptr) return Head::kFormat;
    return DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const char* ext) const noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) return DetectExt<Rest...>(ext);
    return Head::kFormat;
  }

  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;
};

// ============================================================================
// Aliases
// ============================================================================

using MultiConfig = Config<JsonBackend
#ifdef ORCA_CONFIG_INI_ENABLED
                           ,
                           IniBackend
#endif
#ifdef ORCA_CONFIG_YAML_ENABLED
                           ,
                           YamlBackend
#endif
                           >;

using JsonConfig = Config<JsonBackend>;
#ifdef ORCA_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef ORCA_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

}  // namespace orca

#endif  // ORCA_CONFIG_HPP_
