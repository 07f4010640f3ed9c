/**
 * @file command_catalog.hpp
 * @brief Table of the external build-tool commands exposed as tools.
 *
 * Each entry maps a tool name (and its aliases) to an argv prefix. User
 * arguments are appended verbatim. Long-running commands may go to the
 * background; quick commands always answer synchronously.
 */

#ifndef ORCA_COMMAND_CATALOG_HPP_
#define ORCA_COMMAND_CATALOG_HPP_

#include "orca/log.hpp"
#include "orca/process.hpp"
#include "orca/vocabulary.hpp"

#include <cctype>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace orca {

enum class CommandKind : uint8_t {
  kLongRunning = 0,
  kQuick,
};

struct CommandSpec {
  std::string name;
  std::vector<std::string> argv;  ///< Program and fixed arguments
  CommandKind kind = CommandKind::kLongRunning;
  std::string description;
  std::string required_binary;  ///< Extra executable that must be on PATH
  std::vector<std::string> aliases;
};

enum class CatalogError : uint8_t {
  kDuplicateName = 0,
  kReservedName,
  kEmptyArgv,
};

inline const char* CatalogErrorMessage(CatalogError e) noexcept {
  switch (e) {
    case CatalogError::kDuplicateName:
      return "command name or alias already registered";
    case CatalogError::kReservedName:
      return "command name is reserved for a built-in tool";
    case CatalogError::kEmptyArgv:
      return "command argv must not be empty";
  }
  return "unknown catalog error";
}

/// Names handled by the dispatcher itself.
inline bool IsBuiltinTool(const std::string& name) noexcept {
  return name == "status" || name == "wait" || name == "sleep";
}

/// @brief "build" -> "Build". Used in reply headers.
inline std::string CommandLabel(const std::string& name) {
  std::string label = name;
  if (!label.empty()) {
    label[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(label[0])));
  }
  return label;
}

constexpr const char* kAsyncAddendum =
    " Always use these tools; do not run the build tool in a terminal. For "
    "operations >1s, set enable_async_notification=true and call wait to "
    "collect results.";

constexpr const char* kSyncAddendum =
    " This server runs in synchronous mode; results are returned directly in "
    "the reply.";

// ============================================================================
// CommandCatalog
// ============================================================================

class CommandCatalog final {
 public:
  CommandCatalog() = default;

  expected<void, CatalogError> Add(CommandSpec spec) {
    if (spec.argv.empty()) {
      return expected<void, CatalogError>::error(CatalogError::kEmptyArgv);
    }
    if (IsBuiltinTool(spec.name)) {
      return expected<void, CatalogError>::error(CatalogError::kReservedName);
    }
    if (index_.count(spec.name) != 0U) {
      return expected<void, CatalogError>::error(CatalogError::kDuplicateName);
    }
    for (const auto& alias : spec.aliases) {
      if (index_.count(alias) != 0U || IsBuiltinTool(alias)) {
        return expected<void, CatalogError>::error(CatalogError::kDuplicateName);
      }
    }
    const size_t slot = specs_.size();
    index_.emplace(spec.name, slot);
    for (const auto& alias : spec.aliases) index_.emplace(alias, slot);
    specs_.push_back(std::move(spec));
    return expected<void, CatalogError>::success();
  }

  /// @brief Lookup by name or alias; nullptr if unknown.
  const CommandSpec* Find(const std::string& name) const {
    auto it = index_.find(name);
    return (it == index_.end()) ? nullptr : &specs_[it->second];
  }

  const std::vector<CommandSpec>& Commands() const noexcept { return specs_; }
  size_t Size() const noexcept { return specs_.size(); }

  /// @brief Tool description plus the mode-dependent addendum.
  static std::string DescribeFor(const CommandSpec& spec, bool synchronous_mode) {
    return spec.description + (synchronous_mode ? kSyncAddendum : kAsyncAddendum);
  }

  /**
   * @brief Name of the first missing executable, or "" if all are present.
   */
  static std::string MissingBinary(const CommandSpec& spec) {
    if (!FindExecutable(spec.argv.front())) return spec.argv.front();
    if (!spec.required_binary.empty() && !FindExecutable(spec.required_binary)) {
      return spec.required_binary;
    }
    return std::string();
  }

  /// @brief The stock cargo command set.
  static CommandCatalog Default(const std::string& program = "cargo") {
    struct Row {
      const char* name;
      std::vector<std::string> extra;
      CommandKind kind;
      const char* description;
      const char* required;
      std::vector<std::string> aliases;
    };
    const CommandKind L = CommandKind::kLongRunning;
    const CommandKind Q = CommandKind::kQuick;
    const std::vector<Row> rows = {
        {"build", {"build"}, L, "Build the project.", "", {"b"}},
        {"test", {"test"}, L, "Run the project's tests.", "", {"t"}},
        {"check", {"check"}, L, "Check the project for errors without building.", "", {"c"}},
        {"clippy", {"clippy"}, L, "Run the linter over the project.", "", {}},
        {"fmt", {"fmt"}, L, "Format the project's sources.", "", {}},
        {"doc", {"doc"}, L, "Build the project's documentation.", "", {}},
        {"run", {"run"}, L, "Build and run the project's binary.", "", {"r"}},
        {"bench", {"bench"}, L, "Run the project's benchmarks.", "", {}},
        {"audit", {"audit"}, L, "Audit dependencies for known vulnerabilities.",
         "cargo-audit", {}},
        {"nextest", {"nextest", "run"}, L, "Run tests with the nextest runner.",
         "cargo-nextest", {}},
        {"clean", {"clean"}, L, "Remove build artifacts.", "", {}},
        {"fix", {"fix", "--allow-dirty"}, L, "Apply compiler-suggested fixes.", "", {}},
        {"install", {"install"}, L, "Install a binary crate.", "", {}},
        {"fetch", {"fetch"}, L, "Download dependencies without building.", "", {}},
        {"add", {"add"}, L, "Add a dependency to the manifest.", "", {}},
        {"remove", {"remove"}, L, "Remove a dependency from the manifest.", "", {"rm"}},
        {"update", {"update"}, Q, "Update dependencies in the lock file.", "", {}},
        {"tree", {"tree"}, Q, "Show the dependency tree.", "", {}},
        {"version", {"--version"}, Q, "Show the build tool's version.", "", {}},
        {"metadata", {"metadata", "--format-version", "1"}, Q,
         "Print package metadata as JSON.", "", {}},
        {"search", {"search"}, Q, "Search the package registry.", "", {}},
    };

    CommandCatalog catalog;
    for (const auto& row : rows) {
      CommandSpec spec;
      spec.name = row.name;
      spec.argv.push_back(program);
      spec.argv.insert(spec.argv.end(), row.extra.begin(), row.extra.end());
      spec.kind = row.kind;
      spec.description = row.description;
      spec.required_binary = row.required;
      spec.aliases = row.aliases;
      auto added = catalog.Add(std::move(spec));
      if (!added.has_value()) {
        ORCA_LOG_ERROR("Catalog", "default command %s rejected: %s", row.name,
                       CatalogErrorMessage(added.get_error()));
      }
    }
    return catalog;
  }

 private:
  std::vector<CommandSpec> specs_;
  std::unordered_map<std::string, size_t> index_;
};

}  // namespace orca

#endif  // ORCA_COMMAND_CATALOG_HPP_
