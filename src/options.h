#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "controller.h"
#include "geometry.h"
#include "model.h"

namespace multisplit {

// Undo history configuration
struct HistoryOptions {
  size_t max_undo_levels = kDefaultMaxUndoLevels;
};

// Global options container
struct GlobalOptions {
  GeometryOptions geometry;
  HistoryOptions history;
  ModelOptions model; // Also carries the focus policy ([focus] section)
};

// Get default global options
GlobalOptions get_default_global_options();

[[nodiscard]] std::string focus_policy_to_string(FocusPolicy policy);
[[nodiscard]] std::optional<FocusPolicy> string_to_focus_policy(const std::string& str);

// Result type for TOML operations
struct WriteResult {
  bool success;
  std::string error; // Set if success == false
};

struct ReadResult {
  bool success;
  std::string error;     // Set if success == false
  GlobalOptions options; // Valid if success == true
};

// Write GlobalOptions to a TOML file
WriteResult write_options_toml(const GlobalOptions& options, const std::filesystem::path& filepath);

// Read GlobalOptions from a TOML file. Invalid values are logged and replaced by defaults.
ReadResult read_options_toml(const std::filesystem::path& filepath);

// Provides GlobalOptions, optionally monitoring a config file for changes
class GlobalOptionsProvider {
public:
  std::optional<std::filesystem::path> config_path;
  GlobalOptions options;
  std::filesystem::file_time_type last_modified;

  explicit GlobalOptionsProvider(std::optional<std::filesystem::path> config_path = std::nullopt);

  // Check for file changes and reload if necessary. Returns true if options changed.
  bool refresh();
};

} // namespace multisplit
