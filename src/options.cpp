#include "options.h"

#include <spdlog/spdlog.h>

#include <fstream>
#include <toml++/toml.hpp>

namespace multisplit {

namespace {

// Read a non-negative integer, keeping `fallback` (and logging) when the value is negative
void read_non_negative(const toml::table& table, const char* section, const char* key,
                       int& target, int fallback) {
  auto value = table[key].as_integer();
  if (!value) {
    if (table[key]) {
      spdlog::error("Invalid {}.{}: must be an integer. Using default.", section, key);
    }
    return;
  }
  if (value->get() < 0) {
    spdlog::error("Invalid {}.{} value ({}): must be non-negative. Using default.", section, key,
                  value->get());
    target = fallback;
    return;
  }
  target = static_cast<int>(value->get());
}

} // anonymous namespace

std::string focus_policy_to_string(FocusPolicy policy) {
  switch (policy) {
  case FocusPolicy::AutoRestore:
    return "auto_restore";
  case FocusPolicy::LockToMaximized:
    return "lock";
  }
  return "auto_restore";
}

std::optional<FocusPolicy> string_to_focus_policy(const std::string& str) {
  if (str == "auto_restore")
    return FocusPolicy::AutoRestore;
  if (str == "lock")
    return FocusPolicy::LockToMaximized;
  return std::nullopt;
}

GlobalOptions get_default_global_options() {
  return GlobalOptions{};
}

WriteResult write_options_toml(const GlobalOptions& options,
                               const std::filesystem::path& filepath) {
  try {
    toml::table root;

    // Build geometry section
    toml::table geometry;
    geometry.insert("divider_width", options.geometry.divider_width);
    geometry.insert("min_pane_width", options.geometry.min_pane_width);
    geometry.insert("min_pane_height", options.geometry.min_pane_height);
    root.insert("geometry", geometry);

    // Build history section
    toml::table history;
    history.insert("max_undo_levels", static_cast<int64_t>(options.history.max_undo_levels));
    root.insert("history", history);

    // Build focus section
    toml::table focus;
    focus.insert("policy", focus_policy_to_string(options.model.focus_policy));
    root.insert("focus", focus);

    // Build model section
    toml::table model;
    model.insert("validate_on_mutation", options.model.validate_on_mutation);
    model.insert("pane_id_prefix", options.model.pane_id_prefix);
    root.insert("model", model);

    // Write to file
    std::ofstream file(filepath);
    if (!file) {
      return WriteResult{false, "Failed to open file for writing: " + filepath.string()};
    }
    file << root;
    return WriteResult{true, ""};
  } catch (const std::exception& e) {
    return WriteResult{false, std::string("Error writing TOML: ") + e.what()};
  }
}

ReadResult read_options_toml(const std::filesystem::path& filepath) {
  try {
    auto tbl = toml::parse_file(filepath.string());
    GlobalOptions options = get_default_global_options();

    // Parse geometry section
    if (auto geometry = tbl["geometry"].as_table()) {
      read_non_negative(*geometry, "geometry", "divider_width", options.geometry.divider_width,
                        kDefaultDividerWidth);
      read_non_negative(*geometry, "geometry", "min_pane_width", options.geometry.min_pane_width,
                        kDefaultMinPaneWidth);
      read_non_negative(*geometry, "geometry", "min_pane_height",
                        options.geometry.min_pane_height, kDefaultMinPaneHeight);
    }

    // Parse history section
    if (auto history = tbl["history"].as_table()) {
      if (auto levels = (*history)["max_undo_levels"].as_integer()) {
        if (levels->get() < 1) {
          spdlog::error("Invalid history.max_undo_levels value ({}): must be at least 1. Using "
                        "default.",
                        levels->get());
        } else {
          options.history.max_undo_levels = static_cast<size_t>(levels->get());
        }
      }
    }

    // Parse focus section
    if (auto focus = tbl["focus"].as_table()) {
      if (auto policy_str = (*focus)["policy"].as_string()) {
        if (auto policy = string_to_focus_policy(policy_str->get())) {
          options.model.focus_policy = *policy;
        } else {
          spdlog::error("Invalid focus.policy '{}': expected auto_restore or lock. Using default.",
                        policy_str->get());
        }
      }
    }

    // Parse model section
    if (auto model = tbl["model"].as_table()) {
      if (auto validate = (*model)["validate_on_mutation"].as_boolean()) {
        options.model.validate_on_mutation = validate->get();
      }
      if (auto prefix = (*model)["pane_id_prefix"].as_string()) {
        if (prefix->get().empty()) {
          spdlog::error("Invalid model.pane_id_prefix: must not be empty. Using default.");
        } else {
          options.model.pane_id_prefix = prefix->get();
        }
      }
    }

    return ReadResult{true, "", options};
  } catch (const toml::parse_error& e) {
    return ReadResult{false, std::string("TOML parse error: ") + e.what(), {}};
  } catch (const std::exception& e) {
    return ReadResult{false, std::string("Error reading TOML: ") + e.what(), {}};
  }
}

GlobalOptionsProvider::GlobalOptionsProvider(std::optional<std::filesystem::path> path)
    : config_path(std::move(path)), options(get_default_global_options()), last_modified{} {
  if (config_path.has_value() && std::filesystem::exists(*config_path)) {
    auto result = read_options_toml(*config_path);
    if (result.success) {
      options = result.options;
      last_modified = std::filesystem::last_write_time(*config_path);
    } else {
      spdlog::error("Failed to load config: {}", result.error);
    }
  }
}

bool GlobalOptionsProvider::refresh() {
  if (!config_path.has_value()) {
    return false; // No file to monitor
  }
  if (!std::filesystem::exists(*config_path)) {
    return false; // File doesn't exist (yet)
  }

  auto current_modified = std::filesystem::last_write_time(*config_path);
  if (current_modified == last_modified) {
    return false; // No change
  }

  auto result = read_options_toml(*config_path);
  if (result.success) {
    options = result.options;
    last_modified = current_modified;
    spdlog::info("Config reloaded from: {}", config_path->string());
    return true;
  }
  spdlog::error("Failed to reload config: {}", result.error);
  return false;
}

} // namespace multisplit
