#ifdef DOCTEST_CONFIG_DISABLE

#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "argument_parser.h"
#include "geometry.h"
#include "layout_io.h"
#include "options.h"
#include "reconciler.h"
#include "utility.h"
#include "version.h"

namespace {

std::filesystem::path get_default_config_path() {
  return std::filesystem::current_path() / "multisplit.toml";
}

} // namespace

using namespace multisplit;

void apply_log_level(LogLevel level) {
  switch (level) {
  case LogLevel::Trace:
    spdlog::set_level(spdlog::level::trace);
    break;
  case LogLevel::Debug:
    spdlog::set_level(spdlog::level::debug);
    break;
  case LogLevel::Info:
    spdlog::set_level(spdlog::level::info);
    break;
  case LogLevel::Warn:
    spdlog::set_level(spdlog::level::warn);
    break;
  case LogLevel::Err:
    spdlog::set_level(spdlog::level::err);
    break;
  case LogLevel::Off:
    spdlog::set_level(spdlog::level::off);
    break;
  }
}

int run_validate(const ValidateCommand& cmd) {
  auto loaded = load_layout(cmd.filepath);
  if (!loaded.success) {
    spdlog::error("{}", loaded.error);
    std::cout << cmd.filepath << ": invalid\n";
    return 1;
  }

  debug_print_tree(loaded.tree);
  std::cout << cmd.filepath << ": valid, " << pane_count(loaded.tree) << " panes";
  if (loaded.tree.focused_pane_id) {
    std::cout << ", focus " << loaded.tree.focused_pane_id->value;
  }
  std::cout << "\n";
  return 0;
}

int run_geometry(const GeometryCommand& cmd, const GlobalOptions& options) {
  auto loaded = load_layout(cmd.filepath);
  if (!loaded.success) {
    spdlog::error("{}", loaded.error);
    return 1;
  }

  Rect bounds{0, 0, cmd.width, cmd.height};
  Layout layout = compute_display_layout(loaded.tree, bounds, options.geometry);

  for (const auto& pane : layout.panes) {
    std::cout << pane.pane_id.value << " " << pane.rect.x << "," << pane.rect.y << " "
              << pane.rect.width << "x" << pane.rect.height << (pane.visible ? "" : " hidden")
              << "\n";
  }
  for (const auto& divider : layout.dividers) {
    std::cout << divider.split_id.value << "[" << divider.index << "] " << divider.rect.x << ","
              << divider.rect.y << " " << divider.rect.width << "x" << divider.rect.height << "\n";
  }
  if (layout.overflow) {
    std::cout << "overflow: minimum sizes exceed " << cmd.width << "x" << cmd.height << "\n";
  }
  return 0;
}

int run_diff(const DiffCommand& cmd, const GlobalOptions& options) {
  auto old_layout = load_layout(cmd.old_filepath);
  if (!old_layout.success) {
    spdlog::error("{}: {}", cmd.old_filepath, old_layout.error);
    return 1;
  }
  auto new_layout = load_layout(cmd.new_filepath);
  if (!new_layout.success) {
    spdlog::error("{}: {}", cmd.new_filepath, new_layout.error);
    return 1;
  }

  Rect bounds{0, 0, cmd.width, cmd.height};
  auto operations = timed("reconcile", [&]() {
    return reconcile(old_layout.tree, bounds, new_layout.tree, bounds, options.geometry);
  });
  for (const auto& operation : operations) {
    std::cout << describe_operation(operation) << "\n";
  }
  return 0;
}

int main(int argc, char* argv[]) {
  // Flush spdlog on info-level messages to ensure immediate output
  spdlog::flush_on(spdlog::level::info);

  // Parse command-line arguments
  auto result = parse_args(argc, argv);
  if (!result.success) {
    spdlog::error("{}", result.error);
    print_usage();
    return 1;
  }

  // Apply log level if specified
  if (result.args.options.log_level) {
    apply_log_level(*result.args.options.log_level);
  }

  spdlog::debug("multisplit v{}", get_version_string());

  // Determine config path to load
  std::filesystem::path config_path;
  bool config_explicitly_specified = false;

  if (result.args.options.config_path) {
    config_path = *result.args.options.config_path;
    config_explicitly_specified = true;
  } else {
    config_path = get_default_config_path();
  }

  // Load config
  auto global_options = get_default_global_options();
  if (config_explicitly_specified || std::filesystem::exists(config_path)) {
    auto loaded = read_options_toml(config_path);
    if (loaded.success) {
      global_options = loaded.options;
      spdlog::info("Loaded config from: {}", config_path.string());
    } else {
      if (config_explicitly_specified) {
        // Explicit config path failed - error out
        spdlog::error("Failed to load config: {}", loaded.error);
        return 1;
      }
      // Default config failed to load - just use defaults silently
      spdlog::debug("Default config not loaded: {}", loaded.error);
    }
  }

  if (!result.args.command) {
    print_usage();
    return 0;
  }

  // Dispatch command
  return std::visit(overloaded{
                        [](const HelpCommand&) {
                          print_usage();
                          return 0;
                        },
                        [](const VersionCommand&) {
                          std::cout << "multisplit v" << get_version_string() << std::endl;
                          return 0;
                        },
                        [](const ValidateCommand& cmd) { return run_validate(cmd); },
                        [&](const GeometryCommand& cmd) {
                          return run_geometry(cmd, global_options);
                        },
                        [&](const DiffCommand& cmd) { return run_diff(cmd, global_options); },
                        [](const InitConfigCommand& cmd) {
                          auto target_path = cmd.filepath ? std::filesystem::path(*cmd.filepath)
                                                          : get_default_config_path();
                          auto write_result =
                              write_options_toml(get_default_global_options(), target_path);
                          if (!write_result.success) {
                            spdlog::error("Failed to write config: {}", write_result.error);
                            return 1;
                          }
                          spdlog::info("Config written to: {}", target_path.string());
                          return 0;
                        },
                    },
                    *result.args.command);
}

#endif
