#pragma once

#include <optional>
#include <string>
#include <variant>

namespace multisplit {

// ===== Command Structs =====
struct HelpCommand {}; // --help or -h

struct VersionCommand {};

// Load a layout file and report its structure and any invariant violations
struct ValidateCommand {
  std::string filepath;
};

// Print pane and divider rectangles of a layout file
struct GeometryCommand {
  std::string filepath;
  int width = 1280;
  int height = 720;
};

// Print the view operations that turn one layout into another
struct DiffCommand {
  std::string old_filepath;
  std::string new_filepath;
  int width = 1280;
  int height = 720;
};

struct InitConfigCommand {
  std::optional<std::string> filepath; // Empty = use default (multisplit.toml in working dir)
};

// Variant holding all possible commands
using CliCommand = std::variant<HelpCommand, VersionCommand, ValidateCommand, GeometryCommand,
                                DiffCommand, InitConfigCommand>;

// ===== CLI Options =====
enum class LogLevel { Trace, Debug, Info, Warn, Err, Off };

struct CliOptions {
  std::optional<LogLevel> log_level;      // --logmode <level>
  std::optional<std::string> config_path; // --config <filepath>
};

// ===== Parsed Arguments =====
struct ParsedArgs {
  CliOptions options;
  std::optional<CliCommand> command; // nullopt if no command specified
};

// ===== Parser Result =====
struct ParseResult {
  bool success;
  std::string error; // Set if success == false
  ParsedArgs args;
};

// Parse command-line arguments
ParseResult parse_args(int argc, char* argv[]);

// Print usage information to stdout
void print_usage();

} // namespace multisplit
