#include "argument_parser.h"

#include <iostream>

namespace multisplit {

namespace {

std::optional<LogLevel> parse_log_level(const std::string& level) {
  if (level == "trace") return LogLevel::Trace;
  if (level == "debug") return LogLevel::Debug;
  if (level == "info") return LogLevel::Info;
  if (level == "warn") return LogLevel::Warn;
  if (level == "err") return LogLevel::Err;
  if (level == "off") return LogLevel::Off;
  return std::nullopt;
}

ParseResult make_error(const std::string& error) {
  ParseResult result;
  result.success = false;
  result.error = error;
  return result;
}

ParseResult make_success(ParsedArgs args) {
  ParseResult result;
  result.success = true;
  result.args = std::move(args);
  return result;
}

// Parse an optional trailing "width height" pair. Returns false on a malformed pair.
bool parse_size(int argc, char* argv[], int& i, int& width, int& height, std::string& error) {
  int remaining = argc - i;
  if (remaining == 0) {
    return true;
  }
  if (remaining != 2) {
    error = "Expected width and height, got " + std::to_string(remaining) + " arguments";
    return false;
  }

  try {
    width = std::stoi(argv[i]);
    height = std::stoi(argv[i + 1]);
  } catch (const std::exception&) {
    error = "Invalid number in size arguments";
    return false;
  }
  if (width <= 0 || height <= 0) {
    error = "Width and height must be positive";
    return false;
  }
  i += 2;
  return true;
}

}  // namespace

ParseResult parse_args(int argc, char* argv[]) {
  ParsedArgs args;
  int i = 1;

  // Parse options first (--option value)
  while (i < argc) {
    std::string arg = argv[i];

    // Check for help flags
    if (arg == "--help" || arg == "-h") {
      args.command = HelpCommand{};
      return make_success(args);
    }

    if (arg == "--version") {
      args.command = VersionCommand{};
      return make_success(args);
    }

    // Check if it's an option (starts with --)
    if (arg.rfind("--", 0) == 0) {
      std::string option_name = arg.substr(2);

      if (option_name == "logmode") {
        if (i + 1 >= argc) {
          return make_error("--logmode requires a value");
        }
        ++i;
        std::string value = argv[i];
        auto level = parse_log_level(value);
        if (!level) {
          return make_error("Invalid log level: " + value +
                            ". Valid values: trace, debug, info, warn, err, off");
        }
        args.options.log_level = level;
      } else if (option_name == "config") {
        if (i + 1 >= argc) {
          return make_error("--config requires a filepath");
        }
        ++i;
        args.options.config_path = argv[i];
      } else {
        return make_error("Unknown option: --" + option_name);
      }
      ++i;
      continue;
    }

    // Not an option, must be a command
    break;
  }

  // Parse command if present
  if (i < argc) {
    std::string cmd = argv[i];
    ++i;

    if (cmd == "help") {
      args.command = HelpCommand{};
    } else if (cmd == "version") {
      args.command = VersionCommand{};
    } else if (cmd == "validate") {
      if (i >= argc) {
        return make_error("validate requires a layout file");
      }
      args.command = ValidateCommand{argv[i]};
      ++i;
    } else if (cmd == "geometry") {
      if (i >= argc) {
        return make_error("geometry requires a layout file");
      }
      GeometryCommand geometry_cmd;
      geometry_cmd.filepath = argv[i];
      ++i;
      std::string error;
      if (!parse_size(argc, argv, i, geometry_cmd.width, geometry_cmd.height, error)) {
        return make_error("geometry: " + error);
      }
      args.command = geometry_cmd;
    } else if (cmd == "diff") {
      if (i + 1 >= argc) {
        return make_error("diff requires two layout files");
      }
      DiffCommand diff_cmd;
      diff_cmd.old_filepath = argv[i];
      diff_cmd.new_filepath = argv[i + 1];
      i += 2;
      std::string error;
      if (!parse_size(argc, argv, i, diff_cmd.width, diff_cmd.height, error)) {
        return make_error("diff: " + error);
      }
      args.command = diff_cmd;
    } else if (cmd == "init-config") {
      InitConfigCommand init_cmd;
      if (i < argc && argv[i][0] != '-') {
        // Optional filepath argument provided
        init_cmd.filepath = argv[i];
        ++i;
      }
      args.command = init_cmd;
    } else {
      return make_error("Unknown command: " + cmd);
    }

    if (i < argc) {
      return make_error("Unexpected argument: " + std::string(argv[i]));
    }
  }

  return make_success(args);
}

void print_usage() {
  std::cout << "Usage: multisplit [options] [command] [command-args]\n"
            << "\n"
            << "Options:\n"
            << "  --help, -h              Show this help message\n"
            << "  --version               Show version information\n"
            << "  --logmode <level>       Set log level (trace, debug, info, warn, err, off)\n"
            << "  --config <filepath>     Load configuration from a TOML file\n"
            << "\n"
            << "Commands:\n"
            << "  help                    Show this help message\n"
            << "  version                 Show version information\n"
            << "  validate <layout>       Load a layout JSON file and check its invariants\n"
            << "  geometry <layout> [w h] Print pane and divider rectangles\n"
            << "                          (defaults to 1280x720)\n"
            << "  diff <old> <new> [w h]  Print the view operations between two layouts\n"
            << "  init-config [filepath]  Create default configuration TOML file\n"
            << "                          (defaults to multisplit.toml in the working directory)\n"
            << "\n"
            << "Examples:\n"
            << "  multisplit validate layout.json\n"
            << "  multisplit --logmode debug geometry layout.json 1920 1080\n"
            << "  multisplit diff before.json after.json\n"
            << "  multisplit init-config config.toml\n"
            << "  multisplit --config config.toml geometry layout.json\n";
}

}  // namespace multisplit
