#include "cli.hpp"
#include "dispatcher.hpp"
#include "log.hpp"
#include "version.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <memory>
#include <sstream>
#include <string_view>
#include <unordered_set>
#include <vector>

#include <spdlog/spdlog.h>

namespace grpr {

namespace {
std::shared_ptr<spdlog::logger> cli_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("cli");
  }();
  return logger;
}

std::string footer_text() {
  static const std::array<std::string_view, 8> categories = {
      "app",  "cli",     "config",  "dispatch",
      "main", "logging", "process", "repo.discovery"};
  std::ostringstream oss;
  oss << "Every argument from the first one that is not a grpr option is "
         "passed unchanged\nto the tool in each repository. Without tool "
         "arguments the configured default\n(git status) runs.\n\n";
  oss << "Exit status: 0 when every repository succeeded, 1 when any failed, "
         "2 on usage\nerrors, 128+N when interrupted by signal N.\n\n";
  oss << "Logging categories: ";
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i != 0) {
      oss << ", ";
    }
    oss << categories[i];
  }
  oss << "\nUse --grpr-log-category NAME=LEVEL to override (e.g., "
         "repo.discovery=debug).";
  return oss.str();
}
/**
 * Check whether @p arg is one of grpr's own options.
 *
 * Only `-h`, `--help` and the `--grpr-` namespace belong to grpr, so tool
 * flags such as `--version` or `-C` are never intercepted.
 */
bool is_grpr_option(const std::string &arg) {
  return arg == "-h" || arg == "--help" || arg.rfind("--grpr-", 0) == 0;
}

/// grpr options that consume the following argument as their value.
bool takes_value(const std::string &arg) {
  static const std::unordered_set<std::string> valued = {
      "--grpr-config",    "--grpr-root",      "--grpr-marker",
      "--grpr-tool",      "--grpr-log-level", "--grpr-log-file",
      "--grpr-log-rotate", "--grpr-log-category"};
  return valued.count(arg) > 0;
}
} // namespace

/**
 * Parse command line arguments.
 *
 * The leading run of grpr options is handed to CLI11; scanning stops at the
 * first other argument, or after a `--` separator, and the rest is forwarded
 * untouched.
 *
 * @param argc Number of elements supplied in @p argv.
 * @param argv Raw CLI argument strings.
 * @return Populated options structure.
 */
CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"grpr - run a version-control command in every repository "
               "below the current directory",
               "grpr"};
  app.footer(footer_text());
  CliOptions options;
  CLI::Option *log_rotate_option = nullptr;

  app.add_flag("--grpr-verbose", options.verbose, "Enable debug logging")
      ->group("General");
  app.add_option("--grpr-config", options.config_file,
                 "Path to configuration file (YAML, JSON or TOML)")
      ->type_name("FILE")
      ->group("General");
  app.add_flag_function(
         "--grpr-version",
         [](std::int64_t) {
           std::cout << "grpr " << kVersionString << std::endl;
           throw CliParseExit(kExitSuccess);
         },
         "Show version information and exit")
      ->group("General");
  app.add_flag("--grpr-dry-run", options.dry_run,
               "Print the command for each repository without running it")
      ->group("General");
  app.add_option("--grpr-root", options.root,
                 "Directory to search (default: current directory)")
      ->type_name("DIR")
      ->group("Discovery");
  app.add_option_function<std::string>(
         "--grpr-marker",
         [&options](const std::string &value) {
           if (value.empty()) {
             throw CLI::ValidationError("--grpr-marker",
                                        "marker name must not be empty");
           }
           options.markers.push_back(value);
         },
         "Entry marking a repository root; repeatable (default: .git)")
      ->type_name("NAME")
      ->group("Discovery");
  app.add_flag("--grpr-accept-marker-files", options.accept_marker_files,
               "Also accept markers that are regular files (worktrees, "
               "submodules)")
      ->group("Discovery");
  app.add_option_function<std::string>(
         "--grpr-tool",
         [&options](const std::string &value) {
           if (value.empty()) {
             throw CLI::ValidationError("--grpr-tool",
                                        "tool name must not be empty");
           }
           options.tool = value;
         },
         "Executable to run in each repository (default: git)")
      ->type_name("NAME")
      ->group("Dispatch");
  app.add_option(
         "--grpr-log-level", options.log_level,
         "Set logging level (trace, debug, info, warn, error, critical, off)")
      ->type_name("LEVEL")
      ->group("Logging");
  app.add_option("--grpr-log-file", options.log_file, "Path to log file")
      ->type_name("FILE")
      ->group("Logging");
  log_rotate_option =
      app.add_option_function<int>(
             "--grpr-log-rotate",
             [&options](int value) {
               if (value < 0) {
                 throw CLI::ValidationError("--grpr-log-rotate",
                                            "count must be non-negative");
               }
               options.log_rotate = value;
             },
             "Number of rotated log files to keep (0 disables rotation)")
          ->type_name("N")
          ->group("Logging");
  app.add_option_function<std::string>(
         "--grpr-log-category",
         [&options](const std::string &value) {
           auto pos = value.find('=');
           std::string name =
               pos == std::string::npos ? value : value.substr(0, pos);
           std::string level = pos == std::string::npos ? std::string{"debug"}
                                                        : value.substr(pos + 1);
           if (name.empty()) {
             throw CLI::ValidationError("--grpr-log-category",
                                        "category name must not be empty");
           }
           if (level.empty()) {
             level = "debug";
           }
           options.log_categories[name] = level;
           options.log_categories_explicit = true;
         },
         "Override log level for a category (NAME=LEVEL)")
      ->type_name("NAME=LEVEL")
      ->group("Logging");

  std::vector<std::string> own_args;
  int idx = 1;
  while (idx < argc) {
    const std::string arg = argv[idx] != nullptr ? argv[idx] : "";
    if (arg == "--") {
      ++idx;
      break;
    }
    if (!is_grpr_option(arg)) {
      break;
    }
    own_args.push_back(arg);
    ++idx;
    if (takes_value(arg) && idx < argc) {
      own_args.emplace_back(argv[idx] != nullptr ? argv[idx] : "");
      ++idx;
    }
  }
  for (; idx < argc; ++idx) {
    options.tool_args.emplace_back(argv[idx] != nullptr ? argv[idx] : "");
  }

  try {
    // CLI11 consumes the vector from the back.
    std::reverse(own_args.begin(), own_args.end());
    app.parse(own_args);
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code == 0 ? kExitSuccess : kExitUsageError);
  }
  options.log_rotate_explicit = log_rotate_option->count() > 0U;
  cli_log()->debug("Forwarding {} argument(s) to the tool",
                   options.tool_args.size());
  return options;
}

} // namespace grpr
