#include "app.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "log.hpp"
#include "process.hpp"
#include "repo_discovery.hpp"
#include <cstddef>
#include <exception>
#include <filesystem>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <system_error>
#include <unordered_map>

namespace grpr {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}

/**
 * Translate a level name, rejecting names spdlog silently maps to `off`.
 *
 * @param name Level name such as "debug".
 * @param level Receives the parsed level on success.
 * @return `true` when @p name is a known level.
 */
bool parse_level(const std::string &name, spdlog::level::level_enum &level) {
  auto parsed = spdlog::level::from_str(name);
  if (parsed == spdlog::level::off && name != "off") {
    return false;
  }
  level = parsed;
  return true;
}
} // namespace

/**
 * Fill in everything the command line left unset from the configuration.
 * Command line values always win.
 */
void App::merge_config() {
  if (options_.tool.empty()) {
    options_.tool = config_.tool();
  }
  if (options_.markers.empty()) {
    options_.markers = config_.markers();
  }
  if (options_.tool_args.empty()) {
    options_.tool_args = config_.default_args();
  }
  options_.accept_marker_files =
      options_.accept_marker_files || config_.accept_marker_files();
  options_.dry_run = options_.dry_run || config_.dry_run();
  options_.verbose = options_.verbose || config_.verbose();
  if (options_.log_level.empty()) {
    options_.log_level =
        options_.verbose && config_.log_level() == "info"
            ? std::string("debug")
            : config_.log_level();
  }
  if (options_.log_file.empty()) {
    options_.log_file = config_.log_file();
  }
  if (!options_.log_rotate_explicit) {
    options_.log_rotate = config_.log_rotate();
  }
  if (!options_.log_categories_explicit) {
    options_.log_categories = config_.log_categories();
  }
}

void App::setup_logging() {
  spdlog::level::level_enum lvl = spdlog::level::info;
  bool valid_level = parse_level(options_.log_level, lvl);
  init_logger(lvl, config_.log_pattern(), options_.log_file,
              static_cast<std::size_t>(options_.log_rotate));
  if (!valid_level) {
    app_log()->warn("Ignoring invalid log level '{}'", options_.log_level);
  }
  std::unordered_map<std::string, spdlog::level::level_enum> category_levels;
  for (const auto &[category, level_str] : options_.log_categories) {
    spdlog::level::level_enum category_level = spdlog::level::info;
    if (parse_level(level_str, category_level)) {
      category_levels[category] = category_level;
    } else {
      app_log()->warn("Ignoring invalid log level '{}' for category '{}'",
                      level_str, category);
    }
  }
  configure_log_categories(category_levels);
}

/**
 * Execute the main application flow.
 *
 * @param argc Argument count passed from @c main().
 * @param argv Argument vector passed from @c main().
 * @return Exit code for the process.
 */
int App::run(int argc, char **argv) {
  summary_ = RunSummary{};
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    return exit.exit_code();
  } catch (const std::exception &e) {
    app_log()->error("{}", e.what());
    return kExitUsageError;
  }
  if (!options_.config_file.empty()) {
    try {
      config_ = Config::from_file(options_.config_file);
    } catch (const std::exception &e) {
      app_log()->error("Cannot use configuration '{}': {}",
                       options_.config_file, e.what());
      return kExitUsageError;
    }
  }
  merge_config();
  setup_logging();

  std::filesystem::path root(options_.root);
  if (root.empty()) {
    std::error_code ec;
    root = std::filesystem::current_path(ec);
    if (ec) {
      app_log()->error("Cannot determine the current directory: {}",
                       ec.message());
      return kExitUsageError;
    }
  }

  DiscoveryOptions discovery;
  discovery.markers = options_.markers;
  discovery.accept_marker_files = options_.accept_marker_files;

  DispatchOptions dispatch;
  dispatch.tool = options_.tool;
  dispatch.args = options_.tool_args;
  dispatch.dry_run = options_.dry_run;
  dispatch.display_root = root;

  try {
    RepositoryWalker walker(root, discovery);
    CommandDispatcher dispatcher(dispatch, out_);
    app_log()->debug("Running '{}' in repositories below '{}'", dispatch.tool,
                     root.string());
    InterruptScope interrupts;
    reset_interrupt();
    summary_ = dispatcher.dispatch(walker);
  } catch (const InvalidRootError &e) {
    app_log()->error("{}", e.what());
    return kExitUsageError;
  }
  out_ << summary_.format(root);
  out_.flush();
  return summary_.exit_code();
}

} // namespace grpr
