#include "log.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {
constexpr const char *kRootLoggerName = "grpr";
constexpr std::size_t kMaxLogFileSize = 1024 * 1024 * 5;

std::weak_ptr<spdlog::logger> g_logger;
std::recursive_mutex g_logger_mutex;

/**
 * Build the sink list shared by the default logger and every category.
 *
 * @param file Optional log file path.
 * @param rotate_files Number of rotated files to keep; zero disables rotation.
 * @return Sinks to attach to loggers.
 */
std::vector<spdlog::sink_ptr> make_sinks(const std::string &file,
                                         std::size_t rotate_files) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!file.empty()) {
    if (rotate_files > 0) {
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          file, kMaxLogFileSize, rotate_files));
    } else {
      sinks.push_back(
          std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, true));
    }
  }
  return sinks;
}
} // namespace

namespace grpr {

/**
 * Initialize the global spdlog logger with optional file rotation.
 *
 * Calling this again replaces the sinks of the default logger and of every
 * category logger created so far, so categories fetched before the CLI was
 * parsed still write to the final destinations.
 *
 * @param level Logging verbosity level for the default logger.
 * @param pattern Log message pattern; empty string retains the default.
 * @param file Optional log file path.
 * @param rotate_files Maximum number of rotated files to keep.
 */
void init_logger(spdlog::level::level_enum level, const std::string &pattern,
                 const std::string &file, std::size_t rotate_files) {
  std::lock_guard<std::recursive_mutex> lock(g_logger_mutex);
  auto sinks = make_sinks(file, rotate_files);
  auto logger = spdlog::get(kRootLoggerName);
  if (!logger) {
    logger = std::make_shared<spdlog::logger>(kRootLoggerName, sinks.begin(),
                                              sinks.end());
    spdlog::register_logger(logger);
  } else {
    logger->sinks() = sinks;
  }
  spdlog::set_default_logger(logger);
  g_logger = logger;
  const std::string prefix = std::string(kRootLoggerName) + ".";
  spdlog::apply_all([&](const std::shared_ptr<spdlog::logger> &l) {
    if (l->name().rfind(prefix, 0) == 0) {
      l->sinks() = sinks;
      l->set_level(level);
    }
  });
  logger->set_level(level);
  if (!pattern.empty()) {
    spdlog::set_pattern(pattern);
  }
  logger->flush_on(spdlog::level::warn);
  logger->debug("Logger initialised (level={}, file='{}', rotate={})",
                spdlog::level::to_string_view(level), file, rotate_files);
}

/**
 * Ensure that the default logger exists before logging.
 *
 * Creates a new logger when previous initialization was skipped or lost.
 */
void ensure_default_logger() {
  std::lock_guard<std::recursive_mutex> lock(g_logger_mutex);
  auto logger = spdlog::default_logger();
  auto locked = g_logger.lock();
  if (!logger || !locked || logger.get() != locked.get()) {
    init_logger(spdlog::level::info);
  }
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  std::lock_guard<std::recursive_mutex> lock(g_logger_mutex);
  const std::string name = std::string(kRootLoggerName) + "." + category;
  auto logger = spdlog::get(name);
  if (logger) {
    return logger;
  }
  auto default_logger = g_logger.lock();
  if (!default_logger) {
    init_logger(spdlog::level::info);
    default_logger = g_logger.lock();
  }
  std::vector<spdlog::sink_ptr> sinks;
  if (default_logger) {
    sinks = default_logger->sinks();
  } else {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  auto new_logger =
      std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
  new_logger->set_level(default_logger ? default_logger->level()
                                       : spdlog::level::info);
  new_logger->flush_on(spdlog::level::warn);
  spdlog::register_logger(new_logger);
  return new_logger;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  if (overrides.empty()) {
    return;
  }
  for (const auto &[category, level] : overrides) {
    auto logger = category_logger(category);
    logger->set_level(level);
    logger->debug("Category '{}' set to level {}", category,
                  spdlog::level::to_string_view(level));
  }
  category_logger("logging")->debug("Applied {} log category override(s)",
                                    overrides.size());
}

} // namespace grpr
