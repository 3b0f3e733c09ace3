#ifndef GRPR_CONFIG_HPP
#define GRPR_CONFIG_HPP

#include <nlohmann/json_fwd.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace grpr {

/// Application configuration loaded from a YAML, TOML, or JSON file.
class Config {
public:
  /** Check whether verbose output is enabled. */
  bool verbose() const { return verbose_; }

  /// Set verbose output mode.
  void set_verbose(bool verbose) { verbose_ = verbose; }

  /// Whether commands are printed instead of executed.
  bool dry_run() const { return dry_run_; }

  /// Enable or disable dry run mode.
  void set_dry_run(bool dry_run) { dry_run_ = dry_run; }

  /// Executable run in every repository.
  const std::string &tool() const { return tool_; }

  /// Set the executable run in every repository.
  void set_tool(const std::string &tool) { tool_ = tool; }

  /// Arguments used when none are given on the command line.
  const std::vector<std::string> &default_args() const {
    return default_args_;
  }

  /// Set the fallback argument list.
  void set_default_args(const std::vector<std::string> &args) {
    default_args_ = args;
  }

  /// Entry names marking a repository root.
  const std::vector<std::string> &markers() const { return markers_; }

  /// Set repository marker names. Empty names are dropped.
  void set_markers(const std::vector<std::string> &markers);

  /// Whether regular files named like a marker count as markers.
  bool accept_marker_files() const { return accept_marker_files_; }

  /// Toggle acceptance of marker files.
  void set_accept_marker_files(bool accept) { accept_marker_files_ = accept; }

  /// Logging verbosity level.
  const std::string &log_level() const { return log_level_; }

  /// Set logging verbosity level.
  void set_log_level(const std::string &level) { log_level_ = level; }

  /// Logging pattern.
  const std::string &log_pattern() const { return log_pattern_; }

  /// Set logging pattern.
  void set_log_pattern(const std::string &pattern) { log_pattern_ = pattern; }

  /// Optional log file path.
  const std::string &log_file() const { return log_file_; }

  /// Set log file path.
  void set_log_file(const std::string &file) { log_file_ = file; }

  /// Number of rotated log files to keep (0 disables rotation).
  int log_rotate() const { return log_rotate_; }

  /// Set rotated log file count.
  void set_log_rotate(int rotate) { log_rotate_ = rotate < 0 ? 0 : rotate; }

  /// Category specific log level overrides.
  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }

  /// Replace category log level overrides.
  void set_log_categories(
      const std::unordered_map<std::string, std::string> &categories) {
    log_categories_ = categories;
  }

  /**
   * Load configuration from a file on disk.
   *
   * The file type is inferred from the extension (`.yaml`, `.yml`, `.json`,
   * `.toml`).
   *
   * @param path Filesystem location of the configuration file.
   * @return Fully populated configuration object.
   * @throws std::runtime_error When the file cannot be opened, parsed, or has
   *         an unsupported extension.
   */
  static Config from_file(const std::string &path);

  /// Construct a configuration object from a JSON representation.
  static Config from_json(const nlohmann::json &j);

private:
  void load_json(const nlohmann::json &j);

  bool verbose_{false};
  bool dry_run_{false};
  std::string tool_{"git"};
  std::vector<std::string> default_args_{"status"};
  std::vector<std::string> markers_{".git"};
  bool accept_marker_files_{false};
  std::string log_level_{"info"};
  std::string log_pattern_;
  std::string log_file_;
  int log_rotate_{3};
  std::unordered_map<std::string, std::string> log_categories_;
};

} // namespace grpr

#endif // GRPR_CONFIG_HPP
