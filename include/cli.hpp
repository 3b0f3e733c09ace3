/**
 * @file cli.hpp
 * @brief Command line parsing for grpr.
 *
 * grpr owns only a handful of `--grpr-*` options. Parsing stops at the first
 * argument that is not one of them; that argument and everything after it
 * are forwarded verbatim to the dispatched tool.
 */

#ifndef GRPR_CLI_HPP
#define GRPR_CLI_HPP

#include <exception>
#include <string>
#include <unordered_map>
#include <vector>

namespace grpr {

/**
 * Signals that CLI parsing requested an immediate exit (help, version,
 * errors). Used to bubble exit codes from parsing back to the entry point
 * without treating them as fatal errors.
 */
class CliParseExit : public std::exception {
public:
  /**
   * Construct an exit signal with the desired exit code.
   *
   * @param exit_code Process exit code that should be returned to the caller.
   */
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /// Numeric process exit code.
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/**
 * Parsed command line options.
 *
 * Empty strings and `*_explicit == false` mean "not given", so configuration
 * file values can fill them in.
 */
struct CliOptions {
  bool verbose{false};            ///< Debug logging
  bool dry_run{false};            ///< Print commands instead of running them
  std::string config_file;        ///< Optional path to configuration file
  std::string root;               ///< Start directory; empty = current dir
  std::string tool;               ///< Executable to dispatch
  std::vector<std::string> markers; ///< Repository marker names
  bool accept_marker_files{false};  ///< Accept marker files, not only dirs
  std::string log_level;            ///< Logging verbosity level
  std::string log_file;             ///< Optional path to log file
  int log_rotate{3}; ///< Number of rotated log files to keep (0 disables)
  bool log_rotate_explicit{false}; ///< True if CLI set log rotation count
  std::unordered_map<std::string, std::string>
      log_categories; ///< Category -> level overrides requested via CLI
  bool log_categories_explicit{false}; ///< True if CLI specified categories
  std::vector<std::string> tool_args; ///< Forwarded verbatim to the tool
};

/**
 * Parse command line arguments.
 *
 * @param argc Number of elements supplied in @p argv.
 * @param argv Raw CLI argument strings, program name first.
 * @return Populated options structure.
 * @throws CliParseExit When parsing requests an early exit (`--help`,
 *         `--grpr-version`, or a malformed grpr option).
 */
CliOptions parse_cli(int argc, char **argv);

} // namespace grpr

#endif // GRPR_CLI_HPP
