/**
 * @file app.hpp
 * @brief Main application entry point and orchestrator for grpr.
 *
 * Declares the App class, which parses the command line, merges the optional
 * configuration file, initialises logging and runs the walk/dispatch loop.
 */

#ifndef GRPR_APP_HPP
#define GRPR_APP_HPP

#include "cli.hpp"
#include "config.hpp"
#include "dispatcher.hpp"

#include <iostream>
#include <ostream>

namespace grpr {

/**
 * Application entry point responsible for orchestrating the high level flow:
 * CLI parsing, configuration loading, discovery and dispatch.
 */
class App {
public:
  /**
   * @param out Stream receiving repository banners and the final summary.
   */
  explicit App(std::ostream &out = std::cout) : out_(out) {}

  /**
   * Run the application with the given command line arguments.
   *
   * @param argc Number of CLI arguments supplied to the executable.
   * @param argv Raw CLI arguments, program name first.
   * @return Process exit code: 0 when every repository succeeded, 1 when
   *         any failed, 2 on usage errors, 128 + N when interrupted.
   */
  int run(int argc, char **argv);

  /// Parsed command line options, with configuration values merged in.
  const CliOptions &options() const { return options_; }

  /// Loaded configuration.
  const Config &config() const { return config_; }

  /// Outcome of the last run; empty when it stopped before dispatching.
  const RunSummary &summary() const { return summary_; }

private:
  void merge_config();
  void setup_logging();

  std::ostream &out_;
  CliOptions options_;
  Config config_;
  RunSummary summary_;
};

} // namespace grpr

#endif // GRPR_APP_HPP
