/**
 * @file dispatcher.hpp
 * @brief Runs a tool once per discovered repository and aggregates results.
 *
 * Declares per-repository invocation outcomes, the run summary that maps them
 * to a process exit code, and the CommandDispatcher that drives a
 * RepositoryWalker.
 */

#ifndef GRPR_DISPATCHER_HPP
#define GRPR_DISPATCHER_HPP

#include "process.hpp"
#include "repo_discovery.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace grpr {

/// Process exit codes returned by grpr.
constexpr int kExitSuccess = 0;        ///< Every repository succeeded
constexpr int kExitRepositoryFailed = 1; ///< At least one repository failed
constexpr int kExitUsageError = 2;     ///< Invalid root, config or arguments

/** \brief How a single invocation ended. */
enum class OutcomeKind {
  Success,      ///< Tool exited with status zero
  ChildFailure, ///< Tool ran but exited non-zero or was killed
  SpawnError,   ///< Tool could not be launched
  Interrupted   ///< Operator interrupt was forwarded to the tool
};

/**
 * @brief Convert an outcome kind to a lowercase string.
 * @param kind Outcome kind.
 * @return Lowercase string representation.
 */
std::string to_string(OutcomeKind kind);

/** \brief Result of running the tool in one repository. */
struct InvocationOutcome {
  std::filesystem::path path;            ///< Repository root
  OutcomeKind kind{OutcomeKind::Success}; ///< Classification of the result
  int exit_code{0};                      ///< Exit status of the tool
  int term_signal{0};                    ///< Terminating signal, or 0
  std::string error;                     ///< Spawn or wait error message

  /// True for anything but a zero exit status.
  bool failed() const { return kind != OutcomeKind::Success; }

  /// Short reason such as "exited with status 1".
  std::string describe() const;
};

/** \brief Ordered outcomes of a whole run plus skipped directories. */
struct RunSummary {
  std::vector<InvocationOutcome> outcomes;
  std::vector<DirectoryAccessError> warnings;
  int interrupt_signal{0}; ///< Signal that stopped the run, or 0

  /// Number of outcomes that failed.
  std::size_t failure_count() const;

  /// Outcomes that failed, in walk order.
  std::vector<InvocationOutcome> failures() const;

  /**
   * Process exit code for the run.
   *
   * @return 128 + signal when interrupted, kExitRepositoryFailed when any
   *         outcome failed, otherwise kExitSuccess.
   */
  int exit_code() const;

  /**
   * Render the end-of-run report naming every failing repository.
   *
   * @param display_root Paths are shown relative to this directory when set.
   */
  std::string format(const std::filesystem::path &display_root = {}) const;
};

/** \brief Settings for running the tool. */
struct DispatchOptions {
  std::string tool{"git"};       ///< Executable looked up through PATH
  std::vector<std::string> args; ///< Forwarded verbatim to the tool
  bool dry_run{false};           ///< Print commands instead of running them
  std::filesystem::path display_root; ///< Base for banner paths
};

/**
 * Render @p path relative to @p root for display, falling back to the full
 * path when it is not below @p root.
 */
std::string display_path(const std::filesystem::path &path,
                         const std::filesystem::path &root);

/**
 * @brief Sequentially runs the configured tool in each repository.
 *
 * Each repository gets a banner line on the output stream before the tool
 * starts, so the tool's inherited output is grouped under it. A failing or
 * unlaunchable tool never stops the run; only an operator interrupt does.
 */
class CommandDispatcher {
public:
  using ProcessRunner = std::function<ProcessResult(
      const std::vector<std::string> &, const std::filesystem::path &)>;
  using OutcomeCallback = std::function<void(const InvocationOutcome &)>;

  /**
   * @param options Tool, arguments and display settings.
   * @param out Stream receiving banners.
   * @param runner Process launcher; defaults to run_process().
   */
  explicit CommandDispatcher(DispatchOptions options, std::ostream &out,
                             ProcessRunner runner = ProcessRunner{});

  /// Register a callback invoked after each outcome is recorded.
  void on_outcome(OutcomeCallback callback) {
    on_outcome_ = std::move(callback);
  }

  /**
   * Run the tool in a single repository.
   *
   * @param repo Repository root used as the working directory.
   * @return Recorded outcome; spawn failures are captured, not thrown.
   */
  InvocationOutcome invoke(const std::filesystem::path &repo);

  /**
   * Pull repositories from @p walker one at a time and run the tool in each
   * before the walk continues.
   */
  RunSummary dispatch(RepositoryWalker &walker);

  /// Run the tool in each of @p paths, in order.
  RunSummary dispatch(const std::vector<std::filesystem::path> &paths);

  /// Full command line: tool followed by the forwarded arguments.
  std::vector<std::string> command_line() const;

  const DispatchOptions &options() const { return options_; }

private:
  bool record(RunSummary &summary, InvocationOutcome outcome);

  DispatchOptions options_;
  std::ostream &out_;
  ProcessRunner runner_;
  OutcomeCallback on_outcome_;
};

} // namespace grpr

#endif // GRPR_DISPATCHER_HPP
