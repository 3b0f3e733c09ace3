/**
 * @file process.hpp
 * @brief Child process execution with inherited standard streams.
 *
 * Declares the spawn helper used to run the dispatched tool, the error raised
 * when a child cannot be launched, and the interrupt handling that forwards
 * SIGINT/SIGTERM to the running child.
 */

#ifndef GRPR_PROCESS_HPP
#define GRPR_PROCESS_HPP

#include <filesystem>
#include <signal.h>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace grpr {

/** \brief Termination status of a child process. */
struct ProcessResult {
  int exit_code{0};   ///< Exit status when the child exited normally
  int term_signal{0}; ///< Signal number when the child was killed, else 0
  bool interrupted{false}; ///< Parent forwarded an interrupt to the child

  /// True when the child exited normally with status zero.
  bool success() const { return term_signal == 0 && exit_code == 0; }
};

/**
 * Raised when a child process could not be started: executable missing,
 * permission denied, working directory unusable, or fork failure.
 */
class SpawnError : public std::runtime_error {
public:
  SpawnError(const std::string &what, std::error_code code)
      : std::runtime_error(what), code_(code) {}

  /// Underlying system error.
  std::error_code code() const noexcept { return code_; }

private:
  std::error_code code_;
};

/**
 * Run a program and wait for it to finish.
 *
 * The program is looked up through `PATH`, runs in @p cwd, and inherits the
 * parent's environment and standard input, output and error. While waiting,
 * SIGINT and SIGTERM sent to the parent are forwarded to the child, unless
 * they came from the terminal, which already signals the child's process
 * group. An ignored SIGCHLD is reset to the default for the duration of the
 * call so the exit status can be collected.
 *
 * @param argv Program name followed by its arguments. Must not be empty.
 * @param cwd Working directory for the child.
 * @return Exit status of the child.
 * @throws SpawnError When the child could not be started.
 * @throws std::system_error When the child's status cannot be collected.
 */
ProcessResult run_process(const std::vector<std::string> &argv,
                          const std::filesystem::path &cwd);

/**
 * RAII scope installing SIGINT/SIGTERM handlers that record the signal
 * instead of terminating the parent, so run_process() can forward it to the
 * child and reap it. Previous handlers are restored on destruction.
 */
class InterruptScope {
public:
  InterruptScope();
  ~InterruptScope();

  InterruptScope(const InterruptScope &) = delete;
  InterruptScope &operator=(const InterruptScope &) = delete;

private:
  struct sigaction previous_int_ {};
  struct sigaction previous_term_ {};
};

/// Signal number received while an InterruptScope was active, or 0.
int pending_interrupt();

/// Clear any recorded interrupt.
void reset_interrupt();

/**
 * Whether a signal with origin @p si_code must be passed on to the child.
 *
 * Signals sent by a process (kill, sigqueue, raise) reach only grpr and are
 * forwarded. Kernel-generated ones such as terminal Ctrl-C already went to
 * the whole foreground process group, child included.
 */
bool interrupt_needs_forwarding(int si_code);

} // namespace grpr

#endif // GRPR_PROCESS_HPP
