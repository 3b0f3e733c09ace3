#include "dispatcher.hpp"
#include "log.hpp"

#include <memory>
#include <ostream>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace grpr {

namespace fs = std::filesystem;

namespace {
std::shared_ptr<spdlog::logger> dispatch_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("dispatch");
  }();
  return logger;
}

std::string join_command(const std::vector<std::string> &argv) {
  std::string joined;
  for (const auto &arg : argv) {
    if (!joined.empty()) {
      joined += ' ';
    }
    if (arg.empty() || arg.find_first_of(" \t\"'") != std::string::npos) {
      joined += '\'' + arg + '\'';
    } else {
      joined += arg;
    }
  }
  return joined;
}
} // namespace

std::string to_string(OutcomeKind kind) {
  switch (kind) {
  case OutcomeKind::Success:
    return "success";
  case OutcomeKind::ChildFailure:
    return "child-failure";
  case OutcomeKind::SpawnError:
    return "spawn-error";
  case OutcomeKind::Interrupted:
    return "interrupted";
  }
  return "child-failure";
}

std::string InvocationOutcome::describe() const {
  switch (kind) {
  case OutcomeKind::Success:
    return "ok";
  case OutcomeKind::ChildFailure:
    if (!error.empty()) {
      return "wait failed: " + error;
    }
    if (term_signal != 0) {
      return "killed by signal " + std::to_string(term_signal);
    }
    return "exited with status " + std::to_string(exit_code);
  case OutcomeKind::SpawnError:
    return "spawn error: " + error;
  case OutcomeKind::Interrupted:
    return "interrupted by signal " + std::to_string(term_signal);
  }
  return "unknown";
}

std::size_t RunSummary::failure_count() const {
  std::size_t count = 0;
  for (const auto &outcome : outcomes) {
    if (outcome.failed()) {
      ++count;
    }
  }
  return count;
}

std::vector<InvocationOutcome> RunSummary::failures() const {
  std::vector<InvocationOutcome> failed;
  for (const auto &outcome : outcomes) {
    if (outcome.failed()) {
      failed.push_back(outcome);
    }
  }
  return failed;
}

int RunSummary::exit_code() const {
  if (interrupt_signal != 0) {
    return 128 + interrupt_signal;
  }
  return failure_count() == 0 ? kExitSuccess : kExitRepositoryFailed;
}

/**
 * Render the run report.
 *
 * The first line counts processed, succeeded and failed repositories; each
 * failure follows on its own line with the reason, then the number of
 * directories skipped during the walk.
 *
 * @param display_root Base directory for relative paths.
 * @return Multi-line report terminated by a newline.
 */
std::string RunSummary::format(const fs::path &display_root) const {
  std::ostringstream oss;
  const std::size_t failed = failure_count();
  oss << "grpr: processed " << outcomes.size()
      << (outcomes.size() == 1 ? " repository" : " repositories") << ", "
      << outcomes.size() - failed << " succeeded, " << failed << " failed\n";
  for (const auto &outcome : outcomes) {
    if (outcome.failed()) {
      oss << "  FAILED " << display_path(outcome.path, display_root) << ": "
          << outcome.describe() << "\n";
    }
  }
  if (!warnings.empty()) {
    oss << "grpr: skipped " << warnings.size()
        << (warnings.size() == 1 ? " unreadable directory"
                                 : " unreadable directories")
        << "\n";
  }
  if (interrupt_signal != 0) {
    oss << "grpr: interrupted by signal " << interrupt_signal << "\n";
  }
  return oss.str();
}

std::string display_path(const fs::path &path, const fs::path &root) {
  if (root.empty()) {
    return path.string();
  }
  fs::path rel = path.lexically_relative(root);
  if (rel.empty()) {
    return path.string();
  }
  auto first = rel.begin();
  if (first != rel.end() && *first == "..") {
    return path.string();
  }
  return rel.string();
}

CommandDispatcher::CommandDispatcher(DispatchOptions options, std::ostream &out,
                                     ProcessRunner runner)
    : options_(std::move(options)), out_(out), runner_(std::move(runner)) {
  if (!runner_) {
    runner_ = [](const std::vector<std::string> &argv, const fs::path &cwd) {
      return run_process(argv, cwd);
    };
  }
}

std::vector<std::string> CommandDispatcher::command_line() const {
  std::vector<std::string> argv;
  argv.reserve(options_.args.size() + 1);
  argv.push_back(options_.tool);
  argv.insert(argv.end(), options_.args.begin(), options_.args.end());
  return argv;
}

InvocationOutcome CommandDispatcher::invoke(const fs::path &repo) {
  InvocationOutcome outcome;
  outcome.path = repo;
  const auto argv = command_line();
  out_ << "Processing repository: " << display_path(repo, options_.display_root)
       << std::endl;
  if (options_.dry_run) {
    out_ << "  would run: " << join_command(argv) << std::endl;
    return outcome;
  }
  try {
    ProcessResult result = runner_(argv, repo);
    outcome.exit_code = result.exit_code;
    outcome.term_signal = result.term_signal;
    if (result.interrupted) {
      outcome.kind = OutcomeKind::Interrupted;
      if (outcome.term_signal == 0) {
        outcome.term_signal = pending_interrupt();
      }
    } else if (!result.success()) {
      outcome.kind = OutcomeKind::ChildFailure;
    }
  } catch (const SpawnError &e) {
    outcome.kind = OutcomeKind::SpawnError;
    outcome.exit_code = -1;
    outcome.error = e.what();
    dispatch_log()->error("Failed to run '{}' in '{}': {}", options_.tool,
                          repo.string(), e.what());
  } catch (const std::system_error &e) {
    outcome.kind = OutcomeKind::ChildFailure;
    outcome.exit_code = -1;
    outcome.error = e.what();
    dispatch_log()->error("Lost track of '{}' in '{}': {}", options_.tool,
                          repo.string(), e.what());
  }
  if (outcome.kind == OutcomeKind::ChildFailure) {
    dispatch_log()->debug("'{}' failed in '{}': {}", options_.tool,
                          repo.string(), outcome.describe());
  }
  return outcome;
}

/**
 * Append @p outcome to @p summary and notify the observer.
 *
 * @return `false` when the run must stop because of an interrupt.
 */
bool CommandDispatcher::record(RunSummary &summary, InvocationOutcome outcome) {
  const bool interrupted = outcome.kind == OutcomeKind::Interrupted;
  if (interrupted) {
    summary.interrupt_signal =
        pending_interrupt() != 0 ? pending_interrupt() : outcome.term_signal;
  }
  summary.outcomes.push_back(std::move(outcome));
  if (on_outcome_) {
    on_outcome_(summary.outcomes.back());
  }
  return !interrupted;
}

RunSummary CommandDispatcher::dispatch(RepositoryWalker &walker) {
  if (options_.display_root.empty()) {
    options_.display_root = walker.root();
  }
  RunSummary summary;
  while (pending_interrupt() == 0) {
    auto repo = walker.next();
    if (!repo) {
      break;
    }
    // The walk may have been interrupted while scanning for this repository.
    if (pending_interrupt() != 0) {
      dispatch_log()->debug("Interrupted before '{}'", repo->string());
      break;
    }
    if (!record(summary, invoke(*repo))) {
      break;
    }
  }
  if (summary.interrupt_signal == 0 && pending_interrupt() != 0) {
    summary.interrupt_signal = pending_interrupt();
  }
  summary.warnings = walker.warnings();
  dispatch_log()->debug("Dispatched '{}' to {} repositories ({} directories "
                        "visited)",
                        options_.tool, summary.outcomes.size(),
                        walker.visited());
  return summary;
}

RunSummary CommandDispatcher::dispatch(const std::vector<fs::path> &paths) {
  RunSummary summary;
  for (const auto &repo : paths) {
    if (pending_interrupt() != 0) {
      summary.interrupt_signal = pending_interrupt();
      break;
    }
    if (!record(summary, invoke(repo))) {
      break;
    }
  }
  return summary;
}

} // namespace grpr
