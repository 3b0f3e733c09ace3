#include "process.hpp"
#include "log.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace grpr {

namespace {

std::shared_ptr<spdlog::logger> process_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("process");
  }();
  return logger;
}

volatile std::sig_atomic_t g_interrupt = 0;
volatile std::sig_atomic_t g_forward = 0;

extern "C" void record_interrupt(int sig, siginfo_t *info, void *) {
  g_interrupt = sig;
  g_forward = info == nullptr || interrupt_needs_forwarding(info->si_code);
}

/**
 * Restores default SIGCHLD handling while a child runs.
 *
 * With SIGCHLD ignored (or SA_NOCLDWAIT set) the kernel reaps children on its
 * own and waitpid() fails with ECHILD, losing the exit status.
 */
class ChildStatusGuard {
public:
  ChildStatusGuard() {
    if (::sigaction(SIGCHLD, nullptr, &previous_) != 0) {
      return;
    }
    const bool ignored = (previous_.sa_flags & SA_SIGINFO) == 0 &&
                         previous_.sa_handler == SIG_IGN;
    if (!ignored && (previous_.sa_flags & SA_NOCLDWAIT) == 0) {
      return;
    }
    struct sigaction action {};
    action.sa_handler = SIG_DFL;
    sigemptyset(&action.sa_mask);
    if (::sigaction(SIGCHLD, &action, nullptr) == 0) {
      restore_ = true;
      process_log()->debug("SIGCHLD was ignored; using default handling");
    }
  }

  ~ChildStatusGuard() {
    if (restore_) {
      ::sigaction(SIGCHLD, &previous_, nullptr);
    }
  }

  ChildStatusGuard(const ChildStatusGuard &) = delete;
  ChildStatusGuard &operator=(const ChildStatusGuard &) = delete;

private:
  struct sigaction previous_ {};
  bool restore_{false};
};

/// Failure reported by the child through the status pipe before exec.
struct ChildFailure {
  int stage; ///< 1 = chdir, 2 = exec
  int error;
};

constexpr int kStageChdir = 1;
constexpr int kStageExec = 2;

[[noreturn]] void report_child_failure(int fd, int stage) {
  ChildFailure failure{stage, errno};
  ssize_t ignored = ::write(fd, &failure, sizeof(failure));
  (void)ignored;
  ::_exit(127);
}

/**
 * Wait for @p pid, forwarding a recorded interrupt exactly once.
 *
 * @param pid Child process id.
 * @param forwarded Set to `true` once an interrupt was sent to the child.
 * @return Raw wait status.
 */
int wait_for_child(pid_t pid, bool &forwarded) {
  int status = 0;
  for (;;) {
    int sig = g_interrupt;
    if (sig != 0 && !forwarded) {
      if (g_forward != 0) {
        process_log()->debug("Forwarding signal {} to child {}", sig, pid);
        if (::kill(pid, sig) != 0 && errno != ESRCH) {
          process_log()->warn("Cannot forward signal {} to child {}: {}", sig,
                              pid, std::strerror(errno));
        }
      } else {
        // Terminal signals already reached the child's process group.
        process_log()->debug("Child {} received signal {} from the terminal",
                             pid, sig);
      }
      forwarded = true;
    }
    pid_t r = ::waitpid(pid, &status, 0);
    if (r == pid) {
      return status;
    }
    if (r < 0 && errno == EINTR) {
      continue;
    }
    throw std::system_error(errno, std::system_category(),
                            "waitpid failed for child " + std::to_string(pid));
  }
}

} // namespace

bool interrupt_needs_forwarding(int si_code) {
  // kill(), sigqueue() and tgkill() report si_code <= 0; the terminal driver
  // reports SI_KERNEL.
  return si_code <= 0;
}

InterruptScope::InterruptScope() {
  struct sigaction action {};
  action.sa_sigaction = record_interrupt;
  sigemptyset(&action.sa_mask);
  // No SA_RESTART: waitpid must return EINTR so the signal can be forwarded.
  action.sa_flags = SA_SIGINFO;
  ::sigaction(SIGINT, &action, &previous_int_);
  ::sigaction(SIGTERM, &action, &previous_term_);
}

InterruptScope::~InterruptScope() {
  ::sigaction(SIGINT, &previous_int_, nullptr);
  ::sigaction(SIGTERM, &previous_term_, nullptr);
}

int pending_interrupt() { return g_interrupt; }

void reset_interrupt() {
  g_interrupt = 0;
  g_forward = 0;
}

ProcessResult run_process(const std::vector<std::string> &argv,
                          const std::filesystem::path &cwd) {
  if (argv.empty() || argv.front().empty()) {
    throw SpawnError("no program to execute",
                     std::make_error_code(std::errc::invalid_argument));
  }
  std::vector<char *> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto &arg : argv) {
    cargv.push_back(const_cast<char *>(arg.c_str()));
  }
  cargv.push_back(nullptr);
  const std::string dir = cwd.string();
  ChildStatusGuard child_status;

  int status_pipe[2];
  if (::pipe(status_pipe) != 0) {
    std::error_code ec(errno, std::system_category());
    throw SpawnError("cannot create status pipe: " + ec.message(), ec);
  }
  if (::fcntl(status_pipe[0], F_SETFD, FD_CLOEXEC) != 0 ||
      ::fcntl(status_pipe[1], F_SETFD, FD_CLOEXEC) != 0) {
    std::error_code ec(errno, std::system_category());
    ::close(status_pipe[0]);
    ::close(status_pipe[1]);
    throw SpawnError("cannot configure status pipe: " + ec.message(), ec);
  }

  process_log()->debug("Spawning '{}' with {} argument(s) in '{}'", argv[0],
                       argv.size() - 1, dir);
  pid_t pid = ::fork();
  if (pid < 0) {
    std::error_code ec(errno, std::system_category());
    ::close(status_pipe[0]);
    ::close(status_pipe[1]);
    throw SpawnError("cannot fork: " + ec.message(), ec);
  }
  if (pid == 0) {
    ::close(status_pipe[0]);
    ::signal(SIGINT, SIG_DFL);
    ::signal(SIGTERM, SIG_DFL);
    if (::chdir(dir.c_str()) != 0) {
      report_child_failure(status_pipe[1], kStageChdir);
    }
    ::execvp(cargv[0], cargv.data());
    report_child_failure(status_pipe[1], kStageExec);
  }

  ::close(status_pipe[1]);
  ChildFailure failure{0, 0};
  ssize_t n = 0;
  do {
    n = ::read(status_pipe[0], &failure, sizeof(failure));
  } while (n < 0 && errno == EINTR);
  ::close(status_pipe[0]);

  bool forwarded = false;
  int raw_status = wait_for_child(pid, forwarded);

  if (n == static_cast<ssize_t>(sizeof(failure))) {
    std::error_code ec(failure.error, std::system_category());
    if (failure.stage == kStageChdir) {
      throw SpawnError("cannot change directory to '" + dir +
                           "': " + ec.message(),
                       ec);
    }
    throw SpawnError("cannot execute '" + argv[0] + "': " + ec.message(), ec);
  }

  ProcessResult result;
  result.interrupted = forwarded;
  if (WIFEXITED(raw_status)) {
    result.exit_code = WEXITSTATUS(raw_status);
  } else if (WIFSIGNALED(raw_status)) {
    result.term_signal = WTERMSIG(raw_status);
    result.exit_code = 128 + result.term_signal;
  }
  process_log()->debug("Child {} finished (exit={}, signal={})", pid,
                       result.exit_code, result.term_signal);
  return result;
}

} // namespace grpr
