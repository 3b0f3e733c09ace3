#include "process.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

fs::path make_temp_dir(const std::string &tag) {
  auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  fs::path dir = fs::temp_directory_path() /
                 fs::path("grpr_proc_" + tag + "_" + std::to_string(stamp));
  fs::create_directories(dir);
  return dir;
}

struct DirCleanup {
  fs::path dir;
  ~DirCleanup() {
    std::error_code ec;
    fs::remove_all(dir, ec);
  }
};

} // namespace

TEST_CASE("exit status of the child is reported") {
  fs::path dir = make_temp_dir("status");
  DirCleanup cleanup{dir};

  auto ok = grpr::run_process({"sh", "-c", "exit 0"}, dir);
  REQUIRE(ok.success());
  REQUIRE(ok.exit_code == 0);
  REQUIRE(ok.term_signal == 0);
  REQUIRE_FALSE(ok.interrupted);

  auto failed = grpr::run_process({"sh", "-c", "exit 3"}, dir);
  REQUIRE_FALSE(failed.success());
  REQUIRE(failed.exit_code == 3);
}

TEST_CASE("child runs in the requested directory") {
  fs::path dir = make_temp_dir("cwd");
  DirCleanup cleanup{dir};

  auto result =
      grpr::run_process({"sh", "-c", "pwd > here.txt"}, dir);
  REQUIRE(result.success());
  std::ifstream in(dir / "here.txt");
  std::string line;
  std::getline(in, line);
  REQUIRE(fs::equivalent(fs::path(line), dir));
}

TEST_CASE("arguments reach the child verbatim") {
  fs::path dir = make_temp_dir("args");
  DirCleanup cleanup{dir};

  auto result = grpr::run_process(
      {"sh", "-c", "printf '%s|' \"$@\" > args.txt", "sh", "a b", "--flag",
       "", "*"},
      dir);
  REQUIRE(result.success());
  std::ifstream in(dir / "args.txt");
  std::string content;
  std::getline(in, content);
  REQUIRE(content == "a b|--flag||*|");
}

TEST_CASE("missing executable raises SpawnError") {
  fs::path dir = make_temp_dir("missing");
  DirCleanup cleanup{dir};

  try {
    grpr::run_process({"grpr-no-such-tool-xyz", "status"}, dir);
    FAIL("expected SpawnError");
  } catch (const grpr::SpawnError &e) {
    REQUIRE(e.code().value() == ENOENT);
    REQUIRE(std::string(e.what()).find("grpr-no-such-tool-xyz") !=
            std::string::npos);
  }
}

TEST_CASE("unusable working directory raises SpawnError") {
  fs::path dir = make_temp_dir("nocwd");
  DirCleanup cleanup{dir};

  try {
    grpr::run_process({"sh", "-c", "exit 0"}, dir / "gone");
    FAIL("expected SpawnError");
  } catch (const grpr::SpawnError &e) {
    REQUIRE(e.code().value() == ENOENT);
    REQUIRE(std::string(e.what()).find("cannot change directory") !=
            std::string::npos);
  }
}

TEST_CASE("empty command line is rejected") {
  REQUIRE_THROWS_AS(grpr::run_process({}, fs::temp_directory_path()),
                    grpr::SpawnError);
  REQUIRE_THROWS_AS(grpr::run_process({""}, fs::temp_directory_path()),
                    grpr::SpawnError);
}

TEST_CASE("child killed by a signal reports 128 plus the signal") {
  fs::path dir = make_temp_dir("killed");
  DirCleanup cleanup{dir};

  auto result = grpr::run_process({"sh", "-c", "kill -TERM $$"}, dir);
  REQUIRE_FALSE(result.success());
  REQUIRE(result.term_signal == SIGTERM);
  REQUIRE(result.exit_code == 128 + SIGTERM);
  REQUIRE_FALSE(result.interrupted);
}

TEST_CASE("interrupt received by the parent is forwarded to the child") {
  fs::path dir = make_temp_dir("interrupt");
  DirCleanup cleanup{dir};

  grpr::ProcessResult result;
  {
    grpr::InterruptScope scope;
    grpr::reset_interrupt();
    // The child signals its parent, which must pass the signal back down.
    result = grpr::run_process(
        {"sh", "-c", "kill -INT $PPID; exec sleep 5"}, dir);
    REQUIRE(grpr::pending_interrupt() == SIGINT);
  }
  grpr::reset_interrupt();
  REQUIRE(result.interrupted);
  REQUIRE(result.term_signal == SIGINT);
  REQUIRE(result.exit_code == 128 + SIGINT);
  REQUIRE(grpr::pending_interrupt() == 0);
}

TEST_CASE("exit status survives an ignored SIGCHLD") {
  fs::path dir = make_temp_dir("sigchld");
  DirCleanup cleanup{dir};

  auto previous = std::signal(SIGCHLD, SIG_IGN);
  grpr::ProcessResult first = grpr::run_process({"sh", "-c", "exit 5"}, dir);
  grpr::ProcessResult second = grpr::run_process({"sh", "-c", "exit 0"}, dir);
  auto during = std::signal(SIGCHLD, previous);

  REQUIRE(during == SIG_IGN);
  REQUIRE(first.exit_code == 5);
  REQUIRE(second.success());
}

TEST_CASE("only signals sent by a process are forwarded") {
  REQUIRE(grpr::interrupt_needs_forwarding(SI_USER));
  REQUIRE(grpr::interrupt_needs_forwarding(SI_QUEUE));
  REQUIRE(grpr::interrupt_needs_forwarding(SI_TKILL));
  // Terminal-generated SIGINT already reached the foreground process group.
  REQUIRE_FALSE(grpr::interrupt_needs_forwarding(SI_KERNEL));
}
