#include "app.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

class Args {
public:
  Args(std::initializer_list<std::string> args) : storage_(args) {
    storage_.insert(storage_.begin(), "grpr");
    for (auto &arg : storage_) {
      argv_.push_back(arg.data());
    }
    argv_.push_back(nullptr);
  }

  int argc() const { return static_cast<int>(storage_.size()); }
  char **argv() { return argv_.data(); }

private:
  std::vector<std::string> storage_;
  std::vector<char *> argv_;
};

struct Workspace {
  fs::path root;

  Workspace() {
    static int counter = 0;
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    root = fs::temp_directory_path() /
           fs::path("grpr_app_" + std::to_string(stamp) + "_" +
                    std::to_string(++counter));
    fs::create_directories(root);
  }

  ~Workspace() {
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  void repo(const std::string &rel) const {
    fs::create_directories(root / rel / ".git");
  }

  void file(const std::string &rel, const std::string &content) const {
    fs::create_directories((root / rel).parent_path());
    std::ofstream(root / rel) << content;
  }
};

} // namespace

TEST_CASE("every repository succeeding exits with zero") {
  Workspace ws;
  ws.repo("alpha");
  ws.repo("group/beta");
  ws.repo("group/beta/nested");

  std::ostringstream out;
  grpr::App app(out);
  Args args{"--grpr-root", ws.root.string(), "--grpr-tool", "sh", "-c",
            "exit 0"};
  REQUIRE(app.run(args.argc(), args.argv()) == 0);

  const std::string text = out.str();
  REQUIRE(text.find("Processing repository: alpha") != std::string::npos);
  REQUIRE(text.find("Processing repository: " +
                    (fs::path("group") / "beta").string()) !=
          std::string::npos);
  REQUIRE(text.find("nested") == std::string::npos);
  REQUIRE(text.find("processed 2 repositories, 2 succeeded, 0 failed") !=
          std::string::npos);
  REQUIRE(app.summary().outcomes.size() == 2);
}

TEST_CASE("a failing repository makes the run exit with one") {
  Workspace ws;
  ws.repo("a");
  ws.repo("b");
  ws.repo("c");
  ws.file("b/fail", "x");

  std::ostringstream out;
  grpr::App app(out);
  Args args{"--grpr-root", ws.root.string(), "--grpr-tool", "sh", "-c",
            "test ! -e fail"};
  REQUIRE(app.run(args.argc(), args.argv()) == 1);
  REQUIRE(app.summary().outcomes.size() == 3);
  REQUIRE(out.str().find("FAILED b: exited with status 1") !=
          std::string::npos);
}

TEST_CASE("an empty tree exits with zero") {
  Workspace ws;
  ws.file("notes/readme.txt", "no repositories here");
  std::ostringstream out;
  grpr::App app(out);
  Args args{"--grpr-root", ws.root.string(), "--grpr-tool", "sh", "-c",
            "exit 9"};
  REQUIRE(app.run(args.argc(), args.argv()) == 0);
  REQUIRE(out.str().find("processed 0 repositories") != std::string::npos);
}

TEST_CASE("a missing tool fails every repository but visits all") {
  Workspace ws;
  ws.repo("one");
  ws.repo("two");
  std::ostringstream out;
  grpr::App app(out);
  Args args{"--grpr-root", ws.root.string(), "--grpr-tool",
            "grpr-no-such-tool"};
  REQUIRE(app.run(args.argc(), args.argv()) == 1);
  REQUIRE(app.summary().outcomes.size() == 2);
  REQUIRE(app.summary().failure_count() == 2);
}

TEST_CASE("dry run reports commands and exits with zero") {
  Workspace ws;
  ws.repo("r");
  std::ostringstream out;
  grpr::App app(out);
  Args args{"--grpr-dry-run", "--grpr-root", ws.root.string(), "--grpr-tool",
            "grpr-no-such-tool", "push", "--force"};
  REQUIRE(app.run(args.argc(), args.argv()) == 0);
  REQUIRE(out.str().find("would run: grpr-no-such-tool push --force") !=
          std::string::npos);
}

TEST_CASE("tool arguments default to status") {
  Workspace ws;
  std::ostringstream out;
  grpr::App app(out);
  Args args{"--grpr-root", ws.root.string()};
  REQUIRE(app.run(args.argc(), args.argv()) == 0);
  REQUIRE(app.options().tool == "git");
  REQUIRE(app.options().tool_args == std::vector<std::string>{"status"});
}

TEST_CASE("invalid roots are usage errors") {
  Workspace ws;
  ws.file("plain.txt", "x");
  std::ostringstream out;
  grpr::App app(out);

  Args missing{"--grpr-root", (ws.root / "missing").string()};
  REQUIRE(app.run(missing.argc(), missing.argv()) == 2);

  Args file{"--grpr-root", (ws.root / "plain.txt").string()};
  REQUIRE(app.run(file.argc(), file.argv()) == 2);
  REQUIRE(app.summary().outcomes.empty());
}

TEST_CASE("configuration supplies tool, arguments and markers") {
  Workspace ws;
  ws.repo("git-repo");
  fs::create_directories(ws.root / "hg-repo" / ".hg");
  ws.file("conf/grpr.json", R"({
    "dispatch": {"tool": "sh", "default_args": ["-c", "exit 4"]},
    "discovery": {"markers": [".hg"]}
  })");

  std::ostringstream out;
  grpr::App app(out);
  Args args{"--grpr-config", (ws.root / "conf" / "grpr.json").string(),
            "--grpr-root", ws.root.string()};
  REQUIRE(app.run(args.argc(), args.argv()) == 1);
  REQUIRE(app.summary().outcomes.size() == 1);
  REQUIRE(app.summary().outcomes[0].path == ws.root / "hg-repo");
  REQUIRE(app.summary().outcomes[0].exit_code == 4);
  REQUIRE(out.str().find("FAILED hg-repo: exited with status 4") !=
          std::string::npos);
}

TEST_CASE("command line values win over configuration") {
  Workspace ws;
  ws.repo("x");
  ws.file("grpr.yaml", "tool: grpr-no-such-tool\n"
                       "default_args: [\"-c\", \"exit 3\"]\n");

  std::ostringstream out;
  grpr::App app(out);
  Args args{"--grpr-config", (ws.root / "grpr.yaml").string(), "--grpr-root",
            ws.root.string(), "--grpr-tool", "sh", "-c", "exit 0"};
  REQUIRE(app.run(args.argc(), args.argv()) == 0);
  REQUIRE(app.options().tool == "sh");
  REQUIRE(app.options().tool_args ==
          std::vector<std::string>{"-c", "exit 0"});
}

TEST_CASE("unusable configuration is a usage error") {
  Workspace ws;
  ws.file("bad.json", "{ not json");
  std::ostringstream out;
  grpr::App app(out);
  Args broken{"--grpr-config", (ws.root / "bad.json").string(), "--grpr-root",
              ws.root.string()};
  REQUIRE(app.run(broken.argc(), broken.argv()) == 2);

  Args missing{"--grpr-config", (ws.root / "absent.yaml").string()};
  REQUIRE(app.run(missing.argc(), missing.argv()) == 2);
}

TEST_CASE("help and malformed options return parser exit codes") {
  std::ostringstream out;
  grpr::App app(out);
  Args help{"--help"};
  REQUIRE(app.run(help.argc(), help.argv()) == 0);
  Args bad{"--grpr-log-rotate=-2"};
  REQUIRE(app.run(bad.argc(), bad.argv()) == 2);
}
