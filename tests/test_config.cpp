#include "config.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

/// Writes a config file into a private directory removed on destruction.
struct ConfigFile {
  fs::path dir;
  fs::path path;

  ConfigFile(const std::string &name, const std::string &content) {
    static int counter = 0;
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    dir = fs::temp_directory_path() /
          fs::path("grpr_cfg_" + std::to_string(stamp) + "_" +
                   std::to_string(++counter));
    fs::create_directories(dir);
    path = dir / name;
    std::ofstream f(path);
    f << content;
  }

  ~ConfigFile() {
    std::error_code ec;
    fs::remove_all(dir, ec);
  }
};

} // namespace

TEST_CASE("defaults match the plain git invocation") {
  grpr::Config cfg;
  REQUIRE(cfg.tool() == "git");
  REQUIRE(cfg.default_args() == std::vector<std::string>{"status"});
  REQUIRE(cfg.markers() == std::vector<std::string>{".git"});
  REQUIRE_FALSE(cfg.accept_marker_files());
  REQUIRE_FALSE(cfg.dry_run());
  REQUIRE_FALSE(cfg.verbose());
  REQUIRE(cfg.log_level() == "info");
  REQUIRE(cfg.log_file().empty());
  REQUIRE(cfg.log_rotate() == 3);
  REQUIRE(cfg.log_categories().empty());
}

TEST_CASE("config from yaml") {
  ConfigFile file("grpr.yaml", "verbose: true\n"
                               "tool: hg\n"
                               "default_args: [pull, \"-u\"]\n"
                               "markers:\n"
                               "  - .hg\n"
                               "  - .git\n"
                               "accept_marker_files: true\n"
                               "log_level: debug\n"
                               "log_rotate: 0\n");
  auto cfg = grpr::Config::from_file(file.path.string());
  REQUIRE(cfg.verbose());
  REQUIRE(cfg.tool() == "hg");
  REQUIRE(cfg.default_args() == std::vector<std::string>{"pull", "-u"});
  REQUIRE(cfg.markers() == std::vector<std::string>{".hg", ".git"});
  REQUIRE(cfg.accept_marker_files());
  REQUIRE(cfg.log_level() == "debug");
  REQUIRE(cfg.log_rotate() == 0);
}

TEST_CASE("yaml scalars keep their quoted form") {
  ConfigFile file("grpr.yml", "default_args: [log, \"-5\", \"007\", -3]\n");
  auto cfg = grpr::Config::from_file(file.path.string());
  REQUIRE(cfg.default_args() ==
          std::vector<std::string>{"log", "-5", "007", "-3"});
}

TEST_CASE("yaml tool arguments are forwarded as written") {
  ConfigFile file("grpr.yaml", "default_args: [log, -n, 010, +5, True, 1e3]\n"
                               "verbose: True\n"
                               "dispatch:\n"
                               "  markers: [007, .git]\n");
  auto cfg = grpr::Config::from_file(file.path.string());
  REQUIRE(cfg.default_args() ==
          std::vector<std::string>{"log", "-n", "010", "+5", "True", "1e3"});
  REQUIRE(cfg.markers() == std::vector<std::string>{"007", ".git"});
  REQUIRE(cfg.verbose());
}

TEST_CASE("config from json with sections") {
  ConfigFile file("grpr.json", R"({
    "core": {"dry_run": true},
    "discovery": {"markers": ".svn"},
    "dispatch": {"tool": "svn", "default_args": ["update"]},
    "logging": {
      "log_file": "grpr.log",
      "log_categories": {"process": "trace", "dispatch": "warn"}
    }
  })");
  auto cfg = grpr::Config::from_file(file.path.string());
  REQUIRE(cfg.dry_run());
  REQUIRE(cfg.markers() == std::vector<std::string>{".svn"});
  REQUIRE(cfg.tool() == "svn");
  REQUIRE(cfg.default_args() == std::vector<std::string>{"update"});
  REQUIRE(cfg.log_file() == "grpr.log");
  REQUIRE(cfg.log_categories().at("process") == "trace");
  REQUIRE(cfg.log_categories().at("dispatch") == "warn");
}

TEST_CASE("config from toml") {
  ConfigFile file("grpr.toml", "[dispatch]\n"
                               "tool = \"git\"\n"
                               "default_args = [\"fetch\", \"--all\"]\n"
                               "\n"
                               "[logging]\n"
                               "log_level = \"warn\"\n"
                               "log_rotate = 7\n"
                               "\n"
                               "[logging.log_categories]\n"
                               "\"repo.discovery\" = \"debug\"\n");
  auto cfg = grpr::Config::from_file(file.path.string());
  REQUIRE(cfg.default_args() ==
          std::vector<std::string>{"fetch", "--all"});
  REQUIRE(cfg.log_level() == "warn");
  REQUIRE(cfg.log_rotate() == 7);
  REQUIRE(cfg.log_categories().at("repo.discovery") == "debug");
}

TEST_CASE("section values override top-level values") {
  auto cfg = grpr::Config::from_json(
      {{"tool", "git"}, {"dispatch", {{"tool", "hg"}}}});
  REQUIRE(cfg.tool() == "hg");
}

TEST_CASE("negative rotation counts are clamped") {
  auto cfg = grpr::Config::from_json({{"log_rotate", -4}});
  REQUIRE(cfg.log_rotate() == 0);
}

TEST_CASE("invalid configuration is rejected") {
  REQUIRE_THROWS_AS(grpr::Config::from_json({{"tool", ""}}),
                    std::runtime_error);
  REQUIRE_THROWS_AS(grpr::Config::from_json(
                        {{"markers", nlohmann::json::array({""})}}),
                    std::runtime_error);
  REQUIRE_THROWS_AS(grpr::Config::from_json({{"log_categories", "debug"}}),
                    std::runtime_error);
  REQUIRE_THROWS_AS(grpr::Config::from_json(nlohmann::json::array({1, 2})),
                    std::runtime_error);
  REQUIRE_THROWS(grpr::Config::from_json(
      {{"default_args", nlohmann::json::array({nlohmann::json::object()})}}));
  REQUIRE_THROWS(grpr::Config::from_json({{"verbose", "very"}}));
}

TEST_CASE("unsupported or unreadable files are rejected") {
  ConfigFile ini("grpr.ini", "tool=git\n");
  REQUIRE_THROWS_AS(grpr::Config::from_file(ini.path.string()),
                    std::runtime_error);

  ConfigFile no_ext("grprrc", "tool: git\n");
  REQUIRE_THROWS_AS(grpr::Config::from_file(no_ext.path.string()),
                    std::runtime_error);

  REQUIRE_THROWS(grpr::Config::from_file(
      (fs::temp_directory_path() / "grpr-missing-config.json").string()));

  ConfigFile broken("broken.json", "{ \"tool\": ");
  REQUIRE_THROWS(grpr::Config::from_file(broken.path.string()));
}
