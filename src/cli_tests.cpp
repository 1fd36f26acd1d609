#include "cli.h"

#include "doctest/doctest.h"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <variant>
#include <vector>

namespace {

// Helper to convert vector of strings to argc/argv
std::vector<char *> make_argv(std::vector<std::string> &args) {
  std::vector<char *> argv;
  for (auto &arg : args) { argv.push_back(arg.data()); }
  argv.push_back(nullptr);
  return argv;
}

embedpy::cli_args parse(std::vector<std::string> args) {
  auto argv{ make_argv(args) };
  return embedpy::cli_parse(static_cast<int>(args.size()), argv.data());
}

embedpy::provision_cfg const &provision_of(embedpy::cli_args const &parsed) {
  REQUIRE(parsed.cmd_cfg.has_value());
  REQUIRE(std::holds_alternative<embedpy::cmd_provision::cfg>(*parsed.cmd_cfg));
  return std::get<embedpy::cmd_provision::cfg>(*parsed.cmd_cfg).provision;
}

}  // anonymous namespace

TEST_CASE("cli_parse: no arguments provisions ./pydist with defaults") {
  auto const parsed{ parse({ "embedpy" }) };
  auto const &cfg{ provision_of(parsed) };

  CHECK(cfg.target == std::filesystem::path{ "pydist" });
  CHECK_FALSE(cfg.version.has_value());
  CHECK_FALSE(cfg.requirements.has_value());
  CHECK(cfg.host_python == "python");
  CHECK(cfg.mirror == "https://www.python.org/ftp/python");
  CHECK(cfg.get_pip_url == "https://bootstrap.pypa.io/get-pip.py");
  CHECK(cfg.download_timeout == std::chrono::seconds{ 0 });
  CHECK(cfg.tool_timeout == std::chrono::seconds{ 0 });
  CHECK(parsed.cli_output.empty());
  REQUIRE(parsed.verbosity.has_value());
  CHECK(*parsed.verbosity == embedpy::tui::level::TUI_INFO);
  CHECK_FALSE(parsed.decorated_logging);
}

TEST_CASE("cli_parse: cmd_version") {
  SUBCASE("-v flag") {
    auto const parsed{ parse({ "embedpy", "-v" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(std::holds_alternative<embedpy::cmd_version::cfg>(*parsed.cmd_cfg));
  }

  SUBCASE("--version flag") {
    auto const parsed{ parse({ "embedpy", "--version" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(std::holds_alternative<embedpy::cmd_version::cfg>(*parsed.cmd_cfg));
  }
}

TEST_CASE("cli_parse: positional output directory and version") {
  auto const parsed{ parse({ "embedpy", "out/dist", "-p", "3.9.7" }) };
  auto const &cfg{ provision_of(parsed) };

  CHECK(cfg.target == std::filesystem::path{ "out/dist" });
  REQUIRE(cfg.version.has_value());
  CHECK(*cfg.version == "3.9.7");
}

TEST_CASE("cli_parse: long options") {
  auto const parsed{ parse({ "embedpy",
                             "dist",
                             "--py-version",
                             "3.10.4",
                             "--requirements",
                             "reqs.txt",
                             "--python",
                             "/opt/py/bin/python3",
                             "--mirror",
                             "https://mirror.example/python",
                             "--get-pip-url",
                             "https://mirror.example/get-pip.py",
                             "--download-timeout",
                             "30",
                             "--tool-timeout",
                             "600" }) };
  auto const &cfg{ provision_of(parsed) };

  CHECK(*cfg.version == "3.10.4");
  REQUIRE(cfg.requirements.has_value());
  CHECK(*cfg.requirements == std::filesystem::path{ "reqs.txt" });
  CHECK(cfg.host_python == "/opt/py/bin/python3");
  CHECK(cfg.mirror == "https://mirror.example/python");
  CHECK(cfg.get_pip_url == "https://mirror.example/get-pip.py");
  CHECK(cfg.download_timeout == std::chrono::seconds{ 30 });
  CHECK(cfg.tool_timeout == std::chrono::seconds{ 600 });
}

TEST_CASE("cli_parse: short requirements option") {
  auto const parsed{ parse({ "embedpy", "-r", "requirements.txt" }) };
  auto const &cfg{ provision_of(parsed) };

  REQUIRE(cfg.requirements.has_value());
  CHECK(*cfg.requirements == std::filesystem::path{ "requirements.txt" });
  CHECK(cfg.target == std::filesystem::path{ "pydist" });
}

TEST_CASE("cli_parse: --verbose enables decorated debug logging") {
  auto const parsed{ parse({ "embedpy", "--verbose", "-p", "3.9.7" }) };

  REQUIRE(parsed.verbosity.has_value());
  CHECK(*parsed.verbosity == embedpy::tui::level::TUI_DEBUG);
  CHECK(parsed.decorated_logging);
  CHECK(parsed.cmd_cfg.has_value());
}

TEST_CASE("cli_parse: negative timeout is rejected") {
  auto const parsed{ parse({ "embedpy", "--tool-timeout", "-5" }) };

  CHECK_FALSE(parsed.cmd_cfg.has_value());
  CHECK_FALSE(parsed.cli_output.empty());
}

TEST_CASE("cli_parse: unknown option is rejected") {
  auto const parsed{ parse({ "embedpy", "--bogus" }) };

  CHECK_FALSE(parsed.cmd_cfg.has_value());
  CHECK_FALSE(parsed.cli_output.empty());
}

TEST_CASE("cli_parse: --help returns help text without a command") {
  auto const parsed{ parse({ "embedpy", "--help" }) };

  CHECK_FALSE(parsed.cmd_cfg.has_value());
  CHECK(parsed.cli_output.find("--py-version") != std::string::npos);
}

#ifndef _WIN32
TEST_CASE("cli_parse: endpoint options fall back to environment variables") {
  ::setenv("EMBEDPY_PYTHON_MIRROR", "https://env.example/python", 1);
  ::setenv("EMBEDPY_GET_PIP_URL", "https://env.example/get-pip.py", 1);
  ::setenv("EMBEDPY_HOST_PYTHON", "python3", 1);

  auto const parsed{ parse({ "embedpy", "--mirror", "https://cli.example/python" }) };

  ::unsetenv("EMBEDPY_PYTHON_MIRROR");
  ::unsetenv("EMBEDPY_GET_PIP_URL");
  ::unsetenv("EMBEDPY_HOST_PYTHON");

  auto const &cfg{ provision_of(parsed) };
  CHECK(cfg.mirror == "https://cli.example/python");  // command line wins
  CHECK(cfg.get_pip_url == "https://env.example/get-pip.py");
  CHECK(cfg.host_python == "python3");
}
#endif
