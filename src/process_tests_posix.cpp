#if defined(_WIN32)
#error POSIX-only
#endif

#include "process.h"

#include "test_support.h"
#include "util.h"

#include "doctest/doctest.h"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

static embedpy::process_result run_sh(std::string const &script,
                                      embedpy::process_env_t env = embedpy::process_getenv(),
                                      std::optional<fs::path> cwd = std::nullopt) {
  return embedpy::process_run({ "/bin/sh", "-c", script },
                              embedpy::process_run_cfg{ .cwd = std::move(cwd),
                                                        .env = std::move(env) });
}

TEST_CASE("process_run captures stdout and stderr separately") {
  auto const result{ run_sh("echo first; printf 'second\\n'; echo oops 1>&2; printf tail") };

  CHECK(result.exit_code == 0);
  CHECK_FALSE(result.signal.has_value());
  CHECK_FALSE(result.timed_out);
  REQUIRE(result.stdout_lines.size() == 3);
  CHECK(result.stdout_lines[0] == "first");
  CHECK(result.stdout_lines[1] == "second");
  CHECK(result.stdout_lines[2] == "tail");
  REQUIRE(result.stderr_lines.size() == 1);
  CHECK(result.stderr_lines[0] == "oops");
}

TEST_CASE("process_run surfaces non-zero exit codes") {
  auto const result{ run_sh("exit 7") };
  CHECK(result.exit_code == 7);
  CHECK_FALSE(result.signal.has_value());
}

TEST_CASE("process_run reports signals") {
  auto const result{ run_sh("kill -TERM $$") };
  REQUIRE(result.signal.has_value());
  CHECK(*result.signal == SIGTERM);
  CHECK(result.exit_code == 128 + SIGTERM);
}

TEST_CASE("process_run passes the explicit environment only") {
  embedpy::process_env_t env{ { "EMBEDPY_PROCESS_TEST", "ok" } };
  auto const result{ run_sh("printf '%s|%s\\n' \"$EMBEDPY_PROCESS_TEST\" \"${HOME-unset}\"",
                            env) };
  REQUIRE(result.stdout_lines.size() == 1);
  CHECK(result.stdout_lines[0] == "ok|unset");
}

TEST_CASE("process_run environment override does not touch the parent") {
  char const *before{ std::getenv("PATH") };
  std::string const parent_path{ before ? before : "" };

  auto const env{ embedpy::process_env_with(embedpy::process_getenv(), "PATH", "/nowhere") };
  auto const result{ run_sh("printf '%s\\n' \"$PATH\"", env) };
  REQUIRE(result.stdout_lines.size() == 1);
  CHECK(result.stdout_lines[0] == "/nowhere");

  char const *after{ std::getenv("PATH") };
  CHECK(std::string{ after ? after : "" } == parent_path);
}

TEST_CASE("process_run honors cwd") {
  auto const dir{ embedpy::test::make_temp_dir("embedpy-process-test") };
  embedpy::scoped_path_cleanup cleanup{ dir };

  auto const result{ run_sh("pwd -P", embedpy::process_getenv(), dir) };
  REQUIRE(result.stdout_lines.size() == 1);
  CHECK(fs::equivalent(result.stdout_lines[0], dir));
}

TEST_CASE("process_run stdin is the null device") {
  auto const result{ run_sh("cat; echo done") };
  REQUIRE(result.stdout_lines.size() == 1);
  CHECK(result.stdout_lines[0] == "done");
}

TEST_CASE("process_run kills the child on timeout") {
  auto const start{ std::chrono::steady_clock::now() };
  auto const result{ embedpy::process_run(
      { "/bin/sh", "-c", "echo started; exec sleep 30" },
      embedpy::process_run_cfg{ .env = embedpy::process_getenv(),
                                .timeout = std::chrono::seconds{ 1 } }) };
  auto const elapsed{ std::chrono::steady_clock::now() - start };

  CHECK(result.timed_out);
  CHECK(result.exit_code != 0);
  CHECK(elapsed < std::chrono::seconds{ 20 });
  REQUIRE(result.stdout_lines.size() == 1);
  CHECK(result.stdout_lines[0] == "started");
}

TEST_CASE("process_run timeout does not wait for background descendants") {
  auto const start{ std::chrono::steady_clock::now() };
  auto const result{ embedpy::process_run(
      { "/bin/sh", "-c", "sleep 30 & echo spawned; wait" },
      embedpy::process_run_cfg{ .env = embedpy::process_getenv(),
                                .timeout = std::chrono::seconds{ 1 } }) };

  CHECK(result.timed_out);
  CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds{ 20 });
  REQUIRE(result.stdout_lines.size() == 1);
  CHECK(result.stdout_lines[0] == "spawned");
}

TEST_CASE("process_run throws when the program does not exist") {
  CHECK_THROWS_AS(embedpy::process_run({ "/nonexistent/embedpy-program" },
                                       embedpy::process_run_cfg{}),
                  std::system_error);
}

TEST_CASE("process_run rejects empty argv") {
  CHECK_THROWS_AS(embedpy::process_run({}, embedpy::process_run_cfg{}),
                  std::invalid_argument);
}

TEST_CASE("process_find_executable searches in order") {
  auto const root{ embedpy::test::make_temp_dir("embedpy-process-test") };
  embedpy::scoped_path_cleanup cleanup{ root };
  fs::create_directories(root / "a");
  fs::create_directories(root / "b");
  fs::create_directories(root / "c");

  embedpy::util_write_file(root / "a" / "tool", "not executable");
  embedpy::util_write_file(root / "b" / "tool", "#!/bin/sh\n");
  embedpy::util_write_file(root / "c" / "tool", "#!/bin/sh\n");
  fs::permissions(root / "b" / "tool", fs::perms::owner_all);
  fs::permissions(root / "c" / "tool", fs::perms::owner_all);

  std::string const search{ (root / "missing").string() + ":" + (root / "a").string() +
                            ":" + (root / "b").string() + ":" + (root / "c").string() };

  auto const found{ embedpy::process_find_executable("tool", search) };
  REQUIRE(found.has_value());
  CHECK(*found == root / "b" / "tool");

  CHECK_FALSE(embedpy::process_find_executable("absent", search).has_value());
  CHECK_FALSE(embedpy::process_find_executable("tool", "").has_value());
}

TEST_CASE("process_find_executable checks paths with a directory as-is") {
  auto const found{ embedpy::process_find_executable("/bin/sh", "") };
  REQUIRE(found.has_value());
  CHECK(*found == fs::path{ "/bin/sh" });
}
