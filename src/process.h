#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace embedpy {

using process_env_t = std::unordered_map<std::string, std::string>;

struct process_result {
  int exit_code{ 0 };
  std::optional<int> signal;  // POSIX only
  bool timed_out{ false };
  std::vector<std::string> stdout_lines;
  std::vector<std::string> stderr_lines;
};

struct process_run_cfg {
  std::optional<std::filesystem::path> cwd;
  process_env_t env;                  // complete child environment, not a delta
  std::chrono::seconds timeout{ 0 };  // 0 = wait indefinitely
};

// Snapshot of the current process environment.
process_env_t process_getenv();

// Value of `key` in `env`. Keys compare case-insensitively on Windows.
std::optional<std::string> process_env_lookup(process_env_t const &env, std::string_view key);

// Copy of `env` with `key` set to `value`. Keys compare case-insensitively on Windows.
process_env_t process_env_with(process_env_t env, std::string_view key, std::string value);

// Resolve a bare program name against a PATH-style list. Names containing a
// directory component are checked as-is.
std::optional<std::filesystem::path> process_find_executable(std::string_view name,
                                                             std::string_view search_path);

// Captured output as lines: '\n' separated, trailing '\r' dropped, a final
// unterminated line kept.
std::vector<std::string> process_split_lines(std::string_view output);

// Run argv[0] (a path, no search) with stdin on the null device and both output
// streams captured. On timeout the child and its descendants are killed and
// `timed_out` is set. Throws std::system_error if the child cannot be spawned.
process_result process_run(std::vector<std::string> const &argv,
                           process_run_cfg const &cfg);

}  // namespace embedpy
