#include "process.h"

#include "platform.h"
#include "util.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>

namespace embedpy {

namespace {

bool env_key_equal(std::string_view a, std::string_view b) {
#ifdef _WIN32
  return std::ranges::equal(a, b, [](char x, char y) {
    return std::tolower(static_cast<unsigned char>(x)) ==
           std::tolower(static_cast<unsigned char>(y));
  });
#else
  return a == b;
#endif
}

}  // namespace

std::optional<std::string> process_env_lookup(process_env_t const &env,
                                              std::string_view key) {
  auto const it{ std::ranges::find_if(
      env,
      [key](auto const &entry) { return env_key_equal(entry.first, key); }) };
  if (it == env.end()) { return std::nullopt; }
  return it->second;
}

process_env_t process_env_with(process_env_t env, std::string_view key, std::string value) {
  std::erase_if(env, [key](auto const &entry) { return env_key_equal(entry.first, key); });
  env[std::string{ key }] = std::move(value);
  return env;
}

std::optional<std::filesystem::path> process_find_executable(std::string_view name,
                                                             std::string_view search_path) {
  if (name.empty()) { return std::nullopt; }

  std::filesystem::path const as_path{ name };
  std::vector<std::filesystem::path> candidates;
  if (as_path.has_parent_path()) {
    candidates.push_back(as_path);
  } else {
    for (auto const &dir : util_split_path_list(search_path, platform::kPathListSeparator)) {
      candidates.push_back(std::filesystem::path{ dir } / as_path);
    }
  }

  for (auto const &candidate : candidates) {
    if (platform::is_executable(candidate)) { return candidate; }
#ifdef _WIN32
    if (!candidate.has_extension()) {
      auto with_ext{ candidate };
      with_ext += ".exe";
      if (platform::is_executable(with_ext)) { return with_ext; }
    }
#endif
  }

  return std::nullopt;
}

std::vector<std::string> process_split_lines(std::string_view output) {
  std::vector<std::string> lines;
  while (!output.empty()) {
    auto const eol{ output.find('\n') };
    auto line{ output.substr(0, eol) };
    if (line.ends_with('\r')) { line.remove_suffix(1); }
    lines.emplace_back(line);
    output = eol == std::string_view::npos ? std::string_view{} : output.substr(eol + 1);
  }
  return lines;
}

}  // namespace embedpy
