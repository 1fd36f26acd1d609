#pragma once

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace embedpy {

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

struct file_closer {
  void operator()(std::FILE *file) const noexcept;
};
using file_ptr_t = std::unique_ptr<std::FILE, file_closer>;

// fopen with wide-path support on Windows. Null on failure.
file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode);

// Whole file as bytes. Throws std::runtime_error naming `path` on failure.
std::string util_load_file(std::filesystem::path const &path);

// Replace the file with `content`, binary mode. Throws std::runtime_error on failure.
void util_write_file(std::filesystem::path const &path, std::string_view content);

// 1023 -> "1023B", 1536 -> "1.50KB".
std::string util_format_bytes(std::uint64_t bytes);

std::string_view util_trim(std::string_view s);

// "a:b::c" -> {a, b, c}.
std::vector<std::string> util_split_path_list(std::string_view value, char separator);

// Removes `path` recursively when destroyed; removal errors are ignored.
class scoped_path_cleanup : unmovable {
 public:
  explicit scoped_path_cleanup(std::filesystem::path path) : path_{ std::move(path) } {}
  ~scoped_path_cleanup();

 private:
  std::filesystem::path path_;
};

}  // namespace embedpy
