#include "util.h"

#include <array>
#include <cstdio>
#include <stdexcept>
#include <system_error>

namespace embedpy {

void file_closer::operator()(std::FILE *file) const noexcept {
  if (file) { std::fclose(file); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
#if defined(_WIN32)
  std::wstring const wide_mode{ mode, mode + std::char_traits<char>::length(mode) };
  return file_ptr_t{ ::_wfopen(path.c_str(), wide_mode.c_str()) };
#else
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
#endif
}

std::string util_load_file(std::filesystem::path const &path) {
  file_ptr_t const file{ util_open_file(path, "rb") };
  if (!file) { throw std::runtime_error("cannot open " + path.string()); }

  std::string content;
  std::array<char, 16 * 1024> chunk;
  for (;;) {
    std::size_t const n{ std::fread(chunk.data(), 1, chunk.size(), file.get()) };
    content.append(chunk.data(), n);
    if (n < chunk.size()) { break; }
  }
  if (std::ferror(file.get())) { throw std::runtime_error("cannot read " + path.string()); }
  return content;
}

void util_write_file(std::filesystem::path const &path, std::string_view content) {
  file_ptr_t file{ util_open_file(path, "wb") };
  if (!file) { throw std::runtime_error("cannot create " + path.string()); }

  bool const ok{ std::fwrite(content.data(), 1, content.size(), file.get()) ==
                     content.size() &&
                 std::fclose(file.release()) == 0 };
  if (!ok) { throw std::runtime_error("cannot write " + path.string()); }
}

std::string util_format_bytes(std::uint64_t bytes) {
  if (bytes < 1024) { return std::to_string(bytes) + "B"; }

  constexpr char const *kUnits[]{ "KB", "MB", "GB", "TB" };
  double scaled{ static_cast<double>(bytes) / 1024.0 };
  std::size_t unit{ 0 };
  for (; scaled >= 1024.0 && unit + 1 < std::size(kUnits); ++unit) { scaled /= 1024.0; }

  char buf[32];
  std::snprintf(buf, sizeof buf, "%.2f%s", scaled, kUnits[unit]);
  return buf;
}

std::string_view util_trim(std::string_view s) {
  constexpr std::string_view kSpace{ " \t\r\n" };
  auto const first{ s.find_first_not_of(kSpace) };
  if (first == std::string_view::npos) { return {}; }
  return s.substr(first, s.find_last_not_of(kSpace) + 1 - first);
}

std::vector<std::string> util_split_path_list(std::string_view value, char separator) {
  std::vector<std::string> out;
  std::size_t start{ 0 };
  while (start <= value.size()) {
    std::size_t end{ value.find(separator, start) };
    if (end == std::string_view::npos) { end = value.size(); }
    if (end > start) { out.emplace_back(value.substr(start, end - start)); }
    start = end + 1;
  }
  return out;
}

scoped_path_cleanup::~scoped_path_cleanup() {
  std::error_code ec;
  if (!path_.empty()) { std::filesystem::remove_all(path_, ec); }
}

}  // namespace embedpy
