#include "py_version.h"

#include "errors.h"
#include "util.h"

#include <charconv>
#include <string>
#include <system_error>
#include <vector>

namespace embedpy {

namespace {

[[noreturn]] void throw_invalid(std::string_view text) {
  throw provision_error(error_kind::invalid_format,
                        "invalid version '" + std::string{ text } +
                            "': expected X.Y.Z (three dot-separated integers)");
}

}  // namespace

py_version py_version_parse(std::string_view text) {
  std::string_view const trimmed{ util_trim(text) };

  std::vector<std::string_view> parts;
  size_t start{ 0 };
  while (true) {
    size_t const dot{ trimmed.find('.', start) };
    parts.push_back(trimmed.substr(start, dot == std::string_view::npos ? dot : dot - start));
    if (dot == std::string_view::npos) { break; }
    start = dot + 1;
  }
  if (parts.size() != 3) { throw_invalid(text); }

  std::uint32_t values[3]{};
  for (size_t i{ 0 }; i < 3; ++i) {
    std::string_view const part{ parts[i] };
    if (part.empty()) { throw_invalid(text); }
    auto const [ptr, ec]{ std::from_chars(part.data(), part.data() + part.size(), values[i]) };
    if (ec != std::errc{} || ptr != part.data() + part.size()) { throw_invalid(text); }
  }

  return { .major = values[0], .minor = values[1], .patch = values[2] };
}

std::string py_version_format(py_version const &v) {
  return std::to_string(v.major) + "." + std::to_string(v.minor) + "." +
         std::to_string(v.patch);
}

std::string py_version_tag(py_version const &v) {
  return std::to_string(v.major) + std::to_string(v.minor);
}

}  // namespace embedpy
