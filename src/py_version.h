#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace embedpy {

struct py_version {
  std::uint32_t major{ 0 };
  std::uint32_t minor{ 0 };
  std::uint32_t patch{ 0 };

  bool operator==(py_version const &) const = default;
};

// Parse "X.Y.Z" (surrounding whitespace ignored). Exactly three non-negative integer
// components; anything else throws provision_error(invalid_format).
py_version py_version_parse(std::string_view text);

// "X.Y.Z"
std::string py_version_format(py_version const &v);

// Major and minor digits concatenated without padding: 3.9 -> "39", 3.10 -> "310".
std::string py_version_tag(py_version const &v);

}  // namespace embedpy
