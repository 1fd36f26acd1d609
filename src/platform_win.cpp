#include "platform.h"

#include <string>
#include <system_error>

namespace embedpy::platform {

std::string exe_name(std::string_view stem) { return std::string{ stem } + ".exe"; }

bool is_executable(std::filesystem::path const &path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec);
}


}  // namespace embedpy::platform
