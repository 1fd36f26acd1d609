#include "platform.h"

#include <unistd.h>

#include <string>
#include <system_error>

namespace embedpy::platform {

std::string exe_name(std::string_view stem) { return std::string{ stem }; }

bool is_executable(std::filesystem::path const &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) { return false; }
  return ::access(path.c_str(), X_OK) == 0;
}


}  // namespace embedpy::platform
