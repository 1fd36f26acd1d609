#pragma once

#include "py_version.h"

#include <filesystem>
#include <optional>
#include <string>

namespace embedpy {

// First "Python<M><m>/libs" directory found along `search_path`, in search order.
// Entries whose name matches but lack "libs" are skipped. Throws
// provision_error(missing_environment) when `search_path` is absent and
// provision_error(not_found) when nothing qualifies.
std::filesystem::path phase_locate(py_version const &v,
                                   std::optional<std::string> const &search_path);

// "Python39", "Python310"
std::string host_dir_name(py_version const &v);

}  // namespace embedpy
