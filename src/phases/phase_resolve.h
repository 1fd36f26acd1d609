#pragma once

#include "py_version.h"

#include <chrono>
#include <optional>
#include <string>

namespace embedpy {

struct host_python_query {
  std::string python;                      // bare name or path
  std::optional<std::string> search_path;  // PATH value, absent if unset
  std::chrono::seconds timeout{ 0 };
};

// Explicit version text wins; otherwise the host interpreter is asked.
py_version phase_resolve(std::optional<std::string> const &requested,
                         host_python_query const &host);

// Runs `<python> -c ...` and parses the dotted triple it prints. A missing or failing
// interpreter throws provision_error(external_tool); unparsable output throws
// provision_error(invalid_format).
py_version query_host_python_version(host_python_query const &host);

}  // namespace embedpy
