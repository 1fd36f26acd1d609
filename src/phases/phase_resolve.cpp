#include "phase_resolve.h"

#include "errors.h"
#include "platform.h"
#include "process.h"
#include "tool_run.h"
#include "tui.h"

#include <string>

namespace embedpy {

namespace {

constexpr char kVersionScript[]{
  "import sys; print('%d.%d.%d' % sys.version_info[:3])"
};

}  // namespace

py_version query_host_python_version(host_python_query const &host) {
  std::filesystem::path const as_path{ host.python };
  if (!as_path.has_parent_path() && !host.search_path) {
    throw provision_error(error_kind::missing_environment,
                          std::string{ platform::kPathVar } +
                              " is not set; cannot locate host interpreter '" +
                              host.python + "'");
  }

  auto const python{ process_find_executable(host.python, host.search_path.value_or("")) };
  if (!python) {
    throw provision_error(error_kind::external_tool,
                          "host interpreter '" + host.python + "' not found in " +
                              platform::kPathVar);
  }

  auto const result{ tool_run({ .label = "host python",
                                .argv = { python->string(), "-c", kVersionScript },
                                .env = process_getenv(),
                                .timeout = host.timeout,
                                .failure_kind = error_kind::external_tool }) };

  std::string reported;
  for (auto const &line : result.stdout_lines) {
    if (!line.empty()) {
      reported = line;
      break;
    }
  }
  tui::debug("host interpreter %s reports version '%s'",
             python->string().c_str(),
             reported.c_str());
  return py_version_parse(reported);
}

py_version phase_resolve(std::optional<std::string> const &requested,
                         host_python_query const &host) {
  py_version const v{ requested ? py_version_parse(*requested)
                                : query_host_python_version(host) };
  tui::debug("resolved python version %s", py_version_format(v).c_str());
  return v;
}

}  // namespace embedpy
