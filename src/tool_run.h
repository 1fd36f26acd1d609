#pragma once

#include "errors.h"
#include "process.h"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace embedpy {

struct tool_invocation {
  std::string label;  // operator-facing name, e.g. "get-pip"
  std::vector<std::string> argv;
  process_env_t env;
  std::optional<std::filesystem::path> cwd;
  std::chrono::seconds timeout{ 0 };
  error_kind failure_kind{ error_kind::tool_execution };
};

// Run an external tool to completion. Captured stdout/stderr are echoed at INFO after
// the run whatever the outcome. Spawn failure, timeout, and non-zero exit throw
// provision_error(failure_kind) carrying the captured output.
process_result tool_run(tool_invocation const &inv);

}  // namespace embedpy
