#pragma once

#include "fetch.h"
#include "phases/phase_bootstrap.h"
#include "phases/phase_fetch.h"
#include "py_version.h"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace embedpy {

struct provision_cfg {
  std::filesystem::path target{ "pydist" };
  std::optional<std::string> version;  // "X.Y.Z"; host interpreter is asked if absent
  std::optional<std::filesystem::path> requirements;
  std::string host_python{ "python" };
  std::string mirror{ kDefaultPythonMirror };
  std::string get_pip_url{ kDefaultGetPipUrl };
  std::chrono::seconds download_timeout{ 0 };
  std::chrono::seconds tool_timeout{ 0 };
  std::optional<std::string> search_path;  // replaces the parent PATH for host lookups
  download_fn_t download;                  // libcurl when empty
};

struct provision_result {
  py_version version;
  std::filesystem::path root;
  bool assembled{ false };  // false when an existing distribution was reused
};

// Resolve, assemble (unless the pip marker already exists), then install
// requirements. Every failure is a provision_error.
provision_result provision(provision_cfg const &cfg);

}  // namespace embedpy
