#pragma once

#include "dist_layout.h"
#include "fetch.h"
#include "process.h"

#include <chrono>
#include <string>

namespace embedpy {

constexpr char kDefaultGetPipUrl[]{ "https://bootstrap.pypa.io/get-pip.py" };

struct bootstrap_cfg {
  dist_layout layout;
  std::string get_pip_url{ kDefaultGetPipUrl };
  download_fn_t download;
  process_env_t child_env;  // see dist_child_env
  std::chrono::seconds timeout{ 0 };
};

// Fetch get-pip.py into the distribution and run it with the distribution's own
// interpreter. Throws provision_error(fetch) or provision_error(tool_execution); the
// latter also when the run succeeds but leaves no pip executable behind.
void phase_bootstrap(bootstrap_cfg const &cfg);

}  // namespace embedpy
