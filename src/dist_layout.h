#pragma once

#include "process.h"
#include "py_version.h"

#include <filesystem>
#include <string>

namespace embedpy {

// Fixed paths inside an assembled embedded distribution.
struct dist_layout {
  std::filesystem::path root;  // absolute

  std::filesystem::path interpreter() const;
  std::filesystem::path scripts_dir() const;
  std::filesystem::path marker() const;  // pip executable produced by the bootstrap
  std::filesystem::path pth_file(py_version const &v) const;
  std::filesystem::path bootstrap_script() const;
  std::filesystem::path version_record() const;

  // "<root><sep><root>/Scripts"
  std::string search_path() const;
};

dist_layout dist_layout_for(std::filesystem::path const &target);

// Copy of `parent` with PATH replaced by the layout's search path. The parent
// process environment is never touched.
process_env_t dist_child_env(process_env_t parent, dist_layout const &layout);

}  // namespace embedpy
