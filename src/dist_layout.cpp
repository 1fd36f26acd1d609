#include "dist_layout.h"

#include "platform.h"

namespace embedpy {

std::filesystem::path dist_layout::interpreter() const {
  return root / platform::exe_name("python");
}

std::filesystem::path dist_layout::scripts_dir() const { return root / "Scripts"; }

std::filesystem::path dist_layout::marker() const {
  return scripts_dir() / platform::exe_name("pip");
}

std::filesystem::path dist_layout::pth_file(py_version const &v) const {
  return root / ("python" + py_version_tag(v) + "._pth");
}

std::filesystem::path dist_layout::bootstrap_script() const { return root / "get-pip.py"; }

std::filesystem::path dist_layout::version_record() const {
  return root / "embedpy-version.txt";
}

std::string dist_layout::search_path() const {
  return root.string() + platform::kPathListSeparator + scripts_dir().string();
}

dist_layout dist_layout_for(std::filesystem::path const &target) {
  auto root{ std::filesystem::absolute(target).lexically_normal() };
  if (!root.has_filename() && root.has_relative_path()) { root = root.parent_path(); }
  return { .root = root };
}

process_env_t dist_child_env(process_env_t parent, dist_layout const &layout) {
  return process_env_with(std::move(parent), platform::kPathVar, layout.search_path());
}

}  // namespace embedpy
