#include "phase_locate.h"

#include "errors.h"
#include "platform.h"
#include "tui.h"
#include "util.h"

#include <system_error>

namespace embedpy {

std::string host_dir_name(py_version const &v) { return "Python" + py_version_tag(v); }

std::filesystem::path phase_locate(py_version const &v,
                                   std::optional<std::string> const &search_path) {
  if (!search_path) {
    throw provision_error(error_kind::missing_environment,
                          std::string{ "missing " } + platform::kPathVar +
                              " environment variable");
  }

  std::string const target_name{ host_dir_name(v) };

  for (auto const &entry : util_split_path_list(*search_path, platform::kPathListSeparator)) {
    std::filesystem::path dir{ entry };
    if (!dir.has_filename() && dir.has_relative_path()) { dir = dir.parent_path(); }
    if (dir.filename() != target_name) { continue; }

    auto const candidate{ dir / "libs" };
    std::error_code ec;
    if (std::filesystem::is_directory(candidate, ec)) {
      tui::debug("host libs: %s", candidate.string().c_str());
      return candidate;
    }
    tui::debug("skipping %s: no libs directory", dir.string().c_str());
  }

  throw provision_error(error_kind::not_found,
                        "could not find any " + target_name + "/libs in " +
                            platform::kPathVar);
}

}  // namespace embedpy
