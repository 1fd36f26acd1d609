#include "phase_fetch.h"

#include "errors.h"
#include "extract.h"
#include "tui.h"
#include "util.h"

#include <exception>
#include <string>

namespace embedpy {

std::string embed_archive_name(py_version const &v) {
  return "python-" + py_version_format(v) + "-embed-amd64.zip";
}

std::string embed_archive_url(std::string_view mirror, py_version const &v) {
  while (mirror.ends_with('/')) { mirror.remove_suffix(1); }
  return std::string{ mirror } + "/" + py_version_format(v) + "/" + embed_archive_name(v);
}

void phase_fetch(py_version const &v,
                 std::filesystem::path const &target,
                 std::string_view mirror,
                 download_fn_t const &download) {
  tui::info("Downloading zip file...");

  std::string const url{ embed_archive_url(mirror, v) };
  std::filesystem::path const archive_path{ target / embed_archive_name(v) };
  scoped_path_cleanup archive_cleanup{ archive_path };

  fetch_file(download, url, archive_path);

  try {
    extract(archive_path, target);
  } catch (std::exception const &e) {
    throw provision_error(error_kind::extraction,
                          "failed to extract " + url + " into " + target.string() + ": " +
                              e.what());
  }
}

}  // namespace embedpy
