#pragma once

#include "fetch.h"
#include "py_version.h"

#include <filesystem>
#include <string>
#include <string_view>

namespace embedpy {

constexpr char kDefaultPythonMirror[]{ "https://www.python.org/ftp/python" };

// "python-3.9.7-embed-amd64.zip"
std::string embed_archive_name(py_version const &v);

// "<mirror>/3.9.7/python-3.9.7-embed-amd64.zip"
std::string embed_archive_url(std::string_view mirror, py_version const &v);

// Download the embeddable archive into `target` and extract it there. The archive
// file itself is removed afterwards. Throws provision_error(fetch) or
// provision_error(extraction).
void phase_fetch(py_version const &v,
                 std::filesystem::path const &target,
                 std::string_view mirror,
                 download_fn_t const &download);

}  // namespace embedpy
