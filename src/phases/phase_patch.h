#pragma once

#include "py_version.h"

#include <filesystem>

namespace embedpy {

// Uncomment the first "#import site" in python<M><m>._pth under `target`, rewriting
// the file byte for byte otherwise. An already-active "import site" line is accepted
// as is. A missing file or directive throws provision_error(patch).
void phase_patch(py_version const &v, std::filesystem::path const &target);

}  // namespace embedpy
