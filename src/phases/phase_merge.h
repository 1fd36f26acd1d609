#pragma once

#include <cstdint>
#include <filesystem>

namespace embedpy {

// Copy each immediate child of `libs_dir` into `target`/libs, creating it if needed.
// Children already present there are left untouched; directories are copied
// recursively. Throws provision_error(copy). Returns the number of children copied.
std::uint64_t phase_merge(std::filesystem::path const &libs_dir,
                          std::filesystem::path const &target);

}  // namespace embedpy
