#pragma once

#include <cstdint>
#include <filesystem>

namespace embedpy {

// Extract every entry of `archive_path` beneath `destination`, preserving the archive's
// relative paths. Entries with absolute paths or ".." components are rejected.
// Throws std::runtime_error on corrupt input, write failure, or an archive with no
// regular files. Returns the number of regular files written.
std::uint64_t extract(std::filesystem::path const &archive_path,
                      std::filesystem::path const &destination);

}  // namespace embedpy
