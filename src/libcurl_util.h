#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string_view>

namespace embedpy {

void libcurl_ensure_initialized();

// Single HTTP(S) GET of `url` into `destination` (parent directories created).
// Non-2xx status and transport errors throw std::runtime_error; the partial file is
// removed. A zero timeout waits indefinitely. Returns the number of bytes written.
std::uint64_t libcurl_download(std::string_view url,
                               std::filesystem::path const &destination,
                               std::chrono::seconds timeout = std::chrono::seconds{ 0 });

}  // namespace embedpy
