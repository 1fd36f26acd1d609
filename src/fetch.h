#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>

namespace embedpy {

// Downloads `url` into `destination`, throwing on any failure.
using download_fn_t =
    std::function<void(std::string const &url, std::filesystem::path const &destination)>;

// libcurl-backed downloader. A zero timeout waits indefinitely.
download_fn_t fetch_default_downloader(std::chrono::seconds timeout);

// Run `download` and convert any failure into provision_error(fetch) naming the URL.
void fetch_file(download_fn_t const &download,
                std::string const &url,
                std::filesystem::path const &destination);

}  // namespace embedpy
