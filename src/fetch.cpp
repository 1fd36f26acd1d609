#include "fetch.h"

#include "errors.h"
#include "libcurl_util.h"
#include "tui.h"
#include "util.h"

#include <exception>
#include <filesystem>
#include <string>

namespace embedpy {

download_fn_t fetch_default_downloader(std::chrono::seconds timeout) {
  return [timeout](std::string const &url, std::filesystem::path const &destination) {
    std::uint64_t const bytes{ libcurl_download(url, destination, timeout) };
    tui::debug("fetched %s (%s)", url.c_str(), util_format_bytes(bytes).c_str());
  };
}

void fetch_file(download_fn_t const &download,
                std::string const &url,
                std::filesystem::path const &destination) {
  tui::debug("fetch %s -> %s", url.c_str(), destination.string().c_str());
  try {
    download(url, destination);
  } catch (provision_error const &) {
    throw;
  } catch (std::exception const &e) {
    throw provision_error(error_kind::fetch,
                          "failed to download " + url + ": " + e.what());
  }

  if (!std::filesystem::is_regular_file(destination)) {
    throw provision_error(error_kind::fetch,
                          "download of " + url + " produced no file at " +
                              destination.string());
  }
}

}  // namespace embedpy
