#include "libcurl_util.h"

#include "util.h"

#include "curl/curl.h"

#include <cstdio>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>

#ifndef EMBEDPY_VERSION_STR
#error "EMBEDPY_VERSION_STR must be defined by the build system"
#endif

namespace embedpy {
namespace {

struct easy_cleanup {
  void operator()(CURL *h) const { curl_easy_cleanup(h); }
};
using easy_ptr = std::unique_ptr<CURL, easy_cleanup>;

void check(CURLcode rc, char const *what) {
  if (rc != CURLE_OK) {
    throw std::runtime_error(std::string{ what } + ": " + curl_easy_strerror(rc));
  }
}

size_t append_to_file(char *data, size_t size, size_t count, void *file) {
  return std::fwrite(data, 1, size * count, static_cast<std::FILE *>(file));
}

// GET `url` into `file`; returns the byte count.
std::uint64_t perform_get(std::string const &url, std::FILE *file, std::chrono::seconds timeout) {
  easy_ptr const h{ curl_easy_init() };
  if (!h) { throw std::runtime_error("curl_easy_init failed"); }

  char errbuf[CURL_ERROR_SIZE]{};
  check(curl_easy_setopt(h.get(), CURLOPT_URL, url.c_str()), "CURLOPT_URL");
  check(curl_easy_setopt(h.get(), CURLOPT_USERAGENT, "embedpy/" EMBEDPY_VERSION_STR),
        "CURLOPT_USERAGENT");
  check(curl_easy_setopt(h.get(), CURLOPT_FOLLOWLOCATION, 1L), "CURLOPT_FOLLOWLOCATION");
  check(curl_easy_setopt(h.get(), CURLOPT_FAILONERROR, 1L), "CURLOPT_FAILONERROR");
  check(curl_easy_setopt(h.get(), CURLOPT_NOSIGNAL, 1L), "CURLOPT_NOSIGNAL");
  check(curl_easy_setopt(h.get(), CURLOPT_ERRORBUFFER, errbuf), "CURLOPT_ERRORBUFFER");
  check(curl_easy_setopt(h.get(), CURLOPT_WRITEFUNCTION, append_to_file),
        "CURLOPT_WRITEFUNCTION");
  check(curl_easy_setopt(h.get(), CURLOPT_WRITEDATA, file), "CURLOPT_WRITEDATA");
  if (timeout.count() > 0) {
    check(curl_easy_setopt(h.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout.count())),
          "CURLOPT_TIMEOUT");
  }

  if (CURLcode const rc{ curl_easy_perform(h.get()) }; rc != CURLE_OK) {
    throw std::runtime_error(errbuf[0] ? std::string{ errbuf }
                                       : std::string{ curl_easy_strerror(rc) });
  }

  curl_off_t bytes{ 0 };
  check(curl_easy_getinfo(h.get(), CURLINFO_SIZE_DOWNLOAD_T, &bytes), "CURLINFO_SIZE_DOWNLOAD_T");
  return static_cast<std::uint64_t>(bytes);
}

}  // namespace

void libcurl_ensure_initialized() {
  static std::once_flag once;
  std::call_once(once, [] { check(curl_global_init(CURL_GLOBAL_DEFAULT), "curl_global_init"); });
}

std::uint64_t libcurl_download(std::string_view url,
                               std::filesystem::path const &destination,
                               std::chrono::seconds timeout) {
  if (destination.empty()) {
    throw std::invalid_argument("libcurl_download: destination is empty");
  }
  libcurl_ensure_initialized();

  auto const path{ std::filesystem::absolute(destination) };
  std::filesystem::create_directories(path.parent_path());

  file_ptr_t file{ util_open_file(path, "wb") };
  if (!file) { throw std::runtime_error("cannot create " + path.string()); }

  try {
    auto const bytes{ perform_get(std::string{ url }, file.get(), timeout) };
    if (std::fclose(file.release()) != 0) {
      throw std::runtime_error("cannot write " + path.string());
    }
    return bytes;
  } catch (std::exception const &) {
    file.reset();
    std::error_code ec;
    std::filesystem::remove(path, ec);
    throw;
  }
}

}  // namespace embedpy
