#include "cmd_version.h"

#include "tui.h"

#include "CLI/CLI.hpp"
#include "archive.h"
#include "curl/curl.h"

#include <string>

#ifndef EMBEDPY_VERSION_STR
#error "EMBEDPY_VERSION_STR must be defined by the build system"
#endif

namespace embedpy {
namespace {

// "8.5.0 (OpenSSL/3.0.13, zlib)"; the TLS backend matters when downloads fail.
std::string describe_libcurl() {
  curl_version_info_data const *info{ curl_version_info(CURLVERSION_NOW) };
  std::string extras;
  auto add{ [&extras](char const *what) {
    extras += extras.empty() ? "" : ", ";
    extras += what;
  } };

  if ((info->features & CURL_VERSION_SSL) && info->ssl_version) { add(info->ssl_version); }
  if (info->features & CURL_VERSION_LIBZ) { add("zlib"); }
  if (info->features & CURL_VERSION_HTTP2) { add("http2"); }

  std::string out{ info->version };
  if (!extras.empty()) { out += " (" + extras + ")"; }
  return out;
}

}  // namespace

cmd_version::cmd_version(cfg c) : cfg_{ std::move(c) } {}

void cmd_version::execute() {
  tui::info("embedpy %s", EMBEDPY_VERSION_STR);
  tui::info("  libcurl    %s", describe_libcurl().c_str());
  tui::info("  libarchive %s", archive_version_details());
  tui::info("  CLI11      %s", CLI11_VERSION);
}

}  // namespace embedpy
