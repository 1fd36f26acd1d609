#include "phase_fetch.h"

#include "errors.h"
#include "test_support.h"
#include "util.h"

#include "doctest/doctest.h"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

TEST_CASE("embed_archive_url substitutes the version twice") {
  CHECK(embedpy::embed_archive_url(embedpy::kDefaultPythonMirror, { 3, 9, 7 }) ==
        "https://www.python.org/ftp/python/3.9.7/python-3.9.7-embed-amd64.zip");
  CHECK(embedpy::embed_archive_url("https://mirror.example/py/", { 3, 10, 11 }) ==
        "https://mirror.example/py/3.10.11/python-3.10.11-embed-amd64.zip");
}

TEST_CASE("phase_fetch downloads and extracts into the target") {
  auto const root{ embedpy::test::make_temp_dir("embedpy-fetch-test") };
  embedpy::scoped_path_cleanup cleanup{ root };
  auto const fixture{ root / "fixture.zip" };
  auto const dist{ root / "dist" };
  fs::create_directories(dist);

  embedpy::test::write_zip(fixture,
                           { { .path = "python.exe", .content = "MZ" },
                             { .path = "python39._pth", .content = "#import site\n" } });

  std::vector<std::string> urls;
  embedpy::download_fn_t const download{ [&](std::string const &url, fs::path const &dest) {
    urls.push_back(url);
    fs::copy_file(fixture, dest);
  } };

  embedpy::phase_fetch({ 3, 9, 7 }, dist, embedpy::kDefaultPythonMirror, download);

  REQUIRE(urls.size() == 1);
  CHECK(urls[0] == "https://www.python.org/ftp/python/3.9.7/python-3.9.7-embed-amd64.zip");
  CHECK(embedpy::test::read_text(dist / "python39._pth") == "#import site\n");
  CHECK(fs::exists(dist / "python.exe"));
  CHECK_FALSE(fs::exists(dist / "python-3.9.7-embed-amd64.zip"));
}

TEST_CASE("phase_fetch reports download failures with the URL") {
  auto const dist{ embedpy::test::make_temp_dir("embedpy-fetch-test") };
  embedpy::scoped_path_cleanup cleanup{ dist };

  embedpy::download_fn_t const download{ [](std::string const &, fs::path const &) {
    throw std::runtime_error("HTTP 404");
  } };

  try {
    embedpy::phase_fetch({ 3, 9, 99 }, dist, "https://mirror.example", download);
    FAIL("expected phase_fetch to throw");
  } catch (embedpy::provision_error const &e) {
    CHECK(e.kind() == embedpy::error_kind::fetch);
    std::string const msg{ e.what() };
    CHECK(msg.find("https://mirror.example/3.9.99/python-3.9.99-embed-amd64.zip") !=
          std::string::npos);
    CHECK(msg.find("HTTP 404") != std::string::npos);
  }
}

TEST_CASE("phase_fetch reports corrupt archives as extraction errors") {
  auto const dist{ embedpy::test::make_temp_dir("embedpy-fetch-test") };
  embedpy::scoped_path_cleanup cleanup{ dist };

  embedpy::download_fn_t const download{ [](std::string const &, fs::path const &dest) {
    embedpy::util_write_file(dest, "<html>not a zip</html>");
  } };

  try {
    embedpy::phase_fetch({ 3, 9, 7 }, dist, embedpy::kDefaultPythonMirror, download);
    FAIL("expected phase_fetch to throw");
  } catch (embedpy::provision_error const &e) {
    CHECK(e.kind() == embedpy::error_kind::extraction);
  }
}
