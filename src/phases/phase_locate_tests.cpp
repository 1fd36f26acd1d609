#include "phase_locate.h"

#include "errors.h"
#include "platform.h"
#include "test_support.h"
#include "util.h"

#include "doctest/doctest.h"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

std::string join_search_path(std::vector<fs::path> const &dirs) {
  std::string out;
  for (auto const &dir : dirs) {
    if (!out.empty()) { out.push_back(embedpy::platform::kPathListSeparator); }
    out += dir.string();
  }
  return out;
}

embedpy::error_kind locate_failure_kind(embedpy::py_version const &v,
                                        std::optional<std::string> const &search_path) {
  try {
    embedpy::phase_locate(v, search_path);
  } catch (embedpy::provision_error const &e) {
    return e.kind();
  }
  FAIL("expected phase_locate to throw");
  return embedpy::error_kind::copy;
}

}  // namespace

TEST_CASE("host_dir_name concatenates major and minor without padding") {
  CHECK(embedpy::host_dir_name({ 3, 9, 7 }) == "Python39");
  CHECK(embedpy::host_dir_name({ 3, 10, 1 }) == "Python310");
}

TEST_CASE("phase_locate returns the first matching entry with libs") {
  auto const root{ embedpy::test::make_temp_dir("embedpy-locate-test") };
  embedpy::scoped_path_cleanup cleanup{ root };

  fs::create_directories(root / "a" / "Python39");  // no libs: skipped
  fs::create_directories(root / "b" / "Python39" / "libs");
  fs::create_directories(root / "c" / "Python39" / "libs");
  fs::create_directories(root / "d" / "Python38" / "libs");

  auto const search{ join_search_path({ root / "d" / "Python38",
                                        root / "a" / "Python39",
                                        root / "b" / "Python39",
                                        root / "c" / "Python39" }) };

  CHECK(embedpy::phase_locate({ 3, 9, 7 }, search) == root / "b" / "Python39" / "libs");
}

TEST_CASE("phase_locate accepts entries with a trailing separator") {
  auto const root{ embedpy::test::make_temp_dir("embedpy-locate-test") };
  embedpy::scoped_path_cleanup cleanup{ root };
  fs::create_directories(root / "Python310" / "libs");

  std::string const search{ (root / "Python310").string() + "/" };
  CHECK(embedpy::phase_locate({ 3, 10, 0 }, search) == root / "Python310" / "libs");
}

TEST_CASE("phase_locate does not confuse 3.1 with 3.10") {
  auto const root{ embedpy::test::make_temp_dir("embedpy-locate-test") };
  embedpy::scoped_path_cleanup cleanup{ root };
  fs::create_directories(root / "Python310" / "libs");

  CHECK(locate_failure_kind({ 3, 1, 0 }, (root / "Python310").string()) ==
        embedpy::error_kind::not_found);
}

TEST_CASE("phase_locate requires libs to be a directory") {
  auto const root{ embedpy::test::make_temp_dir("embedpy-locate-test") };
  embedpy::scoped_path_cleanup cleanup{ root };
  fs::create_directories(root / "Python39");
  embedpy::util_write_file(root / "Python39" / "libs", "not a directory");

  CHECK(locate_failure_kind({ 3, 9, 7 }, (root / "Python39").string()) ==
        embedpy::error_kind::not_found);
}

TEST_CASE("phase_locate not-found names the directory and variable") {
  try {
    embedpy::phase_locate({ 3, 9, 7 }, std::string{ "/definitely/not/here" });
    FAIL("expected phase_locate to throw");
  } catch (embedpy::provision_error const &e) {
    CHECK(e.kind() == embedpy::error_kind::not_found);
    std::string const msg{ e.what() };
    CHECK(msg.find("Python39") != std::string::npos);
    CHECK(msg.find("PATH") != std::string::npos);
  }
}

TEST_CASE("phase_locate without a search path is a missing environment") {
  CHECK(locate_failure_kind({ 3, 9, 7 }, std::nullopt) ==
        embedpy::error_kind::missing_environment);
}
