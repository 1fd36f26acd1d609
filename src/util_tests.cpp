#include "util.h"

#include "test_support.h"

#include "doctest/doctest.h"

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

TEST_CASE("util_format_bytes") {
  CHECK(embedpy::util_format_bytes(0) == "0B");
  CHECK(embedpy::util_format_bytes(1023) == "1023B");
  CHECK(embedpy::util_format_bytes(1536) == "1.50KB");
  CHECK(embedpy::util_format_bytes(std::uint64_t{ 7 } * 1024 * 1024 * 1024 / 4) == "1.75GB");
}

TEST_CASE("util_trim strips surrounding whitespace") {
  CHECK(embedpy::util_trim("  3.9.7\r\n") == "3.9.7");
  CHECK(embedpy::util_trim("\t\n ").empty());
  CHECK(embedpy::util_trim("a b") == "a b");
}

TEST_CASE("util_split_path_list keeps order and drops empty entries") {
  auto const entries{ embedpy::util_split_path_list("/a::/b/c:/d:", ':') };
  REQUIRE(entries.size() == 3);
  CHECK(entries[0] == "/a");
  CHECK(entries[1] == "/b/c");
  CHECK(entries[2] == "/d");

  CHECK(embedpy::util_split_path_list("", ':').empty());
  CHECK(embedpy::util_split_path_list("C:\\x;D:\\y", ';').size() == 2);
}

TEST_CASE("scoped_path_cleanup removes directory trees") {
  auto const dir{ embedpy::test::make_temp_dir("embedpy-util-test") };
  embedpy::util_write_file(dir / "top.txt", "x");
  fs::create_directories(dir / "nested");
  embedpy::util_write_file(dir / "nested" / "file.txt", "y");

  { embedpy::scoped_path_cleanup cleanup{ dir }; }
  CHECK_FALSE(fs::exists(dir));
}

TEST_CASE("util_write_file and util_load_file keep bytes exactly") {
  auto const dir{ embedpy::test::make_temp_dir("embedpy-util-test") };
  embedpy::scoped_path_cleanup cleanup{ dir };

  std::string const content{ "line one\r\nline two\n\0tail", 24 };
  embedpy::util_write_file(dir / "data", content);
  CHECK(embedpy::util_load_file(dir / "data") == content);

  embedpy::util_write_file(dir / "data", "short");
  CHECK(embedpy::util_load_file(dir / "data") == "short");
}

TEST_CASE("util_load_file names the missing file") {
  auto const dir{ embedpy::test::make_temp_dir("embedpy-util-test") };
  embedpy::scoped_path_cleanup cleanup{ dir };

  try {
    embedpy::util_load_file(dir / "missing.txt");
    FAIL("expected util_load_file to throw");
  } catch (std::runtime_error const &e) {
    CHECK(std::string{ e.what() }.find("missing.txt") != std::string::npos);
  }
}
