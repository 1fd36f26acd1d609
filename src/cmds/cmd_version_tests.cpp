#include "cmds/cmd_version.h"

#include "test_support.h"

#include "doctest/doctest.h"

#include <string>
#include <type_traits>

TEST_CASE("cmd_version config exposes cmd_t alias") {
  CHECK(std::is_same_v<embedpy::cmd_version::cfg::cmd_t, embedpy::cmd_version>);
}

TEST_CASE("cmd_version prints embedpy and library versions") {
  embedpy::test::log_capture log;
  embedpy::cmd::create(embedpy::cmd_version::cfg{})->execute();

  auto const &lines{ log.lines() };
  REQUIRE(lines.size() == 4);
  CHECK(lines[0] == std::string{ "embedpy " } + EMBEDPY_VERSION_STR);
  CHECK(lines[1].starts_with("  libcurl    "));
  CHECK(lines[2].starts_with("  libarchive libarchive "));
  CHECK(lines[3].starts_with("  CLI11      "));
}
