#include "cmds/cmd_provision.h"

#include "errors.h"

#include "doctest/doctest.h"

#include <type_traits>

TEST_CASE("cmd_provision config exposes cmd_t alias") {
  CHECK(std::is_same_v<embedpy::cmd_provision::cfg::cmd_t, embedpy::cmd_provision>);
}

TEST_CASE("cmd_provision keeps its configuration") {
  embedpy::cmd_provision::cfg cfg{};
  cfg.provision.target = "out";
  cfg.provision.version = "3.9.7";

  embedpy::cmd_provision const c{ cfg };
  CHECK(c.get_cfg().provision.target == "out");
  REQUIRE(c.get_cfg().provision.version.has_value());
  CHECK(*c.get_cfg().provision.version == "3.9.7");
}

TEST_CASE("cmd_provision propagates invalid version before any work") {
  embedpy::cmd_provision::cfg cfg{};
  cfg.provision.version = "3.9";
  cfg.provision.download = [](std::string const &, std::filesystem::path const &) {
    FAIL("download must not be attempted");
  };

  auto const c{ embedpy::cmd::create(cfg) };
  try {
    c->execute();
    FAIL("expected provision_error");
  } catch (embedpy::provision_error const &e) {
    CHECK(e.kind() == embedpy::error_kind::invalid_format);
  }
}
