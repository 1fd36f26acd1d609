#pragma once

#include "cmds/cmd_provision.h"
#include "cmds/cmd_version.h"
#include "tui.h"

#include <optional>
#include <string>
#include <variant>

namespace embedpy {

struct cli_args {
  using cmd_cfg_t = std::variant<cmd_provision::cfg, cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::string cli_output;  // help text or parse error
};

cli_args cli_parse(int argc, char **argv);

}  // namespace embedpy
