#include "cli.h"
#include "termination.h"
#include "tui.h"

#include <cstdlib>
#include <exception>
#include <variant>

int main(int argc, char **argv) {
  embedpy::tui::init();

  auto args{ embedpy::cli_parse(argc, argv) };
  embedpy::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      embedpy::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    embedpy::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  try {
    embedpy::termination_handler_install();

    auto cmd{ std::visit([](auto const &cfg) { return embedpy::cmd::create(cfg); },
                         *args.cmd_cfg) };
    cmd->execute();
  } catch (std::exception const &ex) {
    embedpy::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
