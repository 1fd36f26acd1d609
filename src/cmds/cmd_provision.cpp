#include "cmd_provision.h"

#include "tui.h"

namespace embedpy {

cmd_provision::cmd_provision(cmd_provision::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_provision::execute() {
  auto const result{ provision(cfg_.provision) };
  tui::debug("python %s %s at %s",
             py_version_format(result.version).c_str(),
             result.assembled ? "assembled" : "reused",
             result.root.string().c_str());
}

}  // namespace embedpy
