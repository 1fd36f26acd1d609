#pragma once

#include "cmd.h"
#include "provision.h"

namespace embedpy {

class cmd_provision : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_provision> {
    provision_cfg provision;
  };

  explicit cmd_provision(cfg cfg);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace embedpy
