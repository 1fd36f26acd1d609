#include "phase_bootstrap.h"

#include "errors.h"
#include "tool_run.h"
#include "tui.h"

#include <filesystem>
#include <system_error>

namespace embedpy {

void phase_bootstrap(bootstrap_cfg const &cfg) {
  auto const script{ cfg.layout.bootstrap_script() };

  tui::info("Downloading get-pip...");
  fetch_file(cfg.download, cfg.get_pip_url, script);

  tui::info("Installing pip...");
  struct script_remover {
    std::filesystem::path path;
    ~script_remover() {
      std::error_code ec;
      if (!std::filesystem::remove(path, ec) && ec) {
        tui::debug("could not remove %s: %s", path.string().c_str(), ec.message().c_str());
      }
    }
  } const remover{ script };

  tool_run({ .label = "get-pip",
             .argv = { cfg.layout.interpreter().string(),
                       script.string(),
                       "--no-warn-script-location" },
             .env = cfg.child_env,
             .cwd = cfg.layout.root,
             .timeout = cfg.timeout });

  if (!std::filesystem::exists(cfg.layout.marker())) {
    throw provision_error(error_kind::tool_execution,
                          "get-pip finished but " + cfg.layout.marker().string() +
                              " was not created");
  }
}

}  // namespace embedpy
