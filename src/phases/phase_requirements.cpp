#include "phase_requirements.h"

#include "tool_run.h"
#include "tui.h"

namespace embedpy {

void phase_requirements(std::filesystem::path const &pip,
                        std::filesystem::path const &target,
                        std::filesystem::path const &manifest,
                        process_env_t const &child_env,
                        std::chrono::seconds timeout) {
  tui::info("Installing requirements...");

  tool_run({ .label = "pip install",
             .argv = { pip.string(),
                       "install",
                       "-r",
                       std::filesystem::absolute(manifest).string() },
             .env = child_env,
             .cwd = target,
             .timeout = timeout });
}

}  // namespace embedpy
