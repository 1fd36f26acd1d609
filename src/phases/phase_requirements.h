#pragma once

#include "process.h"

#include <chrono>
#include <filesystem>

namespace embedpy {

// `<pip> install -r <manifest>` with the distribution's child environment. The
// manifest is passed through unchecked; pip reports a missing file itself.
void phase_requirements(std::filesystem::path const &pip,
                        std::filesystem::path const &target,
                        std::filesystem::path const &manifest,
                        process_env_t const &child_env,
                        std::chrono::seconds timeout);

}  // namespace embedpy
