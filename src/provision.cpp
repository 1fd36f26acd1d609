#include "provision.h"

#include "dist_layout.h"
#include "errors.h"
#include "phases/phase_locate.h"
#include "phases/phase_merge.h"
#include "phases/phase_patch.h"
#include "phases/phase_requirements.h"
#include "phases/phase_resolve.h"
#include "platform.h"
#include "process.h"
#include "tui.h"
#include "util.h"

#include <exception>
#include <filesystem>
#include <string>
#include <system_error>

namespace embedpy {

namespace {

void check_version_record(dist_layout const &layout, py_version const &v) {
  std::error_code ec;
  if (!std::filesystem::exists(layout.version_record(), ec)) { return; }

  std::string recorded;
  try {
    recorded = util_load_file(layout.version_record());
  } catch (std::exception const &e) {
    tui::warn("could not read %s: %s", layout.version_record().string().c_str(), e.what());
    return;
  }

  std::string const requested{ py_version_format(v) };
  if (util_trim(recorded) != requested) {
    tui::warn("%s holds python %s but %s was requested; reusing existing installation",
              layout.root.string().c_str(),
              std::string{ util_trim(recorded) }.c_str(),
              requested.c_str());
  }
}

void write_version_record(dist_layout const &layout, py_version const &v) {
  try {
    util_write_file(layout.version_record(), py_version_format(v) + "\n");
  } catch (std::exception const &e) {
    tui::warn("could not record version in %s: %s",
              layout.version_record().string().c_str(),
              e.what());
  }
}

void assemble(provision_cfg const &cfg,
              dist_layout const &layout,
              py_version const &v,
              std::optional<std::string> const &search_path,
              process_env_t const &child_env) {
  auto const libs_dir{ phase_locate(v, search_path) };

  std::error_code ec;
  std::filesystem::create_directories(layout.root, ec);
  if (ec) {
    throw provision_error(error_kind::copy,
                          "failed to create " + layout.root.string() + ": " + ec.message());
  }

  download_fn_t const download{ cfg.download ? cfg.download
                                             : fetch_default_downloader(cfg.download_timeout) };

  phase_fetch(v, layout.root, cfg.mirror, download);
  phase_merge(libs_dir, layout.root);
  phase_patch(v, layout.root);
  phase_bootstrap({ .layout = layout,
                    .get_pip_url = cfg.get_pip_url,
                    .download = download,
                    .child_env = child_env,
                    .timeout = cfg.tool_timeout });

  write_version_record(layout, v);
}

}  // namespace

provision_result provision(provision_cfg const &cfg) {
  process_env_t const parent_env{ process_getenv() };
  std::optional<std::string> const search_path{
    cfg.search_path ? cfg.search_path : process_env_lookup(parent_env, platform::kPathVar)
  };

  py_version const v{ phase_resolve(cfg.version,
                                    { .python = cfg.host_python,
                                      .search_path = search_path,
                                      .timeout = cfg.tool_timeout }) };

  dist_layout const layout{ dist_layout_for(cfg.target) };
  process_env_t const child_env{ dist_child_env(parent_env, layout) };

  provision_result result{ .version = v, .root = layout.root };

  if (std::filesystem::exists(layout.marker())) {
    tui::info("Found %s, skipping download", layout.marker().string().c_str());
    check_version_record(layout, v);
  } else {
    assemble(cfg, layout, v, search_path, child_env);
    result.assembled = true;
  }

  if (cfg.requirements) {
    phase_requirements(layout.marker(),
                       layout.root,
                       *cfg.requirements,
                       child_env,
                       cfg.tool_timeout);
  }

  tui::info("Done!");
  return result;
}

}  // namespace embedpy
