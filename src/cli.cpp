#include "cli.h"

#include "tui.h"

#include "CLI/CLI.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace embedpy {

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "embedpy - assemble a redistributable embedded Python distribution" };
  // Disable Windows-style '/' option prefixes so absolute POSIX-style paths
  // like "/tmp/dist" are treated as positional arguments on Windows.
  app.allow_windows_style_options(false);

  bool verbose{ false };
  app.add_flag(
      "--verbose",
      verbose,
      "Enable decorated verbose logging (prefix stderr lines with timestamp and level)");

  bool version_flag{ false };
  app.add_flag("-v,--version", version_flag, "Show version information");

  provision_cfg pcfg{};
  app.add_option("output_dir", pcfg.target, "Output directory")
      ->capture_default_str();
  app.add_option("-p,--py-version",
                 pcfg.version,
                 "Python version (e.g. 3.9.7); detected from the host python if omitted");
  app.add_option("-r,--requirements",
                 pcfg.requirements,
                 "requirements.txt to install into the distribution");
  app.add_option("--python", pcfg.host_python, "Host python used for version detection")
      ->envname("EMBEDPY_HOST_PYTHON")
      ->capture_default_str();
  app.add_option("--mirror", pcfg.mirror, "Base URL of the python.org FTP layout")
      ->envname("EMBEDPY_PYTHON_MIRROR")
      ->capture_default_str();
  app.add_option("--get-pip-url", pcfg.get_pip_url, "URL of the get-pip.py bootstrap")
      ->envname("EMBEDPY_GET_PIP_URL")
      ->capture_default_str();

  int download_timeout{ 0 };
  int tool_timeout{ 0 };
  app.add_option("--download-timeout",
                 download_timeout,
                 "Seconds allowed per download (0 = no limit)")
      ->check(CLI::NonNegativeNumber)
      ->capture_default_str();
  app.add_option("--tool-timeout",
                 tool_timeout,
                 "Seconds allowed per python/pip invocation (0 = no limit)")
      ->check(CLI::NonNegativeNumber)
      ->capture_default_str();

  cli_args args{};

  bool parsed{ false };
  try {
    app.parse(argc, argv);
    parsed = true;
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
  } catch (CLI::ParseError const &e) { args.cli_output = std::string(e.what()); }

  if (verbose) {
    args.verbosity = tui::level::TUI_DEBUG;
    args.decorated_logging = true;
  } else {
    args.verbosity = tui::level::TUI_INFO;
    args.decorated_logging = false;
  }

  if (!parsed) { return args; }

  if (version_flag) {
    args.cmd_cfg = cmd_version::cfg{};
    return args;
  }

  pcfg.download_timeout = std::chrono::seconds{ download_timeout };
  pcfg.tool_timeout = std::chrono::seconds{ tool_timeout };

  cmd_provision::cfg provision_cmd_cfg{};
  provision_cmd_cfg.provision = std::move(pcfg);
  args.cmd_cfg = std::move(provision_cmd_cfg);
  return args;
}

}  // namespace embedpy
