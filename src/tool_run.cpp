#include "tool_run.h"

#include "tui.h"

#include <string>
#include <system_error>

namespace embedpy {

namespace {

std::string join_output(process_result const &result) {
  std::string out;
  for (auto const &line : result.stdout_lines) { out += line + "\n"; }
  for (auto const &line : result.stderr_lines) { out += line + "\n"; }
  return out;
}

void echo_stream(std::string const &label,
                 char const *stream_name,
                 std::vector<std::string> const &lines) {
  tui::info("%s %s:", label.c_str(), stream_name);
  for (auto const &line : lines) { tui::info("%s", line.c_str()); }
}

}  // namespace

process_result tool_run(tool_invocation const &inv) {
  tui::debug("%s: running %s", inv.label.c_str(), inv.argv.front().c_str());

  process_result result;
  try {
    result = process_run(inv.argv,
                         process_run_cfg{ .cwd = inv.cwd,
                                          .env = inv.env,
                                          .timeout = inv.timeout });
  } catch (std::system_error const &e) {
    throw provision_error(inv.failure_kind,
                          inv.label + ": failed to start " + inv.argv.front() + ": " +
                              e.what());
  }

  echo_stream(inv.label, "stdout", result.stdout_lines);
  echo_stream(inv.label, "stderr", result.stderr_lines);

  if (result.timed_out) {
    throw provision_error(inv.failure_kind,
                          inv.label + " timed out after " +
                              std::to_string(inv.timeout.count()) + "s",
                          join_output(result));
  }

  if (result.exit_code != 0) {
    std::string msg{ inv.label + " failed" };
    if (result.signal) {
      msg += " (terminated by signal " + std::to_string(*result.signal) + ")";
    } else {
      msg += " (exit code " + std::to_string(result.exit_code) + ")";
    }
    throw provision_error(inv.failure_kind, msg, join_output(result));
  }

  return result;
}

}  // namespace embedpy
