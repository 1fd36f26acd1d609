#include "phase_patch.h"

#include "dist_layout.h"
#include "errors.h"
#include "tui.h"
#include "util.h"

#include <exception>
#include <string>
#include <string_view>

namespace embedpy {

namespace {

constexpr std::string_view kCommentedDirective{ "#import site" };
constexpr std::string_view kActiveDirective{ "import site" };

bool has_active_directive(std::string_view text) {
  while (!text.empty()) {
    size_t const eol{ text.find('\n') };
    std::string_view const line{ text.substr(0, eol) };
    if (util_trim(line) == kActiveDirective) { return true; }
    if (eol == std::string_view::npos) { break; }
    text.remove_prefix(eol + 1);
  }
  return false;
}

}  // namespace

void phase_patch(py_version const &v, std::filesystem::path const &target) {
  tui::info("Enabling import site...");

  auto const pth_path{ dist_layout_for(target).pth_file(v) };

  std::string text;
  try {
    text = util_load_file(pth_path);
  } catch (std::exception const &e) {
    throw provision_error(error_kind::patch,
                          "cannot read " + pth_path.string() + ": " + e.what());
  }

  size_t const pos{ text.find(kCommentedDirective) };
  if (pos == std::string::npos) {
    if (has_active_directive(text)) {
      tui::debug("%s already enables import site", pth_path.string().c_str());
      return;
    }
    throw provision_error(error_kind::patch,
                          std::string{ "'" } + std::string{ kCommentedDirective } +
                              "' not found in " + pth_path.string());
  }

  text.erase(pos, 1);  // drop '#'

  try {
    util_write_file(pth_path, text);
  } catch (std::exception const &e) {
    throw provision_error(error_kind::patch,
                          "cannot write " + pth_path.string() + ": " + e.what());
  }
}

}  // namespace embedpy
