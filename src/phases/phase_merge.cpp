#include "phase_merge.h"

#include "errors.h"
#include "tui.h"

#include <string>
#include <system_error>

namespace embedpy {

namespace {

[[noreturn]] void throw_copy_error(std::string const &what,
                                   std::filesystem::path const &path,
                                   std::error_code const &ec) {
  throw provision_error(error_kind::copy, what + " " + path.string() + ": " + ec.message());
}

}  // namespace

std::uint64_t phase_merge(std::filesystem::path const &libs_dir,
                          std::filesystem::path const &target) {
  tui::info("Copying libs...");

  auto const dest_dir{ target / "libs" };
  std::error_code ec;
  std::filesystem::create_directories(dest_dir, ec);
  if (ec) { throw_copy_error("failed to create", dest_dir, ec); }

  std::filesystem::directory_iterator it{ libs_dir, ec };
  if (ec) { throw_copy_error("failed to read", libs_dir, ec); }

  std::uint64_t copied{ 0 };
  while (it != std::filesystem::directory_iterator{}) {
    auto const &src{ it->path() };
    auto const dest{ dest_dir / src.filename() };

    auto const dest_status{ std::filesystem::symlink_status(dest, ec) };
    if (dest_status.type() == std::filesystem::file_type::none) {
      throw_copy_error("failed to stat", dest, ec);
    }

    if (std::filesystem::exists(dest_status)) {
      tui::debug("merge: keeping existing %s", dest.string().c_str());
    } else {
      ec.clear();
      if (it->is_directory(ec)) {
        std::filesystem::copy(src, dest, std::filesystem::copy_options::recursive, ec);
      } else if (!ec) {
        std::filesystem::copy_file(src, dest, ec);
      }
      if (ec) { throw_copy_error("failed to copy " + src.string() + " to", dest, ec); }
      ++copied;
    }

    it.increment(ec);
    if (ec) { throw_copy_error("failed to read", libs_dir, ec); }
  }

  tui::debug("merge: copied %llu entries from %s",
             static_cast<unsigned long long>(copied),
             libs_dir.string().c_str());
  return copied;
}

}  // namespace embedpy
