#include "extract.h"

#include "tui.h"
#include "util.h"

#include "archive.h"
#include "archive_entry.h"

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

namespace embedpy {
namespace {

struct read_archive_free {
  void operator()(archive *a) const { archive_read_free(a); }
};

struct write_archive_free {
  void operator()(archive *a) const { archive_write_free(a); }
};

using reader_ptr = std::unique_ptr<archive, read_archive_free>;
using writer_ptr = std::unique_ptr<archive, write_archive_free>;

constexpr int kDiskFlags{ ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                          ARCHIVE_EXTRACT_SECURE_SYMLINKS };

[[noreturn]] void throw_archive_error(archive *a, std::string const &what) {
  char const *detail{ archive_error_string(a) };
  throw std::runtime_error(what + ": " + (detail ? detail : "unknown error"));
}

// Relative, non-escaping entry path or throw.
std::filesystem::path checked_entry_path(char const *name) {
  if (!name) { throw std::runtime_error("archive entry without a name"); }

  std::filesystem::path const rel{ name };
  if (rel.has_root_name() || rel.has_root_directory()) {
    throw std::runtime_error(std::string{ "archive entry has absolute path: " } + name);
  }
  for (auto const &part : rel) {
    if (part == "..") {
      throw std::runtime_error(std::string{ "archive entry escapes destination: " } + name);
    }
  }
  return rel;
}

void copy_entry_data(archive *in, archive *out, std::uint64_t &bytes) {
  void const *block{ nullptr };
  size_t size{ 0 };
  la_int64_t offset{ 0 };

  for (;;) {
    int const r{ archive_read_data_block(in, &block, &size, &offset) };
    if (r == ARCHIVE_EOF) { return; }
    if (r != ARCHIVE_OK) { throw_archive_error(in, "cannot read entry data"); }
    if (archive_write_data_block(out, block, size, offset) != ARCHIVE_OK) {
      throw_archive_error(out, "cannot write entry data");
    }
    bytes += size;
  }
}

}  // namespace

std::uint64_t extract(std::filesystem::path const &archive_path,
                      std::filesystem::path const &destination) {
  reader_ptr const in{ archive_read_new() };
  writer_ptr const out{ archive_write_disk_new() };
  if (!in || !out) { throw std::runtime_error("libarchive allocation failed"); }

  archive_read_support_format_all(in.get());
  archive_read_support_filter_all(in.get());
  archive_write_disk_set_options(out.get(), kDiskFlags);
  archive_write_disk_set_standard_lookup(out.get());

  if (archive_read_open_filename(in.get(), archive_path.string().c_str(), 64 * 1024) !=
      ARCHIVE_OK) {
    throw_archive_error(in.get(), "cannot open " + archive_path.string());
  }

  std::filesystem::create_directories(destination);

  std::uint64_t files{ 0 };
  std::uint64_t bytes{ 0 };
  archive_entry *entry{ nullptr };

  for (;;) {
    int const r{ archive_read_next_header(in.get(), &entry) };
    if (r == ARCHIVE_EOF) { break; }
    if (r != ARCHIVE_OK) { throw_archive_error(in.get(), "corrupt archive"); }

    auto const target{ (destination / checked_entry_path(archive_entry_pathname(entry)))
                           .string() };
    archive_entry_copy_pathname(entry, target.c_str());
    if (char const *link{ archive_entry_hardlink(entry) }) {
      auto const link_target{ (destination / checked_entry_path(link)).string() };
      archive_entry_copy_hardlink(entry, link_target.c_str());
    }

    int const wr{ archive_write_header(out.get(), entry) };
    if (wr < ARCHIVE_WARN) { throw_archive_error(out.get(), "cannot create " + target); }
    if (archive_entry_size(entry) > 0) { copy_entry_data(in.get(), out.get(), bytes); }
    if (archive_write_finish_entry(out.get()) < ARCHIVE_WARN) {
      throw_archive_error(out.get(), "cannot finish " + target);
    }

    if (archive_entry_filetype(entry) == AE_IFREG) { ++files; }
  }

  if (archive_write_close(out.get()) != ARCHIVE_OK) {
    throw_archive_error(out.get(), "cannot finalize extraction");
  }

  if (files == 0) {
    throw std::runtime_error("no files extracted from " + archive_path.filename().string());
  }

  tui::debug("extracted %llu files (%s) from %s",
             static_cast<unsigned long long>(files),
             util_format_bytes(bytes).c_str(),
             archive_path.filename().string().c_str());
  return files;
}

}  // namespace embedpy
