#include "phase_patch.h"

#include "errors.h"
#include "test_support.h"
#include "util.h"

#include "doctest/doctest.h"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace {

embedpy::error_kind patch_failure_kind(fs::path const &target) {
  try {
    embedpy::phase_patch({ 3, 9, 7 }, target);
  } catch (embedpy::provision_error const &e) {
    return e.kind();
  }
  FAIL("expected phase_patch to throw");
  return embedpy::error_kind::copy;
}

}  // namespace

TEST_CASE("phase_patch uncomments import site and keeps other bytes") {
  auto const dist{ embedpy::test::make_temp_dir("embedpy-patch-test") };
  embedpy::scoped_path_cleanup cleanup{ dist };

  std::string const before{
    "python39.zip\r\n.\r\n\r\n# Uncomment to run site.main() automatically\r\n#import site\r\n"
  };
  embedpy::util_write_file(dist / "python39._pth", before);

  embedpy::phase_patch({ 3, 9, 7 }, dist);

  CHECK(embedpy::test::read_text(dist / "python39._pth") ==
        "python39.zip\r\n.\r\n\r\n# Uncomment to run site.main() automatically\r\nimport site\r\n");
}

TEST_CASE("phase_patch only touches the first directive") {
  auto const dist{ embedpy::test::make_temp_dir("embedpy-patch-test") };
  embedpy::scoped_path_cleanup cleanup{ dist };
  embedpy::util_write_file(dist / "python310._pth", "#import site\n#import site\n");

  embedpy::phase_patch({ 3, 10, 2 }, dist);

  CHECK(embedpy::test::read_text(dist / "python310._pth") == "import site\n#import site\n");
}

TEST_CASE("phase_patch accepts an already active directive") {
  auto const dist{ embedpy::test::make_temp_dir("embedpy-patch-test") };
  embedpy::scoped_path_cleanup cleanup{ dist };
  embedpy::util_write_file(dist / "python39._pth", "python39.zip\n.\nimport site\n");

  CHECK_NOTHROW(embedpy::phase_patch({ 3, 9, 7 }, dist));
  CHECK(embedpy::test::read_text(dist / "python39._pth") == "python39.zip\n.\nimport site\n");
}

TEST_CASE("phase_patch fails when the file is missing") {
  auto const dist{ embedpy::test::make_temp_dir("embedpy-patch-test") };
  embedpy::scoped_path_cleanup cleanup{ dist };

  CHECK(patch_failure_kind(dist) == embedpy::error_kind::patch);
}

TEST_CASE("phase_patch fails when the directive is missing") {
  auto const dist{ embedpy::test::make_temp_dir("embedpy-patch-test") };
  embedpy::scoped_path_cleanup cleanup{ dist };
  embedpy::util_write_file(dist / "python39._pth", "python39.zip\n.\n");

  CHECK(patch_failure_kind(dist) == embedpy::error_kind::patch);
  CHECK(embedpy::test::read_text(dist / "python39._pth") == "python39.zip\n.\n");
}
