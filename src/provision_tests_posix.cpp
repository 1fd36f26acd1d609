#if defined(_WIN32)
#error POSIX-only
#endif

#include "provision.h"

#include "errors.h"
#include "test_support.h"
#include "util.h"

#include "doctest/doctest.h"

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr char kFakePython[]{
  "#!/bin/sh\n"
  "d=${0%/*}\n"
  "[ \"$2\" = --no-warn-script-location ] || exit 5\n"
  "printf '%s\\n' \"$PATH\" > \"$d/child-path.txt\"\n"
  "/bin/mkdir -p \"$d/Scripts\"\n"
  "/bin/cp \"$d/pip-template\" \"$d/Scripts/pip\"\n"
  "/bin/chmod 755 \"$d/Scripts/pip\"\n"
  "echo Successfully installed pip\n"
};

constexpr char kFakePip[]{
  "#!/bin/sh\n"
  "[ \"$1\" = install ] && [ \"$2\" = -r ] || exit 2\n"
  "if [ ! -f \"$3\" ]; then\n"
  "  echo \"ERROR: Could not open requirements file: $3\" 1>&2\n"
  "  exit 1\n"
  "fi\n"
  "d=${0%/*}\n"
  "/bin/cp \"$3\" \"$d/../requirements-installed.txt\"\n"
};

struct provision_fixture {
  fs::path root{ embedpy::test::make_temp_dir("embedpy-provision-test") };
  embedpy::scoped_path_cleanup cleanup{ root };
  fs::path fixture_zip{ root / "fixture.zip" };
  fs::path host_dir{ root / "host" / "Python39" };
  fs::path target{ root / "pydist" };
  std::vector<std::string> urls;

  provision_fixture() {
    embedpy::test::write_zip(
        fixture_zip,
        { { .path = "python", .content = kFakePython, .executable = true },
          { .path = "pip-template", .content = kFakePip, .executable = true },
          { .path = "python39._pth",
            .content = "python39.zip\n.\n\n# Uncomment to run site.main() automatically\n"
                       "#import site\n" },
          { .path = "python39.zip", .content = "stdlib" } });

    fs::create_directories(host_dir / "libs");
    embedpy::util_write_file(host_dir / "libs" / "python39.lib", "import library");
    embedpy::util_write_file(host_dir / "libs" / "python39._pth", "HOST COPY");
  }

  embedpy::provision_cfg cfg(std::optional<std::string> version = "3.9.7") {
    embedpy::provision_cfg c{};
    c.target = target;
    c.version = std::move(version);
    c.search_path = (root / "elsewhere").string() + ":" + host_dir.string();
    c.download = [this](std::string const &url, fs::path const &dest) {
      urls.push_back(url);
      if (url.ends_with(".zip")) {
        fs::copy_file(fixture_zip, dest);
      } else {
        embedpy::util_write_file(dest, "# get-pip\n");
      }
    };
    return c;
  }
};

// Lines of `log` that appear in `wanted`, in logged order.
std::vector<std::string> progress_lines(std::vector<std::string> const &log,
                                        std::vector<std::string> const &wanted) {
  std::vector<std::string> out;
  std::ranges::copy_if(log, std::back_inserter(out), [&](std::string const &line) {
    return std::ranges::find(wanted, line) != wanted.end();
  });
  return out;
}

embedpy::error_kind provision_failure_kind(embedpy::provision_cfg const &cfg) {
  try {
    embedpy::provision(cfg);
  } catch (embedpy::provision_error const &e) {
    return e.kind();
  }
  FAIL("expected provision to throw");
  return embedpy::error_kind::copy;
}

}  // namespace

TEST_CASE_FIXTURE(provision_fixture, "provision assembles a distribution end to end") {
  auto const result{ embedpy::provision(cfg()) };

  CHECK(result.assembled);
  CHECK(result.version == embedpy::py_version{ 3, 9, 7 });
  CHECK(result.root == target);

  REQUIRE(urls.size() == 2);
  CHECK(urls[0] == "https://www.python.org/ftp/python/3.9.7/python-3.9.7-embed-amd64.zip");
  CHECK(urls[1] == "https://bootstrap.pypa.io/get-pip.py");

  CHECK(fs::is_regular_file(target / "python"));
  CHECK(fs::is_regular_file(target / "Scripts" / "pip"));
  CHECK(embedpy::test::read_text(target / "python39._pth") ==
        "python39.zip\n.\n\n# Uncomment to run site.main() automatically\nimport site\n");
  CHECK(embedpy::test::read_text(target / "libs" / "python39.lib") == "import library");
  CHECK(embedpy::test::read_text(target / "libs" / "python39._pth") == "HOST COPY");
  CHECK(embedpy::test::read_text(target / "child-path.txt") ==
        target.string() + ":" + (target / "Scripts").string() + "\n");
  CHECK(embedpy::test::read_text(target / "embedpy-version.txt") == "3.9.7\n");
  CHECK_FALSE(fs::exists(target / "get-pip.py"));
  CHECK_FALSE(fs::exists(target / "python-3.9.7-embed-amd64.zip"));
}

TEST_CASE_FIXTURE(provision_fixture, "provision reports each phase in order") {
  auto const requirements{ root / "requirements.txt" };
  embedpy::util_write_file(requirements, "six\n");
  auto c{ cfg() };
  c.requirements = requirements;

  std::vector<std::string> const phases{ "Downloading zip file...",
                                         "Copying libs...",
                                         "Enabling import site...",
                                         "Downloading get-pip...",
                                         "Installing pip...",
                                         "Installing requirements...",
                                         "Done!" };

  embedpy::test::log_capture log;
  embedpy::provision(c);
  auto const &lines{ log.lines() };

  CHECK(progress_lines(lines, phases) == phases);
  CHECK(std::ranges::find(lines, "Successfully installed pip") != lines.end());
}

TEST_CASE_FIXTURE(provision_fixture, "provision reports reuse of an existing distribution") {
  embedpy::provision(cfg());

  embedpy::test::log_capture log;
  embedpy::provision(cfg());

  auto const found{ "Found " + (target / "Scripts" / "pip").string() + ", skipping download" };
  CHECK(log.lines() == std::vector<std::string>{ found, "Done!" });
}

TEST_CASE_FIXTURE(provision_fixture, "provision reuses an existing distribution") {
  embedpy::provision(cfg());
  urls.clear();

  auto const requirements{ root / "requirements.txt" };
  embedpy::util_write_file(requirements, "requests==2.31.0\n");

  auto c{ cfg() };
  c.requirements = requirements;
  auto const result{ embedpy::provision(c) };

  CHECK_FALSE(result.assembled);
  CHECK(urls.empty());
  CHECK(embedpy::test::read_text(target / "requirements-installed.txt") ==
        "requests==2.31.0\n");
}

TEST_CASE_FIXTURE(provision_fixture, "provision reuse skips the host lookup") {
  embedpy::provision(cfg());
  urls.clear();

  auto c{ cfg() };
  c.search_path = std::string{};
  CHECK_FALSE(embedpy::provision(c).assembled);
  CHECK(urls.empty());
}

TEST_CASE_FIXTURE(provision_fixture, "provision keeps a mismatched distribution") {
  embedpy::provision(cfg());
  urls.clear();

  auto const result{ embedpy::provision(cfg("3.9.8")) };

  CHECK_FALSE(result.assembled);
  CHECK(urls.empty());
  CHECK(embedpy::test::read_text(target / "embedpy-version.txt") == "3.9.7\n");
}

TEST_CASE_FIXTURE(provision_fixture, "provision fails before downloading without a host") {
  auto c{ cfg() };
  c.search_path = (root / "elsewhere").string();

  try {
    embedpy::provision(c);
    FAIL("expected provision to throw");
  } catch (embedpy::provision_error const &e) {
    CHECK(e.kind() == embedpy::error_kind::not_found);
    CHECK(std::string{ e.what() }.find("Python39") != std::string::npos);
  }
  CHECK(urls.empty());
  CHECK_FALSE(fs::exists(target));
}

TEST_CASE_FIXTURE(provision_fixture, "provision rejects a malformed version untouched") {
  CHECK(provision_failure_kind(cfg("3.9")) == embedpy::error_kind::invalid_format);
  CHECK(urls.empty());
  CHECK_FALSE(fs::exists(target));
}

TEST_CASE_FIXTURE(provision_fixture, "provision surfaces a missing requirements file") {
  auto c{ cfg() };
  c.requirements = root / "no-such-requirements.txt";

  try {
    embedpy::provision(c);
    FAIL("expected provision to throw");
  } catch (embedpy::provision_error const &e) {
    CHECK(e.kind() == embedpy::error_kind::tool_execution);
    CHECK(e.output().find("Could not open requirements file") != std::string::npos);
  }
  CHECK(fs::exists(target / "Scripts" / "pip"));
}
