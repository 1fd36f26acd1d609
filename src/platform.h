#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif

#include <windows.h>
#endif

namespace embedpy::platform {

// Separator between entries of the PATH environment variable.
constexpr char kPathListSeparator{
#ifdef _WIN32
  ';'
#else
  ':'
#endif
};

// Name of the search-path environment variable.
constexpr char const kPathVar[]{ "PATH" };

// Appends the native executable suffix (".exe" on Windows) to `stem`.
std::string exe_name(std::string_view stem);

// True if `path` names a regular file the current user may execute.
bool is_executable(std::filesystem::path const &path);


}  // namespace embedpy::platform
