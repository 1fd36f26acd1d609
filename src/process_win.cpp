#if !defined(_WIN32)
#error "process_win.cpp should only be compiled on Windows builds"
#else

#include "process.h"

#include "platform.h"

#include <algorithm>
#include <chrono>
#include <cwchar>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>
#include <vector>

namespace embedpy {
namespace {

constexpr UINT kKilledExitCode{ 1 };

struct handle_close {
  void operator()(HANDLE h) const {
    if (h && h != INVALID_HANDLE_VALUE) { ::CloseHandle(h); }
  }
};
using handle_ptr = std::unique_ptr<std::remove_pointer_t<HANDLE>, handle_close>;

[[noreturn]] void throw_win32(DWORD err, char const *what) {
  throw std::system_error(static_cast<int>(err), std::system_category(), what);
}

std::wstring widen(std::string_view s) {
  if (s.empty()) { return {}; }
  int const n{
    ::MultiByteToWideChar(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), nullptr, 0)
  };
  if (n <= 0) { throw_win32(::GetLastError(), "MultiByteToWideChar"); }
  std::wstring out(static_cast<std::size_t>(n), L'\0');
  ::MultiByteToWideChar(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), out.data(), n);
  return out;
}

std::string narrow(std::wstring_view s) {
  if (s.empty()) { return {}; }
  int const n{ ::WideCharToMultiByte(
      CP_UTF8, 0, s.data(), static_cast<int>(s.size()), nullptr, 0, nullptr, nullptr) };
  if (n <= 0) { throw_win32(::GetLastError(), "WideCharToMultiByte"); }
  std::string out(static_cast<std::size_t>(n), '\0');
  ::WideCharToMultiByte(
      CP_UTF8, 0, s.data(), static_cast<int>(s.size()), out.data(), n, nullptr, nullptr);
  return out;
}

// "KEY=VALUE\0...\0\0", sorted case-insensitively as CreateProcessW expects.
std::wstring environment_block(process_env_t const &env) {
  std::vector<std::wstring> entries;
  for (auto const &[key, value] : env) { entries.push_back(widen(key + "=" + value)); }
  std::ranges::sort(entries, [](auto const &a, auto const &b) {
    return ::_wcsicmp(a.c_str(), b.c_str()) < 0;
  });

  std::wstring block;
  for (auto const &entry : entries) {
    block += entry;
    block.push_back(L'\0');
  }
  if (block.empty()) { block.push_back(L'\0'); }
  block.push_back(L'\0');
  return block;
}

// CommandLineToArgvW quoting rules.
void append_quoted(std::wstring &cmd, std::wstring const &arg) {
  if (!arg.empty() && arg.find_first_of(L" \t\"") == std::wstring::npos) {
    cmd += arg;
    return;
  }

  cmd.push_back(L'"');
  std::size_t backslashes{ 0 };
  for (wchar_t const c : arg) {
    if (c == L'\\') {
      ++backslashes;
      continue;
    }
    cmd.append(c == L'"' ? backslashes * 2 + 1 : backslashes, L'\\');
    backslashes = 0;
    cmd.push_back(c);
  }
  cmd.append(backslashes * 2, L'\\');
  cmd.push_back(L'"');
}

// Job whose processes all die when the handle closes.
handle_ptr make_job() {
  handle_ptr job{ ::CreateJobObjectW(nullptr, nullptr) };
  if (!job) { throw_win32(::GetLastError(), "CreateJobObjectW"); }

  JOBOBJECT_EXTENDED_LIMIT_INFORMATION limits{};
  limits.BasicLimitInformation.LimitFlags = JOB_OBJECT_LIMIT_KILL_ON_JOB_CLOSE;
  if (!::SetInformationJobObject(job.get(),
                                 JobObjectExtendedLimitInformation,
                                 &limits,
                                 sizeof limits)) {
    throw_win32(::GetLastError(), "SetInformationJobObject");
  }
  return job;
}

// Inheritable write end for the child, private read end for us.
void make_pipe(handle_ptr &read_end, handle_ptr &write_end) {
  SECURITY_ATTRIBUTES sa{ .nLength = sizeof sa, .bInheritHandle = TRUE };
  HANDLE r{ nullptr };
  HANDLE w{ nullptr };
  if (!::CreatePipe(&r, &w, &sa, 0)) { throw_win32(::GetLastError(), "CreatePipe"); }
  read_end.reset(r);
  write_end.reset(w);
  if (!::SetHandleInformation(r, HANDLE_FLAG_INHERIT, 0)) {
    throw_win32(::GetLastError(), "SetHandleInformation");
  }
}

std::string read_all(HANDLE pipe) {
  std::string out;
  char buf[8192];
  for (;;) {
    DWORD n{ 0 };
    if (!::ReadFile(pipe, buf, sizeof buf, &n, nullptr)) {
      DWORD const err{ ::GetLastError() };
      if (err == ERROR_BROKEN_PIPE || err == ERROR_HANDLE_EOF) { break; }
      throw_win32(err, "ReadFile");
    }
    if (n == 0) { break; }
    out.append(buf, n);
  }
  return out;
}

}  // namespace

process_env_t process_getenv() {
  std::unique_ptr<wchar_t, decltype(&::FreeEnvironmentStringsW)> block{
    ::GetEnvironmentStringsW(), &::FreeEnvironmentStringsW
  };

  process_env_t env;
  for (wchar_t const *p{ block.get() }; p && *p; p += std::wcslen(p) + 1) {
    std::wstring_view const kv{ p };
    auto const eq{ kv.find(L'=', 1) };  // "=C:=C:\x" entries start with '='
    if (eq != std::wstring_view::npos && kv.front() != L'=') {
      env.emplace(narrow(kv.substr(0, eq)), narrow(kv.substr(eq + 1)));
    }
  }
  return env;
}

process_result process_run(std::vector<std::string> const &argv,
                           process_run_cfg const &cfg) {
  if (argv.empty()) { throw std::invalid_argument("process_run: empty argv"); }

  std::filesystem::path const program{ widen(argv[0]) };
  if (!platform::is_executable(program)) {
    throw std::system_error(std::make_error_code(std::errc::no_such_file_or_directory),
                            "not an executable file: " + argv[0]);
  }

  std::wstring cmd;
  for (auto const &arg : argv) {
    if (!cmd.empty()) { cmd.push_back(L' '); }
    append_quoted(cmd, widen(arg));
  }
  std::wstring env{ environment_block(cfg.env) };
  std::wstring const cwd{ cfg.cwd ? cfg.cwd->wstring() : std::wstring{} };

  handle_ptr out_read, out_write, err_read, err_write;
  make_pipe(out_read, out_write);
  make_pipe(err_read, err_write);

  SECURITY_ATTRIBUTES inherit{ .nLength = sizeof inherit, .bInheritHandle = TRUE };
  handle_ptr null_in{ ::CreateFileW(L"NUL",
                                    GENERIC_READ,
                                    FILE_SHARE_READ | FILE_SHARE_WRITE,
                                    &inherit,
                                    OPEN_EXISTING,
                                    0,
                                    nullptr) };
  if (null_in.get() == INVALID_HANDLE_VALUE) { throw_win32(::GetLastError(), "CreateFileW NUL"); }

  handle_ptr const job{ make_job() };

  STARTUPINFOW si{ .cb = sizeof si };
  si.dwFlags = STARTF_USESTDHANDLES;
  si.hStdInput = null_in.get();
  si.hStdOutput = out_write.get();
  si.hStdError = err_write.get();

  PROCESS_INFORMATION pi{};
  if (!::CreateProcessW(program.c_str(),
                        cmd.data(),
                        nullptr,
                        nullptr,
                        TRUE,
                        CREATE_UNICODE_ENVIRONMENT | CREATE_NO_WINDOW | CREATE_SUSPENDED,
                        env.data(),
                        cfg.cwd ? cwd.c_str() : nullptr,
                        &si,
                        &pi)) {
    throw_win32(::GetLastError(), "CreateProcessW");
  }
  handle_ptr const process{ pi.hProcess };
  handle_ptr const thread{ pi.hThread };

  // Descendants inherit the job, so a timeout can take down the whole tree.
  if (!::AssignProcessToJobObject(job.get(), process.get())) {
    DWORD const err{ ::GetLastError() };
    ::TerminateProcess(process.get(), kKilledExitCode);
    throw_win32(err, "AssignProcessToJobObject");
  }
  ::ResumeThread(thread.get());

  null_in.reset();
  out_write.reset();
  err_write.reset();

  auto stdout_text{ std::async(std::launch::async, read_all, out_read.get()) };
  auto stderr_text{ std::async(std::launch::async, read_all, err_read.get()) };

  DWORD const wait_ms{
    cfg.timeout.count() > 0
        ? static_cast<DWORD>(std::chrono::milliseconds{ cfg.timeout }.count())
        : INFINITE
  };

  process_result result;
  DWORD const waited{ ::WaitForSingleObject(process.get(), wait_ms) };
  if (waited == WAIT_TIMEOUT) {
    ::TerminateJobObject(job.get(), kKilledExitCode);
    ::WaitForSingleObject(process.get(), INFINITE);
    result.timed_out = true;
  } else if (waited != WAIT_OBJECT_0) {
    DWORD const err{ ::GetLastError() };
    ::TerminateJobObject(job.get(), kKilledExitCode);
    stdout_text.wait();
    stderr_text.wait();
    throw_win32(err, "WaitForSingleObject");
  }

  DWORD code{ 0 };
  if (!::GetExitCodeProcess(process.get(), &code)) {
    throw_win32(::GetLastError(), "GetExitCodeProcess");
  }
  result.exit_code = static_cast<int>(code);

  result.stdout_lines = process_split_lines(stdout_text.get());
  result.stderr_lines = process_split_lines(stderr_text.get());
  return result;
}

}  // namespace embedpy

#endif
