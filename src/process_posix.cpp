#if defined(_WIN32)
#error "process_posix.cpp should not be compiled on Windows builds"
#else

#include "process.h"

#include "platform.h"
#include "util.h"

#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace embedpy {
namespace {

using steady = std::chrono::steady_clock;

constexpr int kExecFailedExit{ 127 };

[[noreturn]] void throw_errno(char const *what) {
  throw std::system_error(errno, std::generic_category(), what);
}

// Close-on-exec pipe; the child's dup2 copies are the only ends that survive exec.
struct output_pipe : unmovable {
  std::array<int, 2> fds{ -1, -1 };

  output_pipe() {
    if (::pipe(fds.data()) == -1) { throw_errno("pipe"); }
    for (int const fd : fds) { ::fcntl(fd, F_SETFD, FD_CLOEXEC); }
  }
  ~output_pipe() {
    close_end(0);
    close_end(1);
  }

  int read_end() const { return fds[0]; }
  int write_end() const { return fds[1]; }
  void close_end(int i) {
    if (fds[i] != -1) {
      ::close(fds[i]);
      fds[i] = -1;
    }
  }
};

// Kills and reaps the child unless it was waited for normally.
struct child_process : unmovable {
  pid_t pid{ -1 };
  bool reaped{ false };

  ~child_process() {
    if (pid <= 0 || reaped) { return; }
    ::kill(pid, SIGKILL);
    int status{ 0 };
    while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {}
  }

  void wait(process_result &result) {
    int status{ 0 };
    while (::waitpid(pid, &status, 0) == -1) {
      if (errno != EINTR) { throw_errno("waitpid"); }
    }
    reaped = true;

    if (WIFSIGNALED(status)) {
      result.signal = WTERMSIG(status);
      result.exit_code = 128 + *result.signal;
    } else {
      result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : status;
    }
  }
};

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void exec_child(char const *program,
                             char *const *argv,
                             char *const *envp,
                             char const *cwd,
                             int out_fd,
                             int err_fd) {
  int const null_fd{ ::open("/dev/null", O_RDONLY | O_CLOEXEC) };
  if (null_fd == -1 || ::dup2(null_fd, STDIN_FILENO) == -1 ||
      ::dup2(out_fd, STDOUT_FILENO) == -1 || ::dup2(err_fd, STDERR_FILENO) == -1) {
    ::_exit(kExecFailedExit);
  }
  if (cwd && ::chdir(cwd) == -1) {
    std::perror("chdir");
    ::_exit(kExecFailedExit);
  }

  ::execve(program, argv, envp);
  std::perror("execve");
  ::_exit(kExecFailedExit);
}

// Read both pipes to EOF. Returns false if `deadline` passes first.
bool drain(std::array<int, 2> fds,
           std::array<std::string, 2> &out,
           std::optional<steady::time_point> deadline) {
  std::array<pollfd, 2> watch{ pollfd{ fds[0], POLLIN, 0 }, pollfd{ fds[1], POLLIN, 0 } };
  char buf[8192];

  while (watch[0].fd != -1 || watch[1].fd != -1) {
    int wait_ms{ -1 };
    if (deadline) {
      auto const left{
        std::chrono::ceil<std::chrono::milliseconds>(*deadline - steady::now())
      };
      if (left.count() <= 0) { return false; }
      wait_ms = static_cast<int>(left.count());
    }

    int const ready{ ::poll(watch.data(), watch.size(), wait_ms) };
    if (ready == -1) {
      if (errno == EINTR) { continue; }
      throw_errno("poll");
    }

    for (std::size_t i{ 0 }; i < watch.size(); ++i) {
      if (watch[i].fd == -1 || watch[i].revents == 0) { continue; }
      ssize_t const n{ ::read(watch[i].fd, buf, sizeof buf) };
      if (n > 0) {
        out[i].append(buf, static_cast<std::size_t>(n));
      } else if (n == 0) {
        watch[i].fd = -1;
      } else if (errno != EINTR) {
        throw_errno("read");
      }
    }
  }
  return true;
}

}  // namespace

process_env_t process_getenv() {
  process_env_t env;
  for (char **entry{ environ }; entry && *entry; ++entry) {
    std::string_view const kv{ *entry };
    auto const eq{ kv.find('=') };
    if (eq != std::string_view::npos) {
      env.emplace(std::string{ kv.substr(0, eq) }, std::string{ kv.substr(eq + 1) });
    }
  }
  return env;
}

process_result process_run(std::vector<std::string> const &argv,
                           process_run_cfg const &cfg) {
  if (argv.empty()) { throw std::invalid_argument("process_run: empty argv"); }
  if (!platform::is_executable(argv[0])) {
    throw std::system_error(std::make_error_code(std::errc::no_such_file_or_directory),
                            "not an executable file: " + argv[0]);
  }

  // Everything exec needs is built before fork.
  std::vector<char *> child_argv;
  for (auto const &arg : argv) { child_argv.push_back(const_cast<char *>(arg.c_str())); }
  child_argv.push_back(nullptr);

  std::vector<std::string> env_entries;
  for (auto const &[key, value] : cfg.env) { env_entries.push_back(key + "=" + value); }
  std::vector<char *> child_envp;
  for (auto &entry : env_entries) { child_envp.push_back(entry.data()); }
  child_envp.push_back(nullptr);

  std::string const cwd{ cfg.cwd ? cfg.cwd->string() : std::string{} };

  output_pipe out;
  output_pipe err;

  std::optional<steady::time_point> deadline;
  if (cfg.timeout.count() > 0) { deadline = steady::now() + cfg.timeout; }

  child_process child;
  child.pid = ::fork();
  if (child.pid == -1) { throw_errno("fork"); }
  if (child.pid == 0) {
    exec_child(argv[0].c_str(),
               child_argv.data(),
               child_envp.data(),
               cfg.cwd ? cwd.c_str() : nullptr,
               out.write_end(),
               err.write_end());
  }

  out.close_end(1);
  err.close_end(1);

  process_result result;
  std::array<std::string, 2> captured;
  if (!drain({ out.read_end(), err.read_end() }, captured, deadline)) {
    ::kill(child.pid, SIGKILL);
    result.timed_out = true;
  }
  child.wait(result);

  result.stdout_lines = process_split_lines(captured[0]);
  result.stderr_lines = process_split_lines(captured[1]);
  return result;
}

}  // namespace embedpy

#endif
