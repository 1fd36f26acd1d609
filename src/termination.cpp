#include "termination.h"

#include <system_error>

#ifdef _WIN32

#include "platform.h"

namespace {

BOOL WINAPI exit_on_console_event(DWORD event) {
  switch (event) {
    case CTRL_C_EVENT: ::ExitProcess(130);
    case CTRL_BREAK_EVENT: ::ExitProcess(131);
    case CTRL_CLOSE_EVENT: ::ExitProcess(129);
    default: return FALSE;
  }
}

}  // namespace

void embedpy::termination_handler_install() {
  if (!::SetConsoleCtrlHandler(exit_on_console_event, TRUE)) {
    throw std::system_error(::GetLastError(), std::system_category(), "SetConsoleCtrlHandler");
  }
}

#else

#include <cerrno>
#include <csignal>

#include <unistd.h>

namespace {

void exit_on_signal(int sig) { ::_exit(128 + sig); }

}  // namespace

void embedpy::termination_handler_install() {
  struct sigaction action{};
  action.sa_handler = exit_on_signal;
  ::sigemptyset(&action.sa_mask);

  for (int const sig : { SIGINT, SIGTERM, SIGHUP }) {
    if (::sigaction(sig, &action, nullptr) == -1) {
      throw std::system_error(errno, std::generic_category(), "sigaction");
    }
  }
}

#endif
