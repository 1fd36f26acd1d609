#pragma once

#include <functional>
#include <optional>
#include <string_view>

#if defined(__clang__) || defined(__GNUC__)
#define EMBEDPY_TUI_PRINTF(idx, first) __attribute__((format(printf, idx, first)))
#else
#define EMBEDPY_TUI_PRINTF(idx, first)
#endif

namespace embedpy::tui {

enum class level { TUI_DEBUG, TUI_INFO, TUI_WARN, TUI_ERROR };

// Leveled logging to stderr (or the installed handler) from a background writer.
// init once per process; run/shutdown bracket each logging session.
void init();
void set_output_handler(std::function<void(std::string_view)> handler);
void run(std::optional<level> threshold = std::nullopt, bool decorated_logging = false);
void shutdown();  // flushes everything logged before it

// Messages logged while no session is running are dropped.
void debug(char const *fmt, ...) EMBEDPY_TUI_PRINTF(1, 2);
void info(char const *fmt, ...) EMBEDPY_TUI_PRINTF(1, 2);
void warn(char const *fmt, ...) EMBEDPY_TUI_PRINTF(1, 2);
void error(char const *fmt, ...) EMBEDPY_TUI_PRINTF(1, 2);

struct scope {  // run/shutdown; inert before init
  explicit scope(std::optional<level> threshold, bool decorated_logging);
  ~scope();

 private:
  bool active{ false };
};

}  // namespace embedpy::tui

#undef EMBEDPY_TUI_PRINTF
