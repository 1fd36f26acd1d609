#include "tui.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {

using embedpy::tui::level;

constexpr std::chrono::milliseconds kIdleWake{ 50 };

struct record {
  std::chrono::system_clock::time_point when;
  level severity;
  std::string text;
};

char const *severity_tag(level l) {
  switch (l) {
    case level::TUI_DEBUG: return "DBG";
    case level::TUI_INFO: return "INF";
    case level::TUI_WARN: return "WRN";
    case level::TUI_ERROR: return "ERR";
  }
  return "???";
}

// "[2024-05-01 09:30:00.042] [INF] "
std::string decoration(record const &r) {
  std::time_t const secs{ std::chrono::system_clock::to_time_t(r.when) };
  std::tm local{};
#if defined(_WIN32)
  localtime_s(&local, &secs);
#else
  localtime_r(&secs, &local);
#endif
  auto const ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                     r.when.time_since_epoch())
                     .count() %
                 1000 };

  char buf[64];
  std::size_t n{ std::strftime(buf, sizeof buf, "[%Y-%m-%d %H:%M:%S", &local) };
  std::snprintf(buf + n,
                sizeof buf - n,
                ".%03d] [%s] ",
                static_cast<int>(ms),
                severity_tag(r.severity));
  return buf;
}

std::string vformat(char const *fmt, va_list args) {
  va_list sizing;
  va_copy(sizing, args);
  int const len{ std::vsnprintf(nullptr, 0, fmt, sizing) };
  va_end(sizing);
  if (len < 0) { return {}; }

  std::string out(static_cast<std::size_t>(len) + 1, '\0');
  std::vsnprintf(out.data(), out.size(), fmt, args);
  out.resize(static_cast<std::size_t>(len));
  return out;
}

class log_writer {
 public:
  bool initialized{ false };
  std::function<void(std::string_view)> sink;

  bool running() const { return thread_.joinable(); }

  void start(std::optional<level> threshold, bool decorated) {
    threshold_ = threshold;
    decorated_ = decorated;
    stopping_ = false;
    thread_ = std::thread{ [this] { loop(); } };
    accepting_ = true;
  }

  void stop() {
    accepting_ = false;
    {
      std::lock_guard lock{ mutex_ };
      stopping_ = true;
    }
    wake_.notify_one();
    thread_.join();
  }

  void submit(level severity, char const *fmt, va_list args) {
    if (!accepting_ || !fmt) { return; }
    if (threshold_ && severity < *threshold_) { return; }

    record r{ std::chrono::system_clock::now(), severity, vformat(fmt, args) };
    {
      std::lock_guard lock{ mutex_ };
      pending_.push_back(std::move(r));
    }
    wake_.notify_one();
  }

 private:
  void loop() {
    std::vector<record> batch;
    std::unique_lock lock{ mutex_ };
    for (;;) {
      wake_.wait_for(lock, kIdleWake, [this] { return stopping_ || !pending_.empty(); });
      batch.swap(pending_);
      bool const last{ stopping_ };
      lock.unlock();
      write(batch);
      batch.clear();
      lock.lock();
      if (last && pending_.empty()) { return; }
    }
  }

  void write(std::vector<record> const &batch) const {
    for (auto const &r : batch) {
      std::string line{ decorated_ ? decoration(r) : std::string{} };
      line += r.text;
      line.push_back('\n');
      if (sink) {
        sink(line);
      } else {
        std::fwrite(line.data(), 1, line.size(), stderr);
      }
    }
    if (!sink && !batch.empty()) { std::fflush(stderr); }
  }

  std::mutex mutex_;
  std::condition_variable wake_;
  std::vector<record> pending_;
  bool stopping_{ false };
  std::thread thread_;
  std::atomic_bool accepting_{ false };
  std::optional<level> threshold_;
  bool decorated_{ false };
};

log_writer s_writer;

void require(bool ok, char const *what) {
  if (!ok) { throw std::logic_error(std::string{ "embedpy::tui::" } + what); }
}

}  // namespace

namespace embedpy::tui {

void init() {
  require(!s_writer.initialized, "init called more than once");
  s_writer.initialized = true;
}

void set_output_handler(std::function<void(std::string_view)> handler) {
  require(s_writer.initialized, "set_output_handler called before init");
  require(!s_writer.running(), "set_output_handler called while running");
  s_writer.sink = std::move(handler);
}

void run(std::optional<level> threshold, bool decorated_logging) {
  require(s_writer.initialized, "run called before init");
  require(!s_writer.running(), "run called while already running");
  s_writer.start(threshold, decorated_logging);
}

void shutdown() {
  require(s_writer.running(), "shutdown called while not running");
  s_writer.stop();
}

#define EMBEDPY_TUI_LOG(name, severity)      \
  void name(char const *fmt, ...) {          \
    va_list args;                            \
    va_start(args, fmt);                     \
    s_writer.submit(severity, fmt, args);    \
    va_end(args);                            \
  }

EMBEDPY_TUI_LOG(debug, level::TUI_DEBUG)
EMBEDPY_TUI_LOG(info, level::TUI_INFO)
EMBEDPY_TUI_LOG(warn, level::TUI_WARN)
EMBEDPY_TUI_LOG(error, level::TUI_ERROR)

#undef EMBEDPY_TUI_LOG

scope::scope(std::optional<level> threshold, bool decorated_logging) {
  if (!s_writer.initialized) { return; }
  run(threshold, decorated_logging);
  active = true;
}

scope::~scope() {
  if (active) { shutdown(); }
}

}  // namespace embedpy::tui
