#include "utils/logger.hpp"

#include <unistd.h>

#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

namespace logger {
namespace {

constexpr const char* kColorRed   = "\x1b[91m";
constexpr const char* kColorYellow= "\x1b[93m";
constexpr const char* kColorGreen = "\x1b[92m";
constexpr const char* kColorBlue  = "\x1b[94m";
constexpr const char* kColorReset = "\x1b[0m";

constexpr const char* kFilePrefix = "dsmr-exporter_";
constexpr std::uintmax_t kMaxLogFileSize = 10'000'000;

const char* level_name(Level level) {
  switch (level) {
    case Level::Debug: return "DEBUG";
    case Level::Info:  return "INFO";
    case Level::Warn:  return "WARN";
    case Level::Error: return "ERROR";
  }
  return "UNKNOWN";
}

const char* level_color(Level level) {
  switch (level) {
    case Level::Debug: return kColorBlue;
    case Level::Info:  return kColorGreen;
    case Level::Warn:  return kColorYellow;
    case Level::Error: return kColorRed;
  }
  return kColorReset;
}

std::string format_time(const char* fmt) {
  const auto now = std::chrono::system_clock::now();
  const auto tt = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, fmt);
  return oss.str();
}

// Call sites end messages with "\n"; the sinks add their own line ending.
std::string_view trim_right(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

class Logger {
public:
  static Logger& instance() {
    static Logger inst;
    return inst;
  }

  void set_print_level(Level level) { print_level_.store(static_cast<int>(level)); }
  void set_log_level(Level level) { logging_level_.store(static_cast<int>(level)); }

  void set_logs_dir(const std::filesystem::path& dir_path) {
    if (dir_path.empty()) {
      trace(Level::Warn, "Invalid log directory path", std::source_location::current());
      return;
    }
    {
      std::scoped_lock lk(config_mtx_);
      log_dir_ = dir_path;
      log_file_.clear();
    }
    enable_file_logging_.store(true);
  }

  void trace(Level level, std::string_view message, const std::source_location& loc) {
    const int lvl = static_cast<int>(level);
    const bool to_console = lvl >= print_level_.load();
    const bool to_file = enable_file_logging_.load() && lvl >= logging_level_.load();
    if (!to_console && !to_file) return;

    const std::string file_name = std::filesystem::path(loc.file_name()).filename().string();

    std::ostringstream ctx;
    ctx << "(" << file_name << ":" << loc.line() << ") " << trim_right(message);
    const std::string context_msg = ctx.str();

    if (to_console) {
      const std::string ts = format_time("%Y-%m-%d %H:%M:%S");
      std::scoped_lock lk(print_mtx_);
      if (color_) {
        std::cout << level_color(level) << ts << " [" << level_name(level) << "] "
                  << context_msg << kColorReset << "\n";
      } else {
        std::cout << ts << " [" << level_name(level) << "] " << context_msg << "\n";
      }
      std::cout.flush();
    }

    if (to_file) {
      start_worker_if_needed();
      {
        std::scoped_lock lk(queue_mtx_);
        if (stop_signal_.load()) return;
        queue_.push_back({level, context_msg});
      }
      queue_cv_.notify_one();
    }
  }

  void close() {
    {
      std::scoped_lock lk(queue_mtx_);
      stop_signal_.store(true);
    }
    queue_cv_.notify_all();
    std::scoped_lock lk(worker_mtx_);
    if (worker_.joinable()) worker_.join();
  }

private:
  struct LogItem {
    Level level;
    std::string message;
  };

  Logger() : color_(::isatty(STDOUT_FILENO) == 1) {}
  ~Logger() { close(); }

  void start_worker_if_needed() {
    std::scoped_lock lk(worker_mtx_);
    if (worker_started_) return;
    worker_ = std::thread(&Logger::worker_loop, this);
    worker_started_ = true;
  }

  std::filesystem::path current_log_file() {
    std::scoped_lock lk(config_mtx_);
    if (log_file_.empty()) {
      std::error_code ec;
      std::filesystem::create_directories(log_dir_, ec);
      log_file_ = log_dir_ / (std::string(kFilePrefix) + format_time("%Y-%m-%d_%H-%M") + ".log");
    }
    return log_file_;
  }

  void rotate_if_needed(const std::filesystem::path& log_file) {
    std::error_code ec;
    if (!std::filesystem::exists(log_file, ec)) return;
    const auto size = std::filesystem::file_size(log_file, ec);
    if (ec || size <= kMaxLogFileSize) return;

    const std::filesystem::path dir = log_file.parent_path();
    const std::string stem = log_file.stem().string();
    const std::string ext = log_file.extension().string();

    for (int i = 1; i < 10000; ++i) {
      std::filesystem::path rotated = dir / (stem + "_" + std::to_string(i) + ext);
      if (!std::filesystem::exists(rotated, ec)) {
        std::filesystem::rename(log_file, rotated, ec);
        break;
      }
    }
  }

  void worker_loop() {
    while (true) {
      LogItem item;
      {
        std::unique_lock lk(queue_mtx_);
        queue_cv_.wait(lk, [&] {
          return stop_signal_.load() || !queue_.empty();
        });

        if (queue_.empty() && stop_signal_.load()) break;
        if (queue_.empty()) continue;

        item = std::move(queue_.front());
        queue_.pop_front();
      }

      const std::filesystem::path log_file = current_log_file();
      rotate_if_needed(log_file);

      const auto counter = ++msg_counter_;
      const std::string timestamp = format_time("%Y-%m-%d %H:%M:%S");

      std::ostringstream line;
      line << std::setw(6) << std::setfill('0') << counter
           << " [" << timestamp << "] [" << level_name(item.level) << "] "
           << item.message << "\n";

      std::ofstream out(log_file, std::ios::app);
      if (out) out << line.str();
    }
  }

  std::atomic<bool> stop_signal_{false};
  std::mutex worker_mtx_;
  std::thread worker_;
  bool worker_started_{false};

  std::mutex queue_mtx_;
  std::condition_variable queue_cv_;
  std::deque<LogItem> queue_;

  std::mutex config_mtx_;
  std::filesystem::path log_dir_{"logs"};
  std::filesystem::path log_file_;

  std::atomic<int> print_level_{static_cast<int>(Level::Info)};
  std::atomic<int> logging_level_{static_cast<int>(Level::Debug)};
  std::atomic<bool> enable_file_logging_{false};
  std::atomic<std::uint64_t> msg_counter_{0};

  const bool color_;
  std::mutex print_mtx_;
};

} // namespace

bool parse_level(std::string_view name, Level& out) {
  if (name == "debug") { out = Level::Debug; return true; }
  if (name == "info")  { out = Level::Info;  return true; }
  if (name == "warn")  { out = Level::Warn;  return true; }
  if (name == "error") { out = Level::Error; return true; }
  return false;
}

LogStream::LogStream(Level level, const std::source_location& loc)
  : level_(level), loc_(loc) {}

LogStream::LogStream(LogStream&& other) noexcept
  : level_(other.level_),
    loc_(other.loc_),
    stream_(std::move(other.stream_)),
    active_(other.active_) {
  other.active_ = false;
}

LogStream::~LogStream() {
  if (!active_) return;
  try {
    commit();
  } catch (const std::exception& e) {
    std::cerr << "logger: dropped message: " << e.what() << "\n";
  }
}

void LogStream::commit() {
  if (!active_) return;
  active_ = false;
  trace(level_, stream_.str(), loc_);
}

void set_print_level(Level level) {
  Logger::instance().set_print_level(level);
}

void set_log_level(Level level) {
  Logger::instance().set_log_level(level);
}

void set_logs_dir(const std::filesystem::path& dir_path) {
  Logger::instance().set_logs_dir(dir_path);
}

void trace(Level level,
           std::string_view message,
           const std::source_location& loc) {
  Logger::instance().trace(level, message, loc);
}

LogStream trace(Level level, const std::source_location& loc) {
  return LogStream(level, loc);
}

void debug(std::string_view message, const std::source_location& loc) {
  trace(Level::Debug, message, loc);
}

void info(std::string_view message, const std::source_location& loc) {
  trace(Level::Info, message, loc);
}

void warn(std::string_view message, const std::source_location& loc) {
  trace(Level::Warn, message, loc);
}

void error(std::string_view message, const std::source_location& loc) {
  trace(Level::Error, message, loc);
}

LogStream debug(const std::source_location& loc) {
  return LogStream(Level::Debug, loc);
}

LogStream info(const std::source_location& loc) {
  return LogStream(Level::Info, loc);
}

LogStream warn(const std::source_location& loc) {
  return LogStream(Level::Warn, loc);
}

LogStream error(const std::source_location& loc) {
  return LogStream(Level::Error, loc);
}

void close_logger() {
  Logger::instance().close();
}

} // namespace logger
