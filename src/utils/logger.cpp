#include "utils/logger.hpp"

#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <deque>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

namespace logger {
namespace {

constexpr size_t kLevelCount = 4;
constexpr std::uintmax_t kMaxFileSize = 1'000'000;

struct LevelInfo {
  const char* name;
  const char* color;
};

constexpr std::array<LevelInfo, kLevelCount> kLevels{{
  {"DEBUG", "\x1b[94m"},
  {"INFO", "\x1b[92m"},
  {"WARN", "\x1b[93m"},
  {"ERROR", "\x1b[91m"},
}};
constexpr const char* kColorReset = "\x1b[0m";

constexpr size_t level_index(Level level) {
  switch (level) {
    case Level::Debug: return 0;
    case Level::Info:  return 1;
    case Level::Warn:  return 2;
    case Level::Error: return 3;
  }
  return 0;
}

std::string format_time(const char* fmt) {
  const auto tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  localtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, fmt);
  return oss.str();
}

struct LogItem {
  Level level;
  std::string message;
};

class Logger {
public:
  static Logger& instance() {
    static Logger inst;
    return inst;
  }

  void set_print_level(Level level) { print_level_.store(static_cast<int>(level)); }

  void set_logs_dir(const std::filesystem::path& dir) {
    if (dir.empty()) {
      emit(Level::Warn, "Invalid log directory path", std::source_location::current());
      return;
    }
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
      emit(Level::Warn, "Could not create log directory " + dir.string() + ": " + ec.message(),
           std::source_location::current());
      return;
    }

    std::scoped_lock lk(queue_mtx_);
    const std::string stamp = format_time("%Y-%m-%d_%H-%M");
    for (size_t i = 0; i < kLevelCount; ++i) {
      std::string name = kLevels[i].name;
      for (auto& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      files_[i] = dir / (name + "_" + stamp + ".log");
    }
    files_enabled_ = true;
    if (!worker_.joinable()) worker_ = std::thread(&Logger::worker_loop, this);
  }

  void emit(Level level, std::string_view message, const std::source_location& loc) {
    counts_[level_index(level)].fetch_add(1, std::memory_order_relaxed);

    // Stream callers end their messages with "\n".
    while (!message.empty() && (message.back() == '\n' || message.back() == ' ')) {
      message.remove_suffix(1);
    }

    std::ostringstream ctx;
    ctx << "(" << std::filesystem::path(loc.file_name()).filename().string() << ":" << loc.line() << ") "
        << message;
    std::string text = ctx.str();

    const auto& info = kLevels[level_index(level)];
    if (static_cast<int>(level) >= print_level_.load()) {
      std::scoped_lock lk(print_mtx_);
      std::cout << info.color << "[" << info.name << "] " << text << kColorReset << "\n";
    }

    {
      std::scoped_lock lk(queue_mtx_);
      if (!files_enabled_ || stop_) return;
      queue_.push_back({level, std::move(text)});
    }
    queue_cv_.notify_one();
  }

  std::uint64_t count(Level level) const {
    return counts_[level_index(level)].load(std::memory_order_relaxed);
  }

  void close() {
    {
      std::scoped_lock lk(queue_mtx_);
      stop_ = true;
    }
    queue_cv_.notify_all();
    if (worker_.joinable()) worker_.join();
  }

private:
  Logger() = default;
  ~Logger() { close(); }

  // A full file is renamed to <stem>_<n><ext> and a new one is started.
  static void rotate_if_needed(const std::filesystem::path& file) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(file, ec);
    if (ec || size <= kMaxFileSize) return;

    for (int i = 1; i < 10000; ++i) {
      const auto rotated = file.parent_path() /
        (file.stem().string() + "_" + std::to_string(i) + file.extension().string());
      if (!std::filesystem::exists(rotated, ec)) {
        std::filesystem::rename(file, rotated, ec);
        return;
      }
    }
  }

  void worker_loop() {
    for (;;) {
      LogItem item;
      std::filesystem::path file;
      {
        std::unique_lock lk(queue_mtx_);
        queue_cv_.wait(lk, [&] { return stop_ || !queue_.empty(); });
        if (queue_.empty()) break;
        item = std::move(queue_.front());
        queue_.pop_front();
        file = files_[level_index(item.level)];
      }

      rotate_if_needed(file);
      std::ofstream out(file, std::ios::app);
      if (!out) continue;
      out << std::setw(6) << std::setfill('0') << ++written_
          << " [" << format_time("%H:%M:%S") << "] [" << kLevels[level_index(item.level)].name << "] "
          << item.message << "\n";
    }
  }

  std::atomic<int> print_level_{static_cast<int>(Level::Info)};
  std::array<std::atomic<std::uint64_t>, kLevelCount> counts_{};
  std::mutex print_mtx_;

  std::mutex queue_mtx_;
  std::condition_variable queue_cv_;
  std::deque<LogItem> queue_;
  bool files_enabled_{false};
  bool stop_{false};
  std::array<std::filesystem::path, kLevelCount> files_{};
  std::uint64_t written_{0};
  std::thread worker_;
};

} // namespace

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
    Logger::instance().emit(level_, stream_.str(), loc_);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "logger: dropped message: %s\n", e.what());
  }
}

void set_print_level(Level level) {
  Logger::instance().set_print_level(level);
}

void set_logs_dir(const std::filesystem::path& dir_path) {
  Logger::instance().set_logs_dir(dir_path);
}

std::uint64_t count(Level level) {
  return Logger::instance().count(level);
}

bool parse_level(std::string_view name, Level& out) {
  if (name == "debug") out = Level::Debug;
  else if (name == "info") out = Level::Info;
  else if (name == "warn") out = Level::Warn;
  else if (name == "error") out = Level::Error;
  else return false;
  return true;
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
