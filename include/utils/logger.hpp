#pragma once

#include <cstdint>
#include <filesystem>
#include <ostream>
#include <source_location>
#include <sstream>
#include <string_view>
#include <utility>

/**
 * @brief Process-wide leveled logger.
 *
 * Messages at or above the print level go to stdout (colored, with the
 * calling file:line). Once a log directory is set, messages also go to one
 * file per level, written by a background thread.
 *
 *   logger::info() << "[LINK] Connected to " << host << "\n";
 */
namespace logger {

enum class Level : int {
  Debug = 10,
  Info  = 20,
  Warn  = 30,
  Error = 40
};

void set_print_level(Level level);
// Enables file logging.
void set_logs_dir(const std::filesystem::path& dir_path);

// Number of messages emitted at `level` since start (printed or not).
[[nodiscard]] std::uint64_t count(Level level);

// Parse "debug", "info", "warn" or "error"; false if unrecognized.
[[nodiscard]] bool parse_level(std::string_view name, Level& out);

// Collects one message; emitted when the stream is destroyed.
class LogStream {
public:
  LogStream(Level level, const std::source_location& loc);
  LogStream(LogStream&& other) noexcept;
  LogStream(const LogStream&) = delete;
  LogStream& operator=(const LogStream&) = delete;
  LogStream& operator=(LogStream&&) = delete;
  ~LogStream();

  template <typename T>
  LogStream& operator<<(T&& value) {
    stream_ << std::forward<T>(value);
    return *this;
  }

  using Manip = std::ostream& (*)(std::ostream&);
  LogStream& operator<<(Manip manip) {
    manip(stream_);
    return *this;
  }

private:
  Level level_;
  std::source_location loc_;
  std::ostringstream stream_;
  bool active_{true};
};

LogStream debug(const std::source_location& loc = std::source_location::current());
LogStream info(const std::source_location& loc = std::source_location::current());
LogStream warn(const std::source_location& loc = std::source_location::current());
LogStream error(const std::source_location& loc = std::source_location::current());

// Flush the file queue and stop the writer thread.
void close_logger();

} // namespace logger
