#pragma once

#include "intraday/time/i_time_provider.hpp"
#include "intraday/time/time_utils.hpp"

#include <cstddef>
#include <deque>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace intraday {

enum class LogLevel {
  Debug,
  Info,
  Warn,
  Error,
};

// "DEBUG" / "INFO" / "WARN" / "ERROR"
const char* toString(LogLevel level);

// One retained log line.
struct LogEntry {
  Timestamp timestamp{};
  LogLevel level{LogLevel::Info};
  std::string message;
};

// -----------------------------------------------------------------------------
// Logger — thread-safe session log with an in-memory tail
// -----------------------------------------------------------------------------
//
// @brief  Records component log lines to an optional file, to stderr, and to
//         a bounded in-memory buffer that the STATE command returns to
//         dashboard clients.
//
// @details
// Components keep the "[Component] message" convention and pass the line to
// one of debug()/info()/warn()/error(). Each call:
//
//   1. Stamps the entry with the injected ITimeProvider (so replay sessions
//      log in market time).
//   2. Appends it to the in-memory buffer, dropping the oldest entry once
//      max_entries is exceeded.
//   3. Writes "[YYYY-MM-DD HH:MM:SS] [LEVEL] message" to the log file (if
//      one was opened) and flushes.
//   4. Echoes the same line to std::cerr when echo is enabled.
//
// A log file that cannot be opened is reported once on stderr; the logger
// then runs memory-only. Logging never throws into the caller.
//
// Thread model:
//   All methods are safe to call from any thread; a single mutex serializes
//   buffer and file access.
//
// Ownership:
//   Owned by TradingSession (or a test) and injected by reference. There is
//   no process-wide logger.
// -----------------------------------------------------------------------------
class Logger {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  clock        Time source for entry timestamps. Must outlive the
  //                      logger.
  // @param  filename     Log file opened in append mode. Empty = no file.
  // @param  max_entries  Size of the in-memory tail.
  // @param  echo         Mirror every line to std::cerr.
  // -------------------------------------------------------------------------
  explicit Logger(const ITimeProvider& clock, const std::string& filename = "",
                  std::size_t max_entries = 1000, bool echo = true);

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void debug(const std::string& message);
  void info(const std::string& message);
  void warn(const std::string& message);
  void error(const std::string& message);

  void log(LogLevel level, const std::string& message);

  // Copy of the retained entries, oldest first.
  std::vector<LogEntry> entries() const;

 private:
  const ITimeProvider& clock_;
  const std::size_t max_entries_;
  const bool echo_;

  mutable std::mutex mutex_;
  std::ofstream file_;
  std::deque<LogEntry> entries_;
};

}  // namespace intraday
