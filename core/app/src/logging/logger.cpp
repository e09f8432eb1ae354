#include "intraday/logging/logger.hpp"

#include <iostream>

namespace intraday {

const char* toString(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// Constructor: open the log file in append mode (optional)
// -----------------------------------------------------------------------------
Logger::Logger(const ITimeProvider& clock, const std::string& filename,
               std::size_t max_entries, bool echo)
    : clock_(clock), max_entries_(max_entries), echo_(echo) {
  if (filename.empty()) {
    return;
  }

  file_.open(filename, std::ios::out | std::ios::app);
  if (!file_.is_open()) {
    std::cerr << "[Logger] WARNING: could not open log file " << filename
              << ". Logging to memory only.\n";
  }
}

void Logger::debug(const std::string& message) {
  log(LogLevel::Debug, message);
}

void Logger::info(const std::string& message) {
  log(LogLevel::Info, message);
}

void Logger::warn(const std::string& message) {
  log(LogLevel::Warn, message);
}

void Logger::error(const std::string& message) {
  log(LogLevel::Error, message);
}

// -----------------------------------------------------------------------------
// log(): stamp, retain, write, echo
// -----------------------------------------------------------------------------
void Logger::log(LogLevel level, const std::string& message) {
  LogEntry entry;
  entry.timestamp = ms_to_timestamp(clock_.now_ms());
  entry.level = level;
  entry.message = message;

  std::string line = "[" + format_timestamp(entry.timestamp) + "] [" +
                     toString(level) + "] " + message;

  std::lock_guard lock(mutex_);

  entries_.push_back(std::move(entry));
  while (entries_.size() > max_entries_) {
    entries_.pop_front();
  }

  if (file_.is_open()) {
    file_ << line << '\n';
    file_.flush();
  }

  if (echo_) {
    std::cerr << line << '\n';
  }
}

// -----------------------------------------------------------------------------
// entries(): copy of the in-memory tail
// -----------------------------------------------------------------------------
std::vector<LogEntry> Logger::entries() const {
  std::lock_guard lock(mutex_);
  return std::vector<LogEntry>(entries_.begin(), entries_.end());
}

}  // namespace intraday
