#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace intraday {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock time point carried by every ledger record (Order, Trade, pending
// buy lots, log entries).
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// Time conversion and formatting utilities
// -----------------------------------------------------------------------------
//
// @brief  Free functions converting between Timestamp and int64_t epoch
//         milliseconds, and rendering Timestamps as text.
//
// @details
// ITimeProvider returns int64_t milliseconds; ledger records carry a
// Timestamp. The formatters render in local time, which is what the trade
// CSV, the log file and the export filename use.
//
// Thread-safety: Stateless. localtime_r is the reentrant variant, so the
//                formatters are safe to call from any thread.
// -----------------------------------------------------------------------------

// Epoch milliseconds → Timestamp.
inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

// Timestamp → epoch milliseconds (truncated).
inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// -------------------------------------------------------------------------
// format_timestamp
// -------------------------------------------------------------------------
// @brief  Renders tp in local time using a strftime pattern.
//
// @param  tp       The time point to render.
// @param  pattern  strftime pattern; defaults to "YYYY-MM-DD HH:MM:SS".
// @return The formatted string, or an empty string if formatting failed.
// -------------------------------------------------------------------------
inline std::string format_timestamp(Timestamp tp,
                                    const char* pattern = "%Y-%m-%d %H:%M:%S") {
  std::time_t secs = std::chrono::system_clock::to_time_t(tp);
  std::tm local{};
  localtime_r(&secs, &local);

  char buf[64];
  std::size_t n = std::strftime(buf, sizeof(buf), pattern, &local);
  return std::string(buf, n);
}

// "YYYYMMDD_HHMMSS", used for export filenames.
inline std::string format_compact(Timestamp tp) {
  return format_timestamp(tp, "%Y%m%d_%H%M%S");
}

// "YYYY-MM-DDTHH:MM:SS", used for order history snapshots.
inline std::string format_iso(Timestamp tp) {
  return format_timestamp(tp, "%Y-%m-%dT%H:%M:%S");
}

// Seconds between two time points, with millisecond resolution.
inline double seconds_between(Timestamp from, Timestamp to) {
  return std::chrono::duration<double>(to - from).count();
}

}  // namespace intraday
