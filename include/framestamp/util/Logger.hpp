// Repository: Framestamp
// Component: Thread-Safe Logger
// Purpose: Mutex-protected line logging for tools built on the library.
// Copyright (c) 2025 Framestamp

#ifndef FRAMESTAMP_UTIL_LOGGER_HPP_
#define FRAMESTAMP_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace framestamp::util {

// Logger writes whole lines under a single static mutex, appends '\n' and
// flushes, so concurrent callers never interleave.
//
// Info  -> stdout
// Debug -> stdout only when FRAMESTAMP_DEBUG env is set
// Warn  -> stderr
// Error -> stderr
//
// The timecode library itself never logs; only tools do.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // Test-only: capture Info()/Warn()/Error() lines in addition to the
  // stream. Call with nullptr to clear.
  static void SetInfoSink(std::function<void(const std::string&)> sink);
  static void SetWarnSink(std::function<void(const std::string&)> sink);
  static void SetErrorSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::function<void(const std::string&)> info_sink_;
  static std::function<void(const std::string&)> warn_sink_;
  static std::function<void(const std::string&)> error_sink_;
};

}  // namespace framestamp::util

#endif  // FRAMESTAMP_UTIL_LOGGER_HPP_
