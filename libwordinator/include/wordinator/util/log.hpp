// Copyright (c) 2025 Renata Hodovan, Akos Kiss.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef WORDINATOR_UTIL_LOG_HPP
#define WORDINATOR_UTIL_LOG_HPP

#include <format>
#include <iostream>
#include <ostream>
#include <string_view>

#define WORDINATOR_LOG_LEVEL_OFF   0
#define WORDINATOR_LOG_LEVEL_FATAL 1
#define WORDINATOR_LOG_LEVEL_ERROR 2
#define WORDINATOR_LOG_LEVEL_WARN  3
#define WORDINATOR_LOG_LEVEL_INFO  4
#define WORDINATOR_LOG_LEVEL_DEBUG 5
#define WORDINATOR_LOG_LEVEL_TRACE 6

#ifndef WORDINATOR_LOG_LEVEL
#define WORDINATOR_LOG_LEVEL WORDINATOR_LOG_LEVEL_ERROR
#endif

namespace wordinator {
namespace util {

enum class LogLevel {
  Fatal = WORDINATOR_LOG_LEVEL_FATAL,
  Error = WORDINATOR_LOG_LEVEL_ERROR,
  Warn = WORDINATOR_LOG_LEVEL_WARN,
  Info = WORDINATOR_LOG_LEVEL_INFO,
  Debug = WORDINATOR_LOG_LEVEL_DEBUG,
  Trace = WORDINATOR_LOG_LEVEL_TRACE,
};

// Destination of all log records. Defaults to std::clog; tests may point it
// at a string stream.
inline std::ostream*& log_stream() {
  static std::ostream* stream = &std::clog;
  return stream;
}

inline std::string_view log_tag(LogLevel level) {
  switch (level) {
    case LogLevel::Fatal: return "\033[95m[F]\033[0m";
    case LogLevel::Error: return "\033[91m[E]\033[0m";
    case LogLevel::Warn: return "\033[93m[W]\033[0m";
    case LogLevel::Info: return "\033[92m[I]\033[0m";
    case LogLevel::Debug: return "\033[94m[D]\033[0m";
    case LogLevel::Trace: return "\033[96m[T]\033[0m";
  }
  return "[?]";
}

template<typename... Args>
void log(LogLevel level, std::string_view fmt, Args&&... args) {
  std::ostream& out = *log_stream();
  out << log_tag(level) << ' ';
  if constexpr (sizeof...(Args) == 0) {
    out << fmt;
  } else {
    out << std::vformat(fmt, std::make_format_args(args...));
  }
  out << std::endl;
}

}  // namespace util
}  // namespace wordinator

#define WORDINATOR_LOG_AT(LEVEL, FMT, ...) ::wordinator::util::log(::wordinator::util::LogLevel::LEVEL, FMT __VA_OPT__(, ) __VA_ARGS__)

#if WORDINATOR_LOG_LEVEL >= WORDINATOR_LOG_LEVEL_FATAL
#define WORDINATOR_LOG_FATAL(FMT, ...) WORDINATOR_LOG_AT(Fatal, FMT __VA_OPT__(, ) __VA_ARGS__)
#else
#define WORDINATOR_LOG_FATAL(FMT, ...) do { } while (false)
#endif

#if WORDINATOR_LOG_LEVEL >= WORDINATOR_LOG_LEVEL_ERROR
#define WORDINATOR_LOG_ERROR(FMT, ...) WORDINATOR_LOG_AT(Error, FMT __VA_OPT__(, ) __VA_ARGS__)
#else
#define WORDINATOR_LOG_ERROR(FMT, ...) do { } while (false)
#endif

#if WORDINATOR_LOG_LEVEL >= WORDINATOR_LOG_LEVEL_WARN
#define WORDINATOR_LOG_WARN(FMT, ...) WORDINATOR_LOG_AT(Warn, FMT __VA_OPT__(, ) __VA_ARGS__)
#else
#define WORDINATOR_LOG_WARN(FMT, ...) do { } while (false)
#endif

#if WORDINATOR_LOG_LEVEL >= WORDINATOR_LOG_LEVEL_INFO
#define WORDINATOR_LOG_INFO(FMT, ...) WORDINATOR_LOG_AT(Info, FMT __VA_OPT__(, ) __VA_ARGS__)
#else
#define WORDINATOR_LOG_INFO(FMT, ...) do { } while (false)
#endif

#if WORDINATOR_LOG_LEVEL >= WORDINATOR_LOG_LEVEL_DEBUG
#define WORDINATOR_LOG_DEBUG(FMT, ...) WORDINATOR_LOG_AT(Debug, FMT __VA_OPT__(, ) __VA_ARGS__)
#else
#define WORDINATOR_LOG_DEBUG(FMT, ...) do { } while (false)
#endif

#if WORDINATOR_LOG_LEVEL >= WORDINATOR_LOG_LEVEL_TRACE
#define WORDINATOR_LOG_TRACE(FMT, ...) WORDINATOR_LOG_AT(Trace, FMT __VA_OPT__(, ) __VA_ARGS__)
#else
#define WORDINATOR_LOG_TRACE(FMT, ...) do { } while (false)
#endif

#endif  // WORDINATOR_UTIL_LOG_HPP
