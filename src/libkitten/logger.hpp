#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <format>
#include <print>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

// stdout carries the tool's JSON, so log lines go to `sink`, stderr unless a
// test redirects it.

namespace xpto::logger {

enum class level : uint8_t { fatal, error, warning, info, debug, trace };

inline std::string_view level_to_string(level level) {
  // clang-format off
  switch (level) {
  case level::trace:   return "TRACE";
  case level::debug:   return "DEBUG";
  case level::info:    return "INFO";
  case level::warning: return "WARNING";
  case level::error:   return "ERROR";
  case level::fatal:   return "FATAL";
  default: return "UNKNOWN";
  }
  // clang-format on
}

inline level global_level = level::info;  // NOLINT
inline std::FILE* sink = stderr;          // NOLINT

inline void set_level(level level) { global_level = level; }

// From -d/--debug.  Out-of-range values saturate at fatal and trace.
inline void set_level(int value) {
  constexpr int max = static_cast<int>(level::trace);
  global_level = static_cast<level>(value < 0 ? 0 : value > max ? max : value);
}

inline void set_sink(std::FILE* f) { sink = f ? f : stderr; }

inline bool enabled(level level) { return level <= global_level; }

inline std::string timestamp() {
  using namespace std::chrono;

  auto now = system_clock::now();
  auto ymd = year_month_day{floor<days>(now)};
  auto hms = hh_mm_ss{floor<milliseconds>(now - floor<days>(now))};
  return std::format("{} {}", ymd, hms);
}

// "2026-10-19 12:00:00.000 enrich.cpp:42 WARNING: message"
template <typename... Args>
inline void log(
    level level, const std::source_location& where,
    std::format_string<Args...> fmt, Args&&... args) {
  if (!enabled(level)) return;

  std::println(
      sink, "{} {}:{} {}: {}", timestamp(),
      std::filesystem::path{where.file_name()}.filename().string(),
      where.line(), level_to_string(level),
      std::format(fmt, std::forward<Args>(args)...));
}

}  // namespace xpto::logger

// NOLINTBEGIN(*macro-usage*)
#define KITTEN_LOG(lvl, ...)                                     \
  xpto::logger::log(                                             \
      xpto::logger::level::lvl, std::source_location::current(), \
      __VA_ARGS__)

#define LOG_TRACE(...) KITTEN_LOG(trace, __VA_ARGS__)
#define LOG_DEBUG(...) KITTEN_LOG(debug, __VA_ARGS__)
#define LOG_INFO(...) KITTEN_LOG(info, __VA_ARGS__)
#define LOG_WARN(...) KITTEN_LOG(warning, __VA_ARGS__)
#define LOG_ERROR(...) KITTEN_LOG(error, __VA_ARGS__)
#define LOG_FATAL(...) KITTEN_LOG(fatal, __VA_ARGS__)
// NOLINTEND(*macro-usage*)
