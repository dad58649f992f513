#pragma once
#include "types.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <optional>

namespace tbot
{
enum class LogLevel : u8
{
  Debug = 0,
  Info = 1,
  Warn = 2,
  Error = 3
};

// Process-wide threshold. This is the only global the engine keeps; trading state always lives in
// explicit session objects.
inline std::atomic<LogLevel> &log_threshold() noexcept
{
  static std::atomic<LogLevel> level{LogLevel::Info};
  return level;
}

inline void set_log_level(LogLevel lvl) noexcept
{
  log_threshold().store(lvl, std::memory_order_relaxed);
}

inline bool log_enabled(LogLevel lvl) noexcept
{
  return static_cast<u8>(lvl) >= static_cast<u8>(log_threshold().load(std::memory_order_relaxed));
}

inline std::optional<LogLevel> parse_log_level(const char *name) noexcept
{
  if (std::strcmp(name, "debug") == 0)
    return LogLevel::Debug;
  if (std::strcmp(name, "info") == 0)
    return LogLevel::Info;
  if (std::strcmp(name, "warn") == 0)
    return LogLevel::Warn;
  if (std::strcmp(name, "error") == 0)
    return LogLevel::Error;
  return std::nullopt;
}

// Small printf-style logger. Avoids iostreams so a record is a handful of stdio calls, and a
// single vfprintf keeps lines from different pipeline threads from interleaving mid-message.
inline void log(LogLevel lvl, const char *tag, const char *fmt, ...) noexcept
{
  if (!log_enabled(lvl))
    return;
  char line[1024];
  std::va_list args;
  va_start(args, fmt);
  std::vsnprintf(line, sizeof(line), fmt, args);
  va_end(args);
  std::fprintf(stderr, "%s [%llu] %s\n", tag, static_cast<unsigned long long>(wall_ms()), line);
}

#define TBOT_DEBUG(fmt, ...) ::tbot::log(::tbot::LogLevel::Debug, "DEBUG", fmt, ##__VA_ARGS__)
#define TBOT_INFO(fmt, ...) ::tbot::log(::tbot::LogLevel::Info, "INFO", fmt, ##__VA_ARGS__)
#define TBOT_WARN(fmt, ...) ::tbot::log(::tbot::LogLevel::Warn, "WARN", fmt, ##__VA_ARGS__)
#define TBOT_ERROR(fmt, ...) ::tbot::log(::tbot::LogLevel::Error, "ERROR", fmt, ##__VA_ARGS__)
} // namespace tbot
