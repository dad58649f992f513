#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

// Fundamental types shared by every stage of the pipeline.
// Crypto prices and lot sizes are fractional, so Price and Qty are doubles. Timestamps and
// timeframes are integers in a single unit (milliseconds for exchange data) so window arithmetic
// stays exact.
namespace tbot
{
using i8 = std::int8_t;
using u8 = std::uint8_t;
using i32 = std::int32_t;
using u32 = std::uint32_t;
using i64 = std::int64_t;
using u64 = std::uint64_t;

using Price = double;
using Qty = double;
// Event time of an observation or bar open. Same unit as Timeframe.
using Timestamp = i64;
// Bar width. A bar covers [open_time, open_time + timeframe).
using Timeframe = i64;

enum class Side : u8
{
  Buy = 0,
  Sell = 1
};

inline const char *to_string(Side s) noexcept
{
  return s == Side::Buy ? "BUY" : "SELL";
}

// Monotonic time in nanoseconds. Only used for pacing and log stamps, never for trading math,
// so replays stay deterministic.
inline u64 now_ns() noexcept
{
  using namespace std::chrono;
  return duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count();
}

// Wall clock in milliseconds since epoch, for live observations that arrive without exchange time.
inline Timestamp wall_ms() noexcept
{
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

using sv = std::string_view;
} // namespace tbot
