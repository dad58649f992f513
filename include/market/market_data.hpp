#pragma once
#include "common/types.hpp"

#include <cctype>
#include <optional>
#include <string>
#include <variant>

namespace tbot
{
// Canonical price observation. Everything downstream of the normalizer speaks this type only.
struct Observation
{
  std::string symbol;
  Price price{0};
  Qty quantity{0};
  Timestamp timestamp{0};
};

// OHLC bar covering [open_time, open_time + timeframe). Mutable only inside the aggregator while
// its window is open; once sealed it is copied into the session history and never touched again.
struct Bar
{
  std::string symbol;
  Timeframe timeframe{0};
  Timestamp open_time{0};
  Price open{0};
  Price high{0};
  Price low{0};
  Price close{0};
  Qty volume{0};
};

// Raw events as a market-data source hands them over, before validation.
// A trade print from the exchange tape. trade_id is 0 when the venue does not number trades.
struct TradeTick
{
  std::string symbol;
  Price price{0};
  Qty quantity{0};
  u64 trade_id{0};
  Timestamp event_time{0};
};

// Best bid/ask update. Normalized to the mid price with zero traded quantity.
struct BookTicker
{
  std::string symbol;
  Price bid_price{0};
  Qty bid_qty{0};
  Price ask_price{0};
  Qty ask_qty{0};
  Timestamp event_time{0};
};

using RawPriceEvent = std::variant<TradeTick, BookTicker>;

// "btc/usdt", "BTC-USDT" and "BTCUSDT" all name the same pair.
inline std::string canonical_symbol(sv raw)
{
  std::string out;
  out.reserve(raw.size());
  for (char c : raw)
  {
    if (c == '/' || c == '-' || c == '_' || c == ' ')
      continue;
    out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  return out;
}

// Exchange style interval names ("1m", "4h", "1d") to milliseconds.
inline std::optional<Timeframe> parse_timeframe(sv text)
{
  if (text.size() < 2)
    return std::nullopt;
  Timeframe n = 0;
  for (std::size_t i = 0; i + 1 < text.size(); ++i)
  {
    const char c = text[i];
    if (c < '0' || c > '9')
      return std::nullopt;
    n = n * 10 + (c - '0');
    if (n > 1'000'000)
      return std::nullopt;
  }
  if (n <= 0)
    return std::nullopt;
  switch (text.back())
  {
  case 's':
    return n * 1'000;
  case 'm':
    return n * 60'000;
  case 'h':
    return n * 3'600'000;
  case 'd':
    return n * 86'400'000;
  case 'w':
    return n * 604'800'000;
  default:
    return std::nullopt;
  }
}
} // namespace tbot
