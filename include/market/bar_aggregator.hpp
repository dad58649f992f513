#pragma once
#include "common/logging.hpp"
#include "common/status.hpp"
#include "market_data.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>

namespace tbot
{
// Outcome of feeding one observation: at most one sealed bar, or the reason it was dropped.
struct IngestResult
{
  std::optional<Bar> sealed;
  Status status;
};

// Buckets observations of one symbol into fixed windows of `timeframe` units.
// Windows are aligned to multiples of the timeframe. The open bar is sealed by the first
// observation of a later window; there is no timer, so a quiet market leaves the bar open and a gap
// simply produces no bars. Observations older than the open window are dropped: sealed history is
// never corrected after the fact.
class BarAggregator
{
  std::string symbol_;
  Timeframe timeframe_;
  std::optional<Bar> open_; // bar of the current window, if any observation landed in it
  u64 stale_{0};

public:
  BarAggregator(std::string symbol, Timeframe timeframe)
      : symbol_(canonical_symbol(symbol)), timeframe_(timeframe)
  {
    if (timeframe_ <= 0)
      throw std::invalid_argument("bar timeframe must be greater than 0");
    if (symbol_.empty())
      throw std::invalid_argument("bar aggregator needs a symbol");
  }

  // floor(ts / timeframe) * timeframe, rounding toward negative infinity.
  Timestamp window_start(Timestamp ts) const noexcept
  {
    Timestamp r = ts % timeframe_;
    if (r < 0)
      r += timeframe_;
    return ts - r;
  }

  IngestResult ingest(const Observation &o)
  {
    IngestResult out{};
    if (o.symbol != symbol_)
    {
      out.status = Status::error(ErrorCode::InvalidObservation,
                                 "observation for " + o.symbol + " sent to " + symbol_);
      TBOT_WARN("aggregator: %s", out.status.reason.c_str());
      return out;
    }

    const Timestamp w = window_start(o.timestamp);
    if (!open_)
    {
      open_bar(o, w);
      return out;
    }

    if (w < open_->open_time)
    {
      ++stale_;
      out.status = Status::error(ErrorCode::StaleObservation, "observation before open window");
      TBOT_WARN("aggregator: stale %s observation ts=%lld < window %lld dropped", symbol_.c_str(),
                static_cast<long long>(o.timestamp), static_cast<long long>(open_->open_time));
      return out;
    }

    if (w == open_->open_time)
    {
      Bar &b = *open_;
      b.high = std::max(b.high, o.price);
      b.low = std::min(b.low, o.price);
      b.close = o.price;
      b.volume += o.quantity;
      return out;
    }

    // Later window: hand out the finished bar, start the next one.
    out.sealed = std::move(*open_);
    open_bar(o, w);
    return out;
  }

  const std::optional<Bar> &open_bar() const noexcept
  {
    return open_;
  }

  const std::string &symbol() const noexcept
  {
    return symbol_;
  }

  Timeframe timeframe() const noexcept
  {
    return timeframe_;
  }

  u64 stale_count() const noexcept
  {
    return stale_;
  }

private:
  void open_bar(const Observation &o, Timestamp w)
  {
    open_ = Bar{symbol_, timeframe_, w, o.price, o.price, o.price, o.price, o.quantity};
  }
};
} // namespace tbot
