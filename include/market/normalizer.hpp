#pragma once
#include "common/logging.hpp"
#include "common/status.hpp"
#include "market_data.hpp"

#include <cmath>
#include <string>
#include <unordered_map>

namespace tbot
{
// Turns raw source events into canonical observations.
// Delivery from sources is at-least-once, so numbered trades already seen are dropped here. Book
// tickers carry no identity; re-delivered ones only rewrite the same close and are harmless.
class Normalizer
{
  std::unordered_map<std::string, u64> last_trade_id_; // per canonical symbol
  u64 rejected_{0};
  u64 duplicates_{0};

public:
  Result<Observation> normalize(const RawPriceEvent &e)
  {
    if (std::holds_alternative<TradeTick>(e))
      return from_trade(std::get<TradeTick>(e));
    return from_book(std::get<BookTicker>(e));
  }

  u64 rejected() const noexcept
  {
    return rejected_;
  }

  u64 duplicates() const noexcept
  {
    return duplicates_;
  }

private:
  Result<Observation> from_trade(const TradeTick &t)
  {
    Observation o{canonical_symbol(t.symbol), t.price, t.quantity, t.event_time};
    Status s = validate(o);
    if (!s.ok())
      return reject(std::move(s));

    if (t.trade_id != 0)
    {
      auto it = last_trade_id_.find(o.symbol);
      if (it != last_trade_id_.end() && t.trade_id <= it->second)
      {
        ++duplicates_;
        TBOT_DEBUG("normalizer: duplicate trade %s #%llu dropped", o.symbol.c_str(),
                   static_cast<unsigned long long>(t.trade_id));
        return Status::error(ErrorCode::DuplicateObservation, "trade id already seen");
      }
      last_trade_id_[o.symbol] = t.trade_id;
    }
    return o;
  }

  Result<Observation> from_book(const BookTicker &b)
  {
    if (b.bid_price > b.ask_price)
      return reject(Status::error(ErrorCode::InvalidObservation, "crossed book"));
    if (!(b.bid_price > 0))
      return reject(Status::error(ErrorCode::InvalidObservation, "bid price must be positive"));
    Observation o{canonical_symbol(b.symbol), (b.bid_price + b.ask_price) / 2, 0, b.event_time};
    Status s = validate(o);
    if (!s.ok())
      return reject(std::move(s));
    return o;
  }

  static Status validate(const Observation &o)
  {
    if (o.symbol.empty())
      return Status::error(ErrorCode::InvalidObservation, "empty symbol");
    if (!std::isfinite(o.price) || o.price <= 0)
      return Status::error(ErrorCode::InvalidObservation, "price must be positive and finite");
    if (!std::isfinite(o.quantity) || o.quantity < 0)
      return Status::error(ErrorCode::InvalidObservation, "quantity must be non-negative");
    if (o.timestamp < 0)
      return Status::error(ErrorCode::InvalidObservation, "negative timestamp");
    return Status::success();
  }

  Status reject(Status s)
  {
    ++rejected_;
    TBOT_WARN("normalizer: %s: %s", to_string(s.code), s.reason.c_str());
    return s;
  }
};
} // namespace tbot
