#pragma once

#include "common/logging.hpp"
#include "common/status.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

namespace tbot
{
enum class PositionSide : u8
{
  Long = 0,
  Short = 1
};

inline const char *to_string(PositionSide s) noexcept
{
  return s == PositionSide::Long ? "LONG" : "SHORT";
}

struct Position
{
  std::string symbol;
  PositionSide side{PositionSide::Long};
  Qty quantity{0};
  Price entry_price{0};
  Timestamp entry_time{0};
  double entry_commission{0}; // not yet charged to a closed trade
};

// One executed fill. Commission is in quote currency.
struct Fill
{
  std::string symbol;
  Side side{Side::Buy};
  Price price{0};
  Qty quantity{0};
  double commission{0};
  Timestamp time{0};
};

// A closed (or partly closed) position. Profit is net of the commissions of both legs.
struct TradeRecord
{
  std::string symbol;
  PositionSide side{PositionSide::Long};
  Price entry_price{0};
  Price exit_price{0};
  Qty quantity{0};
  Timestamp entry_time{0};
  Timestamp exit_time{0};
  double commission{0};
  double profit{0};
  double profit_pct{0}; // relative to entry_price * quantity
};

// Quote balance, the open position and the closed trades of one session. At most one position is
// open at a time; the ledger is owned by exactly one session and never shared.
class WalletLedger
{
  double initial_balance_;
  double balance_;
  double realized_pnl_{0}; // net of both legs' commissions
  std::optional<Position> position_;
  std::vector<TradeRecord> trades_;
  std::vector<Fill> fills_;

public:
  explicit WalletLedger(double initial_balance = 1000.0)
      : initial_balance_(initial_balance), balance_(initial_balance)
  {
  }

  // Applies a fill all-or-nothing. With `enforce_non_negative` a fill that would leave the balance
  // below zero is refused with InsufficientBalance and nothing changes. `closed` receives the trade
  // record when the fill reduces an open position.
  Status apply(const Fill &f, bool enforce_non_negative, TradeRecord *closed = nullptr)
  {
    if (!(f.quantity > 0) || !std::isfinite(f.quantity) || !(f.price > 0) ||
        !std::isfinite(f.price) || f.commission < 0 || !std::isfinite(f.commission))
      return reject(ErrorCode::InvalidSignal, "fill has invalid price, quantity or commission");

    const double notional = f.price * f.quantity;
    const double delta = f.side == Side::Buy ? -(notional + f.commission) : notional - f.commission;
    if (enforce_non_negative && balance_ + delta < 0)
    {
      char why[128];
      std::snprintf(why, sizeof(why), "fill needs %.8f, balance is %.8f", -delta, balance_);
      return reject(ErrorCode::InsufficientBalance, why);
    }

    const PositionSide incoming = f.side == Side::Buy ? PositionSide::Long : PositionSide::Short;
    if (position_ && position_->side != incoming)
    {
      if (f.quantity > position_->quantity + 1e-12)
        return reject(ErrorCode::InvalidSignal, "fill would reverse the open position");
      close_part(f, closed);
    }
    else if (position_)
    {
      // Same direction: average into the position.
      Position &p = *position_;
      const Qty q = p.quantity + f.quantity;
      p.entry_price = (p.entry_price * p.quantity + notional) / q;
      p.quantity = q;
      p.entry_commission += f.commission;
    }
    else
    {
      position_ = Position{f.symbol, incoming, f.quantity, f.price, f.time, f.commission};
    }

    balance_ += delta;
    fills_.push_back(f);
    TBOT_DEBUG("ledger: %s %s %.8f @ %.8f fee %.8f -> balance %.8f", f.symbol.c_str(),
               to_string(f.side), f.quantity, f.price, f.commission, balance_);
    return Status::success();
  }

  // Balance plus the open position marked at `mark`.
  double equity(Price mark) const noexcept
  {
    if (!position_)
      return balance_;
    const double value = position_->quantity * mark;
    return position_->side == PositionSide::Long ? balance_ + value : balance_ - value;
  }

  // Overwrites the quote balance, used when an exchange account is the source of truth.
  void set_balance(double b) noexcept
  {
    balance_ = b;
  }

  double balance() const noexcept
  {
    return balance_;
  }

  double initial_balance() const noexcept
  {
    return initial_balance_;
  }

  // Sum of the profit of every closed trade.
  double realized_pnl() const noexcept
  {
    return realized_pnl_;
  }

  const std::optional<Position> &position() const noexcept
  {
    return position_;
  }

  const std::vector<TradeRecord> &trades() const noexcept
  {
    return trades_;
  }

  const std::vector<Fill> &fills() const noexcept
  {
    return fills_;
  }

private:
  void close_part(const Fill &f, TradeRecord *closed)
  {
    Position &p = *position_;
    const Qty q = std::min(f.quantity, p.quantity);
    const double entry_fee = p.entry_commission * (q / p.quantity);
    const double gross = p.side == PositionSide::Long ? (f.price - p.entry_price) * q
                                                      : (p.entry_price - f.price) * q;
    TradeRecord t;
    t.symbol = p.symbol;
    t.side = p.side;
    t.entry_price = p.entry_price;
    t.exit_price = f.price;
    t.quantity = q;
    t.entry_time = p.entry_time;
    t.exit_time = f.time;
    t.commission = entry_fee + f.commission;
    t.profit = gross - t.commission;
    t.profit_pct = t.profit / (p.entry_price * q) * 100.0;
    trades_.push_back(t);
    realized_pnl_ += t.profit;
    if (closed)
      *closed = t;

    p.quantity -= q;
    p.entry_commission -= entry_fee;
    if (p.quantity <= 1e-12)
      position_.reset();
  }

  Status reject(ErrorCode code, const char *why)
  {
    TBOT_WARN("ledger: fill rejected (%s): %s", to_string(code), why);
    return Status::error(code, why);
  }
};
} // namespace tbot
