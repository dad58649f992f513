#pragma once

#include "common/logging.hpp"
#include "market/market_data.hpp"
#include "strategy/strategy.hpp"
#include "wallet.hpp"

#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace tbot
{
enum class ExecutionMode : u8
{
  Simulated = 0,
  Live = 1
};

inline const char *to_string(ExecutionMode m) noexcept
{
  return m == ExecutionMode::Simulated ? "simulated" : "live";
}

enum class ExecutionOutcome : u8
{
  Ignored = 0,   // HOLD or a signal the position rules drop
  Filled = 1,    // ledger updated
  Submitted = 2, // live order accepted, ledger untouched until reconciliation
  Rejected = 3   // see status
};

inline const char *to_string(ExecutionOutcome o) noexcept
{
  switch (o)
  {
  case ExecutionOutcome::Ignored:
    return "ignored";
  case ExecutionOutcome::Filled:
    return "filled";
  case ExecutionOutcome::Submitted:
    return "submitted";
  case ExecutionOutcome::Rejected:
    return "rejected";
  }
  return "?";
}

struct ExecutionConfig
{
  double commission_rate{0.001}; // fraction of notional, charged on every fill
  Qty default_quantity{1.0};     // used when a signal carries no quantity
  bool allow_short{false};       // SELL while flat opens a short
  double initial_balance{1000.0};
};

inline void check_execution_config(const ExecutionConfig &c)
{
  if (!(c.commission_rate >= 0) || !std::isfinite(c.commission_rate))
    throw std::invalid_argument("commission rate must be a finite non-negative number");
  if (!(c.default_quantity > 0) || !std::isfinite(c.default_quantity))
    throw std::invalid_argument("default quantity must be positive");
  if (!(c.initial_balance >= 0) || !std::isfinite(c.initial_balance))
    throw std::invalid_argument("initial balance must be a finite non-negative number");
}

// Resolves the order quantity for a signal; InvalidSignal for a non-positive or non-finite one.
inline Result<Qty> signal_quantity(const Signal &s, Qty default_quantity)
{
  const Qty q = s.quantity ? *s.quantity : default_quantity;
  if (!(q > 0) || !std::isfinite(q))
    return Status::error(ErrorCode::InvalidSignal, "signal quantity must be positive and finite");
  return q;
}

struct ExecutionReport
{
  ExecutionOutcome outcome{ExecutionOutcome::Ignored};
  Status status{};
  std::optional<Fill> fill{};
  std::optional<TradeRecord> closed{};
  std::string order_id{};
  std::string note{};
};

// What the single-position rules make of a non-HOLD signal.
struct OrderIntent
{
  Side side{Side::Buy};
  Qty quantity{0};
  bool closing{false};
};

// One position at a time: an opposing signal closes the whole open position (never reverses it in
// the same step), a same-direction signal is ignored, and SELL while flat opens a short only with
// allow_short. Returns the order to place, or the final report when there is nothing to place.
inline std::variant<OrderIntent, ExecutionReport>
apply_position_rules(const Signal &signal, const WalletLedger &ledger, const ExecutionConfig &cfg,
                     const char *tag)
{
  ExecutionReport r;
  if (signal.action == Action::Hold)
    return r;

  Result<Qty> q = signal_quantity(signal, cfg.default_quantity);
  if (!q.ok())
  {
    TBOT_WARN("%s: %s signal rejected: %s", tag, signal.symbol.c_str(),
              q.status().reason.c_str());
    r.outcome = ExecutionOutcome::Rejected;
    r.status = q.status();
    return r;
  }

  const std::optional<Position> &pos = ledger.position();
  OrderIntent intent{signal.action == Action::Buy ? Side::Buy : Side::Sell, q.value(), false};
  if (pos)
  {
    if ((pos->side == PositionSide::Long) == (intent.side == Side::Buy))
    {
      TBOT_INFO("%s: %s %s ignored, %s position already open", tag, signal.symbol.c_str(),
                to_string(signal.action), to_string(pos->side));
      r.note = "position already open";
      return r;
    }
    intent.quantity = pos->quantity;
    intent.closing = true;
  }
  else if (intent.side == Side::Sell && !cfg.allow_short)
  {
    TBOT_INFO("%s: %s SELL ignored, no position and shorting disabled", tag,
              signal.symbol.c_str());
    r.note = "no position to sell";
    return r;
  }
  return intent;
}

// Turns signals into ledger changes, either immediately (simulation) or through an exchange.
class IExecutor
{
public:
  virtual ~IExecutor() = default;
  virtual ExecutionMode mode() const noexcept = 0;
  virtual ExecutionReport execute(const Signal &signal, const Bar &bar, WalletLedger &ledger) = 0;
  // Reconciles outstanding work; returns what was applied or dropped.
  virtual std::vector<ExecutionReport> poll(WalletLedger &ledger) = 0;
  virtual void shutdown(WalletLedger &ledger) = 0;
};
} // namespace tbot
