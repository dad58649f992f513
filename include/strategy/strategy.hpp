#pragma once

#include "common/types.hpp"
#include "indicators/indicator_engine.hpp"
#include "market/market_data.hpp"
#include "parameters.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tbot
{
enum class Action : u8
{
  Hold = 0,
  Buy = 1,
  Sell = 2
};

inline const char *to_string(Action a) noexcept
{
  switch (a)
  {
  case Action::Buy:
    return "BUY";
  case Action::Sell:
    return "SELL";
  case Action::Hold:
    break;
  }
  return "HOLD";
}

// What a strategy wants done after seeing a bar. Consumed immediately by the executor.
// A missing quantity means "use the executor's configured default".
struct Signal
{
  Action action{Action::Hold};
  std::string symbol;
  std::optional<Qty> quantity;
  std::string reason;

  static Signal hold(const std::string &symbol)
  {
    return Signal{Action::Hold, symbol, std::nullopt, {}};
  }
};

enum class Cross : u8
{
  None,
  Up,
  Down
};

// Reports when series `a` crosses series `b` between two consecutive bars. A bar where either
// value is undefined breaks the sequence, so the next defined bar cannot report a cross.
class CrossoverDetector
{
  std::optional<std::pair<double, double>> prev_;

public:
  Cross update(IndicatorValue a, IndicatorValue b)
  {
    if (!a || !b)
    {
      prev_.reset();
      return Cross::None;
    }
    Cross c = Cross::None;
    if (prev_)
    {
      if (prev_->first <= prev_->second && *a > *b)
        c = Cross::Up;
      else if (prev_->first >= prev_->second && *a < *b)
        c = Cross::Down;
    }
    prev_ = std::make_pair(*a, *b);
    return c;
  }

  void reset() noexcept
  {
    prev_.reset();
  }
};

// Interface every trading strategy implements. The runtime owns one instance per start and calls
// it strictly sequentially: on_start once, on_bar per sealed bar, on_stop once. New strategies plug
// in through the registry without runtime changes.
// Throwing from on_start or on_bar is a fault: the instance is discarded and never resumed.
class IStrategy
{
public:
  virtual ~IStrategy() = default;

  virtual std::string name() const = 0;
  virtual std::string description() const = 0;
  // Options this strategy recognises, with defaults and constraints.
  virtual std::vector<OptionSpec> options() const = 0;
  // Cross-option checks run after per-option validation (e.g. fast period < slow period).
  virtual Status validate(const ParameterSet &params) const
  {
    (void)params;
    return Status::success();
  }
  // Registers the indicator series on_bar will read.
  virtual void indicators(const ParameterSet &params, IndicatorEngine &engine,
                          const std::vector<Bar> &history) const = 0;

  virtual void on_start(const ParameterSet &params) = 0;
  virtual Signal on_bar(const Bar &bar, const IndicatorSnapshot &indicators) = 0;
  virtual void on_stop() {}
};
} // namespace tbot
