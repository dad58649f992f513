#pragma once

#include "indicators/technical.hpp"
#include "strategy.hpp"

#include <memory>

namespace tbot
{
// Buys when the fast SMA crosses above the slow SMA and sells when it crosses below.
class SmaCrossover final : public IStrategy
{
  std::string fast_name_;
  std::string slow_name_;
  CrossoverDetector cross_;

public:
  std::string name() const override
  {
    return "SimpleMovingAverageCrossover";
  }

  std::string description() const override
  {
    return "Generates buy signals when the fast MA crosses above the slow MA, and sell signals "
           "when the fast MA crosses below the slow MA.";
  }

  std::vector<OptionSpec> options() const override
  {
    return {int_option("fast_period", 20, 1, kMaxPeriod, "fast SMA length in bars"),
            int_option("slow_period", 50, 2, kMaxPeriod, "slow SMA length in bars")};
  }

  Status validate(const ParameterSet &p) const override
  {
    if (p.get_int("fast_period") >= p.get_int("slow_period"))
      return Status::error(ErrorCode::InvalidParameters,
                           "fast_period must be less than slow_period");
    return Status::success();
  }

  void indicators(const ParameterSet &p, IndicatorEngine &engine,
                  const std::vector<Bar> &history) const override
  {
    engine.add(std::make_unique<SimpleMovingAverage>(static_cast<int>(p.get_int("fast_period"))),
               history);
    engine.add(std::make_unique<SimpleMovingAverage>(static_cast<int>(p.get_int("slow_period"))),
               history);
  }

  void on_start(const ParameterSet &p) override
  {
    fast_name_ = series_name("sma", {static_cast<double>(p.get_int("fast_period"))});
    slow_name_ = series_name("sma", {static_cast<double>(p.get_int("slow_period"))});
    cross_.reset();
  }

  Signal on_bar(const Bar &bar, const IndicatorSnapshot &ind) override
  {
    switch (cross_.update(ind.get(fast_name_), ind.get(slow_name_)))
    {
    case Cross::Up:
      return Signal{Action::Buy, bar.symbol, std::nullopt,
                    fast_name_ + " crossed above " + slow_name_};
    case Cross::Down:
      return Signal{Action::Sell, bar.symbol, std::nullopt,
                    fast_name_ + " crossed below " + slow_name_};
    case Cross::None:
      break;
    }
    return Signal::hold(bar.symbol);
  }
};
} // namespace tbot
