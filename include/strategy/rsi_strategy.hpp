#pragma once

#include "indicators/technical.hpp"
#include "strategy.hpp"

#include <cstdio>
#include <memory>

namespace tbot
{
// Buys when RSI climbs back above the oversold level and sells when it falls back below the
// overbought level.
class RsiStrategy final : public IStrategy
{
  std::string rsi_name_;
  double oversold_{30};
  double overbought_{70};
  std::optional<double> prev_;

public:
  std::string name() const override
  {
    return "RSIStrategy";
  }

  std::string description() const override
  {
    return "Generates buy signals when RSI crosses above the oversold level, and sell signals "
           "when RSI crosses below the overbought level.";
  }

  std::vector<OptionSpec> options() const override
  {
    return {int_option("rsi_period", 14, 1, kMaxPeriod, "RSI length in bars"),
            double_option("oversold", 30, 0, 100, "oversold level"),
            double_option("overbought", 70, 0, 100, "overbought level")};
  }

  Status validate(const ParameterSet &p) const override
  {
    if (p.get_double("oversold") >= p.get_double("overbought"))
      return Status::error(ErrorCode::InvalidParameters, "oversold must be below overbought");
    return Status::success();
  }

  void indicators(const ParameterSet &p, IndicatorEngine &engine,
                  const std::vector<Bar> &history) const override
  {
    engine.add(std::make_unique<RelativeStrengthIndex>(static_cast<int>(p.get_int("rsi_period"))),
               history);
  }

  void on_start(const ParameterSet &p) override
  {
    rsi_name_ = series_name("rsi", {static_cast<double>(p.get_int("rsi_period"))});
    oversold_ = p.get_double("oversold");
    overbought_ = p.get_double("overbought");
    prev_.reset();
  }

  Signal on_bar(const Bar &bar, const IndicatorSnapshot &ind) override
  {
    const IndicatorValue rsi = ind.get(rsi_name_);
    const std::optional<double> prev = prev_;
    prev_ = rsi;
    if (!rsi || !prev)
      return Signal::hold(bar.symbol);

    char reason[96];
    if (*prev < oversold_ && *rsi >= oversold_)
    {
      std::snprintf(reason, sizeof(reason), "RSI crossed above oversold level (%g)", oversold_);
      return Signal{Action::Buy, bar.symbol, std::nullopt, reason};
    }
    if (*prev > overbought_ && *rsi <= overbought_)
    {
      std::snprintf(reason, sizeof(reason), "RSI crossed below overbought level (%g)",
                    overbought_);
      return Signal{Action::Sell, bar.symbol, std::nullopt, reason};
    }
    return Signal::hold(bar.symbol);
  }
};
} // namespace tbot
