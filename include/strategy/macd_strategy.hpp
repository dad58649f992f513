#pragma once

#include "indicators/technical.hpp"
#include "strategy.hpp"

#include <memory>

namespace tbot
{
class MacdStrategy final : public IStrategy
{
  std::string macd_name_;
  std::string signal_name_;
  CrossoverDetector cross_;

public:
  std::string name() const override
  {
    return "MACDStrategy";
  }

  std::string description() const override
  {
    return "Generates buy signals when the MACD line crosses above the signal line, and sell "
           "signals when the MACD line crosses below the signal line.";
  }

  std::vector<OptionSpec> options() const override
  {
    return {int_option("fast_period", 12, 1, kMaxPeriod, "fast EMA length"),
            int_option("slow_period", 26, 2, kMaxPeriod, "slow EMA length"),
            int_option("signal_period", 9, 1, kMaxPeriod, "signal EMA length")};
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
    engine.add(std::make_unique<Macd>(static_cast<int>(p.get_int("fast_period")),
                                      static_cast<int>(p.get_int("slow_period")),
                                      static_cast<int>(p.get_int("signal_period"))),
               history);
  }

  void on_start(const ParameterSet &p) override
  {
    const double f = static_cast<double>(p.get_int("fast_period"));
    const double s = static_cast<double>(p.get_int("slow_period"));
    const double g = static_cast<double>(p.get_int("signal_period"));
    macd_name_ = series_name("macd", {f, s, g});
    signal_name_ = series_name("macd_signal", {f, s, g});
    cross_.reset();
  }

  Signal on_bar(const Bar &bar, const IndicatorSnapshot &ind) override
  {
    switch (cross_.update(ind.get(macd_name_), ind.get(signal_name_)))
    {
    case Cross::Up:
      return Signal{Action::Buy, bar.symbol, std::nullopt, "MACD crossed above signal line"};
    case Cross::Down:
      return Signal{Action::Sell, bar.symbol, std::nullopt, "MACD crossed below signal line"};
    case Cross::None:
      break;
    }
    return Signal::hold(bar.symbol);
  }
};
} // namespace tbot
