#pragma once

#include "indicators/technical.hpp"
#include "strategy.hpp"

#include <cstdio>
#include <memory>

namespace tbot
{
// Buys when the close is within band_touch_pct percent of the lower band and sells when it is
// within that distance of the upper band. The lower band is checked first.
class BollingerStrategy final : public IStrategy
{
  std::string upper_name_;
  std::string lower_name_;
  double touch_pct_{0.5};

public:
  std::string name() const override
  {
    return "BollingerBandsStrategy";
  }

  std::string description() const override
  {
    return "Generates buy signals when price touches the lower Bollinger Band, and sell signals "
           "when price touches the upper Bollinger Band.";
  }

  std::vector<OptionSpec> options() const override
  {
    return {int_option("period", 20, 2, kMaxPeriod, "band length in bars"),
            double_option("std_dev", 2.0, 0, std::nullopt, "band width in standard deviations"),
            double_option("band_touch_pct", 0.5, 0, std::nullopt,
                          "distance to a band, in percent of close, that counts as a touch")};
  }

  void indicators(const ParameterSet &p, IndicatorEngine &engine,
                  const std::vector<Bar> &history) const override
  {
    engine.add(std::make_unique<BollingerBands>(static_cast<int>(p.get_int("period")),
                                                p.get_double("std_dev")),
               history);
  }

  void on_start(const ParameterSet &p) override
  {
    const double period = static_cast<double>(p.get_int("period"));
    const double k = p.get_double("std_dev");
    upper_name_ = series_name("bb_upper", {period, k});
    lower_name_ = series_name("bb_lower", {period, k});
    touch_pct_ = p.get_double("band_touch_pct");
  }

  Signal on_bar(const Bar &bar, const IndicatorSnapshot &ind) override
  {
    const IndicatorValue upper = ind.get(upper_name_);
    const IndicatorValue lower = ind.get(lower_name_);
    if (!upper || !lower || bar.close <= 0)
      return Signal::hold(bar.symbol);

    const double lower_dist = (bar.close - *lower) / bar.close * 100.0;
    const double upper_dist = (*upper - bar.close) / bar.close * 100.0;
    char reason[96];
    if (lower_dist <= touch_pct_)
    {
      std::snprintf(reason, sizeof(reason), "price touched lower band (distance %.2f%%)",
                    lower_dist);
      return Signal{Action::Buy, bar.symbol, std::nullopt, reason};
    }
    if (upper_dist <= touch_pct_)
    {
      std::snprintf(reason, sizeof(reason), "price touched upper band (distance %.2f%%)",
                    upper_dist);
      return Signal{Action::Sell, bar.symbol, std::nullopt, reason};
    }
    return Signal::hold(bar.symbol);
  }
};
} // namespace tbot
