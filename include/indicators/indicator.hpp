#pragma once
#include "market/market_data.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tbot
{
using IndicatorValue = std::optional<double>;

// An indicator consumes each sealed bar exactly once and reports one value per output, or nullopt
// while it is still warming up. Implementations must be O(1) amortized per bar: the engine never
// rescans history, which keeps long backtests linear in bar count.
class IIndicator
{
public:
  virtual ~IIndicator() = default;
  // Series names, including parameters ("sma_20", "macd_signal_12_26_9").
  virtual const std::vector<std::string> &outputs() const = 0;
  // Writes outputs().size() values into `out`, in the same order.
  virtual void update(const Bar &bar, std::vector<IndicatorValue> &out) = 0;
};

// Convenience base for indicators with a single series.
class SingleValueIndicator : public IIndicator
{
  std::vector<std::string> outputs_;

public:
  explicit SingleValueIndicator(std::string name) : outputs_{std::move(name)} {}

  const std::vector<std::string> &outputs() const override
  {
    return outputs_;
  }

  void update(const Bar &bar, std::vector<IndicatorValue> &out) override
  {
    out.assign(1, next(bar));
  }

  virtual IndicatorValue next(const Bar &bar) = 0;
};

// Ad-hoc indicator built from a name and an update callable, for strategies that need a series the
// library does not ship.
class FunctionIndicator final : public SingleValueIndicator
{
  std::function<IndicatorValue(const Bar &)> fn_;

public:
  FunctionIndicator(std::string name, std::function<IndicatorValue(const Bar &)> fn)
      : SingleValueIndicator(std::move(name)), fn_(std::move(fn))
  {
  }

  IndicatorValue next(const Bar &bar) override
  {
    return fn_(bar);
  }
};

// Whole numbers print as integers, anything else with the fewest digits that read back as the
// same double, so distinct parameters never share a series.
inline std::string format_series_param(double v)
{
  char buf[40];
  if (std::nearbyint(v) == v && std::fabs(v) < 1e15)
  {
    std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(v));
    return buf;
  }
  for (int precision = 6; precision <= 17; ++precision)
  {
    std::snprintf(buf, sizeof(buf), "%.*g", precision, v);
    if (std::strtod(buf, nullptr) == v)
      break;
  }
  return buf;
}

// "bb_upper" + {20, 2.0} -> "bb_upper_20_2", {20, 2.0000001} -> "bb_upper_20_2.0000001"
inline std::string series_name(const char *base, std::initializer_list<double> params)
{
  std::string name(base);
  for (double p : params)
  {
    name += '_';
    name += format_series_param(p);
  }
  return name;
}

// One output name per base, all with the same parameters.
inline std::vector<std::string> series_names(std::initializer_list<const char *> bases,
                                             std::initializer_list<double> params)
{
  std::vector<std::string> names;
  for (const char *b : bases)
    names.push_back(series_name(b, params));
  return names;
}
} // namespace tbot
