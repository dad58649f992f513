#pragma once
#include "indicator.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <deque>
#include <stdexcept>
#include <utility>
#include <vector>

namespace tbot
{
// Fixed-length window with a running sum and sum of squares.
// The sums are rebuilt from the buffer every time the write index wraps, which bounds
// floating-point drift over long runs and still costs O(1) amortized per push.
class RollingWindow
{
  std::vector<double> buf_;
  std::size_t next_{0};
  std::size_t count_{0};
  double sum_{0};
  double sumsq_{0};

public:
  explicit RollingWindow(std::size_t length) : buf_(length, 0.0)
  {
    if (length == 0)
      throw std::invalid_argument("rolling window length must be greater than 0");
  }

  void push(double x)
  {
    if (count_ == buf_.size())
    {
      const double old = buf_[next_];
      sum_ -= old;
      sumsq_ -= old * old;
    }
    else
    {
      ++count_;
    }
    buf_[next_] = x;
    sum_ += x;
    sumsq_ += x * x;
    next_ = (next_ + 1) % buf_.size();
    if (next_ == 0 && full())
      resum();
  }

  void clear() noexcept
  {
    next_ = 0;
    count_ = 0;
    sum_ = 0;
    sumsq_ = 0;
  }

  bool full() const noexcept
  {
    return count_ == buf_.size();
  }

  std::size_t length() const noexcept
  {
    return buf_.size();
  }

  double mean() const noexcept
  {
    return sum_ / static_cast<double>(count_);
  }

  // Sample (n - 1) variance of a full window, never negative.
  double sample_variance() const noexcept
  {
    const double n = static_cast<double>(count_);
    if (count_ < 2)
      return 0;
    return std::max(0.0, (sumsq_ - sum_ * sum_ / n) / (n - 1));
  }

private:
  void resum() noexcept
  {
    sum_ = 0;
    sumsq_ = 0;
    for (double v : buf_)
    {
      sum_ += v;
      sumsq_ += v * v;
    }
  }
};

inline std::size_t checked_period(int period, const char *what)
{
  if (period <= 0)
    throw std::invalid_argument(std::string(what) + " period must be greater than 0");
  return static_cast<std::size_t>(period);
}

// Mean of the last P closes; undefined until P bars have been seen.
class SimpleMovingAverage final : public SingleValueIndicator
{
  RollingWindow window_;

public:
  explicit SimpleMovingAverage(int period)
      : SingleValueIndicator(series_name("sma", {static_cast<double>(period)})),
        window_(checked_period(period, "SMA"))
  {
  }

  IndicatorValue next(const Bar &bar) override
  {
    window_.push(bar.close);
    if (!window_.full())
      return std::nullopt;
    return window_.mean();
  }
};

// Recursive EMA with alpha = 2 / (P + 1), seeded with the first value.
class EmaState
{
  double alpha_;
  std::optional<double> value_;

public:
  explicit EmaState(int period)
      : alpha_(2.0 / (static_cast<double>(checked_period(period, "EMA")) + 1.0))
  {
  }

  double push(double x) noexcept
  {
    value_ = value_ ? alpha_ * x + (1.0 - alpha_) * *value_ : x;
    return *value_;
  }
};

class ExponentialMovingAverage final : public SingleValueIndicator
{
  EmaState ema_;

public:
  explicit ExponentialMovingAverage(int period)
      : SingleValueIndicator(series_name("ema", {static_cast<double>(period)})), ema_(period)
  {
  }

  IndicatorValue next(const Bar &bar) override
  {
    return ema_.push(bar.close);
  }
};

// Wilder's RSI. The first average gain/loss is the plain mean of the first P changes, later ones
// are smoothed as avg = (avg * (P - 1) + x) / P. A window without losses reads 100.
class RelativeStrengthIndex final : public SingleValueIndicator
{
  double period_;
  std::optional<double> prev_close_;
  std::size_t changes_{0};
  double avg_gain_{0};
  double avg_loss_{0};

public:
  explicit RelativeStrengthIndex(int period)
      : SingleValueIndicator(series_name("rsi", {static_cast<double>(period)})),
        period_(static_cast<double>(checked_period(period, "RSI")))
  {
  }

  IndicatorValue next(const Bar &bar) override
  {
    if (!prev_close_)
    {
      prev_close_ = bar.close;
      return std::nullopt;
    }
    const double change = bar.close - *prev_close_;
    prev_close_ = bar.close;
    const double gain = change > 0 ? change : 0.0;
    const double loss = change < 0 ? -change : 0.0;
    ++changes_;

    if (static_cast<double>(changes_) <= period_)
    {
      // Warm-up: accumulate sums, divide once the first P changes are in.
      avg_gain_ += gain;
      avg_loss_ += loss;
      if (static_cast<double>(changes_) < period_)
        return std::nullopt;
      avg_gain_ /= period_;
      avg_loss_ /= period_;
    }
    else
    {
      avg_gain_ = (avg_gain_ * (period_ - 1) + gain) / period_;
      avg_loss_ = (avg_loss_ * (period_ - 1) + loss) / period_;
    }
    return rsi(avg_gain_, avg_loss_);
  }

  static double rsi(double avg_gain, double avg_loss) noexcept
  {
    if (avg_loss <= 0)
      return 100.0;
    const double rs = avg_gain / avg_loss;
    return std::clamp(100.0 - 100.0 / (1.0 + rs), 0.0, 100.0);
  }
};

// MACD line (fast EMA - slow EMA), its signal EMA and the histogram between them.
class Macd final : public IIndicator
{
  std::vector<std::string> outputs_;
  EmaState fast_;
  EmaState slow_;
  EmaState signal_;

public:
  Macd(int fast, int slow, int signal)
      : outputs_(series_names({"macd", "macd_signal", "macd_hist"},
                              {static_cast<double>(fast), static_cast<double>(slow),
                               static_cast<double>(signal)})),
        fast_(fast), slow_(slow), signal_(signal)
  {
  }

  const std::vector<std::string> &outputs() const override
  {
    return outputs_;
  }

  void update(const Bar &bar, std::vector<IndicatorValue> &out) override
  {
    const double line = fast_.push(bar.close) - slow_.push(bar.close);
    const double sig = signal_.push(line);
    out.assign({line, sig, line - sig});
  }
};

// Middle band = SMA(P); upper/lower = middle +/- k sample standard deviations.
class BollingerBands final : public IIndicator
{
  std::vector<std::string> outputs_;
  RollingWindow window_;
  double k_;

public:
  BollingerBands(int period, double k)
      : outputs_(series_names({"bb_upper", "bb_middle", "bb_lower"},
                              {static_cast<double>(period), k})),
        window_(checked_period(period, "Bollinger")), k_(k)
  {
    if (period < 2)
      throw std::invalid_argument("Bollinger period must be at least 2");
  }

  const std::vector<std::string> &outputs() const override
  {
    return outputs_;
  }

  void update(const Bar &bar, std::vector<IndicatorValue> &out) override
  {
    window_.push(bar.close);
    if (!window_.full())
    {
      out.assign(3, std::nullopt);
      return;
    }
    const double mid = window_.mean();
    const double band = k_ * std::sqrt(window_.sample_variance());
    out.assign({mid + band, mid, mid - band});
  }
};

// Mean of the last P true ranges. The first bar has no previous close, its range is high - low.
class AverageTrueRange final : public SingleValueIndicator
{
  RollingWindow window_;
  std::optional<double> prev_close_;

public:
  explicit AverageTrueRange(int period)
      : SingleValueIndicator(series_name("atr", {static_cast<double>(period)})),
        window_(checked_period(period, "ATR"))
  {
  }

  IndicatorValue next(const Bar &bar) override
  {
    double tr = bar.high - bar.low;
    if (prev_close_)
      tr = std::max({tr, std::abs(bar.high - *prev_close_), std::abs(bar.low - *prev_close_)});
    prev_close_ = bar.close;
    window_.push(tr);
    if (!window_.full())
      return std::nullopt;
    return window_.mean();
  }
};

// Stochastic oscillator. %K over the last k bars uses monotonic deques for the running low/high;
// %D is the mean of the last d defined %K values. A flat range leaves %K undefined.
class Stochastic final : public IIndicator
{
  std::vector<std::string> outputs_;
  std::size_t k_;
  std::size_t index_{0};
  std::deque<std::pair<std::size_t, double>> lows_;  // ascending values
  std::deque<std::pair<std::size_t, double>> highs_; // descending values
  RollingWindow d_window_;

public:
  Stochastic(int k_period, int d_period)
      : outputs_(series_names({"stoch_k", "stoch_d"},
                              {static_cast<double>(k_period), static_cast<double>(d_period)})),
        k_(checked_period(k_period, "Stochastic %K")),
        d_window_(checked_period(d_period, "Stochastic %D"))
  {
  }

  const std::vector<std::string> &outputs() const override
  {
    return outputs_;
  }

  void update(const Bar &bar, std::vector<IndicatorValue> &out) override
  {
    const std::size_t i = index_++;
    while (!lows_.empty() && lows_.back().second >= bar.low)
      lows_.pop_back();
    lows_.emplace_back(i, bar.low);
    while (!highs_.empty() && highs_.back().second <= bar.high)
      highs_.pop_back();
    highs_.emplace_back(i, bar.high);
    // Evict entries that fell out of the k-bar window.
    while (lows_.front().first + k_ <= i)
      lows_.pop_front();
    while (highs_.front().first + k_ <= i)
      highs_.pop_front();

    IndicatorValue k_value;
    const double range = highs_.front().second - lows_.front().second;
    if (index_ >= k_ && range > 0)
      k_value = 100.0 * (bar.close - lows_.front().second) / range;

    IndicatorValue d_value;
    if (k_value)
    {
      d_window_.push(*k_value);
      if (d_window_.full())
        d_value = d_window_.mean();
    }
    else
    {
      d_window_.clear();
    }
    out.assign({k_value, d_value});
  }
};
} // namespace tbot
