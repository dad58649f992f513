#pragma once
#include "common/logging.hpp"
#include "indicator.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tbot
{
// Values of every series for the bar just sealed, looked up by series name.
class IndicatorSnapshot
{
  std::vector<std::pair<std::string, IndicatorValue>> values_;

public:
  void set(const std::string &name, IndicatorValue v)
  {
    values_.emplace_back(name, v);
  }

  // nullopt both for unknown names and for series still warming up.
  IndicatorValue get(sv name) const
  {
    for (const auto &kv : values_)
    {
      if (kv.first == name)
        return kv.second;
    }
    return std::nullopt;
  }

  bool has(sv name) const
  {
    return std::any_of(values_.begin(), values_.end(),
                       [name](const auto &kv) { return kv.first == name; });
  }

  const std::vector<std::pair<std::string, IndicatorValue>> &values() const noexcept
  {
    return values_;
  }
};

// Runs every registered indicator once per sealed bar and keeps one value per bar in each series,
// so a series is always exactly as long as the sealed-bar history.
class IndicatorEngine
{
  struct Slot
  {
    std::unique_ptr<IIndicator> indicator;
    std::vector<std::size_t> series; // index into series_ per output
  };

  std::vector<Slot> slots_;
  std::vector<std::vector<IndicatorValue>> series_;
  std::unordered_map<std::string, std::size_t> by_name_;
  std::vector<std::string> names_;
  std::size_t bars_{0};
  IndicatorSnapshot latest_;
  std::vector<IndicatorValue> scratch_;

public:
  // Registers an indicator. Outputs already present are left to the existing registration, so two
  // strategies asking for "sma_20" share one series. `history` must hold every bar sealed so far; a
  // late indicator is warmed up over it to keep its series aligned.
  void add(std::unique_ptr<IIndicator> ind, const std::vector<Bar> &history = {})
  {
    const std::vector<std::string> &outs = ind->outputs();
    const bool all_known = std::all_of(outs.begin(), outs.end(),
                                       [this](const std::string &n) { return by_name_.count(n); });
    if (all_known)
      return;
    if (history.size() != bars_)
    {
      TBOT_ERROR("indicators: history of %zu bars given, %zu sealed", history.size(), bars_);
      throw std::invalid_argument("indicator warm-up history does not match sealed bars");
    }

    Slot slot{std::move(ind), {}};
    for (const std::string &name : slot.indicator->outputs())
    {
      auto it = by_name_.find(name);
      if (it != by_name_.end())
      {
        // Shared output: keep the existing series, discard this indicator's copy.
        slot.series.push_back(static_cast<std::size_t>(-1));
        continue;
      }
      by_name_.emplace(name, series_.size());
      names_.push_back(name);
      slot.series.push_back(series_.size());
      series_.emplace_back();
      series_.back().reserve(history.size());
    }

    for (const Bar &b : history)
      run(slot, b);
    TBOT_DEBUG("indicators: registered %s (+%zu outputs, warmed over %zu bars)",
               slot.indicator->outputs().front().c_str(), slot.series.size(), history.size());
    slots_.push_back(std::move(slot));
  }

  const IndicatorSnapshot &on_bar(const Bar &bar)
  {
    for (Slot &s : slots_)
      run(s, bar);
    ++bars_;
    latest_ = IndicatorSnapshot{};
    for (std::size_t i = 0; i < names_.size(); ++i)
      latest_.set(names_[i], series_[i].back());
    return latest_;
  }

  const IndicatorSnapshot &latest() const noexcept
  {
    return latest_;
  }

  // nullptr when nothing registered that name.
  const std::vector<IndicatorValue> *series(const std::string &name) const
  {
    auto it = by_name_.find(name);
    return it == by_name_.end() ? nullptr : &series_[it->second];
  }

  const std::vector<std::string> &names() const noexcept
  {
    return names_;
  }

  std::size_t bar_count() const noexcept
  {
    return bars_;
  }

private:
  void run(Slot &s, const Bar &bar)
  {
    scratch_.clear();
    s.indicator->update(bar, scratch_);
    scratch_.resize(s.series.size());
    for (std::size_t i = 0; i < s.series.size(); ++i)
    {
      if (s.series[i] != static_cast<std::size_t>(-1))
        series_[s.series[i]].push_back(scratch_[i]);
    }
  }
};
} // namespace tbot
