#pragma once

#include "common/logging.hpp"
#include "execution/executor.hpp"
#include "indicators/indicator_engine.hpp"
#include "market/bar_aggregator.hpp"
#include "market/normalizer.hpp"
#include "strategy/strategy_runtime.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace tbot
{
struct SessionConfig
{
  std::string symbol{"BTCUSDT"};
  Timeframe timeframe{60'000}; // 1m in milliseconds
  ExecutionConfig execution{};
};

// Optional observers, called on the pipeline thread while the session lock is held. They must not
// call back into the session.
struct SessionListeners
{
  std::function<void(const Bar &)> on_bar;
  std::function<void(const Signal &, const Bar &)> on_signal;
  std::function<void(const ExecutionReport &)> on_execution;
};

// The whole per-symbol pipeline: normalizer -> aggregator -> bar history -> indicators -> strategy
// -> executor -> ledger. One session per (execution mode, symbol); nothing in it is shared with
// other sessions. A single lock spans each bar step, so stop_strategy() waits for the bar and fill
// in flight and the ledger never shows half of a step.
class TradingSession
{
  SessionConfig cfg_;
  std::unique_ptr<IExecutor> executor_;
  SessionListeners listeners_;
  Normalizer normalizer_;
  BarAggregator aggregator_;
  std::vector<Bar> history_;
  IndicatorEngine indicators_;
  std::unique_ptr<StrategyRuntime> runtime_;
  WalletLedger ledger_;
  std::vector<double> equity_; // equity at each sealed bar close
  mutable std::mutex mu_;

public:
  TradingSession(SessionConfig cfg, std::unique_ptr<IExecutor> executor,
                 SessionListeners listeners = {})
      : cfg_(std::move(cfg)), executor_(std::move(executor)), listeners_(std::move(listeners)),
        aggregator_(cfg_.symbol, cfg_.timeframe), ledger_(cfg_.execution.initial_balance)
  {
    if (!executor_)
      throw std::invalid_argument("trading session needs an executor");
    cfg_.symbol = aggregator_.symbol();
  }

  TradingSession(const TradingSession &) = delete;
  TradingSession &operator=(const TradingSession &) = delete;

  // Live path. Duplicates and invalid events are dropped here and reported in the status.
  Status on_event(const RawPriceEvent &e)
  {
    std::lock_guard<std::mutex> lk(mu_);
    Result<Observation> o = normalizer_.normalize(e);
    if (!o.ok())
      return o.status();
    return observe(o.value());
  }

  Status on_observation(const Observation &o)
  {
    std::lock_guard<std::mutex> lk(mu_);
    return observe(o);
  }

  // Replay path: a bar that is already sealed skips aggregation. Bars must be for this symbol and
  // strictly after the last one.
  Status on_bar(const Bar &bar)
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (canonical_symbol(bar.symbol) != cfg_.symbol)
    {
      TBOT_WARN("session %s: bar for %s dropped", cfg_.symbol.c_str(), bar.symbol.c_str());
      return Status::error(ErrorCode::InvalidObservation, "bar for another symbol");
    }
    if (!history_.empty() && bar.open_time <= history_.back().open_time)
    {
      TBOT_WARN("session %s: bar at %lld is not after %lld, dropped", cfg_.symbol.c_str(),
                static_cast<long long>(bar.open_time),
                static_cast<long long>(history_.back().open_time));
      return Status::error(ErrorCode::StaleObservation, "bar not after last sealed bar");
    }
    Bar b = bar;
    b.symbol = cfg_.symbol;
    return step(b);
  }

  // Builds a runtime for `strategy`, registers its indicators (warmed over the bars already
  // sealed) and starts it. Refused with StateConflict while another instance is RUNNING.
  Status start_strategy(std::unique_ptr<IStrategy> strategy, const ParameterSet &params)
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (runtime_ && runtime_->state() == StrategyState::Running)
    {
      TBOT_WARN("session %s: %s already running", cfg_.symbol.c_str(), runtime_->id().c_str());
      return Status::error(ErrorCode::StateConflict, runtime_->id() + " is already running");
    }
    if (!strategy)
      return Status::error(ErrorCode::InvalidParameters, "no strategy given");

    std::string id = std::string(to_string(executor_->mode())) + ":" + cfg_.symbol + ":" +
                     strategy->name();
    auto rt = std::make_unique<StrategyRuntime>(std::move(id), std::move(strategy));
    Status st = rt->start(params, indicators_, history_);
    if (!st.ok())
      return st;
    runtime_ = std::move(rt);
    return Status::success();
  }

  Status stop_strategy()
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!runtime_ || runtime_->state() != StrategyState::Running)
      return Status::error(ErrorCode::StateConflict, "no running strategy on " + cfg_.symbol);
    runtime_->stop();
    return Status::success();
  }

  // Lets the executor reconcile outstanding orders.
  std::vector<ExecutionReport> poll()
  {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<ExecutionReport> reports = executor_->poll(ledger_);
    if (listeners_.on_execution)
    {
      for (const ExecutionReport &r : reports)
        listeners_.on_execution(r);
    }
    return reports;
  }

  // Stops the strategy and lets the executor cancel whatever it still has outstanding.
  void shutdown()
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (runtime_ && runtime_->state() == StrategyState::Running)
      runtime_->stop();
    executor_->shutdown(ledger_);
  }

  StrategyState strategy_state() const
  {
    std::lock_guard<std::mutex> lk(mu_);
    return runtime_ ? runtime_->state() : StrategyState::Idle;
  }

  WalletLedger ledger() const
  {
    std::lock_guard<std::mutex> lk(mu_);
    return ledger_;
  }

  std::vector<Bar> history() const
  {
    std::lock_guard<std::mutex> lk(mu_);
    return history_;
  }

  std::size_t bar_count() const
  {
    std::lock_guard<std::mutex> lk(mu_);
    return history_.size();
  }

  std::vector<double> equity_curve() const
  {
    std::lock_guard<std::mutex> lk(mu_);
    return equity_;
  }

  // Copy of a series; empty when the name is unknown.
  std::vector<IndicatorValue> indicator_series(const std::string &name) const
  {
    std::lock_guard<std::mutex> lk(mu_);
    const std::vector<IndicatorValue> *s = indicators_.series(name);
    return s ? *s : std::vector<IndicatorValue>{};
  }

  const std::string &symbol() const noexcept
  {
    return cfg_.symbol;
  }

  Timeframe timeframe() const noexcept
  {
    return cfg_.timeframe;
  }

  ExecutionMode mode() const noexcept
  {
    return executor_->mode();
  }

private:
  Status observe(const Observation &o)
  {
    IngestResult r = aggregator_.ingest(o);
    if (!r.status.ok())
      return r.status;
    if (!r.sealed)
      return Status::success();
    return step(*r.sealed);
  }

  Status step(const Bar &bar)
  {
    history_.push_back(bar);
    const IndicatorSnapshot &snap = indicators_.on_bar(bar);
    if (listeners_.on_bar)
      listeners_.on_bar(bar);

    Status out = Status::success();
    if (runtime_ && runtime_->state() == StrategyState::Running)
    {
      Result<Signal> sig = runtime_->on_bar(bar, snap);
      if (!sig.ok())
      {
        out = sig.status();
      }
      else if (sig.value().action != Action::Hold)
      {
        if (listeners_.on_signal)
          listeners_.on_signal(sig.value(), bar);
        ExecutionReport rep = executor_->execute(sig.value(), bar, ledger_);
        if (listeners_.on_execution)
          listeners_.on_execution(rep);
      }
    }
    equity_.push_back(ledger_.equity(bar.close));
    return out;
  }
};
} // namespace tbot
