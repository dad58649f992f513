#pragma once

#include "backtest_report.hpp"
#include "common/logging.hpp"
#include "engine/trading_session.hpp"
#include "execution/execution_simulator.hpp"
#include "market/market_data_source.hpp"
#include "strategy/strategy_registry.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace tbot
{
enum class BacktestState : u8
{
  Loaded = 0,
  Running,
  Paused,
  Finished
};

inline const char *to_string(BacktestState s) noexcept
{
  switch (s)
  {
  case BacktestState::Loaded:
    return "LOADED";
  case BacktestState::Running:
    return "RUNNING";
  case BacktestState::Paused:
    return "PAUSED";
  case BacktestState::Finished:
    return "FINISHED";
  }
  return "?";
}

enum class Pacing : u8
{
  AsFastAsPossible = 0,
  WallClock = 1 // one bar every timeframe / playback_rate
};

struct BacktestConfig
{
  std::string symbol{"BTCUSDT"};
  Timeframe timeframe{3'600'000};
  Timestamp start{0};
  Timestamp end{0};
  std::string strategy{"SimpleMovingAverageCrossover"};
  ParameterSet params{};
  ExecutionConfig execution{};
  Pacing pacing{Pacing::AsFastAsPossible};
  double playback_rate{1.0};
};

// Replays a fixed history through a simulated TradingSession.
// load() fetches the range once; run() feeds sealed bars from the cursor until the end or until
// pause() is called from another thread. While PAUSED the cursor can be moved forward with seek()
// or skip(); skipped bars still go through the whole pipeline, so indicators and the ledger stay
// exactly as a straight run would leave them. Pacing only throttles: the same input always gives
// the same ledger.
class BacktestSession
{
  BacktestConfig cfg_;
  std::vector<Bar> bars_;
  std::unique_ptr<TradingSession> session_;
  std::size_t cursor_{0};
  std::atomic<BacktestState> state_{BacktestState::Loaded};
  // Guards state transitions and the pause request; bars are fed outside it.
  std::mutex control_mutex_;
  bool pause_requested_{false};
  Status fault_{};

  struct Token
  {
  };

public:
  BacktestSession(Token, BacktestConfig cfg, std::vector<Bar> bars,
                  std::unique_ptr<TradingSession> session)
      : cfg_(std::move(cfg)), bars_(std::move(bars)), session_(std::move(session))
  {
  }

  static Result<std::unique_ptr<BacktestSession>> load(BacktestConfig cfg,
                                                       IMarketDataSource &source,
                                                       const StrategyRegistry &registry,
                                                       SessionListeners listeners = {})
  {
    if (cfg.timeframe <= 0)
      return Status::error(ErrorCode::ConfigError, "timeframe must be positive");
    if (!(cfg.playback_rate > 0))
      return Status::error(ErrorCode::ConfigError, "playback rate must be positive");
    cfg.symbol = canonical_symbol(cfg.symbol);

    Result<std::vector<Bar>> bars = source.fetch_history(cfg.symbol, cfg.timeframe, cfg.start,
                                                         cfg.end);
    if (!bars.ok())
    {
      TBOT_ERROR("backtest: history for %s failed: %s", cfg.symbol.c_str(),
                 bars.status().reason.c_str());
      return Status::error(ErrorCode::HistoryFetchError, bars.status().reason);
    }
    Status st = check_history(bars.value());
    if (!st.ok())
    {
      TBOT_ERROR("backtest: history for %s unusable: %s", cfg.symbol.c_str(), st.reason.c_str());
      return st;
    }

    Result<std::unique_ptr<IStrategy>> strategy = registry.create(cfg.strategy);
    if (!strategy.ok())
      return strategy.status();

    SessionConfig sc;
    sc.symbol = cfg.symbol;
    sc.timeframe = cfg.timeframe;
    sc.execution = cfg.execution;
    std::unique_ptr<TradingSession> session;
    try
    {
      session = std::make_unique<TradingSession>(
          sc, std::make_unique<ExecutionSimulator>(cfg.execution), std::move(listeners));
    }
    catch (const std::invalid_argument &e)
    {
      TBOT_ERROR("backtest: %s", e.what());
      return Status::error(ErrorCode::ConfigError, e.what());
    }
    st = session->start_strategy(std::move(strategy.value()), cfg.params);
    if (!st.ok())
      return st;

    TBOT_INFO("backtest: loaded %zu %s bars [%lld, %lld]", bars.value().size(), cfg.symbol.c_str(),
              static_cast<long long>(bars.value().front().open_time),
              static_cast<long long>(bars.value().back().open_time));
    return std::make_unique<BacktestSession>(Token{}, std::move(cfg), std::move(bars.value()),
                                             std::move(session));
  }

  // Non-empty and strictly ascending by open_time.
  static Status check_history(const std::vector<Bar> &bars)
  {
    if (bars.empty())
      return Status::error(ErrorCode::HistoryFetchError, "no bars in range");
    for (std::size_t i = 1; i < bars.size(); ++i)
    {
      if (bars[i].open_time <= bars[i - 1].open_time)
        return Status::error(ErrorCode::HistoryFetchError,
                             "bars not strictly ascending at index " + std::to_string(i));
    }
    return Status::success();
  }

  // Runs from the cursor. Returns when finished or paused; a strategy fault ends the replay.
  // A pause() that returned ok always leaves the session PAUSED, even when it raced the start.
  Status run()
  {
    {
      std::lock_guard<std::mutex> lock(control_mutex_);
      const BacktestState s = state_.load(std::memory_order_acquire);
      if (s != BacktestState::Loaded && s != BacktestState::Paused)
        return Status::error(ErrorCode::StateConflict,
                             std::string("cannot run a backtest that is ") + to_string(s));
      pause_requested_ = false;
      state_.store(BacktestState::Running, std::memory_order_release);
    }

    const auto gap = std::chrono::duration<double, std::milli>(
        static_cast<double>(cfg_.timeframe) / cfg_.playback_rate);
    while (cursor_ < bars_.size())
    {
      if (take_pause())
        return Status::success();
      Status st = feed_one();
      if (!st.ok())
        return st;
      if (cfg_.pacing == Pacing::WallClock && cursor_ < bars_.size())
        std::this_thread::sleep_for(gap);
    }
    if (take_pause())
      return Status::success();
    finish();
    return Status::success();
  }

  // Thread-safe. A running replay stops before its next bar; a loaded one is paused in place.
  Status pause()
  {
    std::lock_guard<std::mutex> lock(control_mutex_);
    const BacktestState s = state_.load(std::memory_order_acquire);
    if (s == BacktestState::Loaded)
    {
      state_.store(BacktestState::Paused, std::memory_order_release);
      return Status::success();
    }
    if (s == BacktestState::Running)
    {
      pause_requested_ = true;
      return Status::success();
    }
    return Status::error(ErrorCode::StateConflict,
                         std::string("cannot pause a backtest that is ") + to_string(s));
  }

  // Advances to the first bar at or after `open_time`.
  Status seek(Timestamp open_time)
  {
    Status st = require_paused("seek");
    if (!st.ok())
      return st;
    auto it = std::lower_bound(bars_.begin(), bars_.end(), open_time,
                               [](const Bar &b, Timestamp t) { return b.open_time < t; });
    const std::size_t target = static_cast<std::size_t>(it - bars_.begin());
    if (target < cursor_)
    {
      TBOT_WARN("backtest: seek to %lld would move backwards", static_cast<long long>(open_time));
      return Status::error(ErrorCode::StateConflict, "seek only moves forward");
    }
    return advance(target - cursor_);
  }

  Status skip(std::size_t n)
  {
    Status st = require_paused("skip");
    if (!st.ok())
      return st;
    return advance(std::min(n, bars_.size() - cursor_));
  }

  BacktestReport result() const
  {
    const WalletLedger ledger = session_->ledger();
    const Price last = cursor_ > 0 ? bars_[cursor_ - 1].close : 0;
    BacktestReport r = compute_report(ledger, session_->equity_curve(), last);
    r.symbol = cfg_.symbol;
    r.strategy = cfg_.strategy;
    r.params = format_params(cfg_.params);
    return r;
  }

  WalletLedger ledger() const
  {
    return session_->ledger();
  }

  BacktestState state() const noexcept
  {
    return state_.load(std::memory_order_acquire);
  }

  std::size_t cursor() const noexcept
  {
    return cursor_;
  }

  const std::vector<Bar> &bars() const noexcept
  {
    return bars_;
  }

  TradingSession &session() noexcept
  {
    return *session_;
  }

  // Set when a strategy fault ended the replay early.
  const Status &fault() const noexcept
  {
    return fault_;
  }

private:
  Status require_paused(const char *what) const
  {
    const BacktestState s = state();
    if (s == BacktestState::Paused)
      return Status::success();
    TBOT_WARN("backtest: %s refused while %s", what, to_string(s));
    return Status::error(ErrorCode::StateConflict,
                         std::string(what) + " needs a paused backtest, state is " + to_string(s));
  }

  Status advance(std::size_t n)
  {
    for (std::size_t i = 0; i < n; ++i)
    {
      Status st = feed_one();
      if (!st.ok())
        return st;
    }
    if (cursor_ == bars_.size())
      finish();
    return Status::success();
  }

  // Called by the running replay between bars.
  bool take_pause()
  {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (!pause_requested_)
      return false;
    pause_requested_ = false;
    state_.store(BacktestState::Paused, std::memory_order_release);
    TBOT_INFO("backtest: paused at bar %zu of %zu", cursor_, bars_.size());
    return true;
  }

  Status feed_one()
  {
    Status st = session_->on_bar(bars_[cursor_++]);
    if (st.code == ErrorCode::StrategyFault)
    {
      fault_ = st;
      TBOT_ERROR("backtest: strategy fault at bar %zu, replay ends: %s", cursor_,
                 st.reason.c_str());
      finish();
      return st;
    }
    return Status::success();
  }

  void finish()
  {
    {
      std::lock_guard<std::mutex> lock(control_mutex_);
      pause_requested_ = false;
      state_.store(BacktestState::Finished, std::memory_order_release);
    }
    const WalletLedger l = session_->ledger();
    TBOT_INFO("backtest: finished at bar %zu of %zu, balance %.8f, %zu trades", cursor_,
              bars_.size(), l.balance(), l.trades().size());
  }
};
} // namespace tbot
