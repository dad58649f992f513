#include <atomic>
#include <chrono>
#include <cstdio>
#include <string>
#include <thread>
#include <vector>

#include "common/logging.hpp"
#include "config/config_loader.hpp"
#include "engine/live_feed.hpp"
#include "engine/strategy_supervisor.hpp"
#include "market/random_walk_source.hpp"

using namespace tbot;

// Runs one strategy in simulated execution against the random-walk stream: ticks are normalized,
// aggregated into bars and traded on as they seal. Stops after live.duration_s seconds.
int main(int argc, char **argv)
{
  Result<EngineConfig> loaded = load_engine_config(std::vector<std::string>(argv + 1, argv + argc));
  if (!loaded.ok())
    return 2;
  const EngineConfig &cfg = loaded.value();
  set_log_level(cfg.log_level);

  std::atomic<int> fills{0};
  SessionListeners listeners;
  listeners.on_bar = [](const Bar &b) {
    TBOT_DEBUG("bar %s %lld o=%.2f h=%.2f l=%.2f c=%.2f v=%.4f", b.symbol.c_str(),
               static_cast<long long>(b.open_time), b.open, b.high, b.low, b.close, b.volume);
  };
  listeners.on_execution = [&fills](const ExecutionReport &r) {
    if (r.outcome == ExecutionOutcome::Filled)
      fills.fetch_add(1, std::memory_order_relaxed);
  };

  SessionConfig defaults;
  defaults.timeframe = cfg.backtest.timeframe;
  defaults.execution = cfg.backtest.execution;
  StrategySupervisor supervisor(defaults, nullptr, listeners);

  Result<StrategyInfo> info = supervisor.registry().describe(cfg.backtest.strategy);
  if (!info.ok())
    return 2;
  Result<ParameterSet> params = resolve_params(info.value().options, cfg.raw_params);
  if (!params.ok())
  {
    TBOT_ERROR("%s: %s", cfg.backtest.strategy.c_str(), params.status().reason.c_str());
    return 2;
  }

  Status st = supervisor.start(ExecutionMode::Simulated, cfg.backtest.symbol,
                               cfg.backtest.strategy, params.value());
  if (!st.ok())
    return 1;
  TradingSession *session = supervisor.session(ExecutionMode::Simulated, cfg.backtest.symbol);

  RandomWalkSource source(cfg.random_walk);
  LiveFeed feed(source, *session);
  st = feed.start();
  if (!st.ok())
    return 1;

  std::this_thread::sleep_for(std::chrono::duration<double>(cfg.live_duration_s));

  feed.stop();
  st = supervisor.stop(ExecutionMode::Simulated, cfg.backtest.symbol);
  if (!st.ok())
    TBOT_WARN("strategy was no longer running: %s", st.reason.c_str());

  const WalletLedger ledger = session->ledger();
  TBOT_INFO("Done: %zu bars, %d fills, %zu closed trades, balance %.8f", session->bar_count(),
            fills.load(), ledger.trades().size(), ledger.balance());
  return 0;
}
