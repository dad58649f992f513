#include <cstdio>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "backtest/backtest_session.hpp"
#include "common/logging.hpp"
#include "config/config_loader.hpp"
#include "market/csv_history_source.hpp"
#include "market/random_walk_source.hpp"

using namespace tbot;

namespace
{
// Bars synthesized when no CSV is given and the config leaves the range open.
constexpr Timestamp kSyntheticBars = 1000;

void list_strategies(const StrategyRegistry &registry, std::FILE *out)
{
  std::fprintf(out, "strategies:\n");
  for (const std::string &name : registry.available())
  {
    Result<StrategyInfo> info = registry.describe(name);
    if (!info.ok())
      continue;
    std::fprintf(out, "  %s\n", name.c_str());
    for (const OptionSpec &o : info.value().options)
      std::fprintf(out, "    %-16s %-6s default %-8s %s\n", o.name.c_str(), to_string(o.type),
                   format_param(o.default_value).c_str(), o.help.c_str());
  }
}

void usage(const StrategyRegistry &registry)
{
  std::fprintf(stderr,
               "usage: tbot_backtest [--config FILE] [--csv FILE] [--strategy NAME]\n"
               "                     [--param NAME=VALUE]... [--symbol SYM] [--timeframe 1h]\n"
               "                     [--start MS] [--end MS] [--trade-log FILE]\n"
               "                     [--log-level debug|info|warn|error] [--list]\n");
  list_strategies(registry, stderr);
}
} // namespace

// Replays history through one strategy and prints the result.
// Without --csv the history is a seeded random walk, so runs are reproducible.
int main(int argc, char **argv)
{
  StrategyRegistry registry;
  Result<EngineConfig> loaded = load_engine_config(std::vector<std::string>(argv + 1, argv + argc));
  if (!loaded.ok())
  {
    usage(registry);
    return 2;
  }
  EngineConfig cfg = loaded.value();
  set_log_level(cfg.log_level);
  if (cfg.list_strategies)
  {
    list_strategies(registry, stdout);
    return 0;
  }
  BacktestConfig &bt = cfg.backtest;

  Result<StrategyInfo> info = registry.describe(bt.strategy);
  if (!info.ok())
  {
    usage(registry);
    return 2;
  }
  Result<ParameterSet> params = resolve_params(info.value().options, cfg.raw_params);
  if (!params.ok())
  {
    TBOT_ERROR("%s: %s", bt.strategy.c_str(), params.status().reason.c_str());
    return 2;
  }
  bt.params = params.value();

  std::unique_ptr<IMarketDataSource> source;
  if (!cfg.csv_path.empty())
  {
    source = std::make_unique<CsvHistorySource>(cfg.csv_path);
    if (bt.end == 0)
      bt.end = std::numeric_limits<Timestamp>::max();
  }
  else
  {
    source = std::make_unique<RandomWalkSource>(cfg.random_walk);
    if (bt.end == 0)
      bt.end = bt.start + (kSyntheticBars - 1) * bt.timeframe;
  }

  Result<std::unique_ptr<BacktestSession>> session = BacktestSession::load(bt, *source, registry);
  if (!session.ok())
  {
    TBOT_ERROR("backtest not started: %s", session.status().reason.c_str());
    return 1;
  }
  BacktestSession &backtest = *session.value();
  Status st = backtest.run();
  if (!st.ok())
    TBOT_ERROR("backtest ended early (%s): %s", to_string(st.code), st.reason.c_str());

  print_report(backtest.result());
  if (!cfg.trade_log.empty())
  {
    Status written = write_trade_log(backtest.ledger(), cfg.trade_log);
    if (!written.ok())
      return 1;
  }
  return st.ok() ? 0 : 1;
}
