#pragma once

#include "backtest/backtest_session.hpp"
#include "common/logging.hpp"
#include "market/random_walk_source.hpp"

#include <map>
#include <string>
#include <vector>

namespace tbot
{
// Everything the executables can be told from a YAML file or the command line. Every key is
// optional; a missing one keeps the struct default.
struct EngineConfig
{
  BacktestConfig backtest{};
  // Strategy options as written by the user. Typed against the strategy's option table by
  // resolve_params once the strategy is known.
  std::map<std::string, std::string> raw_params{};
  RandomWalkConfig random_walk{};
  std::string csv_path{};  // empty = synthetic history
  std::string trade_log{}; // empty = no trade CSV
  double live_duration_s{5.0};
  LogLevel log_level{LogLevel::Info};
  bool list_strategies{false}; // --list: describe the strategies and exit
};

// Parses YAML text. Malformed documents and values of the wrong type are ConfigError.
Result<EngineConfig> parse_config(const std::string &yaml_text, EngineConfig base = {});

Result<EngineConfig> load_config_file(const std::string &path, EngineConfig base = {});

// Reads --config first, then applies the remaining flags on top of the file:
//   --config PATH  --csv PATH  --strategy NAME  --param NAME=VALUE (repeatable)
//   --symbol SYM  --timeframe 1h  --start MS  --end MS  --trade-log PATH  --log-level LEVEL
//   --list (takes no value)
Result<EngineConfig> load_engine_config(const std::vector<std::string> &args);

// Converts raw option strings to typed values using the strategy's option table.
Result<ParameterSet> resolve_params(const std::vector<OptionSpec> &options,
                                    const std::map<std::string, std::string> &raw);
} // namespace tbot
