#include "config/config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>

namespace tbot
{
namespace
{
Status config_error(const std::string &why)
{
  TBOT_ERROR("config: %s", why.c_str());
  return Status::error(ErrorCode::ConfigError, why);
}

// "1h" style strings or a plain number of milliseconds.
Result<Timeframe> timeframe_from(const std::string &text)
{
  if (std::optional<Timeframe> tf = parse_timeframe(text))
    return *tf;
  char *end = nullptr;
  const long long ms = std::strtoll(text.c_str(), &end, 10);
  if (!text.empty() && *end == '\0' && ms > 0)
    return static_cast<Timeframe>(ms);
  return config_error("invalid timeframe '" + text + "'");
}

Result<Timestamp> timestamp_from(const std::string &text)
{
  char *end = nullptr;
  const long long v = std::strtoll(text.c_str(), &end, 10);
  if (text.empty() || *end != '\0')
    return config_error("invalid timestamp '" + text + "'");
  return static_cast<Timestamp>(v);
}

Result<Pacing> pacing_from(const std::string &text)
{
  if (text == "fast")
    return Pacing::AsFastAsPossible;
  if (text == "wallclock")
    return Pacing::WallClock;
  return config_error("pacing must be 'fast' or 'wallclock', got '" + text + "'");
}

Status set_log_level_from(const std::string &text, EngineConfig &cfg)
{
  std::optional<LogLevel> lvl = parse_log_level(text.c_str());
  if (!lvl)
    return config_error("unknown log level '" + text + "'");
  cfg.log_level = *lvl;
  return Status::success();
}

Status set_param(const std::string &assignment, EngineConfig &cfg)
{
  const auto eq = assignment.find('=');
  if (eq == std::string::npos || eq == 0)
    return config_error("--param expects NAME=VALUE, got '" + assignment + "'");
  cfg.raw_params[assignment.substr(0, eq)] = assignment.substr(eq + 1);
  return Status::success();
}

// Sections are read the same way: a key present overrides the default, a key absent keeps it.
Status read_document(const YAML::Node &root, EngineConfig &cfg)
{
  if (root["log_level"])
  {
    Status st = set_log_level_from(root["log_level"].as<std::string>(), cfg);
    if (!st.ok())
      return st;
  }

  BacktestConfig &bt = cfg.backtest;
  if (const YAML::Node market = root["market"])
  {
    bt.symbol = market["symbol"].as<std::string>(bt.symbol);
    if (market["timeframe"])
    {
      Result<Timeframe> tf = timeframe_from(market["timeframe"].as<std::string>());
      if (!tf.ok())
        return tf.status();
      bt.timeframe = tf.value();
    }
    bt.start = market["start"].as<Timestamp>(bt.start);
    bt.end = market["end"].as<Timestamp>(bt.end);
    cfg.csv_path = market["csv"].as<std::string>(cfg.csv_path);
  }

  if (const YAML::Node strategy = root["strategy"])
  {
    bt.strategy = strategy["name"].as<std::string>(bt.strategy);
    if (const YAML::Node params = strategy["params"])
    {
      if (!params.IsMap())
        return config_error("strategy.params must be a mapping");
      for (const auto &kv : params)
        cfg.raw_params[kv.first.as<std::string>()] = kv.second.as<std::string>();
    }
  }

  if (const YAML::Node exec = root["execution"])
  {
    ExecutionConfig &e = bt.execution;
    e.commission_rate = exec["commission_rate"].as<double>(e.commission_rate);
    e.default_quantity = exec["default_quantity"].as<double>(e.default_quantity);
    e.allow_short = exec["allow_short"].as<bool>(e.allow_short);
    e.initial_balance = exec["initial_balance"].as<double>(e.initial_balance);
  }

  if (const YAML::Node replay = root["backtest"])
  {
    if (replay["pacing"])
    {
      Result<Pacing> p = pacing_from(replay["pacing"].as<std::string>());
      if (!p.ok())
        return p.status();
      bt.pacing = p.value();
    }
    bt.playback_rate = replay["playback_rate"].as<double>(bt.playback_rate);
    cfg.trade_log = replay["trade_log"].as<std::string>(cfg.trade_log);
  }

  if (const YAML::Node rw = root["random_walk"])
  {
    RandomWalkConfig &r = cfg.random_walk;
    r.start_price = rw["start_price"].as<double>(r.start_price);
    r.tick = rw["tick"].as<double>(r.tick);
    r.move_prob = rw["move_prob"].as<double>(r.move_prob);
    r.max_qty = rw["max_qty"].as<double>(r.max_qty);
    r.start_time = rw["start_time"].as<Timestamp>(r.start_time);
    r.tick_interval = rw["tick_interval"].as<Timestamp>(r.tick_interval);
    r.duplicate_prob = rw["duplicate_prob"].as<double>(r.duplicate_prob);
    r.disconnect_every = rw["disconnect_every"].as<u64>(r.disconnect_every);
    r.disconnect_prints = rw["disconnect_prints"].as<u64>(r.disconnect_prints);
    r.page_limit = rw["page_limit"].as<std::size_t>(r.page_limit);
    r.step_sleep_us = rw["step_sleep_us"].as<u64>(r.step_sleep_us);
    r.seed = rw["seed"].as<u64>(r.seed);
  }

  if (const YAML::Node live = root["live"])
    cfg.live_duration_s = live["duration_s"].as<double>(cfg.live_duration_s);
  return Status::success();
}

Status validate(const EngineConfig &cfg)
{
  if (canonical_symbol(cfg.backtest.symbol).empty())
    return config_error("symbol must not be empty");
  if (cfg.backtest.end < cfg.backtest.start)
    return config_error("end is before start");
  if (!(cfg.backtest.playback_rate > 0))
    return config_error("playback_rate must be positive");
  const ExecutionConfig &e = cfg.backtest.execution;
  if (!(e.commission_rate >= 0) || !(e.default_quantity > 0) || !(e.initial_balance >= 0))
    return config_error("execution values out of range");
  if (cfg.random_walk.tick_interval <= 0 || cfg.random_walk.page_limit == 0 ||
      !(cfg.random_walk.tick > 0))
    return config_error("random_walk values out of range");
  return Status::success();
}
} // namespace

Result<EngineConfig> parse_config(const std::string &yaml_text, EngineConfig base)
{
  try
  {
    const YAML::Node root = YAML::Load(yaml_text);
    if (!root.IsNull() && !root.IsMap())
      return config_error("top level must be a mapping");
    Status st = read_document(root, base);
    if (!st.ok())
      return st;
  }
  catch (const YAML::Exception &e)
  {
    return config_error(e.what());
  }
  Status st = validate(base);
  if (!st.ok())
    return st;
  return base;
}

Result<EngineConfig> load_config_file(const std::string &path, EngineConfig base)
{
  YAML::Node root;
  try
  {
    root = YAML::LoadFile(path);
  }
  catch (const YAML::Exception &e)
  {
    return config_error(path + ": " + e.what());
  }
  try
  {
    if (!root.IsNull() && !root.IsMap())
      return config_error(path + ": top level must be a mapping");
    Status st = read_document(root, base);
    if (!st.ok())
      return st;
  }
  catch (const YAML::Exception &e)
  {
    return config_error(path + ": " + e.what());
  }
  Status st = validate(base);
  if (!st.ok())
    return st;
  TBOT_INFO("config: loaded %s", path.c_str());
  return base;
}

Result<EngineConfig> load_engine_config(const std::vector<std::string> &args)
{
  EngineConfig cfg;
  for (std::size_t i = 0; i < args.size(); ++i)
  {
    if (args[i] != "--config")
      continue;
    if (i + 1 >= args.size())
      return config_error("--config needs a value");
    Result<EngineConfig> loaded = load_config_file(args[i + 1]);
    if (!loaded.ok())
      return loaded;
    cfg = loaded.value();
  }

  for (std::size_t i = 0; i < args.size(); ++i)
  {
    const std::string &flag = args[i];
    if (flag == "--list")
    {
      cfg.list_strategies = true;
      continue;
    }
    if (i + 1 >= args.size())
      return config_error(flag + " needs a value");
    const std::string &value = args[++i];

    Status st = Status::success();
    if (flag == "--config")
    {
      continue;
    }
    else if (flag == "--csv")
    {
      cfg.csv_path = value;
    }
    else if (flag == "--strategy")
    {
      cfg.backtest.strategy = value;
    }
    else if (flag == "--param")
    {
      st = set_param(value, cfg);
    }
    else if (flag == "--symbol")
    {
      cfg.backtest.symbol = value;
    }
    else if (flag == "--timeframe")
    {
      Result<Timeframe> tf = timeframe_from(value);
      st = tf.status();
      if (tf.ok())
        cfg.backtest.timeframe = tf.value();
    }
    else if (flag == "--start" || flag == "--end")
    {
      Result<Timestamp> ts = timestamp_from(value);
      st = ts.status();
      if (ts.ok())
        (flag == "--start" ? cfg.backtest.start : cfg.backtest.end) = ts.value();
    }
    else if (flag == "--trade-log")
    {
      cfg.trade_log = value;
    }
    else if (flag == "--log-level")
    {
      st = set_log_level_from(value, cfg);
    }
    else
    {
      st = config_error("unknown option " + flag);
    }
    if (!st.ok())
      return st;
  }

  Status st = validate(cfg);
  if (!st.ok())
    return st;
  return cfg;
}

Result<ParameterSet> resolve_params(const std::vector<OptionSpec> &options,
                                    const std::map<std::string, std::string> &raw)
{
  ParameterSet supplied;
  for (const auto &kv : raw)
  {
    const OptionSpec *spec = nullptr;
    for (const OptionSpec &o : options)
    {
      if (o.name == kv.first)
        spec = &o;
    }
    if (!spec)
      return Status::error(ErrorCode::InvalidParameters, "unknown option '" + kv.first + "'");
    Result<ParamValue> v = parse_param(*spec, kv.second);
    if (!v.ok())
      return v.status();
    supplied.set(kv.first, v.value());
  }
  return validate_parameters(options, supplied);
}
} // namespace tbot
