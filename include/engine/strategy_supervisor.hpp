#pragma once

#include "common/logging.hpp"
#include "execution/execution_simulator.hpp"
#include "execution/order_router.hpp"
#include "strategy/strategy_registry.hpp"
#include "trading_session.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace tbot
{
using SessionKey = std::pair<ExecutionMode, std::string>;

// Owns one TradingSession per (execution mode, symbol) and enforces that each key runs at most one
// strategy instance. Sessions are independent: a fault in one leaves the others running.
class StrategySupervisor
{
  SessionConfig defaults_;
  IOrderSink *sink_;
  StrategyRegistry registry_;
  SessionListeners listeners_;
  mutable std::mutex mu_;
  std::map<SessionKey, std::unique_ptr<TradingSession>> sessions_;

public:
  // `sink` is required only for live sessions. Symbol and timeframe of `defaults` are overridden
  // per session.
  explicit StrategySupervisor(SessionConfig defaults = {}, IOrderSink *sink = nullptr,
                              SessionListeners listeners = {})
      : defaults_(std::move(defaults)), sink_(sink), listeners_(std::move(listeners))
  {
  }

  ~StrategySupervisor()
  {
    stop_all();
  }

  StrategySupervisor(const StrategySupervisor &) = delete;
  StrategySupervisor &operator=(const StrategySupervisor &) = delete;

  Status start(ExecutionMode mode, const std::string &symbol, const std::string &strategy,
               const ParameterSet &params)
  {
    Result<std::unique_ptr<IStrategy>> s = registry_.create(strategy);
    if (!s.ok())
      return s.status();

    std::lock_guard<std::mutex> lk(mu_);
    Result<TradingSession *> session = session_for(mode, symbol);
    if (!session.ok())
      return session.status();
    TradingSession &ts = *session.value();
    if (ts.strategy_state() == StrategyState::Running)
    {
      TBOT_WARN("supervisor: %s %s already has a running strategy", to_string(mode),
                ts.symbol().c_str());
      return Status::error(ErrorCode::StateConflict,
                           std::string(to_string(mode)) + " " + ts.symbol() + " is running");
    }
    return ts.start_strategy(std::move(s.value()), params);
  }

  Status stop(ExecutionMode mode, const std::string &symbol)
  {
    TradingSession *ts = session(mode, symbol);
    if (!ts)
      return Status::error(ErrorCode::StateConflict, "no session for " + symbol);
    return ts->stop_strategy();
  }

  void stop_all()
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto &kv : sessions_)
      kv.second->shutdown();
  }

  // nullptr when no session exists for the key.
  TradingSession *session(ExecutionMode mode, const std::string &symbol) const
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(SessionKey{mode, canonical_symbol(symbol)});
    return it == sessions_.end() ? nullptr : it->second.get();
  }

  std::vector<SessionKey> running() const
  {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<SessionKey> out;
    for (const auto &kv : sessions_)
    {
      if (kv.second->strategy_state() == StrategyState::Running)
        out.push_back(kv.first);
    }
    return out;
  }

  const StrategyRegistry &registry() const noexcept
  {
    return registry_;
  }

  StrategyRegistry &registry() noexcept
  {
    return registry_;
  }

private:
  Result<TradingSession *> session_for(ExecutionMode mode, const std::string &symbol)
  {
    const SessionKey key{mode, canonical_symbol(symbol)};
    auto it = sessions_.find(key);
    if (it != sessions_.end())
      return it->second.get();
    if (key.second.empty())
      return Status::error(ErrorCode::InvalidParameters, "empty symbol");

    std::unique_ptr<IExecutor> exec;
    if (mode == ExecutionMode::Live)
    {
      if (!sink_)
      {
        TBOT_ERROR("supervisor: live session for %s needs an order sink", key.second.c_str());
        return Status::error(ErrorCode::ConfigError, "no order sink configured for live mode");
      }
      exec = std::make_unique<OrderRouter>(*sink_, defaults_.execution);
    }
    else
    {
      exec = std::make_unique<ExecutionSimulator>(defaults_.execution);
    }

    SessionConfig cfg = defaults_;
    cfg.symbol = key.second;
    auto ts = std::make_unique<TradingSession>(cfg, std::move(exec), listeners_);
    TradingSession *raw = ts.get();
    sessions_.emplace(key, std::move(ts));
    TBOT_INFO("supervisor: created %s session for %s", to_string(mode), key.second.c_str());
    return raw;
  }
};
} // namespace tbot
