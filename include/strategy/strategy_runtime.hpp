#pragma once

#include "common/logging.hpp"
#include "strategy.hpp"

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

namespace tbot
{
enum class StrategyState : u8
{
  Idle = 0,
  Running = 1,
  Stopped = 2
};

inline const char *to_string(StrategyState s) noexcept
{
  switch (s)
  {
  case StrategyState::Idle:
    return "IDLE";
  case StrategyState::Running:
    return "RUNNING";
  case StrategyState::Stopped:
    return "STOPPED";
  }
  return "?";
}

// One strategy instance and its lifecycle: IDLE -> RUNNING -> STOPPED, never back. The runtime is
// the boundary where strategy exceptions become StrategyFault; a faulted instance is destroyed and
// a restart needs a new runtime.
class StrategyRuntime
{
  std::string id_;
  std::string name_;
  std::unique_ptr<IStrategy> strategy_;
  ParameterSet params_;
  StrategyState state_{StrategyState::Idle};

public:
  StrategyRuntime(std::string id, std::unique_ptr<IStrategy> strategy)
      : id_(std::move(id)), strategy_(std::move(strategy))
  {
    if (!strategy_)
      throw std::invalid_argument("strategy runtime needs a strategy instance");
    name_ = strategy_->name();
  }

  // Validates `supplied` against the strategy's options, registers its indicators (warmed over
  // `history`) and calls on_start. Any failure leaves the instance IDLE, except a throwing on_start
  // which is a fault.
  Status start(const ParameterSet &supplied, IndicatorEngine &engine,
               const std::vector<Bar> &history)
  {
    if (state_ != StrategyState::Idle)
      return Status::error(ErrorCode::StateConflict,
                           id_ + " is " + to_string(state_) + ", cannot start");

    Result<ParameterSet> params = validate_parameters(strategy_->options(), supplied);
    Status st = params.ok() ? strategy_->validate(params.value()) : params.status();
    if (!st.ok())
    {
      TBOT_ERROR("strategy %s: invalid parameters: %s", id_.c_str(), st.reason.c_str());
      return st;
    }
    params_ = params.value();

    try
    {
      strategy_->indicators(params_, engine, history);
    }
    catch (const std::exception &e)
    {
      TBOT_ERROR("strategy %s: indicator setup failed: %s", id_.c_str(), e.what());
      return Status::error(ErrorCode::InvalidParameters, e.what());
    }

    try
    {
      strategy_->on_start(params_);
    }
    catch (const std::exception &e)
    {
      return fault("on_start", e.what());
    }
    state_ = StrategyState::Running;
    TBOT_INFO("strategy %s: %s started with %s", id_.c_str(), name_.c_str(),
              format_params(params_).c_str());
    return Status::success();
  }

  // Only a RUNNING instance sees bars. A throw or a signal for another symbol stops it for good.
  Result<Signal> on_bar(const Bar &bar, const IndicatorSnapshot &indicators)
  {
    if (state_ != StrategyState::Running)
      return Status::error(ErrorCode::StateConflict, id_ + " is not running");

    Signal sig;
    try
    {
      sig = strategy_->on_bar(bar, indicators);
    }
    catch (const std::exception &e)
    {
      return fault("on_bar", e.what());
    }
    if (sig.symbol.empty())
      sig.symbol = bar.symbol;
    if (sig.symbol != bar.symbol || static_cast<u8>(sig.action) > static_cast<u8>(Action::Sell))
      return fault("on_bar", "malformed signal for symbol '" + sig.symbol + "'");
    return sig;
  }

  void stop()
  {
    if (state_ != StrategyState::Running)
    {
      state_ = StrategyState::Stopped;
      return;
    }
    state_ = StrategyState::Stopped;
    try
    {
      strategy_->on_stop();
    }
    catch (const std::exception &e)
    {
      TBOT_WARN("strategy %s: on_stop threw: %s", id_.c_str(), e.what());
    }
    TBOT_INFO("strategy %s: stopped", id_.c_str());
  }

  StrategyState state() const noexcept
  {
    return state_;
  }

  const std::string &id() const noexcept
  {
    return id_;
  }

  const std::string &strategy_name() const noexcept
  {
    return name_;
  }

  const ParameterSet &params() const noexcept
  {
    return params_;
  }

  // False once a fault discarded the instance.
  bool has_instance() const noexcept
  {
    return strategy_ != nullptr;
  }

private:
  Status fault(const char *where, const std::string &what)
  {
    TBOT_ERROR("strategy %s: fault in %s: %s", id_.c_str(), where, what.c_str());
    state_ = StrategyState::Stopped;
    strategy_.reset();
    return Status::error(ErrorCode::StrategyFault, std::string(where) + ": " + what);
  }
};
} // namespace tbot
