#include "strategy/sma_crossover.hpp"
#include "strategy/strategy_runtime.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

namespace tbot
{
namespace
{
// Scripted strategy: throws or misbehaves on request.
class ScriptedStrategy final : public IStrategy
{
public:
  bool throw_on_start{false};
  bool throw_on_bar{false};
  std::string emit_symbol;
  Action emit{Action::Hold};
  int *stops{nullptr};

  std::string name() const override
  {
    return "Scripted";
  }
  std::string description() const override
  {
    return "test strategy";
  }
  std::vector<OptionSpec> options() const override
  {
    return {int_option("period", 3, 1, std::nullopt, "")};
  }
  void indicators(const ParameterSet &, IndicatorEngine &, const std::vector<Bar> &) const override
  {
  }
  void on_start(const ParameterSet &) override
  {
    if (throw_on_start)
      throw std::runtime_error("boom at start");
  }
  Signal on_bar(const Bar &, const IndicatorSnapshot &) override
  {
    if (throw_on_bar)
      throw std::runtime_error("boom");
    return Signal{emit, emit_symbol, std::nullopt, "scripted"};
  }
  void on_stop() override
  {
    if (stops)
      ++*stops;
  }
};

Bar bar_at(Price close, Timestamp t = 0)
{
  return Bar{"BTCUSDT", 60, t, close, close, close, close, 1};
}

TEST(StrategyRuntimeTest, NeedsAnInstance)
{
  EXPECT_THROW(StrategyRuntime("x", nullptr), std::invalid_argument);
}

TEST(StrategyRuntimeTest, StartFillsDefaultsAndRuns)
{
  IndicatorEngine engine;
  StrategyRuntime rt("sim:BTCUSDT:sma", std::make_unique<SmaCrossover>());
  EXPECT_EQ(rt.state(), StrategyState::Idle);
  ASSERT_TRUE(rt.start(ParameterSet{}, engine, {}).ok());
  EXPECT_EQ(rt.state(), StrategyState::Running);
  EXPECT_EQ(rt.params().get_int("fast_period"), 20);
  EXPECT_EQ(rt.params().get_int("slow_period"), 50);
  EXPECT_NE(engine.series("sma_20"), nullptr);
  EXPECT_NE(engine.series("sma_50"), nullptr);
  EXPECT_EQ(rt.strategy_name(), "SimpleMovingAverageCrossover");
}

TEST(StrategyRuntimeTest, InvalidParametersLeaveItIdle)
{
  IndicatorEngine engine;
  StrategyRuntime rt("id", std::make_unique<SmaCrossover>());
  ParameterSet p;
  p.set("fast_period", i64{60});
  EXPECT_EQ(rt.start(p, engine, {}).code, ErrorCode::InvalidParameters);
  EXPECT_EQ(rt.state(), StrategyState::Idle);

  ParameterSet q;
  q.set("bogus", 1.0);
  EXPECT_EQ(rt.start(q, engine, {}).code, ErrorCode::InvalidParameters);
  EXPECT_EQ(rt.state(), StrategyState::Idle);

  EXPECT_TRUE(rt.start(ParameterSet{}, engine, {}).ok());
}

TEST(StrategyRuntimeTest, StartTwiceIsStateConflict)
{
  IndicatorEngine engine;
  StrategyRuntime rt("id", std::make_unique<ScriptedStrategy>());
  ASSERT_TRUE(rt.start(ParameterSet{}, engine, {}).ok());
  EXPECT_EQ(rt.start(ParameterSet{}, engine, {}).code, ErrorCode::StateConflict);
}

TEST(StrategyRuntimeTest, BarsBeforeStartAreRejected)
{
  StrategyRuntime rt("id", std::make_unique<ScriptedStrategy>());
  EXPECT_EQ(rt.on_bar(bar_at(1), IndicatorSnapshot{}).status().code, ErrorCode::StateConflict);
}

TEST(StrategyRuntimeTest, ThrowingOnBarIsFault)
{
  IndicatorEngine engine;
  auto s = std::make_unique<ScriptedStrategy>();
  s->throw_on_bar = true;
  StrategyRuntime rt("id", std::move(s));
  ASSERT_TRUE(rt.start(ParameterSet{}, engine, {}).ok());

  Result<Signal> r = rt.on_bar(bar_at(1), IndicatorSnapshot{});
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code, ErrorCode::StrategyFault);
  EXPECT_EQ(rt.state(), StrategyState::Stopped);
  EXPECT_FALSE(rt.has_instance());
  EXPECT_EQ(rt.on_bar(bar_at(2), IndicatorSnapshot{}).status().code, ErrorCode::StateConflict);
  EXPECT_EQ(rt.start(ParameterSet{}, engine, {}).code, ErrorCode::StateConflict);
}

TEST(StrategyRuntimeTest, ThrowingOnStartIsFault)
{
  IndicatorEngine engine;
  auto s = std::make_unique<ScriptedStrategy>();
  s->throw_on_start = true;
  StrategyRuntime rt("id", std::move(s));
  EXPECT_EQ(rt.start(ParameterSet{}, engine, {}).code, ErrorCode::StrategyFault);
  EXPECT_EQ(rt.state(), StrategyState::Stopped);
  EXPECT_FALSE(rt.has_instance());
}

TEST(StrategyRuntimeTest, EmptySymbolIsFilledFromBar)
{
  IndicatorEngine engine;
  auto s = std::make_unique<ScriptedStrategy>();
  s->emit = Action::Buy;
  StrategyRuntime rt("id", std::move(s));
  ASSERT_TRUE(rt.start(ParameterSet{}, engine, {}).ok());
  Result<Signal> r = rt.on_bar(bar_at(1), IndicatorSnapshot{});
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r.value().symbol, "BTCUSDT");
  EXPECT_EQ(r.value().action, Action::Buy);
}

TEST(StrategyRuntimeTest, SignalForOtherSymbolIsFault)
{
  IndicatorEngine engine;
  auto s = std::make_unique<ScriptedStrategy>();
  s->emit = Action::Sell;
  s->emit_symbol = "ETHUSDT";
  StrategyRuntime rt("id", std::move(s));
  ASSERT_TRUE(rt.start(ParameterSet{}, engine, {}).ok());
  EXPECT_EQ(rt.on_bar(bar_at(1), IndicatorSnapshot{}).status().code, ErrorCode::StrategyFault);
  EXPECT_EQ(rt.state(), StrategyState::Stopped);
}

TEST(StrategyRuntimeTest, StopCallsOnStopOnceAndIsFinal)
{
  IndicatorEngine engine;
  int stops = 0;
  auto s = std::make_unique<ScriptedStrategy>();
  s->stops = &stops;
  StrategyRuntime rt("id", std::move(s));
  ASSERT_TRUE(rt.start(ParameterSet{}, engine, {}).ok());
  rt.stop();
  rt.stop();
  EXPECT_EQ(stops, 1);
  EXPECT_EQ(rt.state(), StrategyState::Stopped);
  EXPECT_EQ(rt.start(ParameterSet{}, engine, {}).code, ErrorCode::StateConflict);
}

TEST(StrategyRuntimeTest, SmaCrossoverBuysOnRealSeries)
{
  IndicatorEngine engine;
  StrategyRuntime rt("id", std::make_unique<SmaCrossover>());
  ParameterSet p;
  p.set("fast_period", i64{2});
  p.set("slow_period", i64{3});
  ASSERT_TRUE(rt.start(p, engine, {}).ok());

  const double closes[] = {10, 9, 8, 9, 12};
  std::vector<Action> actions;
  for (int i = 0; i < 5; ++i)
  {
    const Bar b = bar_at(closes[i], 60 * i);
    const IndicatorSnapshot &snap = engine.on_bar(b);
    Result<Signal> r = rt.on_bar(b, snap);
    ASSERT_TRUE(r.ok());
    actions.push_back(r.value().action);
  }
  EXPECT_EQ(actions, (std::vector<Action>{Action::Hold, Action::Hold, Action::Hold, Action::Hold,
                                          Action::Buy}));
}
} // namespace
} // namespace tbot
