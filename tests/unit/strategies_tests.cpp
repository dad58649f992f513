#include "strategy/strategy_registry.hpp"

#include <gtest/gtest.h>

#include <climits>
#include <initializer_list>
#include <utility>

namespace tbot
{
namespace
{
Bar bar_at(Price close)
{
  return Bar{"BTCUSDT", 60, 0, close, close, close, close, 1};
}

IndicatorSnapshot snap(std::initializer_list<std::pair<const char *, IndicatorValue>> values)
{
  IndicatorSnapshot s;
  for (const auto &kv : values)
    s.set(kv.first, kv.second);
  return s;
}

ParameterSet started(IStrategy &s, const ParameterSet &supplied = {})
{
  Result<ParameterSet> p = validate_parameters(s.options(), supplied);
  EXPECT_TRUE(p.ok());
  EXPECT_TRUE(s.validate(p.value()).ok());
  s.on_start(p.value());
  return p.value();
}

TEST(CrossoverDetectorTest, ReportsCrossesBetweenConsecutiveBars)
{
  CrossoverDetector c;
  EXPECT_EQ(c.update(1.0, 2.0), Cross::None);
  EXPECT_EQ(c.update(3.0, 2.0), Cross::Up);
  EXPECT_EQ(c.update(4.0, 2.0), Cross::None);
  EXPECT_EQ(c.update(2.0, 2.0), Cross::None);
  EXPECT_EQ(c.update(1.0, 2.0), Cross::Down);
}

TEST(CrossoverDetectorTest, UndefinedValueBreaksSequence)
{
  CrossoverDetector c;
  EXPECT_EQ(c.update(1.0, 2.0), Cross::None);
  EXPECT_EQ(c.update(std::nullopt, 2.0), Cross::None);
  EXPECT_EQ(c.update(3.0, 2.0), Cross::None);
  EXPECT_EQ(c.update(1.0, 2.0), Cross::Down);
}

TEST(SmaCrossoverTest, SignalsOnCrossings)
{
  SmaCrossover s;
  ParameterSet in;
  in.set("fast_period", i64{2});
  in.set("slow_period", i64{3});
  started(s, in);

  EXPECT_EQ(s.on_bar(bar_at(100), snap({{"sma_2", 1.0}, {"sma_3", 2.0}})).action, Action::Hold);
  Signal buy = s.on_bar(bar_at(100), snap({{"sma_2", 3.0}, {"sma_3", 2.0}}));
  EXPECT_EQ(buy.action, Action::Buy);
  EXPECT_EQ(buy.symbol, "BTCUSDT");
  EXPECT_FALSE(buy.quantity);
  EXPECT_EQ(buy.reason, "sma_2 crossed above sma_3");
  EXPECT_EQ(s.on_bar(bar_at(100), snap({{"sma_2", 3.0}, {"sma_3", 2.0}})).action, Action::Hold);
  Signal sell = s.on_bar(bar_at(100), snap({{"sma_2", 1.0}, {"sma_3", 2.0}}));
  EXPECT_EQ(sell.action, Action::Sell);
  EXPECT_EQ(sell.reason, "sma_2 crossed below sma_3");
}

TEST(SmaCrossoverTest, FastMustBeShorterThanSlow)
{
  SmaCrossover s;
  ParameterSet in;
  in.set("fast_period", i64{50});
  in.set("slow_period", i64{20});
  Result<ParameterSet> p = validate_parameters(s.options(), in);
  ASSERT_TRUE(p.ok());
  EXPECT_EQ(s.validate(p.value()).code, ErrorCode::InvalidParameters);
}

TEST(RsiStrategyTest, BuysLeavingOversoldAndSellsLeavingOverbought)
{
  RsiStrategy s;
  started(s);
  EXPECT_EQ(s.on_bar(bar_at(1), snap({{"rsi_14", 25.0}})).action, Action::Hold);
  Signal buy = s.on_bar(bar_at(1), snap({{"rsi_14", 35.0}}));
  EXPECT_EQ(buy.action, Action::Buy);
  EXPECT_EQ(buy.reason, "RSI crossed above oversold level (30)");
  EXPECT_EQ(s.on_bar(bar_at(1), snap({{"rsi_14", 75.0}})).action, Action::Hold);
  Signal sell = s.on_bar(bar_at(1), snap({{"rsi_14", 65.0}}));
  EXPECT_EQ(sell.action, Action::Sell);
  EXPECT_EQ(sell.reason, "RSI crossed below overbought level (70)");
}

TEST(RsiStrategyTest, NeedsTwoDefinedReadings)
{
  RsiStrategy s;
  started(s);
  EXPECT_EQ(s.on_bar(bar_at(1), snap({{"rsi_14", 25.0}})).action, Action::Hold);
  EXPECT_EQ(s.on_bar(bar_at(1), snap({{"rsi_14", std::nullopt}})).action, Action::Hold);
  EXPECT_EQ(s.on_bar(bar_at(1), snap({{"rsi_14", 35.0}})).action, Action::Hold);
}

TEST(RsiStrategyTest, LevelsMustBeOrdered)
{
  RsiStrategy s;
  ParameterSet in;
  in.set("oversold", 80.0);
  Result<ParameterSet> p = validate_parameters(s.options(), in);
  ASSERT_TRUE(p.ok());
  EXPECT_EQ(s.validate(p.value()).code, ErrorCode::InvalidParameters);
}

TEST(MacdStrategyTest, SignalsOnSignalLineCrossings)
{
  MacdStrategy s;
  started(s);
  EXPECT_EQ(s.on_bar(bar_at(1), snap({{"macd_12_26_9", -1.0}, {"macd_signal_12_26_9", 0.0}}))
                .action,
            Action::Hold);
  Signal buy = s.on_bar(bar_at(1), snap({{"macd_12_26_9", 0.5}, {"macd_signal_12_26_9", 0.0}}));
  EXPECT_EQ(buy.action, Action::Buy);
  EXPECT_EQ(buy.reason, "MACD crossed above signal line");
  Signal sell =
      s.on_bar(bar_at(1), snap({{"macd_12_26_9", -0.5}, {"macd_signal_12_26_9", 0.0}}));
  EXPECT_EQ(sell.action, Action::Sell);
}

TEST(BollingerStrategyTest, TouchingBandsTriggersSignals)
{
  BollingerStrategy s;
  started(s);
  EXPECT_EQ(s.on_bar(bar_at(100), snap({{"bb_upper_20_2", 110.0}, {"bb_lower_20_2", 99.6}}))
                .action,
            Action::Buy);
  EXPECT_EQ(s.on_bar(bar_at(100), snap({{"bb_upper_20_2", 100.3}, {"bb_lower_20_2", 90.0}}))
                .action,
            Action::Sell);
  EXPECT_EQ(s.on_bar(bar_at(100), snap({{"bb_upper_20_2", 105.0}, {"bb_lower_20_2", 95.0}}))
                .action,
            Action::Hold);
}

TEST(BollingerStrategyTest, LowerBandWinsWhenBothAreTouched)
{
  BollingerStrategy s;
  started(s);
  EXPECT_EQ(s.on_bar(bar_at(100), snap({{"bb_upper_20_2", 100.2}, {"bb_lower_20_2", 99.8}}))
                .action,
            Action::Buy);
}

TEST(BollingerStrategyTest, HoldsWhileBandsWarmUp)
{
  BollingerStrategy s;
  started(s);
  EXPECT_EQ(s.on_bar(bar_at(100), snap({{"bb_upper_20_2", std::nullopt},
                                         {"bb_lower_20_2", std::nullopt}}))
                .action,
            Action::Hold);
}

TEST(StrategyRegistryTest, ListsBundledStrategiesSorted)
{
  StrategyRegistry reg;
  const std::vector<std::string> names = reg.available();
  ASSERT_EQ(names.size(), 4U);
  EXPECT_EQ(names[0], "BollingerBandsStrategy");
  EXPECT_EQ(names[1], "MACDStrategy");
  EXPECT_EQ(names[2], "RSIStrategy");
  EXPECT_EQ(names[3], "SimpleMovingAverageCrossover");
}

TEST(StrategyRegistryTest, CreatesAndDescribesByName)
{
  StrategyRegistry reg;
  Result<std::unique_ptr<IStrategy>> s = reg.create("RSIStrategy");
  ASSERT_TRUE(s.ok());
  EXPECT_EQ(s.value()->name(), "RSIStrategy");

  Result<StrategyInfo> info = reg.describe("MACDStrategy");
  ASSERT_TRUE(info.ok());
  EXPECT_EQ(info.value().options.size(), 3U);
  EXPECT_FALSE(info.value().description.empty());
}

TEST(StrategyRegistryTest, PeriodsAreBoundedBeforeNarrowing)
{
  StrategyRegistry reg;
  for (const std::string &name : reg.available())
  {
    Result<StrategyInfo> info = reg.describe(name);
    ASSERT_TRUE(info.ok());
    for (const OptionSpec &o : info.value().options)
    {
      if (o.type != ParamType::Int)
        continue;
      ASSERT_TRUE(o.max.has_value()) << name << "." << o.name;
      EXPECT_LE(*o.max, static_cast<double>(INT_MAX)) << name << "." << o.name;
    }
  }

  ParameterSet huge;
  huge.set("fast_period", i64{4294967297});
  huge.set("slow_period", i64{4294967298});
  EXPECT_EQ(validate_parameters(SmaCrossover{}.options(), huge).status().code,
            ErrorCode::InvalidParameters);
}

TEST(StrategyRegistryTest, UnknownNameIsInvalidParameters)
{
  StrategyRegistry reg;
  EXPECT_EQ(reg.create("Martingale").status().code, ErrorCode::InvalidParameters);
  EXPECT_EQ(reg.describe("Martingale").status().code, ErrorCode::InvalidParameters);
}

TEST(StrategyRegistryTest, AcceptsCustomFactories)
{
  StrategyRegistry reg;
  reg.add("AlsoSma", [] { return std::unique_ptr<IStrategy>(std::make_unique<SmaCrossover>()); });
  EXPECT_EQ(reg.available().size(), 5U);
  EXPECT_TRUE(reg.create("AlsoSma").ok());
}
} // namespace
} // namespace tbot
