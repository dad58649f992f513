#include "indicators/technical.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>

namespace tbot
{
namespace
{
Bar bar(Price h, Price l, Price c, Timestamp t = 0)
{
  return Bar{"BTCUSDT", 60, t, c, h, l, c, 1};
}

Bar close_at(Price c)
{
  return bar(c, c, c);
}

TEST(IndicatorTest, SeriesNamesCarryParameters)
{
  EXPECT_EQ(series_name("sma", {20}), "sma_20");
  EXPECT_EQ(series_name("bb_upper", {20, 2.0}), "bb_upper_20_2");
  EXPECT_EQ(series_name("bb_upper", {20, 2.5}), "bb_upper_20_2.5");
  EXPECT_EQ(Macd(12, 26, 9).outputs()[1], "macd_signal_12_26_9");
  EXPECT_EQ(Stochastic(14, 3).outputs()[0], "stoch_k_14_3");
}

TEST(IndicatorTest, CloseParametersGetDistinctNames)
{
  EXPECT_EQ(series_name("sma", {1000000}), "sma_1000000");
  EXPECT_EQ(series_name("sma", {1000001}), "sma_1000001");
  EXPECT_EQ(series_name("bb_upper", {20, 2.0000001}), "bb_upper_20_2.0000001");
  EXPECT_NE(series_name("bb_upper", {20, 2.0}), series_name("bb_upper", {20, 2.0000001}));
  EXPECT_EQ(series_name("x", {0.1}), "x_0.1");
  EXPECT_EQ(series_name("x", {-3}), "x_-3");
}

TEST(IndicatorTest, NonPositivePeriodsThrow)
{
  EXPECT_THROW(SimpleMovingAverage(0), std::invalid_argument);
  EXPECT_THROW(ExponentialMovingAverage(-1), std::invalid_argument);
  EXPECT_THROW(RelativeStrengthIndex(0), std::invalid_argument);
  EXPECT_THROW(BollingerBands(1, 2.0), std::invalid_argument);
  EXPECT_THROW(Macd(12, 0, 9), std::invalid_argument);
}

TEST(IndicatorTest, SmaUndefinedUntilWindowFills)
{
  SimpleMovingAverage sma(3);
  EXPECT_FALSE(sma.next(close_at(1)));
  EXPECT_FALSE(sma.next(close_at(2)));
  ASSERT_TRUE(sma.next(close_at(3)));
  IndicatorValue v = sma.next(close_at(4));
  ASSERT_TRUE(v);
  EXPECT_DOUBLE_EQ(*v, 3.0);
}

TEST(IndicatorTest, SmaStaysAccurateOverLongRuns)
{
  SimpleMovingAverage sma(5);
  IndicatorValue v;
  for (int i = 0; i < 100000; ++i)
    v = sma.next(close_at(1e6 + (i % 7) * 0.1));
  ASSERT_TRUE(v);
  // last five closes: i = 99995..99999 -> (i % 7) = 0, 1, 2, 3, 4
  EXPECT_NEAR(*v, 1e6 + 0.2, 1e-6);
}

TEST(IndicatorTest, EmaSeedsWithFirstClose)
{
  ExponentialMovingAverage ema(3);
  EXPECT_DOUBLE_EQ(*ema.next(close_at(1)), 1.0);
  EXPECT_DOUBLE_EQ(*ema.next(close_at(3)), 2.0);
}

TEST(IndicatorTest, RsiUsesWilderSmoothing)
{
  RelativeStrengthIndex rsi(2);
  EXPECT_FALSE(rsi.next(close_at(10)));
  EXPECT_FALSE(rsi.next(close_at(11)));
  IndicatorValue v = rsi.next(close_at(12));
  ASSERT_TRUE(v);
  EXPECT_DOUBLE_EQ(*v, 100.0);
  v = rsi.next(close_at(11));
  ASSERT_TRUE(v);
  EXPECT_DOUBLE_EQ(*v, 50.0);
}

TEST(IndicatorTest, RsiFormulaBounds)
{
  EXPECT_DOUBLE_EQ(RelativeStrengthIndex::rsi(1, 0), 100.0);
  EXPECT_DOUBLE_EQ(RelativeStrengthIndex::rsi(0, 1), 0.0);
  EXPECT_DOUBLE_EQ(RelativeStrengthIndex::rsi(1, 1), 50.0);
}

TEST(IndicatorTest, MacdOfFlatSeriesIsZero)
{
  Macd macd(3, 6, 2);
  std::vector<IndicatorValue> out;
  for (int i = 0; i < 10; ++i)
    macd.update(close_at(100), out);
  ASSERT_EQ(out.size(), 3U);
  EXPECT_DOUBLE_EQ(*out[0], 0.0);
  EXPECT_DOUBLE_EQ(*out[1], 0.0);
  EXPECT_DOUBLE_EQ(*out[2], 0.0);
}

TEST(IndicatorTest, MacdLineRisesInUptrend)
{
  Macd macd(3, 6, 2);
  std::vector<IndicatorValue> out;
  for (int i = 0; i < 20; ++i)
    macd.update(close_at(100 + i), out);
  EXPECT_GT(*out[0], 0.0);
  EXPECT_DOUBLE_EQ(*out[2], *out[0] - *out[1]);
}

TEST(IndicatorTest, BollingerUsesSampleDeviation)
{
  BollingerBands bb(2, 2.0);
  std::vector<IndicatorValue> out;
  bb.update(close_at(1), out);
  ASSERT_EQ(out.size(), 3U);
  EXPECT_FALSE(out[0]);
  bb.update(close_at(3), out);
  ASSERT_TRUE(out[0] && out[1] && out[2]);
  EXPECT_DOUBLE_EQ(*out[1], 2.0);
  EXPECT_NEAR(*out[0], 2.0 + 2.0 * std::sqrt(2.0), 1e-12);
  EXPECT_NEAR(*out[2], 2.0 - 2.0 * std::sqrt(2.0), 1e-12);
}

TEST(IndicatorTest, AtrAveragesTrueRange)
{
  AverageTrueRange atr(2);
  EXPECT_FALSE(atr.next(bar(10, 8, 9)));
  IndicatorValue v = atr.next(bar(12, 9, 11));
  ASSERT_TRUE(v);
  EXPECT_DOUBLE_EQ(*v, 2.5);
}

TEST(IndicatorTest, StochasticTracksWindowExtremes)
{
  Stochastic st(3, 2);
  std::vector<IndicatorValue> out;
  st.update(bar(10, 5, 7), out);
  EXPECT_FALSE(out[0]);
  st.update(bar(12, 6, 11), out);
  EXPECT_FALSE(out[0]);
  st.update(bar(11, 7, 9), out);
  ASSERT_TRUE(out[0]);
  EXPECT_NEAR(*out[0], 100.0 * 4.0 / 7.0, 1e-9);
  EXPECT_FALSE(out[1]);
  st.update(bar(13, 8, 13), out);
  ASSERT_TRUE(out[0]);
  EXPECT_NEAR(*out[0], 100.0, 1e-9);
  ASSERT_TRUE(out[1]);
  EXPECT_NEAR(*out[1], (100.0 * 4.0 / 7.0 + 100.0) / 2.0, 1e-9);
}

TEST(IndicatorTest, FunctionIndicatorWrapsCallable)
{
  FunctionIndicator range("range", [](const Bar &b) -> IndicatorValue { return b.high - b.low; });
  EXPECT_EQ(range.outputs().front(), "range");
  EXPECT_DOUBLE_EQ(*range.next(bar(10, 4, 5)), 6.0);
}
} // namespace
} // namespace tbot
