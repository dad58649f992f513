#include "market/random_walk_source.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <thread>

namespace tbot
{
namespace
{
TEST(RandomWalkGeneratorTest, SameSeedSameSequence)
{
  RandomWalkConfig cfg{};
  cfg.seed = 7;
  RandomWalkGenerator a(cfg);
  RandomWalkGenerator b(cfg);
  for (int i = 0; i < 100; ++i)
  {
    const TradeTick x = a.next("BTCUSDT");
    const TradeTick y = b.next("BTCUSDT");
    ASSERT_EQ(x.price, y.price);
    ASSERT_EQ(x.quantity, y.quantity);
    ASSERT_EQ(x.trade_id, static_cast<u64>(i + 1));
    ASSERT_EQ(x.event_time, cfg.start_time + i * cfg.tick_interval);
  }
}

TEST(RandomWalkGeneratorTest, MovesByWholeTicksAndStaysPositive)
{
  RandomWalkConfig cfg{};
  cfg.start_price = 2.0;
  cfg.tick = 1.0;
  cfg.move_prob = 1.0;
  RandomWalkGenerator gen(cfg);
  Price prev = cfg.start_price;
  for (int i = 0; i < 500; ++i)
  {
    const TradeTick t = gen.next("X");
    EXPECT_GE(t.price, cfg.tick);
    EXPECT_LE(std::abs(t.price - prev), cfg.tick);
    EXPECT_GT(t.quantity, 0);
    prev = t.price;
  }
}

TEST(RandomWalkSourceTest, HistoryIsAlignedAscendingAndPaged)
{
  RandomWalkConfig cfg{};
  cfg.page_limit = 7; // forces several pages
  RandomWalkSource src(cfg);
  Result<std::vector<Bar>> bars = src.fetch_history("btc/usdt", 60, 30, 60 * 50);
  ASSERT_TRUE(bars.ok());
  ASSERT_EQ(bars.value().size(), 50U); // 60, 120, ..., 3000
  for (std::size_t i = 0; i < bars.value().size(); ++i)
  {
    const Bar &b = bars.value()[i];
    EXPECT_EQ(b.symbol, "BTCUSDT");
    EXPECT_EQ(b.open_time, static_cast<Timestamp>(60 * (i + 1)));
    EXPECT_GE(b.high, std::max(b.open, b.close));
    EXPECT_LE(b.low, std::min(b.open, b.close));
  }
}

TEST(RandomWalkSourceTest, HistoryIsReproducible)
{
  RandomWalkSource a{RandomWalkConfig{}};
  RandomWalkSource b{RandomWalkConfig{}};
  Result<std::vector<Bar>> x = a.fetch_history("BTCUSDT", 60, 0, 6000);
  Result<std::vector<Bar>> y = b.fetch_history("BTCUSDT", 60, 0, 6000);
  ASSERT_TRUE(x.ok());
  ASSERT_TRUE(y.ok());
  ASSERT_EQ(x.value().size(), y.value().size());
  for (std::size_t i = 0; i < x.value().size(); ++i)
    EXPECT_EQ(x.value()[i].close, y.value()[i].close);
}

TEST(RandomWalkSourceTest, InvalidRangeIsHistoryFetchError)
{
  RandomWalkSource src;
  EXPECT_EQ(src.fetch_history("BTCUSDT", 60, 100, 0).status().code,
            ErrorCode::HistoryFetchError);
  EXPECT_EQ(src.fetch_history("BTCUSDT", 0, 0, 100).status().code,
            ErrorCode::HistoryFetchError);
}

TEST(RandomWalkSourceTest, StreamsTicksAndReportsDropOuts)
{
  RandomWalkConfig cfg{};
  cfg.step_sleep_us = 50;
  cfg.disconnect_every = 20;
  cfg.disconnect_prints = 5;
  RandomWalkSource src(cfg);

  std::atomic<int> events{0};
  std::atomic<int> downs{0};
  std::atomic<int> ups{0};
  Status st = src.subscribe(
      "BTCUSDT", [&](const RawPriceEvent &) { events.fetch_add(1); },
      [&](bool up) { (up ? ups : downs).fetch_add(1); });
  ASSERT_TRUE(st.ok());
  EXPECT_EQ(src.subscribe("BTCUSDT", [](const RawPriceEvent &) {}, nullptr).code,
            ErrorCode::StateConflict);

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (downs.load() == 0 && std::chrono::steady_clock::now() < deadline)
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  src.unsubscribe("BTCUSDT");

  EXPECT_GE(events.load(), 20);
  EXPECT_GE(downs.load(), 1);
  EXPECT_GE(ups.load(), downs.load());
}
} // namespace
} // namespace tbot
