#pragma once
#include "common/logging.hpp"
#include "market_data_source.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <thread>

namespace tbot
{
// Synthetic market: a seeded random walk of trade prints, used for demos and functional tests in
// place of an exchange connection. It can misbehave the way real feeds do: repeat prints and drop
// the connection for a while.
struct RandomWalkConfig
{
  Price start_price{30'000};
  Price tick{0.5};
  double move_prob{0.55};      // probability the price moves one tick per print
  Qty max_qty{2.0};            // print sizes are uniform in (0, max_qty]
  Timestamp start_time{0};     // event time of the first print
  Timestamp tick_interval{250}; // event-time spacing between prints
  double duplicate_prob{0.0};  // probability a print is delivered twice
  u64 disconnect_every{0};     // prints between drop-outs, 0 = never
  u64 disconnect_prints{0};    // prints lost during each drop-out
  std::size_t page_limit{1000}; // history bars per page
  u64 step_sleep_us{200};      // wall-clock pause between live prints
  u64 seed{42};
};

// Deterministic print generator. The same config always yields the same sequence.
class RandomWalkGenerator
{
  RandomWalkConfig cfg_;
  std::mt19937_64 rng_;
  std::bernoulli_distribution move_;
  std::bernoulli_distribution up_{0.5};
  std::uniform_real_distribution<double> qty_;
  Price price_;
  Timestamp ts_;
  u64 next_trade_id_{1};

public:
  explicit RandomWalkGenerator(RandomWalkConfig cfg = {})
      : cfg_(cfg), rng_(cfg.seed), move_(cfg.move_prob), qty_(0.0, cfg.max_qty),
        price_(cfg.start_price), ts_(cfg.start_time)
  {
  }

  TradeTick next(const std::string &symbol)
  {
    if (move_(rng_))
    {
      const Price step = up_(rng_) ? cfg_.tick : -cfg_.tick;
      // Never walk through zero.
      price_ = std::max(cfg_.tick, price_ + step);
    }
    Qty q = qty_(rng_);
    if (q <= 0)
      q = cfg_.max_qty;
    TradeTick t{symbol, price_, q, next_trade_id_++, ts_};
    ts_ += cfg_.tick_interval;
    return t;
  }

  // Advances time without emitting, as if prints were lost.
  void skip(u64 prints)
  {
    for (u64 i = 0; i < prints; ++i)
      (void)next("");
  }

  bool duplicate()
  {
    return cfg_.duplicate_prob > 0 && std::bernoulli_distribution(cfg_.duplicate_prob)(rng_);
  }
};

class RandomWalkSource final : public IMarketDataSource
{
  struct Subscription
  {
    std::atomic<bool> running{false};
    std::thread thread;
  };

  RandomWalkConfig cfg_;
  std::mutex mu_;
  std::map<std::string, std::unique_ptr<Subscription>> subs_;

public:
  explicit RandomWalkSource(RandomWalkConfig cfg = {}) : cfg_(cfg) {}

  ~RandomWalkSource() override
  {
    std::map<std::string, std::unique_ptr<Subscription>> subs;
    {
      std::lock_guard<std::mutex> lk(mu_);
      subs.swap(subs_);
    }
    for (auto &kv : subs)
      halt(*kv.second);
  }

  Status subscribe(const std::string &symbol, EventHandler on_event,
                   ConnectionHandler on_connection) override
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (subs_.count(symbol) != 0)
      return Status::error(ErrorCode::StateConflict, symbol + " already subscribed");
    auto sub = std::make_unique<Subscription>();
    sub->running.store(true, std::memory_order_release);
    Subscription *raw = sub.get();
    sub->thread = std::thread(
        [this, raw, symbol, on_event = std::move(on_event),
         on_connection = std::move(on_connection)] { run(*raw, symbol, on_event, on_connection); });
    subs_.emplace(symbol, std::move(sub));
    TBOT_INFO("random walk: streaming %s", symbol.c_str());
    return Status::success();
  }

  void unsubscribe(const std::string &symbol) override
  {
    std::unique_ptr<Subscription> sub;
    {
      std::lock_guard<std::mutex> lk(mu_);
      auto it = subs_.find(symbol);
      if (it == subs_.end())
        return;
      sub = std::move(it->second);
      subs_.erase(it);
    }
    halt(*sub);
    TBOT_INFO("random walk: stopped %s", symbol.c_str());
  }

  Result<std::vector<Bar>> fetch_history(const std::string &symbol, Timeframe timeframe,
                                         Timestamp start, Timestamp end) override
  {
    if (timeframe <= 0 || end < start)
      return Status::error(ErrorCode::HistoryFetchError, "invalid history range");
    const std::vector<Bar> full = synthesize(canonical_symbol(symbol), timeframe, start, end);
    // Serve the range the way a paginated REST endpoint would.
    HistoryPageFn page = [&full](const std::string &, Timeframe, Timestamp from, Timestamp to,
                                 std::size_t limit) -> Result<std::vector<Bar>>
    {
      std::vector<Bar> out;
      for (const Bar &b : full)
      {
        if (b.open_time < from || b.open_time > to)
          continue;
        out.push_back(b);
        if (out.size() == limit)
          break;
      }
      return out;
    };
    return fetch_paged(page, symbol, timeframe, start, end, cfg_.page_limit);
  }

private:
  static void halt(Subscription &sub)
  {
    sub.running.store(false, std::memory_order_release);
    if (sub.thread.joinable())
      sub.thread.join();
  }

  void run(Subscription &sub, const std::string &symbol, const EventHandler &on_event,
           const ConnectionHandler &on_connection)
  {
    RandomWalkGenerator gen(cfg_);
    u64 emitted = 0;
    if (on_connection)
      on_connection(true);
    while (sub.running.load(std::memory_order_acquire))
    {
      TradeTick t = gen.next(symbol);
      on_event(RawPriceEvent{t});
      if (gen.duplicate())
        on_event(RawPriceEvent{t});
      ++emitted;

      if (cfg_.disconnect_every != 0 && emitted % cfg_.disconnect_every == 0)
      {
        if (on_connection)
          on_connection(false);
        gen.skip(cfg_.disconnect_prints);
        if (on_connection)
          on_connection(true);
      }
      if (cfg_.step_sleep_us != 0)
        std::this_thread::sleep_for(std::chrono::microseconds(cfg_.step_sleep_us));
    }
  }

  // Bars built from the same walk the live stream uses, two prints per bar.
  std::vector<Bar> synthesize(const std::string &symbol, Timeframe timeframe, Timestamp start,
                              Timestamp end) const
  {
    std::vector<Bar> bars;
    Timestamp t = start - ((start % timeframe) + timeframe) % timeframe;
    if (t < start)
      t += timeframe;
    RandomWalkGenerator gen(cfg_);
    Price prev = cfg_.start_price;
    for (; t <= end; t += timeframe)
    {
      const TradeTick a = gen.next(symbol);
      const TradeTick b = gen.next(symbol);
      const Price open = prev;
      const Price close = b.price;
      const Price high = std::max({open, a.price, close});
      const Price low = std::min({open, a.price, close});
      bars.push_back(Bar{symbol, timeframe, t, open, high, low, close, a.quantity + b.quantity});
      prev = close;
    }
    return bars;
  }
};
} // namespace tbot
