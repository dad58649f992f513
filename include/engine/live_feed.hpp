#pragma once

#include "common/logging.hpp"
#include "common/spsc_queue.hpp"
#include "market/market_data_source.hpp"
#include "trading_session.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

namespace tbot
{
// Connects one TradingSession to a live IMarketDataSource.
// The source's callback thread is the single producer of a bounded SPSC queue and the feed's worker
// is the single consumer, so events reach the session strictly in arrival order. A full queue
// blocks the producer rather than dropping events or growing. While idle the worker also polls the
// session so live orders get reconciled.
class LiveFeed
{
public:
  static constexpr std::size_t kCapacity = 1 << 10;

private:
  IMarketDataSource &source_;
  TradingSession &session_;
  std::unique_ptr<spsc::Queue<RawPriceEvent, kCapacity>> queue_;
  std::atomic<bool> running_{false};
  std::atomic<bool> connected_{false};
  std::atomic<u64> processed_{0};
  std::atomic<u64> dropped_{0};
  std::atomic<u64> disconnects_{0};
  std::thread worker_;

public:
  LiveFeed(IMarketDataSource &source, TradingSession &session)
      : source_(source), session_(session),
        queue_(std::make_unique<spsc::Queue<RawPriceEvent, kCapacity>>())
  {
  }

  ~LiveFeed()
  {
    stop();
  }

  LiveFeed(const LiveFeed &) = delete;
  LiveFeed &operator=(const LiveFeed &) = delete;

  Status start()
  {
    if (running_.exchange(true, std::memory_order_acq_rel))
      return Status::error(ErrorCode::StateConflict, "feed already running");
    worker_ = std::thread([this] { this->run(); });

    Status st = source_.subscribe(
        session_.symbol(),
        [this](const RawPriceEvent &e) {
          if (!queue_->push_wait(e, running_))
            TBOT_DEBUG("feed %s: event discarded, feed stopping", session_.symbol().c_str());
        },
        [this](bool up) { on_connection(up); });
    if (!st.ok())
    {
      TBOT_ERROR("feed %s: subscribe failed: %s", session_.symbol().c_str(), st.reason.c_str());
      running_.store(false, std::memory_order_release);
      worker_.join();
      return st;
    }
    TBOT_INFO("feed %s: started", session_.symbol().c_str());
    return Status::success();
  }

  // Unsubscribes first so no producer is left, then lets the worker drain what is queued.
  void stop()
  {
    if (!running_.load(std::memory_order_acquire))
      return;
    source_.unsubscribe(session_.symbol());
    running_.store(false, std::memory_order_release);
    if (worker_.joinable())
      worker_.join();
    TBOT_INFO("feed %s: stopped after %llu events (%llu dropped, %llu disconnects)",
              session_.symbol().c_str(), static_cast<unsigned long long>(processed()),
              static_cast<unsigned long long>(dropped()),
              static_cast<unsigned long long>(disconnects()));
  }

  bool connected() const noexcept
  {
    return connected_.load(std::memory_order_acquire);
  }

  // Events that reached the session, accepted or not.
  u64 processed() const noexcept
  {
    return processed_.load(std::memory_order_relaxed);
  }

  // Events the session refused (duplicates, stale or invalid data).
  u64 dropped() const noexcept
  {
    return dropped_.load(std::memory_order_relaxed);
  }

  u64 disconnects() const noexcept
  {
    return disconnects_.load(std::memory_order_relaxed);
  }

private:
  void on_connection(bool up)
  {
    const bool was = connected_.exchange(up, std::memory_order_acq_rel);
    if (was == up)
      return;
    if (up)
    {
      TBOT_INFO("feed %s: connected", session_.symbol().c_str());
    }
    else
    {
      disconnects_.fetch_add(1, std::memory_order_relaxed);
      TBOT_WARN("feed %s: connection lost, ingestion paused", session_.symbol().c_str());
    }
  }

  void handle(const RawPriceEvent &e)
  {
    Status st = session_.on_event(e);
    processed_.fetch_add(1, std::memory_order_relaxed);
    if (st.code == ErrorCode::StrategyFault)
      TBOT_ERROR("feed %s: %s", session_.symbol().c_str(), st.reason.c_str());
    else if (!st.ok())
      dropped_.fetch_add(1, std::memory_order_relaxed);
  }

  void run()
  {
    RawPriceEvent e;
    while (running_.load(std::memory_order_acquire))
    {
      int drained = 0;
      while (queue_->pop(e))
      {
        handle(e);
        if (++drained > 256)
          break;
      }
      if (drained == 0)
      {
        session_.poll();
        std::this_thread::sleep_for(std::chrono::microseconds(100));
      }
    }
    while (queue_->pop(e))
      handle(e);
  }
};
} // namespace tbot
