#pragma once
#include "common/logging.hpp"
#include "common/status.hpp"
#include "market_data.hpp"

#include <functional>
#include <string>
#include <vector>

namespace tbot
{
// Boundary to whatever provides prices: an exchange client, a file, a generator.
// Live delivery is at-least-once and may repeat events; history comes back as sealed bars sorted by
// open_time with gaps only where the market was inactive.
class IMarketDataSource
{
public:
  using EventHandler = std::function<void(const RawPriceEvent &)>;
  // Called with false when the stream drops and with true once it is back.
  using ConnectionHandler = std::function<void(bool connected)>;

  virtual ~IMarketDataSource() = default;

  virtual Status subscribe(const std::string &symbol, EventHandler on_event,
                           ConnectionHandler on_connection) = 0;
  virtual void unsubscribe(const std::string &symbol) = 0;
  virtual Result<std::vector<Bar>> fetch_history(const std::string &symbol, Timeframe timeframe,
                                                 Timestamp start, Timestamp end) = 0;
};

// One page request against a venue that caps how many bars a single call may return.
using HistoryPageFn = std::function<Result<std::vector<Bar>>(
    const std::string &symbol, Timeframe timeframe, Timestamp start, Timestamp end,
    std::size_t limit)>;

// Walks [start, end] page by page, continuing one unit after the last open_time received, and
// stitches the pages into one ascending sequence. Overlapping bars at page edges are dropped.
inline Result<std::vector<Bar>> fetch_paged(const HistoryPageFn &page, const std::string &symbol,
                                            Timeframe timeframe, Timestamp start, Timestamp end,
                                            std::size_t page_limit)
{
  if (page_limit == 0)
    return Status::error(ErrorCode::HistoryFetchError, "page limit must be positive");
  std::vector<Bar> all;
  Timestamp cursor = start;
  while (cursor <= end)
  {
    Result<std::vector<Bar>> chunk = page(symbol, timeframe, cursor, end, page_limit);
    if (!chunk.ok())
    {
      Status s = chunk.status();
      TBOT_ERROR("history: page at %lld for %s failed: %s", static_cast<long long>(cursor),
                 symbol.c_str(), s.reason.c_str());
      return Status::error(ErrorCode::HistoryFetchError, s.reason);
    }
    const std::vector<Bar> &bars = chunk.value();
    if (bars.empty())
      break;
    for (const Bar &b : bars)
    {
      if (!all.empty() && b.open_time <= all.back().open_time)
        continue;
      if (b.open_time > end)
        break;
      all.push_back(b);
    }
    const Timestamp next = bars.back().open_time + 1;
    if (next <= cursor)
      return Status::error(ErrorCode::HistoryFetchError, "history page did not advance");
    cursor = next;
    TBOT_DEBUG("history: %s page of %zu bars, %zu total", symbol.c_str(), bars.size(), all.size());
  }
  return all;
}
} // namespace tbot
