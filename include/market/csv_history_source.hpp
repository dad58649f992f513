#pragma once
#include "market_data_source.hpp"

#include <string>
#include <vector>

namespace tbot
{
// History from a CSV file with columns open_time,open,high,low,close,volume (header optional,
// column order taken from the header when present). The file is read on every fetch so a session
// always sees the file as it is at load time. Live streaming is not available from a file.
class CsvHistorySource final : public IMarketDataSource
{
  std::string path_;

public:
  explicit CsvHistorySource(std::string path) : path_(std::move(path)) {}

  Status subscribe(const std::string &symbol, EventHandler on_event,
                   ConnectionHandler on_connection) override;
  void unsubscribe(const std::string &symbol) override;
  Result<std::vector<Bar>> fetch_history(const std::string &symbol, Timeframe timeframe,
                                         Timestamp start, Timestamp end) override;

  // Parses CSV text. Exposed for tests and for callers that already hold the file contents.
  static Result<std::vector<Bar>> parse(const std::string &text, const std::string &symbol,
                                        Timeframe timeframe);
};
} // namespace tbot
