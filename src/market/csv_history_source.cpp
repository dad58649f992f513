#include "market/csv_history_source.hpp"
#include "common/logging.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace tbot
{
namespace
{
std::string trim(const std::string &s)
{
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos)
    return "";
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string &line)
{
  std::vector<std::string> parts;
  std::istringstream iss(line);
  std::string part;
  while (std::getline(iss, part, ','))
    parts.push_back(trim(part));
  return parts;
}

std::string lower(std::string s)
{
  for (auto &c : s)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

bool parse_double(const std::string &s, double &out)
{
  if (s.empty())
    return false;
  errno = 0;
  char *end = nullptr;
  out = std::strtod(s.c_str(), &end);
  return errno == 0 && end == s.c_str() + s.size() && std::isfinite(out);
}

bool parse_int(const std::string &s, Timestamp &out)
{
  if (s.empty())
    return false;
  errno = 0;
  char *end = nullptr;
  out = std::strtoll(s.c_str(), &end, 10);
  return errno == 0 && end == s.c_str() + s.size();
}

// Column positions of open_time, open, high, low, close, volume.
using Layout = std::array<int, 6>;

bool layout_from_header(const std::vector<std::string> &cells, Layout &layout)
{
  const std::array<std::array<const char *, 3>, 6> names{{{"open_time", "timestamp", "time"},
                                                          {"open", "o", "o"},
                                                          {"high", "h", "h"},
                                                          {"low", "l", "l"},
                                                          {"close", "c", "c"},
                                                          {"volume", "v", "v"}}};
  for (std::size_t field = 0; field < names.size(); ++field)
  {
    layout[field] = -1;
    for (std::size_t i = 0; i < cells.size() && layout[field] < 0; ++i)
    {
      const std::string h = lower(cells[i]);
      for (const char *n : names[field])
      {
        if (h == n)
        {
          layout[field] = static_cast<int>(i);
          break;
        }
      }
    }
    if (layout[field] < 0)
      return false;
  }
  return true;
}
} // namespace

Status CsvHistorySource::subscribe(const std::string &symbol, EventHandler, ConnectionHandler)
{
  TBOT_ERROR("csv source: cannot stream %s, a file only provides history", symbol.c_str());
  return Status::error(ErrorCode::StateConflict, "csv source does not stream");
}

void CsvHistorySource::unsubscribe(const std::string &) {}

Result<std::vector<Bar>> CsvHistorySource::fetch_history(const std::string &symbol,
                                                         Timeframe timeframe, Timestamp start,
                                                         Timestamp end)
{
  std::ifstream f(path_);
  if (!f.is_open())
  {
    TBOT_ERROR("csv source: cannot open %s", path_.c_str());
    return Status::error(ErrorCode::HistoryFetchError, "cannot open " + path_);
  }
  std::stringstream buf;
  buf << f.rdbuf();

  Result<std::vector<Bar>> parsed = parse(buf.str(), symbol, timeframe);
  if (!parsed.ok())
  {
    TBOT_ERROR("csv source: %s: %s", path_.c_str(), parsed.status().reason.c_str());
    return parsed;
  }

  std::vector<Bar> bars;
  for (const Bar &b : parsed.value())
  {
    if (b.open_time >= start && b.open_time <= end)
      bars.push_back(b);
  }
  TBOT_INFO("csv source: %zu of %zu bars from %s in range", bars.size(), parsed.value().size(),
            path_.c_str());
  return bars;
}

Result<std::vector<Bar>> CsvHistorySource::parse(const std::string &text, const std::string &symbol,
                                                 Timeframe timeframe)
{
  const std::string sym = canonical_symbol(symbol);
  std::vector<Bar> bars;
  Layout layout{0, 1, 2, 3, 4, 5};
  std::istringstream in(text);
  std::string line;
  std::size_t line_no = 0;
  bool first = true;

  while (std::getline(in, line))
  {
    ++line_no;
    line = trim(line);
    if (line.empty() || line[0] == '#')
      continue;
    const std::vector<std::string> cells = split(line);

    if (first)
    {
      first = false;
      Timestamp probe = 0;
      if (!cells.empty() && !parse_int(cells[0], probe))
      {
        if (!layout_from_header(cells, layout))
          return Status::error(ErrorCode::HistoryFetchError,
                               "csv header lacks open_time/open/high/low/close/volume");
        continue;
      }
    }

    const int widest = *std::max_element(layout.begin(), layout.end());
    if (static_cast<int>(cells.size()) <= widest)
      return Status::error(ErrorCode::HistoryFetchError,
                           "csv line " + std::to_string(line_no) + ": missing columns");

    Bar b{};
    b.symbol = sym;
    b.timeframe = timeframe;
    const bool ok = parse_int(cells[layout[0]], b.open_time) &&
                    parse_double(cells[layout[1]], b.open) &&
                    parse_double(cells[layout[2]], b.high) && parse_double(cells[layout[3]], b.low) &&
                    parse_double(cells[layout[4]], b.close) &&
                    parse_double(cells[layout[5]], b.volume);
    if (!ok)
      return Status::error(ErrorCode::HistoryFetchError,
                           "csv line " + std::to_string(line_no) + ": malformed number");
    if (b.high < std::max(b.open, b.close) || b.low > std::min(b.open, b.close) || b.low <= 0)
      return Status::error(ErrorCode::HistoryFetchError,
                           "csv line " + std::to_string(line_no) + ": inconsistent OHLC");
    if (!bars.empty() && b.open_time <= bars.back().open_time)
      return Status::error(ErrorCode::HistoryFetchError,
                           "csv line " + std::to_string(line_no) + ": open_time not ascending");
    bars.push_back(std::move(b));
  }
  return bars;
}
} // namespace tbot
