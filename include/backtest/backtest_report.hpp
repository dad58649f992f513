#pragma once

#include "common/logging.hpp"
#include "execution/wallet.hpp"

#include <cstdio>
#include <string>
#include <vector>

namespace tbot
{
struct BacktestReport
{
  std::string symbol;
  std::string strategy;
  std::string params;
  std::size_t bars{0};
  double initial_balance{0};
  double final_balance{0};
  double final_equity{0}; // balance plus the open position at the last close
  double return_pct{0};   // of final equity against the initial balance
  double max_drawdown_pct{0};
  int trades{0};
  int wins{0};
  int losses{0};
  double win_rate_pct{0};
  double total_profit{0};
  bool position_open{false};
};

// Largest peak-to-trough decline of an equity curve, in percent of the peak.
inline double max_drawdown_pct(const std::vector<double> &curve)
{
  if (curve.empty())
    return 0;
  double peak = curve.front();
  double worst = 0;
  for (double eq : curve)
  {
    if (eq > peak)
      peak = eq;
    const double dd = peak > 0 ? (peak - eq) / peak * 100.0 : 0;
    if (dd > worst)
      worst = dd;
  }
  return worst;
}

inline BacktestReport compute_report(const WalletLedger &ledger, const std::vector<double> &equity,
                                     Price last_close)
{
  BacktestReport r;
  r.bars = equity.size();
  r.initial_balance = ledger.initial_balance();
  r.final_balance = ledger.balance();
  r.final_equity = ledger.equity(last_close);
  r.return_pct = r.initial_balance != 0
                     ? (r.final_equity - r.initial_balance) / r.initial_balance * 100.0
                     : 0;
  r.max_drawdown_pct = max_drawdown_pct(equity);
  for (const TradeRecord &t : ledger.trades())
  {
    ++r.trades;
    if (t.profit > 0)
      ++r.wins;
    else
      ++r.losses;
  }
  r.total_profit = ledger.realized_pnl();
  r.win_rate_pct = r.trades > 0 ? 100.0 * r.wins / r.trades : 0;
  r.position_open = ledger.position().has_value();
  return r;
}

inline void print_report(const BacktestReport &r, std::FILE *out = stdout)
{
  std::fprintf(out, "Backtest %s", r.symbol.c_str());
  if (!r.strategy.empty())
    std::fprintf(out, " / %s (%s)", r.strategy.c_str(), r.params.c_str());
  std::fprintf(out, "\n");
  std::fprintf(out, "  bars            %zu\n", r.bars);
  std::fprintf(out, "  initial balance %.8f\n", r.initial_balance);
  std::fprintf(out, "  final balance   %.8f\n", r.final_balance);
  std::fprintf(out, "  final equity    %.8f%s\n", r.final_equity,
               r.position_open ? " (position open)" : "");
  std::fprintf(out, "  return          %.4f%%\n", r.return_pct);
  std::fprintf(out, "  max drawdown    %.4f%%\n", r.max_drawdown_pct);
  std::fprintf(out, "  trades          %d (%d won, %d lost, %.2f%% win rate)\n", r.trades, r.wins,
               r.losses, r.win_rate_pct);
  std::fprintf(out, "  net profit      %.8f\n", r.total_profit);
}

// One CSV row per closed trade.
inline Status write_trade_log(const WalletLedger &ledger, const std::string &path)
{
  std::FILE *f = std::fopen(path.c_str(), "w");
  if (!f)
  {
    TBOT_ERROR("report: cannot open %s for writing", path.c_str());
    return Status::error(ErrorCode::ConfigError, "cannot open " + path);
  }
  std::fprintf(f, "symbol,side,entry_time,exit_time,entry_price,exit_price,quantity,commission,"
                  "profit,profit_pct\n");
  for (const TradeRecord &t : ledger.trades())
  {
    std::fprintf(f, "%s,%s,%lld,%lld,%.8f,%.8f,%.8f,%.8f,%.8f,%.4f\n", t.symbol.c_str(),
                 to_string(t.side), static_cast<long long>(t.entry_time),
                 static_cast<long long>(t.exit_time), t.entry_price, t.exit_price, t.quantity,
                 t.commission, t.profit, t.profit_pct);
  }
  if (std::fclose(f) != 0)
  {
    TBOT_ERROR("report: writing %s failed", path.c_str());
    return Status::error(ErrorCode::ConfigError, "write failed for " + path);
  }
  TBOT_INFO("report: %zu trades written to %s", ledger.trades().size(), path.c_str());
  return Status::success();
}
} // namespace tbot
