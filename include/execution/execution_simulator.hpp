#pragma once

#include "common/logging.hpp"
#include "executor.hpp"

#include <variant>

namespace tbot
{
// Fills signals immediately at the bar close, commission a flat fraction of notional. The ledger
// balance may never go negative here.
class ExecutionSimulator final : public IExecutor
{
  ExecutionConfig cfg_;

public:
  explicit ExecutionSimulator(ExecutionConfig cfg = {}) : cfg_(cfg)
  {
    check_execution_config(cfg_);
  }

  ExecutionMode mode() const noexcept override
  {
    return ExecutionMode::Simulated;
  }

  ExecutionReport execute(const Signal &signal, const Bar &bar, WalletLedger &ledger) override
  {
    ExecutionReport r;
    if (signal.action == Action::Hold)
      return r;

    std::variant<OrderIntent, ExecutionReport> plan =
        apply_position_rules(signal, ledger, cfg_, "sim");
    if (std::holds_alternative<ExecutionReport>(plan))
      return std::get<ExecutionReport>(plan);
    const OrderIntent intent = std::get<OrderIntent>(plan);

    Fill f;
    f.symbol = bar.symbol;
    f.side = intent.side;
    f.price = bar.close;
    f.quantity = intent.quantity;
    f.commission = bar.close * intent.quantity * cfg_.commission_rate;
    f.time = bar.open_time;

    TradeRecord closed;
    Status st = ledger.apply(f, true, &closed);
    if (!st.ok())
    {
      r.outcome = ExecutionOutcome::Rejected;
      r.status = st;
      return r;
    }
    r.outcome = ExecutionOutcome::Filled;
    r.fill = f;
    if (intent.closing)
      r.closed = closed;
    TBOT_INFO("sim: %s %s %.8f @ %.8f (%s) balance %.8f", f.symbol.c_str(), to_string(f.side),
              f.quantity, f.price, signal.reason.c_str(), ledger.balance());
    return r;
  }

  std::vector<ExecutionReport> poll(WalletLedger &) override
  {
    return {};
  }

  void shutdown(WalletLedger &) override {}

  const ExecutionConfig &config() const noexcept
  {
    return cfg_;
  }
};
} // namespace tbot
